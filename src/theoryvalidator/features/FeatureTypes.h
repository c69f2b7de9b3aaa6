#pragma once

#include <optional>
#include <string>
#include <vector>

namespace theory_validator
{
  namespace features
  {
    enum class FeatureTiming
    {
      PreGame,
      PostGame
    };

    inline const char* featureTimingToString(FeatureTiming timing)
    {
      return timing == FeatureTiming::PreGame ? "pre_game" : "post_game";
    }

    /**
     * @brief Context a run is evaluated in.
     *
     * Deployable runs exclude post_game features from correlations, the model
     * and triggers. Diagnostic runs keep them for exploratory analysis.
     */
    enum class RunContext
    {
      Deployable,
      Diagnostic
    };

    inline const char* runContextToString(RunContext context)
    {
      return context == RunContext::Deployable ? "deployable" : "diagnostic";
    }

    struct GeneratedFeature
    {
      std::string name;
      std::string formula;
      std::string category;
      std::string group;
      FeatureTiming timing{FeatureTiming::PostGame};
      std::string source;
      bool defaultSelected{false};
    };

    struct FeatureGenerationRequest
    {
      std::string league;
      std::vector<std::string> rawStatKeys;
      bool includeRestDays{false};
      bool includeRolling{false};
      int rollingWindow{5};
    };

    struct FeatureCatalog
    {
      std::string league;
      std::vector<GeneratedFeature> features;
      std::vector<std::string> statKeysUsed;
      std::vector<std::string> skippedStatKeys;
      int rollingWindow{5};
      bool includeRestDays{false};
      bool includeRolling{false};
      std::string summary;
    };

    /**
     * @brief A feature removed from a run, with the reason it was removed.
     *
     * `with`, `absCorr` and `threshold` are filled for correlation-based drops.
     */
    struct DroppedFeature
    {
      std::string feature;
      std::string reason;
      std::optional<std::string> with;
      std::optional<double> absCorr;
      std::optional<double> threshold;
      std::string detail;
    };

    struct FeaturePolicyReport
    {
      RunContext context{RunContext::Deployable};
      std::vector<std::string> droppedPostGameFeatures;
      bool containsPostGameFeatures{false};
    };
  }
}
