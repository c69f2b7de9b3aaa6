#pragma once

#include <optional>
#include <string>
#include "FeatureTypes.h"

namespace theory_validator
{
  namespace features
  {
    enum class FeatureKind
    {
      HomeStat,
      AwayStat,
      StatDiff,
      StatTotal,
      StatRatio,
      HomeRestDays,
      AwayRestDays,
      RestAdvantage,
      RollingHome,
      RollingAway,
      RollingDiff,
      ConferenceGame,
      ClosingSpreadHome,
      ClosingTotal,
      MoneylineImpliedEdge,
      PaceGame,
      FinalTotalPoints,
      TotalDelta,
      CoverMargin,
      PlayerMinutes,
      PlayerMinutesRolling,
      PlayerMinutesDelta
    };

    /**
     * @brief A parsed feature name.
     *
     * stat is empty for features that do not read a boxscore stat; window is
     * only meaningful for the rolling kinds.
     */
    struct FeatureSpec
    {
      FeatureKind kind{FeatureKind::HomeStat};
      std::string stat;
      int window{0};
    };

    constexpr int kMinRollingWindow = 2;
    constexpr int kMaxRollingWindow = 20;
    constexpr int kDefaultRollingWindow = 5;

    int clampRollingWindow(int window);

    /**
     * @brief Parses a generated feature name back into its derivation.
     *
     * Engineered names are matched first, then rest features, then rolling
     * names parsed from the end (side, window, stat), then the raw stat
     * patterns. Returns std::nullopt for a name no generator can produce.
     */
    std::optional<FeatureSpec> parseFeatureName(const std::string& name);

    std::string featureName(const FeatureSpec& spec);

    // Conceptual bucket for a raw stat key (efficiency, rebounding, ...).
    std::string inferStatGroup(const std::string& statKey);

    GeneratedFeature describeFeature(const FeatureSpec& spec);

    bool isRestKind(FeatureKind kind);
    bool isRollingKind(FeatureKind kind);
    bool isPlayerKind(FeatureKind kind);
  }
}
