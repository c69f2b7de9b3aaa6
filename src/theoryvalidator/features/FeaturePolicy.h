#pragma once

#include <set>
#include <string>
#include <vector>
#include "FeatureTypes.h"
#include "FeatureNames.h"

namespace theory_validator
{
  namespace features
  {
    struct FeatureSelection
    {
      std::vector<std::string> requested;
      std::vector<GeneratedFeature> used;
      std::vector<FeatureSpec> usedSpecs;
      std::vector<DroppedFeature> dropped;
      FeaturePolicyReport report;
    };

    /**
     * @brief Decides which requested features a run may use.
     *
     * Checks run in this order and the first failing check names the reason:
     * unknown_feature, target_alias, requires_player_filter, post_game_leakage
     * (deployable context only). Requested names are deduplicated keeping the
     * first occurrence.
     */
    class FeaturePolicy
    {
    public:
      FeaturePolicy(RunContext context,
		    std::set<std::string> targetAliases,
		    std::set<std::string> availableStats,
		    bool playerFilterActive);

      FeatureSelection select(const std::vector<std::string>& requested) const;

    private:
      RunContext mContext;
      std::set<std::string> mTargetAliases;
      std::set<std::string> mAvailableStats;
      bool mPlayerFilterActive;
    };
  }
}
