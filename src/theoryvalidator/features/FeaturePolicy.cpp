#include "FeaturePolicy.h"
#include <boost/algorithm/string.hpp>

namespace theory_validator
{
  namespace features
  {
    FeaturePolicy::FeaturePolicy(RunContext context,
				 std::set<std::string> targetAliases,
				 std::set<std::string> availableStats,
				 bool playerFilterActive)
      : mContext(context),
	mTargetAliases(std::move(targetAliases)),
	mAvailableStats(std::move(availableStats)),
	mPlayerFilterActive(playerFilterActive)
    {}

    FeatureSelection FeaturePolicy::select(const std::vector<std::string>& requested) const
    {
      FeatureSelection selection;
      selection.report.context = mContext;

      std::set<std::string> seen;
      for (const auto& raw : requested)
	{
	  const std::string name = boost::algorithm::trim_copy(raw);
	  if (name.empty() || !seen.insert(name).second)
	    continue;
	  selection.requested.push_back(name);

	  const auto spec = parseFeatureName(name);
	  if (!spec)
	    {
	      selection.dropped.push_back(DroppedFeature{name, "unknown_feature", {}, {}, {},
							 "name does not match any generated feature"});
	      continue;
	    }
	  if (!spec->stat.empty() && mAvailableStats.count(spec->stat) == 0)
	    {
	      selection.dropped.push_back(DroppedFeature{name, "unknown_feature", {}, {}, {},
							 "stat '" + spec->stat + "' is not recorded for this league"});
	      continue;
	    }

	  const GeneratedFeature feature = describeFeature(*spec);
	  if (mTargetAliases.count(name))
	    {
	      selection.dropped.push_back(DroppedFeature{name, "target_alias", {}, {}, {},
							 "feature restates the target outcome"});
	      continue;
	    }
	  if (isPlayerKind(spec->kind) && !mPlayerFilterActive)
	    {
	      selection.dropped.push_back(DroppedFeature{name, "requires_player_filter", {}, {}, {},
							 "player features need a player filter"});
	      continue;
	    }
	  if (feature.timing == FeatureTiming::PostGame)
	    {
	      if (mContext == RunContext::Deployable)
		{
		  selection.report.droppedPostGameFeatures.push_back(name);
		  selection.dropped.push_back(DroppedFeature{name, "post_game_leakage", {}, {}, {},
							     "post_game feature excluded in deployable context"});
		  continue;
		}
	      selection.report.containsPostGameFeatures = true;
	    }

	  selection.used.push_back(feature);
	  selection.usedSpecs.push_back(*spec);
	}

      return selection;
    }
  }
}
