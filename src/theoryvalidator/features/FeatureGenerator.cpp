#include "FeatureGenerator.h"
#include <set>
#include <sstream>
#include <boost/algorithm/string.hpp>
#include "FeatureNames.h"

namespace theory_validator
{
  namespace features
  {
    FeatureGenerator::FeatureGenerator(const sportsdata::HistoricalGameStore& store)
      : mStore(store)
    {}

    std::vector<GeneratedFeature> FeatureGenerator::engineeredCatalog()
    {
      static const FeatureKind kinds[] = {
	FeatureKind::ConferenceGame,
	FeatureKind::ClosingSpreadHome,
	FeatureKind::ClosingTotal,
	FeatureKind::MoneylineImpliedEdge,
	FeatureKind::PaceGame,
	FeatureKind::FinalTotalPoints,
	FeatureKind::TotalDelta,
	FeatureKind::CoverMargin,
	FeatureKind::PlayerMinutes,
	FeatureKind::PlayerMinutesRolling,
	FeatureKind::PlayerMinutesDelta
      };

      std::vector<GeneratedFeature> out;
      for (FeatureKind kind : kinds)
	out.push_back(describeFeature(FeatureSpec{kind, "", 0}));
      return out;
    }

    FeatureCatalog FeatureGenerator::generate(const FeatureGenerationRequest& request) const
    {
      FeatureCatalog catalog;
      catalog.league = request.league;
      catalog.includeRestDays = request.includeRestDays;
      catalog.includeRolling = request.includeRolling;
      catalog.rollingWindow = clampRollingWindow(request.rollingWindow);

      const std::set<std::string> available = mStore.teamStatKeys(request.league);

      std::set<std::string> seen;
      for (const auto& raw : request.rawStatKeys)
	{
	  const std::string key = boost::algorithm::trim_copy(raw);
	  if (key.empty() || !seen.insert(key).second)
	    continue;
	  if (available.count(key))
	    catalog.statKeysUsed.push_back(key);
	  else
	    catalog.skippedStatKeys.push_back(key);
	}

      catalog.features = engineeredCatalog();

      for (const auto& stat : catalog.statKeysUsed)
	{
	  for (FeatureKind kind : {FeatureKind::HomeStat, FeatureKind::AwayStat, FeatureKind::StatDiff,
				   FeatureKind::StatTotal, FeatureKind::StatRatio})
	    catalog.features.push_back(describeFeature(FeatureSpec{kind, stat, 0}));
	}

      if (request.includeRestDays)
	{
	  for (FeatureKind kind : {FeatureKind::HomeRestDays, FeatureKind::AwayRestDays, FeatureKind::RestAdvantage})
	    catalog.features.push_back(describeFeature(FeatureSpec{kind, "", 0}));
	}

      if (request.includeRolling)
	{
	  for (const auto& stat : catalog.statKeysUsed)
	    {
	      for (FeatureKind kind : {FeatureKind::RollingHome, FeatureKind::RollingAway, FeatureKind::RollingDiff})
		catalog.features.push_back(describeFeature(FeatureSpec{kind, stat, catalog.rollingWindow}));
	    }
	}

      std::ostringstream summary;
      summary << catalog.features.size() << " features generated from "
	      << catalog.statKeysUsed.size() << " stats";
      if (request.includeRestDays)
	summary << " + rest days";
      if (request.includeRolling)
	summary << " + rolling " << catalog.rollingWindow;
      if (!catalog.skippedStatKeys.empty())
	summary << "; skipped unknown stats: " << boost::algorithm::join(catalog.skippedStatKeys, ", ");
      catalog.summary = summary.str();

      return catalog;
    }
  }
}
