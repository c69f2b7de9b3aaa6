#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "FeatureNames.h"
#include "GameRecord.h"
#include "DerivedMetrics.h"
#include "IParallelExecutor.h"
#include "CancellationToken.h"

namespace theory_validator
{
  namespace features
  {
    /**
     * @brief Computes feature values for games against a fixed history.
     *
     * Rolling and rest features for a game only read history entries dated
     * strictly before that game, so the history may contain future games
     * without affecting the result. The history is shared and never mutated.
     */
    class FeatureComputer
    {
    public:
      FeatureComputer(std::shared_ptr<const std::vector<sportsdata::GameRecord>> history,
		      std::optional<std::string> playerFilter,
		      int playerWindow = kDefaultRollingWindow);

      sportsdata::StatValue compute(const FeatureSpec& spec, const sportsdata::GameRecord& game) const;

      /**
       * @brief Feature matrix for games x specs.
       *
       * Rows are computed in parallel on the executor; each row lands in its
       * own slot so the matrix does not depend on scheduling.
       */
      std::vector<std::vector<sportsdata::StatValue>>
      computeMatrix(const std::vector<const sportsdata::GameRecord*>& games,
		    const std::vector<FeatureSpec>& specs,
		    concurrency::IParallelExecutor& executor,
		    const concurrency::CancellationToken& token) const;

    private:
      struct TeamAppearance
      {
	const sportsdata::GameRecord* game;
	sportsdata::Side side;
      };

      struct PlayerAppearance
      {
	const sportsdata::GameRecord* game;
	sportsdata::StatValue minutes;
      };

      sportsdata::StatValue teamStat(const sportsdata::GameRecord& game,
				     sportsdata::Side side,
				     const std::string& stat) const;
      sportsdata::StatValue rollingMean(const sportsdata::GameRecord& game,
					sportsdata::Side side,
					const std::string& stat,
					int window) const;
      sportsdata::StatValue restDays(const sportsdata::GameRecord& game, sportsdata::Side side) const;
      sportsdata::StatValue playerMinutes(const sportsdata::GameRecord& game) const;
      sportsdata::StatValue playerMinutesRolling(const sportsdata::GameRecord& game) const;
      std::vector<TeamAppearance>::const_iterator
      firstOnOrAfter(const std::vector<TeamAppearance>& appearances,
		     const boost::gregorian::date& d) const;

    private:
      std::shared_ptr<const std::vector<sportsdata::GameRecord>> mHistory;
      std::optional<std::string> mPlayerFilter;
      int mPlayerWindow;
      std::map<std::string, std::vector<TeamAppearance>> mTeamGames;
      std::vector<PlayerAppearance> mPlayerGames;
    };

    // Case-insensitive substring match used by team and player filters.
    bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

    const sportsdata::PlayerBoxscore* findPlayer(const sportsdata::GameRecord& game,
						 const std::string& playerFilter);
  }
}
