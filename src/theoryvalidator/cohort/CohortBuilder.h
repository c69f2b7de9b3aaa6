#pragma once

#include <memory>
#include <optional>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "FilterBundle.h"
#include "GameRecord.h"
#include "HistoricalGameStore.h"

namespace theory_validator
{
  namespace cohort
  {
    /**
     * @brief Games selected for one request.
     *
     * history holds every game of the league in the resolved seasons, in
     * chronological order; baseline and cohort point into it. Feature
     * computation reads history so rolling features see games outside the
     * date window.
     */
    struct CohortSelection
    {
      std::shared_ptr<const std::vector<sportsdata::GameRecord>> history;
      std::vector<const sportsdata::GameRecord*> baseline;
      std::vector<const sportsdata::GameRecord*> cohort;
      std::vector<int> seasons;
      std::optional<boost::gregorian::date> recentCutoff;
      bool gamesLimitApplied{false};
    };

    class CohortBuilder
    {
    public:
      CohortBuilder(const sportsdata::HistoricalGameStore& store, int gamesLimitMax);

      /**
       * @brief Selects baseline and cohort games.
       *
       * @param spreadMarketTarget the spread band only applies when true
       */
      CohortSelection build(const FilterBundle& filters, bool spreadMarketTarget) const;

    private:
      std::vector<int> resolveSeasons(const FilterBundle& filters) const;
      bool inBaseline(const sportsdata::GameRecord& game,
		      const FilterBundle& filters,
		      const std::optional<boost::gregorian::date>& recentCutoff) const;
      bool inCohort(const sportsdata::GameRecord& game,
		    const FilterBundle& filters,
		    bool spreadMarketTarget) const;

    private:
      const sportsdata::HistoricalGameStore& mStore;
      int mGamesLimitMax;
    };

    bool matchesTeam(const sportsdata::GameRecord& game, const std::string& teamFilter);
  }
}
