#include "LeagueCalendar.h"
#include <boost/algorithm/string.hpp>

namespace theory_validator
{
  namespace sportsdata
  {
    using boost::gregorian::date;
    using boost::gregorian::Jan;
    using boost::gregorian::Mar;
    using boost::gregorian::Apr;
    using boost::gregorian::Nov;

    std::optional<SeasonPhase> parseSeasonPhase(const std::string& name)
    {
      const std::string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));
      if (key.empty() || key == "all")
	return SeasonPhase::All;
      if (key == "out_conf")
	return SeasonPhase::OutOfConference;
      if (key == "conf")
	return SeasonPhase::Conference;
      if (key == "postseason")
	return SeasonPhase::Postseason;
      return std::nullopt;
    }

    const char* seasonPhaseToString(SeasonPhase phase)
    {
      switch (phase)
	{
	case SeasonPhase::OutOfConference:
	  return "out_conf";
	case SeasonPhase::Conference:
	  return "conf";
	case SeasonPhase::Postseason:
	  return "postseason";
	case SeasonPhase::All:
	default:
	  return "all";
	}
    }

    bool LeagueCalendar::supportsPhases(const std::string& league)
    {
      return boost::algorithm::iequals(league, "NCAAB");
    }

    std::optional<DateRange> LeagueCalendar::phaseRange(const std::string& league,
							int seasonStartYear,
							SeasonPhase phase)
    {
      if (phase == SeasonPhase::All || !supportsPhases(league))
	return std::nullopt;

      const int s = seasonStartYear;
      switch (phase)
	{
	case SeasonPhase::OutOfConference:
	  return DateRange::halfOpen(date(s, Nov, 1), date(s + 1, Jan, 1));
	case SeasonPhase::Conference:
	  return DateRange::halfOpen(date(s + 1, Jan, 1), date(s + 1, Mar, 16));
	case SeasonPhase::Postseason:
	  return DateRange::halfOpen(date(s + 1, Mar, 16), date(s + 1, Apr, 16));
	case SeasonPhase::All:
	default:
	  return std::nullopt;
	}
    }

    bool LeagueCalendar::inPhase(const GameRecord& game, SeasonPhase phase)
    {
      if (phase == SeasonPhase::All || !supportsPhases(game.league))
	return true;
      const auto range = phaseRange(game.league, game.season, phase);
      return range && range->contains(game.gameDate);
    }
  }
}
