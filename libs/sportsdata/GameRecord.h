#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace theory_validator
{
  namespace sportsdata
  {
    enum class Side
    {
      Home,
      Away
    };

    inline const char* sideToString(Side side)
    {
      return side == Side::Home ? "home" : "away";
    }

    struct TeamInfo
    {
      std::string name;
      std::string shortName;
      std::string abbreviation;
    };

    // Raw boxscore values are kept as strings; coercion happens in DerivedMetrics.
    struct TeamBoxscore
    {
      std::map<std::string, std::string> stats;
    };

    struct PlayerBoxscore
    {
      Side side{Side::Home};
      std::string playerName;
      std::map<std::string, std::string> stats;
    };

    /**
     * @brief One quoted price for one side of one market.
     *
     * marketType is "spread", "total" or "moneyline". side is "home"/"away"
     * for spread and moneyline, "over"/"under" for totals. Prices are American.
     */
    struct OddsQuote
    {
      std::string marketType;
      std::string side;
      std::optional<double> line;
      std::optional<double> price;
      bool isClosing{true};
    };

    struct GameRecord
    {
      int64_t gameId{0};
      std::string league;
      int season{0};
      boost::gregorian::date gameDate;
      TeamInfo home;
      TeamInfo away;
      std::optional<int> homeScore;
      std::optional<int> awayScore;
      std::optional<bool> isConferenceGame;
      TeamBoxscore homeBox;
      TeamBoxscore awayBox;
      std::vector<PlayerBoxscore> players;
      std::vector<OddsQuote> odds;

      const TeamInfo& team(Side side) const
      {
	return side == Side::Home ? home : away;
      }

      const TeamBoxscore& boxscore(Side side) const
      {
	return side == Side::Home ? homeBox : awayBox;
      }
    };

    // Chronological order with game id as the stable secondary key.
    inline bool chronologicalLess(const GameRecord& lhs, const GameRecord& rhs)
    {
      if (lhs.gameDate != rhs.gameDate)
	return lhs.gameDate < rhs.gameDate;
      return lhs.gameId < rhs.gameId;
    }
  }
}
