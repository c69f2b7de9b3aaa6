#include "DerivedMetrics.h"
#include <cmath>
#include <cstdlib>
#include <boost/algorithm/string.hpp>

namespace theory_validator
{
  namespace sportsdata
  {
    namespace
    {
      bool parseWholeDouble(const std::string& text, double& out)
      {
	if (text.empty())
	  return false;
	char* end = nullptr;
	const double v = std::strtod(text.c_str(), &end);
	if (end != text.c_str() + text.size() || !std::isfinite(v))
	  return false;
	out = v;
	return true;
      }
    }

    StatValue coerceStatValue(const std::string& raw)
    {
      const std::string text = boost::algorithm::trim_copy(raw);
      if (text.empty())
	return StatValue::null();

      const auto colon = text.find(':');
      if (colon != std::string::npos)
	{
	  double minutes = 0.0;
	  double seconds = 0.0;
	  if (parseWholeDouble(text.substr(0, colon), minutes) &&
	      parseWholeDouble(text.substr(colon + 1), seconds))
	    return StatValue::numeric(minutes + seconds / 60.0);
	  return StatValue::nonNumeric();
	}

      double v = 0.0;
      if (parseWholeDouble(text, v))
	return StatValue::numeric(v);
      return StatValue::nonNumeric();
    }

    std::optional<double> DerivedMetrics::combinedScore(const GameRecord& game)
    {
      if (!game.homeScore || !game.awayScore)
	return std::nullopt;
      return static_cast<double>(*game.homeScore + *game.awayScore);
    }

    std::optional<double> DerivedMetrics::marginOfVictory(const GameRecord& game)
    {
      if (!game.homeScore || !game.awayScore)
	return std::nullopt;
      return static_cast<double>(*game.homeScore - *game.awayScore);
    }

    std::optional<std::string> DerivedMetrics::winner(const GameRecord& game)
    {
      if (!game.homeScore || !game.awayScore)
	return std::nullopt;
      if (*game.homeScore > *game.awayScore)
	return std::string("home");
      if (*game.homeScore < *game.awayScore)
	return std::string("away");
      return std::string("tie");
    }

    const OddsQuote* DerivedMetrics::closingQuote(const GameRecord& game,
						  const std::string& marketType,
						  const std::string& side)
    {
      const OddsQuote* found = nullptr;
      for (const auto& quote : game.odds)
	{
	  if (quote.isClosing && quote.marketType == marketType && quote.side == side)
	    found = &quote;
	}
      return found;
    }

    std::optional<double> DerivedMetrics::closingSpread(const GameRecord& game, Side side)
    {
      const OddsQuote* quote = closingQuote(game, "spread", sideToString(side));
      if (quote && quote->line)
	return quote->line;

      // One-sided books quote only the home line; the away line mirrors it.
      const Side other = side == Side::Home ? Side::Away : Side::Home;
      const OddsQuote* opposite = closingQuote(game, "spread", sideToString(other));
      if (opposite && opposite->line)
	return -*opposite->line;
      return std::nullopt;
    }

    std::optional<double> DerivedMetrics::closingTotal(const GameRecord& game)
    {
      const OddsQuote* over = closingQuote(game, "total", "over");
      if (over && over->line)
	return over->line;
      const OddsQuote* under = closingQuote(game, "total", "under");
      if (under && under->line)
	return under->line;
      return std::nullopt;
    }

    std::optional<int> DerivedMetrics::spreadCover(const GameRecord& game, Side side)
    {
      const auto margin = marginOfVictory(game);
      const auto line = closingSpread(game, side);
      if (!margin || !line)
	return std::nullopt;

      const double sideMargin = side == Side::Home ? *margin : -*margin;
      const double adjusted = sideMargin + *line;
      if (adjusted > 0.0)
	return 1;
      if (adjusted < 0.0)
	return 0;
      return std::nullopt;
    }

    std::optional<std::string> DerivedMetrics::totalResult(const GameRecord& game)
    {
      const auto combined = combinedScore(game);
      const auto total = closingTotal(game);
      if (!combined || !total)
	return std::nullopt;
      if (*combined > *total)
	return std::string("over");
      if (*combined < *total)
	return std::string("under");
      return std::string("push");
    }

    std::optional<int> DerivedMetrics::totalOutcome(const GameRecord& game, const std::string& side)
    {
      const auto result = totalResult(game);
      if (!result || *result == "push")
	return std::nullopt;
      return *result == side ? 1 : 0;
    }

    std::optional<int> DerivedMetrics::moneylineOutcome(const GameRecord& game, Side side)
    {
      const auto w = winner(game);
      if (!w || *w == "tie")
	return std::nullopt;
      return *w == sideToString(side) ? 1 : 0;
    }
  }
}
