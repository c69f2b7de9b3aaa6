#pragma once

#include <optional>
#include <string>
#include "GameRecord.h"

namespace theory_validator
{
  namespace sportsdata
  {
    enum class StatValueKind
    {
      Null,
      Numeric,
      NonNumeric
    };

    /**
     * @brief A raw boxscore value after coercion.
     */
    class StatValue
    {
    public:
      static StatValue null()
      {
	return StatValue(StatValueKind::Null, 0.0);
      }

      static StatValue numeric(double v)
      {
	return StatValue(StatValueKind::Numeric, v);
      }

      static StatValue nonNumeric()
      {
	return StatValue(StatValueKind::NonNumeric, 0.0);
      }

      StatValueKind kind() const
      {
	return mKind;
      }

      bool isNumeric() const
      {
	return mKind == StatValueKind::Numeric;
      }

      bool isNull() const
      {
	return mKind == StatValueKind::Null;
      }

      double value() const
      {
	return mValue;
      }

      std::optional<double> asOptional() const
      {
	if (isNumeric())
	  return mValue;
	return std::nullopt;
      }

    private:
      StatValue(StatValueKind kind, double value)
	: mKind(kind),
	  mValue(value)
      {}

      StatValueKind mKind;
      double mValue;
    };

    /**
     * @brief Coerces a raw boxscore string.
     *
     * Empty (after trimming) is null, "mm:ss" becomes fractional minutes, and
     * anything that is not a complete number is non-numeric.
     */
    StatValue coerceStatValue(const std::string& raw);

    /**
     * @brief Outcome metrics derived from final scores and closing odds.
     *
     * Every function returns std::nullopt when the inputs it needs are missing.
     * Binary outcomes are 1 (win) or 0 (loss); pushes are std::nullopt.
     */
    struct DerivedMetrics
    {
      static std::optional<double> combinedScore(const GameRecord& game);
      static std::optional<double> marginOfVictory(const GameRecord& game);

      // "home", "away" or "tie".
      static std::optional<std::string> winner(const GameRecord& game);

      // Closing quote for market/side; the last one listed wins when several exist.
      static const OddsQuote* closingQuote(const GameRecord& game,
					   const std::string& marketType,
					   const std::string& side);

      static std::optional<double> closingSpread(const GameRecord& game, Side side);
      static std::optional<double> closingTotal(const GameRecord& game);

      static std::optional<int> spreadCover(const GameRecord& game, Side side);

      // "over", "under" or "push".
      static std::optional<std::string> totalResult(const GameRecord& game);
      static std::optional<int> totalOutcome(const GameRecord& game, const std::string& side);
      static std::optional<int> moneylineOutcome(const GameRecord& game, Side side);
    };
  }
}
