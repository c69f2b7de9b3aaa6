#include "TargetDefinition.h"
#include <cmath>
#include <sstream>
#include <boost/algorithm/string.hpp>
#include "DerivedMetrics.h"
#include "OddsMath.h"
#include "TheoryValidatorException.h"

namespace theory_validator
{
  namespace evaluation
  {
    using sportsdata::DerivedMetrics;
    using sportsdata::GameRecord;
    using sportsdata::OddsMath;
    using sportsdata::Side;

    const char* targetClassToString(TargetClass c)
    {
      return c == TargetClass::Stat ? "stat" : "market";
    }

    const char* metricTypeToString(MetricType m)
    {
      return m == MetricType::Numeric ? "numeric" : "binary";
    }

    const char* marketTypeToString(MarketType m)
    {
      switch (m)
	{
	case MarketType::Spread:
	  return "spread";
	case MarketType::Total:
	  return "total";
	case MarketType::Moneyline:
	default:
	  return "moneyline";
	}
    }

    std::string oddsAssumptionToString(const OddsAssumption& a)
    {
      if (a.kind == OddsAssumptionKind::UseClosing)
	return "use_closing";
      std::ostringstream os;
      os << "flat_reference(" << a.referencePrice << ")";
      return os.str();
    }

    std::set<std::string> TargetDefinition::aliasFeatures() const
    {
      if (isMarket())
	{
	  switch (*marketType)
	    {
	    case MarketType::Spread:
	      return {"cover_margin"};
	    case MarketType::Total:
	      return {"total_delta", "final_total_points", "total_points"};
	    case MarketType::Moneyline:
	    default:
	      return {"points_diff"};
	    }
	}

      if (targetName == "combined_score")
	return {"combined_score", "final_total_points", "total_points", "total_delta"};
      if (targetName == "margin_of_victory")
	return {"points_diff", "cover_margin"};
      if (targetName == "home_points")
	return {"home_points"};
      if (targetName == "away_points")
	return {"away_points"};
      return {"points_diff"};
    }

    TargetDefinition TargetDefinitionFactory::defaultStatTarget()
    {
      return statTarget("combined_score");
    }

    TargetDefinition TargetDefinitionFactory::statTarget(const std::string& targetName)
    {
      const std::string name = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(targetName));
      TargetDefinition def;
      def.targetClass = TargetClass::Stat;
      def.targetName = name;
      def.oddsRequired = false;

      if (name == "combined_score" || name == "margin_of_victory" ||
	  name == "home_points" || name == "away_points")
	def.metricType = MetricType::Numeric;
      else if (name == "home_win" || name == "away_win")
	def.metricType = MetricType::Binary;
      else
	throw ConfigurationException("target_name", "unknown_target",
				     "unknown stat target '" + targetName + "'");
      return def;
    }

    TargetDefinition TargetDefinitionFactory::marketTarget(const std::string& marketType,
							   const std::string& side,
							   const OddsAssumption& oddsAssumption,
							   bool oddsRequired)
    {
      const std::string market = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(marketType));
      const std::string s = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(side));

      TargetDefinition def;
      def.targetClass = TargetClass::Market;
      def.metricType = MetricType::Binary;
      def.side = s;
      def.oddsAssumption = oddsAssumption;
      def.oddsRequired = oddsRequired;

      if (market == "spread")
	def.marketType = MarketType::Spread;
      else if (market == "total")
	def.marketType = MarketType::Total;
      else if (market == "moneyline")
	def.marketType = MarketType::Moneyline;
      else
	throw ConfigurationException("market_type", "unknown_market",
				     "market_type must be spread, total or moneyline, got '" + marketType + "'");

      const bool totalMarket = *def.marketType == MarketType::Total;
      const bool sideOk = totalMarket ? (s == "over" || s == "under") : (s == "home" || s == "away");
      if (!sideOk)
	throw ConfigurationException("side", "invalid_side",
				     std::string("side '") + side + "' is not valid for market " + market +
				     (totalMarket ? " (expected over or under)" : " (expected home or away)"));

      if (oddsAssumption.kind == OddsAssumptionKind::FlatReference &&
	  std::fabs(oddsAssumption.referencePrice) < 100.0)
	throw ConfigurationException("odds_assumption", "invalid_reference_price",
				     "flat reference price must be an American price with |price| >= 100");

      def.targetName = market + "_" + s;
      return def;
    }

    std::optional<double> TargetResolver::targetValue(const TargetDefinition& target, const GameRecord& game)
    {
      if (!target.isMarket())
	{
	  const std::string& name = target.targetName;
	  if (name == "combined_score")
	    return DerivedMetrics::combinedScore(game);
	  if (name == "margin_of_victory")
	    return DerivedMetrics::marginOfVictory(game);
	  if (name == "home_points")
	    return game.homeScore ? std::optional<double>(*game.homeScore) : std::nullopt;
	  if (name == "away_points")
	    return game.awayScore ? std::optional<double>(*game.awayScore) : std::nullopt;
	  if (name == "home_win" || name == "away_win")
	    {
	      auto outcome = DerivedMetrics::moneylineOutcome(game, name == "home_win" ? Side::Home : Side::Away);
	      if (!outcome)
		return std::nullopt;
	      return static_cast<double>(*outcome);
	    }
	  return std::nullopt;
	}

      std::optional<int> outcome;
      switch (*target.marketType)
	{
	case MarketType::Spread:
	  outcome = DerivedMetrics::spreadCover(game, target.side == "home" ? Side::Home : Side::Away);
	  break;
	case MarketType::Total:
	  outcome = DerivedMetrics::totalOutcome(game, target.side);
	  break;
	case MarketType::Moneyline:
	  outcome = DerivedMetrics::moneylineOutcome(game, target.side == "home" ? Side::Home : Side::Away);
	  break;
	}
      if (!outcome)
	return std::nullopt;
      return static_cast<double>(*outcome);
    }

    MarketQuote TargetResolver::marketQuote(const TargetDefinition& target, const GameRecord& game)
    {
      MarketQuote quote;
      if (!target.isMarket())
	return quote;

      const char* market = marketTypeToString(*target.marketType);
      const sportsdata::OddsQuote* closing = DerivedMetrics::closingQuote(game, market, target.side);

      switch (*target.marketType)
	{
	case MarketType::Spread:
	  quote.line = DerivedMetrics::closingSpread(game, target.side == "home" ? Side::Home : Side::Away);
	  break;
	case MarketType::Total:
	  quote.line = DerivedMetrics::closingTotal(game);
	  break;
	case MarketType::Moneyline:
	  break;
	}

      if (target.oddsAssumption.kind == OddsAssumptionKind::UseClosing)
	quote.price = closing ? closing->price : std::nullopt;
      else if (closing)
	quote.price = target.oddsAssumption.referencePrice;

      if (quote.price)
	quote.impliedProbability = OddsMath::impliedProbability(*quote.price);

      const bool needsLine = *target.marketType != MarketType::Moneyline;
      quote.hasOdds = closing != nullptr && quote.impliedProbability.has_value() &&
	(!needsLine || quote.line.has_value());
      return quote;
    }

    std::optional<double> TargetResolver::unitPnl(const MarketQuote& quote, bool won)
    {
      if (!quote.price)
	return std::nullopt;
      return OddsMath::unitPnl(*quote.price, won);
    }
  }
}
