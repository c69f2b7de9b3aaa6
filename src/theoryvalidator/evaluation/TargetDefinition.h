#pragma once

#include <optional>
#include <set>
#include <string>
#include "GameRecord.h"

namespace theory_validator
{
  namespace evaluation
  {
    enum class TargetClass
    {
      Stat,
      Market
    };

    enum class MetricType
    {
      Numeric,
      Binary
    };

    enum class MarketType
    {
      Spread,
      Total,
      Moneyline
    };

    enum class OddsAssumptionKind
    {
      UseClosing,
      FlatReference
    };

    struct OddsAssumption
    {
      OddsAssumptionKind kind{OddsAssumptionKind::UseClosing};
      double referencePrice{-110.0};
    };

    const char* targetClassToString(TargetClass c);
    const char* metricTypeToString(MetricType m);
    const char* marketTypeToString(MarketType m);
    std::string oddsAssumptionToString(const OddsAssumption& a);

    /**
     * @brief What a theory is trying to predict.
     *
     * Stat targets read a derived game metric. Market targets resolve one side
     * of a closing market to win (1), loss (0) or unresolved (push, missing
     * line). Build instances with TargetDefinitionFactory.
     */
    struct TargetDefinition
    {
      TargetClass targetClass{TargetClass::Stat};
      std::string targetName{"combined_score"};
      MetricType metricType{MetricType::Numeric};
      std::optional<MarketType> marketType;
      std::string side;
      OddsAssumption oddsAssumption;
      bool oddsRequired{true};

      bool isMarket() const
      {
	return targetClass == TargetClass::Market;
      }

      bool isBinary() const
      {
	return metricType == MetricType::Binary;
      }

      // Features that restate this target and must never be used to predict it.
      std::set<std::string> aliasFeatures() const;
    };

    class TargetDefinitionFactory
    {
    public:
      // combined_score, the target used when a request names none.
      static TargetDefinition defaultStatTarget();

      /**
       * @throws ConfigurationException (field target_name, reason unknown_target)
       */
      static TargetDefinition statTarget(const std::string& targetName);

      /**
       * @throws ConfigurationException for an unknown market, a side that does
       *         not belong to the market, or a non-negative flat reference price
       *         in the (-100, 100) dead zone.
       */
      static TargetDefinition marketTarget(const std::string& marketType,
					   const std::string& side,
					   const OddsAssumption& oddsAssumption,
					   bool oddsRequired = true);
    };

    /**
     * @brief Closing market data for the side a market target bets on.
     *
     * price is the price used for settlement: the closing price under
     * use_closing, the reference price under flat_reference.
     */
    struct MarketQuote
    {
      std::optional<double> line;
      std::optional<double> price;
      std::optional<double> impliedProbability;
      bool hasOdds{false};
    };

    class TargetResolver
    {
    public:
      // Target value for a game, or std::nullopt when it cannot be resolved.
      static std::optional<double> targetValue(const TargetDefinition& target,
					       const sportsdata::GameRecord& game);

      static MarketQuote marketQuote(const TargetDefinition& target,
				     const sportsdata::GameRecord& game);

      // Unit PnL of a resolved binary outcome at the quote's price.
      static std::optional<double> unitPnl(const MarketQuote& quote, bool won);
    };
  }
}
