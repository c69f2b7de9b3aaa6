#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "StatUtils.h"
#include "TargetDefinition.h"

namespace theory_validator
{
  namespace evaluation
  {
    // Mean (numeric targets) or rate (binary targets) within a season or month.
    struct StabilityBucket
    {
      std::string key;
      std::size_t n{0};
      std::optional<double> value;
    };

    struct MarketStatistics
    {
      std::size_t resolvedCount{0};
      std::size_t pushCount{0};
      std::size_t wins{0};
      std::size_t losses{0};
      std::size_t rowsWithOdds{0};
      double oddsCoveragePct{0.0};
      std::optional<double> avgImpliedProbability;
      std::optional<double> evVsImplied;
      std::optional<double> roiUnits;
      std::optional<double> sharpeLike;
      std::optional<double> maxDrawdown;
    };

    /**
     * @brief Cohort versus baseline comparison for one target.
     *
     * When reasonCode is set (insufficient_sample, no_odds_coverage) the
     * cohort statistics are null and the note explains why.
     */
    struct EvaluationResult
    {
      std::string targetName;
      TargetClass targetClass{TargetClass::Stat};
      MetricType metricType{MetricType::Numeric};
      std::size_t sampleSize{0};
      std::size_t baselineSize{0};
      std::optional<double> baselineValue;
      std::optional<double> cohortValue;
      std::optional<double> delta;
      std::optional<double> relativeDelta;
      std::optional<statistics::DescriptiveSummary> cohortSummary;
      std::optional<MarketStatistics> market;
      std::vector<StabilityBucket> bySeason;
      std::vector<StabilityBucket> byMonth;
      std::string liftLabel;
      std::string sampleLabel;
      std::optional<std::string> reasonCode;
      std::vector<std::string> notes;

      bool available() const
      {
	return !reasonCode.has_value();
      }
    };

    struct FeatureCorrelation
    {
      std::string feature;
      std::string group;
      double r{0.0};
      std::size_t n{0};
      bool significant{false};
    };

    struct FeatureQuality
    {
      std::string feature;
      std::size_t count{0};
      std::size_t nulls{0};
      double nullPct{0.0};
      std::size_t nonNumeric{0};
      std::size_t distinct{0};
      std::optional<double> min;
      std::optional<double> max;
      std::optional<double> mean;
    };
  }
}
