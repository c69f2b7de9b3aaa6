#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "SimulationTypes.h"
#include "TargetDefinition.h"

namespace theory_validator
{
  namespace simulation
  {
    struct SliceMetrics
    {
      std::string label;
      std::size_t n{0};
      std::size_t wins{0};
      std::size_t losses{0};
      double hitRate{0.0};
      double pnlUnits{0.0};
      double roiPerBet{0.0};
      std::optional<double> avgModelProb;
      std::optional<double> avgImpliedProb;
      std::optional<double> avgEdge;
      std::optional<double> hitMinusImplied;
      bool redZone{false};
    };

    struct PerformanceSlices
    {
      SliceMetrics overall;
      std::vector<SliceMetrics> confidence;
      std::vector<SliceMetrics> spreadBuckets;
      std::vector<SliceMetrics> favoriteUnderdog;
      std::vector<SliceMetrics> paceQuartiles;
      std::vector<std::string> notes;
    };

    struct FailureAnalysis
    {
      std::vector<BetTapeRow> largestLosses;
      std::vector<BetTapeRow> overconfidentLosses;
      std::vector<SliceMetrics> edgeBuckets;
      std::vector<std::string> notes;
    };

    /**
     * @brief Groups a bet tape into diagnostic slices.
     *
     * A slice is in the red zone when its ROI is negative or its hit rate is
     * below the average implied probability.
     */
    class PerformanceSlicer
    {
    public:
      static constexpr std::size_t kMinPaceBets = 20;
      static constexpr std::size_t kFailureRows = 10;

      static SliceMetrics metrics(const std::string& label, const std::vector<const BetTapeRow*>& rows);

      static PerformanceSlices slice(const std::vector<BetTapeRow>& tape,
				     const evaluation::TargetDefinition& target);

      static FailureAnalysis failures(const std::vector<BetTapeRow>& tape);
    };
  }
}
