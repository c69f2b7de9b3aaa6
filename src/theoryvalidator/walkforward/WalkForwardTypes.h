#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace theory_validator
{
  namespace walkforward
  {
    struct WalkForwardWindow
    {
      int trainDays{180};
      int testDays{14};
      int stepDays{7};
    };

    /**
     * @throws ConfigurationException when train_days is outside [30, 730] or
     *         test_days / step_days are outside [3, 90]
     */
    void validateWindow(const WalkForwardWindow& window);

    struct WalkForwardPolicy
    {
      std::size_t minTrainRows{30};
      std::size_t minTestRows{5};
    };

    // One test window. startDate is the first test day, endDate is exclusive.
    struct WalkforwardSlice
    {
      boost::gregorian::date startDate;
      boost::gregorian::date endDate;
      std::size_t trainRows{0};
      std::size_t sampleSize{0};
      std::size_t betCount{0};
      std::optional<double> hitRate;
      std::optional<double> roiUnits;
      std::optional<double> edgeAvg;
      double oddsCoveragePct{0.0};
    };

    struct WalkForwardResult
    {
      bool eligible{true};
      std::string reasonCode;
      WalkForwardWindow window;
      std::vector<WalkforwardSlice> slices;
      std::size_t skippedSlices{0};
      std::optional<int> edgeHalfLifeDays;
      std::vector<std::string> notes;
    };
  }
}
