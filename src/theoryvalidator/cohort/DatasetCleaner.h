#pragma once

#include <cstddef>
#include <optional>
#include <vector>
#include "CohortDataset.h"

namespace theory_validator
{
  namespace cohort
  {
    struct CleaningOptions
    {
      bool dropIfAllNull{false};
      bool dropIfAnyNull{false};
      bool dropIfNonNumeric{false};
      std::optional<int> minNonNullFeatures;
    };

    struct CleaningSummary
    {
      std::size_t rawRows{0};
      std::size_t rowsAfterCleaning{0};
      std::size_t droppedNull{0};
      std::size_t droppedNonNumeric{0};
    };

    /**
     * @brief Applies CleaningOptions to cohort rows.
     *
     * Checks run per row in the order non-numeric, any-null, all-null,
     * min-non-null; the first failing check decides which counter the drop
     * lands in. All-null only applies when at least one feature is selected.
     */
    class DatasetCleaner
    {
    public:
      explicit DatasetCleaner(const CleaningOptions& options);

      CleaningSummary clean(std::vector<CohortRow>& rows) const;

    private:
      enum class Verdict
      {
	Keep,
	DropNull,
	DropNonNumeric
      };

      Verdict inspect(const CohortRow& row) const;

    private:
      CleaningOptions mOptions;
    };
  }
}
