#include "DatasetCleaner.h"
#include <utility>

namespace theory_validator
{
  namespace cohort
  {
    DatasetCleaner::DatasetCleaner(const CleaningOptions& options)
      : mOptions(options)
    {}

    DatasetCleaner::Verdict DatasetCleaner::inspect(const CohortRow& row) const
    {
      std::size_t nulls = 0;
      std::size_t nonNumeric = 0;
      for (const auto& value : row.features)
	{
	  if (value.isNull())
	    ++nulls;
	  else if (!value.isNumeric())
	    ++nonNumeric;
	}

      const std::size_t total = row.features.size();
      if (mOptions.dropIfNonNumeric && nonNumeric > 0)
	return Verdict::DropNonNumeric;
      if (mOptions.dropIfAnyNull && nulls > 0)
	return Verdict::DropNull;
      if (mOptions.dropIfAllNull && total > 0 && nulls == total)
	return Verdict::DropNull;
      if (mOptions.minNonNullFeatures &&
	  static_cast<long>(total - nulls) < static_cast<long>(*mOptions.minNonNullFeatures))
	return Verdict::DropNull;
      return Verdict::Keep;
    }

    CleaningSummary DatasetCleaner::clean(std::vector<CohortRow>& rows) const
    {
      CleaningSummary summary;
      summary.rawRows = rows.size();

      std::vector<CohortRow> kept;
      kept.reserve(rows.size());
      for (auto& row : rows)
	{
	  switch (inspect(row))
	    {
	    case Verdict::DropNull:
	      ++summary.droppedNull;
	      break;
	    case Verdict::DropNonNumeric:
	      ++summary.droppedNonNumeric;
	      break;
	    case Verdict::Keep:
	      kept.push_back(std::move(row));
	      break;
	    }
	}
      rows = std::move(kept);
      summary.rowsAfterCleaning = rows.size();
      return summary;
    }
  }
}
