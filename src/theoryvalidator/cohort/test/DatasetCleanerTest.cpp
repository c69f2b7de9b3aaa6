#include <catch2/catch_test_macros.hpp>
#include "DatasetCleaner.h"

using namespace theory_validator;
using namespace theory_validator::cohort;
using sportsdata::StatValue;

namespace
{
  CohortRow row(std::vector<StatValue> values)
  {
    CohortRow r;
    r.features = std::move(values);
    r.target = 1.0;
    return r;
  }

  std::vector<CohortRow> sampleRows()
  {
    return {
      row({StatValue::numeric(1.0), StatValue::numeric(2.0), StatValue::numeric(3.0)}),
      row({StatValue::numeric(1.0), StatValue::null(), StatValue::numeric(3.0)}),
      row({StatValue::null(), StatValue::null(), StatValue::null()}),
      row({StatValue::numeric(1.0), StatValue::nonNumeric(), StatValue::null()}),
      row({StatValue::numeric(4.0), StatValue::numeric(5.0), StatValue::nonNumeric()})
    };
  }
}

TEST_CASE("DatasetCleaner keeps every row by default", "[DatasetCleaner]")
{
  auto rows = sampleRows();
  auto summary = DatasetCleaner(CleaningOptions()).clean(rows);
  REQUIRE(summary.rawRows == 5);
  REQUIRE(summary.rowsAfterCleaning == 5);
  REQUIRE(summary.droppedNull == 0);
  REQUIRE(summary.droppedNonNumeric == 0);
}

TEST_CASE("DatasetCleaner checks non-numeric before nulls", "[DatasetCleaner]")
{
  CleaningOptions options;
  options.dropIfNonNumeric = true;
  options.dropIfAnyNull = true;

  auto rows = sampleRows();
  auto summary = DatasetCleaner(options).clean(rows);
  REQUIRE(summary.droppedNonNumeric == 2);
  REQUIRE(summary.droppedNull == 2);
  REQUIRE(summary.rowsAfterCleaning == 1);
  REQUIRE(summary.rawRows == summary.rowsAfterCleaning + summary.droppedNull + summary.droppedNonNumeric);
  REQUIRE(rows.size() == 1);
  REQUIRE(rows[0].features[1].value() == 2.0);
}

TEST_CASE("DatasetCleaner all-null and minimum non-null counts", "[DatasetCleaner]")
{
  SECTION("all null")
    {
      CleaningOptions options;
      options.dropIfAllNull = true;
      auto rows = sampleRows();
      auto summary = DatasetCleaner(options).clean(rows);
      REQUIRE(summary.droppedNull == 1);
      REQUIRE(summary.rowsAfterCleaning == 4);
    }

  SECTION("minimum non-null features counts non-numeric values as present")
    {
      CleaningOptions options;
      options.minNonNullFeatures = 2;
      auto rows = sampleRows();
      auto summary = DatasetCleaner(options).clean(rows);
      REQUIRE(summary.droppedNull == 1);
      REQUIRE(summary.rowsAfterCleaning == 4);
    }

  SECTION("all-null never drops rows when no feature is selected")
    {
      CleaningOptions options;
      options.dropIfAllNull = true;
      std::vector<CohortRow> rows = {row({}), row({})};
      auto summary = DatasetCleaner(options).clean(rows);
      REQUIRE(summary.rowsAfterCleaning == 2);
    }
}

TEST_CASE("DatasetCleaner preserves row order", "[DatasetCleaner]")
{
  CleaningOptions options;
  options.dropIfAllNull = true;
  auto rows = sampleRows();
  rows[0].target = 10.0;
  rows[4].target = 50.0;
  DatasetCleaner(options).clean(rows);
  REQUIRE(rows.front().target == 10.0);
  REQUIRE(rows.back().target == 50.0);
}
