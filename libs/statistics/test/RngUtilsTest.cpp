#include <catch2/catch_test_macros.hpp>
#include <set>
#include <vector>

#include "RngUtils.h"

using namespace theory_validator::rng_utils;

TEST_CASE("hash_combine64 is deterministic and order sensitive", "[RngUtils]")
{
  REQUIRE(hash_combine64({1, 2, 3}) == hash_combine64({1, 2, 3}));
  REQUIRE(hash_combine64({1, 2}) != hash_combine64({2, 1}));
  REQUIRE(splitmix64(0) != splitmix64(1));
}

TEST_CASE("make_replicate_engine depends only on seed and replicate", "[RngUtils]")
{
  auto a = make_replicate_engine(42, 7);
  auto b = make_replicate_engine(42, 7);
  auto c = make_replicate_engine(42, 8);

  std::vector<uint64_t> da, db, dc;
  for (int i = 0; i < 16; ++i)
    {
      da.push_back(a());
      db.push_back(b());
      dc.push_back(c());
    }

  REQUIRE(da == db);
  REQUIRE(da != dc);
}

TEST_CASE("draw_index covers the whole range", "[RngUtils]")
{
  auto eng = make_replicate_engine(1, 0);
  std::set<std::size_t> seen;
  for (int i = 0; i < 2000; ++i)
    {
      const std::size_t idx = draw_index(eng, 5);
      REQUIRE(idx < 5);
      seen.insert(idx);
    }
  REQUIRE(seen.size() == 5);
  REQUIRE(draw_index(eng, 0) == 0);
}
