#include <catch2/catch.hpp>

#include <stdexcept>
#include <utility>
#include <vector>

#include "franchise_core/tier.hpp"

using namespace franchise_core;

TEST_CASE("Tier ids and ladder order", "[tier]") {
  CHECK(std::string(tier_id(Tier::DoubleA)) == "DOUBLE_A");
  CHECK(parse_tier("TRIPLE_A") == Tier::TripleA);
  CHECK_FALSE(parse_tier("ROOKIE").has_value());
  CHECK(next_tier(Tier::LowA) == Tier::HighA);
  CHECK_FALSE(next_tier(Tier::MLB).has_value());
}

TEST_CASE("Standard tier table", "[tier]") {
  const TierTable &t = TierTable::standard();
  CHECK(t.at(Tier::LowA).budget == 500000);
  CHECK(t.at(Tier::MLB).stadium_capacity == 42000);
  CHECK(t.at(Tier::HighA).promotion->division_title);
  CHECK(t.at(Tier::TripleA).promotion->league_championship);
  CHECK_FALSE(t.at(Tier::MLB).promotion.has_value());

  // budgets grow up the ladder
  for (int i = 1; i < kTierCount; ++i) {
    CHECK(t.rows()[i].budget > t.rows()[i - 1].budget);
  }
}

TEST_CASE("TierTable validates its rows", "[tier]") {
  const auto &std_rows = TierTable::standard().rows();
  std::vector<TierConfig> rows(std_rows.begin(), std_rows.end());

  SECTION("wrong row count") {
    rows.pop_back();
    CHECK_THROWS_AS(TierTable(rows), std::invalid_argument);
  }
  SECTION("out of order") {
    std::swap(rows[0], rows[1]);
    CHECK_THROWS_AS(TierTable(rows), std::invalid_argument);
  }
  SECTION("promotion at the top") {
    rows.back().promotion = PromotionRequirements{};
    CHECK_THROWS_AS(TierTable(rows), std::invalid_argument);
  }
  SECTION("valid copy") {
    TierTable copy(rows);
    CHECK(copy.at(Tier::DoubleA).name == "Double-A");
  }
}
