#include <catch2/catch.hpp>

#include <cstdint>
#include <limits>

#include "franchise_core/franchise.hpp"

using namespace franchise_core;

TEST_CASE("New franchise takes the tier row", "[franchise]") {
  const Franchise f = new_franchise("player", "Riverside", Tier::LowA, 100000);
  CHECK(f.budget == 500000);
  CHECK(f.reserves == 100000);
  CHECK(f.stadium_capacity == 2500);
  CHECK(f.ticket_price == 8);
  CHECK(f.stadium_name == "Riverside Park");
  CHECK(f.facility_level == 0);
}

TEST_CASE("Debt amount", "[franchise]") {
  CHECK(debt_amount(100000) == 0);
  CHECK(debt_amount(0) == 0);
  CHECK(debt_amount(-250000) == 250000);
  CHECK(debt_amount(std::numeric_limits<std::int64_t>::min()) ==
        std::numeric_limits<std::int64_t>::max());
}

TEST_CASE("Roster capacity follows facility level", "[franchise]") {
  CHECK(roster_capacities(0).total == 30);
  CHECK(roster_capacities(1).reserve == 20);
  CHECK(roster_capacities(2).total == 65);
  // out of range clamps
  CHECK(roster_capacities(9).reserve == 40);
  CHECK(roster_capacities(-1).reserve == 5);

  FacilityConfig cfg;
  CHECK(cfg.training_multiplier(1) == Approx(1.15));
}

TEST_CASE("Facility upgrades spend reserves", "[franchise]") {
  Franchise f = new_franchise("player", "Riverside", Tier::LowA, 200000);

  FacilityUpgradeResult r = upgrade_facility(f);
  REQUIRE(r.ok);
  CHECK(r.cost == 150000);
  CHECK(r.new_level == 1);
  CHECK(r.new_reserves == 50000);

  f.facility_level = r.new_level;
  f.reserves = r.new_reserves;
  r = upgrade_facility(f);
  CHECK_FALSE(r.ok);
  CHECK(r.reason.find("Insufficient funds") == 0);
  CHECK(r.new_reserves == 50000);

  f.facility_level = 2;
  f.reserves = 10000000;
  r = upgrade_facility(f);
  CHECK_FALSE(r.ok);
  CHECK(r.reason == "Facilities are already at the maximum level");
}
