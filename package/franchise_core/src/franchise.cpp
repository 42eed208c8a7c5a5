#include "franchise_core/franchise.hpp"

#include <algorithm>
#include <limits>
#include <utility>

#include <fmt/format.h>

namespace franchise_core {

const FacilityLevelConfig &FacilityConfig::at(int level) const {
  const int last = static_cast<int>(levels.size()) - 1;
  return levels[static_cast<std::size_t>(std::clamp(level, 0, last))];
}

RosterCapacities roster_capacities(int facility_level, const FacilityConfig &cfg) {
  RosterCapacities caps;
  caps.reserve = cfg.at(facility_level).reserve_slots;
  caps.total = caps.active + caps.reserve;
  return caps;
}

std::int64_t debt_amount(std::int64_t reserves) {
  if (reserves >= 0)
    return 0;
  if (reserves == std::numeric_limits<std::int64_t>::min())
    return std::numeric_limits<std::int64_t>::max();
  return -reserves;
}

Franchise new_franchise(std::string id, std::string name, Tier tier,
                        std::int64_t starting_reserves, const TierTable &tiers) {
  const TierConfig &tc = tiers.at(tier);
  Franchise f;
  f.id = std::move(id);
  f.name = std::move(name);
  f.tier = tier;
  f.budget = tc.budget;
  f.reserves = starting_reserves;
  f.stadium_name = f.name + " Park";
  f.stadium_capacity = tc.stadium_capacity;
  f.ticket_price = (tc.min_ticket_price + tc.max_ticket_price) / 2;
  return f;
}

FacilityUpgradeResult upgrade_facility(const Franchise &franchise,
                                       const FacilityConfig &cfg) {
  FacilityUpgradeResult r;
  r.new_level = franchise.facility_level;
  r.new_reserves = franchise.reserves;

  const FacilityLevelConfig &cur = cfg.at(franchise.facility_level);
  if (!cur.upgrade_cost) {
    r.reason = "Facilities are already at the maximum level";
    return r;
  }
  if (franchise.reserves < *cur.upgrade_cost) {
    r.reason = fmt::format("Insufficient funds: upgrade costs ${}, reserves are ${}",
                           *cur.upgrade_cost, franchise.reserves);
    return r;
  }
  r.ok = true;
  r.cost = *cur.upgrade_cost;
  r.new_level = cur.level + 1;
  r.new_reserves = franchise.reserves - r.cost;
  return r;
}

} // namespace franchise_core
