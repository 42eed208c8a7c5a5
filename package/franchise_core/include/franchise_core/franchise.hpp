#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "franchise_core/tier.hpp"

namespace franchise_core {

constexpr int kActiveRosterSize = 25;

struct FacilityLevelConfig {
  int level{0};
  std::string name;
  int reserve_slots{0};
  // Cost to reach the next level; absent at the top level.
  std::optional<std::int64_t> upgrade_cost;
  double training_multiplier{1.0};
};

// Farm-system facility ladder. Level 0 is the basic complex every franchise
// starts with.
struct FacilityConfig {
  std::array<FacilityLevelConfig, 3> levels{{
      {0, "Basic Dugout", 5, std::int64_t{150000}, 1.0},
      {1, "Minor League Complex", 20, std::int64_t{500000}, 1.15},
      {2, "Player Development Lab", 40, std::nullopt, 1.30},
  }};

  // Out-of-range levels clamp onto the ladder.
  const FacilityLevelConfig &at(int level) const;
  double training_multiplier(int level) const { return at(level).training_multiplier; }
};

struct RosterCapacities {
  int active{kActiveRosterSize};
  int reserve{0};
  int total{kActiveRosterSize};
};

RosterCapacities roster_capacities(int facility_level,
                                   const FacilityConfig &cfg = FacilityConfig{});

struct FacilityUpgradeResult {
  bool ok{false};
  std::string reason;
  int new_level{0};
  std::int64_t cost{0};
  std::int64_t new_reserves{0};
};

struct Franchise {
  std::string id;
  std::string name;

  Tier tier{Tier::LowA};
  std::int64_t budget{0};   // tier ceiling
  std::int64_t reserves{0}; // signed; negative means debt

  std::string stadium_name;
  int stadium_capacity{0};
  int stadium_quality{50}; // 0-100

  int hitting_coach_skill{50};
  std::int64_t hitting_coach_salary{0};
  int pitching_coach_skill{50};
  std::int64_t pitching_coach_salary{0};
  int development_coord_skill{50};
  std::int64_t development_coord_salary{0};

  int ticket_price{0};
  int facility_level{0}; // 0..2

  int consecutive_winning_seasons{0};
  int consecutive_division_titles{0};
};

// Amount owed when reserves are negative, zero otherwise. Saturates at the
// int64 maximum.
std::int64_t debt_amount(std::int64_t reserves);

// Fresh franchise at the given tier: budget and stadium from the tier row,
// ticket price at the middle of the tier's range.
Franchise new_franchise(std::string id, std::string name, Tier tier,
                        std::int64_t starting_reserves,
                        const TierTable &tiers = TierTable::standard());

// Spend reserves to move one facility level up. Fails with a reason when
// already at the top or when reserves do not cover the cost.
FacilityUpgradeResult upgrade_facility(const Franchise &franchise,
                                       const FacilityConfig &cfg = FacilityConfig{});

} // namespace franchise_core
