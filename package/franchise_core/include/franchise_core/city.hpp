#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "franchise_core/random.hpp"
#include "franchise_core/tier.hpp"

namespace franchise_core {

constexpr int kCityBuildingCount = 50;
constexpr int kMaxBuildingState = 4;
constexpr int kActiveBuildingState = 2; // a building contributes from here on

enum class BuildingType { Restaurant, Bar, Retail, Hotel, Corporate };

const char *building_type_name(BuildingType t);
std::optional<BuildingType> parse_building_type(std::string_view name);

struct Building {
  int id{0}; // 0..49
  BuildingType type{BuildingType::Restaurant};
  int state{0}; // 0..4
  std::string name;
  std::optional<int> year_opened;

  bool is_active() const { return state >= kActiveBuildingState; }
};

struct CityState {
  int population{0};
  std::int64_t median_income{0};
  double unemployment_rate{0.0}; // percent

  int team_pride{50};           // 0-100
  int national_recognition{0};  // 0-100

  std::vector<Building> buildings; // kCityBuildingCount entries

  // Share of buildings at or above the active state.
  double occupancy_rate() const;
};

// City for a franchise starting at the given tier: demographics from the tier
// row, every building vacant. Building types cycle through the five kinds.
CityState new_city_state(const TierConfig &tier, int team_pride = 50,
                         int national_recognition = 0);

// Per-building bonus of an active building, by type.
struct DistrictBonusConfig {
  double restaurant{0.02};
  double bar{0.025};
  double retail{0.02};
  double hotel{0.05};
  double corporate{0.03};
};

// Multipliers the city grants the franchise. Entertainment (restaurants,
// bars) drives fans, commercial (retail, hotels) drives income and the
// performance district (corporate) drives training.
struct DistrictBonuses {
  double fan_mult{1.0};
  double income_mult{1.0};
  double training_mult{1.0};
  int entertainment_count{0};
  int commercial_count{0};
  int performance_count{0};
};

DistrictBonuses compute_district_bonuses(const CityState &city,
                                         const DistrictBonusConfig &cfg = DistrictBonusConfig{});

struct AttendanceResult {
  int avg_attendance{0};
  std::int64_t total_attendance{0};
};

// Season attendance: 40% of capacity scaled by winning, pride, unemployment,
// stadium quality and the fan multiplier, with a +/-10% draw, capped at
// capacity per game.
AttendanceResult calculate_attendance(int stadium_capacity, double win_pct, int city_pride,
                                      double unemployment_rate, int stadium_quality,
                                      int home_games, double fan_mult, UniformSource &rng);

} // namespace franchise_core
