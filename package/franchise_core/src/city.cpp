#include "franchise_core/city.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace franchise_core {

namespace {

const std::array<std::pair<BuildingType, const char *>, 5> kBuildingNames = {{
    {BuildingType::Restaurant, "restaurant"},
    {BuildingType::Bar, "bar"},
    {BuildingType::Retail, "retail"},
    {BuildingType::Hotel, "hotel"},
    {BuildingType::Corporate, "corporate"},
}};

} // namespace

const char *building_type_name(BuildingType t) {
  for (const auto &kv : kBuildingNames)
    if (kv.first == t)
      return kv.second;
  return "?";
}

std::optional<BuildingType> parse_building_type(std::string_view name) {
  for (const auto &kv : kBuildingNames)
    if (name == kv.second)
      return kv.first;
  return std::nullopt;
}

double CityState::occupancy_rate() const {
  if (buildings.empty())
    return 0.0;
  const auto active = std::count_if(buildings.begin(), buildings.end(),
                                    [](const Building &b) { return b.is_active(); });
  return static_cast<double>(active) / static_cast<double>(buildings.size());
}

CityState new_city_state(const TierConfig &tier, int team_pride, int national_recognition) {
  CityState city;
  city.population = tier.population;
  city.median_income = tier.median_income;
  city.unemployment_rate = tier.unemployment_rate;
  city.team_pride = std::clamp(team_pride, 0, 100);
  city.national_recognition = std::clamp(national_recognition, 0, 100);
  city.buildings.reserve(kCityBuildingCount);
  for (int i = 0; i < kCityBuildingCount; ++i) {
    Building b;
    b.id = i;
    b.type = kBuildingNames[static_cast<std::size_t>(i) % kBuildingNames.size()].first;
    city.buildings.push_back(b);
  }
  return city;
}

DistrictBonuses compute_district_bonuses(const CityState &city, const DistrictBonusConfig &cfg) {
  DistrictBonuses out;
  double fan = 0.0, income = 0.0, training = 0.0;
  for (const auto &b : city.buildings) {
    if (!b.is_active())
      continue;
    switch (b.type) {
    case BuildingType::Restaurant:
      fan += cfg.restaurant;
      ++out.entertainment_count;
      break;
    case BuildingType::Bar:
      fan += cfg.bar;
      ++out.entertainment_count;
      break;
    case BuildingType::Retail:
      income += cfg.retail;
      ++out.commercial_count;
      break;
    case BuildingType::Hotel:
      income += cfg.hotel;
      ++out.commercial_count;
      break;
    case BuildingType::Corporate:
      training += cfg.corporate;
      ++out.performance_count;
      break;
    }
  }
  out.fan_mult = 1.0 + fan;
  out.income_mult = 1.0 + income;
  out.training_mult = 1.0 + training;
  return out;
}

AttendanceResult calculate_attendance(int stadium_capacity, double win_pct, int city_pride,
                                      double unemployment_rate, int stadium_quality,
                                      int home_games, double fan_mult, UniformSource &rng) {
  AttendanceResult r;
  if (stadium_capacity <= 0 || home_games <= 0)
    return r;

  double base = stadium_capacity * 0.4;
  base *= std::pow(std::max(0.0, win_pct) / 0.5, 1.5);
  base *= 0.7 + (city_pride / 100.0) * 0.8;
  base *= 1.0 - (unemployment_rate / 100.0) * 0.5;
  base *= 0.8 + (stadium_quality / 100.0) * 0.4;
  base *= fan_mult;
  base *= uniform_real(rng, 0.9, 1.1);

  r.avg_attendance = std::min(static_cast<int>(std::lround(base)), stadium_capacity);
  r.total_attendance = static_cast<std::int64_t>(r.avg_attendance) * home_games;
  return r;
}

} // namespace franchise_core
