#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace franchise_core {

enum class Tier { LowA = 0, HighA = 1, DoubleA = 2, TripleA = 3, MLB = 4 };

constexpr int kTierCount = 5;

const char *tier_id(Tier t); // "LOW_A", ...
std::optional<Tier> parse_tier(std::string_view id);
int tier_index(Tier t);
std::optional<Tier> next_tier(Tier t);

struct PromotionRequirements {
  double win_pct{0.0};
  int consecutive_years{0};
  std::int64_t reserves{0};
  int city_pride{0};
  bool division_title{false};
  bool league_championship{false};
};

struct TierConfig {
  Tier tier{Tier::LowA};
  std::string name;
  std::int64_t budget{0};
  int stadium_capacity{0};
  int season_length{0};
  int average_opponent_strength{50};
  int min_age{18};
  int max_age{35};
  int min_rating{20};
  int max_rating{80};
  std::int64_t scouting_budget{0};
  int min_ticket_price{0};
  int max_ticket_price{0};
  std::int64_t min_salary{0};
  std::int64_t max_salary{0};
  // Host-city demographics for a franchise starting at this tier.
  int population{0};
  double unemployment_rate{0.0}; // percent
  std::int64_t median_income{0};
  // Absent at the top tier.
  std::optional<PromotionRequirements> promotion;
};

// Immutable lookup of per-tier constants, one row per tier in ladder order.
class TierTable {
public:
  explicit TierTable(std::vector<TierConfig> rows);

  const TierConfig &at(Tier t) const { return rows_[static_cast<std::size_t>(tier_index(t))]; }
  const std::array<TierConfig, kTierCount> &rows() const { return rows_; }

  static const TierTable &standard();

private:
  std::array<TierConfig, kTierCount> rows_;
};

} // namespace franchise_core
