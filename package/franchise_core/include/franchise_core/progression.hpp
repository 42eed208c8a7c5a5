#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "franchise_core/city.hpp"
#include "franchise_core/franchise.hpp"
#include "franchise_core/tier.hpp"

namespace franchise_core {

enum class GameStatus { Active, GameOver, Promoted, Champion };

const char *game_status_name(GameStatus s);

enum class DebtWarningLevel { None, Low, Medium, High, Critical };

const char *debt_warning_level_name(DebtWarningLevel l);

struct ProgressionConfig {
  double bankruptcy_budget_multiple{2.0}; // game over strictly above this
  int promotion_pride_boost{15};
  // Fractions of the bankruptcy threshold for the debt warning bands.
  double warning_high{0.75};
  double warning_medium{0.5};
  double warning_low{0.25};
};

struct RequirementCheck {
  std::string criterion; // "win_pct", "reserves", ...
  double required{0.0};
  double actual{0.0};
  bool met{false};
};

struct PromotionInput {
  Tier tier{Tier::LowA};
  double win_pct{0.0};
  std::int64_t reserves{0};
  int city_pride{0};
  int consecutive_winning_seasons{0};
  bool won_division{false};
  bool won_championship{false};
};

struct PromotionEligibility {
  bool is_eligible{false};
  std::optional<Tier> next_tier;
  std::vector<std::string> met_criteria;
  std::vector<std::string> missing_criteria;
  std::vector<RequirementCheck> requirements; // only those the tier imposes
};

struct GameStatusCheck {
  GameStatus status{GameStatus::Active};
  std::optional<std::string> reason;
  std::int64_t total_debt{0};
  std::int64_t debt_threshold{0};
  bool is_in_debt{false};
  bool is_bankrupt{false};
};

struct PromotionBonuses {
  std::int64_t budget_increase{0};
  int stadium_capacity_increase{0};
  int pride_boost{0};
};

struct DebtWarning {
  DebtWarningLevel level{DebtWarningLevel::None};
  std::optional<std::string> message;
  double debt_percent{0.0};
};

struct PromotionResult {
  bool ok{false};
  std::string reason;
  Tier previous_tier{Tier::LowA};
  Tier new_tier{Tier::LowA};
  PromotionBonuses bonuses;
  Franchise franchise;
  CityState city;
};

// Eligible iff every requirement of the current tier is met. The top tier is
// never eligible.
PromotionEligibility check_promotion_eligibility(const PromotionInput &input,
                                                 const TierTable &tiers = TierTable::standard());

// game_over iff debt is strictly above the budget multiple. An MLB franchise
// that just won the championship reports champion.
GameStatusCheck check_game_status(std::int64_t reserves, std::int64_t annual_budget, Tier tier,
                                  bool won_mlb_championship = false,
                                  const ProgressionConfig &cfg = ProgressionConfig{});

PromotionBonuses calculate_promotion_bonuses(Tier from, Tier to,
                                             const TierTable &tiers = TierTable::standard(),
                                             const ProgressionConfig &cfg = ProgressionConfig{});

DebtWarning debt_warning(std::int64_t reserves, std::int64_t annual_budget,
                         const ProgressionConfig &cfg = ProgressionConfig{});

// Share of requirements met, 0-100; 100 at the top tier.
int progress_to_next_tier(const PromotionInput &input,
                          const TierTable &tiers = TierTable::standard());

// Moves the franchise one tier up: budget ceiling and stadium capacity from
// the new tier row, pride boost for the city, streak counters reset.
PromotionResult apply_promotion(const Franchise &franchise, const CityState &city,
                                const TierTable &tiers = TierTable::standard(),
                                const ProgressionConfig &cfg = ProgressionConfig{});

} // namespace franchise_core
