#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "franchise_core/city.hpp"
#include "franchise_core/franchise.hpp"
#include "franchise_core/player.hpp"
#include "franchise_core/random.hpp"

namespace franchise_core {

struct TrainingConfig {
  double base_xp_per_game{2.0};

  // Age brackets: <= young_age, <= prime_dev_age, <= prime_age, older.
  int young_age{21};
  int prime_dev_age{25};
  int prime_age{28};
  double young_mult{1.5};
  double prime_dev_mult{1.2};
  double prime_mult{1.0};
  double declining_mult{0.6};

  // Morale brackets: <= low_morale, <= medium_morale, higher.
  int low_morale{30};
  int medium_morale{60};
  double low_morale_mult{0.7};
  double medium_morale_mult{1.0};
  double high_morale_mult{1.2};

  double poor_ethic_mult{0.6};
  double average_ethic_mult{1.0};
  double excellent_ethic_mult{1.4};

  double injured_mult{0.25};
  double reserve_mult{0.7};
  double jitter{0.2}; // final gain scaled by U(1 - jitter, 1 + jitter)

  int xp_per_level{100};
  // An attribute below potential by no more than this is not recommended.
  int recommend_min_room{5};
};

struct TrainingResult {
  std::int64_t player_id{0};
  int previous_xp{0};
  int new_xp{0};
  int xp_gained{0};
  bool leveled_up{false};
  std::optional<Tool> attribute_improved;
  std::optional<int> previous_value;
  std::optional<int> new_value;
};

struct BatchTrainingResult {
  std::vector<TrainingResult> results;
  std::int64_t total_xp_gained{0};
  int players_leveled_up{0};
};

struct TrainingSummary {
  double training_mult{1.0};
  double facility_bonus{1.0};
  double total_bonus{1.0};
  double avg_progression_rate{1.0};
  int estimated_xp_per_game{0};
  int estimated_games_to_level_up{0};
};

double age_xp_multiplier(int age, const TrainingConfig &cfg = TrainingConfig{});
double morale_xp_multiplier(double morale, const TrainingConfig &cfg = TrainingConfig{});
double work_ethic_xp_multiplier(WorkEthic w, const TrainingConfig &cfg = TrainingConfig{});

// Product of every deterministic factor applied to a player's base XP.
double training_multiplier(const Player &player, const DistrictBonuses &bonuses,
                           int facility_level, const TrainingConfig &cfg = TrainingConfig{},
                           const FacilityConfig &facilities = FacilityConfig{});

// Tool a level-up would raise: the focused tool, or under Overall (and when
// the focus does not belong to the player's type) the tool furthest below
// potential. Earlier tools win ties.
std::optional<Tool> attribute_to_improve(const Player &player);

// One player's XP for games_simulated games. At most one level-up per call;
// the carried remainder is capped just below the next level.
TrainingResult process_player_training(const Player &player, const DistrictBonuses &bonuses,
                                       int facility_level, int games_simulated,
                                       UniformSource &rng,
                                       const TrainingConfig &cfg = TrainingConfig{},
                                       const FacilityConfig &facilities = FacilityConfig{});

BatchTrainingResult process_batch_training(const std::vector<Player> &players,
                                           const DistrictBonuses &bonuses, int facility_level,
                                           int games_simulated, UniformSource &rng,
                                           const TrainingConfig &cfg = TrainingConfig{},
                                           const FacilityConfig &facilities = FacilityConfig{});

// Copy of the player with the result's XP and attribute change applied.
// Results for another player id are ignored.
Player apply_training_result(const Player &player, const TrainingResult &result);

TrainingFocus recommended_training_focus(const Player &player,
                                         const TrainingConfig &cfg = TrainingConfig{});

TrainingSummary training_summary(const std::vector<Player> &players,
                                 const DistrictBonuses &bonuses, int facility_level,
                                 const TrainingConfig &cfg = TrainingConfig{},
                                 const FacilityConfig &facilities = FacilityConfig{});

} // namespace franchise_core
