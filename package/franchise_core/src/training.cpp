#include "franchise_core/training.hpp"

#include <algorithm>
#include <cmath>

#include "franchise_core/log.hpp"

namespace franchise_core {

double age_xp_multiplier(int age, const TrainingConfig &cfg) {
  if (age <= cfg.young_age)
    return cfg.young_mult;
  if (age <= cfg.prime_dev_age)
    return cfg.prime_dev_mult;
  if (age <= cfg.prime_age)
    return cfg.prime_mult;
  return cfg.declining_mult;
}

double morale_xp_multiplier(double morale, const TrainingConfig &cfg) {
  if (morale <= cfg.low_morale)
    return cfg.low_morale_mult;
  if (morale <= cfg.medium_morale)
    return cfg.medium_morale_mult;
  return cfg.high_morale_mult;
}

double work_ethic_xp_multiplier(WorkEthic w, const TrainingConfig &cfg) {
  switch (w) {
  case WorkEthic::Poor:
    return cfg.poor_ethic_mult;
  case WorkEthic::Average:
    return cfg.average_ethic_mult;
  case WorkEthic::Excellent:
    return cfg.excellent_ethic_mult;
  }
  return 1.0;
}

double training_multiplier(const Player &player, const DistrictBonuses &bonuses,
                           int facility_level, const TrainingConfig &cfg,
                           const FacilityConfig &facilities) {
  double m = player.progression_rate;
  m *= age_xp_multiplier(player.age, cfg);
  m *= morale_xp_multiplier(player.morale, cfg);
  m *= work_ethic_xp_multiplier(player.traits.work_ethic, cfg);
  m *= facilities.training_multiplier(facility_level);
  m *= bonuses.training_mult;
  if (player.is_injured)
    m *= cfg.injured_mult;
  if (player.roster_status == RosterStatus::Reserve)
    m *= cfg.reserve_mult;
  return m;
}

std::optional<Tool> attribute_to_improve(const Player &player) {
  const auto &order = tools_for(player.player_type);
  if (player.tools.size() != static_cast<Eigen::Index>(order.size()))
    return std::nullopt;

  if (auto focus = focus_tool(player.training_focus)) {
    if (tool_index(player.player_type, *focus) >= 0)
      return focus;
  }

  std::size_t best = 0;
  int best_room = player.potential - player.tools[0];
  for (std::size_t i = 1; i < order.size(); ++i) {
    const int room = player.potential - player.tools[static_cast<Eigen::Index>(i)];
    if (room > best_room) {
      best_room = room;
      best = i;
    }
  }
  return order[best];
}

TrainingResult process_player_training(const Player &player, const DistrictBonuses &bonuses,
                                       int facility_level, int games_simulated,
                                       UniformSource &rng, const TrainingConfig &cfg,
                                       const FacilityConfig &facilities) {
  TrainingResult r;
  r.player_id = player.id;
  r.previous_xp = std::clamp(player.current_xp, 0, cfg.xp_per_level - 1);
  r.new_xp = r.previous_xp;
  if (games_simulated <= 0)
    return r;

  const double base = cfg.base_xp_per_game * games_simulated;
  const double mult = training_multiplier(player, bonuses, facility_level, cfg, facilities);
  const double variance = uniform_real(rng, 1.0 - cfg.jitter, 1.0 + cfg.jitter);
  r.xp_gained = std::max(0, static_cast<int>(std::lround(base * mult * variance)));

  const int total = r.previous_xp + r.xp_gained;
  if (total < cfg.xp_per_level) {
    r.new_xp = total;
    return r;
  }

  r.leveled_up = true;
  r.new_xp = std::min(total - cfg.xp_per_level, cfg.xp_per_level - 1);

  if (auto tool = attribute_to_improve(player)) {
    const int idx = tool_index(player.player_type, *tool);
    const int before = player.tools[idx];
    r.attribute_improved = tool;
    r.previous_value = before;
    r.new_value = std::clamp(before + 1, kMinRating, kMaxRating);
    log_debug("player {} leveled up: {} {} -> {}", player.id, tool_name(*tool), before,
              *r.new_value);
  }
  return r;
}

BatchTrainingResult process_batch_training(const std::vector<Player> &players,
                                           const DistrictBonuses &bonuses, int facility_level,
                                           int games_simulated, UniformSource &rng,
                                           const TrainingConfig &cfg,
                                           const FacilityConfig &facilities) {
  BatchTrainingResult out;
  out.results.reserve(players.size());
  for (const auto &p : players) {
    TrainingResult r = process_player_training(p, bonuses, facility_level, games_simulated,
                                               rng, cfg, facilities);
    out.total_xp_gained += r.xp_gained;
    if (r.leveled_up)
      ++out.players_leveled_up;
    out.results.push_back(std::move(r));
  }
  return out;
}

Player apply_training_result(const Player &player, const TrainingResult &result) {
  Player p = player;
  if (result.player_id != player.id)
    return p;
  p.current_xp = result.new_xp;
  if (result.attribute_improved && result.new_value) {
    const int idx = tool_index(p.player_type, *result.attribute_improved);
    if (idx >= 0 && idx < p.tools.size())
      p.tools[idx] = std::clamp(*result.new_value, kMinRating, kMaxRating);
  }
  return p;
}

TrainingFocus recommended_training_focus(const Player &player, const TrainingConfig &cfg) {
  const auto &order = tools_for(player.player_type);
  const TrainingFocus fallback =
      player.player_type == PlayerType::Hitter ? TrainingFocus::Hit : TrainingFocus::Stuff;
  if (player.tools.size() != static_cast<Eigen::Index>(order.size()))
    return TrainingFocus::Overall;

  TrainingFocus best = fallback;
  double best_score = -1e300;
  for (std::size_t i = 0; i < order.size(); ++i) {
    const int value = player.tools[static_cast<Eigen::Index>(i)];
    const int room = player.potential - value;
    const double score = room * (100.0 - value) / 100.0;
    if (room > cfg.recommend_min_room && score > best_score) {
      best_score = score;
      best = focus_for(order[i]);
    }
  }
  return best;
}

TrainingSummary training_summary(const std::vector<Player> &players,
                                 const DistrictBonuses &bonuses, int facility_level,
                                 const TrainingConfig &cfg, const FacilityConfig &facilities) {
  TrainingSummary s;
  s.training_mult = bonuses.training_mult;
  s.facility_bonus = facilities.training_multiplier(facility_level);
  s.total_bonus = s.training_mult * s.facility_bonus;

  double avg_morale = 50.0;
  if (!players.empty()) {
    double rate = 0.0, morale = 0.0;
    for (const auto &p : players) {
      rate += p.progression_rate;
      morale += p.morale;
    }
    s.avg_progression_rate = rate / static_cast<double>(players.size());
    avg_morale = morale / static_cast<double>(players.size());
  }

  s.estimated_xp_per_game = static_cast<int>(std::lround(
      cfg.base_xp_per_game * s.avg_progression_rate * s.total_bonus *
      morale_xp_multiplier(avg_morale, cfg)));
  s.estimated_games_to_level_up =
      s.estimated_xp_per_game > 0
          ? static_cast<int>(std::ceil(static_cast<double>(cfg.xp_per_level) /
                                       s.estimated_xp_per_game))
          : 999;
  return s;
}

} // namespace franchise_core
