#include "franchise_core/draft_ai.hpp"

#include <algorithm>
#include <limits>
#include <numeric>

#include <fmt/format.h>

#include "franchise_core/log.hpp"

namespace franchise_core {

namespace {

const std::vector<std::pair<DraftPhilosophy, const char *>> kPhilosophyNames = {
    {DraftPhilosophy::BestAvailable, "best_available"},
    {DraftPhilosophy::NeedBased, "need_based"},
    {DraftPhilosophy::UpsideSwing, "upside_swing"},
    {DraftPhilosophy::SafeFloor, "safe_floor"}};

AITeam make_team(const char *id, const char *city, const char *name, DraftPhilosophy p,
                 int risk, std::vector<PositionNeed> needs, int strength, double variance) {
  AITeam t;
  t.id = id;
  t.city = city;
  t.name = name;
  t.philosophy = p;
  t.risk_tolerance = risk;
  t.needs = std::move(needs);
  t.base_strength = strength;
  t.variance = variance;
  return t;
}

} // namespace

const char *draft_philosophy_name(DraftPhilosophy p) {
  for (const auto &kv : kPhilosophyNames)
    if (kv.first == p)
      return kv.second;
  return "?";
}

std::optional<DraftPhilosophy> parse_draft_philosophy(std::string_view name) {
  for (const auto &kv : kPhilosophyNames)
    if (name == kv.second)
      return kv.first;
  return std::nullopt;
}

const std::vector<AITeam> &default_ai_teams() {
  using P = DraftPhilosophy;
  static const std::vector<AITeam> teams = {
      make_team("steel-city-hammers", "Steel City", "Hammers", P::BestAvailable, 70, {}, 52, 1.0),
      make_team("river-city-rapids", "River City", "Rapids", P::UpsideSwing, 80, {}, 48, 1.3),
      make_team("canyon-town-coyotes", "Canyon Town", "Coyotes", P::UpsideSwing, 85, {}, 45, 1.4),
      make_team("port-city-sailors", "Port City", "Sailors", P::SafeFloor, 30, {}, 50, 0.8),
      make_team("forest-city-foresters", "Forest City", "Foresters", P::SafeFloor, 25, {}, 51, 0.7),
      make_team("valley-town-vultures", "Valley Town", "Vultures", P::SafeFloor, 20, {}, 49, 0.75),
      make_team("coaltown-miners", "Coaltown", "Miners", P::NeedBased, 50,
                {{Position::SP, 90}, {Position::RP, 70}}, 47, 1.0),
      make_team("mountain-town-mountaineers", "Mountain Town", "Mountaineers", P::NeedBased, 50,
                {{Position::C, 85}, {Position::FirstBase, 60}}, 48, 1.0),
      make_team("desert-springs-scorpions", "Desert Springs", "Scorpions", P::NeedBased, 55,
                {{Position::CF, 80}, {Position::LF, 65}, {Position::RF, 65}}, 46, 1.0),
      make_team("lakeside-lakers", "Lakeside", "Lakers", P::UpsideSwing, 60, {}, 50, 1.2),
      make_team("bay-city-buccaneers", "Bay City", "Buccaneers", P::BestAvailable, 45, {}, 53, 0.9),
      make_team("prairie-plains-pioneers", "Prairie Plains", "Pioneers", P::BestAvailable, 55, {}, 49, 1.0),
      make_team("summit-heights-hawks", "Summit Heights", "Hawks", P::UpsideSwing, 65, {}, 47, 1.1),
      make_team("riverside-royals", "Riverside", "Royals", P::SafeFloor, 35, {}, 52, 0.85),
      make_team("crossroads-cardinals", "Crossroads", "Cardinals", P::NeedBased, 50,
                {{Position::SS, 75}, {Position::SecondBase, 70}}, 50, 1.0),
      make_team("ironworks-ironmen", "Ironworks", "Ironmen", P::BestAvailable, 60, {}, 51, 1.0),
      make_team("harbor-town-hurricanes", "Harbor Town", "Hurricanes", P::UpsideSwing, 75, {}, 46, 1.25),
      make_team("metro-city-meteors", "Metro City", "Meteors", P::SafeFloor, 40, {}, 54, 0.8),
      make_team("central-valley-condors", "Central Valley", "Condors", P::NeedBased, 45,
                {{Position::ThirdBase, 80}, {Position::DH, 50}}, 48, 1.0),
  };
  return teams;
}

Eigen::VectorXd DraftAgent::score_prospects(const std::vector<DraftProspect> &pool,
                                            UniformSource &rng,
                                            std::vector<std::string> *reasons) const {
  const auto n = static_cast<Eigen::Index>(pool.size());
  Eigen::VectorXd score = Eigen::VectorXd::Constant(n, -std::numeric_limits<double>::infinity());
  if (reasons)
    reasons->assign(pool.size(), std::string());

  for (Eigen::Index i = 0; i < n; ++i) {
    const DraftProspect &p = pool[static_cast<std::size_t>(i)];
    if (p.is_drafted)
      continue;

    double s = p.current_rating + uniform_real(rng, -cfg_.scouting_noise, cfg_.scouting_noise);
    std::string reason = "best available";
    const int upside = p.potential - p.current_rating;

    switch (team_.philosophy) {
    case DraftPhilosophy::BestAvailable:
      break;
    case DraftPhilosophy::NeedBased: {
      auto it = std::find_if(team_.needs.begin(), team_.needs.end(),
                             [&](const PositionNeed &nd) { return nd.position == p.position; });
      if (it != team_.needs.end()) {
        s += it->priority / cfg_.need_divisor;
        reason = fmt::format("filling need at {}", position_name(p.position));
      }
      break;
    }
    case DraftPhilosophy::UpsideSwing:
      s += cfg_.upside_weight * upside;
      reason = "high ceiling prospect";
      break;
    case DraftPhilosophy::SafeFloor:
      s -= cfg_.floor_weight * upside;
      if (p.traits.injury_prone && team_.risk_tolerance < cfg_.injury_risk_threshold) {
        s -= (cfg_.injury_risk_threshold - team_.risk_tolerance) / cfg_.injury_penalty_divisor;
        reason = "safe, low-risk pick";
      }
      break;
    }

    s += uniform_real(rng, -cfg_.decision_noise, cfg_.decision_noise);
    score[i] = s;
    if (reasons)
      (*reasons)[static_cast<std::size_t>(i)] = std::move(reason);
  }
  return score;
}

AIDraftPickResult DraftAgent::pick(const std::vector<DraftProspect> &pool, int round,
                                   UniformSource &rng) const {
  AIDraftPickResult r;
  std::vector<std::string> reasons;
  const Eigen::VectorXd score = score_prospects(pool, rng, &reasons);

  std::vector<int> idx;
  idx.reserve(pool.size());
  for (std::size_t i = 0; i < pool.size(); ++i)
    if (!pool[i].is_drafted)
      idx.push_back(static_cast<int>(i));
  if (idx.empty()) {
    r.reason = "No prospects available";
    return r;
  }

  std::stable_sort(idx.begin(), idx.end(), [&](int a, int b) { return score[a] > score[b]; });

  const int top_n = round <= 1 ? 1 : std::max(1, cfg_.later_round_pool);
  const int window = std::min<int>(top_n, static_cast<int>(idx.size()));
  const int chosen = idx[static_cast<std::size_t>(window == 1 ? 0 : uniform_int(rng, 0, window - 1))];

  r.ok = true;
  r.selected_index = chosen;
  r.prospect_id = pool[static_cast<std::size_t>(chosen)].id;
  r.score = score[chosen];
  r.reason = reasons[static_cast<std::size_t>(chosen)];
  return r;
}

AIDraftPickResult ai_draft_pick(const AITeam &team, const std::vector<DraftProspect> &pool,
                                int round, UniformSource &rng, const DraftAIConfig &cfg) {
  return DraftAgent(team, cfg).pick(pool, round, rng);
}

int pick_position_in_round(int pick, int round, int picks_per_round, bool snake) {
  if (picks_per_round <= 0)
    return 0;
  const int pos = ((pick - 1) % picks_per_round) + 1;
  if (snake && round % 2 == 0)
    return picks_per_round + 1 - pos;
  return pos;
}

SimulatedDraftPicks simulate_ai_draft_picks(const std::vector<AITeam> &teams,
                                            const std::vector<DraftProspect> &pool,
                                            int current_pick, int player_slot, int round,
                                            UniformSource &rng, bool snake,
                                            const DraftAIConfig &cfg) {
  SimulatedDraftPicks out;
  out.remaining = pool;
  out.next_pick = current_pick;

  const int per_round = static_cast<int>(teams.size()) + 1;
  if (player_slot < 1 || player_slot > per_round) {
    out.reason = fmt::format("Invalid player draft slot {} (expected 1-{})", player_slot,
                             per_round);
    return out;
  }
  if (round < 1 || current_pick < 1) {
    out.reason = fmt::format("Invalid draft position: round {}, pick {}", round, current_pick);
    return out;
  }
  if (pool.empty()) {
    out.reason = "No prospects available";
    return out;
  }
  out.ok = true;

  const int round_end = round * per_round;
  int pick = current_pick;

  while (pick <= round_end && !out.remaining.empty()) {
    const int pos = pick_position_in_round(pick, round, per_round, snake);
    if (pos == player_slot)
      break;

    const int team_idx = pos < player_slot ? pos - 1 : pos - 2;
    if (team_idx >= 0 && team_idx < static_cast<int>(teams.size())) {
      const AITeam &team = teams[static_cast<std::size_t>(team_idx)];
      const AIDraftPickResult res = ai_draft_pick(team, out.remaining, round, rng, cfg);
      if (!res.ok) {
        out.ok = false;
        out.reason = fmt::format("{} could not pick: {}", team.id, res.reason);
        break;
      }

      auto it = out.remaining.begin() + res.selected_index;
      DraftProspect taken = std::move(*it);
      out.remaining.erase(it);
      taken.is_drafted = true;
      taken.drafted_by_team = team.id;
      taken.draft_round = round;
      taken.draft_pick = pick;

      out.picks.push_back({team.id, taken.id, pick, round, res.reason});
      log_debug("pick {} (round {}): {} takes {} ({})", pick, round, team.id,
                taken.full_name(), res.reason);
      out.drafted.push_back(std::move(taken));
    }
    ++pick;
  }

  out.next_pick = pick;
  return out;
}

} // namespace franchise_core
