#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include "franchise_core/player.hpp"
#include "franchise_core/random.hpp"

namespace franchise_core {

enum class DraftPhilosophy { BestAvailable, NeedBased, UpsideSwing, SafeFloor };

const char *draft_philosophy_name(DraftPhilosophy p);
std::optional<DraftPhilosophy> parse_draft_philosophy(std::string_view name);

struct PositionNeed {
  Position position{Position::SP};
  int priority{0}; // 0-100
};

struct AITeam {
  std::string id;
  std::string city;
  std::string name;
  DraftPhilosophy philosophy{DraftPhilosophy::BestAvailable};
  int risk_tolerance{50}; // 0-100
  std::vector<PositionNeed> needs;
  int base_strength{50};  // simulated team quality
  double variance{1.0};   // season-to-season swing multiplier
};

// The nineteen computer-controlled clubs sharing the league with the player.
const std::vector<AITeam> &default_ai_teams();

struct DraftAIConfig {
  double scouting_noise{5.0};   // first U(-x, x) term
  double decision_noise{5.0};   // second U(-x, x) term
  double need_divisor{5.0};
  double upside_weight{2.0};
  double floor_weight{1.0};
  int injury_risk_threshold{50};
  double injury_penalty_divisor{5.0};
  int later_round_pool{3};      // random pick among the top N after round 1
};

struct AIDraftPickResult {
  bool ok{false};
  int selected_index{-1}; // into the pool passed in
  std::int64_t prospect_id{0};
  double score{0.0};
  std::string reason;
};

// Draft-room behaviour of one AI team.
class DraftAgent {
public:
  DraftAgent(AITeam team, DraftAIConfig cfg = DraftAIConfig{})
      : team_(std::move(team)), cfg_(cfg) {}

  // Noisy valuation for every prospect in the pool; drafted prospects score
  // -inf. Writes the per-prospect reason into reasons when non-null.
  Eigen::VectorXd score_prospects(const std::vector<DraftProspect> &pool,
                                  UniformSource &rng,
                                  std::vector<std::string> *reasons = nullptr) const;

  // Round 1 takes the top score, later rounds draw among the top few.
  AIDraftPickResult pick(const std::vector<DraftProspect> &pool, int round,
                         UniformSource &rng) const;

  const AITeam &team() const { return team_; }

private:
  AITeam team_;
  DraftAIConfig cfg_{};
};

AIDraftPickResult ai_draft_pick(const AITeam &team, const std::vector<DraftProspect> &pool,
                                int round, UniformSource &rng,
                                const DraftAIConfig &cfg = DraftAIConfig{});

struct DraftPickRecord {
  std::string team_id;
  std::int64_t prospect_id{0};
  int pick{0}; // overall pick number, 1-based
  int round{0};
  std::string reason;
};

struct SimulatedDraftPicks {
  bool ok{false};
  std::string reason; // set when ok is false
  std::vector<DraftPickRecord> picks;
  std::vector<DraftProspect> drafted;   // picked prospects, marked drafted
  std::vector<DraftProspect> remaining; // pool minus picked prospects
  int next_pick{0};
};

// Position (1-based) inside its round of an overall pick. Even rounds run in
// reverse under a snake draft.
int pick_position_in_round(int pick, int round, int picks_per_round, bool snake);

// Runs AI picks from current_pick until the player's slot comes up, the round
// ends or the pool runs dry. Each round has teams.size() + 1 picks; the player
// holds player_slot (1-based) and the AI teams fill the other slots in order.
// A slot outside 1..teams.size() + 1, a non-positive pick or round, or an
// empty pool fails with a reason and makes no picks.
SimulatedDraftPicks simulate_ai_draft_picks(const std::vector<AITeam> &teams,
                                            const std::vector<DraftProspect> &pool,
                                            int current_pick, int player_slot, int round,
                                            UniformSource &rng, bool snake = true,
                                            const DraftAIConfig &cfg = DraftAIConfig{});

} // namespace franchise_core
