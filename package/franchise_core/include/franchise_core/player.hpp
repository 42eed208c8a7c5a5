#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include "franchise_core/rating_sampler.hpp"

namespace franchise_core {

enum class Position { SP, RP, C, FirstBase, SecondBase, ThirdBase, SS, LF, CF, RF, DH };

enum class PlayerType { Hitter, Pitcher };

enum class WorkEthic { Poor, Average, Excellent };

enum class Personality { TeamPlayer, PrimaDonna, Leader };

enum class Tool { Hit, Power, Speed, Arm, Field, Stuff, Control, Movement };

enum class TrainingFocus { Overall, Hit, Power, Speed, Arm, Field, Stuff, Control, Movement };

enum class Archetype {
  Slugger,
  Speedster,
  ContactKing,
  GloveWizard,
  CannonArm,
  Flamethrower,
  CommandAce,
  MovementMaster,
  Playmaker,
  RawTalent
};

enum class RosterStatus { Active, Reserve };

enum class ScoutingTier { Low, Medium, High };

const char *position_name(Position p);
std::optional<Position> parse_position(std::string_view name);
PlayerType player_type_for(Position p);

const char *player_type_name(PlayerType t);
const char *work_ethic_name(WorkEthic w);
const char *personality_name(Personality p);
const char *tool_name(Tool t);
const char *training_focus_name(TrainingFocus f);
std::optional<TrainingFocus> parse_training_focus(std::string_view name);
const char *archetype_name(Archetype a);
const char *scouting_tier_name(ScoutingTier t);
std::optional<ScoutingTier> parse_scouting_tier(std::string_view name);

// Tool order inside a player's attribute bundle.
// Hitters: hit, power, speed, arm, field. Pitchers: stuff, control, movement.
const std::vector<Tool> &tools_for(PlayerType t);

// Index of a tool inside the bundle for the given type, -1 if absent.
int tool_index(PlayerType t, Tool tool);

// The tool a focus trains, or nullopt for Overall.
std::optional<Tool> focus_tool(TrainingFocus f);
TrainingFocus focus_for(Tool t);

struct HiddenTraits {
  WorkEthic work_ethic{WorkEthic::Average};
  bool injury_prone{false};
  Personality personality{Personality::TeamPlayer};
  int coachability{50};
  int clutch{50};
};

// Traits a scouting visit managed to uncover.
struct RevealedTraits {
  std::optional<WorkEthic> work_ethic;
  std::optional<Personality> personality;
  std::optional<bool> injury_prone;
  std::optional<int> coachability;
  std::optional<int> clutch;

  bool any() const {
    return work_ethic || personality || injury_prone || coachability || clutch;
  }
};

struct Player {
  std::int64_t id{0};
  std::string first_name;
  std::string last_name;
  int age{18};
  Position position{Position::SP};
  PlayerType player_type{PlayerType::Pitcher};

  int current_rating{kMinRating};
  int potential{kMinRating};
  Eigen::ArrayXi tools; // length 5 for hitters, 3 for pitchers

  HiddenTraits traits;
  bool traits_revealed{false};

  TrainingFocus training_focus{TrainingFocus::Overall};
  int current_xp{0};          // [0, 100)
  double progression_rate{1.0}; // derived, see calculate_progression_rate
  int morale{50};

  bool is_injured{false};
  int injury_games_remaining{0};
  bool is_on_roster{true};
  RosterStatus roster_status{RosterStatus::Active};

  std::int64_t salary{0};
  int contract_years{0};
  int years_in_org{0};
  int draft_year{0};
  int draft_round{0};
  int draft_pick{0};

  std::string full_name() const { return first_name + " " + last_name; }

  // Value of one tool, or nullopt when the tool is not in this player's bundle.
  std::optional<int> tool(Tool t) const;
};

struct DraftProspect : Player {
  std::optional<int> scouted_rating;
  std::optional<int> scouted_potential;
  std::optional<ScoutingTier> scouting_accuracy;
  RevealedTraits revealed_traits;

  int media_rank{0};
  Archetype archetype{Archetype::Playmaker};

  bool is_drafted{false};
  std::string drafted_by_team;
};

// Hidden development-speed multiplier derived from age, potential and the
// distance still to potential; clamped to [0.5, 2.0].
double calculate_progression_rate(int age, int potential, int current_rating);

// Roster lookup by player id.
class PlayerTable {
public:
  PlayerTable() = default;
  explicit PlayerTable(const std::vector<Player> &players) {
    for (const auto &p : players)
      add_player(p);
  }

  void add_player(const Player &p) {
    auto it = id_index_.find(p.id);
    if (it != id_index_.end()) {
      players_[it->second] = p;
      return;
    }
    id_index_[p.id] = players_.size();
    players_.push_back(p);
  }

  std::size_t size() const { return players_.size(); }

  bool has_id(std::int64_t id) const {
    return id_index_.find(id) != id_index_.end();
  }

  const Player &get(std::int64_t id) const {
    auto it = id_index_.find(id);
    if (it == id_index_.end()) {
      throw std::out_of_range("PlayerTable: player id not found");
    }
    return players_[it->second];
  }

  const std::vector<Player> &players() const { return players_; }

private:
  std::vector<Player> players_;
  std::unordered_map<std::int64_t, std::size_t> id_index_;
};

} // namespace franchise_core
