#include "franchise_core/player.hpp"

#include <algorithm>

namespace franchise_core {

namespace {

const std::vector<Tool> kHitterTools = {Tool::Hit, Tool::Power, Tool::Speed,
                                        Tool::Arm, Tool::Field};
const std::vector<Tool> kPitcherTools = {Tool::Stuff, Tool::Control,
                                         Tool::Movement};

const std::vector<std::pair<Position, const char *>> kPositionNames = {
    {Position::SP, "SP"},        {Position::RP, "RP"},
    {Position::C, "C"},          {Position::FirstBase, "1B"},
    {Position::SecondBase, "2B"}, {Position::ThirdBase, "3B"},
    {Position::SS, "SS"},        {Position::LF, "LF"},
    {Position::CF, "CF"},        {Position::RF, "RF"},
    {Position::DH, "DH"}};

const std::vector<std::pair<TrainingFocus, const char *>> kFocusNames = {
    {TrainingFocus::Overall, "overall"}, {TrainingFocus::Hit, "hit"},
    {TrainingFocus::Power, "power"},     {TrainingFocus::Speed, "speed"},
    {TrainingFocus::Arm, "arm"},         {TrainingFocus::Field, "field"},
    {TrainingFocus::Stuff, "stuff"},     {TrainingFocus::Control, "control"},
    {TrainingFocus::Movement, "movement"}};

} // namespace

const char *position_name(Position p) {
  for (const auto &kv : kPositionNames)
    if (kv.first == p)
      return kv.second;
  return "?";
}

std::optional<Position> parse_position(std::string_view name) {
  for (const auto &kv : kPositionNames)
    if (name == kv.second)
      return kv.first;
  return std::nullopt;
}

PlayerType player_type_for(Position p) {
  return (p == Position::SP || p == Position::RP) ? PlayerType::Pitcher
                                                  : PlayerType::Hitter;
}

const char *player_type_name(PlayerType t) {
  return t == PlayerType::Hitter ? "HITTER" : "PITCHER";
}

const char *work_ethic_name(WorkEthic w) {
  switch (w) {
  case WorkEthic::Poor:
    return "poor";
  case WorkEthic::Average:
    return "average";
  case WorkEthic::Excellent:
    return "excellent";
  }
  return "?";
}

const char *personality_name(Personality p) {
  switch (p) {
  case Personality::TeamPlayer:
    return "team_player";
  case Personality::PrimaDonna:
    return "prima_donna";
  case Personality::Leader:
    return "leader";
  }
  return "?";
}

const char *tool_name(Tool t) {
  switch (t) {
  case Tool::Hit:
    return "hit";
  case Tool::Power:
    return "power";
  case Tool::Speed:
    return "speed";
  case Tool::Arm:
    return "arm";
  case Tool::Field:
    return "field";
  case Tool::Stuff:
    return "stuff";
  case Tool::Control:
    return "control";
  case Tool::Movement:
    return "movement";
  }
  return "?";
}

const char *training_focus_name(TrainingFocus f) {
  for (const auto &kv : kFocusNames)
    if (kv.first == f)
      return kv.second;
  return "?";
}

std::optional<TrainingFocus> parse_training_focus(std::string_view name) {
  for (const auto &kv : kFocusNames)
    if (name == kv.second)
      return kv.first;
  return std::nullopt;
}

const char *archetype_name(Archetype a) {
  switch (a) {
  case Archetype::Slugger:
    return "Slugger";
  case Archetype::Speedster:
    return "Speedster";
  case Archetype::ContactKing:
    return "Contact King";
  case Archetype::GloveWizard:
    return "Glove Wizard";
  case Archetype::CannonArm:
    return "Cannon Arm";
  case Archetype::Flamethrower:
    return "Flamethrower";
  case Archetype::CommandAce:
    return "Command Ace";
  case Archetype::MovementMaster:
    return "Movement Master";
  case Archetype::Playmaker:
    return "Playmaker";
  case Archetype::RawTalent:
    return "Raw Talent";
  }
  return "?";
}

const char *scouting_tier_name(ScoutingTier t) {
  switch (t) {
  case ScoutingTier::Low:
    return "low";
  case ScoutingTier::Medium:
    return "medium";
  case ScoutingTier::High:
    return "high";
  }
  return "?";
}

std::optional<ScoutingTier> parse_scouting_tier(std::string_view name) {
  if (name == "low")
    return ScoutingTier::Low;
  if (name == "medium")
    return ScoutingTier::Medium;
  if (name == "high")
    return ScoutingTier::High;
  return std::nullopt;
}

const std::vector<Tool> &tools_for(PlayerType t) {
  return t == PlayerType::Hitter ? kHitterTools : kPitcherTools;
}

int tool_index(PlayerType t, Tool tool) {
  const auto &tools = tools_for(t);
  auto it = std::find(tools.begin(), tools.end(), tool);
  if (it == tools.end())
    return -1;
  return static_cast<int>(it - tools.begin());
}

std::optional<Tool> focus_tool(TrainingFocus f) {
  switch (f) {
  case TrainingFocus::Overall:
    return std::nullopt;
  case TrainingFocus::Hit:
    return Tool::Hit;
  case TrainingFocus::Power:
    return Tool::Power;
  case TrainingFocus::Speed:
    return Tool::Speed;
  case TrainingFocus::Arm:
    return Tool::Arm;
  case TrainingFocus::Field:
    return Tool::Field;
  case TrainingFocus::Stuff:
    return Tool::Stuff;
  case TrainingFocus::Control:
    return Tool::Control;
  case TrainingFocus::Movement:
    return Tool::Movement;
  }
  return std::nullopt;
}

std::optional<int> Player::tool(Tool t) const {
  const int idx = tool_index(player_type, t);
  if (idx < 0 || idx >= tools.size())
    return std::nullopt;
  return tools[idx];
}

TrainingFocus focus_for(Tool t) {
  switch (t) {
  case Tool::Hit:
    return TrainingFocus::Hit;
  case Tool::Power:
    return TrainingFocus::Power;
  case Tool::Speed:
    return TrainingFocus::Speed;
  case Tool::Arm:
    return TrainingFocus::Arm;
  case Tool::Field:
    return TrainingFocus::Field;
  case Tool::Stuff:
    return TrainingFocus::Stuff;
  case Tool::Control:
    return TrainingFocus::Control;
  case Tool::Movement:
    return TrainingFocus::Movement;
  }
  return TrainingFocus::Overall;
}

double calculate_progression_rate(int age, int potential, int current_rating) {
  double age_factor = 0.7;
  if (age <= 21)
    age_factor = 1.5;
  else if (age <= 25)
    age_factor = 1.2;
  else if (age <= 28)
    age_factor = 1.0;

  double potential_factor = 0.8;
  if (potential >= 70)
    potential_factor = 1.3;
  else if (potential >= 60)
    potential_factor = 1.1;
  else if (potential >= 50)
    potential_factor = 1.0;

  // Harder to improve close to the ceiling
  const int gap = potential - current_rating;
  double ceiling_factor = 0.5;
  if (gap >= 15)
    ceiling_factor = 1.2;
  else if (gap >= 10)
    ceiling_factor = 1.0;
  else if (gap >= 5)
    ceiling_factor = 0.8;

  return std::max(0.5, std::min(2.0, age_factor * potential_factor * ceiling_factor));
}

} // namespace franchise_core
