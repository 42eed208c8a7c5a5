#include <catch2/catch.hpp>

#include <stdexcept>

#include "franchise_core/player.hpp"

using namespace franchise_core;

TEST_CASE("Position names round trip", "[player]") {
  CHECK(std::string(position_name(Position::FirstBase)) == "1B");
  CHECK(parse_position("CF") == Position::CF);
  CHECK_FALSE(parse_position("QB").has_value());
  CHECK(player_type_for(Position::RP) == PlayerType::Pitcher);
  CHECK(player_type_for(Position::DH) == PlayerType::Hitter);
}

TEST_CASE("Tool bundles depend on player type", "[player]") {
  CHECK(tools_for(PlayerType::Hitter).size() == 5);
  CHECK(tools_for(PlayerType::Pitcher).size() == 3);
  CHECK(tool_index(PlayerType::Hitter, Tool::Field) == 4);
  CHECK(tool_index(PlayerType::Hitter, Tool::Stuff) == -1);
  CHECK(tool_index(PlayerType::Pitcher, Tool::Movement) == 2);

  Player p;
  p.player_type = PlayerType::Pitcher;
  p.tools = Eigen::ArrayXi(3);
  p.tools << 60, 45, 50;
  CHECK(p.tool(Tool::Control) == 45);
  CHECK_FALSE(p.tool(Tool::Hit).has_value());
}

TEST_CASE("Training focus maps to tools", "[player]") {
  CHECK_FALSE(focus_tool(TrainingFocus::Overall).has_value());
  CHECK(focus_tool(TrainingFocus::Arm) == Tool::Arm);
  CHECK(focus_for(Tool::Stuff) == TrainingFocus::Stuff);
  CHECK(parse_training_focus("movement") == TrainingFocus::Movement);
}

TEST_CASE("Progression rate brackets", "[player]") {
  // young, elite, far from ceiling: 1.5 * 1.3 * 1.2 clamps to 2.0
  CHECK(calculate_progression_rate(19, 75, 40) == Approx(2.0));
  // prime, average, moderate gap
  CHECK(calculate_progression_rate(27, 55, 44) == Approx(1.0));
  // old, low potential, at the ceiling: 0.7 * 0.8 * 0.5 clamps to 0.5
  CHECK(calculate_progression_rate(33, 40, 40) == Approx(0.5));
  CHECK(calculate_progression_rate(23, 62, 55) == Approx(1.2 * 1.1 * 0.8));
}

TEST_CASE("PlayerTable replaces on duplicate id", "[player]") {
  Player a;
  a.id = 7;
  a.first_name = "Sam";
  a.last_name = "Ortiz";
  PlayerTable table({a});
  CHECK(table.has_id(7));
  CHECK(table.get(7).full_name() == "Sam Ortiz");

  a.age = 30;
  table.add_player(a);
  CHECK(table.size() == 1);
  CHECK(table.get(7).age == 30);
  CHECK_THROWS_AS(table.get(8), std::out_of_range);
}
