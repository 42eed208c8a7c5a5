#include <catch2/catch.hpp>

#include <vector>

#include "franchise_core/training.hpp"

using namespace franchise_core;

namespace {

// Every deterministic multiplier is 1.0 for this player.
Player neutral_hitter() {
  Player p;
  p.id = 42;
  p.age = 27;
  p.position = Position::SS;
  p.player_type = PlayerType::Hitter;
  p.current_rating = 50;
  p.potential = 65;
  p.tools = Eigen::ArrayXi(5);
  p.tools << 50, 50, 45, 55, 52;
  p.morale = 50;
  p.progression_rate = 1.0;
  p.traits.work_ethic = WorkEthic::Average;
  return p;
}

} // namespace

TEST_CASE("XP multipliers by bracket", "[training]") {
  CHECK(age_xp_multiplier(20) == Approx(1.5));
  CHECK(age_xp_multiplier(25) == Approx(1.2));
  CHECK(age_xp_multiplier(28) == Approx(1.0));
  CHECK(age_xp_multiplier(29) == Approx(0.6));
  CHECK(morale_xp_multiplier(30) == Approx(0.7));
  CHECK(morale_xp_multiplier(61) == Approx(1.2));
  CHECK(work_ethic_xp_multiplier(WorkEthic::Excellent) == Approx(1.4));

  Player p = neutral_hitter();
  const DistrictBonuses none;
  CHECK(training_multiplier(p, none, 0) == Approx(1.0));
  p.is_injured = true;
  p.roster_status = RosterStatus::Reserve;
  CHECK(training_multiplier(p, none, 2) == Approx(0.25 * 0.7 * 1.30));
}

TEST_CASE("Crossing 100 XP levels up exactly one point", "[training]") {
  Player p = neutral_hitter();
  p.current_xp = 95;
  p.training_focus = TrainingFocus::Power;
  SequenceSource rng({0.5}); // jitter factor 1.0

  const TrainingResult r = process_player_training(p, DistrictBonuses{}, 0, 3, rng);
  CHECK(r.xp_gained == 6);
  CHECK(r.previous_xp == 95);
  REQUIRE(r.leveled_up);
  CHECK(r.new_xp == 1);
  CHECK(r.attribute_improved == Tool::Power);
  CHECK(r.previous_value == 50);
  CHECK(r.new_value == 51);

  const Player after = apply_training_result(p, r);
  CHECK(after.current_xp == 1);
  CHECK(after.tool(Tool::Power) == 51);
  CHECK(after.current_rating == p.current_rating);
  CHECK(after.tool(Tool::Hit) == 50);
}

TEST_CASE("Large gains still level up once", "[training]") {
  Player p = neutral_hitter();
  p.current_xp = 95;
  SequenceSource rng({0.5});
  const TrainingResult r = process_player_training(p, DistrictBonuses{}, 0, 100, rng);
  CHECK(r.xp_gained == 200);
  CHECK(r.leveled_up);
  CHECK(r.new_xp == 99);
  // overall focus raises the tool furthest below potential
  CHECK(r.attribute_improved == Tool::Speed);
  CHECK(r.new_value == 46);
}

TEST_CASE("Tools never pass the rating ceiling", "[training]") {
  Player p = neutral_hitter();
  p.potential = 80;
  p.tools << 80, 80, 80, 80, 80;
  p.current_xp = 99;
  p.training_focus = TrainingFocus::Hit;
  SequenceSource rng({0.5});
  const TrainingResult r = process_player_training(p, DistrictBonuses{}, 0, 1, rng);
  REQUIRE(r.leveled_up);
  CHECK(r.new_value == kMaxRating);
  CHECK(apply_training_result(p, r).tool(Tool::Hit) == kMaxRating);
}

TEST_CASE("Level-ups lift an out-of-range tool onto the rating floor", "[training]") {
  Player p = neutral_hitter();
  p.tools << 50, 5, 45, 55, 52;
  p.current_xp = 99;
  p.training_focus = TrainingFocus::Power;
  SequenceSource rng({0.5});
  const TrainingResult r = process_player_training(p, DistrictBonuses{}, 0, 1, rng);
  REQUIRE(r.leveled_up);
  CHECK(r.previous_value == 5);
  CHECK(r.new_value == kMinRating);
  CHECK(apply_training_result(p, r).tool(Tool::Power) == kMinRating);
}

TEST_CASE("Off-type focus falls back to overall", "[training]") {
  Player p = neutral_hitter();
  p.training_focus = TrainingFocus::Stuff;
  CHECK(attribute_to_improve(p) == Tool::Speed);

  p.training_focus = TrainingFocus::Field;
  CHECK(attribute_to_improve(p) == Tool::Field);
}

TEST_CASE("No games, no XP", "[training]") {
  Player p = neutral_hitter();
  p.current_xp = 40;
  SequenceSource rng({0.5});
  const TrainingResult r = process_player_training(p, DistrictBonuses{}, 0, 0, rng);
  CHECK(r.xp_gained == 0);
  CHECK(r.new_xp == 40);
  CHECK_FALSE(r.leveled_up);
}

TEST_CASE("Results for another player are ignored", "[training]") {
  const Player p = neutral_hitter();
  TrainingResult r;
  r.player_id = 7;
  r.new_xp = 80;
  CHECK(apply_training_result(p, r).current_xp == p.current_xp);
}

TEST_CASE("Batch training totals", "[training]") {
  std::vector<Player> roster(3, neutral_hitter());
  roster[0].current_xp = 99;
  roster[1].id = 43;
  roster[2].id = 44;
  SequenceSource rng({0.5});
  const BatchTrainingResult b = process_batch_training(roster, DistrictBonuses{}, 0, 5, rng);
  REQUIRE(b.results.size() == 3);
  CHECK(b.total_xp_gained == 30);
  CHECK(b.players_leveled_up == 1);
  CHECK(b.results[1].player_id == 43);
}

TEST_CASE("Recommended focus targets the biggest gap", "[training]") {
  Player p = neutral_hitter();
  p.potential = 70;
  p.tools << 40, 60, 60, 60, 60;
  CHECK(recommended_training_focus(p) == TrainingFocus::Hit);

  Player arm;
  arm.player_type = PlayerType::Pitcher;
  arm.potential = 60;
  arm.tools = Eigen::ArrayXi(3);
  arm.tools << 58, 59, 60;
  CHECK(recommended_training_focus(arm) == TrainingFocus::Stuff);
}

TEST_CASE("Training summary estimates", "[training]") {
  const TrainingSummary empty = training_summary({}, DistrictBonuses{}, 0);
  CHECK(empty.estimated_xp_per_game == 2);
  CHECK(empty.estimated_games_to_level_up == 50);

  DistrictBonuses perf;
  perf.training_mult = 1.5;
  const TrainingSummary s = training_summary({neutral_hitter()}, perf, 2);
  CHECK(s.total_bonus == Approx(1.5 * 1.30));
  CHECK(s.estimated_xp_per_game == 4);
  CHECK(s.estimated_games_to_level_up == 25);
}
