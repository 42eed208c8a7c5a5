#include <catch2/catch.hpp>

#include <cstdint>
#include <vector>

#include "franchise_core/offseason.hpp"

using namespace franchise_core;

namespace {

Player roster_player(std::int64_t id, int age, int current, int potential, int contract) {
  Player p;
  p.id = id;
  p.first_name = "Player";
  p.last_name = std::to_string(id);
  p.age = age;
  p.position = Position::CF;
  p.player_type = PlayerType::Hitter;
  p.current_rating = current;
  p.potential = potential;
  p.contract_years = contract;
  return p;
}

} // namespace

TEST_CASE("Winter development follows the age curve", "[offseason]") {
  SequenceSource high({0.999});
  SequenceSource low({0.0});

  WinterChange w = calculate_winter_development(20, 45, 70, WorkEthic::Average, high);
  CHECK(w.rating_change == 3);
  CHECK(w.reason == "Young prospect development");

  // growth never passes potential
  CHECK(calculate_winter_development(20, 51, 52, WorkEthic::Excellent, high).rating_change == 1);

  // 2 * 1.3 rounds to 3
  CHECK(calculate_winter_development(23, 50, 70, WorkEthic::Excellent, high).rating_change == 3);

  w = calculate_winter_development(27, 60, 65, WorkEthic::Average, high);
  CHECK(w.rating_change == 1);
  CHECK(w.reason == "Peak years refinement");
  CHECK(calculate_winter_development(27, 65, 65, WorkEthic::Average, high).rating_change == 0);

  CHECK(calculate_winter_development(31, 60, 65, WorkEthic::Average, high).rating_change == -1);
  CHECK(calculate_winter_development(31, 60, 65, WorkEthic::Average, low).rating_change == 0);

  w = calculate_winter_development(35, 60, 65, WorkEthic::Average, high);
  CHECK(w.rating_change == 0);
  CHECK(w.reason == "Defying age");
  CHECK(calculate_winter_development(35, 60, 65, WorkEthic::Average, low).rating_change == -1);

  w = calculate_winter_development(38, 60, 65, WorkEthic::Average, high);
  CHECK(w.rating_change == -1);
  CHECK(w.reason == "Aging gracefully");
}

TEST_CASE("Rating changes clamp and contracts tick down", "[offseason]") {
  CHECK(apply_rating_change(79, 3) == kMaxRating);
  CHECK(apply_rating_change(21, -3) == kMinRating);
  CHECK(apply_rating_change(50, 2) == 52);

  CHECK(process_contract_year(3).new_contract_years == 2);
  CHECK_FALSE(process_contract_year(3).became_free_agent);
  CHECK(process_contract_year(1).became_free_agent);
  CHECK(process_contract_year(0).new_contract_years == 0);
}

TEST_CASE("Aging a roster", "[offseason]") {
  const std::vector<Player> roster = {roster_player(1, 21, 45, 70, 2),
                                      roster_player(2, 33, 55, 60, 1)};
  SequenceSource rng({0.999});
  const AgingResult r = age_roster(roster, rng);
  REQUIRE(r.players.size() == 2);

  const Player &young = r.players[0];
  CHECK(young.age == 22);
  CHECK(young.years_in_org == 1);
  CHECK(young.current_rating == 48); // developed as a 21-year-old
  CHECK(young.contract_years == 1);
  CHECK(young.progression_rate ==
        Approx(calculate_progression_rate(22, young.potential, young.current_rating)));

  REQUIRE(r.winter_development.size() == 2);
  CHECK(r.winter_development[0].age == 22);
  CHECK(r.winter_development[0].previous_rating == 45);
  CHECK(r.winter_development[0].rating_change == 3);

  REQUIRE(r.contract_expirations.size() == 1);
  CHECK(r.contract_expirations[0].player_id == 2);
  CHECK(r.players[1].contract_years == 0);
}

TEST_CASE("Retirements and releases", "[offseason]") {
  std::vector<Player> aged = {roster_player(1, 40, 60, 60, 3), roster_player(2, 34, 20, 40, 2),
                              roster_player(3, 25, 50, 60, 0), roster_player(4, 25, 50, 60, 2),
                              roster_player(5, 33, 20, 40, 2)};
  const std::vector<RosterRemoval> out = roster_removals(aged);
  REQUIRE(out.size() == 3);
  CHECK(out[0].player_id == 1);
  CHECK(out[0].kind == RemovalKind::Retired);
  CHECK(out[0].reason == "Retired at age 40");
  CHECK(out[1].player_id == 2);
  CHECK(out[1].kind == RemovalKind::Retired);
  CHECK(out[2].player_id == 3);
  CHECK(out[2].kind == RemovalKind::Released);
}

TEST_CASE("Season stats archive", "[offseason]") {
  SeasonStats s;
  s.games_played = 120;
  s.at_bats = 400;
  s.hits = 120;
  s.home_runs = 18;
  const CareerHistory one = archive_season_stats(s, {}, 2025, Tier::LowA, PlayerType::Hitter);
  REQUIRE(one.size() == 1);
  CHECK(one[0].avg == Approx(0.3));
  CHECK(one[0].obp == Approx(0.3));
  CHECK(one[0].home_runs == 18);

  const CareerHistory two =
      archive_season_stats(std::nullopt, one, 2026, Tier::HighA, PlayerType::Hitter);
  REQUIRE(two.size() == 2);
  CHECK(two[1].year == 2026);
  CHECK(two[1].games_played == 0);
  CHECK(two[1].avg == Approx(0.0));

  SeasonStats arm;
  arm.wins = 12;
  arm.era = 2.85;
  const CareerHistory p = archive_season_stats(arm, {}, 2025, Tier::LowA, PlayerType::Pitcher);
  CHECK(p[0].era == Approx(2.85));
  CHECK(p[0].wins == 12);
}

TEST_CASE("Draft order runs worst to best", "[offseason]") {
  Mt19937Source rng(21);
  const PlayerSeasonRecord record{"Riverside Rivermen", 70, 62};
  const std::vector<DraftOrderEntry> order =
      generate_draft_order(record, default_ai_teams(), 2026, rng);
  REQUIRE(order.size() == 20);
  for (std::size_t i = 0; i < order.size(); ++i) {
    CHECK(order[i].pick_number == static_cast<int>(i) + 1);
    CHECK(order[i].previous_season_wins + order[i].previous_season_losses == 132);
    if (i > 0)
      CHECK(order[i - 1].win_pct <= order[i].win_pct);
  }
  const int pos = player_draft_position(order);
  REQUIRE(pos >= 1);
  CHECK(order[static_cast<std::size_t>(pos - 1)].team_id == "player");
  CHECK(player_draft_position({}) == 0);
}

TEST_CASE("A losing player picks near the top", "[offseason]") {
  const PlayerSeasonRecord record{"Riverside Rivermen", 40, 92};
  for (std::uint64_t seed : {1u, 7u, 42u, 2026u}) {
    Mt19937Source rng(seed);
    const std::vector<DraftOrderEntry> order =
        generate_draft_order(record, default_ai_teams(), 2026, rng);
    REQUIRE(order.size() == 20);
    for (std::size_t i = 1; i < order.size(); ++i)
      CHECK(order[i - 1].win_pct <= order[i].win_pct);
    const int pos = player_draft_position(order);
    CHECK(pos >= 1);
    CHECK(pos <= 3);
    const DraftOrderEntry &me = order[static_cast<std::size_t>(pos - 1)];
    CHECK(me.team_id == "player");
    CHECK(me.win_pct == Approx(40.0 / 132.0));
  }
}

TEST_CASE("A winless player picks first", "[offseason]") {
  Mt19937Source rng(2);
  const PlayerSeasonRecord record{"Riverside Rivermen", 0, 0};
  const auto order = generate_draft_order(record, default_ai_teams(), 2026, rng);
  CHECK(player_draft_position(order) == 1);
}

TEST_CASE("Playoff results", "[offseason]") {
  CHECK(determine_playoff_result(false, std::string("player"), std::nullopt) ==
        PlayoffResult::Missed);
  CHECK(determine_playoff_result(true, std::string("player"), std::nullopt) ==
        PlayoffResult::Champion);
  CHECK(determine_playoff_result(true, std::string("metro-city-meteors"),
                                 std::string("metro-city-meteors")) == PlayoffResult::Finals);
  CHECK(determine_playoff_result(true, std::string("metro-city-meteors"), std::nullopt) ==
        PlayoffResult::Semifinals);
}

TEST_CASE("Season MVP", "[offseason]") {
  SeasonStats bat;
  bat.at_bats = 500;
  bat.hits = 160;
  bat.home_runs = 30;
  bat.rbi = 90;
  bat.stolen_bases = 10;
  const MvpCandidate slugger{1, "Slugger", PlayerType::Hitter, bat, 60};
  // 60 + 60 + 45 + 48 + 5 + 10 (.320)
  CHECK(calculate_mvp_score(slugger) == Approx(228.0));

  SeasonStats arm;
  arm.wins = 15;
  arm.strikeouts = 200;
  arm.era = 2.40;
  const MvpCandidate ace{2, "Ace", PlayerType::Pitcher, arm, 62};
  // 62 + 75 + 40 + 15 + 10
  CHECK(calculate_mvp_score(ace) == Approx(202.0));

  const MvpCandidate bench{3, "Bench", PlayerType::Hitter, std::nullopt, 40};
  CHECK(calculate_mvp_score(bench) == Approx(40.0));

  const auto mvp = determine_season_mvp({bench, ace, slugger});
  REQUIRE(mvp.has_value());
  CHECK(mvp->player_id == 1);
  CHECK_FALSE(determine_season_mvp({}).has_value());
}

TEST_CASE("Offseason rollover", "[offseason]") {
  OffseasonInput in;
  in.year = 2025;
  in.tier = Tier::LowA;
  in.record = {"Riverside Rivermen", 80, 52};
  in.league_rank = 2;
  in.made_playoffs = true;
  in.playoff_result = PlayoffResult::Finals;
  in.total_revenue = 900000;
  in.total_expenses = 850000;
  in.avg_attendance = 1800;
  in.players = {roster_player(1, 21, 45, 70, 3), roster_player(2, 40, 55, 60, 2)};
  in.ai_teams = default_ai_teams();

  SeasonStats s;
  s.at_bats = 450;
  s.hits = 140;
  s.home_runs = 25;
  in.season_stats[1] = s;
  in.career_stats[1] = CareerHistory(1);

  Mt19937Source rng(17);
  const OffseasonSummary out = run_offseason_rollover(in, rng);
  CHECK(out.previous_year == 2025);
  CHECK(out.new_year == 2026);

  const TeamHistoryEntry &h = out.team_history;
  CHECK(h.win_pct == Approx(80.0 / 132.0));
  CHECK(h.net_income == 50000);
  CHECK(h.playoff_result == PlayoffResult::Finals);
  CHECK(h.mvp_player_id == std::int64_t{1});

  CHECK(out.career_stats.at(1).size() == 2);
  CHECK(out.career_stats.at(1).back().home_runs == 25);
  CHECK(out.career_stats.at(2).size() == 1);

  REQUIRE(out.players.size() == 2);
  CHECK(out.players[0].age == 22);
  CHECK(out.players[1].age == 41);
  REQUIRE(out.removals.size() == 1);
  CHECK(out.removals[0].player_id == 2);

  CHECK(out.draft_order.size() == 20);
  CHECK(out.player_draft_position == player_draft_position(out.draft_order));
}
