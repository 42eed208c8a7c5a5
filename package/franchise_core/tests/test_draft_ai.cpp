#include <catch2/catch.hpp>

#include <set>
#include <string>
#include <vector>

#include "franchise_core/draft_ai.hpp"
#include "franchise_core/prospect_generator.hpp"

using namespace franchise_core;

namespace {

DraftProspect make_prospect(std::int64_t id, Position pos, int current, int potential) {
  DraftProspect p;
  p.id = id;
  p.position = pos;
  p.player_type = player_type_for(pos);
  p.current_rating = current;
  p.potential = potential;
  return p;
}

DraftAIConfig quiet() {
  DraftAIConfig cfg;
  cfg.scouting_noise = 0.0;
  cfg.decision_noise = 0.0;
  return cfg;
}

AITeam team_with(DraftPhilosophy p) {
  AITeam t;
  t.id = "test-club";
  t.philosophy = p;
  return t;
}

} // namespace

TEST_CASE("Default league has nineteen AI clubs", "[draft_ai]") {
  const auto &teams = default_ai_teams();
  REQUIRE(teams.size() == 19);
  std::set<std::string> ids;
  for (const auto &t : teams)
    ids.insert(t.id);
  CHECK(ids.size() == 19);
  CHECK(parse_draft_philosophy("safe_floor") == DraftPhilosophy::SafeFloor);
}

TEST_CASE("Philosophies drive the first-round pick", "[draft_ai]") {
  const std::vector<DraftProspect> pool = {
      make_prospect(1, Position::SS, 55, 58),  // polished
      make_prospect(2, Position::SP, 40, 70),  // raw ceiling
      make_prospect(3, Position::C, 50, 54),   // catcher
  };
  SequenceSource rng({0.5});

  CHECK(ai_draft_pick(team_with(DraftPhilosophy::BestAvailable), pool, 1, rng, quiet())
            .prospect_id == 1);
  CHECK(ai_draft_pick(team_with(DraftPhilosophy::UpsideSwing), pool, 1, rng, quiet())
            .prospect_id == 2);
  CHECK(ai_draft_pick(team_with(DraftPhilosophy::SafeFloor), pool, 1, rng, quiet())
            .prospect_id == 1);

  AITeam needy = team_with(DraftPhilosophy::NeedBased);
  needy.needs = {{Position::C, 100}};
  const AIDraftPickResult r = ai_draft_pick(needy, pool, 1, rng, quiet());
  CHECK(r.prospect_id == 3);
  CHECK(r.reason == "filling need at C");
}

TEST_CASE("Injury risk pushes cautious clubs away", "[draft_ai]") {
  std::vector<DraftProspect> pool = {
      make_prospect(1, Position::CF, 52, 55),
      make_prospect(2, Position::LF, 51, 54),
  };
  pool[0].traits.injury_prone = true;

  AITeam cautious = team_with(DraftPhilosophy::SafeFloor);
  cautious.risk_tolerance = 10;
  SequenceSource rng({0.5});
  CHECK(ai_draft_pick(cautious, pool, 1, rng, quiet()).prospect_id == 2);

  AITeam bold = team_with(DraftPhilosophy::SafeFloor);
  bold.risk_tolerance = 90;
  CHECK(ai_draft_pick(bold, pool, 1, rng, quiet()).prospect_id == 1);
}

TEST_CASE("Drafted prospects are never picked", "[draft_ai]") {
  Mt19937Source rng(31);
  std::vector<DraftProspect> pool = generate_draft_class(40, 2025, rng);
  for (std::size_t i = 0; i < pool.size(); i += 2)
    pool[i].is_drafted = true;

  for (const auto &team : default_ai_teams()) {
    for (int round = 1; round <= 3; ++round) {
      const AIDraftPickResult r = ai_draft_pick(team, pool, round, rng);
      REQUIRE(r.ok);
      CHECK_FALSE(pool[static_cast<std::size_t>(r.selected_index)].is_drafted);
    }
  }

  for (auto &p : pool)
    p.is_drafted = true;
  const AIDraftPickResult none = ai_draft_pick(default_ai_teams()[0], pool, 1, rng);
  CHECK_FALSE(none.ok);
  CHECK(none.reason == "No prospects available");
  CHECK_FALSE(ai_draft_pick(default_ai_teams()[0], {}, 1, rng).ok);
}

TEST_CASE("Later rounds pick among the top few", "[draft_ai]") {
  const std::vector<DraftProspect> pool = {
      make_prospect(1, Position::SS, 70, 72), make_prospect(2, Position::SS, 65, 70),
      make_prospect(3, Position::SS, 60, 66), make_prospect(4, Position::SS, 30, 40),
  };
  const AITeam team = team_with(DraftPhilosophy::BestAvailable);
  Mt19937Source rng(8);
  std::set<std::int64_t> seen;
  for (int i = 0; i < 300; ++i)
    seen.insert(ai_draft_pick(team, pool, 2, rng, quiet()).prospect_id);
  CHECK(seen.count(4) == 0);
  CHECK(seen.size() == 3);
}

TEST_CASE("Snake order reverses even rounds", "[draft_ai]") {
  CHECK(pick_position_in_round(1, 1, 20, true) == 1);
  CHECK(pick_position_in_round(20, 1, 20, true) == 20);
  CHECK(pick_position_in_round(21, 2, 20, true) == 20);
  CHECK(pick_position_in_round(40, 2, 20, true) == 1);
  CHECK(pick_position_in_round(21, 2, 20, false) == 1);
  CHECK(pick_position_in_round(41, 3, 20, true) == 1);
}

TEST_CASE("Simulated picks stop at the player's slot", "[draft_ai]") {
  const std::vector<AITeam> teams(default_ai_teams().begin(), default_ai_teams().begin() + 3);
  Mt19937Source rng(4);
  const std::vector<DraftProspect> pool = generate_draft_class(30, 2025, rng);

  SECTION("round one") {
    const SimulatedDraftPicks r = simulate_ai_draft_picks(teams, pool, 1, 3, 1, rng);
    CHECK(r.ok);
    REQUIRE(r.picks.size() == 2);
    CHECK(r.picks[0].team_id == teams[0].id);
    CHECK(r.picks[1].team_id == teams[1].id);
    CHECK(r.picks[1].pick == 2);
    CHECK(r.next_pick == 3);
    CHECK(r.remaining.size() == 28);
    REQUIRE(r.drafted.size() == 2);
    CHECK(r.drafted[0].is_drafted);
    CHECK(r.drafted[0].drafted_by_team == teams[0].id);
    CHECK(r.drafted[0].id != r.drafted[1].id);
  }
  SECTION("round two runs in reverse") {
    // picks 5..8 map to slots 4, 3, 2, 1
    const SimulatedDraftPicks r = simulate_ai_draft_picks(teams, pool, 5, 3, 2, rng);
    REQUIRE(r.picks.size() == 1);
    CHECK(r.picks[0].team_id == teams[2].id);
    CHECK(r.next_pick == 6);
  }
  SECTION("player picks last") {
    const SimulatedDraftPicks r = simulate_ai_draft_picks(teams, pool, 1, 4, 1, rng);
    CHECK(r.picks.size() == 3);
    CHECK(r.next_pick == 4);
  }
  SECTION("pool runs dry") {
    const std::vector<DraftProspect> tiny(pool.begin(), pool.begin() + 1);
    const SimulatedDraftPicks r = simulate_ai_draft_picks(teams, tiny, 1, 4, 1, rng);
    CHECK(r.ok);
    CHECK(r.picks.size() == 1);
    CHECK(r.remaining.empty());
  }
}

TEST_CASE("Simulated picks reject bad draft positions", "[draft_ai]") {
  const std::vector<AITeam> &teams = default_ai_teams();
  Mt19937Source rng(8);
  const std::vector<DraftProspect> pool = generate_draft_class(100, 2025, rng);

  SECTION("slot zero") {
    const SimulatedDraftPicks r = simulate_ai_draft_picks(teams, pool, 1, 0, 1, rng);
    CHECK_FALSE(r.ok);
    CHECK(r.reason.find("slot") != std::string::npos);
    CHECK(r.picks.empty());
    CHECK(r.remaining.size() == pool.size());
    CHECK(r.next_pick == 1);
  }
  SECTION("slot past the last team") {
    const SimulatedDraftPicks r = simulate_ai_draft_picks(teams, pool, 1, 21, 1, rng);
    CHECK_FALSE(r.ok);
    CHECK(r.picks.empty());
  }
  SECTION("last slot is valid") {
    const SimulatedDraftPicks r = simulate_ai_draft_picks(teams, pool, 1, 20, 1, rng);
    CHECK(r.ok);
    CHECK(r.reason.empty());
    CHECK(r.picks.size() == 19);
    CHECK(r.next_pick == 20);
  }
  SECTION("non-positive round") {
    const SimulatedDraftPicks r = simulate_ai_draft_picks(teams, pool, 1, 5, 0, rng);
    CHECK_FALSE(r.ok);
    CHECK_FALSE(r.reason.empty());
    CHECK(r.picks.empty());
  }
  SECTION("non-positive pick") {
    const SimulatedDraftPicks r = simulate_ai_draft_picks(teams, pool, 0, 5, 1, rng);
    CHECK_FALSE(r.ok);
    CHECK(r.picks.empty());
  }
  SECTION("empty pool") {
    const SimulatedDraftPicks r = simulate_ai_draft_picks(teams, {}, 1, 5, 1, rng);
    CHECK_FALSE(r.ok);
    CHECK(r.reason == "No prospects available");
    CHECK(r.picks.empty());
  }
  SECTION("every prospect already drafted") {
    std::vector<DraftProspect> taken = pool;
    for (auto &p : taken)
      p.is_drafted = true;
    const SimulatedDraftPicks r = simulate_ai_draft_picks(teams, taken, 1, 5, 1, rng);
    CHECK_FALSE(r.ok);
    CHECK(r.reason.find(teams[0].id) != std::string::npos);
    CHECK(r.picks.empty());
  }
}
