#include <catch2/catch.hpp>

#include <algorithm>
#include <set>
#include <vector>

#include "franchise_core/prospect_generator.hpp"

using namespace franchise_core;

TEST_CASE("Draft class invariants", "[prospects]") {
  Mt19937Source rng(2024);
  const std::vector<DraftProspect> cls = generate_draft_class(800, 2025, rng);
  REQUIRE(cls.size() == 800);

  std::set<int> ranks;
  std::set<std::int64_t> ids;
  int pitchers = 0;
  for (const auto &p : cls) {
    CHECK(p.current_rating <= p.potential);
    CHECK(p.current_rating >= kMinRating);
    CHECK(p.potential <= kMaxRating);
    CHECK(p.age >= 18);
    CHECK(p.age <= 22);
    CHECK(p.traits.coachability >= 30);
    CHECK(p.traits.coachability <= 70);
    CHECK(p.draft_year == 2025);
    CHECK_FALSE(p.is_drafted);
    CHECK_FALSE(p.scouted_rating.has_value());
    CHECK(p.position != Position::DH);

    const auto expected_tools = tools_for(p.player_type).size();
    REQUIRE(static_cast<std::size_t>(p.tools.size()) == expected_tools);
    CHECK(p.tools.minCoeff() >= kMinRating);
    CHECK(p.tools.maxCoeff() <= kMaxRating);
    CHECK(p.progression_rate >= 0.5);
    CHECK(p.progression_rate <= 2.0);

    ranks.insert(p.media_rank);
    ids.insert(p.id);
    if (p.player_type == PlayerType::Pitcher)
      ++pitchers;
  }

  // dense ranks 1..N and unique ids
  CHECK(ranks.size() == 800);
  CHECK(*ranks.begin() == 1);
  CHECK(*ranks.rbegin() == 800);
  CHECK(ids.size() == 800);
  CHECK(ids.count(prospect_id(2025, 0)) == 1);

  // roughly 40% pitchers
  CHECK(pitchers > 240);
  CHECK(pitchers < 400);
}

TEST_CASE("Same seed, same class", "[prospects]") {
  Mt19937Source a(77);
  Mt19937Source b(77);
  const auto x = generate_draft_class(50, 2030, a);
  const auto y = generate_draft_class(50, 2030, b);
  REQUIRE(x.size() == y.size());
  for (std::size_t i = 0; i < x.size(); ++i) {
    CHECK(x[i].id == y[i].id);
    CHECK(x[i].full_name() == y[i].full_name());
    CHECK(x[i].media_rank == y[i].media_rank);
    CHECK((x[i].tools == y[i].tools).all());
  }
}

TEST_CASE("Empty and degenerate classes", "[prospects]") {
  Mt19937Source rng(1);
  CHECK(generate_draft_class(0, 2025, rng).empty());
  CHECK(generate_draft_class(-3, 2025, rng).empty());
  const auto one = generate_draft_class(1, 2025, rng);
  REQUIRE(one.size() == 1);
  CHECK(one[0].media_rank == 1);

  DraftClassConfig bad;
  bad.gap_min = 10;
  bad.gap_max = 5;
  CHECK_THROWS_AS(ProspectGenerator(rng, bad), std::invalid_argument);
}

TEST_CASE("Media ranks favour potential", "[prospects]") {
  Mt19937Source rng(3);
  DraftClassConfig cfg;
  cfg.media_noise = 0.0;
  cfg.media_age_noise = 0.0;
  ProspectGenerator gen(rng, cfg);

  std::vector<DraftProspect> ps(3);
  ps[0].potential = 50;
  ps[0].current_rating = 40;
  ps[1].potential = 70;
  ps[1].current_rating = 50;
  ps[2].potential = 50;
  ps[2].current_rating = 40;
  gen.assign_media_ranks(ps);
  CHECK(ps[1].media_rank == 1);
  // equal scores keep generation order
  CHECK(ps[0].media_rank == 2);
  CHECK(ps[2].media_rank == 3);
}

TEST_CASE("Archetype labels", "[prospects]") {
  Eigen::ArrayXi hitter(5);

  hitter << 50, 70, 45, 50, 48;
  CHECK(determine_archetype(PlayerType::Hitter, hitter, 52, 60) == Archetype::Slugger);

  hitter << 50, 52, 48, 50, 49;
  CHECK(determine_archetype(PlayerType::Hitter, hitter, 50, 55) == Archetype::Playmaker);

  // big headroom wins over any tool
  hitter << 50, 70, 45, 50, 48;
  CHECK(determine_archetype(PlayerType::Hitter, hitter, 40, 60) == Archetype::RawTalent);

  // strong profile but no tool reaches the floor
  hitter << 30, 50, 30, 30, 30;
  CHECK(determine_archetype(PlayerType::Hitter, hitter, 35, 40) == Archetype::Playmaker);

  Eigen::ArrayXi pitcher(3);
  pitcher << 45, 62, 50;
  CHECK(determine_archetype(PlayerType::Pitcher, pitcher, 52, 58) == Archetype::CommandAce);
}
