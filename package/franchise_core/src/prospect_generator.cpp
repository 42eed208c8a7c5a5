#include "franchise_core/prospect_generator.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <utility>

#include "franchise_core/log.hpp"

namespace franchise_core {

namespace {

const std::vector<const char *> kFirstNames = {
    "Jake",    "Mike",     "Chris",   "Matt",     "Ryan",    "Josh",    "Tyler",
    "Brandon", "Justin",   "Kyle",    "Derek",    "Kevin",   "Adam",    "Jason",
    "Marcus",  "Darius",   "Jamal",   "Terrence", "Jose",    "Juan",    "Luis",
    "Pedro",   "Rafael",   "Fernando", "Roberto", "Diego",   "Alejandro", "Ricardo",
    "Victor",  "Hector",   "Hiroshi", "Kenji",    "Takeshi", "Kenta",   "Daisuke",
    "Min-ho",  "Ji-hoon",  "Hyun-woo", "Wei",     "Ming"};

const std::vector<const char *> kLastNames = {
    "Johnson",  "Williams", "Brown",    "Jones",     "Miller",   "Davis",   "Wilson",
    "Moore",    "Taylor",   "Anderson", "Thomas",    "Jackson",  "Harris",  "Martin",
    "Thompson", "Clark",    "Lewis",    "Walker",    "Young",    "Wright",  "Gonzalez",
    "Lopez",    "Hernandez", "Ramirez", "Torres",    "Rivera",   "Sanchez", "Ortiz",
    "Cruz",     "Vargas",   "Castillo", "Medina",    "Suzuki",   "Tanaka",  "Nakamura",
    "Saito",    "Kim",      "Park",     "Choi",      "Chen"};

Archetype archetype_for_tool(Tool t) {
  switch (t) {
  case Tool::Hit:
    return Archetype::ContactKing;
  case Tool::Power:
    return Archetype::Slugger;
  case Tool::Speed:
    return Archetype::Speedster;
  case Tool::Arm:
    return Archetype::CannonArm;
  case Tool::Field:
    return Archetype::GloveWizard;
  case Tool::Stuff:
    return Archetype::Flamethrower;
  case Tool::Control:
    return Archetype::CommandAce;
  case Tool::Movement:
    return Archetype::MovementMaster;
  }
  return Archetype::Playmaker;
}

} // namespace

std::int64_t prospect_id(int draft_year, int index) {
  return static_cast<std::int64_t>(draft_year) * 10000 + index + 1;
}

Archetype determine_archetype(PlayerType type, const Eigen::ArrayXi &tools,
                              int current_rating, int potential,
                              const DraftClassConfig &cfg) {
  if (potential - current_rating >= cfg.raw_talent_gap)
    return Archetype::RawTalent;
  if (tools.size() == 0)
    return Archetype::Playmaker;

  const int spread = tools.maxCoeff() - tools.minCoeff();
  const int balanced = type == PlayerType::Hitter ? cfg.balanced_spread_hitter
                                                  : cfg.balanced_spread_pitcher;
  if (spread <= balanced)
    return Archetype::Playmaker;

  Eigen::Index best = 0;
  const int top = tools.maxCoeff(&best);
  if (top < cfg.strong_tool_floor)
    return Archetype::Playmaker;

  const auto &order = tools_for(type);
  if (best >= static_cast<Eigen::Index>(order.size()))
    return Archetype::Playmaker;
  return archetype_for_tool(order[static_cast<std::size_t>(best)]);
}

ProspectGenerator::ProspectGenerator(UniformSource &rng, DraftClassConfig cfg)
    : rng_(rng), sampler_(rng, cfg.bounds), cfg_(std::move(cfg)) {
  if (cfg_.gap_min > cfg_.gap_max) {
    throw std::invalid_argument("ProspectGenerator: require gap_min <= gap_max");
  }
  if (cfg_.position_weights.empty() || cfg_.age_weights.empty()) {
    throw std::invalid_argument("ProspectGenerator: position and age weights must be non-empty");
  }
}

Eigen::ArrayXi ProspectGenerator::generate_tools(PlayerType type, int current_rating) {
  const auto &order = tools_for(type);
  Eigen::ArrayXi tools(static_cast<Eigen::Index>(order.size()));
  for (Eigen::Index i = 0; i < tools.size(); ++i)
    tools[i] = sampler_.sample(current_rating, cfg_.tool_sd);
  return tools;
}

HiddenTraits ProspectGenerator::generate_hidden_traits() {
  HiddenTraits t;
  t.work_ethic = weighted_choice(rng_, cfg_.work_ethic_weights);
  t.injury_prone = chance(rng_, cfg_.injury_prone_chance);
  t.personality = weighted_choice(rng_, cfg_.personality_weights);
  t.coachability = uniform_int(rng_, cfg_.trait_min, cfg_.trait_max);
  t.clutch = uniform_int(rng_, cfg_.trait_min, cfg_.trait_max);
  return t;
}

DraftProspect ProspectGenerator::generate_prospect(int draft_year, int index) {
  const SamplerBounds b = sampler_.bounds();
  DraftProspect p;
  p.id = prospect_id(draft_year, index);
  p.first_name = kFirstNames[static_cast<std::size_t>(
      uniform_int(rng_, 0, static_cast<int>(kFirstNames.size()) - 1))];
  p.last_name = kLastNames[static_cast<std::size_t>(
      uniform_int(rng_, 0, static_cast<int>(kLastNames.size()) - 1))];

  p.potential = sampler_.sample(cfg_.potential_mean, cfg_.potential_sd);
  const int gap = uniform_int(rng_, cfg_.gap_min, cfg_.gap_max);
  p.current_rating = std::clamp(p.potential - gap, b.min_rating, b.max_rating);
  // current <= potential, also when potential is pinned to the floor
  p.current_rating = std::min(p.current_rating, p.potential);

  p.position = weighted_choice(rng_, cfg_.position_weights);
  p.player_type = player_type_for(p.position);
  p.tools = generate_tools(p.player_type, p.current_rating);
  p.traits = generate_hidden_traits();
  p.age = weighted_choice(rng_, cfg_.age_weights);

  p.progression_rate = calculate_progression_rate(p.age, p.potential, p.current_rating);
  p.is_on_roster = false;
  p.draft_year = draft_year;
  p.archetype = determine_archetype(p.player_type, p.tools, p.current_rating,
                                    p.potential, cfg_);
  return p;
}

void ProspectGenerator::assign_media_ranks(std::vector<DraftProspect> &prospects) {
  const auto n = static_cast<Eigen::Index>(prospects.size());
  Eigen::VectorXd score(n);
  for (Eigen::Index i = 0; i < n; ++i) {
    const auto &p = prospects[static_cast<std::size_t>(i)];
    const double age_extra = std::max(
        0.0, cfg_.media_age_noise * (cfg_.media_age_ceiling - p.age) / 4.0);
    const double noise = uniform_real(rng_, -cfg_.media_noise, cfg_.media_noise) +
                         uniform_real(rng_, -age_extra, age_extra);
    score[i] = cfg_.media_potential_weight * p.potential +
               cfg_.media_current_weight * p.current_rating + noise;
  }

  std::vector<std::size_t> order(prospects.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
    return score[static_cast<Eigen::Index>(a)] > score[static_cast<Eigen::Index>(b)];
  });
  for (std::size_t r = 0; r < order.size(); ++r)
    prospects[order[r]].media_rank = static_cast<int>(r) + 1;
}

std::vector<DraftProspect> ProspectGenerator::generate_draft_class(int total_players,
                                                                   int draft_year) {
  std::vector<DraftProspect> prospects;
  if (total_players <= 0)
    return prospects;
  prospects.reserve(static_cast<std::size_t>(total_players));
  for (int i = 0; i < total_players; ++i)
    prospects.push_back(generate_prospect(draft_year, i));

  assign_media_ranks(prospects);

  // Fisher-Yates on display order; media_rank travels with the record
  for (std::size_t i = prospects.size() - 1; i > 0; --i) {
    const auto j = static_cast<std::size_t>(uniform_int(rng_, 0, static_cast<int>(i)));
    std::swap(prospects[i], prospects[j]);
  }

  log_debug("generated draft class {} with {} prospects", draft_year, prospects.size());
  return prospects;
}

std::vector<DraftProspect> generate_draft_class(int total_players, int draft_year,
                                                UniformSource &rng,
                                                const DraftClassConfig &cfg) {
  ProspectGenerator gen(rng, cfg);
  return gen.generate_draft_class(total_players, draft_year);
}

} // namespace franchise_core
