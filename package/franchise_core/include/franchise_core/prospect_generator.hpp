#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include "franchise_core/player.hpp"
#include "franchise_core/random.hpp"
#include "franchise_core/rating_sampler.hpp"

namespace franchise_core {

struct DraftClassConfig {
  int total_players{800};

  // potential ~ Normal(mean, sd); current = potential - U[gap_min, gap_max]
  double potential_mean{50.0};
  double potential_sd{15.0};
  int gap_min{5};
  int gap_max{20};
  double tool_sd{8.0};

  std::vector<std::pair<Position, double>> position_weights{
      {Position::SP, 0.25},         {Position::RP, 0.15},
      {Position::C, 0.05},          {Position::FirstBase, 0.07},
      {Position::SecondBase, 0.07}, {Position::ThirdBase, 0.07},
      {Position::SS, 0.07},         {Position::LF, 0.09},
      {Position::CF, 0.09},         {Position::RF, 0.09}};

  std::vector<std::pair<int, double>> age_weights{
      {18, 0.15}, {19, 0.25}, {20, 0.30}, {21, 0.20}, {22, 0.10}};

  std::vector<std::pair<WorkEthic, double>> work_ethic_weights{
      {WorkEthic::Poor, 0.20}, {WorkEthic::Average, 0.60}, {WorkEthic::Excellent, 0.20}};
  double injury_prone_chance{0.20};
  std::vector<std::pair<Personality, double>> personality_weights{
      {Personality::TeamPlayer, 0.70},
      {Personality::PrimaDonna, 0.15},
      {Personality::Leader, 0.15}};
  int trait_min{30};
  int trait_max{70};

  // Media-rank score = 0.75*potential + 0.25*current + noise. Noise is
  // U(-media_noise, media_noise) plus an age term up to +/-media_age_noise
  // for the youngest class.
  double media_potential_weight{0.75};
  double media_current_weight{0.25};
  double media_noise{8.0};
  double media_age_noise{8.0};
  int media_age_ceiling{22};

  // Archetype thresholds.
  int raw_talent_gap{15};
  int balanced_spread_hitter{12};
  int balanced_spread_pitcher{8};
  int strong_tool_floor{55};

  SamplerBounds bounds{};
};

// Stable prospect id for draft year and zero-based generation index.
std::int64_t prospect_id(int draft_year, int index);

// Label for a tool profile. Large remaining headroom overrides everything.
Archetype determine_archetype(PlayerType type, const Eigen::ArrayXi &tools,
                              int current_rating, int potential,
                              const DraftClassConfig &cfg = DraftClassConfig{});

// Draft-class generator. Owns no randomness of its own; every draw comes from
// the source passed at construction.
class ProspectGenerator {
public:
  explicit ProspectGenerator(UniformSource &rng, DraftClassConfig cfg = DraftClassConfig{});

  // One prospect with id/name filled in, media rank left at 0.
  DraftProspect generate_prospect(int draft_year, int index);

  // Tool bundle sampled around the current rating.
  Eigen::ArrayXi generate_tools(PlayerType type, int current_rating);

  HiddenTraits generate_hidden_traits();

  // Assigns dense media ranks 1..N in place. Ties keep generation order.
  void assign_media_ranks(std::vector<DraftProspect> &prospects);

  // total_players prospects, ranked and shuffled. total_players <= 0 yields
  // an empty class.
  std::vector<DraftProspect> generate_draft_class(int total_players, int draft_year);
  std::vector<DraftProspect> generate_draft_class(int draft_year) {
    return generate_draft_class(cfg_.total_players, draft_year);
  }

  const DraftClassConfig &config() const { return cfg_; }

private:
  UniformSource &rng_;
  RatingSampler sampler_;
  DraftClassConfig cfg_;
};

// Convenience wrapper over ProspectGenerator.
std::vector<DraftProspect> generate_draft_class(int total_players, int draft_year,
                                                UniformSource &rng,
                                                const DraftClassConfig &cfg = DraftClassConfig{});

} // namespace franchise_core
