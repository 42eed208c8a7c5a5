#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "franchise_core/player.hpp"
#include "franchise_core/random.hpp"

namespace franchise_core {

struct ScoutingTierConfig {
  std::int64_t cost{0};
  int error{0};               // scouted value lands within +/- error of the truth
  double trait_chance{0.0};   // chance the visit reveals hidden traits at all
};

struct ScoutingConfig {
  // Indexed by ScoutingTier.
  std::array<ScoutingTierConfig, 3> tiers{{
      {2000, 15, 0.30},
      {4000, 8, 0.60},
      {8000, 3, 0.90},
  }};
  // Once traits are revealed, work ethic and personality always show; the
  // rest each need their own coin flip.
  double reveal_injury_chance{0.5};
  double reveal_coachability_chance{0.7};
  double reveal_clutch_chance{0.5};
  SamplerBounds bounds{};

  const ScoutingTierConfig &at(ScoutingTier t) const {
    return tiers[static_cast<std::size_t>(t)];
  }
};

struct ScoutingReport {
  ScoutingTier accuracy{ScoutingTier::Low};
  int scouted_rating{kMinRating};
  int scouted_potential{kMinRating};
  int rating_error{0};    // absolute
  int potential_error{0}; // absolute
  bool traits_revealed{false};
  RevealedTraits revealed_traits;
  std::int64_t cost{0};
};

struct ScoutingRequestResult {
  bool ok{false};
  std::string reason;
  std::optional<ScoutingReport> report;
  std::int64_t remaining_funds{0};
};

std::int64_t scouting_cost(ScoutingTier tier, const ScoutingConfig &cfg = ScoutingConfig{});

// Noisy estimate of a prospect at the given accuracy. The prospect is left
// untouched; use merge_scouting_report to fold the estimate in.
ScoutingReport scout_prospect(const DraftProspect &prospect, ScoutingTier tier,
                              UniformSource &rng,
                              const ScoutingConfig &cfg = ScoutingConfig{});

// Validated entry point for caller-supplied tier names and a funds balance.
ScoutingRequestResult request_scouting(const DraftProspect &prospect,
                                       std::string_view tier_name,
                                       std::int64_t available_funds, UniformSource &rng,
                                       const ScoutingConfig &cfg = ScoutingConfig{});

// Copy of the prospect carrying the report's estimates. Traits revealed by
// earlier visits stay revealed.
DraftProspect merge_scouting_report(const DraftProspect &prospect,
                                    const ScoutingReport &report);

} // namespace franchise_core
