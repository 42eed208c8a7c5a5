#include "franchise_core/scouting.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

#include <fmt/format.h>

#include "franchise_core/log.hpp"

namespace franchise_core {

namespace {

int noisy_error(UniformSource &rng, int bound) {
  return static_cast<int>(std::floor(uniform_real(rng, -1.0, 1.0) * bound));
}

} // namespace

std::int64_t scouting_cost(ScoutingTier tier, const ScoutingConfig &cfg) {
  return cfg.at(tier).cost;
}

ScoutingReport scout_prospect(const DraftProspect &prospect, ScoutingTier tier,
                              UniformSource &rng, const ScoutingConfig &cfg) {
  const ScoutingTierConfig &tc = cfg.at(tier);
  ScoutingReport r;
  r.accuracy = tier;
  r.cost = tc.cost;

  const int rating_err = noisy_error(rng, tc.error);
  const int potential_err = noisy_error(rng, tc.error);
  r.scouted_rating = std::clamp(prospect.current_rating + rating_err,
                                cfg.bounds.min_rating, cfg.bounds.max_rating);
  r.scouted_potential = std::clamp(prospect.potential + potential_err,
                                   cfg.bounds.min_rating, cfg.bounds.max_rating);
  r.rating_error = std::abs(rating_err);
  r.potential_error = std::abs(potential_err);

  r.traits_revealed = chance(rng, tc.trait_chance);
  if (r.traits_revealed) {
    const HiddenTraits &t = prospect.traits;
    r.revealed_traits.work_ethic = t.work_ethic;
    r.revealed_traits.personality = t.personality;
    if (chance(rng, cfg.reveal_injury_chance))
      r.revealed_traits.injury_prone = t.injury_prone;
    if (chance(rng, cfg.reveal_coachability_chance))
      r.revealed_traits.coachability = t.coachability;
    if (chance(rng, cfg.reveal_clutch_chance))
      r.revealed_traits.clutch = t.clutch;
  }
  return r;
}

ScoutingRequestResult request_scouting(const DraftProspect &prospect,
                                       std::string_view tier_name,
                                       std::int64_t available_funds, UniformSource &rng,
                                       const ScoutingConfig &cfg) {
  ScoutingRequestResult out;
  out.remaining_funds = available_funds;

  const auto tier = parse_scouting_tier(tier_name);
  if (!tier) {
    out.reason = fmt::format("Unknown scouting tier '{}'", tier_name);
    return out;
  }
  const std::int64_t cost = scouting_cost(*tier, cfg);
  if (available_funds < cost) {
    out.reason = fmt::format("Insufficient funds: {} scouting costs ${}, available ${}",
                             scouting_tier_name(*tier), cost, available_funds);
    return out;
  }

  out.ok = true;
  out.report = scout_prospect(prospect, *tier, rng, cfg);
  out.remaining_funds = available_funds - cost;
  log_debug("scouted prospect {} at {} accuracy for ${}", prospect.id,
            scouting_tier_name(*tier), cost);
  return out;
}

DraftProspect merge_scouting_report(const DraftProspect &prospect,
                                    const ScoutingReport &report) {
  DraftProspect p = prospect;
  p.scouted_rating = report.scouted_rating;
  p.scouted_potential = report.scouted_potential;
  p.scouting_accuracy = report.accuracy;

  const RevealedTraits &in = report.revealed_traits;
  RevealedTraits &out = p.revealed_traits;
  if (in.work_ethic)
    out.work_ethic = in.work_ethic;
  if (in.personality)
    out.personality = in.personality;
  if (in.injury_prone)
    out.injury_prone = in.injury_prone;
  if (in.coachability)
    out.coachability = in.coachability;
  if (in.clutch)
    out.clutch = in.clutch;
  p.traits_revealed = p.traits_revealed || report.traits_revealed;
  return p;
}

} // namespace franchise_core
