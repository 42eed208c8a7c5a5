#pragma once

#include <utility>
#include <vector>

#include "franchise_core/random.hpp"

namespace franchise_core {

constexpr int kMinRating = 20;
constexpr int kMaxRating = 80;

// Round to the nearest integer and clamp onto the 20-80 scouting scale.
int clamp_rating(double value);

// Standard normal draw via Box-Muller. A zero first draw is re-sampled so the
// logarithm stays in its domain.
double standard_normal(UniformSource &rng);

struct SamplerBounds {
  int min_rating{kMinRating};
  int max_rating{kMaxRating};
};

// Bounded normal sampler used by every generator.
class RatingSampler {
public:
  explicit RatingSampler(UniformSource &rng, int min_rating = kMinRating,
                         int max_rating = kMaxRating);
  RatingSampler(UniformSource &rng, SamplerBounds bounds)
      : RatingSampler(rng, bounds.min_rating, bounds.max_rating) {}

  // Normal(mean, std_dev) rounded and clamped to [min_rating, max_rating].
  int sample(double mean, double std_dev);

  // Unclamped, unrounded normal draw.
  double sample_raw(double mean, double std_dev);

  UniformSource &source() { return rng_; }
  SamplerBounds bounds() const { return {min_rating_, max_rating_}; }

private:
  UniformSource &rng_;
  int min_rating_;
  int max_rating_;
};

// Weighted categorical draw. Weights need not sum to one; the last choice
// absorbs floating-point slack.
template <typename T>
T weighted_choice(UniformSource &rng,
                  const std::vector<std::pair<T, double>> &choices) {
  double total = 0.0;
  for (const auto &c : choices)
    total += c.second;
  double roll = rng.next() * total;
  for (const auto &c : choices) {
    roll -= c.second;
    if (roll < 0.0)
      return c.first;
  }
  return choices.back().first;
}

} // namespace franchise_core
