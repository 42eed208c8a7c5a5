#include "franchise_core/rating_sampler.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace franchise_core {

namespace {
constexpr double kTwoPi = 6.283185307179586476925286766559;
} // namespace

int clamp_rating(double value) {
  const double bounded = std::max<double>(kMinRating, std::min<double>(kMaxRating, value));
  return static_cast<int>(std::lround(bounded));
}

double standard_normal(UniformSource &rng) {
  double u1 = rng.next();
  while (u1 <= 0.0)
    u1 = rng.next();
  const double u2 = rng.next();
  return std::sqrt(-2.0 * std::log(u1)) * std::cos(kTwoPi * u2);
}

RatingSampler::RatingSampler(UniformSource &rng, int min_rating, int max_rating)
    : rng_(rng), min_rating_(min_rating), max_rating_(max_rating) {
  if (min_rating_ > max_rating_) {
    throw std::invalid_argument("RatingSampler: require min_rating <= max_rating");
  }
}

double RatingSampler::sample_raw(double mean, double std_dev) {
  return mean + standard_normal(rng_) * std_dev;
}

int RatingSampler::sample(double mean, double std_dev) {
  if (std_dev < 0.0) {
    throw std::invalid_argument("RatingSampler.sample: std_dev must be >= 0");
  }
  const double v = sample_raw(mean, std_dev);
  const double bounded = std::max<double>(min_rating_, std::min<double>(max_rating_, v));
  return static_cast<int>(std::lround(bounded));
}

} // namespace franchise_core
