#include "franchise_core/random.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace franchise_core {

Mt19937Source::Mt19937Source()
    : seed_((static_cast<std::uint64_t>(std::random_device{}()) << 32) ^
            std::random_device{}()),
      rng_(seed_) {}

Mt19937Source::Mt19937Source(std::uint64_t seed) : seed_(seed), rng_(seed) {}

double Mt19937Source::next() {
  const double u = unif_(rng_);
  // uniform_real_distribution may round up to the upper bound
  return u < 1.0 ? u : std::nextafter(1.0, 0.0);
}

SequenceSource::SequenceSource(std::vector<double> values)
    : values_(std::move(values)) {
  if (values_.empty()) {
    throw std::invalid_argument("SequenceSource: require at least one value");
  }
  for (double v : values_) {
    if (!(v >= 0.0 && v < 1.0)) {
      throw std::invalid_argument("SequenceSource: values must lie in [0, 1)");
    }
  }
}

double SequenceSource::next() {
  const double v = values_[pos_ % values_.size()];
  ++pos_;
  return v;
}

std::uint64_t mix_seed(std::uint64_t a, std::uint64_t b) {
  std::uint64_t z = a + 0x9e3779b97f4a7c15ULL + (b << 6) + (b >> 2);
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
  return z ^ (z >> 31);
}

double uniform_real(UniformSource &rng, double lo, double hi) {
  return lo + (hi - lo) * rng.next();
}

int uniform_int(UniformSource &rng, int lo, int hi) {
  if (hi < lo)
    std::swap(lo, hi);
  const int span = hi - lo + 1;
  const int offset = static_cast<int>(std::floor(rng.next() * span));
  return lo + std::min(offset, span - 1);
}

bool chance(UniformSource &rng, double probability) {
  return rng.next() < probability;
}

} // namespace franchise_core
