#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace franchise_core {

// Uniform source of doubles in [0, 1). Every randomized engine call draws
// from one of these, so callers control reproducibility.
class UniformSource {
public:
  virtual ~UniformSource() = default;
  virtual double next() = 0;
};

// std::mt19937_64 backed source. The default constructor seeds from
// std::random_device and is therefore non-deterministic.
class Mt19937Source : public UniformSource {
public:
  Mt19937Source();
  explicit Mt19937Source(std::uint64_t seed);

  double next() override;

  std::uint64_t seed() const { return seed_; }

private:
  std::uint64_t seed_{0};
  std::mt19937_64 rng_;
  std::uniform_real_distribution<double> unif_{0.0, 1.0};
};

// Replays a fixed list of draws, wrapping around at the end.
class SequenceSource : public UniformSource {
public:
  explicit SequenceSource(std::vector<double> values);

  double next() override;

  std::size_t position() const { return pos_; }

private:
  std::vector<double> values_;
  std::size_t pos_{0};
};

// splitmix64-style mixing to decorrelate seeds
std::uint64_t mix_seed(std::uint64_t a, std::uint64_t b);

// Uniform double in [lo, hi).
double uniform_real(UniformSource &rng, double lo, double hi);

// Uniform integer in [lo, hi], both inclusive.
int uniform_int(UniformSource &rng, int lo, int hi);

bool chance(UniformSource &rng, double probability);

} // namespace franchise_core
