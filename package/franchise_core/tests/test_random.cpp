#include <catch2/catch.hpp>

#include <stdexcept>
#include <vector>

#include "franchise_core/random.hpp"
#include "franchise_core/rating_sampler.hpp"

using namespace franchise_core;

TEST_CASE("SequenceSource replays and wraps", "[random]") {
  SequenceSource src({0.1, 0.5, 0.9});
  CHECK(src.next() == Approx(0.1));
  CHECK(src.next() == Approx(0.5));
  CHECK(src.next() == Approx(0.9));
  CHECK(src.next() == Approx(0.1));
  CHECK(src.position() == 4);
}

TEST_CASE("SequenceSource rejects bad input", "[random]") {
  CHECK_THROWS_AS(SequenceSource(std::vector<double>{}), std::invalid_argument);
  CHECK_THROWS_AS(SequenceSource({0.2, 1.0}), std::invalid_argument);
  CHECK_THROWS_AS(SequenceSource({-0.1}), std::invalid_argument);
}

TEST_CASE("Seeded Mt19937Source is reproducible", "[random]") {
  Mt19937Source a(42);
  Mt19937Source b(42);
  for (int i = 0; i < 100; ++i) {
    const double u = a.next();
    CHECK(u == b.next());
    CHECK(u >= 0.0);
    CHECK(u < 1.0);
  }
}

TEST_CASE("uniform_int covers both ends", "[random]") {
  SequenceSource low({0.0});
  CHECK(uniform_int(low, 5, 20) == 5);
  SequenceSource high({0.999999});
  CHECK(uniform_int(high, 5, 20) == 20);

  Mt19937Source rng(7);
  bool saw_lo = false;
  bool saw_hi = false;
  for (int i = 0; i < 2000; ++i) {
    const int v = uniform_int(rng, 1, 4);
    REQUIRE(v >= 1);
    REQUIRE(v <= 4);
    saw_lo = saw_lo || v == 1;
    saw_hi = saw_hi || v == 4;
  }
  CHECK(saw_lo);
  CHECK(saw_hi);
}

TEST_CASE("chance compares strictly", "[random]") {
  SequenceSource src({0.3});
  CHECK(chance(src, 0.31));
  CHECK_FALSE(chance(src, 0.3));
}

TEST_CASE("mix_seed decorrelates neighbours", "[random]") {
  CHECK(mix_seed(1, 2) != mix_seed(1, 3));
  CHECK(mix_seed(1, 2) == mix_seed(1, 2));
}

TEST_CASE("clamp_rating rounds onto the scale", "[sampler]") {
  CHECK(clamp_rating(5.0) == kMinRating);
  CHECK(clamp_rating(120.0) == kMaxRating);
  CHECK(clamp_rating(49.6) == 50);
  CHECK(clamp_rating(49.4) == 49);
}

TEST_CASE("RatingSampler stays in bounds", "[sampler]") {
  Mt19937Source rng(1234);
  RatingSampler sampler(rng);
  int below_mean = 0;
  for (int i = 0; i < 5000; ++i) {
    const int v = sampler.sample(50.0, 30.0);
    REQUIRE(v >= kMinRating);
    REQUIRE(v <= kMaxRating);
    if (v < 50)
      ++below_mean;
  }
  // symmetric around the mean
  CHECK(below_mean > 2000);
  CHECK(below_mean < 3000);
}

TEST_CASE("RatingSampler honours custom bounds", "[sampler]") {
  Mt19937Source rng(99);
  RatingSampler sampler(rng, SamplerBounds{40, 60});
  CHECK(sampler.bounds().min_rating == 40);
  CHECK(sampler.bounds().max_rating == 60);
  for (int i = 0; i < 1000; ++i) {
    const int v = sampler.sample(50.0, 25.0);
    REQUIRE(v >= 40);
    REQUIRE(v <= 60);
  }
  CHECK_THROWS_AS(RatingSampler(rng, 70, 30), std::invalid_argument);
  CHECK_THROWS_AS(sampler.sample(50.0, -1.0), std::invalid_argument);
}

TEST_CASE("Zero std_dev returns the mean", "[sampler]") {
  Mt19937Source rng(5);
  RatingSampler sampler(rng);
  CHECK(sampler.sample(55.0, 0.0) == 55);
}

TEST_CASE("weighted_choice follows the cumulative weights", "[sampler]") {
  const std::vector<std::pair<int, double>> choices{{1, 0.2}, {2, 0.5}, {3, 0.3}};
  SequenceSource a({0.1});
  CHECK(weighted_choice(a, choices) == 1);
  SequenceSource b({0.5});
  CHECK(weighted_choice(b, choices) == 2);
  SequenceSource c({0.95});
  CHECK(weighted_choice(c, choices) == 3);
}
