#pragma once

#include <cstdint>
#include <random>

namespace dojo {

// Seeded gameplay RNG. One instance per session so that a recorded input
// stream replays identically under the same seed. Seed 0 draws from
// std::random_device.
class Random {
  public:
    explicit Random(uint64_t seed = 0);

    void reseed(uint64_t seed);
    uint64_t seed() const;

    // Uniform in [lo, hi)
    float uniform(float lo, float hi);
    // Uniform in [0, 1)
    float unit();
    // True with probability p
    bool chance(float p);
    // Uniform integer in [0, count)
    int index(int count);

  private:
    uint64_t seed_ = 0;
    std::mt19937_64 engine_;
};

} // namespace dojo
