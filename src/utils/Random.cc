#include "dojo/utils/Random.hh"

namespace dojo {

Random::Random(uint64_t seed) {
    reseed(seed);
}

void Random::reseed(uint64_t seed) {
    if (seed == 0) {
        std::random_device rd;
        seed = (static_cast<uint64_t>(rd()) << 32) | rd();
    }
    seed_ = seed;
    engine_.seed(seed_);
}

uint64_t Random::seed() const {
    return seed_;
}

float Random::uniform(float lo, float hi) {
    std::uniform_real_distribution<float> dist(lo, hi);
    return dist(engine_);
}

float Random::unit() {
    return uniform(0.0f, 1.0f);
}

bool Random::chance(float p) {
    return unit() < p;
}

int Random::index(int count) {
    if (count <= 1)
        return 0;
    std::uniform_int_distribution<int> dist(0, count - 1);
    return dist(engine_);
}

} // namespace dojo
