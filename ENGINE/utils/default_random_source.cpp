#include "default_random_source.hpp"

EngineRandomSource::EngineRandomSource()
: rng_(std::random_device{}()) {}

float EngineRandomSource::random_float() {
    std::uniform_real_distribution<float> dist(0.0f, 1.0f);
    float v = dist(rng_);
    // Some library versions can round up to the upper bound.
    if (v >= 1.0f) v = 0.0f;
    return v;
}

int EngineRandomSource::random_int(int min, int max) {
    if (max <= min) return min;
    std::uniform_int_distribution<int> dist(min, max - 1);
    return dist(rng_);
}
