#include "shared_random.hpp"

    SharedRandom::SharedRandom(uint64_t seed_)
        : seed(seed_), rng(seed_) {}

    float SharedRandom::nextFloat() {
        // 24 bits fill a float mantissa exactly, so the result never rounds up to 1.
        const uint64_t bits = rng() >> 40;
        return static_cast<float>(bits) * (1.0f / 16777216.0f);
    }

    int SharedRandom::randRange(int min, int max) {
        if (max <= min) return min;
        const uint64_t span = static_cast<uint64_t>(static_cast<int64_t>(max) - static_cast<int64_t>(min));
        // Reject the top partial bucket so every value is equally likely.
        const uint64_t limit = UINT64_MAX - (UINT64_MAX % span);
        uint64_t draw = rng();
        while (draw >= limit) {
            draw = rng();
        }
        return static_cast<int>(static_cast<int64_t>(min) + static_cast<int64_t>(draw % span));
    }

    float SharedRandom::randFloat(float min, float max) {
        return min + (max - min) * nextFloat();
    }

    bool SharedRandom::coinFlip() {
        return (rng() >> 63) != 0;
    }

    std::vector<int> SharedRandom::choice(const std::vector<int>& vec) {
        if(vec.empty()) return {};
        int i = randRange(0, static_cast<int>(vec.size()));
        return {vec[i]};
    }
