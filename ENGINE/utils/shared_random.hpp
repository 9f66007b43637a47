#pragma once

#include <cstdint>
#include <random>
#include <vector>

/*
  SharedRandom
  ------------
  Seeded generator whose sequences repeat for a given seed on every platform.
  Draws are built directly from mt19937_64 output instead of the std
  distributions, whose algorithms differ between standard libraries.
*/
class SharedRandom {
    uint64_t seed;
    std::mt19937_64 rng;

    public:
        explicit SharedRandom(uint64_t seed);

        uint64_t getSeed() const { return seed; }

        // [0, 1)
        float nextFloat();
        // min inclusive, max exclusive. Returns min when the range is empty.
        int randRange(int min, int max);
        float randFloat(float min, float max);
        bool coinFlip();
        std::vector<int> choice(const std::vector<int>& vec);
};
