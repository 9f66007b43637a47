#pragma once

#include <random>

/*
  Non-deterministic randomness used whenever a named channel is not driven by
  its own seed.
*/
class DefaultRandomSource {
public:
    virtual ~DefaultRandomSource() = default;

    // [0, 1)
    virtual float random_float() = 0;
    // min inclusive, max exclusive. Returns min when the range is empty.
    virtual int random_int(int min, int max) = 0;
};

class EngineRandomSource : public DefaultRandomSource {
public:
    EngineRandomSource();

    float random_float() override;
    int random_int(int min, int max) override;

private:
    std::mt19937 rng_;
};
