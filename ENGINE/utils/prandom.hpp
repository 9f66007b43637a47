#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>
#include "shared_random.hpp"

class DefaultRandomSource;

// Logical random streams. Grow this list to add a channel.
enum class RngChannel {
    Spawn = 0,
    RoomGeneration,
    TrailGeneration,
    Animation,
    Movement,
    Lighting,
    Audio,
    Count
};

const char* to_string(RngChannel channel);
std::optional<RngChannel> rng_channel_from_string(const std::string& name);

/*
  PRandom
  -------
  Table of named random channels. A channel that is enabled and seeded
  produces a repeatable sequence; every other channel draws from the engine's
  default source. Seeding and enabling are separate steps, so a seed can be
  staged ahead of time and switched on later.

  Construct one at startup and hand it to the systems that need it.
  Not thread-safe.
*/
class PRandom {
public:
    static constexpr std::size_t kChannelCount = static_cast<std::size_t>(RngChannel::Count);

    explicit PRandom(DefaultRandomSource& fallback);

    void initialize_if_needed();
    bool initialized() const { return initialized_; }

    void set_seed(RngChannel channel, int64_t seed);
    void clear_seed(RngChannel channel);
    bool has_seed(RngChannel channel) const;
    std::optional<int64_t> seed(RngChannel channel) const;

    void set_enabled(RngChannel channel, bool enabled);
    bool is_enabled(RngChannel channel) const;

    // [0, 1)
    float get_float(RngChannel channel);
    // min and max inclusive float
    float get_range(RngChannel channel, float min, float max);
    // min inclusive, max exclusive integer
    int   get_range(RngChannel channel, int min, int max);

    // {"channels": {"spawn": {"seed": 42, "enabled": true}, ...}}
    void apply_config(const nlohmann::json& data);

private:
    struct Slot {
        std::unique_ptr<SharedRandom> generator;
        bool enabled = false;
        bool warned_unseeded = false;
    };

    Slot* slot(RngChannel channel);
    const Slot* slot(RngChannel channel) const;
    SharedRandom* active_generator(RngChannel channel);

    DefaultRandomSource& fallback_;
    std::array<Slot, kChannelCount> slots_;
    bool initialized_ = false;
};
