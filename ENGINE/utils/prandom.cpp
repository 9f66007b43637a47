#include "prandom.hpp"
#include "default_random_source.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <iostream>

namespace {

struct ChannelName {
    RngChannel channel;
    const char* name;
};

constexpr ChannelName kChannelNames[] = {
    {RngChannel::Spawn,           "spawn"},
    {RngChannel::RoomGeneration,  "room_generation"},
    {RngChannel::TrailGeneration, "trail_generation"},
    {RngChannel::Animation,       "animation"},
    {RngChannel::Movement,        "movement"},
    {RngChannel::Lighting,        "lighting"},
    {RngChannel::Audio,           "audio"},
};

static_assert(sizeof(kChannelNames) / sizeof(kChannelNames[0]) == PRandom::kChannelCount,
              "every RngChannel needs a name");

}

const char* to_string(RngChannel channel) {
    for (const auto& entry : kChannelNames) {
        if (entry.channel == channel) return entry.name;
    }
    return "unknown";
}

std::optional<RngChannel> rng_channel_from_string(const std::string& name) {
    for (const auto& entry : kChannelNames) {
        if (name == entry.name) return entry.channel;
    }
    return std::nullopt;
}

PRandom::PRandom(DefaultRandomSource& fallback)
: fallback_(fallback)
{
    initialize_if_needed();
}

void PRandom::initialize_if_needed() {
    if (initialized_) {
        return;
    }
    for (auto& s : slots_) {
        s.generator.reset();
        s.enabled = false;
        s.warned_unseeded = false;
    }
    initialized_ = true;
}

PRandom::Slot* PRandom::slot(RngChannel channel) {
    const auto index = static_cast<std::size_t>(channel);
    if (index >= kChannelCount) return nullptr;
    return &slots_[index];
}

const PRandom::Slot* PRandom::slot(RngChannel channel) const {
    const auto index = static_cast<std::size_t>(channel);
    if (index >= kChannelCount) return nullptr;
    return &slots_[index];
}

void PRandom::set_seed(RngChannel channel, int64_t seed) {
    Slot* s = slot(channel);
    if (!s) {
        std::cerr << "[PRandom] set_seed on invalid channel " << static_cast<int>(channel) << "\n";
        return;
    }
    s->generator = std::make_unique<SharedRandom>(static_cast<uint64_t>(seed));
    s->warned_unseeded = false;
}

void PRandom::clear_seed(RngChannel channel) {
    if (Slot* s = slot(channel)) {
        s->generator.reset();
    }
}

bool PRandom::has_seed(RngChannel channel) const {
    const Slot* s = slot(channel);
    return s && s->generator;
}

std::optional<int64_t> PRandom::seed(RngChannel channel) const {
    const Slot* s = slot(channel);
    if (!s || !s->generator) return std::nullopt;
    return static_cast<int64_t>(s->generator->getSeed());
}

void PRandom::set_enabled(RngChannel channel, bool enabled) {
    Slot* s = slot(channel);
    if (!s) {
        std::cerr << "[PRandom] set_enabled on invalid channel " << static_cast<int>(channel) << "\n";
        return;
    }
    s->enabled = enabled;
}

bool PRandom::is_enabled(RngChannel channel) const {
    const Slot* s = slot(channel);
    return s && s->enabled;
}

SharedRandom* PRandom::active_generator(RngChannel channel) {
    Slot* s = slot(channel);
    if (!s || !s->enabled) {
        return nullptr;
    }
    if (!s->generator) {
        if (!s->warned_unseeded) {
            std::cerr << "[PRandom] Channel '" << to_string(channel)
                      << "' is enabled but has no seed, using default randomness\n";
            s->warned_unseeded = true;
        }
        return nullptr;
    }
    return s->generator.get();
}

float PRandom::get_float(RngChannel channel) {
    if (SharedRandom* gen = active_generator(channel)) {
        return gen->nextFloat();
    }
    return fallback_.random_float();
}

float PRandom::get_range(RngChannel channel, float min, float max) {
    const float t = std::clamp(get_float(channel), 0.0f, 1.0f);
    return min + (max - min) * t;
}

int PRandom::get_range(RngChannel channel, int min, int max) {
    if (SharedRandom* gen = active_generator(channel)) {
        return gen->randRange(min, max);
    }
    return fallback_.random_int(min, max);
}

void PRandom::apply_config(const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }
    const auto channels_it = data.find("channels");
    if (channels_it == data.end()) {
        return;
    }
    if (!channels_it->is_object()) {
        std::cerr << "[PRandom] 'channels' must be an object\n";
        return;
    }
    for (auto it = channels_it->begin(); it != channels_it->end(); ++it) {
        const auto channel = rng_channel_from_string(it.key());
        if (!channel) {
            std::cerr << "[PRandom] Unknown channel '" << it.key() << "' in config\n";
            continue;
        }
        const auto& entry = it.value();
        if (!entry.is_object()) {
            std::cerr << "[PRandom] Channel '" << it.key() << "' config must be an object\n";
            continue;
        }
        try {
            const auto seed_it = entry.find("seed");
            if (seed_it != entry.end() && !seed_it->is_null()) {
                if (!seed_it->is_number_integer()) {
                    std::cerr << "[PRandom] Seed for '" << it.key() << "' must be an integer\n";
                } else {
                    const int64_t seed = seed_it->get<int64_t>();
                    set_seed(*channel, seed);
                    std::cout << "[PRandom] Seeded '" << it.key() << "' with " << seed << "\n";
                }
            }
            set_enabled(*channel, entry.value("enabled", is_enabled(*channel)));
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[PRandom] Bad config for '" << it.key() << "': " << e.what() << "\n";
        }
    }
}
