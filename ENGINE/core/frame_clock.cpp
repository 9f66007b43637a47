#include "frame_clock.hpp"

#include <nlohmann/json.hpp>
#include <cmath>
#include <iostream>

FrameClock::FrameClock() : FrameClock(Config{}) {}

FrameClock::FrameClock(const Config& config)
: counter_origin_(SDL_GetPerformanceCounter()),
  counter_freq_(SDL_GetPerformanceFrequency()),
  max_delta_(config.max_delta)
{
    if (counter_freq_ == 0) counter_freq_ = 1;
    set_time_scale(config.time_scale);
}

FrameClock::Config FrameClock::config_from_json(const nlohmann::json& data) {
    Config cfg;
    if (!data.is_object()) {
        return cfg;
    }
    auto read_number = [&data](const char* key, float& out) {
        const auto it = data.find(key);
        if (it == data.end()) return;
        if (!it->is_number()) {
            std::cerr << "[FrameClock] '" << key << "' must be a number, got " << it->dump() << "\n";
            return;
        }
        out = it->get<float>();
    };
    read_number("time_scale", cfg.time_scale);
    read_number("max_delta", cfg.max_delta);
    return cfg;
}

double FrameClock::read_seconds() const {
    const Uint64 now = SDL_GetPerformanceCounter();
    return static_cast<double>(now - counter_origin_) / static_cast<double>(counter_freq_);
}

void FrameClock::tick() {
    const double now = read_seconds();
    double delta = now - last_read_;
    last_read_ = now;
    if (delta < 0.0) delta = 0.0;
    advance(delta);
}

void FrameClock::advance(double unscaled_delta) {
    if (max_delta_ > 0.0f && unscaled_delta > max_delta_) {
        unscaled_delta = max_delta_;
    }
    const double scaled_delta = unscaled_delta * time_scale_;

    unscaled_time_  += unscaled_delta;
    scaled_time_    += scaled_delta;
    unscaled_delta_  = static_cast<float>(unscaled_delta);
    scaled_delta_    = static_cast<float>(scaled_delta);
    ++frame_count_;
}

float FrameClock::current_time(bool scaled) const {
    return static_cast<float>(scaled ? scaled_time_ : unscaled_time_);
}

float FrameClock::tick_delta(bool scaled) const {
    return scaled ? scaled_delta_ : unscaled_delta_;
}

bool FrameClock::set_time_scale(float scale) {
    if (!std::isfinite(scale) || scale < 0.0f) {
        std::cerr << "[FrameClock] Ignoring invalid time scale " << scale << "\n";
        return false;
    }
    time_scale_ = scale;
    return true;
}
