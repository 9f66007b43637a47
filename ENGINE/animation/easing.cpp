#include "easing.hpp"
#include "keyframe_curve.hpp"
#include "core/frame_clock.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>

namespace {

constexpr float kPi = 3.14159265358979f;

float bounce_out(float t) {
    const float n1 = 7.5625f;
    const float d1 = 2.75f;

    if (t < 1.0f / d1) {
        return n1 * t * t;
    } else if (t < 2.0f / d1) {
        t -= 1.5f / d1;
        return n1 * t * t + 0.75f;
    } else if (t < 2.5f / d1) {
        t -= 2.25f / d1;
        return n1 * t * t + 0.9375f;
    } else {
        t -= 2.625f / d1;
        return n1 * t * t + 0.984375f;
    }
}

float lerp_unclamped(float a, float b, float t) {
    return a + (b - a) * t;
}

struct ShapeName {
    Easing::Shape shape;
    const char* name;
};

constexpr ShapeName kShapeNames[] = {
    {Easing::Shape::NULL_SHAPE,     "NULL"},
    {Easing::Shape::LINEAR,         "LINEAR"},
    {Easing::Shape::START_VALUE,    "START_VALUE"},
    {Easing::Shape::END_VALUE,      "END_VALUE"},
    {Easing::Shape::CURVE,          "CURVE"},
    {Easing::Shape::QUAD_IN,        "QUAD_IN"},
    {Easing::Shape::QUAD_OUT,       "QUAD_OUT"},
    {Easing::Shape::QUAD_IN_OUT,    "QUAD_IN_OUT"},
    {Easing::Shape::CUBIC_IN,       "CUBIC_IN"},
    {Easing::Shape::CUBIC_OUT,      "CUBIC_OUT"},
    {Easing::Shape::CUBIC_IN_OUT,   "CUBIC_IN_OUT"},
    {Easing::Shape::TRIG_IN,        "TRIG_IN"},
    {Easing::Shape::TRIG_OUT,       "TRIG_OUT"},
    {Easing::Shape::TRIG_IN_OUT,    "TRIG_IN_OUT"},
    {Easing::Shape::EXPO_IN,        "EXPO_IN"},
    {Easing::Shape::EXPO_OUT,       "EXPO_OUT"},
    {Easing::Shape::EXPO_IN_OUT,    "EXPO_IN_OUT"},
    {Easing::Shape::BOUNCE_IN,      "BOUNCE_IN"},
    {Easing::Shape::BOUNCE_OUT,     "BOUNCE_OUT"},
    {Easing::Shape::BOUNCE_IN_OUT,  "BOUNCE_IN_OUT"},
    {Easing::Shape::BACK_IN,        "BACK_IN"},
    {Easing::Shape::BACK_OUT,       "BACK_OUT"},
    {Easing::Shape::BACK_IN_OUT,    "BACK_IN_OUT"},
    {Easing::Shape::ELASTIC_IN,     "ELASTIC_IN"},
    {Easing::Shape::ELASTIC_OUT,    "ELASTIC_OUT"},
    {Easing::Shape::ELASTIC_IN_OUT, "ELASTIC_IN_OUT"},
};

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

bool valid_duration(float seconds) {
    return std::isfinite(seconds) && seconds > 0.0f;
}

}

const char* to_string(Easing::Shape shape) {
    for (const auto& entry : kShapeNames) {
        if (entry.shape == shape) return entry.name;
    }
    return "UNKNOWN";
}

const char* to_string(Easing::Loop loop) {
    switch (loop) {
        case Easing::Loop::NO_LOOP:        return "NO_LOOP";
        case Easing::Loop::RESET:          return "RESET";
        case Easing::Loop::PING_PONG:      return "PING_PONG";
        case Easing::Loop::PING_PONG_ONCE: return "PING_PONG_ONCE";
    }
    return "UNKNOWN";
}

const char* to_string(Easing::PlayState state) {
    switch (state) {
        case Easing::PlayState::UNPLAYED: return "UNPLAYED";
        case Easing::PlayState::PLAYING:  return "PLAYING";
        case Easing::PlayState::FINISHED: return "FINISHED";
    }
    return "UNKNOWN";
}

const char* to_string(Easing::Issue issue) {
    switch (issue) {
        case Easing::Issue::NONE:             return "NONE";
        case Easing::Issue::MISSING_CURVE:    return "MISSING_CURVE";
        case Easing::Issue::UNASSIGNED_SHAPE: return "UNASSIGNED_SHAPE";
        case Easing::Issue::UNKNOWN_SHAPE:    return "UNKNOWN_SHAPE";
    }
    return "UNKNOWN";
}

std::optional<Easing::Shape> easing_shape_from_string(const std::string& name) {
    const std::string upper = to_upper(name);
    for (const auto& entry : kShapeNames) {
        if (upper == entry.name) return entry.shape;
    }
    return std::nullopt;
}

std::optional<Easing::Loop> easing_loop_from_string(const std::string& name) {
    const std::string upper = to_upper(name);
    for (auto loop : {Easing::Loop::NO_LOOP, Easing::Loop::RESET,
                      Easing::Loop::PING_PONG, Easing::Loop::PING_PONG_ONCE}) {
        if (upper == to_string(loop)) return loop;
    }
    return std::nullopt;
}

Easing::Easing(const TimeSource& clock, Shape shape, Loop loop, std::optional<float> duration)
: clock_(&clock), shape_(shape), loop_(loop)
{
    if (duration) set_duration(*duration);
}

Easing::Easing(const TimeSource& clock, std::shared_ptr<const CustomCurve> curve,
               Loop loop, std::optional<float> duration)
: clock_(&clock), shape_(Shape::CURVE), loop_(loop), curve_(std::move(curve))
{
    if (duration) set_duration(*duration);
}

Easing::Easing(const TimeSource& clock, const Config& config)
: clock_(&clock),
  shape_(config.shape),
  loop_(config.loop),
  curve_(config.curve),
  use_scaled_time_(config.use_scaled_time)
{
    if (config.duration) set_duration(*config.duration);
}

Easing::Config Easing::config_from_json(const nlohmann::json& data) {
    Config cfg;
    if (!data.is_object()) {
        std::cerr << "[Easing] Easing config must be an object\n";
        return cfg;
    }
    const auto curve_it = data.find("curve");
    if (curve_it != data.end()) {
        auto curve = std::make_shared<KeyframeCurve>(KeyframeCurve::from_json(*curve_it));
        cfg.curve = std::move(curve);
        cfg.shape = Shape::CURVE;
    }

    const auto shape_it = data.find("shape");
    if (shape_it != data.end()) {
        if (!shape_it->is_string()) {
            std::cerr << "[Easing] 'shape' must be a string, got " << shape_it->dump() << "\n";
        } else if (auto shape = easing_shape_from_string(shape_it->get<std::string>())) {
            cfg.shape = *shape;
        } else {
            std::cerr << "[Easing] Unknown easing shape '" << shape_it->get<std::string>() << "'\n";
        }
    }

    const auto loop_it = data.find("loop");
    if (loop_it != data.end()) {
        if (!loop_it->is_string()) {
            std::cerr << "[Easing] 'loop' must be a string, got " << loop_it->dump() << "\n";
        } else if (auto loop = easing_loop_from_string(loop_it->get<std::string>())) {
            cfg.loop = *loop;
        } else {
            std::cerr << "[Easing] Unknown loop mode '" << loop_it->get<std::string>() << "'\n";
        }
    }

    const auto duration_it = data.find("duration");
    if (duration_it != data.end()) {
        if (!duration_it->is_number()) {
            std::cerr << "[Easing] 'duration' must be a number, got " << duration_it->dump() << "\n";
        } else {
            const float seconds = duration_it->get<float>();
            if (valid_duration(seconds)) {
                cfg.duration = seconds;
            } else {
                std::cerr << "[Easing] Ignoring invalid duration " << seconds << "\n";
            }
        }
    }

    const auto scaled_it = data.find("scaled_time");
    if (scaled_it != data.end()) {
        if (scaled_it->is_boolean()) {
            cfg.use_scaled_time = scaled_it->get<bool>();
        } else {
            std::cerr << "[Easing] 'scaled_time' must be a boolean, got " << scaled_it->dump() << "\n";
        }
    }
    return cfg;
}

Easing Easing::from_json(const TimeSource& clock, const nlohmann::json& data) {
    return Easing(clock, config_from_json(data));
}

float Easing::sample() {
    if (paused_) {
        start_time_ += clock_->tick_delta(use_scaled_time_);
    }

    if (play_state_ == PlayState::UNPLAYED) {
        return start_value_;
    }
    if (play_state_ == PlayState::FINISHED) {
        return end_value_;
    }

    float t = (current_time() - start_time_) / duration_;

    if (t > 1.0f) {
        if (loop_ == Loop::NO_LOOP) {
            play_state_ = PlayState::FINISHED;
            return end_value_;
        }

        // Skip every overflowed cycle in one step. A duration below the
        // float spacing of start_time_ would never advance it one cycle at a time.
        const double elapsed = static_cast<double>(current_time()) - static_cast<double>(start_time_);
        const double cycles_done = elapsed / static_cast<double>(duration_);
        const double cycles = std::max(1.0, std::ceil(cycles_done - 1.0));
        start_time_ = static_cast<float>(static_cast<double>(start_time_) + cycles * static_cast<double>(duration_));
        t = static_cast<float>(std::clamp(cycles_done - cycles, 0.0, 1.0));

        switch (loop_) {
            case Loop::NO_LOOP:
            case Loop::RESET:
                break;

            case Loop::PING_PONG_ONCE:
                // Reverse this once, finish at the next overflow.
                loop_ = Loop::NO_LOOP;
                std::swap(start_value_, end_value_);
                break;

            case Loop::PING_PONG:
                if (std::fmod(cycles, 2.0) != 0.0) {
                    std::swap(start_value_, end_value_);
                }
                break;
        }
    }

    return value_at(t);
}

void Easing::begin(float start_value, float end_value, std::optional<float> duration) {
    play_state_  = PlayState::PLAYING;
    start_time_  = current_time();
    start_value_ = start_value;
    end_value_   = end_value;

    if (duration) set_duration(*duration);

    if (shape_ == Shape::NULL_SHAPE) {
        std::cerr << "[Easing] Easing shape not yet assigned!\n";
        last_issue_ = Issue::UNASSIGNED_SHAPE;
    }
}

void Easing::begin(std::optional<float> duration) {
    begin(0.0f, 1.0f, duration);
}

void Easing::reset() {
    play_state_ = PlayState::UNPLAYED;
    start_time_ = -std::numeric_limits<float>::infinity();
}

bool Easing::set_duration(float seconds) {
    if (!valid_duration(seconds)) {
        std::cerr << "[Easing] Ignoring invalid duration " << seconds << "\n";
        return false;
    }
    duration_ = seconds;
    return true;
}

float Easing::value_at(float t) {
    return lerp_unclamped(start_value_, end_value_, progress_at(t));
}

float Easing::progress_at(float t) {
    const CurveSample s = evaluate(shape_, t, curve_.get());
    record_issue(s.issue);
    return s.progress;
}

float Easing::time_factor() const {
    switch (play_state_) {
        case PlayState::UNPLAYED: return 0.0f;
        case PlayState::FINISHED: return 1.0f;
        case PlayState::PLAYING:  break;
    }
    return (current_time() - start_time_) / duration_;
}

float Easing::current_time() const {
    return clock_->current_time(use_scaled_time_);
}

void Easing::record_issue(Issue issue) {
    if (issue == last_issue_) {
        return;
    }
    last_issue_ = issue;
    switch (issue) {
        case Issue::NONE:
            break;
        case Issue::MISSING_CURVE:
            std::cerr << "[Easing] Easing's animation curve is null!\n";
            break;
        case Issue::UNASSIGNED_SHAPE:
            std::cerr << "[Easing] Easing shape not assigned, passing time through\n";
            break;
        case Issue::UNKNOWN_SHAPE:
            std::cerr << "[Easing] Easing not defined: " << static_cast<int>(shape_) << "\n";
            break;
    }
}

Easing::CurveSample Easing::evaluate(Shape shape, float t, const CustomCurve* curve) {
    float value = t;
    Issue issue = Issue::NONE;

    switch (shape) {
        case Shape::LINEAR:
            break;

        case Shape::START_VALUE:
            value = 0.0f;
            break;

        case Shape::END_VALUE:
            value = 1.0f;
            break;

        case Shape::CURVE:
            if (curve) {
                value = curve->evaluate(t);
            } else {
                issue = Issue::MISSING_CURVE;
            }
            break;

        case Shape::QUAD_IN:
            value = t * t;
            break;

        case Shape::QUAD_OUT:
            value = 1.0f - ((1.0f - t) * (1.0f - t));
            break;

        case Shape::QUAD_IN_OUT:
            if (t < 0.5f) {
                value = 2.0f * t * t;
            } else {
                value = 1.0f - (std::pow(-2.0f * t + 2.0f, 2.0f) / 2.0f);
            }
            break;

        case Shape::CUBIC_IN:
            value = t * t * t;
            break;

        case Shape::CUBIC_OUT:
            value = 1.0f - std::pow(1.0f - t, 3.0f);
            break;

        case Shape::CUBIC_IN_OUT:
            if (t < 0.5f) {
                value = 4.0f * t * t * t;
            } else {
                value = 1.0f - (std::pow(-2.0f * t + 2.0f, 3.0f) / 2.0f);
            }
            break;

        case Shape::TRIG_IN:
            value = 1.0f - std::cos(t * kPi / 2.0f);
            break;

        case Shape::TRIG_OUT:
            value = std::sin(t * kPi / 2.0f);
            break;

        case Shape::TRIG_IN_OUT:
            value = (std::cos(kPi * t) - 1.0f) / -2.0f;
            break;

        case Shape::EXPO_IN:
            if (t > 0.0f) {
                value = std::pow(2.0f, (10.0f * t) - 10.0f);
            }
            break;

        case Shape::EXPO_OUT:
            if (t < 1.0f) {
                value = 1.0f - std::pow(2.0f, -10.0f * t);
            }
            break;

        case Shape::EXPO_IN_OUT:
            if (t != 0.0f && t != 1.0f) {
                if (t < 0.5f) {
                    value = std::pow(2.0f, (20.0f * t) - 10.0f) / 2.0f;
                } else {
                    value = (2.0f - std::pow(2.0f, (-20.0f * t) + 10.0f)) / 2.0f;
                }
            }
            break;

        case Shape::BOUNCE_IN:
            value = 1.0f - bounce_out(1.0f - t);
            break;

        case Shape::BOUNCE_OUT:
            value = bounce_out(t);
            break;

        case Shape::BOUNCE_IN_OUT:
            if (t < 0.5f) {
                value = (1.0f - bounce_out(1.0f - (2.0f * t))) / 2.0f;
            } else {
                value = (1.0f + bounce_out((2.0f * t) - 1.0f)) / 2.0f;
            }
            break;

        case Shape::BACK_IN:
            value = (2.70158f * t * t * t) - (1.70158f * t * t);
            break;

        case Shape::BACK_OUT:
            value = 1.0f + (2.70158f * std::pow(t - 1.0f, 3.0f)) + (1.70158f * std::pow(t - 1.0f, 2.0f));
            break;

        case Shape::BACK_IN_OUT:
            if (t < 0.5f) {
                value = (std::pow(2.0f * t, 2.0f) * ((2.595f + 1.0f) * 2.0f * t - 2.595f)) / 2.0f;
            } else {
                value = (std::pow(2.0f * t - 2.0f, 2.0f) * ((2.595f + 1.0f) * (t * 2.0f - 2.0f) + 2.595f) + 2.0f) / 2.0f;
            }
            break;

        case Shape::ELASTIC_IN:
            if (t != 0.0f && t != 1.0f) {
                value = -std::pow(2.0f, 10.0f * t - 10.0f) * std::sin((t * 10.0f - 10.75f) * ((2.0f * kPi) / 3.0f));
            }
            break;

        case Shape::ELASTIC_OUT:
            if (t != 0.0f && t != 1.0f) {
                value = std::pow(2.0f, -10.0f * t) * std::sin((t * 10.0f - 0.75f) * ((2.0f * kPi) / 3.0f)) + 1.0f;
            }
            break;

        case Shape::ELASTIC_IN_OUT:
            if (t != 0.0f && t != 1.0f) {
                if (t < 0.5f) {
                    value = -(std::pow(2.0f, 20.0f * t - 10.0f) * std::sin((20.0f * t - 11.125f) * ((2.0f * kPi) / 4.5f))) / 2.0f;
                } else {
                    value = (std::pow(2.0f, -20.0f * t + 10.0f) * std::sin((20.0f * t - 11.125f) * ((2.0f * kPi) / 4.5f))) / 2.0f + 1.0f;
                }
            }
            break;

        case Shape::NULL_SHAPE:
            issue = Issue::UNASSIGNED_SHAPE;
            break;

        default:
            issue = Issue::UNKNOWN_SHAPE;
            break;
    }

    return {value, issue};
}
