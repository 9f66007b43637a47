#pragma once

#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <nlohmann/json_fwd.hpp>

class TimeSource;
class CustomCurve;

/*
  Easing
  ------
  Interpolates one value over time using a named curve shape
  (see https://easings.net/ for the families).

  Create it with a shape, call begin() once, then sample() once per frame.
  Before begin() it returns the start value, after the transition finishes
  it keeps returning the end value. Looping modes restart or reverse the
  transition when it runs past its duration; PING_PONG swaps the stored
  start and end values each time it turns around.

  The clock must outlive the easing.
*/
class Easing {
public:
    enum class Shape : int {
        NULL_SHAPE = -1,
        LINEAR,         // t
        START_VALUE,    // 0
        END_VALUE,      // 1
        CURVE,          // supplied CustomCurve

        QUAD_IN,
        QUAD_OUT,
        QUAD_IN_OUT,

        CUBIC_IN,
        CUBIC_OUT,
        CUBIC_IN_OUT,

        TRIG_IN,        // 1 - cos(t * pi / 2)
        TRIG_OUT,       // sin(t * pi / 2)
        TRIG_IN_OUT,    // (cos(t * pi) - 1) / -2

        EXPO_IN,
        EXPO_OUT,
        EXPO_IN_OUT,

        BOUNCE_IN,
        BOUNCE_OUT,
        BOUNCE_IN_OUT,

        BACK_IN,        // winds up below 0
        BACK_OUT,       // overshoots past 1
        BACK_IN_OUT,

        ELASTIC_IN,
        ELASTIC_OUT,
        ELASTIC_IN_OUT,

        COUNT
    };

    enum class Loop {
        NO_LOOP = 0,
        RESET,
        PING_PONG,
        PING_PONG_ONCE,
    };

    enum class PlayState {
        UNPLAYED = 0,   // sample() == start value
        PLAYING,        // sample() == curve value
        FINISHED,       // sample() == end value
    };

    // Recoverable problems. The easing keeps running with t passed through.
    enum class Issue {
        NONE = 0,
        MISSING_CURVE,
        UNASSIGNED_SHAPE,
        UNKNOWN_SHAPE,
    };

    struct CurveSample {
        float progress;
        Issue issue;
    };

    struct Config {
        Shape shape = Shape::NULL_SHAPE;
        Loop  loop  = Loop::NO_LOOP;
        std::optional<float> duration;
        bool  use_scaled_time = true;
        std::shared_ptr<const CustomCurve> curve;
    };

    Easing(const TimeSource& clock, Shape shape, Loop loop = Loop::NO_LOOP,
           std::optional<float> duration = std::nullopt);
    Easing(const TimeSource& clock, std::shared_ptr<const CustomCurve> curve,
           Loop loop = Loop::NO_LOOP, std::optional<float> duration = std::nullopt);
    explicit Easing(const TimeSource& clock, const Config& config);

    // {"shape": "QUAD_IN", "loop": "PING_PONG", "duration": 0.5,
    //  "scaled_time": true, "curve": [[0, 0], [1, 1]]}
    static Config config_from_json(const nlohmann::json& data);
    static Easing from_json(const TimeSource& clock, const nlohmann::json& data);

    // Current value. Call once per frame: pausing offsets by the frame delta.
    float sample();

    void begin(float start_value, float end_value, std::optional<float> duration = std::nullopt);
    // Runs 0 -> 1, for callers that apply the factor themselves.
    void begin(std::optional<float> duration = std::nullopt);
    void reset();

    // Curve value at t mapped onto [start, end], unclamped.
    float value_at(float t);
    // Raw curve value at t for this easing's shape.
    float progress_at(float t);

    // Unclamped (now - start) / duration while playing; 0 before, 1 after.
    float time_factor() const;

    static CurveSample evaluate(Shape shape, float t, const CustomCurve* curve);

    PlayState play_state() const { return play_state_; }
    bool is_playing() const { return play_state_ == PlayState::PLAYING; }
    bool is_finished() const { return play_state_ == PlayState::FINISHED; }
    Issue last_issue() const { return last_issue_; }

    Shape shape() const { return shape_; }
    void  set_shape(Shape shape) { shape_ = shape; }
    Loop  loop() const { return loop_; }
    void  set_loop(Loop loop) { loop_ = loop; }
    const std::shared_ptr<const CustomCurve>& curve() const { return curve_; }
    void  set_curve(std::shared_ptr<const CustomCurve> curve) { curve_ = std::move(curve); }

    bool  uses_scaled_time() const { return use_scaled_time_; }
    void  set_use_scaled_time(bool scaled) { use_scaled_time_ = scaled; }
    bool  paused() const { return paused_; }
    void  set_paused(bool paused) { paused_ = paused; }

    float duration() const { return duration_; }
    bool  set_duration(float seconds);
    float start_value() const { return start_value_; }
    float end_value() const { return end_value_; }
    void  set_start_value(float v) { start_value_ = v; }
    void  set_end_value(float v) { end_value_ = v; }
    float start_time() const { return start_time_; }

private:
    float current_time() const;
    void  record_issue(Issue issue);

    const TimeSource* clock_ = nullptr;

    Shape shape_ = Shape::NULL_SHAPE;
    Loop  loop_  = Loop::NO_LOOP;
    std::shared_ptr<const CustomCurve> curve_;
    bool  use_scaled_time_ = true;
    bool  paused_ = false;

    PlayState play_state_ = PlayState::UNPLAYED;
    Issue     last_issue_ = Issue::NONE;

    float start_time_  = -std::numeric_limits<float>::infinity();
    float duration_    = 1.0f;
    float start_value_ = 0.0f;
    float end_value_   = 1.0f;
};

const char* to_string(Easing::Shape shape);
const char* to_string(Easing::Loop loop);
const char* to_string(Easing::PlayState state);
const char* to_string(Easing::Issue issue);
std::optional<Easing::Shape> easing_shape_from_string(const std::string& name);
std::optional<Easing::Loop> easing_loop_from_string(const std::string& name);
