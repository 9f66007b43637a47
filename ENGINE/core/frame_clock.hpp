#pragma once

#include <SDL.h>
#include <nlohmann/json_fwd.hpp>

/*
  TimeSource
  ----------
  Read-only view of the engine clock. "scaled" time follows the game's time
  scale (slow motion, pause menus), unscaled time follows the wall clock.
  Both are seconds since the clock started.
*/
class TimeSource {
public:
    virtual ~TimeSource() = default;

    virtual float current_time(bool scaled) const = 0;
    virtual float tick_delta(bool scaled) const = 0;
};

class FrameClock : public TimeSource {
public:
    struct Config {
        float time_scale = 1.0f;
        float max_delta  = 0.25f;
    };

    FrameClock();
    explicit FrameClock(const Config& config);

    static Config config_from_json(const nlohmann::json& data);

    // Call once per frame, before anything samples the clock.
    void tick();

    float current_time(bool scaled) const override;
    float tick_delta(bool scaled) const override;

    bool  set_time_scale(float scale);
    float time_scale() const { return time_scale_; }

    // Non-positive disables the cap.
    void  set_max_delta(float seconds) { max_delta_ = seconds; }
    float max_delta() const { return max_delta_; }

    Uint64 frame_count() const { return frame_count_; }

protected:
    // Seconds since construction on SDL's high resolution counter.
    virtual double read_seconds() const;

    // Advances both clocks by an already measured unscaled delta.
    void advance(double unscaled_delta);

private:
    Uint64 counter_origin_ = 0;
    Uint64 counter_freq_   = 1;

    double last_read_       = 0.0;
    double unscaled_time_   = 0.0;
    double scaled_time_     = 0.0;
    float  unscaled_delta_  = 0.0f;
    float  scaled_delta_    = 0.0f;

    float  time_scale_ = 1.0f;
    float  max_delta_  = 0.25f;
    Uint64 frame_count_ = 0;
};
