#pragma once

#include <vector>
#include <nlohmann/json_fwd.hpp>

// Authored curve sampled by Easing::CURVE.
class CustomCurve {
public:
    virtual ~CustomCurve() = default;
    virtual float evaluate(float t) const = 0;
};

/*
  KeyframeCurve
  -------------
  Piecewise linear curve through (time, value) keys, held sorted by time.
  Outside the keyed range the nearest end value is held.

  JSON: [[0, 0], [0.5, 1.2], [1, 1]] or {"keys": [[t, v], ...]}
*/
class KeyframeCurve : public CustomCurve {
public:
    struct Key {
        float time;
        float value;
    };

    KeyframeCurve() = default;
    explicit KeyframeCurve(std::vector<Key> keys);

    static KeyframeCurve linear();
    static KeyframeCurve from_json(const nlohmann::json& data);

    // Replaces an existing key at the same time.
    void add_key(float time, float value);
    void clear() { keys_.clear(); }

    const std::vector<Key>& keys() const { return keys_; }
    bool empty() const { return keys_.empty(); }

    float evaluate(float t) const override;

private:
    std::vector<Key> keys_;
};
