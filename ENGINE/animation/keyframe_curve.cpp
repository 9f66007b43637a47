#include "keyframe_curve.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>

KeyframeCurve::KeyframeCurve(std::vector<Key> keys) {
    for (const auto& k : keys) {
        add_key(k.time, k.value);
    }
}

KeyframeCurve KeyframeCurve::linear() {
    return KeyframeCurve({{0.0f, 0.0f}, {1.0f, 1.0f}});
}

KeyframeCurve KeyframeCurve::from_json(const nlohmann::json& data) {
    KeyframeCurve curve;
    const nlohmann::json* keys = &data;
    if (data.is_object()) {
        const auto it = data.find("keys");
        if (it == data.end()) {
            std::cerr << "[KeyframeCurve] Curve object has no 'keys'\n";
            return curve;
        }
        keys = &(*it);
    }
    if (!keys->is_array()) {
        std::cerr << "[KeyframeCurve] Curve keys must be an array\n";
        return curve;
    }
    for (const auto& entry : *keys) {
        if (!entry.is_array() || entry.size() != 2 ||
            !entry[0].is_number() || !entry[1].is_number()) {
            std::cerr << "[KeyframeCurve] Skipping malformed key " << entry.dump() << "\n";
            continue;
        }
        const float time  = entry[0].get<float>();
        const float value = entry[1].get<float>();
        if (!std::isfinite(time) || !std::isfinite(value)) {
            std::cerr << "[KeyframeCurve] Skipping non-finite key " << entry.dump() << "\n";
            continue;
        }
        curve.add_key(time, value);
    }
    return curve;
}

void KeyframeCurve::add_key(float time, float value) {
    auto it = std::lower_bound(keys_.begin(), keys_.end(), time,
                               [](const Key& k, float t) { return k.time < t; });
    if (it != keys_.end() && it->time == time) {
        it->value = value;
        return;
    }
    keys_.insert(it, Key{time, value});
}

float KeyframeCurve::evaluate(float t) const {
    if (keys_.empty()) return 0.0f;
    if (std::isnan(t) || t <= keys_.front().time) return keys_.front().value;
    if (t >= keys_.back().time) return keys_.back().value;

    auto hi = std::upper_bound(keys_.begin(), keys_.end(), t,
                               [](float v, const Key& k) { return v < k.time; });
    auto lo = hi - 1;
    const float span = hi->time - lo->time;
    const float f = (t - lo->time) / span;
    return lo->value + (hi->value - lo->value) * f;
}
