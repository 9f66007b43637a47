#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

#include "animation/keyframe_curve.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <limits>

TEST_CASE("Empty and single key curves") {
    KeyframeCurve curve;
    CHECK(curve.empty());
    CHECK(curve.evaluate(0.5f) == 0.0f);

    curve.add_key(0.3f, 7.0f);
    CHECK(curve.evaluate(-1.0f) == 7.0f);
    CHECK(curve.evaluate(0.3f) == 7.0f);
    CHECK(curve.evaluate(5.0f) == 7.0f);
}

TEST_CASE("Keys are sorted and interpolated") {
    KeyframeCurve curve;
    curve.add_key(1.0f, 1.0f);
    curve.add_key(0.0f, 0.0f);
    curve.add_key(0.5f, 2.0f);
    REQUIRE(curve.keys().size() == 3);
    CHECK(curve.keys()[0].time == 0.0f);
    CHECK(curve.keys()[1].time == 0.5f);
    CHECK(curve.keys()[2].time == 1.0f);

    CHECK(curve.evaluate(0.25f) == doctest::Approx(1.0f));
    CHECK(curve.evaluate(0.5f) == doctest::Approx(2.0f));
    CHECK(curve.evaluate(0.75f) == doctest::Approx(1.5f));
    CHECK(curve.evaluate(-0.5f) == 0.0f);
    CHECK(curve.evaluate(1.5f) == 1.0f);
    CHECK(curve.evaluate(std::numeric_limits<float>::quiet_NaN()) == 0.0f);

    curve.add_key(0.5f, -1.0f);
    CHECK(curve.keys().size() == 3);
    CHECK(curve.evaluate(0.5f) == doctest::Approx(-1.0f));
}

TEST_CASE("Linear curve is the identity on [0, 1]") {
    const KeyframeCurve curve = KeyframeCurve::linear();
    for (float t : {0.0f, 0.2f, 0.5f, 0.9f, 1.0f}) {
        CHECK(curve.evaluate(t) == doctest::Approx(t));
    }
}

TEST_CASE("Curves load from JSON arrays and objects") {
    const auto from_array = KeyframeCurve::from_json(nlohmann::json::parse("[[0, 0], [1, 4]]"));
    CHECK(from_array.evaluate(0.5f) == doctest::Approx(2.0f));

    const auto from_object = KeyframeCurve::from_json(nlohmann::json::parse(R"({"keys": [[1, 1], [0, 3]]})"));
    REQUIRE(from_object.keys().size() == 2);
    CHECK(from_object.keys().front().time == 0.0f);
    CHECK(from_object.evaluate(0.5f) == doctest::Approx(2.0f));

    const auto skipped = KeyframeCurve::from_json(nlohmann::json::parse(R"([[0, 0], [0.5], "x", [0.5, "y"], [1, 1]])"));
    CHECK(skipped.keys().size() == 2);

    CHECK(KeyframeCurve::from_json(nlohmann::json::parse(R"({"points": []})")).empty());
    CHECK(KeyframeCurve::from_json(nlohmann::json(3)).empty());
}
