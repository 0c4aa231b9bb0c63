#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/core/MirrorPlane.hpp"

using namespace shapemirror::core;

TEST_CASE("Mirror plane reflection", "[plane]") {
    SECTION("Reflect point about X = 0") {
        MirrorPlane plane{Axis::X, 0.0f};
        auto p = plane.reflectPoint({-1.0f, 2.0f, 3.0f});
        REQUIRE(p[0] == Catch::Approx(1.0f));
        REQUIRE(p[1] == Catch::Approx(2.0f));
        REQUIRE(p[2] == Catch::Approx(3.0f));
    }

    SECTION("Reflect point about an offset plane") {
        MirrorPlane plane{Axis::Y, 2.0f};
        auto p = plane.reflectPoint({0.0f, 5.0f, 0.0f});
        REQUIRE(p[1] == Catch::Approx(-1.0f));
        REQUIRE(plane.reflectPoint(p)[1] == Catch::Approx(5.0f));
    }

    SECTION("Delta reflection has no offset term") {
        MirrorPlane plane{Axis::Z, 10.0f};
        auto d = plane.reflectDelta({0.5f, 0.25f, 1.0f});
        REQUIRE(d[0] == Catch::Approx(0.5f));
        REQUIRE(d[1] == Catch::Approx(0.25f));
        REQUIRE(d[2] == Catch::Approx(-1.0f));
    }

    SECTION("Half spaces") {
        MirrorPlane plane{Axis::X, 1.0f};
        REQUIRE(plane.halfOf({0.0f, 0.0f, 0.0f}) == Half::Negative);
        REQUIRE(plane.halfOf({2.0f, 0.0f, 0.0f}) == Half::Positive);
        REQUIRE_FALSE(plane.halfOf({1.0f, 7.0f, 0.0f}).has_value());
        REQUIRE(plane.signedDistance({3.0f, 0.0f, 0.0f}) == Catch::Approx(2.0f));
    }
}

TEST_CASE("Mirror plane resolution", "[plane]") {
    const Mesh base("neutral", {
        {-1.0f, 0.0f, 0.0f},
        {1.0f, 0.0f, 0.0f},
        {0.25f, 1.0f, -3.0f}
    });

    SECTION("Offset is the seam coordinate on the configured axis") {
        auto plane = resolveMirrorPlane(base, 2);
        REQUIRE(plane.has_value());
        REQUIRE(plane->axis == Axis::X);
        REQUIRE(plane->offset == Catch::Approx(0.25f));

        auto planeZ = resolveMirrorPlane(base, 2, Axis::Z);
        REQUIRE(planeZ.has_value());
        REQUIRE(planeZ->axis == Axis::Z);
        REQUIRE(planeZ->offset == Catch::Approx(-3.0f));
    }

    SECTION("Off-centre seam is accepted without validation") {
        auto plane = resolveMirrorPlane(base, 0);
        REQUIRE(plane.has_value());
        REQUIRE(plane->offset == Catch::Approx(-1.0f));
    }

    SECTION("Missing selection") {
        auto plane = resolveMirrorPlane(base, std::nullopt);
        REQUIRE_FALSE(plane.has_value());
        REQUIRE(plane.error() == MirrorError::InvalidSelection);
    }

    SECTION("Out of range selection") {
        auto plane = resolveMirrorPlane(base, 3);
        REQUIRE_FALSE(plane.has_value());
        REQUIRE(plane.error() == MirrorError::InvalidSelection);
    }

    SECTION("Empty mesh") {
        auto plane = resolveMirrorPlane(Mesh{}, 0);
        REQUIRE_FALSE(plane.has_value());
        REQUIRE(plane.error() == MirrorError::InvalidSelection);
    }
}
