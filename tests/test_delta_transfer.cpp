#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/core/DeltaTransfer.hpp"

using namespace shapemirror::core;

namespace {
    Mesh diamond(std::string name = "neutral") {
        return Mesh(std::move(name), {
            {-1.0f, 0.0f, 0.0f},
            {1.0f, 0.0f, 0.0f},
            {0.0f, 1.0f, 0.0f},
            {0.0f, -1.0f, 0.0f}
        });
    }

    Mesh sculpt(const Mesh& base, std::string name, Index vertex, const Position& position) {
        auto result = base.withName(std::move(name));
        result.setPosition(vertex, position);
        return result;
    }

    void requirePosition(const Position& actual, const Position& expected) {
        REQUIRE(actual[0] == Catch::Approx(expected[0]));
        REQUIRE(actual[1] == Catch::Approx(expected[1]));
        REQUIRE(actual[2] == Catch::Approx(expected[2]));
    }
}

TEST_CASE("Delta transfer end to end", "[transfer]") {
    const auto base = diamond();
    auto plane = resolveMirrorPlane(base, 2);
    REQUIRE(plane.has_value());
    REQUIRE(plane->offset == Catch::Approx(0.0f));

    const auto map = buildCorrespondence(base, *plane);
    const auto blend = sculpt(base, "brow_l_raise", 0, {-1.0f, 0.0f, 0.5f});

    auto result = transferDelta(base, blend, map, *plane, SideMarkers{});
    REQUIRE(result.has_value());

    const auto& mesh = result->mesh;
    REQUIRE(mesh.vertexCount() == 4);
    requirePosition(mesh.position(0), {-1.0f, 0.0f, 0.5f});
    requirePosition(mesh.position(1), {1.0f, 0.0f, 0.5f});
    requirePosition(mesh.position(2), {0.0f, 1.0f, 0.0f});
    requirePosition(mesh.position(3), {0.0f, -1.0f, 0.0f});

    REQUIRE(result->stats.sourceVertices == 1);
    REQUIRE(result->stats.targetVertices == 1);
    REQUIRE(result->stats.seamVertices == 2);
    REQUIRE(result->stats.sculptedVertices == 1);
    REQUIRE(result->stats.crossSideTargets == 0);
    REQUIRE(result->stats.maxDeltaLength == Catch::Approx(0.5));

    // 输出共享基础网格拓扑，名称沿用融合变形
    REQUIRE(mesh.sharedTopology() == base.sharedTopology());
    REQUIRE(mesh.name() == "brow_l_raise");
}

TEST_CASE("Delta transfer reflects the axis component", "[transfer]") {
    const auto base = diamond();
    const MirrorPlane plane{Axis::X, 0.0f};
    const auto map = buildCorrespondence(base, plane);

    SECTION("Left sculpt pushed outward moves the right vertex outward") {
        const auto blend = sculpt(base, "cheek_l_puff", 0, {-1.5f, 0.25f, 0.0f});
        auto result = transferDelta(base, blend, map, plane, SideTag::Left);
        REQUIRE(result.has_value());
        requirePosition(result->mesh.position(1), {1.5f, 0.25f, 0.0f});
    }

    SECTION("Right sculpt overwrites the left side") {
        const auto blend = sculpt(base, "cheek_r_puff", 1, {1.0f, 0.0f, -0.75f});
        auto result = transferDelta(base, blend, map, plane, SideTag::Right);
        REQUIRE(result.has_value());
        requirePosition(result->mesh.position(1), {1.0f, 0.0f, -0.75f});
        requirePosition(result->mesh.position(0), {-1.0f, 0.0f, -0.75f});
    }

    SECTION("Target side edits are discarded") {
        auto blend = sculpt(base, "brow_l_raise", 0, {-1.0f, 0.2f, 0.0f});
        blend.setPosition(1, {5.0f, 5.0f, 5.0f});
        auto result = transferDelta(base, blend, map, plane, SideTag::Left);
        REQUIRE(result.has_value());
        requirePosition(result->mesh.position(1), {1.0f, 0.2f, 0.0f});
    }

    SECTION("Offset plane does not leak into the delta") {
        const Mesh shifted("shifted", {
            {9.0f, 0.0f, 0.0f},
            {11.0f, 0.0f, 0.0f},
            {10.0f, 1.0f, 0.0f}
        });
        const MirrorPlane offsetPlane{Axis::X, 10.0f};
        const auto shiftedMap = buildCorrespondence(shifted, offsetPlane);
        const auto blend = sculpt(shifted, "jaw_l_open", 0, {8.5f, 0.0f, 0.0f});

        auto result = transferDelta(shifted, blend, shiftedMap, offsetPlane, SideTag::Left);
        REQUIRE(result.has_value());
        requirePosition(result->mesh.position(1), {11.5f, 0.0f, 0.0f});
    }
}

TEST_CASE("Delta transfer seam policy", "[transfer]") {
    const auto base = diamond();
    const MirrorPlane plane{Axis::X, 0.0f};
    const auto map = buildCorrespondence(base, plane);
    const auto blend = sculpt(base, "lip_l_up", 2, {0.3f, 1.2f, 0.1f});

    SECTION("Authoritative copies the sculpted seam position") {
        auto result = transferDelta(base, blend, map, plane, SideTag::Left);
        REQUIRE(result.has_value());
        requirePosition(result->mesh.position(2), {0.3f, 1.2f, 0.1f});
    }

    SECTION("Symmetrize removes the axis component") {
        TransferConfig config;
        config.seamPolicy = SeamPolicy::Symmetrize;
        auto result = transferDelta(base, blend, map, plane, SideTag::Left, config);
        REQUIRE(result.has_value());
        requirePosition(result->mesh.position(2), {0.0f, 1.2f, 0.1f});
    }
}

TEST_CASE("Delta transfer vertex roles", "[transfer]") {
    const auto base = diamond();
    const MirrorPlane plane{Axis::X, 0.0f};
    const auto map = buildCorrespondence(base, plane);

    REQUIRE(classifyVertex(0, base, plane, SideTag::Left) == VertexRole::Source);
    REQUIRE(classifyVertex(1, base, plane, SideTag::Left) == VertexRole::Target);
    REQUIRE(classifyVertex(2, base, plane, SideTag::Left) == VertexRole::Seam);
    REQUIRE(classifyVertex(0, base, plane, SideTag::Right) == VertexRole::Target);

    SECTION("Left on the positive half") {
        REQUIRE(sourceHalf(SideTag::Left, Half::Positive) == Half::Positive);
        TransferConfig config;
        config.leftHalf = Half::Positive;
        REQUIRE(classifyVertex(1, base, plane, SideTag::Left, config) == VertexRole::Source);

        const auto blend = sculpt(base, "brow_l_raise", 1, {1.0f, 0.4f, 0.0f});
        auto result = transferDelta(base, blend, map, plane, SideTag::Left, config);
        REQUIRE(result.has_value());
        requirePosition(result->mesh.position(0), {-1.0f, 0.4f, 0.0f});
    }
}

TEST_CASE("Delta transfer off-plane vertex mapped to itself", "[transfer]") {
    // 顶点 3 没有镜像对应，最近的候选是它自己，但它离平面 0.3
    const Mesh base("lopsided", {
        {-1.0f, 0.0f, 0.0f},
        {1.0f, 0.0f, 0.0f},
        {0.0f, 1.0f, 0.0f},
        {-0.3f, 5.0f, 0.0f}
    });
    auto plane = resolveMirrorPlane(base, 2);
    REQUIRE(plane.has_value());

    const auto map = buildCorrespondence(base, *plane);
    REQUIRE(map[3] == 3);
    REQUIRE(classifyVertex(3, base, *plane, SideTag::Left) == VertexRole::Source);
    REQUIRE(classifyVertex(3, base, *plane, SideTag::Right) == VertexRole::Target);

    SECTION("Source side keeps its sculpt under symmetrize") {
        const auto blend = sculpt(base, "cheek_l_puff", 3, {-0.1f, 5.0f, 0.0f});
        TransferConfig config;
        config.seamPolicy = SeamPolicy::Symmetrize;

        auto result = transferDelta(base, blend, map, *plane, SideTag::Left, config);
        REQUIRE(result.has_value());
        requirePosition(result->mesh.position(3), {-0.1f, 5.0f, 0.0f});
        REQUIRE(result->stats.sourceVertices == 2);
        REQUIRE(result->stats.seamVertices == 1);
    }

    SECTION("Target side takes its own reflected delta") {
        const auto blend = sculpt(base, "cheek_r_puff", 3, {-0.1f, 5.0f, 0.0f});

        auto result = transferDelta(base, blend, map, *plane, SideTag::Right);
        REQUIRE(result.has_value());
        requirePosition(result->mesh.position(3), {-0.5f, 5.0f, 0.0f});
        REQUIRE(result->stats.targetVertices == 2);
        REQUIRE(result->stats.crossSideTargets == 1);
    }

    SECTION("Looser seam epsilon turns it into a seam vertex") {
        TransferConfig config;
        config.seamEpsilon = 1.0f;
        REQUIRE(classifyVertex(3, base, *plane, SideTag::Right, config) == VertexRole::Seam);
    }
}

TEST_CASE("Delta transfer errors", "[transfer]") {
    const auto base = diamond();
    const MirrorPlane plane{Axis::X, 0.0f};
    const auto map = buildCorrespondence(base, plane);

    SECTION("Vertex count mismatch") {
        const Mesh blend("brow_l_raise", {{0.0f, 0.0f, 0.0f}});
        auto result = transferDelta(base, blend, map, plane, SideTag::Left);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error() == MirrorError::TopologyMismatch);
    }

    SECTION("Map built for another mesh") {
        const CorrespondenceMap shortMap{std::vector<Index>{1, 0}};
        auto result = transferDelta(base, base.withName("brow_l_raise"), shortMap, plane, SideTag::Left);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error() == MirrorError::TopologyMismatch);
    }

    SECTION("Map pointing outside the mesh") {
        const CorrespondenceMap badMap{std::vector<Index>{1, 0, 2, 9}};
        auto result = transferDelta(base, base.withName("brow_l_raise"), badMap, plane, SideTag::Left);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error() == MirrorError::TopologyMismatch);
    }

    SECTION("Name without a side marker") {
        auto result = transferDelta(base, base.withName("jaw_open"), map, plane, SideMarkers{});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error() == MirrorError::MissingSideTag);
    }
}

TEST_CASE("Delta transfer is deterministic and leaves inputs untouched", "[transfer]") {
    const auto base = diamond();
    const MirrorPlane plane{Axis::X, 0.0f};
    const auto map = buildCorrespondence(base, plane);
    const auto blend = sculpt(base, "brow_l_raise", 0, {-1.0f, 0.3f, 0.2f});
    const auto basePositions = base.positions();
    const auto blendPositions = blend.positions();

    auto first = transferDelta(base, blend, map, plane, SideTag::Left);
    auto second = transferDelta(base, blend, map, plane, SideTag::Left);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(first->mesh.positions() == second->mesh.positions());

    REQUIRE(base.positions() == basePositions);
    REQUIRE(blend.positions() == blendPositions);

    SECTION("Unsculpted blendshape reproduces the base") {
        auto identity = transferDelta(base, base.withName("brow_l_raise"), map, plane, SideTag::Left);
        REQUIRE(identity.has_value());
        REQUIRE(identity->mesh.positions() == base.positions());
        REQUIRE(identity->stats.sculptedVertices == 0);
    }
}
