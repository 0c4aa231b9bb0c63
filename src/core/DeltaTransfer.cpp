#include "core/DeltaTransfer.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace shapemirror::core {

namespace {
    Position subtract(const Position& a, const Position& b) noexcept {
        return {a[0] - b[0], a[1] - b[1], a[2] - b[2]};
    }

    Position add(const Position& a, const Position& b) noexcept {
        return {a[0] + b[0], a[1] + b[1], a[2] + b[2]};
    }

    double length(const Position& v) noexcept {
        return std::sqrt(static_cast<double>(v[0]) * v[0] +
                         static_cast<double>(v[1]) * v[1] +
                         static_cast<double>(v[2]) * v[2]);
    }
}

VertexRole classifyVertex(Index vertex, const Mesh& base, const MirrorPlane& plane,
                          SideTag side, const TransferConfig& config) {
    const auto& p = base.position(vertex);

    // 只有镜像点与自身重合的顶点才是接缝；远离平面而映射到自身的顶点仍按半空间归类
    const auto half = plane.halfOf(p);
    if (!half || distance(plane.reflectPoint(p), p) < config.seamEpsilon) {
        return VertexRole::Seam;
    }

    return *half == sourceHalf(side, config.leftHalf) ? VertexRole::Source : VertexRole::Target;
}

std::expected<TransferResult, MirrorError>
transferDelta(const Mesh& base, const Mesh& blendshape, const CorrespondenceMap& map,
              const MirrorPlane& plane, SideTag side, const TransferConfig& config) {
    if (blendshape.vertexCount() != base.vertexCount()) {
        spdlog::debug("Blendshape '{}' has {} vertices, base '{}' has {}",
                      blendshape.name(), blendshape.vertexCount(), base.name(), base.vertexCount());
        return std::unexpected(MirrorError::TopologyMismatch);
    }
    if (map.size() != base.vertexCount()) {
        spdlog::debug("Correspondence covers {} vertices, base '{}' has {}",
                      map.size(), base.name(), base.vertexCount());
        return std::unexpected(MirrorError::TopologyMismatch);
    }
    const auto& targets = map.targets();
    if (std::any_of(targets.begin(), targets.end(),
                    [&base](Index u) { return !base.contains(u); })) {
        spdlog::debug("Correspondence references vertices outside base '{}'", base.name());
        return std::unexpected(MirrorError::TopologyMismatch);
    }

    const auto axis = axisIndex(plane.axis);
    const auto vertexCount = static_cast<Index>(base.vertexCount());

    std::vector<VertexRole> roles(vertexCount);
    for (Index v = 0; v < vertexCount; ++v) {
        roles[v] = classifyVertex(v, base, plane, side, config);
    }

    TransferStats stats;
    Mesh::Positions output(vertexCount);

    for (Index v = 0; v < vertexCount; ++v) {
        switch (roles[v]) {
            case VertexRole::Source: {
                const auto delta = subtract(blendshape.position(v), base.position(v));
                output[v] = blendshape.position(v);
                ++stats.sourceVertices;
                if (length(delta) > 0.0) {
                    ++stats.sculptedVertices;
                    stats.maxDeltaLength = std::max(stats.maxDeltaLength, length(delta));
                }
                break;
            }
            case VertexRole::Seam: {
                auto delta = subtract(blendshape.position(v), base.position(v));
                if (config.seamPolicy == SeamPolicy::Symmetrize) {
                    delta[axis] = 0.0f;
                    output[v] = add(base.position(v), delta);
                } else {
                    output[v] = blendshape.position(v);
                }
                ++stats.seamVertices;
                if (length(delta) > 0.0) {
                    ++stats.sculptedVertices;
                    stats.maxDeltaLength = std::max(stats.maxDeltaLength, length(delta));
                }
                break;
            }
            case VertexRole::Target: {
                const auto u = map[v];
                if (roles[u] != VertexRole::Source) {
                    ++stats.crossSideTargets;
                }
                const auto delta = subtract(blendshape.position(u), base.position(u));
                output[v] = add(base.position(v), plane.reflectDelta(delta));
                ++stats.targetVertices;
                break;
            }
        }
    }

    if (stats.crossSideTargets > 0) {
        spdlog::warn("{} target vertices of '{}' map to a non-source vertex; mesh may not be symmetric about the seam",
                     stats.crossSideTargets, blendshape.name());
    }

    // 输出沿用基础网格的拓扑与融合变形的名称
    auto mirrored = base.withName(blendshape.name()).withPositions(std::move(output));
    if (!mirrored) {
        return std::unexpected(mirrored.error());
    }

    return TransferResult{std::move(*mirrored), stats};
}

std::expected<TransferResult, MirrorError>
transferDelta(const Mesh& base, const Mesh& blendshape, const CorrespondenceMap& map,
              const MirrorPlane& plane, const SideMarkers& markers, const TransferConfig& config) {
    auto side = resolveSideTag(blendshape.name(), markers);
    if (!side) {
        spdlog::debug("No side marker ('{}' / '{}') in blendshape name '{}'",
                      markers.left, markers.right, blendshape.name());
        return std::unexpected(side.error());
    }
    return transferDelta(base, blendshape, map, plane, *side, config);
}

} // namespace shapemirror::core
