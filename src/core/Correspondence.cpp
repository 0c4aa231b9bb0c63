#include "core/Correspondence.hpp"
#include "core/Geometry.hpp"
#include <algorithm>
#include <execution>
#include <memory>
#include <numeric>
#include <spdlog/spdlog.h>

namespace shapemirror::core {

namespace {
    Index pickCandidate(const std::vector<Neighbor>& candidates, TieBreak tieBreak, Index fallback) {
        if (candidates.empty()) {
            return fallback;
        }
        // 候选已按索引升序
        return tieBreak == TieBreak::LowestIndex ? candidates.front().index : candidates.back().index;
    }

    template<typename Search>
    Index resolveVertex(const Mesh& base, const MirrorPlane& plane, Index vertex,
                        const CorrespondenceConfig& config, const Search& search) {
        const auto& p = base.position(vertex);
        const auto mirrored = plane.reflectPoint(p);

        // 接缝顶点
        if (distance(mirrored, p) < config.seamEpsilon) {
            return vertex;
        }

        return pickCandidate(search(mirrored), config.tieBreak, vertex);
    }
}

CorrespondenceMap
buildCorrespondence(const Mesh& base, const MirrorPlane& plane, const CorrespondenceConfig& config) {
    const auto& positions = base.positions();
    std::vector<Index> targets(positions.size());

    if (positions.empty()) {
        return CorrespondenceMap{std::move(targets)};
    }

    std::vector<Index> vertices(positions.size());
    std::iota(vertices.begin(), vertices.end(), Index{0});

    std::unique_ptr<VertexGrid> grid;
    if (config.searchMethod == SearchMethod::Grid) {
        grid = std::make_unique<VertexGrid>(positions);
        const auto& dims = grid->dimensions();
        spdlog::debug("Vertex grid {}x{}x{} for {} vertices", dims[0], dims[1], dims[2], positions.size());
    }

    const double tolerance = config.tieTolerance;
    auto search = [&](const Position& query) {
        return grid ? grid->nearestWithin(query, tolerance)
                    : nearestWithinBruteForce(positions, query, tolerance);
    };

    // 每个顶点的查询相互独立，只读访问基础网格
    auto resolve = [&](Index vertex) {
        targets[vertex] = resolveVertex(base, plane, vertex, config, search);
    };

    if (config.enableParallelProcessing) {
        std::for_each(std::execution::par, vertices.begin(), vertices.end(), resolve);
    } else {
        std::for_each(vertices.begin(), vertices.end(), resolve);
    }

    return CorrespondenceMap{std::move(targets)};
}

Index findMirrorVertex(const Mesh& base, const MirrorPlane& plane, Index vertex,
                       const CorrespondenceConfig& config) {
    // 单次查询不值得建网格，结果与网格搜索一致
    return resolveVertex(base, plane, vertex, config, [&](const Position& query) {
        return nearestWithinBruteForce(base.positions(), query, config.tieTolerance);
    });
}

CorrespondenceStats
computeCorrespondenceStats(const Mesh& base, const MirrorPlane& plane, const CorrespondenceMap& map) noexcept {
    CorrespondenceStats stats;
    stats.vertexCount = map.size();

    if (map.empty() || map.size() != base.vertexCount()) {
        return stats;
    }

    double totalDistance = 0.0;
    for (Index v = 0; v < map.size(); ++v) {
        const auto u = map[v];
        if (u >= map.size()) {
            ++stats.asymmetricVertices;
            continue;
        }
        if (u == v) {
            ++stats.seamVertices;
        } else if (map[u] == v) {
            ++stats.pairedVertices;
        }
        if (map[u] != v) {
            ++stats.asymmetricVertices;
        }

        const double d = distance(plane.reflectPoint(base.position(v)), base.position(u));
        stats.maxMirrorDistance = std::max(stats.maxMirrorDistance, d);
        totalDistance += d;
    }

    stats.meanMirrorDistance = totalDistance / static_cast<double>(map.size());

    const auto meshStats = computeStats(base);
    if (meshStats.diagonal > 0.0) {
        stats.symmetryResidual = stats.meanMirrorDistance / meshStats.diagonal;
    }

    return stats;
}

bool isInvolution(const CorrespondenceMap& map) noexcept {
    const auto& targets = map.targets();
    for (size_t v = 0; v < targets.size(); ++v) {
        const auto u = targets[v];
        if (u >= targets.size() || targets[u] != v) {
            return false;
        }
    }
    return true;
}

} // namespace shapemirror::core
