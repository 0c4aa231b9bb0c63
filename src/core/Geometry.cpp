#include "core/Geometry.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace shapemirror::core {

namespace {
    // 只保留距离不超过 (最近距离 + tolerance) 的候选，按索引升序
    std::vector<Neighbor> filterCandidates(std::vector<Neighbor> visited, double tolerance) {
        if (visited.empty()) {
            return visited;
        }

        const auto nearest = std::min_element(visited.begin(), visited.end(),
            [](const Neighbor& a, const Neighbor& b) { return a.distance < b.distance; });
        const double limit = nearest->distance + tolerance;

        std::erase_if(visited, [limit](const Neighbor& n) { return n.distance > limit; });
        std::sort(visited.begin(), visited.end(),
                  [](const Neighbor& a, const Neighbor& b) { return a.index < b.index; });
        return visited;
    }
}

BoundingBox computeBoundingBox(const std::vector<Position>& positions) noexcept {
    if (positions.empty()) {
        return BoundingBox{};
    }

    BoundingBox bbox{positions[0], positions[0]};
    for (const auto& pos : positions) {
        for (size_t i = 0; i < 3; ++i) {
            bbox.min[i] = std::min(bbox.min[i], pos[i]);
            bbox.max[i] = std::max(bbox.max[i], pos[i]);
        }
    }
    return bbox;
}

VertexGrid::VertexGrid(const std::vector<Position>& positions, const GridConfig& config)
    : positions_(positions), bounds_(computeBoundingBox(positions)) {
    const auto extent = bounds_.size();

    // 按非退化轴的体积估算立方单元边长
    const double targetCells = std::max(1.0,
        static_cast<double>(positions.size()) / std::max(config.targetPointsPerCell, 1.0));
    double volume = 1.0;
    int activeAxes = 0;
    for (size_t i = 0; i < 3; ++i) {
        if (extent[i] > 0.0f) {
            volume *= extent[i];
            ++activeAxes;
        }
    }
    const double edge = activeAxes > 0
        ? std::pow(volume / targetCells, 1.0 / activeAxes)
        : 1.0;

    for (size_t i = 0; i < 3; ++i) {
        if (extent[i] > 0.0f && edge > 0.0) {
            const double cells = std::ceil(extent[i] / edge);
            dims_[i] = static_cast<int>(std::clamp(cells, 1.0, static_cast<double>(config.maxCellsPerAxis)));
            cellSize_[i] = static_cast<double>(extent[i]) / dims_[i];
        } else {
            dims_[i] = 1;
            cellSize_[i] = 1.0;
        }
    }

    const double diagonal = distance(bounds_.min, bounds_.max);
    slack_ = 1e-7 * (diagonal + 1.0);

    // 计数排序构建 CSR，单元内顶点保持索引升序
    const size_t totalCells = static_cast<size_t>(dims_[0]) * dims_[1] * dims_[2];
    cellStart_.assign(totalCells + 1, 0);

    std::vector<size_t> owner(positions.size());
    for (size_t v = 0; v < positions.size(); ++v) {
        const auto c = cellOf(positions[v]);
        owner[v] = cellId(c[0], c[1], c[2]);
        ++cellStart_[owner[v] + 1];
    }
    for (size_t c = 0; c < totalCells; ++c) {
        cellStart_[c + 1] += cellStart_[c];
    }

    cellItems_.resize(positions.size());
    std::vector<uint32_t> cursor(cellStart_.begin(), cellStart_.end() - 1);
    for (size_t v = 0; v < positions.size(); ++v) {
        cellItems_[cursor[owner[v]]++] = static_cast<Index>(v);
    }
}

std::array<int, 3> VertexGrid::cellOf(const Position& point) const noexcept {
    std::array<int, 3> cell{0, 0, 0};
    for (size_t i = 0; i < 3; ++i) {
        const double t = (static_cast<double>(point[i]) - bounds_.min[i]) / cellSize_[i];
        const double clamped = std::clamp(std::floor(t), 0.0, static_cast<double>(dims_[i] - 1));
        cell[i] = static_cast<int>(clamped);
    }
    return cell;
}

std::vector<Neighbor> VertexGrid::nearestWithin(const Position& query, double tolerance) const {
    std::vector<Neighbor> visited;
    if (positions_.empty()) {
        return visited;
    }

    const auto origin = cellOf(query);
    double best = std::numeric_limits<double>::infinity();

    for (int r = 0;; ++r) {
        // 访问切比雪夫距离恰为 r 的单元
        for (int z = std::max(origin[2] - r, 0); z <= std::min(origin[2] + r, dims_[2] - 1); ++z) {
            for (int y = std::max(origin[1] - r, 0); y <= std::min(origin[1] + r, dims_[1] - 1); ++y) {
                for (int x = std::max(origin[0] - r, 0); x <= std::min(origin[0] + r, dims_[0] - 1); ++x) {
                    const int ring = std::max({std::abs(x - origin[0]),
                                               std::abs(y - origin[1]),
                                               std::abs(z - origin[2])});
                    if (ring != r) {
                        continue;
                    }

                    const auto id = cellId(x, y, z);
                    for (auto k = cellStart_[id]; k < cellStart_[id + 1]; ++k) {
                        const auto index = cellItems_[k];
                        const double d = distance(query, positions_[index]);
                        best = std::min(best, d);
                        visited.push_back({index, d});
                    }
                }
            }
        }

        // 未访问单元到查询点距离的下界
        double bound = std::numeric_limits<double>::infinity();
        bool remaining = false;
        for (size_t i = 0; i < 3; ++i) {
            if (origin[i] + r + 1 <= dims_[i] - 1) {
                remaining = true;
                const double face = bounds_.min[i] + (origin[i] + r + 1) * cellSize_[i];
                bound = std::min(bound, std::max(face - query[i], 0.0));
            }
            if (origin[i] - r - 1 >= 0) {
                remaining = true;
                const double face = bounds_.min[i] + (origin[i] - r) * cellSize_[i];
                bound = std::min(bound, std::max(query[i] - face, 0.0));
            }
        }

        if (!remaining) {
            break;
        }
        if (!visited.empty() && bound > best + tolerance + slack_) {
            break;
        }
    }

    return filterCandidates(std::move(visited), tolerance);
}

std::vector<Neighbor>
nearestWithinBruteForce(const std::vector<Position>& positions, const Position& query, double tolerance) {
    std::vector<Neighbor> visited;
    visited.reserve(positions.size());

    for (size_t v = 0; v < positions.size(); ++v) {
        visited.push_back({static_cast<Index>(v), distance(query, positions[v])});
    }

    return filterCandidates(std::move(visited), tolerance);
}

} // namespace shapemirror::core
