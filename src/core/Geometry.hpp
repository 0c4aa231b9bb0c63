#pragma once

#include "Mesh.hpp"
#include <array>
#include <vector>

namespace shapemirror::core {

// 3D 包围盒
struct BoundingBox {
    Position min{0.0f, 0.0f, 0.0f};
    Position max{0.0f, 0.0f, 0.0f};

    constexpr BoundingBox() = default;
    constexpr BoundingBox(const Position& min, const Position& max)
        : min(min), max(max) {}

    // 查询方法
    constexpr Position size() const noexcept {
        return {max[0] - min[0], max[1] - min[1], max[2] - min[2]};
    }

    constexpr Position center() const noexcept {
        return {(min[0] + max[0]) * 0.5f, (min[1] + max[1]) * 0.5f, (min[2] + max[2]) * 0.5f};
    }

    constexpr bool contains(const Position& point) const noexcept {
        return point[0] >= min[0] && point[0] <= max[0] &&
               point[1] >= min[1] && point[1] <= max[1] &&
               point[2] >= min[2] && point[2] <= max[2];
    }
};

// 纯函数：从顶点计算包围盒
[[nodiscard]] BoundingBox computeBoundingBox(const std::vector<Position>& positions) noexcept;

// 最近邻查询结果
struct Neighbor {
    Index index{0};
    double distance{0.0};
};

// 网格划分配置
struct GridConfig {
    double targetPointsPerCell{2.0};
    int maxCellsPerAxis{128};
};

// 均匀网格空间索引。
// 查询返回的集合与暴力搜索完全一致：所有距离不超过 (最近距离 + tolerance) 的顶点，按索引升序。
// 网格只引用顶点数组，调用方保证其生命周期。
class VertexGrid {
public:
    explicit VertexGrid(const std::vector<Position>& positions, const GridConfig& config = {});

    [[nodiscard]] std::vector<Neighbor> nearestWithin(const Position& query, double tolerance) const;

    const std::array<int, 3>& dimensions() const noexcept { return dims_; }
    size_t cellCount() const noexcept { return cellStart_.empty() ? 0 : cellStart_.size() - 1; }

private:
    const std::vector<Position>& positions_;
    BoundingBox bounds_;
    std::array<int, 3> dims_{1, 1, 1};
    std::array<double, 3> cellSize_{1.0, 1.0, 1.0};
    double slack_{0.0};

    // CSR 布局：cellItems_[cellStart_[c] .. cellStart_[c + 1]) 为单元 c 内的顶点
    std::vector<uint32_t> cellStart_;
    std::vector<Index> cellItems_;

    std::array<int, 3> cellOf(const Position& point) const noexcept;
    size_t cellId(int x, int y, int z) const noexcept {
        return (static_cast<size_t>(z) * dims_[1] + y) * dims_[0] + x;
    }
};

// 纯函数：暴力最近邻，语义与 VertexGrid::nearestWithin 相同
[[nodiscard]] std::vector<Neighbor>
nearestWithinBruteForce(const std::vector<Position>& positions, const Position& query, double tolerance);

} // namespace shapemirror::core
