#pragma once

#include "Error.hpp"
#include "Mesh.hpp"
#include "Types.hpp"
#include <expected>
#include <optional>

namespace shapemirror::core {

// 轴对齐镜像平面：p[axis] == offset
struct MirrorPlane {
    Axis axis{Axis::X};
    float offset{0.0f};

    constexpr MirrorPlane() = default;
    constexpr MirrorPlane(Axis axis, float offset) : axis(axis), offset(offset) {}

    // 点到平面的有符号距离
    constexpr float signedDistance(const Position& point) const noexcept {
        return point[axisIndex(axis)] - offset;
    }

    // 点的镜像：p'[axis] = 2 * offset - p[axis]
    constexpr Position reflectPoint(const Position& point) const noexcept {
        Position result = point;
        const auto i = axisIndex(axis);
        result[i] = 2.0f * offset - point[i];
        return result;
    }

    // 位移向量的镜像：只取反轴向分量，没有偏移项
    constexpr Position reflectDelta(const Position& delta) const noexcept {
        Position result = delta;
        const auto i = axisIndex(axis);
        result[i] = -delta[i];
        return result;
    }

    // 点所在的半空间，平面上的点返回空
    constexpr std::optional<Half> halfOf(const Position& point) const noexcept {
        const float d = signedDistance(point);
        if (d < 0.0f) return Half::Negative;
        if (d > 0.0f) return Half::Positive;
        return std::nullopt;
    }

    constexpr bool operator==(const MirrorPlane&) const = default;
};

// 由接缝顶点解析镜像平面。
// seamVertex 为空（未选择）或越界时返回 InvalidSelection；
// 不检查接缝是否真的位于模型对称线上。
[[nodiscard]] std::expected<MirrorPlane, MirrorError>
resolveMirrorPlane(const Mesh& base, std::optional<Index> seamVertex, Axis axis = Axis::X);

} // namespace shapemirror::core
