#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace shapemirror::core {

// 基本类型
using Position = std::array<float, 3>;
using TexCoord = std::array<float, 2>;
using Index = uint32_t;

// 镜像轴
enum class Axis : uint8_t {
    X = 0,
    Y = 1,
    Z = 2
};

// 融合变形所属侧（由网格名称解析）
enum class SideTag : uint8_t {
    Left,
    Right
};

// 镜像平面两侧的半空间
enum class Half : uint8_t {
    Negative,  // p[axis] < offset
    Positive   // p[axis] > offset
};

// 接缝顶点的处理策略
enum class SeamPolicy : uint8_t {
    Authoritative,  // 直接使用雕刻位置
    Symmetrize      // 去掉位移在镜像轴上的分量
};

// 最近邻等距时的取舍策略
enum class TieBreak : uint8_t {
    LowestIndex,
    HighestIndex
};

// 最近邻搜索方式
enum class SearchMethod : uint8_t {
    Grid,
    BruteForce
};

constexpr size_t axisIndex(Axis axis) noexcept {
    return static_cast<size_t>(axis);
}

constexpr SideTag opposite(SideTag side) noexcept {
    return side == SideTag::Left ? SideTag::Right : SideTag::Left;
}

constexpr std::string_view toString(Axis axis) noexcept {
    switch (axis) {
        case Axis::X: return "x";
        case Axis::Y: return "y";
        case Axis::Z: return "z";
    }
    return "?";
}

constexpr std::string_view toString(SideTag side) noexcept {
    return side == SideTag::Left ? "left" : "right";
}

constexpr std::string_view toString(SeamPolicy policy) noexcept {
    return policy == SeamPolicy::Authoritative ? "authoritative" : "symmetrize";
}

constexpr std::string_view toString(TieBreak tieBreak) noexcept {
    return tieBreak == TieBreak::LowestIndex ? "lowest" : "highest";
}

constexpr std::string_view toString(SearchMethod method) noexcept {
    return method == SearchMethod::Grid ? "grid" : "brute-force";
}

// 文本解析（命令行使用）
[[nodiscard]] std::optional<Axis> parseAxis(std::string_view text);
[[nodiscard]] std::optional<Half> parseHalf(std::string_view text);
[[nodiscard]] std::optional<SeamPolicy> parseSeamPolicy(std::string_view text);
[[nodiscard]] std::optional<TieBreak> parseTieBreak(std::string_view text);
[[nodiscard]] std::optional<SearchMethod> parseSearchMethod(std::string_view text);

} // namespace shapemirror::core
