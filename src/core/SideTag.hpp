#pragma once

#include "Error.hpp"
#include "Types.hpp"
#include <expected>
#include <string>
#include <string_view>

namespace shapemirror::core {

// 名称中的左右标记
struct SideMarkers {
    std::string left{"_l_"};
    std::string right{"_r_"};

    const std::string& markerFor(SideTag side) const noexcept {
        return side == SideTag::Left ? left : right;
    }
};

// 由网格名称解析所属侧，两个标记都出现时取先出现的一个
[[nodiscard]] std::expected<SideTag, MirrorError>
resolveSideTag(std::string_view name, const SideMarkers& markers = {});

// 镜像结果的名称：把所属侧标记换成对侧标记（brow_l_raise -> brow_r_raise）
[[nodiscard]] std::expected<std::string, MirrorError>
mirroredName(std::string_view name, const SideMarkers& markers = {});

} // namespace shapemirror::core
