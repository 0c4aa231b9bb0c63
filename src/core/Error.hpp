#pragma once
#include <string_view>

namespace shapemirror::core {

// 镜像核心错误类型
enum class MirrorError {
    InvalidSelection,   // 接缝顶点越界或未选择
    TopologyMismatch,   // 基础网格与融合变形顶点数不一致
    MissingSideTag      // 网格名称中没有左右标记
};

constexpr std::string_view toString(MirrorError error) noexcept {
    switch (error) {
        case MirrorError::InvalidSelection: return "InvalidSelection";
        case MirrorError::TopologyMismatch: return "TopologyMismatch";
        case MirrorError::MissingSideTag: return "MissingSideTag";
    }
    return "Unknown";
}

} // namespace shapemirror::core
