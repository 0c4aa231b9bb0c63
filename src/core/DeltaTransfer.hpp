#pragma once

#include "Correspondence.hpp"
#include "Error.hpp"
#include "Mesh.hpp"
#include "MirrorPlane.hpp"
#include "SideTag.hpp"
#include <expected>

namespace shapemirror::core {

// 顶点在一次镜像中的角色
enum class VertexRole : uint8_t {
    Source,  // 雕刻侧，保持原位置
    Target,  // 对侧，由镜像位移覆盖
    Seam     // 映射到自身
};

// 位移转移配置
struct TransferConfig {
    Half leftHalf{Half::Negative};
    SeamPolicy seamPolicy{SeamPolicy::Authoritative};
    float seamEpsilon{1e-5f};   // 与 CorrespondenceConfig::seamEpsilon 相同的接缝判定
};

struct TransferStats {
    size_t sourceVertices{0};
    size_t targetVertices{0};
    size_t seamVertices{0};
    size_t sculptedVertices{0};   // 源侧与接缝中位移非零的顶点
    size_t crossSideTargets{0};   // 对应顶点不在源侧的目标顶点（对称性差）
    double maxDeltaLength{0.0};
};

struct TransferResult {
    Mesh mesh;
    TransferStats stats;
};

// 源侧所在的半空间
[[nodiscard]] constexpr Half sourceHalf(SideTag side, Half leftHalf) noexcept {
    if (side == SideTag::Left) {
        return leftHalf;
    }
    return leftHalf == Half::Negative ? Half::Positive : Half::Negative;
}

// 纯函数：按半空间确定顶点角色，平面上或镜像点在 seamEpsilon 内的顶点为接缝
[[nodiscard]] VertexRole classifyVertex(Index vertex, const Mesh& base, const MirrorPlane& plane,
                                        SideTag side, const TransferConfig& config = {});

// 纯函数：把源侧雕刻位移镜像到对侧，生成新的融合变形网格。
// 源侧顶点直接复制雕刻位置；对侧顶点 v 取 base(v) + reflect(blend(u) - base(u))，u = map[v]；
// 接缝顶点按 seamPolicy 处理。输入不被修改，出错时不产生任何输出。
[[nodiscard]] std::expected<TransferResult, MirrorError>
transferDelta(const Mesh& base, const Mesh& blendshape, const CorrespondenceMap& map,
              const MirrorPlane& plane, SideTag side, const TransferConfig& config = {});

// 由融合变形名称解析所属侧后转移，名称无标记时返回 MissingSideTag
[[nodiscard]] std::expected<TransferResult, MirrorError>
transferDelta(const Mesh& base, const Mesh& blendshape, const CorrespondenceMap& map,
              const MirrorPlane& plane, const SideMarkers& markers, const TransferConfig& config = {});

} // namespace shapemirror::core
