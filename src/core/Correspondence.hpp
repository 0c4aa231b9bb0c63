#pragma once

#include "Mesh.hpp"
#include "MirrorPlane.hpp"
#include "Types.hpp"
#include <vector>

namespace shapemirror::core {

// 镜像对应构建配置
struct CorrespondenceConfig {
    float seamEpsilon{1e-5f};      // 镜像点与自身距离小于该值视为接缝顶点
    float tieTolerance{1e-6f};     // 距离差在该值内视为等距
    TieBreak tieBreak{TieBreak::LowestIndex};
    SearchMethod searchMethod{SearchMethod::Grid};
    bool enableParallelProcessing{false};

    bool operator==(const CorrespondenceConfig&) const = default;
};

// 顶点索引到其镜像顶点索引的全映射
class CorrespondenceMap {
public:
    CorrespondenceMap() = default;
    explicit CorrespondenceMap(std::vector<Index> targets)
        : targets_(std::move(targets)) {}

    Index operator[](Index vertex) const { return targets_[vertex]; }
    Index at(Index vertex) const { return targets_.at(vertex); }

    size_t size() const noexcept { return targets_.size(); }
    bool empty() const noexcept { return targets_.empty(); }
    bool isSeam(Index vertex) const { return targets_[vertex] == vertex; }

    const std::vector<Index>& targets() const noexcept { return targets_; }

    bool operator==(const CorrespondenceMap&) const = default;

private:
    std::vector<Index> targets_;
};

// 对应质量统计，对称性差不是错误，只在这里体现
struct CorrespondenceStats {
    size_t vertexCount{0};
    size_t seamVertices{0};
    size_t pairedVertices{0};       // map[map[i]] == i 且非接缝
    size_t asymmetricVertices{0};   // map[map[i]] != i
    double maxMirrorDistance{0.0};  // 镜像点到对应顶点的最大距离
    double meanMirrorDistance{0.0};
    double symmetryResidual{0.0};   // 平均镜像距离 / 包围盒对角线
};

// 纯函数：为基础网格的每个顶点寻找镜像后的最近顶点。
// 等距候选按 tieBreak 取舍；镜像点与自身重合（seamEpsilon 内）的顶点映射到自身。
// 结果只依赖基础网格与镜像平面，可在多个融合变形间复用。
[[nodiscard]] CorrespondenceMap
buildCorrespondence(const Mesh& base, const MirrorPlane& plane, const CorrespondenceConfig& config = {});

// 纯函数：单个顶点的对应查询
[[nodiscard]] Index findMirrorVertex(const Mesh& base, const MirrorPlane& plane, Index vertex,
                                     const CorrespondenceConfig& config = {});

// 纯函数：统计对应质量
[[nodiscard]] CorrespondenceStats
computeCorrespondenceStats(const Mesh& base, const MirrorPlane& plane, const CorrespondenceMap& map) noexcept;

// 纯函数：映射两次是否回到自身
[[nodiscard]] bool isInvolution(const CorrespondenceMap& map) noexcept;

} // namespace shapemirror::core
