#pragma once

#include "Error.hpp"
#include "Types.hpp"
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace shapemirror::core {

// 面的一个角：顶点索引 + 可选纹理坐标索引（均为 0 起始）
struct FaceCorner {
    Index vertex{0};
    std::optional<Index> texCoord;

    bool operator==(const FaceCorner&) const = default;
};

using Face = std::vector<FaceCorner>;

// 拓扑数据，核心算法只透传不读取
struct Topology {
    std::vector<TexCoord> texCoords;
    std::vector<Face> faces;

    size_t faceCount() const noexcept { return faces.size(); }
    bool operator==(const Topology&) const = default;
};

// 网格：按索引排列的顶点位置 + 共享的不透明拓扑
class Mesh {
public:
    using Positions = std::vector<Position>;

    Mesh() = default;
    Mesh(std::string name, Positions positions,
         std::shared_ptr<const Topology> topology = nullptr)
        : name_(std::move(name)),
          positions_(std::move(positions)),
          topology_(topology ? std::move(topology) : std::make_shared<const Topology>()) {}

    // 访问器
    const std::string& name() const noexcept { return name_; }
    const Positions& positions() const noexcept { return positions_; }
    const Position& position(Index index) const { return positions_[index]; }
    const Topology& topology() const noexcept { return *topology_; }
    const std::shared_ptr<const Topology>& sharedTopology() const noexcept { return topology_; }

    // 写入单个顶点，不改变顶点数量和顺序
    void setPosition(Index index, const Position& position) { positions_[index] = position; }

    // 查询方法
    size_t vertexCount() const noexcept { return positions_.size(); }
    size_t faceCount() const noexcept { return topology_->faceCount(); }
    bool empty() const noexcept { return positions_.empty(); }
    bool contains(Index index) const noexcept { return index < positions_.size(); }

    // 创建新实例的函数式操作，顶点数必须一致
    [[nodiscard]] std::expected<Mesh, MirrorError> withPositions(Positions newPositions) const;

    [[nodiscard]] Mesh withName(std::string newName) const {
        return Mesh{std::move(newName), positions_, topology_};
    }

private:
    std::string name_;
    Positions positions_;
    std::shared_ptr<const Topology> topology_{std::make_shared<const Topology>()};
};

// 网格统计信息
struct MeshStats {
    size_t vertexCount{0};
    size_t faceCount{0};
    Position boundingBoxMin{0, 0, 0};
    Position boundingBoxMax{0, 0, 0};
    double diagonal{0.0};
};

// 纯函数：计算网格统计
[[nodiscard]] MeshStats computeStats(const Mesh& mesh) noexcept;

// 纯函数：顶点数量与位置的 FNV-1a 指纹，用作缓存键
[[nodiscard]] uint64_t fingerprint(const Mesh& mesh) noexcept;

// 纯函数：两点欧氏距离（双精度累加）
[[nodiscard]] double distance(const Position& a, const Position& b) noexcept;

} // namespace shapemirror::core
