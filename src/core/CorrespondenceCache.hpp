#pragma once

#include "Correspondence.hpp"
#include <compare>
#include <map>
#include <memory>
#include <string>

namespace shapemirror::core {

// 缓存键：基础网格身份（名称 + 位置指纹）、镜像轴、接缝顶点
struct CorrespondenceKey {
    std::string meshName;
    uint64_t meshFingerprint{0};
    Axis axis{Axis::X};
    Index seamVertex{0};

    auto operator<=>(const CorrespondenceKey&) const = default;
};

[[nodiscard]] CorrespondenceKey makeCorrespondenceKey(const Mesh& base, Axis axis, Index seamVertex);

// 对应映射缓存。映射只依赖基础网格与平面，同一基础网格的多个融合变形共用一份。
class CorrespondenceCache {
public:
    using MapPtr = std::shared_ptr<const CorrespondenceMap>;

    [[nodiscard]] MapPtr find(const CorrespondenceKey& key) const;
    void insert(const CorrespondenceKey& key, MapPtr map);

    // 查找，未命中时调用 build 构建并缓存
    template<typename Build>
    MapPtr getOrBuild(const CorrespondenceKey& key, Build&& build) {
        if (auto cached = find(key)) {
            return cached;
        }
        auto map = std::make_shared<const CorrespondenceMap>(build());
        insert(key, map);
        return map;
    }

    // 丢弃某个基础网格的全部条目
    size_t invalidate(const std::string& meshName);
    void clear() noexcept;

    size_t size() const noexcept { return entries_.size(); }
    size_t hits() const noexcept { return hits_; }
    size_t misses() const noexcept { return misses_; }

private:
    std::map<CorrespondenceKey, MapPtr> entries_;
    mutable size_t hits_{0};
    mutable size_t misses_{0};
};

} // namespace shapemirror::core
