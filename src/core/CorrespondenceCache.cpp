#include "core/CorrespondenceCache.hpp"
#include <spdlog/spdlog.h>

namespace shapemirror::core {

CorrespondenceKey makeCorrespondenceKey(const Mesh& base, Axis axis, Index seamVertex) {
    return CorrespondenceKey{base.name(), fingerprint(base), axis, seamVertex};
}

CorrespondenceCache::MapPtr CorrespondenceCache::find(const CorrespondenceKey& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        ++misses_;
        return nullptr;
    }
    ++hits_;
    spdlog::debug("Correspondence cache hit: mesh='{}' axis={} seam={}",
                  key.meshName, toString(key.axis), key.seamVertex);
    return it->second;
}

void CorrespondenceCache::insert(const CorrespondenceKey& key, MapPtr map) {
    entries_.insert_or_assign(key, std::move(map));
}

size_t CorrespondenceCache::invalidate(const std::string& meshName) {
    return std::erase_if(entries_, [&meshName](const auto& entry) {
        return entry.first.meshName == meshName;
    });
}

void CorrespondenceCache::clear() noexcept {
    entries_.clear();
    hits_ = 0;
    misses_ = 0;
}

} // namespace shapemirror::core
