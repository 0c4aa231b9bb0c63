#include "core/Mesh.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>

namespace shapemirror::core {

std::expected<Mesh, MirrorError> Mesh::withPositions(Positions newPositions) const {
    if (newPositions.size() != positions_.size()) {
        return std::unexpected(MirrorError::TopologyMismatch);
    }
    return Mesh{name_, std::move(newPositions), topology_};
}

MeshStats computeStats(const Mesh& mesh) noexcept {
    MeshStats stats;

    stats.vertexCount = mesh.vertexCount();
    stats.faceCount = mesh.faceCount();

    const auto& positions = mesh.positions();
    if (positions.empty()) {
        return stats;
    }

    stats.boundingBoxMin = positions[0];
    stats.boundingBoxMax = positions[0];

    for (const auto& pos : positions) {
        for (size_t i = 0; i < 3; ++i) {
            stats.boundingBoxMin[i] = std::min(stats.boundingBoxMin[i], pos[i]);
            stats.boundingBoxMax[i] = std::max(stats.boundingBoxMax[i], pos[i]);
        }
    }

    stats.diagonal = distance(stats.boundingBoxMin, stats.boundingBoxMax);
    return stats;
}

uint64_t fingerprint(const Mesh& mesh) noexcept {
    constexpr uint64_t kOffsetBasis = 14695981039346656037ull;
    constexpr uint64_t kPrime = 1099511628211ull;

    uint64_t hash = kOffsetBasis;
    auto mix = [&hash](const void* data, size_t size) {
        const auto* bytes = static_cast<const unsigned char*>(data);
        for (size_t i = 0; i < size; ++i) {
            hash ^= bytes[i];
            hash *= kPrime;
        }
    };

    const uint64_t count = mesh.vertexCount();
    mix(&count, sizeof(count));

    for (const auto& pos : mesh.positions()) {
        for (const float value : pos) {
            // -0.0 与 0.0 视为相同
            const float normalized = value == 0.0f ? 0.0f : value;
            uint32_t bits;
            std::memcpy(&bits, &normalized, sizeof(bits));
            mix(&bits, sizeof(bits));
        }
    }

    return hash;
}

double distance(const Position& a, const Position& b) noexcept {
    const double dx = static_cast<double>(a[0]) - b[0];
    const double dy = static_cast<double>(a[1]) - b[1];
    const double dz = static_cast<double>(a[2]) - b[2];
    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

} // namespace shapemirror::core
