#include "core/MirrorPlane.hpp"
#include <spdlog/spdlog.h>

namespace shapemirror::core {

std::expected<MirrorPlane, MirrorError>
resolveMirrorPlane(const Mesh& base, std::optional<Index> seamVertex, Axis axis) {
    if (!seamVertex) {
        spdlog::debug("No seam vertex selected");
        return std::unexpected(MirrorError::InvalidSelection);
    }

    if (!base.contains(*seamVertex)) {
        spdlog::debug("Seam vertex {} out of range (mesh '{}' has {} vertices)",
                      *seamVertex, base.name(), base.vertexCount());
        return std::unexpected(MirrorError::InvalidSelection);
    }

    const auto& seam = base.position(*seamVertex);
    MirrorPlane plane{axis, seam[axisIndex(axis)]};

    spdlog::debug("Mirror plane: axis={} offset={} (seam vertex {})",
                  toString(axis), plane.offset, *seamVertex);
    return plane;
}

} // namespace shapemirror::core
