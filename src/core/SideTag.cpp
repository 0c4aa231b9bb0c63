#include "core/SideTag.hpp"

namespace shapemirror::core {

namespace {
    struct MarkerMatch {
        SideTag side;
        size_t position;
    };

    std::expected<MarkerMatch, MirrorError> findMarker(std::string_view name, const SideMarkers& markers) {
        const auto left = markers.left.empty() ? std::string_view::npos : name.find(markers.left);
        const auto right = markers.right.empty() ? std::string_view::npos : name.find(markers.right);

        if (left == std::string_view::npos && right == std::string_view::npos) {
            return std::unexpected(MirrorError::MissingSideTag);
        }
        if (right == std::string_view::npos || (left != std::string_view::npos && left <= right)) {
            return MarkerMatch{SideTag::Left, left};
        }
        return MarkerMatch{SideTag::Right, right};
    }
}

std::expected<SideTag, MirrorError> resolveSideTag(std::string_view name, const SideMarkers& markers) {
    auto match = findMarker(name, markers);
    if (!match) {
        return std::unexpected(match.error());
    }
    return match->side;
}

std::expected<std::string, MirrorError> mirroredName(std::string_view name, const SideMarkers& markers) {
    auto match = findMarker(name, markers);
    if (!match) {
        return std::unexpected(match.error());
    }

    const auto& from = markers.markerFor(match->side);
    const auto& to = markers.markerFor(opposite(match->side));

    std::string result(name);
    result.replace(match->position, from.size(), to);
    return result;
}

} // namespace shapemirror::core
