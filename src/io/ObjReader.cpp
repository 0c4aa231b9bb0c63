#include "ObjReader.hpp"
#include <charconv>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <spdlog/spdlog.h>

namespace shapemirror::io {

namespace {
    // 去掉行尾空白（含 CR）
    void trimRight(std::string& line) {
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n' ||
                                 line.back() == ' ' || line.back() == '\t')) {
            line.pop_back();
        }
    }

    std::optional<long long> parseInteger(std::string_view text) {
        long long value = 0;
        const auto* begin = text.data();
        const auto* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc{} || ptr != end) {
            return std::nullopt;
        }
        return value;
    }

    // OBJ 索引（1 起始，负数为相对索引）转 0 起始
    std::expected<core::Index, ObjError> resolveIndex(std::string_view text, size_t currentCount) {
        auto value = parseInteger(text);
        if (!value || *value == 0) {
            return std::unexpected(ObjError::InvalidFormat);
        }
        const long long resolved = *value > 0 ? *value - 1 : static_cast<long long>(currentCount) + *value;
        if (resolved < 0 || resolved > static_cast<long long>(std::numeric_limits<core::Index>::max())) {
            return std::unexpected(ObjError::IndexOutOfRange);
        }
        return static_cast<core::Index>(resolved);
    }

    // 面的一个角：v、v/vt、v//vn、v/vt/vn
    std::expected<core::FaceCorner, ObjError>
    parseCorner(std::string_view token, size_t vertexCount, size_t texCoordCount) {
        const auto firstSlash = token.find('/');
        auto vertex = resolveIndex(token.substr(0, firstSlash), vertexCount);
        if (!vertex) {
            return std::unexpected(vertex.error());
        }

        core::FaceCorner corner{*vertex, std::nullopt};
        if (firstSlash == std::string_view::npos) {
            return corner;
        }

        const auto rest = token.substr(firstSlash + 1);
        const auto texCoordText = rest.substr(0, rest.find('/'));
        if (!texCoordText.empty()) {
            auto texCoord = resolveIndex(texCoordText, texCoordCount);
            if (!texCoord) {
                return std::unexpected(texCoord.error());
            }
            corner.texCoord = *texCoord;
        }
        // 法线索引不保留
        return corner;
    }
}

std::expected<core::Mesh, ObjError> StandardObjReader::readObj(const std::filesystem::path& filePath) const {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        return std::unexpected(ObjError::FileNotFound);
    }

    const auto stem = filePath.stem().string();
    auto mesh = parse(file, stem);
    if (!mesh) {
        spdlog::debug("Failed to parse '{}': {}", filePath.string(), toString(mesh.error()));
        return mesh;
    }

    if (options_.nameFromFile) {
        return mesh->withName(stem);
    }
    return mesh;
}

std::expected<core::Mesh, ObjError>
StandardObjReader::parse(std::istream& stream, const std::string& fallbackName) const {
    core::Mesh::Positions positions;
    core::Topology topology;
    std::string objectName;

    std::string line;
    while (std::getline(stream, line)) {
        trimRight(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::istringstream iss(line);
        std::string keyword;
        iss >> keyword;

        if (keyword == "v") {
            float x, y, z;
            if (!(iss >> x >> y >> z)) {
                return std::unexpected(ObjError::InvalidFormat);
            }
            positions.push_back({x, y, z});
        } else if (keyword == "vt") {
            float u = 0.0f, v = 0.0f;
            if (!(iss >> u)) {
                return std::unexpected(ObjError::InvalidFormat);
            }
            iss >> v;
            topology.texCoords.push_back({u, v});
        } else if (keyword == "f") {
            core::Face face;
            std::string token;
            while (iss >> token) {
                auto corner = parseCorner(token, positions.size(), topology.texCoords.size());
                if (!corner) {
                    return std::unexpected(corner.error());
                }
                face.push_back(*corner);
            }
            if (face.size() < 3) {
                return std::unexpected(ObjError::InvalidFormat);
            }
            topology.faces.push_back(std::move(face));
        } else if ((keyword == "o" || keyword == "g") && objectName.empty()) {
            std::getline(iss >> std::ws, objectName);
        }
        // vn、s、usemtl、mtllib、l 等记录忽略
    }

    if (positions.empty()) {
        return std::unexpected(ObjError::EmptyMesh);
    }

    // 面可能引用后面才定义的顶点，最后统一校验
    for (const auto& face : topology.faces) {
        for (const auto& corner : face) {
            if (corner.vertex >= positions.size() ||
                (corner.texCoord && *corner.texCoord >= topology.texCoords.size())) {
                return std::unexpected(ObjError::IndexOutOfRange);
            }
        }
    }

    return core::Mesh{objectName.empty() ? fallbackName : objectName,
                      std::move(positions),
                      std::make_shared<const core::Topology>(std::move(topology))};
}

std::expected<ObjMetadata, ObjError> StandardObjReader::readMetadata(const std::filesystem::path& filePath) const {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        return std::unexpected(ObjError::FileNotFound);
    }

    ObjMetadata metadata;
    std::string line;
    while (std::getline(file, line)) {
        trimRight(line);
        std::istringstream iss(line);
        std::string keyword;
        iss >> keyword;

        if (keyword == "v") {
            ++metadata.vertexCount;
        } else if (keyword == "vt") {
            ++metadata.texCoordCount;
        } else if (keyword == "vn") {
            ++metadata.normalCount;
        } else if (keyword == "f") {
            ++metadata.faceCount;
        } else if ((keyword == "o" || keyword == "g") && metadata.objectName.empty()) {
            std::getline(iss >> std::ws, metadata.objectName);
        }
    }

    return metadata;
}

std::expected<std::vector<core::Mesh>, ObjError>
StandardObjReader::readMultiple(const std::vector<std::filesystem::path>& filePaths) const {
    std::vector<core::Mesh> meshes;
    meshes.reserve(filePaths.size());

    for (const auto& path : filePaths) {
        auto result = readObj(path);
        if (!result) {
            return std::unexpected(result.error());
        }
        meshes.push_back(std::move(result.value()));
    }

    return meshes;
}

std::unique_ptr<IObjReader> createObjReader(ObjReadOptions options) {
    return std::make_unique<StandardObjReader>(options);
}

} // namespace shapemirror::io
