#include "ObjWriter.hpp"
#include <fmt/format.h>
#include <fstream>
#include <iterator>

namespace shapemirror::io {

std::expected<void, ObjError>
StandardObjWriter::writeObj(const core::Mesh& mesh, const std::filesystem::path& outputFile) const {
    std::ofstream file(outputFile);
    if (!file.is_open()) {
        return std::unexpected(ObjError::WriteError);
    }

    auto result = write(mesh, file);
    if (!result) {
        return result;
    }

    file.flush();
    if (!file.good()) {
        return std::unexpected(ObjError::WriteError);
    }
    return {};
}

std::expected<void, ObjError>
StandardObjWriter::write(const core::Mesh& mesh, std::ostream& stream) const {
    if (mesh.empty()) {
        return std::unexpected(ObjError::EmptyMesh);
    }

    const auto& topology = mesh.topology();
    const bool withTexCoords = config_.writeTexCoords && !topology.texCoords.empty();

    std::string buffer;
    auto out = std::back_inserter(buffer);

    if (config_.writeHeader) {
        fmt::format_to(out, "# {}\n", config_.header);
        fmt::format_to(out, "# vertices: {} faces: {}\n", mesh.vertexCount(), mesh.faceCount());
    }
    if (!mesh.name().empty()) {
        fmt::format_to(out, "o {}\n", mesh.name());
    }

    // 浮点按最短可往返格式输出
    for (const auto& p : mesh.positions()) {
        fmt::format_to(out, "v {} {} {}\n", p[0], p[1], p[2]);
    }

    if (withTexCoords) {
        for (const auto& t : topology.texCoords) {
            fmt::format_to(out, "vt {} {}\n", t[0], t[1]);
        }
    }

    for (const auto& face : topology.faces) {
        buffer += 'f';
        for (const auto& corner : face) {
            if (withTexCoords && corner.texCoord) {
                fmt::format_to(out, " {}/{}", corner.vertex + 1, *corner.texCoord + 1);
            } else {
                fmt::format_to(out, " {}", corner.vertex + 1);
            }
        }
        buffer += '\n';
    }

    stream.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    if (!stream.good()) {
        return std::unexpected(ObjError::WriteError);
    }
    return {};
}

std::unique_ptr<IObjWriter> createObjWriter(ObjWriteConfig config) {
    return std::make_unique<StandardObjWriter>(std::move(config));
}

} // namespace shapemirror::io
