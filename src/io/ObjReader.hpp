#pragma once

#include "../core/Mesh.hpp"
#include <expected>
#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace shapemirror::io {

// OBJ 读写错误类型
enum class ObjError {
    FileNotFound,
    InvalidFormat,
    EmptyMesh,
    IndexOutOfRange,
    WriteError
};

constexpr std::string_view toString(ObjError error) noexcept {
    switch (error) {
        case ObjError::FileNotFound: return "FileNotFound";
        case ObjError::InvalidFormat: return "InvalidFormat";
        case ObjError::EmptyMesh: return "EmptyMesh";
        case ObjError::IndexOutOfRange: return "IndexOutOfRange";
        case ObjError::WriteError: return "WriteError";
    }
    return "Unknown";
}

// OBJ 文件元数据
struct ObjMetadata {
    std::string objectName;   // 第一个 o/g 记录，可能为空
    size_t vertexCount{0};
    size_t texCoordCount{0};
    size_t normalCount{0};
    size_t faceCount{0};
};

// OBJ 读取器接口
class IObjReader {
public:
    virtual ~IObjReader() = default;

    // 读取 OBJ 文件，顶点顺序与文件一致
    virtual std::expected<core::Mesh, ObjError>
    readObj(const std::filesystem::path& filePath) const = 0;

    // 读取元数据（不构建网格）
    virtual std::expected<ObjMetadata, ObjError>
    readMetadata(const std::filesystem::path& filePath) const = 0;

    // 批量读取
    virtual std::expected<std::vector<core::Mesh>, ObjError>
    readMultiple(const std::vector<std::filesystem::path>& filePaths) const = 0;
};

// 读取选项
struct ObjReadOptions {
    // 使用文件名（不含扩展名）作为网格名，否则使用 o/g 记录
    bool nameFromFile{true};
};

// 标准 OBJ 读取器实现
class StandardObjReader : public IObjReader {
public:
    explicit StandardObjReader(ObjReadOptions options = {})
        : options_(options) {}

    std::expected<core::Mesh, ObjError>
    readObj(const std::filesystem::path& filePath) const override;

    std::expected<ObjMetadata, ObjError>
    readMetadata(const std::filesystem::path& filePath) const override;

    std::expected<std::vector<core::Mesh>, ObjError>
    readMultiple(const std::vector<std::filesystem::path>& filePaths) const override;

    // 从流解析，fallbackName 在没有 o/g 记录时作为网格名
    std::expected<core::Mesh, ObjError>
    parse(std::istream& stream, const std::string& fallbackName) const;

private:
    ObjReadOptions options_;
};

// 工厂函数
[[nodiscard]] std::unique_ptr<IObjReader> createObjReader(ObjReadOptions options = {});

} // namespace shapemirror::io
