#pragma once

#include "ObjReader.hpp"
#include <ostream>

namespace shapemirror::io {

// OBJ 写出配置
struct ObjWriteConfig {
    bool writeTexCoords{true};
    bool writeHeader{true};
    std::string header{"shapemirror output"};
};

// OBJ 写出器接口
class IObjWriter {
public:
    virtual ~IObjWriter() = default;

    // 按索引顺序写出全部顶点，面保持原样
    virtual std::expected<void, ObjError>
    writeObj(const core::Mesh& mesh, const std::filesystem::path& outputFile) const = 0;

    virtual std::expected<void, ObjError>
    write(const core::Mesh& mesh, std::ostream& stream) const = 0;
};

// 标准 OBJ 写出器实现
class StandardObjWriter : public IObjWriter {
public:
    explicit StandardObjWriter(ObjWriteConfig config = {})
        : config_(std::move(config)) {}

    std::expected<void, ObjError>
    writeObj(const core::Mesh& mesh, const std::filesystem::path& outputFile) const override;

    std::expected<void, ObjError>
    write(const core::Mesh& mesh, std::ostream& stream) const override;

private:
    ObjWriteConfig config_;
};

// 工厂函数
[[nodiscard]] std::unique_ptr<IObjWriter> createObjWriter(ObjWriteConfig config = {});

} // namespace shapemirror::io
