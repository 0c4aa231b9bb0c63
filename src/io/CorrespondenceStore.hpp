#pragma once

#include "../core/CorrespondenceCache.hpp"
#include "../core/MirrorPlane.hpp"
#include <expected>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string_view>

namespace shapemirror::io {

// JSON 存取错误类型
enum class StoreError {
    ReadError,
    WriteError,
    JsonError,
    Mismatch   // 文件中的映射不属于当前基础网格/轴/接缝
};

constexpr std::string_view toString(StoreError error) noexcept {
    switch (error) {
        case StoreError::ReadError: return "ReadError";
        case StoreError::WriteError: return "WriteError";
        case StoreError::JsonError: return "JsonError";
        case StoreError::Mismatch: return "Mismatch";
    }
    return "Unknown";
}

// 持久化的对应映射，连同生成它的键与平面
struct CorrespondenceDocument {
    core::CorrespondenceKey key;
    core::MirrorPlane plane;
    core::CorrespondenceMap map;
};

// JSON 转换
[[nodiscard]] nlohmann::json toJson(const CorrespondenceDocument& document);
[[nodiscard]] std::expected<CorrespondenceDocument, StoreError> fromJson(const nlohmann::json& json);

// 保存 / 读取对应映射
[[nodiscard]] std::expected<void, StoreError>
saveCorrespondence(const CorrespondenceDocument& document, const std::filesystem::path& outputFile);

[[nodiscard]] std::expected<CorrespondenceDocument, StoreError>
loadCorrespondence(const std::filesystem::path& inputFile);

// 读取并校验键，键不一致时返回 Mismatch
[[nodiscard]] std::expected<CorrespondenceDocument, StoreError>
loadCorrespondence(const std::filesystem::path& inputFile, const core::CorrespondenceKey& expectedKey);

// 写出任意 JSON 文档（运行报告）
[[nodiscard]] std::expected<void, StoreError>
writeJsonFile(const nlohmann::json& json, const std::filesystem::path& outputFile);

} // namespace shapemirror::io
