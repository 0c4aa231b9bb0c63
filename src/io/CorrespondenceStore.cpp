#include "CorrespondenceStore.hpp"
#include <fmt/format.h>
#include <fstream>
#include <iomanip>
#include <optional>
#include <spdlog/spdlog.h>

namespace shapemirror::io {

namespace {
    constexpr int kFormatVersion = 1;

    std::string formatFingerprint(uint64_t value) {
        return fmt::format("{:016x}", value);
    }

    std::optional<uint64_t> parseFingerprint(const std::string& text) {
        try {
            size_t consumed = 0;
            const auto value = std::stoull(text, &consumed, 16);
            if (consumed != text.size()) {
                return std::nullopt;
            }
            return value;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
}

nlohmann::json toJson(const CorrespondenceDocument& document) {
    nlohmann::json json;
    json["version"] = kFormatVersion;
    json["mesh"] = document.key.meshName;
    json["fingerprint"] = formatFingerprint(document.key.meshFingerprint);
    json["axis"] = std::string(core::toString(document.key.axis));
    json["seamVertex"] = document.key.seamVertex;
    json["offset"] = document.plane.offset;
    json["targets"] = document.map.targets();
    return json;
}

std::expected<CorrespondenceDocument, StoreError> fromJson(const nlohmann::json& json) {
    try {
        if (json.at("version").get<int>() != kFormatVersion) {
            return std::unexpected(StoreError::JsonError);
        }

        auto axis = core::parseAxis(json.at("axis").get<std::string>());
        auto fingerprint = parseFingerprint(json.at("fingerprint").get<std::string>());
        if (!axis || !fingerprint) {
            return std::unexpected(StoreError::JsonError);
        }

        CorrespondenceDocument document;
        document.key.meshName = json.at("mesh").get<std::string>();
        document.key.meshFingerprint = *fingerprint;
        document.key.axis = *axis;
        document.key.seamVertex = json.at("seamVertex").get<core::Index>();
        document.plane = core::MirrorPlane{*axis, json.at("offset").get<float>()};
        document.map = core::CorrespondenceMap{json.at("targets").get<std::vector<core::Index>>()};

        // 映射必须落在自身范围内
        for (const auto target : document.map.targets()) {
            if (target >= document.map.size()) {
                return std::unexpected(StoreError::JsonError);
            }
        }

        return document;
    } catch (const nlohmann::json::exception& e) {
        spdlog::debug("Invalid correspondence document: {}", e.what());
        return std::unexpected(StoreError::JsonError);
    }
}

std::expected<void, StoreError>
saveCorrespondence(const CorrespondenceDocument& document, const std::filesystem::path& outputFile) {
    return writeJsonFile(toJson(document), outputFile);
}

std::expected<CorrespondenceDocument, StoreError>
loadCorrespondence(const std::filesystem::path& inputFile) {
    std::ifstream file(inputFile);
    if (!file.is_open()) {
        return std::unexpected(StoreError::ReadError);
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::exception& e) {
        spdlog::debug("Failed to parse '{}': {}", inputFile.string(), e.what());
        return std::unexpected(StoreError::JsonError);
    }

    return fromJson(json);
}

std::expected<CorrespondenceDocument, StoreError>
loadCorrespondence(const std::filesystem::path& inputFile, const core::CorrespondenceKey& expectedKey) {
    auto document = loadCorrespondence(inputFile);
    if (!document) {
        return document;
    }

    if (document->key != expectedKey) {
        spdlog::debug("Correspondence '{}' was built for mesh='{}' fingerprint={} axis={} seam={}",
                      inputFile.string(), document->key.meshName,
                      formatFingerprint(document->key.meshFingerprint),
                      core::toString(document->key.axis), document->key.seamVertex);
        return std::unexpected(StoreError::Mismatch);
    }

    return document;
}

std::expected<void, StoreError>
writeJsonFile(const nlohmann::json& json, const std::filesystem::path& outputFile) {
    std::ofstream file(outputFile);
    if (!file.is_open()) {
        return std::unexpected(StoreError::WriteError);
    }

    try {
        file << std::setw(2) << json << std::endl;
    } catch (const nlohmann::json::exception&) {
        return std::unexpected(StoreError::JsonError);
    }

    if (!file.good()) {
        return std::unexpected(StoreError::WriteError);
    }
    return {};
}

} // namespace shapemirror::io
