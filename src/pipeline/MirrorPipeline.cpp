#include "MirrorPipeline.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <system_error>

namespace shapemirror::pipeline {

namespace {
    // 接缝判定与对应映射使用同一容差
    core::TransferConfig effectiveTransferConfig(const PipelineConfig& config) {
        auto transfer = config.transferConfig;
        transfer.seamEpsilon = config.correspondenceConfig.seamEpsilon;
        return transfer;
    }
}

namespace components {

std::expected<core::Mesh, PipelineError>
loadMesh(const std::filesystem::path& path, const ProgressCallback& progress) {
    if (progress) {
        progress(0.0, "读取 " + path.filename().string());
    }

    auto reader = io::createObjReader();
    auto result = reader->readObj(path);
    if (!result) {
        spdlog::error("Failed to read '{}': {}", path.string(), io::toString(result.error()));
        return std::unexpected(PipelineError::InputError);
    }

    return std::move(result.value());
}

std::expected<core::TransferResult, core::MirrorError>
mirrorBlendshape(const core::Mesh& base, const core::Mesh& blendshape,
                 const core::CorrespondenceMap& map, const core::MirrorPlane& plane,
                 const core::SideMarkers& markers, const core::TransferConfig& config) {
    return core::transferDelta(base, blendshape, map, plane, markers, config);
}

std::expected<std::filesystem::path, PipelineError>
exportMesh(const core::Mesh& mesh, const std::filesystem::path& outputDir,
           const io::ObjWriteConfig& config, const ProgressCallback& progress) {
    std::error_code ec;
    std::filesystem::create_directories(outputDir, ec);
    if (ec) {
        spdlog::error("Cannot create output directory '{}': {}", outputDir.string(), ec.message());
        return std::unexpected(PipelineError::OutputError);
    }

    const auto outputPath = outputDir / (mesh.name() + ".obj");
    auto writer = io::createObjWriter(config);
    auto result = writer->writeObj(mesh, outputPath);
    if (!result) {
        spdlog::error("Failed to write '{}': {}", outputPath.string(), io::toString(result.error()));
        return std::unexpected(PipelineError::OutputError);
    }

    if (progress) {
        progress(1.0, "导出 " + outputPath.filename().string());
    }
    return outputPath;
}

} // namespace components

// MirrorPipeline 实现
PipelineResult MirrorPipeline::execute() {
    return execute(nullptr, nullptr);
}

PipelineResult MirrorPipeline::execute(const ProgressCallback& progressCallback,
                                       const LogCallback& logCallback) {
    PipelineResult result;
    startTime_ = std::chrono::steady_clock::now();

    try {
        log("info", "开始执行镜像管道", logCallback);

        // 步骤1: 加载基础网格
        updateProgress(0.05, "加载基础网格", progressCallback);
        if (!base_) {
            auto loaded = loadBase();
            if (!loaded) {
                result.errorMessage = "基础网格加载失败: " + config_.baseMesh.string();
                log("error", result.errorMessage, logCallback);
                return result;
            }
        }

        // 步骤2: 解析镜像平面
        updateProgress(0.15, "解析镜像平面", progressCallback);
        auto plane = resolvePlane();
        if (!plane) {
            result.mirrorError = plane.error();
            result.errorMessage = fmt::format("接缝顶点无效 ({})", core::toString(plane.error()));
            log("error", result.errorMessage, logCallback);
            return result;
        }
        result.plane = *plane;
        log("info", fmt::format("镜像平面: 轴={} 偏移={}", core::toString(plane->axis), plane->offset),
            logCallback);

        // 步骤3: 构建或复用对应映射
        updateProgress(0.25, "构建对应映射", progressCallback);
        auto map = correspondence(*plane);
        if (!map) {
            result.errorMessage = "对应映射获取失败";
            log("error", result.errorMessage, logCallback);
            return result;
        }
        result.correspondenceReused = lastMapReused_;
        result.correspondenceStats = core::computeCorrespondenceStats(*base_, *plane, **map);

        const auto& stats = result.correspondenceStats;
        log("info", fmt::format("对应映射: {} 个顶点, {} 个接缝, {} 对, 平均镜像误差 {:.6f}{}",
                                stats.vertexCount, stats.seamVertices, stats.pairedVertices / 2,
                                stats.meanMirrorDistance, result.correspondenceReused ? " (复用)" : ""),
            logCallback);
        if (stats.asymmetricVertices > 0) {
            log("warn", fmt::format("{} 个顶点的对应不可逆，基础网格可能不对称或接缝选择偏离对称线",
                                    stats.asymmetricVertices),
                logCallback);
        }

        if (config_.saveMapFile) {
            io::CorrespondenceDocument document{
                core::makeCorrespondenceKey(*base_, plane->axis, *config_.seamVertex), *plane, **map};
            auto saved = io::saveCorrespondence(document, *config_.saveMapFile);
            if (!saved) {
                result.errorMessage = fmt::format("对应映射保存失败: {} ({})",
                                                  config_.saveMapFile->string(), io::toString(saved.error()));
                log("error", result.errorMessage, logCallback);
                return result;
            }
            result.outputFiles.push_back(*config_.saveMapFile);
        }

        // 步骤4: 逐个镜像融合变形
        const auto total = config_.blendshapes.size();
        for (size_t i = 0; i < total; ++i) {
            const auto& path = config_.blendshapes[i];
            updateProgress(0.3 + 0.65 * static_cast<double>(i) / static_cast<double>(total),
                           "镜像 " + path.filename().string(), progressCallback);

            auto outcome = processBlendshape(path, *plane, **map, logCallback);
            if (outcome.outputFile) {
                result.outputFiles.push_back(*outcome.outputFile);
            }
            result.outcomes.push_back(std::move(outcome));
        }

        const auto failed = std::count_if(result.outcomes.begin(), result.outcomes.end(),
                                          [](const BlendshapeOutcome& o) { return !o.success; });
        result.success = failed == 0;
        if (!result.success) {
            result.errorMessage = fmt::format("{} / {} 个融合变形镜像失败", failed, total);
            auto firstFailure = std::find_if(result.outcomes.begin(), result.outcomes.end(),
                                             [](const BlendshapeOutcome& o) { return !o.success; });
            result.mirrorError = firstFailure->mirrorError;
        }

        auto endTime = std::chrono::steady_clock::now();
        result.processingTime = std::chrono::duration_cast<std::chrono::milliseconds>(
            endTime - startTime_);

        // 步骤5: 运行报告
        if (config_.reportFile) {
            auto written = io::writeJsonFile(buildReport(config_, result), *config_.reportFile);
            if (!written) {
                result.success = false;
                result.errorMessage = fmt::format("报告写出失败: {}", config_.reportFile->string());
                log("error", result.errorMessage, logCallback);
                return result;
            }
            result.outputFiles.push_back(*config_.reportFile);
        }

        updateProgress(1.0, "处理完成", progressCallback);

        log(result.success ? "info" : "error",
            result.success ? fmt::format("镜像管道执行成功，耗时: {}ms", result.processingTime.count())
                           : result.errorMessage,
            logCallback);

    } catch (const std::exception& e) {
        result.success = false;
        result.errorMessage = std::string("执行异常: ") + e.what();
        log("error", result.errorMessage, logCallback);
    }

    return result;
}

std::expected<void, PipelineError> MirrorPipeline::loadBase() {
    auto mesh = components::loadMesh(config_.baseMesh);
    if (!mesh) {
        return std::unexpected(mesh.error());
    }
    setBaseMesh(std::move(*mesh));
    return {};
}

void MirrorPipeline::setBaseMesh(core::Mesh base) {
    const auto stats = core::computeStats(base);
    spdlog::debug("Base mesh '{}': {} vertices, {} faces, diagonal {:.4f}",
                  base.name(), stats.vertexCount, stats.faceCount, stats.diagonal);
    base_ = std::move(base);
}

std::expected<core::MirrorPlane, core::MirrorError> MirrorPipeline::resolvePlane() const {
    // 没有基础网格就无从选择顶点
    if (!base_) {
        return std::unexpected(core::MirrorError::InvalidSelection);
    }
    return core::resolveMirrorPlane(*base_, config_.seamVertex, config_.axis);
}

std::expected<core::CorrespondenceCache::MapPtr, PipelineError>
MirrorPipeline::correspondence(const core::MirrorPlane& plane) {
    lastMapReused_ = false;
    if (!base_ || !config_.seamVertex) {
        return std::unexpected(PipelineError::ConfigError);
    }

    const auto key = core::makeCorrespondenceKey(*base_, plane.axis, *config_.seamVertex);

    if (auto cached = cache_.find(key)) {
        lastMapReused_ = true;
        return cached;
    }

    if (config_.loadMapFile) {
        auto document = io::loadCorrespondence(*config_.loadMapFile, key);
        if (document) {
            auto map = std::make_shared<const core::CorrespondenceMap>(std::move(document->map));
            cache_.insert(key, map);
            lastMapReused_ = true;
            spdlog::info("Loaded correspondence from '{}'", config_.loadMapFile->string());
            return map;
        }
        if (document.error() != io::StoreError::Mismatch) {
            spdlog::error("Cannot load correspondence '{}': {}",
                          config_.loadMapFile->string(), io::toString(document.error()));
            return std::unexpected(PipelineError::InputError);
        }
        spdlog::warn("Correspondence '{}' does not match the current base mesh, axis and seam; rebuilding",
                     config_.loadMapFile->string());
    }

    const auto start = std::chrono::steady_clock::now();
    auto map = cache_.getOrBuild(key, [&] {
        return core::buildCorrespondence(*base_, plane, config_.correspondenceConfig);
    });
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    spdlog::debug("Correspondence built in {}ms ({} search)", elapsed.count(),
                  core::toString(config_.correspondenceConfig.searchMethod));

    return map;
}

std::expected<core::TransferResult, core::MirrorError>
MirrorPipeline::mirror(const core::Mesh& blendshape) {
    auto plane = resolvePlane();
    if (!plane) {
        return std::unexpected(plane.error());
    }

    const auto key = core::makeCorrespondenceKey(*base_, plane->axis, *config_.seamVertex);
    auto map = cache_.getOrBuild(key, [&] {
        return core::buildCorrespondence(*base_, *plane, config_.correspondenceConfig);
    });

    return components::mirrorBlendshape(*base_, blendshape, *map, *plane,
                                        config_.sideMarkers, effectiveTransferConfig(config_));
}

void MirrorPipeline::updateConfig(PipelineConfig newConfig) {
    if (newConfig.baseMesh != config_.baseMesh) {
        base_.reset();
        cache_.clear();
    } else if (!(newConfig.correspondenceConfig == config_.correspondenceConfig)) {
        cache_.clear();
    }
    config_ = std::move(newConfig);
}

BlendshapeOutcome MirrorPipeline::processBlendshape(const std::filesystem::path& path,
                                                    const core::MirrorPlane& plane,
                                                    const core::CorrespondenceMap& map,
                                                    const LogCallback& logCallback) {
    BlendshapeOutcome outcome;
    outcome.input = path;

    auto blendshape = components::loadMesh(path);
    if (!blendshape) {
        outcome.errorMessage = "无法读取融合变形: " + path.string();
        log("error", outcome.errorMessage, logCallback);
        return outcome;
    }
    outcome.name = blendshape->name();

    // 所属侧在加载后解析一次
    auto side = core::resolveSideTag(outcome.name, config_.sideMarkers);
    if (!side) {
        outcome.mirrorError = side.error();
        outcome.errorMessage = fmt::format("'{}' 中没有左右标记 ('{}' / '{}')",
                                           outcome.name, config_.sideMarkers.left, config_.sideMarkers.right);
        log("error", outcome.errorMessage, logCallback);
        return outcome;
    }
    outcome.side = *side;

    auto outputName = core::mirroredName(outcome.name, config_.sideMarkers);
    if (!outputName) {
        outcome.mirrorError = outputName.error();
        outcome.errorMessage = "无法生成镜像名称: " + outcome.name;
        log("error", outcome.errorMessage, logCallback);
        return outcome;
    }
    outcome.outputName = *outputName;

    auto transfer = core::transferDelta(*base_, *blendshape, map, plane, *side, effectiveTransferConfig(config_));
    if (!transfer) {
        outcome.mirrorError = transfer.error();
        outcome.errorMessage = fmt::format("'{}' 镜像失败 ({}): {} 个顶点, 基础网格 {} 个顶点",
                                           outcome.name, core::toString(transfer.error()),
                                           blendshape->vertexCount(), base_->vertexCount());
        log("error", outcome.errorMessage, logCallback);
        return outcome;
    }
    outcome.stats = transfer->stats;

    auto mirrored = transfer->mesh.withName(outcome.outputName);
    log("info", fmt::format("{} ({}) -> {}: {} 个源顶点, {} 个目标顶点, {} 个接缝",
                            outcome.name, core::toString(*side), outcome.outputName,
                            outcome.stats.sourceVertices, outcome.stats.targetVertices,
                            outcome.stats.seamVertices),
        logCallback);

    if (config_.previewOnly) {
        outcome.mesh = std::move(mirrored);
        outcome.success = true;
        return outcome;
    }

    auto exported = components::exportMesh(mirrored, config_.outputDirectory, config_.objConfig);
    if (!exported) {
        outcome.errorMessage = "导出失败: " + outcome.outputName;
        log("error", outcome.errorMessage, logCallback);
        return outcome;
    }

    outcome.outputFile = *exported;
    outcome.success = true;
    return outcome;
}

void MirrorPipeline::updateProgress(double progress, const std::string& message,
                                    const ProgressCallback& callback) const {
    if (config_.enableProgressReporting && callback) {
        callback(progress, message);
    }
}

void MirrorPipeline::log(const std::string& level, const std::string& message,
                         const LogCallback& callback) const {
    if (config_.enableLogging) {
        if (callback) {
            callback(level, message);
        } else {
            // 使用默认日志记录
            if (level == "error") {
                spdlog::error(message);
            } else if (level == "warn") {
                spdlog::warn(message);
            } else if (level == "info") {
                spdlog::info(message);
            } else if (level == "debug") {
                spdlog::debug(message);
            } else {
                spdlog::trace(message);
            }
        }
    }
}

// 工厂函数和便利函数实现
PipelineBuilder createPipeline() {
    return PipelineBuilder{};
}

PipelineResult executeSingleMirror(const std::filesystem::path& baseMesh,
                                   const std::filesystem::path& blendshape,
                                   core::Index seamVertex,
                                   const std::filesystem::path& outputDir,
                                   core::Axis axis,
                                   const ProgressCallback& progress) {
    return createPipeline()
        .withBaseMesh(baseMesh)
        .withBlendshape(blendshape)
        .withSeamVertex(seamVertex)
        .withAxis(axis)
        .withOutput(outputDir)
        .execute(progress);
}

std::expected<void, PipelineError> validateConfig(const PipelineConfig& config) {
    // 验证输入配置
    if (config.baseMesh.empty() || !std::filesystem::exists(config.baseMesh)) {
        return std::unexpected(PipelineError::InputError);
    }
    if (config.blendshapes.empty() ||
        !std::all_of(config.blendshapes.begin(), config.blendshapes.end(),
                     [](const auto& path) { return std::filesystem::exists(path); })) {
        return std::unexpected(PipelineError::InputError);
    }
    if (config.loadMapFile && !std::filesystem::exists(*config.loadMapFile)) {
        return std::unexpected(PipelineError::InputError);
    }

    // 验证镜像配置
    if (!config.seamVertex) {
        return std::unexpected(PipelineError::ConfigError);
    }
    const auto& markers = config.sideMarkers;
    if (markers.left.empty() || markers.right.empty() || markers.left == markers.right) {
        return std::unexpected(PipelineError::ConfigError);
    }
    if (config.correspondenceConfig.seamEpsilon < 0.0f || config.correspondenceConfig.tieTolerance < 0.0f) {
        return std::unexpected(PipelineError::ConfigError);
    }

    // 验证输出配置
    if (!config.previewOnly && config.outputDirectory.empty()) {
        return std::unexpected(PipelineError::ConfigError);
    }

    return {};
}

nlohmann::json buildReport(const PipelineConfig& config, const PipelineResult& result) {
    nlohmann::json report;
    report["baseMesh"] = config.baseMesh.string();
    report["success"] = result.success;
    report["processingTimeMs"] = result.processingTime.count();
    if (!result.errorMessage.empty()) {
        report["error"] = result.errorMessage;
    }

    if (result.plane) {
        report["plane"] = {
            {"axis", std::string(core::toString(result.plane->axis))},
            {"offset", result.plane->offset},
            {"seamVertex", config.seamVertex.value_or(0)}
        };
    }

    const auto& stats = result.correspondenceStats;
    report["correspondence"] = {
        {"vertices", stats.vertexCount},
        {"seamVertices", stats.seamVertices},
        {"pairedVertices", stats.pairedVertices},
        {"asymmetricVertices", stats.asymmetricVertices},
        {"maxMirrorDistance", stats.maxMirrorDistance},
        {"meanMirrorDistance", stats.meanMirrorDistance},
        {"symmetryResidual", stats.symmetryResidual},
        {"reused", result.correspondenceReused},
        {"tieBreak", std::string(core::toString(config.correspondenceConfig.tieBreak))},
        {"seamPolicy", std::string(core::toString(config.transferConfig.seamPolicy))}
    };

    auto blendshapes = nlohmann::json::array();
    for (const auto& outcome : result.outcomes) {
        nlohmann::json entry;
        entry["input"] = outcome.input.string();
        entry["name"] = outcome.name;
        entry["success"] = outcome.success;
        if (outcome.side) {
            entry["side"] = std::string(core::toString(*outcome.side));
        }
        if (!outcome.outputName.empty()) {
            entry["outputName"] = outcome.outputName;
        }
        if (outcome.outputFile) {
            entry["outputFile"] = outcome.outputFile->string();
        }
        if (outcome.mirrorError) {
            entry["mirrorError"] = std::string(core::toString(*outcome.mirrorError));
        }
        if (!outcome.errorMessage.empty()) {
            entry["error"] = outcome.errorMessage;
        }
        entry["stats"] = {
            {"sourceVertices", outcome.stats.sourceVertices},
            {"targetVertices", outcome.stats.targetVertices},
            {"seamVertices", outcome.stats.seamVertices},
            {"sculptedVertices", outcome.stats.sculptedVertices},
            {"crossSideTargets", outcome.stats.crossSideTargets},
            {"maxDeltaLength", outcome.stats.maxDeltaLength}
        };
        blendshapes.push_back(std::move(entry));
    }
    report["blendshapes"] = std::move(blendshapes);

    return report;
}

} // namespace shapemirror::pipeline
