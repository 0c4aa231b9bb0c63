#pragma once

#include "../core/CorrespondenceCache.hpp"
#include "../core/DeltaTransfer.hpp"
#include "../io/CorrespondenceStore.hpp"
#include "../io/ObjReader.hpp"
#include "../io/ObjWriter.hpp"
#include <chrono>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>

namespace shapemirror::pipeline {

// 管道错误类型
enum class PipelineError {
    InputError,
    ProcessingError,
    OutputError,
    ConfigError
};

constexpr std::string_view toString(PipelineError error) noexcept {
    switch (error) {
        case PipelineError::InputError: return "InputError";
        case PipelineError::ProcessingError: return "ProcessingError";
        case PipelineError::OutputError: return "OutputError";
        case PipelineError::ConfigError: return "ConfigError";
    }
    return "Unknown";
}

// 管道配置
struct PipelineConfig {
    // 输入配置
    std::filesystem::path baseMesh;
    std::vector<std::filesystem::path> blendshapes;
    std::optional<core::Index> seamVertex;

    // 镜像配置
    core::Axis axis{core::Axis::X};
    core::CorrespondenceConfig correspondenceConfig;
    core::TransferConfig transferConfig;
    core::SideMarkers sideMarkers;

    // 输出配置
    std::filesystem::path outputDirectory;
    bool previewOnly{false};  // 只计算不导出
    io::ObjWriteConfig objConfig;

    // 对应映射与报告文件
    std::optional<std::filesystem::path> loadMapFile;
    std::optional<std::filesystem::path> saveMapFile;
    std::optional<std::filesystem::path> reportFile;

    // 处理配置
    bool enableProgressReporting{true};
    bool enableLogging{true};
};

// 进度回调函数类型
using ProgressCallback = std::function<void(double progress, const std::string& message)>;
using LogCallback = std::function<void(const std::string& level, const std::string& message)>;

// 单个融合变形的处理结果
struct BlendshapeOutcome {
    std::filesystem::path input;
    std::string name;
    std::optional<core::SideTag> side;
    std::string outputName;
    std::optional<std::filesystem::path> outputFile;
    core::TransferStats stats;
    std::optional<core::Mesh> mesh;   // 预览模式下保留结果
    bool success{false};
    std::optional<core::MirrorError> mirrorError;
    std::string errorMessage;
};

// 管道结果
struct PipelineResult {
    std::optional<core::MirrorPlane> plane;
    core::CorrespondenceStats correspondenceStats;
    bool correspondenceReused{false};
    std::vector<BlendshapeOutcome> outcomes;
    std::vector<std::filesystem::path> outputFiles;
    std::chrono::milliseconds processingTime{0};
    bool success{false};
    std::string errorMessage;
    std::optional<core::MirrorError> mirrorError;
};

// 函数式管道组件
namespace components {

// 输入阶段：读取 OBJ 网格
[[nodiscard]] std::expected<core::Mesh, PipelineError>
loadMesh(const std::filesystem::path& path, const ProgressCallback& progress = nullptr);

// 镜像阶段：纯函数，不访问文件
[[nodiscard]] std::expected<core::TransferResult, core::MirrorError>
mirrorBlendshape(const core::Mesh& base, const core::Mesh& blendshape,
                 const core::CorrespondenceMap& map, const core::MirrorPlane& plane,
                 const core::SideMarkers& markers, const core::TransferConfig& config);

// 输出阶段：写出 <outputDir>/<name>.obj
[[nodiscard]] std::expected<std::filesystem::path, PipelineError>
exportMesh(const core::Mesh& mesh, const std::filesystem::path& outputDir,
           const io::ObjWriteConfig& config, const ProgressCallback& progress = nullptr);

} // namespace components

// 主管道类，持有会话状态：基础网格与对应映射缓存
class MirrorPipeline {
public:
    explicit MirrorPipeline(PipelineConfig config)
        : config_(std::move(config)) {}

    // 执行完整管道
    [[nodiscard]] PipelineResult execute();

    // 执行管道（带回调）
    [[nodiscard]] PipelineResult execute(const ProgressCallback& progressCallback,
                                         const LogCallback& logCallback = nullptr);

    // 分步执行
    [[nodiscard]] std::expected<void, PipelineError> loadBase();
    void setBaseMesh(core::Mesh base);
    [[nodiscard]] std::expected<core::MirrorPlane, core::MirrorError> resolvePlane() const;
    [[nodiscard]] std::expected<core::CorrespondenceCache::MapPtr, PipelineError>
    correspondence(const core::MirrorPlane& plane);

    // 镜像内存中的融合变形（使用缓存的对应映射）
    [[nodiscard]] std::expected<core::TransferResult, core::MirrorError>
    mirror(const core::Mesh& blendshape);

    // 配置访问
    const PipelineConfig& config() const noexcept { return config_; }
    void updateConfig(PipelineConfig newConfig);

    const std::optional<core::Mesh>& baseMesh() const noexcept { return base_; }
    const core::CorrespondenceCache& cache() const noexcept { return cache_; }

private:
    PipelineConfig config_;
    std::optional<core::Mesh> base_;
    core::CorrespondenceCache cache_;
    bool lastMapReused_{false};

    // 内部状态
    mutable std::chrono::steady_clock::time_point startTime_;

    BlendshapeOutcome processBlendshape(const std::filesystem::path& path,
                                        const core::MirrorPlane& plane,
                                        const core::CorrespondenceMap& map,
                                        const LogCallback& logCallback);

    // 辅助方法
    void updateProgress(double progress, const std::string& message,
                        const ProgressCallback& callback) const;
    void log(const std::string& level, const std::string& message,
             const LogCallback& callback) const;
};

// 链式构建器
class PipelineBuilder {
public:
    PipelineBuilder() = default;

    PipelineBuilder& withBaseMesh(std::filesystem::path path) {
        config_.baseMesh = std::move(path);
        return *this;
    }

    PipelineBuilder& withBlendshape(std::filesystem::path path) {
        config_.blendshapes.push_back(std::move(path));
        return *this;
    }

    PipelineBuilder& withBlendshapes(std::vector<std::filesystem::path> paths) {
        config_.blendshapes = std::move(paths);
        return *this;
    }

    PipelineBuilder& withSeamVertex(core::Index vertex) {
        config_.seamVertex = vertex;
        return *this;
    }

    PipelineBuilder& withAxis(core::Axis axis) {
        config_.axis = axis;
        return *this;
    }

    PipelineBuilder& withCorrespondenceConfig(core::CorrespondenceConfig config) {
        config_.correspondenceConfig = config;
        return *this;
    }

    PipelineBuilder& withTransferConfig(core::TransferConfig config) {
        config_.transferConfig = config;
        return *this;
    }

    PipelineBuilder& withSideMarkers(core::SideMarkers markers) {
        config_.sideMarkers = std::move(markers);
        return *this;
    }

    PipelineBuilder& withOutput(std::filesystem::path outputDir) {
        config_.outputDirectory = std::move(outputDir);
        config_.previewOnly = false;
        return *this;
    }

    PipelineBuilder& withPreview() {
        config_.previewOnly = true;
        return *this;
    }

    PipelineBuilder& withCorrespondenceFiles(std::optional<std::filesystem::path> load,
                                             std::optional<std::filesystem::path> save) {
        config_.loadMapFile = std::move(load);
        config_.saveMapFile = std::move(save);
        return *this;
    }

    PipelineBuilder& withReport(std::filesystem::path reportFile) {
        config_.reportFile = std::move(reportFile);
        return *this;
    }

    PipelineBuilder& withLogging(bool enable) {
        config_.enableLogging = enable;
        return *this;
    }

    // 构建管道
    [[nodiscard]] MirrorPipeline build() {
        return MirrorPipeline{std::move(config_)};
    }

    // 直接执行（一次性使用）
    [[nodiscard]] PipelineResult execute() {
        return build().execute();
    }

    [[nodiscard]] PipelineResult execute(const ProgressCallback& progress,
                                         const LogCallback& log = nullptr) {
        return build().execute(progress, log);
    }

    const PipelineConfig& config() const noexcept { return config_; }

private:
    PipelineConfig config_;
};

// 工厂函数
[[nodiscard]] PipelineBuilder createPipeline();

// 便利函数：镜像单个融合变形文件
[[nodiscard]] PipelineResult
executeSingleMirror(const std::filesystem::path& baseMesh,
                    const std::filesystem::path& blendshape,
                    core::Index seamVertex,
                    const std::filesystem::path& outputDir,
                    core::Axis axis = core::Axis::X,
                    const ProgressCallback& progress = nullptr);

// 验证配置
[[nodiscard]] std::expected<void, PipelineError>
validateConfig(const PipelineConfig& config);

// 运行报告
[[nodiscard]] nlohmann::json buildReport(const PipelineConfig& config, const PipelineResult& result);

} // namespace shapemirror::pipeline
