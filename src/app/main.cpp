#include "../pipeline/MirrorPipeline.hpp"
#include <iostream>
#include <filesystem>
#include <chrono>
#include <cxxopts.hpp>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#ifndef SHAPEMIRROR_VERSION
#define SHAPEMIRROR_VERSION "0.1.0"
#endif

using namespace shapemirror;

// 命令行选项结构
struct CommandLineOptions {
    std::string baseMesh;
    std::vector<std::string> blendshapes;
    std::optional<core::Index> seamVertex;
    core::Axis axis{core::Axis::X};
    std::string outputDir;
    core::Half leftHalf{core::Half::Negative};
    core::SeamPolicy seamPolicy{core::SeamPolicy::Authoritative};
    core::TieBreak tieBreak{core::TieBreak::LowestIndex};
    core::SearchMethod searchMethod{core::SearchMethod::Grid};
    float seamEpsilon{1e-5f};
    float tieTolerance{1e-6f};
    bool enableParallel{false};
    std::string leftMarker{"_l_"};
    std::string rightMarker{"_r_"};
    bool preview{false};
    std::string saveMap;
    std::string loadMap;
    std::string report;
    bool verbose{false};
    bool quiet{false};
    std::string logFile;
    bool dryRun{false};
};

namespace {

template<typename T, typename Parse>
std::expected<T, std::string> parseChoice(const std::string& option, const std::string& text, Parse parse) {
    auto value = parse(text);
    if (!value) {
        return std::unexpected(fmt::format("Invalid value '{}' for --{}", text, option));
    }
    return *value;
}

}

// 解析命令行参数
std::expected<CommandLineOptions, std::string> parseCommandLine(int argc, char* argv[]) {
    try {
        cxxopts::Options options("shapemirror", "Mirror left/right blendshape sculpts across a symmetry plane");

        options.add_options()
            ("b,base", "Base (neutral) OBJ mesh", cxxopts::value<std::string>())
            ("s,blendshape", "Blendshape OBJ mesh (repeatable)", cxxopts::value<std::vector<std::string>>())
            ("seam", "Index of a vertex on the symmetry line", cxxopts::value<core::Index>())
            ("a,axis", "Mirror axis (x,y,z)", cxxopts::value<std::string>()->default_value("x"))
            ("o,output", "Output directory", cxxopts::value<std::string>())
            ("left-half", "Half-space of the left side (negative,positive)", cxxopts::value<std::string>()->default_value("negative"))
            ("seam-policy", "Seam vertex policy (authoritative,symmetrize)", cxxopts::value<std::string>()->default_value("authoritative"))
            ("tie-break", "Equidistant candidate choice (lowest,highest)", cxxopts::value<std::string>()->default_value("lowest"))
            ("search", "Nearest vertex search (grid,brute-force)", cxxopts::value<std::string>()->default_value("grid"))
            ("seam-epsilon", "Distance under which a vertex maps to itself", cxxopts::value<float>()->default_value("1e-5"))
            ("tie-tolerance", "Distance difference treated as a tie", cxxopts::value<float>()->default_value("1e-6"))
            ("parallel", "Enable parallel correspondence search", cxxopts::value<bool>()->default_value("false"))
            ("left-marker", "Left side name marker", cxxopts::value<std::string>()->default_value("_l_"))
            ("right-marker", "Right side name marker", cxxopts::value<std::string>()->default_value("_r_"))
            ("preview", "Compute without writing meshes", cxxopts::value<bool>()->default_value("false"))
            ("save-map", "Save correspondence JSON", cxxopts::value<std::string>())
            ("load-map", "Load correspondence JSON", cxxopts::value<std::string>())
            ("report", "Write JSON run report", cxxopts::value<std::string>())
            ("v,verbose", "Verbose output", cxxopts::value<bool>()->default_value("false"))
            ("q,quiet", "Quiet mode", cxxopts::value<bool>()->default_value("false"))
            ("log-file", "Log file path", cxxopts::value<std::string>())
            ("dry-run", "Dry run (validate only)", cxxopts::value<bool>()->default_value("false"))
            ("h,help", "Show help");

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            std::exit(0);
        }

        CommandLineOptions opts;

        if (result.count("base")) {
            opts.baseMesh = result["base"].as<std::string>();
        } else {
            return std::unexpected("Base mesh is required");
        }

        if (result.count("blendshape")) {
            opts.blendshapes = result["blendshape"].as<std::vector<std::string>>();
        } else {
            return std::unexpected("At least one blendshape is required");
        }

        // 接缝顶点缺失交给管道报告为 InvalidSelection
        if (result.count("seam")) {
            opts.seamVertex = result["seam"].as<core::Index>();
        }

        opts.preview = result["preview"].as<bool>();
        if (result.count("output")) {
            opts.outputDir = result["output"].as<std::string>();
        } else if (!opts.preview) {
            return std::unexpected("Output directory is required");
        }

        auto axis = parseChoice<core::Axis>("axis", result["axis"].as<std::string>(), core::parseAxis);
        auto leftHalf = parseChoice<core::Half>("left-half", result["left-half"].as<std::string>(), core::parseHalf);
        auto seamPolicy = parseChoice<core::SeamPolicy>("seam-policy", result["seam-policy"].as<std::string>(),
                                                        core::parseSeamPolicy);
        auto tieBreak = parseChoice<core::TieBreak>("tie-break", result["tie-break"].as<std::string>(),
                                                    core::parseTieBreak);
        auto search = parseChoice<core::SearchMethod>("search", result["search"].as<std::string>(),
                                                      core::parseSearchMethod);
        if (!axis) return std::unexpected(axis.error());
        if (!leftHalf) return std::unexpected(leftHalf.error());
        if (!seamPolicy) return std::unexpected(seamPolicy.error());
        if (!tieBreak) return std::unexpected(tieBreak.error());
        if (!search) return std::unexpected(search.error());

        opts.axis = *axis;
        opts.leftHalf = *leftHalf;
        opts.seamPolicy = *seamPolicy;
        opts.tieBreak = *tieBreak;
        opts.searchMethod = *search;
        opts.seamEpsilon = result["seam-epsilon"].as<float>();
        opts.tieTolerance = result["tie-tolerance"].as<float>();
        opts.enableParallel = result["parallel"].as<bool>();
        opts.leftMarker = result["left-marker"].as<std::string>();
        opts.rightMarker = result["right-marker"].as<std::string>();
        opts.verbose = result["verbose"].as<bool>();
        opts.quiet = result["quiet"].as<bool>();
        opts.dryRun = result["dry-run"].as<bool>();

        if (result.count("save-map")) {
            opts.saveMap = result["save-map"].as<std::string>();
        }
        if (result.count("load-map")) {
            opts.loadMap = result["load-map"].as<std::string>();
        }
        if (result.count("report")) {
            opts.report = result["report"].as<std::string>();
        }
        if (result.count("log-file")) {
            opts.logFile = result["log-file"].as<std::string>();
        }

        return opts;

    } catch (const std::exception& e) {
        return std::unexpected(std::string("Command line parsing error: ") + e.what());
    }
}

// 设置日志系统
void setupLogging(const CommandLineOptions& opts) {
    std::vector<spdlog::sink_ptr> sinks;

    if (!opts.quiet) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(opts.verbose ? spdlog::level::debug : spdlog::level::info);
        sinks.push_back(console_sink);
    }

    if (!opts.logFile.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(opts.logFile, true);
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("shapemirror", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace);
    spdlog::set_default_logger(logger);

    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
}

// 进度回调
void progressCallback(double progress, const std::string& message) {
    static auto lastUpdate = std::chrono::steady_clock::now();
    auto now = std::chrono::steady_clock::now();

    // 限制更新频率（每100ms）
    if (std::chrono::duration_cast<std::chrono::milliseconds>(now - lastUpdate).count() < 100
        && progress < 1.0) {
        return;
    }
    lastUpdate = now;

    std::cout << "\r[" << std::string(static_cast<size_t>(30 * progress), '#')
              << std::string(30 - static_cast<size_t>(30 * progress), ' ') << "] "
              << static_cast<int>(progress * 100.0) << "% " << message;
    std::cout.flush();

    if (progress >= 1.0) {
        std::cout << std::endl;
    }
}

// 日志回调
void logCallback(const std::string& level, const std::string& message) {
    if (level == "trace") spdlog::trace(message);
    else if (level == "debug") spdlog::debug(message);
    else if (level == "info") spdlog::info(message);
    else if (level == "warn") spdlog::warn(message);
    else if (level == "error") spdlog::error(message);
    else spdlog::info(message);
}

// 构建管道配置
pipeline::PipelineConfig buildPipelineConfig(const CommandLineOptions& opts) {
    pipeline::PipelineConfig config;

    // 输入配置
    config.baseMesh = opts.baseMesh;
    config.blendshapes.assign(opts.blendshapes.begin(), opts.blendshapes.end());
    config.seamVertex = opts.seamVertex;

    // 镜像配置
    config.axis = opts.axis;
    config.correspondenceConfig.seamEpsilon = opts.seamEpsilon;
    config.correspondenceConfig.tieTolerance = opts.tieTolerance;
    config.correspondenceConfig.tieBreak = opts.tieBreak;
    config.correspondenceConfig.searchMethod = opts.searchMethod;
    config.correspondenceConfig.enableParallelProcessing = opts.enableParallel;
    config.transferConfig.leftHalf = opts.leftHalf;
    config.transferConfig.seamPolicy = opts.seamPolicy;
    config.sideMarkers = core::SideMarkers{opts.leftMarker, opts.rightMarker};

    // 输出配置
    config.outputDirectory = opts.outputDir;
    config.previewOnly = opts.preview;
    if (!opts.loadMap.empty()) config.loadMapFile = opts.loadMap;
    if (!opts.saveMap.empty()) config.saveMapFile = opts.saveMap;
    if (!opts.report.empty()) config.reportFile = opts.report;

    config.enableProgressReporting = !opts.quiet;
    config.enableLogging = true;

    return config;
}

// 显示结果摘要
void showResultSummary(const pipeline::PipelineResult& result) {
    spdlog::info("=== Mirror Complete ===");
    spdlog::info("Success: {}", result.success ? "Yes" : "No");

    if (result.plane) {
        spdlog::info("Plane: {} = {:.6f}", core::toString(result.plane->axis), result.plane->offset);

        const auto& stats = result.correspondenceStats;
        spdlog::info("Correspondence: {} vertices, {} seam, {} paired, {} asymmetric{}",
                     stats.vertexCount, stats.seamVertices, stats.pairedVertices,
                     stats.asymmetricVertices, result.correspondenceReused ? " (reused)" : "");
        spdlog::info("Mirror distance: mean {:.6f}, max {:.6f}, residual {:.6f}",
                     stats.meanMirrorDistance, stats.maxMirrorDistance, stats.symmetryResidual);
    }

    for (const auto& outcome : result.outcomes) {
        if (outcome.success) {
            spdlog::info("  {} -> {} ({} target vertices)", outcome.name, outcome.outputName,
                         outcome.stats.targetVertices);
        } else {
            spdlog::error("  {} failed: {}", outcome.input.filename().string(), outcome.errorMessage);
        }
    }

    if (!result.success) {
        spdlog::error("Error: {}", result.errorMessage);
        if (result.mirrorError) {
            spdlog::error("Mirror error: {}", core::toString(*result.mirrorError));
        }
        return;
    }

    spdlog::info("Processing time: {:.2f} seconds", result.processingTime.count() / 1000.0);

    spdlog::info("Output files:");
    for (const auto& file : result.outputFiles) {
        spdlog::info("  - {}", file.string());
    }
}

int main(int argc, char* argv[]) {
    try {
        // 解析命令行
        auto optsResult = parseCommandLine(argc, argv);
        if (!optsResult) {
            std::cerr << "Error: " << optsResult.error() << std::endl;
            return 1;
        }
        const auto opts = *optsResult;

        // 设置日志
        setupLogging(opts);

        spdlog::info("shapemirror v{}", SHAPEMIRROR_VERSION);
        spdlog::info("Base: {}", opts.baseMesh);
        spdlog::info("Blendshapes: {}", fmt::join(opts.blendshapes, ", "));
        spdlog::info("Output: {}", opts.preview ? "(preview)" : opts.outputDir);
        spdlog::info("Axis: {}, seam policy: {}, tie-break: {}, search: {}",
                     core::toString(opts.axis), core::toString(opts.seamPolicy),
                     core::toString(opts.tieBreak), core::toString(opts.searchMethod));

        // 构建管道配置
        auto config = buildPipelineConfig(opts);

        // 验证配置
        auto validation = pipeline::validateConfig(config);
        if (!validation) {
            spdlog::error("Configuration validation failed: {}", pipeline::toString(validation.error()));
            if (!config.seamVertex) {
                spdlog::error("Mirror error: {}", core::toString(core::MirrorError::InvalidSelection));
            }
            return 1;
        }

        if (opts.dryRun) {
            spdlog::info("Dry run completed successfully");
            return 0;
        }

        spdlog::info("Starting mirror...");

        auto pipeline = pipeline::MirrorPipeline{std::move(config)};
        auto result = pipeline.execute(
            opts.quiet ? pipeline::ProgressCallback{} : progressCallback,
            logCallback
        );

        // 显示结果
        showResultSummary(result);

        return result.success ? 0 : 1;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
