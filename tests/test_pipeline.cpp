#include "catch2/catch_test_macros.hpp"
#include "catch2/catch_approx.hpp"
#include "pipeline/MirrorPipeline.hpp"
#include <fmt/format.h>
#include <fstream>

namespace {
    namespace fs = std::filesystem;

    void writeFile(const fs::path& path, const std::string& text) {
        std::ofstream file(path);
        file << text;
    }

    std::string diamondObj(float z0 = 0.0f) {
        return fmt::format(
            "v -1 0 {}\n"
            "v 1 0 0\n"
            "v 0 1 0\n"
            "v 0 -1 0\n"
            "f 1 2 3\n"
            "f 1 4 2\n", z0);
    }

    // 每个测试用例独立的临时目录
    struct Workspace {
        fs::path dir;

        explicit Workspace(const std::string& name)
            : dir(fs::temp_directory_path() / ("shapemirror_test_" + name)) {
            fs::remove_all(dir);
            fs::create_directories(dir);
            writeFile(dir / "neutral.obj", diamondObj());
            writeFile(dir / "brow_l_raise.obj", diamondObj(0.5f));
            writeFile(dir / "jaw_open.obj", diamondObj(0.5f));
            writeFile(dir / "lip_l_up.obj", "v 0 0 0\nv 1 0 0\nv 0 1 0\n");
        }

        ~Workspace() {
            std::error_code ec;
            fs::remove_all(dir, ec);
        }

        fs::path operator/(const std::string& name) const { return dir / name; }
    };
}

TEST_CASE("Mirror Pipeline - Configuration validation", "[pipeline]") {
    using namespace shapemirror;
    Workspace ws("validate");

    auto valid = pipeline::createPipeline()
        .withBaseMesh(ws / "neutral.obj")
        .withBlendshape(ws / "brow_l_raise.obj")
        .withSeamVertex(2)
        .withOutput(ws / "out")
        .config();

    SECTION("Valid configuration") {
        REQUIRE(pipeline::validateConfig(valid).has_value());
    }

    SECTION("Missing base mesh") {
        auto config = valid;
        config.baseMesh = ws / "missing.obj";
        REQUIRE(pipeline::validateConfig(config).error() == pipeline::PipelineError::InputError);
    }

    SECTION("No blendshapes") {
        auto config = valid;
        config.blendshapes.clear();
        REQUIRE(pipeline::validateConfig(config).error() == pipeline::PipelineError::InputError);
    }

    SECTION("No seam selection") {
        auto config = valid;
        config.seamVertex.reset();
        REQUIRE(pipeline::validateConfig(config).error() == pipeline::PipelineError::ConfigError);
    }

    SECTION("Identical side markers") {
        auto config = valid;
        config.sideMarkers = core::SideMarkers{"_x_", "_x_"};
        REQUIRE(pipeline::validateConfig(config).error() == pipeline::PipelineError::ConfigError);
    }

    SECTION("Output directory required unless previewing") {
        auto config = valid;
        config.outputDirectory.clear();
        REQUIRE(pipeline::validateConfig(config).error() == pipeline::PipelineError::ConfigError);

        config.previewOnly = true;
        REQUIRE(pipeline::validateConfig(config).has_value());
    }
}

TEST_CASE("Mirror Pipeline - Export", "[pipeline]") {
    using namespace shapemirror;
    Workspace ws("export");

    auto result = pipeline::createPipeline()
        .withBaseMesh(ws / "neutral.obj")
        .withBlendshape(ws / "brow_l_raise.obj")
        .withSeamVertex(2)
        .withOutput(ws / "out")
        .withReport(ws / "report.json")
        .withLogging(false)
        .execute();

    REQUIRE(result.success);
    REQUIRE(result.plane.has_value());
    REQUIRE(result.plane->offset == Catch::Approx(0.0f));
    REQUIRE(result.correspondenceStats.seamVertices == 2);
    REQUIRE_FALSE(result.correspondenceReused);

    REQUIRE(result.outcomes.size() == 1);
    const auto& outcome = result.outcomes[0];
    REQUIRE(outcome.success);
    REQUIRE(outcome.side == core::SideTag::Left);
    REQUIRE(outcome.outputName == "brow_r_raise");
    REQUIRE(outcome.outputFile == ws / "out" / "brow_r_raise.obj");
    REQUIRE_FALSE(outcome.mesh.has_value());

    auto mirrored = io::createObjReader()->readObj(ws / "out" / "brow_r_raise.obj");
    REQUIRE(mirrored.has_value());
    REQUIRE(mirrored->vertexCount() == 4);
    REQUIRE(mirrored->faceCount() == 2);
    REQUIRE(mirrored->position(0)[2] == Catch::Approx(0.5f));
    REQUIRE(mirrored->position(1)[2] == Catch::Approx(0.5f));
    REQUIRE(mirrored->position(2)[2] == Catch::Approx(0.0f));

    SECTION("Run report") {
        std::ifstream file(ws / "report.json");
        REQUIRE(file.is_open());
        auto report = nlohmann::json::parse(file);
        REQUIRE(report["success"] == true);
        REQUIRE(report["plane"]["axis"] == "x");
        REQUIRE(report["blendshapes"].size() == 1);
        REQUIRE(report["blendshapes"][0]["outputName"] == "brow_r_raise");
    }
}

TEST_CASE("Mirror Pipeline - Preview and cache reuse", "[pipeline]") {
    using namespace shapemirror;
    Workspace ws("preview");

    auto pipe = pipeline::createPipeline()
        .withBaseMesh(ws / "neutral.obj")
        .withBlendshape(ws / "brow_l_raise.obj")
        .withSeamVertex(2)
        .withPreview()
        .withLogging(false)
        .build();

    auto first = pipe.execute();
    REQUIRE(first.success);
    REQUIRE(first.outputFiles.empty());
    REQUIRE(first.outcomes[0].mesh.has_value());
    REQUIRE(first.outcomes[0].mesh->name() == "brow_r_raise");
    REQUIRE(first.outcomes[0].mesh->position(1)[2] == Catch::Approx(0.5f));
    REQUIRE_FALSE(fs::exists(ws / "brow_r_raise.obj"));

    auto second = pipe.execute();
    REQUIRE(second.success);
    REQUIRE(second.correspondenceReused);
    REQUIRE(pipe.cache().size() == 1);

    SECTION("In-memory mirror uses the cached map") {
        auto blend = pipe.baseMesh()->withName("cheek_r_puff");
        blend.setPosition(1, {1.0f, 0.25f, 0.0f});

        auto mirrored = pipe.mirror(blend);
        REQUIRE(mirrored.has_value());
        REQUIRE(mirrored->mesh.position(0)[1] == Catch::Approx(0.25f));
        REQUIRE(pipe.cache().size() == 1);
    }

    SECTION("Changing the seam rebuilds the map") {
        auto config = pipe.config();
        config.seamVertex = 3;
        pipe.updateConfig(config);

        auto third = pipe.execute();
        REQUIRE(third.success);
        REQUIRE_FALSE(third.correspondenceReused);
        REQUIRE(pipe.cache().size() == 2);
    }
}

TEST_CASE("Mirror Pipeline - Failures", "[pipeline]") {
    using namespace shapemirror;
    Workspace ws("failures");

    SECTION("Seam vertex out of range") {
        auto result = pipeline::createPipeline()
            .withBaseMesh(ws / "neutral.obj")
            .withBlendshape(ws / "brow_l_raise.obj")
            .withSeamVertex(10)
            .withPreview()
            .withLogging(false)
            .execute();

        REQUIRE_FALSE(result.success);
        REQUIRE(result.mirrorError == core::MirrorError::InvalidSelection);
        REQUIRE(result.outcomes.empty());
    }

    SECTION("One failing blendshape does not stop the others") {
        auto result = pipeline::createPipeline()
            .withBaseMesh(ws / "neutral.obj")
            .withBlendshapes({ws / "jaw_open.obj", ws / "brow_l_raise.obj", ws / "lip_l_up.obj"})
            .withSeamVertex(2)
            .withOutput(ws / "out")
            .withLogging(false)
            .execute();

        REQUIRE_FALSE(result.success);
        REQUIRE(result.outcomes.size() == 3);
        REQUIRE(result.mirrorError == core::MirrorError::MissingSideTag);

        REQUIRE_FALSE(result.outcomes[0].success);
        REQUIRE(result.outcomes[0].mirrorError == core::MirrorError::MissingSideTag);

        REQUIRE(result.outcomes[1].success);
        REQUIRE(fs::exists(ws / "out" / "brow_r_raise.obj"));

        REQUIRE_FALSE(result.outcomes[2].success);
        REQUIRE(result.outcomes[2].mirrorError == core::MirrorError::TopologyMismatch);
        REQUIRE_FALSE(fs::exists(ws / "out" / "lip_r_up.obj"));
    }

    SECTION("Unreadable blendshape") {
        auto result = pipeline::createPipeline()
            .withBaseMesh(ws / "neutral.obj")
            .withBlendshape(ws / "missing_l_.obj")
            .withSeamVertex(2)
            .withPreview()
            .withLogging(false)
            .execute();

        REQUIRE_FALSE(result.success);
        REQUIRE(result.outcomes.size() == 1);
        REQUIRE_FALSE(result.outcomes[0].mirrorError.has_value());
    }
}

TEST_CASE("Mirror Pipeline - Correspondence files", "[pipeline]") {
    using namespace shapemirror;
    Workspace ws("mapfiles");

    auto saved = pipeline::createPipeline()
        .withBaseMesh(ws / "neutral.obj")
        .withBlendshape(ws / "brow_l_raise.obj")
        .withSeamVertex(2)
        .withPreview()
        .withCorrespondenceFiles(std::nullopt, ws / "map.json")
        .withLogging(false)
        .execute();

    REQUIRE(saved.success);
    REQUIRE(fs::exists(ws / "map.json"));

    SECTION("Matching map is reused") {
        auto loaded = pipeline::createPipeline()
            .withBaseMesh(ws / "neutral.obj")
            .withBlendshape(ws / "brow_l_raise.obj")
            .withSeamVertex(2)
            .withPreview()
            .withCorrespondenceFiles(ws / "map.json", std::nullopt)
            .withLogging(false)
            .execute();

        REQUIRE(loaded.success);
        REQUIRE(loaded.correspondenceReused);
    }

    SECTION("Map for another seam is rebuilt") {
        auto rebuilt = pipeline::createPipeline()
            .withBaseMesh(ws / "neutral.obj")
            .withBlendshape(ws / "brow_l_raise.obj")
            .withSeamVertex(3)
            .withPreview()
            .withCorrespondenceFiles(ws / "map.json", std::nullopt)
            .withLogging(false)
            .execute();

        REQUIRE(rebuilt.success);
        REQUIRE_FALSE(rebuilt.correspondenceReused);
    }

    SECTION("Corrupt map file fails the run") {
        writeFile(ws / "bad.json", "{ broken");
        auto result = pipeline::createPipeline()
            .withBaseMesh(ws / "neutral.obj")
            .withBlendshape(ws / "brow_l_raise.obj")
            .withSeamVertex(2)
            .withPreview()
            .withCorrespondenceFiles(ws / "bad.json", std::nullopt)
            .withLogging(false)
            .execute();

        REQUIRE_FALSE(result.success);
        REQUIRE(result.outcomes.empty());
    }
}
