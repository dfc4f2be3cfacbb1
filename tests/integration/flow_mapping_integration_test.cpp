// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include <gtest/gtest.h>

#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

#include "core/parameter_table.hpp"
#include "services/flow/flow_matrix_io.hpp"
#include "services/flow/interval_catalog.hpp"
#include "services/flow/run_configuration.hpp"
#include "services/flow/segment_catalog.hpp"

#include "../test_utils/kymograph_phantom_generator.hpp"

using namespace flow_mapper::services;
using flow_mapper::core::ParameterKind;
using flow_mapper::core::ParameterTable;
namespace phantom = flow_mapper::test_utils;

namespace {

void writeText(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path);
    file << content;
}

std::string readText(const std::filesystem::path& path) {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

}  // anonymous namespace

// =============================================================================
// E2E-001: Video to velocity matrix to spatial map
// Pipeline: config file -> runAnalysis -> CSV matrices -> runRendering -> TIFF
// Ground truth: sinusoid moving at -1.5 px/frame, 20 fps, 0.5 um/px = -15 um/s
// =============================================================================

class FlowMappingIntegration : public ::testing::Test {
protected:
    static constexpr int kWidth = 128;
    static constexpr int kHeight = 32;
    static constexpr int kFrames = 80;
    static constexpr double kExpectedVelocity = -15.0;

    void SetUp() override {
        dir_ = std::make_unique<phantom::TempDirectory>("integration");
        const auto& root = dir_->path();

        phantom::SinusoidPhantom pattern;
        pattern.velocity = -1.5;
        phantom::writeVideoStack(
            phantom::createSinusoidVideo(kWidth, kHeight, kFrames, pattern),
            root / "video.mha");

        writeText(root / "segments.json", R"({
  "segments": [
    {"name": "main vessel", "points": [[0, 16], [127, 16]]},
    {"name": "branch", "points": [[20, 4], [20, 12]]}
  ]
})");
        writeText(root / "intervals.txt", "// startFrame,endFrame\n1,40\n41,80\n");

        writeText(root / "flow.cfg", std::format(
            "// flow mapping run\n"
            "videoPath,{0}/video.mha,stack\n"
            "segmentsPath,{0}/segments.json,traced segments\n"
            "intervalsPath,{0}/intervals.txt,selected intervals\n"
            "outputDirectory,{0}/results,results\n"
            "pixelSize,0.5,um/px\n"
            "frameRate,20,fps\n"
            "minSegmentLength,10,um\n"
            "maxMeasuredSpeed,500,um/s\n"
            "maxPlotSpeed,30,um/s\n"
            "arrowCutoff,5,um/s\n"
            "lutName,Fire,colour table\n",
            root.string()));
    }

    [[nodiscard]] ParameterTable loadTable() const {
        auto table = ParameterTable::load(dir_->path() / "flow.cfg");
        EXPECT_TRUE(table.has_value()) << table.error().toString();
        return *table;
    }

    [[nodiscard]] std::filesystem::path results() const {
        return dir_->path() / "results";
    }

    std::unique_ptr<phantom::TempDirectory> dir_;
};

TEST_F(FlowMappingIntegration, AnalysisWritesExpectedMatrices) {
    auto table = loadTable();

    auto result = runAnalysis(table);
    ASSERT_TRUE(result.has_value()) << result.error().toString();

    for (const char* name : {FlowMatrixIO::kVelocityFile, FlowMatrixIO::kAngleFile,
                             FlowMatrixIO::kFitFile, FlowMatrixIO::kAnomalyFile,
                             FlowMatrixIO::kSegmentLengthFile}) {
        EXPECT_TRUE(std::filesystem::exists(results() / name)) << name;
    }

    auto segments = SegmentCatalog::load(dir_->path() / "segments.json", 0.5);
    auto intervals = IntervalCatalog::load(dir_->path() / "intervals.txt");
    ASSERT_TRUE(segments.has_value());
    ASSERT_TRUE(intervals.has_value());

    auto velocity = FlowMatrixIO::read(results() / FlowMatrixIO::kVelocityFile,
                                       *intervals, *segments);
    ASSERT_TRUE(velocity.has_value()) << velocity.error().toString();
    EXPECT_EQ(*velocity, result->matrices.velocity);

    for (int interval = 1; interval <= 2; ++interval) {
        const auto& main = velocity->at(interval, 1);
        ASSERT_TRUE(main.isNumeric());
        EXPECT_NEAR(main.value, kExpectedVelocity, 0.75);
        // 8 px * 0.5 um = 4 um, below the 10 um minimum
        EXPECT_EQ(velocity->at(interval, 2).state, CellState::TooShort);
    }

    EXPECT_EQ(readText(results() / FlowMatrixIO::kVelocityFile).substr(0, 22),
              "// main vessel,branch\n");
}

TEST_F(FlowMappingIntegration, AnalysisIsReproducible) {
    auto table = loadTable();
    ASSERT_TRUE(runAnalysis(table).has_value());
    const auto first = readText(results() / FlowMatrixIO::kVelocityFile);

    ASSERT_TRUE(table.set(ParameterKind::Threads, "3").has_value());
    ASSERT_TRUE(runAnalysis(table).has_value());
    EXPECT_EQ(readText(results() / FlowMatrixIO::kVelocityFile), first);
    EXPECT_EQ(readText(results() / "velocity.csv.bak"), first);
}

TEST_F(FlowMappingIntegration, RenderingProducesSpatialMap) {
    auto table = loadTable();
    ASSERT_TRUE(runAnalysis(table).has_value());

    auto map = runRendering(table);
    ASSERT_TRUE(map.has_value()) << map.error().toString();
    EXPECT_EQ(*map, results() / kSpatialMapFile);
    ASSERT_TRUE(std::filesystem::exists(*map));
    EXPECT_GT(std::filesystem::file_size(*map), 0u);
}

TEST_F(FlowMappingIntegration, RenderingWithFitGate) {
    auto table = loadTable();
    ASSERT_TRUE(runAnalysis(table).has_value());

    RenderOptions options;
    options.minFitGoodness = 0.5;
    auto map = runRendering(table, options);
    ASSERT_TRUE(map.has_value()) << map.error().toString();

    options.fitMatrixPath = dir_->path() / "missing_fit.csv";
    auto missing = runRendering(table, options);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, FlowError::Code::FileAccess);
}

TEST_F(FlowMappingIntegration, RenderingBeforeAnalysisFails) {
    auto map = runRendering(loadTable());
    ASSERT_FALSE(map.has_value());
    EXPECT_EQ(map.error().code, FlowError::Code::FileAccess);
}

TEST_F(FlowMappingIntegration, IntervalsBeyondVideoFailWithoutOutputs) {
    writeText(dir_->path() / "intervals.txt", "1,40\n41,81\n");
    auto result = runAnalysis(loadTable());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, FlowError::Code::Range);
    EXPECT_FALSE(std::filesystem::exists(results() / FlowMatrixIO::kVelocityFile));
}

TEST_F(FlowMappingIntegration, RunWithBadRenderConfigWritesNothing) {
    auto table = loadTable();
    ASSERT_TRUE(table.set(ParameterKind::LutName, "Viridis").has_value());

    auto map = runAnalysisAndRendering(table);
    ASSERT_FALSE(map.has_value());
    EXPECT_EQ(map.error().code, FlowError::Code::Configuration);
    EXPECT_FALSE(std::filesystem::exists(results() / FlowMatrixIO::kVelocityFile));

    ASSERT_TRUE(table.set(ParameterKind::LutName, "Fire").has_value());
    auto completed = runAnalysisAndRendering(table);
    ASSERT_TRUE(completed.has_value()) << completed.error().toString();
    EXPECT_TRUE(std::filesystem::exists(results() / FlowMatrixIO::kVelocityFile));
    EXPECT_EQ(*completed, results() / kSpatialMapFile);
}
