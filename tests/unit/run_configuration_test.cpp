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

#include "services/flow/run_configuration.hpp"
#include "test_utils/kymograph_phantom_generator.hpp"

using namespace flow_mapper::services;
using flow_mapper::core::ParameterKind;
using flow_mapper::core::ParameterTable;
using flow_mapper::core::RgbColor;
using flow_mapper::test_utils::TempDirectory;

namespace {

ParameterTable calibratedTable() {
    auto table = ParameterTable::parse(
        "pixelSize,0.5,um per px\n"
        "frameRate,30,fps\n"
        "minSegmentLength,20,um\n"
        "maxMeasuredSpeed,2000,um/s\n"
        "outputDirectory,/tmp/flow_mapper_run_configuration,results\n"
        "maxPlotSpeed,1000,um/s\n");
    EXPECT_TRUE(table.has_value());
    return *table;
}

}  // anonymous namespace

TEST(RunConfigurationTest, AnalysisConfigCarriesTableValues) {
    auto config = analysisConfigFrom(calibratedTable());
    ASSERT_TRUE(config.has_value()) << config.error().toString();

    EXPECT_DOUBLE_EQ(config->pixelSize, 0.5);
    EXPECT_DOUBLE_EQ(config->frameRate, 30.0);
    EXPECT_DOUBLE_EQ(config->minSegmentLength, 20.0);
    EXPECT_DOUBLE_EQ(config->maxMeasuredSpeed, 2000.0);
    EXPECT_FALSE(config->flickerCorrection);
    EXPECT_EQ(config->threads, 1);
    EXPECT_FALSE(config->saveKymographs);
    EXPECT_EQ(config->outputDirectory, "/tmp/flow_mapper_run_configuration");
}

TEST(RunConfigurationTest, MissingCalibrationNamesKeyAndStep) {
    auto table = calibratedTable();
    ASSERT_TRUE(table.set(ParameterKind::FrameRate, "").has_value());

    auto config = analysisConfigFrom(table);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, FlowError::Code::Configuration);
    EXPECT_NE(config.error().message.find("frameRate"), std::string::npos);
    EXPECT_NE(config.error().message.find("microscope calibration"), std::string::npos);
}

TEST(RunConfigurationTest, SpatialMapDefaults) {
    auto config = spatialMapConfigFrom(calibratedTable());
    ASSERT_TRUE(config.has_value()) << config.error().toString();

    EXPECT_DOUBLE_EQ(config->maxPlotSpeed, 1000.0);
    EXPECT_EQ(config->lineThickness, 3);
    EXPECT_EQ(config->arrowSize, 6);
    EXPECT_DOUBLE_EQ(config->arrowCutoff, 0.0);
    EXPECT_EQ(config->backgroundColor, (RgbColor{0, 0, 0}));
    EXPECT_EQ(config->arrowColor, (RgbColor{255, 255, 255}));
    EXPECT_FALSE(config->minFitGoodness.has_value());
}

TEST(RunConfigurationTest, SpatialMapRequiresPlotSpeed) {
    auto table = calibratedTable();
    ASSERT_TRUE(table.set(ParameterKind::MaxPlotSpeed, "").has_value());

    auto config = spatialMapConfigFrom(table);
    ASSERT_FALSE(config.has_value());
    EXPECT_NE(config.error().message.find("maxPlotSpeed"), std::string::npos);
}

TEST(RunConfigurationTest, InputPathsMustExist) {
    auto table = calibratedTable();
    auto missing = inputPathsFrom(table);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, FlowError::Code::Configuration);
    EXPECT_NE(missing.error().message.find("videoPath"), std::string::npos);

    ASSERT_TRUE(table.set(ParameterKind::VideoPath, "/nonexistent/video.tif").has_value());
    auto notOnDisk = inputPathsFrom(table);
    ASSERT_FALSE(notOnDisk.has_value());
    EXPECT_NE(notOnDisk.error().message.find("video acquisition"), std::string::npos);
}

TEST(RunConfigurationTest, RunAnalysisFailsBeforeTouchingDisk) {
    auto table = calibratedTable();
    ASSERT_TRUE(table.set(ParameterKind::PixelSize, "").has_value());

    auto result = runAnalysis(table);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, FlowError::Code::Configuration);
    EXPECT_NE(result.error().message.find("pixelSize"), std::string::npos);
}

TEST(RunConfigurationTest, RunRenderingRejectsUnknownLut) {
    auto table = calibratedTable();
    ASSERT_TRUE(table.set(ParameterKind::LutName, "Viridis").has_value());

    auto result = runRendering(table);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, FlowError::Code::Configuration);
}

TEST(RunConfigurationTest, ConfigErrorConversionKeepsMessage) {
    flow_mapper::core::ConfigError error{
        flow_mapper::core::ConfigError::Code::MissingValue, "'x' is empty"};
    auto converted = toFlowError(error);
    EXPECT_EQ(converted.code, FlowError::Code::Configuration);
    EXPECT_EQ(converted.message, error.toString());
}

TEST(RunConfigurationTest, RenderSetupResolvesLut) {
    auto table = calibratedTable();
    ASSERT_TRUE(table.set(ParameterKind::LutName, "fire").has_value());

    auto setup = renderSetupFrom(table, RenderOptions{std::nullopt, 0.4});
    ASSERT_TRUE(setup.has_value()) << setup.error().toString();
    EXPECT_DOUBLE_EQ(setup->config.maxPlotSpeed, 1000.0);
    ASSERT_TRUE(setup->config.minFitGoodness.has_value());
    EXPECT_DOUBLE_EQ(*setup->config.minFitGoodness, 0.4);
}

TEST(RunConfigurationTest, FitMatrixWithoutThresholdIsRejected) {
    RenderOptions options;
    options.fitMatrixPath = "/tmp/fit.csv";

    auto setup = renderSetupFrom(calibratedTable(), options);
    ASSERT_FALSE(setup.has_value());
    EXPECT_EQ(setup.error().code, FlowError::Code::Configuration);
    EXPECT_NE(setup.error().message.find("--min-fit"), std::string::npos);
}

TEST(RunConfigurationTest, RunFailsOnRenderConfigBeforeAnalysis) {
    TempDirectory dir("run_configuration_fail_fast");
    auto table = calibratedTable();
    ASSERT_TRUE(table.set(ParameterKind::OutputDirectory, dir.path().string()).has_value());
    ASSERT_TRUE(table.set(ParameterKind::MaxPlotSpeed, "").has_value());

    auto result = runAnalysisAndRendering(table);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, FlowError::Code::Configuration);
    EXPECT_NE(result.error().message.find("maxPlotSpeed"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "velocity.csv"));
}
