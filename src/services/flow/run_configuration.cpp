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

#include "services/flow/run_configuration.hpp"
#include "services/flow/flow_matrix_io.hpp"
#include "services/flow/interval_catalog.hpp"
#include "services/flow/segment_catalog.hpp"
#include "services/flow/video_source.hpp"

#include <format>

#include <kcenon/common/logging/log_macros.h>

namespace flow_mapper::services {

using core::ParameterKind;
using core::ParameterTable;

namespace {

template <typename T>
std::expected<T, FlowError> lift(std::expected<T, core::ConfigError> value) {
    if (!value) {
        return std::unexpected(toFlowError(value.error()));
    }
    return std::move(*value);
}

}  // anonymous namespace

FlowError toFlowError(const core::ConfigError& error) {
    return FlowError{FlowError::Code::Configuration, error.toString()};
}

std::expected<InputPaths, FlowError> inputPathsFrom(const ParameterTable& table) {
    auto video = lift(table.path(ParameterKind::VideoPath));
    if (!video) return std::unexpected(video.error());
    auto segments = lift(table.path(ParameterKind::SegmentsPath));
    if (!segments) return std::unexpected(segments.error());
    auto intervals = lift(table.path(ParameterKind::IntervalsPath));
    if (!intervals) return std::unexpected(intervals.error());

    return InputPaths{*video, *segments, *intervals};
}

std::expected<AnalysisConfig, FlowError> analysisConfigFrom(const ParameterTable& table) {
    AnalysisConfig config;

    auto pixelSize = lift(table.real(ParameterKind::PixelSize));
    if (!pixelSize) return std::unexpected(pixelSize.error());
    auto frameRate = lift(table.real(ParameterKind::FrameRate));
    if (!frameRate) return std::unexpected(frameRate.error());
    auto minLength = lift(table.real(ParameterKind::MinSegmentLength));
    if (!minLength) return std::unexpected(minLength.error());
    auto maxSpeed = lift(table.real(ParameterKind::MaxMeasuredSpeed));
    if (!maxSpeed) return std::unexpected(maxSpeed.error());
    auto flicker = lift(table.boolean(ParameterKind::FlickerCorrection));
    if (!flicker) return std::unexpected(flicker.error());
    auto threads = lift(table.integer(ParameterKind::Threads));
    if (!threads) return std::unexpected(threads.error());
    auto saveKymographs = lift(table.boolean(ParameterKind::SaveKymographs));
    if (!saveKymographs) return std::unexpected(saveKymographs.error());
    auto outputDirectory = lift(table.path(ParameterKind::OutputDirectory));
    if (!outputDirectory) return std::unexpected(outputDirectory.error());

    config.pixelSize = *pixelSize;
    config.frameRate = *frameRate;
    config.minSegmentLength = *minLength;
    config.maxMeasuredSpeed = *maxSpeed;
    config.flickerCorrection = *flicker;
    config.threads = *threads;
    config.saveKymographs = *saveKymographs;
    config.outputDirectory = *outputDirectory;
    return config;
}

std::expected<SpatialMapConfig, FlowError> spatialMapConfigFrom(const ParameterTable& table) {
    SpatialMapConfig config;

    auto maxPlotSpeed = lift(table.real(ParameterKind::MaxPlotSpeed));
    if (!maxPlotSpeed) return std::unexpected(maxPlotSpeed.error());
    auto lineThickness = lift(table.integer(ParameterKind::LineThickness));
    if (!lineThickness) return std::unexpected(lineThickness.error());
    auto arrowSize = lift(table.integer(ParameterKind::ArrowSize));
    if (!arrowSize) return std::unexpected(arrowSize.error());
    auto arrowCutoff = lift(table.real(ParameterKind::ArrowCutoff));
    if (!arrowCutoff) return std::unexpected(arrowCutoff.error());
    auto background = lift(table.color(ParameterKind::BackgroundColor));
    if (!background) return std::unexpected(background.error());
    auto arrowColor = lift(table.color(ParameterKind::ArrowColor));
    if (!arrowColor) return std::unexpected(arrowColor.error());

    config.maxPlotSpeed = *maxPlotSpeed;
    config.lineThickness = *lineThickness;
    config.arrowSize = *arrowSize;
    config.arrowCutoff = *arrowCutoff;
    config.backgroundColor = *background;
    config.arrowColor = *arrowColor;
    return config;
}

std::expected<AnalysisResult, FlowError>
runAnalysis(const ParameterTable& table, FlowMappingPipeline::ProgressCallback progress) {
    auto config = analysisConfigFrom(table);
    if (!config) return std::unexpected(config.error());
    auto paths = inputPathsFrom(table);
    if (!paths) return std::unexpected(paths.error());

    auto segments = SegmentCatalog::load(paths->segments, config->pixelSize);
    if (!segments) return std::unexpected(segments.error());
    auto intervals = IntervalCatalog::load(paths->intervals);
    if (!intervals) return std::unexpected(intervals.error());

    // Header check first so a bad interval file fails before the stack is read
    auto header = ImageStackVideo::probe(paths->video);
    if (!header) return std::unexpected(header.error());
    if (auto inRange = intervals->validateAgainst((*header)[2]); !inRange) {
        return std::unexpected(inRange.error());
    }

    auto video = ImageStackVideo::open(paths->video);
    if (!video) return std::unexpected(video.error());

    FlowMappingPipeline pipeline(*config);
    pipeline.setProgressCallback(std::move(progress));

    auto result = pipeline.analyze(**video, *segments, *intervals);
    if (!result) return std::unexpected(result.error());

    if (auto written = pipeline.writeOutputs(*result, *segments); !written) {
        return std::unexpected(written.error());
    }
    return result;
}

std::expected<RenderSetup, FlowError>
renderSetupFrom(const ParameterTable& table, const RenderOptions& options) {
    auto config = spatialMapConfigFrom(table);
    if (!config) return std::unexpected(config.error());
    config->minFitGoodness = options.minFitGoodness;

    auto lutName = lift(table.text(ParameterKind::LutName));
    if (!lutName) return std::unexpected(lutName.error());
    auto lut = ColorLut::fromName(*lutName);
    if (!lut) return std::unexpected(lut.error());

    if (options.fitMatrixPath && !options.minFitGoodness) {
        return std::unexpected(FlowError{
            FlowError::Code::Configuration,
            "A fit matrix was given without a minimum fit goodness (--min-fit)"});
    }

    return RenderSetup{std::move(*config), std::move(*lut)};
}

std::expected<std::filesystem::path, FlowError>
runRendering(const ParameterTable& table, const RenderOptions& options) {
    auto setup = renderSetupFrom(table, options);
    if (!setup) return std::unexpected(setup.error());
    return runRendering(table, *setup, options);
}

std::expected<std::filesystem::path, FlowError>
runRendering(const ParameterTable& table, const RenderSetup& setup,
             const RenderOptions& options) {
    auto pixelSize = lift(table.real(ParameterKind::PixelSize));
    if (!pixelSize) return std::unexpected(pixelSize.error());
    auto outputDirectory = lift(table.path(ParameterKind::OutputDirectory));
    if (!outputDirectory) return std::unexpected(outputDirectory.error());
    auto paths = inputPathsFrom(table);
    if (!paths) return std::unexpected(paths.error());

    auto segments = SegmentCatalog::load(paths->segments, *pixelSize);
    if (!segments) return std::unexpected(segments.error());
    auto intervals = IntervalCatalog::load(paths->intervals);
    if (!intervals) return std::unexpected(intervals.error());
    auto header = ImageStackVideo::probe(paths->video);
    if (!header) return std::unexpected(header.error());

    auto velocity = FlowMatrixIO::read(*outputDirectory / FlowMatrixIO::kVelocityFile,
                                       *intervals, *segments);
    if (!velocity) return std::unexpected(velocity.error());

    std::optional<FlowMatrix> fit;
    if (options.minFitGoodness) {
        auto fitPath = options.fitMatrixPath.value_or(*outputDirectory / FlowMatrixIO::kFitFile);
        auto loaded = FlowMatrixIO::read(fitPath, *intervals, *segments);
        if (!loaded) return std::unexpected(loaded.error());
        fit = std::move(*loaded);
    }

    SpatialMapRenderer renderer(setup.config, setup.lut);
    auto frames = renderer.renderAll(*velocity, *segments,
                                     {(*header)[0], (*header)[1]},
                                     fit ? &*fit : nullptr);
    if (!frames) return std::unexpected(frames.error());

    auto outputPath = *outputDirectory / kSpatialMapFile;
    if (auto written = SpatialMapRenderer::writeMultiFrameTiff(*frames, outputPath); !written) {
        return std::unexpected(written.error());
    }

    LOG_INFO(std::format("Spatial map written to {}", outputPath.string()));
    return outputPath;
}

std::expected<std::filesystem::path, FlowError>
runAnalysisAndRendering(const ParameterTable& table, const RenderOptions& options,
                        FlowMappingPipeline::ProgressCallback progress) {
    auto setup = renderSetupFrom(table, options);
    if (!setup) return std::unexpected(setup.error());

    auto analyzed = runAnalysis(table, std::move(progress));
    if (!analyzed) return std::unexpected(analyzed.error());

    return runRendering(table, *setup, options);
}

}  // namespace flow_mapper::services
