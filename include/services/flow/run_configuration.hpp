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

/**
 * @file run_configuration.hpp
 * @brief Stage configuration built from the parameter table
 * @details Each stage receives an immutable configuration value that is
 *          built here once per run. Required parameters that are empty
 *          fail only when the stage that needs them is built, with a
 *          Configuration error naming the key and the upstream step.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <expected>
#include <filesystem>
#include <optional>

#include "core/parameter_table.hpp"
#include "services/flow/flow_mapping_pipeline.hpp"
#include "services/flow/flow_types.hpp"
#include "services/render/spatial_map_renderer.hpp"

namespace flow_mapper::services {

/// Name of the rendered spatial map inside the output directory
inline constexpr const char* kSpatialMapFile = "spatial_map.tif";

/**
 * @brief Input files of the analysis stage
 */
struct InputPaths {
    std::filesystem::path video;
    std::filesystem::path segments;
    std::filesystem::path intervals;
};

/**
 * @brief Options of the render stage that do not live in the table
 */
struct RenderOptions {
    std::optional<std::filesystem::path> fitMatrixPath;
    std::optional<double> minFitGoodness;
};

/**
 * @brief Everything the render stage needs from the table, resolved up front
 */
struct RenderSetup {
    SpatialMapConfig config;
    ColorLut lut;
};

[[nodiscard]] FlowError toFlowError(const core::ConfigError& error);

[[nodiscard]] std::expected<InputPaths, FlowError>
inputPathsFrom(const core::ParameterTable& table);

[[nodiscard]] std::expected<AnalysisConfig, FlowError>
analysisConfigFrom(const core::ParameterTable& table);

[[nodiscard]] std::expected<SpatialMapConfig, FlowError>
spatialMapConfigFrom(const core::ParameterTable& table);

/**
 * @brief Resolve the spatial map configuration and colour table
 *
 * Fails with Configuration for empty or invalid render parameters, an
 * unknown lutName, or a fit matrix given without a minimum fit goodness.
 */
[[nodiscard]] std::expected<RenderSetup, FlowError>
renderSetupFrom(const core::ParameterTable& table, const RenderOptions& options = {});

/**
 * @brief Load inputs, analyze and write the matrices
 * @param progress Optional progress sink
 */
[[nodiscard]] std::expected<AnalysisResult, FlowError>
runAnalysis(const core::ParameterTable& table,
            FlowMappingPipeline::ProgressCallback progress = {});

/**
 * @brief Render the persisted velocity matrix to outputDirectory/spatial_map.tif
 * @return Path of the written file
 */
[[nodiscard]] std::expected<std::filesystem::path, FlowError>
runRendering(const core::ParameterTable& table, const RenderOptions& options = {});

/// Render with a setup resolved earlier by renderSetupFrom()
[[nodiscard]] std::expected<std::filesystem::path, FlowError>
runRendering(const core::ParameterTable& table, const RenderSetup& setup,
             const RenderOptions& options);

/**
 * @brief Analyze then render
 *
 * Render parameters are validated before the analysis starts, so a bad
 * render configuration writes no matrices.
 */
[[nodiscard]] std::expected<std::filesystem::path, FlowError>
runAnalysisAndRendering(const core::ParameterTable& table, const RenderOptions& options = {},
                        FlowMappingPipeline::ProgressCallback progress = {});

}  // namespace flow_mapper::services
