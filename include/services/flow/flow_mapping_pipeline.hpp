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
 * @file flow_mapping_pipeline.hpp
 * @brief Video to velocity matrix orchestration
 * @details For every interval and every segment the pipeline builds the
 *          kymograph, estimates its orientation and classifies the
 *          resulting velocity. Segments of one interval may be processed
 *          concurrently; results are always stored by (interval, segment)
 *          so the output does not depend on the thread count.
 *
 * ## Thread Safety
 * - cancel() may be called from any thread, including the progress
 *   callback
 * - The progress callback is invoked on the thread running analyze()
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "services/flow/flow_matrix.hpp"
#include "services/flow/flow_types.hpp"
#include "services/flow/kymograph_builder.hpp"

namespace flow_mapper::services {

class IntervalCatalog;
class SegmentCatalog;
class VideoSource;

/**
 * @brief Parameters of the analysis stage
 */
struct AnalysisConfig {
    double pixelSize = 0.0;          ///< um per pixel
    double frameRate = 0.0;          ///< fps
    double minSegmentLength = 0.0;   ///< um
    double maxMeasuredSpeed = 0.0;   ///< um/s
    bool flickerCorrection = false;
    int threads = 1;                 ///< 1 = strictly sequential
    bool saveKymographs = false;
    std::filesystem::path outputDirectory;
};

/**
 * @brief Everything analyze() produces
 */
struct AnalysisResult {
    FlowMatrices matrices;
    std::vector<SegmentSummary> summaries;
    std::vector<Kymograph> kymographs;   ///< Only filled when saveKymographs is set
};

class FlowMappingPipeline {
public:
    /// Progress in [0, 1] and a short status line
    using ProgressCallback = std::function<void(double progress, const std::string& status)>;

    explicit FlowMappingPipeline(AnalysisConfig config);
    ~FlowMappingPipeline();

    FlowMappingPipeline(const FlowMappingPipeline&) = delete;
    FlowMappingPipeline& operator=(const FlowMappingPipeline&) = delete;
    FlowMappingPipeline(FlowMappingPipeline&&) noexcept;
    FlowMappingPipeline& operator=(FlowMappingPipeline&&) noexcept;

    [[nodiscard]] const AnalysisConfig& config() const;

    void setProgressCallback(ProgressCallback callback);

    /**
     * @brief Request cooperative cancellation of a running analyze()
     */
    void cancel();

    [[nodiscard]] bool isCancelled() const;

    /**
     * @brief Compute velocity, angle and fit matrices
     *
     * Writes nothing to disk. The video is calibrated with the configured
     * pixel size and frame rate.
     *
     * @return Result; Configuration error for invalid parameters, Range
     *         error when an interval exceeds the video, Cancelled when
     *         cancel() was called
     */
    [[nodiscard]] std::expected<AnalysisResult, FlowError>
    analyze(VideoSource& video,
            const SegmentCatalog& segments,
            const IntervalCatalog& intervals);

    /**
     * @brief Persist matrices, side tables and optional kymographs
     */
    [[nodiscard]] std::expected<void, FlowError>
    writeOutputs(const AnalysisResult& result, const SegmentCatalog& segments) const;

    /**
     * @brief Write one kymograph as a float TIFF
     */
    [[nodiscard]] static std::expected<void, FlowError>
    writeKymograph(const Kymograph& kymograph, const std::filesystem::path& path);

    /// File name of a dumped kymograph
    [[nodiscard]] static std::string kymographFileName(int intervalId, int segmentId);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace flow_mapper::services
