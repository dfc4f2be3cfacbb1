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

#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "services/flow/flow_matrix.hpp"
#include "services/flow/flow_types.hpp"

namespace flow_mapper::services {

class IntervalCatalog;
class SegmentCatalog;

/**
 * @brief Delimited-text persistence of flow matrices and side tables
 *
 * Matrix files start with a comment row "// name1,name2,..." followed by
 * one comma-separated row per interval. Numbers carry exactly two
 * decimals; sentinel cells are written as "short" and "out".
 *
 * Every write preserves an existing file under a .bak suffix.
 */
class FlowMatrixIO {
public:
    /// File names inside the output directory
    static constexpr const char* kVelocityFile = "velocity.csv";
    static constexpr const char* kAngleFile = "angle.csv";
    static constexpr const char* kFitFile = "fit.csv";
    static constexpr const char* kAnomalyFile = "anomalies.csv";
    static constexpr const char* kSegmentLengthFile = "segment_lengths.csv";

    [[nodiscard]] static std::string formatCell(const VelocityCell& cell);

    /**
     * @brief Parse one token
     * @return ParseFailed error for anything that is neither a number nor
     *         a sentinel token
     */
    [[nodiscard]] static std::expected<VelocityCell, FlowError>
    parseCell(std::string_view token);

    [[nodiscard]] static std::string serialize(const FlowMatrix& matrix,
                                               const std::vector<std::string>& columnNames);

    /**
     * @brief Parse matrix text against the expected dimensions
     * @return Range error for a row or column count mismatch
     */
    [[nodiscard]] static std::expected<FlowMatrix, FlowError>
    parse(std::string_view content, size_t expectedRows, size_t expectedCols,
          const std::string& sourceName = "<memory>");

    /**
     * @brief Read a matrix sized by the catalogs it was produced from
     */
    [[nodiscard]] static std::expected<FlowMatrix, FlowError>
    read(const std::filesystem::path& path,
         const IntervalCatalog& intervals,
         const SegmentCatalog& segments);

    [[nodiscard]] static std::expected<void, FlowError>
    write(const std::filesystem::path& path,
          const FlowMatrix& matrix,
          const SegmentCatalog& segments);

    /// segmentId,intervalId,rawAngle per anomaly
    [[nodiscard]] static std::expected<void, FlowError>
    writeAnomalies(const std::filesystem::path& path,
                   const std::vector<ComputationAnomaly>& anomalies);

    /// id,name,pixelLength,physicalLength per segment
    [[nodiscard]] static std::expected<void, FlowError>
    writeSegmentLengths(const std::filesystem::path& path,
                        const SegmentCatalog& segments);

    /**
     * @brief Write velocity, angle and fit matrices plus both side tables
     */
    [[nodiscard]] static std::expected<void, FlowError>
    writeAnalysisOutputs(const std::filesystem::path& outputDirectory,
                         const FlowMatrices& matrices,
                         const SegmentCatalog& segments);
};

}  // namespace flow_mapper::services
