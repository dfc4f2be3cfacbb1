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
 * @file flow_matrix.hpp
 * @brief Interval x segment result matrices
 * @details Rows are intervals in ascending id order, columns are segments
 *          in ascending id order. Cells are inserted by (interval id,
 *          segment id) so the layout never depends on the order in which
 *          workers finish.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <expected>
#include <string>
#include <vector>

#include "services/flow/flow_types.hpp"

namespace flow_mapper::services {

class SegmentCatalog;

/**
 * @brief Dense matrix of tagged cells addressed by 1-based ids
 */
class FlowMatrix {
public:
    FlowMatrix() = default;

    /// All cells start as OutOfRange until set
    FlowMatrix(size_t intervalCount, size_t segmentCount);

    [[nodiscard]] size_t rows() const noexcept { return rows_; }
    [[nodiscard]] size_t cols() const noexcept { return cols_; }

    /**
     * @brief Store a cell
     * @return Range error when either id is outside the matrix
     */
    [[nodiscard]] std::expected<void, FlowError>
    set(int intervalId, int segmentId, VelocityCell cell);

    /// Cell by 1-based ids; throws std::out_of_range outside the matrix
    [[nodiscard]] const VelocityCell& at(int intervalId, int segmentId) const;

    /// Cell by 0-based row and column
    [[nodiscard]] const VelocityCell& cell(size_t row, size_t col) const {
        return cells_[row * cols_ + col];
    }

    /**
     * @brief Values of one interval row for consumers that need numbers only
     * @return DataIntegrity error naming the interval if any cell is a sentinel
     */
    [[nodiscard]] std::expected<std::vector<double>, FlowError>
    numericRow(int intervalId) const;

    bool operator==(const FlowMatrix& other) const = default;

private:
    size_t rows_ = 0;
    size_t cols_ = 0;
    std::vector<VelocityCell> cells_;
};

/**
 * @brief Complete analysis output
 */
struct FlowMatrices {
    FlowMatrix velocity;   ///< um/s
    FlowMatrix angle;      ///< degrees
    FlowMatrix fit;        ///< coherence in [0, 1]
    std::vector<ComputationAnomaly> anomalies;
};

/**
 * @brief Per-segment statistics over all intervals
 */
struct SegmentSummary {
    int segmentId = 0;
    std::string name;
    double meanVelocity = 0.0;   ///< Mean of numeric cells; 0 when none
    int validIntervals = 0;      ///< Number of numeric cells
};

[[nodiscard]] std::vector<SegmentSummary>
summarizeSegments(const FlowMatrix& velocity, const SegmentCatalog& segments);

}  // namespace flow_mapper::services
