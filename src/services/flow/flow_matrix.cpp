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

#include "services/flow/flow_matrix.hpp"
#include "services/flow/segment_catalog.hpp"

#include <format>
#include <stdexcept>

namespace flow_mapper::services {

FlowMatrix::FlowMatrix(size_t intervalCount, size_t segmentCount)
    : rows_(intervalCount)
    , cols_(segmentCount)
    , cells_(intervalCount * segmentCount, VelocityCell::outOfRange()) {}

std::expected<void, FlowError>
FlowMatrix::set(int intervalId, int segmentId, VelocityCell value) {
    if (intervalId < 1 || static_cast<size_t>(intervalId) > rows_ ||
        segmentId < 1 || static_cast<size_t>(segmentId) > cols_) {
        return std::unexpected(FlowError{
            FlowError::Code::Range,
            std::format("Cell (interval {}, segment {}) outside {}x{} matrix",
                        intervalId, segmentId, rows_, cols_)});
    }
    cells_[(intervalId - 1) * cols_ + (segmentId - 1)] = value;
    return {};
}

const VelocityCell& FlowMatrix::at(int intervalId, int segmentId) const {
    if (intervalId < 1 || static_cast<size_t>(intervalId) > rows_ ||
        segmentId < 1 || static_cast<size_t>(segmentId) > cols_) {
        throw std::out_of_range(std::format(
            "Cell (interval {}, segment {}) outside {}x{} matrix",
            intervalId, segmentId, rows_, cols_));
    }
    return cells_[(intervalId - 1) * cols_ + (segmentId - 1)];
}

std::expected<std::vector<double>, FlowError>
FlowMatrix::numericRow(int intervalId) const {
    if (intervalId < 1 || static_cast<size_t>(intervalId) > rows_) {
        return std::unexpected(FlowError{
            FlowError::Code::Range,
            std::format("Interval {} outside matrix with {} rows", intervalId, rows_)});
    }

    std::vector<double> values;
    values.reserve(cols_);
    for (size_t col = 0; col < cols_; ++col) {
        const auto& c = cell(intervalId - 1, col);
        if (!c.isNumeric()) {
            return std::unexpected(FlowError{
                FlowError::Code::DataIntegrity,
                std::format("Row {} (interval {}) holds '{}' in column {} where a number is required",
                            intervalId, intervalId,
                            c.state == CellState::TooShort ? kTooShortToken : kOutOfRangeToken,
                            col + 1)});
        }
        values.push_back(c.value);
    }
    return values;
}

std::vector<SegmentSummary>
summarizeSegments(const FlowMatrix& velocity, const SegmentCatalog& segments) {
    std::vector<SegmentSummary> summaries;
    summaries.reserve(velocity.cols());

    for (size_t col = 0; col < velocity.cols(); ++col) {
        SegmentSummary summary;
        summary.segmentId = static_cast<int>(col) + 1;
        if (col < segments.size()) {
            summary.name = segments.segments()[col].name;
        }

        double sum = 0.0;
        for (size_t row = 0; row < velocity.rows(); ++row) {
            const auto& c = velocity.cell(row, col);
            if (c.isNumeric()) {
                sum += c.value;
                ++summary.validIntervals;
            }
        }
        if (summary.validIntervals > 0) {
            summary.meanVelocity = sum / summary.validIntervals;
        }
        summaries.push_back(std::move(summary));
    }
    return summaries;
}

}  // namespace flow_mapper::services
