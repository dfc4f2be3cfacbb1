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

#include "services/flow/flow_matrix_io.hpp"
#include "services/flow/interval_catalog.hpp"
#include "services/flow/segment_catalog.hpp"
#include "core/artifact_writer.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <fstream>
#include <sstream>

#include <kcenon/common/logging/log_macros.h>

namespace flow_mapper::services {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

std::vector<std::string_view> splitRow(std::string_view line) {
    std::vector<std::string_view> tokens;
    size_t pos = 0;
    while (true) {
        auto comma = line.find(',', pos);
        tokens.push_back(trim(line.substr(pos, comma - pos)));
        if (comma == std::string_view::npos) {
            break;
        }
        pos = comma + 1;
    }
    return tokens;
}

std::expected<void, FlowError> writeText(const std::filesystem::path& path,
                                         const std::string& content) {
    auto written = core::writeTextArtifact(path, content);
    if (!written) {
        return std::unexpected(FlowError{FlowError::Code::FileAccess, written.error()});
    }
    return {};
}

}  // anonymous namespace

std::string FlowMatrixIO::formatCell(const VelocityCell& cell) {
    switch (cell.state) {
        case CellState::TooShort: return kTooShortToken;
        case CellState::OutOfRange: return kOutOfRangeToken;
        case CellState::Numeric: break;
    }
    auto text = std::format("{:.2f}", cell.value);
    if (text == "-0.00") {
        text = "0.00";
    }
    return text;
}

std::expected<VelocityCell, FlowError> FlowMatrixIO::parseCell(std::string_view token) {
    token = trim(token);
    if (token == kTooShortToken) {
        return VelocityCell::tooShort();
    }
    if (token == kOutOfRangeToken) {
        return VelocityCell::outOfRange();
    }

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (token.empty() || ec != std::errc{} || ptr != token.data() + token.size() ||
        !std::isfinite(value)) {
        return std::unexpected(FlowError{
            FlowError::Code::ParseFailed,
            std::format("'{}' is neither a number nor '{}'/'{}'",
                        token, kTooShortToken, kOutOfRangeToken)});
    }
    return VelocityCell::numeric(value);
}

std::string FlowMatrixIO::serialize(const FlowMatrix& matrix,
                                    const std::vector<std::string>& columnNames) {
    std::string out = "// ";
    for (size_t i = 0; i < columnNames.size(); ++i) {
        if (i > 0) out += ',';
        out += columnNames[i];
    }
    out += '\n';

    for (size_t row = 0; row < matrix.rows(); ++row) {
        for (size_t col = 0; col < matrix.cols(); ++col) {
            if (col > 0) out += ',';
            out += formatCell(matrix.cell(row, col));
        }
        out += '\n';
    }
    return out;
}

std::expected<FlowMatrix, FlowError>
FlowMatrixIO::parse(std::string_view content, size_t expectedRows, size_t expectedCols,
                    const std::string& sourceName) {
    FlowMatrix matrix(expectedRows, expectedCols);

    size_t row = 0;
    int lineNumber = 0;
    while (!content.empty()) {
        auto newline = content.find('\n');
        auto line = trim(content.substr(0, newline));
        content = (newline == std::string_view::npos)
            ? std::string_view{} : content.substr(newline + 1);
        ++lineNumber;

        if (line.empty() || line.starts_with("//")) {
            continue;
        }

        ++row;
        if (row > expectedRows) {
            continue;  // counted below
        }

        auto tokens = splitRow(line);
        if (tokens.size() != expectedCols) {
            return std::unexpected(FlowError{
                FlowError::Code::Range,
                std::format("{}:{}: row {} has {} columns, expected {} segments",
                            sourceName, lineNumber, row, tokens.size(), expectedCols)});
        }

        for (size_t col = 0; col < tokens.size(); ++col) {
            auto cell = parseCell(tokens[col]);
            if (!cell) {
                return std::unexpected(FlowError{
                    cell.error().code,
                    std::format("{}:{}: {}", sourceName, lineNumber, cell.error().message)});
            }
            auto stored = matrix.set(static_cast<int>(row), static_cast<int>(col) + 1, *cell);
            if (!stored) {
                return std::unexpected(stored.error());
            }
        }
    }

    if (row != expectedRows) {
        return std::unexpected(FlowError{
            FlowError::Code::Range,
            std::format("{} has {} rows, expected {} intervals",
                        sourceName, row, expectedRows)});
    }
    return matrix;
}

std::expected<FlowMatrix, FlowError>
FlowMatrixIO::read(const std::filesystem::path& path,
                   const IntervalCatalog& intervals,
                   const SegmentCatalog& segments) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(FlowError{
            FlowError::Code::FileAccess,
            "Cannot open matrix file: " + path.string()});
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str(), intervals.size(), segments.size(), path.filename().string());
}

std::expected<void, FlowError>
FlowMatrixIO::write(const std::filesystem::path& path,
                    const FlowMatrix& matrix,
                    const SegmentCatalog& segments) {
    if (matrix.cols() != segments.size()) {
        return std::unexpected(FlowError{
            FlowError::Code::Range,
            std::format("Matrix has {} columns but the catalog has {} segments",
                        matrix.cols(), segments.size())});
    }
    return writeText(path, serialize(matrix, segments.columnNames()));
}

std::expected<void, FlowError>
FlowMatrixIO::writeAnomalies(const std::filesystem::path& path,
                             const std::vector<ComputationAnomaly>& anomalies) {
    std::string out = "// segmentId,intervalId,rawAngle\n";
    for (const auto& anomaly : anomalies) {
        out += std::format("{},{},{}\n", anomaly.segmentId, anomaly.intervalId, anomaly.rawAngle);
    }
    return writeText(path, out);
}

std::expected<void, FlowError>
FlowMatrixIO::writeSegmentLengths(const std::filesystem::path& path,
                                  const SegmentCatalog& segments) {
    auto names = segments.columnNames();
    std::string out = "// segmentId,name,pixelLength,physicalLength\n";
    for (const auto& segment : segments.segments()) {
        out += std::format("{},{},{:.2f},{:.2f}\n",
                           segment.id, names[segment.id - 1],
                           segment.pixelLength, segment.physicalLength);
    }
    return writeText(path, out);
}

std::expected<void, FlowError>
FlowMatrixIO::writeAnalysisOutputs(const std::filesystem::path& outputDirectory,
                                   const FlowMatrices& matrices,
                                   const SegmentCatalog& segments) {
    if (auto r = write(outputDirectory / kVelocityFile, matrices.velocity, segments); !r) {
        return r;
    }
    if (auto r = write(outputDirectory / kAngleFile, matrices.angle, segments); !r) {
        return r;
    }
    if (auto r = write(outputDirectory / kFitFile, matrices.fit, segments); !r) {
        return r;
    }
    if (auto r = writeAnomalies(outputDirectory / kAnomalyFile, matrices.anomalies); !r) {
        return r;
    }
    if (auto r = writeSegmentLengths(outputDirectory / kSegmentLengthFile, segments); !r) {
        return r;
    }

    LOG_INFO(std::format("Wrote {}x{} matrices and {} anomalies to {}",
                         matrices.velocity.rows(), matrices.velocity.cols(),
                         matrices.anomalies.size(), outputDirectory.string()));
    return {};
}

}  // namespace flow_mapper::services
