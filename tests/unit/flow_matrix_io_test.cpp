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
#include <fstream>
#include <sstream>

#include "services/flow/flow_matrix_io.hpp"
#include "services/flow/interval_catalog.hpp"
#include "services/flow/segment_catalog.hpp"
#include "test_utils/kymograph_phantom_generator.hpp"

using namespace flow_mapper::services;
using flow_mapper::test_utils::TempDirectory;

namespace {

std::string readFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

SegmentCatalog twoSegments() {
    auto catalog = SegmentCatalog::fromPolylines(
        {{"left, upper", {{0.0, 0.0}, {30.0, 0.0}}},
         {"right", {{0.0, 10.0}, {0.0, 50.0}}}}, 0.5);
    EXPECT_TRUE(catalog.has_value());
    return *catalog;
}

}  // anonymous namespace

// =============================================================================
// Cell tokens
// =============================================================================

TEST(FlowMatrixIOTest, FormatCellUsesTwoDecimalsAndSentinelTokens) {
    EXPECT_EQ(FlowMatrixIO::formatCell(VelocityCell::numeric(15.0)), "15.00");
    EXPECT_EQ(FlowMatrixIO::formatCell(VelocityCell::numeric(-3.456)), "-3.46");
    EXPECT_EQ(FlowMatrixIO::formatCell(VelocityCell::numeric(-0.001)), "0.00");
    EXPECT_EQ(FlowMatrixIO::formatCell(VelocityCell::tooShort()), "short");
    EXPECT_EQ(FlowMatrixIO::formatCell(VelocityCell::outOfRange()), "out");
}

TEST(FlowMatrixIOTest, ParseCellAcceptsNumbersAndSentinels) {
    EXPECT_EQ(*FlowMatrixIO::parseCell("12.50"), VelocityCell::numeric(12.5));
    EXPECT_EQ(*FlowMatrixIO::parseCell(" -7 "), VelocityCell::numeric(-7.0));
    EXPECT_EQ(*FlowMatrixIO::parseCell("short"), VelocityCell::tooShort());
    EXPECT_EQ(*FlowMatrixIO::parseCell("out"), VelocityCell::outOfRange());
}

TEST(FlowMatrixIOTest, ParseCellRejectsOtherText) {
    for (const char* token : {"", "abc", "1.5x", "nan", "inf", "SHORT"}) {
        auto cell = FlowMatrixIO::parseCell(token);
        ASSERT_FALSE(cell.has_value()) << token;
        EXPECT_EQ(cell.error().code, FlowError::Code::ParseFailed);
    }
}

// =============================================================================
// Matrix text
// =============================================================================

TEST(FlowMatrixIOTest, SerializeWritesHeaderAndRows) {
    FlowMatrix matrix(2, 2);
    ASSERT_TRUE(matrix.set(1, 1, VelocityCell::numeric(15.0)).has_value());
    ASSERT_TRUE(matrix.set(1, 2, VelocityCell::tooShort()).has_value());
    ASSERT_TRUE(matrix.set(2, 1, VelocityCell::numeric(-2.5)).has_value());

    auto text = FlowMatrixIO::serialize(matrix, {"a", "b"});
    EXPECT_EQ(text, "// a,b\n15.00,short\n-2.50,out\n");
}

TEST(FlowMatrixIOTest, ParseRestoresSerializedMatrix) {
    auto parsed = FlowMatrixIO::parse("// a,b\n15.00,short\n\n-2.50,out\n", 2, 2);
    ASSERT_TRUE(parsed.has_value()) << parsed.error().toString();
    EXPECT_EQ(parsed->at(1, 1), VelocityCell::numeric(15.0));
    EXPECT_EQ(parsed->at(1, 2), VelocityCell::tooShort());
    EXPECT_EQ(parsed->at(2, 1), VelocityCell::numeric(-2.5));
    EXPECT_EQ(parsed->at(2, 2), VelocityCell::outOfRange());
}

TEST(FlowMatrixIOTest, ColumnMismatchIsRangeErrorWithLocation) {
    auto parsed = FlowMatrixIO::parse("// a,b\n1.00,2.00\n3.00\n", 2, 2, "velocity.csv");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, FlowError::Code::Range);
    EXPECT_NE(parsed.error().message.find("velocity.csv:3"), std::string::npos);
}

TEST(FlowMatrixIOTest, RowCountMismatchIsRangeError) {
    auto tooFew = FlowMatrixIO::parse("1.00,2.00\n", 2, 2);
    ASSERT_FALSE(tooFew.has_value());
    EXPECT_EQ(tooFew.error().code, FlowError::Code::Range);

    auto tooMany = FlowMatrixIO::parse("1,2\n3,4\n5,6\n", 2, 2);
    ASSERT_FALSE(tooMany.has_value());
    EXPECT_EQ(tooMany.error().code, FlowError::Code::Range);
}

TEST(FlowMatrixIOTest, BadTokenIsParseErrorWithLocation) {
    auto parsed = FlowMatrixIO::parse("1.00,fast\n", 1, 2, "velocity.csv");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, FlowError::Code::ParseFailed);
    EXPECT_NE(parsed.error().message.find("velocity.csv:1"), std::string::npos);
}

// =============================================================================
// Files
// =============================================================================

TEST(FlowMatrixIOTest, WriteUsesSanitisedColumnNames) {
    TempDirectory dir("flow_matrix_io_names");
    auto segments = twoSegments();
    FlowMatrix matrix(1, 2);
    ASSERT_TRUE(matrix.set(1, 1, VelocityCell::numeric(1.0)).has_value());
    ASSERT_TRUE(matrix.set(1, 2, VelocityCell::numeric(2.0)).has_value());

    auto file = dir.path() / "velocity.csv";
    ASSERT_TRUE(FlowMatrixIO::write(file, matrix, segments).has_value());
    EXPECT_EQ(readFile(file), "// left_ upper,right\n1.00,2.00\n");
}

TEST(FlowMatrixIOTest, WriteRejectsColumnCountMismatch) {
    TempDirectory dir("flow_matrix_io_mismatch");
    auto result = FlowMatrixIO::write(dir.path() / "velocity.csv", FlowMatrix(1, 3), twoSegments());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, FlowError::Code::Range);
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "velocity.csv"));
}

TEST(FlowMatrixIOTest, ReadSizesMatrixFromCatalogs) {
    TempDirectory dir("flow_matrix_io_read");
    auto segments = twoSegments();
    auto intervals = IntervalCatalog::fromRanges({{1, 10}, {11, 20}});
    ASSERT_TRUE(intervals.has_value());

    FlowMatrix matrix(2, 2);
    ASSERT_TRUE(matrix.set(2, 2, VelocityCell::numeric(99.99)).has_value());
    auto file = dir.path() / "velocity.csv";
    ASSERT_TRUE(FlowMatrixIO::write(file, matrix, segments).has_value());

    auto read = FlowMatrixIO::read(file, *intervals, segments);
    ASSERT_TRUE(read.has_value()) << read.error().toString();
    EXPECT_EQ(*read, matrix);

    auto oneInterval = IntervalCatalog::fromRanges({{1, 10}});
    ASSERT_TRUE(oneInterval.has_value());
    EXPECT_EQ(FlowMatrixIO::read(file, *oneInterval, segments).error().code,
              FlowError::Code::Range);
    EXPECT_EQ(FlowMatrixIO::read(dir.path() / "missing.csv", *intervals, segments).error().code,
              FlowError::Code::FileAccess);
}

TEST(FlowMatrixIOTest, AnalysisOutputsWriteAllFilesAndKeepBackups) {
    TempDirectory dir("flow_matrix_io_outputs");
    auto segments = twoSegments();

    FlowMatrices matrices{FlowMatrix(1, 2), FlowMatrix(1, 2), FlowMatrix(1, 2), {}};
    matrices.anomalies.push_back({2, 1, 0.0});

    ASSERT_TRUE(FlowMatrixIO::writeAnalysisOutputs(dir.path(), matrices, segments).has_value());
    for (const char* name : {FlowMatrixIO::kVelocityFile, FlowMatrixIO::kAngleFile,
                             FlowMatrixIO::kFitFile, FlowMatrixIO::kAnomalyFile,
                             FlowMatrixIO::kSegmentLengthFile}) {
        EXPECT_TRUE(std::filesystem::exists(dir.path() / name)) << name;
    }
    EXPECT_EQ(readFile(dir.path() / FlowMatrixIO::kAnomalyFile),
              "// segmentId,intervalId,rawAngle\n2,1,0\n");
    EXPECT_EQ(readFile(dir.path() / FlowMatrixIO::kSegmentLengthFile),
              "// segmentId,name,pixelLength,physicalLength\n"
              "1,left_ upper,30.00,15.00\n"
              "2,right,40.00,20.00\n");

    ASSERT_TRUE(FlowMatrixIO::writeAnalysisOutputs(dir.path(), matrices, segments).has_value());
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "velocity.csv.bak"));
}

TEST(FlowMatrixIOTest, MultiLineSegmentNameKeepsHeaderOnOneLine) {
    TempDirectory dir("flow_matrix_io_multiline");
    auto segments = SegmentCatalog::fromPolylines(
        {{"main\nvessel", {{0.0, 0.0}, {30.0, 0.0}}}}, 0.5);
    ASSERT_TRUE(segments.has_value());
    auto intervals = IntervalCatalog::fromRanges({{1, 10}});
    ASSERT_TRUE(intervals.has_value());

    FlowMatrix matrix(1, 1);
    ASSERT_TRUE(matrix.set(1, 1, VelocityCell::numeric(4.25)).has_value());
    auto file = dir.path() / "velocity.csv";
    ASSERT_TRUE(FlowMatrixIO::write(file, matrix, *segments).has_value());
    EXPECT_EQ(readFile(file), "// main_vessel\n4.25\n");

    auto read = FlowMatrixIO::read(file, *intervals, *segments);
    ASSERT_TRUE(read.has_value()) << read.error().toString();
    EXPECT_EQ(*read, matrix);
}
