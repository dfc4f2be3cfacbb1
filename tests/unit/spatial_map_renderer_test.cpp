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

#include <cstdlib>
#include <cstring>
#include <filesystem>

#include "services/flow/segment_catalog.hpp"
#include "services/render/spatial_map_renderer.hpp"
#include "test_utils/kymograph_phantom_generator.hpp"

using namespace flow_mapper::services;
using flow_mapper::core::RgbColor;
using flow_mapper::test_utils::TempDirectory;

namespace {

constexpr int kWidth = 64;
constexpr int kHeight = 40;

const RgbColor kBackground{10, 20, 30};
const RgbColor kArrow{0, 255, 0};

SegmentCatalog horizontalSegment(double y = 20.0) {
    auto catalog = SegmentCatalog::fromPolylines({{"h", {{10.0, y}, {50.0, y}}}}, 1.0);
    EXPECT_TRUE(catalog.has_value());
    return *catalog;
}

SpatialMapConfig baseConfig() {
    SpatialMapConfig config;
    config.maxPlotSpeed = 1000.0;
    config.lineThickness = 3;
    config.arrowSize = 6;
    config.arrowCutoff = 1.0;
    config.backgroundColor = kBackground;
    config.arrowColor = kArrow;
    return config;
}

FlowMatrix singleCell(VelocityCell cell) {
    FlowMatrix matrix(1, 1);
    EXPECT_TRUE(matrix.set(1, 1, cell).has_value());
    return matrix;
}

struct ArrowPixels {
    int count = 0;
    int wingCount = 0;     ///< Arrow pixels outside the line band
    double wingMeanX = 0.0;
};

ArrowPixels collectArrowPixels(vtkImageData* frame, int lineY, int halfBand) {
    ArrowPixels result;
    double sumX = 0.0;
    for (int y = 0; y < kHeight; ++y) {
        for (int x = 0; x < kWidth; ++x) {
            if (SpatialMapRenderer::pixelAt(frame, x, y) != kArrow) {
                continue;
            }
            ++result.count;
            if (std::abs(y - lineY) > halfBand) {
                ++result.wingCount;
                sumX += x;
            }
        }
    }
    if (result.wingCount > 0) {
        result.wingMeanX = sumX / result.wingCount;
    }
    return result;
}

int countNonBackground(vtkImageData* frame) {
    int count = 0;
    for (int y = 0; y < kHeight; ++y) {
        for (int x = 0; x < kWidth; ++x) {
            if (SpatialMapRenderer::pixelAt(frame, x, y) != kBackground) {
                ++count;
            }
        }
    }
    return count;
}

}  // anonymous namespace

// =============================================================================
// Arrow helpers
// =============================================================================

TEST(SpatialMapRendererTest, ArrowDirectionRespectsCutoff) {
    EXPECT_EQ(SpatialMapRenderer::arrowDirection(0.5, 1.0), ArrowDirection::None);
    EXPECT_EQ(SpatialMapRenderer::arrowDirection(1.0, 1.0), ArrowDirection::None);
    EXPECT_EQ(SpatialMapRenderer::arrowDirection(-1.0, 1.0), ArrowDirection::None);
    EXPECT_EQ(SpatialMapRenderer::arrowDirection(1.5, 1.0), ArrowDirection::Forward);
    EXPECT_EQ(SpatialMapRenderer::arrowDirection(-1.5, 1.0), ArrowDirection::Backward);
    EXPECT_EQ(SpatialMapRenderer::arrowDirection(0.0, 0.0), ArrowDirection::None);
}

TEST(SpatialMapRendererTest, ArrowAnchorsBracketMidpoint) {
    auto longSeg = SpatialMapRenderer::arrowAnchors(40);
    EXPECT_EQ(longSeg.pre, 12u);
    EXPECT_EQ(longSeg.post, 28u);

    auto shortSeg = SpatialMapRenderer::arrowAnchors(5);
    EXPECT_EQ(shortSeg.pre, 0u);
    EXPECT_EQ(shortSeg.post, 4u);

    auto single = SpatialMapRenderer::arrowAnchors(1);
    EXPECT_EQ(single.pre, single.post);
}

// =============================================================================
// Rendering
// =============================================================================

TEST(SpatialMapRendererTest, LineColourComesFromLut) {
    auto config = baseConfig();
    config.arrowCutoff = 10000.0;
    SpatialMapRenderer renderer(config, ColorLut::create(LutPalette::Grays));

    auto frame = renderer.renderInterval(singleCell(VelocityCell::numeric(500.0)), 1,
                                         horizontalSegment(), {kWidth, kHeight});
    ASSERT_TRUE(frame.has_value()) << frame.error().toString();

    int dims[3];
    (*frame)->GetDimensions(dims);
    EXPECT_EQ(dims[0], kWidth);
    EXPECT_EQ(dims[1], kHeight);
    EXPECT_EQ((*frame)->GetNumberOfScalarComponents(), 3);

    EXPECT_EQ(SpatialMapRenderer::pixelAt(*frame, 30, 20), (RgbColor{127, 127, 127}));
    EXPECT_EQ(SpatialMapRenderer::pixelAt(*frame, 0, 0), kBackground);
}

TEST(SpatialMapRendererTest, ThicknessIsSquareBrush) {
    auto config = baseConfig();
    config.arrowCutoff = 10000.0;
    SpatialMapRenderer renderer(config, ColorLut::create(LutPalette::Grays));

    auto frame = renderer.renderInterval(singleCell(VelocityCell::numeric(1000.0)), 1,
                                         horizontalSegment(), {kWidth, kHeight});
    ASSERT_TRUE(frame.has_value());
    for (int y : {19, 20, 21}) {
        EXPECT_EQ(SpatialMapRenderer::pixelAt(*frame, 30, y), (RgbColor{255, 255, 255})) << y;
    }
    EXPECT_EQ(SpatialMapRenderer::pixelAt(*frame, 30, 18), kBackground);
    EXPECT_EQ(SpatialMapRenderer::pixelAt(*frame, 30, 22), kBackground);
}

TEST(SpatialMapRendererTest, VideoRowsAreNotFlipped) {
    auto config = baseConfig();
    config.arrowCutoff = 10000.0;
    config.lineThickness = 1;
    SpatialMapRenderer renderer(config, ColorLut::create(LutPalette::Grays));

    auto frame = renderer.renderInterval(singleCell(VelocityCell::numeric(1000.0)), 1,
                                         horizontalSegment(5.0), {kWidth, kHeight});
    ASSERT_TRUE(frame.has_value());
    EXPECT_NE(SpatialMapRenderer::pixelAt(*frame, 30, 5), kBackground);
    EXPECT_EQ(SpatialMapRenderer::pixelAt(*frame, 30, kHeight - 1 - 5), kBackground);
}

TEST(SpatialMapRendererTest, SlowSegmentGetsNoArrow) {
    SpatialMapRenderer renderer(baseConfig(), ColorLut::create(LutPalette::Grays));

    auto frame = renderer.renderInterval(singleCell(VelocityCell::numeric(0.5)), 1,
                                         horizontalSegment(), {kWidth, kHeight});
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(collectArrowPixels(*frame, 20, 1).count, 0);
}

TEST(SpatialMapRendererTest, ArrowPointsAlongFlow) {
    SpatialMapRenderer renderer(baseConfig(), ColorLut::create(LutPalette::Grays));
    const double midX = 30.0;

    auto forward = renderer.renderInterval(singleCell(VelocityCell::numeric(1.5)), 1,
                                           horizontalSegment(), {kWidth, kHeight});
    ASSERT_TRUE(forward.has_value());
    auto fwd = collectArrowPixels(*forward, 20, 1);
    EXPECT_GT(fwd.count, 0);
    ASSERT_GT(fwd.wingCount, 0);
    EXPECT_GT(fwd.wingMeanX, midX);

    auto backward = renderer.renderInterval(singleCell(VelocityCell::numeric(-1.5)), 1,
                                            horizontalSegment(), {kWidth, kHeight});
    ASSERT_TRUE(backward.has_value());
    auto bwd = collectArrowPixels(*backward, 20, 1);
    ASSERT_GT(bwd.wingCount, 0);
    EXPECT_LT(bwd.wingMeanX, midX);
}

TEST(SpatialMapRendererTest, SentinelCellsAreNotDrawn) {
    SpatialMapRenderer renderer(baseConfig(), ColorLut::create(LutPalette::Fire));

    for (auto cell : {VelocityCell::tooShort(), VelocityCell::outOfRange()}) {
        auto frame = renderer.renderInterval(singleCell(cell), 1,
                                             horizontalSegment(), {kWidth, kHeight});
        ASSERT_TRUE(frame.has_value());
        EXPECT_EQ(countNonBackground(*frame), 0);
    }
}

TEST(SpatialMapRendererTest, RenderingIsDeterministic) {
    SpatialMapRenderer renderer(baseConfig(), ColorLut::create(LutPalette::Fire));
    auto velocity = singleCell(VelocityCell::numeric(-420.0));

    auto a = renderer.renderInterval(velocity, 1, horizontalSegment(), {kWidth, kHeight});
    auto b = renderer.renderInterval(velocity, 1, horizontalSegment(), {kWidth, kHeight});
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());

    const size_t bytes = static_cast<size_t>(kWidth) * kHeight * 3;
    EXPECT_EQ(std::memcmp((*a)->GetScalarPointer(), (*b)->GetScalarPointer(), bytes), 0);
}

TEST(SpatialMapRendererTest, FitGateHidesPoorFits) {
    auto config = baseConfig();
    config.minFitGoodness = 0.5;
    SpatialMapRenderer renderer(config, ColorLut::create(LutPalette::Fire));
    auto velocity = singleCell(VelocityCell::numeric(600.0));

    auto poorFit = singleCell(VelocityCell::numeric(0.3));
    auto hidden = renderer.renderInterval(velocity, 1, horizontalSegment(),
                                          {kWidth, kHeight}, &poorFit);
    ASSERT_TRUE(hidden.has_value());
    EXPECT_EQ(countNonBackground(*hidden), 0);

    auto goodFit = singleCell(VelocityCell::numeric(0.8));
    auto shown = renderer.renderInterval(velocity, 1, horizontalSegment(),
                                         {kWidth, kHeight}, &goodFit);
    ASSERT_TRUE(shown.has_value());
    EXPECT_GT(countNonBackground(*shown), 0);
}

TEST(SpatialMapRendererTest, FitGateErrors) {
    auto config = baseConfig();
    config.minFitGoodness = 0.5;
    SpatialMapRenderer renderer(config, ColorLut::create(LutPalette::Fire));
    auto velocity = singleCell(VelocityCell::numeric(600.0));

    auto missing = renderer.renderInterval(velocity, 1, horizontalSegment(), {kWidth, kHeight});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, FlowError::Code::Configuration);

    auto sentinelFit = singleCell(VelocityCell::outOfRange());
    auto sentinel = renderer.renderInterval(velocity, 1, horizontalSegment(),
                                            {kWidth, kHeight}, &sentinelFit);
    ASSERT_FALSE(sentinel.has_value());
    EXPECT_EQ(sentinel.error().code, FlowError::Code::DataIntegrity);

    FlowMatrix wrongSize(2, 1);
    auto mismatch = renderer.renderInterval(velocity, 1, horizontalSegment(),
                                            {kWidth, kHeight}, &wrongSize);
    ASSERT_FALSE(mismatch.has_value());
    EXPECT_EQ(mismatch.error().code, FlowError::Code::Range);
}

TEST(SpatialMapRendererTest, DimensionErrors) {
    SpatialMapRenderer renderer(baseConfig(), ColorLut::create(LutPalette::Fire));
    auto velocity = singleCell(VelocityCell::numeric(1.0));

    EXPECT_EQ(renderer.renderInterval(velocity, 1, horizontalSegment(), {0, kHeight})
                  .error().code, FlowError::Code::InvalidInput);
    EXPECT_EQ(renderer.renderInterval(velocity, 2, horizontalSegment(), {kWidth, kHeight})
                  .error().code, FlowError::Code::Range);
    EXPECT_EQ(renderer.renderInterval(FlowMatrix(1, 2), 1, horizontalSegment(), {kWidth, kHeight})
                  .error().code, FlowError::Code::Range);
}

TEST(SpatialMapRendererTest, RenderAllProducesFramePerInterval) {
    SpatialMapRenderer renderer(baseConfig(), ColorLut::create(LutPalette::Fire));
    FlowMatrix velocity(3, 1);
    ASSERT_TRUE(velocity.set(1, 1, VelocityCell::numeric(100.0)).has_value());
    ASSERT_TRUE(velocity.set(2, 1, VelocityCell::tooShort()).has_value());
    ASSERT_TRUE(velocity.set(3, 1, VelocityCell::numeric(-100.0)).has_value());

    auto frames = renderer.renderAll(velocity, horizontalSegment(), {kWidth, kHeight});
    ASSERT_TRUE(frames.has_value()) << frames.error().toString();
    ASSERT_EQ(frames->size(), 3u);
    EXPECT_GT(countNonBackground((*frames)[0]), 0);
    EXPECT_EQ(countNonBackground((*frames)[1]), 0);
}

TEST(SpatialMapRendererTest, WritesMultiFrameTiffWithBackup) {
    TempDirectory dir("spatial_map_renderer");
    SpatialMapRenderer renderer(baseConfig(), ColorLut::create(LutPalette::Fire));
    FlowMatrix velocity(2, 1);
    ASSERT_TRUE(velocity.set(1, 1, VelocityCell::numeric(300.0)).has_value());
    ASSERT_TRUE(velocity.set(2, 1, VelocityCell::numeric(700.0)).has_value());

    auto frames = renderer.renderAll(velocity, horizontalSegment(), {kWidth, kHeight});
    ASSERT_TRUE(frames.has_value());

    auto file = dir.path() / "maps" / "spatial_map.tif";
    ASSERT_TRUE(SpatialMapRenderer::writeMultiFrameTiff(*frames, file).has_value());
    ASSERT_TRUE(std::filesystem::exists(file));
    EXPECT_GT(std::filesystem::file_size(file), 0u);

    ASSERT_TRUE(SpatialMapRenderer::writeMultiFrameTiff(*frames, file).has_value());
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "maps" / "spatial_map.tif.bak"));
}

TEST(SpatialMapRendererTest, WritingNoFramesIsInvalidInput) {
    TempDirectory dir("spatial_map_renderer_empty");
    auto result = SpatialMapRenderer::writeMultiFrameTiff({}, dir.path() / "empty.tif");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, FlowError::Code::InvalidInput);
}
