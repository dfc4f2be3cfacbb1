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

#include "services/flow/kymograph_builder.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <format>

#include <itkLinearInterpolateImageFunction.h>

namespace flow_mapper::services {

using InterpolatorType = itk::LinearInterpolateImageFunction<FloatImage2D, double>;

class KymographBuilder::Impl {
public:
    std::shared_ptr<spdlog::logger> logger;

    Impl() : logger(logging::LoggerFactory::create("KymographBuilder")) {}

    // Interpolate point along the polyline at the given arc length
    static Point2D interpolateAlongPolyline(
        const std::vector<Point2D>& points,
        const std::vector<double>& arcLengths,
        double targetArcLen);

    // Sample a frame at continuous pixel index; 0 outside the frame
    static float sampleFrame(const InterpolatorType* interp, const Point2D& pos);
};

KymographBuilder::KymographBuilder()
    : impl_(std::make_unique<Impl>()) {}

KymographBuilder::~KymographBuilder() = default;

KymographBuilder::KymographBuilder(KymographBuilder&&) noexcept = default;
KymographBuilder& KymographBuilder::operator=(KymographBuilder&&) noexcept = default;

// =============================================================================
// Helper Functions
// =============================================================================

Point2D KymographBuilder::Impl::interpolateAlongPolyline(
    const std::vector<Point2D>& points,
    const std::vector<double>& arcLengths,
    double targetArcLen)
{
    // Find bracketing segment
    int lo = 0;
    for (int i = 1; i < static_cast<int>(arcLengths.size()); ++i) {
        if (arcLengths[i] >= targetArcLen) {
            lo = i - 1;
            break;
        }
        lo = i;
    }
    int hi = std::min(lo + 1, static_cast<int>(points.size()) - 1);

    double segLen = arcLengths[hi] - arcLengths[lo];
    double t = (segLen > 1e-10) ? (targetArcLen - arcLengths[lo]) / segLen : 0.0;
    t = std::clamp(t, 0.0, 1.0);

    return Point2D{
        points[lo][0] + t * (points[hi][0] - points[lo][0]),
        points[lo][1] + t * (points[hi][1] - points[lo][1])
    };
}

float KymographBuilder::Impl::sampleFrame(const InterpolatorType* interp, const Point2D& pos)
{
    InterpolatorType::ContinuousIndexType index;
    index[0] = pos[0];
    index[1] = pos[1];

    if (interp->IsInsideBuffer(index)) {
        return static_cast<float>(interp->EvaluateAtContinuousIndex(index));
    }
    return 0.0f;
}

std::vector<Point2D> KymographBuilder::samplePositions(const std::vector<Point2D>& polyline) {
    if (polyline.empty()) {
        return {};
    }

    const int n = static_cast<int>(polyline.size());
    std::vector<double> arcLengths(n, 0.0);
    for (int i = 1; i < n; ++i) {
        double dx = polyline[i][0] - polyline[i-1][0];
        double dy = polyline[i][1] - polyline[i-1][1];
        arcLengths[i] = arcLengths[i-1] + std::sqrt(dx*dx + dy*dy);
    }
    const double totalLength = arcLengths.back();

    const int sampleCount = static_cast<int>(std::floor(totalLength)) + 1;
    std::vector<Point2D> samples;
    samples.reserve(sampleCount);
    for (int s = 0; s < sampleCount; ++s) {
        samples.push_back(Impl::interpolateAlongPolyline(
            polyline, arcLengths, static_cast<double>(s)));
    }
    return samples;
}

// =============================================================================
// Kymograph
// =============================================================================

std::expected<IntervalFrames, FlowError>
KymographBuilder::readFrames(const VideoSource& video, const Interval& interval)
{
    if (interval.startFrame < 1 || interval.endFrame < interval.startFrame ||
        interval.endFrame > video.frameCount()) {
        return std::unexpected(FlowError{
            FlowError::Code::Range,
            std::format("Interval {} (frames {}-{}) exceeds the {} available frames",
                        interval.id, interval.startFrame, interval.endFrame,
                        video.frameCount())});
    }

    IntervalFrames frames;
    frames.reserve(static_cast<size_t>(interval.frameCount()));
    for (int frameNumber = interval.startFrame; frameNumber <= interval.endFrame; ++frameNumber) {
        auto frame = video.frame(frameNumber);
        if (!frame) {
            return std::unexpected(frame.error());
        }
        frames.push_back(std::move(*frame));
    }
    return frames;
}

std::expected<Kymograph, FlowError>
KymographBuilder::build(const VideoSource& video,
                        const Segment& segment,
                        const Interval& interval) const
{
    if (segment.points.size() < 2) {
        return std::unexpected(FlowError{
            FlowError::Code::InvalidInput,
            std::format("Segment {} has fewer than 2 points", segment.id)});
    }

    auto frames = readFrames(video, interval);
    if (!frames) {
        return std::unexpected(frames.error());
    }
    return build(*frames, segment, interval);
}

std::expected<Kymograph, FlowError>
KymographBuilder::build(const IntervalFrames& frames,
                        const Segment& segment,
                        const Interval& interval) const
{
    if (segment.points.size() < 2) {
        return std::unexpected(FlowError{
            FlowError::Code::InvalidInput,
            std::format("Segment {} has fewer than 2 points", segment.id)});
    }
    if (static_cast<int>(frames.size()) != interval.frameCount()) {
        return std::unexpected(FlowError{
            FlowError::Code::Range,
            std::format("Interval {} spans {} frames but {} were supplied",
                        interval.id, interval.frameCount(), frames.size())});
    }

    const auto samples = samplePositions(segment.points);
    const int width = static_cast<int>(samples.size());
    const int height = interval.frameCount();

    auto raster = FloatImage2D::New();
    FloatImage2D::SizeType size;
    size[0] = static_cast<FloatImage2D::SizeValueType>(width);
    size[1] = static_cast<FloatImage2D::SizeValueType>(height);
    FloatImage2D::IndexType start;
    start[0] = 0;
    start[1] = 0;
    raster->SetRegions(FloatImage2D::RegionType(start, size));

    try {
        raster->Allocate(true);
    } catch (const itk::ExceptionObject& e) {
        return std::unexpected(FlowError{
            FlowError::Code::InternalError,
            std::format("Cannot allocate {}x{} kymograph: {}", width, height,
                        e.GetDescription())});
    }

    float* pixels = raster->GetBufferPointer();
    auto interp = InterpolatorType::New();

    for (int row = 0; row < height; ++row) {
        const auto& frame = frames[static_cast<size_t>(row)];
        if (!frame) {
            return std::unexpected(FlowError{
                FlowError::Code::InvalidInput,
                std::format("Frame {} of interval {} is missing", interval.startFrame + row,
                            interval.id)});
        }

        interp->SetInputImage(frame);
        for (int col = 0; col < width; ++col) {
            pixels[row * width + col] = Impl::sampleFrame(interp.GetPointer(), samples[col]);
        }
    }

    impl_->logger->debug("Kymograph interval {} segment {}: {}x{} px",
                         interval.id, segment.id, width, height);

    return Kymograph{raster, segment.id, interval.id};
}

}  // namespace flow_mapper::services
