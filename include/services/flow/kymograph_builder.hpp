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
 * @file kymograph_builder.hpp
 * @brief Space-time raster generator along a vessel segment
 * @details Resamples each frame of an interval along the segment polyline
 *          at unit arc-length steps. Row t of the result is frame
 *          (startFrame + t), column s is the intensity at arc length s
 *          pixels from the first polyline point. A particle moving along
 *          the vessel therefore leaves a straight streak whose slope
 *          encodes its speed.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <expected>
#include <memory>
#include <vector>

#include "services/flow/flow_types.hpp"
#include "services/flow/video_source.hpp"

namespace flow_mapper::services {

/**
 * @brief Kymograph of one (interval, segment) pair
 */
struct Kymograph {
    FloatImage2D::Pointer raster;   ///< width = samples, height = frames
    int segmentId = 0;
    int intervalId = 0;

    [[nodiscard]] int width() const {
        return raster ? static_cast<int>(raster->GetLargestPossibleRegion().GetSize()[0]) : 0;
    }
    [[nodiscard]] int height() const {
        return raster ? static_cast<int>(raster->GetLargestPossibleRegion().GetSize()[1]) : 0;
    }
};

/// Frames of one interval in order; row t of a kymograph reads entry t
using IntervalFrames = std::vector<FloatImage2D::Pointer>;

/**
 * @brief Builds kymographs from a video source
 *
 * The builder is stateless apart from its logger and may be shared by
 * concurrent workers.
 *
 * @example
 * @code
 * KymographBuilder builder;
 * auto kymo = builder.build(video, catalog.byId(3), intervals.intervals()[0]);
 * if (kymo) {
 *     auto orientation = estimator->estimate(*kymo);
 * }
 * @endcode
 */
class KymographBuilder {
public:
    KymographBuilder();
    ~KymographBuilder();

    KymographBuilder(const KymographBuilder&) = delete;
    KymographBuilder& operator=(const KymographBuilder&) = delete;
    KymographBuilder(KymographBuilder&&) noexcept;
    KymographBuilder& operator=(KymographBuilder&&) noexcept;

    /**
     * @brief Build the kymograph of a segment over an interval
     *
     * Only frames inside the interval are read.
     *
     * @return Kymograph, Range error when the interval exceeds the video,
     *         InvalidInput for polylines with fewer than two points
     */
    [[nodiscard]] std::expected<Kymograph, FlowError>
    build(const VideoSource& video, const Segment& segment, const Interval& interval) const;

    /**
     * @brief Build from frames already read for the interval
     *
     * Frames are only read, so one set may be shared by concurrent builds
     * of different segments.
     *
     * @return Range error when the frame count differs from the interval
     *         length, InvalidInput as for the video overload
     */
    [[nodiscard]] std::expected<Kymograph, FlowError>
    build(const IntervalFrames& frames, const Segment& segment, const Interval& interval) const;

    /**
     * @brief Read every frame of an interval once
     * @return Frames in interval order or Range error when the interval
     *         exceeds the video
     */
    [[nodiscard]] static std::expected<IntervalFrames, FlowError>
    readFrames(const VideoSource& video, const Interval& interval);

    /**
     * @brief Positions at unit arc-length steps along a polyline
     *
     * Returns floor(pathLength) + 1 points; the first equals the first
     * polyline point.
     */
    [[nodiscard]] static std::vector<Point2D>
    samplePositions(const std::vector<Point2D>& polyline);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace flow_mapper::services
