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
 * @file orientation_estimator.hpp
 * @brief Dominant line orientation of a kymograph
 * @details Moving particles leave straight streaks in a kymograph. The
 *          streak direction is recovered from the 2x2 structure tensor of
 *          the image gradient:
 *
 *          J = sum over pixels of [gx*gx  gx*gy]
 *                                 [gx*gy  gy*gy]
 *
 *          where x is the position column and y is the frame row. The
 *          dominant gradient direction is 0.5 * atan2(2Jxy, Jxx - Jyy); the
 *          streaks run perpendicular to it. Coherence
 *          sqrt((Jxx - Jyy)^2 + 4Jxy^2) / (Jxx + Jyy) serves as the fit
 *          goodness.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <expected>
#include <memory>
#include <string>

#include "services/flow/flow_types.hpp"
#include "services/flow/kymograph_builder.hpp"

namespace flow_mapper::services {

/**
 * @brief Strategy interface for kymograph orientation estimation
 *
 * The returned angle is measured from the position axis towards the
 * time axis and lies in [0, pi). A particle moving towards increasing
 * arc length at v px/frame produces an angle of atan(1 / v).
 */
class IOrientationEstimator {
public:
    virtual ~IOrientationEstimator() = default;

    /**
     * @brief Estimate the dominant orientation
     * @return Orientation; NaN angle and zero fit for a featureless raster
     */
    [[nodiscard]] virtual std::expected<OrientationResult, FlowError>
    estimate(const Kymograph& kymograph) const = 0;

    /// Short name used in logs
    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * @brief Structure-tensor estimate on the raw kymograph
 */
class GradientOrientationEstimator : public IOrientationEstimator {
public:
    [[nodiscard]] std::expected<OrientationResult, FlowError>
    estimate(const Kymograph& kymograph) const override;

    [[nodiscard]] std::string name() const override { return "gradient"; }

    /**
     * @brief Estimate on an arbitrary raster
     */
    [[nodiscard]] static std::expected<OrientationResult, FlowError>
    estimateRaster(const FloatImage2D* raster);
};

/**
 * @brief Structure-tensor estimate after removing each frame row's mean
 *
 * Global illumination flicker adds a per-frame offset that shows up as
 * horizontal bands in the kymograph and biases the estimate towards
 * zero velocity. Subtracting the row mean removes it.
 */
class FlickerCorrectedOrientationEstimator : public IOrientationEstimator {
public:
    [[nodiscard]] std::expected<OrientationResult, FlowError>
    estimate(const Kymograph& kymograph) const override;

    [[nodiscard]] std::string name() const override { return "flicker-corrected"; }

    /// Copy of @p raster with every row shifted to zero mean
    [[nodiscard]] static FloatImage2D::Pointer
    removeRowMeans(const FloatImage2D* raster);
};

/**
 * @brief Select the estimator for the flickerCorrection setting
 */
[[nodiscard]] std::unique_ptr<IOrientationEstimator>
createOrientationEstimator(bool flickerCorrection);

}  // namespace flow_mapper::services
