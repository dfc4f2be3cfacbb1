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

#include <optional>

#include "services/flow/flow_types.hpp"

namespace flow_mapper::services {

/**
 * @brief Calibration and validity limits for velocity conversion
 */
struct VelocityPolicy {
    double frameRate = 0.0;          ///< fps
    double pixelSize = 0.0;          ///< um per pixel
    double minSegmentLength = 0.0;   ///< um; shorter segments are TooShort
    double maxMeasuredSpeed = 0.0;   ///< um/s; faster results are OutOfRange
};

/**
 * @brief Outcome of classifying one orientation result
 */
struct VelocityEvaluation {
    VelocityCell cell;
    double rawVelocity = 0.0;                      ///< Unrounded um/s (may be inf/NaN)
    std::optional<ComputationAnomaly> anomaly;     ///< Set for non-finite results
};

/**
 * @brief Converts kymograph orientation into flow velocity
 *
 * velocity = (1 / tan(angle)) * frameRate * pixelSize. Classification
 * runs in this order: segment shorter than minSegmentLength yields
 * TooShort; a non-finite angle or velocity yields OutOfRange together
 * with a ComputationAnomaly; |velocity| above maxMeasuredSpeed yields
 * OutOfRange; anything else is Numeric, rounded to hundredths.
 */
class VelocityCalculator {
public:
    explicit VelocityCalculator(VelocityPolicy policy);

    [[nodiscard]] const VelocityPolicy& policy() const noexcept { return policy_; }

    /**
     * @brief Classify the orientation of one (interval, segment) unit
     */
    [[nodiscard]] VelocityEvaluation evaluate(const Segment& segment,
                                              int intervalId,
                                              double angle) const;

    /**
     * @brief Raw conversion without classification
     *
     * Returns +infinity when tan(angle) is exactly zero.
     */
    [[nodiscard]] static double angleToVelocity(double angle,
                                                double frameRate,
                                                double pixelSize) noexcept;

    /// Round half away from zero to two decimals; -0 becomes 0
    [[nodiscard]] static double roundToHundredths(double value) noexcept;

private:
    VelocityPolicy policy_;
};

}  // namespace flow_mapper::services
