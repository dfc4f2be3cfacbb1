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

#include "services/flow/velocity_calculator.hpp"

#include <cmath>
#include <format>
#include <limits>

#include <kcenon/common/logging/log_macros.h>

namespace flow_mapper::services {

VelocityCalculator::VelocityCalculator(VelocityPolicy policy)
    : policy_(policy) {}

double VelocityCalculator::angleToVelocity(double angle,
                                           double frameRate,
                                           double pixelSize) noexcept {
    const double tangent = std::tan(angle);
    if (tangent == 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    return (1.0 / tangent) * frameRate * pixelSize;
}

double VelocityCalculator::roundToHundredths(double value) noexcept {
    double rounded = std::round(value * 100.0) / 100.0;
    if (rounded == 0.0) {
        rounded = 0.0;
    }
    return rounded;
}

VelocityEvaluation VelocityCalculator::evaluate(const Segment& segment,
                                                int intervalId,
                                                double angle) const {
    VelocityEvaluation result;
    result.rawVelocity = angleToVelocity(angle, policy_.frameRate, policy_.pixelSize);

    if (segment.physicalLength < policy_.minSegmentLength) {
        result.cell = VelocityCell::tooShort();
        return result;
    }

    if (!std::isfinite(angle) || !std::isfinite(result.rawVelocity)) {
        result.cell = VelocityCell::outOfRange();
        result.anomaly = ComputationAnomaly{segment.id, intervalId, angle};
        LOG_WARNING(std::format(
            "Non-finite velocity for segment {} interval {} (angle {})",
            segment.id, intervalId, angle));
        return result;
    }

    if (std::abs(result.rawVelocity) > policy_.maxMeasuredSpeed) {
        result.cell = VelocityCell::outOfRange();
        return result;
    }

    result.cell = VelocityCell::numeric(roundToHundredths(result.rawVelocity));
    return result;
}

}  // namespace flow_mapper::services
