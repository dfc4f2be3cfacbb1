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

#include <array>
#include <cmath>
#include <string>
#include <vector>

#include <itkImage.h>

namespace flow_mapper::services {

/// Single video frame or kymograph raster
using FloatImage2D = itk::Image<float, 2>;

/// Video stack: x, y, frame
using FloatImage3D = itk::Image<float, 3>;

/**
 * @brief Error information for flow mapping operations
 */
struct FlowError {
    enum class Code {
        Success,
        InvalidInput,
        Configuration,   ///< Required parameter empty, unparsable or path absent
        Range,           ///< Frame range or persisted row/column count out of bounds
        DataIntegrity,   ///< Sentinel where a numeric value is required
        ParseFailed,
        FileAccess,
        Cancelled,
        InternalError
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::InvalidInput: return "Invalid input: " + message;
            case Code::Configuration: return "Configuration error: " + message;
            case Code::Range: return "Range error: " + message;
            case Code::DataIntegrity: return "Data integrity error: " + message;
            case Code::ParseFailed: return "Parse failed: " + message;
            case Code::FileAccess: return "File access error: " + message;
            case Code::Cancelled: return "Cancelled: " + message;
            case Code::InternalError: return "Internal error: " + message;
        }
        return "Unknown error";
    }
};

/// Pixel coordinate (x, y) in video frame space
using Point2D = std::array<double, 2>;

/**
 * @brief Traced vessel segment
 *
 * Ids are 1-based and follow the order of the segment file; every
 * pipeline stage addresses segments by this id.
 */
struct Segment {
    int id = 0;
    std::string name;
    std::vector<Point2D> points;
    double pixelLength = 0.0;     ///< Polyline length in pixels
    double physicalLength = 0.0;  ///< pixelLength * pixel size (um)
};

/**
 * @brief Frame range selected for analysis (1-based, inclusive)
 */
struct Interval {
    int id = 0;
    int startFrame = 0;
    int endFrame = 0;

    [[nodiscard]] int frameCount() const noexcept {
        return endFrame - startFrame + 1;
    }

    bool operator==(const Interval&) const = default;
};

/**
 * @brief Dominant orientation of a kymograph
 *
 * The angle is measured from the position axis towards the time axis,
 * in [0, pi). A kymograph without orientation structure reports NaN.
 */
struct OrientationResult {
    double angle = 0.0;        ///< radians
    double fitGoodness = 0.0;  ///< 0 = isotropic, 1 = perfectly oriented
};

/**
 * @brief Matrix cell state
 */
enum class CellState {
    Numeric,
    TooShort,    ///< Segment shorter than the minimum measurable length
    OutOfRange   ///< Speed above the measurable limit or non-finite
};

/**
 * @brief Tagged matrix cell; the value is meaningful only when Numeric
 */
struct VelocityCell {
    CellState state = CellState::OutOfRange;
    double value = 0.0;

    [[nodiscard]] static VelocityCell numeric(double v) noexcept {
        return {CellState::Numeric, v};
    }
    [[nodiscard]] static VelocityCell tooShort() noexcept {
        return {CellState::TooShort, 0.0};
    }
    [[nodiscard]] static VelocityCell outOfRange() noexcept {
        return {CellState::OutOfRange, 0.0};
    }

    [[nodiscard]] bool isNumeric() const noexcept {
        return state == CellState::Numeric;
    }

    bool operator==(const VelocityCell& other) const noexcept {
        return state == other.state && (state != CellState::Numeric || value == other.value);
    }
};

/**
 * @brief Diagnostic record for a non-finite angle or velocity
 */
struct ComputationAnomaly {
    int segmentId = 0;
    int intervalId = 0;
    double rawAngle = 0.0;
};

/// Sentinel tokens used at the text boundary
inline constexpr const char* kTooShortToken = "short";
inline constexpr const char* kOutOfRangeToken = "out";

}  // namespace flow_mapper::services
