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

#include "services/flow/orientation_estimator.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <numbers>

#include <itkGradientImageFilter.h>
#include <itkImageRegionConstIterator.h>

namespace flow_mapper::services {

namespace {

using GradientFilterType = itk::GradientImageFilter<FloatImage2D, float, float>;
using GradientImageType = GradientFilterType::OutputImageType;

// Tensor energy below which the raster is considered featureless
constexpr double kMinTensorEnergy = 1e-12;

OrientationResult orientationFromTensor(double jxx, double jyy, double jxy) {
    const double trace = jxx + jyy;
    if (!(trace > kMinTensorEnergy)) {
        return {std::numeric_limits<double>::quiet_NaN(), 0.0};
    }

    const double gradientAngle = 0.5 * std::atan2(2.0 * jxy, jxx - jyy);
    double lineAngle = gradientAngle + std::numbers::pi / 2.0;
    while (lineAngle >= std::numbers::pi) lineAngle -= std::numbers::pi;
    while (lineAngle < 0.0) lineAngle += std::numbers::pi;

    const double diff = jxx - jyy;
    double coherence = std::sqrt(diff * diff + 4.0 * jxy * jxy) / trace;
    coherence = std::min(coherence, 1.0);

    return {lineAngle, coherence};
}

}  // anonymous namespace

// =============================================================================
// GradientOrientationEstimator
// =============================================================================

std::expected<OrientationResult, FlowError>
GradientOrientationEstimator::estimateRaster(const FloatImage2D* raster) {
    if (!raster) {
        return std::unexpected(FlowError{
            FlowError::Code::InvalidInput, "Kymograph has no raster"});
    }

    auto size = raster->GetLargestPossibleRegion().GetSize();
    if (size[0] < 2 || size[1] < 2) {
        // A single row or column carries no orientation
        return OrientationResult{std::numeric_limits<double>::quiet_NaN(), 0.0};
    }

    auto gradient = GradientFilterType::New();
    gradient->SetInput(raster);
    gradient->SetUseImageSpacing(false);
    gradient->SetUseImageDirection(false);

    try {
        gradient->Update();
    } catch (const itk::ExceptionObject& e) {
        return std::unexpected(FlowError{
            FlowError::Code::InternalError,
            std::format("Gradient computation failed: {}", e.GetDescription())});
    }

    double jxx = 0.0;
    double jyy = 0.0;
    double jxy = 0.0;

    itk::ImageRegionConstIterator<GradientImageType> it(
        gradient->GetOutput(), gradient->GetOutput()->GetLargestPossibleRegion());
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        const auto& g = it.Get();
        const double gx = g[0];
        const double gy = g[1];
        jxx += gx * gx;
        jyy += gy * gy;
        jxy += gx * gy;
    }

    return orientationFromTensor(jxx, jyy, jxy);
}

std::expected<OrientationResult, FlowError>
GradientOrientationEstimator::estimate(const Kymograph& kymograph) const {
    return estimateRaster(kymograph.raster.GetPointer());
}

// =============================================================================
// FlickerCorrectedOrientationEstimator
// =============================================================================

FloatImage2D::Pointer
FlickerCorrectedOrientationEstimator::removeRowMeans(const FloatImage2D* raster) {
    auto result = FloatImage2D::New();
    result->SetRegions(raster->GetLargestPossibleRegion());
    result->SetSpacing(raster->GetSpacing());
    result->Allocate();

    auto size = raster->GetLargestPossibleRegion().GetSize();
    const auto width = static_cast<size_t>(size[0]);
    const auto height = static_cast<size_t>(size[1]);
    const float* in = raster->GetBufferPointer();
    float* out = result->GetBufferPointer();

    for (size_t row = 0; row < height; ++row) {
        double sum = 0.0;
        for (size_t col = 0; col < width; ++col) {
            sum += in[row * width + col];
        }
        const double mean = width > 0 ? sum / static_cast<double>(width) : 0.0;
        for (size_t col = 0; col < width; ++col) {
            out[row * width + col] = static_cast<float>(in[row * width + col] - mean);
        }
    }
    return result;
}

std::expected<OrientationResult, FlowError>
FlickerCorrectedOrientationEstimator::estimate(const Kymograph& kymograph) const {
    if (!kymograph.raster) {
        return std::unexpected(FlowError{
            FlowError::Code::InvalidInput, "Kymograph has no raster"});
    }

    FloatImage2D::Pointer corrected;
    try {
        corrected = removeRowMeans(kymograph.raster.GetPointer());
    } catch (const itk::ExceptionObject& e) {
        return std::unexpected(FlowError{
            FlowError::Code::InternalError,
            std::format("Flicker correction failed: {}", e.GetDescription())});
    }
    return GradientOrientationEstimator::estimateRaster(corrected.GetPointer());
}

std::unique_ptr<IOrientationEstimator> createOrientationEstimator(bool flickerCorrection) {
    if (flickerCorrection) {
        return std::make_unique<FlickerCorrectedOrientationEstimator>();
    }
    return std::make_unique<GradientOrientationEstimator>();
}

}  // namespace flow_mapper::services
