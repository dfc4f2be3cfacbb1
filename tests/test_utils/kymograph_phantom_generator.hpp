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

/// @file kymograph_phantom_generator.hpp
/// @brief Synthetic microscopy data with analytically known flow speed
///
/// Phantoms:
/// - Moving sinusoid video:  I(x, y, t) = base + amp * sin(2*pi*(x - v*t) / lambda)
///   Every horizontal line is a kymograph with streak slope v px/frame.
/// - Direct kymograph raster with the same pattern (no video sampling)
/// - Flicker: a per-frame offset added to every pixel of a frame

#include <array>
#include <cmath>
#include <filesystem>
#include <functional>
#include <numbers>
#include <string>

#include <itkImage.h>
#include <itkImageFileWriter.h>

#include "services/flow/flow_types.hpp"
#include "services/flow/kymograph_builder.hpp"

namespace flow_mapper::test_utils {

using services::FloatImage2D;
using services::FloatImage3D;
using services::Kymograph;

/// Parameters of a moving sinusoid
struct SinusoidPhantom {
    double velocity = 2.0;      ///< px/frame, positive = towards +x
    double wavelength = 64.0;   ///< px
    double base = 100.0;
    double amplitude = 50.0;
    double flicker = 0.0;       ///< Amplitude of the per-frame offset

    [[nodiscard]] double intensity(double x, double t) const {
        double value = base + amplitude *
            std::sin(2.0 * std::numbers::pi * (x - velocity * t) / wavelength);
        if (flicker != 0.0) {
            value += flicker * std::sin(1.7 * t);
        }
        return value;
    }
};

/// Video stack where every pixel follows fn(x, y, frameIndex), frameIndex 0-based
inline FloatImage3D::Pointer createVideoStack(
    int width, int height, int frames,
    const std::function<float(int, int, int)>& fn) {

    auto image = FloatImage3D::New();
    FloatImage3D::SizeType size = {{
        static_cast<FloatImage3D::SizeValueType>(width),
        static_cast<FloatImage3D::SizeValueType>(height),
        static_cast<FloatImage3D::SizeValueType>(frames)
    }};
    FloatImage3D::IndexType start = {{0, 0, 0}};
    image->SetRegions(FloatImage3D::RegionType(start, size));
    image->Allocate();

    float* buffer = image->GetBufferPointer();
    for (int t = 0; t < frames; ++t) {
        for (int y = 0; y < height; ++y) {
            for (int x = 0; x < width; ++x) {
                buffer[(static_cast<size_t>(t) * height + y) * width + x] = fn(x, y, t);
            }
        }
    }
    return image;
}

/// Moving sinusoid video, uniform along y
inline FloatImage3D::Pointer createSinusoidVideo(
    int width, int height, int frames, const SinusoidPhantom& phantom) {
    return createVideoStack(width, height, frames, [&phantom](int x, int, int t) {
        return static_cast<float>(phantom.intensity(x, t));
    });
}

/// Kymograph raster with rows = frames, columns = positions
inline Kymograph createSinusoidKymograph(
    int width, int height, const SinusoidPhantom& phantom) {

    auto raster = FloatImage2D::New();
    FloatImage2D::SizeType size = {{
        static_cast<FloatImage2D::SizeValueType>(width),
        static_cast<FloatImage2D::SizeValueType>(height)
    }};
    FloatImage2D::IndexType start = {{0, 0}};
    raster->SetRegions(FloatImage2D::RegionType(start, size));
    raster->Allocate();

    float* buffer = raster->GetBufferPointer();
    for (int t = 0; t < height; ++t) {
        for (int x = 0; x < width; ++x) {
            buffer[t * width + x] = static_cast<float>(phantom.intensity(x, t));
        }
    }
    return Kymograph{raster, 1, 1};
}

/// Constant raster (no orientation structure)
inline Kymograph createUniformKymograph(int width, int height, float value) {
    auto raster = FloatImage2D::New();
    FloatImage2D::SizeType size = {{
        static_cast<FloatImage2D::SizeValueType>(width),
        static_cast<FloatImage2D::SizeValueType>(height)
    }};
    FloatImage2D::IndexType start = {{0, 0}};
    raster->SetRegions(FloatImage2D::RegionType(start, size));
    raster->Allocate();
    raster->FillBuffer(value);
    return Kymograph{raster, 1, 1};
}

/// Write a stack to disk (format chosen by extension)
inline void writeVideoStack(const FloatImage3D::Pointer& stack,
                            const std::filesystem::path& path) {
    auto writer = itk::ImageFileWriter<FloatImage3D>::New();
    writer->SetFileName(path.string());
    writer->SetInput(stack);
    writer->Update();
}

/// Unique scratch directory removed on destruction
class TempDirectory {
public:
    explicit TempDirectory(const std::string& name)
        : path_(std::filesystem::temp_directory_path() / ("flow_mapper_test_" + name)) {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace flow_mapper::test_utils
