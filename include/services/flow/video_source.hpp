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
#include <expected>
#include <filesystem>
#include <memory>

#include "services/flow/flow_types.hpp"

namespace flow_mapper::services {

/**
 * @brief Frame-indexable video with spatial and temporal calibration
 *
 * Frame numbers are 1-based. Implementations must allow concurrent
 * frame() calls; frames are returned as independent images so callers
 * can never modify the source.
 */
class VideoSource {
public:
    virtual ~VideoSource() = default;

    [[nodiscard]] virtual int frameCount() const = 0;

    /// Width and height in pixels
    [[nodiscard]] virtual std::array<int, 2> frameSize() const = 0;

    [[nodiscard]] virtual std::expected<FloatImage2D::Pointer, FlowError>
    frame(int frameNumber) const = 0;

    /**
     * @brief Record calibration metadata
     * @param pixelSize Micrometres per pixel
     * @param frameRate Frames per second
     */
    virtual void setCalibration(double pixelSize, double frameRate) {
        pixelSize_ = pixelSize;
        frameRate_ = frameRate;
    }

    [[nodiscard]] double pixelSize() const noexcept { return pixelSize_; }
    [[nodiscard]] double frameRate() const noexcept { return frameRate_; }

protected:
    double pixelSize_ = 1.0;
    double frameRate_ = 1.0;
};

/**
 * @brief Video held in memory as an ITK image stack (x, y, frame)
 *
 * Any 3-D format ITK can read is accepted; multi-page TIFF is the usual
 * export of microscope acquisition software.
 */
class ImageStackVideo : public VideoSource {
public:
    explicit ImageStackVideo(FloatImage3D::Pointer stack);

    /**
     * @brief Read a complete stack from disk
     */
    [[nodiscard]] static std::expected<std::unique_ptr<ImageStackVideo>, FlowError>
    open(const std::filesystem::path& path);

    /**
     * @brief Read only the header of a stack (frame size and count)
     * @return {width, height, frameCount}
     */
    [[nodiscard]] static std::expected<std::array<int, 3>, FlowError>
    probe(const std::filesystem::path& path);

    [[nodiscard]] int frameCount() const override;
    [[nodiscard]] std::array<int, 2> frameSize() const override;

    [[nodiscard]] std::expected<FloatImage2D::Pointer, FlowError>
    frame(int frameNumber) const override;

    /// Also stores the calibration as image spacing (um, um, s)
    void setCalibration(double pixelSize, double frameRate) override;

    [[nodiscard]] FloatImage3D::ConstPointer stack() const { return stack_.GetPointer(); }

private:
    FloatImage3D::Pointer stack_;
};

}  // namespace flow_mapper::services
