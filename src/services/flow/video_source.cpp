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

#include "services/flow/video_source.hpp"

#include <format>

#include <itkImageFileReader.h>
#include <itkImageIOBase.h>
#include <itkImageIOFactory.h>
#include <itkImageRegionConstIterator.h>
#include <itkImageRegionIterator.h>

#include "core/logging.hpp"

namespace {

auto& getLogger() {
    static auto logger = flow_mapper::logging::LoggerFactory::create("VideoSource");
    return logger;
}

}  // anonymous namespace

namespace flow_mapper::services {

ImageStackVideo::ImageStackVideo(FloatImage3D::Pointer stack)
    : stack_(std::move(stack)) {}

std::expected<std::unique_ptr<ImageStackVideo>, FlowError>
ImageStackVideo::open(const std::filesystem::path& path) {
    using ReaderType = itk::ImageFileReader<FloatImage3D>;

    try {
        auto reader = ReaderType::New();
        reader->SetFileName(path.string());
        reader->Update();

        FloatImage3D::Pointer stack = reader->GetOutput();
        stack->DisconnectPipeline();

        auto size = stack->GetLargestPossibleRegion().GetSize();
        getLogger()->info("Opened video {}: {}x{} px, {} frames",
                          path.filename().string(), size[0], size[1], size[2]);

        return std::make_unique<ImageStackVideo>(stack);
    } catch (const itk::ExceptionObject& e) {
        return std::unexpected(FlowError{
            FlowError::Code::FileAccess,
            std::format("Cannot read video {}: {}", path.string(), e.GetDescription())});
    }
}

std::expected<std::array<int, 3>, FlowError>
ImageStackVideo::probe(const std::filesystem::path& path) {
    auto imageIO = itk::ImageIOFactory::CreateImageIO(
        path.string().c_str(), itk::CommonEnums::IOFileMode::ReadMode);
    if (!imageIO) {
        return std::unexpected(FlowError{
            FlowError::Code::FileAccess,
            "No image reader understands " + path.string()});
    }

    try {
        imageIO->SetFileName(path.string());
        imageIO->ReadImageInformation();
    } catch (const itk::ExceptionObject& e) {
        return std::unexpected(FlowError{
            FlowError::Code::FileAccess,
            std::format("Cannot read header of {}: {}", path.string(), e.GetDescription())});
    }

    const int width = static_cast<int>(imageIO->GetDimensions(0));
    const int height = imageIO->GetNumberOfDimensions() > 1
        ? static_cast<int>(imageIO->GetDimensions(1)) : 1;
    const int frames = imageIO->GetNumberOfDimensions() > 2
        ? static_cast<int>(imageIO->GetDimensions(2)) : 1;
    return std::array<int, 3>{width, height, frames};
}

int ImageStackVideo::frameCount() const {
    if (!stack_) return 0;
    return static_cast<int>(stack_->GetLargestPossibleRegion().GetSize()[2]);
}

std::array<int, 2> ImageStackVideo::frameSize() const {
    if (!stack_) return {0, 0};
    auto size = stack_->GetLargestPossibleRegion().GetSize();
    return {static_cast<int>(size[0]), static_cast<int>(size[1])};
}

std::expected<FloatImage2D::Pointer, FlowError>
ImageStackVideo::frame(int frameNumber) const {
    if (!stack_) {
        return std::unexpected(FlowError{
            FlowError::Code::InvalidInput, "Video has no image data"});
    }
    if (frameNumber < 1 || frameNumber > frameCount()) {
        return std::unexpected(FlowError{
            FlowError::Code::Range,
            std::format("Frame {} outside [1, {}]", frameNumber, frameCount())});
    }

    // Read-only copy; an extract filter would touch the shared requested region
    auto stackRegion = stack_->GetLargestPossibleRegion();
    auto stackSize = stackRegion.GetSize();
    auto stackIndex = stackRegion.GetIndex();

    FloatImage3D::SizeType frameSize = stackSize;
    frameSize[2] = 1;
    FloatImage3D::IndexType frameIndex = stackIndex;
    frameIndex[2] += frameNumber - 1;
    FloatImage3D::RegionType frameRegion(frameIndex, frameSize);

    auto result = FloatImage2D::New();
    FloatImage2D::SizeType size = {{stackSize[0], stackSize[1]}};
    FloatImage2D::IndexType start = {{0, 0}};
    result->SetRegions(FloatImage2D::RegionType(start, size));

    auto stackSpacing = stack_->GetSpacing();
    FloatImage2D::SpacingType spacing;
    spacing[0] = stackSpacing[0];
    spacing[1] = stackSpacing[1];
    result->SetSpacing(spacing);

    try {
        result->Allocate();
    } catch (const itk::ExceptionObject& e) {
        return std::unexpected(FlowError{
            FlowError::Code::InternalError,
            std::format("Failed to allocate frame {}: {}", frameNumber, e.GetDescription())});
    }

    itk::ImageRegionConstIterator<FloatImage3D> in(stack_, frameRegion);
    itk::ImageRegionIterator<FloatImage2D> out(result, result->GetLargestPossibleRegion());
    for (in.GoToBegin(), out.GoToBegin(); !in.IsAtEnd(); ++in, ++out) {
        out.Set(in.Get());
    }

    return result;
}

void ImageStackVideo::setCalibration(double pixelSize, double frameRate) {
    VideoSource::setCalibration(pixelSize, frameRate);
    if (!stack_ || pixelSize <= 0.0 || frameRate <= 0.0) {
        return;
    }

    FloatImage3D::SpacingType spacing;
    spacing[0] = pixelSize;
    spacing[1] = pixelSize;
    spacing[2] = 1.0 / frameRate;
    stack_->SetSpacing(spacing);

    getLogger()->debug("Calibration: {:.4f} um/px, {:.2f} fps", pixelSize, frameRate);
}

}  // namespace flow_mapper::services
