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

#include "services/render/spatial_map_renderer.hpp"
#include "services/flow/segment_catalog.hpp"
#include "core/artifact_writer.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <format>

#include <vtkImageAppend.h>
#include <vtkImageCanvasSource2D.h>
#include <vtkNew.h>
#include <vtkTIFFWriter.h>

namespace flow_mapper::services {

class SpatialMapRenderer::Impl {
public:
    SpatialMapConfig config;
    ColorLut lut;
    std::shared_ptr<spdlog::logger> logger;

    Impl(SpatialMapConfig cfg, ColorLut table)
        : config(std::move(cfg))
        , lut(std::move(table))
        , logger(logging::LoggerFactory::create("SpatialMapRenderer")) {}

    // Canvas column/row of a video pixel position
    static std::array<int, 2> toCanvas(const Point2D& p, int height) {
        return {static_cast<int>(std::lround(p[0])),
                height - 1 - static_cast<int>(std::lround(p[1]))};
    }

    static void setColor(vtkImageCanvasSource2D* canvas, const core::RgbColor& c) {
        canvas->SetDrawColor(c.r, c.g, c.b);
    }

    // Square brush of side lineThickness stamped along the segment
    void drawThickSegment(vtkImageCanvasSource2D* canvas,
                          const std::array<int, 2>& a,
                          const std::array<int, 2>& b) const {
        const int thickness = std::max(config.lineThickness, 1);
        const int lo = -(thickness - 1) / 2;
        const int hi = lo + thickness - 1;
        for (int dy = lo; dy <= hi; ++dy) {
            for (int dx = lo; dx <= hi; ++dx) {
                canvas->DrawSegment(a[0] + dx, a[1] + dy, b[0] + dx, b[1] + dy);
            }
        }
    }

    void drawPolyline(vtkImageCanvasSource2D* canvas,
                      const std::vector<Point2D>& points,
                      int height) const {
        for (size_t i = 1; i < points.size(); ++i) {
            drawThickSegment(canvas, toCanvas(points[i - 1], height),
                             toCanvas(points[i], height));
        }
    }

    // Shaft from tail to tip with a filled triangular head at the tip
    void drawArrow(vtkImageCanvasSource2D* canvas,
                   const Point2D& tail,
                   const Point2D& tip,
                   int height) const {
        const double dx = tip[0] - tail[0];
        const double dy = tip[1] - tail[1];
        const double length = std::sqrt(dx * dx + dy * dy);
        if (length < 1e-9) {
            return;
        }

        const double ux = dx / length;
        const double uy = dy / length;
        const double headLength = std::max(config.arrowSize, 1);
        const double halfWidth = headLength / 2.0;

        const Point2D base{tip[0] - ux * headLength, tip[1] - uy * headLength};
        const Point2D left{base[0] - uy * halfWidth, base[1] + ux * halfWidth};
        const Point2D right{base[0] + uy * halfWidth, base[1] - ux * halfWidth};

        setColor(canvas, config.arrowColor);

        auto t = toCanvas(tail, height);
        auto h = toCanvas(tip, height);
        canvas->DrawSegment(t[0], t[1], h[0], h[1]);

        auto l = toCanvas(left, height);
        auto r = toCanvas(right, height);
        canvas->FillTriangle(h[0], h[1], l[0], l[1], r[0], r[1]);
    }
};

SpatialMapRenderer::SpatialMapRenderer(SpatialMapConfig config, ColorLut lut)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(lut))) {}

SpatialMapRenderer::~SpatialMapRenderer() = default;

SpatialMapRenderer::SpatialMapRenderer(SpatialMapRenderer&&) noexcept = default;
SpatialMapRenderer& SpatialMapRenderer::operator=(SpatialMapRenderer&&) noexcept = default;

const SpatialMapConfig& SpatialMapRenderer::config() const {
    return impl_->config;
}

ArrowDirection SpatialMapRenderer::arrowDirection(double velocity, double arrowCutoff) {
    if (velocity > arrowCutoff) {
        return ArrowDirection::Forward;
    }
    if (velocity < -arrowCutoff) {
        return ArrowDirection::Backward;
    }
    return ArrowDirection::None;
}

ArrowAnchors SpatialMapRenderer::arrowAnchors(size_t sampleCount) {
    if (sampleCount == 0) {
        return {};
    }
    const size_t mid = sampleCount / 2;
    const size_t pre = mid >= kArrowBracket ? mid - kArrowBracket : 0;
    const size_t post = std::min(mid + kArrowBracket, sampleCount - 1);
    return {pre, post};
}

core::RgbColor SpatialMapRenderer::pixelAt(vtkImageData* frame, int x, int y) {
    int dims[3];
    frame->GetDimensions(dims);
    auto* pixel = static_cast<unsigned char*>(
        frame->GetScalarPointer(x, dims[1] - 1 - y, 0));
    return {pixel[0], pixel[1], pixel[2]};
}

// =============================================================================
// Rendering
// =============================================================================

std::expected<vtkSmartPointer<vtkImageData>, FlowError>
SpatialMapRenderer::renderInterval(const FlowMatrix& velocity,
                                   int intervalId,
                                   const SegmentCatalog& segments,
                                   std::array<int, 2> frameSize,
                                   const FlowMatrix* fit) const {
    const auto& cfg = impl_->config;
    const int width = frameSize[0];
    const int height = frameSize[1];

    if (width <= 0 || height <= 0) {
        return std::unexpected(FlowError{
            FlowError::Code::InvalidInput,
            std::format("Invalid frame size {}x{}", width, height)});
    }
    if (velocity.cols() != segments.size()) {
        return std::unexpected(FlowError{
            FlowError::Code::Range,
            std::format("Velocity matrix has {} columns but the catalog has {} segments",
                        velocity.cols(), segments.size())});
    }
    if (intervalId < 1 || static_cast<size_t>(intervalId) > velocity.rows()) {
        return std::unexpected(FlowError{
            FlowError::Code::Range,
            std::format("Interval {} outside matrix with {} rows", intervalId, velocity.rows())});
    }

    std::vector<double> fitRow;
    if (cfg.minFitGoodness) {
        if (!fit) {
            return std::unexpected(FlowError{
                FlowError::Code::Configuration,
                "Minimum fit goodness requires a fit matrix (produced by analyze)"});
        }
        if (fit->rows() != velocity.rows() || fit->cols() != velocity.cols()) {
            return std::unexpected(FlowError{
                FlowError::Code::Range,
                std::format("Fit matrix is {}x{}, velocity matrix is {}x{}",
                            fit->rows(), fit->cols(), velocity.rows(), velocity.cols())});
        }
        auto row = fit->numericRow(intervalId);
        if (!row) {
            return std::unexpected(row.error());
        }
        fitRow = std::move(*row);
    }

    vtkNew<vtkImageCanvasSource2D> canvas;
    canvas->SetScalarTypeToUnsignedChar();
    canvas->SetNumberOfScalarComponents(3);
    canvas->SetExtent(0, width - 1, 0, height - 1, 0, 0);

    Impl::setColor(canvas, cfg.backgroundColor);
    canvas->FillBox(0, width - 1, 0, height - 1);

    int drawn = 0;
    for (const auto& segment : segments.segments()) {
        const auto& cell = velocity.at(intervalId, segment.id);
        if (!cell.isNumeric()) {
            continue;
        }
        if (cfg.minFitGoodness && fitRow[segment.id - 1] < *cfg.minFitGoodness) {
            continue;
        }

        Impl::setColor(canvas, impl_->lut.colorFor(cell.value, cfg.maxPlotSpeed));
        impl_->drawPolyline(canvas, segment.points, height);

        const auto direction = arrowDirection(cell.value, cfg.arrowCutoff);
        const auto anchors = arrowAnchors(segment.points.size());
        if (direction != ArrowDirection::None && anchors.pre != anchors.post) {
            const auto& pre = segment.points[anchors.pre];
            const auto& post = segment.points[anchors.post];
            if (direction == ArrowDirection::Forward) {
                impl_->drawArrow(canvas, pre, post, height);
            } else {
                impl_->drawArrow(canvas, post, pre, height);
            }
        }
        ++drawn;
    }

    canvas->Update();

    auto frame = vtkSmartPointer<vtkImageData>::New();
    frame->DeepCopy(canvas->GetOutput());

    impl_->logger->debug("Interval {}: drew {}/{} segments", intervalId, drawn, segments.size());
    return frame;
}

std::expected<std::vector<vtkSmartPointer<vtkImageData>>, FlowError>
SpatialMapRenderer::renderAll(const FlowMatrix& velocity,
                              const SegmentCatalog& segments,
                              std::array<int, 2> frameSize,
                              const FlowMatrix* fit) const {
    std::vector<vtkSmartPointer<vtkImageData>> frames;
    frames.reserve(velocity.rows());

    for (size_t row = 0; row < velocity.rows(); ++row) {
        auto frame = renderInterval(velocity, static_cast<int>(row) + 1,
                                    segments, frameSize, fit);
        if (!frame) {
            return std::unexpected(frame.error());
        }
        frames.push_back(std::move(*frame));
    }

    impl_->logger->info("Rendered {} spatial map frames ({}x{} px)",
                        frames.size(), frameSize[0], frameSize[1]);
    return frames;
}

std::expected<void, FlowError>
SpatialMapRenderer::writeMultiFrameTiff(const std::vector<vtkSmartPointer<vtkImageData>>& frames,
                                        const std::filesystem::path& path) {
    if (frames.empty()) {
        return std::unexpected(FlowError{
            FlowError::Code::InvalidInput, "No frames to write"});
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(FlowError{
                FlowError::Code::FileAccess,
                std::format("Cannot create directory {}: {}",
                            path.parent_path().string(), ec.message())});
        }
    }

    auto backup = core::backupExisting(path);
    if (!backup) {
        return std::unexpected(FlowError{FlowError::Code::FileAccess, backup.error()});
    }

    vtkNew<vtkImageAppend> append;
    append->SetAppendAxis(2);
    for (const auto& frame : frames) {
        append->AddInputData(frame);
    }

    vtkNew<vtkTIFFWriter> writer;
    writer->SetInputConnection(append->GetOutputPort());
    writer->SetFileDimensionality(3);
    writer->SetFileName(path.string().c_str());
    writer->Write();

    if (writer->GetErrorCode() != 0) {
        return std::unexpected(FlowError{
            FlowError::Code::FileAccess,
            std::format("Failed to write spatial map {} (VTK error {})",
                        path.string(), writer->GetErrorCode())});
    }
    return {};
}

}  // namespace flow_mapper::services
