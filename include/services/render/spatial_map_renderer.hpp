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
 * @file spatial_map_renderer.hpp
 * @brief Colour/arrow coded flow map drawn over vessel geometry
 * @details Produces one RGB frame per interval at video frame size. Each
 *          segment with a numeric velocity is drawn as its full polyline in
 *          the LUT colour of its speed; segments faster than the arrow
 *          cutoff additionally get an arrow at their midpoint pointing in
 *          the flow direction. Segments are drawn in catalog order, so later
 *          segments overpaint earlier ones where they cross.
 *
 * Frames are returned as vtkImageData with extent
 * [0, width-1] x [0, height-1] x [0, 0]. Image row 0 is the bottom row in
 * VTK convention; video row y is stored at VTK row (height - 1 - y) so
 * that written files keep the video orientation.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <array>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include <vtkImageData.h>
#include <vtkSmartPointer.h>

#include "core/parameter_table.hpp"
#include "services/flow/flow_matrix.hpp"
#include "services/flow/flow_types.hpp"
#include "services/render/color_lut.hpp"

namespace flow_mapper::services {

class SegmentCatalog;

/**
 * @brief Rendering parameters
 */
struct SpatialMapConfig {
    double maxPlotSpeed = 1000.0;                     ///< um/s mapped to LUT entry 255
    int lineThickness = 3;                            ///< px
    int arrowSize = 6;                                ///< Arrow head length in px
    double arrowCutoff = 0.0;                         ///< um/s; |v| at or below draws no arrow
    core::RgbColor backgroundColor{0, 0, 0};
    core::RgbColor arrowColor{255, 255, 255};
    std::optional<double> minFitGoodness;             ///< Hide cells whose fit is lower
};

enum class ArrowDirection {
    None,
    Forward,    ///< Towards increasing sample index
    Backward
};

/**
 * @brief Polyline sample indices bracketing the arrow
 */
struct ArrowAnchors {
    size_t pre = 0;
    size_t post = 0;
};

class SpatialMapRenderer {
public:
    /// Samples on either side of the midpoint used as arrow anchors
    static constexpr size_t kArrowBracket = 8;

    SpatialMapRenderer(SpatialMapConfig config, ColorLut lut);
    ~SpatialMapRenderer();

    SpatialMapRenderer(const SpatialMapRenderer&) = delete;
    SpatialMapRenderer& operator=(const SpatialMapRenderer&) = delete;
    SpatialMapRenderer(SpatialMapRenderer&&) noexcept;
    SpatialMapRenderer& operator=(SpatialMapRenderer&&) noexcept;

    [[nodiscard]] const SpatialMapConfig& config() const;

    /**
     * @brief Render the frame of one interval
     *
     * @param velocity Velocity matrix (um/s)
     * @param intervalId 1-based row of the matrix
     * @param segments Catalog the matrix columns refer to
     * @param frameSize Width and height of the output frame
     * @param fit Optional fit matrix; required when minFitGoodness is set
     * @return RGB frame; Range error on dimension mismatch, DataIntegrity
     *         when the fit gate meets a sentinel
     */
    [[nodiscard]] std::expected<vtkSmartPointer<vtkImageData>, FlowError>
    renderInterval(const FlowMatrix& velocity,
                   int intervalId,
                   const SegmentCatalog& segments,
                   std::array<int, 2> frameSize,
                   const FlowMatrix* fit = nullptr) const;

    /**
     * @brief Render one frame per matrix row
     */
    [[nodiscard]] std::expected<std::vector<vtkSmartPointer<vtkImageData>>, FlowError>
    renderAll(const FlowMatrix& velocity,
              const SegmentCatalog& segments,
              std::array<int, 2> frameSize,
              const FlowMatrix* fit = nullptr) const;

    /**
     * @brief Write frames as one multi-page 8-bit RGB TIFF
     *
     * An existing file is kept under a .bak suffix.
     */
    [[nodiscard]] static std::expected<void, FlowError>
    writeMultiFrameTiff(const std::vector<vtkSmartPointer<vtkImageData>>& frames,
                        const std::filesystem::path& path);

    [[nodiscard]] static ArrowDirection arrowDirection(double velocity, double arrowCutoff);

    /**
     * @brief Anchors at n / 2 -/+ kArrowBracket, clamped to [0, n - 1]
     */
    [[nodiscard]] static ArrowAnchors arrowAnchors(size_t sampleCount);

    /**
     * @brief Pixel of a rendered frame in video coordinates (y down)
     */
    [[nodiscard]] static core::RgbColor pixelAt(vtkImageData* frame, int x, int y);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace flow_mapper::services
