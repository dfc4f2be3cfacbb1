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
 * @file color_lut.hpp
 * @brief 256-entry speed colour table
 * @details Palettes are built with vtkLookupTable so their hue ramps match
 *          the flow visualizer colour modes. Speeds map to entries by
 *          floor(min(|v|, maxPlotSpeed) * 255 / maxPlotSpeed).
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <array>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include <vtkLookupTable.h>
#include <vtkSmartPointer.h>

#include "core/parameter_table.hpp"
#include "services/flow/flow_types.hpp"

namespace flow_mapper::services {

/**
 * @brief Named palettes
 */
enum class LutPalette {
    Fire,       ///< Black, blue, red, yellow, white
    Grays,
    Spectrum,   ///< Full hue circle starting at red
    Rainbow     ///< Blue (slow) to red (fast)
};

class ColorLut {
public:
    static constexpr int kSize = 256;

    /// Grays
    ColorLut();

    [[nodiscard]] static ColorLut create(LutPalette palette);

    /**
     * @brief Palette by case-insensitive name
     * @return Configuration error listing the known names
     */
    [[nodiscard]] static std::expected<ColorLut, FlowError> fromName(std::string_view name);

    [[nodiscard]] static std::vector<std::string> paletteNames();

    [[nodiscard]] const core::RgbColor& operator[](int index) const {
        return entries_[index];
    }

    [[nodiscard]] LutPalette palette() const noexcept { return palette_; }

    /**
     * @brief Table index for a signed velocity
     *
     * Returns 0 when maxPlotSpeed is not positive.
     */
    [[nodiscard]] static int colorIndex(double velocity, double maxPlotSpeed);

    [[nodiscard]] const core::RgbColor& colorFor(double velocity, double maxPlotSpeed) const {
        return entries_[colorIndex(velocity, maxPlotSpeed)];
    }

    /// Equivalent VTK table over [0, maxPlotSpeed]
    [[nodiscard]] vtkSmartPointer<vtkLookupTable> toVtkLookupTable(double maxPlotSpeed) const;

private:
    LutPalette palette_ = LutPalette::Grays;
    std::array<core::RgbColor, kSize> entries_{};
};

}  // namespace flow_mapper::services
