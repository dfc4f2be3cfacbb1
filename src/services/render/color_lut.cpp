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

#include "services/render/color_lut.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>

namespace flow_mapper::services {

namespace {

// ImageJ "Fire" control points, linearly interpolated to 256 entries
constexpr std::array<int, 32> kFireR = {
    0, 0, 1, 25, 49, 73, 98, 122, 146, 162, 173, 184, 195, 207, 217, 229,
    240, 252, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255};
constexpr std::array<int, 32> kFireG = {
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 14, 35, 57,
    79, 101, 117, 133, 147, 161, 175, 190, 205, 219, 234, 248, 255, 255, 255, 255};
constexpr std::array<int, 32> kFireB = {
    0, 61, 96, 130, 165, 192, 220, 227, 210, 181, 151, 122, 93, 64, 35, 5,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 35, 98, 160, 223, 255};

uint8_t toByte(double unit) {
    return static_cast<uint8_t>(std::clamp(std::lround(unit * 255.0), 0L, 255L));
}

std::string lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

vtkSmartPointer<vtkLookupTable> buildHueRamp(double hueStart, double hueEnd) {
    auto lut = vtkSmartPointer<vtkLookupTable>::New();
    lut->SetNumberOfTableValues(ColorLut::kSize);
    lut->SetRange(0.0, 1.0);
    lut->SetHueRange(hueStart, hueEnd);
    lut->SetSaturationRange(1.0, 1.0);
    lut->SetValueRange(1.0, 1.0);
    lut->Build();
    return lut;
}

}  // anonymous namespace

ColorLut::ColorLut() {
    for (int i = 0; i < kSize; ++i) {
        auto v = static_cast<uint8_t>(i);
        entries_[i] = {v, v, v};
    }
}

ColorLut ColorLut::create(LutPalette palette) {
    ColorLut lut;
    lut.palette_ = palette;

    switch (palette) {
        case LutPalette::Grays:
            break;

        case LutPalette::Fire: {
            constexpr double scale = 32.0 / kSize;
            for (int i = 0; i < kSize; ++i) {
                int i1 = static_cast<int>(i * scale);
                int i2 = std::min(i1 + 1, 31);
                double fraction = i * scale - i1;
                auto mix = [&](const std::array<int, 32>& table) {
                    return static_cast<uint8_t>(
                        (1.0 - fraction) * table[i1] + fraction * table[i2]);
                };
                lut.entries_[i] = {mix(kFireR), mix(kFireG), mix(kFireB)};
            }
            break;
        }

        case LutPalette::Spectrum:
        case LutPalette::Rainbow: {
            auto vtkLut = palette == LutPalette::Spectrum
                ? buildHueRamp(0.0, 1.0)
                : buildHueRamp(0.667, 0.0);
            for (int i = 0; i < kSize; ++i) {
                double rgba[4];
                vtkLut->GetTableValue(i, rgba);
                lut.entries_[i] = {toByte(rgba[0]), toByte(rgba[1]), toByte(rgba[2])};
            }
            break;
        }
    }
    return lut;
}

std::vector<std::string> ColorLut::paletteNames() {
    return {"Fire", "Grays", "Spectrum", "Rainbow"};
}

std::expected<ColorLut, FlowError> ColorLut::fromName(std::string_view name) {
    const auto key = lower(name);
    if (key == "fire") return create(LutPalette::Fire);
    if (key == "grays" || key == "greys") return create(LutPalette::Grays);
    if (key == "spectrum") return create(LutPalette::Spectrum);
    if (key == "rainbow") return create(LutPalette::Rainbow);

    return std::unexpected(FlowError{
        FlowError::Code::Configuration,
        std::format("Unknown lookup table '{}' (lutName; expected Fire, Grays, Spectrum or Rainbow)",
                    name)});
}

int ColorLut::colorIndex(double velocity, double maxPlotSpeed) {
    if (!(maxPlotSpeed > 0.0) || !std::isfinite(velocity)) {
        return 0;
    }
    const double speed = std::min(std::abs(velocity), maxPlotSpeed);
    const auto index = static_cast<int>(std::floor(speed * 255.0 / maxPlotSpeed));
    return std::clamp(index, 0, kSize - 1);
}

vtkSmartPointer<vtkLookupTable> ColorLut::toVtkLookupTable(double maxPlotSpeed) const {
    auto lut = vtkSmartPointer<vtkLookupTable>::New();
    lut->SetNumberOfTableValues(kSize);
    lut->SetRange(0.0, maxPlotSpeed > 0.0 ? maxPlotSpeed : 1.0);
    for (int i = 0; i < kSize; ++i) {
        lut->SetTableValue(i,
                           entries_[i].r / 255.0,
                           entries_[i].g / 255.0,
                           entries_[i].b / 255.0,
                           1.0);
    }
    return lut;
}

}  // namespace flow_mapper::services
