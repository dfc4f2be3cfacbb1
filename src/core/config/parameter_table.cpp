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

#include "core/parameter_table.hpp"
#include "core/artifact_writer.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <fstream>
#include <sstream>

#include <kcenon/common/logging/log_macros.h>

namespace flow_mapper::core {

namespace fs = std::filesystem;

namespace {

const std::vector<ParameterSpec> kSchema = {
    {ParameterKind::VideoPath, "videoPath", ParameterType::ExistingPath,
     "video acquisition", "", "Image stack (x, y, frame) to analyse"},
    {ParameterKind::SegmentsPath, "segmentsPath", ParameterType::ExistingPath,
     "skeleton tracing", "", "Segment polylines (JSON)"},
    {ParameterKind::IntervalsPath, "intervalsPath", ParameterType::ExistingPath,
     "interval selection", "", "Frame intervals, one startFrame,endFrame per line"},
    {ParameterKind::OutputDirectory, "outputDirectory", ParameterType::OutputPath,
     "run setup", "", "Directory receiving matrices and maps"},
    {ParameterKind::PixelSize, "pixelSize", ParameterType::PositiveReal,
     "microscope calibration", "", "Pixel size in micrometres"},
    {ParameterKind::FrameRate, "frameRate", ParameterType::PositiveReal,
     "microscope calibration", "", "Acquisition rate in frames per second"},
    {ParameterKind::MinSegmentLength, "minSegmentLength", ParameterType::NonNegativeReal,
     "velocity policy setup", "", "Shorter segments are reported as short (um)"},
    {ParameterKind::MaxMeasuredSpeed, "maxMeasuredSpeed", ParameterType::PositiveReal,
     "velocity policy setup", "", "Faster results are reported as out (um/s)"},
    {ParameterKind::FlickerCorrection, "flickerCorrection", ParameterType::Boolean,
     "orientation setup", "false", "Remove per-frame brightness before orientation analysis"},
    {ParameterKind::MaxPlotSpeed, "maxPlotSpeed", ParameterType::PositiveReal,
     "spatial map setup", "", "Speed mapped to the top of the colour table (um/s)"},
    {ParameterKind::LineThickness, "lineThickness", ParameterType::PositiveInteger,
     "spatial map setup", "3", "Segment line width in pixels"},
    {ParameterKind::ArrowSize, "arrowSize", ParameterType::PositiveInteger,
     "spatial map setup", "6", "Arrow head length in pixels"},
    {ParameterKind::ArrowCutoff, "arrowCutoff", ParameterType::NonNegativeReal,
     "spatial map setup", "0", "No arrow is drawn at or below this speed (um/s)"},
    {ParameterKind::BackgroundColor, "backgroundColor", ParameterType::Color,
     "spatial map setup", "black", "Map background colour"},
    {ParameterKind::ArrowColor, "arrowColor", ParameterType::Color,
     "spatial map setup", "white", "Direction arrow colour"},
    {ParameterKind::LutName, "lutName", ParameterType::Text,
     "spatial map setup", "Fire", "Colour table: Fire, Grays, Spectrum or Rainbow"},
    {ParameterKind::Threads, "threads", ParameterType::PositiveInteger,
     "run setup", "1", "Segments analysed concurrently per interval"},
    {ParameterKind::SaveKymographs, "saveKymographs", ParameterType::Boolean,
     "run setup", "false", "Write every kymograph as a TIFF image"},
};

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool isCommentLine(std::string_view line) {
    return line.size() >= 2 && line[0] == '/' && line[1] == '/';
}

std::optional<double> parseReal(std::string_view text) {
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<int> parseInteger(std::string_view text) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<bool> parseBoolean(std::string_view text) {
    auto v = lower(text);
    if (v == "true" || v == "yes" || v == "on" || v == "1") return true;
    if (v == "false" || v == "no" || v == "off" || v == "0") return false;
    return std::nullopt;
}

ConfigError invalidValue(const ParameterSpec& spec, const std::string& raw,
                         const char* expected) {
    return ConfigError{
        ConfigError::Code::InvalidValue,
        std::format("'{}' = '{}' is not {}", spec.key, raw, expected)};
}

}  // anonymous namespace

// =============================================================================
// Schema
// =============================================================================

const std::vector<ParameterSpec>& ParameterTable::schema() {
    return kSchema;
}

const ParameterSpec& ParameterTable::spec(ParameterKind kind) {
    auto it = std::find_if(kSchema.begin(), kSchema.end(),
                           [kind](const ParameterSpec& s) { return s.kind == kind; });
    return *it;
}

std::optional<ParameterKind> ParameterTable::kindFromKey(std::string_view key) {
    for (const auto& s : kSchema) {
        if (key == s.key) {
            return s.kind;
        }
    }
    return std::nullopt;
}

std::optional<RgbColor> ParameterTable::parseColor(std::string_view text) {
    auto name = lower(trim(text));
    if (name == "black")   return RgbColor{0, 0, 0};
    if (name == "white")   return RgbColor{255, 255, 255};
    if (name == "red")     return RgbColor{255, 0, 0};
    if (name == "green")   return RgbColor{0, 255, 0};
    if (name == "blue")    return RgbColor{0, 0, 255};
    if (name == "yellow")  return RgbColor{255, 255, 0};
    if (name == "cyan")    return RgbColor{0, 255, 255};
    if (name == "magenta") return RgbColor{255, 0, 255};
    if (name == "gray" || name == "grey") return RgbColor{128, 128, 128};

    if (name.size() == 7 && name[0] == '#') {
        unsigned int rgb = 0;
        auto [ptr, ec] = std::from_chars(name.data() + 1, name.data() + 7, rgb, 16);
        if (ec == std::errc{} && ptr == name.data() + 7) {
            return RgbColor{static_cast<uint8_t>((rgb >> 16) & 0xFF),
                            static_cast<uint8_t>((rgb >> 8) & 0xFF),
                            static_cast<uint8_t>(rgb & 0xFF)};
        }
    }
    return std::nullopt;
}

// =============================================================================
// Construction and loading
// =============================================================================

ParameterTable::ParameterTable() {
    for (const auto& s : kSchema) {
        Entry entry;
        if (*s.defaultValue != '\0') {
            // Defaults are part of the schema and always convert
            entry.value = convert(s, s.defaultValue).value_or(Value{});
        }
        entries_[s.kind] = std::move(entry);
    }
}

std::expected<ParameterTable, ConfigError>
ParameterTable::load(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::unexpected(ConfigError{
            ConfigError::Code::FileNotFound, path.string()});
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(ConfigError{
            ConfigError::Code::FileAccessDenied, path.string()});
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str(), path.filename().string());
}

std::expected<ParameterTable, ConfigError>
ParameterTable::parse(std::string_view content, const std::string& sourceName) {
    ParameterTable table;

    int lineNumber = 0;
    size_t setCount = 0;
    while (!content.empty()) {
        auto newline = content.find('\n');
        auto line = content.substr(0, newline);
        content = (newline == std::string_view::npos)
            ? std::string_view{} : content.substr(newline + 1);
        ++lineNumber;

        line = trim(line);
        if (line.empty() || isCommentLine(line)) {
            continue;
        }

        auto firstComma = line.find(',');
        auto key = trim(line.substr(0, firstComma));
        std::string_view value;
        if (firstComma != std::string_view::npos) {
            auto rest = line.substr(firstComma + 1);
            value = trim(rest.substr(0, rest.find(',')));
        }

        auto kind = kindFromKey(key);
        if (!kind) {
            LOG_WARNING(std::format("{}:{}: ignoring unknown parameter '{}'",
                                    sourceName, lineNumber, key));
            continue;
        }

        auto result = table.set(*kind, std::string(value));
        if (!result) {
            auto error = result.error();
            error.message = std::format("{} ({}:{})", error.message, sourceName, lineNumber);
            return std::unexpected(error);
        }
        ++setCount;
    }

    LOG_DEBUG(std::format("Loaded {} parameters from {}", setCount, sourceName));
    return table;
}

std::expected<void, ConfigError>
ParameterTable::save(const fs::path& path) const {
    std::ostringstream out;
    out << "// flow_mapper configuration: key,value,description\n";
    for (const auto& s : kSchema) {
        out << s.key << ',' << rawValue(s.kind) << ',' << s.description << '\n';
    }

    auto written = writeTextArtifact(path, out.str());
    if (!written) {
        return std::unexpected(ConfigError{
            ConfigError::Code::FileAccessDenied, written.error()});
    }
    return {};
}

std::expected<void, ConfigError>
ParameterTable::set(ParameterKind kind, const std::string& rawValue) {
    const auto& s = spec(kind);
    Entry entry;
    entry.raw = std::string(trim(rawValue));

    const std::string& effective =
        entry.raw.empty() ? std::string(s.defaultValue) : entry.raw;
    if (!effective.empty()) {
        auto converted = convert(s, effective);
        if (!converted) {
            return std::unexpected(converted.error());
        }
        entry.value = std::move(*converted);
    }

    entries_[kind] = std::move(entry);
    return {};
}

bool ParameterTable::isSet(ParameterKind kind) const {
    auto it = entries_.find(kind);
    return it != entries_.end() && !std::holds_alternative<std::monostate>(it->second.value);
}

std::string ParameterTable::rawValue(ParameterKind kind) const {
    auto it = entries_.find(kind);
    if (it == entries_.end() || it->second.raw.empty()) {
        return spec(kind).defaultValue;
    }
    return it->second.raw;
}

// =============================================================================
// Conversion
// =============================================================================

std::expected<ParameterTable::Value, ConfigError>
ParameterTable::convert(const ParameterSpec& s, const std::string& raw) {
    switch (s.type) {
        case ParameterType::ExistingPath:
        case ParameterType::OutputPath:
            return Value{fs::path(raw)};

        case ParameterType::PositiveReal: {
            auto v = parseReal(raw);
            if (!v || *v <= 0.0) {
                return std::unexpected(invalidValue(s, raw, "a positive number"));
            }
            return Value{*v};
        }

        case ParameterType::NonNegativeReal: {
            auto v = parseReal(raw);
            if (!v || *v < 0.0) {
                return std::unexpected(invalidValue(s, raw, "a non-negative number"));
            }
            return Value{*v};
        }

        case ParameterType::PositiveInteger: {
            auto v = parseInteger(raw);
            if (!v || *v < 1) {
                return std::unexpected(invalidValue(s, raw, "a positive integer"));
            }
            return Value{*v};
        }

        case ParameterType::Boolean: {
            auto v = parseBoolean(raw);
            if (!v) {
                return std::unexpected(invalidValue(s, raw, "true or false"));
            }
            return Value{*v};
        }

        case ParameterType::Color: {
            auto v = parseColor(raw);
            if (!v) {
                return std::unexpected(invalidValue(s, raw, "a colour name or #RRGGBB"));
            }
            return Value{*v};
        }

        case ParameterType::Text:
            return Value{raw};
    }

    return std::unexpected(invalidValue(s, raw, "a supported value"));
}

std::expected<const ParameterTable::Value*, ConfigError>
ParameterTable::resolved(ParameterKind kind) const {
    auto it = entries_.find(kind);
    if (it == entries_.end() || std::holds_alternative<std::monostate>(it->second.value)) {
        const auto& s = spec(kind);
        return std::unexpected(ConfigError{
            ConfigError::Code::MissingValue,
            std::format("'{}' is empty; it must be supplied by {}", s.key, s.suppliedBy)});
    }
    return &it->second.value;
}

// =============================================================================
// Typed access
// =============================================================================

std::expected<double, ConfigError> ParameterTable::real(ParameterKind kind) const {
    auto v = resolved(kind);
    if (!v) return std::unexpected(v.error());
    if (const auto* d = std::get_if<double>(*v)) {
        return *d;
    }
    if (const auto* i = std::get_if<int>(*v)) {
        return static_cast<double>(*i);
    }
    return std::unexpected(ConfigError{
        ConfigError::Code::InvalidValue,
        std::format("'{}' is not a numeric parameter", spec(kind).key)});
}

std::expected<int, ConfigError> ParameterTable::integer(ParameterKind kind) const {
    auto v = resolved(kind);
    if (!v) return std::unexpected(v.error());
    if (const auto* i = std::get_if<int>(*v)) {
        return *i;
    }
    return std::unexpected(ConfigError{
        ConfigError::Code::InvalidValue,
        std::format("'{}' is not an integer parameter", spec(kind).key)});
}

std::expected<bool, ConfigError> ParameterTable::boolean(ParameterKind kind) const {
    auto v = resolved(kind);
    if (!v) return std::unexpected(v.error());
    if (const auto* b = std::get_if<bool>(*v)) {
        return *b;
    }
    return std::unexpected(ConfigError{
        ConfigError::Code::InvalidValue,
        std::format("'{}' is not a boolean parameter", spec(kind).key)});
}

std::expected<RgbColor, ConfigError> ParameterTable::color(ParameterKind kind) const {
    auto v = resolved(kind);
    if (!v) return std::unexpected(v.error());
    if (const auto* c = std::get_if<RgbColor>(*v)) {
        return *c;
    }
    return std::unexpected(ConfigError{
        ConfigError::Code::InvalidValue,
        std::format("'{}' is not a colour parameter", spec(kind).key)});
}

std::expected<std::string, ConfigError> ParameterTable::text(ParameterKind kind) const {
    auto v = resolved(kind);
    if (!v) return std::unexpected(v.error());
    if (const auto* s = std::get_if<std::string>(*v)) {
        return *s;
    }
    return rawValue(kind);
}

std::expected<fs::path, ConfigError> ParameterTable::path(ParameterKind kind) const {
    auto v = resolved(kind);
    if (!v) return std::unexpected(v.error());

    const auto* p = std::get_if<fs::path>(*v);
    if (!p) {
        return std::unexpected(ConfigError{
            ConfigError::Code::InvalidValue,
            std::format("'{}' is not a path parameter", spec(kind).key)});
    }

    const auto& s = spec(kind);
    std::error_code ec;
    if (s.type == ParameterType::ExistingPath && !fs::exists(*p, ec)) {
        return std::unexpected(ConfigError{
            ConfigError::Code::PathNotFound,
            std::format("'{}' = {} does not exist; it must be produced by {}",
                        s.key, p->string(), s.suppliedBy)});
    }
    return *p;
}

}  // namespace flow_mapper::core
