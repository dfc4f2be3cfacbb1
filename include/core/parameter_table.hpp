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
 * @file parameter_table.hpp
 * @brief Typed run configuration loaded from a key/value/description file
 * @details Every parameter the pipeline understands is an enumerated
 *          ParameterKind with a fixed type, validator and the upstream step
 *          that is expected to supply it. Values are parsed and validated
 *          once at load time; a value that is left empty is only reported
 *          when a stage asks for it.
 *
 * File format, one parameter per line:
 * @code
 * // comment lines start with two or more slashes
 * pixelSize,0.5,Pixel size in micrometres
 * frameRate,30,Acquisition rate in frames per second
 * minSegmentLength,,left empty: fails when the velocity stage needs it
 * @endcode
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace flow_mapper::core {

/**
 * @brief Every parameter understood by the pipeline
 */
enum class ParameterKind {
    VideoPath,
    SegmentsPath,
    IntervalsPath,
    OutputDirectory,
    PixelSize,
    FrameRate,
    MinSegmentLength,
    MaxMeasuredSpeed,
    FlickerCorrection,
    MaxPlotSpeed,
    LineThickness,
    ArrowSize,
    ArrowCutoff,
    BackgroundColor,
    ArrowColor,
    LutName,
    Threads,
    SaveKymographs
};

/**
 * @brief Storage type of a parameter
 */
enum class ParameterType {
    ExistingPath,   ///< Path that must exist when it is used
    OutputPath,     ///< Path that is created on demand
    PositiveReal,
    NonNegativeReal,
    PositiveInteger,
    Boolean,
    Color,
    Text
};

/**
 * @brief 8-bit RGB colour
 */
struct RgbColor {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const RgbColor&) const = default;
};

/**
 * @brief Static description of one parameter
 */
struct ParameterSpec {
    ParameterKind kind;
    const char* key;
    ParameterType type;
    const char* suppliedBy;     ///< Upstream step named in error messages
    const char* defaultValue;   ///< Empty string: no default, required on use
    const char* description;
};

/**
 * @brief Error information for configuration handling
 */
struct ConfigError {
    enum class Code {
        Success,
        FileNotFound,
        FileAccessDenied,
        InvalidValue,
        MissingValue,
        PathNotFound
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::FileNotFound: return "Configuration file not found: " + message;
            case Code::FileAccessDenied: return "Configuration file access denied: " + message;
            case Code::InvalidValue: return "Invalid parameter value: " + message;
            case Code::MissingValue: return "Missing parameter: " + message;
            case Code::PathNotFound: return "Referenced path not found: " + message;
        }
        return "Unknown error";
    }
};

/**
 * @brief Immutable-after-load table of typed parameters
 *
 * Stages never hold a reference to the table; they build their own
 * configuration value from it once per run.
 */
class ParameterTable {
public:
    using Value = std::variant<std::monostate, double, int, bool, RgbColor,
                               std::string, std::filesystem::path>;

    ParameterTable();

    /**
     * @brief Load and validate a configuration file
     * @return Table on success; InvalidValue names the key and line number
     */
    [[nodiscard]] static std::expected<ParameterTable, ConfigError>
    load(const std::filesystem::path& path);

    /**
     * @brief Parse configuration text
     * @param content File content
     * @param sourceName Name used in error messages
     */
    [[nodiscard]] static std::expected<ParameterTable, ConfigError>
    parse(std::string_view content, const std::string& sourceName = "<memory>");

    /**
     * @brief Write the table in the load format, preserving any previous file
     */
    [[nodiscard]] std::expected<void, ConfigError>
    save(const std::filesystem::path& path) const;

    /**
     * @brief Replace one value (command-line overrides, tests)
     *
     * An empty raw value clears the parameter back to its default.
     */
    [[nodiscard]] std::expected<void, ConfigError>
    set(ParameterKind kind, const std::string& rawValue);

    [[nodiscard]] bool isSet(ParameterKind kind) const;
    [[nodiscard]] std::string rawValue(ParameterKind kind) const;

    // --- Typed access; MissingValue when empty without default ---

    [[nodiscard]] std::expected<double, ConfigError> real(ParameterKind kind) const;
    [[nodiscard]] std::expected<int, ConfigError> integer(ParameterKind kind) const;
    [[nodiscard]] std::expected<bool, ConfigError> boolean(ParameterKind kind) const;
    [[nodiscard]] std::expected<RgbColor, ConfigError> color(ParameterKind kind) const;
    [[nodiscard]] std::expected<std::string, ConfigError> text(ParameterKind kind) const;

    /**
     * @brief Path access; ExistingPath parameters are checked on disk here
     */
    [[nodiscard]] std::expected<std::filesystem::path, ConfigError>
    path(ParameterKind kind) const;

    // --- Schema ---

    [[nodiscard]] static const std::vector<ParameterSpec>& schema();
    [[nodiscard]] static const ParameterSpec& spec(ParameterKind kind);
    [[nodiscard]] static std::optional<ParameterKind> kindFromKey(std::string_view key);

    /**
     * @brief Parse a colour name (`black`, `white`, `red`, ...) or `#RRGGBB`
     */
    [[nodiscard]] static std::optional<RgbColor> parseColor(std::string_view text);

private:
    struct Entry {
        std::string raw;
        Value value;
    };

    [[nodiscard]] static std::expected<Value, ConfigError>
    convert(const ParameterSpec& spec, const std::string& raw);

    [[nodiscard]] std::expected<const Value*, ConfigError>
    resolved(ParameterKind kind) const;

    std::map<ParameterKind, Entry> entries_;
};

}  // namespace flow_mapper::core
