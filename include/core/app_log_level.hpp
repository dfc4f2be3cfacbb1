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
 * @file app_log_level.hpp
 * @brief User-facing log verbosity of the command line tool
 * @details `--log-level` accepts one of four tiers. The tier is applied to
 *          both logging stacks: the kcenon ecosystem logger behind the
 *          LOG_* macros and the spdlog loggers created by LoggerFactory.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <kcenon/common/interfaces/logger_interface.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>

namespace flow_mapper {

/**
 * @brief Hierarchical verbosity; each tier includes the ones above it
 */
enum class AppLogLevel {
    Exception = 0,    ///< ITK/VTK exceptions and I/O failures
    Error = 1,        ///< Configuration, range and integrity errors
    Information = 2,  ///< Run summary, per-segment means, written files
    Debug = 3         ///< One line per (interval, segment) unit
};

/// Spellings accepted by `--log-level`, indexed by AppLogLevel
inline constexpr std::array<std::string_view, 4> kAppLogLevelNames = {
    "Exception", "Error", "Information", "Debug"};

inline std::string_view app_log_level_name(AppLogLevel level) {
    return kAppLogLevelNames[static_cast<size_t>(level)];
}

inline kcenon::common::interfaces::log_level to_ecosystem_level(AppLogLevel level) {
    using kcenon::common::interfaces::log_level;
    switch (level) {
        case AppLogLevel::Exception:   return log_level::critical;
        case AppLogLevel::Error:       return log_level::error;
        case AppLogLevel::Information: return log_level::info;
        case AppLogLevel::Debug:       return log_level::debug;
    }
    return log_level::info;
}

/**
 * @brief Parse a `--log-level` argument (case-insensitive)
 *
 * `info` is accepted as a short form of Information.
 */
inline std::optional<AppLogLevel> parse_app_log_level(std::string_view text) {
    std::string key(text);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (key == "info") {
        return AppLogLevel::Information;
    }
    for (size_t i = 0; i < kAppLogLevelNames.size(); ++i) {
        std::string name(kAppLogLevelNames[i]);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (key == name) {
            return static_cast<AppLogLevel>(i);
        }
    }
    return std::nullopt;
}

}  // namespace flow_mapper
