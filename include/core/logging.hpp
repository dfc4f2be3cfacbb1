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

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/app_log_level.hpp"

namespace flow_mapper::logging {

enum class LogLevel {
    Trace = spdlog::level::trace,
    Debug = spdlog::level::debug,
    Info = spdlog::level::info,
    Warning = spdlog::level::warn,
    Error = spdlog::level::err,
    Critical = spdlog::level::critical,
    Off = spdlog::level::off
};

/// File name of the run log inside LogConfig::runLogDirectory
inline constexpr const char* kRunLogFile = "flow_mapper.log";

struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::optional<std::filesystem::path> runLogDirectory;  ///< Adds a rotating file sink
    std::string pattern = "[%H:%M:%S.%e] [%n] [%^%l%$] %v";
    size_t maxFileSize = 2 * 1024 * 1024;  // 2 MB
    size_t maxFiles = 5;
};

/**
 * @brief Map the user-facing four-tier level onto spdlog levels
 */
[[nodiscard]] LogLevel fromAppLogLevel(AppLogLevel level);

/**
 * @brief Named spdlog loggers sharing one set of sinks
 *
 * Every logger writes to stderr. With a run log directory all loggers also
 * append to the same rotating kRunLogFile, so one run leaves one log next
 * to its matrices.
 */
class LoggerFactory {
public:
    static std::shared_ptr<spdlog::logger> create(const std::string& name);

    /**
     * @brief Rebuild the shared sinks
     *
     * Loggers created before this call are moved onto the new sinks.
     */
    static void configure(const LogConfig& config);

    static void setGlobalLevel(LogLevel level);

    static LogLevel getGlobalLevel();

    static void shutdown();

private:
    static std::vector<spdlog::sink_ptr> buildSinks(const LogConfig& config);

    static LogConfig config_;
    static std::vector<spdlog::sink_ptr> sinks_;
};

}  // namespace flow_mapper::logging
