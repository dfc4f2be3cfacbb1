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

#include "core/logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace flow_mapper::logging {

LogConfig LoggerFactory::config_ = {};
std::vector<spdlog::sink_ptr> LoggerFactory::sinks_ = {};

namespace {

spdlog::level::level_enum toSpdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}

}  // anonymous namespace

LogLevel fromAppLogLevel(AppLogLevel level) {
    switch (level) {
        case AppLogLevel::Exception:   return LogLevel::Critical;
        case AppLogLevel::Error:       return LogLevel::Error;
        case AppLogLevel::Information: return LogLevel::Info;
        case AppLogLevel::Debug:       return LogLevel::Debug;
    }
    return LogLevel::Info;
}

std::vector<spdlog::sink_ptr> LoggerFactory::buildSinks(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (config.runLogDirectory) {
        std::error_code ec;
        std::filesystem::create_directories(*config.runLogDirectory, ec);
        if (ec) {
            spdlog::warn("Cannot create log directory {}: {}",
                         config.runLogDirectory->string(), ec.message());
        } else {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                (*config.runLogDirectory / kRunLogFile).string(),
                config.maxFileSize,
                config.maxFiles));
        }
    }

    for (auto& sink : sinks) {
        sink->set_level(toSpdlog(config.level));
        sink->set_pattern(config.pattern);
    }
    return sinks;
}

std::shared_ptr<spdlog::logger> LoggerFactory::create(const std::string& name) {
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    if (sinks_.empty()) {
        sinks_ = buildSinks(config_);
    }

    auto logger = std::make_shared<spdlog::logger>(name, sinks_.begin(), sinks_.end());
    logger->set_level(toSpdlog(config_.level));
    spdlog::register_logger(logger);
    return logger;
}

void LoggerFactory::configure(const LogConfig& config) {
    config_ = config;
    sinks_ = buildSinks(config_);

    spdlog::set_level(toSpdlog(config_.level));
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& logger) {
        logger->sinks() = sinks_;
        logger->set_level(toSpdlog(config_.level));
    });
}

void LoggerFactory::setGlobalLevel(LogLevel level) {
    config_.level = level;
    spdlog::set_level(toSpdlog(level));

    for (auto& sink : sinks_) {
        sink->set_level(toSpdlog(level));
    }
    spdlog::apply_all([level](const std::shared_ptr<spdlog::logger>& logger) {
        logger->set_level(toSpdlog(level));
    });
}

LogLevel LoggerFactory::getGlobalLevel() {
    return config_.level;
}

void LoggerFactory::shutdown() {
    spdlog::shutdown();
    sinks_.clear();
}

}  // namespace flow_mapper::logging
