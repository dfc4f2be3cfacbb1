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

// Ecosystem logger headers must precede Qt to avoid emit() macro conflict
#include <kcenon/common/interfaces/global_logger_registry.h>

#include "core/app_log_level.hpp"
#include "core/logging.hpp"
#include "core/parameter_table.hpp"
#include "services/flow/run_configuration.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QStringList>

#include <format>
#include <optional>
#include <string>

namespace {

using flow_mapper::core::ParameterKind;
using flow_mapper::core::ParameterTable;
using flow_mapper::services::FlowError;

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;

void applyLogLevel(flow_mapper::AppLogLevel appLevel) {
    flow_mapper::logging::LoggerFactory::setGlobalLevel(
        flow_mapper::logging::fromAppLogLevel(appLevel));

    auto& registry = kcenon::common::interfaces::GlobalLoggerRegistry::instance();
    auto logger = registry.get_default_logger();
    if (logger) {
        logger->set_level(flow_mapper::to_ecosystem_level(appLevel));
    }
}

int fail(const std::shared_ptr<spdlog::logger>& logger, const FlowError& error) {
    logger->error("{}", error.toString());
    return kExitFailure;
}

}  // anonymous namespace

/**
 * @brief Command line entry point
 *
 * flow_mapper <analyze|render|run> --config FILE [--log-level L] [--threads N]
 *             [--fit-matrix FILE --min-fit G] [--log-file]
 */
int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("flow_mapper");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("kcenon");
    app.setOrganizationDomain("github.com/kcenon");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Measure blood flow speed in traced vessel segments and render a spatial flow map");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "analyze, render or run");

    QCommandLineOption configOption({"c", "config"},
        "Parameter file (key,value,description per line).", "file");
    QCommandLineOption logLevelOption("log-level",
        "Exception, Error, Information or Debug.", "level", "Information");
    QCommandLineOption threadsOption({"j", "threads"},
        "Segments analysed concurrently (overrides the parameter file).", "count");
    QCommandLineOption fitMatrixOption("fit-matrix",
        "Fit goodness matrix used with --min-fit (default: outputDirectory/fit.csv).", "file");
    QCommandLineOption minFitOption("min-fit",
        "Hide segments whose fit goodness is below this value.", "value");
    QCommandLineOption logFileOption("log-file",
        "Also write rotating log files under outputDirectory/logs.");
    parser.addOptions({configOption, logLevelOption, threadsOption, fitMatrixOption,
                       minFitOption, logFileOption});

    parser.process(app);

    auto logger = flow_mapper::logging::LoggerFactory::create("flow_mapper");
    auto failWith = [&logger](const std::string& message) {
        logger->error("{}", message);
        return kExitFailure;
    };

    auto appLevel = flow_mapper::parse_app_log_level(parser.value(logLevelOption).toStdString());
    if (!appLevel) {
        return failWith(std::format("Unknown log level '{}'",
                                        parser.value(logLevelOption).toStdString()));
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        failWith("Expected exactly one command: analyze, render or run");
        parser.showHelp(kExitFailure);
    }
    const std::string command = positional.first().toStdString();
    if (command != "analyze" && command != "render" && command != "run") {
        return failWith(std::format("Unknown command '{}'", command));
    }

    if (!parser.isSet(configOption)) {
        return failWith("--config is required");
    }

    auto table = ParameterTable::load(parser.value(configOption).toStdString());
    if (!table) {
        return failWith(flow_mapper::services::toFlowError(table.error()).toString());
    }

    flow_mapper::logging::LogConfig logConfig;
    logConfig.level = flow_mapper::logging::fromAppLogLevel(*appLevel);
    if (parser.isSet(logFileOption)) {
        auto outputDirectory = table->path(ParameterKind::OutputDirectory);
        if (!outputDirectory) {
            return failWith(
                flow_mapper::services::toFlowError(outputDirectory.error()).toString());
        }
        logConfig.runLogDirectory = *outputDirectory / "logs";
    }
    flow_mapper::logging::LoggerFactory::configure(logConfig);
    applyLogLevel(*appLevel);
    logger->debug("Command '{}', log level {}", command, flow_mapper::app_log_level_name(*appLevel));

    if (parser.isSet(threadsOption)) {
        auto overridden = table->set(ParameterKind::Threads,
                                     parser.value(threadsOption).toStdString());
        if (!overridden) {
            return fail(logger, flow_mapper::services::toFlowError(overridden.error()));
        }
    }

    flow_mapper::services::RenderOptions renderOptions;
    if (parser.isSet(minFitOption)) {
        bool ok = false;
        double minFit = parser.value(minFitOption).toDouble(&ok);
        if (!ok || minFit < 0.0) {
            logger->error("--min-fit expects a non-negative number");
            return kExitFailure;
        }
        renderOptions.minFitGoodness = minFit;
    }
    if (parser.isSet(fitMatrixOption)) {
        renderOptions.fitMatrixPath = parser.value(fitMatrixOption).toStdString();
    }

    int lastPercent = -1;
    auto reportProgress = [&logger, &lastPercent](double progress, const std::string& status) {
        int percent = static_cast<int>(progress * 100.0);
        if (percent / 10 != lastPercent / 10) {
            logger->info("{:3d}% {}", percent, status);
        }
        lastPercent = percent;
    };

    if (command == "analyze") {
        if (parser.isSet(fitMatrixOption) || parser.isSet(minFitOption)) {
            logger->warn("--fit-matrix and --min-fit only apply to render and run");
        }
        auto analyzed = flow_mapper::services::runAnalysis(*table, reportProgress);
        if (!analyzed) {
            return fail(logger, analyzed.error());
        }
    } else {
        auto rendered = command == "run"
            ? flow_mapper::services::runAnalysisAndRendering(*table, renderOptions, reportProgress)
            : flow_mapper::services::runRendering(*table, renderOptions);
        if (!rendered) {
            return fail(logger, rendered.error());
        }
        logger->info("Spatial map: {}", rendered->string());
    }

    flow_mapper::logging::LoggerFactory::shutdown();
    return kExitSuccess;
}
