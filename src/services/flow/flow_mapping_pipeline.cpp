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

#include "services/flow/flow_mapping_pipeline.hpp"
#include "services/flow/flow_matrix_io.hpp"
#include "services/flow/interval_catalog.hpp"
#include "services/flow/orientation_estimator.hpp"
#include "services/flow/segment_catalog.hpp"
#include "services/flow/velocity_calculator.hpp"
#include "services/flow/video_source.hpp"
#include "core/artifact_writer.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <format>
#include <future>
#include <limits>
#include <numbers>

#include <itkImageFileWriter.h>

namespace flow_mapper::services {

namespace {

// Result of one (interval, segment) unit
struct UnitResult {
    int segmentId = 0;
    OrientationResult orientation;
    VelocityEvaluation evaluation;
    FloatImage2D::Pointer raster;
};

VelocityCell angleCell(double radians) {
    if (!std::isfinite(radians)) {
        return VelocityCell::outOfRange();
    }
    return VelocityCell::numeric(
        VelocityCalculator::roundToHundredths(radians * 180.0 / std::numbers::pi));
}

VelocityCell fitCell(double fit) {
    if (!std::isfinite(fit)) {
        return VelocityCell::outOfRange();
    }
    return VelocityCell::numeric(VelocityCalculator::roundToHundredths(fit));
}

std::expected<void, FlowError> requirePositive(double value, const char* key) {
    if (!(value > 0.0)) {
        return std::unexpected(FlowError{
            FlowError::Code::Configuration,
            std::format("{} must be positive, got {}", key, value)});
    }
    return {};
}

}  // anonymous namespace

class FlowMappingPipeline::Impl {
public:
    AnalysisConfig config;
    ProgressCallback progressCallback;
    std::atomic<bool> cancelled{false};
    KymographBuilder builder;
    std::unique_ptr<IOrientationEstimator> estimator;
    std::shared_ptr<spdlog::logger> logger;

    explicit Impl(AnalysisConfig cfg)
        : config(std::move(cfg))
        , estimator(createOrientationEstimator(config.flickerCorrection))
        , logger(logging::LoggerFactory::create("FlowMappingPipeline")) {}

    void reportProgress(double progress, const std::string& status) const {
        if (progressCallback) {
            progressCallback(progress, status);
        }
    }

    std::expected<void, FlowError> validateConfig() const {
        if (auto r = requirePositive(config.pixelSize, "pixelSize"); !r) return r;
        if (auto r = requirePositive(config.frameRate, "frameRate"); !r) return r;
        if (auto r = requirePositive(config.maxMeasuredSpeed, "maxMeasuredSpeed"); !r) return r;
        if (config.minSegmentLength < 0.0) {
            return std::unexpected(FlowError{
                FlowError::Code::Configuration,
                std::format("minSegmentLength must not be negative, got {}",
                            config.minSegmentLength)});
        }
        if (config.threads < 1) {
            return std::unexpected(FlowError{
                FlowError::Code::Configuration,
                std::format("threads must be at least 1, got {}", config.threads)});
        }
        return {};
    }

    std::expected<UnitResult, FlowError> processUnit(const IntervalFrames& frames,
                                                     const Segment& segment,
                                                     const Interval& interval,
                                                     const VelocityCalculator& calculator) const {
        // A single traced pixel has no direction; its zero length decides the cell
        if (segment.points.size() < 2) {
            UnitResult result;
            result.segmentId = segment.id;
            result.orientation = OrientationResult{
                std::numeric_limits<double>::quiet_NaN(),
                std::numeric_limits<double>::quiet_NaN()};
            result.evaluation = calculator.evaluate(segment, interval.id, result.orientation.angle);
            return result;
        }

        auto kymograph = builder.build(frames, segment, interval);
        if (!kymograph) {
            return std::unexpected(kymograph.error());
        }

        auto orientation = estimator->estimate(*kymograph);
        if (!orientation) {
            return std::unexpected(FlowError{
                orientation.error().code,
                std::format("Segment {} interval {}: {}", segment.id, interval.id,
                            orientation.error().message)});
        }

        UnitResult result;
        result.segmentId = segment.id;
        result.orientation = *orientation;
        result.evaluation = calculator.evaluate(segment, interval.id, orientation->angle);
        if (config.saveKymographs) {
            result.raster = kymograph->raster;
        }
        return result;
    }
};

FlowMappingPipeline::FlowMappingPipeline(AnalysisConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

FlowMappingPipeline::~FlowMappingPipeline() = default;

FlowMappingPipeline::FlowMappingPipeline(FlowMappingPipeline&&) noexcept = default;
FlowMappingPipeline& FlowMappingPipeline::operator=(FlowMappingPipeline&&) noexcept = default;

const AnalysisConfig& FlowMappingPipeline::config() const {
    return impl_->config;
}

void FlowMappingPipeline::setProgressCallback(ProgressCallback callback) {
    impl_->progressCallback = std::move(callback);
}

void FlowMappingPipeline::cancel() {
    impl_->cancelled.store(true);
}

bool FlowMappingPipeline::isCancelled() const {
    return impl_->cancelled.load();
}

std::expected<AnalysisResult, FlowError>
FlowMappingPipeline::analyze(VideoSource& video,
                             const SegmentCatalog& segments,
                             const IntervalCatalog& intervals) {
    impl_->cancelled.store(false);
    const auto& cfg = impl_->config;

    if (auto valid = impl_->validateConfig(); !valid) {
        return std::unexpected(valid.error());
    }
    if (auto inRange = intervals.validateAgainst(video.frameCount()); !inRange) {
        return std::unexpected(inRange.error());
    }

    video.setCalibration(cfg.pixelSize, cfg.frameRate);

    const VelocityCalculator calculator(VelocityPolicy{
        cfg.frameRate, cfg.pixelSize, cfg.minSegmentLength, cfg.maxMeasuredSpeed});

    AnalysisResult result;
    result.matrices.velocity = FlowMatrix(intervals.size(), segments.size());
    result.matrices.angle = FlowMatrix(intervals.size(), segments.size());
    result.matrices.fit = FlowMatrix(intervals.size(), segments.size());

    const auto& segmentList = segments.segments();
    const size_t totalUnits = intervals.size() * segmentList.size();
    const size_t batchSize = static_cast<size_t>(cfg.threads);
    const auto policy = cfg.threads > 1 ? std::launch::async : std::launch::deferred;
    size_t completed = 0;

    impl_->logger->info("Analyzing {} segments x {} intervals ({} estimator, {} threads)",
                        segmentList.size(), intervals.size(),
                        impl_->estimator->name(), cfg.threads);
    impl_->reportProgress(0.0, "Starting analysis");

    for (const auto& interval : intervals.intervals()) {
        auto frames = KymographBuilder::readFrames(video, interval);
        if (!frames) {
            return std::unexpected(frames.error());
        }

        for (size_t first = 0; first < segmentList.size(); first += batchSize) {
            const size_t last = std::min(first + batchSize, segmentList.size());

            std::vector<std::future<std::expected<UnitResult, FlowError>>> futures;
            futures.reserve(last - first);
            for (size_t i = first; i < last; ++i) {
                if (impl_->cancelled.load()) {
                    impl_->logger->info("Analysis cancelled at interval {}", interval.id);
                    return std::unexpected(FlowError{
                        FlowError::Code::Cancelled, "Analysis cancelled"});
                }
                futures.push_back(std::async(policy,
                    [this, &frames, &segmentList, &interval, &calculator, i]() {
                        return impl_->processUnit(*frames, segmentList[i], interval, calculator);
                    }));
            }

            for (auto& future : futures) {
                auto unit = future.get();
                if (!unit) {
                    return std::unexpected(unit.error());
                }

                const int segmentId = unit->segmentId;
                const auto& evaluation = unit->evaluation;

                auto stored = result.matrices.velocity.set(interval.id, segmentId, evaluation.cell);
                if (!stored) return std::unexpected(stored.error());
                stored = result.matrices.angle.set(interval.id, segmentId,
                                                   angleCell(unit->orientation.angle));
                if (!stored) return std::unexpected(stored.error());
                stored = result.matrices.fit.set(interval.id, segmentId,
                                                 fitCell(unit->orientation.fitGoodness));
                if (!stored) return std::unexpected(stored.error());

                if (evaluation.anomaly) {
                    result.matrices.anomalies.push_back(*evaluation.anomaly);
                }
                if (unit->raster) {
                    result.kymographs.push_back(Kymograph{unit->raster, segmentId, interval.id});
                }

                impl_->logger->debug("Interval {} segment {}: angle {:.4f} rad, fit {:.3f}, v {:.2f} um/s",
                                     interval.id, segmentId, unit->orientation.angle,
                                     unit->orientation.fitGoodness, evaluation.rawVelocity);

                ++completed;
                impl_->reportProgress(
                    static_cast<double>(completed) / static_cast<double>(totalUnits),
                    std::format("Interval {}/{}, segment {}/{}", interval.id, intervals.size(),
                                segmentId, segmentList.size()));

                if (impl_->cancelled.load()) {
                    impl_->logger->info("Analysis cancelled after interval {} segment {}",
                                        interval.id, segmentId);
                    return std::unexpected(FlowError{
                        FlowError::Code::Cancelled, "Analysis cancelled"});
                }
            }
        }
    }

    result.summaries = summarizeSegments(result.matrices.velocity, segments);
    for (const auto& summary : result.summaries) {
        impl_->logger->info("Segment {} ({}): mean {:.2f} um/s over {}/{} intervals",
                            summary.segmentId, summary.name, summary.meanVelocity,
                            summary.validIntervals, intervals.size());
    }
    if (!result.matrices.anomalies.empty()) {
        impl_->logger->warn("{} computation anomalies recorded",
                            result.matrices.anomalies.size());
    }

    impl_->reportProgress(1.0, "Analysis complete");
    return result;
}

std::string FlowMappingPipeline::kymographFileName(int intervalId, int segmentId) {
    return std::format("interval{:03}_segment{:03}.tif", intervalId, segmentId);
}

std::expected<void, FlowError>
FlowMappingPipeline::writeKymograph(const Kymograph& kymograph, const std::filesystem::path& path) {
    if (!kymograph.raster) {
        return std::unexpected(FlowError{
            FlowError::Code::InvalidInput, "Kymograph has no raster"});
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

    using WriterType = itk::ImageFileWriter<FloatImage2D>;
    auto writer = WriterType::New();
    writer->SetFileName(path.string());
    writer->SetInput(kymograph.raster);

    try {
        writer->Update();
    } catch (const itk::ExceptionObject& e) {
        return std::unexpected(FlowError{
            FlowError::Code::FileAccess,
            std::format("Cannot write kymograph {}: {}", path.string(), e.GetDescription())});
    }
    return {};
}

std::expected<void, FlowError>
FlowMappingPipeline::writeOutputs(const AnalysisResult& result,
                                  const SegmentCatalog& segments) const {
    const auto& directory = impl_->config.outputDirectory;
    if (directory.empty()) {
        return std::unexpected(FlowError{
            FlowError::Code::Configuration,
            "outputDirectory is empty (run setup must supply it)"});
    }

    auto written = FlowMatrixIO::writeAnalysisOutputs(directory, result.matrices, segments);
    if (!written) {
        return written;
    }

    for (const auto& kymograph : result.kymographs) {
        auto path = directory / "kymographs" /
                    kymographFileName(kymograph.intervalId, kymograph.segmentId);
        if (auto r = writeKymograph(kymograph, path); !r) {
            return r;
        }
    }
    if (!result.kymographs.empty()) {
        impl_->logger->info("Saved {} kymographs to {}", result.kymographs.size(),
                            (directory / "kymographs").string());
    }
    return {};
}

}  // namespace flow_mapper::services
