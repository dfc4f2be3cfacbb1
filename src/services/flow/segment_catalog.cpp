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

#include "services/flow/segment_catalog.hpp"
#include "core/artifact_writer.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include <kcenon/common/logging/log_macros.h>

namespace flow_mapper::services {

using json = nlohmann::json;

namespace {

std::expected<Point2D, FlowError> jsonToPoint(const json& j, size_t segmentIndex) {
    if (!j.is_array() || j.size() < 2 || !j[0].is_number() || !j[1].is_number()) {
        return std::unexpected(FlowError{
            FlowError::Code::ParseFailed,
            std::format("Segment {} has a point that is not [x, y]", segmentIndex + 1)});
    }
    return Point2D{j[0].get<double>(), j[1].get<double>()};
}

json pointToJson(const Point2D& p) {
    return json::array({p[0], p[1]});
}

}  // anonymous namespace

double SegmentCatalog::pathLength(const std::vector<Point2D>& points) {
    double length = 0.0;
    for (size_t i = 1; i < points.size(); ++i) {
        double dx = points[i][0] - points[i - 1][0];
        double dy = points[i][1] - points[i - 1][1];
        length += std::sqrt(dx * dx + dy * dy);
    }
    return length;
}

std::expected<SegmentCatalog, FlowError>
SegmentCatalog::fromPolylines(const std::vector<NamedPolyline>& polylines, double pixelSize) {
    if (!(pixelSize > 0.0) || !std::isfinite(pixelSize)) {
        return std::unexpected(FlowError{
            FlowError::Code::InvalidInput,
            std::format("Pixel size must be positive, got {}", pixelSize)});
    }
    if (polylines.empty()) {
        return std::unexpected(FlowError{
            FlowError::Code::InvalidInput, "Segment catalog is empty"});
    }

    SegmentCatalog catalog;
    catalog.pixelSize_ = pixelSize;
    catalog.segments_.reserve(polylines.size());

    for (size_t i = 0; i < polylines.size(); ++i) {
        const auto& [name, points] = polylines[i];
        if (points.empty()) {
            return std::unexpected(FlowError{
                FlowError::Code::InvalidInput,
                std::format("Segment {} ('{}') has no points", i + 1, name)});
        }

        Segment segment;
        segment.id = static_cast<int>(i) + 1;
        segment.name = name.empty() ? std::format("Segment {}", segment.id) : name;
        segment.points = points;
        segment.pixelLength = pathLength(points);
        segment.physicalLength = segment.pixelLength * pixelSize;
        catalog.segments_.push_back(std::move(segment));
    }

    return catalog;
}

std::expected<SegmentCatalog, FlowError>
SegmentCatalog::parse(const std::string& text, double pixelSize) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        return std::unexpected(FlowError{
            FlowError::Code::ParseFailed,
            std::format("Segment file is not valid JSON: {}", e.what())});
    }

    if (!root.contains("segments") || !root["segments"].is_array()) {
        return std::unexpected(FlowError{
            FlowError::Code::ParseFailed,
            "Segment file has no 'segments' array"});
    }

    std::vector<NamedPolyline> polylines;
    const auto& segments = root["segments"];
    polylines.reserve(segments.size());

    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& s = segments[i];
        if (!s.is_object() || !s.contains("points") || !s["points"].is_array()) {
            return std::unexpected(FlowError{
                FlowError::Code::ParseFailed,
                std::format("Segment {} has no 'points' array", i + 1)});
        }

        if (s.contains("name") && !s["name"].is_string()) {
            return std::unexpected(FlowError{
                FlowError::Code::ParseFailed,
                std::format("Segment {} has a non-string 'name'", i + 1)});
        }

        std::vector<Point2D> points;
        points.reserve(s["points"].size());
        for (const auto& p : s["points"]) {
            auto point = jsonToPoint(p, i);
            if (!point) {
                return std::unexpected(point.error());
            }
            points.push_back(*point);
        }
        polylines.emplace_back(s.value("name", std::string{}), std::move(points));
    }

    return fromPolylines(polylines, pixelSize);
}

std::expected<SegmentCatalog, FlowError>
SegmentCatalog::load(const std::filesystem::path& path, double pixelSize) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(FlowError{
            FlowError::Code::FileAccess,
            "Cannot open segment file: " + path.string()});
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto catalog = parse(buffer.str(), pixelSize);
    if (catalog) {
        LOG_INFO(std::format("Loaded {} segments from {}",
                             catalog->size(), path.filename().string()));
    }
    return catalog;
}

std::expected<void, FlowError>
SegmentCatalog::save(const std::filesystem::path& path) const {
    json segments = json::array();
    for (const auto& segment : segments_) {
        json points = json::array();
        for (const auto& p : segment.points) {
            points.push_back(pointToJson(p));
        }
        segments.push_back({{"name", segment.name}, {"points", points}});
    }

    json root = {{"segments", segments}};
    auto written = core::writeTextArtifact(path, root.dump(2) + "\n");
    if (!written) {
        return std::unexpected(FlowError{FlowError::Code::FileAccess, written.error()});
    }
    return {};
}

std::vector<std::string> SegmentCatalog::columnNames() const {
    std::vector<std::string> names;
    names.reserve(segments_.size());
    for (const auto& segment : segments_) {
        // Column and row separators must not appear inside a header cell
        std::string name = segment.name;
        std::replace_if(name.begin(), name.end(),
                        [](char c) { return c == ',' || c == '\n' || c == '\r'; }, '_');
        names.push_back(std::move(name));
    }
    return names;
}

}  // namespace flow_mapper::services
