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

#include <expected>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "services/flow/flow_types.hpp"

namespace flow_mapper::services {

/**
 * @brief Ordered, read-only set of traced vessel segments
 *
 * Segments are numbered 1..N in file order. The catalog is produced by the
 * skeleton tracing step and stored as JSON:
 * @code
 * {
 *   "segments": [
 *     {"name": "Segment 1", "points": [[12.0, 40.0], [13.0, 40.0], ...]},
 *     ...
 *   ]
 * }
 * @endcode
 */
class SegmentCatalog {
public:
    using NamedPolyline = std::pair<std::string, std::vector<Point2D>>;

    SegmentCatalog() = default;

    /**
     * @brief Load segments from a JSON file
     * @param path Segment file
     * @param pixelSize Micrometres per pixel used for physical lengths
     */
    [[nodiscard]] static std::expected<SegmentCatalog, FlowError>
    load(const std::filesystem::path& path, double pixelSize);

    /**
     * @brief Parse segments from JSON text
     */
    [[nodiscard]] static std::expected<SegmentCatalog, FlowError>
    parse(const std::string& json, double pixelSize);

    /**
     * @brief Build a catalog from in-memory polylines (ids follow vector order)
     */
    [[nodiscard]] static std::expected<SegmentCatalog, FlowError>
    fromPolylines(const std::vector<NamedPolyline>& polylines, double pixelSize);

    /**
     * @brief Write the catalog as JSON, preserving any previous file
     */
    [[nodiscard]] std::expected<void, FlowError>
    save(const std::filesystem::path& path) const;

    [[nodiscard]] const std::vector<Segment>& segments() const noexcept { return segments_; }
    [[nodiscard]] size_t size() const noexcept { return segments_.size(); }
    [[nodiscard]] bool empty() const noexcept { return segments_.empty(); }
    [[nodiscard]] double pixelSize() const noexcept { return pixelSize_; }

    /// Segment by 1-based id
    [[nodiscard]] const Segment& byId(int id) const { return segments_.at(id - 1); }

    /// Names used as matrix column headers
    [[nodiscard]] std::vector<std::string> columnNames() const;

    /**
     * @brief Euclidean length of a polyline in pixels
     */
    [[nodiscard]] static double pathLength(const std::vector<Point2D>& points);

private:
    std::vector<Segment> segments_;
    double pixelSize_ = 1.0;
};

}  // namespace flow_mapper::services
