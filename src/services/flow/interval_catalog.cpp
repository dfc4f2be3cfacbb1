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

#include "services/flow/interval_catalog.hpp"
#include "core/artifact_writer.hpp"

#include <cctype>
#include <charconv>
#include <format>
#include <fstream>
#include <sstream>

#include <kcenon/common/logging/log_macros.h>

namespace flow_mapper::services {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

bool parseFrame(std::string_view text, int& out) {
    text = trim(text);
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size() && !text.empty();
}

}  // anonymous namespace

std::expected<IntervalCatalog, FlowError>
IntervalCatalog::fromRanges(const std::vector<std::pair<int, int>>& ranges) {
    IntervalCatalog catalog;
    catalog.intervals_.reserve(ranges.size());

    int previousEnd = 0;
    for (size_t i = 0; i < ranges.size(); ++i) {
        const auto [start, end] = ranges[i];
        const int id = static_cast<int>(i) + 1;

        if (start < 1 || end < start) {
            return std::unexpected(FlowError{
                FlowError::Code::InvalidInput,
                std::format("Interval {} ({}-{}) is not a valid 1-based frame range",
                            id, start, end)});
        }
        if (start <= previousEnd) {
            return std::unexpected(FlowError{
                FlowError::Code::InvalidInput,
                std::format("Interval {} ({}-{}) overlaps or precedes the previous interval",
                            id, start, end)});
        }

        catalog.intervals_.push_back(Interval{id, start, end});
        previousEnd = end;
    }

    return catalog;
}

std::expected<IntervalCatalog, FlowError>
IntervalCatalog::parse(std::string_view content, const std::string& sourceName) {
    std::vector<std::pair<int, int>> ranges;

    int lineNumber = 0;
    while (!content.empty()) {
        auto newline = content.find('\n');
        auto line = trim(content.substr(0, newline));
        content = (newline == std::string_view::npos)
            ? std::string_view{} : content.substr(newline + 1);
        ++lineNumber;

        if (line.empty() || line.starts_with("//")) {
            continue;
        }

        auto comma = line.find(',');
        int start = 0;
        int end = 0;
        if (comma == std::string_view::npos ||
            !parseFrame(line.substr(0, comma), start) ||
            !parseFrame(line.substr(comma + 1), end)) {
            return std::unexpected(FlowError{
                FlowError::Code::ParseFailed,
                std::format("{}:{}: expected 'startFrame,endFrame', got '{}'",
                            sourceName, lineNumber, line)});
        }
        ranges.emplace_back(start, end);
    }

    return fromRanges(ranges);
}

std::expected<IntervalCatalog, FlowError>
IntervalCatalog::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(FlowError{
            FlowError::Code::FileAccess,
            "Cannot open interval file: " + path.string()});
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto catalog = parse(buffer.str(), path.filename().string());
    if (catalog) {
        LOG_INFO(std::format("Loaded {} intervals from {}",
                             catalog->size(), path.filename().string()));
    }
    return catalog;
}

std::string IntervalCatalog::serialize() const {
    std::string out = "// startFrame,endFrame\n";
    for (const auto& interval : intervals_) {
        out += std::format("{},{}\n", interval.startFrame, interval.endFrame);
    }
    return out;
}

std::expected<void, FlowError>
IntervalCatalog::save(const std::filesystem::path& path) const {
    auto written = core::writeTextArtifact(path, serialize());
    if (!written) {
        return std::unexpected(FlowError{FlowError::Code::FileAccess, written.error()});
    }
    return {};
}

std::expected<void, FlowError> IntervalCatalog::validateAgainst(int frameCount) const {
    for (const auto& interval : intervals_) {
        if (interval.startFrame < 1 || interval.endFrame > frameCount) {
            return std::unexpected(FlowError{
                FlowError::Code::Range,
                std::format("Interval {} covers frames {}-{} but the video has {} frames",
                            interval.id, interval.startFrame, interval.endFrame,
                            frameCount)});
        }
    }
    return {};
}

}  // namespace flow_mapper::services
