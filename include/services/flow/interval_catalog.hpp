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
#include <string_view>
#include <utility>
#include <vector>

#include "services/flow/flow_types.hpp"

namespace flow_mapper::services {

/**
 * @brief Ordered, non-overlapping frame ranges to analyse
 *
 * Text format, one interval per line (frames are 1-based and inclusive):
 * @code
 * // motion artefact between 301 and 340 excluded
 * 1,300
 * 341,600
 * @endcode
 */
class IntervalCatalog {
public:
    IntervalCatalog() = default;

    [[nodiscard]] static std::expected<IntervalCatalog, FlowError>
    load(const std::filesystem::path& path);

    [[nodiscard]] static std::expected<IntervalCatalog, FlowError>
    parse(std::string_view content, const std::string& sourceName = "<memory>");

    /**
     * @brief Build a catalog from (start, end) pairs; ids follow vector order
     */
    [[nodiscard]] static std::expected<IntervalCatalog, FlowError>
    fromRanges(const std::vector<std::pair<int, int>>& ranges);

    [[nodiscard]] std::string serialize() const;

    [[nodiscard]] std::expected<void, FlowError>
    save(const std::filesystem::path& path) const;

    /**
     * @brief Check every interval against the number of available frames
     * @return Range error naming the first interval that does not fit
     */
    [[nodiscard]] std::expected<void, FlowError> validateAgainst(int frameCount) const;

    [[nodiscard]] const std::vector<Interval>& intervals() const noexcept { return intervals_; }
    [[nodiscard]] size_t size() const noexcept { return intervals_.size(); }
    [[nodiscard]] bool empty() const noexcept { return intervals_.empty(); }

private:
    std::vector<Interval> intervals_;
};

}  // namespace flow_mapper::services
