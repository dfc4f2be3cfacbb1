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

#include "core/artifact_writer.hpp"

#include <format>
#include <fstream>
#include <system_error>

#include <kcenon/common/logging/log_macros.h>

namespace flow_mapper::core {

namespace fs = std::filesystem;

std::expected<fs::path, std::string>
backupExisting(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return fs::path{};
    }

    fs::path backup = path;
    backup += ".bak";
    for (int n = 1; fs::exists(backup, ec); ++n) {
        backup = path;
        backup += std::format(".bak.{}", n);
    }

    fs::rename(path, backup, ec);
    if (ec) {
        return std::unexpected(std::format("Cannot back up {} to {}: {}",
                                           path.string(), backup.string(), ec.message()));
    }

    LOG_INFO(std::format("Preserved previous {} as {}",
                         path.filename().string(), backup.filename().string()));
    return backup;
}

std::expected<void, std::string>
writeTextArtifact(const fs::path& path, const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(std::format("Cannot create directory {}: {}",
                                               path.parent_path().string(), ec.message()));
        }
    }

    auto backup = backupExisting(path);
    if (!backup) {
        return std::unexpected(backup.error());
    }

    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        return std::unexpected("Cannot open file for writing: " + path.string());
    }

    file << content;
    file.close();
    if (file.fail()) {
        return std::unexpected("Failed to write file: " + path.string());
    }
    return {};
}

}  // namespace flow_mapper::core
