/*
 * hostfan - Fleet Command Dispatcher
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hostfan/source.hpp"
#include "hostfan/logger.hpp"
#include <fstream>

namespace hostfan {

LoadResult readLines(const std::filesystem::path& path) noexcept {
    LoadResult result;
    try {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            result.message = "Not a readable file: " + path.string();
            return result;
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            result.message = "Failed to open " + path.string();
            return result;
        }

        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty()) {
                continue;
            }
            result.lines.push_back(line);
        }

        if (file.bad()) {
            result.lines.clear();
            result.message = "Read error on " + path.string();
            return result;
        }

        LOG_DEBUG("Loaded " + std::to_string(result.lines.size()) + " lines from " + path.string());
        result.ok = true;
        return result;
    } catch (const std::exception& e) {
        result.lines.clear();
        result.message = "Failed to read " + path.string() + ": " + e.what();
        return result;
    }
}

}
