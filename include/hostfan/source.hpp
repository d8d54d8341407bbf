/*
 * hostfan - Fleet Command Dispatcher
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace hostfan {

struct LoadResult {
    bool ok = false;
    std::vector<std::string> lines;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Reads every non-empty line of a text file, in file order.
[[nodiscard]] LoadResult readLines(const std::filesystem::path& path) noexcept;

}
