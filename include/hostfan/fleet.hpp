/*
 * hostfan - Fleet Command Dispatcher
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>
#include <vector>

#include "hostfan/types.hpp"

namespace hostfan {

class Dispatcher;

class Fleet final {
public:
    // workers == 0 gives every command its own worker.
    explicit Fleet(Dispatcher& dispatcher, int workers = 0) noexcept;

    Fleet(const Fleet&) = delete;
    Fleet& operator=(const Fleet&) = delete;
    Fleet(Fleet&&) = delete;
    Fleet& operator=(Fleet&&) = delete;

    // Blocks until every command has reported exactly one result.
    [[nodiscard]] RunSummary run(const std::vector<std::string>& commands);

private:
    [[nodiscard]] int poolWidth(std::size_t commandCount) const noexcept;

    Dispatcher& dispatcher_;
    int workers_;
};

}
