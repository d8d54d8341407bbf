/*
 * hostfan - Fleet Command Dispatcher
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <mutex>
#include <random>
#include <vector>

namespace hostfan {

// Produces the order in which a command tries the host pool.
// Safe to call from any number of dispatch threads.
class HostOrder {
public:
    HostOrder();
    explicit HostOrder(std::uint64_t seed) noexcept;

    HostOrder(const HostOrder&) = delete;
    HostOrder& operator=(const HostOrder&) = delete;

    [[nodiscard]] std::vector<std::size_t> permutation(std::size_t hostCount);

private:
    std::mutex mutex_;
    std::mt19937_64 engine_;
};

}
