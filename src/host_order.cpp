/*
 * hostfan - Fleet Command Dispatcher
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hostfan/host_order.hpp"
#include <algorithm>
#include <array>
#include <chrono>
#include <numeric>

namespace hostfan {

namespace {
std::uint64_t entropySeed() {
    std::random_device device;
    auto now = static_cast<std::uint64_t>(
        std::chrono::system_clock::now().time_since_epoch().count());
    std::seed_seq seq{device(), device(),
                      static_cast<std::uint32_t>(now),
                      static_cast<std::uint32_t>(now >> 32)};
    std::array<std::uint32_t, 2> words{};
    seq.generate(words.begin(), words.end());
    return (static_cast<std::uint64_t>(words[0]) << 32) | words[1];
}
}

HostOrder::HostOrder() : engine_(entropySeed()) {}

HostOrder::HostOrder(std::uint64_t seed) noexcept : engine_(seed) {}

std::vector<std::size_t> HostOrder::permutation(std::size_t hostCount) {
    std::vector<std::size_t> order(hostCount);
    std::iota(order.begin(), order.end(), std::size_t{0});

    std::lock_guard<std::mutex> lock(mutex_);
    std::shuffle(order.begin(), order.end(), engine_);
    return order;
}

}
