/*
 * hostfan - Fleet Command Dispatcher
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "hostfan/types.hpp"

namespace hostfan {

using CommandProcessor = std::function<void(CommandId, int workerId)>;

class Pool {
public:
    explicit Pool(int workers) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(CommandProcessor processor);
    void stop() noexcept;
    [[nodiscard]] bool submit(CommandId id) noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    // Fewer than requested when the system refused some threads.
    [[nodiscard]] int workerCount() const noexcept { return workers_; }

    // Caps thread creation in every pool started afterwards; -1 lifts the cap.
    static void limitThreadStarts(int maxThreads) noexcept;

private:
    void workerLoop(int workerId);

    int workers_;
    CommandProcessor processor_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    mutable std::mutex queueMutex_;
    std::condition_variable commandAvailable_;
    std::queue<CommandId> queue_;

    std::vector<std::thread> workerThreads_;
};

}
