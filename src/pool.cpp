/*
 * hostfan - Fleet Command Dispatcher
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hostfan/pool.hpp"
#include "hostfan/logger.hpp"
#include <system_error>
#include <utility>

namespace hostfan {

namespace {
std::atomic<int> g_thread_start_limit{-1};
}

Pool::Pool(int workers) noexcept : workers_(workers) {
    LOG_DEBUG("Pool created with " + std::to_string(workers) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start(CommandProcessor processor) {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    if (!processor) {
        LOG_ERROR("Invalid command processor provided");
        return false;
    }

    if (workers_ <= 0) {
        LOG_ERROR("Pool needs at least one worker (got " + std::to_string(workers_) + ")");
        return false;
    }

    processor_ = std::move(processor);
    running_.store(true);
    shutdown_.store(false);

    const int requested = workers_;
    try {
        workerThreads_.reserve(requested);
        for (int i = 0; i < requested; ++i) {
            const int limit = g_thread_start_limit.load();
            if (limit >= 0 && i >= limit) {
                throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                        "thread start limit reached");
            }
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }
    } catch (const std::exception& e) {
        if (workerThreads_.empty()) {
            LOG_ERROR("Failed to start pool: " + std::string(e.what()));
            running_.store(false);
            return false;
        }
        // Workers share one queue, so fewer of them still drain it
        workers_ = static_cast<int>(workerThreads_.size());
        LOG_WARN("Started only " + std::to_string(workers_) + " of " + std::to_string(requested) +
                 " workers: " + std::string(e.what()));
    }

    LOG_DEBUG("Pool started with " + std::to_string(workers_) + " worker threads");
    return true;
}

void Pool::limitThreadStarts(int maxThreads) noexcept {
    g_thread_start_limit.store(maxThreads);
}

void Pool::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping pool...");

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
        running_.store(false);
    }

    commandAvailable_.notify_all();

    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    workerThreads_.clear();

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!queue_.empty()) {
            LOG_WARN("Pool stopped with " + std::to_string(queue_.size()) + " commands never started");
        }
        while (!queue_.empty()) {
            queue_.pop();
        }
    }

    LOG_DEBUG("Pool stopped");
}

bool Pool::submit(CommandId id) noexcept {
    if (!running_.load() || shutdown_.load()) {
        LOG_DEBUG("Cannot submit command to stopped pool: id=" + std::to_string(id));
        return false;
    }

    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            queue_.push(id);
        }

        commandAvailable_.notify_one();
        LOG_TRACE("Command queued: id=" + std::to_string(id));
        return true;
    } catch (...) {
        LOG_ERROR("Failed to queue command: id=" + std::to_string(id));
        return false;
    }
}

void Pool::workerLoop(int workerId) {
    setThreadName(getThreadName(workerId));
    LOG_TRACE("Worker-" + std::to_string(workerId) + " thread started");

    while (true) {
        CommandId id = 0;

        {
            std::unique_lock<std::mutex> lock(queueMutex_);

            commandAvailable_.wait(lock, [this] {
                return !queue_.empty() || shutdown_.load();
            });

            if (shutdown_.load()) {
                break;
            }

            id = queue_.front();
            queue_.pop();
        }

        // Process outside of lock
        try {
            processor_(id, workerId);
        } catch (const std::exception& e) {
            LOG_ERROR("Worker " + std::to_string(workerId) + " command processing error: " +
                      std::string(e.what()) + " (id=" + std::to_string(id) + ")");
        }
    }

    LOG_TRACE("Worker " + std::to_string(workerId) + " stopped");
}

}
