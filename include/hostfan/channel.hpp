/*
 * hostfan - Fleet Command Dispatcher
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <condition_variable>
#include <exception>
#include <mutex>
#include <queue>
#include <utility>

namespace hostfan {

// Unbounded queue: any number of senders, one receiver that blocks.
template <typename T>
class Channel {
public:
    Channel() = default;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    void send(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push(std::move(value));
        }
        available_.notify_one();
    }

    // Sends value, or whatever fallback() builds if value cannot be queued.
    // Returns false when the fallback was sent instead.
    template <typename Fallback>
    bool sendOr(T value, Fallback fallback) {
        try {
            send(std::move(value));
            return true;
        } catch (const std::exception&) {
            send(fallback());
            return false;
        }
    }

    [[nodiscard]] T receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        available_.wait(lock, [this] { return !queue_.empty(); });
        T value = std::move(queue_.front());
        queue_.pop();
        return value;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::queue<T> queue_;
};

}
