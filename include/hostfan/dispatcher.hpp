/*
 * hostfan - Fleet Command Dispatcher
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <string>
#include <vector>

#include "hostfan/types.hpp"

namespace hostfan {

class Executor;
class HostOrder;
class AttemptRecorder;

// Runs one command against the host pool, one host at a time, until a host
// succeeds or every host has been tried.
class Dispatcher {
public:
    Dispatcher(const std::vector<std::string>& hosts, HostOrder& order,
               const AttemptRecorder& recorder, Executor& executor) noexcept;

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;
    Dispatcher(Dispatcher&&) = delete;
    Dispatcher& operator=(Dispatcher&&) = delete;

    [[nodiscard]] CompletionResult dispatch(CommandId id, const std::string& command) noexcept;

    // Stops every dispatch from starting another attempt. Attempts already
    // running are left to finish.
    void abort() noexcept { aborted_.store(true); }
    [[nodiscard]] bool aborted() const noexcept { return aborted_.load(); }

    [[nodiscard]] std::size_t hostCount() const noexcept { return hosts_.size(); }

private:
    [[nodiscard]] bool runAttempt(CompletionResult& result, const std::string& command,
                                  const std::string& host, int sequence);

    const std::vector<std::string>& hosts_;
    HostOrder& order_;
    const AttemptRecorder& recorder_;
    Executor& executor_;
    std::atomic<bool> aborted_{false};
};

}
