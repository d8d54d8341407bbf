/*
 * hostfan - Fleet Command Dispatcher
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace hostfan {

// Position of a command in the input list.
using CommandId = std::size_t;

// Terminal states of a single command dispatch.
enum class Outcome : std::uint8_t { Succeeded, Exhausted, Aborted };

struct AttemptRecord {
    CommandId commandId = 0;
    int sequence = 0;
    std::string host;
    bool ok = false;
    std::filesystem::path path;
    std::string error;
};

struct CompletionResult {
    CommandId commandId = 0;
    Outcome outcome = Outcome::Exhausted;
    std::vector<AttemptRecord> attempts;
    std::filesystem::path output;   // final artifact, or attempt artifact if promotion failed
    bool promoted = false;
    bool fatal = false;
    std::string error;

    [[nodiscard]] bool ok() const noexcept { return outcome == Outcome::Succeeded; }
};

struct RunSummary {
    std::size_t total = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    bool fatal = false;
    std::string fatalError;
    std::vector<CompletionResult> results;  // indexed by CommandId
};

const char* outcomeToString(Outcome outcome) noexcept;

}
