/*
 * hostfan - Fleet Command Dispatcher
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>

#include "hostfan/types.hpp"

namespace hostfan {

// Owns the descriptor of one attempt artifact.
class AttemptFile {
public:
    AttemptFile() noexcept = default;
    AttemptFile(int fd, std::filesystem::path path) noexcept;
    ~AttemptFile();

    AttemptFile(const AttemptFile&) = delete;
    AttemptFile& operator=(const AttemptFile&) = delete;
    AttemptFile(AttemptFile&& other) noexcept;
    AttemptFile& operator=(AttemptFile&& other) noexcept;

    [[nodiscard]] int fd() const noexcept { return fd_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] bool isOpen() const noexcept { return fd_ >= 0; }

    [[nodiscard]] bool sync() noexcept;
    void close() noexcept;

private:
    int fd_ = -1;
    std::filesystem::path path_;
};

struct BeginResult {
    bool ok = false;
    AttemptFile file;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct PromoteResult {
    bool ok = false;
    std::filesystem::path path;  // final artifact, or the attempt artifact when !ok
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

class AttemptRecorder final {
public:
    explicit AttemptRecorder(const std::filesystem::path& outputDir);

    AttemptRecorder(const AttemptRecorder&) = delete;
    AttemptRecorder& operator=(const AttemptRecorder&) = delete;

    [[nodiscard]] bool prepare(std::string& error) const noexcept;

    // A failed begin means the run can no longer keep track of its attempts.
    [[nodiscard]] BeginResult begin(CommandId id, int sequence) const noexcept;

    [[nodiscard]] PromoteResult promote(CommandId id, AttemptFile&& attempt) const noexcept;

    [[nodiscard]] std::filesystem::path attemptPath(CommandId id, int sequence) const;
    [[nodiscard]] std::filesystem::path finalPath(CommandId id) const;

private:
    std::filesystem::path outputDir_;
};

}
