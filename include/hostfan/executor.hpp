/*
 * hostfan - Fleet Command Dispatcher
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>
#include <vector>

namespace hostfan {

struct ExecResult {
    bool ok = false;
    int exitCode = -1;
    std::string error;
};

// Runs one command on one host. Combined stdout/stderr goes to outputFd.
// Implementations never retry.
class Executor {
public:
    virtual ~Executor() = default;

    [[nodiscard]] virtual ExecResult execute(const std::string& command,
                                             const std::string& host,
                                             int outputFd) = 0;
};

class SshExecutor final : public Executor {
public:
    explicit SshExecutor(std::string program = "ssh", int connectTimeout = 2,
                         std::vector<std::string> extraOptions = {});

    SshExecutor(const SshExecutor&) = delete;
    SshExecutor& operator=(const SshExecutor&) = delete;

    [[nodiscard]] ExecResult execute(const std::string& command,
                                     const std::string& host,
                                     int outputFd) override;

    [[nodiscard]] std::vector<std::string> buildArgs(const std::string& command,
                                                     const std::string& host) const;

private:
    std::string program_;
    int connectTimeout_;
    std::vector<std::string> extraOptions_;
};

}
