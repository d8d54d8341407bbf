/*
 * hostfan - Fleet Command Dispatcher
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hostfan/executor.hpp"
#include "hostfan/logger.hpp"
#include <cerrno>
#include <cstring>
#include <utility>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace hostfan {

namespace {
constexpr int kExecFailedStatus = 127;

void writeAll(int fd, const char* data, std::size_t size) noexcept {
    while (size > 0) {
        ssize_t n = ::write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return;
        }
        data += n;
        size -= static_cast<std::size_t>(n);
    }
}
}

SshExecutor::SshExecutor(std::string program, int connectTimeout,
                         std::vector<std::string> extraOptions)
    : program_(std::move(program)),
      connectTimeout_(connectTimeout),
      extraOptions_(std::move(extraOptions)) {
    LOG_DEBUG("SshExecutor using " + program_ + " with ConnectTimeout=" + std::to_string(connectTimeout_));
}

std::vector<std::string> SshExecutor::buildArgs(const std::string& command,
                                                const std::string& host) const {
    std::vector<std::string> args;
    args.reserve(5 + 2 * extraOptions_.size());
    args.push_back(program_);
    args.push_back("-o");
    args.push_back("ConnectTimeout=" + std::to_string(connectTimeout_));
    for (const auto& option : extraOptions_) {
        args.push_back("-o");
        args.push_back(option);
    }
    args.push_back(host);
    args.push_back(command);
    return args;
}

ExecResult SshExecutor::execute(const std::string& command, const std::string& host,
                                int outputFd) {
    ExecResult result;
    if (command.empty() || host.empty()) {
        result.error = "empty command or host";
        return result;
    }
    if (outputFd < 0) {
        result.error = "no output sink";
        return result;
    }

    // Everything the child touches is prepared before fork
    std::vector<std::string> args = buildArgs(command, host);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    std::string execFailure = "hostfan: failed to execute " + program_ + "\n";

    pid_t pid = ::fork();
    if (pid == -1) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        // Concurrent children must not compete for the terminal
        int devNull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devNull == STDIN_FILENO) {
            ::fcntl(devNull, F_SETFD, 0);
        } else if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
            ::close(devNull);
        }
        if (::dup2(outputFd, STDOUT_FILENO) == -1 || ::dup2(outputFd, STDERR_FILENO) == -1) {
            ::_exit(kExecFailedStatus);
        }
        ::execvp(argv[0], argv.data());
        writeAll(STDERR_FILENO, execFailure.data(), execFailure.size());
        ::_exit(kExecFailedStatus);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            result.error = std::string("waitpid failed: ") + std::strerror(errno);
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
        if (result.exitCode == 0) {
            result.ok = true;
        } else {
            result.error = "exit status " + std::to_string(result.exitCode);
        }
    } else if (WIFSIGNALED(status)) {
        result.error = "killed by signal " + std::to_string(WTERMSIG(status));
    } else {
        result.error = "abnormal termination";
    }
    return result;
}

}
