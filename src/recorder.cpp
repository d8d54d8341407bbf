/*
 * hostfan - Fleet Command Dispatcher
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hostfan/recorder.hpp"
#include "hostfan/logger.hpp"
#include <cerrno>
#include <cstring>
#include <utility>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace hostfan {

AttemptFile::AttemptFile(int fd, std::filesystem::path path) noexcept
    : fd_(fd), path_(std::move(path)) {}

AttemptFile::~AttemptFile() {
    close();
}

AttemptFile::AttemptFile(AttemptFile&& other) noexcept
    : fd_(other.fd_), path_(std::move(other.path_)) {
    other.fd_ = -1;
}

AttemptFile& AttemptFile::operator=(AttemptFile&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

bool AttemptFile::sync() noexcept {
    if (fd_ < 0) {
        return false;
    }
    while (::fsync(fd_) != 0) {
        if (errno != EINTR) {
            return false;
        }
    }
    return true;
}

void AttemptFile::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

AttemptRecorder::AttemptRecorder(const std::filesystem::path& outputDir)
    : outputDir_(outputDir) {
    LOG_DEBUG("AttemptRecorder writing to " + outputDir_.string());
}

bool AttemptRecorder::prepare(std::string& error) const noexcept {
    try {
        std::filesystem::create_directories(outputDir_);
        if (!std::filesystem::is_directory(outputDir_)) {
            error = "Output path is not a directory: " + outputDir_.string();
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        error = "Failed to create output directory " + outputDir_.string() + ": " + e.what();
        return false;
    }
}

std::filesystem::path AttemptRecorder::attemptPath(CommandId id, int sequence) const {
    return outputDir_ / ("cmd_" + std::to_string(id) + "-attempt" + std::to_string(sequence) + ".log");
}

std::filesystem::path AttemptRecorder::finalPath(CommandId id) const {
    return outputDir_ / ("cmd_" + std::to_string(id) + "-final.log");
}

BeginResult AttemptRecorder::begin(CommandId id, int sequence) const noexcept {
    BeginResult result;
    try {
        auto path = attemptPath(id, sequence);
        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd < 0) {
            result.message = "cannot create " + path.string() + ": " + std::strerror(errno);
            return result;
        }
        result.file = AttemptFile(fd, std::move(path));
        result.ok = true;
        return result;
    } catch (const std::exception& e) {
        result.message = std::string("cannot create attempt artifact: ") + e.what();
        return result;
    }
}

PromoteResult AttemptRecorder::promote(CommandId id, AttemptFile&& attempt) const noexcept {
    PromoteResult result;
    AttemptFile file(std::move(attempt));
    try {
        result.path = file.path();
        if (!file.sync()) {
            LOG_WARN("fsync failed for " + file.path().string() + ": " + std::strerror(errno));
        }
        file.close();

        auto finalOutput = finalPath(id);
        std::error_code ec;
        std::filesystem::rename(result.path, finalOutput, ec);
        if (ec) {
            result.message = "could not write output path " + finalOutput.string() + ": " + ec.message();
            return result;
        }

        result.path = finalOutput;
        result.ok = true;
        return result;
    } catch (const std::exception& e) {
        result.message = std::string("promotion failed: ") + e.what();
        return result;
    }
}

}
