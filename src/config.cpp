/*
 * hostfan - Fleet Command Dispatcher
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hostfan/config.hpp"
#include "hostfan/logger.hpp"
#include <cstdlib>

namespace hostfan {

namespace {
int env_int(const char* name, int defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

std::string env_string(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    return val;
}
}

Config Config::fromEnv() {
    Config config;
    config.workers = env_int("HOSTFAN_WORKERS", config.workers);
    config.connectTimeout = env_int("HOSTFAN_CONNECT_TIMEOUT", config.connectTimeout);
    config.sshProgram = env_string("HOSTFAN_SSH", config.sshProgram);
    config.outputDir = env_string("HOSTFAN_OUTPUT_DIR", config.outputDir.string());
    return config;
}

bool Config::validate(std::string& error) const {
    if (commandsPath.empty()) {
        error = "Command file path is empty";
        return false;
    }
    if (hostsPath.empty()) {
        error = "Host file path is empty";
        return false;
    }
    if (outputDir.empty()) {
        error = "Output directory is empty";
        return false;
    }
    if (workers < 0) {
        error = "Worker count must not be negative (got " + std::to_string(workers) + ")";
        return false;
    }
    if (connectTimeout <= 0) {
        error = "Connect timeout must be positive (got " + std::to_string(connectTimeout) + ")";
        return false;
    }
    if (sshProgram.empty()) {
        error = "Remote execution program is empty";
        return false;
    }
    return true;
}

}
