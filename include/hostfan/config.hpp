/*
 * hostfan - Fleet Command Dispatcher
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace hostfan {

struct Config {
    std::filesystem::path commandsPath = "cmds.txt";
    std::filesystem::path hostsPath = "hosts.txt";
    std::filesystem::path outputDir = ".";

    // 0 runs every command on its own worker
    int workers = 0;

    int connectTimeout = 2;  // seconds
    std::string sshProgram = "ssh";
    std::vector<std::string> sshOptions;

    // Defaults overridden by HOSTFAN_* environment variables.
    [[nodiscard]] static Config fromEnv();

    [[nodiscard]] bool validate(std::string& error) const;
};

}
