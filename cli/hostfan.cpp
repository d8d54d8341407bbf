/*
 * hostfan - Fleet Command Dispatcher
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hostfan/config.hpp"
#include "hostfan/dispatcher.hpp"
#include "hostfan/executor.hpp"
#include "hostfan/fleet.hpp"
#include "hostfan/host_order.hpp"
#include "hostfan/logger.hpp"
#include "hostfan/recorder.hpp"
#include "hostfan/source.hpp"
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace hostfan;

constexpr const char* VERSION = "0.1.0";

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitFatal = 2;

void printUsage(const char* progName) {
    std::cout << "hostfan v" << VERSION << " - run commands across a pool of remote hosts\n\n";
    std::cout << "Usage: " << progName << " [options]\n";
    std::cout << "       " << progName << " help | --help | --version\n\n";
    std::cout << "Every command runs on one randomly chosen host; when it fails it is retried\n";
    std::cout << "on the next host until one succeeds or all hosts have been tried.\n\n";
    std::cout << "Options:\n";
    std::cout << "  --cmds <path>            Commands to run, one per line (default: cmds.txt)\n";
    std::cout << "  --hosts <path>           Hosts to run on, one per line (default: hosts.txt)\n";
    std::cout << "  --output-dir <dir>       Where attempt and final logs are written (default: .)\n";
    std::cout << "  --workers <n>            Commands running at once, 0 = all (default: 0)\n";
    std::cout << "  --connect-timeout <s>    Connection timeout per attempt (default: 2)\n";
    std::cout << "  --ssh <program>          Remote execution client (default: ssh)\n";
    std::cout << "  --ssh-option <opt>       Extra '-o' option for the client (repeatable)\n";
    std::cout << "  -v, --verbose            Debug logging\n";
    std::cout << "  -q, --quiet              Only log errors\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "      --version            Show version\n\n";
    std::cout << "Output:\n";
    std::cout << "  cmd_<id>-attempt<n>.log  Output of attempt n of command id\n";
    std::cout << "  cmd_<id>-final.log       Output of the attempt that succeeded\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  HOSTFAN_LOG_LEVEL        Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  HOSTFAN_WORKERS          Default for --workers\n";
    std::cout << "  HOSTFAN_CONNECT_TIMEOUT  Default for --connect-timeout\n";
    std::cout << "  HOSTFAN_SSH              Default for --ssh\n";
    std::cout << "  HOSTFAN_OUTPUT_DIR       Default for --output-dir\n\n";
    std::cout << "Exit status: 0 all commands succeeded, 1 some failed, 2 logs could not be written\n";
}

bool parseInt(const std::string& flag, const std::string& value, int& out) {
    try {
        std::size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        out = parsed;
        return true;
    } catch (const std::exception&) {
        std::cerr << "Error: " << flag << " expects a number, got '" << value << "'\n";
        return false;
    }
}

}

int main(int argc, char* argv[]) {
    setThreadName("Main");

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help" || (i == 1 && arg == "help")) {
            printUsage(argv[0]);
            return kExitOk;
        }
        if (arg == "--version") {
            std::cout << VERSION << "\n";
            return kExitOk;
        }
    }

    Config config = Config::fromEnv();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needsValue = [&](std::string& value) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value\n";
                return false;
            }
            value = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--cmds") {
            if (!needsValue(value)) return kExitFailed;
            config.commandsPath = value;
        } else if (arg == "--hosts") {
            if (!needsValue(value)) return kExitFailed;
            config.hostsPath = value;
        } else if (arg == "--output-dir") {
            if (!needsValue(value)) return kExitFailed;
            config.outputDir = value;
        } else if (arg == "--workers") {
            if (!needsValue(value) || !parseInt(arg, value, config.workers)) return kExitFailed;
        } else if (arg == "--connect-timeout") {
            if (!needsValue(value) || !parseInt(arg, value, config.connectTimeout)) return kExitFailed;
        } else if (arg == "--ssh") {
            if (!needsValue(value)) return kExitFailed;
            config.sshProgram = value;
        } else if (arg == "--ssh-option") {
            if (!needsValue(value)) return kExitFailed;
            config.sshOptions.push_back(value);
        } else if (arg == "-v" || arg == "--verbose") {
            Logger::setLevel(LogLevel::DEBUG);
        } else if (arg == "-q" || arg == "--quiet") {
            Logger::setLevel(LogLevel::ERROR);
        } else {
            std::cerr << "Error: unknown option '" << arg << "'\n";
            std::cerr << "Run '" << argv[0] << " --help' for usage\n";
            return kExitFailed;
        }
    }

    std::string error;
    if (!config.validate(error)) {
        std::cerr << "Error: " << error << "\n";
        return kExitFailed;
    }

    try {
        // Load commands and hosts, run all the items until completion
        LoadResult commands = readLines(config.commandsPath);
        if (!commands) {
            LOG_ERROR("Cannot load commands: " + commands.message);
            return kExitFailed;
        }
        LoadResult hosts = readLines(config.hostsPath);
        if (!hosts) {
            LOG_ERROR("Cannot load hosts: " + hosts.message);
            return kExitFailed;
        }
        if (hosts.lines.empty()) {
            LOG_WARN("Host list " + config.hostsPath.string() + " is empty, every command will fail");
        }

        AttemptRecorder recorder(config.outputDir);
        if (!recorder.prepare(error)) {
            LOG_ERROR(error);
            return kExitFatal;
        }

        HostOrder order;
        SshExecutor executor(config.sshProgram, config.connectTimeout, config.sshOptions);
        Dispatcher dispatcher(hosts.lines, order, recorder, executor);
        Fleet fleet(dispatcher, config.workers);

        RunSummary summary = fleet.run(commands.lines);

        for (const auto& result : summary.results) {
            if (!result.ok()) {
                std::cout << "failed id=" << result.commandId
                          << " (" << outcomeToString(result.outcome) << ", "
                          << result.attempts.size() << " attempts): "
                          << commands.lines[result.commandId] << "\n";
            }
        }
        std::cout << "succeeded=" << summary.succeeded
                  << " failed=" << summary.failed
                  << " total=" << summary.total << std::endl;

        if (summary.fatal) {
            LOG_ERROR("Run stopped early: " + summary.fatalError);
            return kExitFatal;
        }
        return summary.failed == 0 ? kExitOk : kExitFailed;

    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Unexpected error: ") + e.what());
        return kExitFatal;
    }
}
