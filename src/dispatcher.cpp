/*
 * hostfan - Fleet Command Dispatcher
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hostfan/dispatcher.hpp"
#include "hostfan/executor.hpp"
#include "hostfan/host_order.hpp"
#include "hostfan/recorder.hpp"
#include "hostfan/logger.hpp"
#include <utility>

namespace hostfan {

Dispatcher::Dispatcher(const std::vector<std::string>& hosts, HostOrder& order,
                       const AttemptRecorder& recorder, Executor& executor) noexcept
    : hosts_(hosts), order_(order), recorder_(recorder), executor_(executor) {}

CompletionResult Dispatcher::dispatch(CommandId id, const std::string& command) noexcept {
    CompletionResult result;
    result.commandId = id;
    const std::string tag = "id=" + std::to_string(id);

    try {
        if (hosts_.empty()) {
            LOG_ERROR("FAILED " + tag + " no hosts available");
            result.outcome = Outcome::Exhausted;
            result.error = "no hosts available";
            return result;
        }

        // Try hosts in a random order until one works
        const std::vector<std::size_t> order = order_.permutation(hosts_.size());
        int sequence = 0;
        for (std::size_t index : order) {
            if (aborted()) {
                LOG_WARN("ABORT " + tag + " run is shutting down, skipping remaining hosts");
                result.outcome = Outcome::Aborted;
                result.error = "run aborted after " + std::to_string(sequence) + " attempts";
                return result;
            }
            if (runAttempt(result, command, hosts_[index], sequence++)) {
                return result;
            }
        }

        LOG_ERROR("FAILED " + tag + " exhausted all " + std::to_string(hosts_.size()) +
                  " hosts and could not complete");
        result.outcome = Outcome::Exhausted;
        result.error = "exhausted all hosts";
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("FAILED " + tag + " internal error: " + std::string(e.what()));
        result.outcome = Outcome::Aborted;
        result.error = std::string("internal error: ") + e.what();
        return result;
    }
}

// Returns true once the command has reached a terminal state.
bool Dispatcher::runAttempt(CompletionResult& result, const std::string& command,
                            const std::string& host, int sequence) {
    const CommandId id = result.commandId;
    const std::string tag = "id=" + std::to_string(id);

    BeginResult begun = recorder_.begin(id, sequence);
    if (!begun) {
        LOG_ERROR("FATAL " + tag + " " + begun.message);
        result.outcome = Outcome::Aborted;
        result.fatal = true;
        result.error = begun.message;
        return true;
    }

    AttemptRecord record;
    record.commandId = id;
    record.sequence = sequence;
    record.host = host;
    record.path = begun.file.path();

    LOG_INFO("EXEC command " + tag + " host=" + host + " attempt=" + std::to_string(sequence));

    ExecResult exec;
    try {
        exec = executor_.execute(command, host, begun.file.fd());
    } catch (const std::exception& e) {
        exec.ok = false;
        exec.error = std::string("executor error: ") + e.what();
    }

    record.ok = exec.ok;
    record.error = exec.error;
    result.attempts.push_back(record);

    if (!exec.ok) {
        LOG_WARN("ERROR " + tag + " host=" + host + " status=" + exec.error);
        return false;
    }

    // Atomic rename of the attempt to the final output
    PromoteResult promoted = recorder_.promote(id, std::move(begun.file));
    result.output = promoted.path;
    result.promoted = promoted.ok;
    if (!promoted) {
        LOG_ERROR("ERROR (" + tag + "): " + promoted.message + ", final output in " +
                  promoted.path.string());
    }

    LOG_INFO("SUCC " + tag + " host=" + host + " output=" + result.output.string());
    result.outcome = Outcome::Succeeded;
    return true;
}

}
