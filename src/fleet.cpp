/*
 * hostfan - Fleet Command Dispatcher
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hostfan/fleet.hpp"
#include "hostfan/channel.hpp"
#include "hostfan/dispatcher.hpp"
#include "hostfan/pool.hpp"
#include "hostfan/logger.hpp"
#include <algorithm>
#include <limits>
#include <utility>

namespace hostfan {

namespace {
CompletionResult unscheduled(CommandId id, const std::string& reason) {
    CompletionResult result;
    result.commandId = id;
    result.outcome = Outcome::Aborted;
    result.error = reason;
    return result;
}
}

Fleet::Fleet(Dispatcher& dispatcher, int workers) noexcept
    : dispatcher_(dispatcher), workers_(workers) {}

int Fleet::poolWidth(std::size_t commandCount) const noexcept {
    std::size_t width = commandCount;
    if (workers_ > 0) {
        width = std::min(width, static_cast<std::size_t>(workers_));
    }
    return static_cast<int>(std::min<std::size_t>(width, std::numeric_limits<int>::max()));
}

RunSummary Fleet::run(const std::vector<std::string>& commands) {
    RunSummary summary;
    summary.total = commands.size();
    summary.results.resize(commands.size());
    for (CommandId id = 0; id < commands.size(); ++id) {
        summary.results[id].commandId = id;
    }

    if (commands.empty()) {
        LOG_INFO("FINISHED=0 FAILED=0 TOTAL=0");
        return summary;
    }

    Channel<CompletionResult> done;
    Pool pool(poolWidth(commands.size()));

    const bool started = pool.start([this, &commands, &done](CommandId id, int) {
        CompletionResult result = dispatcher_.dispatch(id, commands[id]);
        // The coordinator waits for one message per command, even a lost one
        if (!done.sendOr(std::move(result), [id] {
                return unscheduled(id, "result could not be delivered");
            })) {
            LOG_ERROR("Result of id=" + std::to_string(id) + " could not be delivered, reported as failed");
        }
    });

    if (started) {
        LOG_INFO("Dispatching " + std::to_string(commands.size()) + " commands across " +
                 std::to_string(dispatcher_.hostCount()) + " hosts with " +
                 std::to_string(pool.workerCount()) + " workers");
        for (CommandId id = 0; id < commands.size(); ++id) {
            if (!pool.submit(id)) {
                done.send(unscheduled(id, "worker pool rejected the command"));
            }
        }
    } else {
        LOG_ERROR("Worker pool failed to start, no command will run");
        summary.fatal = true;
        summary.fatalError = "worker pool failed to start";
        for (CommandId id = 0; id < commands.size(); ++id) {
            done.send(unscheduled(id, summary.fatalError));
        }
    }

    // Wait for all to report in
    std::size_t succeeded = 0;
    for (std::size_t received = 0; received < commands.size(); ++received) {
        CompletionResult result = done.receive();

        if (result.fatal && !summary.fatal) {
            summary.fatal = true;
            summary.fatalError = result.error;
            LOG_ERROR("Cannot record attempts any more, stopping new attempts: " + result.error);
            dispatcher_.abort();
        }

        if (result.commandId >= summary.results.size()) {
            LOG_ERROR("Dropping result for unknown command id=" + std::to_string(result.commandId));
            continue;
        }
        if (result.ok()) {
            ++succeeded;
        }
        summary.results[result.commandId] = std::move(result);
    }

    pool.stop();

    summary.succeeded = succeeded;
    summary.failed = summary.total - succeeded;

    LOG_INFO("FINISHED=" + std::to_string(summary.succeeded) +
             " FAILED=" + std::to_string(summary.failed) +
             " TOTAL=" + std::to_string(summary.total));
    return summary;
}

}
