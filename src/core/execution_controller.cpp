/**
 * @file execution_controller.cpp
 * @brief Implementation of the run/timeout/kill cycle
 *
 * @date 2025
 */

#include "codecell/core/execution_controller.hpp"
#include "codecell/core/errors.hpp"

#include <spdlog/spdlog.h>

namespace codecell {
namespace core {

ExecutionController::ExecutionController(utils::ContainerRuntime& runtime)
    : runtime_(runtime) {
}

RunOutcome ExecutionController::Run(ExecutionEnvironment& environment,
                                    std::chrono::seconds timeout) {
    if (environment.started) {
        throw EngineError("Environment " + environment.container_name + " was already started");
    }

    RunOutcome outcome;
    auto start_time = std::chrono::steady_clock::now();

    environment.started = true;
    if (!runtime_.StartContainer(environment.container_id)) {
        throw ProvisioningError("Failed to start container " + environment.container_name);
    }

    spdlog::info("Running {} (timeout {}s)", environment.container_name, timeout.count());

    auto wait = runtime_.WaitForContainer(environment.container_id, timeout);

    if (wait.completed) {
        outcome.exit_code = wait.exit_code;
        spdlog::info("Container {} exited with code {}", environment.container_name, wait.exit_code);
    } else if (wait.timed_out) {
        outcome.timed_out = true;
        spdlog::warn("Container {} exceeded {}s, killing", environment.container_name, timeout.count());

        if (!runtime_.KillContainer(environment.container_id)) {
            spdlog::error("Failed to kill container {}", environment.container_name);
        }
    } else {
        throw EngineError("Failed waiting for container " + environment.container_name +
                          ": " + wait.error);
    }

    auto logs = runtime_.GetContainerLogs(environment.container_id);
    if (logs) {
        outcome.stdout_output = std::move(logs->stdout_output);
        outcome.stderr_output = std::move(logs->stderr_output);
    } else {
        spdlog::warn("No logs available for container {}", environment.container_name);
    }

    outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    return outcome;
}

} // namespace core
} // namespace codecell
