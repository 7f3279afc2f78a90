/**
 * @file execution_controller.hpp
 * @brief Start, observe and, if needed, terminate a provisioned container
 *
 * @date 2025
 */

#pragma once

#include "codecell/core/environment_provisioner.hpp"
#include "codecell/utils/container_utils.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace codecell {
namespace core {

/**
 * @struct RunOutcome
 * @brief What happened to the entry command
 *
 * Exactly one of `exit_code` / `timed_out` describes the ending.
 */
struct RunOutcome {
    std::optional<int> exit_code;          ///< Empty when killed on timeout
    bool timed_out{false};
    std::string stdout_output;
    std::string stderr_output;
    std::chrono::milliseconds duration{0};
};

/**
 * @class ExecutionController
 * @brief Runs an ExecutionEnvironment exactly once under a wall-clock limit
 *
 * **Workflow**:
 * 1. Start the container (never restarted)
 * 2. Wait for exit, bounded by the timeout
 * 3. On timeout, force-kill; an already exited container is not an error
 * 4. Read stdout and stderr as separate streams from the runtime logs
 *
 * A non-zero exit is an ordinary outcome, not an exception.
 */
class ExecutionController {
public:
    explicit ExecutionController(utils::ContainerRuntime& runtime);

    /**
     * @brief Run the environment's entry command
     *
     * @param environment Created, not yet started, environment (marked started)
     * @param timeout Wall-clock limit
     * @throws EngineError if the environment was already started or waiting fails
     * @throws ProvisioningError if the container cannot be started
     */
    RunOutcome Run(ExecutionEnvironment& environment, std::chrono::seconds timeout);

private:
    utils::ContainerRuntime& runtime_;
};

} // namespace core
} // namespace codecell
