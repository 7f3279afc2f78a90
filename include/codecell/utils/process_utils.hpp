/**
 * @file process_utils.hpp
 * @brief Host process execution with separate stream capture and timeouts
 *
 * Runs an external program (the container runtime CLI) without a shell,
 * capturing stdout and stderr into separate buffers and enforcing an optional
 * wall-clock deadline after which the whole process group is killed.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace codecell {
namespace utils {

/**
 * @struct ProcessResult
 * @brief Outcome of a host process invocation
 */
struct ProcessResult {
    bool launched{false};         ///< fork/exec succeeded
    bool timed_out{false};        ///< Killed after the deadline
    int exit_code{-1};            ///< Exit status (128 + signal when signaled)
    std::string stdout_output;    ///< Captured standard output
    std::string stderr_output;    ///< Captured standard error
    std::string error;            ///< Launch/wait failure description
    std::chrono::milliseconds duration{0};  ///< Wall-clock runtime

    /// Process ran to completion with exit status 0
    bool Succeeded() const { return launched && !timed_out && exit_code == 0; }
};

/**
 * @brief Execute a program and capture its output
 *
 * argv[0] is looked up on PATH. No shell is involved, so arguments are passed
 * through verbatim. The child runs in its own process group; on timeout the
 * group receives SIGKILL and the call returns once the child is reaped.
 *
 * @param argv Program and arguments
 * @param timeout Optional deadline
 * @return ProcessResult (never throws for child failures)
 *
 * **Example**:
 * @code
 * auto result = RunProcess({"docker", "wait", id}, std::chrono::seconds(30));
 * if (result.timed_out) {
 *     // container still running
 * }
 * @endcode
 */
ProcessResult RunProcess(const std::vector<std::string>& argv,
                         std::optional<std::chrono::milliseconds> timeout = std::nullopt);

/**
 * @brief Render argv as a single line for logging
 */
std::string FormatCommandLine(const std::vector<std::string>& argv);

} // namespace utils
} // namespace codecell
