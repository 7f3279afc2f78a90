/**
 * @file execution_types.hpp
 * @brief Request, result and resource types of the execution engine
 *
 * Plain value types exchanged across the engine's public boundary, together
 * with their JSON mapping:
 *
 * **Request**:
 * ```
 * {"code": "...", "env_vars": {}, "upload_files": [{"container_path": "...",
 *  "content": "..." | "path": "..."}], "download_paths": [], "requirements": [],
 *  "timeout": 30}
 * ```
 *
 * **Response**:
 * ```
 * {"success": true, "stdout": "...", "stderr": "...", "error": null,
 *  "exit_code": 0, "timed_out": false, "duration_ms": 812,
 *  "downloaded_files": {"out.csv": "data:application/octet-stream;base64,..."}}
 * ```
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace codecell {
namespace core {

/// Longest timeout accepted for a run or a runtime command
constexpr std::chrono::seconds kMaxTimeout{24 * 60 * 60};

/**
 * @struct UploadSpec
 * @brief One input file to place in the sandbox
 *
 * Exactly one of content / source_reference is set.
 */
struct UploadSpec {
    std::string destination_path;                 ///< Path inside the sandbox
    std::optional<std::string> content;           ///< Inline text or data URI
    std::optional<std::string> source_reference;  ///< Hint resolved in the uploads area
};

/**
 * @struct ExecutionRequest
 * @brief A single unit of untrusted code to run
 */
struct ExecutionRequest {
    std::string code;                                         ///< Source text (required)
    std::map<std::string, std::string> environment_variables; ///< Injected environment
    std::vector<UploadSpec> upload_specs;                     ///< Inputs, in order
    std::vector<std::string> download_paths;                  ///< Outputs to retrieve
    std::vector<std::string> requirements;                    ///< Packages to install first
    std::optional<std::chrono::seconds> timeout;              ///< Overrides engine default
};

/**
 * @struct ResourceLimits
 * @brief Resource ceiling and identity of an execution context
 */
struct ResourceLimits {
    std::size_t memory_limit_mb{512};  ///< Memory ceiling; swap is pinned to it
    long cpu_period{100000};           ///< CFS period (microseconds)
    long cpu_quota{50000};             ///< CFS quota (50% of one core)
    int pids_limit{64};                ///< Maximum process count
    bool network_enabled{false};       ///< Bridge network instead of none
    std::string user{"nobody"};        ///< Unprivileged identity
};

/**
 * @struct ExecutionResult
 * @brief Sole output of the pipeline
 *
 * `exit_code` is empty when the process was killed on timeout or never ran.
 * `error` is empty exactly when `success` is true.
 */
struct ExecutionResult {
    bool success{false};
    std::optional<int> exit_code;
    bool timed_out{false};
    std::string stdout_output;
    std::string stderr_output;
    std::map<std::string, std::string> downloaded_files;  ///< path -> data URI or error note
    std::optional<std::string> error;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Reject requests that violate the request invariants
 * @throws RequestError if code is empty, an upload spec is ambiguous,
 *         or the timeout is outside (0, kMaxTimeout]
 */
void ValidateRequest(const ExecutionRequest& request);

/**
 * @brief Map a sandbox path onto the container namespace
 *
 * Relative paths resolve against the work path; the result is lexically
 * normalized, so `..` components cannot climb above the container root.
 *
 * @param path Path as written in the request
 * @param work_path Container working directory
 * @return Absolute, normalized container path
 */
std::filesystem::path ResolveContainerPath(const std::string& path,
                                           const std::filesystem::path& work_path);

/**
 * @brief Build a request from its JSON form
 * @throws RequestError on missing or mistyped fields
 */
ExecutionRequest ParseRequest(const nlohmann::json& j);

/// Serialize a result to its JSON form
nlohmann::json ToJson(const ExecutionResult& result);

} // namespace core
} // namespace codecell
