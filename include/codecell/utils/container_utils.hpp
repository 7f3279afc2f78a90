/**
 * @file container_utils.hpp
 * @brief Container runtime interfaces and the Docker CLI implementation
 *
 * Defines the two collaborators the execution pipeline depends on, an image
 * store and a container runtime, as abstract interfaces, and provides a
 * Docker-backed implementation that drives the `docker` CLI. Podman accepts
 * the same command line and can be used by pointing the binary at it.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace codecell {
namespace utils {

/**
 * @enum ContainerState
 * @brief Container lifecycle states
 */
enum class ContainerState {
    CREATED,   ///< Container created but not started
    RUNNING,   ///< Container is running
    PAUSED,    ///< Container paused
    EXITED,    ///< Container exited
    DEAD,      ///< Container is dead
    UNKNOWN    ///< Unknown state
};

/**
 * @enum NetworkMode
 * @brief Container network isolation modes
 */
enum class NetworkMode {
    NONE,      ///< No network access (default)
    BRIDGE     ///< Default bridge network, explicitly requested
};

/**
 * @struct ContainerConfig
 * @brief Complete container configuration
 */
struct ContainerConfig {
    // Basic Settings
    std::string name;                    ///< Container name
    std::string image;                   ///< Image reference
    std::vector<std::string> command;    ///< Entry command (argv)

    // Resource Limits
    std::size_t memory_limit_mb{512};       ///< Memory ceiling
    std::size_t memory_swap_limit_mb{512};  ///< Memory + swap ceiling
    long cpu_period{100000};                ///< CFS period (microseconds)
    long cpu_quota{50000};                  ///< CFS quota (50% of one core)
    int pids_limit{64};                     ///< Process limit

    // Network Settings
    NetworkMode network_mode{NetworkMode::NONE};

    // Security Settings
    std::vector<std::string> capabilities_drop{"ALL"};  ///< Dropped capabilities
    bool no_new_privileges{true};                       ///< Block setuid escalation
    std::string user{"nobody"};                         ///< Run as user

    // Filesystem Settings
    std::map<std::filesystem::path, std::filesystem::path> mounts;  ///< host -> container (rw)
    std::filesystem::path working_dir{"/code"};                     ///< Working directory

    // Environment
    std::map<std::string, std::string> environment_vars;  ///< Injected environment
    std::map<std::string, std::string> labels;            ///< Metadata labels
};

/**
 * @struct ContainerInfo
 * @brief Container listing entry
 */
struct ContainerInfo {
    std::string id;                              ///< Container ID
    std::string name;                            ///< Container name
    std::string image;                           ///< Image name
    ContainerState state{ContainerState::UNKNOWN};  ///< Current state
};

/**
 * @struct ContainerExecResult
 * @brief Result of a runtime CLI operation
 */
struct ContainerExecResult {
    int exit_code{0};              ///< Exit code
    std::string stdout_output;     ///< Standard output
    std::string stderr_output;     ///< Standard error
    std::chrono::milliseconds duration{0};  ///< Execution duration
    bool success{false};           ///< Success flag
    bool timed_out{false};         ///< CLI call exceeded its bound
};

/**
 * @struct ContainerWaitResult
 * @brief Outcome of waiting for a container to exit
 */
struct ContainerWaitResult {
    bool completed{false};   ///< Container exited before the timeout
    bool timed_out{false};   ///< Timeout elapsed, container may still run
    int exit_code{-1};       ///< Exit status when completed
    std::string error;       ///< Failure description when neither
};

/**
 * @struct ContainerLogs
 * @brief Container output split by channel
 */
struct ContainerLogs {
    std::string stdout_output;
    std::string stderr_output;
};

/**
 * @class ImageStore
 * @brief Image existence checks and builds
 */
class ImageStore {
public:
    virtual ~ImageStore() = default;

    /**
     * @brief Check whether an image reference is present locally
     * @param image Image reference (name:tag)
     */
    virtual bool ImageExists(const std::string& image) = 0;

    /**
     * @brief Build an image from a build context directory
     * @param tag Tag to apply
     * @param context_dir Directory containing a Dockerfile
     * @return true if the build succeeded
     */
    virtual bool BuildImage(const std::string& tag, const std::filesystem::path& context_dir) = 0;
};

/**
 * @class ContainerRuntime
 * @brief Container lifecycle and file transfer operations
 *
 * Implementations must tolerate operations on containers that already exited
 * or were already removed: KillContainer and RemoveContainer report success
 * when the desired end state already holds.
 */
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    /**
     * @brief Create (but do not start) a container
     * @param config Container configuration
     * @return Container ID, empty on failure
     */
    virtual std::string CreateContainer(const ContainerConfig& config) = 0;

    virtual bool StartContainer(const std::string& container_id) = 0;

    /**
     * @brief Block until the container exits or the timeout elapses
     */
    virtual ContainerWaitResult WaitForContainer(const std::string& container_id,
                                                 std::chrono::milliseconds timeout) = 0;

    /// Force-terminate; true if the container is not running afterwards
    virtual bool KillContainer(const std::string& container_id) = 0;

    /// Remove; true if the container no longer exists afterwards
    virtual bool RemoveContainer(const std::string& container_id, bool force) = 0;

    /**
     * @brief Copy a host file or directory tree into the container
     */
    virtual ContainerExecResult CopyToContainer(const std::string& container_id,
                                                const std::filesystem::path& source,
                                                const std::filesystem::path& dest) = 0;

    /**
     * @brief Copy a file or directory tree out of the container
     */
    virtual ContainerExecResult CopyFromContainer(const std::string& container_id,
                                                  const std::filesystem::path& source,
                                                  const std::filesystem::path& dest) = 0;

    /**
     * @brief Read everything the container wrote to stdout and stderr
     * @return Logs, or nullopt if they could not be retrieved
     */
    virtual std::optional<ContainerLogs> GetContainerLogs(const std::string& container_id) = 0;

    /**
     * @brief List containers (running and stopped) carrying all given labels
     */
    virtual std::vector<ContainerInfo> ListContainers(
        const std::map<std::string, std::string>& labels) = 0;
};

/**
 * @struct DockerRuntimeOptions
 * @brief Docker CLI invocation settings
 */
struct DockerRuntimeOptions {
    std::string binary{"docker"};                     ///< CLI binary (docker, podman)
    std::chrono::seconds command_timeout{60};         ///< Bound for every short CLI call
    std::chrono::seconds build_timeout{1800};         ///< Bound for image builds
};

/**
 * @class DockerRuntime
 * @brief Docker CLI backed ImageStore and ContainerRuntime
 *
 * Every operation is a single `docker` invocation through RunProcess, so
 * arguments (environment values in particular) never pass through a shell.
 * The object holds no per-container state and may be shared between threads.
 *
 * **Usage Example**:
 * @code
 * DockerRuntime docker;
 *
 * ContainerConfig config = ContainerBuilder()
 *     .WithImage("codecell-sandbox:latest")
 *     .WithCommand({"python", "/code/main.py"})
 *     .WithMount("/tmp/codecell-run-abc/workspace", "/code")
 *     .Build();
 *
 * std::string id = docker.CreateContainer(config);
 * docker.StartContainer(id);
 * auto wait = docker.WaitForContainer(id, std::chrono::seconds(30));
 * auto logs = docker.GetContainerLogs(id);
 * docker.RemoveContainer(id, true);
 * @endcode
 */
class DockerRuntime : public ContainerRuntime, public ImageStore {
public:
    explicit DockerRuntime(DockerRuntimeOptions options = DockerRuntimeOptions{});

    /**
     * @brief Check if the runtime CLI is installed and the daemon answers
     * @param binary CLI binary to probe
     * @return true if available
     */
    static bool IsRuntimeAvailable(const std::string& binary = "docker");

    /**
     * @brief Get runtime version string
     * @param binary CLI binary to query
     * @return Version string ("unknown" if unavailable)
     */
    static std::string GetRuntimeVersion(const std::string& binary = "docker");

    /**
     * @brief Translate a configuration into `docker create` arguments
     *
     * Exposed for inspection; the returned vector excludes the binary itself.
     */
    static std::vector<std::string> BuildCreateArgs(const ContainerConfig& config);

    // ImageStore
    bool ImageExists(const std::string& image) override;
    bool BuildImage(const std::string& tag, const std::filesystem::path& context_dir) override;

    // ContainerRuntime
    std::string CreateContainer(const ContainerConfig& config) override;
    bool StartContainer(const std::string& container_id) override;
    ContainerWaitResult WaitForContainer(const std::string& container_id,
                                         std::chrono::milliseconds timeout) override;
    bool KillContainer(const std::string& container_id) override;
    bool RemoveContainer(const std::string& container_id, bool force) override;
    ContainerExecResult CopyToContainer(const std::string& container_id,
                                        const std::filesystem::path& source,
                                        const std::filesystem::path& dest) override;
    ContainerExecResult CopyFromContainer(const std::string& container_id,
                                          const std::filesystem::path& source,
                                          const std::filesystem::path& dest) override;
    std::optional<ContainerLogs> GetContainerLogs(const std::string& container_id) override;
    std::vector<ContainerInfo> ListContainers(
        const std::map<std::string, std::string>& labels) override;

    const DockerRuntimeOptions& GetOptions() const { return options_; }

private:
    DockerRuntimeOptions options_;

    ContainerExecResult ExecuteDockerCommand(const std::vector<std::string>& args,
                                             std::chrono::milliseconds timeout) const;
    ContainerExecResult ExecuteDockerCommand(const std::vector<std::string>& args) const;
    bool ValidateConfig(const ContainerConfig& config) const;
    std::vector<std::string> CheckSecurityIssues(const ContainerConfig& config) const;
};

/**
 * @brief Map a `docker inspect` / `docker ps` state string to ContainerState
 */
ContainerState ParseContainerState(const std::string& state_str);

/**
 * @brief Generate a unique container name: <prefix>_<epoch>_<random>
 */
std::string GenerateContainerName(const std::string& prefix = "codecell");

/**
 * @class ContainerBuilder
 * @brief Fluent API for building container configurations
 */
class ContainerBuilder {
public:
    ContainerBuilder& WithName(const std::string& name);
    ContainerBuilder& WithImage(const std::string& image);
    ContainerBuilder& WithCommand(const std::vector<std::string>& command);
    ContainerBuilder& WithMemoryLimit(std::size_t mb);
    ContainerBuilder& WithMemorySwapLimit(std::size_t mb);
    ContainerBuilder& WithCPUQuota(long period, long quota);
    ContainerBuilder& WithPidsLimit(int pids);
    ContainerBuilder& WithNetwork(NetworkMode mode);
    ContainerBuilder& WithMount(const std::filesystem::path& host,
                               const std::filesystem::path& container);
    ContainerBuilder& WithWorkingDir(const std::filesystem::path& dir);
    ContainerBuilder& WithEnvironment(const std::string& key,
                                     const std::string& value);
    ContainerBuilder& WithLabel(const std::string& key, const std::string& value);
    ContainerBuilder& DropAllCapabilities();
    ContainerBuilder& WithUser(const std::string& user);

    ContainerConfig Build() const;

private:
    ContainerConfig config_;  ///< Configuration being built
};

} // namespace utils
} // namespace codecell
