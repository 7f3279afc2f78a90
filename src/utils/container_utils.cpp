/**
 * @file container_utils.cpp
 * @brief Implementation of the Docker CLI container runtime
 *
 * **Security Hardening Layers** (applied at creation time):
 * 1. Network Isolation: --network none unless bridge is requested
 * 2. Capability Dropping: --cap-drop ALL
 * 3. No New Privileges: --security-opt no-new-privileges
 * 4. Resource Limits: memory, memory+swap, CFS period/quota, pids
 * 5. Unprivileged identity: --user nobody
 *
 * **Container Lifecycle**:
 * ```
 * Create → Start → Wait (bounded) → [Kill] → Logs / Copy out → Remove
 * ```
 *
 * Kill and remove treat "already in the desired state" responses from the
 * daemon as success so teardown can be repeated safely.
 *
 * @date 2025
 */

#include "codecell/utils/container_utils.hpp"
#include "codecell/utils/process_utils.hpp"
#include "codecell/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <random>
#include <regex>
#include <sstream>

using json = nlohmann::json;

namespace codecell {
namespace utils {

namespace {

bool MentionsMissingContainer(const std::string& message) {
    std::string lower = StringUtils::ToLower(message);
    return StringUtils::Contains(lower, "no such container");
}

bool MentionsNotRunning(const std::string& message) {
    std::string lower = StringUtils::ToLower(message);
    return StringUtils::Contains(lower, "is not running") ||
           StringUtils::Contains(lower, "no such container");
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR
// ============================================================================

DockerRuntime::DockerRuntime(DockerRuntimeOptions options)
    : options_(std::move(options)) {
    spdlog::debug("Docker runtime using binary '{}' (command timeout {}s)",
                  options_.binary, options_.command_timeout.count());
}

// ============================================================================
// RUNTIME DETECTION
// ============================================================================

bool DockerRuntime::IsRuntimeAvailable(const std::string& binary) {
    // `info` needs a reachable daemon, `--version` only the client
    auto result = RunProcess({binary, "info", "--format", "{{.ServerVersion}}"},
                             std::chrono::seconds(15));
    return result.Succeeded();
}

std::string DockerRuntime::GetRuntimeVersion(const std::string& binary) {
    auto result = RunProcess({binary, "--version"}, std::chrono::seconds(15));
    if (result.Succeeded()) {
        // Extract version number using regex (matches x.y.z format)
        std::regex version_regex(R"((\d+\.\d+\.\d+))");
        std::smatch match;
        std::string output_copy = result.stdout_output;
        if (std::regex_search(output_copy, match, version_regex)) {
            return match[1].str();
        }
        return StringUtils::Trim(result.stdout_output);
    }

    return "unknown";
}

// ============================================================================
// IMAGES
// ============================================================================

bool DockerRuntime::ImageExists(const std::string& image) {
    auto result = ExecuteDockerCommand({"image", "inspect", "--format", "{{.Id}}", image});
    return result.success;
}

bool DockerRuntime::BuildImage(const std::string& tag, const std::filesystem::path& context_dir) {
    spdlog::info("Building image {} from {}", tag, context_dir.string());

    auto result = ExecuteDockerCommand({"build", "-t", tag, context_dir.string()},
                                       options_.build_timeout);

    if (result.success) {
        spdlog::info("Image built: {}", tag);
        return true;
    }

    spdlog::error("Failed to build image {}: {}", tag, StringUtils::Trim(result.stderr_output));
    return false;
}

// ============================================================================
// CONTAINER CREATION
// ============================================================================

std::string DockerRuntime::CreateContainer(const ContainerConfig& config) {
    spdlog::info("Creating container: {}", config.name);

    if (!ValidateConfig(config)) {
        spdlog::error("Invalid container configuration");
        return "";
    }

    auto issues = CheckSecurityIssues(config);
    for (const auto& issue : issues) {
        spdlog::warn("  - {}", issue);
    }

    auto result = ExecuteDockerCommand(BuildCreateArgs(config));

    if (result.success) {
        std::string container_id = StringUtils::Trim(result.stdout_output);
        spdlog::info("Container created: {}", container_id.substr(0, 12));
        return container_id;
    }

    spdlog::error("Failed to create container: {}", StringUtils::Trim(result.stderr_output));
    return "";
}

// ============================================================================
// CONTAINER LIFECYCLE MANAGEMENT
// ============================================================================

bool DockerRuntime::StartContainer(const std::string& container_id) {
    spdlog::debug("Starting container: {}", container_id);

    auto result = ExecuteDockerCommand({"start", container_id});

    if (result.success) {
        return true;
    }

    spdlog::error("Failed to start container: {}", StringUtils::Trim(result.stderr_output));
    return false;
}

ContainerWaitResult DockerRuntime::WaitForContainer(const std::string& container_id,
                                                    std::chrono::milliseconds timeout) {
    spdlog::debug("Waiting for container to exit: {} ({} ms)", container_id, timeout.count());

    ContainerWaitResult wait;
    auto result = ExecuteDockerCommand({"wait", container_id}, timeout);

    if (result.success) {
        try {
            wait.exit_code = std::stoi(StringUtils::Trim(result.stdout_output));
            wait.completed = true;
        }
        catch (const std::exception&) {
            wait.error = "Unexpected wait output: " + StringUtils::Trim(result.stdout_output);
        }
        return wait;
    }

    // A killed `docker wait` client reports the timeout; the container keeps running
    if (result.timed_out) {
        wait.timed_out = true;
        return wait;
    }

    wait.error = StringUtils::Trim(result.stderr_output);
    if (wait.error.empty()) {
        wait.error = "docker wait exited with code " + std::to_string(result.exit_code);
    }
    return wait;
}

bool DockerRuntime::KillContainer(const std::string& container_id) {
    spdlog::info("Killing container: {}", container_id.substr(0, 12));

    auto result = ExecuteDockerCommand({"kill", container_id});

    if (result.success || MentionsNotRunning(result.stderr_output)) {
        return true;
    }

    spdlog::error("Failed to kill container: {}", StringUtils::Trim(result.stderr_output));
    return false;
}

bool DockerRuntime::RemoveContainer(const std::string& container_id, bool force) {
    spdlog::debug("Removing container: {} (force: {})", container_id, force);

    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(container_id);

    auto result = ExecuteDockerCommand(args);

    if (result.success || MentionsMissingContainer(result.stderr_output)) {
        return true;
    }

    spdlog::error("Failed to remove container: {}", StringUtils::Trim(result.stderr_output));
    return false;
}

std::vector<ContainerInfo> DockerRuntime::ListContainers(
    const std::map<std::string, std::string>& labels) {

    std::vector<std::string> args = {"ps", "--all", "--no-trunc", "--format", "{{json .}}"};
    for (const auto& [key, value] : labels) {
        args.push_back("--filter");
        args.push_back("label=" + key + "=" + value);
    }

    auto result = ExecuteDockerCommand(args);

    std::vector<ContainerInfo> containers;

    if (!result.success) {
        spdlog::error("Failed to list containers: {}", StringUtils::Trim(result.stderr_output));
        return containers;
    }

    std::istringstream stream(result.stdout_output);
    std::string line;

    // Parse JSON output line by line
    while (std::getline(stream, line)) {
        if (StringUtils::Trim(line).empty()) continue;

        try {
            json j = json::parse(line);

            ContainerInfo info;
            info.id = j.value("ID", "");
            info.name = j.value("Names", "");
            info.image = j.value("Image", "");
            info.state = ParseContainerState(j.value("State", ""));

            containers.push_back(info);
        }
        catch (const std::exception& e) {
            spdlog::warn("Failed to parse container info: {}", e.what());
        }
    }

    return containers;
}

// ============================================================================
// FILE OPERATIONS
// ============================================================================

ContainerExecResult DockerRuntime::CopyToContainer(const std::string& container_id,
                                                   const std::filesystem::path& source,
                                                   const std::filesystem::path& dest) {
    spdlog::debug("Copying {} to container {}:{}",
                  source.string(), container_id.substr(0, 12), dest.string());

    auto result = ExecuteDockerCommand({
        "cp",
        source.string(),
        container_id + ":" + dest.string()
    });

    if (!result.success) {
        spdlog::error("Failed to copy file: {}", StringUtils::Trim(result.stderr_output));
    }

    return result;
}

ContainerExecResult DockerRuntime::CopyFromContainer(const std::string& container_id,
                                                     const std::filesystem::path& source,
                                                     const std::filesystem::path& dest) {
    spdlog::debug("Copying {}:{} to {}",
                  container_id.substr(0, 12), source.string(), dest.string());

    auto result = ExecuteDockerCommand({
        "cp",
        container_id + ":" + source.string(),
        dest.string()
    });

    if (!result.success) {
        spdlog::warn("Failed to copy {} out of container: {}",
                     source.string(), StringUtils::Trim(result.stderr_output));
    }

    return result;
}

// ============================================================================
// LOG MANAGEMENT
// ============================================================================

std::optional<ContainerLogs> DockerRuntime::GetContainerLogs(const std::string& container_id) {
    // Without a TTY the daemon keeps the streams apart and the CLI replays
    // them on its own stdout and stderr
    auto result = ExecuteDockerCommand({"logs", container_id});

    if (!result.success) {
        spdlog::error("Failed to read container logs: {}", StringUtils::Trim(result.stderr_output));
        return std::nullopt;
    }

    ContainerLogs logs;
    logs.stdout_output = std::move(result.stdout_output);
    logs.stderr_output = std::move(result.stderr_output);
    return logs;
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

ContainerExecResult DockerRuntime::ExecuteDockerCommand(const std::vector<std::string>& args) const {
    return ExecuteDockerCommand(args, options_.command_timeout);
}

ContainerExecResult DockerRuntime::ExecuteDockerCommand(const std::vector<std::string>& args,
                                                        std::chrono::milliseconds timeout) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(options_.binary);
    argv.insert(argv.end(), args.begin(), args.end());

    auto process = RunProcess(argv, timeout);

    ContainerExecResult exec_result;
    exec_result.exit_code = process.exit_code;
    exec_result.stdout_output = std::move(process.stdout_output);
    exec_result.stderr_output = std::move(process.stderr_output);
    exec_result.duration = process.duration;
    exec_result.success = process.Succeeded();

    if (process.timed_out) {
        exec_result.timed_out = true;
        exec_result.stderr_output += "timed out after " + std::to_string(timeout.count()) + " ms";
    } else if (!process.error.empty()) {
        exec_result.stderr_output += process.error;
    }

    return exec_result;
}

std::vector<std::string> DockerRuntime::BuildCreateArgs(const ContainerConfig& config) {
    std::vector<std::string> args;

    args.push_back("create");

    if (!config.name.empty()) {
        args.push_back("--name");
        args.push_back(config.name);
    }

    // Memory ceiling; swap equal to memory disables swapping
    if (config.memory_limit_mb > 0) {
        args.push_back("--memory");
        args.push_back(std::to_string(config.memory_limit_mb) + "m");
        args.push_back("--memory-swap");
        args.push_back(std::to_string(config.memory_swap_limit_mb) + "m");
    }

    // CPU share as a CFS period/quota pair
    if (config.cpu_period > 0 && config.cpu_quota > 0) {
        args.push_back("--cpu-period");
        args.push_back(std::to_string(config.cpu_period));
        args.push_back("--cpu-quota");
        args.push_back(std::to_string(config.cpu_quota));
    }

    if (config.pids_limit > 0) {
        args.push_back("--pids-limit");
        args.push_back(std::to_string(config.pids_limit));
    }

    switch (config.network_mode) {
        case NetworkMode::NONE:
            args.push_back("--network");
            args.push_back("none");
            break;
        case NetworkMode::BRIDGE:
            args.push_back("--network");
            args.push_back("bridge");
            break;
    }

    for (const auto& cap : config.capabilities_drop) {
        args.push_back("--cap-drop");
        args.push_back(cap);
    }

    if (config.no_new_privileges) {
        args.push_back("--security-opt");
        args.push_back("no-new-privileges");
    }

    if (!config.user.empty()) {
        args.push_back("--user");
        args.push_back(config.user);
    }

    for (const auto& [host_path, container_path] : config.mounts) {
        args.push_back("-v");
        args.push_back(host_path.string() + ":" + container_path.string() + ":rw");
    }

    for (const auto& [key, value] : config.environment_vars) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }

    for (const auto& [key, value] : config.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }

    args.push_back("-w");
    args.push_back(config.working_dir.string());

    // Image, then the entry command
    args.push_back(config.image);
    args.insert(args.end(), config.command.begin(), config.command.end());

    return args;
}

bool DockerRuntime::ValidateConfig(const ContainerConfig& config) const {
    if (config.image.empty()) {
        spdlog::error("Container image not specified");
        return false;
    }

    if (config.command.empty()) {
        spdlog::error("Container command not specified");
        return false;
    }

    if (config.memory_swap_limit_mb < config.memory_limit_mb) {
        spdlog::error("Swap limit {} MB is below memory limit {} MB",
                      config.memory_swap_limit_mb, config.memory_limit_mb);
        return false;
    }

    if (config.memory_limit_mb > 0 && config.memory_limit_mb < 16) {
        spdlog::warn("Memory limit very low: {} MB", config.memory_limit_mb);
    }

    return true;
}

std::vector<std::string> DockerRuntime::CheckSecurityIssues(const ContainerConfig& config) const {
    std::vector<std::string> issues;

    if (config.network_mode != NetworkMode::NONE) {
        issues.push_back("WARNING: Network access enabled for untrusted code");
    }

    if (config.user == "root" || config.user == "0" || config.user.empty()) {
        issues.push_back("WARNING: Running as root user");
    }

    if (config.capabilities_drop.empty()) {
        issues.push_back("WARNING: Default capabilities retained");
    }

    return issues;
}

// ============================================================================
// FREE HELPERS
// ============================================================================

ContainerState ParseContainerState(const std::string& state_str) {
    if (state_str == "created") return ContainerState::CREATED;
    if (state_str == "running") return ContainerState::RUNNING;
    if (state_str == "paused") return ContainerState::PAUSED;
    if (state_str == "restarting") return ContainerState::RUNNING;
    if (state_str == "removing") return ContainerState::EXITED;
    if (state_str == "exited") return ContainerState::EXITED;
    if (state_str == "dead") return ContainerState::DEAD;
    return ContainerState::UNKNOWN;
}

std::string GenerateContainerName(const std::string& prefix) {
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(100000, 999999);

    auto now = std::chrono::system_clock::now();
    auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();

    return prefix + "_" + std::to_string(timestamp) + "_" + std::to_string(dis(gen));
}

// ============================================================================
// CONTAINER BUILDER IMPLEMENTATION (FLUENT API)
// ============================================================================

ContainerBuilder& ContainerBuilder::WithName(const std::string& name) {
    config_.name = name;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithImage(const std::string& image) {
    config_.image = image;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithCommand(const std::vector<std::string>& command) {
    config_.command = command;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithMemoryLimit(std::size_t mb) {
    config_.memory_limit_mb = mb;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithMemorySwapLimit(std::size_t mb) {
    config_.memory_swap_limit_mb = mb;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithCPUQuota(long period, long quota) {
    config_.cpu_period = period;
    config_.cpu_quota = quota;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithPidsLimit(int pids) {
    config_.pids_limit = pids;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithNetwork(NetworkMode mode) {
    config_.network_mode = mode;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithMount(const std::filesystem::path& host,
                                              const std::filesystem::path& container) {
    config_.mounts[host] = container;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithWorkingDir(const std::filesystem::path& dir) {
    config_.working_dir = dir;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithEnvironment(const std::string& key,
                                                    const std::string& value) {
    config_.environment_vars[key] = value;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithLabel(const std::string& key, const std::string& value) {
    config_.labels[key] = value;
    return *this;
}

ContainerBuilder& ContainerBuilder::DropAllCapabilities() {
    config_.capabilities_drop = {"ALL"};
    return *this;
}

ContainerBuilder& ContainerBuilder::WithUser(const std::string& user) {
    config_.user = user;
    return *this;
}

ContainerConfig ContainerBuilder::Build() const {
    return config_;
}

} // namespace utils
} // namespace codecell
