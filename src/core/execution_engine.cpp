/**
 * @file execution_engine.cpp
 * @brief Pipeline orchestration, teardown scope and configuration loading
 *
 * **Execution Workflow**:
 * 1. Validate the request
 * 2. Stage code, requirements and uploads into a private bundle
 * 3. Ensure the sandbox image exists (first use only)
 * 4. Create the container and place out-of-workspace uploads
 * 5. Run with the request's (or default) timeout
 * 6. Collect declared outputs, also after a timeout
 * 7. Tear down the container and the bundle
 * 8. Translate the outcome into an ExecutionResult
 *
 * @date 2025
 */

#include "codecell/core/execution_engine.hpp"
#include "codecell/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace codecell {
namespace core {

namespace {

// ============================================================================
// CONFIG HELPERS
// ============================================================================

std::string ReadString(const json& j, const char* key) {
    if (!j[key].is_string()) {
        throw std::invalid_argument(std::string("Config key '") + key + "' must be a string");
    }
    return j[key].get<std::string>();
}

long long ReadPositive(const json& j, const char* key) {
    if (!j[key].is_number_integer() || j[key].get<long long>() <= 0) {
        throw std::invalid_argument(std::string("Config key '") + key +
                                    "' must be a positive integer");
    }
    return j[key].get<long long>();
}

std::chrono::seconds ReadTimeout(const json& j, const char* key) {
    std::chrono::seconds timeout(ReadPositive(j, key));
    if (timeout > kMaxTimeout) {
        throw std::invalid_argument(std::string("Config key '") + key + "' must not exceed " +
                                    std::to_string(kMaxTimeout.count()));
    }
    return timeout;
}

bool ReadBool(const json& j, const char* key) {
    if (!j[key].is_boolean()) {
        throw std::invalid_argument(std::string("Config key '") + key + "' must be a boolean");
    }
    return j[key].get<bool>();
}

EngineConfig Normalize(EngineConfig config) {
    if (config.default_timeout.count() <= 0 || config.default_timeout > kMaxTimeout) {
        throw std::invalid_argument("Default timeout must be between 1 and " +
                                    std::to_string(kMaxTimeout.count()) + " seconds");
    }
    if (config.docker.command_timeout.count() <= 0 || config.docker.command_timeout > kMaxTimeout ||
        config.docker.build_timeout.count() <= 0 || config.docker.build_timeout > kMaxTimeout) {
        throw std::invalid_argument("Runtime command timeouts must be between 1 and " +
                                    std::to_string(kMaxTimeout.count()) + " seconds");
    }

    if (!config.runtime) {
        auto docker = std::make_shared<utils::DockerRuntime>(config.docker);
        config.runtime = docker;
        if (!config.image_store) {
            config.image_store = docker;
        }
    }

    if (!config.image_store) {
        auto docker = std::dynamic_pointer_cast<utils::DockerRuntime>(config.runtime);
        if (docker) {
            config.image_store = docker;
        } else {
            config.image_store = std::make_shared<utils::DockerRuntime>(config.docker);
        }
    }

    config.image.work_path = config.work_path;
    return config;
}

std::string FormatSeconds(std::chrono::seconds timeout) {
    return std::to_string(timeout.count()) + "s";
}

} // anonymous namespace

void ApplyConfigJson(const json& j, EngineConfig& config) {
    if (!j.is_object()) {
        throw std::invalid_argument("Configuration must be a JSON object");
    }

    for (const auto& [key, value] : j.items()) {
        if (key == "image") {
            config.image.image = ReadString(j, "image");
        } else if (key == "base_image") {
            config.image.base_image = ReadString(j, "base_image");
        } else if (key == "system_packages") {
            if (!value.is_array()) {
                throw std::invalid_argument("Config key 'system_packages' must be an array");
            }
            config.image.system_packages.clear();
            for (const auto& package : value) {
                if (!package.is_string()) {
                    throw std::invalid_argument("Config key 'system_packages' must hold strings");
                }
                config.image.system_packages.push_back(package.get<std::string>());
            }
        } else if (key == "interpreter") {
            config.interpreter = ReadString(j, "interpreter");
        } else if (key == "uploads_directory") {
            config.uploads_directory = ReadString(j, "uploads_directory");
        } else if (key == "downloads_directory") {
            if (value.is_null()) {
                config.downloads_directory.reset();
            } else {
                config.downloads_directory = std::filesystem::path(ReadString(j, "downloads_directory"));
            }
        } else if (key == "staging_directory") {
            config.staging_directory = ReadString(j, "staging_directory");
        } else if (key == "timeout_seconds") {
            config.default_timeout = ReadTimeout(j, "timeout_seconds");
        } else if (key == "command_timeout_seconds") {
            config.docker.command_timeout = ReadTimeout(j, "command_timeout_seconds");
        } else if (key == "docker_binary") {
            config.docker.binary = ReadString(j, "docker_binary");
        } else if (key == "memory_limit_mb") {
            config.limits.memory_limit_mb = static_cast<std::size_t>(ReadPositive(j, "memory_limit_mb"));
        } else if (key == "cpu_period") {
            config.limits.cpu_period = static_cast<long>(ReadPositive(j, "cpu_period"));
        } else if (key == "cpu_quota") {
            config.limits.cpu_quota = static_cast<long>(ReadPositive(j, "cpu_quota"));
        } else if (key == "pids_limit") {
            config.limits.pids_limit = static_cast<int>(ReadPositive(j, "pids_limit"));
        } else if (key == "network_enabled") {
            config.limits.network_enabled = ReadBool(j, "network_enabled");
        } else if (key == "user") {
            config.limits.user = ReadString(j, "user");
        } else if (key == "resolver") {
            if (!value.is_object()) {
                throw std::invalid_argument("Config key 'resolver' must be an object");
            }
            if (value.contains("exact")) config.resolver.exact = ReadBool(value, "exact");
            if (value.contains("absolute")) config.resolver.absolute = ReadBool(value, "absolute");
            if (value.contains("substring")) config.resolver.substring = ReadBool(value, "substring");
            if (value.contains("keyword")) config.resolver.keyword = ReadBool(value, "keyword");
        } else {
            spdlog::warn("Ignoring unknown config key '{}'", key);
        }
    }
}

EngineConfig LoadEngineConfig(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path.string());
    }

    json j;
    try {
        file >> j;
    }
    catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path.string() + ": " + e.what());
    }

    EngineConfig config;
    ApplyConfigJson(j, config);
    spdlog::debug("Loaded configuration from {}", path.string());
    return config;
}

// ============================================================================
// CONFIG BUILDER
// ============================================================================

EngineConfigBuilder& EngineConfigBuilder::WithRuntime(std::shared_ptr<utils::ContainerRuntime> runtime) {
    config_.runtime = std::move(runtime);
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::WithImageStore(std::shared_ptr<utils::ImageStore> images) {
    config_.image_store = std::move(images);
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::WithImage(const std::string& image) {
    config_.image.image = image;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::WithMemoryLimit(std::size_t mb) {
    config_.limits.memory_limit_mb = mb;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::WithCPUQuota(long period, long quota) {
    config_.limits.cpu_period = period;
    config_.limits.cpu_quota = quota;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::WithPidsLimit(int pids) {
    config_.limits.pids_limit = pids;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::WithNetwork(bool enabled) {
    config_.limits.network_enabled = enabled;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::WithTimeout(std::chrono::seconds timeout) {
    config_.default_timeout = timeout;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::WithUploadsDirectory(const std::filesystem::path& dir) {
    config_.uploads_directory = dir;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::WithDownloadsDirectory(const std::filesystem::path& dir) {
    config_.downloads_directory = dir;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::WithStagingDirectory(const std::filesystem::path& dir) {
    config_.staging_directory = dir;
    return *this;
}

EngineConfigBuilder& EngineConfigBuilder::WithResolver(const ResolverOptions& options) {
    config_.resolver = options;
    return *this;
}

EngineConfig EngineConfigBuilder::Build() const {
    return config_;
}

// ============================================================================
// EXECUTION SCOPE
// ============================================================================

ExecutionScope::ExecutionScope(utils::ContainerRuntime& runtime,
                               EnvironmentProvisioner* provisioner,
                               std::string sandbox_user)
    : runtime_(runtime)
    , provisioner_(provisioner)
    , sandbox_user_(std::move(sandbox_user)) {
}

ExecutionScope::~ExecutionScope() {
    Close();
}

void ExecutionScope::AdoptBundle(StagedBundle bundle) {
    bundle_ = std::move(bundle);
}

void ExecutionScope::AdoptContainer(const std::string& container_id) {
    container_id_ = container_id;
}

bool ExecutionScope::Close() {
    bool clean = true;

    if (container_id_) {
        try {
            if (runtime_.RemoveContainer(*container_id_, true)) {
                spdlog::debug("Removed container {}", container_id_->substr(0, 12));
            } else {
                spdlog::error("Failed to remove container {}", container_id_->substr(0, 12));
                clean = false;
            }
        }
        catch (const std::exception& e) {
            spdlog::error("Error removing container {}: {}", container_id_->substr(0, 12), e.what());
            clean = false;
        }
        container_id_.reset();
    }

    if (!bundle_.Release()) {
        if (provisioner_ && provisioner_->ReclaimWorkspace(bundle_, sandbox_user_) &&
            bundle_.Release()) {
            spdlog::info("Removed staging directory after reclaiming sandbox files");
        } else {
            clean = false;
        }
    }

    return clean;
}

// ============================================================================
// ENGINE
// ============================================================================

ExecutionEngine::ExecutionEngine(EngineConfig config)
    : config_(Normalize(std::move(config)))
    , runtime_(config_.runtime)
    , images_(config_.image_store)
    , stager_(StagerOptions{config_.staging_directory, config_.work_path, config_.interpreter},
              FileResolver::WithDefaultChain(config_.uploads_directory, config_.resolver))
    , provisioner_(*runtime_, *images_, config_.image)
    , controller_(*runtime_)
    , collector_(*runtime_, config_.staging_directory, config_.downloads_directory) {

    spdlog::debug("Execution engine ready (image {}, timeout {}s, memory {} MB, network {})",
                  config_.image.image, config_.default_timeout.count(),
                  config_.limits.memory_limit_mb,
                  config_.limits.network_enabled ? "bridge" : "none");
}

ExecutionResult ExecutionEngine::Execute(const ExecutionRequest& request) {
    auto start_time = std::chrono::steady_clock::now();
    ExecutionResult result;

    try {
        ExecutionScope scope(*runtime_, &provisioner_, config_.limits.user);
        RunPipeline(request, scope, result);
        scope.Close();
    }
    catch (const RequestError& e) {
        spdlog::error("Invalid request: {}", e.what());
        result.error = std::string("Invalid request: ") + e.what();
    }
    catch (const StagingError& e) {
        spdlog::error("Staging failed: {}", e.what());
        result.error = std::string("Staging failed: ") + e.what();
    }
    catch (const ProvisioningError& e) {
        spdlog::error("Provisioning failed: {}", e.what());
        result.error = std::string("Provisioning failed: ") + e.what();
    }
    catch (const std::exception& e) {
        spdlog::error("Execution failed: {}", e.what());
        result.error = std::string("Execution failed: ") + e.what();
    }
    catch (...) {
        spdlog::error("Execution failed with an unknown error");
        result.error = "Execution failed: unknown error";
    }

    if (result.error) {
        result.success = false;
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    return result;
}

void ExecutionEngine::RunPipeline(const ExecutionRequest& request,
                                  ExecutionScope& scope,
                                  ExecutionResult& result) {
    ValidateRequest(request);

    auto timeout = request.timeout.value_or(config_.default_timeout);

    if (!request.requirements.empty() && !config_.limits.network_enabled) {
        spdlog::warn("Requirements requested but network is disabled; installation will likely fail");
    }

    scope.AdoptBundle(stager_.Stage(request));

    provisioner_.EnsureImage();

    auto environment = provisioner_.Provision(scope.Bundle(), config_.limits,
                                              request.environment_variables,
                                              stager_.EntryCommand(request));
    scope.AdoptContainer(environment.container_id);

    provisioner_.PlaceUploads(environment, scope.Bundle());

    auto outcome = controller_.Run(environment, timeout);

    result.stdout_output = std::move(outcome.stdout_output);
    result.stderr_output = std::move(outcome.stderr_output);
    result.downloaded_files = collector_.Collect(environment, request.download_paths);

    if (outcome.timed_out) {
        result.timed_out = true;
        result.error = "Execution timed out after " + FormatSeconds(timeout);
        return;
    }

    result.exit_code = outcome.exit_code;
    int code = outcome.exit_code.value_or(-1);

    if (code == 0) {
        result.success = true;
    } else if (code == kRequirementsFailedExitCode && !request.requirements.empty()) {
        result.error = "Requirements installation failed (exit code: " + std::to_string(code) + ")";
    } else {
        result.error = "Exit code: " + std::to_string(code);
    }
}

json ExecutionEngine::ExecuteJson(const json& request) {
    ExecutionRequest parsed;

    try {
        parsed = ParseRequest(request);
    }
    catch (const RequestError& e) {
        spdlog::error("Invalid request: {}", e.what());
        ExecutionResult result;
        result.error = std::string("Invalid request: ") + e.what();
        return ToJson(result);
    }

    return ToJson(Execute(parsed));
}

std::size_t ExecutionEngine::CleanupOrphans() {
    auto containers = runtime_->ListContainers({{kManagedLabelKey, kManagedLabelValue}});
    std::size_t removed = 0;

    for (const auto& container : containers) {
        if (runtime_->RemoveContainer(container.id, true)) {
            spdlog::info("Removed leftover container {} ({})", container.name, container.id.substr(0, 12));
            ++removed;
        } else {
            spdlog::warn("Could not remove leftover container {}", container.name);
        }
    }

    spdlog::info("Cleanup removed {} of {} managed container(s)", removed, containers.size());
    return removed;
}

} // namespace core
} // namespace codecell
