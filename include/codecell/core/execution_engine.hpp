/**
 * @file execution_engine.hpp
 * @brief Public entry point: one request in, one well-formed result out
 *
 * Composes the pipeline
 *
 * ```
 * request → ArtifactStager → EnvironmentProvisioner → ExecutionController
 *         → ResultCollector → ExecutionResult
 * ```
 *
 * inside an ExecutionScope that removes the container and the staging
 * directory on every exit path. Execute() never throws: every failure becomes
 * `success == false` with an `error` naming the failing stage.
 *
 * @date 2025
 */

#pragma once

#include "codecell/core/artifact_stager.hpp"
#include "codecell/core/environment_provisioner.hpp"
#include "codecell/core/execution_controller.hpp"
#include "codecell/core/execution_types.hpp"
#include "codecell/core/file_resolver.hpp"
#include "codecell/core/result_collector.hpp"
#include "codecell/utils/container_utils.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace codecell {
namespace core {

/**
 * @struct EngineConfig
 * @brief Everything the engine needs, passed in at construction
 *
 * Leaving `runtime` / `image_store` empty makes the engine create a
 * DockerRuntime from `docker`.
 */
struct EngineConfig {
    // Collaborators
    std::shared_ptr<utils::ContainerRuntime> runtime;
    std::shared_ptr<utils::ImageStore> image_store;
    utils::DockerRuntimeOptions docker;

    // Sandbox
    ImageSettings image;
    ResourceLimits limits;
    std::string interpreter{"python"};
    std::filesystem::path work_path{"/code"};
    std::chrono::seconds default_timeout{30};

    // Host directories
    std::filesystem::path uploads_directory{"./uploads"};
    std::optional<std::filesystem::path> downloads_directory;
    std::filesystem::path staging_directory;   ///< Empty: system temp

    ResolverOptions resolver;
};

/**
 * @brief Overlay keys of a JSON object onto a configuration
 *
 * Recognized keys: `image`, `base_image`, `system_packages`, `interpreter`,
 * `uploads_directory`, `downloads_directory`, `staging_directory`,
 * `timeout_seconds`, `command_timeout_seconds`, `docker_binary`,
 * `memory_limit_mb`, `cpu_period`, `cpu_quota`, `pids_limit`,
 * `network_enabled`, `user`, `resolver` (object of `exact`, `absolute`,
 * `substring`, `keyword` booleans). Unknown keys are logged and ignored.
 *
 * @throws std::invalid_argument on mistyped or out of range values
 */
void ApplyConfigJson(const nlohmann::json& j, EngineConfig& config);

/**
 * @brief Read a JSON configuration file over the defaults
 * @throws std::runtime_error if the file cannot be read or parsed
 * @throws std::invalid_argument on invalid values
 */
EngineConfig LoadEngineConfig(const std::filesystem::path& path);

/**
 * @class EngineConfigBuilder
 * @brief Fluent API for building engine configurations
 */
class EngineConfigBuilder {
public:
    EngineConfigBuilder& WithRuntime(std::shared_ptr<utils::ContainerRuntime> runtime);
    EngineConfigBuilder& WithImageStore(std::shared_ptr<utils::ImageStore> images);
    EngineConfigBuilder& WithImage(const std::string& image);
    EngineConfigBuilder& WithMemoryLimit(std::size_t mb);
    EngineConfigBuilder& WithCPUQuota(long period, long quota);
    EngineConfigBuilder& WithPidsLimit(int pids);
    EngineConfigBuilder& WithNetwork(bool enabled);
    EngineConfigBuilder& WithTimeout(std::chrono::seconds timeout);
    EngineConfigBuilder& WithUploadsDirectory(const std::filesystem::path& dir);
    EngineConfigBuilder& WithDownloadsDirectory(const std::filesystem::path& dir);
    EngineConfigBuilder& WithStagingDirectory(const std::filesystem::path& dir);
    EngineConfigBuilder& WithResolver(const ResolverOptions& options);

    EngineConfig Build() const;

private:
    EngineConfig config_;
};

/**
 * @class ExecutionScope
 * @brief Owns one request's staging directory and container
 *
 * Close() (or the destructor) force-removes the container first, then the
 * staging directory. If the directory cannot be removed because the sandbox
 * left private files in it, the provisioner (when given) reclaims the
 * workspace and removal is retried once. Failures are logged, never thrown;
 * closing twice is a no-op.
 */
class ExecutionScope {
public:
    explicit ExecutionScope(utils::ContainerRuntime& runtime,
                            EnvironmentProvisioner* provisioner = nullptr,
                            std::string sandbox_user = "nobody");
    ~ExecutionScope();

    ExecutionScope(const ExecutionScope&) = delete;
    ExecutionScope& operator=(const ExecutionScope&) = delete;

    void AdoptBundle(StagedBundle bundle);
    void AdoptContainer(const std::string& container_id);

    const StagedBundle& Bundle() const { return bundle_; }

    /**
     * @brief Tear everything down now
     * @return true if both the container and the directory are gone
     */
    bool Close();

private:
    utils::ContainerRuntime& runtime_;
    EnvironmentProvisioner* provisioner_;
    std::string sandbox_user_;
    StagedBundle bundle_;
    std::optional<std::string> container_id_;
};

/**
 * @class ExecutionEngine
 * @brief Sandboxed code execution engine
 *
 * **Thread Safety**: Execute may be called concurrently. Each call owns its
 * bundle and container; the only shared state is the image-ready flag.
 *
 * **Usage Example**:
 * @code
 * ExecutionEngine engine(EngineConfigBuilder()
 *     .WithTimeout(std::chrono::seconds(10))
 *     .WithDownloadsDirectory("./downloads")
 *     .Build());
 *
 * ExecutionRequest request;
 * request.code = "print('ok')";
 *
 * auto result = engine.Execute(request);
 * if (result.success) {
 *     std::cout << result.stdout_output;
 * }
 * @endcode
 */
class ExecutionEngine {
public:
    explicit ExecutionEngine(EngineConfig config = EngineConfig{});

    ExecutionEngine(const ExecutionEngine&) = delete;
    ExecutionEngine& operator=(const ExecutionEngine&) = delete;

    /**
     * @brief Run one request through the whole pipeline
     * @return Result; never throws
     */
    ExecutionResult Execute(const ExecutionRequest& request);

    /**
     * @brief JSON request → JSON response
     *
     * A request that cannot be parsed yields a failed response as well.
     */
    nlohmann::json ExecuteJson(const nlohmann::json& request);

    /**
     * @brief Remove every container carrying the managed label
     * @return Number of containers removed
     */
    std::size_t CleanupOrphans();

    const EngineConfig& GetConfig() const { return config_; }

private:
    EngineConfig config_;
    std::shared_ptr<utils::ContainerRuntime> runtime_;
    std::shared_ptr<utils::ImageStore> images_;

    ArtifactStager stager_;
    EnvironmentProvisioner provisioner_;
    ExecutionController controller_;
    ResultCollector collector_;

    void RunPipeline(const ExecutionRequest& request, ExecutionScope& scope,
                     ExecutionResult& result);
};

} // namespace core
} // namespace codecell
