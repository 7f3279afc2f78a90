/**
 * @file environment_provisioner.hpp
 * @brief Runtime image preparation and container creation
 *
 * The provisioner owns the one piece of state shared between concurrent
 * requests: whether the sandbox image is known to exist. Everything it creates
 * per request (the container) is handed back to the caller for teardown.
 *
 * **Container Profile**:
 * - Workspace bound read-write at the work path (`/code`)
 * - Memory ceiling, memory+swap pinned to the same value
 * - CFS period/quota (default 50% of one core), pids limit
 * - All capabilities dropped, `no-new-privileges`
 * - Network `none` unless explicitly enabled
 * - Unprivileged user (`nobody`)
 * - `codecell.managed=true` label for orphan cleanup
 *
 * @date 2025
 */

#pragma once

#include "codecell/core/artifact_stager.hpp"
#include "codecell/core/execution_types.hpp"
#include "codecell/utils/container_utils.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace codecell {
namespace core {

/// Label carried by every container this engine creates
constexpr const char* kManagedLabelKey = "codecell.managed";
constexpr const char* kManagedLabelValue = "true";

/**
 * @struct ImageSettings
 * @brief Sandbox image identity and generated build context
 */
struct ImageSettings {
    std::string image{"codecell-sandbox:latest"};       ///< Tag the sandbox runs
    std::string base_image{"python:3.11-slim"};         ///< FROM line of the generated build
    std::vector<std::string> system_packages{"gcc", "python3-dev"};
    std::filesystem::path build_root;                   ///< Parent of build dirs (empty: system temp)
    std::filesystem::path work_path{"/code"};           ///< WORKDIR and workspace mount point
};

/**
 * @struct ImageRef
 * @brief Result of EnsureImage
 */
struct ImageRef {
    std::string tag;
    bool built{false};  ///< Built by this call rather than found
};

/**
 * @struct ExecutionEnvironment
 * @brief A created, not yet started, container bound to one bundle
 */
struct ExecutionEnvironment {
    std::string container_id;
    std::string container_name;
    std::filesystem::path host_directory;   ///< Bound workspace on the host
    std::filesystem::path work_path;        ///< Mount point inside the container
    ResourceLimits limits;
    bool started{false};
};

/**
 * @class EnvironmentProvisioner
 * @brief ImageStore + ContainerRuntime → ExecutionEnvironment
 *
 * **Thread Safety**: EnsureImage serializes on an internal mutex; Provision
 * and PlaceUploads hold no shared state.
 */
class EnvironmentProvisioner {
public:
    EnvironmentProvisioner(utils::ContainerRuntime& runtime,
                           utils::ImageStore& images,
                           ImageSettings settings = ImageSettings{});

    EnvironmentProvisioner(const EnvironmentProvisioner&) = delete;
    EnvironmentProvisioner& operator=(const EnvironmentProvisioner&) = delete;

    /**
     * @brief Make sure the sandbox image exists, building it once if absent
     *
     * The throwaway build directory is removed whether the build succeeds or
     * not. A failed build is not retried here.
     *
     * @throws ProvisioningError if the build fails
     */
    ImageRef EnsureImage();

    /**
     * @brief Create the container for a staged bundle
     *
     * @param bundle Staged workspace to bind
     * @param limits Resource ceiling and identity
     * @param env Environment variables, passed through verbatim
     * @param command Entry command
     * If the runtime returns no id (for example `docker create` timed out
     * after the daemon accepted it), the container is removed by name before
     * the error is raised.
     *
     * @throws ProvisioningError if the runtime rejects the container
     */
    ExecutionEnvironment Provision(const StagedBundle& bundle,
                                   const ResourceLimits& limits,
                                   const std::map<std::string, std::string>& env,
                                   const std::vector<std::string>& command);

    /**
     * @brief Copy uploads whose destination lies outside the work path
     *
     * Uploads under the work path are already visible through the bind mount.
     *
     * @throws ProvisioningError if a copy fails
     */
    void PlaceUploads(const ExecutionEnvironment& environment, const StagedBundle& bundle);

    /**
     * @brief Make sandbox-written files in a workspace removable by the host
     *
     * Runs a short-lived container as the sandbox user with the workspace
     * bound at the work path and `chmod -R a+rwX` over it. Used when the host
     * cannot delete a bundle because sandbox code created private
     * directories. Failures are logged.
     *
     * @param bundle Bundle whose workspace to open up
     * @param user Identity the sandbox ran as
     * @return true if the helper container ran to completion
     */
    bool ReclaimWorkspace(const StagedBundle& bundle, const std::string& user);

    /// Dockerfile text for the configured base image and packages
    static std::string GenerateDockerfile(const ImageSettings& settings);

    const ImageSettings& GetSettings() const { return settings_; }

private:
    utils::ContainerRuntime& runtime_;
    utils::ImageStore& images_;
    ImageSettings settings_;

    std::mutex image_mutex_;
    bool image_ready_{false};

    void BuildSandboxImage();
};

} // namespace core
} // namespace codecell
