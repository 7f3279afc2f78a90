/**
 * @file environment_provisioner.cpp
 * @brief Implementation of image preparation and container creation
 *
 * @date 2025
 */

#include "codecell/core/environment_provisioner.hpp"
#include "codecell/core/errors.hpp"
#include "codecell/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#include <stdlib.h>

namespace codecell {
namespace core {

using utils::ContainerBuilder;
using utils::NetworkMode;
using utils::StringUtils;

namespace {

constexpr std::chrono::seconds kReclaimTimeout{60};

/// Removes a build directory on every exit path
class BuildDirectory {
public:
    explicit BuildDirectory(std::filesystem::path path) : path_(std::move(path)) {}

    ~BuildDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            spdlog::warn("Failed to remove build directory {}: {}", path_.string(), ec.message());
        }
    }

    BuildDirectory(const BuildDirectory&) = delete;
    BuildDirectory& operator=(const BuildDirectory&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

std::filesystem::path MakeBuildDirectory(const std::filesystem::path& build_root) {
    std::filesystem::path parent = build_root;
    std::error_code ec;

    if (parent.empty()) {
        parent = std::filesystem::temp_directory_path(ec);
        if (ec) {
            throw ProvisioningError("No temporary directory available: " + ec.message());
        }
    }

    std::string pattern = (parent / "codecell-build-XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (mkdtemp(buffer.data()) == nullptr) {
        throw ProvisioningError("Cannot create build directory under " + parent.string() + ": " +
                                std::strerror(errno));
    }

    return std::filesystem::path(buffer.data());
}

} // anonymous namespace

EnvironmentProvisioner::EnvironmentProvisioner(utils::ContainerRuntime& runtime,
                                               utils::ImageStore& images,
                                               ImageSettings settings)
    : runtime_(runtime)
    , images_(images)
    , settings_(std::move(settings)) {
}

// ============================================================================
// IMAGE
// ============================================================================

ImageRef EnvironmentProvisioner::EnsureImage() {
    std::lock_guard<std::mutex> lock(image_mutex_);

    if (image_ready_) {
        return ImageRef{settings_.image, false};
    }

    if (images_.ImageExists(settings_.image)) {
        spdlog::debug("Sandbox image {} already present", settings_.image);
        image_ready_ = true;
        return ImageRef{settings_.image, false};
    }

    BuildSandboxImage();
    image_ready_ = true;
    return ImageRef{settings_.image, true};
}

void EnvironmentProvisioner::BuildSandboxImage() {
    spdlog::info("Sandbox image {} not found, building from {}", settings_.image, settings_.base_image);

    BuildDirectory build_dir(MakeBuildDirectory(settings_.build_root));

    {
        std::ofstream dockerfile(build_dir.Path() / "Dockerfile", std::ios::trunc);
        if (!dockerfile.is_open()) {
            throw ProvisioningError("Cannot write Dockerfile in " + build_dir.Path().string());
        }
        dockerfile << GenerateDockerfile(settings_);
        if (!dockerfile) {
            throw ProvisioningError("Failed to write Dockerfile in " + build_dir.Path().string());
        }
    }

    if (!images_.BuildImage(settings_.image, build_dir.Path())) {
        throw ProvisioningError("Failed to build image " + settings_.image);
    }

    spdlog::info("Sandbox image {} built", settings_.image);
}

std::string EnvironmentProvisioner::GenerateDockerfile(const ImageSettings& settings) {
    std::ostringstream dockerfile;

    dockerfile << "FROM " << settings.base_image << "\n";

    if (!settings.system_packages.empty()) {
        dockerfile << "RUN apt-get update && apt-get install -y --no-install-recommends "
                   << StringUtils::Join(settings.system_packages, " ")
                   << " && rm -rf /var/lib/apt/lists/*\n";
    }

    dockerfile << "WORKDIR " << settings.work_path.string() << "\n";
    return dockerfile.str();
}

// ============================================================================
// CONTAINER
// ============================================================================

ExecutionEnvironment EnvironmentProvisioner::Provision(
    const StagedBundle& bundle,
    const ResourceLimits& limits,
    const std::map<std::string, std::string>& env,
    const std::vector<std::string>& command) {

    if (!bundle.Valid()) {
        throw ProvisioningError("Cannot provision without a staged bundle");
    }

    ExecutionEnvironment environment;
    environment.container_name = utils::GenerateContainerName("codecell");
    environment.host_directory = bundle.Workspace();
    environment.work_path = settings_.work_path;
    environment.limits = limits;

    ContainerBuilder builder;
    builder.WithName(environment.container_name)
           .WithImage(settings_.image)
           .WithCommand(command)
           .WithMemoryLimit(limits.memory_limit_mb)
           .WithMemorySwapLimit(limits.memory_limit_mb)
           .WithCPUQuota(limits.cpu_period, limits.cpu_quota)
           .WithPidsLimit(limits.pids_limit)
           .WithNetwork(limits.network_enabled ? NetworkMode::BRIDGE : NetworkMode::NONE)
           .WithMount(environment.host_directory, environment.work_path)
           .WithWorkingDir(environment.work_path)
           .WithLabel(kManagedLabelKey, kManagedLabelValue)
           .DropAllCapabilities()
           .WithUser(limits.user);

    for (const auto& [name, value] : env) {
        builder.WithEnvironment(name, value);
    }

    environment.container_id = runtime_.CreateContainer(builder.Build());
    if (environment.container_id.empty()) {
        if (!runtime_.RemoveContainer(environment.container_name, true)) {
            spdlog::debug("No container named {} to remove after failed create",
                          environment.container_name);
        }
        throw ProvisioningError("Container runtime refused to create " + environment.container_name);
    }

    spdlog::info("Provisioned container {} ({})", environment.container_name,
                 environment.container_id.substr(0, 12));
    return environment;
}

void EnvironmentProvisioner::PlaceUploads(const ExecutionEnvironment& environment,
                                          const StagedBundle& bundle) {
    for (const auto& upload : bundle.Uploads()) {
        if (ArtifactStager::IsWithinWorkPath(upload.container_path, environment.work_path)) {
            continue;
        }

        spdlog::debug("Copying {} to {}:{}", upload.host_path.string(),
                      environment.container_name, upload.container_path.string());

        auto result = runtime_.CopyToContainer(environment.container_id,
                                               upload.host_path, upload.container_path);
        if (!result.success) {
            throw ProvisioningError("Failed to place upload at " + upload.container_path.string() +
                                    ": " + StringUtils::Trim(result.stderr_output));
        }
    }
}

bool EnvironmentProvisioner::ReclaimWorkspace(const StagedBundle& bundle, const std::string& user) {
    if (!bundle.Valid()) {
        return true;
    }

    auto config = ContainerBuilder()
        .WithName(utils::GenerateContainerName("codecell_reclaim"))
        .WithImage(settings_.image)
        .WithCommand({"chmod", "-R", "a+rwX", settings_.work_path.string()})
        .WithNetwork(NetworkMode::NONE)
        .WithMount(bundle.Workspace(), settings_.work_path)
        .WithLabel(kManagedLabelKey, kManagedLabelValue)
        .DropAllCapabilities()
        .WithUser(user)
        .Build();

    auto container_id = runtime_.CreateContainer(config);
    if (container_id.empty()) {
        if (!runtime_.RemoveContainer(config.name, true)) {
            spdlog::debug("No helper container named {} to remove", config.name);
        }
        spdlog::error("Could not create helper to reclaim {}", bundle.Workspace().string());
        return false;
    }

    bool completed = false;
    if (runtime_.StartContainer(container_id)) {
        auto wait = runtime_.WaitForContainer(container_id, kReclaimTimeout);
        completed = wait.completed;
        if (wait.timed_out && !runtime_.KillContainer(container_id)) {
            spdlog::warn("Failed to kill helper container {}", config.name);
        }
    }

    if (!runtime_.RemoveContainer(container_id, true)) {
        spdlog::error("Failed to remove helper container {}", config.name);
    }

    if (!completed) {
        spdlog::error("Helper failed to reclaim {}", bundle.Workspace().string());
    }
    return completed;
}

} // namespace core
} // namespace codecell
