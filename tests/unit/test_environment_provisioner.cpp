#include <gtest/gtest.h>
#include "codecell/core/environment_provisioner.hpp"
#include "codecell/core/errors.hpp"
#include "fake_container_runtime.hpp"

#include <filesystem>
#include <thread>
#include <vector>

namespace codecell {
namespace core {
namespace {

using codecell::testing::FakeContainerRuntime;

class EnvironmentProvisionerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = std::filesystem::temp_directory_path() /
               (std::string("codecell_provisioner_test_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(root);
        std::filesystem::create_directories(root / "uploads");

        StagerOptions options;
        options.staging_directory = root / "staging";
        stager = std::make_unique<ArtifactStager>(options,
                                                  FileResolver::WithDefaultChain(root / "uploads"));
    }

    void TearDown() override {
        std::filesystem::remove_all(root);
    }

    ImageSettings Settings() {
        ImageSettings settings;
        settings.build_root = root;
        return settings;
    }

    std::vector<std::string> Command() {
        return stager->EntryCommand(ExecutionRequest{});
    }

    StagedBundle StageCode(const std::string& code = "print('ok')") {
        ExecutionRequest request;
        request.code = code;
        return stager->Stage(request);
    }

    std::filesystem::path root;
    FakeContainerRuntime fake;
    std::unique_ptr<ArtifactStager> stager;
};

// ============================================================================
// EnsureImage Tests
// ============================================================================

TEST_F(EnvironmentProvisionerTest, EnsureImage_ExistingImageIsNotRebuilt) {
    fake.image_present = true;
    EnvironmentProvisioner provisioner(fake, fake, Settings());

    auto ref = provisioner.EnsureImage();

    EXPECT_EQ(ref.tag, "codecell-sandbox:latest");
    EXPECT_FALSE(ref.built);
    EXPECT_EQ(fake.build_count.load(), 0);
}

TEST_F(EnvironmentProvisionerTest, EnsureImage_BuildsOnceAndCleansContext) {
    // Given: The image is missing
    fake.image_present = false;
    EnvironmentProvisioner provisioner(fake, fake, Settings());

    // When: Ensuring the image repeatedly
    auto first = provisioner.EnsureImage();
    auto second = provisioner.EnsureImage();

    // Then: It is built exactly once and the build directory is gone
    EXPECT_TRUE(first.built);
    EXPECT_FALSE(second.built);
    EXPECT_EQ(fake.build_count.load(), 1);
    EXPECT_NE(fake.last_dockerfile.find("FROM python:3.11-slim"), std::string::npos);
    EXPECT_NE(fake.last_dockerfile.find("gcc python3-dev"), std::string::npos);
    EXPECT_NE(fake.last_dockerfile.find("WORKDIR /code"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(fake.last_build_context));
}

TEST_F(EnvironmentProvisionerTest, EnsureImage_ConcurrentCallersBuildOnce) {
    fake.image_present = false;
    EnvironmentProvisioner provisioner(fake, fake, Settings());

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&provisioner]() { provisioner.EnsureImage(); });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(fake.build_count.load(), 1);
}

TEST_F(EnvironmentProvisionerTest, EnsureImage_BuildFailureIsProvisioningError) {
    fake.image_present = false;
    fake.fail_build = true;
    EnvironmentProvisioner provisioner(fake, fake, Settings());

    EXPECT_THROW(provisioner.EnsureImage(), ProvisioningError);
    EXPECT_FALSE(std::filesystem::exists(fake.last_build_context))
        << "Build directory removed even when the build fails";
    EXPECT_EQ(fake.build_count.load(), 1) << "No retry inside the provisioner";
}

// ============================================================================
// Provision Tests
// ============================================================================

TEST_F(EnvironmentProvisionerTest, Provision_CreatesIsolatedContainer) {
    EnvironmentProvisioner provisioner(fake, fake, Settings());
    auto bundle = StageCode();

    ResourceLimits limits;
    limits.memory_limit_mb = 256;
    auto env = provisioner.Provision(bundle, limits, {{"MODE", "test"}},
                                     Command());

    ASSERT_FALSE(env.container_id.empty());
    EXPECT_FALSE(env.started) << "Provision must not start the container";
    EXPECT_EQ(fake.start_count.load(), 0);

    ASSERT_TRUE(fake.last_config.has_value());
    const auto& config = *fake.last_config;
    EXPECT_EQ(config.memory_limit_mb, 256u);
    EXPECT_EQ(config.memory_swap_limit_mb, 256u);
    EXPECT_EQ(config.cpu_period, 100000);
    EXPECT_EQ(config.cpu_quota, 50000);
    EXPECT_EQ(config.network_mode, utils::NetworkMode::NONE);
    EXPECT_EQ(config.user, "nobody");
    EXPECT_EQ(config.capabilities_drop, std::vector<std::string>{"ALL"});
    EXPECT_TRUE(config.no_new_privileges);
    EXPECT_EQ(config.environment_vars.at("MODE"), "test");
    EXPECT_EQ(config.labels.at(kManagedLabelKey), kManagedLabelValue);
    EXPECT_EQ(FakeContainerRuntime::MountSource(config, "/code"), bundle.Workspace());
    EXPECT_EQ(config.command, Command());
}

TEST_F(EnvironmentProvisionerTest, Provision_NetworkOnlyWhenEnabled) {
    EnvironmentProvisioner provisioner(fake, fake, Settings());
    auto bundle = StageCode();

    ResourceLimits limits;
    limits.network_enabled = true;
    provisioner.Provision(bundle, limits, {}, Command());

    EXPECT_EQ(fake.last_config->network_mode, utils::NetworkMode::BRIDGE);
}

TEST_F(EnvironmentProvisionerTest, Provision_RuntimeRefusalIsProvisioningError) {
    fake.fail_create = true;
    EnvironmentProvisioner provisioner(fake, fake, Settings());
    auto bundle = StageCode();

    EXPECT_THROW(provisioner.Provision(bundle, ResourceLimits{}, {}, Command()),
                 ProvisioningError);
}

TEST_F(EnvironmentProvisionerTest, Provision_LostCreateReplyLeavesNoContainer) {
    // Given: The daemon creates the container but the create call returns no id
    fake.create_times_out = true;
    EnvironmentProvisioner provisioner(fake, fake, Settings());
    auto bundle = StageCode();

    // When: Provisioning
    EXPECT_THROW(provisioner.Provision(bundle, ResourceLimits{}, {}, Command()), ProvisioningError);

    // Then: The container is removed by name before the error surfaces
    EXPECT_EQ(fake.LiveContainers(), 0u);
}

TEST_F(EnvironmentProvisionerTest, ReclaimWorkspace_RunsChmodAsSandboxUser) {
    EnvironmentProvisioner provisioner(fake, fake, Settings());
    auto bundle = StageCode();

    EXPECT_TRUE(provisioner.ReclaimWorkspace(bundle, "nobody"));

    ASSERT_TRUE(fake.last_config.has_value());
    const auto& config = *fake.last_config;
    EXPECT_EQ(config.command, (std::vector<std::string>{"chmod", "-R", "a+rwX", "/code"}));
    EXPECT_EQ(config.user, "nobody");
    EXPECT_EQ(config.network_mode, utils::NetworkMode::NONE);
    EXPECT_EQ(FakeContainerRuntime::MountSource(config, "/code"), bundle.Workspace());
    EXPECT_EQ(fake.LiveContainers(), 0u) << "Helper container is removed";
}

TEST_F(EnvironmentProvisionerTest, ReclaimWorkspace_StartFailureIsReported) {
    fake.fail_start = true;
    EnvironmentProvisioner provisioner(fake, fake, Settings());
    auto bundle = StageCode();

    EXPECT_FALSE(provisioner.ReclaimWorkspace(bundle, "nobody"));
    EXPECT_EQ(fake.LiveContainers(), 0u);
}

TEST_F(EnvironmentProvisionerTest, PlaceUploads_CopiesOnlyOutsideWorkPath) {
    EnvironmentProvisioner provisioner(fake, fake, Settings());

    ExecutionRequest request;
    request.code = "pass";
    request.upload_specs.push_back({"in.txt", std::string("inside"), std::nullopt});
    request.upload_specs.push_back({"/data/in.csv", std::string("outside"), std::nullopt});
    auto bundle = stager->Stage(request);

    auto env = provisioner.Provision(bundle, ResourceLimits{}, {}, Command());
    provisioner.PlaceUploads(env, bundle);

    EXPECT_EQ(fake.FileInContainer(env.container_id, "/data/in.csv"), std::string("outside"));
    EXPECT_FALSE(fake.FileInContainer(env.container_id, "/code/in.txt").has_value())
        << "Workspace files travel through the bind mount";
}

TEST_F(EnvironmentProvisionerTest, PlaceUploads_CopyFailureIsProvisioningError) {
    EnvironmentProvisioner provisioner(fake, fake, Settings());

    ExecutionRequest request;
    request.code = "pass";
    request.upload_specs.push_back({"/data/in.csv", std::string("x"), std::nullopt});
    auto bundle = stager->Stage(request);
    auto env = provisioner.Provision(bundle, ResourceLimits{}, {}, Command());

    fake.fail_copy_to = true;
    EXPECT_THROW(provisioner.PlaceUploads(env, bundle), ProvisioningError);
}

TEST_F(EnvironmentProvisionerTest, GenerateDockerfile_WithoutPackages) {
    ImageSettings settings;
    settings.base_image = "python:3.12-alpine";
    settings.system_packages.clear();

    auto dockerfile = EnvironmentProvisioner::GenerateDockerfile(settings);

    EXPECT_EQ(dockerfile, "FROM python:3.12-alpine\nWORKDIR /code\n");
}

} // namespace
} // namespace core
} // namespace codecell
