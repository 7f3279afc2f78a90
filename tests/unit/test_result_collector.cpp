#include <gtest/gtest.h>
#include "codecell/core/result_collector.hpp"
#include "codecell/utils/string_utils.hpp"
#include "fake_container_runtime.hpp"

#include <filesystem>
#include <fstream>

namespace codecell {
namespace core {
namespace {

using codecell::testing::FakeBehaviour;
using codecell::testing::FakeContainerRuntime;
using utils::StringUtils;

class ResultCollectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = std::filesystem::temp_directory_path() /
               (std::string("codecell_collector_test_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(root);
        workspace = root / "workspace";
        scratch = root / "scratch";
        std::filesystem::create_directories(workspace);
        std::filesystem::create_directories(scratch);
    }

    void TearDown() override {
        std::filesystem::remove_all(root);
    }

    /// Create and run a container that writes the given files
    ExecutionEnvironment RunWriting(const std::map<std::string, std::string>& writes) {
        FakeBehaviour behaviour;
        behaviour.writes = writes;
        fake.behaviour = [behaviour](const utils::ContainerConfig&) { return behaviour; };

        auto config = utils::ContainerBuilder()
            .WithName("codecell_collector_test")
            .WithImage("codecell-sandbox:latest")
            .WithCommand({"python", "/code/main.py"})
            .WithMount(workspace, "/code")
            .Build();

        ExecutionEnvironment env;
        env.container_name = config.name;
        env.container_id = fake.CreateContainer(config);
        env.host_directory = workspace;
        env.work_path = "/code";
        fake.StartContainer(env.container_id);
        return env;
    }

    bool ScratchIsEmpty() {
        return std::filesystem::is_empty(scratch);
    }

    std::filesystem::path root;
    std::filesystem::path workspace;
    std::filesystem::path scratch;
    FakeContainerRuntime fake;
};

// ============================================================================
// Retrieval Tests
// ============================================================================

TEST_F(ResultCollectorTest, Collect_EncodesFilesAsDataUris) {
    std::string bytes{'a', '\x00', '\xfe', 'z'};
    auto env = RunWriting({{"/code/out.bin", bytes}});
    ResultCollector collector(fake, scratch);

    auto files = collector.Collect(env, {"out.bin"});

    ASSERT_EQ(files.count("out.bin"), 1u);
    EXPECT_EQ(files["out.bin"], "data:application/octet-stream;base64," + StringUtils::ToBase64(bytes));
    EXPECT_EQ(StringUtils::DecodeDataUri(files["out.bin"]), bytes);
    EXPECT_TRUE(ScratchIsEmpty()) << "Scratch copies are removed";
}

TEST_F(ResultCollectorTest, Collect_PathsOutsideWorkspace) {
    auto env = RunWriting({{"/tmp/report.txt", "done"}});
    ResultCollector collector(fake, scratch);

    auto files = collector.Collect(env, {"/tmp/report.txt"});

    EXPECT_EQ(StringUtils::DecodeDataUri(files["/tmp/report.txt"]), "done");
}

TEST_F(ResultCollectorTest, Collect_MissingPathIsIsolatedError) {
    // Given: One present and one absent output
    auto env = RunWriting({{"/code/result.csv", "a,b\n"}});
    ResultCollector collector(fake, scratch);

    // When: Collecting both
    auto files = collector.Collect(env, {"missing.csv", "result.csv"});

    // Then: The absent one carries an error note, the other succeeds
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files["missing.csv"].rfind("Error downloading: ", 0), 0u);
    EXPECT_EQ(StringUtils::DecodeDataUri(files["result.csv"]), "a,b\n");
}

TEST_F(ResultCollectorTest, Collect_DirectoryIsNotAnArtifact) {
    std::filesystem::create_directories(workspace / "outdir");
    auto env = RunWriting({});
    ResultCollector collector(fake, scratch);

    auto files = collector.Collect(env, {"outdir"});

    EXPECT_EQ(files["outdir"], "Error downloading: /code/outdir is not a regular file");
}

TEST_F(ResultCollectorTest, Collect_NoPathsNoWork) {
    auto env = RunWriting({});
    ResultCollector collector(fake, scratch);

    EXPECT_TRUE(collector.Collect(env, {}).empty());
}

// ============================================================================
// Downloads Directory Tests
// ============================================================================

TEST_F(ResultCollectorTest, Collect_PersistsToDownloadsDirectory) {
    auto downloads = root / "downloads";
    auto env = RunWriting({{"/code/charts/plot.png", "PNGDATA"}});
    ResultCollector collector(fake, scratch, downloads);

    collector.Collect(env, {"charts/plot.png", "nope.txt"});

    std::ifstream saved(downloads / "plot.png", std::ios::binary);
    std::string content((std::istreambuf_iterator<char>(saved)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "PNGDATA");
    EXPECT_FALSE(std::filesystem::exists(downloads / "nope.txt"));
}

} // namespace
} // namespace core
} // namespace codecell
