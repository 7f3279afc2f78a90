#include <gtest/gtest.h>
#include "codecell/core/errors.hpp"
#include "codecell/core/execution_types.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace codecell {
namespace core {
namespace {

// ============================================================================
// Validation Tests
// ============================================================================

TEST(ExecutionTypesTest, Validate_RejectsEmptyCode) {
    ExecutionRequest request;
    EXPECT_THROW(ValidateRequest(request), RequestError);
}

TEST(ExecutionTypesTest, Validate_UploadNeedsExactlyOneSource) {
    ExecutionRequest request;
    request.code = "print(1)";

    UploadSpec both{"a.txt", std::string("x"), std::string("a.txt")};
    request.upload_specs = {both};
    EXPECT_THROW(ValidateRequest(request), RequestError);

    UploadSpec neither{"a.txt", std::nullopt, std::nullopt};
    request.upload_specs = {neither};
    EXPECT_THROW(ValidateRequest(request), RequestError);

    UploadSpec content_only{"a.txt", std::string("x"), std::nullopt};
    request.upload_specs = {content_only};
    EXPECT_NO_THROW(ValidateRequest(request));
}

TEST(ExecutionTypesTest, Validate_RejectsNonPositiveTimeout) {
    ExecutionRequest request;
    request.code = "print(1)";
    request.timeout = std::chrono::seconds(0);
    EXPECT_THROW(ValidateRequest(request), RequestError);
}

TEST(ExecutionTypesTest, Validate_TimeoutUpperBound) {
    ExecutionRequest request;
    request.code = "print(1)";

    request.timeout = kMaxTimeout;
    EXPECT_NO_THROW(ValidateRequest(request));

    request.timeout = kMaxTimeout + std::chrono::seconds(1);
    EXPECT_THROW(ValidateRequest(request), RequestError);

    request.timeout = std::chrono::seconds(10000000000000000LL);
    EXPECT_THROW(ValidateRequest(request), RequestError);
}

// ============================================================================
// Path Mapping Tests
// ============================================================================

TEST(ExecutionTypesTest, ResolveContainerPath_RelativeJoinsWorkPath) {
    EXPECT_EQ(ResolveContainerPath("out/result.csv", "/code"), "/code/out/result.csv");
    EXPECT_EQ(ResolveContainerPath("./a.txt", "/code"), "/code/a.txt");
}

TEST(ExecutionTypesTest, ResolveContainerPath_NeverClimbsAboveRoot) {
    // Given: Paths trying to escape with '..'
    // When: Resolving them
    // Then: They stay inside the container's root
    EXPECT_EQ(ResolveContainerPath("/../../etc/passwd", "/code"), "/etc/passwd");
    EXPECT_EQ(ResolveContainerPath("../../../../tmp/x", "/code"), "/tmp/x");
    EXPECT_EQ(ResolveContainerPath("/data/../data/in.csv", "/code"), "/data/in.csv");
}

// ============================================================================
// JSON Mapping Tests
// ============================================================================

TEST(ExecutionTypesTest, ParseRequest_AllFields) {
    json j = {
        {"code", "print('hi')"},
        {"env_vars", {{"MODE", "test"}}},
        {"upload_files", json::array({
            {{"container_path", "in.txt"}, {"content", "hello"}},
            {{"container_path", "/data/sales.csv"}, {"path", "sales"}}
        })},
        {"download_paths", {"out.csv"}},
        {"requirements", {"numpy"}},
        {"timeout", 5}
    };

    auto request = ParseRequest(j);

    EXPECT_EQ(request.code, "print('hi')");
    EXPECT_EQ(request.environment_variables.at("MODE"), "test");
    ASSERT_EQ(request.upload_specs.size(), 2u);
    EXPECT_EQ(*request.upload_specs[0].content, "hello");
    EXPECT_FALSE(request.upload_specs[0].source_reference.has_value());
    EXPECT_EQ(*request.upload_specs[1].source_reference, "sales");
    EXPECT_EQ(request.download_paths, std::vector<std::string>{"out.csv"});
    EXPECT_EQ(request.requirements, std::vector<std::string>{"numpy"});
    ASSERT_TRUE(request.timeout.has_value());
    EXPECT_EQ(request.timeout->count(), 5);
}

TEST(ExecutionTypesTest, ParseRequest_OptionalFieldsDefault) {
    auto request = ParseRequest(json{{"code", "x = 1"}});

    EXPECT_TRUE(request.environment_variables.empty());
    EXPECT_TRUE(request.upload_specs.empty());
    EXPECT_TRUE(request.download_paths.empty());
    EXPECT_FALSE(request.timeout.has_value());
}

TEST(ExecutionTypesTest, ParseRequest_RejectsMistypedFields) {
    EXPECT_THROW(ParseRequest(json::array()), RequestError);
    EXPECT_THROW(ParseRequest(json{{"code", 3}}), RequestError);
    EXPECT_THROW(ParseRequest(json{{"code", "x"}, {"env_vars", {{"A", 1}}}}), RequestError);
    EXPECT_THROW(ParseRequest(json{{"code", "x"}, {"download_paths", "out.csv"}}), RequestError);
    EXPECT_THROW(ParseRequest(json{{"code", "x"}, {"timeout", "soon"}}), RequestError);
}

TEST(ExecutionTypesTest, ToJson_NullsForAbsentValues) {
    // Given: A timed-out result
    ExecutionResult result;
    result.timed_out = true;
    result.error = "Execution timed out after 1s";
    result.downloaded_files["out.csv"] = "Error downloading: missing";

    auto j = ToJson(result);

    EXPECT_FALSE(j["success"].get<bool>());
    EXPECT_TRUE(j["exit_code"].is_null()) << "No exit code after a kill";
    EXPECT_EQ(j["error"], "Execution timed out after 1s");
    EXPECT_TRUE(j["timed_out"].get<bool>());
    EXPECT_EQ(j["downloaded_files"]["out.csv"], "Error downloading: missing");
}

TEST(ExecutionTypesTest, ToJson_SuccessHasNullError) {
    ExecutionResult result;
    result.success = true;
    result.exit_code = 0;
    result.stdout_output = "ok\n";

    auto j = ToJson(result);

    EXPECT_TRUE(j["error"].is_null());
    EXPECT_EQ(j["exit_code"], 0);
    EXPECT_EQ(j["stdout"], "ok\n");
    EXPECT_TRUE(j["downloaded_files"].is_object());
}

} // namespace
} // namespace core
} // namespace codecell
