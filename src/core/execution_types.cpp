/**
 * @file execution_types.cpp
 * @brief Request validation, path mapping and JSON conversion
 *
 * @date 2025
 */

#include "codecell/core/execution_types.hpp"
#include "codecell/core/errors.hpp"

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace codecell {
namespace core {

namespace {

std::vector<std::string> ReadStringArray(const json& j, const char* key) {
    std::vector<std::string> values;
    if (!j.contains(key) || j[key].is_null()) {
        return values;
    }

    const auto& array = j[key];
    if (!array.is_array()) {
        throw RequestError(std::string("'") + key + "' must be an array of strings");
    }

    for (const auto& item : array) {
        if (!item.is_string()) {
            throw RequestError(std::string("'") + key + "' must be an array of strings");
        }
        values.push_back(item.get<std::string>());
    }

    return values;
}

UploadSpec ParseUploadSpec(const json& j) {
    if (!j.is_object()) {
        throw RequestError("Each upload_files entry must be an object");
    }

    UploadSpec spec;

    if (!j.contains("container_path") || !j["container_path"].is_string()) {
        throw RequestError("upload_files entry is missing 'container_path'");
    }
    spec.destination_path = j["container_path"].get<std::string>();

    if (j.contains("content") && !j["content"].is_null()) {
        if (!j["content"].is_string()) {
            throw RequestError("upload_files 'content' must be a string");
        }
        spec.content = j["content"].get<std::string>();
    }

    if (j.contains("path") && !j["path"].is_null()) {
        if (!j["path"].is_string()) {
            throw RequestError("upload_files 'path' must be a string");
        }
        spec.source_reference = j["path"].get<std::string>();
    }

    return spec;
}

} // anonymous namespace

// ============================================================================
// VALIDATION
// ============================================================================

void ValidateRequest(const ExecutionRequest& request) {
    if (request.code.empty()) {
        throw RequestError("'code' must not be empty");
    }

    for (const auto& spec : request.upload_specs) {
        if (spec.destination_path.empty()) {
            throw RequestError("Upload destination path must not be empty");
        }
        if (spec.content.has_value() == spec.source_reference.has_value()) {
            throw RequestError("Upload for '" + spec.destination_path +
                               "' needs exactly one of content or path");
        }
    }

    if (request.timeout) {
        if (request.timeout->count() <= 0) {
            throw RequestError("Timeout must be positive");
        }
        if (*request.timeout > kMaxTimeout) {
            throw RequestError("Timeout must not exceed " + std::to_string(kMaxTimeout.count()) + "s");
        }
    }
}

std::filesystem::path ResolveContainerPath(const std::string& path,
                                           const std::filesystem::path& work_path) {
    std::filesystem::path requested(path);
    if (requested.is_absolute()) {
        return requested.lexically_normal();
    }
    return (work_path / requested).lexically_normal();
}

// ============================================================================
// JSON MAPPING
// ============================================================================

ExecutionRequest ParseRequest(const json& j) {
    if (!j.is_object()) {
        throw RequestError("Request must be a JSON object");
    }

    ExecutionRequest request;

    if (!j.contains("code") || !j["code"].is_string()) {
        throw RequestError("Request is missing string field 'code'");
    }
    request.code = j["code"].get<std::string>();

    if (j.contains("env_vars") && !j["env_vars"].is_null()) {
        const auto& env = j["env_vars"];
        if (!env.is_object()) {
            throw RequestError("'env_vars' must be an object");
        }
        for (const auto& [name, value] : env.items()) {
            if (!value.is_string()) {
                throw RequestError("Environment variable '" + name + "' must be a string");
            }
            request.environment_variables[name] = value.get<std::string>();
        }
    }

    if (j.contains("upload_files") && !j["upload_files"].is_null()) {
        if (!j["upload_files"].is_array()) {
            throw RequestError("'upload_files' must be an array");
        }
        for (const auto& item : j["upload_files"]) {
            request.upload_specs.push_back(ParseUploadSpec(item));
        }
    }

    request.download_paths = ReadStringArray(j, "download_paths");
    request.requirements = ReadStringArray(j, "requirements");

    if (j.contains("timeout") && !j["timeout"].is_null()) {
        if (!j["timeout"].is_number_integer()) {
            throw RequestError("'timeout' must be an integer number of seconds");
        }
        request.timeout = std::chrono::seconds(j["timeout"].get<long long>());
    }

    spdlog::debug("Parsed request: {} bytes of code, {} uploads, {} downloads, {} requirements",
                  request.code.size(), request.upload_specs.size(),
                  request.download_paths.size(), request.requirements.size());

    return request;
}

json ToJson(const ExecutionResult& result) {
    json j;

    j["success"] = result.success;
    j["stdout"] = result.stdout_output;
    j["stderr"] = result.stderr_output;
    j["error"] = result.error ? json(*result.error) : json(nullptr);
    j["exit_code"] = result.exit_code ? json(*result.exit_code) : json(nullptr);
    j["timed_out"] = result.timed_out;
    j["duration_ms"] = result.duration.count();

    json files = json::object();
    for (const auto& [path, content] : result.downloaded_files) {
        files[path] = content;
    }
    j["downloaded_files"] = files;

    return j;
}

} // namespace core
} // namespace codecell
