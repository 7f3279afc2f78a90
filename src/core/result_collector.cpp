/**
 * @file result_collector.cpp
 * @brief Implementation of artifact retrieval
 *
 * **Per-path Workflow**:
 * 1. Map the path into the container namespace
 * 2. Copy it out into `<scratch>/<index>`
 * 3. Require a regular file, read it, encode it as a data URI
 * 4. Optionally persist the raw bytes to the downloads directory
 *
 * @date 2025
 */

#include "codecell/core/result_collector.hpp"
#include "codecell/core/errors.hpp"
#include "codecell/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>

#include <stdlib.h>

namespace codecell {
namespace core {

using utils::StringUtils;

ResultCollector::ResultCollector(utils::ContainerRuntime& runtime,
                                 std::filesystem::path scratch_root,
                                 std::optional<std::filesystem::path> downloads_directory)
    : runtime_(runtime)
    , scratch_root_(std::move(scratch_root))
    , downloads_directory_(std::move(downloads_directory)) {
}

std::map<std::string, std::string> ResultCollector::Collect(
    const ExecutionEnvironment& environment,
    const std::vector<std::string>& paths) {

    std::map<std::string, std::string> files;
    if (paths.empty()) {
        return files;
    }

    std::filesystem::path scratch;
    try {
        scratch = CreateScratchDirectory();
    }
    catch (const ArtifactRetrievalError& e) {
        spdlog::error("{}", e.what());
        for (const auto& path : paths) {
            files[path] = kDownloadErrorPrefix + std::string(e.what());
        }
        return files;
    }

    std::size_t index = 0;
    for (const auto& path : paths) {
        auto scratch_file = scratch / std::to_string(index++);

        try {
            files[path] = Retrieve(environment, path, scratch_file);
            spdlog::info("Downloaded {}", path);
        }
        catch (const ArtifactRetrievalError& e) {
            spdlog::warn("Could not download {}: {}", path, e.what());
            files[path] = kDownloadErrorPrefix + std::string(e.what());
        }
    }

    std::error_code ec;
    std::filesystem::remove_all(scratch, ec);
    if (ec) {
        spdlog::warn("Failed to remove scratch directory {}: {}", scratch.string(), ec.message());
    }

    return files;
}

std::string ResultCollector::Retrieve(const ExecutionEnvironment& environment,
                                      const std::string& path,
                                      const std::filesystem::path& scratch_file) {
    if (path.empty()) {
        throw ArtifactRetrievalError("empty path");
    }

    auto container_path = ResolveContainerPath(path, environment.work_path);

    auto copy = runtime_.CopyFromContainer(environment.container_id, container_path, scratch_file);
    if (!copy.success) {
        auto reason = StringUtils::Trim(copy.stderr_output);
        throw ArtifactRetrievalError(reason.empty() ? "copy from container failed" : reason);
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(scratch_file, ec)) {
        throw ArtifactRetrievalError(container_path.string() + " is not a regular file");
    }

    std::ifstream file(scratch_file, std::ios::binary);
    if (!file.is_open()) {
        throw ArtifactRetrievalError("cannot read retrieved copy of " + container_path.string());
    }

    std::string bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw ArtifactRetrievalError("read error on retrieved copy of " + container_path.string());
    }

    Persist(path, bytes);
    return StringUtils::ToDataUri(bytes);
}

void ResultCollector::Persist(const std::string& path, const std::string& bytes) const {
    if (!downloads_directory_) {
        return;
    }

    auto name = std::filesystem::path(path).filename();
    if (name.empty()) {
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(*downloads_directory_, ec);
    if (ec) {
        spdlog::warn("Cannot create downloads directory {}: {}",
                     downloads_directory_->string(), ec.message());
        return;
    }

    auto target = *downloads_directory_ / name;
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.close();

    if (!out) {
        spdlog::warn("Failed to save {} to {}", path, target.string());
        return;
    }

    spdlog::debug("Saved {} to {}", path, target.string());
}

std::filesystem::path ResultCollector::CreateScratchDirectory() const {
    std::filesystem::path parent = scratch_root_;
    std::error_code ec;

    if (parent.empty()) {
        parent = std::filesystem::temp_directory_path(ec);
        if (ec) {
            throw ArtifactRetrievalError("no temporary directory available: " + ec.message());
        }
    }

    std::string pattern = (parent / "codecell-collect-XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (mkdtemp(buffer.data()) == nullptr) {
        throw ArtifactRetrievalError("cannot create scratch directory: " +
                                     std::string(std::strerror(errno)));
    }

    return std::filesystem::path(buffer.data());
}

} // namespace core
} // namespace codecell
