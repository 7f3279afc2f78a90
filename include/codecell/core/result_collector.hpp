/**
 * @file result_collector.hpp
 * @brief Retrieval of declared output artifacts from a finished container
 *
 * Each requested path is handled on its own: a path that cannot be retrieved
 * gets an `Error downloading: <reason>` note in its slot and the others carry
 * on. Retrieved files are returned as
 * `data:application/octet-stream;base64,<payload>`.
 *
 * @date 2025
 */

#pragma once

#include "codecell/core/environment_provisioner.hpp"
#include "codecell/utils/container_utils.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace codecell {
namespace core {

/// Prefix of a per-path retrieval failure note
constexpr const char* kDownloadErrorPrefix = "Error downloading: ";

/**
 * @class ResultCollector
 * @brief ExecutionEnvironment + paths → path → data URI or error note
 */
class ResultCollector {
public:
    /**
     * @param runtime Runtime used to copy files out
     * @param scratch_root Parent of private scratch directories (empty: system temp)
     * @param downloads_directory If set, retrieved artifacts are also written here
     */
    ResultCollector(utils::ContainerRuntime& runtime,
                    std::filesystem::path scratch_root = {},
                    std::optional<std::filesystem::path> downloads_directory = std::nullopt);

    /**
     * @brief Retrieve every requested path
     *
     * Never throws for an individual path. Relative paths resolve against the
     * environment's work path; keys of the result are the paths as requested.
     */
    std::map<std::string, std::string> Collect(const ExecutionEnvironment& environment,
                                               const std::vector<std::string>& paths);

private:
    utils::ContainerRuntime& runtime_;
    std::filesystem::path scratch_root_;
    std::optional<std::filesystem::path> downloads_directory_;

    std::string Retrieve(const ExecutionEnvironment& environment,
                         const std::string& path,
                         const std::filesystem::path& scratch_file);
    void Persist(const std::string& path, const std::string& bytes) const;
    std::filesystem::path CreateScratchDirectory() const;
};

} // namespace core
} // namespace codecell
