/**
 * @file artifact_stager.hpp
 * @brief Materialization of a request into a private on-disk bundle
 *
 * The stager turns an ExecutionRequest into a StagedBundle: a private
 * temporary directory whose `workspace/` subdirectory is later bound into the
 * container at the work path. It holds the entry script (the user's code,
 * unmodified), an optional requirements manifest and every decoded upload.
 * The command that runs the entry script is a small shell launcher that
 * relaxes the umask and installs requirements first.
 *
 * **Bundle Layout**:
 * ```
 * <staging_dir>/codecell-run-XXXXXX/      (0700, owned by this process)
 * ├── workspace/                          (bound to /code)
 * │   ├── main.py
 * │   ├── requirements.txt                (only with requirements)
 * │   └── <uploads under /code, same relative paths>
 * └── outbox/<n>/<base name>              (uploads destined outside /code)
 * ```
 *
 * @date 2025
 */

#pragma once

#include "codecell/core/execution_types.hpp"
#include "codecell/core/file_resolver.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace codecell {
namespace core {

/// Exit status the launcher uses when requirement installation fails
constexpr int kRequirementsFailedExitCode = 97;

constexpr const char* kEntryScriptName = "main.py";
constexpr const char* kRequirementsFileName = "requirements.txt";
constexpr const char* kPackagesDirName = ".packages";

/**
 * @struct StagedUpload
 * @brief A decoded upload and where it belongs inside the container
 */
struct StagedUpload {
    std::filesystem::path host_path;       ///< Staged file on the host
    std::filesystem::path container_path;  ///< Normalized destination
};

/**
 * @class StagedBundle
 * @brief Exclusively-owned staging directory (move-only RAII)
 *
 * The directory is removed when the bundle is destroyed or Release() is
 * called. Removal failures are logged and never thrown.
 */
class StagedBundle {
public:
    StagedBundle() = default;
    explicit StagedBundle(std::filesystem::path root);
    ~StagedBundle();

    StagedBundle(const StagedBundle&) = delete;
    StagedBundle& operator=(const StagedBundle&) = delete;
    StagedBundle(StagedBundle&& other) noexcept;
    StagedBundle& operator=(StagedBundle&& other) noexcept;

    /// Bundle currently owns a directory
    bool Valid() const { return !root_.empty(); }

    const std::filesystem::path& Root() const { return root_; }
    std::filesystem::path Workspace() const { return root_ / "workspace"; }
    std::filesystem::path EntryScript() const { return Workspace() / kEntryScriptName; }

    const std::vector<StagedUpload>& Uploads() const { return uploads_; }
    void AddUpload(StagedUpload upload) { uploads_.push_back(std::move(upload)); }

    /**
     * @brief Remove the directory now
     * @return true if nothing is left on disk
     */
    bool Release();

private:
    std::filesystem::path root_;
    std::vector<StagedUpload> uploads_;
};

/**
 * @struct StagerOptions
 * @brief Staging locations and interpreter conventions
 */
struct StagerOptions {
    std::filesystem::path staging_directory;        ///< Parent of bundles (empty: system temp)
    std::filesystem::path work_path{"/code"};       ///< Container mount point of the workspace
    std::string interpreter{"python"};              ///< Interpreter inside the image
};

/**
 * @class ArtifactStager
 * @brief Request → StagedBundle
 *
 * **Usage Example**:
 * @code
 * ArtifactStager stager(StagerOptions{}, FileResolver::WithDefaultChain("./uploads"));
 * StagedBundle bundle = stager.Stage(request);
 * // bundle.Workspace() now holds main.py and the uploads
 * @endcode
 */
class ArtifactStager {
public:
    ArtifactStager(StagerOptions options, FileResolver resolver);

    /**
     * @brief Write the request to a fresh bundle
     *
     * @throws StagingError on undecodable content, unusable destinations or
     *         filesystem failures
     * @throws UploadNotFoundError if a source reference matches nothing
     */
    StagedBundle Stage(const ExecutionRequest& request) const;

    /**
     * @brief Generate the `sh -c` script that runs the entry script
     *
     * Always relaxes the umask so the host can clean up sandbox-written files.
     * With requirements, pip-installs them into `<work_path>/.packages`
     * first, exits with kRequirementsFailedExitCode if that fails, and puts
     * the target on PYTHONPATH. Ends by exec'ing the interpreter.
     */
    static std::string GenerateLauncher(bool install_requirements,
                                        const std::string& interpreter,
                                        const std::filesystem::path& work_path);

    /// Container command for a staged request: `/bin/sh -c <launcher>`
    std::vector<std::string> EntryCommand(const ExecutionRequest& request) const;

    const StagerOptions& GetOptions() const { return options_; }

    /// True if the path is strictly below the work path
    static bool IsWithinWorkPath(const std::filesystem::path& container_path,
                                 const std::filesystem::path& work_path);

private:
    StagerOptions options_;
    FileResolver resolver_;

    std::filesystem::path CreateBundleDirectory() const;
    void StageUpload(const UploadSpec& spec, bool has_requirements, StagedBundle& bundle) const;
    static void WriteFile(const std::filesystem::path& path, const std::string& bytes);
};

} // namespace core
} // namespace codecell
