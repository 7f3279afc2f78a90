/**
 * @file artifact_stager.cpp
 * @brief Implementation of request staging
 *
 * **Staging Workflow**:
 * 1. mkdtemp a private bundle root (0700) under the staging directory
 * 2. Create `workspace/` (0777, the unprivileged sandbox user writes here)
 * 3. Write requirements.txt when requirements are present
 * 4. Write main.py, byte for byte the user's code
 * 5. Decode and write each upload: destinations under the work path go to
 *    the same relative location in the workspace, others to `outbox/<n>/`
 *
 * The umask and the requirements installation live in a `/bin/sh -c`
 * launcher (EntryCommand), never in main.py, so `from __future__` imports and
 * traceback line numbers are unaffected.
 *
 * Any failure destroys the partially built bundle before the exception
 * leaves Stage().
 *
 * @date 2025
 */

#include "codecell/core/artifact_stager.hpp"
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

using utils::StringUtils;

namespace {

std::string ShellQuote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // anonymous namespace

// ============================================================================
// STAGED BUNDLE
// ============================================================================

StagedBundle::StagedBundle(std::filesystem::path root)
    : root_(std::move(root)) {
}

StagedBundle::~StagedBundle() {
    Release();
}

StagedBundle::StagedBundle(StagedBundle&& other) noexcept
    : root_(std::move(other.root_))
    , uploads_(std::move(other.uploads_)) {
    other.root_.clear();
    other.uploads_.clear();
}

StagedBundle& StagedBundle::operator=(StagedBundle&& other) noexcept {
    if (this != &other) {
        Release();
        root_ = std::move(other.root_);
        uploads_ = std::move(other.uploads_);
        other.root_.clear();
        other.uploads_.clear();
    }
    return *this;
}

bool StagedBundle::Release() {
    if (root_.empty()) {
        return true;
    }

    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    if (ec) {
        spdlog::warn("Failed to remove staging directory {}: {}", root_.string(), ec.message());
        return false;
    }

    spdlog::debug("Removed staging directory {}", root_.string());
    root_.clear();
    uploads_.clear();
    return true;
}

// ============================================================================
// STAGER
// ============================================================================

ArtifactStager::ArtifactStager(StagerOptions options, FileResolver resolver)
    : options_(std::move(options))
    , resolver_(std::move(resolver)) {
}

StagedBundle ArtifactStager::Stage(const ExecutionRequest& request) const {
    StagedBundle bundle(CreateBundleDirectory());
    spdlog::debug("Staging request into {}", bundle.Root().string());

    try {
        std::filesystem::create_directory(bundle.Workspace());
        std::filesystem::permissions(bundle.Workspace(), std::filesystem::perms::all);

        if (!request.requirements.empty()) {
            WriteFile(bundle.Workspace() / kRequirementsFileName,
                      StringUtils::Join(request.requirements, "\n") + "\n");
        }

        WriteFile(bundle.EntryScript(), request.code);

        for (const auto& spec : request.upload_specs) {
            StageUpload(spec, !request.requirements.empty(), bundle);
        }
    }
    catch (const std::filesystem::filesystem_error& e) {
        throw StagingError(std::string("Filesystem error while staging: ") + e.what());
    }

    spdlog::info("Staged {} upload(s) into {}", bundle.Uploads().size(), bundle.Root().string());
    return bundle;
}

std::string ArtifactStager::GenerateLauncher(bool install_requirements,
                                             const std::string& interpreter,
                                             const std::filesystem::path& work_path) {
    auto python = ShellQuote(interpreter);
    auto target = ShellQuote((work_path / kPackagesDirName).string());
    std::ostringstream script;

    script << "umask 000\n";

    if (install_requirements) {
        auto manifest = ShellQuote((work_path / kRequirementsFileName).string());
        script << python << " -m pip install --no-cache-dir --disable-pip-version-check"
               << " --target " << target << " -r " << manifest << " > /dev/null"
               << " || { echo 'requirements installation failed' >&2; exit "
               << kRequirementsFailedExitCode << "; }\n"
               << "PYTHONPATH=" << target << "${PYTHONPATH:+:$PYTHONPATH}\n"
               << "export PYTHONPATH\n";
    }

    script << "exec " << python << " " << ShellQuote((work_path / kEntryScriptName).string()) << "\n";
    return script.str();
}

std::vector<std::string> ArtifactStager::EntryCommand(const ExecutionRequest& request) const {
    return {"/bin/sh", "-c",
            GenerateLauncher(!request.requirements.empty(), options_.interpreter, options_.work_path)};
}

std::filesystem::path ArtifactStager::CreateBundleDirectory() const {
    std::filesystem::path parent = options_.staging_directory;
    std::error_code ec;

    if (parent.empty()) {
        parent = std::filesystem::temp_directory_path(ec);
        if (ec) {
            throw StagingError("No temporary directory available: " + ec.message());
        }
    }

    std::filesystem::create_directories(parent, ec);
    if (ec) {
        throw StagingError("Cannot create staging directory " + parent.string() + ": " + ec.message());
    }

    std::string pattern = (parent / "codecell-run-XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    // mkdtemp creates the directory with mode 0700
    if (mkdtemp(buffer.data()) == nullptr) {
        throw StagingError("Cannot create bundle directory under " + parent.string() + ": " +
                           std::strerror(errno));
    }

    return std::filesystem::path(buffer.data());
}

void ArtifactStager::StageUpload(const UploadSpec& spec, bool has_requirements,
                                 StagedBundle& bundle) const {
    auto container_path = ResolveContainerPath(spec.destination_path, options_.work_path);
    auto file_name = container_path.filename();

    if (file_name.empty() || file_name == "." || file_name == "..") {
        throw StagingError("Upload destination has no file name: " + spec.destination_path);
    }
    if (container_path == options_.work_path / kEntryScriptName) {
        throw StagingError("Upload would overwrite the entry script: " + spec.destination_path);
    }
    if (has_requirements && container_path == options_.work_path / kRequirementsFileName) {
        throw StagingError("Upload would overwrite the requirements manifest: " +
                           spec.destination_path);
    }

    // Work-path destinations land in the bound workspace; the rest wait in
    // a private outbox until the provisioner copies them into the container
    std::filesystem::path host_path;
    if (IsWithinWorkPath(container_path, options_.work_path)) {
        host_path = bundle.Workspace() / container_path.lexically_relative(options_.work_path);
    } else {
        host_path = bundle.Root() / "outbox" / std::to_string(bundle.Uploads().size()) / file_name;
    }
    std::filesystem::create_directories(host_path.parent_path());

    if (spec.content) {
        const std::string& content = *spec.content;
        if (StringUtils::HasBase64Marker(content)) {
            try {
                WriteFile(host_path, StringUtils::DecodeDataUri(content));
            }
            catch (const std::invalid_argument& e) {
                throw StagingError("Cannot decode content for " + spec.destination_path +
                                   ": " + e.what());
            }
        } else {
            WriteFile(host_path, content);
        }
    } else {
        auto source = resolver_.Resolve(*spec.source_reference);
        spdlog::info("Upload '{}' resolved to {}", *spec.source_reference, source.string());
        std::filesystem::copy_file(source, host_path,
                                   std::filesystem::copy_options::overwrite_existing);
    }

    std::filesystem::permissions(host_path,
                                 std::filesystem::perms::owner_read |
                                 std::filesystem::perms::owner_write |
                                 std::filesystem::perms::group_read |
                                 std::filesystem::perms::others_read);

    bundle.AddUpload(StagedUpload{host_path, container_path});
}

bool ArtifactStager::IsWithinWorkPath(const std::filesystem::path& container_path,
                                      const std::filesystem::path& work_path) {
    auto relative = container_path.lexically_relative(work_path);
    if (relative.empty() || relative == ".") {
        return false;
    }
    return *relative.begin() != "..";
}

void ArtifactStager::WriteFile(const std::filesystem::path& path, const std::string& bytes) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw StagingError("Cannot open " + path.string() + " for writing");
    }

    file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    file.close();
    if (!file) {
        throw StagingError("Failed to write " + path.string());
    }
}

} // namespace core
} // namespace codecell
