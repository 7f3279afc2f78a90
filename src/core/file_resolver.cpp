/**
 * @file file_resolver.cpp
 * @brief Implementation of the upload reference resolution chain
 *
 * **Resolution Order** (default chain):
 * 1. Exact name: `uploads/<hint>` exists, or a file is named exactly `hint`
 * 2. Absolute path: `hint` is absolute and exists
 * 3. Substring: lowercase hint is contained in a lowercase file name
 * 4. Keyword glob: hint mentions a domain keyword, try its patterns
 *
 * Listing-based strategies look at regular files directly inside the uploads
 * area, in sorted name order, so equal inputs always resolve identically.
 *
 * @date 2025
 */

#include "codecell/core/file_resolver.hpp"
#include "codecell/core/errors.hpp"
#include "codecell/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

#include <fnmatch.h>

namespace codecell {
namespace core {

using utils::StringUtils;

namespace {

std::vector<std::filesystem::path> ListUploads(const std::filesystem::path& uploads_dir) {
    std::vector<std::filesystem::path> files;
    std::error_code ec;

    if (!std::filesystem::is_directory(uploads_dir, ec)) {
        return files;
    }

    for (const auto& entry : std::filesystem::directory_iterator(uploads_dir, ec)) {
        if (entry.is_regular_file(ec)) {
            files.push_back(entry.path());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

bool IsExistingFile(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

} // anonymous namespace

// ============================================================================
// STRATEGIES
// ============================================================================

std::optional<std::filesystem::path> ExactNameResolver::Resolve(
    const std::string& hint,
    const std::filesystem::path& uploads_dir) const {

    std::filesystem::path relative(hint);
    if (!relative.is_absolute()) {
        auto candidate = uploads_dir / relative;
        if (IsExistingFile(candidate)) {
            return candidate;
        }
    }

    for (const auto& file : ListUploads(uploads_dir)) {
        if (file.filename().string() == hint) {
            return file;
        }
    }

    return std::nullopt;
}

std::optional<std::filesystem::path> AbsolutePathResolver::Resolve(
    const std::string& hint,
    const std::filesystem::path& /*uploads_dir*/) const {

    std::filesystem::path path(hint);
    if (path.is_absolute() && IsExistingFile(path)) {
        return path;
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> SubstringResolver::Resolve(
    const std::string& hint,
    const std::filesystem::path& uploads_dir) const {

    std::string needle = StringUtils::ToLower(hint);
    if (needle.empty()) {
        return std::nullopt;
    }

    for (const auto& file : ListUploads(uploads_dir)) {
        if (StringUtils::Contains(StringUtils::ToLower(file.filename().string()), needle)) {
            return file;
        }
    }

    return std::nullopt;
}

KeywordGlobResolver::KeywordGlobResolver()
    : patterns_(DefaultPatterns()) {
}

KeywordGlobResolver::KeywordGlobResolver(PatternTable patterns)
    : patterns_(std::move(patterns)) {
}

KeywordGlobResolver::PatternTable KeywordGlobResolver::DefaultPatterns() {
    return {
        {"sales",  {"*sales*.csv", "*revenue*.csv", "*orders*.csv"}},
        {"report", {"*report*.pdf", "*report*.xlsx", "*report*.csv"}},
        {"config", {"*config*.json", "*settings*.json", "*conf*.yaml"}},
        {"data",   {"*data*.csv", "*data*.json", "*dataset*.csv"}},
    };
}

std::optional<std::filesystem::path> KeywordGlobResolver::Resolve(
    const std::string& hint,
    const std::filesystem::path& uploads_dir) const {

    std::string lowered = StringUtils::ToLower(hint);
    auto files = ListUploads(uploads_dir);
    if (files.empty()) {
        return std::nullopt;
    }

    for (const auto& [keyword, patterns] : patterns_) {
        if (!StringUtils::Contains(lowered, keyword)) {
            continue;
        }

        for (const auto& pattern : patterns) {
            for (const auto& file : files) {
                if (fnmatch(pattern.c_str(), file.filename().c_str(), 0) == 0) {
                    return file;
                }
            }
        }
    }

    return std::nullopt;
}

// ============================================================================
// CHAIN
// ============================================================================

FileResolver::FileResolver(std::filesystem::path uploads_dir)
    : uploads_dir_(std::move(uploads_dir)) {
}

FileResolver FileResolver::WithDefaultChain(const std::filesystem::path& uploads_dir,
                                            const ResolverOptions& options) {
    FileResolver resolver(uploads_dir);

    if (options.exact) {
        resolver.AddStrategy(std::make_unique<ExactNameResolver>());
    }
    if (options.absolute) {
        resolver.AddStrategy(std::make_unique<AbsolutePathResolver>());
    }
    if (options.substring) {
        resolver.AddStrategy(std::make_unique<SubstringResolver>());
    }
    if (options.keyword) {
        resolver.AddStrategy(std::make_unique<KeywordGlobResolver>());
    }

    return resolver;
}

FileResolver& FileResolver::AddStrategy(std::unique_ptr<ResolverStrategy> strategy) {
    strategies_.push_back(std::move(strategy));
    return *this;
}

std::optional<std::filesystem::path> FileResolver::TryResolve(const std::string& hint) const {
    for (const auto& strategy : strategies_) {
        auto match = strategy->Resolve(hint, uploads_dir_);
        if (match) {
            spdlog::debug("Resolved '{}' via {} strategy: {}", hint, strategy->Name(), match->string());
            return match;
        }
    }

    return std::nullopt;
}

std::filesystem::path FileResolver::Resolve(const std::string& hint) const {
    auto match = TryResolve(hint);
    if (!match) {
        throw UploadNotFoundError("Could not find file matching: " + hint);
    }
    return *match;
}

} // namespace core
} // namespace codecell
