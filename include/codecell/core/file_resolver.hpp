/**
 * @file file_resolver.hpp
 * @brief Best-effort lookup of loosely named upload references
 *
 * Callers often name input files vaguely ("the sales data", "report.PDF").
 * The resolver turns such hints into a concrete host file by trying an
 * ordered chain of strategies; the first strategy that finds a file wins.
 *
 * This is a convenience for the uploads area convention, NOT a security
 * boundary: an absolute path that exists on the host is accepted as-is.
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace codecell {
namespace core {

/**
 * @class ResolverStrategy
 * @brief One link in the resolution chain
 */
class ResolverStrategy {
public:
    virtual ~ResolverStrategy() = default;

    /**
     * @brief Try to resolve a hint
     * @param hint Reference as written in the request
     * @param uploads_dir Conventional uploads area
     * @return Matching host file, or nullopt
     */
    virtual std::optional<std::filesystem::path> Resolve(
        const std::string& hint,
        const std::filesystem::path& uploads_dir) const = 0;

    /// Short name for logging
    virtual std::string Name() const = 0;
};

/// File in the uploads area whose name (or relative path) equals the hint
class ExactNameResolver : public ResolverStrategy {
public:
    std::optional<std::filesystem::path> Resolve(
        const std::string& hint,
        const std::filesystem::path& uploads_dir) const override;
    std::string Name() const override { return "exact"; }
};

/// Absolute host path that exists
class AbsolutePathResolver : public ResolverStrategy {
public:
    std::optional<std::filesystem::path> Resolve(
        const std::string& hint,
        const std::filesystem::path& uploads_dir) const override;
    std::string Name() const override { return "absolute"; }
};

/// Case-insensitive substring of an uploaded file name
class SubstringResolver : public ResolverStrategy {
public:
    std::optional<std::filesystem::path> Resolve(
        const std::string& hint,
        const std::filesystem::path& uploads_dir) const override;
    std::string Name() const override { return "substring"; }
};

/**
 * @class KeywordGlobResolver
 * @brief Domain keyword → glob pattern heuristics
 *
 * A hint containing a keyword (case-insensitive) is matched against that
 * keyword's glob patterns in order, e.g. "sales" → `*sales*.csv`,
 * `*revenue*.csv`, `*orders*.csv`.
 */
class KeywordGlobResolver : public ResolverStrategy {
public:
    using PatternTable = std::vector<std::pair<std::string, std::vector<std::string>>>;

    KeywordGlobResolver();
    explicit KeywordGlobResolver(PatternTable patterns);

    std::optional<std::filesystem::path> Resolve(
        const std::string& hint,
        const std::filesystem::path& uploads_dir) const override;
    std::string Name() const override { return "keyword"; }

    /// Built-in sales/report/config/data table
    static PatternTable DefaultPatterns();

private:
    PatternTable patterns_;
};

/**
 * @struct ResolverOptions
 * @brief Which strategies make up the default chain
 */
struct ResolverOptions {
    bool exact{true};
    bool absolute{true};
    bool substring{true};
    bool keyword{true};
};

/**
 * @class FileResolver
 * @brief Ordered, first-match chain of ResolverStrategy objects
 *
 * **Usage Example**:
 * @code
 * auto resolver = FileResolver::WithDefaultChain("./uploads");
 * auto path = resolver.Resolve("sales");   // ./uploads/q3_revenue.csv
 * @endcode
 */
class FileResolver {
public:
    explicit FileResolver(std::filesystem::path uploads_dir);

    FileResolver(FileResolver&&) = default;
    FileResolver& operator=(FileResolver&&) = default;

    /**
     * @brief Build the standard chain: exact → absolute → substring → keyword
     */
    static FileResolver WithDefaultChain(const std::filesystem::path& uploads_dir,
                                         const ResolverOptions& options = ResolverOptions{});

    /// Append a strategy to the end of the chain
    FileResolver& AddStrategy(std::unique_ptr<ResolverStrategy> strategy);

    std::optional<std::filesystem::path> TryResolve(const std::string& hint) const;

    /**
     * @brief Resolve or fail
     * @throws UploadNotFoundError if no strategy matches
     */
    std::filesystem::path Resolve(const std::string& hint) const;

    const std::filesystem::path& UploadsDirectory() const { return uploads_dir_; }
    std::size_t StrategyCount() const { return strategies_.size(); }

private:
    std::filesystem::path uploads_dir_;
    std::vector<std::unique_ptr<ResolverStrategy>> strategies_;
};

} // namespace core
} // namespace codecell
