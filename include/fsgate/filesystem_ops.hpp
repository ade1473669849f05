#pragma once
#include "config.hpp"
#include "fs_types.hpp"
#include "logging.hpp"
#include "path_normalizer.hpp"
#include "path_security.hpp"
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace fsgate {

/// Sandboxed filesystem operations. Every entry point normalizes its path
/// arguments and checks them with the security policy before touching the
/// filesystem; mutating operations first require writes to be enabled.
///
/// Failures are reported as typed exceptions: SecurityError, NotFoundError,
/// InvalidArgumentError, FormatError, or std::filesystem::filesystem_error
/// for I/O failures.
class FilesystemOperations {
public:
    static constexpr std::string_view DEFAULT_SEARCH_PATTERN = R"(.*\.(c|cc|cpp|cxx|h|hh|hpp|hxx)$)";
    static constexpr std::string_view TRUNCATION_MARKER = "... (truncated)";
    static constexpr std::size_t MAX_PATTERN_LENGTH = 1000;

    FilesystemOperations(const ServerConfig& config, const PathNormalizer& normalizer,
                         const PathSecurityPolicy& policy);

    [[nodiscard]] std::string read_file(const std::string& path, const std::string& encoding = "UTF-8") const;

    WriteResult write_file(const std::string& path, const std::string& content,
                           const std::string& encoding = "UTF-8", bool create_backup = false);

    [[nodiscard]] std::vector<FileEntry> list_directory(const std::string& path,
                                                        const std::optional<std::string>& pattern = std::nullopt,
                                                        bool recursive = false) const;

    [[nodiscard]] std::vector<SearchHit> search_files(const std::string& directory,
                                                      const std::string& content_pattern,
                                                      const std::optional<std::string>& file_pattern = std::nullopt) const;

    [[nodiscard]] PathRepresentations normalize_path(const std::string& path) const;

    // ---- Line-oriented reads. Lines longer than max_line_length are cut and marked.

    [[nodiscard]] LineRange read_file_range(const std::string& path, std::int64_t start_line = 1,
                                            std::size_t max_lines = 100, const std::string& encoding = "UTF-8") const;
    [[nodiscard]] LineWindow head_file(const std::string& path, std::size_t lines = 50,
                                       const std::string& encoding = "UTF-8") const;
    [[nodiscard]] LineWindow tail_file(const std::string& path, std::size_t lines = 50,
                                       const std::string& encoding = "UTF-8") const;
    [[nodiscard]] LineCount count_lines(const std::string& path, const std::string& encoding = "UTF-8") const;
    [[nodiscard]] GrepResult grep_file(const std::string& path, const std::string& pattern,
                                       std::size_t max_matches = 100, const std::string& encoding = "UTF-8") const;

    /// Reads at most max_read_multiple files; per-file failures are reported
    /// in the entry rather than thrown.
    [[nodiscard]] std::vector<FileContent> read_multiple_files(const std::vector<std::string>& paths) const;

    // ---- Edits

    /// Creates the file and its parent directories when missing.
    AppendResult append_to_file(const std::string& path, const std::string& content,
                                const std::string& encoding = "UTF-8");

    /// old_text must occur exactly once in the file.
    ReplaceResult replace_in_file(const std::string& path, const std::string& old_text, const std::string& new_text,
                                  const std::string& encoding = "UTF-8", bool create_backup = false);

    // ---- Metadata and queries

    /// Never throws SecurityError; a disallowed path is reported as allowed=false.
    [[nodiscard]] ExistsResult file_exists(const std::string& path) const;
    [[nodiscard]] FileSummary get_file_summary(const std::string& path) const;
    [[nodiscard]] const std::string& project_root() const { return config_.project_root; }

    /// Regular files below directory (default: project root) whose name
    /// contains a match for pattern.
    [[nodiscard]] std::vector<FileEntry> find_files_by_name(const std::string& pattern,
                                                            const std::optional<std::string>& directory = std::nullopt,
                                                            std::size_t max_depth = 5,
                                                            std::size_t max_results = 100) const;

    /// sort_by is "name" (ascending) or "size" (descending).
    [[nodiscard]] std::vector<FileEntry> list_directory_with_sizes(const std::string& path,
                                                                   const std::string& sort_by = "name") const;

    /// Bounded by max_tree_depth and max_tree_files. Exclude patterns must
    /// match a whole entry name.
    [[nodiscard]] TreeNode get_directory_tree(const std::string& path,
                                              const std::vector<std::string>& exclude_patterns = {}) const;

    /// Immediate children, at most min(max_results, max_list_results).
    [[nodiscard]] std::vector<FileEntry> list_children_only(const std::string& path,
                                                            const std::optional<std::string>& pattern = std::nullopt,
                                                            std::size_t max_results = 0) const;

    /// search_files rooted at the project root, at most
    /// min(max_results, max_search_results) files.
    [[nodiscard]] std::vector<SearchHit> search_in_project(const std::string& content_pattern,
                                                           const std::optional<std::string>& file_pattern = std::nullopt,
                                                           std::size_t max_results = 0) const;

    CopyResult copy_file(const std::string& source, const std::string& destination, bool overwrite = false);
    MoveResult move_file(const std::string& source, const std::string& destination, bool overwrite = false);
    DeleteResult delete_file(const std::string& path, bool recursive = false);
    MkdirResult create_directory(const std::string& path);

    [[nodiscard]] FileEntry get_file_info(const std::string& path) const;

    /// Record a poll-mode watch. Event types default to CREATE, MODIFY, DELETE.
    WatchRegistration watch_directory(const std::string& path, const std::vector<std::string>& event_types = {});

    /// Never blocks; the event list is always empty.
    [[nodiscard]] PollResult poll_directory_watch(const std::string& path) const;

    [[nodiscard]] const std::vector<std::string>& allowed_directories() const;
    [[nodiscard]] bool symlinks_allowed() const;

    /// Normalize and check a path. Throws FormatError or SecurityError.
    [[nodiscard]] std::string resolve(const std::string& raw, std::string_view action) const;

private:
    std::vector<SearchHit> search_below(const std::string& normalized, const std::string& content_pattern,
                                        const std::optional<std::string>& file_pattern, std::size_t max_results) const;
    std::string checked_file(const std::string& path, std::string_view action) const;
    std::string checked_directory(const std::string& path, std::string_view action) const;
    std::vector<std::string> read_lines(const std::string& normalized, const std::string& encoding) const;
    std::string clip(std::string line) const;
    TreeNode build_tree(const std::filesystem::path& p, const std::vector<std::regex>& excludes,
                        std::size_t depth, std::size_t& count) const;

    FileEntry describe(const std::filesystem::path& p) const;
    FileEntry describe_or_error(const std::filesystem::path& p) const;

    template <typename Fn>
    auto audited(std::string_view op, const std::string& path, Fn&& body) -> decltype(body());

    const ServerConfig& config_;
    const PathNormalizer& normalizer_;
    const PathSecurityPolicy& policy_;
    AuditLog audit_;
    std::map<std::string, std::vector<std::string>> watches_;
};

} // namespace fsgate
