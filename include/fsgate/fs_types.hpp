#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace fsgate {

// ========== Mutation results ==========

struct WriteResult {
    std::string path;
    std::uintmax_t size = 0;
    std::optional<std::string> backup;
};

struct DeleteResult {
    std::string path;
    bool deleted = false;
};

struct CopyResult {
    std::string source;
    std::string destination;
    std::uintmax_t size = 0;
};

struct MoveResult {
    std::string source;
    std::string destination;
};

struct MkdirResult {
    std::string path;
    bool created = false;
    bool exists = false;
};

// ========== Listing and search ==========

struct FileEntry {
    std::string path;
    std::string name;
    std::string type;       // file, directory, symlink, other, unknown
    std::uintmax_t size = 0;
    std::int64_t last_modified = 0;   // epoch milliseconds
    bool readable = false;
    bool writable = false;
    bool executable = false;
    std::optional<std::string> error;
};

struct LineMatch {
    std::size_t line_number = 0;   // 1-based
    std::string line;
};

struct SearchHit {
    std::string path;
    std::string name;
    std::vector<LineMatch> matches;
};

// ========== Line-oriented reads ==========

/// readFileRange. When start_line is past the end only path, total_lines
/// and error are reported.
struct LineRange {
    std::string path;
    std::size_t start_line = 1;
    std::size_t end_line = 0;
    std::size_t total_lines = 0;
    std::size_t requested_max_lines = 0;
    std::vector<std::string> lines;
    bool truncated = false;
    std::optional<std::string> error;
};

/// headFile and tailFile
struct LineWindow {
    std::string path;
    std::size_t total_lines = 0;
    std::size_t requested_lines = 0;
    std::vector<std::string> lines;
};

struct LineCount {
    std::string path;
    std::size_t line_count = 0;
    std::uintmax_t size = 0;
};

struct GrepResult {
    std::string path;
    std::string pattern;
    std::vector<LineMatch> matches;
    bool truncated = false;
};

/// One entry of readMultipleFiles; exactly one of content / error is set.
struct FileContent {
    std::string path;
    std::optional<std::string> content;
    std::optional<std::string> error;
};

// ========== Edits ==========

struct AppendResult {
    std::string path;
    std::uintmax_t appended_bytes = 0;
    std::uintmax_t file_size = 0;
};

struct ReplaceResult {
    std::string path;
    std::size_t old_length = 0;
    std::size_t new_length = 0;
    std::uintmax_t file_size = 0;
    std::optional<std::string> backup;
};

// ========== Metadata ==========

struct ExistsResult {
    std::string path;
    bool exists = false;
    bool allowed = false;
    bool is_file = false;
    bool is_directory = false;
};

/// getFileSummary. line_count and extension are only filled for regular
/// files below the size limit.
struct FileSummary {
    FileEntry entry;
    std::optional<std::size_t> line_count;
    std::optional<std::string> extension;
};

/// getDirectoryTree node. type is file, directory or truncated; children
/// are emitted for directories only.
struct TreeNode {
    std::string name;
    std::string type;
    std::vector<TreeNode> children;
    std::optional<std::string> message;
};

// ========== Watch ==========

struct WatchRegistration {
    std::string path;
    std::vector<std::string> event_types;
    bool watching = true;
    std::string mode = "poll";
};

struct PollResult {
    std::string path;
    bool watching = false;
    std::vector<nlohmann::json> events;
};

void to_json(nlohmann::json& j, const WriteResult& r);
void to_json(nlohmann::json& j, const DeleteResult& r);
void to_json(nlohmann::json& j, const CopyResult& r);
void to_json(nlohmann::json& j, const MoveResult& r);
void to_json(nlohmann::json& j, const MkdirResult& r);
void to_json(nlohmann::json& j, const FileEntry& e);
void to_json(nlohmann::json& j, const LineMatch& m);
void to_json(nlohmann::json& j, const SearchHit& h);
void to_json(nlohmann::json& j, const LineRange& r);
void to_json(nlohmann::json& j, const LineWindow& w);
void to_json(nlohmann::json& j, const LineCount& c);
void to_json(nlohmann::json& j, const GrepResult& g);
void to_json(nlohmann::json& j, const FileContent& f);
void to_json(nlohmann::json& j, const AppendResult& r);
void to_json(nlohmann::json& j, const ReplaceResult& r);
void to_json(nlohmann::json& j, const ExistsResult& r);
void to_json(nlohmann::json& j, const FileSummary& s);
void to_json(nlohmann::json& j, const TreeNode& n);
void to_json(nlohmann::json& j, const WatchRegistration& w);
void to_json(nlohmann::json& j, const PollResult& p);

} // namespace fsgate
