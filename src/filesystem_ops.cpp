#include "fsgate/filesystem_ops.hpp"
#include "fsgate/encoding.hpp"
#include "fsgate/error.hpp"
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <regex>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace fsgate {

namespace {

const std::set<std::string> WATCH_EVENTS = {"CREATE", "MODIFY", "DELETE"};

std::string escape_regex(const std::string& literal) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    for (char c : literal) {
        if (special.find(c) != std::string::npos) out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

// Invalid patterns degrade to a literal match
std::regex compile_pattern(const std::string& pattern) {
    if (pattern.size() > FilesystemOperations::MAX_PATTERN_LENGTH) {
        throw InvalidArgumentError("Pattern too long: " + std::to_string(pattern.size()) + " characters (max: "
                                   + std::to_string(FilesystemOperations::MAX_PATTERN_LENGTH) + ")");
    }
    try {
        return std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        spdlog::warn("Invalid regex '{}' ({}), matching it literally", pattern, e.what());
        return std::regex(escape_regex(pattern), std::regex::ECMAScript);
    }
}

bool cut_line(std::string& line, std::size_t limit) {
    if (line.size() <= limit) return false;
    line.resize(limit);
    return true;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        start = end + 1;
    }
    return lines;
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool exists_nofollow(const fs::path& p) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(p, ec));
}

bool is_regular_nofollow(const fs::directory_entry& entry) {
    std::error_code ec;
    return fs::is_regular_file(entry.symlink_status(ec));
}

std::string read_bytes(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) {
        throw fs::filesystem_error("Cannot open file", p, std::error_code(errno, std::generic_category()));
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        throw fs::filesystem_error("Cannot read file", p, std::make_error_code(std::errc::io_error));
    }
    return buf.str();
}

void write_bytes(const fs::path& p, const std::string& bytes) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw fs::filesystem_error("Cannot open file for writing", p,
                                   std::error_code(errno, std::generic_category()));
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
        throw fs::filesystem_error("Cannot write file", p, std::make_error_code(std::errc::io_error));
    }
}

std::size_t depth(const fs::path& p) {
    return static_cast<std::size_t>(std::distance(p.begin(), p.end()));
}

} // anonymous namespace

FilesystemOperations::FilesystemOperations(const ServerConfig& config, const PathNormalizer& normalizer,
                                           const PathSecurityPolicy& policy)
    : config_(config), normalizer_(normalizer), policy_(policy) {}

template <typename Fn>
auto FilesystemOperations::audited(std::string_view op, const std::string& path, Fn&& body)
    -> decltype(body()) {
    try {
        auto result = body();
        audit_.file_operation(op, path, true);
        return result;
    } catch (const std::exception& e) {
        audit_.file_operation(op, path, false, e.what());
        throw;
    }
}

std::string FilesystemOperations::resolve(const std::string& raw, std::string_view action) const {
    std::string normalized = normalizer_.normalize(raw);
    policy_.check(normalized, action);
    return normalized;
}

const std::vector<std::string>& FilesystemOperations::allowed_directories() const {
    return policy_.allowed_directories();
}

bool FilesystemOperations::symlinks_allowed() const {
    return policy_.symlinks_allowed();
}

// ========== Attributes ==========

FileEntry FilesystemOperations::describe(const fs::path& p) const {
    struct stat sb {};
    if (::lstat(p.c_str(), &sb) != 0) {
        throw fs::filesystem_error("lstat", p, std::error_code(errno, std::generic_category()));
    }

    FileEntry e;
    e.path = p.generic_string();
    e.name = p.filename().generic_string();
    if (S_ISREG(sb.st_mode)) {
        e.type = "file";
        e.size = static_cast<std::uintmax_t>(sb.st_size);
    } else if (S_ISDIR(sb.st_mode)) {
        e.type = "directory";
    } else if (S_ISLNK(sb.st_mode)) {
        e.type = "symlink";
    } else {
        e.type = "other";
    }
    e.last_modified = static_cast<std::int64_t>(sb.st_mtime) * 1000;
    e.readable = ::access(p.c_str(), R_OK) == 0;
    e.writable = ::access(p.c_str(), W_OK) == 0;
    e.executable = ::access(p.c_str(), X_OK) == 0;
    return e;
}

FileEntry FilesystemOperations::describe_or_error(const fs::path& p) const {
    try {
        return describe(p);
    } catch (const fs::filesystem_error& ex) {
        spdlog::warn("Cannot stat {}: {}", p.generic_string(), ex.what());
        FileEntry e;
        e.path = p.generic_string();
        e.name = p.filename().generic_string();
        e.type = "unknown";
        e.error = ex.code().message();
        return e;
    }
}

// ========== Read ==========

std::string FilesystemOperations::read_file(const std::string& path, const std::string& encoding) const {
    Encoding enc = parse_encoding(encoding);
    std::string normalized = resolve(path, "readFile");
    fs::path p(normalized);

    if (!fs::exists(p)) throw NotFoundError("File not found: " + normalized);
    if (!fs::is_regular_file(p)) throw InvalidArgumentError("Path is not a file: " + normalized);

    std::uintmax_t size = fs::file_size(p);
    if (size > config_.max_file_size_bytes()) {
        throw InvalidArgumentError("File too large: " + std::to_string(size) + " bytes (max: "
                                   + std::to_string(config_.max_file_size_mb) + "MB)");
    }
    return decode_text(read_bytes(p), enc);
}

FileEntry FilesystemOperations::get_file_info(const std::string& path) const {
    std::string normalized = resolve(path, "getFileInfo");
    if (!exists_nofollow(normalized)) throw NotFoundError("File not found: " + normalized);
    return describe(normalized);
}

// ========== Write ==========

WriteResult FilesystemOperations::write_file(const std::string& path, const std::string& content,
                                             const std::string& encoding, bool create_backup) {
    policy_.require_write("writeFile", path);
    std::string normalized = resolve(path, "writeFile");

    return audited("writeFile", normalized, [&]() {
        std::string bytes = encode_text(content, parse_encoding(encoding));
        if (bytes.size() > config_.max_file_size_bytes()) {
            throw InvalidArgumentError("Content too large: " + std::to_string(bytes.size()) + " bytes (max: "
                                       + std::to_string(config_.max_file_size_mb) + "MB)");
        }

        fs::path p(normalized);
        if (fs::is_directory(p)) throw InvalidArgumentError("Path is a directory: " + normalized);
        if (!fs::is_directory(p.parent_path())) {
            throw NotFoundError("Parent directory not found: " + p.parent_path().generic_string());
        }

        WriteResult result;
        result.path = normalized;
        if (create_backup && fs::exists(p)) {
            std::string backup = resolve(normalized + ".backup", "writeFile");
            fs::copy_file(p, backup, fs::copy_options::overwrite_existing);
            result.backup = backup;
        }

        write_bytes(p, bytes);
        result.size = fs::file_size(p);
        return result;
    });
}

// ========== List and search ==========

std::vector<FileEntry> FilesystemOperations::list_directory(const std::string& path,
                                                            const std::optional<std::string>& pattern,
                                                            bool recursive) const {
    std::string normalized = resolve(path, "listDirectory");
    fs::path dir(normalized);
    if (!fs::exists(dir)) throw NotFoundError("Directory not found: " + normalized);
    if (!fs::is_directory(dir)) throw InvalidArgumentError("Path is not a directory: " + normalized);

    std::optional<std::regex> name_re;
    if (pattern && !pattern->empty()) name_re = compile_pattern(*pattern);

    auto accept = [&](const fs::path& p) {
        std::string name = p.filename().generic_string();
        if (PathSecurityPolicy::is_reserved_name(name)) return false;
        return !name_re || std::regex_match(name, *name_re);
    };

    std::vector<FileEntry> entries;
    std::error_code ec;
    if (recursive) {
        fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (is_regular_nofollow(*it) && accept(it->path())) {
                entries.push_back(describe_or_error(it->path()));
            }
        }
    } else {
        fs::directory_iterator it(dir, ec);
        for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
            if (accept(it->path())) entries.push_back(describe_or_error(it->path()));
        }
    }
    if (ec) spdlog::warn("Listing of {} stopped early: {}", normalized, ec.message());

    std::sort(entries.begin(), entries.end(),
              [](const FileEntry& a, const FileEntry& b) { return a.path < b.path; });
    return entries;
}

std::vector<SearchHit> FilesystemOperations::search_files(const std::string& directory,
                                                          const std::string& content_pattern,
                                                          const std::optional<std::string>& file_pattern) const {
    std::string normalized = checked_directory(directory, "searchFiles");
    return search_below(normalized, content_pattern, file_pattern, config_.max_search_results);
}

std::vector<SearchHit> FilesystemOperations::search_in_project(const std::string& content_pattern,
                                                               const std::optional<std::string>& file_pattern,
                                                               std::size_t max_results) const {
    std::string normalized = checked_directory(config_.project_root, "searchInProject");
    std::size_t limit = max_results > 0 ? std::min(max_results, config_.max_search_results)
                                        : config_.max_search_results;
    return search_below(normalized, content_pattern, file_pattern, limit);
}

std::vector<SearchHit> FilesystemOperations::search_below(const std::string& normalized,
                                                          const std::string& content_pattern,
                                                          const std::optional<std::string>& file_pattern,
                                                          std::size_t max_results) const {
    std::regex content_re = compile_pattern(content_pattern);
    std::regex name_re = compile_pattern(file_pattern && !file_pattern->empty()
                                             ? *file_pattern
                                             : std::string(DEFAULT_SEARCH_PATTERN));

    std::vector<fs::path> candidates;
    std::error_code ec;
    fs::recursive_directory_iterator it(normalized, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (!is_regular_nofollow(*it)) continue;
        std::string name = it->path().filename().generic_string();
        if (PathSecurityPolicy::is_reserved_name(name)) continue;
        if (std::regex_match(name, name_re)) candidates.push_back(it->path());
    }
    if (ec) spdlog::warn("Search walk of {} stopped early: {}", normalized, ec.message());
    std::sort(candidates.begin(), candidates.end());

    std::vector<SearchHit> hits;
    for (const auto& file : candidates) {
        if (hits.size() >= max_results) break;

        std::error_code size_ec;
        auto size = fs::file_size(file, size_ec);
        if (size_ec || size > config_.max_file_size_bytes()) {
            spdlog::debug("Skipping {} during search: too large or unreadable", file.generic_string());
            continue;
        }

        std::ifstream in(file, std::ios::binary);
        if (!in) {
            spdlog::warn("Error reading file {}: {}", file.generic_string(),
                         std::error_code(errno, std::generic_category()).message());
            continue;
        }

        SearchHit hit;
        hit.path = file.generic_string();
        hit.name = file.filename().generic_string();
        std::string line;
        std::size_t number = 0;
        while (std::getline(in, line)) {
            ++number;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            // The regex only sees the first max_line_length bytes
            bool cut = cut_line(line, config_.max_line_length);
            if (!std::regex_search(line, content_re)) continue;
            if (cut) line += TRUNCATION_MARKER;
            hit.matches.push_back(LineMatch{number, line});
        }
        if (in.bad()) {
            spdlog::warn("Error reading file {}", file.generic_string());
            continue;
        }
        if (!hit.matches.empty()) hits.push_back(std::move(hit));
    }
    return hits;
}

PathRepresentations FilesystemOperations::normalize_path(const std::string& path) const {
    return normalizer_.representations(path);
}

// ========== Line-oriented reads ==========

std::string FilesystemOperations::checked_file(const std::string& path, std::string_view action) const {
    std::string normalized = resolve(path, action);
    if (!fs::exists(normalized)) throw NotFoundError("File not found: " + normalized);
    if (!fs::is_regular_file(normalized)) throw InvalidArgumentError("Path is not a file: " + normalized);
    return normalized;
}

std::string FilesystemOperations::checked_directory(const std::string& path, std::string_view action) const {
    std::string normalized = resolve(path, action);
    if (!fs::exists(normalized)) throw NotFoundError("Directory not found: " + normalized);
    if (!fs::is_directory(normalized)) throw InvalidArgumentError("Path is not a directory: " + normalized);
    return normalized;
}

std::vector<std::string> FilesystemOperations::read_lines(const std::string& normalized,
                                                          const std::string& encoding) const {
    Encoding enc = parse_encoding(encoding);
    std::uintmax_t size = fs::file_size(normalized);
    if (size > config_.max_file_size_bytes()) {
        throw InvalidArgumentError("File too large: " + std::to_string(size) + " bytes (max: "
                                   + std::to_string(config_.max_file_size_mb) + "MB)");
    }
    return split_lines(decode_text(read_bytes(normalized), enc));
}

std::string FilesystemOperations::clip(std::string line) const {
    if (cut_line(line, config_.max_line_length)) line += TRUNCATION_MARKER;
    return line;
}

LineRange FilesystemOperations::read_file_range(const std::string& path, std::int64_t start_line,
                                                std::size_t max_lines, const std::string& encoding) const {
    std::string normalized = checked_file(path, "readFileRange");
    auto all = read_lines(normalized, encoding);

    LineRange range;
    range.path = normalized;
    range.total_lines = all.size();
    range.requested_max_lines = max_lines;
    range.start_line = start_line < 1 ? 1 : static_cast<std::size_t>(start_line);

    if (range.start_line > all.size()) {
        range.error = "Start line " + std::to_string(start_line) + " exceeds file length "
                      + std::to_string(all.size());
        return range;
    }

    for (std::size_t i = range.start_line - 1; i < all.size() && range.lines.size() < max_lines; ++i) {
        range.lines.push_back(clip(std::move(all[i])));
    }
    range.end_line = range.start_line + range.lines.size() - 1;
    range.truncated = range.end_line < range.total_lines;
    return range;
}

LineWindow FilesystemOperations::head_file(const std::string& path, std::size_t lines,
                                           const std::string& encoding) const {
    std::string normalized = checked_file(path, "headFile");
    auto all = read_lines(normalized, encoding);

    LineWindow window{normalized, all.size(), lines, {}};
    for (std::size_t i = 0; i < all.size() && i < lines; ++i) {
        window.lines.push_back(clip(std::move(all[i])));
    }
    return window;
}

LineWindow FilesystemOperations::tail_file(const std::string& path, std::size_t lines,
                                           const std::string& encoding) const {
    std::string normalized = checked_file(path, "tailFile");
    auto all = read_lines(normalized, encoding);

    LineWindow window{normalized, all.size(), lines, {}};
    std::size_t first = all.size() > lines ? all.size() - lines : 0;
    for (std::size_t i = first; i < all.size(); ++i) {
        window.lines.push_back(clip(std::move(all[i])));
    }
    return window;
}

LineCount FilesystemOperations::count_lines(const std::string& path, const std::string& encoding) const {
    std::string normalized = checked_file(path, "countLines");
    auto all = read_lines(normalized, encoding);
    return LineCount{normalized, all.size(), fs::file_size(normalized)};
}

GrepResult FilesystemOperations::grep_file(const std::string& path, const std::string& pattern,
                                           std::size_t max_matches, const std::string& encoding) const {
    std::string normalized = checked_file(path, "grepFile");
    std::regex re = compile_pattern(pattern);
    auto all = read_lines(normalized, encoding);

    GrepResult result;
    result.path = normalized;
    result.pattern = pattern;
    for (std::size_t i = 0; i < all.size() && result.matches.size() < max_matches; ++i) {
        std::string& line = all[i];
        bool cut = cut_line(line, config_.max_line_length);
        if (!std::regex_search(line, re)) continue;
        if (cut) line += TRUNCATION_MARKER;
        result.matches.push_back(LineMatch{i + 1, std::move(line)});
    }
    result.truncated = result.matches.size() >= max_matches;
    return result;
}

std::vector<FileContent> FilesystemOperations::read_multiple_files(const std::vector<std::string>& paths) const {
    std::size_t count = paths.size();
    if (count > config_.max_read_multiple) {
        spdlog::warn("readMultipleFiles limited to {} files (requested: {})", config_.max_read_multiple, count);
        count = config_.max_read_multiple;
    }

    std::vector<FileContent> out;
    for (std::size_t i = 0; i < count; ++i) {
        FileContent entry;
        entry.path = paths[i];
        try {
            entry.content = read_file(paths[i]);
        } catch (const std::exception& e) {
            spdlog::warn("Failed to read {}: {}", paths[i], e.what());
            entry.error = e.what();
        }
        out.push_back(std::move(entry));
    }
    return out;
}

// ========== Edits ==========

AppendResult FilesystemOperations::append_to_file(const std::string& path, const std::string& content,
                                                  const std::string& encoding) {
    policy_.require_write("appendToFile", path);
    std::string normalized = resolve(path, "appendToFile");

    return audited("appendToFile", normalized, [&]() {
        std::string bytes = encode_text(content, parse_encoding(encoding));

        fs::path p(normalized);
        if (fs::is_directory(p)) throw InvalidArgumentError("Path is a directory: " + normalized);
        std::uintmax_t existing = fs::exists(p) ? fs::file_size(p) : 0;
        if (existing + bytes.size() > config_.max_file_size_bytes()) {
            throw InvalidArgumentError("File would exceed the size limit of "
                                       + std::to_string(config_.max_file_size_mb) + "MB");
        }
        fs::create_directories(p.parent_path());

        std::ofstream out(p, std::ios::binary | std::ios::app);
        if (!out) {
            throw fs::filesystem_error("Cannot open file for appending", p,
                                       std::error_code(errno, std::generic_category()));
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.close();
        if (!out) throw fs::filesystem_error("Cannot append to file", p, std::make_error_code(std::errc::io_error));

        return AppendResult{normalized, bytes.size(), fs::file_size(p)};
    });
}

ReplaceResult FilesystemOperations::replace_in_file(const std::string& path, const std::string& old_text,
                                                    const std::string& new_text, const std::string& encoding,
                                                    bool create_backup) {
    policy_.require_write("replaceInFile", path);
    std::string normalized = checked_file(path, "replaceInFile");

    return audited("replaceInFile", normalized, [&]() {
        if (old_text.empty()) throw InvalidArgumentError("oldText must not be empty");
        Encoding enc = parse_encoding(encoding);
        std::string text = decode_text(read_bytes(normalized), enc);

        std::size_t count = 0;
        std::size_t at = std::string::npos;
        for (std::size_t pos = text.find(old_text); pos != std::string::npos;
             pos = text.find(old_text, pos + old_text.size())) {
            if (count++ == 0) at = pos;
        }
        if (count == 0) {
            std::string preview = old_text.size() > 100 ? old_text.substr(0, 100) + "..." : old_text;
            throw InvalidArgumentError("oldText not found in file. First 100 chars of search text: '"
                                       + preview + "'");
        }
        if (count > 1) {
            throw InvalidArgumentError("oldText found " + std::to_string(count)
                                       + " times in file - must be unique. Include more surrounding context.");
        }

        text.replace(at, old_text.size(), new_text);
        std::string bytes = encode_text(text, enc);
        if (bytes.size() > config_.max_file_size_bytes()) {
            throw InvalidArgumentError("Content too large: " + std::to_string(bytes.size()) + " bytes (max: "
                                       + std::to_string(config_.max_file_size_mb) + "MB)");
        }

        ReplaceResult result;
        result.path = normalized;
        result.old_length = old_text.size();
        result.new_length = new_text.size();
        if (create_backup) {
            std::string backup = resolve(normalized + ".backup", "replaceInFile");
            fs::copy_file(normalized, backup, fs::copy_options::overwrite_existing);
            result.backup = backup;
        }
        write_bytes(normalized, bytes);
        result.file_size = fs::file_size(normalized);
        return result;
    });
}

// ========== Metadata and queries ==========

ExistsResult FilesystemOperations::file_exists(const std::string& path) const {
    ExistsResult result;
    result.path = normalizer_.normalize(path);
    result.allowed = policy_.is_allowed(result.path);
    // Nothing outside the allowed roots is examined
    if (!result.allowed) return result;

    std::error_code ec;
    auto status = fs::status(result.path, ec);
    result.exists = !ec && fs::exists(status);
    result.is_file = result.exists && fs::is_regular_file(status);
    result.is_directory = result.exists && fs::is_directory(status);
    return result;
}

FileSummary FilesystemOperations::get_file_summary(const std::string& path) const {
    std::string normalized = resolve(path, "getFileSummary");
    if (!exists_nofollow(normalized)) throw NotFoundError("File not found: " + normalized);

    FileSummary summary;
    summary.entry = describe(normalized);
    if (summary.entry.type == "file" && summary.entry.size < config_.max_file_size_bytes()) {
        std::string bytes = read_bytes(normalized);
        std::size_t lines = static_cast<std::size_t>(std::count(bytes.begin(), bytes.end(), '\n'));
        if (!bytes.empty() && bytes.back() != '\n') ++lines;
        summary.line_count = lines;

        const std::string& name = summary.entry.name;
        auto dot = name.rfind('.');
        summary.extension = dot == std::string::npos ? std::string() : lowercase(name.substr(dot + 1));
    }
    return summary;
}

std::vector<FileEntry> FilesystemOperations::find_files_by_name(const std::string& pattern,
                                                                const std::optional<std::string>& directory,
                                                                std::size_t max_depth,
                                                                std::size_t max_results) const {
    std::string normalized = checked_directory(directory && !directory->empty() ? *directory : config_.project_root,
                                               "findFilesByName");
    std::regex name_re = compile_pattern(pattern);
    std::size_t limit = std::min(max_results, config_.max_list_results);

    std::vector<fs::path> found;
    std::error_code ec;
    fs::recursive_directory_iterator it(normalized, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        // depth() is 0 for direct children
        if (static_cast<std::size_t>(it.depth()) + 1 >= max_depth) it.disable_recursion_pending();
        if (!is_regular_nofollow(*it)) continue;
        std::string name = it->path().filename().generic_string();
        if (PathSecurityPolicy::is_reserved_name(name)) continue;
        if (std::regex_search(name, name_re)) found.push_back(it->path());
    }
    if (ec) spdlog::warn("Name search of {} stopped early: {}", normalized, ec.message());

    std::sort(found.begin(), found.end());
    if (found.size() > limit) found.resize(limit);

    std::vector<FileEntry> entries;
    for (const auto& p : found) entries.push_back(describe_or_error(p));
    return entries;
}

std::vector<FileEntry> FilesystemOperations::list_directory_with_sizes(const std::string& path,
                                                                       const std::string& sort_by) const {
    if (sort_by != "name" && sort_by != "size") {
        throw InvalidArgumentError("sortBy must be 'name' or 'size', got '" + sort_by + "'");
    }
    std::string normalized = checked_directory(path, "listDirectoryWithSizes");

    std::vector<FileEntry> entries;
    std::error_code ec;
    fs::directory_iterator it(normalized, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        if (PathSecurityPolicy::is_reserved_name(it->path().filename().generic_string())) continue;
        entries.push_back(describe_or_error(it->path()));
    }
    if (ec) spdlog::warn("Listing of {} stopped early: {}", normalized, ec.message());

    if (sort_by == "size") {
        std::stable_sort(entries.begin(), entries.end(), [](const FileEntry& a, const FileEntry& b) {
            return a.size != b.size ? a.size > b.size : a.name < b.name;
        });
    } else {
        std::sort(entries.begin(), entries.end(),
                  [](const FileEntry& a, const FileEntry& b) { return a.name < b.name; });
    }
    return entries;
}

TreeNode FilesystemOperations::get_directory_tree(const std::string& path,
                                                  const std::vector<std::string>& exclude_patterns) const {
    std::string normalized = checked_directory(path, "getDirectoryTree");
    std::vector<std::regex> excludes;
    for (const auto& p : exclude_patterns) excludes.push_back(compile_pattern(p));

    std::size_t count = 0;
    return build_tree(normalized, excludes, 0, count);
}

TreeNode FilesystemOperations::build_tree(const fs::path& p, const std::vector<std::regex>& excludes,
                                          std::size_t depth, std::size_t& count) const {
    TreeNode node;
    node.name = p.has_filename() ? p.filename().generic_string() : p.generic_string();

    std::error_code ec;
    bool is_dir = fs::is_directory(fs::symlink_status(p, ec));
    if (is_dir && depth >= config_.max_tree_depth) {
        node.type = "truncated";
        node.message = "Max depth (" + std::to_string(config_.max_tree_depth) + ") reached";
        return node;
    }
    node.type = is_dir ? "directory" : "file";
    ++count;
    if (!is_dir) return node;

    std::vector<fs::path> children;
    fs::directory_iterator it(p, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) children.push_back(it->path());
    if (ec) spdlog::warn("Error reading directory {}: {}", p.generic_string(), ec.message());
    std::sort(children.begin(), children.end());

    for (const auto& child : children) {
        std::string name = child.filename().generic_string();
        if (PathSecurityPolicy::is_reserved_name(name)) continue;
        bool excluded = std::any_of(excludes.begin(), excludes.end(),
                                    [&](const std::regex& re) { return std::regex_match(name, re); });
        if (excluded) continue;
        if (count >= config_.max_tree_files) {
            TreeNode marker;
            marker.name = "... (truncated)";
            marker.type = "truncated";
            marker.message = "Max files (" + std::to_string(config_.max_tree_files) + ") reached";
            node.children.push_back(std::move(marker));
            break;
        }
        node.children.push_back(build_tree(child, excludes, depth + 1, count));
    }
    return node;
}

std::vector<FileEntry> FilesystemOperations::list_children_only(const std::string& path,
                                                                const std::optional<std::string>& pattern,
                                                                std::size_t max_results) const {
    std::string normalized = checked_directory(path, "listChildrenOnly");
    std::size_t limit = max_results > 0 ? std::min(max_results, config_.max_list_results)
                                        : config_.max_list_results;

    std::optional<std::regex> name_re;
    if (pattern && !pattern->empty()) name_re = compile_pattern(*pattern);

    std::vector<fs::path> children;
    std::error_code ec;
    fs::directory_iterator it(normalized, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::string name = it->path().filename().generic_string();
        if (PathSecurityPolicy::is_reserved_name(name)) continue;
        if (name_re && !std::regex_match(name, *name_re)) continue;
        children.push_back(it->path());
    }
    if (ec) spdlog::warn("Listing of {} stopped early: {}", normalized, ec.message());

    std::sort(children.begin(), children.end());
    if (children.size() > limit) children.resize(limit);

    std::vector<FileEntry> entries;
    for (const auto& p : children) entries.push_back(describe_or_error(p));
    return entries;
}

// ========== Copy, move, delete, mkdir ==========

CopyResult FilesystemOperations::copy_file(const std::string& source, const std::string& destination,
                                           bool overwrite) {
    policy_.require_write("copyFile", source);
    std::string src = resolve(source, "copyFile");
    std::string dst = resolve(destination, "copyFile");

    return audited("copyFile", src + " -> " + dst, [&]() {
        if (!fs::exists(src)) throw NotFoundError("Source not found: " + src);
        if (!fs::is_regular_file(src)) throw InvalidArgumentError("Source is not a file: " + src);
        if (exists_nofollow(dst)) {
            if (fs::is_directory(dst)) throw InvalidArgumentError("Destination is a directory: " + dst);
            if (!overwrite) throw InvalidArgumentError("Destination already exists: " + dst);
        }

        fs::copy_file(src, dst, overwrite ? fs::copy_options::overwrite_existing : fs::copy_options::none);
        return CopyResult{src, dst, fs::file_size(dst)};
    });
}

MoveResult FilesystemOperations::move_file(const std::string& source, const std::string& destination,
                                           bool overwrite) {
    policy_.require_write("moveFile", source);
    std::string src = resolve(source, "moveFile");
    std::string dst = resolve(destination, "moveFile");

    return audited("moveFile", src + " -> " + dst, [&]() {
        if (!exists_nofollow(src)) throw NotFoundError("Source not found: " + src);
        if (exists_nofollow(dst) && !overwrite) {
            throw InvalidArgumentError("Destination already exists: " + dst);
        }
        fs::rename(src, dst);
        return MoveResult{src, dst};
    });
}

DeleteResult FilesystemOperations::delete_file(const std::string& path, bool recursive) {
    policy_.require_write("deleteFile", path);
    std::string normalized = resolve(path, "deleteFile");

    return audited("deleteFile", normalized, [&]() {
        fs::path root(normalized);
        if (!exists_nofollow(root)) throw NotFoundError("File not found: " + normalized);

        std::error_code ec;
        bool is_dir = fs::is_directory(fs::symlink_status(root, ec));
        if (is_dir && !recursive && !fs::is_empty(root)) {
            throw InvalidArgumentError("Directory not empty: " + normalized + " (set recursive to delete it)");
        }

        if (is_dir && recursive) {
            std::vector<fs::path> entries;
            fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
            for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
                entries.push_back(it->path());
            }
            if (ec) spdlog::warn("Walk of {} stopped early: {}", normalized, ec.message());

            // Deepest entries first so directories are empty when reached
            std::stable_sort(entries.begin(), entries.end(), [](const fs::path& a, const fs::path& b) {
                return depth(a) > depth(b);
            });
            for (const auto& entry : entries) {
                std::error_code rm_ec;
                fs::remove(entry, rm_ec);
                if (rm_ec) spdlog::warn("Failed to delete {}: {}", entry.generic_string(), rm_ec.message());
            }
        }

        std::error_code rm_ec;
        fs::remove(root, rm_ec);
        if (rm_ec) spdlog::warn("Failed to delete {}: {}", normalized, rm_ec.message());

        return DeleteResult{normalized, !exists_nofollow(root)};
    });
}

MkdirResult FilesystemOperations::create_directory(const std::string& path) {
    policy_.require_write("createDirectory", path);
    std::string normalized = resolve(path, "createDirectory");

    return audited("createDirectory", normalized, [&]() {
        fs::path p(normalized);
        if (fs::exists(p) && !fs::is_directory(p)) {
            throw InvalidArgumentError("Path exists and is not a directory: " + normalized);
        }
        bool created = fs::create_directories(p);
        return MkdirResult{normalized, created, fs::is_directory(p)};
    });
}

// ========== Watch ==========

WatchRegistration FilesystemOperations::watch_directory(const std::string& path,
                                                        const std::vector<std::string>& event_types) {
    std::string normalized = resolve(path, "watchDirectory");
    if (!fs::exists(normalized)) throw NotFoundError("Directory not found: " + normalized);
    if (!fs::is_directory(normalized)) throw InvalidArgumentError("Path is not a directory: " + normalized);

    std::vector<std::string> kinds;
    for (const auto& kind : event_types) {
        if (WATCH_EVENTS.count(kind) == 0) {
            throw InvalidArgumentError("Unknown event type: " + kind + " (expected CREATE, MODIFY or DELETE)");
        }
        if (std::find(kinds.begin(), kinds.end(), kind) == kinds.end()) kinds.push_back(kind);
    }
    if (kinds.empty()) kinds = {"CREATE", "MODIFY", "DELETE"};

    watches_[normalized] = kinds;
    spdlog::debug("Registered poll watch on {}", normalized);

    WatchRegistration reg;
    reg.path = normalized;
    reg.event_types = std::move(kinds);
    return reg;
}

PollResult FilesystemOperations::poll_directory_watch(const std::string& path) const {
    std::string normalized = resolve(path, "pollDirectoryWatch");
    PollResult result;
    result.path = normalized;
    result.watching = watches_.count(normalized) > 0;
    return result;
}

} // namespace fsgate
