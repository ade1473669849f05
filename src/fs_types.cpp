#include "fsgate/fs_types.hpp"

namespace fsgate {

void to_json(nlohmann::json& j, const WriteResult& r) {
    j = nlohmann::json{{"path", r.path}, {"size", r.size}};
    if (r.backup) {
        j["backup"] = *r.backup;
    } else {
        j["backup"] = nullptr;
    }
}

void to_json(nlohmann::json& j, const DeleteResult& r) {
    j = nlohmann::json{{"path", r.path}, {"deleted", r.deleted}};
}

void to_json(nlohmann::json& j, const CopyResult& r) {
    j = nlohmann::json{{"source", r.source}, {"destination", r.destination}, {"size", r.size}};
}

void to_json(nlohmann::json& j, const MoveResult& r) {
    j = nlohmann::json{{"source", r.source}, {"destination", r.destination}};
}

void to_json(nlohmann::json& j, const MkdirResult& r) {
    j = nlohmann::json{{"path", r.path}, {"created", r.created}, {"exists", r.exists}};
}

void to_json(nlohmann::json& j, const FileEntry& e) {
    j = nlohmann::json{
        {"path", e.path},
        {"name", e.name},
        {"type", e.type},
        {"size", e.size},
        {"lastModified", e.last_modified},
        {"readable", e.readable},
        {"writable", e.writable},
        {"executable", e.executable}
    };
    if (e.error) j["error"] = *e.error;
}

void to_json(nlohmann::json& j, const LineMatch& m) {
    j = nlohmann::json{{"lineNumber", m.line_number}, {"line", m.line}};
}

void to_json(nlohmann::json& j, const SearchHit& h) {
    j = nlohmann::json{{"path", h.path}, {"name", h.name}, {"matches", h.matches}};
}

void to_json(nlohmann::json& j, const LineRange& r) {
    if (r.error) {
        j = nlohmann::json{{"path", r.path}, {"totalLines", r.total_lines}, {"error", *r.error},
                           {"lines", nlohmann::json::array()}};
        return;
    }
    j = nlohmann::json{
        {"path", r.path},
        {"startLine", r.start_line},
        {"endLine", r.end_line},
        {"totalLines", r.total_lines},
        {"requestedMaxLines", r.requested_max_lines},
        {"actualLines", r.lines.size()},
        {"lines", r.lines},
        {"truncated", r.truncated}
    };
}

void to_json(nlohmann::json& j, const LineWindow& w) {
    j = nlohmann::json{
        {"path", w.path},
        {"totalLines", w.total_lines},
        {"requestedLines", w.requested_lines},
        {"actualLines", w.lines.size()},
        {"lines", w.lines}
    };
}

void to_json(nlohmann::json& j, const LineCount& c) {
    j = nlohmann::json{{"path", c.path}, {"lineCount", c.line_count}, {"size", c.size}, {"sizeKB", c.size / 1024}};
}

void to_json(nlohmann::json& j, const GrepResult& g) {
    j = nlohmann::json{
        {"path", g.path},
        {"pattern", g.pattern},
        {"matchCount", g.matches.size()},
        {"truncated", g.truncated},
        {"matches", g.matches}
    };
}

void to_json(nlohmann::json& j, const FileContent& f) {
    if (f.content) {
        j = nlohmann::json{{"path", f.path}, {"content", *f.content}, {"success", true}};
    } else {
        j = nlohmann::json{{"path", f.path}, {"error", f.error.value_or("")}, {"success", false}};
    }
}

void to_json(nlohmann::json& j, const AppendResult& r) {
    j = nlohmann::json{{"path", r.path}, {"appendedBytes", r.appended_bytes}, {"fileSize", r.file_size}};
}

void to_json(nlohmann::json& j, const ReplaceResult& r) {
    j = nlohmann::json{
        {"path", r.path},
        {"replacements", 1},
        {"oldLength", r.old_length},
        {"newLength", r.new_length},
        {"fileSize", r.file_size}
    };
    if (r.backup) {
        j["backup"] = *r.backup;
    } else {
        j["backup"] = nullptr;
    }
}

void to_json(nlohmann::json& j, const ExistsResult& r) {
    j = nlohmann::json{
        {"path", r.path},
        {"exists", r.exists},
        {"allowed", r.allowed},
        {"isFile", r.is_file},
        {"isDirectory", r.is_directory}
    };
}

void to_json(nlohmann::json& j, const FileSummary& s) {
    const FileEntry& e = s.entry;
    j = nlohmann::json{
        {"path", e.path},
        {"name", e.name},
        {"type", e.type},
        {"size", e.size},
        {"sizeKB", e.size / 1024},
        {"sizeMB", e.size / (1024 * 1024)},
        {"modified", e.last_modified},
        {"readable", e.readable},
        {"writable", e.writable},
        {"executable", e.executable}
    };
    if (s.line_count) j["lineCount"] = *s.line_count;
    if (s.extension) j["extension"] = *s.extension;
}

void to_json(nlohmann::json& j, const TreeNode& n) {
    j = nlohmann::json{{"name", n.name}, {"type", n.type}};
    if (n.message) j["message"] = *n.message;
    if (n.type == "directory") j["children"] = n.children;
}

void to_json(nlohmann::json& j, const WatchRegistration& w) {
    j = nlohmann::json{
        {"path", w.path},
        {"eventTypes", w.event_types},
        {"watching", w.watching},
        {"mode", w.mode}
    };
}

void to_json(nlohmann::json& j, const PollResult& p) {
    j = nlohmann::json{{"path", p.path}, {"watching", p.watching}, {"events", p.events}};
}

} // namespace fsgate
