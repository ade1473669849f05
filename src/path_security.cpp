#include "fsgate/path_security.hpp"
#include "fsgate/error.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cctype>

namespace fs = std::filesystem;

namespace fsgate {

namespace {

std::vector<std::string> segments(const fs::path& p) {
    std::vector<std::string> out;
    for (const auto& part : p) {
        std::string s = part.generic_string();
        if (s.empty() || s == ".") continue;
        out.push_back(std::move(s));
    }
    return out;
}

fs::path canonical_or_empty(const fs::path& p) {
    std::error_code ec;
    fs::path c = fs::weakly_canonical(p, ec);
    if (ec) return {};
    return c;
}

} // anonymous namespace

PathSecurityPolicy::PathSecurityPolicy(const ServerConfig& config) : config_(config) {
    for (const auto& dir : config_.allowed_directories) {
        fs::path root = canonical_or_empty(dir);
        if (root.empty()) {
            spdlog::warn("Allowed directory cannot be resolved, using it as given: {}", dir);
            root = fs::path(dir);
        }
        roots_.push_back(root.lexically_normal());
    }
}

bool PathSecurityPolicy::is_reserved_name(std::string_view name) {
    static constexpr std::array<std::string_view, 22> reserved = {
        "CON", "PRN", "AUX", "NUL",
        "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
        "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"};

    std::string_view stem = name.substr(0, name.find('.'));
    std::string upper(stem);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return std::find(reserved.begin(), reserved.end(), upper) != reserved.end();
}

bool PathSecurityPolicy::is_within(const fs::path& path, const fs::path& root) {
    auto p = segments(path);
    auto r = segments(root);
    if (r.size() > p.size()) return false;
    return std::equal(r.begin(), r.end(), p.begin());
}

bool PathSecurityPolicy::is_allowed(const std::string& normalized_path) const {
    if (normalized_path.empty()) return false;
    fs::path path(normalized_path);

    for (const auto& seg : segments(path)) {
        if (is_reserved_name(seg)) {
            spdlog::debug("Denied reserved device name in {}", normalized_path);
            return false;
        }
    }

    if (!config_.symlinks_allowed) {
        std::error_code ec;
        if (fs::is_symlink(fs::symlink_status(path, ec))) {
            spdlog::debug("Denied symbolic link {}", normalized_path);
            return false;
        }
    }

    fs::path canonical = canonical_or_empty(path);
    if (canonical.empty()) return false;

    return std::any_of(roots_.begin(), roots_.end(),
                       [&](const fs::path& root) { return is_within(canonical, root); });
}

void PathSecurityPolicy::check(const std::string& normalized_path, std::string_view action) const {
    if (is_allowed(normalized_path)) return;
    audit_.security_violation(action, normalized_path, "path not permitted");
    throw SecurityError("Access denied: " + normalized_path);
}

void PathSecurityPolicy::require_write(std::string_view action, const std::string& normalized_path) const {
    if (config_.write_enabled) return;
    audit_.security_violation(action, normalized_path, "write operations disabled");
    throw SecurityError("Write operations are disabled on this server");
}

} // namespace fsgate
