#include "fsgate/path_normalizer.hpp"
#include "fsgate/error.hpp"
#include <algorithm>
#include <cctype>

namespace fsgate {

namespace {

bool starts_with_segment(std::string_view path, std::string_view prefix) {
    if (path.size() < prefix.size() || path.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    if (path.size() == prefix.size()) return true;
    return prefix.back() == '/' || path[prefix.size()] == '/';
}

char lower(char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }
char upper(char c) { return static_cast<char>(std::toupper(static_cast<unsigned char>(c))); }

std::string forward_slashes(std::string_view raw) {
    std::string s(raw);
    std::replace(s.begin(), s.end(), '\\', '/');
    return s;
}

} // anonymous namespace

void to_json(nlohmann::json& j, const PathRepresentations& p) {
    j = nlohmann::json{
        {"original", p.original},
        {"normalized", p.normalized},
        {"windows", p.windows},
        {"wsl", p.wsl}
    };
}

PathNormalizer::PathNormalizer() : PathNormalizer(Options{}) {}

PathNormalizer::PathNormalizer(const ServerConfig& config)
    : PathNormalizer(Options{config.path_style,
                             config.project_root.empty() ? std::string() : config.project_root,
                             config.path_aliases}) {}

PathNormalizer::PathNormalizer(Options opts) : opts_(std::move(opts)) {
    if (opts_.base_directory.empty()) {
        opts_.base_directory = opts_.style == PathStyle::Windows ? "C:/" : "/";
    }
    std::string base = convert_style(forward_slashes(opts_.base_directory));
    if (!is_absolute(base)) {
        throw ConfigError("Base directory must be absolute: " + opts_.base_directory);
    }
    opts_.base_directory = collapse(base);

    std::vector<std::pair<std::string, std::string>> aliases;
    for (const auto& [prefix, target] : opts_.aliases) {
        if (prefix.empty() || target.empty()) {
            throw ConfigError("Path alias prefix and target must not be empty");
        }
        std::string p = collapse(convert_style(forward_slashes(prefix)));
        std::string t = collapse(convert_style(forward_slashes(target)));
        if (!is_absolute(p) || !is_absolute(t)) {
            throw ConfigError("Path alias must map an absolute prefix to an absolute target: " + prefix);
        }
        if (p == "/" || (is_drive_path(p) && p.size() == 3)) {
            throw ConfigError("Path alias prefix must not be a filesystem root: " + prefix);
        }
        aliases.emplace_back(std::move(p), std::move(t));
    }
    for (const auto& [p, ignored] : aliases) {
        for (const auto& [other, t] : aliases) {
            if (starts_with_segment(t, p) || starts_with_segment(p, t)) {
                throw ConfigError("Path alias target " + t + " overlaps alias prefix " + p);
            }
        }
    }
    // Longest prefix wins
    std::sort(aliases.begin(), aliases.end(), [](const auto& a, const auto& b) {
        return a.first.size() > b.first.size();
    });
    opts_.aliases = std::move(aliases);
}

bool PathNormalizer::is_drive_path(std::string_view path) {
    return path.size() >= 2 && std::isalpha(static_cast<unsigned char>(path[0])) && path[1] == ':'
           && (path.size() == 2 || path[2] == '/');
}

bool PathNormalizer::is_mount_path(std::string_view path) {
    constexpr std::string_view mnt = "/mnt/";
    return path.size() >= 6 && path.compare(0, mnt.size(), mnt) == 0
           && std::islower(static_cast<unsigned char>(path[5]))
           && (path.size() == 6 || path[6] == '/');
}

std::string PathNormalizer::to_windows(std::string_view path) {
    std::string s = forward_slashes(path);
    if (!is_mount_path(s)) return s;
    std::string rest = s.substr(6);
    std::string out;
    out.push_back(upper(s[5]));
    out += ":";
    out += rest.empty() ? "/" : rest;
    return out;
}

std::string PathNormalizer::to_wsl(std::string_view path) {
    std::string s = forward_slashes(path);
    if (!is_drive_path(s)) return s;
    std::string out = "/mnt/";
    out.push_back(lower(s[0]));
    std::string rest = s.size() > 2 ? s.substr(2) : std::string();
    while (!rest.empty() && rest.back() == '/') rest.pop_back();
    return out + rest;
}

std::string PathNormalizer::collapse(std::string_view path) {
    std::string root;
    std::string_view rest = path;
    if (is_drive_path(path)) {
        root.push_back(upper(path[0]));
        root += ":/";
        rest = path.size() > 2 ? path.substr(3) : std::string_view();
    } else if (!path.empty() && path.front() == '/') {
        root = "/";
        rest = path.substr(1);
    }
    const bool absolute = !root.empty();

    std::vector<std::string_view> segments;
    size_t pos = 0;
    while (pos <= rest.size()) {
        size_t next = rest.find('/', pos);
        if (next == std::string_view::npos) next = rest.size();
        std::string_view seg = rest.substr(pos, next - pos);
        pos = next + 1;

        if (seg.empty() || seg == ".") continue;
        if (seg == "..") {
            if (!segments.empty() && segments.back() != "..") {
                segments.pop_back();
            } else if (!absolute) {
                segments.push_back(seg);
            }
            continue;
        }
        segments.push_back(seg);
    }

    std::string out = root;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) out += '/';
        out.append(segments[i]);
    }
    if (out.empty()) out = ".";
    return out;
}

bool PathNormalizer::is_absolute(std::string_view path) const {
    if (opts_.style == PathStyle::Windows) return is_drive_path(path);
    return !path.empty() && path.front() == '/';
}

std::string PathNormalizer::convert_style(std::string path) const {
    if (opts_.style == PathStyle::Posix) {
        if (is_drive_path(path)) return to_wsl(path);
        return path;
    }
    if (is_mount_path(path)) return to_windows(path);
    if (is_drive_path(path)) {
        path[0] = upper(path[0]);
        return path;
    }
    // Rooted but driveless: take the drive of the base directory
    if (!path.empty() && path.front() == '/' && opts_.base_directory.size() >= 2
        && is_drive_path(opts_.base_directory)) {
        return opts_.base_directory.substr(0, 2) + path;
    }
    return path;
}

std::string PathNormalizer::apply_aliases(std::string path) const {
    for (const auto& [prefix, target] : opts_.aliases) {
        if (starts_with_segment(path, prefix)) {
            return collapse(target + "/" + path.substr(prefix.size()));
        }
    }
    return path;
}

std::string PathNormalizer::canonical_form(std::string_view raw) const {
    if (raw.empty()) {
        throw FormatError("Path must not be empty");
    }
    if (raw.find('\0') != std::string_view::npos) {
        throw FormatError("Path contains a NUL character");
    }
    std::string s = convert_style(forward_slashes(raw));
    if (!is_absolute(s)) {
        s = opts_.base_directory + "/" + s;
    }
    return apply_aliases(collapse(s));
}

std::string PathNormalizer::normalize(std::string_view raw) const {
    return canonical_form(raw);
}

PathRepresentations PathNormalizer::representations(std::string_view raw) const {
    PathRepresentations r;
    r.original = std::string(raw);
    r.normalized = normalize(raw);
    r.windows = to_windows(r.normalized);
    r.wsl = to_wsl(r.normalized);
    return r;
}

} // namespace fsgate
