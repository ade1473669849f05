#pragma once
#include "config.hpp"
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace fsgate {

/// The forms of one path reported by the normalizePath tool.
struct PathRepresentations {
    std::string original;
    std::string normalized;
    std::string windows;
    std::string wsl;

    bool operator==(const PathRepresentations& o) const {
        return original == o.original && normalized == o.normalized
               && windows == o.windows && wsl == o.wsl;
    }
};

void to_json(nlohmann::json& j, const PathRepresentations& p);

/// Pure string transform from any accepted path notation to the canonical
/// absolute form: forward slashes, no '.' or '..' segments, no trailing
/// separator, drive or mount form chosen by the path style. Never touches the
/// filesystem. normalize(normalize(p)) == normalize(p).
class PathNormalizer {
public:
    struct Options {
        PathStyle style = host_path_style();
        std::string base_directory = "/";
        std::vector<std::pair<std::string, std::string>> aliases;
    };

    PathNormalizer();
    explicit PathNormalizer(Options opts);
    explicit PathNormalizer(const ServerConfig& config);

    /// Throws FormatError on an empty path or an embedded NUL.
    [[nodiscard]] std::string normalize(std::string_view raw) const;

    [[nodiscard]] PathRepresentations representations(std::string_view raw) const;

    [[nodiscard]] PathStyle style() const { return opts_.style; }
    [[nodiscard]] const std::string& base_directory() const { return opts_.base_directory; }

    /// /mnt/c/x -> C:/x, anything else unchanged.
    [[nodiscard]] static std::string to_windows(std::string_view path);
    /// C:/x -> /mnt/c/x, anything else unchanged.
    [[nodiscard]] static std::string to_wsl(std::string_view path);

    /// Lexically collapse '.', '..', repeated and trailing separators.
    /// '..' never climbs above the root of an absolute path.
    [[nodiscard]] static std::string collapse(std::string_view path);

    [[nodiscard]] static bool is_drive_path(std::string_view path);
    [[nodiscard]] static bool is_mount_path(std::string_view path);

private:
    std::string convert_style(std::string path) const;
    bool is_absolute(std::string_view path) const;
    std::string apply_aliases(std::string path) const;
    std::string canonical_form(std::string_view raw) const;

    Options opts_;
};

} // namespace fsgate
