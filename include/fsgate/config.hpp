#pragma once
#include "error.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace fsgate {

enum class PathStyle {
    Posix,    // drive paths C:/x are mapped to /mnt/c/x
    Windows   // mount paths /mnt/c/x are mapped to C:/x
};

PathStyle host_path_style();

struct ScriptConfig {
    bool enabled = false;
    std::vector<std::string> allowed_patterns;
    std::vector<std::string> blocked_patterns;
    int timeout_seconds = 60;
};

/// Process-wide settings. Built once at startup and passed by const reference;
/// nothing mutates it afterwards.
struct ServerConfig {
    static constexpr std::size_t MAX_LINE_LENGTH_LIMIT = 4096;

    std::vector<std::string> allowed_directories;   // normalized, absolute
    std::size_t max_file_size_mb = 10;
    bool write_enabled = false;
    bool symlinks_allowed = false;

    std::string project_root;                        // base for relative paths
    PathStyle path_style = host_path_style();
    std::vector<std::pair<std::string, std::string>> path_aliases;

    std::size_t max_search_results = 50;
    std::size_t max_line_length = 1000;     // regexes only ever see this many bytes of a line
    std::size_t max_list_results = 100;
    std::size_t max_tree_depth = 5;
    std::size_t max_tree_files = 200;
    std::size_t max_read_multiple = 10;

    std::string log_level = "info";
    std::optional<std::string> log_file;

    ScriptConfig script;

    [[nodiscard]] std::uintmax_t max_file_size_bytes() const {
        return static_cast<std::uintmax_t>(max_file_size_mb) * 1024 * 1024;
    }
};

/// Raw, not yet validated settings as read from the file, environment and
/// command line. Later sources override earlier ones.
struct ConfigOverrides {
    std::optional<std::string> config_file;
    std::vector<std::string> allowed_directories;
    std::optional<bool> write_enabled;
    std::optional<bool> symlinks_allowed;
    std::optional<std::size_t> max_file_size_mb;
    std::optional<std::string> project_root;
    std::optional<std::string> log_level;
    std::optional<std::string> log_file;
    std::optional<bool> scripts_enabled;
    bool show_help = false;
};

class ConfigLoader {
public:
    /// Parse command-line flags. Throws ConfigError on unknown or incomplete flags.
    [[nodiscard]] static ConfigOverrides parse_args(int argc, const char* const argv[]);

    /// Read FSGATE_* environment variables.
    [[nodiscard]] static ConfigOverrides from_environment();

    /// Build a validated configuration: defaults < file < environment < cli.
    [[nodiscard]] static ServerConfig load(const ConfigOverrides& env, const ConfigOverrides& cli);

    /// Apply a JSON configuration document on top of cfg.
    static void apply_json(ServerConfig& cfg, const nlohmann::json& doc);

    /// Normalize paths and check limits and patterns. Throws ConfigError.
    static void finalize(ServerConfig& cfg);

    static std::string usage();
};

} // namespace fsgate
