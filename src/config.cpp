#include "fsgate/config.hpp"
#include "fsgate/path_normalizer.hpp"
#include <spdlog/common.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>

namespace fsgate {

namespace {

bool parse_bool(const std::string& name, const std::string& value) {
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    throw ConfigError(name + ": expected a boolean, got '" + value + "'");
}

std::size_t parse_count(const std::string& name, const std::string& value) {
    std::size_t consumed = 0;
    unsigned long long n = 0;
    try {
        n = std::stoull(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(name + ": expected a positive integer, got '" + value + "'");
    }
    if (consumed != value.size() || n == 0 || value.front() == '-') {
        throw ConfigError(name + ": expected a positive integer, got '" + value + "'");
    }
    return static_cast<std::size_t>(n);
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> out;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto first = item.find_first_not_of(" \t");
        auto last = item.find_last_not_of(" \t");
        if (first == std::string::npos) continue;
        out.push_back(item.substr(first, last - first + 1));
    }
    return out;
}

std::optional<std::string> env(const char* name) {
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') return std::nullopt;
    return std::string(v);
}

std::vector<std::string> string_list(const nlohmann::json& doc, const char* key) {
    const auto& v = doc.at(key);
    if (!v.is_array()) throw ConfigError(std::string(key) + " must be an array of strings");
    std::vector<std::string> out;
    for (const auto& item : v) {
        if (!item.is_string()) throw ConfigError(std::string(key) + " must be an array of strings");
        out.push_back(item.get<std::string>());
    }
    return out;
}

std::size_t positive(const nlohmann::json& doc, const char* key) {
    const auto& v = doc.at(key);
    if (!v.is_number_integer() || v.get<long long>() <= 0) {
        throw ConfigError(std::string(key) + " must be a positive integer");
    }
    return v.get<std::size_t>();
}

bool boolean(const nlohmann::json& doc, const char* key) {
    const auto& v = doc.at(key);
    if (!v.is_boolean()) throw ConfigError(std::string(key) + " must be a boolean");
    return v.get<bool>();
}

std::string text(const nlohmann::json& doc, const char* key) {
    const auto& v = doc.at(key);
    if (!v.is_string()) throw ConfigError(std::string(key) + " must be a string");
    return v.get<std::string>();
}

void apply_overrides(ServerConfig& cfg, const ConfigOverrides& o) {
    if (!o.allowed_directories.empty()) cfg.allowed_directories = o.allowed_directories;
    if (o.write_enabled) cfg.write_enabled = *o.write_enabled;
    if (o.symlinks_allowed) cfg.symlinks_allowed = *o.symlinks_allowed;
    if (o.max_file_size_mb) cfg.max_file_size_mb = *o.max_file_size_mb;
    if (o.project_root) cfg.project_root = *o.project_root;
    if (o.log_level) cfg.log_level = *o.log_level;
    if (o.log_file) cfg.log_file = *o.log_file;
    if (o.scripts_enabled) cfg.script.enabled = *o.scripts_enabled;
}

void check_patterns(const std::vector<std::string>& patterns, const char* what) {
    for (const auto& p : patterns) {
        try {
            std::regex re(p);
        } catch (const std::regex_error& e) {
            throw ConfigError(std::string("Invalid ") + what + " pattern '" + p + "': " + e.what());
        }
    }
}

} // anonymous namespace

PathStyle host_path_style() {
#ifdef _WIN32
    return PathStyle::Windows;
#else
    return PathStyle::Posix;
#endif
}

ConfigOverrides ConfigLoader::parse_args(int argc, const char* const argv[]) {
    ConfigOverrides o;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw ConfigError(arg + " requires a value");
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            o.show_help = true;
        } else if (arg == "--config") {
            o.config_file = value();
        } else if (arg == "--allow") {
            o.allowed_directories.push_back(value());
        } else if (arg == "--enable-write") {
            o.write_enabled = true;
        } else if (arg == "--allow-symlinks") {
            o.symlinks_allowed = true;
        } else if (arg == "--max-file-size-mb") {
            o.max_file_size_mb = parse_count(arg, value());
        } else if (arg == "--project-root") {
            o.project_root = value();
        } else if (arg == "--enable-scripts") {
            o.scripts_enabled = true;
        } else if (arg == "--log-level") {
            o.log_level = value();
        } else if (arg == "--log-file") {
            o.log_file = value();
        } else {
            throw ConfigError("Unknown argument: " + arg);
        }
    }
    return o;
}

ConfigOverrides ConfigLoader::from_environment() {
    ConfigOverrides o;
    if (auto v = env("FSGATE_CONFIG")) o.config_file = *v;
    if (auto v = env("FSGATE_ALLOWED_DIRS")) o.allowed_directories = split_list(*v);
    if (auto v = env("FSGATE_MAX_FILE_SIZE_MB")) o.max_file_size_mb = parse_count("FSGATE_MAX_FILE_SIZE_MB", *v);
    if (auto v = env("FSGATE_ENABLE_WRITE")) o.write_enabled = parse_bool("FSGATE_ENABLE_WRITE", *v);
    if (auto v = env("FSGATE_ALLOW_SYMLINKS")) o.symlinks_allowed = parse_bool("FSGATE_ALLOW_SYMLINKS", *v);
    if (auto v = env("FSGATE_PROJECT_ROOT")) o.project_root = *v;
    if (auto v = env("FSGATE_LOG_LEVEL")) o.log_level = *v;
    return o;
}

void ConfigLoader::apply_json(ServerConfig& cfg, const nlohmann::json& doc) {
    if (!doc.is_object()) throw ConfigError("Configuration document must be a JSON object");

    if (doc.contains("allowedDirectories")) cfg.allowed_directories = string_list(doc, "allowedDirectories");
    if (doc.contains("maxFileSizeMb")) cfg.max_file_size_mb = positive(doc, "maxFileSizeMb");
    if (doc.contains("enableWrite")) cfg.write_enabled = boolean(doc, "enableWrite");
    if (doc.contains("allowSymlinks")) cfg.symlinks_allowed = boolean(doc, "allowSymlinks");
    if (doc.contains("activeProjectRoot")) cfg.project_root = text(doc, "activeProjectRoot");
    if (doc.contains("maxSearchResults")) cfg.max_search_results = positive(doc, "maxSearchResults");
    if (doc.contains("maxLineLength")) cfg.max_line_length = positive(doc, "maxLineLength");
    if (doc.contains("maxListResults")) cfg.max_list_results = positive(doc, "maxListResults");
    if (doc.contains("maxTreeDepth")) cfg.max_tree_depth = positive(doc, "maxTreeDepth");
    if (doc.contains("maxTreeFiles")) cfg.max_tree_files = positive(doc, "maxTreeFiles");
    if (doc.contains("maxReadMultiple")) cfg.max_read_multiple = positive(doc, "maxReadMultiple");
    if (doc.contains("logLevel")) cfg.log_level = text(doc, "logLevel");
    if (doc.contains("logFile")) cfg.log_file = text(doc, "logFile");

    if (doc.contains("pathStyle")) {
        std::string style = text(doc, "pathStyle");
        if (style == "posix") {
            cfg.path_style = PathStyle::Posix;
        } else if (style == "windows") {
            cfg.path_style = PathStyle::Windows;
        } else {
            throw ConfigError("pathStyle must be 'posix' or 'windows', got '" + style + "'");
        }
    }

    if (doc.contains("pathAliases")) {
        const auto& aliases = doc.at("pathAliases");
        if (!aliases.is_object()) throw ConfigError("pathAliases must be an object");
        cfg.path_aliases.clear();
        for (auto it = aliases.begin(); it != aliases.end(); ++it) {
            if (!it.value().is_string()) throw ConfigError("pathAliases values must be strings");
            cfg.path_aliases.emplace_back(it.key(), it.value().get<std::string>());
        }
    }

    if (doc.contains("script")) {
        const auto& script = doc.at("script");
        if (!script.is_object()) throw ConfigError("script must be an object");
        if (script.contains("enabled")) cfg.script.enabled = boolean(script, "enabled");
        if (script.contains("allowedPatterns")) cfg.script.allowed_patterns = string_list(script, "allowedPatterns");
        if (script.contains("blockedPatterns")) cfg.script.blocked_patterns = string_list(script, "blockedPatterns");
        if (script.contains("timeoutSeconds")) {
            cfg.script.timeout_seconds = static_cast<int>(positive(script, "timeoutSeconds"));
        }
    }
}

void ConfigLoader::finalize(ServerConfig& cfg) {
    if (cfg.allowed_directories.empty()) {
        throw ConfigError("At least one allowed directory is required");
    }
    if (cfg.max_file_size_mb == 0 || cfg.max_search_results == 0 || cfg.max_line_length == 0
        || cfg.max_list_results == 0 || cfg.max_tree_depth == 0 || cfg.max_tree_files == 0
        || cfg.max_read_multiple == 0 || cfg.script.timeout_seconds <= 0) {
        throw ConfigError("Numeric limits must be positive");
    }
    if (cfg.max_line_length > ServerConfig::MAX_LINE_LENGTH_LIMIT) {
        throw ConfigError("maxLineLength must not exceed " + std::to_string(ServerConfig::MAX_LINE_LENGTH_LIMIT));
    }
    if (spdlog::level::from_str(cfg.log_level) == spdlog::level::off && cfg.log_level != "off") {
        throw ConfigError("Unknown log level: " + cfg.log_level);
    }
    check_patterns(cfg.script.allowed_patterns, "allowed script");
    check_patterns(cfg.script.blocked_patterns, "blocked script");

    // Allowed roots are resolved against the working directory, not the project root
    PathNormalizer::Options cwd_opts;
    cwd_opts.style = cfg.path_style;
    if (cfg.path_style == host_path_style()) {
        cwd_opts.base_directory = std::filesystem::current_path().generic_string();
    }
    cwd_opts.aliases = cfg.path_aliases;
    PathNormalizer roots(cwd_opts);

    try {
        for (auto& dir : cfg.allowed_directories) {
            dir = roots.normalize(dir);
        }
        cfg.project_root = cfg.project_root.empty() ? cfg.allowed_directories.front()
                                                    : roots.normalize(cfg.project_root);
    } catch (const FormatError& e) {
        throw ConfigError(std::string("Invalid directory in configuration: ") + e.what());
    }

    // Rejects overlapping aliases and a relative project root
    PathNormalizer validated(cfg);
    cfg.project_root = validated.base_directory();
}

ServerConfig ConfigLoader::load(const ConfigOverrides& env, const ConfigOverrides& cli) {
    ServerConfig cfg;

    std::optional<std::string> file = cli.config_file ? cli.config_file : env.config_file;
    if (file) {
        std::ifstream in(*file);
        if (!in) throw ConfigError("Cannot open configuration file: " + *file);
        nlohmann::json doc;
        try {
            doc = nlohmann::json::parse(in);
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError("Invalid configuration file " + *file + ": " + e.what());
        }
        apply_json(cfg, doc);
    }

    apply_overrides(cfg, env);
    apply_overrides(cfg, cli);
    finalize(cfg);
    return cfg;
}

std::string ConfigLoader::usage() {
    return "Usage: fsgate_server [options]\n"
           "  --allow DIR             Allow access below DIR (repeatable)\n"
           "  --config PATH           Read settings from a JSON file\n"
           "  --enable-write          Permit write, copy, move, delete and mkdir\n"
           "  --allow-symlinks        Follow symbolic links\n"
           "  --max-file-size-mb N    Largest file read or written (default 10)\n"
           "  --project-root DIR      Base for relative paths (default: first --allow)\n"
           "  --enable-scripts        Permit executeScript for whitelisted commands\n"
           "  --log-level LEVEL       trace, debug, info, warn, error, critical, off\n"
           "  --log-file PATH         Also write logs to PATH\n"
           "  --help                  Show this message\n";
}

} // namespace fsgate
