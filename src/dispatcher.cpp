#include "fsgate/dispatcher.hpp"
#include "fsgate/error.hpp"
#include "fsgate/sanitizer.hpp"
#include "fsgate/tool_catalog.hpp"
#include "fsgate/version.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <filesystem>

namespace fsgate {

namespace {

using json = nlohmann::json;

std::string require_string(const json& args, const char* key) {
    if (!args.contains(key) || args.at(key).is_null()) {
        throw InvalidArgumentError(std::string("Missing required parameter: ") + key);
    }
    if (!args.at(key).is_string()) {
        throw InvalidArgumentError(std::string("Parameter '") + key + "' must be a string");
    }
    return args.at(key).get<std::string>();
}

std::optional<std::string> optional_string(const json& args, const char* key) {
    if (!args.contains(key) || args.at(key).is_null()) return std::nullopt;
    if (!args.at(key).is_string()) {
        throw InvalidArgumentError(std::string("Parameter '") + key + "' must be a string");
    }
    return args.at(key).get<std::string>();
}

bool optional_bool(const json& args, const char* key, bool fallback = false) {
    if (!args.contains(key) || args.at(key).is_null()) return fallback;
    if (!args.at(key).is_boolean()) {
        throw InvalidArgumentError(std::string("Parameter '") + key + "' must be a boolean");
    }
    return args.at(key).get<bool>();
}

std::size_t optional_count(const json& args, const char* key, std::size_t fallback) {
    if (!args.contains(key) || args.at(key).is_null()) return fallback;
    const auto& v = args.at(key);
    if (!v.is_number_integer() || v.get<std::int64_t>() <= 0) {
        throw InvalidArgumentError(std::string("Parameter '") + key + "' must be a positive integer");
    }
    return v.get<std::size_t>();
}

std::int64_t optional_integer(const json& args, const char* key, std::int64_t fallback) {
    if (!args.contains(key) || args.at(key).is_null()) return fallback;
    const auto& v = args.at(key);
    if (!v.is_number_integer() || (v.is_number_unsigned() && v.get<std::uint64_t>() > INT64_MAX)) {
        throw InvalidArgumentError(std::string("Parameter '") + key + "' must be an integer");
    }
    return v.get<std::int64_t>();
}

std::vector<std::string> optional_string_list(const json& args, const char* key) {
    std::vector<std::string> out;
    if (!args.contains(key) || args.at(key).is_null()) return out;
    const auto& v = args.at(key);
    if (!v.is_array()) {
        throw InvalidArgumentError(std::string("Parameter '") + key + "' must be an array of strings");
    }
    for (const auto& item : v) {
        if (!item.is_string()) {
            throw InvalidArgumentError(std::string("Parameter '") + key + "' must be an array of strings");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

// Results other than file contents travel as JSON text
std::string encode(const json& value) {
    return Sanitizer::sanitize(value).dump();
}

} // anonymous namespace

RequestDispatcher::RequestDispatcher(const ServerConfig& config, FilesystemOperations& fs_ops,
                                     IScriptExecutor& scripts)
    : config_(config), fs_(fs_ops), scripts_(scripts) {
    register_tools();
    register_methods();
}

std::optional<JsonRpcMessage> RequestDispatcher::dispatch(const JsonRpcMessage& msg) {
    return router_.dispatch(msg);
}

InitializeResult RequestDispatcher::initialize(const json& params) const {
    std::string requested;
    if (params.is_object() && params.contains("protocolVersion") && params.at("protocolVersion").is_string()) {
        requested = params.at("protocolVersion").get<std::string>();
    }

    InitializeResult result;
    result.protocol_version = negotiate_protocol_version(requested);
    result.capabilities.tools = json{{"listChanged", false}};
    result.server_info = Implementation{std::string(SERVER_NAME), std::string(LIBRARY_VERSION)};
    result.instructions = "Sandboxed filesystem access. Paths outside getAllowedDirectories are refused"
                          + std::string(config_.write_enabled ? "." : "; writes are disabled.");

    if (requested != result.protocol_version) {
        spdlog::info("Client requested protocol {}, answering with {}",
                     requested.empty() ? "<none>" : requested, result.protocol_version);
    }
    return result;
}

void RequestDispatcher::register_methods() {
    router_.on_request("initialize", [this](const json& params) -> HandlerResult {
        return json(initialize(params));
    });

    router_.on_request("ping", [](const json&) -> HandlerResult {
        return json::object();
    });

    router_.on_request("tools/list", [](const json&) -> HandlerResult {
        return json{{"tools", ToolCatalog::tools()}};
    });

    router_.on_request("tools/call", [this](const json& params) -> HandlerResult {
        return json(call_tool(params.get<ToolCall>()));
    });

    router_.on_notification("notifications/initialized", [](const json&) {
        spdlog::info("Client initialized");
    });

    router_.on_notification("notifications/cancelled", [](const json& params) {
        spdlog::debug("Client cancelled request {}", params.value("requestId", json()).dump());
    });
}

CallToolResult RequestDispatcher::call_tool(const ToolCall& call) {
    auto it = tools_.find(call.name);
    if (it == tools_.end()) {
        throw ProtocolError(error::MethodNotFound, "Unknown tool: " + call.name);
    }
    spdlog::debug("tools/call {}", call.name);

    CallToolResult result;
    result.content.push_back(TextContent{it->second(call.arguments)});
    return result;
}

std::string RequestDispatcher::execute_script(const json& args) {
    std::string script = require_string(args, "script");
    std::string working_dir = require_string(args, "workingDirectory");

    if (!scripts_.enabled()) {
        throw SecurityError("Script execution is disabled on this server");
    }
    std::string dir = fs_.resolve(working_dir, "executeScript");
    if (!std::filesystem::exists(dir)) throw NotFoundError("Working directory not found: " + dir);
    if (!std::filesystem::is_directory(dir)) {
        throw InvalidArgumentError("Working directory is not a directory: " + dir);
    }
    return encode(scripts_.execute(script, dir));
}

void RequestDispatcher::register_tools() {
    tools_["readFile"] = [this](const json& a) {
        return fs_.read_file(require_string(a, "path"), optional_string(a, "encoding").value_or("UTF-8"));
    };

    tools_["writeFile"] = [this](const json& a) {
        return encode(fs_.write_file(require_string(a, "path"), require_string(a, "content"),
                                     optional_string(a, "encoding").value_or("UTF-8"),
                                     optional_bool(a, "createBackup")));
    };

    tools_["listDirectory"] = [this](const json& a) {
        return encode(fs_.list_directory(require_string(a, "path"), optional_string(a, "pattern"),
                                         optional_bool(a, "recursive")));
    };

    tools_["searchFiles"] = [this](const json& a) {
        return encode(fs_.search_files(require_string(a, "directory"), require_string(a, "contentPattern"),
                                       optional_string(a, "filePattern")));
    };

    tools_["normalizePath"] = [this](const json& a) {
        return encode(fs_.normalize_path(require_string(a, "path")));
    };

    tools_["copyFile"] = [this](const json& a) {
        return encode(fs_.copy_file(require_string(a, "source"), require_string(a, "destination"),
                                    optional_bool(a, "overwrite")));
    };

    tools_["moveFile"] = [this](const json& a) {
        return encode(fs_.move_file(require_string(a, "source"), require_string(a, "destination"),
                                    optional_bool(a, "overwrite")));
    };

    tools_["deleteFile"] = [this](const json& a) {
        return encode(fs_.delete_file(require_string(a, "path"), optional_bool(a, "recursive")));
    };

    tools_["createDirectory"] = [this](const json& a) {
        return encode(fs_.create_directory(require_string(a, "path")));
    };

    tools_["executeScript"] = [this](const json& a) { return execute_script(a); };

    tools_["getAllowedDirectories"] = [this](const json&) {
        return encode(fs_.allowed_directories());
    };

    tools_["isSymlinksAllowed"] = [this](const json&) {
        return encode(json{{"allowSymlinks", fs_.symlinks_allowed()}});
    };

    tools_["watchDirectory"] = [this](const json& a) {
        return encode(fs_.watch_directory(require_string(a, "path"), optional_string_list(a, "eventTypes")));
    };

    tools_["pollDirectoryWatch"] = [this](const json& a) {
        return encode(fs_.poll_directory_watch(require_string(a, "path")));
    };

    tools_["getFileInfo"] = [this](const json& a) {
        return encode(fs_.get_file_info(require_string(a, "path")));
    };

    tools_["readFileRange"] = [this](const json& a) {
        return encode(fs_.read_file_range(require_string(a, "path"), optional_integer(a, "startLine", 1),
                                          optional_count(a, "maxLines", 100),
                                          optional_string(a, "encoding").value_or("UTF-8")));
    };

    tools_["headFile"] = [this](const json& a) {
        return encode(fs_.head_file(require_string(a, "path"), optional_count(a, "lines", 50),
                                    optional_string(a, "encoding").value_or("UTF-8")));
    };

    tools_["tailFile"] = [this](const json& a) {
        return encode(fs_.tail_file(require_string(a, "path"), optional_count(a, "lines", 50),
                                    optional_string(a, "encoding").value_or("UTF-8")));
    };

    tools_["countLines"] = [this](const json& a) {
        return encode(fs_.count_lines(require_string(a, "path"), optional_string(a, "encoding").value_or("UTF-8")));
    };

    tools_["grepFile"] = [this](const json& a) {
        return encode(fs_.grep_file(require_string(a, "path"), require_string(a, "pattern"),
                                    optional_count(a, "maxMatches", 100),
                                    optional_string(a, "encoding").value_or("UTF-8")));
    };

    tools_["readMultipleFiles"] = [this](const json& a) {
        if (!a.contains("paths") || a.at("paths").is_null()) {
            throw InvalidArgumentError("Missing required parameter: paths");
        }
        return encode(fs_.read_multiple_files(optional_string_list(a, "paths")));
    };

    tools_["appendToFile"] = [this](const json& a) {
        return encode(fs_.append_to_file(require_string(a, "path"), require_string(a, "content"),
                                         optional_string(a, "encoding").value_or("UTF-8")));
    };

    tools_["replaceInFile"] = [this](const json& a) {
        return encode(fs_.replace_in_file(require_string(a, "path"), require_string(a, "oldText"),
                                          require_string(a, "newText"),
                                          optional_string(a, "encoding").value_or("UTF-8"),
                                          optional_bool(a, "createBackup")));
    };

    tools_["fileExists"] = [this](const json& a) {
        return encode(fs_.file_exists(require_string(a, "path")));
    };

    tools_["getFileSummary"] = [this](const json& a) {
        return encode(fs_.get_file_summary(require_string(a, "path")));
    };

    tools_["getProjectRoot"] = [this](const json&) {
        return encode(json{{"projectRoot", fs_.project_root()},
                           {"message", "This is the preferred scope for file operations"}});
    };

    tools_["findFilesByName"] = [this](const json& a) {
        return encode(fs_.find_files_by_name(require_string(a, "pattern"), optional_string(a, "directory"),
                                             optional_count(a, "maxDepth", 5),
                                             optional_count(a, "maxResults", 100)));
    };

    tools_["listDirectoryWithSizes"] = [this](const json& a) {
        return encode(fs_.list_directory_with_sizes(require_string(a, "path"),
                                                    optional_string(a, "sortBy").value_or("name")));
    };

    tools_["getDirectoryTree"] = [this](const json& a) {
        return encode(fs_.get_directory_tree(require_string(a, "path"), optional_string_list(a, "excludePatterns")));
    };

    tools_["listChildrenOnly"] = [this](const json& a) {
        return encode(fs_.list_children_only(require_string(a, "path"), optional_string(a, "pattern"),
                                             optional_count(a, "maxResults", 0)));
    };

    tools_["searchInProject"] = [this](const json& a) {
        return encode(fs_.search_in_project(require_string(a, "contentPattern"), optional_string(a, "filePattern"),
                                            optional_count(a, "maxResults", 0)));
    };
}

} // namespace fsgate
