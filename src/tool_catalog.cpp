#include "fsgate/tool_catalog.hpp"
#include <algorithm>

namespace fsgate {

namespace {

using json = nlohmann::json;

json prop(const char* type, const char* description) {
    return {{"type", type}, {"description", description}};
}

json object_schema(json properties, std::vector<std::string> required) {
    return {{"type", "object"}, {"properties", std::move(properties)}, {"required", std::move(required)}};
}

std::vector<ToolDefinition> build_catalog() {
    const json path_arg = prop("string", "File path (POSIX, Windows or WSL form)");
    const json encoding_arg = prop("string", "Character encoding: UTF-8 (default), US-ASCII or ISO-8859-1");

    std::vector<ToolDefinition> tools;

    tools.push_back({"readFile", "Read complete file contents with encoding support",
                     object_schema({{"path", path_arg}, {"encoding", encoding_arg}}, {"path"})});

    tools.push_back({"writeFile", "Write content to a file with optional backup",
                     object_schema({{"path", path_arg},
                                    {"content", prop("string", "Content to write")},
                                    {"encoding", encoding_arg},
                                    {"createBackup", prop("boolean", "Create a .backup copy before overwriting")}},
                                   {"path", "content"})});

    tools.push_back({"listDirectory", "List files and directories with optional filtering",
                     object_schema({{"path", prop("string", "Directory path")},
                                    {"pattern", prop("string", "Filename regex pattern (optional)")},
                                    {"recursive", prop("boolean", "List files recursively")}},
                                   {"path"})});

    tools.push_back({"searchFiles", "Search file contents using regex patterns",
                     object_schema({{"directory", prop("string", "Directory to search in")},
                                    {"contentPattern", prop("string", "Regex to search for in file contents")},
                                    {"filePattern", prop("string", "Filename regex (default: C and C++ sources)")}},
                                   {"directory", "contentPattern"})});

    tools.push_back({"normalizePath", "Convert between Windows and WSL path formats",
                     object_schema({{"path", prop("string", "Path to normalize")}}, {"path"})});

    tools.push_back({"copyFile", "Copy a file to a new location",
                     object_schema({{"source", prop("string", "Source file path")},
                                    {"destination", prop("string", "Destination file path")},
                                    {"overwrite", prop("boolean", "Overwrite if exists (default: false)")}},
                                   {"source", "destination"})});

    tools.push_back({"moveFile", "Move or rename a file",
                     object_schema({{"source", prop("string", "Source file path")},
                                    {"destination", prop("string", "Destination file path")},
                                    {"overwrite", prop("boolean", "Overwrite if exists (default: false)")}},
                                   {"source", "destination"})});

    tools.push_back({"deleteFile", "Delete a file or directory",
                     object_schema({{"path", prop("string", "File or directory path")},
                                    {"recursive", prop("boolean", "Delete directory recursively")}},
                                   {"path"})});

    tools.push_back({"createDirectory", "Create a directory (including parent directories)",
                     object_schema({{"path", prop("string", "Directory path to create")}}, {"path"})});

    tools.push_back({"executeScript", "Run whitelisted shell commands, one per line, in a working directory",
                     object_schema({{"script", prop("string", "Commands to run, one per line")},
                                    {"workingDirectory", prop("string", "Working directory for the commands")}},
                                   {"script", "workingDirectory"})});

    tools.push_back({"getAllowedDirectories", "Get list of allowed directories accessible for file operations",
                     object_schema(json::object(), {})});

    tools.push_back({"isSymlinksAllowed", "Check if symbolic links are allowed",
                     object_schema(json::object(), {})});

    json event_types = {{"type", "array"},
                        {"items", {{"type", "string"}, {"enum", {"CREATE", "MODIFY", "DELETE"}}}},
                        {"description", "Event types to watch for (default: CREATE, MODIFY, DELETE)"}};
    tools.push_back({"watchDirectory", "Watch a directory for file changes (CREATE, MODIFY, DELETE events)",
                     object_schema({{"path", prop("string", "Directory path to watch")},
                                    {"eventTypes", event_types}},
                                   {"path"})});

    tools.push_back({"pollDirectoryWatch", "Poll for directory watch events",
                     object_schema({{"path", prop("string", "Directory path being watched")}}, {"path"})});

    tools.push_back({"getFileInfo", "Get size, type, timestamps and permissions of a file or directory",
                     object_schema({{"path", path_arg}}, {"path"})});

    tools.push_back({"readFileRange", "Read a range of lines from a file",
                     object_schema({{"path", path_arg},
                                    {"startLine", prop("integer", "First line to return, 1-based (default: 1)")},
                                    {"maxLines", prop("integer", "Maximum lines to return (default: 100)")},
                                    {"encoding", encoding_arg}},
                                   {"path"})});

    tools.push_back({"headFile", "Read the first N lines of a file",
                     object_schema({{"path", path_arg},
                                    {"lines", prop("integer", "Number of lines from the start (default: 50)")},
                                    {"encoding", encoding_arg}},
                                   {"path"})});

    tools.push_back({"tailFile", "Read the last N lines of a file",
                     object_schema({{"path", path_arg},
                                    {"lines", prop("integer", "Number of lines from the end (default: 50)")},
                                    {"encoding", encoding_arg}},
                                   {"path"})});

    tools.push_back({"countLines", "Count the lines of a file without returning its content",
                     object_schema({{"path", path_arg}, {"encoding", encoding_arg}}, {"path"})});

    tools.push_back({"grepFile", "Return only the lines of a file that match a regex",
                     object_schema({{"path", path_arg},
                                    {"pattern", prop("string", "Regex to search for; invalid regex matches literally")},
                                    {"maxMatches", prop("integer", "Maximum matches to return (default: 100)")},
                                    {"encoding", encoding_arg}},
                                   {"path", "pattern"})});

    json paths_arg = {{"type", "array"},
                      {"items", {{"type", "string"}}},
                      {"description", "File paths to read (at most 10 are read)"}};
    tools.push_back({"readMultipleFiles", "Read several files at once; failures are reported per file",
                     object_schema({{"paths", paths_arg}}, {"paths"})});

    tools.push_back({"appendToFile", "Append content to a file, creating it and its parent directories",
                     object_schema({{"path", path_arg},
                                    {"content", prop("string", "Content to append")},
                                    {"encoding", encoding_arg}},
                                   {"path", "content"})});

    tools.push_back({"replaceInFile", "Replace one unique occurrence of text in a file",
                     object_schema({{"path", path_arg},
                                    {"oldText", prop("string", "Text to replace; must occur exactly once")},
                                    {"newText", prop("string", "Replacement text")},
                                    {"encoding", encoding_arg},
                                    {"createBackup", prop("boolean", "Create a .backup copy first")}},
                                   {"path", "oldText", "newText"})});

    tools.push_back({"fileExists", "Check whether a path exists and is inside the allowed directories",
                     object_schema({{"path", path_arg}}, {"path"})});

    tools.push_back({"getFileSummary", "Get metadata plus line count and extension of a file",
                     object_schema({{"path", path_arg}}, {"path"})});

    tools.push_back({"getProjectRoot", "Get the project root used for relative paths",
                     object_schema(json::object(), {})});

    tools.push_back({"findFilesByName", "Find files whose name matches a regex",
                     object_schema({{"pattern", prop("string", "Filename regex, matched anywhere in the name")},
                                    {"directory", prop("string", "Directory to search (default: project root)")},
                                    {"maxDepth", prop("integer", "Maximum directory depth (default: 5)")},
                                    {"maxResults", prop("integer", "Maximum results (default: 100)")}},
                                   {"pattern"})});

    tools.push_back({"listDirectoryWithSizes", "List a directory with sizes, sorted by name or size",
                     object_schema({{"path", prop("string", "Directory path")},
                                    {"sortBy", prop("string", "name (default) or size")}},
                                   {"path"})});

    tools.push_back({"getDirectoryTree", "Get a bounded tree view of a directory",
                     object_schema({{"path", prop("string", "Directory path")},
                                    {"excludePatterns", {{"type", "array"},
                                                         {"items", {{"type", "string"}}},
                                                         {"description", "Regexes for names to skip"}}}},
                                   {"path"})});

    tools.push_back({"listChildrenOnly", "List the immediate children of a directory (bounded)",
                     object_schema({{"path", prop("string", "Directory path")},
                                    {"pattern", prop("string", "Filename regex pattern (optional)")},
                                    {"maxResults", prop("integer", "Maximum results (default: 100)")}},
                                   {"path"})});

    tools.push_back({"searchInProject", "Search file contents below the project root",
                     object_schema({{"contentPattern", prop("string", "Regex to search for in file contents")},
                                    {"filePattern", prop("string", "Filename regex (default: C and C++ sources)")},
                                    {"maxResults", prop("integer", "Maximum files to return")}},
                                   {"contentPattern"})});

    return tools;
}

} // anonymous namespace

const std::vector<ToolDefinition>& ToolCatalog::tools() {
    static const std::vector<ToolDefinition> catalog = build_catalog();
    return catalog;
}

const ToolDefinition* ToolCatalog::find(const std::string& name) {
    const auto& all = tools();
    auto it = std::find_if(all.begin(), all.end(), [&](const ToolDefinition& t) { return t.name == name; });
    return it == all.end() ? nullptr : &*it;
}

} // namespace fsgate
