#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace fsgate {

// ---------- Tool ----------

struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
};

/// Params of a tools/call request.
struct ToolCall {
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

struct TextContent {
    std::string text;
};

/// Tool failures travel as JSON-RPC errors, so a result is always a success.
struct CallToolResult {
    std::vector<TextContent> content;
};

// ---------- Initialize ----------

struct ServerCapabilities {
    std::optional<nlohmann::json> tools;
};

struct Implementation {
    std::string name;
    std::string version;
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;
};

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, const ToolDefinition& t);

/// Throws InvalidArgumentError when name is missing or arguments is not an object.
void from_json(const nlohmann::json& j, ToolCall& t);

void to_json(nlohmann::json& j, const TextContent& t);
void to_json(nlohmann::json& j, const CallToolResult& t);

void to_json(nlohmann::json& j, const ServerCapabilities& t);
void to_json(nlohmann::json& j, const Implementation& t);
void to_json(nlohmann::json& j, const InitializeResult& t);

} // namespace fsgate
