#include "fsgate/types.hpp"
#include "fsgate/error.hpp"

namespace fsgate {

// ---------- ToolDefinition ----------

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}, {"description", t.description}, {"inputSchema", t.input_schema}};
}

// ---------- ToolCall ----------

void from_json(const nlohmann::json& j, ToolCall& t) {
    if (!j.is_object() || !j.contains("name") || !j.at("name").is_string()) {
        throw InvalidArgumentError("tools/call requires a string 'name'");
    }
    t.name = j.at("name").get<std::string>();
    t.arguments = nlohmann::json::object();
    if (j.contains("arguments") && !j.at("arguments").is_null()) {
        if (!j.at("arguments").is_object()) {
            throw InvalidArgumentError("tools/call 'arguments' must be an object");
        }
        t.arguments = j.at("arguments");
    }
}

// ---------- TextContent ----------

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

// ---------- CallToolResult ----------

void to_json(nlohmann::json& j, const CallToolResult& t) {
    j = nlohmann::json::object();
    j["content"] = nlohmann::json::array();
    for (const auto& c : t.content) {
        nlohmann::json cj;
        to_json(cj, c);
        j["content"].push_back(cj);
    }
}

// ---------- Initialize ----------

void to_json(nlohmann::json& j, const ServerCapabilities& t) {
    j = nlohmann::json::object();
    if (t.tools) j["tools"] = *t.tools;
}

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
}

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"serverInfo", t.server_info}
    };
    if (t.instructions) j["instructions"] = *t.instructions;
}

} // namespace fsgate
