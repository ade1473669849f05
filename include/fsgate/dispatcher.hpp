#pragma once
#include "config.hpp"
#include "filesystem_ops.hpp"
#include "router.hpp"
#include "script_executor.hpp"
#include "types.hpp"
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace fsgate {

/// Produces the text block of a tools/call result from the tool arguments.
using ToolHandler = std::function<std::string(const nlohmann::json& arguments)>;

/// Registers the protocol methods (initialize, ping, tools/list, tools/call
/// and the client notifications) on a Router and runs the filesystem tools.
class RequestDispatcher {
public:
    RequestDispatcher(const ServerConfig& config, FilesystemOperations& fs_ops, IScriptExecutor& scripts);

    RequestDispatcher(const RequestDispatcher&) = delete;
    RequestDispatcher& operator=(const RequestDispatcher&) = delete;

    /// Exactly one response per request, none for notifications.
    [[nodiscard]] std::optional<JsonRpcMessage> dispatch(const JsonRpcMessage& msg);

    [[nodiscard]] InitializeResult initialize(const nlohmann::json& params) const;

    /// Run one tool. Throws ProtocolError(MethodNotFound) for unknown tools and
    /// the typed operation errors otherwise.
    [[nodiscard]] CallToolResult call_tool(const ToolCall& call);

    [[nodiscard]] const Router& router() const { return router_; }

private:
    void register_methods();
    void register_tools();

    std::string execute_script(const nlohmann::json& args);

    const ServerConfig& config_;
    FilesystemOperations& fs_;
    IScriptExecutor& scripts_;
    Router router_;
    std::unordered_map<std::string, ToolHandler> tools_;
};

} // namespace fsgate
