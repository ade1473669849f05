#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace fsgate {

class Codec {
public:
    /// Minimal frame written when nothing else could be serialized.
    static constexpr std::string_view FALLBACK_ERROR_LINE =
        R"({"jsonrpc":"2.0","id":null,"error":{"code":-32603,"message":"Internal error"}})";

    /// Parse one line of raw JSON into a message.
    /// Throws FormatError on invalid JSON, invalid UTF-8 or a malformed envelope.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Sanitize, encode and scrub a message. May throw on encoder failure.
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);

    /// Boundary serializer: always returns one line of valid JSON. Falls back
    /// to an internal-error response for the same id, then to FALLBACK_ERROR_LINE.
    [[nodiscard]] static std::string serialize_safe(const JsonRpcMessage& msg) noexcept;

private:
    static JsonRpcMessage parse_object(const nlohmann::json& j);
};

} // namespace fsgate
