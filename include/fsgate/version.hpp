#pragma once
#include <array>
#include <string>
#include <string_view>

namespace fsgate {

constexpr std::string_view LIBRARY_VERSION     = "0.3.0";
constexpr std::string_view SERVER_NAME         = "fsgate";
constexpr std::string_view JSONRPC_VERSION     = "2.0";

/// Protocol revisions the gateway speaks, newest first.
constexpr std::array<std::string_view, 3> SUPPORTED_PROTOCOL_VERSIONS = {
    "2025-06-18",
    "2025-03-26",
    "2024-11-05",
};

constexpr std::string_view PROTOCOL_VERSION = SUPPORTED_PROTOCOL_VERSIONS.front();

/// Echo the client's version when supported, otherwise answer with the newest.
inline std::string negotiate_protocol_version(std::string_view requested) {
    for (auto v : SUPPORTED_PROTOCOL_VERSIONS) {
        if (v == requested) return std::string(v);
    }
    return std::string(PROTOCOL_VERSION);
}

} // namespace fsgate
