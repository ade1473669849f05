#pragma once
#include <stdexcept>
#include <string>

namespace fsgate {

class GatewayError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Malformed path string or malformed request JSON.
class FormatError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

/// Sandbox violation: outside the allow-list, disallowed symlink, writes disabled.
class SecurityError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

class NotFoundError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

/// Wrong argument type, oversized file, file where a directory is expected.
class InvalidArgumentError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

class InternalError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

class ConfigError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

class TransportError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

class ProtocolError : public GatewayError {
public:
    int code;
    ProtocolError(int code, const std::string& msg)
        : GatewayError(msg), code(code) {}
};

namespace error {
    constexpr int ParseError        = -32700;
    constexpr int InvalidRequest    = -32600;
    constexpr int MethodNotFound    = -32601;
    constexpr int InvalidParams     = -32602;
    constexpr int InternalError     = -32603;
    constexpr int SecurityViolation = -32001;
    constexpr int NotFound          = -32002;
} // namespace error

} // namespace fsgate
