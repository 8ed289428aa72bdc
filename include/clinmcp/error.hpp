#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace clinmcp {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Malformed length header, bad Content-Length, or a stream that closed
/// mid-body. The only error class that ends a stdio session.
class FramingError : public Error {
public:
    using Error::Error;
};

/// The frame body is not JSON, or not a JSON-RPC 2.0 envelope.
class ParseError : public Error {
public:
    using Error::Error;
};

class ProtocolError : public Error {
public:
    int code;
    ProtocolError(int code, const std::string& msg)
        : Error(msg), code(code) {}
};

class ToolNotFound : public Error {
public:
    explicit ToolNotFound(const std::string& name)
        : Error("Tool '" + name + "' not found"), tool_name(name) {}
    std::string tool_name;
};

class SchemaValidationError : public Error {
public:
    SchemaValidationError(const std::string& msg, std::vector<std::string> missing)
        : Error(msg), missing_fields(std::move(missing)) {}
    std::vector<std::string> missing_fields;
};

class ResourceNotFound : public Error {
public:
    explicit ResourceNotFound(const std::string& uri)
        : Error("Resource not found: " + uri), uri(uri) {}
    std::string uri;
};

class ConfigError : public Error {
public:
    using Error::Error;
};

class TransportError : public Error {
public:
    using Error::Error;
};

namespace error {
    constexpr int ParseError          = -32700;
    constexpr int InvalidRequest      = -32600;
    constexpr int MethodNotFound      = -32601;
    constexpr int InvalidParams       = -32602;
    constexpr int InternalError       = -32603;
    constexpr int NotInitialized      = -32000;
    constexpr int ToolExecutionFailed = -32001;
    constexpr int ResourceNotFound    = -32002;
} // namespace error

} // namespace clinmcp
