#pragma once
#include <stdexcept>
#include <string>

namespace toolsrv {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Payload is not syntactically valid JSON.
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

/// Unrecoverable I/O or encoding failure on the underlying streams.
class TransportError : public Error {
public:
    using Error::Error;
};

class ConfigError : public Error {
public:
    using Error::Error;
};

/// Outbound weather fetch failed (transport, status or payload).
class WeatherError : public Error {
public:
    using Error::Error;
};

namespace error {
    constexpr int ParseError          = -32700;
    constexpr int InvalidRequest      = -32600;
    constexpr int MethodNotFound      = -32601;
    constexpr int InvalidParams       = -32602;
    constexpr int InternalError       = -32603;
    constexpr int NotInitialized      = -32002;
    constexpr int ShuttingDown        = -32003;
    constexpr int UnknownTool         = -32004;
    constexpr int ToolExecutionFailed = -32005;
} // namespace error

namespace exit_code {
    constexpr int Ok     = 0;
    constexpr int Fatal  = 1;
    constexpr int Forced = 2;
} // namespace exit_code

} // namespace toolsrv
