#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace toolbridge {

enum class ErrorKind {
    Connect,
    Handshake,
    ConnectionLost,
    Timeout,
    SessionClosed,
    UnknownServer,
    UnknownCapability,
    InvalidArguments,
    Cancelled,
    NotReady,
    Remote,
    Protocol,
    Transport,
    Config,
    Internal
};

[[nodiscard]] std::string_view to_string(ErrorKind kind);

/// Connection-class failures that a retry may absorb.
[[nodiscard]] bool is_transient(ErrorKind kind) noexcept;

/// Root of every error the runtime raises. Carries a kind so callers can
/// branch without catching each subclass.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class ConnectError : public Error {
public:
    explicit ConnectError(const std::string& msg) : Error(ErrorKind::Connect, msg) {}
};

class HandshakeError : public Error {
public:
    explicit HandshakeError(const std::string& msg) : Error(ErrorKind::Handshake, msg) {}
};

class ConnectionLost : public Error {
public:
    explicit ConnectionLost(const std::string& msg) : Error(ErrorKind::ConnectionLost, msg) {}
};

class TimeoutError : public Error {
public:
    explicit TimeoutError(const std::string& msg) : Error(ErrorKind::Timeout, msg) {}
};

class SessionClosed : public Error {
public:
    explicit SessionClosed(const std::string& msg) : Error(ErrorKind::SessionClosed, msg) {}
};

class UnknownServer : public Error {
public:
    explicit UnknownServer(const std::string& name)
        : Error(ErrorKind::UnknownServer, "unknown server '" + name + "'") {}
};

class UnknownCapability : public Error {
public:
    UnknownCapability(const std::string& server, const std::string& tool)
        : Error(ErrorKind::UnknownCapability,
                "server '" + server + "' has no tool named '" + tool + "'") {}
};

class InvalidArguments : public Error {
public:
    explicit InvalidArguments(const std::string& msg) : Error(ErrorKind::InvalidArguments, msg) {}
};

class Cancelled : public Error {
public:
    explicit Cancelled(const std::string& msg) : Error(ErrorKind::Cancelled, msg) {}
};

class NotReady : public Error {
public:
    explicit NotReady(const std::string& msg) : Error(ErrorKind::NotReady, msg) {}
};

/// JSON-RPC error object returned by the peer.
class RemoteError : public Error {
public:
    int code;
    RemoteError(int code, const std::string& msg)
        : Error(ErrorKind::Remote, msg), code(code) {}
};

class ParseError : public Error {
public:
    explicit ParseError(const std::string& msg) : Error(ErrorKind::Protocol, msg) {}
};

/// Channel-level I/O failure (write to a closed channel, read error).
class TransportError : public Error {
public:
    explicit TransportError(const std::string& msg) : Error(ErrorKind::Transport, msg) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& msg) : Error(ErrorKind::Config, msg) {}
};

/// Value form of an error, used where outcomes are aggregated as data.
struct ErrorInfo {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
    std::optional<int> code;

    bool operator==(const ErrorInfo& o) const {
        return kind == o.kind && message == o.message && code == o.code;
    }
};

[[nodiscard]] ErrorInfo to_error_info(const Error& e);

void to_json(nlohmann::json& j, const ErrorInfo& e);

namespace rpc_error {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
} // namespace rpc_error

} // namespace toolbridge
