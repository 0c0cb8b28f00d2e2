#include "toolbridge/error.hpp"

namespace toolbridge {

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Connect:           return "connect_error";
        case ErrorKind::Handshake:         return "handshake_error";
        case ErrorKind::ConnectionLost:    return "connection_lost";
        case ErrorKind::Timeout:           return "timeout";
        case ErrorKind::SessionClosed:     return "session_closed";
        case ErrorKind::UnknownServer:     return "unknown_server";
        case ErrorKind::UnknownCapability: return "unknown_capability";
        case ErrorKind::InvalidArguments:  return "invalid_arguments";
        case ErrorKind::Cancelled:         return "cancelled";
        case ErrorKind::NotReady:          return "not_ready";
        case ErrorKind::Remote:            return "remote_error";
        case ErrorKind::Protocol:          return "protocol_error";
        case ErrorKind::Transport:         return "transport_error";
        case ErrorKind::Config:            return "config_error";
        case ErrorKind::Internal:          return "internal_error";
    }
    return "internal_error";
}

bool is_transient(ErrorKind kind) noexcept {
    return kind == ErrorKind::ConnectionLost || kind == ErrorKind::Timeout;
}

ErrorInfo to_error_info(const Error& e) {
    ErrorInfo info;
    info.kind = e.kind();
    info.message = e.what();
    if (const auto* remote = dynamic_cast<const RemoteError*>(&e)) {
        info.code = remote->code;
    }
    return info;
}

void to_json(nlohmann::json& j, const ErrorInfo& e) {
    j = {{"kind", std::string(to_string(e.kind))}, {"message", e.message}};
    if (e.code) j["code"] = *e.code;
}

} // namespace toolbridge
