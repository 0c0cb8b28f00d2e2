#pragma once
#include "framing.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolbridge {

/// Upper bound for a step's retry count, in config and task documents.
constexpr int MAX_STEP_RETRIES = 100;

enum class TransportKind {
    Process,
    Network,
    Http
};

[[nodiscard]] std::string_view to_string(TransportKind kind);

/// How to reach one tool server. Immutable once loaded.
struct ServerDescriptor {
    std::string name;
    TransportKind kind = TransportKind::Process;

    // process
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::optional<std::string> working_dir;

    // network
    std::string host;
    uint16_t port = 0;

    // http
    std::string url;
    std::map<std::string, std::string> headers;

    Framing framing = Framing::Newline;
    std::chrono::milliseconds connect_timeout{5000};
};

/// Runtime-wide knobs from the "client" section.
struct ClientSettings {
    std::chrono::milliseconds handshake_timeout{10000};
    std::chrono::milliseconds discovery_timeout{10000};
    std::chrono::milliseconds invocation_timeout{30000};
    size_t max_in_flight = 4;
    int step_retries = 1;
    std::chrono::milliseconds reconnect_delay{100};
    bool validate_arguments = true;
    std::string log_level = "info";
};

struct Config {
    std::map<std::string, ServerDescriptor> servers;
    ClientSettings client;

    /// Parse an "mcpServers" document. Throws ConfigError naming the server
    /// and field at fault.
    [[nodiscard]] static Config parse(const nlohmann::json& doc);

    /// Read and parse a JSON file. Throws ConfigError.
    [[nodiscard]] static Config load_file(const std::string& path);
};

/// Parse a single server entry. Throws ConfigError.
[[nodiscard]] ServerDescriptor parse_server(const std::string& name, const nlohmann::json& entry);

} // namespace toolbridge
