#include "toolbridge/config.hpp"
#include "toolbridge/error.hpp"
#include <fstream>
#include <limits>
#include <stdexcept>

namespace toolbridge {

namespace {

[[noreturn]] void fail(const std::string& server, const std::string& msg) {
    throw ConfigError("server '" + server + "': " + msg);
}

std::string get_string(const std::string& server, const nlohmann::json& entry, const char* field) {
    const auto& v = entry.at(field);
    if (!v.is_string()) fail(server, std::string("'") + field + "' must be a string");
    return v.get<std::string>();
}

std::map<std::string, std::string> get_string_map(const std::string& server,
                                                  const nlohmann::json& entry, const char* field) {
    std::map<std::string, std::string> out;
    const auto& v = entry.at(field);
    if (!v.is_object()) fail(server, std::string("'") + field + "' must be an object");
    for (auto it = v.begin(); it != v.end(); ++it) {
        if (!it.value().is_string()) {
            fail(server, std::string("'") + field + "." + it.key() + "' must be a string");
        }
        out[it.key()] = it.value().get<std::string>();
    }
    return out;
}

std::chrono::milliseconds get_millis(const std::string& where, const nlohmann::json& obj, const char* field) {
    const auto& v = obj.at(field);
    if (!v.is_number_integer() || v.get<long long>() <= 0) {
        throw ConfigError(where + ": '" + field + "' must be a positive integer (milliseconds)");
    }
    return std::chrono::milliseconds(v.get<long long>());
}

uint16_t get_port(const std::string& server, const nlohmann::json& v) {
    long long port = 0;
    if (v.is_number_integer()) {
        port = v.get<long long>();
    } else if (v.is_string()) {
        const std::string text = v.get<std::string>();
        if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
            fail(server, "'port' is not a number: '" + text + "'");
        }
        try {
            port = std::stoll(text);
        } catch (const std::out_of_range&) {
            fail(server, "'port' out of range: " + text);
        }
    } else {
        fail(server, "'port' must be an integer");
    }
    if (port <= 0 || port > std::numeric_limits<uint16_t>::max()) {
        fail(server, "'port' out of range: " + std::to_string(port));
    }
    return static_cast<uint16_t>(port);
}

/// "tcp://host:port"
void parse_tcp_url(ServerDescriptor& d, const std::string& url) {
    std::string rest = url.substr(6);
    auto colon = rest.rfind(':');
    if (colon == std::string::npos || colon == 0) {
        fail(d.name, "'" + url + "' is not of the form tcp://host:port");
    }
    d.host = rest.substr(0, colon);
    d.port = get_port(d.name, nlohmann::json(rest.substr(colon + 1)));
}

TransportKind parse_kind(const std::string& server, const std::string& s) {
    if (s == "process" || s == "stdio") return TransportKind::Process;
    if (s == "network" || s == "tcp") return TransportKind::Network;
    if (s == "http" || s == "streamable-http") return TransportKind::Http;
    fail(server, "unknown transport '" + s + "'");
}

} // anonymous namespace

std::string_view to_string(TransportKind kind) {
    switch (kind) {
        case TransportKind::Process: return "process";
        case TransportKind::Network: return "network";
        case TransportKind::Http:    return "http";
    }
    return "unknown";
}

ServerDescriptor parse_server(const std::string& name, const nlohmann::json& entry) {
    if (name.empty()) throw ConfigError("server name must not be empty");
    if (!entry.is_object()) fail(name, "entry must be an object");

    ServerDescriptor d;
    d.name = name;

    if (entry.contains("transport")) {
        d.kind = parse_kind(name, get_string(name, entry, "transport"));
    } else if (entry.contains("command")) {
        d.kind = TransportKind::Process;
    } else if (entry.contains("url")) {
        d.kind = get_string(name, entry, "url").compare(0, 6, "tcp://") == 0
                     ? TransportKind::Network : TransportKind::Http;
    } else if (entry.contains("host") || entry.contains("port")) {
        d.kind = TransportKind::Network;
    } else {
        fail(name, "needs one of 'command', 'url' or 'host'/'port'");
    }

    if (entry.contains("framing")) {
        auto framing = framing_from_string(get_string(name, entry, "framing"));
        if (!framing) fail(name, "unknown framing '" + entry["framing"].get<std::string>() + "'");
        d.framing = *framing;
    }
    if (entry.contains("connectTimeoutMs")) {
        d.connect_timeout = get_millis("server '" + name + "'", entry, "connectTimeoutMs");
    }

    switch (d.kind) {
    case TransportKind::Process:
        if (!entry.contains("command")) fail(name, "'command' is required for a process server");
        d.command = get_string(name, entry, "command");
        if (d.command.empty()) fail(name, "'command' must not be empty");
        if (entry.contains("args")) {
            const auto& args = entry["args"];
            if (!args.is_array()) fail(name, "'args' must be an array");
            for (const auto& a : args) {
                if (!a.is_string()) fail(name, "'args' must contain only strings");
                d.args.push_back(a.get<std::string>());
            }
        }
        if (entry.contains("env")) d.env = get_string_map(name, entry, "env");
        if (entry.contains("cwd")) d.working_dir = get_string(name, entry, "cwd");
        break;

    case TransportKind::Network:
        if (entry.contains("url")) {
            std::string url = get_string(name, entry, "url");
            if (url.compare(0, 6, "tcp://") != 0) fail(name, "network url must start with tcp://");
            parse_tcp_url(d, url);
        } else {
            if (!entry.contains("port")) fail(name, "'port' is required for a network server");
            d.host = entry.contains("host") ? get_string(name, entry, "host") : "127.0.0.1";
            d.port = get_port(name, entry["port"]);
        }
        if (d.host.empty()) fail(name, "'host' must not be empty");
        break;

    case TransportKind::Http:
        if (!entry.contains("url")) fail(name, "'url' is required for an http server");
        d.url = get_string(name, entry, "url");
        if (d.url.compare(0, 8, "https://") == 0) {
            fail(name, "https is not supported by this build: " + d.url);
        }
        if (d.url.compare(0, 7, "http://") != 0) fail(name, "'url' must start with http://");
        if (d.url.size() == 7 || d.url[7] == '/') fail(name, "'url' has no host: " + d.url);
        if (entry.contains("headers")) d.headers = get_string_map(name, entry, "headers");
        break;
    }
    return d;
}

Config Config::parse(const nlohmann::json& doc) {
    if (!doc.is_object()) throw ConfigError("configuration must be a JSON object");

    Config cfg;
    auto servers = doc.find("mcpServers");
    if (servers == doc.end() || !servers->is_object()) {
        throw ConfigError("configuration needs an 'mcpServers' object");
    }
    for (auto it = servers->begin(); it != servers->end(); ++it) {
        cfg.servers.emplace(it.key(), parse_server(it.key(), it.value()));
    }

    auto client = doc.find("client");
    if (client == doc.end()) return cfg;
    if (!client->is_object()) throw ConfigError("'client' must be an object");

    const std::string where = "client";
    auto& s = cfg.client;
    if (client->contains("handshakeTimeoutMs"))  s.handshake_timeout = get_millis(where, *client, "handshakeTimeoutMs");
    if (client->contains("discoveryTimeoutMs"))  s.discovery_timeout = get_millis(where, *client, "discoveryTimeoutMs");
    if (client->contains("invocationTimeoutMs")) s.invocation_timeout = get_millis(where, *client, "invocationTimeoutMs");
    if (client->contains("reconnectDelayMs"))    s.reconnect_delay = get_millis(where, *client, "reconnectDelayMs");

    if (client->contains("maxInFlight")) {
        const auto& v = (*client)["maxInFlight"];
        if (!v.is_number_integer() || v.get<long long>() < 1) {
            throw ConfigError("client: 'maxInFlight' must be an integer >= 1");
        }
        s.max_in_flight = static_cast<size_t>(v.get<long long>());
    }
    if (client->contains("stepRetries")) {
        const auto& v = (*client)["stepRetries"];
        if (!v.is_number_integer() || v.get<long long>() < 0 || v.get<long long>() > MAX_STEP_RETRIES) {
            throw ConfigError("client: 'stepRetries' must be an integer in [0, "
                              + std::to_string(MAX_STEP_RETRIES) + "]");
        }
        s.step_retries = static_cast<int>(v.get<long long>());
    }
    if (client->contains("validateArguments")) {
        const auto& v = (*client)["validateArguments"];
        if (!v.is_boolean()) throw ConfigError("client: 'validateArguments' must be a boolean");
        s.validate_arguments = v.get<bool>();
    }
    if (client->contains("logLevel")) {
        const auto& v = (*client)["logLevel"];
        if (!v.is_string()) throw ConfigError("client: 'logLevel' must be a string");
        s.log_level = v.get<std::string>();
    }
    return cfg;
}

Config Config::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("cannot open configuration file '" + path + "'");

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("'" + path + "' is not valid JSON: " + e.what());
    }
    return parse(doc);
}

} // namespace toolbridge
