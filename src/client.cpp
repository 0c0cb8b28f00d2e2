#include "toolbridge/client.hpp"
#include "toolbridge/error.hpp"
#include "toolbridge/log.hpp"
#include "toolbridge/transport/factory.hpp"
#include <thread>

namespace toolbridge {

Client::Client(std::map<std::string, ServerDescriptor> servers, Options opts)
    : opts_(std::move(opts)) {
    if (!opts_.transport_factory) opts_.transport_factory = make_transport;
    for (auto& [name, descriptor] : servers) {
        auto e = std::make_unique<Entry>();
        e->descriptor = std::move(descriptor);
        if (e->descriptor.name.empty()) e->descriptor.name = name;
        entries_.emplace(name, std::move(e));
    }
}

Client::Client(const Config& config)
    : Client(config.servers, options_from(config.client)) {
}

Client::~Client() {
    shutdown();
}

Client::Options Client::options_from(const ClientSettings& settings) {
    Options opts;
    opts.handshake_timeout = settings.handshake_timeout;
    opts.discovery_timeout = settings.discovery_timeout;
    opts.invocation_timeout = settings.invocation_timeout;
    opts.reconnect.initial_delay = settings.reconnect_delay;
    opts.validate_arguments = settings.validate_arguments;
    return opts;
}

std::vector<Capability> Client::discover(const std::string& server) {
    Entry& e = entry(server);
    auto session = acquire(e);
    if (session->state() == SessionState::Degraded) {
        session = reconnect(e, session, "session degraded", 2);
    }
    return session->discover(opts_.discovery_timeout);
}

std::map<std::string, std::vector<Capability>> Client::discover_all() {
    check_open();
    std::map<std::string, std::vector<Capability>> all;
    for (const auto& [name, e] : entries_) {
        try {
            all[name] = discover(name);
        } catch (const SessionClosed&) {
            if (shut_down_) throw;
            log::logger()->warn("skipping server '{}': session closed during discovery", name);
        } catch (const Error& ex) {
            log::logger()->warn("skipping server '{}': {}", name, ex.what());
        }
    }
    return all;
}

ToolResult Client::invoke(const std::string& server, const std::string& tool,
                          const nlohmann::json& arguments,
                          std::optional<std::chrono::milliseconds> timeout) {
    Entry& e = entry(server);
    auto call_timeout = timeout.value_or(opts_.invocation_timeout);

    int attempt = 1;
    auto session = acquire(e);
    if (session->state() == SessionState::Degraded) {
        session = reconnect(e, session, "session degraded", ++attempt);
    }

    while (true) {
        try {
            return session->call(tool, arguments, call_timeout);
        } catch (const ConnectionLost& ex) {
            if (!opts_.reconnect.allows(attempt + 1)) throw;
            session = reconnect(e, session, ex.what(), ++attempt);
        }
    }
}

std::optional<bool> Client::idempotent_hint(const std::string& server, const std::string& tool) {
    auto it = entries_.find(server);
    if (it == entries_.end()) return std::nullopt;

    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(it->second->mutex);
        session = it->second->session;
    }
    if (!session) return std::nullopt;
    auto tools = session->capabilities();
    if (!tools) return std::nullopt;
    for (const auto& t : *tools) {
        if (t.name != tool || !t.annotations) continue;
        auto hint = t.annotations->find("idempotentHint");
        if (hint != t.annotations->end() && hint->is_boolean()) return hint->get<bool>();
        return std::nullopt;
    }
    return std::nullopt;
}

std::shared_ptr<Session> Client::session(const std::string& server) {
    return acquire(entry(server));
}

void Client::close_session(const std::string& server) {
    Entry& e = entry(server);
    std::lock_guard<std::mutex> lock(e.mutex);
    if (!e.session) return;
    e.session->close();
    e.session.reset();
    log::logger()->info("closed session '{}'", server);
}

void Client::shutdown() {
    if (shut_down_.exchange(true)) return;

    size_t closed = 0;
    for (auto& [name, e] : entries_) {
        std::lock_guard<std::mutex> lock(e->mutex);
        if (!e->session) continue;
        e->session->close();
        e->session.reset();
        ++closed;
    }
    log::logger()->info("client shut down, {} sessions closed", closed);
}

std::vector<std::string> Client::server_names() const {
    std::vector<std::string> names;
    for (const auto& [name, e] : entries_) names.push_back(name);
    return names;
}

size_t Client::active_sessions() const {
    size_t n = 0;
    for (const auto& [name, e] : entries_) {
        std::lock_guard<std::mutex> lock(e->mutex);
        if (e->session && e->session->state() != SessionState::Closed) ++n;
    }
    return n;
}

Client::Entry& Client::entry(const std::string& server) {
    check_open();
    auto it = entries_.find(server);
    if (it == entries_.end()) throw UnknownServer(server);
    return *it->second;
}

std::shared_ptr<Session> Client::acquire(Entry& e) {
    std::lock_guard<std::mutex> lock(e.mutex);
    check_open();
    if (e.session && e.session->state() != SessionState::Closed) return e.session;

    e.session = start_session(e.descriptor);
    return e.session;
}

std::shared_ptr<Session> Client::reconnect(Entry& e, const std::shared_ptr<Session>& dead,
                                           const std::string& why, int attempt) {
    if (!opts_.reconnect.allows(attempt)) {
        throw ConnectionLost(why + "; reconnecting is disabled");
    }
    std::lock_guard<std::mutex> lock(e.mutex);
    check_open();
    // Another caller may have replaced the session already.
    if (e.session && e.session != dead && e.session->state() == SessionState::Ready) {
        return e.session;
    }

    auto logger = log::logger();
    logger->warn("reconnecting to '{}' after: {}", e.descriptor.name, why);
    if (e.session) {
        e.session->close();
        e.session.reset();
    }

    auto delay = opts_.reconnect.delay_for(attempt);
    if (delay.count() > 0) std::this_thread::sleep_for(delay);

    try {
        e.session = start_session(e.descriptor);
    } catch (const Error& ex) {
        logger->error("reconnect to '{}' failed: {}", e.descriptor.name, ex.what());
        throw ConnectionLost(why + "; reconnect failed: " + ex.what());
    }
    logger->info("reconnected to '{}'", e.descriptor.name);
    return e.session;
}

std::shared_ptr<Session> Client::start_session(const ServerDescriptor& descriptor) {
    Session::Options so;
    so.connector.client_info = opts_.client_info;
    so.connector.handshake_timeout = opts_.handshake_timeout;
    so.discovery_timeout = opts_.discovery_timeout;
    so.call_timeout = opts_.invocation_timeout;
    so.validate_arguments = opts_.validate_arguments;

    auto session = std::make_shared<Session>(descriptor.name, opts_.transport_factory(descriptor), std::move(so));
    session->start();
    return session;
}

void Client::check_open() const {
    if (shut_down_) throw SessionClosed("client has been shut down");
}

} // namespace toolbridge
