#include "toolbridge/session.hpp"
#include "toolbridge/error.hpp"
#include "toolbridge/log.hpp"
#include "toolbridge/schema.hpp"

namespace toolbridge {

std::string_view to_string(SessionState state) {
    switch (state) {
        case SessionState::Connecting: return "connecting";
        case SessionState::Ready:      return "ready";
        case SessionState::Degraded:   return "degraded";
        case SessionState::Closed:     return "closed";
    }
    return "unknown";
}

// ---------- PendingCall ----------

PendingCall::PendingCall(std::weak_ptr<SessionLink> link, std::string server, std::string tool,
                         Connector::Outbound out)
    : link_(std::move(link)), server_(std::move(server)), tool_(std::move(tool)), out_(std::move(out)) {
}

PendingCall& PendingCall::operator=(PendingCall&& other) noexcept {
    if (this != &other) {
        release();
        link_ = std::move(other.link_);
        server_ = std::move(other.server_);
        tool_ = std::move(other.tool_);
        out_ = std::move(other.out_);
    }
    return *this;
}

PendingCall::~PendingCall() {
    release();
}

void PendingCall::release() noexcept {
    if (!out_.future.valid()) return;
    auto link = link_.lock();
    if (!link) return;
    try {
        link->connector->abandon(out_.id, "call handle released");
    } catch (const std::exception& e) {
        log::logger()->warn("releasing call {}.{} (id {}) failed: {}", server_, tool_, out_.id, e.what());
    }
}

ToolResult PendingCall::get() {
    auto logger = log::logger();
    nlohmann::json raw;
    try {
        if (auto link = link_.lock()) {
            raw = link->connector->wait(out_);
        } else if (out_.future.valid()) {
            // The session failed every entry when it closed.
            raw = out_.future.get();
        } else {
            throw SessionClosed("session '" + server_ + "' is closed");
        }
    } catch (const Error& e) {
        logger->info("call {}.{} (id {}) failed: {}", server_, tool_, out_.id, e.what());
        throw;
    }

    ToolResult result;
    try {
        from_json(raw, result);
    } catch (const nlohmann::json::exception& e) {
        throw ParseError("malformed tools/call result from '" + server_ + "': " + e.what());
    }
    logger->debug("call {}.{} (id {}) completed{}", server_, tool_, out_.id,
                  result.is_error ? " with a tool error" : "");
    return result;
}

void PendingCall::cancel(const std::string& reason) {
    if (auto link = link_.lock()) link->connector->abandon(out_.id, reason);
}

// ---------- Session ----------

Session::Session(std::string server_name, std::unique_ptr<ITransport> transport, Options opts)
    : server_name_(std::move(server_name)),
      opts_(std::move(opts)),
      link_(std::make_shared<SessionLink>()) {
    link_->connector = std::make_unique<Connector>(std::move(transport), link_->pending, opts_.connector);
    link_->connector->on_disconnect([this](const std::string& reason) { handle_disconnect(reason); });
    link_->connector->router().on_notification("notifications/tools/list_changed", [this](const nlohmann::json&) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tools_stale_ = true;
        }
        log::logger()->info("session '{}': tool list changed", server_name_);
    });
}

Session::~Session() {
    close();
}

void Session::start() {
    switch (state()) {
        case SessionState::Ready:    return;
        case SessionState::Closed:   throw SessionClosed("session '" + server_name_ + "' is closed");
        case SessionState::Degraded: throw ConnectionLost("session '" + server_name_ + "' lost its connection");
        case SessionState::Connecting: break;
    }
    if (started_.exchange(true)) {
        throw NotReady("session '" + server_name_ + "' is already starting");
    }

    auto logger = log::logger();
    logger->info("session '{}' connecting to {}", server_name_, link_->connector->describe());

    try {
        link_->connector->open();
    } catch (const ConnectError& e) {
        logger->error("session '{}': connect failed: {}", server_name_, e.what());
        close();
        throw;
    }

    try {
        link_->connector->handshake();
        auto tools = link_->connector->list_tools(opts_.discovery_timeout);
        std::lock_guard<std::mutex> lock(mutex_);
        tools_ = std::move(tools);
        tools_stale_ = false;
    } catch (const Error& e) {
        bool closed_meanwhile = closed_;
        close();
        if (closed_meanwhile) {
            throw SessionClosed("session '" + server_name_ + "' closed while starting");
        }
        if (e.kind() == ErrorKind::Handshake) throw;
        logger->error("session '{}': tool discovery failed: {}", server_name_, e.what());
        throw HandshakeError("session '" + server_name_ + "': tool discovery failed: " + e.what());
    }

    bool lost = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lost = disconnected_;
    }
    set_state(lost ? SessionState::Degraded : SessionState::Ready);
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<std::vector<Capability>> Session::capabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Ready) return std::nullopt;
    return tools_;
}

std::vector<Capability> Session::discover() {
    return discover(opts_.discovery_timeout);
}

std::vector<Capability> Session::discover(std::chrono::milliseconds timeout) {
    ensure_callable();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (tools_ && !tools_stale_) return *tools_;
    }
    return refresh_tools(timeout);
}

std::optional<InitializeResult> Session::server_info() const {
    return link_->connector->initialize_result();
}

PendingCall Session::call_async(const std::string& tool, const nlohmann::json& arguments,
                                std::optional<std::chrono::milliseconds> timeout) {
    ensure_callable();

    auto capability = find_tool(tool);
    if (!capability) {
        bool stale = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stale = tools_stale_;
        }
        if (stale) {
            refresh_tools(opts_.discovery_timeout);
            capability = find_tool(tool);
        }
    }
    if (!capability) throw UnknownCapability(server_name_, tool);

    nlohmann::json args = arguments.is_null() ? nlohmann::json::object() : arguments;
    if (opts_.validate_arguments) {
        validate_arguments(capability->input_schema, args);
    }

    auto deadline = std::chrono::steady_clock::now() + timeout.value_or(opts_.call_timeout);
    nlohmann::json params = {{"name", tool}, {"arguments", std::move(args)}};
    auto out = link_->connector->request("tools/call", std::move(params), deadline);
    log::logger()->debug("call {}.{} (id {}) started", server_name_, tool, out.id);
    return PendingCall(link_, server_name_, tool, std::move(out));
}

ToolResult Session::call(const std::string& tool, const nlohmann::json& arguments,
                         std::optional<std::chrono::milliseconds> timeout) {
    return call_async(tool, arguments, timeout).get();
}

void Session::close() {
    if (closed_.exchange(true)) return;

    size_t failed = link_->pending.fail_all(
        std::make_exception_ptr(SessionClosed("session '" + server_name_ + "' closed")), true);
    if (failed > 0) {
        log::logger()->info("session '{}': {} pending requests failed on close", server_name_, failed);
    }
    link_->connector->close();
    set_state(SessionState::Closed);
}

void Session::set_state(SessionState next) {
    SessionState prev;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        prev = state_;
        if (prev == next || prev == SessionState::Closed) return;
        state_ = next;
    }
    log::logger()->info("session '{}': {} -> {}", server_name_, to_string(prev), to_string(next));
}

void Session::handle_disconnect(const std::string& reason) {
    size_t failed = link_->pending.fail_all(
        std::make_exception_ptr(ConnectionLost("connection to '" + server_name_ + "' lost: " + reason)), true);
    log::logger()->warn("session '{}' disconnected ({}), {} pending requests failed",
                        server_name_, reason, failed);

    bool was_ready = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        disconnected_ = true;
        was_ready = state_ == SessionState::Ready;
    }
    if (was_ready) set_state(SessionState::Degraded);
}

void Session::ensure_callable() const {
    switch (state()) {
        case SessionState::Ready:
            return;
        case SessionState::Connecting:
            throw NotReady("session '" + server_name_ + "' has not completed its handshake");
        case SessionState::Degraded:
            throw ConnectionLost("session '" + server_name_ + "' lost its connection");
        case SessionState::Closed:
            throw SessionClosed("session '" + server_name_ + "' is closed");
    }
}

std::vector<Capability> Session::refresh_tools(std::chrono::milliseconds timeout) {
    auto tools = link_->connector->list_tools(timeout);
    log::logger()->info("session '{}': refreshed tool list ({} tools)", server_name_, tools.size());
    std::lock_guard<std::mutex> lock(mutex_);
    tools_ = tools;
    tools_stale_ = false;
    return tools;
}

std::optional<Capability> Session::find_tool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!tools_) return std::nullopt;
    for (const auto& t : *tools_) {
        if (t.name == name) return t;
    }
    return std::nullopt;
}

} // namespace toolbridge
