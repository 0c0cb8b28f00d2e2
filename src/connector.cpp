#include "toolbridge/connector.hpp"
#include "toolbridge/codec.hpp"
#include "toolbridge/error.hpp"
#include "toolbridge/log.hpp"

namespace toolbridge {

// ---------- NotificationStream ----------

void NotificationStream::push(JsonRpcNotification notification) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        queue_.push_back(std::move(notification));
    }
    cv_.notify_one();
}

void NotificationStream::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

std::optional<JsonRpcNotification> NotificationStream::next() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) return std::nullopt;
    auto n = std::move(queue_.front());
    queue_.pop_front();
    return n;
}

std::optional<JsonRpcNotification> NotificationStream::next_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) return std::nullopt;
    auto n = std::move(queue_.front());
    queue_.pop_front();
    return n;
}

bool NotificationStream::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t NotificationStream::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

// ---------- Connector ----------

Connector::Connector(std::unique_ptr<ITransport> transport, PendingTable& pending, Options opts)
    : transport_(std::move(transport)), pending_(pending), opts_(std::move(opts)) {
    router_.on_request("ping", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json::object();
    });
}

Connector::~Connector() {
    close();
}

void Connector::open() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (closing_) throw ConnectError(describe() + ": connector already closed");
    if (connected_) return;

    transport_->open();
    connected_ = true;
    reader_ = std::thread([this] { reader_loop(); });
}

InitializeResult Connector::handshake() {
    auto logger = log::logger();
    logger->info("handshake with {} started", describe());

    nlohmann::json params = {
        {"protocolVersion", std::string(PROTOCOL_VERSION)},
        {"capabilities", opts_.capabilities},
        {"clientInfo", opts_.client_info}
    };

    InitializeResult result;
    try {
        auto out = request("initialize", std::move(params),
                           std::chrono::steady_clock::now() + opts_.handshake_timeout);
        nlohmann::json raw = wait(out);

        if (!raw.is_object()) {
            throw HandshakeError("initialize result from " + describe() + " is not an object");
        }
        for (const char* field : {"protocolVersion", "capabilities", "serverInfo"}) {
            if (!raw.contains(field)) {
                throw HandshakeError("initialize result from " + describe() + " lacks '" + field + "'");
            }
        }
        try {
            from_json(raw, result);
        } catch (const nlohmann::json::exception& e) {
            throw HandshakeError("malformed initialize result from " + describe() + ": " + e.what());
        }

        notify("notifications/initialized");
    } catch (const HandshakeError& e) {
        logger->error("handshake with {} failed: {}", describe(), e.what());
        throw;
    } catch (const Error& e) {
        logger->error("handshake with {} failed: {}", describe(), e.what());
        throw HandshakeError("handshake with " + describe() + " failed: " + e.what());
    }

    if (result.protocol_version != PROTOCOL_VERSION) {
        logger->info("{} negotiated protocol {} (requested {})",
                     describe(), result.protocol_version, PROTOCOL_VERSION);
    }
    logger->info("handshake with {} complete: {} {}",
                 describe(), result.server_info.name, result.server_info.version);

    std::lock_guard<std::mutex> lock(mutex_);
    init_result_ = result;
    return result;
}

std::vector<Capability> Connector::list_tools(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::vector<Capability> tools;
    std::optional<std::string> cursor;

    do {
        nlohmann::json params = nlohmann::json::object();
        if (cursor) params["cursor"] = *cursor;

        auto out = request("tools/list", std::move(params), deadline);
        nlohmann::json page = wait(out);
        auto it = page.find("tools");
        if (!page.is_object() || it == page.end() || !it->is_array()) {
            throw ParseError("tools/list result from " + describe() + " lacks a 'tools' array");
        }
        try {
            for (const auto& t : *it) {
                tools.push_back(t.get<Capability>());
            }
        } catch (const nlohmann::json::exception& e) {
            throw ParseError("malformed tool in tools/list result from " + describe() + ": " + e.what());
        }

        cursor.reset();
        auto next = page.find("nextCursor");
        if (next != page.end() && next->is_string()) cursor = next->get<std::string>();
    } while (cursor);

    log::logger()->debug("{} advertises {} tools", describe(), tools.size());
    return tools;
}

Connector::Outbound Connector::request(const std::string& method, nlohmann::json params,
                                       std::chrono::steady_clock::time_point deadline) {
    if (!connected_) {
        throw ConnectionLost(describe() + " is not connected");
    }

    expire_overdue();

    int64_t id = pending_.next_id();
    std::string payload = Codec::serialize(make_request(id, method, std::move(params)));

    Outbound out;
    out.id = id;
    out.method = method;
    out.deadline = deadline;
    out.future = pending_.insert(id, method, payload, deadline);

    try {
        transport_->send(payload);
    } catch (const TransportError& e) {
        std::string msg = "sending " + method + " to " + describe() + " failed: " + e.what();
        pending_.fail(id, std::make_exception_ptr(ConnectionLost(msg)));
        throw ConnectionLost(msg);
    }
    log::logger()->trace("-> {} {} (id {})", describe(), method, id);
    return out;
}

nlohmann::json Connector::wait(Outbound& out) {
    if (out.future.wait_until(out.deadline) == std::future_status::timeout) {
        TimeoutError timeout = timeout_error(out.method, out.id);
        // A response may still win the race; then the entry is gone already.
        if (pending_.fail(out.id, std::make_exception_ptr(timeout))) {
            log::logger()->warn("{}", timeout.what());
            send_cancel(out.id, "timeout");
        }
    }
    return out.future.get();
}

void Connector::abandon(int64_t id, const std::string& reason) {
    if (pending_.fail(id, std::make_exception_ptr(Cancelled("request " + std::to_string(id) + " cancelled: " + reason)))) {
        log::logger()->info("cancelled request {} to {}: {}", id, describe(), reason);
        send_cancel(id, reason);
    }
}

size_t Connector::expire_overdue() {
    size_t expired = 0;
    for (int64_t id : pending_.expired(std::chrono::steady_clock::now())) {
        TimeoutError timeout = timeout_error(pending_.method_of(id), id);
        if (pending_.fail(id, std::make_exception_ptr(timeout))) {
            log::logger()->warn("{}", timeout.what());
            send_cancel(id, "timeout");
            ++expired;
        }
    }
    return expired;
}

void Connector::notify(const std::string& method, std::optional<nlohmann::json> params) {
    try {
        send(make_notification(method, std::move(params)));
    } catch (const TransportError& e) {
        throw ConnectionLost("sending " + method + " to " + describe() + " failed: " + e.what());
    }
}

std::shared_ptr<NotificationStream> Connector::notifications() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stream_) {
        stream_ = std::make_shared<NotificationStream>();
        if (stream_closed_) stream_->close();
    }
    return stream_;
}

void Connector::on_disconnect(DisconnectHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    disconnect_handler_ = std::move(handler);
}

void Connector::close() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (closing_.exchange(true)) return;

    log::logger()->debug("closing connection to {}", describe());
    transport_->close();
    if (reader_.joinable()) reader_.join();
    connected_ = false;
    close_stream();
}

std::optional<InitializeResult> Connector::initialize_result() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return init_result_;
}

std::string Connector::describe() const {
    return transport_->describe();
}

void Connector::reader_loop() {
    std::string reason = "end of stream";
    try {
        while (!closing_) {
            auto frame = transport_->receive();
            if (!frame) break;

            JsonRpcMessage msg;
            try {
                msg = Codec::parse(*frame);
            } catch (const ParseError& e) {
                log::logger()->warn("dropping malformed message from {}: {}", describe(), e.what());
                continue;
            }
            handle(std::move(msg));
        }
    } catch (const std::exception& e) {
        reason = e.what();
    }

    connected_ = false;
    if (closing_) return;

    log::logger()->warn("lost connection to {}: {}", describe(), reason);
    close_stream();

    DisconnectHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = disconnect_handler_;
    }
    if (handler) handler(reason);
}

void Connector::handle(JsonRpcMessage msg) {
    if (auto* resp = std::get_if<JsonRpcResponse>(&msg)) {
        const auto* id = std::get_if<int64_t>(&resp->id);
        if (!id) {
            log::logger()->debug("dropping response with foreign id {} from {}", id_to_string(resp->id), describe());
            return;
        }
        bool delivered = resp->failed()
            ? pending_.fail(*id, std::make_exception_ptr(RemoteError(resp->error->code, resp->error->message)))
            : pending_.complete(*id, resp->result ? std::move(*resp->result) : nlohmann::json::object());
        if (!delivered) {
            log::logger()->debug("discarding response for unknown or finished id {} from {}", *id, describe());
        }
        return;
    }

    if (auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        std::shared_ptr<NotificationStream> stream;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stream = stream_;
        }
        if (stream) stream->push(*notif);
        (void)router_.dispatch(msg);
        return;
    }

    auto reply = router_.dispatch(msg);
    if (!reply) return;
    try {
        send(*reply);
    } catch (const TransportError& e) {
        log::logger()->warn("could not answer {} request: {}", describe(), e.what());
    }
}

void Connector::send(const JsonRpcMessage& msg) {
    transport_->send(Codec::serialize(msg));
}

void Connector::send_cancel(int64_t id, const std::string& reason) {
    try {
        send(make_notification("notifications/cancelled", nlohmann::json{{"requestId", id}, {"reason", reason}}));
    } catch (const TransportError& e) {
        log::logger()->debug("cancel for request {} not delivered: {}", id, e.what());
    }
}

TimeoutError Connector::timeout_error(const std::string& method, int64_t id) const {
    return TimeoutError(method + " (id " + std::to_string(id) + ") to " + describe() + " timed out");
}

void Connector::close_stream() {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_closed_ = true;
    if (stream_) stream_->close();
}

} // namespace toolbridge
