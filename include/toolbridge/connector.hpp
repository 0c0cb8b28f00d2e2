#pragma once
#include "error.hpp"
#include "json_rpc.hpp"
#include "pending_table.hpp"
#include "router.hpp"
#include "types.hpp"
#include "version.hpp"
#include "transport/transport.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace toolbridge {

/// Notifications received from one server, in arrival order. Unbounded;
/// ends when the connector closes.
class NotificationStream {
public:
    void push(JsonRpcNotification notification);
    void close();

    /// Blocks for the next notification. nullopt once closed and drained.
    [[nodiscard]] std::optional<JsonRpcNotification> next();

    /// Like next(), giving up after `timeout`.
    [[nodiscard]] std::optional<JsonRpcNotification> next_for(std::chrono::milliseconds timeout);

    [[nodiscard]] bool closed() const;
    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<JsonRpcNotification> queue_;
    bool closed_ = false;
};

/// Protocol layer over one transport: the initialize handshake, correlated
/// request/response through the owning session's PendingTable, and inbound
/// dispatch on a dedicated reader thread.
class Connector {
public:
    struct Options {
        Implementation client_info{std::string(LIBRARY_NAME), std::nullopt, std::string(LIBRARY_VERSION)};
        ClientCapabilities capabilities;
        std::chrono::milliseconds handshake_timeout{10000};
    };

    /// An in-flight request.
    struct Outbound {
        int64_t id = 0;
        std::string method;
        std::future<nlohmann::json> future;
        std::chrono::steady_clock::time_point deadline;
    };

    using DisconnectHandler = std::function<void(const std::string& reason)>;

    Connector(std::unique_ptr<ITransport> transport, PendingTable& pending, Options opts);
    ~Connector();

    Connector(const Connector&) = delete;
    Connector& operator=(const Connector&) = delete;

    /// Open the transport and start reading. Throws ConnectError.
    void open();

    /// initialize / notifications/initialized. Throws HandshakeError.
    InitializeResult handshake();

    /// Every tool the server advertises, following nextCursor.
    [[nodiscard]] std::vector<Capability> list_tools(std::chrono::milliseconds timeout);

    /// Register and send a request. Throws ConnectionLost when the request
    /// cannot be sent, or the table's rejection error once it refuses entries.
    [[nodiscard]] Outbound request(const std::string& method, nlohmann::json params,
                                   std::chrono::steady_clock::time_point deadline);

    /// Wait for the response to `out`. On deadline expiry the entry is
    /// failed with TimeoutError and the server is told to cancel.
    /// RemoteError for error responses.
    nlohmann::json wait(Outbound& out);

    /// Give up on a pending request with Cancelled and notify the server.
    void abandon(int64_t id, const std::string& reason);

    /// Fail every request whose deadline has passed with TimeoutError,
    /// whether or not anyone is waiting on it. Runs on each request().
    size_t expire_overdue();

    void notify(const std::string& method, std::optional<nlohmann::json> params = std::nullopt);

    [[nodiscard]] std::shared_ptr<NotificationStream> notifications();

    Router& router() { return router_; }

    /// Called once from the reader thread when the peer goes away. The
    /// handler must not call close().
    void on_disconnect(DisconnectHandler handler);

    /// Close the transport and join the reader. Idempotent.
    void close();

    [[nodiscard]] bool is_connected() const noexcept { return connected_; }
    [[nodiscard]] std::optional<InitializeResult> initialize_result() const;
    [[nodiscard]] std::string describe() const;

private:
    void reader_loop();
    void handle(JsonRpcMessage msg);
    void send(const JsonRpcMessage& msg);
    void send_cancel(int64_t id, const std::string& reason);
    void close_stream();
    TimeoutError timeout_error(const std::string& method, int64_t id) const;

    std::unique_ptr<ITransport> transport_;
    PendingTable& pending_;
    Options opts_;
    Router router_;

    std::mutex lifecycle_mutex_;
    std::thread reader_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> closing_{false};

    mutable std::mutex mutex_;
    std::shared_ptr<NotificationStream> stream_;
    bool stream_closed_ = false;
    DisconnectHandler disconnect_handler_;
    std::optional<InitializeResult> init_result_;
};

} // namespace toolbridge
