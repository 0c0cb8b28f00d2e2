#pragma once
#include "connector.hpp"
#include "pending_table.hpp"
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolbridge {

enum class SessionState {
    Connecting,
    Ready,
    Degraded,
    Closed
};

[[nodiscard]] std::string_view to_string(SessionState state);

/// State a Session shares with the calls it hands out. The connector is
/// declared last so it is destroyed before the table it writes to.
struct SessionLink {
    PendingTable pending;
    std::unique_ptr<Connector> connector;
};

/// Handle to one in-flight tools/call. get() may be called once.
/// Releasing the handle before get() abandons the call. The handle may
/// outlive its Session; get() then throws SessionClosed.
class PendingCall {
public:
    PendingCall(PendingCall&&) = default;
    PendingCall& operator=(PendingCall&& other) noexcept;
    ~PendingCall();

    /// Block until the call completes or its deadline passes.
    /// Throws TimeoutError, Cancelled, RemoteError, ConnectionLost,
    /// SessionClosed or ParseError.
    ToolResult get();

    /// Abandon the call. get() then throws Cancelled.
    void cancel(const std::string& reason = "cancelled by caller");

    [[nodiscard]] int64_t id() const noexcept { return out_.id; }
    [[nodiscard]] const std::string& tool() const noexcept { return tool_; }

private:
    friend class Session;
    PendingCall(std::weak_ptr<SessionLink> link, std::string server, std::string tool, Connector::Outbound out);

    void release() noexcept;

    std::weak_ptr<SessionLink> link_;
    std::string server_;
    std::string tool_;
    Connector::Outbound out_;
};

/// One logical connection to one tool server. Owns the connector, the
/// pending-request table and the capability cache.
class Session {
public:
    struct Options {
        Connector::Options connector;
        std::chrono::milliseconds discovery_timeout{10000};
        std::chrono::milliseconds call_timeout{30000};
        bool validate_arguments = true;
    };

    Session(std::string server_name, std::unique_ptr<ITransport> transport, Options opts);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Connect, handshake and fetch the tool list. Connecting -> Ready.
    /// ConnectError is rethrown; any later failure is a HandshakeError.
    /// Either way the session ends Closed.
    void start();

    [[nodiscard]] SessionState state() const;
    [[nodiscard]] const std::string& server_name() const noexcept { return server_name_; }

    /// The advertised tools; nullopt unless the session is Ready.
    [[nodiscard]] std::optional<std::vector<Capability>> capabilities() const;

    /// The advertised tools, re-fetched first when the server announced a change.
    std::vector<Capability> discover();
    std::vector<Capability> discover(std::chrono::milliseconds timeout);

    [[nodiscard]] std::optional<InitializeResult> server_info() const;

    [[nodiscard]] PendingCall call_async(const std::string& tool, const nlohmann::json& arguments,
                                         std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    ToolResult call(const std::string& tool, const nlohmann::json& arguments,
                    std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Fail outstanding calls with SessionClosed and release the connection.
    /// Idempotent.
    void close();

    [[nodiscard]] size_t pending_count() const { return link_->pending.size(); }

    [[nodiscard]] std::shared_ptr<NotificationStream> notifications() { return link_->connector->notifications(); }

private:
    void set_state(SessionState next);
    void handle_disconnect(const std::string& reason);
    void ensure_callable() const;
    std::vector<Capability> refresh_tools(std::chrono::milliseconds timeout);
    std::optional<Capability> find_tool(const std::string& name) const;

    std::string server_name_;
    Options opts_;
    std::shared_ptr<SessionLink> link_;

    mutable std::mutex mutex_;
    SessionState state_{SessionState::Connecting};
    bool disconnected_ = false;
    std::optional<std::vector<Capability>> tools_;
    bool tools_stale_ = false;

    std::atomic<bool> started_{false};
    std::atomic<bool> closed_{false};
};

} // namespace toolbridge
