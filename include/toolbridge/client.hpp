#pragma once
#include "backoff.hpp"
#include "config.hpp"
#include "session.hpp"
#include "types.hpp"
#include "transport/transport.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolbridge {

/// What the task layer needs: run one tool on one server.
class ToolInvoker {
public:
    virtual ~ToolInvoker() = default;

    virtual ToolResult invoke(const std::string& server, const std::string& tool,
                              const nlohmann::json& arguments,
                              std::optional<std::chrono::milliseconds> timeout = std::nullopt) = 0;

    /// The tool's idempotentHint annotation, if known.
    virtual std::optional<bool> idempotent_hint(const std::string& /*server*/, const std::string& /*tool*/) {
        return std::nullopt;
    }
};

/// Front door for the reasoning layer. Holds one lazily started Session per
/// configured server; the set of server names is fixed at construction.
class Client : public ToolInvoker {
public:
    using TransportFactory = std::function<std::unique_ptr<ITransport>(const ServerDescriptor&)>;

    struct Options {
        Implementation client_info{std::string(LIBRARY_NAME), std::nullopt, std::string(LIBRARY_VERSION)};
        std::chrono::milliseconds handshake_timeout{10000};
        std::chrono::milliseconds discovery_timeout{10000};
        std::chrono::milliseconds invocation_timeout{30000};
        /// Session starts per call; attempt 2 is the single reconnect.
        BackoffPolicy reconnect{2, std::chrono::milliseconds(100), 2.0, std::chrono::milliseconds(2000)};
        bool validate_arguments = true;
        TransportFactory transport_factory;   // empty: make_transport
    };

    Client(std::map<std::string, ServerDescriptor> servers, Options opts);
    explicit Client(const Config& config);
    ~Client() override;

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    [[nodiscard]] static Options options_from(const ClientSettings& settings);

    /// Tools of one server, starting its session on first use.
    /// Throws UnknownServer, ConnectError, HandshakeError.
    std::vector<Capability> discover(const std::string& server);

    /// Tools of every configured server. Servers that fail are logged and left out.
    std::map<std::string, std::vector<Capability>> discover_all();

    /// Call a tool. A lost connection is retried once on a fresh session;
    /// every other failure surfaces unchanged.
    ToolResult invoke(const std::string& server, const std::string& tool,
                      const nlohmann::json& arguments,
                      std::optional<std::chrono::milliseconds> timeout = std::nullopt) override;

    /// idempotentHint from the cached tool list of a started session.
    std::optional<bool> idempotent_hint(const std::string& server, const std::string& tool) override;

    /// The started session for `server`.
    [[nodiscard]] std::shared_ptr<Session> session(const std::string& server);

    /// Close one server's session; the next use starts a new one.
    void close_session(const std::string& server);

    /// Close every session. Idempotent; later calls throw SessionClosed.
    void shutdown();

    [[nodiscard]] std::vector<std::string> server_names() const;
    [[nodiscard]] size_t active_sessions() const;
    [[nodiscard]] bool is_shut_down() const noexcept { return shut_down_; }

private:
    struct Entry {
        ServerDescriptor descriptor;
        std::mutex mutex;
        std::shared_ptr<Session> session;
    };

    Entry& entry(const std::string& server);
    std::shared_ptr<Session> acquire(Entry& e);
    std::shared_ptr<Session> reconnect(Entry& e, const std::shared_ptr<Session>& dead, const std::string& why,
                                       int attempt);
    std::shared_ptr<Session> start_session(const ServerDescriptor& descriptor);
    void check_open() const;

    Options opts_;
    std::map<std::string, std::unique_ptr<Entry>> entries_;
    std::atomic<bool> shut_down_{false};
};

} // namespace toolbridge
