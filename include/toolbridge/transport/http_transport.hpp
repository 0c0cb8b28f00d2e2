#pragma once
#include "transport.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Forward declaration to avoid including heavy httplib header
namespace httplib {
    class Client;
}

namespace toolbridge {

/// Tool server reachable over streamable HTTP. Every outbound message is a
/// POST to the server URL; the reply body (plain JSON or an event stream) is
/// queued for receive().
///
/// Messages leave in send() order. A single sender thread POSTs
/// notifications and responses itself and hands requests to a worker pool,
/// moving on only once the worker has written the request body. A slow call
/// therefore holds a worker but never the messages queued behind it.
class HttpTransport : public ITransport {
public:
    struct Options {
        std::string url;
        std::map<std::string, std::string> headers;
        std::chrono::milliseconds connect_timeout{5000};
        std::chrono::milliseconds read_timeout{120000};
        size_t workers = 4;   // concurrent requests
    };

    explicit HttpTransport(Options opts);
    ~HttpTransport() override;

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    void open() override;
    void send(std::string_view payload) override;
    std::optional<std::string> receive() override;
    void close() override;
    bool is_open() const override;
    std::string describe() const override;

    /// Session id the server assigned, empty before the first reply.
    [[nodiscard]] std::string session_id() const;

private:
    struct Inbound {
        std::string body;
        bool failed = false;
    };

    struct Outgoing {
        std::string body;
        bool is_request = false;
    };

    /// A request waiting for a worker; `written` is set once its body is on
    /// the wire or the POST has failed.
    struct Job {
        std::string body;
        std::promise<void> written;
    };

    void sender_loop();
    void worker_loop(httplib::Client* client);
    void post(httplib::Client& client, const std::string& body, const std::function<void()>& on_written);
    void push_inbound(Inbound item);

    Options opts_;
    std::string origin_;   // "http://host:port"
    std::string path_;

    std::atomic<bool> open_{false};

    std::mutex outbox_mutex_;
    std::condition_variable outbox_cv_;
    std::deque<Outgoing> outbox_;

    std::mutex jobs_mutex_;
    std::condition_variable jobs_cv_;
    std::deque<Job> jobs_;

    std::mutex inbox_mutex_;
    std::condition_variable inbox_cv_;
    std::deque<Inbound> inbox_;

    mutable std::mutex session_mutex_;
    std::string session_id_;

    std::unique_ptr<httplib::Client> sender_client_;
    std::thread sender_;
    std::vector<std::unique_ptr<httplib::Client>> clients_;
    std::vector<std::thread> workers_;
};

} // namespace toolbridge
