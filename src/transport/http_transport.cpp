#include "toolbridge/transport/http_transport.hpp"
#include "toolbridge/error.hpp"
#include "toolbridge/log.hpp"
#include "toolbridge/version.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <sstream>

namespace toolbridge {

namespace {

constexpr const char* SESSION_HEADER = "Mcp-Session-Id";

/// Payloads of the "data:" fields of an event stream, one per event.
std::vector<std::string> parse_event_stream(const std::string& body) {
    std::vector<std::string> events;
    std::string current;
    bool have_data = false;
    std::istringstream in(body);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) {
            if (have_data) events.push_back(std::move(current));
            current.clear();
            have_data = false;
            continue;
        }
        if (line.compare(0, 5, "data:") != 0) continue;
        std::string data = line.substr(5);
        if (!data.empty() && data.front() == ' ') data.erase(0, 1);
        if (have_data) current += '\n';
        current += data;
        have_data = true;
    }
    if (have_data) events.push_back(std::move(current));
    return events;
}

} // anonymous namespace

HttpTransport::HttpTransport(Options opts)
    : opts_(std::move(opts)) {
    if (opts_.workers == 0) opts_.workers = 1;
}

HttpTransport::~HttpTransport() {
    close();
}

void HttpTransport::open() {
    if (open_) return;

    const std::string& url = opts_.url;
    if (url.compare(0, 8, "https://") == 0) {
        throw ConnectError("https is not supported by this build: " + url);
    }
    if (url.compare(0, 7, "http://") != 0) {
        throw ConnectError("unsupported url '" + url + "', expected http://host[:port]/path");
    }
    std::string rest = url.substr(7);
    auto slash = rest.find('/');
    std::string host_port = slash == std::string::npos ? rest : rest.substr(0, slash);
    if (host_port.empty()) {
        throw ConnectError("url '" + url + "' has no host");
    }
    origin_ = "http://" + host_port;
    path_ = slash == std::string::npos ? "/" : rest.substr(slash);

    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        inbox_.clear();
    }
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        session_id_.clear();
    }

    auto make_client = [this] {
        auto client = std::make_unique<httplib::Client>(origin_);
        client->set_connection_timeout(opts_.connect_timeout);
        client->set_read_timeout(opts_.read_timeout);
        client->set_keep_alive(true);
        return client;
    };
    sender_client_ = make_client();
    clients_.clear();
    for (size_t i = 0; i < opts_.workers; ++i) clients_.push_back(make_client());

    open_ = true;
    for (auto& client : clients_) {
        workers_.emplace_back([this, c = client.get()] { worker_loop(c); });
    }
    sender_ = std::thread([this] { sender_loop(); });
    log::logger()->debug("http transport ready for {} ({} workers)", url, opts_.workers);
}

void HttpTransport::send(std::string_view payload) {
    if (!open_) {
        throw TransportError("transport is closed");
    }
    Outgoing out;
    out.body = std::string(payload);
    auto msg = nlohmann::json::parse(out.body, nullptr, false);
    out.is_request = msg.is_object() && msg.contains("method") && msg.contains("id");
    {
        std::lock_guard<std::mutex> lock(outbox_mutex_);
        outbox_.push_back(std::move(out));
    }
    outbox_cv_.notify_one();
}

std::optional<std::string> HttpTransport::receive() {
    std::unique_lock<std::mutex> lock(inbox_mutex_);
    inbox_cv_.wait(lock, [this] { return !inbox_.empty() || !open_; });
    if (!open_) return std::nullopt;

    Inbound item = std::move(inbox_.front());
    inbox_.pop_front();
    if (item.failed) {
        throw TransportError(item.body);
    }
    return std::move(item.body);
}

void HttpTransport::close() {
    if (!open_.exchange(false)) return;

    {
        std::lock_guard<std::mutex> lock(outbox_mutex_);
        outbox_.clear();
    }
    outbox_cv_.notify_all();
    {
        // Dropping a job breaks its promise, which releases the sender.
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        jobs_.clear();
    }
    jobs_cv_.notify_all();
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
    }
    inbox_cv_.notify_all();

    if (sender_client_) sender_client_->stop();
    for (auto& client : clients_) client->stop();
    if (sender_.joinable()) sender_.join();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();

    // Let the server drop its session state; failure here changes nothing.
    std::string sid = session_id();
    if (!sid.empty()) {
        httplib::Client client(origin_);
        client.set_connection_timeout(std::chrono::milliseconds(500));
        client.set_read_timeout(std::chrono::milliseconds(500));
        httplib::Headers headers = {{SESSION_HEADER, sid}};
        auto res = client.Delete(path_, headers);
        if (!res) {
            log::logger()->debug("session DELETE to {} failed: {}", opts_.url, httplib::to_string(res.error()));
        }
    }
    clients_.clear();
    sender_client_.reset();
}

bool HttpTransport::is_open() const {
    return open_;
}

std::string HttpTransport::describe() const {
    return opts_.url;
}

std::string HttpTransport::session_id() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_id_;
}

void HttpTransport::sender_loop() {
    while (true) {
        Outgoing out;
        {
            std::unique_lock<std::mutex> lock(outbox_mutex_);
            outbox_cv_.wait(lock, [this] { return !outbox_.empty() || !open_; });
            if (!open_) return;
            out = std::move(outbox_.front());
            outbox_.pop_front();
        }

        if (!out.is_request) {
            post(*sender_client_, out.body, nullptr);
            continue;
        }

        Job job;
        job.body = std::move(out.body);
        std::future<void> written = job.written.get_future();
        {
            std::lock_guard<std::mutex> lock(jobs_mutex_);
            jobs_.push_back(std::move(job));
        }
        jobs_cv_.notify_one();
        while (written.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready) {
            if (!open_) return;
        }
    }
}

void HttpTransport::worker_loop(httplib::Client* client) {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(jobs_mutex_);
            jobs_cv_.wait(lock, [this] { return !jobs_.empty() || !open_; });
            if (!open_) return;
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }

        bool signalled = false;
        auto release_sender = [&] {
            if (signalled) return;
            signalled = true;
            job.written.set_value();
        };
        post(*client, job.body, release_sender);
        release_sender();
    }
}

void HttpTransport::post(httplib::Client& client, const std::string& body,
                         const std::function<void()>& on_written) {
    httplib::Headers headers = {
        {"Accept", "application/json, text/event-stream"},
        {"MCP-Protocol-Version", std::string(PROTOCOL_VERSION)}
    };
    for (const auto& [name, value] : opts_.headers) {
        headers.emplace(name, value);
    }
    std::string sid = session_id();
    if (!sid.empty()) headers.emplace(SESSION_HEADER, sid);

    auto res = client.Post(path_, headers, body.size(),
        [&body, &on_written](size_t offset, size_t length, httplib::DataSink& sink) -> bool {
            if (!sink.write(body.data() + offset, length)) return false;
            if (offset + length >= body.size() && on_written) on_written();
            return true;
        },
        "application/json");
    if (!open_) return;
    if (!res) {
        push_inbound({"POST to " + opts_.url + " failed: " + httplib::to_string(res.error()), true});
        return;
    }

    if (res->has_header(SESSION_HEADER)) {
        std::lock_guard<std::mutex> lock(session_mutex_);
        session_id_ = res->get_header_value(SESSION_HEADER);
    }

    if (res->status >= 400) {
        push_inbound({"POST to " + opts_.url + " returned HTTP " + std::to_string(res->status), true});
        return;
    }
    if (res->body.empty()) return;   // 202 Accepted for notifications

    std::string content_type = res->get_header_value("Content-Type");
    if (content_type.find("text/event-stream") != std::string::npos) {
        for (auto& event : parse_event_stream(res->body)) {
            push_inbound({std::move(event), false});
        }
    } else {
        push_inbound({res->body, false});
    }
}

void HttpTransport::push_inbound(Inbound item) {
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        inbox_.push_back(std::move(item));
    }
    inbox_cv_.notify_one();
}

} // namespace toolbridge
