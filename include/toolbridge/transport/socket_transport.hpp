#pragma once
#include "stream_transport.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace toolbridge {

/// Tool server listening on a TCP port.
class SocketTransport : public StreamTransport {
public:
    struct Options {
        std::string host = "127.0.0.1";
        uint16_t port = 0;
        Framing framing = Framing::Newline;
        std::chrono::milliseconds connect_timeout{5000};
    };

    explicit SocketTransport(Options opts);
    ~SocketTransport() override;

    void open() override;
    std::string describe() const override;

protected:
    void release() override;

private:
    Options opts_;
    int socket_fd_{-1};
};

} // namespace toolbridge
