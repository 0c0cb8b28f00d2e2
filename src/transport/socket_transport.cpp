#include "toolbridge/transport/socket_transport.hpp"
#include "toolbridge/error.hpp"
#include "toolbridge/log.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstring>

namespace toolbridge {

namespace {

/// Connect `fd` (non-blocking) and wait at most `timeout`. Returns 0 or an errno.
int connect_with_timeout(int fd, const addrinfo* ai, std::chrono::milliseconds timeout) {
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) return 0;
    if (errno != EINPROGRESS) return errno;

    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLOUT;
    pfd.revents = 0;
    int ret;
    do {
        ret = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while (ret < 0 && errno == EINTR);
    if (ret < 0) return errno;
    if (ret == 0) return ETIMEDOUT;

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) return errno;
    return so_error;
}

} // anonymous namespace

SocketTransport::SocketTransport(Options opts)
    : StreamTransport(opts.framing), opts_(std::move(opts)) {
}

SocketTransport::~SocketTransport() {
    close();
}

void SocketTransport::open() {
    if (is_open()) return;

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* result = nullptr;
    const std::string port = std::to_string(opts_.port);
    int rc = ::getaddrinfo(opts_.host.c_str(), port.c_str(), &hints, &result);
    if (rc != 0) {
        throw ConnectError("cannot resolve '" + opts_.host + "': " + ::gai_strerror(rc));
    }

    int fd = -1;
    int last_error = ECONNREFUSED;
    for (auto* ai = result; ai != nullptr; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC | SOCK_NONBLOCK, ai->ai_protocol);
        if (fd < 0) {
            last_error = errno;
            continue;
        }
        last_error = connect_with_timeout(fd, ai, opts_.connect_timeout);
        if (last_error == 0) break;
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(result);

    if (fd < 0) {
        throw ConnectError("connect to " + describe() + " failed: " + std::strerror(last_error));
    }

    int flags = ::fcntl(fd, F_GETFL, 0);
    ::fcntl(fd, F_SETFL, flags & ~O_NONBLOCK);
    int one = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

    socket_fd_ = fd;
    attach(fd, fd);
    log::logger()->debug("connected to {}", describe());
}

std::string SocketTransport::describe() const {
    return "tcp://" + opts_.host + ":" + std::to_string(opts_.port);
}

void SocketTransport::release() {
    if (socket_fd_ >= 0) ::shutdown(socket_fd_, SHUT_RDWR);
    socket_fd_ = -1;
}

} // namespace toolbridge
