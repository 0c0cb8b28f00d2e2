#include "toolbridge/transport/stream_transport.hpp"
#include "toolbridge/error.hpp"
#include "toolbridge/log.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <csignal>
#include <cerrno>
#include <cstring>

namespace toolbridge {

StreamTransport::StreamTransport(Framing framing)
    : framing_(framing), decoder_(framing) {
}

StreamTransport::~StreamTransport() {
    close();
}

void StreamTransport::attach(int read_fd, int write_fd) {
    // A peer that vanishes mid-write must surface as EPIPE, not kill us.
    static std::once_flag sigpipe_once;
    std::call_once(sigpipe_once, [] { std::signal(SIGPIPE, SIG_IGN); });

    if (::pipe2(wakeup_pipe_, O_CLOEXEC) < 0) {
        int err = errno;
        ::close(read_fd);
        if (write_fd != read_fd) ::close(write_fd);
        throw ConnectError(std::string("failed to create wakeup pipe: ") + std::strerror(err));
    }
    int flags = ::fcntl(wakeup_pipe_[1], F_GETFL, 0);
    ::fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);

    std::lock_guard<std::mutex> rlock(read_mutex_);
    std::lock_guard<std::mutex> wlock(write_mutex_);
    read_fd_ = read_fd;
    write_fd_ = write_fd;
    eof_ = false;
    decoder_.reset();
    closing_ = false;
    open_ = true;
}

void StreamTransport::send(std::string_view payload) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!open_ || write_fd_ < 0) {
        throw TransportError("transport is closed");
    }

    const std::string frame = encode_frame(framing_, payload);
    const char* data = frame.data();
    size_t remaining = frame.size();
    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw TransportError(std::string("write failed: ") + std::strerror(errno));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
}

std::optional<std::string> StreamTransport::receive() {
    std::lock_guard<std::mutex> lock(read_mutex_);
    char chunk[8192];

    while (true) {
        if (auto frame = decoder_.next()) return frame;
        if (eof_ || read_fd_ < 0 || closing_) return std::nullopt;

        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw TransportError(std::string("poll failed: ") + std::strerror(errno));
        }

        // close() was called from another thread
        if (fds[1].revents & POLLIN) return std::nullopt;

        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            if (closing_) return std::nullopt;
            throw TransportError(std::string("read failed: ") + std::strerror(errno));
        }
        if (n == 0) {
            eof_ = true;
            if (decoder_.buffered() > 0) {
                log::logger()->warn("{}: discarding {} bytes of incomplete frame at end of stream",
                                    describe(), decoder_.buffered());
            }
            if (!closing_) on_end_of_stream();
            return std::nullopt;
        }
        decoder_.feed(chunk, static_cast<size_t>(n));
    }
}

void StreamTransport::close() {
    if (!open_.exchange(false)) return;
    closing_ = true;
    wake_reader();

    bool shared_fd = false;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        shared_fd = write_fd_ == read_fd_;
        if (write_fd_ >= 0 && !shared_fd) ::close(write_fd_);
        write_fd_ = -1;
    }

    release();

    std::lock_guard<std::mutex> lock(read_mutex_);
    close_descriptors();
}

bool StreamTransport::is_open() const {
    return open_;
}

void StreamTransport::wake_reader() {
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        ssize_t ignored = ::write(wakeup_pipe_[1], &b, 1);
        (void)ignored; // pipe already readable is as good as a fresh byte
    }
}

void StreamTransport::close_descriptors() {
    if (read_fd_ >= 0) ::close(read_fd_);
    read_fd_ = -1;
    for (int& fd : wakeup_pipe_) {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }
}

} // namespace toolbridge
