#pragma once
#include "transport.hpp"
#include "../framing.hpp"
#include <atomic>
#include <mutex>

namespace toolbridge {

/// Shared machinery for transports backed by file descriptors (pipes to a
/// child process, a connected socket). Reads go through poll() on the data
/// descriptor plus a wakeup pipe so close() can interrupt a blocked reader.
class StreamTransport : public ITransport {
public:
    explicit StreamTransport(Framing framing);
    ~StreamTransport() override;

    StreamTransport(const StreamTransport&) = delete;
    StreamTransport& operator=(const StreamTransport&) = delete;

    void send(std::string_view payload) override;
    std::optional<std::string> receive() override;
    void close() override;
    bool is_open() const override;

protected:
    /// Install the descriptors produced by a derived open(). The transport
    /// takes ownership; read_fd and write_fd may be the same descriptor.
    void attach(int read_fd, int write_fd);

    /// Called once when the read side hits end of stream while the
    /// transport is still open. Return for a graceful end, throw
    /// TransportError to report an abnormal one.
    virtual void on_end_of_stream() {}

    /// Release derived resources. Runs once per close(), after the write
    /// side is closed and before the read side is.
    virtual void release() {}

    [[nodiscard]] bool closing() const noexcept { return closing_; }

private:
    void wake_reader();
    void close_descriptors();

    Framing framing_;
    FrameDecoder decoder_;

    int read_fd_{-1};
    int write_fd_{-1};
    int wakeup_pipe_[2]{-1, -1};
    bool eof_{false};

    std::atomic<bool> open_{false};
    std::atomic<bool> closing_{false};

    std::mutex write_mutex_;
    std::mutex read_mutex_;
};

} // namespace toolbridge
