#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace toolbridge {

/// A bidirectional channel to one tool server that moves whole messages.
///
/// send() may be called from any thread. receive() is driven by a single
/// reader. close() may be called from any thread, including while another
/// thread is blocked in receive(), and wakes that reader.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Establish the channel. Throws ConnectError.
    virtual void open() = 0;

    /// Write one message with the transport's framing.
    /// Throws TransportError when the channel is closed or the write fails.
    virtual void send(std::string_view payload) = 0;

    /// Block until the next message arrives.
    /// Returns nullopt on graceful end of stream or after close().
    /// Throws TransportError when the peer vanishes abnormally.
    [[nodiscard]] virtual std::optional<std::string> receive() = 0;

    /// Release the channel. Safe to call repeatedly and after a disconnect.
    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const = 0;

    /// Short human-readable endpoint description for logs.
    [[nodiscard]] virtual std::string describe() const = 0;
};

} // namespace toolbridge
