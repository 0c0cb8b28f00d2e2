#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace toolbridge {

enum class Framing {
    Newline,        // one JSON message per line
    ContentLength   // "Content-Length: N\r\n\r\n" header block + N bytes
};

[[nodiscard]] std::string_view to_string(Framing framing);

/// Parses "newline" / "content-length". Returns nullopt for anything else.
[[nodiscard]] std::optional<Framing> framing_from_string(std::string_view s);

constexpr std::size_t DEFAULT_MAX_FRAME_SIZE = 4 * 1024 * 1024;

[[nodiscard]] std::string encode_frame(Framing framing, std::string_view payload);

/// Incremental splitter for a byte stream.
/// feed() raw bytes as they arrive, then drain complete frames with next().
class FrameDecoder {
public:
    explicit FrameDecoder(Framing framing, std::size_t max_frame_size = DEFAULT_MAX_FRAME_SIZE);

    void feed(const char* data, std::size_t size);

    /// Next complete frame, or nullopt when more bytes are needed.
    /// Throws TransportError when a frame exceeds the size limit; the stream
    /// cannot be resynchronized after that.
    [[nodiscard]] std::optional<std::string> next();

    /// Bytes buffered that do not yet form a complete frame.
    [[nodiscard]] std::size_t buffered() const noexcept { return buffer_.size() - pos_; }

    void reset();

private:
    std::optional<std::string> next_line();
    std::optional<std::string> next_content_length();
    void compact();

    Framing framing_;
    std::size_t max_frame_size_;
    std::string buffer_;
    std::size_t pos_ = 0;
};

} // namespace toolbridge
