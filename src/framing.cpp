#include "toolbridge/framing.hpp"
#include "toolbridge/error.hpp"
#include "toolbridge/log.hpp"
#include <algorithm>
#include <cctype>
#include <limits>

namespace toolbridge {

namespace {

constexpr std::string_view HEADER_END = "\r\n\r\n";

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

} // anonymous namespace

std::string_view to_string(Framing framing) {
    return framing == Framing::ContentLength ? "content-length" : "newline";
}

std::optional<Framing> framing_from_string(std::string_view s) {
    if (s == "newline" || s == "line") return Framing::Newline;
    if (s == "content-length") return Framing::ContentLength;
    return std::nullopt;
}

std::string encode_frame(Framing framing, std::string_view payload) {
    std::string frame;
    if (framing == Framing::ContentLength) {
        std::string header = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n";
        frame.reserve(header.size() + payload.size());
        frame.append(header);
        frame.append(payload);
    } else {
        frame.reserve(payload.size() + 1);
        frame.append(payload);
        frame.push_back('\n');
    }
    return frame;
}

FrameDecoder::FrameDecoder(Framing framing, std::size_t max_frame_size)
    : framing_(framing), max_frame_size_(max_frame_size) {
}

void FrameDecoder::feed(const char* data, std::size_t size) {
    compact();
    buffer_.append(data, size);
}

void FrameDecoder::reset() {
    buffer_.clear();
    pos_ = 0;
}

void FrameDecoder::compact() {
    if (pos_ == 0) return;
    buffer_.erase(0, pos_);
    pos_ = 0;
}

std::optional<std::string> FrameDecoder::next() {
    return framing_ == Framing::ContentLength ? next_content_length() : next_line();
}

std::optional<std::string> FrameDecoder::next_line() {
    while (true) {
        auto nl = buffer_.find('\n', pos_);
        if (nl == std::string::npos) {
            if (buffered() > max_frame_size_) {
                throw TransportError("incoming line exceeds " + std::to_string(max_frame_size_)
                                     + " bytes without a newline");
            }
            return std::nullopt;
        }
        std::string line = buffer_.substr(pos_, nl - pos_);
        pos_ = nl + 1;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        return line;
    }
}

std::optional<std::string> FrameDecoder::next_content_length() {
    while (true) {
        auto header_end = buffer_.find(HEADER_END, pos_);
        if (header_end == std::string::npos) {
            if (buffered() > max_frame_size_) {
                throw TransportError("header block exceeds frame size limit");
            }
            return std::nullopt;
        }

        const std::size_t body_start = header_end + HEADER_END.size();
        std::optional<std::size_t> length;
        bool malformed = false;

        std::size_t line_start = pos_;
        while (line_start < header_end) {
            auto eol = buffer_.find("\r\n", line_start);
            if (eol == std::string::npos || eol > header_end) eol = header_end;
            std::string line = buffer_.substr(line_start, eol - line_start);
            line_start = eol + 2;

            auto colon = line.find(':');
            if (colon == std::string::npos) continue;
            if (lowercase(trim(line.substr(0, colon))) != "content-length") continue;

            std::string value = trim(line.substr(colon + 1));
            if (value.empty() || !std::all_of(value.begin(), value.end(),
                                              [](unsigned char c) { return std::isdigit(c); })) {
                malformed = true;
                break;
            }
            try {
                unsigned long long v = std::stoull(value);
                if (v > max_frame_size_) {
                    throw TransportError("frame of " + value + " bytes exceeds limit of "
                                         + std::to_string(max_frame_size_));
                }
                length = static_cast<std::size_t>(v);
            } catch (const std::out_of_range&) {
                throw TransportError("Content-Length out of range: " + value);
            }
        }

        if (malformed || !length) {
            // Drop the bad header block and try to continue with what follows.
            log::logger()->warn("dropping frame with missing or invalid Content-Length header");
            pos_ = body_start;
            continue;
        }

        if (buffer_.size() - body_start < *length) {
            return std::nullopt;
        }
        std::string payload = buffer_.substr(body_start, *length);
        pos_ = body_start + *length;
        return payload;
    }
}

} // namespace toolbridge
