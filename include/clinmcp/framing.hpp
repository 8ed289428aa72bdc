#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace clinmcp {

/// How inbound frames are delimited. Outbound frames always carry a
/// Content-Length header.
enum class Framing {
    ContentLength,  // "Content-Length: N\r\n\r\n" + N bytes
    Auto            // as above, but a line starting with '{' or '[' is a bare JSON message
};

/// "content-length" / "auto". Throws ConfigError on anything else.
Framing parse_framing(std::string_view name);
std::string_view to_string(Framing framing);

/// Reads discrete message bodies from a file descriptor.
/// Performs no JSON parsing.
class FrameReader {
public:
    struct Options {
        Framing framing = Framing::ContentLength;
        size_t max_frame_bytes = 16 * 1024 * 1024;
        size_t max_header_line = 8 * 1024;
    };

    explicit FrameReader(int fd);
    FrameReader(int fd, Options opts);

    /// Blocks until a complete frame is available and returns its body.
    /// Returns std::nullopt when the source closes cleanly between frames.
    /// Throws FramingError on a malformed header, a non-numeric or oversized
    /// Content-Length, or a stream that closes mid-frame.
    std::optional<std::string> read_frame();

private:
    /// Next line without its terminator. std::nullopt on EOF at a line start.
    std::optional<std::string> read_line(size_t limit);
    bool fill();

    int fd_;
    Options opts_;
    std::string buffer_;
    size_t pos_ = 0;
};

/// Writes framed messages to a file descriptor. Callers must not share one
/// writer between threads.
class FrameWriter {
public:
    explicit FrameWriter(int fd) : fd_(fd) {}

    /// Writes header, blank line and body. Throws TransportError on failure.
    void write_frame(std::string_view body);

    /// The exact bytes write_frame() puts on the wire.
    [[nodiscard]] static std::string encode(std::string_view body);

private:
    int fd_;
};

} // namespace clinmcp
