#include "clinmcp/framing.hpp"
#include "clinmcp/error.hpp"
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <limits>

namespace clinmcp {

namespace {

constexpr std::string_view kContentLength = "content-length";

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

size_t parse_length(std::string_view value, size_t max) {
    value = trim(value);
    if (value.empty()) {
        throw FramingError("Content-Length is empty");
    }
    size_t n = 0;
    for (char c : value) {
        if (c < '0' || c > '9') {
            throw FramingError("Content-Length is not a non-negative integer: '" +
                               std::string(value) + "'");
        }
        size_t digit = static_cast<size_t>(c - '0');
        if (n > (std::numeric_limits<size_t>::max() - digit) / 10) {
            throw FramingError("Content-Length overflows");
        }
        n = n * 10 + digit;
    }
    if (n > max) {
        throw FramingError("Content-Length " + std::to_string(n) +
                           " exceeds the limit of " + std::to_string(max) + " bytes");
    }
    return n;
}

} // anonymous namespace

Framing parse_framing(std::string_view name) {
    if (name == "content-length") return Framing::ContentLength;
    if (name == "auto") return Framing::Auto;
    throw ConfigError("Unknown framing '" + std::string(name) +
                      "', expected 'content-length' or 'auto'");
}

std::string_view to_string(Framing framing) {
    return framing == Framing::Auto ? "auto" : "content-length";
}

// ---------- FrameReader ----------

FrameReader::FrameReader(int fd) : FrameReader(fd, Options{}) {}

FrameReader::FrameReader(int fd, Options opts) : fd_(fd), opts_(opts) {}

bool FrameReader::fill() {
    if (pos_ > 0) {
        buffer_.erase(0, pos_);
        pos_ = 0;
    }
    char chunk[4096];
    while (true) {
        ssize_t n = ::read(fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw FramingError(std::string("Read error: ") + std::strerror(errno));
        }
        if (n == 0) return false;
        buffer_.append(chunk, static_cast<size_t>(n));
        return true;
    }
}

std::optional<std::string> FrameReader::read_line(size_t limit) {
    size_t searched = 0;
    while (true) {
        size_t nl = buffer_.find('\n', pos_ + searched);
        if (nl != std::string::npos) {
            std::string line = buffer_.substr(pos_, nl - pos_);
            pos_ = nl + 1;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return line;
        }
        searched = buffer_.size() - pos_;
        if (searched > limit) {
            throw FramingError("Header line exceeds " + std::to_string(limit) + " bytes");
        }
        if (!fill()) {
            if (pos_ == buffer_.size()) return std::nullopt;
            throw FramingError("Stream closed inside a header line");
        }
    }
}

std::optional<std::string> FrameReader::read_frame() {
    const size_t first_line_limit =
        opts_.framing == Framing::Auto ? opts_.max_frame_bytes : opts_.max_header_line;

    // Blank lines between frames are tolerated.
    std::optional<std::string> line;
    do {
        line = read_line(first_line_limit);
        if (!line) return std::nullopt;
    } while (trim(*line).empty());

    if (opts_.framing == Framing::Auto) {
        std::string_view t = trim(*line);
        if (t.front() == '{' || t.front() == '[') return std::string(t);
    }

    std::optional<size_t> length;
    while (true) {
        std::string_view header = *line;
        auto colon = header.find(':');
        if (colon == std::string_view::npos) {
            throw FramingError("Malformed header line: '" + std::string(header) + "'");
        }
        if (iequals(trim(header.substr(0, colon)), kContentLength)) {
            length = parse_length(header.substr(colon + 1), opts_.max_frame_bytes);
        }
        line = read_line(opts_.max_header_line);
        if (!line) throw FramingError("Stream closed before the end of the frame header");
        if (line->empty()) break;
    }

    if (!length) throw FramingError("Frame header has no Content-Length");

    while (buffer_.size() - pos_ < *length) {
        if (!fill()) {
            throw FramingError("Stream closed after " + std::to_string(buffer_.size() - pos_) +
                               " of " + std::to_string(*length) + " body bytes");
        }
    }
    std::string body = buffer_.substr(pos_, *length);
    pos_ += *length;
    return body;
}

// ---------- FrameWriter ----------

std::string FrameWriter::encode(std::string_view body) {
    std::string out = "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";
    out.append(body.data(), body.size());
    return out;
}

void FrameWriter::write_frame(std::string_view body) {
    // One buffer, one write loop: header and body never interleave with
    // anything else on this descriptor.
    std::string frame = encode(body);
    const char* data = frame.data();
    size_t remaining = frame.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd_, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw TransportError(std::string("Write error: ") + std::strerror(errno));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
}

} // namespace clinmcp
