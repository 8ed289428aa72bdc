#include "clinmcp/transport/stdio_transport.hpp"
#include "clinmcp/error.hpp"
#include <unistd.h>

namespace clinmcp {

StdioTransport::StdioTransport(Options opts)
    : StdioTransport(STDIN_FILENO, STDOUT_FILENO, opts) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd, Options opts)
    : reader_(read_fd, opts), writer_(write_fd) {
}

std::optional<std::string> StdioTransport::receive() {
    if (!open_) return std::nullopt;
    try {
        auto body = reader_.read_frame();
        if (!body) open_ = false;
        return body;
    } catch (const FramingError&) {
        open_ = false;
        throw;
    }
}

void StdioTransport::send(std::string_view body) {
    if (!open_) {
        throw TransportError("Transport closed");
    }
    try {
        writer_.write_frame(body);
    } catch (const TransportError&) {
        open_ = false;
        throw;
    }
}

void StdioTransport::close() {
    open_ = false;
}

bool StdioTransport::is_open() const {
    return open_;
}

} // namespace clinmcp
