#pragma once
#include "transport.hpp"
#include "../framing.hpp"

namespace clinmcp {

/// Content-Length framed transport over a pair of file descriptors,
/// stdin/stdout by default. Reads and writes happen on the caller's thread.
class StdioTransport : public ITransport {
public:
    using Options = FrameReader::Options;

    /// Use the process's stdin/stdout.
    explicit StdioTransport(Options opts = {});

    /// Use the given descriptors (pipes in tests). Descriptors are not closed.
    StdioTransport(int read_fd, int write_fd, Options opts = {});

    std::optional<std::string> receive() override;
    void send(std::string_view body) override;
    void close() override;
    bool is_open() const override;

private:
    FrameReader reader_;
    FrameWriter writer_;
    bool open_ = true;
};

} // namespace clinmcp
