#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace clinmcp {

/// Byte-level message channel used by the protocol engine. Implementations
/// deal in whole message bodies; JSON is the engine's concern.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Blocks for the next message body. std::nullopt at end of stream.
    /// Throws FramingError when the stream becomes unusable.
    virtual std::optional<std::string> receive() = 0;

    /// Sends one message body.
    virtual void send(std::string_view body) = 0;

    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const = 0;
};

} // namespace clinmcp
