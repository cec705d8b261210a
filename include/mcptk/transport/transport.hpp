#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace mcptk {

/// Abstract server transport feeding a JsonRpcProcessor.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Bind and serve on a background thread. Returns once the socket is bound.
    /// Throws McpTransportError on bind failure. Calling twice is a no-op.
    virtual void start() = 0;

    /// Stop serving and close every tracked connection. Idempotent.
    virtual void stop() = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /// Process a raw JSON-RPC payload without any network I/O.
    [[nodiscard]] virtual std::string handle_request(std::string_view body) = 0;

    /// Bound port while running, the configured port otherwise.
    [[nodiscard]] virtual uint16_t port() const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace mcptk
