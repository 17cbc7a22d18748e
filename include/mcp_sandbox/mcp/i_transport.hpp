#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace mcp_sandbox {

// ---------------------------------------------------------------------------
// ITransport — moves whole message units (one line of JSON) between the
// server and its peer. Knows nothing about JSON-RPC.
// ---------------------------------------------------------------------------
class ITransport {
public:
    virtual ~ITransport() = default;

    // Block until one complete message is available. nullopt means the
    // stream ended; a truncated final line also counts as end of stream.
    virtual std::optional<std::string> Receive() = 0;

    // Write one complete message and flush. Safe to call from several
    // threads; messages never interleave. Returns false if the output is
    // no longer writable.
    virtual bool Send(std::string_view message) = 0;

    [[nodiscard]] virtual bool IsOpen() const = 0;
};

} // namespace mcp_sandbox
