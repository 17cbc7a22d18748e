#pragma once

#include <mcp_sandbox/mcp/i_transport.hpp>

#include <atomic>
#include <iostream>
#include <mutex>

namespace mcp_sandbox {

// Newline-delimited transport over a pair of streams (stdin/stdout by
// default). CR before LF is stripped and blank lines are skipped.
class StdioTransport : public ITransport {
public:
    explicit StdioTransport(std::istream& in = std::cin,
                            std::ostream& out = std::cout);

    std::optional<std::string> Receive() override;
    bool Send(std::string_view message) override;
    [[nodiscard]] bool IsOpen() const override { return open_; }

private:
    std::istream& in_;
    std::ostream& out_;
    std::mutex write_mutex_;
    std::atomic<bool> open_{true};
};

} // namespace mcp_sandbox
