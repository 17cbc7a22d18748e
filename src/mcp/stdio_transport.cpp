#include <mcp_sandbox/mcp/stdio_transport.hpp>

#include <mcp_sandbox/core/log.hpp>

#include <string>

namespace mcp_sandbox {

namespace {
constexpr const char* kLogComponent = "transport";
} // anonymous namespace

StdioTransport::StdioTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {}

std::optional<std::string> StdioTransport::Receive() {
    std::string line;
    while (open_) {
        if (!std::getline(in_, line)) {
            LogDebug(kLogComponent, "End of input stream");
            open_ = false;
            break;
        }
        if (in_.eof()) {
            // The last line had no terminator: the peer went away mid-write.
            if (!line.empty()) {
                LogWarn(kLogComponent, "Discarding " + std::to_string(line.size()) +
                                           " bytes of unterminated input at end of stream");
            }
            open_ = false;
            break;
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) continue;
        return line;
    }
    return std::nullopt;
}

bool StdioTransport::Send(std::string_view message) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    out_.write(message.data(), static_cast<std::streamsize>(message.size()));
    out_.put('\n');
    out_.flush();
    if (!out_) {
        LogError(kLogComponent, "Output stream is no longer writable");
        return false;
    }
    return true;
}

} // namespace mcp_sandbox
