#include <catch2/catch_test_macros.hpp>

#include <mcp_sandbox/mcp/stdio_transport.hpp>

#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace mcp_sandbox;

TEST_CASE("StdioTransport: receives one message per line", "[mcp][transport]") {
    std::istringstream in("{\"a\":1}\n{\"b\":2}\n");
    std::ostringstream out;
    StdioTransport transport(in, out);

    auto first = transport.Receive();
    REQUIRE(first.has_value());
    CHECK(*first == "{\"a\":1}");
    auto second = transport.Receive();
    REQUIRE(second.has_value());
    CHECK(*second == "{\"b\":2}");
    CHECK(transport.IsOpen());

    CHECK_FALSE(transport.Receive().has_value());
    CHECK_FALSE(transport.IsOpen());
}

TEST_CASE("StdioTransport: strips CR and skips blank lines", "[mcp][transport]") {
    std::istringstream in("\n\r\n{\"a\":1}\r\n\n");
    std::ostringstream out;
    StdioTransport transport(in, out);

    auto line = transport.Receive();
    REQUIRE(line.has_value());
    CHECK(*line == "{\"a\":1}");
    CHECK_FALSE(transport.Receive().has_value());
}

TEST_CASE("StdioTransport: unterminated last line is end of stream", "[mcp][transport]") {
    std::istringstream in("{\"a\":1}\n{\"partial\":");
    std::ostringstream out;
    StdioTransport transport(in, out);

    REQUIRE(transport.Receive().has_value());
    CHECK_FALSE(transport.Receive().has_value());
    CHECK_FALSE(transport.IsOpen());
}

TEST_CASE("StdioTransport: empty input closes immediately", "[mcp][transport]") {
    std::istringstream in;
    std::ostringstream out;
    StdioTransport transport(in, out);
    CHECK_FALSE(transport.Receive().has_value());
}

TEST_CASE("StdioTransport: Send writes one line and flushes", "[mcp][transport]") {
    std::istringstream in;
    std::ostringstream out;
    StdioTransport transport(in, out);

    CHECK(transport.Send("{\"x\":1}"));
    CHECK(transport.Send("{\"y\":2}"));
    CHECK(out.str() == "{\"x\":1}\n{\"y\":2}\n");
}

TEST_CASE("StdioTransport: Send reports a broken output stream", "[mcp][transport]") {
    std::istringstream in;
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    StdioTransport transport(in, out);
    CHECK_FALSE(transport.Send("{}"));
}

TEST_CASE("StdioTransport: concurrent sends never interleave", "[mcp][transport]") {
    std::istringstream in;
    std::ostringstream out;
    StdioTransport transport(in, out);

    constexpr int kThreads = 8;
    constexpr int kMessages = 50;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&transport, t]() {
            const std::string message(100, static_cast<char>('a' + t));
            for (int i = 0; i < kMessages; ++i) {
                transport.Send(message);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    std::istringstream lines(out.str());
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        ++count;
        REQUIRE(line.size() == 100);
        CHECK(line.find_first_not_of(line[0]) == std::string::npos);
    }
    CHECK(count == kThreads * kMessages);
}
