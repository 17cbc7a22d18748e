#include <catch2/catch_test_macros.hpp>

#include <mcp_sandbox/core/deadline.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

using namespace mcp_sandbox;
using namespace std::chrono_literals;

TEST_CASE("RunWithTimeout: returns the value of fast work", "[core][deadline]") {
    auto result = RunWithTimeout([] { return std::string("done"); }, 5000ms);
    REQUIRE(result.has_value());
    CHECK(*result == "done");
}

TEST_CASE("RunWithTimeout: gives up on slow work", "[core][deadline]") {
    auto finished = std::make_shared<std::atomic<bool>>(false);
    auto result = RunWithTimeout(
        [finished] {
            std::this_thread::sleep_for(500ms);
            finished->store(true);
            return 1;
        },
        20ms);
    CHECK_FALSE(result.has_value());
    // The worker was left running; it owns `finished` and completes later.
    CHECK_FALSE(finished->load());
}

TEST_CASE("RunWithTimeout: rethrows exceptions from the work", "[core][deadline]") {
    CHECK_THROWS_AS(
        RunWithTimeout([]() -> int { throw std::runtime_error("disk on fire"); },
                       5000ms),
        std::runtime_error);
}
