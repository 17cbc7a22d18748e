#pragma once

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <thread>
#include <utility>

namespace mcp_sandbox {

// ---------------------------------------------------------------------------
// RunWithTimeout — run `fn` on a helper thread and wait at most `timeout`.
//
// Returns the value, or nullopt if the deadline passed first. An exception
// thrown by `fn` is rethrown in the caller. On timeout the helper thread is
// detached and finishes on its own, so `fn` must own everything it touches
// (capture by value).
// ---------------------------------------------------------------------------
template <typename Fn>
auto RunWithTimeout(Fn fn, std::chrono::milliseconds timeout)
    -> std::optional<decltype(fn())> {
    using T = decltype(fn());

    auto promise = std::make_shared<std::promise<T>>();
    auto future = promise->get_future();

    std::thread worker([promise, fn = std::move(fn)]() mutable {
        try {
            promise->set_value(fn());
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });
    worker.detach();

    if (future.wait_for(timeout) != std::future_status::ready) {
        return std::nullopt;
    }
    return future.get();
}

} // namespace mcp_sandbox
