#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace forge::core::concurrency {

// Shared cancellation flag, set once by the canceller and polled at every
// suspension point.
using CancelToken = std::shared_ptr<std::atomic_bool>;

inline CancelToken make_cancel_token() {
    return std::make_shared<std::atomic_bool>(false);
}

inline bool is_cancelled(const CancelToken& token) {
    return token && token->load();
}

// Sleeps in short slices; returns false if the token fired first.
inline bool sleep_unless_cancelled(const CancelToken& token,
                                   const std::chrono::milliseconds duration) {
    constexpr auto kSlice = std::chrono::milliseconds(20);
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < deadline) {
        if (is_cancelled(token)) {
            return false;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(remaining < kSlice ? remaining : kSlice);
    }
    return !is_cancelled(token);
}

}  // namespace forge::core::concurrency
