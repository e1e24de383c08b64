#include "providers/retrying_model_client.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include "core/logging/logger.hpp"

namespace forge::providers {

using core::errors::ErrorCategory;
using core::errors::ForgeError;

RetryingModelClient::RetryingModelClient(std::shared_ptr<ModelClient> inner,
                                         core::config::RetryPolicy policy)
    : inner_(std::move(inner)), policy_(policy) {}

core::errors::Status RetryingModelClient::stream(const protocol::ModelRequest& request,
                                                 const ChunkSink& on_chunk,
                                                 const core::concurrency::CancelToken& cancel) {
    const std::uint32_t attempts = std::max<std::uint32_t>(1, policy_.max_attempts);
    std::uint32_t backoff_ms = policy_.initial_backoff_ms;
    core::errors::Status last = core::errors::ok();

    for (std::uint32_t attempt = 1; attempt <= attempts; ++attempt) {
        bool delivered = false;
        last = inner_->stream(
            request,
            [&](const protocol::ModelChunk& chunk) {
                delivered = true;
                on_chunk(chunk);
            },
            cancel);
        if (!core::errors::is_error(last)) {
            return last;
        }
        const auto& error = core::errors::get_error(last);
        if (error.category != ErrorCategory::Transport || delivered ||
            core::concurrency::is_cancelled(cancel)) {
            return last;
        }
        if (attempt == attempts) {
            break;
        }
        FORGE_LOG_WARN("Model stream attempt " + std::to_string(attempt) + "/" +
                       std::to_string(attempts) + " failed: " + core::errors::describe(error) +
                       "; retrying in " + std::to_string(backoff_ms) + "ms");
        if (!core::concurrency::sleep_unless_cancelled(cancel,
                                                       std::chrono::milliseconds(backoff_ms))) {
            return ForgeError{ErrorCategory::Execution, "Model request cancelled", "cancelled"};
        }
        backoff_ms = std::min(policy_.max_backoff_ms, backoff_ms * 2);
    }

    const auto& error = core::errors::get_error(last);
    return ForgeError{ErrorCategory::Transport,
                      error.message + " (after " + std::to_string(attempts) + " attempts)",
                      error.code, error.hint};
}

}  // namespace forge::providers
