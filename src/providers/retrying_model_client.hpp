#pragma once

#include <memory>
#include "core/config/engine_config.hpp"
#include "providers/model_client.hpp"

namespace forge::providers {

// Retries transport failures that happen before the first chunk, with
// exponential backoff capped at max_backoff_ms. A stream that already
// delivered chunks is never replayed.
class RetryingModelClient : public ModelClient {
public:
    RetryingModelClient(std::shared_ptr<ModelClient> inner, core::config::RetryPolicy policy);

    core::errors::Status stream(const protocol::ModelRequest& request,
                                const ChunkSink& on_chunk,
                                const core::concurrency::CancelToken& cancel) override;

private:
    std::shared_ptr<ModelClient> inner_;
    core::config::RetryPolicy policy_;
};

}  // namespace forge::providers
