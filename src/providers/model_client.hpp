#pragma once

#include <functional>
#include "core/concurrency/cancel_token.hpp"
#include "core/errors/forge_errors.hpp"
#include "protocol/model_contract.hpp"

namespace forge::providers {

using ChunkSink = std::function<void(const protocol::ModelChunk&)>;

// Streams one model response. Chunks are delivered in order on the calling
// thread; the call returns once the stream has ended or failed.
// Transport failures are ErrorCategory::Transport; a fired cancel token
// ends the stream with code "cancelled".
class ModelClient {
public:
    virtual ~ModelClient() = default;

    virtual core::errors::Status stream(const protocol::ModelRequest& request,
                                        const ChunkSink& on_chunk,
                                        const core::concurrency::CancelToken& cancel) = 0;
};

}  // namespace forge::providers
