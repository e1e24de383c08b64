#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/concurrency/cancel_token.hpp"
#include "core/errors/forge_errors.hpp"

namespace forge::protocol {

    // Tool advertised by an externally-hosted tool host during the handshake.
    struct RemoteToolDescriptor {
        std::string name;
        std::string description;
        nlohmann::json input_schema = nlohmann::json::object();
        std::string usage_hint;
    };

    struct RemoteRequest {
        std::string method;   // tool name
        nlohmann::json params = nlohmann::json::object();
    };

    struct RemoteError {
        int code = 0;
        std::string message;
    };

    // Exactly one of result / error is set.
    struct RemoteResponse {
        std::optional<nlohmann::json> result;
        std::optional<RemoteError> error;
    };

    // Abstract request/response contract; transports live behind it.
    class RemoteToolHost {
    public:
        virtual ~RemoteToolHost() = default;

        virtual const std::string& host_name() const = 0;

        virtual core::errors::Result<std::vector<RemoteToolDescriptor>> initialize() = 0;

        // Transport failures come back as errors; host-side failures as response.error.
        virtual core::errors::Result<RemoteResponse> call(
            const RemoteRequest& request,
            const core::concurrency::CancelToken& cancel) = 0;

        // Reads one resource by URI. Hosts without resources answer with a
        // method-not-found error.
        virtual core::errors::Result<RemoteResponse> read_resource(
            const std::string& uri,
            const core::concurrency::CancelToken& cancel) {
            static_cast<void>(uri);
            static_cast<void>(cancel);
            RemoteResponse response;
            response.error = RemoteError{-32601, host_name() + " does not serve resources"};
            return response;
        }

        virtual void shutdown() {}
    };

} // namespace forge::protocol
