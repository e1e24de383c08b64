#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "message_contract.hpp"

namespace forge::protocol {

    // Incremental pieces of one streamed model response.
    struct TextChunk { std::string text; };
    struct ToolCallBeginChunk { std::string id; std::string name; };
    struct ToolArgsChunk { std::string text; };
    struct ToolCallEndChunk {};
    struct StreamEndChunk { std::uint32_t total_tokens = 0; };

    using ModelChunk = std::variant<
        TextChunk,
        ToolCallBeginChunk,
        ToolArgsChunk,
        ToolCallEndChunk,
        StreamEndChunk
    >;

    // What the model is told about one tool.
    struct ToolSpec {
        std::string name;
        std::string description;
        nlohmann::json input_schema;
    };

    struct ModelRequest {
        std::vector<Turn> history;
        std::vector<ToolSpec> tools;
    };

} // namespace forge::protocol
