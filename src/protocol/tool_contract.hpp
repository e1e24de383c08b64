#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace forge::protocol {

    // How the model asks the engine to do something
    struct ToolCall {
        std::string id;
        std::string name;               // e.g., "read_file", "execute_command"
        nlohmann::json arguments = nlohmann::json::object();
        std::string raw_arguments;      // argument text exactly as streamed

        // Set when raw_arguments is not a JSON object; such calls never reach a handler.
        std::optional<std::string> argument_error;
    };

    enum class ContentKind {
        Text,
        Image
    };

    struct ContentBlock {
        ContentKind kind = ContentKind::Text;
        std::string text;        // Text
        std::string mime_type;   // Image
        std::string data;        // Image, base64
    };

    // How the engine replies back
    struct ToolResult {
        std::string call_id;
        std::vector<ContentBlock> content;
        bool is_error = false;

        static ToolResult text(std::string call_id, std::string body, bool is_error = false) {
            ToolResult result;
            result.call_id = std::move(call_id);
            result.content.push_back(ContentBlock{ContentKind::Text, std::move(body), "", ""});
            result.is_error = is_error;
            return result;
        }

        // Concatenation of every text block.
        std::string text_content() const {
            std::string out;
            for (const auto& block : content) {
                if (block.kind != ContentKind::Text) {
                    continue;
                }
                if (!out.empty()) {
                    out += "\n";
                }
                out += block.text;
            }
            return out;
        }
    };

    // Static classification of a tool's potential impact.
    enum class RiskClass {
        Safe,
        Mutating,
        Destructive,
        Network
    };

    inline std::string to_string(const RiskClass risk) {
        switch (risk) {
            case RiskClass::Safe:        return "safe";
            case RiskClass::Mutating:    return "mutating";
            case RiskClass::Destructive: return "destructive";
            case RiskClass::Network:     return "network";
            default: return "unknown";
        }
    }

    inline std::optional<RiskClass> parse_risk_class(const std::string& text) {
        if (text == "safe") return RiskClass::Safe;
        if (text == "mutating") return RiskClass::Mutating;
        if (text == "destructive") return RiskClass::Destructive;
        if (text == "network") return RiskClass::Network;
        return std::nullopt;
    }

    // Destructive outranks network, which outranks mutating.
    inline int risk_rank(const RiskClass risk) {
        switch (risk) {
            case RiskClass::Safe:        return 0;
            case RiskClass::Mutating:    return 1;
            case RiskClass::Network:     return 2;
            case RiskClass::Destructive: return 3;
            default: return 3;
        }
    }

    inline RiskClass max_risk(const RiskClass a, const RiskClass b) {
        return risk_rank(a) >= risk_rank(b) ? a : b;
    }

    inline nlohmann::json content_to_json(const std::vector<ContentBlock>& content) {
        nlohmann::json blocks = nlohmann::json::array();
        for (const auto& block : content) {
            if (block.kind == ContentKind::Text) {
                blocks.push_back({{"type", "text"}, {"text", block.text}});
            } else {
                blocks.push_back({{"type", "image"}, {"mime_type", block.mime_type}, {"data", block.data}});
            }
        }
        return blocks;
    }

} // namespace forge::protocol
