#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ledger_service {

// ---------------------------------------------------------------------------
// Response content shapes and their MCP JSON encodings.
// ---------------------------------------------------------------------------

struct ContentBlock {
    std::string type = "text";
    std::string text;
};

// Ordered content blocks of one tool result.
using ResponseContent = std::vector<ContentBlock>;

inline ResponseContent TextContent(std::string text) {
    return ResponseContent{ContentBlock{"text", std::move(text)}};
}

// Derived view of a note; never stored.
struct ResourceDescriptor {
    std::string uri;
    std::string name;
    std::string description;
    std::string mime_type = "text/plain";
};

struct PromptMessage {
    std::string role = "user";
    std::string text;
};

struct PromptResult {
    std::string description;
    std::vector<PromptMessage> messages;
};

void to_json(nlohmann::json& j, const ContentBlock& block);
void to_json(nlohmann::json& j, const ResourceDescriptor& resource);
void to_json(nlohmann::json& j, const PromptMessage& message);
void to_json(nlohmann::json& j, const PromptResult& result);

} // namespace ledger_service
