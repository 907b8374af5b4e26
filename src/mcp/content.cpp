#include <ledger_service/mcp/content.hpp>

namespace ledger_service {

void to_json(nlohmann::json& j, const ContentBlock& block) {
    j = {{"type", block.type}, {"text", block.text}};
}

void to_json(nlohmann::json& j, const ResourceDescriptor& resource) {
    j = {{"uri", resource.uri},
         {"name", resource.name},
         {"description", resource.description},
         {"mimeType", resource.mime_type}};
}

void to_json(nlohmann::json& j, const PromptMessage& message) {
    j = {{"role", message.role},
         {"content", {{"type", "text"}, {"text", message.text}}}};
}

void to_json(nlohmann::json& j, const PromptResult& result) {
    j = {{"description", result.description},
         {"messages", result.messages}};
}

} // namespace ledger_service
