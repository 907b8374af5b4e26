#include <ledger_service/mcp/capability_catalog.hpp>

namespace ledger_service {

nlohmann::json ToolDescriptor::InputSchema() const {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();
    for (const auto& field : fields) {
        properties[field.name] = {{"type", field.type}};
        if (field.required) {
            required.push_back(field.name);
        }
    }
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

void to_json(nlohmann::json& j, const ToolDescriptor& tool) {
    j = {{"name", tool.name},
         {"description", tool.description},
         {"inputSchema", tool.InputSchema()}};
}

void to_json(nlohmann::json& j, const PromptDescriptor& prompt) {
    nlohmann::json arguments = nlohmann::json::array();
    for (const auto& arg : prompt.arguments) {
        arguments.push_back({{"name", arg.name},
                             {"description", arg.description},
                             {"required", arg.required}});
    }
    j = {{"name", prompt.name},
         {"description", prompt.description},
         {"arguments", arguments}};
}

CapabilityCatalog::CapabilityCatalog()
    : tools_{
          {kListAccountsTool, "List all ledger accounts",
           {{"year"}}},
          {kAccountBalanceTool, "Get the balance of an account",
           {{"year"}, {"account"}}},
          {kAccountRegisterTool, "Get the register of an account",
           {{"year"}, {"account"}}},
          {kAddNoteTool, "Add a new note",
           {{"name"}, {"content"}}},
      },
      prompts_{
          {kSummarizeNotesPrompt, "Creates a summary of all notes",
           {{"style", "Style of the summary (brief/detailed)", false}}},
      } {}

const ToolDescriptor* CapabilityCatalog::FindTool(const std::string& name) const {
    for (const auto& tool : tools_) {
        if (tool.name == name) return &tool;
    }
    return nullptr;
}

const PromptDescriptor* CapabilityCatalog::FindPrompt(const std::string& name) const {
    for (const auto& prompt : prompts_) {
        if (prompt.name == name) return &prompt;
    }
    return nullptr;
}

} // namespace ledger_service
