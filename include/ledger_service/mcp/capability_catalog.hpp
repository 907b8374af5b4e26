#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ledger_service {

constexpr const char* kListAccountsTool = "list-accounts";
constexpr const char* kAccountBalanceTool = "account-balance";
constexpr const char* kAccountRegisterTool = "account-register";
constexpr const char* kAddNoteTool = "add-note";

constexpr const char* kSummarizeNotesPrompt = "summarize-notes";

// ---------------------------------------------------------------------------
// ToolField — one named input of a tool.
// ---------------------------------------------------------------------------
struct ToolField {
    std::string name;
    std::string type = "string";
    bool required = true;
};

// ---------------------------------------------------------------------------
// ToolDescriptor — name, description and input contract of a tool.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;
    std::vector<ToolField> fields;  // in declaration order

    // {"type":"object","properties":{...},"required":[...]}
    [[nodiscard]] nlohmann::json InputSchema() const;
};

struct PromptArgument {
    std::string name;
    std::string description;
    bool required = false;
};

struct PromptDescriptor {
    std::string name;
    std::string description;
    std::vector<PromptArgument> arguments;
};

void to_json(nlohmann::json& j, const ToolDescriptor& tool);
void to_json(nlohmann::json& j, const PromptDescriptor& prompt);

// ---------------------------------------------------------------------------
// CapabilityCatalog — the fixed set of tools and prompts this server offers.
// ---------------------------------------------------------------------------
class CapabilityCatalog {
public:
    CapabilityCatalog();

    [[nodiscard]] const std::vector<ToolDescriptor>& ListTools() const noexcept {
        return tools_;
    }

    [[nodiscard]] const std::vector<PromptDescriptor>& ListPrompts() const noexcept {
        return prompts_;
    }

    // nullptr when no tool has that name.
    [[nodiscard]] const ToolDescriptor* FindTool(const std::string& name) const;

    [[nodiscard]] const PromptDescriptor* FindPrompt(const std::string& name) const;

private:
    std::vector<ToolDescriptor> tools_;
    std::vector<PromptDescriptor> prompts_;
};

} // namespace ledger_service
