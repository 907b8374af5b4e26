#pragma once

#include <ledger_service/core/result.hpp>
#include <ledger_service/mcp/capability_catalog.hpp>

#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace ledger_service {

struct ListAccountsArgs {
    std::string year;
};

struct AccountBalanceArgs {
    std::string year;
    std::string account;
};

struct AccountRegisterArgs {
    std::string year;
    std::string account;
};

struct AddNoteArgs {
    std::string name;
    std::string content;
};

// One alternative per tool in the catalog.
using ToolArguments = std::variant<ListAccountsArgs,
                                   AccountBalanceArgs,
                                   AccountRegisterArgs,
                                   AddNoteArgs>;

// Decode and validate the argument mapping of a tool call.
//
// Fails with UnknownTool ("Unknown tool: <name>") when the catalog has no
// such tool, and with InvalidArguments when the mapping is missing or not an
// object, or when a required field is missing, not a string, or empty.
// Fields the tool does not declare are ignored.
Result<ToolArguments, Error> DecodeToolArguments(const CapabilityCatalog& catalog,
                                                 const std::string& name,
                                                 const nlohmann::json& arguments);

} // namespace ledger_service
