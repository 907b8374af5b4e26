#pragma once

#include <ledger_service/core/result.hpp>
#include <ledger_service/ledger/i_ledger_query.hpp>
#include <ledger_service/ledger/ledger_path.hpp>
#include <ledger_service/mcp/capability_catalog.hpp>
#include <ledger_service/mcp/content.hpp>
#include <ledger_service/mcp/tool_arguments.hpp>
#include <ledger_service/notes/notes_store.hpp>

#include <string>

#include <nlohmann/json.hpp>

namespace ledger_service {

// ---------------------------------------------------------------------------
// ToolDispatcher — decodes a tool call and runs the matching handler.
//
// Arguments are validated before any handler runs, so a failed call leaves
// the notes store untouched. Ledger adapter errors are returned unchanged.
// Holds references only; the session loop owns everything it points at.
// ---------------------------------------------------------------------------
class ToolDispatcher {
public:
    ToolDispatcher(const CapabilityCatalog& catalog,
                   NotesStore& notes,
                   ILedgerQuery& ledger,
                   LedgerLocation location);

    [[nodiscard]] Result<ResponseContent, Error> Call(
        const std::string& name, const nlohmann::json& arguments);

    [[nodiscard]] Result<ResponseContent, Error> Dispatch(
        const ToolArguments& arguments);

private:
    Result<ResponseContent, Error> Handle(const ListAccountsArgs& args);
    Result<ResponseContent, Error> Handle(const AccountBalanceArgs& args);
    Result<ResponseContent, Error> Handle(const AccountRegisterArgs& args);
    Result<ResponseContent, Error> Handle(const AddNoteArgs& args);

    const CapabilityCatalog& catalog_;
    NotesStore& notes_;
    ILedgerQuery& ledger_;
    LedgerLocation location_;
};

} // namespace ledger_service
