#pragma once

#include <ledger_service/core/result.hpp>
#include <ledger_service/mcp/capability_catalog.hpp>
#include <ledger_service/mcp/content.hpp>
#include <ledger_service/notes/notes_store.hpp>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ledger_service {

constexpr const char* kNoteScheme = "note";

// "note://internal/<name>"
std::string NoteUri(const std::string& name);

// ---------------------------------------------------------------------------
// ResourceDispatcher — notes as resources, and the summarize-notes prompt.
// Read-only with respect to the notes store.
// ---------------------------------------------------------------------------
class ResourceDispatcher {
public:
    ResourceDispatcher(const CapabilityCatalog& catalog, const NotesStore& notes);

    // One descriptor per note, in store order, built fresh on every call.
    [[nodiscard]] std::vector<ResourceDescriptor> ListResources() const;

    // Content of the note addressed by a note:// URI.
    [[nodiscard]] Result<std::string, Error> ReadResource(const std::string& uri) const;

    [[nodiscard]] const std::vector<PromptDescriptor>& ListPrompts() const noexcept {
        return catalog_.ListPrompts();
    }

    // arguments may be null or an object; only "style" is read.
    [[nodiscard]] Result<PromptResult, Error> GetPrompt(
        const std::string& name, const nlohmann::json& arguments) const;

private:
    const CapabilityCatalog& catalog_;
    const NotesStore& notes_;
};

} // namespace ledger_service
