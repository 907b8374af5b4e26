#include <ledger_service/mcp/resource_dispatcher.hpp>

#include <ledger_service/core/uri.hpp>

namespace ledger_service {

namespace {

constexpr const char* kNoteUriPrefix = "note://internal/";
constexpr const char* kSummaryInstruction = "Here are the current notes to summarize:";
constexpr const char* kDetailedSuffix = " Give extensive details.";

std::string StyleArgument(const nlohmann::json& arguments) {
    if (arguments.is_object()) {
        auto it = arguments.find("style");
        if (it != arguments.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return "brief";
}

} // anonymous namespace

std::string NoteUri(const std::string& name) {
    return kNoteUriPrefix + name;
}

ResourceDispatcher::ResourceDispatcher(const CapabilityCatalog& catalog,
                                       const NotesStore& notes)
    : catalog_(catalog), notes_(notes) {}

std::vector<ResourceDescriptor> ResourceDispatcher::ListResources() const {
    std::vector<ResourceDescriptor> resources;
    resources.reserve(notes_.Size());
    for (const auto& note : notes_.List()) {
        resources.push_back(ResourceDescriptor{
            NoteUri(note.name),
            "Note: " + note.name,
            "A simple note named " + note.name,
            "text/plain",
        });
    }
    return resources;
}

Result<std::string, Error> ResourceDispatcher::ReadResource(const std::string& uri) const {
    auto parsed = ParseUri(uri);
    if (parsed.IsErr()) {
        return Result<std::string, Error>::Err(Error::Make(
            ErrorCategory::UnsupportedScheme, "ReadResource", parsed.Error()));
    }
    const auto& parts = parsed.Value();
    if (parts.scheme != kNoteScheme) {
        return Result<std::string, Error>::Err(Error::Make(
            ErrorCategory::UnsupportedScheme, "ReadResource",
            "Unsupported URI scheme: " + parts.scheme));
    }

    auto name = parts.path;
    auto first = name.find_first_not_of('/');
    name = first == std::string::npos ? std::string() : name.substr(first);
    return notes_.Get(name);
}

Result<PromptResult, Error> ResourceDispatcher::GetPrompt(
    const std::string& name, const nlohmann::json& arguments) const {
    if (name != kSummarizeNotesPrompt) {
        return Result<PromptResult, Error>::Err(Error::Make(
            ErrorCategory::UnknownPrompt, "GetPrompt", "Unknown prompt: " + name));
    }

    std::string text = kSummaryInstruction;
    if (StyleArgument(arguments) == "detailed") {
        text += kDetailedSuffix;
    }
    text += "\n\n";

    bool first = true;
    for (const auto& note : notes_.List()) {
        if (!first) text += '\n';
        text += "- " + note.name + ": " + note.content;
        first = false;
    }

    PromptResult result;
    result.description = "Summarize the current notes";
    result.messages.push_back(PromptMessage{"user", std::move(text)});
    return Result<PromptResult, Error>::Ok(std::move(result));
}

} // namespace ledger_service
