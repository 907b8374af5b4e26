#include <ledger_service/notes/notes_store.hpp>

#include <ledger_service/core/log.hpp>

#include <exception>

namespace ledger_service {

namespace {
constexpr const char* kLogComponent = "notes";
} // anonymous namespace

Result<void, Error> NotesStore::Put(const std::string& name,
                                    const std::string& content) {
    if (name.empty() || content.empty()) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::InvalidArguments, "NotesStore::Put",
            "Note name and content must not be empty"));
    }

    auto it = index_.find(name);
    if (it != index_.end()) {
        notes_[it->second].content = content;
        LogDebug(kLogComponent, "Overwrote note '" + name + "'");
    } else {
        index_.emplace(name, notes_.size());
        notes_.push_back(Note{name, content});
        LogDebug(kLogComponent, "Added note '" + name + "'");
    }

    NotifyChanged(name);
    return Result<void, Error>::Ok();
}

Result<std::string, Error> NotesStore::Get(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return Result<std::string, Error>::Err(Error::Make(
            ErrorCategory::NotFound, "NotesStore::Get",
            "Note not found: " + name));
    }
    return Result<std::string, Error>::Ok(notes_[it->second].content);
}

bool NotesStore::Contains(const std::string& name) const {
    return index_.count(name) > 0;
}

void NotesStore::Subscribe(NotesChangedListener listener) {
    listeners_.push_back(std::move(listener));
}

void NotesStore::NotifyChanged(const std::string& name) {
    for (const auto& listener : listeners_) {
        try {
            listener(name);
        } catch (const std::exception& e) {
            LogWarn(kLogComponent,
                    "Change listener failed for '" + name + "': " + e.what());
        }
    }
}

} // namespace ledger_service
