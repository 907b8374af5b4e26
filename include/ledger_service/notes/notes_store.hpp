#pragma once

#include <ledger_service/core/result.hpp>

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ledger_service {

struct Note {
    std::string name;
    std::string content;

    bool operator==(const Note& other) const {
        return name == other.name && content == other.content;
    }
};

// Called after a mutation is complete. The argument is the note's name.
using NotesChangedListener = std::function<void(const std::string& name)>;

// ---------------------------------------------------------------------------
// NotesStore — name -> content, enumerated in insertion order.
//
// Overwriting an existing note replaces its content in place. Listeners run
// after the mutation is visible; a listener that throws is logged and the
// mutation stands.
// ---------------------------------------------------------------------------
class NotesStore {
public:
    NotesStore() = default;

    // Insert or overwrite. Fails with InvalidArguments for an empty name or
    // content, in which case nothing changes and no listener runs.
    Result<void, Error> Put(const std::string& name, const std::string& content);

    [[nodiscard]] Result<std::string, Error> Get(const std::string& name) const;

    [[nodiscard]] bool Contains(const std::string& name) const;

    [[nodiscard]] const std::vector<Note>& List() const noexcept { return notes_; }

    [[nodiscard]] std::size_t Size() const noexcept { return notes_.size(); }

    void Subscribe(NotesChangedListener listener);

private:
    void NotifyChanged(const std::string& name);

    std::vector<Note> notes_;
    std::unordered_map<std::string, std::size_t> index_;
    std::vector<NotesChangedListener> listeners_;
};

} // namespace ledger_service
