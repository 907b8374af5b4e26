#include <catch2/catch_test_macros.hpp>

#include <ledger_service/notes/notes_store.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace ledger_service;

// ===========================================================================
// Put / Get
// ===========================================================================

TEST_CASE("NotesStore: starts empty", "[notes]") {
    NotesStore store;
    CHECK(store.Size() == 0);
    CHECK(store.List().empty());
    CHECK_FALSE(store.Contains("anything"));
}

TEST_CASE("NotesStore: Put then Get", "[notes]") {
    NotesStore store;
    REQUIRE(store.Put("groceries", "milk, eggs").IsOk());

    auto content = store.Get("groceries");
    REQUIRE(content.IsOk());
    CHECK(content.Value() == "milk, eggs");
    CHECK(store.Contains("groceries"));
}

TEST_CASE("NotesStore: Get of an unknown note is NotFound", "[notes]") {
    NotesStore store;
    auto content = store.Get("missing");
    REQUIRE(content.IsErr());
    CHECK(content.Error().category == ErrorCategory::NotFound);
    CHECK(content.Error().message == "Note not found: missing");
}

TEST_CASE("NotesStore: List keeps insertion order", "[notes]") {
    NotesStore store;
    REQUIRE(store.Put("c", "3").IsOk());
    REQUIRE(store.Put("a", "1").IsOk());
    REQUIRE(store.Put("b", "2").IsOk());

    const auto& notes = store.List();
    REQUIRE(notes.size() == 3);
    CHECK(notes[0].name == "c");
    CHECK(notes[1].name == "a");
    CHECK(notes[2].name == "b");
}

TEST_CASE("NotesStore: overwrite replaces content in place", "[notes]") {
    NotesStore store;
    REQUIRE(store.Put("first", "one").IsOk());
    REQUIRE(store.Put("second", "two").IsOk());
    REQUIRE(store.Put("first", "uno").IsOk());

    REQUIRE(store.Size() == 2);
    CHECK(store.List()[0] == Note{"first", "uno"});
    CHECK(store.List()[1] == Note{"second", "two"});
}

TEST_CASE("NotesStore: empty name or content is rejected", "[notes]") {
    NotesStore store;
    int notified = 0;
    store.Subscribe([&](const std::string&) { ++notified; });

    auto empty_name = store.Put("", "text");
    REQUIRE(empty_name.IsErr());
    CHECK(empty_name.Error().category == ErrorCategory::InvalidArguments);

    auto empty_content = store.Put("name", "");
    REQUIRE(empty_content.IsErr());
    CHECK(empty_content.Error().category == ErrorCategory::InvalidArguments);

    CHECK(store.Size() == 0);
    CHECK(notified == 0);
}

// ===========================================================================
// Change listeners
// ===========================================================================

TEST_CASE("NotesStore: listener sees the mutation", "[notes][listener]") {
    NotesStore store;
    std::vector<std::string> seen;
    store.Subscribe([&](const std::string& name) {
        auto content = store.Get(name);
        REQUIRE(content.IsOk());
        seen.push_back(name + "=" + content.Value());
    });

    REQUIRE(store.Put("a", "1").IsOk());
    REQUIRE(store.Put("a", "2").IsOk());

    REQUIRE(seen.size() == 2);
    CHECK(seen[0] == "a=1");
    CHECK(seen[1] == "a=2");
}

TEST_CASE("NotesStore: every listener runs once per Put", "[notes][listener]") {
    NotesStore store;
    int first = 0;
    int second = 0;
    store.Subscribe([&](const std::string&) { ++first; });
    store.Subscribe([&](const std::string&) { ++second; });

    REQUIRE(store.Put("x", "y").IsOk());
    CHECK(first == 1);
    CHECK(second == 1);
}

TEST_CASE("NotesStore: a throwing listener does not undo the Put", "[notes][listener]") {
    NotesStore store;
    int after = 0;
    store.Subscribe([](const std::string&) {
        throw std::runtime_error("listener broke");
    });
    store.Subscribe([&](const std::string&) { ++after; });

    auto put = store.Put("kept", "value");
    CHECK(put.IsOk());
    CHECK(store.Contains("kept"));
    CHECK(after == 1);
}
