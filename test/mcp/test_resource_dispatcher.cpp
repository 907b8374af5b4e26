#include <catch2/catch_test_macros.hpp>

#include <ledger_service/mcp/resource_dispatcher.hpp>

using namespace ledger_service;

namespace {

struct ResourceFixture {
    CapabilityCatalog catalog;
    NotesStore notes;
    ResourceDispatcher resources{catalog, notes};
};

} // anonymous namespace

// ===========================================================================
// Resources
// ===========================================================================

TEST_CASE("ResourceDispatcher: NoteUri", "[mcp][resources]") {
    CHECK(NoteUri("groceries") == "note://internal/groceries");
}

TEST_CASE("ResourceDispatcher: no notes, no resources", "[mcp][resources]") {
    ResourceFixture f;
    CHECK(f.resources.ListResources().empty());
}

TEST_CASE("ResourceDispatcher: one descriptor per note in store order", "[mcp][resources]") {
    ResourceFixture f;
    REQUIRE(f.notes.Put("b", "second").IsOk());
    REQUIRE(f.notes.Put("a", "first").IsOk());

    auto list = f.resources.ListResources();
    REQUIRE(list.size() == 2);
    CHECK(list[0].uri == "note://internal/b");
    CHECK(list[0].name == "Note: b");
    CHECK(list[0].description == "A simple note named b");
    CHECK(list[0].mime_type == "text/plain");
    CHECK(list[1].uri == "note://internal/a");

    nlohmann::json j = list[0];
    CHECK(j["mimeType"] == "text/plain");
}

TEST_CASE("ResourceDispatcher: read an existing note", "[mcp][resources]") {
    ResourceFixture f;
    REQUIRE(f.notes.Put("groceries", "milk").IsOk());

    auto content = f.resources.ReadResource("note://internal/groceries");
    REQUIRE(content.IsOk());
    CHECK(content.Value() == "milk");
}

TEST_CASE("ResourceDispatcher: unknown note is NotFound", "[mcp][resources]") {
    ResourceFixture f;
    auto content = f.resources.ReadResource("note://internal/nothing");
    REQUIRE(content.IsErr());
    CHECK(content.Error().category == ErrorCategory::NotFound);
    CHECK(content.Error().message == "Note not found: nothing");
}

TEST_CASE("ResourceDispatcher: URI without a note name is NotFound", "[mcp][resources]") {
    ResourceFixture f;
    auto content = f.resources.ReadResource("note://internal/");
    REQUIRE(content.IsErr());
    CHECK(content.Error().category == ErrorCategory::NotFound);
}

TEST_CASE("ResourceDispatcher: other schemes are rejected", "[mcp][resources]") {
    ResourceFixture f;
    REQUIRE(f.notes.Put("x", "y").IsOk());

    auto content = f.resources.ReadResource("file://internal/x");
    REQUIRE(content.IsErr());
    CHECK(content.Error().category == ErrorCategory::UnsupportedScheme);
    CHECK(content.Error().message == "Unsupported URI scheme: file");
}

TEST_CASE("ResourceDispatcher: malformed URI is an unsupported scheme", "[mcp][resources]") {
    ResourceFixture f;
    auto content = f.resources.ReadResource("just-a-name");
    REQUIRE(content.IsErr());
    CHECK(content.Error().category == ErrorCategory::UnsupportedScheme);
}

// ===========================================================================
// Prompts
// ===========================================================================

TEST_CASE("ResourceDispatcher: summarize-notes, brief by default", "[mcp][prompts]") {
    ResourceFixture f;
    REQUIRE(f.notes.Put("a", "one").IsOk());
    REQUIRE(f.notes.Put("b", "two").IsOk());

    auto prompt = f.resources.GetPrompt("summarize-notes", nullptr);
    REQUIRE(prompt.IsOk());
    CHECK(prompt.Value().description == "Summarize the current notes");
    REQUIRE(prompt.Value().messages.size() == 1);
    CHECK(prompt.Value().messages[0].role == "user");
    CHECK(prompt.Value().messages[0].text ==
          "Here are the current notes to summarize:\n\n- a: one\n- b: two");
}

TEST_CASE("ResourceDispatcher: summarize-notes, detailed", "[mcp][prompts]") {
    ResourceFixture f;
    REQUIRE(f.notes.Put("a", "one").IsOk());

    auto prompt = f.resources.GetPrompt("summarize-notes", {{"style", "detailed"}});
    REQUIRE(prompt.IsOk());
    CHECK(prompt.Value().messages[0].text ==
          "Here are the current notes to summarize: Give extensive details.\n\n- a: one");
}

TEST_CASE("ResourceDispatcher: unrecognised style is brief", "[mcp][prompts]") {
    ResourceFixture f;
    auto prompt = f.resources.GetPrompt("summarize-notes", {{"style", "poetic"}});
    REQUIRE(prompt.IsOk());
    CHECK(prompt.Value().messages[0].text ==
          "Here are the current notes to summarize:\n\n");
}

TEST_CASE("ResourceDispatcher: prompt JSON encoding", "[mcp][prompts]") {
    ResourceFixture f;
    auto prompt = f.resources.GetPrompt("summarize-notes", nullptr);
    REQUIRE(prompt.IsOk());

    nlohmann::json j = prompt.Value();
    CHECK(j["messages"][0]["role"] == "user");
    CHECK(j["messages"][0]["content"]["type"] == "text");
}

TEST_CASE("ResourceDispatcher: unknown prompt", "[mcp][prompts]") {
    ResourceFixture f;
    auto prompt = f.resources.GetPrompt("summarize", nullptr);
    REQUIRE(prompt.IsErr());
    CHECK(prompt.Error().category == ErrorCategory::UnknownPrompt);
    CHECK(prompt.Error().message == "Unknown prompt: summarize");
}

TEST_CASE("ResourceDispatcher: prompts are listed from the catalog", "[mcp][prompts]") {
    ResourceFixture f;
    REQUIRE(f.resources.ListPrompts().size() == 1);
    CHECK(f.resources.ListPrompts()[0].name == "summarize-notes");
}
