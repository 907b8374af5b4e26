#include <catch2/catch_test_macros.hpp>

#include <ledger_service/mcp/tool_arguments.hpp>

#include <variant>

using namespace ledger_service;

namespace {

Result<ToolArguments, Error> Decode(const std::string& name,
                                    const nlohmann::json& arguments) {
    static const CapabilityCatalog catalog;
    return DecodeToolArguments(catalog, name, arguments);
}

} // anonymous namespace

// ===========================================================================
// Successful decoding
// ===========================================================================

TEST_CASE("DecodeToolArguments: list-accounts", "[mcp][arguments]") {
    auto result = Decode("list-accounts", {{"year", "2024"}});
    REQUIRE(result.IsOk());
    REQUIRE(std::holds_alternative<ListAccountsArgs>(result.Value()));
    CHECK(std::get<ListAccountsArgs>(result.Value()).year == "2024");
}

TEST_CASE("DecodeToolArguments: account-balance and account-register", "[mcp][arguments]") {
    auto balance = Decode("account-balance", {{"year", "2023"}, {"account", "Assets"}});
    REQUIRE(balance.IsOk());
    const auto& b = std::get<AccountBalanceArgs>(balance.Value());
    CHECK(b.year == "2023");
    CHECK(b.account == "Assets");

    auto reg = Decode("account-register", {{"year", "2023"}, {"account", "Income"}});
    REQUIRE(reg.IsOk());
    CHECK(std::get<AccountRegisterArgs>(reg.Value()).account == "Income");
}

TEST_CASE("DecodeToolArguments: add-note", "[mcp][arguments]") {
    auto result = Decode("add-note", {{"name", "todo"}, {"content", "pay rent"}});
    REQUIRE(result.IsOk());
    const auto& args = std::get<AddNoteArgs>(result.Value());
    CHECK(args.name == "todo");
    CHECK(args.content == "pay rent");
}

TEST_CASE("DecodeToolArguments: undeclared fields are ignored", "[mcp][arguments]") {
    auto result = Decode("list-accounts", {{"year", "2024"}, {"verbose", true}});
    REQUIRE(result.IsOk());
}

// ===========================================================================
// Failures
// ===========================================================================

TEST_CASE("DecodeToolArguments: unknown tool", "[mcp][arguments]") {
    auto result = Decode("delete-everything", {{"year", "2024"}});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::UnknownTool);
    CHECK(result.Error().message == "Unknown tool: delete-everything");
}

TEST_CASE("DecodeToolArguments: missing argument mapping", "[mcp][arguments]") {
    auto result = Decode("list-accounts", nullptr);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::InvalidArguments);
    CHECK(result.Error().message == "Missing arguments for tool: list-accounts");
}

TEST_CASE("DecodeToolArguments: non-object mapping", "[mcp][arguments]") {
    auto result = Decode("list-accounts", nlohmann::json::array({"2024"}));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::InvalidArguments);
}

TEST_CASE("DecodeToolArguments: missing required field", "[mcp][arguments]") {
    auto result = Decode("account-balance", {{"year", "2024"}});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::InvalidArguments);
    CHECK(result.Error().message == "Missing required parameter: account");
}

TEST_CASE("DecodeToolArguments: empty string counts as missing", "[mcp][arguments]") {
    auto result = Decode("add-note", {{"name", "x"}, {"content", ""}});
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Missing required parameter: content");
}

TEST_CASE("DecodeToolArguments: non-string value", "[mcp][arguments]") {
    auto result = Decode("list-accounts", {{"year", 2024}});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::InvalidArguments);
    CHECK(result.Error().message == "Parameter year must be a string");
}
