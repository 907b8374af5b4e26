#include <catch2/catch_test_macros.hpp>

#include <ledger_service/ledger/ledger_cli.hpp>
#include <ledger_service/ledger/ledger_path.hpp>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

using namespace ledger_service;

// LedgerCli is exercised against ordinary system programs standing in for
// the ledger binary, so these tests need no ledger installation.

namespace {

class TempLedgerFile {
public:
    TempLedgerFile() : path_("ledger_service_test_cli.ledger") {
        std::ofstream out(path_);
        out << "2024/01/01 Opening\n    Assets:Cash  100 EUR\n    Equity\n";
    }
    ~TempLedgerFile() { std::remove(path_.c_str()); }

    const std::string& Path() const { return path_; }

private:
    std::string path_;
};

} // anonymous namespace

TEST_CASE("LedgerCli: default binary is ledger", "[ledger][cli]") {
    LedgerCli cli;
    CHECK(cli.Binary() == "ledger");
}

TEST_CASE("LedgerCli: missing ledger file is an adapter error", "[ledger][cli]") {
    LedgerCli cli("echo");
    auto result = cli.FetchAccounts("/nonexistent/2024/experiment.ledger");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Adapter);
    CHECK(result.Error().operation == "FetchAccounts");
    CHECK(result.Error().message ==
          "Ledger file not found: /nonexistent/2024/experiment.ledger");
}

TEST_CASE("LedgerCli: accounts runs <binary> -f <path> accounts", "[ledger][cli]") {
    TempLedgerFile file;
    LedgerCli cli("echo");

    auto result = cli.FetchAccounts(file.Path());
    REQUIRE(result.IsOk());
    CHECK(result.Value() == "-f " + file.Path() + " accounts\n");
}

TEST_CASE("LedgerCli: balance output is trimmed", "[ledger][cli]") {
    TempLedgerFile file;
    LedgerCli cli("echo");

    auto result = cli.GetAccountBalance(file.Path(), "Assets:Cash");
    REQUIRE(result.IsOk());
    CHECK(result.Value() == "-f " + file.Path() + " balance Assets:Cash");
}

TEST_CASE("LedgerCli: register passes the account as one argument", "[ledger][cli]") {
    TempLedgerFile file;
    LedgerCli cli("echo");

    auto result = cli.GetAccountRegister(file.Path(), "Expenses:Eating Out");
    REQUIRE(result.IsOk());
    CHECK(result.Value() ==
          "-f " + file.Path() + " register Expenses:Eating Out");
}

TEST_CASE("LedgerCli: non-zero exit is an adapter error", "[ledger][cli]") {
    TempLedgerFile file;
    LedgerCli cli("false");

    auto result = cli.GetAccountBalance(file.Path(), "Assets");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Adapter);
    CHECK(result.Error().operation == "GetAccountBalance");
    CHECK(result.Error().message == "false exited with status 1");
    CHECK_FALSE(result.Error().detail.has_value());
}

TEST_CASE("LedgerCli: unknown binary is an adapter error", "[ledger][cli]") {
    TempLedgerFile file;
    LedgerCli cli("ledger-service-no-such-binary");

    auto result = cli.FetchAccounts(file.Path());
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Adapter);
    CHECK(result.Error().operation == "FetchAccounts");
    CHECK(result.Error().message ==
          "Cannot execute ledger-service-no-such-binary");
}

TEST_CASE("LedgerCli: account that looks like an option is rejected", "[ledger][cli]") {
    TempLedgerFile file;
    LedgerCli cli("echo");

    auto balance = cli.GetAccountBalance(file.Path(), "--output=/tmp/x");
    REQUIRE(balance.IsErr());
    CHECK(balance.Error().category == ErrorCategory::InvalidArguments);
    CHECK(balance.Error().operation == "GetAccountBalance");
    CHECK(balance.Error().message ==
          "Account must not start with '-': --output=/tmp/x");

    auto reg = cli.GetAccountRegister(file.Path(), "-f");
    REQUIRE(reg.IsErr());
    CHECK(reg.Error().category == ErrorCategory::InvalidArguments);
}

TEST_CASE("LedgerCli: dash inside an account is fine", "[ledger][cli]") {
    TempLedgerFile file;
    LedgerCli cli("echo");

    auto result = cli.GetAccountBalance(file.Path(), "Expenses:Self-Care");
    REQUIRE(result.IsOk());
    CHECK(result.Value() == "-f " + file.Path() + " balance Expenses:Self-Care");
}

TEST_CASE("LedgerCli: only stdin of the child points at /dev/null", "[ledger][cli]") {
    TempLedgerFile file;
    const std::string script = "./ledger_service_list_fds.sh";
    {
        std::ofstream out(script);
        out << "#!/bin/sh\n"
               "for fd in /proc/$$/fd/*; do readlink \"$fd\"; done\n";
    }
    std::filesystem::permissions(script, std::filesystem::perms::owner_all);

    LedgerCli cli(script);
    auto result = cli.FetchAccounts(file.Path());
    std::remove(script.c_str());

    REQUIRE(result.IsOk());
    auto lines = SplitLines(result.Value());
    CHECK(std::count(lines.begin(), lines.end(), "/dev/null") == 1);
}
