#include <ledger_service/ledger/ledger_cli.hpp>

#include <ledger_service/core/log.hpp>

#include "process.hpp"

#include <filesystem>
#include <system_error>

namespace ledger_service {

namespace {

constexpr const char* kLogComponent = "ledger";

Error MakeAdapterError(const std::string& operation, const std::string& message) {
    return Error::Make(ErrorCategory::Adapter, operation, message);
}

std::string TrimTrailingWhitespace(std::string text) {
    while (!text.empty() &&
           (text.back() == '\n' || text.back() == '\r' ||
            text.back() == ' ' || text.back() == '\t')) {
        text.pop_back();
    }
    return text;
}

// ledger reads options anywhere on its command line, so an account that
// starts with '-' would be taken as an option rather than a pattern.
Result<void, Error> CheckAccount(const std::string& operation,
                                 std::string_view account) {
    if (!account.empty() && account.front() == '-') {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::InvalidArguments, operation,
            "Account must not start with '-': " + std::string(account)));
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

LedgerCli::LedgerCli(std::string binary) : binary_(std::move(binary)) {}

Result<std::string, Error> LedgerCli::FetchAccounts(std::string_view ledger_path) {
    return Query("FetchAccounts", ledger_path, {"accounts"});
}

Result<std::string, Error> LedgerCli::GetAccountBalance(
    std::string_view ledger_path, std::string_view account) {
    auto checked = CheckAccount("GetAccountBalance", account);
    if (checked.IsErr()) {
        return Result<std::string, Error>::Err(checked.Error());
    }
    return Query("GetAccountBalance", ledger_path,
                 {"balance", std::string(account)})
        .Map(TrimTrailingWhitespace);
}

Result<std::string, Error> LedgerCli::GetAccountRegister(
    std::string_view ledger_path, std::string_view account) {
    auto checked = CheckAccount("GetAccountRegister", account);
    if (checked.IsErr()) {
        return Result<std::string, Error>::Err(checked.Error());
    }
    return Query("GetAccountRegister", ledger_path,
                 {"register", std::string(account)})
        .Map(TrimTrailingWhitespace);
}

Result<std::string, Error> LedgerCli::Query(const std::string& operation,
                                            std::string_view ledger_path,
                                            std::vector<std::string> command) {
    const std::string path(ledger_path);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Result<std::string, Error>::Err(
            MakeAdapterError(operation, "Ledger file not found: " + path));
    }

    std::vector<std::string> argv{binary_, "-f", path};
    for (auto& arg : command) {
        argv.push_back(std::move(arg));
    }

    LogDebug(kLogComponent, operation + ": " + binary_ + " -f " + path);
    auto run = process::Run(argv);
    if (run.IsErr()) {
        auto error = run.Error();
        error.operation = operation;
        return Result<std::string, Error>::Err(std::move(error));
    }

    const auto& output = run.Value();
    if (output.exit_code != 0) {
        auto error = MakeAdapterError(
            operation, binary_ + " exited with status " +
                           std::to_string(output.exit_code));
        auto stderr_text = TrimTrailingWhitespace(output.err);
        if (!stderr_text.empty()) {
            error.message += ": " + stderr_text;
            error.detail = stderr_text;
        }
        LogWarn(kLogComponent, error.ToString());
        return Result<std::string, Error>::Err(std::move(error));
    }

    return Result<std::string, Error>::Ok(output.out);
}

} // namespace ledger_service
