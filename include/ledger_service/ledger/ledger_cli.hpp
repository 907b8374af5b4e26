#pragma once

#include <ledger_service/ledger/i_ledger_query.hpp>

#include <string>
#include <vector>

namespace ledger_service {

// ---------------------------------------------------------------------------
// LedgerCli — ILedgerQuery backed by the `ledger` command-line program.
//
//   FetchAccounts      -> <binary> -f <path> accounts
//   GetAccountBalance  -> <binary> -f <path> balance <account>
//   GetAccountRegister -> <binary> -f <path> register <account>
//
// The child is waited on synchronously. A missing ledger file, or an account
// starting with '-', is reported without spawning anything.
// ---------------------------------------------------------------------------
class LedgerCli : public ILedgerQuery {
public:
    explicit LedgerCli(std::string binary = "ledger");

    [[nodiscard]] Result<std::string, Error> FetchAccounts(
        std::string_view ledger_path) override;

    [[nodiscard]] Result<std::string, Error> GetAccountBalance(
        std::string_view ledger_path, std::string_view account) override;

    [[nodiscard]] Result<std::string, Error> GetAccountRegister(
        std::string_view ledger_path, std::string_view account) override;

    [[nodiscard]] const std::string& Binary() const noexcept { return binary_; }

private:
    Result<std::string, Error> Query(const std::string& operation,
                                     std::string_view ledger_path,
                                     std::vector<std::string> command);

    std::string binary_;
};

} // namespace ledger_service
