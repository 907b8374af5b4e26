#pragma once

#include <ledger_service/core/result.hpp>

#include <string>
#include <string_view>

namespace ledger_service {

// ---------------------------------------------------------------------------
// ILedgerQuery — read-only queries against one ledger file.
//
// Every operation takes a resolved ledger file path (see ResolveLedgerPath).
// Failures are returned as Error with category Adapter (InvalidArguments for
// an account the backend cannot take) and are passed to the client unchanged. This enables offline testing via MockLedgerQuery.
// ---------------------------------------------------------------------------
class ILedgerQuery {
public:
    ILedgerQuery() = default;
    virtual ~ILedgerQuery() = default;

    ILedgerQuery(const ILedgerQuery&) = delete;
    ILedgerQuery& operator=(const ILedgerQuery&) = delete;
    ILedgerQuery(ILedgerQuery&&) = delete;
    ILedgerQuery& operator=(ILedgerQuery&&) = delete;

    // Newline-separated account names.
    [[nodiscard]] virtual Result<std::string, Error> FetchAccounts(
        std::string_view ledger_path) = 0;

    // Formatted balance of one account.
    [[nodiscard]] virtual Result<std::string, Error> GetAccountBalance(
        std::string_view ledger_path, std::string_view account) = 0;

    // Formatted register (postings) of one account.
    [[nodiscard]] virtual Result<std::string, Error> GetAccountRegister(
        std::string_view ledger_path, std::string_view account) = 0;
};

} // namespace ledger_service
