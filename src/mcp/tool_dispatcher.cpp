#include <ledger_service/mcp/tool_dispatcher.hpp>

#include <ledger_service/core/log.hpp>

#include <variant>

namespace ledger_service {

namespace {

constexpr const char* kLogComponent = "tools";

Result<ResponseContent, Error> TextResult(std::string text) {
    return Result<ResponseContent, Error>::Ok(TextContent(std::move(text)));
}

// "\nLedger Accounts:\n- a\n- b"
std::string RenderAccounts(const std::string& raw) {
    std::string text = "\nLedger Accounts:\n";
    bool first = true;
    for (const auto& account : SplitLines(raw)) {
        if (!first) text += '\n';
        text += "- " + account;
        first = false;
    }
    return text;
}

} // anonymous namespace

ToolDispatcher::ToolDispatcher(const CapabilityCatalog& catalog,
                               NotesStore& notes,
                               ILedgerQuery& ledger,
                               LedgerLocation location)
    : catalog_(catalog),
      notes_(notes),
      ledger_(ledger),
      location_(std::move(location)) {}

Result<ResponseContent, Error> ToolDispatcher::Call(
    const std::string& name, const nlohmann::json& arguments) {
    auto decoded = DecodeToolArguments(catalog_, name, arguments);
    if (decoded.IsErr()) {
        LogInfo(kLogComponent, "Rejected call to " + name + ": " +
                                   decoded.Error().message);
        return Result<ResponseContent, Error>::Err(decoded.Error());
    }
    LogDebug(kLogComponent, "Calling " + name);
    return Dispatch(decoded.Value());
}

Result<ResponseContent, Error> ToolDispatcher::Dispatch(
    const ToolArguments& arguments) {
    return std::visit(
        [this](const auto& args) { return Handle(args); }, arguments);
}

Result<ResponseContent, Error> ToolDispatcher::Handle(const ListAccountsArgs& args) {
    auto accounts = ledger_.FetchAccounts(location_.PathFor(args.year));
    if (accounts.IsErr()) {
        return Result<ResponseContent, Error>::Err(accounts.Error());
    }
    return TextResult(RenderAccounts(accounts.Value()));
}

Result<ResponseContent, Error> ToolDispatcher::Handle(const AccountBalanceArgs& args) {
    auto balance = ledger_.GetAccountBalance(location_.PathFor(args.year),
                                             args.account);
    if (balance.IsErr()) {
        return Result<ResponseContent, Error>::Err(balance.Error());
    }
    return TextResult("The balance of " + args.account + " is " + balance.Value());
}

Result<ResponseContent, Error> ToolDispatcher::Handle(const AccountRegisterArgs& args) {
    auto reg = ledger_.GetAccountRegister(location_.PathFor(args.year),
                                          args.account);
    if (reg.IsErr()) {
        return Result<ResponseContent, Error>::Err(reg.Error());
    }
    return TextResult("The register of " + args.account + " is " + reg.Value());
}

Result<ResponseContent, Error> ToolDispatcher::Handle(const AddNoteArgs& args) {
    auto put = notes_.Put(args.name, args.content);
    if (put.IsErr()) {
        return Result<ResponseContent, Error>::Err(put.Error());
    }
    return TextResult("Added note '" + args.name + "' with content: " + args.content);
}

} // namespace ledger_service
