#include <ledger_service/mcp/tool_arguments.hpp>

#include <map>

namespace ledger_service {

namespace {

using Fields = std::map<std::string, std::string>;

constexpr const char* kOperation = "DecodeToolArguments";

Error MakeInvalidArguments(const std::string& message) {
    return Error::Make(ErrorCategory::InvalidArguments, kOperation, message);
}

// Check the mapping against the tool's declared fields and collect the
// string values of the ones that are present.
Result<Fields, Error> CollectFields(const ToolDescriptor& tool,
                                    const nlohmann::json& arguments) {
    if (arguments.is_null()) {
        return Result<Fields, Error>::Err(
            MakeInvalidArguments("Missing arguments for tool: " + tool.name));
    }
    if (!arguments.is_object()) {
        return Result<Fields, Error>::Err(
            MakeInvalidArguments("Arguments for tool " + tool.name +
                                 " must be an object"));
    }

    Fields fields;
    for (const auto& field : tool.fields) {
        auto it = arguments.find(field.name);
        const bool present = it != arguments.end() && !it->is_null();
        if (!present) {
            if (field.required) {
                return Result<Fields, Error>::Err(MakeInvalidArguments(
                    "Missing required parameter: " + field.name));
            }
            continue;
        }
        if (!it->is_string()) {
            return Result<Fields, Error>::Err(MakeInvalidArguments(
                "Parameter " + field.name + " must be a string"));
        }
        auto value = it->get<std::string>();
        if (value.empty() && field.required) {
            return Result<Fields, Error>::Err(MakeInvalidArguments(
                "Missing required parameter: " + field.name));
        }
        fields.emplace(field.name, std::move(value));
    }
    return Result<Fields, Error>::Ok(std::move(fields));
}

std::string Take(Fields& fields, const std::string& key) {
    auto it = fields.find(key);
    return it == fields.end() ? std::string() : std::move(it->second);
}

} // anonymous namespace

Result<ToolArguments, Error> DecodeToolArguments(const CapabilityCatalog& catalog,
                                                 const std::string& name,
                                                 const nlohmann::json& arguments) {
    const auto* tool = catalog.FindTool(name);
    if (tool == nullptr) {
        return Result<ToolArguments, Error>::Err(Error::Make(
            ErrorCategory::UnknownTool, kOperation, "Unknown tool: " + name));
    }

    auto collected = CollectFields(*tool, arguments);
    if (collected.IsErr()) {
        return Result<ToolArguments, Error>::Err(collected.Error());
    }
    auto fields = std::move(collected).Value();

    if (name == kListAccountsTool) {
        return Result<ToolArguments, Error>::Ok(
            ListAccountsArgs{Take(fields, "year")});
    }
    if (name == kAccountBalanceTool) {
        return Result<ToolArguments, Error>::Ok(
            AccountBalanceArgs{Take(fields, "year"), Take(fields, "account")});
    }
    if (name == kAccountRegisterTool) {
        return Result<ToolArguments, Error>::Ok(
            AccountRegisterArgs{Take(fields, "year"), Take(fields, "account")});
    }
    if (name == kAddNoteTool) {
        return Result<ToolArguments, Error>::Ok(
            AddNoteArgs{Take(fields, "name"), Take(fields, "content")});
    }

    // In the catalog but without an argument record.
    return Result<ToolArguments, Error>::Err(Error::Make(
        ErrorCategory::Internal, kOperation, "No decoder for tool: " + name));
}

} // namespace ledger_service
