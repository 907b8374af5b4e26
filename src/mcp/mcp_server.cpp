#include <ledger_service/mcp/mcp_server.hpp>

#include <ledger_service/core/log.hpp>
#include <ledger_service/core/version.hpp>

#include <algorithm>
#include <array>
#include <optional>
#include <string>

namespace ledger_service {

namespace {

constexpr const char* kLogComponent = "mcp";
constexpr const char* kDefaultProtocolVersion = "2024-11-05";
constexpr std::array<const char*, 3> kSupportedProtocolVersions = {
    "2024-11-05", "2025-03-26", "2025-06-18"};
constexpr const char* kResourcesChanged = "notifications/resources/list_changed";

std::string NegotiateProtocolVersion(const nlohmann::json& params) {
    auto it = params.find("protocolVersion");
    if (it == params.end() || !it->is_string()) {
        return kDefaultProtocolVersion;
    }
    const auto requested = it->get<std::string>();
    auto match = std::find_if(
        kSupportedProtocolVersions.begin(), kSupportedProtocolVersions.end(),
        [&](const char* v) { return requested == v; });
    return match != kSupportedProtocolVersions.end() ? requested
                                                      : kDefaultProtocolVersion;
}

// Tool failures the client should see as a result with isError set, as
// opposed to a protocol-level error.
bool IsToolExecutionError(const Error& error) {
    return error.category == ErrorCategory::InvalidArguments ||
           error.category == ErrorCategory::Adapter;
}

} // anonymous namespace

McpServer::McpServer(NotesStore notes,
                     ILedgerQuery& ledger,
                     LedgerLocation location,
                     std::istream& in,
                     std::ostream& out)
    : in_(in),
      out_(out),
      notes_(std::move(notes)),
      tools_(catalog_, notes_, ledger, std::move(location)),
      resources_(catalog_, notes_) {
    notes_.Subscribe([this](const std::string& name) {
        LogDebug(kLogComponent, "Resource list changed by note '" + name + "'");
        SendNotification(kResourcesChanged);
    });
}

void McpServer::Run() {
    LogInfo(kLogComponent, "Session started");
    std::string line;
    while (state_ == State::Running && std::getline(in_, line)) {
        if (line.empty() || line == "\r") continue;

        nlohmann::json message;
        try {
            message = nlohmann::json::parse(line);
        } catch (const nlohmann::json::exception& e) {
            LogWarn(kLogComponent, std::string("Parse error: ") + e.what());
            WriteLine(MakeError(nullptr, kRpcParseError, "Parse error"));
            continue;
        }

        auto response = HandleMessage(message);
        if (response) {
            WriteLine(*response);
        }
    }
    Close();
}

void McpServer::Close() {
    if (state_ == State::Closed) return;
    state_ = State::Closed;
    LogInfo(kLogComponent, "Session closed");
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    if (!message.is_object()) {
        return MakeError(nullptr, kRpcInvalidRequest,
                         "Request must be a JSON object");
    }

    const bool is_notification = !message.contains("id");
    const nlohmann::json id = is_notification ? nlohmann::json() : message["id"];

    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        if (is_notification) return std::nullopt;
        return MakeError(id, kRpcInvalidRequest, "Invalid JSON-RPC version");
    }

    auto method_it = message.find("method");
    if (method_it == message.end() || !method_it->is_string()) {
        if (is_notification) return std::nullopt;
        return MakeError(id, kRpcInvalidRequest, "Missing 'method'");
    }
    const auto method = method_it->get<std::string>();

    if (state_ == State::Closed) {
        if (is_notification) return std::nullopt;
        return MakeError(id, kRpcInvalidRequest, "Session is closed");
    }

    if (is_notification) {
        HandleNotification(method);
        return std::nullopt;
    }

    auto params = message.value("params", nlohmann::json::object());
    if (!params.is_object()) {
        return MakeError(id, kRpcInvalidParams, "'params' must be an object");
    }

    LogDebug(kLogComponent, "Request: " + method);

    if (method == "initialize") {
        return HandleInitialize(params, id);
    } else if (method == "ping") {
        return MakeResult(id, nlohmann::json::object());
    } else if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        return HandleToolsCall(params, id);
    } else if (method == "resources/list") {
        return HandleResourcesList(id);
    } else if (method == "resources/read") {
        return HandleResourcesRead(params, id);
    } else if (method == "prompts/list") {
        return HandlePromptsList(id);
    } else if (method == "prompts/get") {
        return HandlePromptsGet(params, id);
    } else {
        return MakeError(id, kRpcMethodNotFound, "Method not found: " + method);
    }
}

nlohmann::json McpServer::HandleInitialize(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (initialized_) {
        LogWarn(kLogComponent, "Repeated initialize; keeping session state");
    }
    initialized_ = true;

    nlohmann::json result;
    result["protocolVersion"] = NegotiateProtocolVersion(params);
    result["capabilities"] = {
        {"tools", {{"listChanged", false}}},
        {"resources", {{"subscribe", false}, {"listChanged", true}}},
        {"prompts", {{"listChanged", false}}},
    };
    result["serverInfo"] = {
        {"name", kServerName},
        {"version", kVersion}
    };

    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) {
    return MakeResult(id, {{"tools", catalog_.ListTools()}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) {
    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string()) {
        return MakeError(id, kRpcInvalidParams, "Missing 'name' parameter");
    }
    const auto tool_name = name_it->get<std::string>();
    const auto arguments = params.value("arguments", nlohmann::json());

    auto result = tools_.Call(tool_name, arguments);
    if (result.IsErr()) {
        const auto& error = result.Error();
        if (!IsToolExecutionError(error)) {
            return MakeError(id, error);
        }
        LogWarn(kLogComponent, error.ToString());
        return MakeResult(id, {{"content", TextContent(error.message)},
                               {"isError", true}});
    }

    return MakeResult(id, {{"content", result.Value()}});
}

nlohmann::json McpServer::HandleResourcesList(const nlohmann::json& id) {
    return MakeResult(id, {{"resources", resources_.ListResources()}});
}

nlohmann::json McpServer::HandleResourcesRead(
    const nlohmann::json& params, const nlohmann::json& id) {
    auto uri_it = params.find("uri");
    if (uri_it == params.end() || !uri_it->is_string()) {
        return MakeError(id, kRpcInvalidParams, "Missing 'uri' parameter");
    }
    const auto uri = uri_it->get<std::string>();

    auto content = resources_.ReadResource(uri);
    if (content.IsErr()) {
        return MakeError(id, content.Error());
    }

    nlohmann::json contents = nlohmann::json::array({
        {{"uri", uri}, {"mimeType", "text/plain"}, {"text", content.Value()}}
    });
    return MakeResult(id, {{"contents", contents}});
}

nlohmann::json McpServer::HandlePromptsList(const nlohmann::json& id) {
    return MakeResult(id, {{"prompts", resources_.ListPrompts()}});
}

nlohmann::json McpServer::HandlePromptsGet(
    const nlohmann::json& params, const nlohmann::json& id) {
    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string()) {
        return MakeError(id, kRpcInvalidParams, "Missing 'name' parameter");
    }

    auto prompt = resources_.GetPrompt(name_it->get<std::string>(),
                                       params.value("arguments", nlohmann::json()));
    if (prompt.IsErr()) {
        return MakeError(id, prompt.Error());
    }
    return MakeResult(id, prompt.Value());
}

void McpServer::HandleNotification(const std::string& method) {
    if (method == "notifications/initialized") {
        LogInfo(kLogComponent, "Client initialized");
    } else {
        LogDebug(kLogComponent, "Ignoring notification: " + method);
    }
}

void McpServer::SendNotification(const std::string& method) {
    WriteLine({{"jsonrpc", "2.0"}, {"method", method}});
}

void McpServer::WriteLine(const nlohmann::json& message) {
    // Ledger output is not guaranteed to be UTF-8; invalid bytes become U+FFFD.
    out_ << message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
         << "\n";
    out_.flush();
    if (!out_) {
        LogError(kLogComponent, "Failed to write to output stream");
        out_.clear();
    }
}

nlohmann::json McpServer::MakeError(
    const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

nlohmann::json McpServer::MakeError(const nlohmann::json& id, const Error& error) {
    LogInfo(kLogComponent, error.ToString());
    auto response = MakeError(id, error.RpcCode(), error.message);
    response["error"]["data"] = {{"category", error.CategoryName()}};
    return response;
}

nlohmann::json McpServer::MakeResult(
    const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

} // namespace ledger_service
