#pragma once

#include <ledger_service/core/result.hpp>
#include <ledger_service/ledger/i_ledger_query.hpp>
#include <ledger_service/ledger/ledger_path.hpp>
#include <ledger_service/mcp/capability_catalog.hpp>
#include <ledger_service/mcp/resource_dispatcher.hpp>
#include <ledger_service/mcp/tool_dispatcher.hpp>
#include <ledger_service/notes/notes_store.hpp>

#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ledger_service {

// ---------------------------------------------------------------------------
// McpServer — one MCP session over newline-delimited JSON-RPC 2.0.
//
// Methods:
//   - initialize, ping
//   - tools/list, tools/call
//   - resources/list, resources/read
//   - prompts/list, prompts/get
//   - notifications/* (no response)
//
// Owns the catalog, the notes store and both dispatchers. Every notes change
// is forwarded to the client as notifications/resources/list_changed before
// the response of the call that caused it.
//
// Requests are handled strictly one at a time. Run() returns at end of input,
// after which the session is Closed and rejects further messages.
// ---------------------------------------------------------------------------
class McpServer {
public:
    enum class State {
        Running,
        Closed,
    };

    McpServer(NotesStore notes,
              ILedgerQuery& ledger,
              LedgerLocation location,
              std::istream& in = std::cin,
              std::ostream& out = std::cout);

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;
    McpServer(McpServer&&) = delete;
    McpServer& operator=(McpServer&&) = delete;

    // Run the server loop (blocks until EOF on the input stream).
    void Run();

    // Process a single JSON-RPC message and return the response (if any).
    // Returns nullopt for notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    void Close();

    [[nodiscard]] State GetState() const noexcept { return state_; }
    [[nodiscard]] bool Initialized() const noexcept { return initialized_; }
    [[nodiscard]] const NotesStore& Notes() const noexcept { return notes_; }

private:
    nlohmann::json HandleInitialize(const nlohmann::json& params,
                                    const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);
    nlohmann::json HandleResourcesList(const nlohmann::json& id);
    nlohmann::json HandleResourcesRead(const nlohmann::json& params,
                                       const nlohmann::json& id);
    nlohmann::json HandlePromptsList(const nlohmann::json& id);
    nlohmann::json HandlePromptsGet(const nlohmann::json& params,
                                    const nlohmann::json& id);
    void HandleNotification(const std::string& method);

    void SendNotification(const std::string& method);
    void WriteLine(const nlohmann::json& message);

    nlohmann::json MakeError(const nlohmann::json& id,
                             int code, const std::string& message);
    nlohmann::json MakeError(const nlohmann::json& id, const Error& error);
    nlohmann::json MakeResult(const nlohmann::json& id,
                              const nlohmann::json& result);

    std::istream& in_;
    std::ostream& out_;
    CapabilityCatalog catalog_;
    NotesStore notes_;
    ToolDispatcher tools_;
    ResourceDispatcher resources_;
    State state_ = State::Running;
    bool initialized_ = false;
};

} // namespace ledger_service
