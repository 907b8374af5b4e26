#include <ledger_service/config/config_loader.hpp>
#include <ledger_service/core/log.hpp>
#include <ledger_service/core/terminal.hpp>
#include <ledger_service/core/version.hpp>
#include <ledger_service/ledger/ledger_cli.hpp>
#include <ledger_service/mcp/mcp_server.hpp>
#include <ledger_service/notes/notes_store.hpp>

#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitConfig = 1;
constexpr int kExitInternal = 99;

// Logs go to stderr or a file; stdout carries the protocol.
std::unique_ptr<ledger_service::ILogSink> MakeLogSink(
    const ledger_service::AppConfig& config) {
    using namespace ledger_service;

    if (config.log_file.has_value()) {
        auto sink = std::make_unique<FileSink>(*config.log_file, config.log_json);
        if (!sink->IsOpen()) {
            return nullptr;
        }
        return sink;
    }
    if (config.log_json) {
        return std::make_unique<JsonSink>(std::cerr);
    }
    return std::make_unique<ColorConsoleSink>(
        ResolveLogColor(config.force_color, config.force_no_color));
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace ledger_service;

    auto config_result = LoadConfig(argc, argv);
    if (config_result.IsErr()) {
        std::cerr << kServerName << ": " << config_result.Error().message << "\n";
        return config_result.Error().ExitCode();
    }
    const auto& config = config_result.Value();

    auto sink = MakeLogSink(config);
    if (!sink) {
        std::cerr << kServerName << ": cannot open log file "
                  << *config.log_file << "\n";
        return kExitConfig;
    }
    InitGlobalLogger(std::move(sink), config.log_level.value_or(kDefaultLogLevel));

    // A client that goes away mid-response must not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    LogInfo("main", std::string(kServerName) + " " + kVersion +
                        " serving ledgers under " + config.ledger.base_path);

    try {
        LedgerCli ledger(config.ledger.binary);
        McpServer server(NotesStore{}, ledger,
                         LedgerLocation{config.ledger.base_path,
                                        config.ledger.file_name});
        server.Run();
    } catch (const std::exception& e) {
        LogError("main", std::string("Fatal: ") + e.what());
        return kExitInternal;
    }

    return kExitSuccess;
}
