#pragma once

#include <ledger_service/core/log.hpp>

#include <optional>
#include <string>

namespace ledger_service {

constexpr const char* kDefaultLedgerFileName = "experiment.ledger";
constexpr const char* kDefaultLedgerBinary = "ledger";
constexpr LogLevel kDefaultLogLevel = LogLevel::Warn;

struct LedgerConfig {
    std::string base_path;
    std::optional<std::string> base_path_env; // env var to read base_path from
    std::string file_name = kDefaultLedgerFileName;
    std::string binary = kDefaultLedgerBinary;
};

struct AppConfig {
    LedgerConfig ledger;
    std::optional<std::string> config_file;
    std::optional<std::string> log_file;
    bool log_json = false;
    std::optional<LogLevel> log_level;  // unset means kDefaultLogLevel
    bool force_color = false;
    bool force_no_color = false;
};

} // namespace ledger_service
