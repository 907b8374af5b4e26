#include <ledger_service/config/config_loader.hpp>

#include <ledger_service/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <string>

namespace ledger_service {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error::Make(ErrorCategory::Config, "ConfigLoader", message);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config;
    config.config_file = std::string(file_path);

    try {
        // -- Ledger --
        if (root["ledger"]) {
            const auto& ledger = root["ledger"];
            if (ledger["base_path"]) {
                config.ledger.base_path = ledger["base_path"].as<std::string>();
            }
            if (ledger["base_path_env"]) {
                config.ledger.base_path_env = ledger["base_path_env"].as<std::string>();
            }
            if (ledger["file_name"]) {
                config.ledger.file_name = ledger["file_name"].as<std::string>();
            }
            if (ledger["binary"]) {
                config.ledger.binary = ledger["binary"].as<std::string>();
            }
        }

        // -- Logging --
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["log_json"]) {
            config.log_json = root["log_json"].as<bool>();
        }
        if (root["log_level"]) {
            auto name = root["log_level"].as<std::string>();
            LogLevel level = kDefaultLogLevel;
            if (!ParseLogLevel(name, level)) {
                return Result<AppConfig, Error>::Err(
                    MakeConfigError("Invalid log_level: " + name));
            }
            config.log_level = level;
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in " + std::string(file_path) +
                            ": " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program(kServerName, kVersion);
    program.add_description(
        "MCP server exposing ledger queries and notes over stdio.");

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--ledger-base")
        .help("Base directory holding <year>/<ledger-file>");
    program.add_argument("--ledger-file")
        .help("Ledger file name inside each year directory");
    program.add_argument("--ledger-binary")
        .help("ledger executable to run");

    program.add_argument("--log-file")
        .help("Write logs to this file instead of stderr");
    program.add_argument("--log-json")
        .help("Log as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--verbose")
        .help("Log at info level")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--debug")
        .help("Log at debug level")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force coloured log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable coloured log output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }
    if (auto val = program.present("--ledger-base")) {
        config.ledger.base_path = *val;
    }
    if (auto val = program.present("--ledger-file")) {
        config.ledger.file_name = *val;
    }
    if (auto val = program.present("--ledger-binary")) {
        config.ledger.binary = *val;
    }

    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (program.get<bool>("--log-json")) {
        config.log_json = true;
    }
    if (auto val = program.present("--log-level")) {
        LogLevel level = kDefaultLogLevel;
        if (!ParseLogLevel(*val, level)) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Invalid --log-level: " + *val));
        }
        config.log_level = level;
    }
    if (program.get<bool>("--verbose")) {
        config.log_level = LogLevel::Info;
    }
    if (program.get<bool>("--debug")) {
        config.log_level = LogLevel::Debug;
    }
    config.force_color = program.get<bool>("--color");
    config.force_no_color = program.get<bool>("--no-color");

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    AppConfig merged = yaml_base;

    if (!cli_overrides.ledger.base_path.empty()) {
        merged.ledger.base_path = cli_overrides.ledger.base_path;
    }
    if (cli_overrides.ledger.base_path_env.has_value()) {
        merged.ledger.base_path_env = cli_overrides.ledger.base_path_env;
    }
    if (cli_overrides.ledger.file_name != kDefaultLedgerFileName) {
        merged.ledger.file_name = cli_overrides.ledger.file_name;
    }
    if (cli_overrides.ledger.binary != kDefaultLedgerBinary) {
        merged.ledger.binary = cli_overrides.ledger.binary;
    }

    if (cli_overrides.config_file.has_value()) {
        merged.config_file = cli_overrides.config_file;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    if (cli_overrides.log_json) {
        merged.log_json = true;
    }
    if (cli_overrides.log_level.has_value()) {
        merged.log_level = cli_overrides.log_level;
    }
    if (cli_overrides.force_color) {
        merged.force_color = true;
    }
    if (cli_overrides.force_no_color) {
        merged.force_no_color = true;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ResolveBasePathEnv
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveBasePathEnv(AppConfig config) {
    if (config.ledger.base_path.empty() &&
        config.ledger.base_path_env.has_value()) {
        const auto& env_var = *config.ledger.base_path_env;
        const char* env_val = std::getenv(env_var.c_str());
        if (env_val == nullptr || *env_val == '\0') {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Environment variable '" + env_var +
                                "' not set (specified by base_path_env)"));
        }
        config.ledger.base_path = env_val;
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.ledger.base_path.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: ledger.base_path"));
    }
    if (config.ledger.file_name.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("ledger.file_name must not be empty"));
    }
    if (config.ledger.file_name.find('/') != std::string::npos) {
        return Result<void, Error>::Err(
            MakeConfigError("ledger.file_name must be a plain file name, got " +
                            config.ledger.file_name));
    }
    if (config.ledger.binary.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("ledger.binary must not be empty"));
    }
    if (config.log_file.has_value() && config.log_file->empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("log_file must not be empty when set"));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// LoadConfig
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadConfig(int argc, const char* const* argv) {
    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        return cli;
    }

    AppConfig merged = cli.Value();
    if (cli.Value().config_file.has_value()) {
        auto yaml = LoadFromYaml(*cli.Value().config_file);
        if (yaml.IsErr()) {
            return yaml;
        }
        merged = MergeConfigs(yaml.Value(), cli.Value());
    }

    auto resolved = ResolveBasePathEnv(std::move(merged));
    if (resolved.IsErr()) {
        return resolved;
    }

    auto valid = ValidateConfig(resolved.Value());
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(valid.Error());
    }
    return resolved;
}

} // namespace ledger_service
