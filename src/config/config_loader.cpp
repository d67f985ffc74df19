#include <querygraph/config/config_loader.hpp>

#include <querygraph/core/version.hpp>
#include <querygraph/sql/debouncer.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace querygraph {

namespace {

Error MakeConfigError(const std::string& message, const std::string& subject = "") {
    return Error{"ConfigLoader", subject, message, ErrorCategory::Config};
}

Result<LogLevel, Error> ParseLevel(const std::string& text) {
    auto level = ParseLogLevel(text);
    if (!level) {
        return Result<LogLevel, Error>::Err(MakeConfigError(
            "Unknown log level '" + text + "' (expected debug, info, warn or error)",
            "log_level"));
    }
    return Result<LogLevel, Error>::Ok(*level);
}

Result<OperationMode, Error> ParseMode(const std::string& text) {
    auto mode = ParseOperationMode(text);
    if (mode.IsErr()) {
        return Result<OperationMode, Error>::Err(MakeConfigError(mode.Error(), "default_mode"));
    }
    return Result<OperationMode, Error>::Ok(mode.Value());
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ParseLinkedServers
// ---------------------------------------------------------------------------
Result<LinkedServerMap, Error> ParseLinkedServers(const std::vector<std::string>& entries) {
    LinkedServerMap servers;
    for (const auto& entry : entries) {
        const auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0 || eq + 1 == entry.size()) {
            return Result<LinkedServerMap, Error>::Err(MakeConfigError(
                "Linked server entry '" + entry + "' must have the form ALIAS=NAME",
                "linked_servers"));
        }
        servers[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    return Result<LinkedServerMap, Error>::Ok(std::move(servers));
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(MakeConfigError(
            "Failed to parse YAML file: " + std::string(e.what()), std::string(file_path)));
    }

    AppConfig config;
    try {
        if (root["log_level"]) {
            auto level = ParseLevel(root["log_level"].as<std::string>());
            if (level.IsErr()) {
                return Result<AppConfig, Error>::Err(level.Error());
            }
            config.log_level = level.Value();
        }
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["json_output"]) {
            config.json_output = root["json_output"].as<bool>();
        }
        if (root["color"]) {
            config.color = root["color"].as<bool>();
        }
        if (root["verbose"]) {
            config.verbose = root["verbose"].as<bool>();
        }
        if (root["quiet"]) {
            config.quiet = root["quiet"].as<bool>();
        }
        if (root["auto_generate"]) {
            config.auto_generate = root["auto_generate"].as<bool>();
        }
        if (root["debounce_ms"]) {
            config.debounce_ms = root["debounce_ms"].as<int>();
        }
        if (root["default_mode"]) {
            auto mode = ParseMode(root["default_mode"].as<std::string>());
            if (mode.IsErr()) {
                return Result<AppConfig, Error>::Err(mode.Error());
            }
            config.default_mode = mode.Value();
        }

        // -- Linked servers: either a mapping or a list of "ALIAS=NAME" --
        if (const auto servers = root["linked_servers"]) {
            if (servers.IsMap()) {
                for (const auto& entry : servers) {
                    config.linked_servers[entry.first.as<std::string>()] =
                        entry.second.as<std::string>();
                }
            } else {
                std::vector<std::string> entries;
                for (const auto& entry : servers) {
                    entries.push_back(entry.as<std::string>());
                }
                auto parsed = ParseLinkedServers(entries);
                if (parsed.IsErr()) {
                    return Result<AppConfig, Error>::Err(parsed.Error());
                }
                config.linked_servers = std::move(parsed).Value();
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(MakeConfigError(
            "Invalid value in config file: " + std::string(e.what()), std::string(file_path)));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv,
                                     std::string* config_path) {
    // --help and --version are answered by main before this runs, and -v is
    // the verbosity switch here.
    argparse::ArgumentParser program("querygraph", kVersion,
                                     argparse::default_arguments::none);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--log-level")
        .help("Minimum log level (debug, info, warn, error)");
    program.add_argument("--log-file")
        .help("Append log lines to this file");
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Verbose output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-vv")
        .help("Debug output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Quiet output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-auto-generate")
        .help("Only generate SQL on explicit request")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--debounce-ms")
        .help("Validation debounce interval in milliseconds (400-800)")
        .scan<'i', int>();
    program.add_argument("--mode")
        .help("Default operation mode (select, insert, update, delete)");
    program.add_argument("--linked-server")
        .help("Linked server mapping ALIAS=NAME (repeatable)")
        .append();

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    if (config_path != nullptr) {
        if (auto val = program.present("--config")) {
            *config_path = *val;
        }
    }

    if (auto val = program.present("--log-level")) {
        auto level = ParseLevel(*val);
        if (level.IsErr()) {
            return Result<AppConfig, Error>::Err(level.Error());
        }
        config.log_level = level.Value();
    }
    if (program.get<bool>("--verbose")) {
        config.verbose = true;
        config.log_level = LogLevel::Info;
    }
    if (program.get<bool>("-vv")) {
        config.verbose = true;
        config.log_level = LogLevel::Debug;
    }
    if (program.get<bool>("--quiet")) {
        config.quiet = true;
        config.log_level = LogLevel::Error;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (program.get<bool>("--json")) {
        config.json_output = true;
    }
    if (program.get<bool>("--color")) {
        config.color = true;
    }
    if (program.get<bool>("--no-color")) {
        config.color = false;
    }
    if (program.get<bool>("--no-auto-generate")) {
        config.auto_generate = false;
    }
    if (auto val = program.present<int>("--debounce-ms")) {
        config.debounce_ms = *val;
    }
    if (auto val = program.present("--mode")) {
        auto mode = ParseMode(*val);
        if (mode.IsErr()) {
            return Result<AppConfig, Error>::Err(mode.Error());
        }
        config.default_mode = mode.Value();
    }
    if (auto entries = program.present<std::vector<std::string>>("--linked-server")) {
        auto parsed = ParseLinkedServers(*entries);
        if (parsed.IsErr()) {
            return Result<AppConfig, Error>::Err(parsed.Error());
        }
        config.linked_servers = std::move(parsed).Value();
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    const AppConfig defaults;
    AppConfig merged = yaml_base;

    if (cli_overrides.log_level != defaults.log_level) {
        merged.log_level = cli_overrides.log_level;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    if (cli_overrides.json_output) {
        merged.json_output = true;
    }
    if (cli_overrides.color.has_value()) {
        merged.color = cli_overrides.color;
    }
    if (cli_overrides.verbose) {
        merged.verbose = true;
    }
    if (cli_overrides.quiet) {
        merged.quiet = true;
    }
    if (!cli_overrides.auto_generate) {
        merged.auto_generate = false;
    }
    if (cli_overrides.debounce_ms != defaults.debounce_ms) {
        merged.debounce_ms = cli_overrides.debounce_ms;
    }
    if (cli_overrides.default_mode != defaults.default_mode) {
        merged.default_mode = cli_overrides.default_mode;
    }
    // CLI entries are added on top of the file's, replacing equal aliases.
    for (const auto& [alias, server] : cli_overrides.linked_servers) {
        merged.linked_servers[alias] = server;
    }
    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.debounce_ms < kMinDebounceInterval.count() ||
        config.debounce_ms > kMaxDebounceInterval.count()) {
        return Result<void, Error>::Err(MakeConfigError(
            "Debounce interval must be between " + std::to_string(kMinDebounceInterval.count()) +
                " and " + std::to_string(kMaxDebounceInterval.count()) + " ms, got " +
                std::to_string(config.debounce_ms),
            "debounce_ms"));
    }
    if (config.verbose && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --verbose and --quiet"));
    }
    for (const auto& [alias, server] : config.linked_servers) {
        if (alias.empty() || server.empty()) {
            return Result<void, Error>::Err(MakeConfigError(
                "Linked server alias and name must not be empty", "linked_servers"));
        }
    }
    return Result<void, Error>::Ok();
}

} // namespace querygraph
