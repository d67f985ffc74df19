#include <querygraph/cli/command_executor.hpp>
#include <querygraph/cli/command_router.hpp>
#include <querygraph/config/config_loader.hpp>
#include <querygraph/core/log.hpp>
#include <querygraph/core/terminal.hpp>
#include <querygraph/core/version.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitSuccess = 0;

// Check for --version before the first positional (group) argument.
bool HandleVersionFlag(int argc, const char* const* argv) {
    const int group = querygraph::CommandRouter::GroupIndex(argc, argv);
    for (int i = 1; i < group; ++i) {
        if (std::string_view{argv[i]} == "--version") {
            std::cout << "querygraph " << querygraph::kVersion << "\n";
            return true;
        }
    }
    return false;
}

// True when --help/-h appears before any command group.
bool IsTopLevelHelp(int argc, const char* const* argv) {
    const int group = querygraph::CommandRouter::GroupIndex(argc, argv);
    for (int i = 1; i < group; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--help" || arg == "-h") {
            return true;
        }
    }
    return false;
}

void PrintStartupError(const querygraph::Error& error, bool json_output) {
    if (json_output) {
        std::cerr << error.ToJson() << "\n";
    } else {
        std::cerr << "Error: " << error.ToString() << "\n";
    }
}

// Resolve the merged configuration from the global flags (everything before
// the command group) and the optional YAML file they name.
querygraph::Result<querygraph::AppConfig, querygraph::Error> ResolveConfig(
    int argc, const char* const* argv) {
    using namespace querygraph;

    // argparse only sees the global prefix; group, action and command flags
    // belong to the router.
    const int group = CommandRouter::GroupIndex(argc, argv);
    std::vector<const char*> global_args(argv, argv + group);

    std::string config_path;
    auto cli_result = LoadFromCli(static_cast<int>(global_args.size()),
                                  global_args.data(), &config_path);
    if (cli_result.IsErr()) {
        return cli_result;
    }
    auto config = std::move(cli_result).Value();

    if (!config_path.empty()) {
        auto yaml_result = LoadFromYaml(config_path);
        if (yaml_result.IsErr()) {
            return yaml_result;
        }
        config = MergeConfigs(yaml_result.Value(), config);
    }

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(valid.Error());
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// Install the global logger: a file when log_file is set, JSON lines on
// stderr in JSON mode, otherwise the (optionally colored) console sink.
querygraph::Result<void, querygraph::Error> InitLogging(const querygraph::AppConfig& config) {
    using namespace querygraph;

    if (config.log_file) {
        auto sink = std::make_unique<FileSink>(*config.log_file);
        if (!sink->IsOpen()) {
            return Result<void, Error>::Err(Error{"InitLogging", *config.log_file,
                                                  "Cannot open log file", ErrorCategory::Io});
        }
        InitGlobalLogger(std::move(sink), config.log_level);
        return Result<void, Error>::Ok();
    }
    if (config.json_output) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), config.log_level);
        return Result<void, Error>::Ok();
    }

    InitGlobalLogger(
        std::make_unique<ColorConsoleSink>(ColorEnabled(OutputStream::Stderr, config.color)),
        config.log_level);
    return Result<void, Error>::Ok();
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace querygraph;

    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }

    // No command group, or --help in front of it: top-level help.
    if (CommandRouter::GroupIndex(argc, argv) >= argc || IsTopLevelHelp(argc, argv)) {
        CommandRouter router;
        RegisterAllCommands(router, AppConfig{}, std::cout, std::cerr);
        router.PrintHelp(std::cout);
        return kExitSuccess;
    }

    auto config_result = ResolveConfig(argc, argv);
    if (config_result.IsErr()) {
        bool json_output = false;
        for (int i = 1; i < argc; ++i) {
            if (std::string_view{argv[i]} == "--json") json_output = true;
        }
        PrintStartupError(config_result.Error(), json_output);
        return config_result.Error().ExitCode();
    }
    const auto config = std::move(config_result).Value();

    auto logging = InitLogging(config);
    if (logging.IsErr()) {
        PrintStartupError(logging.Error(), config.json_output);
        return logging.Error().ExitCode();
    }
    LogDebug("cli", "querygraph " + std::string(kVersion) + " starting");

    CommandRouter router;
    RegisterAllCommands(router, config, std::cout, std::cerr);
    return router.Dispatch(argc, argv, std::cout, std::cerr);
}
