#include <querygraph/cli/command_executor.hpp>
#include <querygraph/cli/output_formatter.hpp>
#include <querygraph/core/log.hpp>
#include <querygraph/core/terminal.hpp>
#include <querygraph/session/session_json.hpp>
#include <querygraph/session/session_loader.hpp>
#include <querygraph/sql/sql_importer.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <string>

namespace querygraph {

namespace {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

std::string GetFlag(const CommandArgs& args, const std::string& key,
                    const std::string& default_val = "") {
    auto it = args.flags.find(key);
    return (it != args.flags.end()) ? it->second : default_val;
}

bool HasFlag(const CommandArgs& args, const std::string& key) {
    return args.flags.count(key) > 0;
}

// Flags after the action may repeat the global output switches.
AppConfig WithCommandFlags(AppConfig config, const CommandArgs& args) {
    if (GetFlag(args, "json") == "true") {
        config.json_output = true;
    }
    if (GetFlag(args, "no-color") == "true") {
        config.color = false;
    } else if (GetFlag(args, "color") == "true") {
        config.color = true;
    }
    return config;
}

Error MakeUsageError(const std::string& message) {
    return Error{"Usage", "", message, ErrorCategory::InvalidArgument};
}

Result<std::string, Error> ReadTextFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string, Error>::Err(
            Error{"ReadFile", path, "Cannot open file", ErrorCategory::Io});
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return Result<std::string, Error>::Ok(buffer.str());
}

int Fail(const OutputFormatter& fmt, const Error& error) {
    LogDebug("cli", error.ToString());
    fmt.PrintError(error);
    return error.ExitCode();
}

// Loads the session file named by the first positional argument and applies
// a --mode override.
Result<QuerySession, Error> LoadSessionArg(const CommandArgs& args, const AppConfig& config,
                                           const std::string& usage) {
    if (args.positional.empty()) {
        return Result<QuerySession, Error>::Err(
            MakeUsageError("Missing session file. Usage: " + usage));
    }

    QuerySession session(SessionOptionsFromConfig(config));
    auto loaded = LoadSessionFromFile(args.positional[0], session);
    if (loaded.IsErr()) {
        return Result<QuerySession, Error>::Err(loaded.Error());
    }

    if (HasFlag(args, "mode")) {
        auto mode = ParseOperationMode(GetFlag(args, "mode"));
        if (mode.IsErr()) {
            return Result<QuerySession, Error>::Err(MakeUsageError(mode.Error()));
        }
        session.SetOperationMode(mode.Value());
    }
    session.Regenerate();
    return Result<QuerySession, Error>::Ok(std::move(session));
}

std::string Join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out;
}

std::string FirstLine(const std::string& text) {
    const auto nl = text.find('\n');
    return nl == std::string::npos ? text : text.substr(0, nl) + " ...";
}

// ---------------------------------------------------------------------------
// sql generate
// ---------------------------------------------------------------------------
int HandleSqlGenerate(const CommandArgs& args, const AppConfig& base,
                      std::ostream& out, std::ostream& err) {
    const auto config = WithCommandFlags(base, args);
    OutputFormatter fmt(config.json_output, ResolveColor(config), out, err);

    auto session = LoadSessionArg(args, config,
                                  "querygraph sql generate <session.yaml> [--mode=<mode>]");
    if (session.IsErr()) {
        return Fail(fmt, session.Error());
    }

    auto s = std::move(session).Value();
    s.ValidateNow();
    fmt.PrintSql(s.Output(), s.Validation());
    return 0;
}

// ---------------------------------------------------------------------------
// sql validate
// ---------------------------------------------------------------------------
int HandleSqlValidate(const CommandArgs& args, const AppConfig& base,
                      std::ostream& out, std::ostream& err) {
    const auto config = WithCommandFlags(base, args);
    OutputFormatter fmt(config.json_output, ResolveColor(config), out, err);

    std::string text;
    if (HasFlag(args, "text")) {
        text = GetFlag(args, "text");
    } else if (!args.positional.empty()) {
        auto file = ReadTextFile(args.positional[0]);
        if (file.IsErr()) {
            return Fail(fmt, file.Error());
        }
        text = std::move(file).Value();
    } else {
        return Fail(fmt, MakeUsageError(
            "Missing SQL. Usage: querygraph sql validate <file.sql> | --text=<sql>"));
    }

    const auto result = ValidateSql(text);
    fmt.PrintValidation(result);
    return result.status == ValidationStatus::Invalid ? 1 : 0;
}

// ---------------------------------------------------------------------------
// sql import
// ---------------------------------------------------------------------------
int HandleSqlImport(const CommandArgs& args, const AppConfig& base,
                    std::ostream& out, std::ostream& err) {
    const auto config = WithCommandFlags(base, args);
    OutputFormatter fmt(config.json_output, ResolveColor(config), out, err);

    if (args.positional.empty()) {
        return Fail(fmt, MakeUsageError(
            "Missing SQL file. Usage: querygraph sql import <file.sql>"));
    }
    auto file = ReadTextFile(args.positional[0]);
    if (file.IsErr()) {
        return Fail(fmt, file.Error());
    }

    auto imported = ImportSql(file.Value());
    if (imported.IsErr()) {
        return Fail(fmt, imported.Error());
    }
    const auto& result = imported.Value();

    if (fmt.IsJsonMode()) {
        nlohmann::json ctes = nlohmann::json::array();
        for (const auto& cte : result.ctes) {
            ctes.push_back({{"name", cte.name}, {"body", cte.body}});
        }
        fmt.PrintJson(nlohmann::json{{"ctes", ctes}, {"body", result.body}}.dump());
        return 0;
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto& cte : result.ctes) {
        rows.push_back({cte.name, FirstLine(cte.body)});
    }
    if (!rows.empty()) {
        fmt.PrintTable({"CTE", "Body"}, rows);
        out << "\n";
    }
    out << result.body << "\n";
    return 0;
}

// ---------------------------------------------------------------------------
// sql run
// ---------------------------------------------------------------------------
int HandleSqlRun(const CommandArgs& args, const AppConfig& base,
                 std::ostream& out, std::ostream& err) {
    const auto config = WithCommandFlags(base, args);
    OutputFormatter fmt(config.json_output, ResolveColor(config), out, err);

    auto session = LoadSessionArg(args, config,
                                  "querygraph sql run <session.yaml> [--mode=<mode>]");
    if (session.IsErr()) {
        return Fail(fmt, session.Error());
    }

    auto s = std::move(session).Value();
    EchoExecutor executor;
    auto result = s.Run(executor);
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }

    if (fmt.IsJsonMode()) {
        fmt.PrintJson(nlohmann::json{{"sql", s.Output().text},
                                     {"result", result.Value()}}.dump());
    } else {
        out << result.Value() << "\n";
    }
    return 0;
}

// ---------------------------------------------------------------------------
// graph show
// ---------------------------------------------------------------------------
int HandleGraphShow(const CommandArgs& args, const AppConfig& base,
                    std::ostream& out, std::ostream& err) {
    const auto config = WithCommandFlags(base, args);
    OutputFormatter fmt(config.json_output, ResolveColor(config), out, err);

    auto session = LoadSessionArg(args, config,
                                  "querygraph graph show <session.yaml>");
    if (session.IsErr()) {
        return Fail(fmt, session.Error());
    }
    auto s = std::move(session).Value();
    s.ValidateNow();

    if (fmt.IsJsonMode()) {
        fmt.PrintJson(SessionToJson(s).dump());
        return 0;
    }

    const auto& graph = s.Graph();

    std::vector<std::vector<std::string>> node_rows;
    for (const auto& n : graph.Nodes()) {
        node_rows.push_back({n.id,
                             NodeKindName(n.kind),
                             Join(n.columns),
                             Join(std::vector<std::string>(n.selected.begin(),
                                                           n.selected.end())),
                             graph.IsDmlTarget(n.id) ? "yes" : ""});
    }
    fmt.PrintTable({"Node", "Kind", "Columns", "Selected", "Target"}, node_rows);

    if (!graph.JoinEdges().empty()) {
        out << "\n";
        std::vector<std::vector<std::string>> join_rows;
        for (const auto& e : graph.JoinEdges()) {
            join_rows.push_back({std::to_string(e.id), e.node_a, e.node_b,
                                 ToSql(e.type), e.condition});
        }
        fmt.PrintTable({"Edge", "Left", "Right", "Type", "Condition"}, join_rows);
    }

    if (!graph.MappingEdges().empty()) {
        out << "\n";
        std::vector<std::vector<std::string>> mapping_rows;
        for (const auto& m : graph.MappingEdges()) {
            mapping_rows.push_back({std::to_string(m.id), m.source_ref, m.target_ref});
        }
        fmt.PrintTable({"Mapping", "Source", "Target"}, mapping_rows);
    }

    const auto& clauses = s.Clauses();
    DetailSection summary;
    summary.entries = {
        {"mode", ToSql(s.Mode())},
        {"where", std::to_string(clauses.Where().size())},
        {"group by", Join(clauses.GroupBy())},
        {"having", std::to_string(clauses.Having().size())},
        {"ctes", std::to_string(s.Ctes().Definitions().size())},
        {"validation", ValidationStatusName(s.Validation().status)},
    };
    DetailSection servers;
    servers.title = "linked servers";
    for (const auto& [alias, name] : s.LinkedServers()) {
        servers.entries.emplace_back(alias, name);
    }
    out << "\n";
    fmt.PrintDetail("Session", {summary, servers});
    return 0;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// EchoExecutor
// ---------------------------------------------------------------------------
Result<std::string, Error> EchoExecutor::Execute(std::string_view sql) {
    LogInfo("cli", "echo executor received " + std::to_string(sql.size()) + " bytes");
    return Result<std::string, Error>::Ok("Executing:\n\n" + std::string(sql));
}

SessionOptions SessionOptionsFromConfig(const AppConfig& config) {
    SessionOptions options;
    options.auto_generate = config.auto_generate;
    options.debounce = std::chrono::milliseconds(config.debounce_ms);
    options.mode = config.default_mode;
    options.linked_servers = config.linked_servers;
    return options;
}

bool ResolveColor(const AppConfig& config) {
    return !config.json_output && ColorEnabled(OutputStream::Stdout, config.color);
}

// ---------------------------------------------------------------------------
// RegisterAllCommands
// ---------------------------------------------------------------------------
void RegisterAllCommands(CommandRouter& router, const AppConfig& config,
                         std::ostream& out, std::ostream& err) {
    router.SetGroupDescription("sql", "Generate, validate, import and run SQL");
    router.SetGroupDescription("graph", "Inspect a query graph session");

    const FlagHelp mode_flag{"mode", "<select|insert|update|delete>",
                             "Override the session's operation mode"};

    auto bind = [&config, &out, &err](auto handler) -> CommandHandler {
        return [handler, config, &out, &err](const CommandArgs& args) {
            return handler(args, config, out, err);
        };
    };

    router.Register("sql", "generate", "Generate SQL from a session file",
                    bind(HandleSqlGenerate),
                    CommandHelp{"querygraph sql generate <session.yaml> [--mode=<mode>]",
                                "<session.yaml>  Session document (nodes, joins, clauses)",
                                {mode_flag},
                                {"$ querygraph sql generate orders.yaml",
                                 "$ querygraph --json sql generate orders.yaml --mode=insert"}});

    router.Register("sql", "validate", "Check SQL text for syntax errors",
                    bind(HandleSqlValidate),
                    CommandHelp{"querygraph sql validate <file.sql> | --text=<sql>",
                                "<file.sql>  File holding the statement",
                                {{"text", "<sql>", "Validate this text instead of a file"}},
                                {"$ querygraph sql validate report.sql",
                                 "$ querygraph sql validate --text=\"SELECT 1 FROM t\""}});

    router.Register("sql", "import", "Split an existing statement into CTEs and body",
                    bind(HandleSqlImport),
                    CommandHelp{"querygraph sql import <file.sql>",
                                "<file.sql>  Statement, optionally with a WITH list",
                                {},
                                {"$ querygraph sql import legacy.sql"}});

    router.Register("sql", "run", "Hand the generated SQL to the echo executor",
                    bind(HandleSqlRun),
                    CommandHelp{"querygraph sql run <session.yaml> [--mode=<mode>]",
                                "<session.yaml>  Session document",
                                {mode_flag},
                                {"$ querygraph sql run orders.yaml"}});

    router.Register("graph", "show", "Show nodes, edges and clause summary",
                    bind(HandleGraphShow),
                    CommandHelp{"querygraph graph show <session.yaml>",
                                "<session.yaml>  Session document",
                                {mode_flag},
                                {"$ querygraph graph show orders.yaml",
                                 "$ querygraph --json graph show orders.yaml"}});
}

} // namespace querygraph
