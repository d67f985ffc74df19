#pragma once

#include <querygraph/cli/command_router.hpp>
#include <querygraph/config/app_config.hpp>
#include <querygraph/session/i_sql_executor.hpp>
#include <querygraph/session/query_session.hpp>

#include <iosfwd>
#include <string>

namespace querygraph {

// ---------------------------------------------------------------------------
// EchoExecutor: stand-in executor for `sql run`. Does not touch a database;
// the returned text is "Executing:\n\n<sql>".
// ---------------------------------------------------------------------------
class EchoExecutor final : public ISqlExecutor {
public:
    EchoExecutor() = default;

    Result<std::string, Error> Execute(std::string_view sql) override;
};

// Session options derived from the merged application config.
[[nodiscard]] SessionOptions SessionOptionsFromConfig(const AppConfig& config);

// Resolve whether human-readable output should use ANSI color: JSON mode and
// NO_COLOR disable it, an explicit --color/--no-color wins, otherwise stdout
// must be a terminal.
[[nodiscard]] bool ResolveColor(const AppConfig& config);

// Register the `sql` and `graph` command groups. Handlers read their
// defaults from `config` and write to `out` / `err`.
void RegisterAllCommands(CommandRouter& router, const AppConfig& config,
                         std::ostream& out, std::ostream& err);

} // namespace querygraph
