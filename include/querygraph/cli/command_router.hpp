#pragma once

#include <querygraph/core/result.hpp>

#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace querygraph {

// ---------------------------------------------------------------------------
// CommandArgs: parsed command-line arguments for a specific command.
// ---------------------------------------------------------------------------
struct CommandArgs {
    std::string group;                        // e.g. "sql", "graph"
    std::string action;                       // e.g. "generate", "show"
    std::vector<std::string> positional;      // remaining positional arguments
    std::map<std::string, std::string> flags; // --key=value pairs
};

// Returns 0 on success, non-zero exit code on failure.
using CommandHandler = std::function<int(const CommandArgs& args)>;

struct FlagHelp {
    std::string name;        // e.g. "mode"
    std::string placeholder; // e.g. "<select|insert|update|delete>"
    std::string description;
};

struct CommandHelp {
    std::string usage;            // e.g. "querygraph sql generate <session.yaml>"
    std::string args_description;
    std::vector<FlagHelp> flags;
    std::vector<std::string> examples;
};

struct CommandInfo {
    std::string group;
    std::string action;
    std::string description;
    CommandHandler handler;
    std::optional<CommandHelp> help;
};

// ---------------------------------------------------------------------------
// CommandRouter: two-level dispatch for CLI commands.
//
// Commands are registered as group/action pairs. Global flags in front of
// the group are skipped (they belong to the config loader); flags after the
// action land in CommandArgs::flags.
//
// Usage:
//   CommandRouter router;
//   router.Register("sql", "generate", "Generate SQL", handler);
//   return router.Dispatch(argc, argv);
// ---------------------------------------------------------------------------
class CommandRouter {
public:
    CommandRouter() = default;

    void Register(const std::string& group,
                  const std::string& action,
                  const std::string& description,
                  CommandHandler handler,
                  std::optional<CommandHelp> help = std::nullopt);

    void SetGroupDescription(const std::string& group, const std::string& description);

    // Parse argv and dispatch to the matching handler.
    // Returns the handler's exit code, or 1 on a routing error.
    // Intercepts --help at group and command level.
    int Dispatch(int argc, const char* const* argv,
                 std::ostream& out, std::ostream& err) const;

    // Parse argv into CommandArgs without dispatching.
    static Result<CommandArgs, std::string> Parse(int argc, const char* const* argv);

    // True for flags that never take a value (--json, --color, --quiet, ...).
    static bool IsBooleanFlag(std::string_view arg);

    // Index of the command group in argv (first token that is neither a
    // global flag nor a global flag's value); argc when there is none.
    static int GroupIndex(int argc, const char* const* argv);

    [[nodiscard]] std::vector<std::string> Groups() const;
    [[nodiscard]] bool HasGroup(const std::string& group) const;
    [[nodiscard]] std::vector<CommandInfo> CommandsForGroup(const std::string& group) const;

    void PrintHelp(std::ostream& out) const;
    void PrintGroupHelp(const std::string& group, std::ostream& out) const;
    void PrintCommandHelp(const std::string& group, const std::string& action,
                          std::ostream& out) const;

private:
    [[nodiscard]] const CommandInfo* Find(const std::string& group,
                                          const std::string& action) const;

    // group -> action -> command; both levels sorted by name.
    std::map<std::string, std::map<std::string, CommandInfo>> groups_;
    std::map<std::string, std::string> group_descriptions_;
};

} // namespace querygraph
