#include <querygraph/cli/command_router.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>

namespace querygraph {

namespace {

bool HasJsonFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--json") return true;
    }
    return false;
}

// Routing failures go to `err`: one JSON object in JSON mode, otherwise the
// message followed by whatever help `print_help` writes.
template <typename HelpPrinter>
int RoutingError(bool json_mode, const std::string& message, std::ostream& err,
                 HelpPrinter print_help) {
    if (json_mode) {
        err << nlohmann::json{{"error", {{"message", message}}}}.dump() << "\n";
    } else {
        err << "Error: " << message << "\n";
        print_help(err);
    }
    return 1;
}

// Consumes one "--key", "--key=value" or "--key value" token starting at
// argv[i]; returns the index of the next unconsumed token.
int ConsumeLongFlag(int argc, const char* const* argv, int i,
                    std::map<std::string, std::string>& flags) {
    std::string_view arg{argv[i]};
    const auto eq = arg.find('=');
    if (eq != std::string_view::npos) {
        flags[std::string(arg.substr(2, eq - 2))] = std::string(arg.substr(eq + 1));
        return i + 1;
    }
    const auto key = std::string(arg.substr(2));
    if (!CommandRouter::IsBooleanFlag(arg) && i + 1 < argc &&
        std::string_view{argv[i + 1]}.substr(0, 1) != "-") {
        flags[key] = argv[i + 1];
        return i + 2;
    }
    flags[key] = "true";
    return i + 1;
}

} // anonymous namespace

bool CommandRouter::IsBooleanFlag(std::string_view arg) {
    return arg == "--json" || arg == "--color" || arg == "--no-color" ||
           arg == "--help" || arg == "--version" || arg == "--verbose" ||
           arg == "--quiet" || arg == "--no-auto-generate";
}

int CommandRouter::GroupIndex(int argc, const char* const* argv) {
    int i = 1;
    while (i < argc) {
        std::string_view arg{argv[i]};
        if (arg == "-v" || arg == "-vv" || arg == "-q" || arg == "-h") {
            ++i;
        } else if (arg == "-c") {
            i += 2;
        } else if (arg.substr(0, 2) == "--") {
            std::map<std::string, std::string> ignored;
            i = ConsumeLongFlag(argc, argv, i, ignored);
        } else {
            break;
        }
    }
    return std::min(i, argc);
}

void CommandRouter::Register(const std::string& group,
                             const std::string& action,
                             const std::string& description,
                             CommandHandler handler,
                             std::optional<CommandHelp> help) {
    groups_[group][action] =
        CommandInfo{group, action, description, std::move(handler), std::move(help)};
}

void CommandRouter::SetGroupDescription(const std::string& group,
                                        const std::string& description) {
    group_descriptions_[group] = description;
}

const CommandInfo* CommandRouter::Find(const std::string& group,
                                       const std::string& action) const {
    auto group_it = groups_.find(group);
    if (group_it == groups_.end()) {
        return nullptr;
    }
    auto it = group_it->second.find(action);
    return it == group_it->second.end() ? nullptr : &it->second;
}

int CommandRouter::Dispatch(int argc, const char* const* argv,
                            std::ostream& out, std::ostream& err) const {
    const bool json_mode = HasJsonFlag(argc, argv);
    const auto top_help = [this](std::ostream& os) { PrintHelp(os); };

    auto parsed = Parse(argc, argv);
    if (parsed.IsErr()) {
        return RoutingError(json_mode, parsed.Error(), err, top_help);
    }
    const auto args = std::move(parsed).Value();

    if (!HasGroup(args.group)) {
        return RoutingError(json_mode, "unknown command group '" + args.group + "'", err,
                            top_help);
    }
    const auto group_help = [this, &args](std::ostream& os) {
        PrintGroupHelp(args.group, os);
    };

    if (args.action == "help" || (args.action.empty() && args.flags.count("help") > 0)) {
        PrintGroupHelp(args.group, out);
        return 0;
    }
    if (args.action.empty()) {
        return RoutingError(json_mode,
                            "missing action for group '" + args.group +
                                "'. Usage: querygraph " + args.group + " <action> [args]",
                            err, group_help);
    }

    const auto* command = Find(args.group, args.action);
    if (command == nullptr) {
        return RoutingError(json_mode,
                            "unknown command '" + args.group + " " + args.action + "'",
                            err, group_help);
    }
    if (args.flags.count("help") > 0) {
        PrintCommandHelp(args.group, args.action, out);
        return 0;
    }
    return command->handler(args);
}

Result<CommandArgs, std::string> CommandRouter::Parse(int argc, const char* const* argv) {
    CommandArgs args;
    int i = GroupIndex(argc, argv);

    if (i >= argc) {
        return Result<CommandArgs, std::string>::Err(
            "Missing command group. Usage: querygraph [flags] <group> <action> [args]");
    }
    args.group = argv[i++];

    if (i < argc && std::string_view{argv[i]}.substr(0, 1) != "-") {
        args.action = argv[i++];
    }

    while (i < argc) {
        std::string_view arg{argv[i]};
        if (arg == "-h") {
            args.flags["help"] = "true";
            ++i;
        } else if (arg.substr(0, 2) == "--") {
            i = ConsumeLongFlag(argc, argv, i, args.flags);
        } else {
            args.positional.emplace_back(argv[i]);
            ++i;
        }
    }

    return Result<CommandArgs, std::string>::Ok(std::move(args));
}

std::vector<std::string> CommandRouter::Groups() const {
    std::vector<std::string> names;
    names.reserve(groups_.size());
    for (const auto& [group, actions] : groups_) {
        names.push_back(group);
    }
    return names;
}

bool CommandRouter::HasGroup(const std::string& group) const {
    return groups_.count(group) > 0;
}

std::vector<CommandInfo> CommandRouter::CommandsForGroup(const std::string& group) const {
    std::vector<CommandInfo> commands;
    auto it = groups_.find(group);
    if (it != groups_.end()) {
        for (const auto& [action, info] : it->second) {
            commands.push_back(info);
        }
    }
    return commands;
}

void CommandRouter::PrintHelp(std::ostream& out) const {
    out << "\nUsage: querygraph [flags] <group> <action> [args]\n\n";
    out << "Global flags:\n"
        << "  -c, --config <path>        YAML config file\n"
        << "  --json                     JSON output\n"
        << "  --color / --no-color       Force or disable colored output\n"
        << "  -v, -vv, -q                Info, debug or error-only logging\n"
        << "  --log-level <level>        debug, info, warn, error\n"
        << "  --log-file <path>          Append log lines to a file\n"
        << "  --mode <mode>              Default operation mode\n"
        << "  --linked-server A=NAME     Linked server mapping (repeatable)\n"
        << "  --debounce-ms <n>          Validation debounce (400-800)\n"
        << "  --no-auto-generate         Generate only on explicit request\n"
        << "  --version                  Print version\n";
    out << "\nCommands:\n";
    for (const auto& group : Groups()) {
        out << "\n  " << group << ":\n";
        for (const auto& cmd : CommandsForGroup(group)) {
            out << "    " << cmd.action;
            if (!cmd.description.empty()) {
                out << " - " << cmd.description;
            }
            out << "\n";
        }
    }
    out << "\n";
}

void CommandRouter::PrintGroupHelp(const std::string& group, std::ostream& out) const {
    auto desc_it = group_descriptions_.find(group);
    out << "querygraph " << group << " - "
        << (desc_it != group_descriptions_.end() ? desc_it->second : group) << "\n";

    out << "\nActions:\n";
    const auto cmds = CommandsForGroup(group);
    size_t max_len = 0;
    for (const auto& cmd : cmds) {
        max_len = std::max(max_len, cmd.action.size());
    }
    for (const auto& cmd : cmds) {
        out << "  " << cmd.action << std::string(max_len - cmd.action.size() + 6, ' ')
            << cmd.description << "\n";
    }
    out << "\nUse \"querygraph " << group
        << " <action> --help\" for details on a specific action.\n";
}

void CommandRouter::PrintCommandHelp(const std::string& group, const std::string& action,
                                     std::ostream& out) const {
    const auto* found = Find(group, action);
    if (found == nullptr) {
        out << "Error: unknown command '" << group << " " << action << "'\n";
        return;
    }

    const auto& cmd = *found;
    out << "querygraph " << group << " " << action << " - " << cmd.description << "\n";
    if (!cmd.help) {
        return;
    }

    const auto& help = *cmd.help;
    if (!help.usage.empty()) {
        out << "\nUsage:\n  " << help.usage << "\n";
    }
    if (!help.args_description.empty()) {
        out << "\nArguments:\n  " << help.args_description << "\n";
    }
    if (!help.flags.empty()) {
        out << "\nFlags:\n";
        std::vector<std::string> displays;
        size_t max_len = 0;
        for (const auto& f : help.flags) {
            auto display = "--" + f.name;
            if (!f.placeholder.empty()) {
                display += " " + f.placeholder;
            }
            max_len = std::max(max_len, display.size());
            displays.push_back(std::move(display));
        }
        for (size_t i = 0; i < help.flags.size(); ++i) {
            out << "  " << displays[i] << std::string(max_len - displays[i].size() + 4, ' ')
                << help.flags[i].description << "\n";
        }
    }
    if (!help.examples.empty()) {
        out << "\nExamples:\n";
        for (const auto& ex : help.examples) {
            out << "  " << ex << "\n";
        }
    }
}

} // namespace querygraph
