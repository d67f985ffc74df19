#include <querygraph/session/session_loader.hpp>

#include <querygraph/core/log.hpp>

#include <yaml-cpp/yaml.h>

#include <string>
#include <vector>

namespace querygraph {

namespace {

Error MakeLoadError(const std::string& subject, const std::string& message,
                    ErrorCategory category = ErrorCategory::Parse) {
    return Error{"LoadSession", subject, message, category};
}

// Tags an error from a mutation call with the document location it came
// from, keeping its category.
Result<void, Error> At(const std::string& where, const Error& error) {
    return Result<void, Error>::Err(error.Within(where));
}

std::string Where(const char* section, size_t index) {
    return std::string(section) + "[" + std::to_string(index) + "]";
}

std::string Str(const YAML::Node& node, const char* key, const std::string& fallback = "") {
    if (!node[key]) {
        return fallback;
    }
    return node[key].as<std::string>();
}

std::vector<std::string> StrList(const YAML::Node& node, const char* key) {
    std::vector<std::string> out;
    if (node[key]) {
        for (const auto& item : node[key]) {
            out.push_back(item.as<std::string>());
        }
    }
    return out;
}

// Converts a Parse* result for an enum into a located Parse error.
template <typename T>
Result<T, Error> Keyword(const std::string& where, Result<T, std::string> parsed) {
    if (parsed.IsErr()) {
        return Result<T, Error>::Err(MakeLoadError(where, parsed.Error()));
    }
    return Result<T, Error>::Ok(std::move(parsed).Value());
}

Result<void, Error> ApplyNodes(const YAML::Node& root, QuerySession& session) {
    if (!root["nodes"]) {
        return Result<void, Error>::Ok();
    }
    size_t i = 0;
    for (const auto& node : root["nodes"]) {
        const auto where = Where("nodes", i++);
        const auto id = Str(node, "id");

        auto kind = Keyword(where, ParseNodeKind(Str(node, "kind", "table")));
        if (kind.IsErr()) {
            return Result<void, Error>::Err(kind.Error());
        }

        auto added = kind.Value() == NodeKind::Subquery
                         ? session.AddSubqueryNode(id, Str(node, "body"), StrList(node, "columns"))
                         : session.AddNode(id, StrList(node, "columns"), kind.Value());
        if (added.IsErr()) {
            return At(where, added.Error());
        }

        for (const auto& column : StrList(node, "selected")) {
            auto selected = session.SelectColumn(id, column);
            if (selected.IsErr()) {
                return At(where, selected.Error());
            }
        }
        if (node["dml_target"] && node["dml_target"].as<bool>()) {
            auto marked = session.MarkDmlTarget(id);
            if (marked.IsErr()) {
                return At(where, marked.Error());
            }
        }
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> ApplyJoins(const YAML::Node& root, QuerySession& session) {
    if (!root["joins"]) {
        return Result<void, Error>::Ok();
    }
    size_t i = 0;
    for (const auto& join : root["joins"]) {
        const auto where = Where("joins", i++);
        auto type = Keyword(where, ParseJoinType(Str(join, "type", "inner")));
        if (type.IsErr()) {
            return Result<void, Error>::Err(type.Error());
        }
        auto added = session.AddJoinEdge(Str(join, "left"), Str(join, "right"), type.Value(),
                                         Str(join, "condition"));
        if (added.IsErr()) {
            return At(where, added.Error());
        }
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> ApplyMappings(const YAML::Node& root, QuerySession& session) {
    if (!root["mappings"]) {
        return Result<void, Error>::Ok();
    }
    size_t i = 0;
    for (const auto& mapping : root["mappings"]) {
        const auto where = Where("mappings", i++);
        auto added = session.AddMappingEdge(Str(mapping, "source"), Str(mapping, "target"));
        if (added.IsErr()) {
            return At(where, added.Error());
        }
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> ApplyPredicates(const YAML::Node& root, const char* section,
                                    PredicateClause clause, QuerySession& session) {
    if (!root[section]) {
        return Result<void, Error>::Ok();
    }
    size_t i = 0;
    for (const auto& p : root[section]) {
        const auto where = Where(section, i++);
        auto added = session.AddPredicate(clause, Str(p, "column"), Str(p, "op", "="),
                                          Str(p, "value"));
        if (added.IsErr()) {
            return At(where, added.Error());
        }
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> ApplyClauses(const YAML::Node& root, QuerySession& session) {
    auto result = ApplyPredicates(root, "where", PredicateClause::Where, session);
    if (result.IsErr()) return result;
    result = ApplyPredicates(root, "having", PredicateClause::Having, session);
    if (result.IsErr()) return result;

    for (const auto& column : StrList(root, "group_by")) {
        auto added = session.AddGroupBy(column);
        if (added.IsErr()) {
            return At("group_by", added.Error());
        }
    }

    if (root["aggregates"]) {
        size_t i = 0;
        for (const auto& agg : root["aggregates"]) {
            const auto where = Where("aggregates", i++);
            auto fn = Keyword(where, ParseAggregateFunction(Str(agg, "function")));
            if (fn.IsErr()) {
                return Result<void, Error>::Err(fn.Error());
            }
            auto added = session.AddAggregate(fn.Value(), Str(agg, "column"), Str(agg, "alias"));
            if (added.IsErr()) {
                return At(where, added.Error());
            }
        }
    }

    if (root["order_by"]) {
        size_t i = 0;
        for (const auto& term : root["order_by"]) {
            const auto where = Where("order_by", i++);
            auto dir = Keyword(where, ParseSortDirection(Str(term, "direction", "asc")));
            if (dir.IsErr()) {
                return Result<void, Error>::Err(dir.Error());
            }
            auto added = session.AddOrderBy(Str(term, "column"), dir.Value());
            if (added.IsErr()) {
                return At(where, added.Error());
            }
        }
    }

    if (root["limit"]) {
        auto set = session.SetLimit(root["limit"].as<int>());
        if (set.IsErr()) {
            return At("limit", set.Error());
        }
    }
    if (root["offset"]) {
        auto set = session.SetOffset(root["offset"].as<int>());
        if (set.IsErr()) {
            return At("offset", set.Error());
        }
    }

    if (root["derived_columns"]) {
        size_t i = 0;
        for (const auto& d : root["derived_columns"]) {
            const auto where = Where("derived_columns", i++);
            auto added = session.AddDerivedColumn(Str(d, "alias"), Str(d, "expression"));
            if (added.IsErr()) {
                return At(where, added.Error());
            }
        }
    }

    if (root["window_functions"]) {
        size_t i = 0;
        for (const auto& w : root["window_functions"]) {
            const auto where = Where("window_functions", i++);
            auto fn = Keyword(where, ParseWindowFunction(Str(w, "function")));
            if (fn.IsErr()) {
                return Result<void, Error>::Err(fn.Error());
            }
            WindowFunctionSpec spec;
            spec.function = fn.Value();
            spec.partition_by = StrList(w, "partition_by");
            spec.order_by = StrList(w, "order_by");
            spec.descending = w["descending"] && w["descending"].as<bool>();
            spec.alias = Str(w, "alias");
            auto added = session.AddWindowFunction(spec);
            if (added.IsErr()) {
                return At(where, added.Error());
            }
        }
    }

    if (root["combine"]) {
        const auto& combine = root["combine"];
        auto op = Keyword("combine", ParseCombineOperator(Str(combine, "op", "union")));
        if (op.IsErr()) {
            return Result<void, Error>::Err(op.Error());
        }
        auto set = session.SetCombineQuery(op.Value(), Str(combine, "sql"));
        if (set.IsErr()) {
            return At("combine", set.Error());
        }
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> ApplyCtes(const YAML::Node& root, QuerySession& session) {
    if (!root["ctes"]) {
        return Result<void, Error>::Ok();
    }
    size_t i = 0;
    for (const auto& cte : root["ctes"]) {
        const auto where = Where("ctes", i++);
        auto added = session.AddCte(Str(cte, "name"), Str(cte, "body"));
        if (added.IsErr()) {
            return At(where, added.Error());
        }
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> ApplyDocument(const YAML::Node& root, QuerySession& session) {
    if (!root.IsMap()) {
        return Result<void, Error>::Err(
            MakeLoadError("", "Session document must be a YAML mapping"));
    }

    if (root["mode"]) {
        auto mode = Keyword("mode", ParseOperationMode(root["mode"].as<std::string>()));
        if (mode.IsErr()) {
            return Result<void, Error>::Err(mode.Error());
        }
        session.SetOperationMode(mode.Value());
    }

    if (root["linked_servers"]) {
        LinkedServerMap servers;
        for (const auto& entry : root["linked_servers"]) {
            servers[entry.first.as<std::string>()] = entry.second.as<std::string>();
        }
        auto set = session.SetLinkedServerMap(std::move(servers));
        if (set.IsErr()) {
            return At("linked_servers", set.Error());
        }
    }

    auto result = ApplyNodes(root, session);
    if (result.IsErr()) return result;
    result = ApplyJoins(root, session);
    if (result.IsErr()) return result;
    result = ApplyMappings(root, session);
    if (result.IsErr()) return result;
    result = ApplyClauses(root, session);
    if (result.IsErr()) return result;
    return ApplyCtes(root, session);
}

Result<void, Error> LoadInto(const YAML::Node& root, QuerySession& session) {
    QuerySession staged = session;
    staged.SetAutoGenerate(false);
    staged.Reset();

    Result<void, Error> applied = Result<void, Error>::Ok();
    try {
        applied = ApplyDocument(root, staged);
    } catch (const YAML::Exception& e) {
        applied = Result<void, Error>::Err(
            MakeLoadError("", "Malformed session document: " + std::string(e.what())));
    }
    if (applied.IsErr()) {
        LogWarn("session", applied.Error().ToString());
        return applied;
    }

    bool auto_generate = session.AutoGenerate();
    if (root["auto_generate"]) {
        try {
            auto_generate = root["auto_generate"].as<bool>();
        } catch (const YAML::Exception& e) {
            return Result<void, Error>::Err(
                MakeLoadError("auto_generate", "Expected true or false: " + std::string(e.what())));
        }
    }
    staged.SetAutoGenerate(auto_generate);
    staged.Regenerate();

    session = std::move(staged);
    LogInfo("session", "Loaded session with " + std::to_string(session.Graph().Nodes().size()) +
                           " node(s)");
    return Result<void, Error>::Ok();
}

} // anonymous namespace

Result<void, Error> LoadSessionFromString(std::string_view yaml_text, QuerySession& session) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml_text));
    } catch (const YAML::Exception& e) {
        return Result<void, Error>::Err(
            MakeLoadError("", "Failed to parse YAML: " + std::string(e.what())));
    }
    return LoadInto(root, session);
}

Result<void, Error> LoadSessionFromFile(std::string_view file_path, QuerySession& session) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::BadFile&) {
        return Result<void, Error>::Err(MakeLoadError(
            std::string(file_path), "Cannot open session file", ErrorCategory::Io));
    } catch (const YAML::Exception& e) {
        return Result<void, Error>::Err(MakeLoadError(
            std::string(file_path), "Failed to parse YAML: " + std::string(e.what())));
    }
    return LoadInto(root, session);
}

} // namespace querygraph
