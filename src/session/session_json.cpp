#include <querygraph/session/session_json.hpp>

namespace querygraph {

namespace {

nlohmann::json PredicatesToJson(const std::vector<Predicate>& predicates) {
    auto arr = nlohmann::json::array();
    for (const auto& p : predicates) {
        arr.push_back({{"column", p.column}, {"op", p.op}, {"value", p.value}});
    }
    return arr;
}

nlohmann::json GraphToJson(const GraphModel& graph) {
    auto nodes = nlohmann::json::array();
    for (const auto& n : graph.Nodes()) {
        nlohmann::json node = {
            {"id", n.id},
            {"kind", NodeKindName(n.kind)},
            {"columns", n.columns},
            {"selected", std::vector<std::string>(n.selected.begin(), n.selected.end())},
            {"dml_target", graph.IsDmlTarget(n.id)},
        };
        if (n.kind == NodeKind::Subquery) {
            node["body"] = n.subquery_body;
        }
        nodes.push_back(std::move(node));
    }

    auto joins = nlohmann::json::array();
    for (const auto& e : graph.JoinEdges()) {
        joins.push_back({{"id", e.id},
                         {"left", e.node_a},
                         {"right", e.node_b},
                         {"type", ToSql(e.type)},
                         {"condition", e.condition}});
    }

    auto mappings = nlohmann::json::array();
    for (const auto& m : graph.MappingEdges()) {
        mappings.push_back({{"id", m.id}, {"source", m.source_ref}, {"target", m.target_ref}});
    }

    return {{"nodes", nodes}, {"joins", joins}, {"mappings", mappings}};
}

nlohmann::json ClausesToJson(const ClauseState& clauses) {
    auto aggregates = nlohmann::json::array();
    for (const auto& a : clauses.Aggregates()) {
        aggregates.push_back(
            {{"function", ToSql(a.function)}, {"column", a.column}, {"alias", a.alias}});
    }
    auto order_by = nlohmann::json::array();
    for (const auto& o : clauses.OrderBy()) {
        order_by.push_back({{"column", o.column}, {"direction", ToSql(o.direction)}});
    }
    auto derived = nlohmann::json::array();
    for (const auto& d : clauses.DerivedColumns()) {
        derived.push_back({{"alias", d.alias}, {"expression", d.expression}});
    }

    nlohmann::json j = {
        {"where", PredicatesToJson(clauses.Where())},
        {"having", PredicatesToJson(clauses.Having())},
        {"group_by", clauses.GroupBy()},
        {"aggregates", aggregates},
        {"order_by", order_by},
        {"limit", clauses.Limit()},
        {"offset", clauses.Offset()},
        {"derived_columns", derived},
    };
    if (clauses.Combine()) {
        j["combine"] = {{"op", ToSql(clauses.Combine()->op)}, {"sql", clauses.Combine()->sql}};
    }
    return j;
}

} // anonymous namespace

nlohmann::json ValidationToJson(const ValidationResult& validation) {
    return {{"status", ValidationStatusName(validation.status)},
            {"message", validation.message}};
}

nlohmann::json SessionToJson(const QuerySession& session) {
    auto ctes = nlohmann::json::array();
    for (const auto& c : session.Ctes().Definitions()) {
        ctes.push_back({{"name", c.name}, {"body", c.body}});
    }

    nlohmann::json j = {
        {"mode", ToSql(session.Mode())},
        {"auto_generate", session.AutoGenerate()},
        {"linked_servers", session.LinkedServers()},
        {"graph", GraphToJson(session.Graph())},
        {"clauses", ClausesToJson(session.Clauses())},
        {"ctes", ctes},
        {"sql", {{"text", session.Output().text}, {"diagnostic", session.Output().diagnostic}}},
        {"validation", ValidationToJson(session.Validation())},
    };
    if (!session.ImportedBody().empty()) {
        j["imported_body"] = session.ImportedBody();
    }
    return j;
}

} // namespace querygraph
