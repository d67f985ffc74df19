#include <querygraph/sql/clause_assembler.hpp>

namespace querygraph {

namespace {

std::string JoinList(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

} // anonymous namespace

OperatorFamily ClassifyOperator(const std::string& op) {
    const auto k = NormalizeKeyword(op);
    if (k == "IN" || k == "NOT IN") {
        return OperatorFamily::List;
    }
    if (k == "IS NULL" || k == "IS NOT NULL" || k == "EXISTS") {
        return OperatorFamily::Unary;
    }
    return OperatorFamily::Comparison;
}

std::string RenderPredicate(const Predicate& predicate) {
    const auto op = NormalizeKeyword(predicate.op);
    switch (ClassifyOperator(predicate.op)) {
        case OperatorFamily::List:
            return predicate.column + " " + op + " (" + predicate.value + ")";
        case OperatorFamily::Unary:
            return predicate.column + " " + op;
        case OperatorFamily::Comparison:
            break;
    }
    return predicate.column + " " + op + " '" + predicate.value + "'";
}

std::string RenderPredicates(const std::vector<Predicate>& predicates) {
    std::vector<std::string> parts;
    parts.reserve(predicates.size());
    for (const auto& p : predicates) {
        parts.push_back(RenderPredicate(p));
    }
    return JoinList(parts, " AND ");
}

std::vector<std::string> BuildSelectList(const GraphModel& graph, const ClauseState& clauses,
                                         const std::optional<std::string>& exclude) {
    std::vector<std::string> items;
    for (const auto& node : graph.Nodes()) {
        if (exclude.has_value() && *exclude == node.id) {
            continue;
        }
        for (const auto& column : node.columns) {
            if (node.selected.count(column) > 0) {
                items.push_back(node.id + "." + column);
            }
        }
    }
    for (const auto& derived : clauses.DerivedColumns()) {
        items.push_back(derived.expression + " AS " + derived.alias);
    }
    for (const auto& agg : clauses.Aggregates()) {
        items.push_back(ToSql(agg.function) + "(" + agg.column + ") AS " + agg.alias);
    }
    return items;
}

std::string AssembleSelect(const std::vector<std::string>& select_items,
                           const std::string& from_text,
                           const ClauseState& clauses) {
    std::vector<std::string> lines;
    lines.push_back("SELECT " + (select_items.empty() ? std::string("*")
                                                      : JoinList(select_items, ", ")));
    if (!from_text.empty()) {
        lines.push_back(from_text);
    }
    if (!clauses.Where().empty()) {
        lines.push_back("WHERE " + RenderPredicates(clauses.Where()));
    }
    if (!clauses.GroupBy().empty()) {
        lines.push_back("GROUP BY " + JoinList(clauses.GroupBy(), ", "));
    }
    if (!clauses.Having().empty()) {
        lines.push_back("HAVING " + RenderPredicates(clauses.Having()));
    }
    if (!clauses.OrderBy().empty()) {
        std::vector<std::string> terms;
        for (const auto& term : clauses.OrderBy()) {
            terms.push_back(term.column + " " + ToSql(term.direction));
        }
        lines.push_back("ORDER BY " + JoinList(terms, ", "));
    }
    if (clauses.Limit() > 0) {
        lines.push_back("LIMIT " + std::to_string(clauses.Limit()));
    }
    if (clauses.Offset() > 0) {
        lines.push_back("OFFSET " + std::to_string(clauses.Offset()));
    }
    return JoinList(lines, "\n");
}

std::string RenderCombineSuffix(const ClauseState& clauses) {
    const auto& combine = clauses.Combine();
    if (!combine.has_value()) {
        return "";
    }
    return "\n" + ToSql(combine->op) + "\n(\n" + combine->sql + "\n)";
}

} // namespace querygraph
