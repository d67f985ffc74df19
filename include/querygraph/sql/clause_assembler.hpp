#pragma once

#include <querygraph/graph/clause_state.hpp>
#include <querygraph/graph/graph_model.hpp>

#include <optional>
#include <string>
#include <vector>

namespace querygraph {

// How a predicate operator decides the shape of its right-hand side.
enum class OperatorFamily {
    Comparison, // col op 'value'   (=, <, >, <=, >=, <>, LIKE and anything unknown)
    List,       // col op (value)   (IN, NOT IN)
    Unary,      // col op           (IS NULL, IS NOT NULL, EXISTS)
};

[[nodiscard]] OperatorFamily ClassifyOperator(const std::string& op);

// "status IN ('A','B')", "name = 'x'", "deleted_at IS NULL".
// List values are inserted verbatim, never re-split or re-quoted.
[[nodiscard]] std::string RenderPredicate(const Predicate& predicate);

// Predicates joined with " AND "; empty string for an empty list.
[[nodiscard]] std::string RenderPredicates(const std::vector<Predicate>& predicates);

// Selected columns as "<node>.<column>" (node order, then column order),
// derived columns as "<expr> AS <alias>", aggregates as "FUNC(col) AS alias".
[[nodiscard]] std::vector<std::string> BuildSelectList(
    const GraphModel& graph, const ClauseState& clauses,
    const std::optional<std::string>& exclude = std::nullopt);

// ---------------------------------------------------------------------------
// AssembleSelect: lay out one SELECT statement, one clause per line:
//   SELECT, FROM block, WHERE, GROUP BY, HAVING, ORDER BY, LIMIT, OFFSET.
// An empty select list renders as "*". LIMIT and OFFSET appear only when
// greater than zero. The combine query is not applied here.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string AssembleSelect(const std::vector<std::string>& select_items,
                                         const std::string& from_text,
                                         const ClauseState& clauses);

// "\nUNION ALL\n(\n<sql>\n)" or an empty string when no combine query is set.
[[nodiscard]] std::string RenderCombineSuffix(const ClauseState& clauses);

} // namespace querygraph
