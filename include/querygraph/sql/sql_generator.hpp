#pragma once

#include <querygraph/core/types.hpp>
#include <querygraph/graph/clause_state.hpp>
#include <querygraph/graph/graph_model.hpp>
#include <querygraph/sql/cte_inliner.hpp>
#include <querygraph/sql/dml_translator.hpp>
#include <querygraph/sql/identifier_rewriter.hpp>

#include <string>

namespace querygraph {

inline constexpr const char* kEmptyCanvasComment =
    "-- No tables selected on canvas => no SELECT.";

// Everything one generation pass reads. Nothing here is modified.
struct GenerationInput {
    const GraphModel& graph;
    const ClauseState& clauses;
    const CteInliner& ctes;
    const IdentifierRewriter& rewriter;
    OperationMode mode = OperationMode::Select;
    // Non-CTE body of an imported statement, used as the main statement
    // while the canvas is empty.
    const std::string& imported_body;
};

// ---------------------------------------------------------------------------
// GenerateSql: one full, non-incremental generation pass.
//
// SELECT: FROM/JOIN text (rewritten for linked servers), clause lines, then
// the combine query. DML: TranslateDml. The WITH prefix is added to every
// statement but never to a diagnostic comment.
// ---------------------------------------------------------------------------
[[nodiscard]] GeneratedSql GenerateSql(const GenerationInput& input);

} // namespace querygraph
