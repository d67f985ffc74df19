#pragma once

#include <querygraph/core/types.hpp>
#include <querygraph/graph/clause_state.hpp>
#include <querygraph/graph/graph_model.hpp>
#include <querygraph/sql/identifier_rewriter.hpp>

#include <string>

namespace querygraph {

// Generated statement text. `diagnostic` is set when the text is a single
// "-- ..." comment line explaining why no statement could be produced.
struct GeneratedSql {
    std::string text;
    bool diagnostic = false;
};

// Diagnostic comment lines emitted instead of a DML statement.
std::string EmptyTargetComment(OperationMode mode);
std::string NoMappingComment(OperationMode mode, const std::string& target);

// ---------------------------------------------------------------------------
// TranslateDml: INSERT / UPDATE / DELETE from the DML target, its mapping
// edges and the clause state.
//
// The sub-select reads the mapping source refs (edge order) from every
// non-target node, with WHERE/GROUP BY/HAVING/ORDER BY/LIMIT/OFFSET applied.
// The target table is the last two dot-separated parts of its node id. UPDATE
// and DELETE join on the literal column `id`.
//
// Never fails: a missing target or missing mappings yield a diagnostic.
// ---------------------------------------------------------------------------
[[nodiscard]] GeneratedSql TranslateDml(OperationMode mode,
                                        const GraphModel& graph,
                                        const ClauseState& clauses,
                                        const IdentifierRewriter& rewriter);

} // namespace querygraph
