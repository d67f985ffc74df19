#pragma once

#include <querygraph/graph/graph_model.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace querygraph {

struct FromClause {
    std::string text;                     // "FROM A\nINNER JOIN B ON ..." (may be empty)
    std::vector<std::string> visit_order; // node ids in BFS visit order
    std::size_t join_count = 0;
    std::size_t component_count = 0;
};

// ---------------------------------------------------------------------------
// BuildFromClause: linearize the join graph into FROM/JOIN text.
//
// The join graph is treated as undirected. Roots are taken in node insertion
// order; from each unvisited root a FIFO breadth-first walk emits one
// "<TYPE> JOIN <node> ON <condition>" line per edge that discovers a new node,
// trying incident edges in edge insertion order. Edges that close a cycle emit
// nothing. Each connected component yields its own "FROM" block; blocks are
// separated by a newline and not combined any further.
//
// `exclude` removes one node (and its incident edges) from the walk; the DML
// translator uses it to keep the target out of the sub-select.
// ---------------------------------------------------------------------------
[[nodiscard]] FromClause BuildFromClause(const GraphModel& graph,
                                         const std::optional<std::string>& exclude = std::nullopt);

// How a node is spelled in FROM/JOIN text.
[[nodiscard]] std::string RenderFromItem(const GraphNode& node);

} // namespace querygraph
