#pragma once

#include <querygraph/core/result.hpp>
#include <querygraph/core/types.hpp>

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace querygraph {

using EdgeId = std::uint64_t;

// ---------------------------------------------------------------------------
// GraphNode: a data source on the canvas.
//
// `columns` may be empty while schema discovery is still running; it is
// replaced later via GraphModel::SetColumns. `selected` is always a subset of
// `columns` once columns are known.
// ---------------------------------------------------------------------------
struct GraphNode {
    std::string id;
    NodeKind kind = NodeKind::Table;
    std::vector<std::string> columns;
    std::set<std::string> selected;
    std::string subquery_body;  // NodeKind::Subquery only
};

struct JoinEdge {
    EdgeId id = 0;
    std::string node_a;
    std::string node_b;
    JoinType type = JoinType::Inner;
    std::string condition;
};

// Source column -> target column, meaningful only in DML mode.
struct MappingEdge {
    EdgeId id = 0;
    std::string source_ref;
    std::string target_ref;
};

// ---------------------------------------------------------------------------
// GraphModel: arena owning all nodes and edges of one editing session.
//
// Edges refer to nodes by id, never by pointer, so removing a node is a
// filter over the edge lists. Nodes and edges keep insertion order, which the
// FROM builder relies on for deterministic output.
//
// Every mutating call either succeeds completely or returns an Error and
// leaves the model untouched.
// ---------------------------------------------------------------------------
class GraphModel {
public:
    GraphModel() = default;

    // -- Nodes --------------------------------------------------------------

    // Table or CTE node; NodeKind::Subquery is rejected (see AddSubqueryNode).
    [[nodiscard]] Result<void, Error> AddNode(const std::string& id,
                                              std::vector<std::string> columns,
                                              NodeKind kind = NodeKind::Table);

    // A subquery node renders as "(<body>) AS <alias>" in the FROM clause.
    [[nodiscard]] Result<void, Error> AddSubqueryNode(const std::string& alias,
                                                      std::string body,
                                                      std::vector<std::string> columns = {});

    // Replace the column list of a node (schema discovery finished).
    // Selections that no longer name a column are dropped.
    [[nodiscard]] Result<void, Error> SetColumns(const std::string& id,
                                                 std::vector<std::string> columns);

    [[nodiscard]] Result<void, Error> SelectColumn(const std::string& id,
                                                   const std::string& column);
    [[nodiscard]] Result<void, Error> DeselectColumn(const std::string& id,
                                                     const std::string& column);

    // Removes the node and every join/mapping edge that references it.
    [[nodiscard]] Result<void, Error> RemoveNode(const std::string& id);

    // Alias management: renames a node and rewrites edge endpoints and
    // mapping references. Join condition text is not touched.
    [[nodiscard]] Result<void, Error> RenameNode(const std::string& old_id,
                                                 const std::string& new_id);

    // -- Join edges ---------------------------------------------------------

    [[nodiscard]] Result<EdgeId, Error> AddJoinEdge(const std::string& node_a,
                                                    const std::string& node_b,
                                                    JoinType type,
                                                    const std::string& condition);
    [[nodiscard]] Result<void, Error> RemoveJoinEdge(EdgeId id);

    // -- DML target and mappings --------------------------------------------

    // Clears any previous target (and its mappings) before setting the new
    // one, so at most one node is ever the target.
    [[nodiscard]] Result<void, Error> SetDmlTarget(const std::string& id);
    void ClearDmlTarget();

    [[nodiscard]] Result<EdgeId, Error> AddMappingEdge(const std::string& source_ref,
                                                       const std::string& target_ref);
    [[nodiscard]] Result<void, Error> RemoveMappingEdge(EdgeId id);

    // Drops all nodes, edges and the target.
    void Clear();

    // -- Queries ------------------------------------------------------------

    [[nodiscard]] const std::vector<GraphNode>& Nodes() const noexcept { return nodes_; }
    [[nodiscard]] const std::vector<JoinEdge>& JoinEdges() const noexcept { return joins_; }
    [[nodiscard]] const std::vector<MappingEdge>& MappingEdges() const noexcept { return mappings_; }
    [[nodiscard]] const std::optional<std::string>& DmlTarget() const noexcept { return target_node_id_; }

    [[nodiscard]] const GraphNode* FindNode(const std::string& id) const;
    [[nodiscard]] bool HasNode(const std::string& id) const { return FindNode(id) != nullptr; }
    [[nodiscard]] bool IsDmlTarget(const std::string& id) const {
        return target_node_id_.has_value() && *target_node_id_ == id;
    }
    [[nodiscard]] bool Empty() const noexcept { return nodes_.empty(); }

private:
    GraphNode* FindMutableNode(const std::string& id);
    Result<void, Error> CheckNewNodeId(const std::string& operation,
                                       const std::string& id) const;

    std::vector<GraphNode> nodes_;
    std::vector<JoinEdge> joins_;
    std::vector<MappingEdge> mappings_;
    std::optional<std::string> target_node_id_;
    EdgeId next_edge_id_ = 1;
};

} // namespace querygraph
