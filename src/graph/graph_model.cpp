#include <querygraph/graph/graph_model.hpp>

#include <querygraph/core/log.hpp>

#include <algorithm>

namespace querygraph {

namespace {

constexpr const char* kComponent = "graph";

Error MakeGraphError(const std::string& operation, const std::string& subject,
                     const std::string& message, ErrorCategory category) {
    return Error{operation, subject, message, category};
}

bool Contains(const std::vector<std::string>& columns, const std::string& column) {
    return std::find(columns.begin(), columns.end(), column) != columns.end();
}

// Rewrites "<old>.<col>" to "<new>.<col>"; other refs are returned unchanged.
std::string RenameRef(const std::string& ref, const std::string& old_id,
                      const std::string& new_id) {
    auto parsed = ColumnRef::Parse(ref);
    if (parsed.IsErr() || parsed.Value().NodeId() != old_id) {
        return ref;
    }
    return new_id + "." + parsed.Value().Column();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Nodes
// ---------------------------------------------------------------------------
const GraphNode* GraphModel::FindNode(const std::string& id) const {
    auto it = std::find_if(nodes_.begin(), nodes_.end(),
                           [&](const GraphNode& n) { return n.id == id; });
    return it == nodes_.end() ? nullptr : &*it;
}

GraphNode* GraphModel::FindMutableNode(const std::string& id) {
    auto it = std::find_if(nodes_.begin(), nodes_.end(),
                           [&](const GraphNode& n) { return n.id == id; });
    return it == nodes_.end() ? nullptr : &*it;
}

Result<void, Error> GraphModel::CheckNewNodeId(const std::string& operation,
                                               const std::string& id) const {
    if (id.empty()) {
        return Result<void, Error>::Err(MakeGraphError(
            operation, "", "Node id must not be empty", ErrorCategory::InvalidArgument));
    }
    if (HasNode(id)) {
        return Result<void, Error>::Err(MakeGraphError(
            operation, id, "A node with this id already exists",
            ErrorCategory::DuplicateNode));
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> GraphModel::AddNode(const std::string& id,
                                        std::vector<std::string> columns,
                                        NodeKind kind) {
    auto check = CheckNewNodeId("AddNode", id);
    if (check.IsErr()) {
        return check;
    }
    if (kind == NodeKind::Subquery) {
        return Result<void, Error>::Err(MakeGraphError(
            "AddNode", id, "Subquery nodes need a body, use AddSubqueryNode",
            ErrorCategory::InvalidArgument));
    }
    GraphNode node;
    node.id = id;
    node.kind = kind;
    node.columns = std::move(columns);
    nodes_.push_back(std::move(node));
    if (LogEnabled(LogLevel::Debug)) {
        LogDebug(kComponent, "added node " + id + " (" +
                             std::to_string(nodes_.back().columns.size()) + " columns)");
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> GraphModel::AddSubqueryNode(const std::string& alias,
                                                std::string body,
                                                std::vector<std::string> columns) {
    auto check = CheckNewNodeId("AddSubqueryNode", alias);
    if (check.IsErr()) {
        return check;
    }
    if (body.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Result<void, Error>::Err(MakeGraphError(
            "AddSubqueryNode", alias, "Subquery body must not be empty",
            ErrorCategory::InvalidArgument));
    }
    GraphNode node;
    node.id = alias;
    node.kind = NodeKind::Subquery;
    node.columns = std::move(columns);
    node.subquery_body = std::move(body);
    nodes_.push_back(std::move(node));
    LogDebug(kComponent, "added subquery node " + alias);
    return Result<void, Error>::Ok();
}

Result<void, Error> GraphModel::SetColumns(const std::string& id,
                                           std::vector<std::string> columns) {
    auto* node = FindMutableNode(id);
    if (node == nullptr) {
        return Result<void, Error>::Err(MakeGraphError(
            "SetColumns", id, "Node not found", ErrorCategory::NodeNotFound));
    }
    node->columns = std::move(columns);
    for (auto it = node->selected.begin(); it != node->selected.end();) {
        if (Contains(node->columns, *it)) {
            ++it;
        } else {
            it = node->selected.erase(it);
        }
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> GraphModel::SelectColumn(const std::string& id,
                                             const std::string& column) {
    auto* node = FindMutableNode(id);
    if (node == nullptr) {
        return Result<void, Error>::Err(MakeGraphError(
            "SelectColumn", id, "Node not found", ErrorCategory::NodeNotFound));
    }
    if (!Contains(node->columns, column)) {
        return Result<void, Error>::Err(MakeGraphError(
            "SelectColumn", id + "." + column, "Node has no such column",
            ErrorCategory::InvalidArgument));
    }
    node->selected.insert(column);
    return Result<void, Error>::Ok();
}

Result<void, Error> GraphModel::DeselectColumn(const std::string& id,
                                               const std::string& column) {
    auto* node = FindMutableNode(id);
    if (node == nullptr) {
        return Result<void, Error>::Err(MakeGraphError(
            "DeselectColumn", id, "Node not found", ErrorCategory::NodeNotFound));
    }
    node->selected.erase(column);
    return Result<void, Error>::Ok();
}

Result<void, Error> GraphModel::RemoveNode(const std::string& id) {
    auto it = std::find_if(nodes_.begin(), nodes_.end(),
                           [&](const GraphNode& n) { return n.id == id; });
    if (it == nodes_.end()) {
        return Result<void, Error>::Err(MakeGraphError(
            "RemoveNode", id, "Node not found", ErrorCategory::NodeNotFound));
    }
    nodes_.erase(it);

    const auto joins_before = joins_.size();
    joins_.erase(std::remove_if(joins_.begin(), joins_.end(),
                                [&](const JoinEdge& e) {
                                    return e.node_a == id || e.node_b == id;
                                }),
                 joins_.end());

    const auto mappings_before = mappings_.size();
    mappings_.erase(std::remove_if(mappings_.begin(), mappings_.end(),
                                   [&](const MappingEdge& m) {
                                       auto src = ColumnRef::Parse(m.source_ref);
                                       auto tgt = ColumnRef::Parse(m.target_ref);
                                       return (src.IsOk() && src.Value().NodeId() == id) ||
                                              (tgt.IsOk() && tgt.Value().NodeId() == id);
                                   }),
                    mappings_.end());

    if (IsDmlTarget(id)) {
        target_node_id_.reset();
    }
    LogDebug(kComponent, "removed node " + id + " with " +
                         std::to_string(joins_before - joins_.size()) + " join and " +
                         std::to_string(mappings_before - mappings_.size()) +
                         " mapping edges");
    return Result<void, Error>::Ok();
}

Result<void, Error> GraphModel::RenameNode(const std::string& old_id,
                                           const std::string& new_id) {
    auto* node = FindMutableNode(old_id);
    if (node == nullptr) {
        return Result<void, Error>::Err(MakeGraphError(
            "RenameNode", old_id, "Node not found", ErrorCategory::NodeNotFound));
    }
    if (old_id == new_id) {
        return Result<void, Error>::Ok();
    }
    auto check = CheckNewNodeId("RenameNode", new_id);
    if (check.IsErr()) {
        return check;
    }

    node->id = new_id;
    for (auto& edge : joins_) {
        if (edge.node_a == old_id) edge.node_a = new_id;
        if (edge.node_b == old_id) edge.node_b = new_id;
    }
    for (auto& mapping : mappings_) {
        mapping.source_ref = RenameRef(mapping.source_ref, old_id, new_id);
        mapping.target_ref = RenameRef(mapping.target_ref, old_id, new_id);
    }
    if (IsDmlTarget(old_id)) {
        target_node_id_ = new_id;
    }
    LogDebug(kComponent, "renamed node " + old_id + " to " + new_id);
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Join edges
// ---------------------------------------------------------------------------
Result<EdgeId, Error> GraphModel::AddJoinEdge(const std::string& node_a,
                                              const std::string& node_b,
                                              JoinType type,
                                              const std::string& condition) {
    for (const auto* id : {&node_a, &node_b}) {
        if (!HasNode(*id)) {
            return Result<EdgeId, Error>::Err(MakeGraphError(
                "AddJoinEdge", *id, "Join references a node that does not exist",
                ErrorCategory::NodeNotFound));
        }
    }
    if (node_a == node_b) {
        return Result<EdgeId, Error>::Err(MakeGraphError(
            "AddJoinEdge", node_a, "A node cannot be joined to itself",
            ErrorCategory::InvalidArgument));
    }
    if (condition.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Result<EdgeId, Error>::Err(MakeGraphError(
            "AddJoinEdge", node_a + " -> " + node_b, "Join condition must not be empty",
            ErrorCategory::InvalidArgument));
    }

    JoinEdge edge;
    edge.id = next_edge_id_++;
    edge.node_a = node_a;
    edge.node_b = node_b;
    edge.type = type;
    edge.condition = condition;
    joins_.push_back(std::move(edge));
    LogDebug(kComponent, ToSql(type) + " join " + node_a + " -> " + node_b);
    return Result<EdgeId, Error>::Ok(joins_.back().id);
}

Result<void, Error> GraphModel::RemoveJoinEdge(EdgeId id) {
    auto it = std::find_if(joins_.begin(), joins_.end(),
                           [&](const JoinEdge& e) { return e.id == id; });
    if (it == joins_.end()) {
        return Result<void, Error>::Err(MakeGraphError(
            "RemoveJoinEdge", std::to_string(id), "Join edge not found",
            ErrorCategory::InvalidArgument));
    }
    joins_.erase(it);
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// DML target and mappings
// ---------------------------------------------------------------------------
Result<void, Error> GraphModel::SetDmlTarget(const std::string& id) {
    if (!HasNode(id)) {
        return Result<void, Error>::Err(MakeGraphError(
            "SetDmlTarget", id, "Node not found", ErrorCategory::NodeNotFound));
    }
    if (IsDmlTarget(id)) {
        return Result<void, Error>::Ok();
    }
    if (target_node_id_.has_value()) {
        LogDebug(kComponent, "replacing DML target " + *target_node_id_ + " with " + id);
    }
    ClearDmlTarget();
    target_node_id_ = id;
    return Result<void, Error>::Ok();
}

void GraphModel::ClearDmlTarget() {
    target_node_id_.reset();
    mappings_.clear();
}

Result<EdgeId, Error> GraphModel::AddMappingEdge(const std::string& source_ref,
                                                 const std::string& target_ref) {
    const std::string subject = source_ref + " -> " + target_ref;
    if (!target_node_id_.has_value()) {
        return Result<EdgeId, Error>::Err(MakeGraphError(
            "AddMappingEdge", subject, "No DML target is set",
            ErrorCategory::InvalidMapping));
    }

    auto tgt = ColumnRef::Parse(target_ref);
    if (tgt.IsErr()) {
        return Result<EdgeId, Error>::Err(MakeGraphError(
            "AddMappingEdge", subject, tgt.Error(), ErrorCategory::InvalidMapping));
    }
    if (tgt.Value().NodeId() != *target_node_id_) {
        return Result<EdgeId, Error>::Err(MakeGraphError(
            "AddMappingEdge", subject,
            "Target side must reference the DML target '" + *target_node_id_ + "'",
            ErrorCategory::InvalidMapping));
    }
    const auto* target = FindNode(*target_node_id_);
    if (!target->columns.empty() && !Contains(target->columns, tgt.Value().Column())) {
        return Result<EdgeId, Error>::Err(MakeGraphError(
            "AddMappingEdge", subject, "DML target has no column '" +
                                       tgt.Value().Column() + "'",
            ErrorCategory::InvalidMapping));
    }

    auto src = ColumnRef::Parse(source_ref);
    if (src.IsErr()) {
        return Result<EdgeId, Error>::Err(MakeGraphError(
            "AddMappingEdge", subject, src.Error(), ErrorCategory::InvalidMapping));
    }
    const auto* source = FindNode(src.Value().NodeId());
    if (source == nullptr) {
        return Result<EdgeId, Error>::Err(MakeGraphError(
            "AddMappingEdge", src.Value().NodeId(),
            "Mapping source references a node that does not exist",
            ErrorCategory::NodeNotFound));
    }
    if (source->id == *target_node_id_) {
        return Result<EdgeId, Error>::Err(MakeGraphError(
            "AddMappingEdge", subject, "Mapping source must not be the DML target",
            ErrorCategory::InvalidMapping));
    }
    if (!source->columns.empty() && !Contains(source->columns, src.Value().Column())) {
        return Result<EdgeId, Error>::Err(MakeGraphError(
            "AddMappingEdge", subject, "Source node has no column '" +
                                       src.Value().Column() + "'",
            ErrorCategory::InvalidMapping));
    }

    MappingEdge mapping;
    mapping.id = next_edge_id_++;
    mapping.source_ref = source_ref;
    mapping.target_ref = target_ref;
    mappings_.push_back(std::move(mapping));
    LogDebug(kComponent, "mapped " + subject);
    return Result<EdgeId, Error>::Ok(mappings_.back().id);
}

Result<void, Error> GraphModel::RemoveMappingEdge(EdgeId id) {
    auto it = std::find_if(mappings_.begin(), mappings_.end(),
                           [&](const MappingEdge& m) { return m.id == id; });
    if (it == mappings_.end()) {
        return Result<void, Error>::Err(MakeGraphError(
            "RemoveMappingEdge", std::to_string(id), "Mapping edge not found",
            ErrorCategory::InvalidArgument));
    }
    mappings_.erase(it);
    return Result<void, Error>::Ok();
}

void GraphModel::Clear() {
    nodes_.clear();
    joins_.clear();
    mappings_.clear();
    target_node_id_.reset();
    LogDebug(kComponent, "graph cleared");
}

} // namespace querygraph
