#include <querygraph/sql/from_clause_builder.hpp>

#include <querygraph/core/log.hpp>

#include <deque>
#include <map>
#include <set>
#include <utility>

namespace querygraph {

namespace {

struct Incidence {
    const JoinEdge* edge;
    std::string neighbor;
};

} // anonymous namespace

std::string RenderFromItem(const GraphNode& node) {
    if (node.kind == NodeKind::Subquery) {
        return "(\n" + node.subquery_body + "\n) AS " + node.id;
    }
    return node.id;
}

FromClause BuildFromClause(const GraphModel& graph,
                           const std::optional<std::string>& exclude) {
    auto is_excluded = [&](const std::string& id) {
        return exclude.has_value() && *exclude == id;
    };

    // Edge lists are appended in edge insertion order, which is the
    // tie-break when several edges leave the same node.
    std::map<std::string, std::vector<Incidence>> adjacency;
    for (const auto& edge : graph.JoinEdges()) {
        if (is_excluded(edge.node_a) || is_excluded(edge.node_b)) {
            continue;
        }
        adjacency[edge.node_a].push_back(Incidence{&edge, edge.node_b});
        adjacency[edge.node_b].push_back(Incidence{&edge, edge.node_a});
    }

    FromClause result;
    std::set<std::string> visited;
    std::vector<std::string> blocks;

    for (const auto& root : graph.Nodes()) {
        if (is_excluded(root.id) || visited.count(root.id) > 0) {
            continue;
        }

        std::string block = "FROM " + RenderFromItem(root);
        visited.insert(root.id);
        result.visit_order.push_back(root.id);

        std::deque<std::string> queue;
        queue.push_back(root.id);
        while (!queue.empty()) {
            const auto current = std::move(queue.front());
            queue.pop_front();

            auto it = adjacency.find(current);
            if (it == adjacency.end()) {
                continue;
            }
            for (const auto& inc : it->second) {
                if (visited.count(inc.neighbor) > 0) {
                    continue;
                }
                const auto* neighbor = graph.FindNode(inc.neighbor);
                if (neighbor == nullptr) {
                    continue;
                }
                visited.insert(inc.neighbor);
                result.visit_order.push_back(inc.neighbor);
                block += "\n" + ToSql(inc.edge->type) + " JOIN " + RenderFromItem(*neighbor) +
                         " ON " + inc.edge->condition;
                ++result.join_count;
                queue.push_back(inc.neighbor);
            }
        }
        blocks.push_back(std::move(block));
    }

    for (size_t i = 0; i < blocks.size(); ++i) {
        if (i > 0) result.text += "\n";
        result.text += blocks[i];
    }
    result.component_count = blocks.size();

    if (result.component_count > 1) {
        LogDebug("from", "Join graph has " + std::to_string(result.component_count) +
                             " disconnected components");
    }
    return result;
}

} // namespace querygraph
