#include <querygraph/sql/dml_translator.hpp>

#include <querygraph/core/log.hpp>
#include <querygraph/sql/clause_assembler.hpp>
#include <querygraph/sql/from_clause_builder.hpp>

#include <algorithm>
#include <vector>

namespace querygraph {

namespace {

constexpr const char* kJoinKey = "id";

// Column part of a "<node>.<column>" ref; the whole ref if it has no dot.
std::string ColumnOf(const std::string& ref) {
    auto parsed = ColumnRef::Parse(ref);
    if (parsed.IsErr()) {
        return ref;
    }
    return parsed.Value().Column();
}

std::string JoinList(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

// "<node>.id" for the node of the first mapping's source ref.
std::string SourceJoinKey(const GraphModel& graph) {
    const auto& first = graph.MappingEdges().front().source_ref;
    auto parsed = ColumnRef::Parse(first);
    const auto node = parsed.IsOk() ? parsed.Value().NodeId() : first;
    return node + "." + kJoinKey;
}

std::vector<std::string> MappedSourceRefs(const GraphModel& graph) {
    std::vector<std::string> refs;
    for (const auto& mapping : graph.MappingEdges()) {
        refs.push_back(mapping.source_ref);
    }
    return refs;
}

std::string BuildSubSelect(const GraphModel& graph, const ClauseState& clauses,
                           const IdentifierRewriter& rewriter, const std::string& target,
                           const std::vector<std::string>& items) {
    const auto from = BuildFromClause(graph, target);
    return AssembleSelect(items, rewriter.Rewrite(from.text).text, clauses);
}

} // anonymous namespace

std::string EmptyTargetComment(OperationMode mode) {
    return "-- EmptyTarget: no DML target node is marked, cannot generate " + ToSql(mode) + ".";
}

std::string NoMappingComment(OperationMode mode, const std::string& target) {
    return "-- NoMapping: no column mappings into " + target + ", cannot generate " +
           ToSql(mode) + ".";
}

GeneratedSql TranslateDml(OperationMode mode, const GraphModel& graph,
                          const ClauseState& clauses, const IdentifierRewriter& rewriter) {
    if (mode == OperationMode::Select) {
        return GeneratedSql{"-- SELECT mode has no DML translation.", true};
    }

    const auto& target = graph.DmlTarget();
    if (!target.has_value()) {
        LogInfo("dml", "No DML target for " + ToSql(mode));
        return GeneratedSql{EmptyTargetComment(mode), true};
    }
    if (graph.MappingEdges().empty()) {
        LogInfo("dml", "No mapping edges into " + *target);
        return GeneratedSql{NoMappingComment(mode, *target), true};
    }

    const auto table = TableReference(*target);

    switch (mode) {
        case OperationMode::Insert: {
            std::vector<std::string> columns;
            for (const auto& mapping : graph.MappingEdges()) {
                columns.push_back(ColumnOf(mapping.target_ref));
            }
            const auto sub_select =
                BuildSubSelect(graph, clauses, rewriter, *target, MappedSourceRefs(graph));
            return GeneratedSql{
                "INSERT INTO " + table + " (" + JoinList(columns, ", ") + ")\n" + sub_select,
                false};
        }
        case OperationMode::Update: {
            std::vector<std::string> sets;
            for (const auto& mapping : graph.MappingEdges()) {
                const auto target_column = ColumnOf(mapping.target_ref);
                if (target_column == kJoinKey) {
                    continue;
                }
                sets.push_back(target_column + "=src." + ColumnOf(mapping.source_ref));
            }
            if (sets.empty()) {
                LogInfo("dml", "Only the join key is mapped into " + *target);
                return GeneratedSql{
                    "-- NoMapping: only the id column is mapped into " + *target +
                        ", nothing to SET.",
                    true};
            }
            // src.id must resolve inside the derived table.
            auto items = MappedSourceRefs(graph);
            const auto key = SourceJoinKey(graph);
            if (std::find(items.begin(), items.end(), key) == items.end()) {
                items.push_back(key);
            }
            const auto sub_select = BuildSubSelect(graph, clauses, rewriter, *target, items);
            return GeneratedSql{"UPDATE " + table + "\nSET " + JoinList(sets, ", ") +
                                    "\nFROM (\n" + sub_select + "\n) AS src\nWHERE " + table +
                                    "." + kJoinKey + "=src." + kJoinKey,
                                false};
        }
        case OperationMode::Delete: {
            const auto sub_select =
                BuildSubSelect(graph, clauses, rewriter, *target, {SourceJoinKey(graph)});
            return GeneratedSql{"DELETE FROM " + table + "\nWHERE " + kJoinKey + " IN (\n" +
                                    sub_select + "\n)",
                                false};
        }
        case OperationMode::Select:
            break;
    }
    return GeneratedSql{"-- SELECT mode has no DML translation.", true};
}

} // namespace querygraph
