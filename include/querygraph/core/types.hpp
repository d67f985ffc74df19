#pragma once

#include <querygraph/core/result.hpp>

#include <string>
#include <string_view>

namespace querygraph {

// ---------------------------------------------------------------------------
// Closed vocabularies of the query graph. Each has a Parse* function that
// accepts the spelling a user would type (case-insensitive) and a ToSql /
// *Name function that yields the canonical SQL spelling.
// ---------------------------------------------------------------------------

enum class NodeKind {
    Table,
    Cte,
    Subquery,
};

enum class JoinType {
    Inner,
    Left,
    Right,
    Full,
};

enum class OperationMode {
    Select,
    Insert,
    Update,
    Delete,
};

enum class PredicateClause {
    Where,
    Having,
};

enum class AggregateFunction {
    Count,
    Sum,
    Avg,
    Min,
    Max,
};

enum class SortDirection {
    Asc,
    Desc,
};

enum class WindowFunction {
    RowNumber,
    Rank,
    DenseRank,
    Ntile,
    Lag,
    Lead,
};

enum class CombineOperator {
    Union,
    UnionAll,
    Intersect,
    Except,
};

// Accepts "table", "cte", "subquery".
Result<NodeKind, std::string> ParseNodeKind(std::string_view text);
std::string NodeKindName(NodeKind kind);

// Accepts "INNER", "left", "RIGHT JOIN", "FULL OUTER JOIN", ...
Result<JoinType, std::string> ParseJoinType(std::string_view text);
std::string ToSql(JoinType type);

// Accepts "select", "INSERT", "update", "delete".
Result<OperationMode, std::string> ParseOperationMode(std::string_view text);
std::string ToSql(OperationMode mode);

// Accepts "where", "HAVING".
Result<PredicateClause, std::string> ParsePredicateClause(std::string_view text);
std::string ToSql(PredicateClause clause);

Result<AggregateFunction, std::string> ParseAggregateFunction(std::string_view text);
std::string ToSql(AggregateFunction fn);

// Accepts "ASC", "desc", "ascending", "descending".
Result<SortDirection, std::string> ParseSortDirection(std::string_view text);
std::string ToSql(SortDirection dir);

// Accepts "ROW_NUMBER", "rank", "DENSE_RANK", ...
Result<WindowFunction, std::string> ParseWindowFunction(std::string_view text);
std::string ToSql(WindowFunction fn);

// Accepts "UNION", "union all", "INTERSECT", "EXCEPT".
Result<CombineOperator, std::string> ParseCombineOperator(std::string_view text);
std::string ToSql(CombineOperator op);

// Upper-cases ASCII letters and collapses runs of whitespace to one space.
std::string NormalizeKeyword(std::string_view text);

// ---------------------------------------------------------------------------
// ColumnRef: "<node id>.<column>", split at the last '.'.
//
// The node id may itself be dotted (alias.database.table), so
// "X.db1.tbl1.amount" yields node "X.db1.tbl1" and column "amount".
// ---------------------------------------------------------------------------
class ColumnRef {
public:
    static Result<ColumnRef, std::string> Parse(std::string_view ref);

    [[nodiscard]] const std::string& NodeId() const noexcept { return node_id_; }
    [[nodiscard]] const std::string& Column() const noexcept { return column_; }
    [[nodiscard]] std::string ToString() const { return node_id_ + "." + column_; }

    bool operator==(const ColumnRef& other) const {
        return node_id_ == other.node_id_ && column_ == other.column_;
    }
    bool operator!=(const ColumnRef& other) const { return !(*this == other); }

private:
    ColumnRef(std::string node_id, std::string column)
        : node_id_(std::move(node_id)), column_(std::move(column)) {}

    std::string node_id_;
    std::string column_;
};

// "<db>.<table>" for a DML target: the last two dot-separated parts of the
// node id ("alias.db.table" -> "db.table"); ids with fewer parts unchanged.
std::string TableReference(std::string_view node_id);

} // namespace querygraph
