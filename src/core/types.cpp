#include <querygraph/core/types.hpp>

#include <cctype>

namespace querygraph {

std::string NormalizeKeyword(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

// ---------------------------------------------------------------------------
// NodeKind
// ---------------------------------------------------------------------------
Result<NodeKind, std::string> ParseNodeKind(std::string_view text) {
    const auto k = NormalizeKeyword(text);
    if (k == "TABLE") return Result<NodeKind, std::string>::Ok(NodeKind::Table);
    if (k == "CTE") return Result<NodeKind, std::string>::Ok(NodeKind::Cte);
    if (k == "SUBQUERY") return Result<NodeKind, std::string>::Ok(NodeKind::Subquery);
    return Result<NodeKind, std::string>::Err(
        "Unknown node kind '" + std::string(text) + "' (expected table, cte or subquery)");
}

std::string NodeKindName(NodeKind kind) {
    switch (kind) {
        case NodeKind::Table:    return "table";
        case NodeKind::Cte:      return "cte";
        case NodeKind::Subquery: return "subquery";
    }
    return "table";
}

// ---------------------------------------------------------------------------
// JoinType
// ---------------------------------------------------------------------------
Result<JoinType, std::string> ParseJoinType(std::string_view text) {
    auto k = NormalizeKeyword(text);
    const std::string join_suffix = " JOIN";
    if (k.size() > join_suffix.size() &&
        k.compare(k.size() - join_suffix.size(), join_suffix.size(), join_suffix) == 0) {
        k.erase(k.size() - join_suffix.size());
    }
    const std::string outer_suffix = " OUTER";
    if (k.size() > outer_suffix.size() &&
        k.compare(k.size() - outer_suffix.size(), outer_suffix.size(), outer_suffix) == 0) {
        k.erase(k.size() - outer_suffix.size());
    }
    if (k == "INNER") return Result<JoinType, std::string>::Ok(JoinType::Inner);
    if (k == "LEFT") return Result<JoinType, std::string>::Ok(JoinType::Left);
    if (k == "RIGHT") return Result<JoinType, std::string>::Ok(JoinType::Right);
    if (k == "FULL") return Result<JoinType, std::string>::Ok(JoinType::Full);
    return Result<JoinType, std::string>::Err(
        "Unknown join type '" + std::string(text) + "' (expected INNER, LEFT, RIGHT or FULL)");
}

std::string ToSql(JoinType type) {
    switch (type) {
        case JoinType::Inner: return "INNER";
        case JoinType::Left:  return "LEFT";
        case JoinType::Right: return "RIGHT";
        case JoinType::Full:  return "FULL";
    }
    return "INNER";
}

// ---------------------------------------------------------------------------
// OperationMode
// ---------------------------------------------------------------------------
Result<OperationMode, std::string> ParseOperationMode(std::string_view text) {
    const auto k = NormalizeKeyword(text);
    if (k == "SELECT") return Result<OperationMode, std::string>::Ok(OperationMode::Select);
    if (k == "INSERT") return Result<OperationMode, std::string>::Ok(OperationMode::Insert);
    if (k == "UPDATE") return Result<OperationMode, std::string>::Ok(OperationMode::Update);
    if (k == "DELETE") return Result<OperationMode, std::string>::Ok(OperationMode::Delete);
    return Result<OperationMode, std::string>::Err(
        "Unknown operation mode '" + std::string(text) +
        "' (expected SELECT, INSERT, UPDATE or DELETE)");
}

std::string ToSql(OperationMode mode) {
    switch (mode) {
        case OperationMode::Select: return "SELECT";
        case OperationMode::Insert: return "INSERT";
        case OperationMode::Update: return "UPDATE";
        case OperationMode::Delete: return "DELETE";
    }
    return "SELECT";
}

// ---------------------------------------------------------------------------
// PredicateClause
// ---------------------------------------------------------------------------
Result<PredicateClause, std::string> ParsePredicateClause(std::string_view text) {
    const auto k = NormalizeKeyword(text);
    if (k == "WHERE") return Result<PredicateClause, std::string>::Ok(PredicateClause::Where);
    if (k == "HAVING") return Result<PredicateClause, std::string>::Ok(PredicateClause::Having);
    return Result<PredicateClause, std::string>::Err(
        "Unknown predicate clause '" + std::string(text) + "' (expected WHERE or HAVING)");
}

std::string ToSql(PredicateClause clause) {
    return clause == PredicateClause::Having ? "HAVING" : "WHERE";
}

// ---------------------------------------------------------------------------
// AggregateFunction
// ---------------------------------------------------------------------------
Result<AggregateFunction, std::string> ParseAggregateFunction(std::string_view text) {
    const auto k = NormalizeKeyword(text);
    if (k == "COUNT") return Result<AggregateFunction, std::string>::Ok(AggregateFunction::Count);
    if (k == "SUM") return Result<AggregateFunction, std::string>::Ok(AggregateFunction::Sum);
    if (k == "AVG") return Result<AggregateFunction, std::string>::Ok(AggregateFunction::Avg);
    if (k == "MIN") return Result<AggregateFunction, std::string>::Ok(AggregateFunction::Min);
    if (k == "MAX") return Result<AggregateFunction, std::string>::Ok(AggregateFunction::Max);
    return Result<AggregateFunction, std::string>::Err(
        "Unknown aggregate function '" + std::string(text) +
        "' (expected COUNT, SUM, AVG, MIN or MAX)");
}

std::string ToSql(AggregateFunction fn) {
    switch (fn) {
        case AggregateFunction::Count: return "COUNT";
        case AggregateFunction::Sum:   return "SUM";
        case AggregateFunction::Avg:   return "AVG";
        case AggregateFunction::Min:   return "MIN";
        case AggregateFunction::Max:   return "MAX";
    }
    return "COUNT";
}

// ---------------------------------------------------------------------------
// SortDirection
// ---------------------------------------------------------------------------
Result<SortDirection, std::string> ParseSortDirection(std::string_view text) {
    const auto k = NormalizeKeyword(text);
    if (k == "ASC" || k == "ASCENDING") {
        return Result<SortDirection, std::string>::Ok(SortDirection::Asc);
    }
    if (k == "DESC" || k == "DESCENDING") {
        return Result<SortDirection, std::string>::Ok(SortDirection::Desc);
    }
    return Result<SortDirection, std::string>::Err(
        "Unknown sort direction '" + std::string(text) + "' (expected ASC or DESC)");
}

std::string ToSql(SortDirection dir) {
    return dir == SortDirection::Desc ? "DESC" : "ASC";
}

// ---------------------------------------------------------------------------
// WindowFunction
// ---------------------------------------------------------------------------
Result<WindowFunction, std::string> ParseWindowFunction(std::string_view text) {
    const auto k = NormalizeKeyword(text);
    if (k == "ROW_NUMBER") return Result<WindowFunction, std::string>::Ok(WindowFunction::RowNumber);
    if (k == "RANK") return Result<WindowFunction, std::string>::Ok(WindowFunction::Rank);
    if (k == "DENSE_RANK") return Result<WindowFunction, std::string>::Ok(WindowFunction::DenseRank);
    if (k == "NTILE") return Result<WindowFunction, std::string>::Ok(WindowFunction::Ntile);
    if (k == "LAG") return Result<WindowFunction, std::string>::Ok(WindowFunction::Lag);
    if (k == "LEAD") return Result<WindowFunction, std::string>::Ok(WindowFunction::Lead);
    return Result<WindowFunction, std::string>::Err(
        "Unknown window function '" + std::string(text) +
        "' (expected ROW_NUMBER, RANK, DENSE_RANK, NTILE, LAG or LEAD)");
}

std::string ToSql(WindowFunction fn) {
    switch (fn) {
        case WindowFunction::RowNumber: return "ROW_NUMBER";
        case WindowFunction::Rank:      return "RANK";
        case WindowFunction::DenseRank: return "DENSE_RANK";
        case WindowFunction::Ntile:     return "NTILE";
        case WindowFunction::Lag:       return "LAG";
        case WindowFunction::Lead:      return "LEAD";
    }
    return "ROW_NUMBER";
}

// ---------------------------------------------------------------------------
// CombineOperator
// ---------------------------------------------------------------------------
Result<CombineOperator, std::string> ParseCombineOperator(std::string_view text) {
    const auto k = NormalizeKeyword(text);
    if (k == "UNION") return Result<CombineOperator, std::string>::Ok(CombineOperator::Union);
    if (k == "UNION ALL") return Result<CombineOperator, std::string>::Ok(CombineOperator::UnionAll);
    if (k == "INTERSECT") return Result<CombineOperator, std::string>::Ok(CombineOperator::Intersect);
    if (k == "EXCEPT") return Result<CombineOperator, std::string>::Ok(CombineOperator::Except);
    return Result<CombineOperator, std::string>::Err(
        "Unknown combine operator '" + std::string(text) +
        "' (expected UNION, UNION ALL, INTERSECT or EXCEPT)");
}

std::string ToSql(CombineOperator op) {
    switch (op) {
        case CombineOperator::Union:     return "UNION";
        case CombineOperator::UnionAll:  return "UNION ALL";
        case CombineOperator::Intersect: return "INTERSECT";
        case CombineOperator::Except:    return "EXCEPT";
    }
    return "UNION";
}

// ---------------------------------------------------------------------------
// ColumnRef
// ---------------------------------------------------------------------------
Result<ColumnRef, std::string> ColumnRef::Parse(std::string_view ref) {
    const auto dot = ref.rfind('.');
    if (dot == std::string_view::npos) {
        return Result<ColumnRef, std::string>::Err(
            "Column reference '" + std::string(ref) + "' must have the form <node>.<column>");
    }
    auto node = ref.substr(0, dot);
    auto column = ref.substr(dot + 1);
    if (node.empty() || column.empty()) {
        return Result<ColumnRef, std::string>::Err(
            "Column reference '" + std::string(ref) + "' has an empty node or column part");
    }
    return Result<ColumnRef, std::string>::Ok(
        ColumnRef(std::string(node), std::string(column)));
}

std::string TableReference(std::string_view node_id) {
    const auto last = node_id.rfind('.');
    if (last == std::string_view::npos || last == 0) {
        return std::string(node_id);
    }
    const auto prev = node_id.rfind('.', last - 1);
    if (prev == std::string_view::npos) {
        return std::string(node_id);
    }
    return std::string(node_id.substr(prev + 1));
}

} // namespace querygraph
