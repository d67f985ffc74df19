#include <querygraph/graph/clause_state.hpp>

#include <algorithm>

namespace querygraph {

namespace {

Error MakeClauseError(const std::string& operation, const std::string& subject,
                      const std::string& message) {
    return Error{operation, subject, message, ErrorCategory::InvalidArgument};
}

bool IsBlank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string Join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

Result<void, Error> RemoveAt(const std::string& operation, size_t index, size_t size) {
    if (index >= size) {
        return Result<void, Error>::Err(MakeClauseError(
            operation, std::to_string(index),
            "Index out of range (have " + std::to_string(size) + " entries)"));
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

std::string BuildWindowExpression(const WindowFunctionSpec& spec) {
    std::vector<std::string> over;
    if (!spec.partition_by.empty()) {
        over.push_back("PARTITION BY " + Join(spec.partition_by, ", "));
    }
    if (!spec.order_by.empty()) {
        std::string order = "ORDER BY " + Join(spec.order_by, ", ");
        if (spec.descending) {
            order += " DESC";
        }
        over.push_back(std::move(order));
    }
    return ToSql(spec.function) + "() OVER (" + Join(over, " ") + ")";
}

// ---------------------------------------------------------------------------
// Predicates
// ---------------------------------------------------------------------------
Result<void, Error> ClauseState::AddPredicate(PredicateClause clause,
                                              const std::string& column,
                                              const std::string& op,
                                              const std::string& value) {
    const auto operation = "Add" + ToSql(clause) + "Predicate";
    if (IsBlank(column)) {
        return Result<void, Error>::Err(
            MakeClauseError(operation, "", "Predicate column must not be empty"));
    }
    if (IsBlank(op)) {
        return Result<void, Error>::Err(
            MakeClauseError(operation, column, "Predicate operator must not be empty"));
    }
    PredicatesFor(clause).push_back(Predicate{column, op, value});
    return Result<void, Error>::Ok();
}

Result<void, Error> ClauseState::RemovePredicate(PredicateClause clause, size_t index) {
    auto& list = PredicatesFor(clause);
    auto check = RemoveAt("Remove" + ToSql(clause) + "Predicate", index, list.size());
    if (check.IsErr()) {
        return check;
    }
    list.erase(list.begin() + static_cast<std::ptrdiff_t>(index));
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// GROUP BY
// ---------------------------------------------------------------------------
Result<void, Error> ClauseState::AddGroupBy(const std::string& column) {
    if (IsBlank(column)) {
        return Result<void, Error>::Err(
            MakeClauseError("AddGroupBy", "", "Group-by column must not be empty"));
    }
    if (std::find(group_by_.begin(), group_by_.end(), column) == group_by_.end()) {
        group_by_.push_back(column);
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> ClauseState::RemoveGroupBy(const std::string& column) {
    auto it = std::find(group_by_.begin(), group_by_.end(), column);
    if (it == group_by_.end()) {
        return Result<void, Error>::Err(
            MakeClauseError("RemoveGroupBy", column, "Column is not grouped"));
    }
    group_by_.erase(it);
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Aggregates
// ---------------------------------------------------------------------------
Result<void, Error> ClauseState::AddAggregate(AggregateFunction function,
                                              const std::string& column,
                                              const std::string& alias) {
    if (IsBlank(column) || IsBlank(alias)) {
        return Result<void, Error>::Err(MakeClauseError(
            "AddAggregate", ToSql(function), "Aggregate column and alias are required"));
    }
    aggregates_.push_back(Aggregate{function, column, alias});
    return Result<void, Error>::Ok();
}

Result<void, Error> ClauseState::RemoveAggregate(size_t index) {
    auto check = RemoveAt("RemoveAggregate", index, aggregates_.size());
    if (check.IsErr()) {
        return check;
    }
    aggregates_.erase(aggregates_.begin() + static_cast<std::ptrdiff_t>(index));
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// ORDER BY, LIMIT, OFFSET
// ---------------------------------------------------------------------------
Result<void, Error> ClauseState::AddOrderBy(const std::string& column,
                                            SortDirection direction) {
    if (IsBlank(column)) {
        return Result<void, Error>::Err(
            MakeClauseError("AddOrderBy", "", "Order-by column must not be empty"));
    }
    order_by_.push_back(OrderTerm{column, direction});
    return Result<void, Error>::Ok();
}

Result<void, Error> ClauseState::RemoveOrderBy(size_t index) {
    auto check = RemoveAt("RemoveOrderBy", index, order_by_.size());
    if (check.IsErr()) {
        return check;
    }
    order_by_.erase(order_by_.begin() + static_cast<std::ptrdiff_t>(index));
    return Result<void, Error>::Ok();
}

Result<void, Error> ClauseState::SetLimit(int limit) {
    if (limit < 0) {
        return Result<void, Error>::Err(MakeClauseError(
            "SetLimit", std::to_string(limit), "Limit must not be negative"));
    }
    limit_ = limit;
    return Result<void, Error>::Ok();
}

Result<void, Error> ClauseState::SetOffset(int offset) {
    if (offset < 0) {
        return Result<void, Error>::Err(MakeClauseError(
            "SetOffset", std::to_string(offset), "Offset must not be negative"));
    }
    offset_ = offset;
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Derived columns and window functions
// ---------------------------------------------------------------------------
Result<void, Error> ClauseState::AddDerivedColumn(const std::string& alias,
                                                  const std::string& expression) {
    if (IsBlank(alias) || IsBlank(expression)) {
        return Result<void, Error>::Err(MakeClauseError(
            "AddDerivedColumn", alias, "Both alias and expression are required"));
    }
    if (std::count(expression.begin(), expression.end(), '(') !=
        std::count(expression.begin(), expression.end(), ')')) {
        return Result<void, Error>::Err(MakeClauseError(
            "AddDerivedColumn", alias, "Unbalanced parentheses in expression"));
    }
    derived_.push_back(DerivedColumn{alias, expression});
    return Result<void, Error>::Ok();
}

Result<void, Error> ClauseState::AddWindowFunction(const WindowFunctionSpec& spec) {
    if (IsBlank(spec.alias)) {
        return Result<void, Error>::Err(MakeClauseError(
            "AddWindowFunction", ToSql(spec.function), "Alias is required"));
    }
    return AddDerivedColumn(spec.alias, BuildWindowExpression(spec));
}

Result<void, Error> ClauseState::RemoveDerivedColumn(const std::string& alias) {
    auto it = std::find_if(derived_.begin(), derived_.end(),
                           [&](const DerivedColumn& d) { return d.alias == alias; });
    if (it == derived_.end()) {
        return Result<void, Error>::Err(
            MakeClauseError("RemoveDerivedColumn", alias, "No derived column with this alias"));
    }
    derived_.erase(it);
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Combine query
// ---------------------------------------------------------------------------
Result<void, Error> ClauseState::SetCombineQuery(CombineOperator op,
                                                 const std::string& sql) {
    const auto start = sql.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return Result<void, Error>::Err(MakeClauseError(
            "SetCombineQuery", ToSql(op), "Second query must not be empty"));
    }
    if (NormalizeKeyword(sql.substr(start, 6)) != "SELECT") {
        return Result<void, Error>::Err(MakeClauseError(
            "SetCombineQuery", ToSql(op), "The second query must begin with SELECT"));
    }
    const auto end = sql.find_last_not_of(" \t\r\n");
    combine_ = CombineQuery{op, sql.substr(start, end - start + 1)};
    return Result<void, Error>::Ok();
}

void ClauseState::Clear() {
    where_.clear();
    having_.clear();
    group_by_.clear();
    aggregates_.clear();
    order_by_.clear();
    derived_.clear();
    combine_.reset();
    limit_ = 0;
    offset_ = 0;
}

} // namespace querygraph
