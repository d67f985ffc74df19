#pragma once

#include <querygraph/core/result.hpp>
#include <querygraph/core/types.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace querygraph {

// (column, operator, value). The operator is kept as typed; its family
// decides how the value is rendered (see ClauseAssembler).
struct Predicate {
    std::string column;
    std::string op;
    std::string value;
};

struct Aggregate {
    AggregateFunction function = AggregateFunction::Count;
    std::string column;
    std::string alias;
};

struct OrderTerm {
    std::string column;
    SortDirection direction = SortDirection::Asc;
};

// "<expression> AS <alias>" appended after the selected columns.
struct DerivedColumn {
    std::string alias;
    std::string expression;
};

struct WindowFunctionSpec {
    WindowFunction function = WindowFunction::RowNumber;
    std::vector<std::string> partition_by;
    std::vector<std::string> order_by;
    bool descending = false;
    std::string alias;
};

// Second statement appended to SELECT output with a set operator.
struct CombineQuery {
    CombineOperator op = CombineOperator::Union;
    std::string sql;
};

// "ROW_NUMBER() OVER (PARTITION BY a, b ORDER BY c DESC)".
std::string BuildWindowExpression(const WindowFunctionSpec& spec);

// ---------------------------------------------------------------------------
// ClauseState: everything besides the graph that shapes a statement.
//
// limit/offset use 0 as "unset": a value of 0 is never rendered, so LIMIT 0
// cannot be expressed.
// ---------------------------------------------------------------------------
class ClauseState {
public:
    [[nodiscard]] Result<void, Error> AddPredicate(PredicateClause clause,
                                                   const std::string& column,
                                                   const std::string& op,
                                                   const std::string& value);
    [[nodiscard]] Result<void, Error> RemovePredicate(PredicateClause clause, std::size_t index);

    // Ordered-unique: adding a column that is already grouped is a no-op.
    [[nodiscard]] Result<void, Error> AddGroupBy(const std::string& column);
    [[nodiscard]] Result<void, Error> RemoveGroupBy(const std::string& column);

    [[nodiscard]] Result<void, Error> AddAggregate(AggregateFunction function,
                                                   const std::string& column,
                                                   const std::string& alias);
    [[nodiscard]] Result<void, Error> RemoveAggregate(std::size_t index);

    [[nodiscard]] Result<void, Error> AddOrderBy(const std::string& column,
                                                 SortDirection direction);
    [[nodiscard]] Result<void, Error> RemoveOrderBy(std::size_t index);

    [[nodiscard]] Result<void, Error> SetLimit(int limit);
    [[nodiscard]] Result<void, Error> SetOffset(int offset);

    [[nodiscard]] Result<void, Error> AddDerivedColumn(const std::string& alias,
                                                       const std::string& expression);
    [[nodiscard]] Result<void, Error> AddWindowFunction(const WindowFunctionSpec& spec);
    [[nodiscard]] Result<void, Error> RemoveDerivedColumn(const std::string& alias);

    [[nodiscard]] Result<void, Error> SetCombineQuery(CombineOperator op,
                                                      const std::string& sql);
    void ClearCombineQuery() { combine_.reset(); }

    void Clear();

    [[nodiscard]] const std::vector<Predicate>& Where() const noexcept { return where_; }
    [[nodiscard]] const std::vector<Predicate>& Having() const noexcept { return having_; }
    [[nodiscard]] const std::vector<std::string>& GroupBy() const noexcept { return group_by_; }
    [[nodiscard]] const std::vector<Aggregate>& Aggregates() const noexcept { return aggregates_; }
    [[nodiscard]] const std::vector<OrderTerm>& OrderBy() const noexcept { return order_by_; }
    [[nodiscard]] const std::vector<DerivedColumn>& DerivedColumns() const noexcept { return derived_; }
    [[nodiscard]] const std::optional<CombineQuery>& Combine() const noexcept { return combine_; }
    [[nodiscard]] int Limit() const noexcept { return limit_; }
    [[nodiscard]] int Offset() const noexcept { return offset_; }

private:
    std::vector<Predicate>& PredicatesFor(PredicateClause clause) {
        return clause == PredicateClause::Having ? having_ : where_;
    }

    std::vector<Predicate> where_;
    std::vector<Predicate> having_;
    std::vector<std::string> group_by_;
    std::vector<Aggregate> aggregates_;
    std::vector<OrderTerm> order_by_;
    std::vector<DerivedColumn> derived_;
    std::optional<CombineQuery> combine_;
    int limit_ = 0;
    int offset_ = 0;
};

} // namespace querygraph
