#pragma once

#include <querygraph/core/result.hpp>
#include <querygraph/core/types.hpp>
#include <querygraph/graph/clause_state.hpp>
#include <querygraph/graph/graph_model.hpp>
#include <querygraph/session/i_sql_executor.hpp>
#include <querygraph/sql/cte_inliner.hpp>
#include <querygraph/sql/debouncer.hpp>
#include <querygraph/sql/dml_translator.hpp>
#include <querygraph/sql/identifier_rewriter.hpp>
#include <querygraph/sql/syntax_validator.hpp>

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace querygraph {

struct SessionOptions {
    bool auto_generate = true;
    std::chrono::milliseconds debounce = kDefaultDebounceInterval;
    OperationMode mode = OperationMode::Select;
    LinkedServerMap linked_servers;
};

// ---------------------------------------------------------------------------
// QuerySession: one editing session: the graph, the clause state, the CTE
// list, the linked-server map and the last generated SQL.
//
// Every inbound mutation either fails without changing anything or succeeds
// and, with auto-generate on, triggers a full Regenerate(). Regenerate()
// marks validation Pending and (re)arms the debouncer; Poll() runs the syntax
// check once the debounce interval has passed without a newer generation.
// ---------------------------------------------------------------------------
class QuerySession {
public:
    using Clock = Debouncer::Clock;
    using ClockFn = std::function<Clock::time_point()>;

    explicit QuerySession(SessionOptions options = {}, ClockFn clock = &Clock::now);

    // -- Graph mutations ----------------------------------------------------

    [[nodiscard]] Result<void, Error> AddNode(const std::string& id,
                                              std::vector<std::string> columns,
                                              NodeKind kind = NodeKind::Table);
    [[nodiscard]] Result<void, Error> AddSubqueryNode(const std::string& alias,
                                                      std::string body,
                                                      std::vector<std::string> columns = {});
    [[nodiscard]] Result<void, Error> SetColumns(const std::string& id,
                                                 std::vector<std::string> columns);
    [[nodiscard]] Result<void, Error> SelectColumn(const std::string& id, const std::string& column);
    [[nodiscard]] Result<void, Error> DeselectColumn(const std::string& id, const std::string& column);
    [[nodiscard]] Result<void, Error> RemoveNode(const std::string& id);
    [[nodiscard]] Result<void, Error> RenameNode(const std::string& old_id, const std::string& new_id);

    [[nodiscard]] Result<EdgeId, Error> AddJoinEdge(const std::string& node_a,
                                                    const std::string& node_b,
                                                    JoinType type,
                                                    const std::string& condition);
    [[nodiscard]] Result<void, Error> RemoveJoinEdge(EdgeId id);

    [[nodiscard]] Result<void, Error> MarkDmlTarget(const std::string& id);
    void ClearDmlTarget();
    [[nodiscard]] Result<EdgeId, Error> AddMappingEdge(const std::string& source_ref,
                                                       const std::string& target_ref);
    [[nodiscard]] Result<void, Error> RemoveMappingEdge(EdgeId id);

    // -- Clause mutations ---------------------------------------------------

    [[nodiscard]] Result<void, Error> AddPredicate(PredicateClause clause,
                                                   const std::string& column,
                                                   const std::string& op,
                                                   const std::string& value);
    [[nodiscard]] Result<void, Error> RemovePredicate(PredicateClause clause, std::size_t index);
    [[nodiscard]] Result<void, Error> AddGroupBy(const std::string& column);
    [[nodiscard]] Result<void, Error> RemoveGroupBy(const std::string& column);
    [[nodiscard]] Result<void, Error> AddAggregate(AggregateFunction function,
                                                   const std::string& column,
                                                   const std::string& alias);
    [[nodiscard]] Result<void, Error> RemoveAggregate(std::size_t index);
    [[nodiscard]] Result<void, Error> AddOrderBy(const std::string& column, SortDirection direction);
    [[nodiscard]] Result<void, Error> RemoveOrderBy(std::size_t index);
    [[nodiscard]] Result<void, Error> SetLimit(int limit);
    [[nodiscard]] Result<void, Error> SetOffset(int offset);
    [[nodiscard]] Result<void, Error> AddDerivedColumn(const std::string& alias,
                                                       const std::string& expression);
    [[nodiscard]] Result<void, Error> RemoveDerivedColumn(const std::string& alias);
    [[nodiscard]] Result<void, Error> AddWindowFunction(const WindowFunctionSpec& spec);
    [[nodiscard]] Result<void, Error> SetCombineQuery(CombineOperator op, const std::string& sql);
    void ClearCombineQuery();

    [[nodiscard]] Result<void, Error> AddCte(const std::string& name, const std::string& body);
    [[nodiscard]] Result<void, Error> RemoveCte(const std::string& name);

    void SetOperationMode(OperationMode mode);
    [[nodiscard]] Result<void, Error> SetLinkedServerMap(LinkedServerMap servers);
    void SetAutoGenerate(bool enabled);

    // Replaces the whole session with an imported statement: CTEs become
    // definitions, the rest is kept as literal body text. Graph, clause state
    // and CTEs are swapped in one step, or not at all.
    [[nodiscard]] Result<void, Error> ImportSql(std::string_view sql);

    // Clears graph, clause state, CTEs and any imported body.
    void Reset();

    // -- Generation and validation ------------------------------------------

    const GeneratedSql& Regenerate();

    // Runs the pending syntax check if its debounce interval has elapsed.
    // Returns true when a check ran.
    bool Poll();

    // Cancels the debounce and validates the current output immediately.
    const ValidationResult& ValidateNow();

    // Hands the current output verbatim to `executor`.
    [[nodiscard]] Result<std::string, Error> Run(ISqlExecutor& executor);

    // -- Accessors ----------------------------------------------------------

    [[nodiscard]] const GeneratedSql& Output() const noexcept { return output_; }
    [[nodiscard]] const ValidationResult& Validation() const noexcept { return validation_; }
    [[nodiscard]] bool Dirty() const noexcept { return dirty_; }

    [[nodiscard]] const GraphModel& Graph() const noexcept { return graph_; }
    [[nodiscard]] const ClauseState& Clauses() const noexcept { return clauses_; }
    [[nodiscard]] const CteInliner& Ctes() const noexcept { return ctes_; }
    [[nodiscard]] const LinkedServerMap& LinkedServers() const noexcept { return rewriter_.Servers(); }
    [[nodiscard]] OperationMode Mode() const noexcept { return mode_; }
    [[nodiscard]] bool AutoGenerate() const noexcept { return auto_generate_; }
    [[nodiscard]] const std::string& ImportedBody() const noexcept { return imported_body_; }
    [[nodiscard]] const Debouncer& ValidationTimer() const noexcept { return debouncer_; }

private:
    template <typename T>
    Result<T, Error> Apply(Result<T, Error> result);
    void Changed();

    GraphModel graph_;
    ClauseState clauses_;
    CteInliner ctes_;
    IdentifierRewriter rewriter_;
    OperationMode mode_;
    bool auto_generate_;
    Debouncer debouncer_;
    ClockFn clock_;
    std::string imported_body_;
    GeneratedSql output_;
    ValidationResult validation_;
    bool dirty_ = false;
};

} // namespace querygraph
