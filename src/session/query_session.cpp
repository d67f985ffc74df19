#include <querygraph/session/query_session.hpp>

#include <querygraph/core/log.hpp>
#include <querygraph/sql/sql_generator.hpp>
#include <querygraph/sql/sql_importer.hpp>

namespace querygraph {

QuerySession::QuerySession(SessionOptions options, ClockFn clock)
    : rewriter_(std::move(options.linked_servers)),
      mode_(options.mode),
      auto_generate_(options.auto_generate),
      debouncer_(options.debounce),
      clock_(std::move(clock)) {}

template <typename T>
Result<T, Error> QuerySession::Apply(Result<T, Error> result) {
    if (result.IsOk()) {
        Changed();
    } else {
        LogDebug("session", result.Error().ToString());
    }
    return result;
}

void QuerySession::Changed() {
    dirty_ = true;
    if (auto_generate_) {
        Regenerate();
    }
}

// ---------------------------------------------------------------------------
// Graph mutations
// ---------------------------------------------------------------------------

Result<void, Error> QuerySession::AddNode(const std::string& id,
                                          std::vector<std::string> columns, NodeKind kind) {
    return Apply(graph_.AddNode(id, std::move(columns), kind));
}

Result<void, Error> QuerySession::AddSubqueryNode(const std::string& alias, std::string body,
                                                  std::vector<std::string> columns) {
    return Apply(graph_.AddSubqueryNode(alias, std::move(body), std::move(columns)));
}

Result<void, Error> QuerySession::SetColumns(const std::string& id,
                                             std::vector<std::string> columns) {
    return Apply(graph_.SetColumns(id, std::move(columns)));
}

Result<void, Error> QuerySession::SelectColumn(const std::string& id, const std::string& column) {
    return Apply(graph_.SelectColumn(id, column));
}

Result<void, Error> QuerySession::DeselectColumn(const std::string& id,
                                                 const std::string& column) {
    return Apply(graph_.DeselectColumn(id, column));
}

Result<void, Error> QuerySession::RemoveNode(const std::string& id) {
    return Apply(graph_.RemoveNode(id));
}

Result<void, Error> QuerySession::RenameNode(const std::string& old_id,
                                             const std::string& new_id) {
    return Apply(graph_.RenameNode(old_id, new_id));
}

Result<EdgeId, Error> QuerySession::AddJoinEdge(const std::string& node_a,
                                                const std::string& node_b, JoinType type,
                                                const std::string& condition) {
    return Apply(graph_.AddJoinEdge(node_a, node_b, type, condition));
}

Result<void, Error> QuerySession::RemoveJoinEdge(EdgeId id) {
    return Apply(graph_.RemoveJoinEdge(id));
}

Result<void, Error> QuerySession::MarkDmlTarget(const std::string& id) {
    return Apply(graph_.SetDmlTarget(id));
}

void QuerySession::ClearDmlTarget() {
    graph_.ClearDmlTarget();
    Changed();
}

Result<EdgeId, Error> QuerySession::AddMappingEdge(const std::string& source_ref,
                                                   const std::string& target_ref) {
    return Apply(graph_.AddMappingEdge(source_ref, target_ref));
}

Result<void, Error> QuerySession::RemoveMappingEdge(EdgeId id) {
    return Apply(graph_.RemoveMappingEdge(id));
}

// ---------------------------------------------------------------------------
// Clause mutations
// ---------------------------------------------------------------------------

Result<void, Error> QuerySession::AddPredicate(PredicateClause clause, const std::string& column,
                                              const std::string& op, const std::string& value) {
    return Apply(clauses_.AddPredicate(clause, column, op, value));
}

Result<void, Error> QuerySession::RemovePredicate(PredicateClause clause, std::size_t index) {
    return Apply(clauses_.RemovePredicate(clause, index));
}

Result<void, Error> QuerySession::AddGroupBy(const std::string& column) {
    return Apply(clauses_.AddGroupBy(column));
}

Result<void, Error> QuerySession::RemoveGroupBy(const std::string& column) {
    return Apply(clauses_.RemoveGroupBy(column));
}

Result<void, Error> QuerySession::AddAggregate(AggregateFunction function,
                                              const std::string& column,
                                              const std::string& alias) {
    return Apply(clauses_.AddAggregate(function, column, alias));
}

Result<void, Error> QuerySession::RemoveAggregate(std::size_t index) {
    return Apply(clauses_.RemoveAggregate(index));
}

Result<void, Error> QuerySession::AddOrderBy(const std::string& column,
                                            SortDirection direction) {
    return Apply(clauses_.AddOrderBy(column, direction));
}

Result<void, Error> QuerySession::RemoveOrderBy(std::size_t index) {
    return Apply(clauses_.RemoveOrderBy(index));
}

Result<void, Error> QuerySession::SetLimit(int limit) {
    return Apply(clauses_.SetLimit(limit));
}

Result<void, Error> QuerySession::SetOffset(int offset) {
    return Apply(clauses_.SetOffset(offset));
}

Result<void, Error> QuerySession::AddDerivedColumn(const std::string& alias,
                                                  const std::string& expression) {
    return Apply(clauses_.AddDerivedColumn(alias, expression));
}

Result<void, Error> QuerySession::RemoveDerivedColumn(const std::string& alias) {
    return Apply(clauses_.RemoveDerivedColumn(alias));
}

Result<void, Error> QuerySession::AddWindowFunction(const WindowFunctionSpec& spec) {
    return Apply(clauses_.AddWindowFunction(spec));
}

Result<void, Error> QuerySession::SetCombineQuery(CombineOperator op, const std::string& sql) {
    return Apply(clauses_.SetCombineQuery(op, sql));
}

void QuerySession::ClearCombineQuery() {
    clauses_.ClearCombineQuery();
    Changed();
}

Result<void, Error> QuerySession::AddCte(const std::string& name, const std::string& body) {
    return Apply(ctes_.AddCte(name, body));
}

Result<void, Error> QuerySession::RemoveCte(const std::string& name) {
    return Apply(ctes_.RemoveCte(name));
}

void QuerySession::SetOperationMode(OperationMode mode) {
    mode_ = mode;
    LogDebug("session", "Operation mode " + ToSql(mode));
    Changed();
}

Result<void, Error> QuerySession::SetLinkedServerMap(LinkedServerMap servers) {
    for (const auto& [alias, server] : servers) {
        if (alias.empty() || server.empty()) {
            return Result<void, Error>::Err(Error{
                "SetLinkedServerMap", alias, "Alias and linked server name must not be empty",
                ErrorCategory::InvalidArgument});
        }
    }
    rewriter_ = IdentifierRewriter(std::move(servers));
    Changed();
    return Result<void, Error>::Ok();
}

void QuerySession::SetAutoGenerate(bool enabled) {
    auto_generate_ = enabled;
    if (enabled && dirty_) {
        Regenerate();
    }
}

// ---------------------------------------------------------------------------
// Import / reset
// ---------------------------------------------------------------------------

Result<void, Error> QuerySession::ImportSql(std::string_view sql) {
    auto imported = querygraph::ImportSql(sql);
    if (imported.IsErr()) {
        LogWarn("session", imported.Error().ToString());
        return Result<void, Error>::Err(imported.Error());
    }

    CteInliner ctes;
    for (const auto& cte : imported.Value().ctes) {
        auto added = ctes.AddCte(cte.name, cte.body);
        if (added.IsErr()) {
            return added;
        }
    }

    graph_.Clear();
    clauses_.Clear();
    ctes_ = std::move(ctes);
    imported_body_ = std::move(imported).Value().body;
    mode_ = OperationMode::Select;
    LogInfo("session", "Session replaced by imported SQL");
    Changed();
    return Result<void, Error>::Ok();
}

void QuerySession::Reset() {
    graph_.Clear();
    clauses_.Clear();
    ctes_.Clear();
    imported_body_.clear();
    Changed();
}

// ---------------------------------------------------------------------------
// Generation and validation
// ---------------------------------------------------------------------------

const GeneratedSql& QuerySession::Regenerate() {
    output_ = GenerateSql(GenerationInput{graph_, clauses_, ctes_, rewriter_, mode_,
                                          imported_body_});
    dirty_ = false;
    validation_ = ValidationResult{ValidationStatus::Pending, ""};
    debouncer_.Schedule(clock_());
    return output_;
}

bool QuerySession::Poll() {
    if (!debouncer_.Poll(clock_())) {
        return false;
    }
    validation_ = ValidateSql(output_.text);
    LogDebug("validate", ValidationStatusName(validation_.status) + ": " + validation_.message);
    return true;
}

const ValidationResult& QuerySession::ValidateNow() {
    debouncer_.Cancel();
    validation_ = ValidateSql(output_.text);
    return validation_;
}

Result<std::string, Error> QuerySession::Run(ISqlExecutor& executor) {
    if (output_.text.empty() || output_.diagnostic) {
        return Result<std::string, Error>::Err(Error{
            "Run", "", output_.text.empty() ? "No SQL has been generated" : output_.text,
            ErrorCategory::Execution});
    }
    if (dirty_) {
        LogWarn("session", "Running SQL that predates the latest changes");
    }
    LogInfo("session", "Handing " + std::to_string(output_.text.size()) +
                           " characters of SQL to the executor");
    return executor.Execute(output_.text);
}

} // namespace querygraph
