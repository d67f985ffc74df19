#include <catch2/catch_test_macros.hpp>

#include "mocks/mock_sql_executor.hpp"

#include <querygraph/session/query_session.hpp>
#include <querygraph/sql/sql_generator.hpp>

#include <chrono>
#include <memory>
#include <string>

using namespace querygraph;
using namespace querygraph::testing;
using namespace std::chrono_literals;

namespace {

// Manually advanced clock shared between the test and the session.
struct FakeClock {
    std::shared_ptr<QuerySession::Clock::time_point> now =
        std::make_shared<QuerySession::Clock::time_point>();

    QuerySession::ClockFn Fn() const {
        auto shared = now;
        return [shared]() { return *shared; };
    }
    void Advance(std::chrono::milliseconds d) { *now += d; }
};

void BuildTwoTableJoin(QuerySession& s) {
    REQUIRE(s.AddNode("A", {"id", "name"}).IsOk());
    REQUIRE(s.AddNode("B", {"id", "aid"}).IsOk());
    REQUIRE(s.AddJoinEdge("A", "B", JoinType::Inner, "A.id=B.aid").IsOk());
    REQUIRE(s.SelectColumn("A", "id").IsOk());
    REQUIRE(s.SelectColumn("A", "name").IsOk());
}

} // anonymous namespace

// ===========================================================================
// Regeneration
// ===========================================================================

TEST_CASE("QuerySession: starts with no output", "[session]") {
    QuerySession s;
    CHECK(s.Output().text.empty());
    CHECK_FALSE(s.Dirty());
    CHECK(s.Mode() == OperationMode::Select);
}

TEST_CASE("QuerySession: every mutation regenerates", "[session]") {
    QuerySession s;
    BuildTwoTableJoin(s);
    CHECK(s.Output().text == "SELECT A.id, A.name\nFROM A\nINNER JOIN B ON A.id=B.aid");
    CHECK_FALSE(s.Dirty());

    REQUIRE(s.AddPredicate(PredicateClause::Where, "A.name", "LIKE", "J%").IsOk());
    CHECK(s.Output().text.find("WHERE A.name LIKE 'J%'") != std::string::npos);
}

TEST_CASE("QuerySession: regeneration is idempotent", "[session]") {
    QuerySession s;
    BuildTwoTableJoin(s);
    REQUIRE(s.AddCte("c", "SELECT 1 AS x").IsOk());

    const auto first = s.Regenerate().text;
    const auto second = s.Regenerate().text;
    CHECK(first == second);
}

TEST_CASE("QuerySession: failed mutation changes nothing", "[session]") {
    QuerySession s;
    BuildTwoTableJoin(s);
    const auto before = s.Output().text;

    auto r = s.AddJoinEdge("A", "Missing", JoinType::Left, "A.id=Missing.id");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::NodeNotFound);
    CHECK(s.Output().text == before);
    CHECK(s.Graph().JoinEdges().size() == 1);
}

TEST_CASE("QuerySession: auto-generate off leaves the output stale", "[session]") {
    SessionOptions options;
    options.auto_generate = false;
    QuerySession s(options);

    REQUIRE(s.AddNode("T", {"id"}).IsOk());
    CHECK(s.Dirty());
    CHECK(s.Output().text.empty());

    s.SetAutoGenerate(true);
    CHECK_FALSE(s.Dirty());
    CHECK(s.Output().text == "SELECT *\nFROM T");
}

TEST_CASE("QuerySession: mode switch picks the DML translation", "[session][dml]") {
    QuerySession s;
    REQUIRE(s.AddNode("S", {"id", "v"}).IsOk());
    REQUIRE(s.AddNode("T", {"id", "val"}).IsOk());

    s.SetOperationMode(OperationMode::Update);
    CHECK(s.Output().diagnostic);
    CHECK(s.Output().text == EmptyTargetComment(OperationMode::Update));

    REQUIRE(s.MarkDmlTarget("T").IsOk());
    CHECK(s.Output().text == NoMappingComment(OperationMode::Update, "T"));

    REQUIRE(s.AddMappingEdge("S.v", "T.val").IsOk());
    CHECK_FALSE(s.Output().diagnostic);
    CHECK(s.Output().text.find("SET val=src.v") != std::string::npos);

    s.ClearDmlTarget();
    CHECK(s.Output().text == EmptyTargetComment(OperationMode::Update));
}

TEST_CASE("QuerySession: linked servers rewrite the FROM text", "[session]") {
    QuerySession s;
    REQUIRE(s.AddNode("X.db1.tbl1", {"id"}).IsOk());
    REQUIRE(s.SetLinkedServerMap({{"X", "LS1"}}).IsOk());
    CHECK(s.Output().text == "SELECT *\nFROM [LS1].[db1].dbo.[tbl1]");
    CHECK(s.LinkedServers().at("X") == "LS1");

    auto bad = s.SetLinkedServerMap({{"Y", ""}});
    REQUIRE(bad.IsErr());
    CHECK(bad.Error().category == ErrorCategory::InvalidArgument);
    CHECK(s.LinkedServers().count("X") == 1);
}

// ===========================================================================
// Debounced validation
// ===========================================================================

TEST_CASE("QuerySession: validation waits for the debounce interval", "[session][validate]") {
    FakeClock clock;
    SessionOptions options;
    options.debounce = 500ms;
    QuerySession s(options, clock.Fn());

    REQUIRE(s.AddNode("T", {"id"}).IsOk());
    CHECK(s.Validation().status == ValidationStatus::Pending);

    clock.Advance(499ms);
    CHECK_FALSE(s.Poll());
    CHECK(s.Validation().status == ValidationStatus::Pending);

    clock.Advance(1ms);
    CHECK(s.Poll());
    CHECK(s.Validation().status == ValidationStatus::Valid);
    CHECK_FALSE(s.Poll());
}

TEST_CASE("QuerySession: a new edit restarts the debounce", "[session][validate]") {
    FakeClock clock;
    SessionOptions options;
    options.debounce = 500ms;
    QuerySession s(options, clock.Fn());

    REQUIRE(s.AddNode("T", {"id"}).IsOk());
    clock.Advance(400ms);
    REQUIRE(s.SelectColumn("T", "id").IsOk());
    clock.Advance(400ms);
    CHECK_FALSE(s.Poll());

    clock.Advance(100ms);
    CHECK(s.Poll());
    CHECK(s.Validation().Ok());
}

TEST_CASE("QuerySession: ValidateNow skips the wait", "[session][validate]") {
    FakeClock clock;
    QuerySession s({}, clock.Fn());

    const auto& empty = s.ValidateNow();
    CHECK(empty.status == ValidationStatus::Empty);

    REQUIRE(s.AddNode("T", {"id"}).IsOk());
    CHECK(s.ValidateNow().status == ValidationStatus::Valid);
    CHECK_FALSE(s.ValidationTimer().Pending());
}

TEST_CASE("QuerySession: diagnostic output validates as Empty", "[session][validate]") {
    QuerySession s;
    REQUIRE(s.AddNode("T", {"id"}).IsOk());
    REQUIRE(s.RemoveNode("T").IsOk());
    CHECK(s.Output().text == kEmptyCanvasComment);
    CHECK(s.ValidateNow().status == ValidationStatus::Empty);
}

// ===========================================================================
// Run
// ===========================================================================

TEST_CASE("QuerySession: Run hands the text to the executor", "[session][run]") {
    QuerySession s;
    BuildTwoTableJoin(s);

    MockSqlExecutor mock;
    mock.EnqueueResult(Result<std::string, Error>::Ok("2 rows"));
    auto r = s.Run(mock);
    REQUIRE(r.IsOk());
    CHECK(r.Value() == "2 rows");
    REQUIRE(mock.ExecuteCallCount() == 1);
    CHECK(mock.ExecutedSql()[0] == s.Output().text);
}

TEST_CASE("QuerySession: Run refuses a diagnostic", "[session][run]") {
    QuerySession s;
    s.SetOperationMode(OperationMode::Delete);

    MockSqlExecutor mock;
    auto r = s.Run(mock);
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Execution);
    CHECK(mock.ExecuteCallCount() == 0);
}

TEST_CASE("QuerySession: executor errors propagate", "[session][run]") {
    QuerySession s;
    REQUIRE(s.AddNode("T", {"id"}).IsOk());

    MockSqlExecutor mock;
    mock.EnqueueResult(Result<std::string, Error>::Err(
        Error{"Execute", "T", "connection refused", ErrorCategory::Execution}));
    auto r = s.Run(mock);
    REQUIRE(r.IsErr());
    CHECK(r.Error().message == "connection refused");
}

// ===========================================================================
// Import and reset
// ===========================================================================

TEST_CASE("QuerySession: ImportSql replaces the session", "[session][import]") {
    QuerySession s;
    BuildTwoTableJoin(s);
    REQUIRE(s.SetLimit(5).IsOk());
    s.SetOperationMode(OperationMode::Insert);

    REQUIRE(s.ImportSql("WITH c AS (SELECT 1 AS x)\nSELECT x FROM c").IsOk());
    CHECK(s.Graph().Empty());
    CHECK(s.Clauses().Limit() == 0);
    CHECK(s.Mode() == OperationMode::Select);
    REQUIRE(s.Ctes().Definitions().size() == 1);
    CHECK(s.ImportedBody() == "SELECT x FROM c");
    CHECK(s.Output().text == "WITH c AS (\nSELECT 1 AS x\n)\nSELECT x FROM c");
}

TEST_CASE("QuerySession: failed import keeps the session", "[session][import]") {
    QuerySession s;
    BuildTwoTableJoin(s);
    const auto before = s.Output().text;

    SECTION("malformed WITH list") {
        CHECK(s.ImportSql("WITH c AS (SELECT 1").IsErr());
    }
    SECTION("duplicate CTE names") {
        auto r = s.ImportSql("WITH c AS (SELECT 1), c AS (SELECT 2) SELECT 1");
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::InvalidArgument);
    }
    CHECK(s.Graph().Nodes().size() == 2);
    CHECK(s.Ctes().Empty());
    CHECK(s.Output().text == before);
}

TEST_CASE("QuerySession: Reset clears everything", "[session]") {
    QuerySession s;
    BuildTwoTableJoin(s);
    REQUIRE(s.AddCte("c", "SELECT 1").IsOk());

    s.Reset();
    CHECK(s.Graph().Empty());
    CHECK(s.Ctes().Empty());
    CHECK(s.Output().text == kEmptyCanvasComment);
}

TEST_CASE("QuerySession: a disconnected join graph does not validate", "[session][validate]") {
    FakeClock clock;
    QuerySession s({}, clock.Fn());

    REQUIRE(s.AddNode("A", {"x"}).IsOk());
    REQUIRE(s.AddNode("B", {"y"}).IsOk());
    REQUIRE(s.AddNode("C", {"z"}).IsOk());
    REQUIRE(s.AddJoinEdge("A", "C", JoinType::Inner, "A.x=C.z").IsOk());

    CHECK(s.Output().text == "SELECT *\nFROM A\nINNER JOIN C ON A.x=C.z\nFROM B");
    const auto& r = s.ValidateNow();
    CHECK(r.status == ValidationStatus::Invalid);
    CHECK(r.message == "multiple FROM blocks (disconnected join graph)");
}
