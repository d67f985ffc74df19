#include <catch2/catch_test_macros.hpp>

#include <querygraph/sql/clause_assembler.hpp>
#include <querygraph/sql/from_clause_builder.hpp>

#include <string>
#include <vector>

using namespace querygraph;

// ===========================================================================
// Predicate rendering
// ===========================================================================

TEST_CASE("ClassifyOperator: families", "[assembler][predicate]") {
    CHECK(ClassifyOperator("=") == OperatorFamily::Comparison);
    CHECK(ClassifyOperator("like") == OperatorFamily::Comparison);
    CHECK(ClassifyOperator("~=") == OperatorFamily::Comparison);
    CHECK(ClassifyOperator("in") == OperatorFamily::List);
    CHECK(ClassifyOperator("not  in") == OperatorFamily::List);
    CHECK(ClassifyOperator("is null") == OperatorFamily::Unary);
    CHECK(ClassifyOperator("IS NOT NULL") == OperatorFamily::Unary);
    CHECK(ClassifyOperator("exists") == OperatorFamily::Unary);
}

TEST_CASE("RenderPredicate: IN list is inserted verbatim", "[assembler][predicate]") {
    Predicate p{"status", "IN", "'A','B'"};
    CHECK(RenderPredicate(p) == "status IN ('A','B')");

    Predicate not_in{"id", "not in", "1, 2,3"};
    CHECK(RenderPredicate(not_in) == "id NOT IN (1, 2,3)");
}

TEST_CASE("RenderPredicate: comparison quotes the value", "[assembler][predicate]") {
    CHECK(RenderPredicate(Predicate{"name", "=", "x"}) == "name = 'x'");
    CHECK(RenderPredicate(Predicate{"A.total", ">=", "10"}) == "A.total >= '10'");
    CHECK(RenderPredicate(Predicate{"name", "like", "J%"}) == "name LIKE 'J%'");
}

TEST_CASE("RenderPredicate: unary operators ignore the value", "[assembler][predicate]") {
    CHECK(RenderPredicate(Predicate{"deleted_at", "is null", "ignored"}) == "deleted_at IS NULL");
    CHECK(RenderPredicate(Predicate{"x", "IS NOT NULL", ""}) == "x IS NOT NULL");
}

TEST_CASE("RenderPredicates: joined with AND", "[assembler][predicate]") {
    std::vector<Predicate> preds = {{"a", "=", "1"}, {"b", "IN", "2,3"}};
    CHECK(RenderPredicates(preds) == "a = '1' AND b IN (2,3)");
    CHECK(RenderPredicates({}).empty());
}

// ===========================================================================
// Select list
// ===========================================================================

TEST_CASE("BuildSelectList: node order, then derived, then aggregates", "[assembler][select]") {
    GraphModel g;
    REQUIRE(g.AddNode("A", {"id", "name"}).IsOk());
    REQUIRE(g.AddNode("B", {"id", "aid", "total"}).IsOk());
    REQUIRE(g.SelectColumn("B", "total").IsOk());
    REQUIRE(g.SelectColumn("A", "name").IsOk());
    REQUIRE(g.SelectColumn("A", "id").IsOk());

    ClauseState c;
    REQUIRE(c.AddDerivedColumn("twice", "B.total * 2").IsOk());
    REQUIRE(c.AddAggregate(AggregateFunction::Count, "B.id", "n").IsOk());

    auto items = BuildSelectList(g, c);
    CHECK(items == std::vector<std::string>{
                       "A.id", "A.name", "B.total", "B.total * 2 AS twice", "COUNT(B.id) AS n"});

    auto without_b = BuildSelectList(g, c, std::string("B"));
    CHECK(without_b.front() == "A.id");
    CHECK(without_b.size() == 4);
}

// ===========================================================================
// AssembleSelect
// ===========================================================================

TEST_CASE("AssembleSelect: two-node join with selected columns", "[assembler]") {
    GraphModel g;
    REQUIRE(g.AddNode("A", {"id", "name"}).IsOk());
    REQUIRE(g.AddNode("B", {"id", "aid"}).IsOk());
    REQUIRE(g.AddJoinEdge("A", "B", JoinType::Inner, "A.id=B.aid").IsOk());
    REQUIRE(g.SelectColumn("A", "id").IsOk());
    REQUIRE(g.SelectColumn("A", "name").IsOk());

    ClauseState c;
    auto sql = AssembleSelect(BuildSelectList(g, c), BuildFromClause(g).text, c);
    CHECK(sql == "SELECT A.id, A.name\nFROM A\nINNER JOIN B ON A.id=B.aid");
}

TEST_CASE("AssembleSelect: empty select list becomes *", "[assembler]") {
    ClauseState c;
    CHECK(AssembleSelect({}, "FROM T", c) == "SELECT *\nFROM T");
}

TEST_CASE("AssembleSelect: clause order", "[assembler]") {
    ClauseState c;
    REQUIRE(c.AddPredicate(PredicateClause::Where, "status", "IN", "'A','B'").IsOk());
    REQUIRE(c.AddGroupBy("region").IsOk());
    REQUIRE(c.AddPredicate(PredicateClause::Having, "COUNT(id)", ">", "1").IsOk());
    REQUIRE(c.AddOrderBy("region", SortDirection::Desc).IsOk());
    REQUIRE(c.SetLimit(10).IsOk());
    REQUIRE(c.SetOffset(5).IsOk());

    auto sql = AssembleSelect({"region"}, "FROM T", c);
    CHECK(sql ==
          "SELECT region\n"
          "FROM T\n"
          "WHERE status IN ('A','B')\n"
          "GROUP BY region\n"
          "HAVING COUNT(id) > '1'\n"
          "ORDER BY region DESC\n"
          "LIMIT 10\n"
          "OFFSET 5");
}

TEST_CASE("AssembleSelect: zero LIMIT and OFFSET are omitted", "[assembler]") {
    ClauseState c;
    REQUIRE(c.SetLimit(0).IsOk());
    REQUIRE(c.SetOffset(0).IsOk());
    auto sql = AssembleSelect({"a"}, "FROM T", c);
    CHECK(sql.find("LIMIT") == std::string::npos);
    CHECK(sql.find("OFFSET") == std::string::npos);

    REQUIRE(c.SetOffset(3).IsOk());
    sql = AssembleSelect({"a"}, "FROM T", c);
    CHECK(sql.find("LIMIT") == std::string::npos);
    CHECK(sql.find("OFFSET 3") != std::string::npos);
}

TEST_CASE("AssembleSelect: no FROM line when the graph is empty", "[assembler]") {
    ClauseState c;
    CHECK(AssembleSelect({"1 AS one"}, "", c) == "SELECT 1 AS one");
}

// ===========================================================================
// Combine suffix
// ===========================================================================

TEST_CASE("RenderCombineSuffix: wraps the second query", "[assembler][combine]") {
    ClauseState c;
    CHECK(RenderCombineSuffix(c).empty());

    REQUIRE(c.SetCombineQuery(CombineOperator::UnionAll, "SELECT id FROM B").IsOk());
    CHECK(RenderCombineSuffix(c) == "\nUNION ALL\n(\nSELECT id FROM B\n)");

    REQUIRE(c.SetCombineQuery(CombineOperator::Except, "SELECT 1").IsOk());
    CHECK(RenderCombineSuffix(c) == "\nEXCEPT\n(\nSELECT 1\n)");
}
