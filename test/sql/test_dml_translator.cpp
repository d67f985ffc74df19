#include <catch2/catch_test_macros.hpp>

#include <querygraph/sql/dml_translator.hpp>

#include <string>

using namespace querygraph;

namespace {

// S(id, v) feeding target T(id, val) with S.v -> T.val.
GraphModel SourceAndTarget(const std::string& target_id = "T") {
    GraphModel g;
    REQUIRE(g.AddNode("S", {"id", "v"}).IsOk());
    REQUIRE(g.AddNode(target_id, {"id", "val"}).IsOk());
    REQUIRE(g.SetDmlTarget(target_id).IsOk());
    REQUIRE(g.AddMappingEdge("S.v", target_id + ".val").IsOk());
    return g;
}

} // anonymous namespace

// ===========================================================================
// Diagnostics
// ===========================================================================

TEST_CASE("TranslateDml: no target yields EmptyTarget comment", "[dml]") {
    GraphModel g;
    REQUIRE(g.AddNode("S", {"id"}).IsOk());
    ClauseState c;

    for (auto mode : {OperationMode::Insert, OperationMode::Update, OperationMode::Delete}) {
        auto r = TranslateDml(mode, g, c, IdentifierRewriter{});
        CHECK(r.diagnostic);
        CHECK(r.text == EmptyTargetComment(mode));
        CHECK(r.text.rfind("-- EmptyTarget", 0) == 0);
    }
}

TEST_CASE("TranslateDml: target without mappings yields NoMapping comment", "[dml]") {
    GraphModel g;
    REQUIRE(g.AddNode("T", {"id", "val"}).IsOk());
    REQUIRE(g.SetDmlTarget("T").IsOk());
    ClauseState c;

    auto r = TranslateDml(OperationMode::Insert, g, c, IdentifierRewriter{});
    CHECK(r.diagnostic);
    CHECK(r.text == NoMappingComment(OperationMode::Insert, "T"));
    CHECK(r.text.find('\n') == std::string::npos);
}

TEST_CASE("TranslateDml: UPDATE with only the id column mapped", "[dml]") {
    GraphModel g;
    REQUIRE(g.AddNode("S", {"id"}).IsOk());
    REQUIRE(g.AddNode("T", {"id", "val"}).IsOk());
    REQUIRE(g.SetDmlTarget("T").IsOk());
    REQUIRE(g.AddMappingEdge("S.id", "T.id").IsOk());
    ClauseState c;

    auto r = TranslateDml(OperationMode::Update, g, c, IdentifierRewriter{});
    CHECK(r.diagnostic);
    CHECK(r.text.rfind("-- NoMapping", 0) == 0);
}

// ===========================================================================
// Statements
// ===========================================================================

TEST_CASE("TranslateDml: UPDATE sets mapped columns from the sub-select", "[dml]") {
    auto g = SourceAndTarget();
    ClauseState c;

    auto r = TranslateDml(OperationMode::Update, g, c, IdentifierRewriter{});
    REQUIRE_FALSE(r.diagnostic);
    CHECK(r.text ==
          "UPDATE T\n"
          "SET val=src.v\n"
          "FROM (\n"
          "SELECT S.v, S.id\n"
          "FROM S\n"
          ") AS src\n"
          "WHERE T.id=src.id");
}

TEST_CASE("TranslateDml: INSERT lists target columns in mapping order", "[dml]") {
    GraphModel g;
    REQUIRE(g.AddNode("S", {"id", "a", "b"}).IsOk());
    REQUIRE(g.AddNode("T", {"x", "y"}).IsOk());
    REQUIRE(g.SetDmlTarget("T").IsOk());
    REQUIRE(g.AddMappingEdge("S.b", "T.y").IsOk());
    REQUIRE(g.AddMappingEdge("S.a", "T.x").IsOk());
    ClauseState c;
    REQUIRE(c.AddPredicate(PredicateClause::Where, "S.a", "IS NOT NULL", "").IsOk());

    auto r = TranslateDml(OperationMode::Insert, g, c, IdentifierRewriter{});
    REQUIRE_FALSE(r.diagnostic);
    CHECK(r.text ==
          "INSERT INTO T (y, x)\n"
          "SELECT S.b, S.a\n"
          "FROM S\n"
          "WHERE S.a IS NOT NULL");
}

TEST_CASE("TranslateDml: DELETE by id", "[dml]") {
    auto g = SourceAndTarget();
    ClauseState c;

    auto r = TranslateDml(OperationMode::Delete, g, c, IdentifierRewriter{});
    REQUIRE_FALSE(r.diagnostic);
    CHECK(r.text == "DELETE FROM T\nWHERE id IN (\nSELECT S.id\nFROM S\n)");
}

TEST_CASE("TranslateDml: DELETE with two mappings selects only the key", "[dml]") {
    GraphModel g;
    REQUIRE(g.AddNode("S", {"id", "v", "w"}).IsOk());
    REQUIRE(g.AddNode("T", {"id", "val", "wal"}).IsOk());
    REQUIRE(g.SetDmlTarget("T").IsOk());
    REQUIRE(g.AddMappingEdge("S.v", "T.val").IsOk());
    REQUIRE(g.AddMappingEdge("S.w", "T.wal").IsOk());
    ClauseState c;

    auto r = TranslateDml(OperationMode::Delete, g, c, IdentifierRewriter{});
    REQUIRE_FALSE(r.diagnostic);
    CHECK(r.text == "DELETE FROM T\nWHERE id IN (\nSELECT S.id\nFROM S\n)");
}

TEST_CASE("TranslateDml: UPDATE with two mappings projects src.id", "[dml]") {
    GraphModel g;
    REQUIRE(g.AddNode("S", {"id", "v", "w"}).IsOk());
    REQUIRE(g.AddNode("T", {"id", "val", "wal"}).IsOk());
    REQUIRE(g.SetDmlTarget("T").IsOk());
    REQUIRE(g.AddMappingEdge("S.v", "T.val").IsOk());
    REQUIRE(g.AddMappingEdge("S.w", "T.wal").IsOk());
    ClauseState c;

    auto r = TranslateDml(OperationMode::Update, g, c, IdentifierRewriter{});
    REQUIRE_FALSE(r.diagnostic);
    CHECK(r.text ==
          "UPDATE T\n"
          "SET val=src.v, wal=src.w\n"
          "FROM (\n"
          "SELECT S.v, S.w, S.id\n"
          "FROM S\n"
          ") AS src\n"
          "WHERE T.id=src.id");
}

TEST_CASE("TranslateDml: UPDATE does not repeat an already mapped id", "[dml]") {
    GraphModel g;
    REQUIRE(g.AddNode("S", {"id", "v"}).IsOk());
    REQUIRE(g.AddNode("T", {"id", "val"}).IsOk());
    REQUIRE(g.SetDmlTarget("T").IsOk());
    REQUIRE(g.AddMappingEdge("S.id", "T.id").IsOk());
    REQUIRE(g.AddMappingEdge("S.v", "T.val").IsOk());
    ClauseState c;

    auto r = TranslateDml(OperationMode::Update, g, c, IdentifierRewriter{});
    REQUIRE_FALSE(r.diagnostic);
    CHECK(r.text.find("SELECT S.id, S.v\nFROM S\n") != std::string::npos);
}

TEST_CASE("TranslateDml: target is excluded from the sub-select joins", "[dml]") {
    auto g = SourceAndTarget();
    REQUIRE(g.AddJoinEdge("S", "T", JoinType::Inner, "S.id=T.id").IsOk());
    ClauseState c;

    auto r = TranslateDml(OperationMode::Insert, g, c, IdentifierRewriter{});
    CHECK(r.text.find("JOIN T") == std::string::npos);
}

TEST_CASE("TranslateDml: target table is the last two name parts", "[dml]") {
    auto g = SourceAndTarget("X.db1.dst");
    ClauseState c;

    auto r = TranslateDml(OperationMode::Update, g, c, IdentifierRewriter{});
    CHECK(r.text.rfind("UPDATE db1.dst\n", 0) == 0);
    CHECK(r.text.find("WHERE db1.dst.id=src.id") != std::string::npos);
}

TEST_CASE("TranslateDml: sub-select FROM text goes through the rewriter", "[dml]") {
    GraphModel g;
    REQUIRE(g.AddNode("X.db1.src", {"id", "v"}).IsOk());
    REQUIRE(g.AddNode("T", {"id", "val"}).IsOk());
    REQUIRE(g.SetDmlTarget("T").IsOk());
    REQUIRE(g.AddMappingEdge("X.db1.src.v", "T.val").IsOk());
    ClauseState c;

    auto r = TranslateDml(OperationMode::Insert, g, c, IdentifierRewriter(LinkedServerMap{{"X", "LS1"}}));
    CHECK(r.text.find("FROM [LS1].[db1].dbo.[src]") != std::string::npos);
}
