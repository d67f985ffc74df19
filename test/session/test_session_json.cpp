#include <catch2/catch_test_macros.hpp>

#include <querygraph/session/session_json.hpp>

#include <string>

using namespace querygraph;

TEST_CASE("SessionToJson: graph, clauses and SQL", "[session][json]") {
    QuerySession s;
    REQUIRE(s.AddNode("A", {"id", "name"}).IsOk());
    REQUIRE(s.AddNode("B", {"id", "aid"}).IsOk());
    REQUIRE(s.AddJoinEdge("A", "B", JoinType::Left, "A.id=B.aid").IsOk());
    REQUIRE(s.SelectColumn("A", "name").IsOk());
    REQUIRE(s.AddPredicate(PredicateClause::Where, "A.name", "=", "x").IsOk());
    REQUIRE(s.SetLimit(3).IsOk());

    auto j = SessionToJson(s);
    CHECK(j.at("mode") == "SELECT");
    CHECK(j.at("auto_generate") == true);

    const auto& nodes = j.at("graph").at("nodes");
    REQUIRE(nodes.size() == 2);
    CHECK(nodes[0].at("id") == "A");
    CHECK(nodes[0].at("kind") == "table");
    CHECK(nodes[0].at("selected") == nlohmann::json::array({"name"}));
    CHECK(nodes[1].at("dml_target") == false);

    const auto& joins = j.at("graph").at("joins");
    REQUIRE(joins.size() == 1);
    CHECK(joins[0].at("type") == "LEFT");
    CHECK(joins[0].at("condition") == "A.id=B.aid");

    CHECK(j.at("clauses").at("where")[0].at("op") == "=");
    CHECK(j.at("clauses").at("limit") == 3);
    CHECK_FALSE(j.at("clauses").contains("combine"));

    CHECK(j.at("sql").at("text") == s.Output().text);
    CHECK(j.at("sql").at("diagnostic") == false);
    CHECK(j.at("validation").at("status") == "pending");
    CHECK_FALSE(j.contains("imported_body"));
}

TEST_CASE("SessionToJson: DML target, mappings and linked servers", "[session][json]") {
    QuerySession s;
    REQUIRE(s.SetLinkedServerMap({{"X", "LS1"}}).IsOk());
    REQUIRE(s.AddNode("S", {"id", "v"}).IsOk());
    REQUIRE(s.AddNode("T", {"id", "val"}).IsOk());
    REQUIRE(s.MarkDmlTarget("T").IsOk());
    REQUIRE(s.AddMappingEdge("S.v", "T.val").IsOk());
    s.SetOperationMode(OperationMode::Insert);

    auto j = SessionToJson(s);
    CHECK(j.at("mode") == "INSERT");
    CHECK(j.at("linked_servers").at("X") == "LS1");
    CHECK(j.at("graph").at("nodes")[1].at("dml_target") == true);

    const auto& mappings = j.at("graph").at("mappings");
    REQUIRE(mappings.size() == 1);
    CHECK(mappings[0].at("source") == "S.v");
    CHECK(mappings[0].at("target") == "T.val");
}

TEST_CASE("SessionToJson: subquery body, CTEs and imported body", "[session][json]") {
    QuerySession s;
    REQUIRE(s.ImportSql("WITH c AS (SELECT 1 AS x)\nSELECT x FROM c").IsOk());

    auto j = SessionToJson(s);
    REQUIRE(j.at("ctes").size() == 1);
    CHECK(j.at("ctes")[0].at("name") == "c");
    CHECK(j.at("imported_body") == "SELECT x FROM c");

    REQUIRE(s.AddSubqueryNode("sq", "SELECT 2 AS y").IsOk());
    j = SessionToJson(s);
    CHECK(j.at("graph").at("nodes")[0].at("body") == "SELECT 2 AS y");
}

TEST_CASE("ValidationToJson: status and message", "[session][json]") {
    auto j = ValidationToJson(ValidationResult{ValidationStatus::Invalid, "missing SELECT columns"});
    CHECK(j.at("status") == "invalid");
    CHECK(j.at("message") == "missing SELECT columns");
}
