#include <catch2/catch_test_macros.hpp>

#include <querygraph/sql/syntax_validator.hpp>

#include <string>

using namespace querygraph;

// ===========================================================================
// Valid statements
// ===========================================================================

TEST_CASE("ValidateSql: generated SELECT shapes are valid", "[validator]") {
    CHECK(ValidateSql("SELECT A.id, A.name\nFROM A\nINNER JOIN B ON A.id=B.aid").Ok());
    CHECK(ValidateSql("SELECT *\nFROM T\nWHERE status IN ('A','B')").Ok());
    CHECK(ValidateSql("SELECT TOP 10 * FROM T;").Ok());
    CHECK(ValidateSql("SELECT a FROM (\nSELECT a FROM b\n) AS sq").Ok());
    CHECK(ValidateSql("SELECT id FROM A\nUNION ALL\n(\nSELECT id FROM B\n)").Ok());
}

TEST_CASE("ValidateSql: DML statements", "[validator]") {
    CHECK(ValidateSql("INSERT INTO T (a, b)\nSELECT S.a, S.b\nFROM S").Ok());
    CHECK(ValidateSql("INSERT INTO T (a) VALUES (1)").Ok());
    CHECK(ValidateSql("UPDATE T\nSET val=src.v\nFROM (\nSELECT S.v\nFROM S\n) AS src\n"
                      "WHERE T.id=src.id").Ok());
    CHECK(ValidateSql("DELETE FROM T\nWHERE id IN (\nSELECT S.id\nFROM S\n)").Ok());
}

TEST_CASE("ValidateSql: WITH list before the statement", "[validator]") {
    auto r = ValidateSql("WITH a AS (\nSELECT 1 AS x FROM t\n),\n  b (y) AS (\nSELECT y FROM u\n)\n"
                         "SELECT * FROM a");
    CHECK(r.status == ValidationStatus::Valid);
    CHECK(r.message == "Syntax OK");
}

TEST_CASE("ValidateSql: linked-server names are valid", "[validator]") {
    CHECK(ValidateSql("SELECT * FROM [LS1].[db1].dbo.[tbl1]").Ok());
}

TEST_CASE("ValidateSql: UTF-8 column names are valid", "[validator]") {
    auto r = ValidateSql("SELECT A.\xC3\xBCn\xC3\xAF FROM A");
    CHECK(r.status == ValidationStatus::Valid);
    CHECK(r.message == "Syntax OK");
}

// ===========================================================================
// Empty input
// ===========================================================================

TEST_CASE("ValidateSql: whitespace and comments are Empty", "[validator]") {
    CHECK(ValidateSql("").status == ValidationStatus::Empty);
    CHECK(ValidateSql("  \n").status == ValidationStatus::Empty);
    CHECK(ValidateSql("-- No tables selected on canvas => no SELECT.").status ==
          ValidationStatus::Empty);
}

// ===========================================================================
// Invalid statements
// ===========================================================================

TEST_CASE("ValidateSql: SELECT problems", "[validator]") {
    auto no_cols = ValidateSql("SELECT FROM T");
    CHECK(no_cols.status == ValidationStatus::Invalid);
    CHECK(no_cols.message == "missing SELECT columns");

    auto no_from = ValidateSql("SELECT a, b");
    CHECK(no_from.status == ValidationStatus::Invalid);
    CHECK(no_from.message == "no tables found in FROM");
}

TEST_CASE("ValidateSql: one FROM block per SELECT", "[validator]") {
    auto r = ValidateSql("SELECT *\nFROM A\nINNER JOIN C ON A.x=C.z\nFROM B");
    CHECK(r.status == ValidationStatus::Invalid);
    CHECK(r.message == "multiple FROM blocks (disconnected join graph)");

    // nested and combined SELECTs keep their own FROM
    CHECK(ValidateSql("SELECT a FROM t WHERE a IN (SELECT b FROM u)").Ok());
    CHECK(ValidateSql("SELECT id FROM A\nUNION\nSELECT id FROM B").Ok());
}

TEST_CASE("ValidateSql: unbalanced parentheses", "[validator]") {
    auto open = ValidateSql("SELECT a FROM (SELECT b FROM c");
    CHECK(open.status == ValidationStatus::Invalid);
    CHECK(open.message.find("Unbalanced parentheses") != std::string::npos);

    CHECK_FALSE(ValidateSql("SELECT a) FROM b").Ok());
}

TEST_CASE("ValidateSql: DML problems", "[validator]") {
    CHECK(ValidateSql("INSERT T SELECT a FROM b").message ==
          "INSERT must be followed by INTO <table>");
    CHECK(ValidateSql("UPDATE T WHERE id = 1").message == "UPDATE is missing SET");
    CHECK(ValidateSql("DELETE T").message == "DELETE must be followed by FROM <table>");
}

TEST_CASE("ValidateSql: unknown leading keyword", "[validator]") {
    auto r = ValidateSql("MERGE INTO T");
    CHECK(r.status == ValidationStatus::Invalid);
    CHECK(r.message.find("Statement must start with") != std::string::npos);
}

TEST_CASE("ValidateSql: dangling clause keyword", "[validator]") {
    auto r = ValidateSql("SELECT a FROM b WHERE");
    CHECK(r.status == ValidationStatus::Invalid);
    CHECK(r.message == "Unexpected end of statement after WHERE");
    CHECK_FALSE(ValidateSql("SELECT a FROM b WHERE x =").Ok());
}

TEST_CASE("ValidateSql: lexer errors are reported as Invalid", "[validator]") {
    auto r = ValidateSql("SELECT 'abc FROM t");
    CHECK(r.status == ValidationStatus::Invalid);
    CHECK(r.message == "Unterminated string literal at offset 7");
}

TEST_CASE("ValidationStatusName: lower-case names", "[validator]") {
    CHECK(ValidationStatusName(ValidationStatus::Valid) == "valid");
    CHECK(ValidationStatusName(ValidationStatus::Empty) == "empty");
}
