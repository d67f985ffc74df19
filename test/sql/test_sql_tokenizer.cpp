#include <catch2/catch_test_macros.hpp>

#include <querygraph/sql/sql_tokenizer.hpp>

#include <string>
#include <vector>

using namespace querygraph;

namespace {

std::vector<SqlTokenKind> Kinds(const std::vector<SqlToken>& tokens) {
    std::vector<SqlTokenKind> kinds;
    for (const auto& t : tokens) {
        kinds.push_back(t.kind);
    }
    return kinds;
}

} // anonymous namespace

TEST_CASE("IsSqlKeyword: case-insensitive", "[tokenizer]") {
    CHECK(IsSqlKeyword("select"));
    CHECK(IsSqlKeyword("Join"));
    CHECK_FALSE(IsSqlKeyword("orders"));
    CHECK_FALSE(IsSqlKeyword("COUNT"));
}

TEST_CASE("TokenizeSql: simple SELECT", "[tokenizer]") {
    auto r = TokenizeSql("select A.id, 42 from A where x >= 'it''s'");
    REQUIRE(r.IsOk());
    const auto& t = r.Value();

    REQUIRE(t.size() == 12);
    CHECK(t[0].text == "SELECT");
    CHECK(t[0].kind == SqlTokenKind::Keyword);
    CHECK(t[1].text == "A");
    CHECK(t[2].kind == SqlTokenKind::Punctuation);
    CHECK(t[5].kind == SqlTokenKind::Number);
    CHECK(t[10].text == ">=");
    CHECK(t[10].kind == SqlTokenKind::Operator);
    CHECK(t[11].kind == SqlTokenKind::String);
    CHECK(t[11].text == "'it''s'");
    CHECK(t[11].offset == 34);
}

TEST_CASE("TokenizeSql: quoted identifiers keep delimiters", "[tokenizer]") {
    auto r = TokenizeSql("[LS1].[db1].dbo.\"t x\"");
    REQUIRE(r.IsOk());
    CHECK(Kinds(r.Value()) == std::vector<SqlTokenKind>{
                                  SqlTokenKind::QuotedIdentifier, SqlTokenKind::Punctuation,
                                  SqlTokenKind::QuotedIdentifier, SqlTokenKind::Punctuation,
                                  SqlTokenKind::Identifier, SqlTokenKind::Punctuation,
                                  SqlTokenKind::QuotedIdentifier});
    CHECK(r.Value()[0].text == "[LS1]");
    CHECK(r.Value()[6].text == "\"t x\"");
}

TEST_CASE("TokenizeSql: comments are dropped", "[tokenizer]") {
    auto r = TokenizeSql("-- heading\nSELECT /* inline */ 1 -- trailing");
    REQUIRE(r.IsOk());
    REQUIRE(r.Value().size() == 2);
    CHECK(r.Value()[1].text == "1");

    auto only_comment = TokenizeSql("-- No tables selected on canvas => no SELECT.");
    REQUIRE(only_comment.IsOk());
    CHECK(only_comment.Value().empty());
}

TEST_CASE("TokenizeSql: two-character operators", "[tokenizer]") {
    auto r = TokenizeSql("a<>b != c <= d");
    REQUIRE(r.IsOk());
    CHECK(r.Value()[1].text == "<>");
    CHECK(r.Value()[3].text == "!=");
    CHECK(r.Value()[5].text == "<=");
}

TEST_CASE("TokenizeSql: UTF-8 names are identifiers", "[tokenizer]") {
    auto r = TokenizeSql("SELECT A.\xC3\xBCn\xC3\xAF FROM \xC3\xA9t\xC3\xA9");
    REQUIRE(r.IsOk());
    REQUIRE(r.Value().size() == 6);
    CHECK(r.Value()[3].kind == SqlTokenKind::Identifier);
    CHECK(r.Value()[3].text == "\xC3\xBCn\xC3\xAF");
    CHECK(r.Value()[5].kind == SqlTokenKind::Identifier);
    CHECK(r.Value()[5].text == "\xC3\xA9t\xC3\xA9");
}

TEST_CASE("TokenizeSql: lexical errors name the offset", "[tokenizer]") {
    SECTION("unterminated string") {
        auto r = TokenizeSql("SELECT 'abc");
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::Parse);
        CHECK(r.Error().subject == "offset 7");
    }
    SECTION("unterminated bracket") {
        auto r = TokenizeSql("SELECT [abc");
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "Unterminated bracketed identifier");
    }
    SECTION("unterminated block comment") {
        CHECK(TokenizeSql("SELECT /* x").IsErr());
    }
    SECTION("unknown character") {
        auto r = TokenizeSql("SELECT a ? b");
        REQUIRE(r.IsErr());
        CHECK(r.Error().subject == "offset 9");
    }
}
