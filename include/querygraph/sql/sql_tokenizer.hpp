#pragma once

#include <querygraph/core/result.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace querygraph {

enum class SqlTokenKind {
    Keyword,          // upper-cased in `text`
    Identifier,
    QuotedIdentifier, // [name] or "name", delimiters kept
    String,           // 'text', quotes kept
    Number,
    Operator,         // = < > <= >= <> != + - * / %
    Punctuation,      // ( ) , ; .
};

struct SqlToken {
    SqlTokenKind kind = SqlTokenKind::Identifier;
    std::string text;
    std::size_t offset = 0;
};

[[nodiscard]] bool IsSqlKeyword(std::string_view word);

// ---------------------------------------------------------------------------
// TokenizeSql: conservative lexer for T-SQL-flavoured text.
//
// "--" line comments and "/* */" block comments are dropped. Fails with a
// Parse error naming the offset of an unterminated string, bracketed or
// double-quoted identifier, or block comment, and of any character the lexer
// does not know.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<std::vector<SqlToken>, Error> TokenizeSql(std::string_view sql);

} // namespace querygraph
