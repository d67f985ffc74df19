#include <querygraph/sql/sql_tokenizer.hpp>

#include <querygraph/core/types.hpp>

#include <array>
#include <cctype>

namespace querygraph {

namespace {

constexpr std::array<const char*, 56> kKeywords = {
    "ALL",      "AND",     "AS",       "ASC",       "BETWEEN",  "BY",       "CASE",
    "CROSS",    "DELETE",  "DESC",     "DISTINCT",  "ELSE",     "END",      "EXCEPT",
    "EXISTS",   "FETCH",   "FROM",     "FULL",      "GROUP",    "HAVING",   "IN",
    "INNER",    "INSERT",  "INTERSECT", "INTO",     "IS",       "JOIN",     "LEFT",
    "LIKE",     "LIMIT",   "NEXT",     "NOT",       "NULL",     "OFFSET",   "ON",
    "ONLY",     "OR",      "ORDER",    "OUTER",     "OVER",     "PARTITION", "RIGHT",
    "ROWS",     "SELECT",  "SET",      "THEN",      "TOP",      "UNION",    "UPDATE",
    "USING",    "VALUES",  "WHEN",     "WHERE",     "WITH",     "APPLY",    "PERCENT",
};

// Bytes >= 0x80 belong to UTF-8 sequences and are accepted in names.
bool IsHighBit(char c) {
    return static_cast<unsigned char>(c) >= 0x80;
}

bool IsIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '@' || c == '#' ||
           IsHighBit(c);
}

bool IsIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '@' || c == '#' ||
           c == '$' || IsHighBit(c);
}

Result<std::vector<SqlToken>, Error> LexError(std::size_t offset, const std::string& what) {
    return Result<std::vector<SqlToken>, Error>::Err(Error{
        "TokenizeSql", "offset " + std::to_string(offset), what, ErrorCategory::Parse});
}

} // anonymous namespace

bool IsSqlKeyword(std::string_view word) {
    const auto upper = NormalizeKeyword(word);
    for (const char* kw : kKeywords) {
        if (upper == kw) {
            return true;
        }
    }
    return false;
}

Result<std::vector<SqlToken>, Error> TokenizeSql(std::string_view sql) {
    std::vector<SqlToken> tokens;
    const auto n = sql.size();
    std::size_t i = 0;

    while (i < n) {
        const char c = sql[i];

        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }

        // -- line comment
        if (c == '-' && i + 1 < n && sql[i + 1] == '-') {
            while (i < n && sql[i] != '\n') {
                ++i;
            }
            continue;
        }

        // /* block comment */
        if (c == '/' && i + 1 < n && sql[i + 1] == '*') {
            const auto end = sql.find("*/", i + 2);
            if (end == std::string_view::npos) {
                return LexError(i, "Unterminated block comment");
            }
            i = end + 2;
            continue;
        }

        // 'string' with '' as an escaped quote
        if (c == '\'') {
            const auto start = i++;
            bool closed = false;
            while (i < n) {
                if (sql[i] == '\'') {
                    if (i + 1 < n && sql[i + 1] == '\'') {
                        i += 2;
                        continue;
                    }
                    ++i;
                    closed = true;
                    break;
                }
                ++i;
            }
            if (!closed) {
                return LexError(start, "Unterminated string literal");
            }
            tokens.push_back(SqlToken{SqlTokenKind::String,
                                      std::string(sql.substr(start, i - start)), start});
            continue;
        }

        // [bracketed] or "double-quoted" identifier
        if (c == '[' || c == '"') {
            const char close = c == '[' ? ']' : '"';
            const auto end = sql.find(close, i + 1);
            if (end == std::string_view::npos) {
                return LexError(i, c == '[' ? "Unterminated bracketed identifier"
                                            : "Unterminated quoted identifier");
            }
            tokens.push_back(SqlToken{SqlTokenKind::QuotedIdentifier,
                                      std::string(sql.substr(i, end - i + 1)), i});
            i = end + 1;
            continue;
        }

        if (std::isdigit(static_cast<unsigned char>(c))) {
            const auto start = i;
            while (i < n && (std::isdigit(static_cast<unsigned char>(sql[i])) || sql[i] == '.')) {
                ++i;
            }
            tokens.push_back(SqlToken{SqlTokenKind::Number,
                                      std::string(sql.substr(start, i - start)), start});
            continue;
        }

        if (IsIdentStart(c)) {
            const auto start = i;
            while (i < n && IsIdentChar(sql[i])) {
                ++i;
            }
            const auto word = sql.substr(start, i - start);
            if (IsSqlKeyword(word)) {
                tokens.push_back(SqlToken{SqlTokenKind::Keyword, NormalizeKeyword(word), start});
            } else {
                tokens.push_back(SqlToken{SqlTokenKind::Identifier, std::string(word), start});
            }
            continue;
        }

        if (c == '<' || c == '>' || c == '!') {
            if (i + 1 < n && (sql[i + 1] == '=' || (c == '<' && sql[i + 1] == '>'))) {
                tokens.push_back(SqlToken{SqlTokenKind::Operator,
                                          std::string(sql.substr(i, 2)), i});
                i += 2;
                continue;
            }
            if (c == '!') {
                return LexError(i, "Unexpected character '!'");
            }
            tokens.push_back(SqlToken{SqlTokenKind::Operator, std::string(1, c), i});
            ++i;
            continue;
        }

        switch (c) {
            case '=': case '+': case '-': case '*': case '/': case '%':
                tokens.push_back(SqlToken{SqlTokenKind::Operator, std::string(1, c), i});
                ++i;
                continue;
            case '(': case ')': case ',': case ';': case '.':
                tokens.push_back(SqlToken{SqlTokenKind::Punctuation, std::string(1, c), i});
                ++i;
                continue;
            default:
                break;
        }

        return LexError(i, std::string("Unexpected character '") + c + "'");
    }

    return Result<std::vector<SqlToken>, Error>::Ok(std::move(tokens));
}

} // namespace querygraph
