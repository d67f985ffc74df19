#include <querygraph/sql/syntax_validator.hpp>

#include <querygraph/core/log.hpp>
#include <querygraph/sql/sql_tokenizer.hpp>

#include <optional>
#include <vector>

namespace querygraph {

namespace {

using Tokens = std::vector<SqlToken>;
using Problem = std::optional<std::string>;

constexpr size_t kNpos = static_cast<size_t>(-1);

bool IsKeyword(const Tokens& t, size_t i, const char* kw) {
    return i < t.size() && t[i].kind == SqlTokenKind::Keyword && t[i].text == kw;
}

bool IsPunct(const Tokens& t, size_t i, char ch) {
    return i < t.size() && t[i].kind == SqlTokenKind::Punctuation && t[i].text[0] == ch;
}

bool IsName(const Tokens& t, size_t i) {
    return i < t.size() && (t[i].kind == SqlTokenKind::Identifier ||
                            t[i].kind == SqlTokenKind::QuotedIdentifier);
}

// Index of the ')' matching the '(' at `open`, or kNpos.
size_t MatchParen(const Tokens& t, size_t open) {
    int depth = 0;
    for (size_t i = open; i < t.size(); ++i) {
        if (IsPunct(t, i, '(')) {
            ++depth;
        } else if (IsPunct(t, i, ')')) {
            if (--depth == 0) {
                return i;
            }
        }
    }
    return kNpos;
}

// First top-level occurrence of `kw` at or after `from`, stopping at a
// top-level set operator or ';'.
size_t FindTopLevel(const Tokens& t, size_t from, const char* kw) {
    int depth = 0;
    for (size_t i = from; i < t.size(); ++i) {
        if (IsPunct(t, i, '(')) {
            ++depth;
            continue;
        }
        if (IsPunct(t, i, ')')) {
            --depth;
            continue;
        }
        if (depth != 0) {
            continue;
        }
        if (IsKeyword(t, i, kw)) {
            return i;
        }
        if (IsPunct(t, i, ';') || IsKeyword(t, i, "UNION") ||
            IsKeyword(t, i, "INTERSECT") || IsKeyword(t, i, "EXCEPT")) {
            return kNpos;
        }
    }
    return kNpos;
}

Problem CheckParentheses(const Tokens& t) {
    int depth = 0;
    for (const auto& tok : t) {
        if (tok.kind != SqlTokenKind::Punctuation) {
            continue;
        }
        if (tok.text == "(") {
            ++depth;
        } else if (tok.text == ")" && --depth < 0) {
            return "Unbalanced parentheses: unexpected ')' at offset " +
                   std::to_string(tok.offset);
        }
    }
    if (depth > 0) {
        return "Unbalanced parentheses: " + std::to_string(depth) + " unclosed '('";
    }
    return std::nullopt;
}

Problem CheckSelect(const Tokens& t, size_t i) {
    size_t j = i + 1;
    if (IsKeyword(t, j, "DISTINCT") || IsKeyword(t, j, "ALL")) {
        ++j;
    }
    if (IsKeyword(t, j, "TOP")) {
        ++j;
        if (IsPunct(t, j, '(')) {
            const auto close = MatchParen(t, j);
            j = close == kNpos ? t.size() : close + 1;
        } else {
            ++j;
        }
        if (IsKeyword(t, j, "PERCENT")) {
            ++j;
        }
    }
    if (j >= t.size() || IsKeyword(t, j, "FROM") || IsPunct(t, j, ';')) {
        return std::string("missing SELECT columns");
    }
    const auto from = FindTopLevel(t, j, "FROM");
    if (from == kNpos || !(IsName(t, from + 1) || IsPunct(t, from + 1, '('))) {
        return std::string("no tables found in FROM");
    }
    if (FindTopLevel(t, from + 1, "FROM") != kNpos) {
        return std::string("multiple FROM blocks (disconnected join graph)");
    }
    return std::nullopt;
}

Problem CheckInsert(const Tokens& t, size_t i) {
    if (!IsKeyword(t, i + 1, "INTO") || !IsName(t, i + 2)) {
        return std::string("INSERT must be followed by INTO <table>");
    }
    for (size_t j = i + 3; j < t.size(); ++j) {
        if (IsKeyword(t, j, "VALUES")) {
            return std::nullopt;
        }
        if (IsKeyword(t, j, "SELECT")) {
            return CheckSelect(t, j);
        }
    }
    return std::string("INSERT has no SELECT or VALUES source");
}

Problem CheckUpdate(const Tokens& t, size_t i) {
    if (!IsName(t, i + 1)) {
        return std::string("UPDATE must name a table");
    }
    const auto set = FindTopLevel(t, i + 2, "SET");
    if (set == kNpos) {
        return std::string("UPDATE is missing SET");
    }
    if (!IsName(t, set + 1)) {
        return std::string("SET list is empty");
    }
    return std::nullopt;
}

Problem CheckDelete(const Tokens& t, size_t i) {
    if (!IsKeyword(t, i + 1, "FROM") || !IsName(t, i + 2)) {
        return std::string("DELETE must be followed by FROM <table>");
    }
    return std::nullopt;
}

Problem CheckStatement(const Tokens& t, size_t i) {
    if (IsKeyword(t, i, "SELECT")) return CheckSelect(t, i);
    if (IsKeyword(t, i, "INSERT")) return CheckInsert(t, i);
    if (IsKeyword(t, i, "UPDATE")) return CheckUpdate(t, i);
    if (IsKeyword(t, i, "DELETE")) return CheckDelete(t, i);
    if (IsPunct(t, i, '(')) {
        // "(SELECT ...)" as a whole statement
        return CheckStatement(t, i + 1);
    }
    return std::string("Statement must start with SELECT, WITH, INSERT, UPDATE or DELETE");
}

Problem CheckWith(const Tokens& t, size_t i) {
    size_t j = i + 1;
    while (true) {
        if (!IsName(t, j)) {
            return std::string("WITH must be followed by a CTE name");
        }
        const auto name = t[j].text;
        ++j;
        if (IsPunct(t, j, '(')) {
            // optional column list
            j = MatchParen(t, j) + 1;
        }
        if (!IsKeyword(t, j, "AS")) {
            return "CTE " + name + " is missing AS";
        }
        ++j;
        if (!IsPunct(t, j, '(')) {
            return "CTE " + name + " body must be enclosed in parentheses";
        }
        j = MatchParen(t, j) + 1;
        if (IsPunct(t, j, ',')) {
            ++j;
            continue;
        }
        break;
    }
    if (j >= t.size()) {
        return std::string("WITH list must be followed by a statement");
    }
    return CheckStatement(t, j);
}

Problem CheckTrailing(const Tokens& t) {
    size_t last = t.size() - 1;
    while (last > 0 && IsPunct(t, last, ';')) {
        --last;
    }
    const auto& tok = t[last];
    if (tok.kind == SqlTokenKind::Operator && tok.text != "*") {
        return "Unexpected end of statement after '" + tok.text + "'";
    }
    if (tok.kind == SqlTokenKind::Punctuation && (tok.text == "," || tok.text == ".")) {
        return "Unexpected end of statement after '" + tok.text + "'";
    }
    if (tok.kind == SqlTokenKind::Keyword) {
        for (const char* kw : {"WHERE", "AND", "OR", "ON", "FROM", "JOIN", "SET", "BY",
                               "HAVING", "SELECT", "INTO", "UNION", "INTERSECT", "EXCEPT"}) {
            if (tok.text == kw) {
                return "Unexpected end of statement after " + tok.text;
            }
        }
    }
    return std::nullopt;
}

} // anonymous namespace

std::string ValidationStatusName(ValidationStatus status) {
    switch (status) {
        case ValidationStatus::Pending: return "pending";
        case ValidationStatus::Valid:   return "valid";
        case ValidationStatus::Invalid: return "invalid";
        case ValidationStatus::Empty:   return "empty";
    }
    return "pending";
}

ValidationResult ValidateSql(std::string_view sql) {
    if (sql.find_first_not_of(" \t\r\n") == std::string_view::npos) {
        return ValidationResult{ValidationStatus::Empty, "No SQL to validate."};
    }

    auto lexed = TokenizeSql(sql);
    if (lexed.IsErr()) {
        const auto& err = lexed.Error();
        LogDebug("validate", err.ToString());
        return ValidationResult{ValidationStatus::Invalid, err.message + " at " + err.subject};
    }
    const auto& tokens = lexed.Value();
    if (tokens.empty()) {
        return ValidationResult{ValidationStatus::Empty, "No SQL to validate."};
    }

    Problem problem = CheckParentheses(tokens);
    if (!problem) {
        problem = IsKeyword(tokens, 0, "WITH") ? CheckWith(tokens, 0) : CheckStatement(tokens, 0);
    }
    if (!problem) {
        problem = CheckTrailing(tokens);
    }

    if (problem) {
        LogDebug("validate", "Invalid: " + *problem);
        return ValidationResult{ValidationStatus::Invalid, *problem};
    }
    return ValidationResult{ValidationStatus::Valid, "Syntax OK"};
}

} // namespace querygraph
