#include <querygraph/sql/sql_importer.hpp>

#include <querygraph/core/log.hpp>
#include <querygraph/sql/sql_tokenizer.hpp>

namespace querygraph {

namespace {

std::string Trim(std::string_view s) {
    const auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return "";
    }
    const auto end = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(start, end - start + 1));
}

Result<ImportedSql, Error> ImportError(const std::string& message) {
    return Result<ImportedSql, Error>::Err(
        Error{"ImportSql", "WITH", message, ErrorCategory::Parse});
}

bool IsPunct(const std::vector<SqlToken>& t, size_t i, char ch) {
    return i < t.size() && t[i].kind == SqlTokenKind::Punctuation && t[i].text[0] == ch;
}

// Index of the ')' matching the '(' at `open`, or t.size().
size_t MatchParen(const std::vector<SqlToken>& t, size_t open) {
    int depth = 0;
    for (size_t i = open; i < t.size(); ++i) {
        if (IsPunct(t, i, '(')) {
            ++depth;
        } else if (IsPunct(t, i, ')') && --depth == 0) {
            return i;
        }
    }
    return t.size();
}

std::string Unquote(const std::string& name) {
    if (name.size() >= 2 && (name.front() == '[' || name.front() == '"')) {
        return name.substr(1, name.size() - 2);
    }
    return name;
}

} // anonymous namespace

Result<ImportedSql, Error> ImportSql(std::string_view sql) {
    if (sql.find_first_not_of(" \t\r\n") == std::string_view::npos) {
        return Result<ImportedSql, Error>::Err(
            Error{"ImportSql", "", "Nothing to import", ErrorCategory::InvalidArgument});
    }

    auto lexed = TokenizeSql(sql);
    if (lexed.IsErr()) {
        auto err = std::move(lexed).Error();
        err.operation = "ImportSql";
        return Result<ImportedSql, Error>::Err(std::move(err));
    }
    const auto& t = lexed.Value();

    ImportedSql imported;
    if (t.empty() || t[0].kind != SqlTokenKind::Keyword || t[0].text != "WITH") {
        imported.body = Trim(sql);
        return Result<ImportedSql, Error>::Ok(std::move(imported));
    }

    size_t j = 1;
    while (true) {
        if (j >= t.size() || (t[j].kind != SqlTokenKind::Identifier &&
                              t[j].kind != SqlTokenKind::QuotedIdentifier)) {
            return ImportError("Expected a CTE name after WITH");
        }
        const auto name = Unquote(t[j].text);
        ++j;
        if (IsPunct(t, j, '(')) {
            j = MatchParen(t, j) + 1;
        }
        if (j >= t.size() || t[j].kind != SqlTokenKind::Keyword || t[j].text != "AS") {
            return ImportError("CTE " + name + " is missing AS");
        }
        ++j;
        if (!IsPunct(t, j, '(')) {
            return ImportError("CTE " + name + " body must be enclosed in parentheses");
        }
        const auto close = MatchParen(t, j);
        if (close >= t.size()) {
            return ImportError("CTE " + name + " body is not closed");
        }
        const auto body_start = t[j].offset + 1;
        imported.ctes.push_back(
            CteDefinition{name, Trim(sql.substr(body_start, t[close].offset - body_start))});
        j = close + 1;
        if (IsPunct(t, j, ',')) {
            ++j;
            continue;
        }
        break;
    }

    if (j >= t.size()) {
        return ImportError("WITH list is not followed by a statement");
    }
    imported.body = Trim(sql.substr(t[j].offset));
    LogInfo("session", "Imported " + std::to_string(imported.ctes.size()) +
                           " CTE(s) and a " + std::to_string(imported.body.size()) +
                           "-character body");
    return Result<ImportedSql, Error>::Ok(std::move(imported));
}

} // namespace querygraph
