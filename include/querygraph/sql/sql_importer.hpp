#pragma once

#include <querygraph/core/result.hpp>
#include <querygraph/sql/cte_inliner.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace querygraph {

struct ImportedSql {
    std::vector<CteDefinition> ctes;
    std::string body;  // the statement after the WITH list, kept as literal text
};

// ---------------------------------------------------------------------------
// ImportSql: partial re-import of an existing statement.
//
// A leading WITH list is split into CTE name/body pairs; everything after it
// is retained verbatim as the body. The body is never decomposed back into
// nodes or edges. Fails with Parse on text the lexer rejects or on a
// malformed WITH list, and with InvalidArgument on empty input.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<ImportedSql, Error> ImportSql(std::string_view sql);

} // namespace querygraph
