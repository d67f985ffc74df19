#pragma once

#include <querygraph/core/result.hpp>
#include <querygraph/session/query_session.hpp>

#include <string_view>

namespace querygraph {

// ---------------------------------------------------------------------------
// Session documents (YAML).
//
//   mode: update                     # select | insert | update | delete
//   auto_generate: true
//   linked_servers: {X: LS1}
//   nodes:
//     - {id: A, columns: [id, name], selected: [id]}
//     - {id: T, columns: [id, val], dml_target: true}
//     - {id: sq, kind: subquery, body: "SELECT 1 AS id"}
//   joins:    [{left: A, right: B, type: inner, condition: "A.id=B.aid"}]
//   mappings: [{source: S.v, target: T.val}]
//   where:    [{column: status, op: IN, value: "'A','B'"}]
//   having, group_by, aggregates, order_by, limit, offset,
//   derived_columns, window_functions, combine, ctes
//
// Every entry is applied through the session's own mutation calls, so a
// structural problem fails with the same category it would have
// interactively; the message is prefixed with the entry's location
// ("joins[1]: ..."). The target session is only replaced when the whole
// document applies; on success it has been regenerated.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<void, Error> LoadSessionFromString(std::string_view yaml_text,
                                                        QuerySession& session);
[[nodiscard]] Result<void, Error> LoadSessionFromFile(std::string_view file_path,
                                                      QuerySession& session);

} // namespace querygraph
