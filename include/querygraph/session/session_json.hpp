#pragma once

#include <querygraph/session/query_session.hpp>

#include <nlohmann/json.hpp>

namespace querygraph {

// Snapshot of a session: graph, clause state, CTEs, linked servers, the last
// generated SQL and its validation status.
[[nodiscard]] nlohmann::json SessionToJson(const QuerySession& session);

[[nodiscard]] nlohmann::json ValidationToJson(const ValidationResult& validation);

} // namespace querygraph
