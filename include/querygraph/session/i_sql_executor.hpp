#pragma once

#include <querygraph/core/result.hpp>

#include <string>
#include <string_view>

namespace querygraph {

// ---------------------------------------------------------------------------
// ISqlExecutor: hand-off point for running generated SQL.
//
// The session passes the text verbatim; connection management and result
// handling belong to the implementation. Returns a short status line on
// success, an Execution error otherwise. Never throws on expected failures.
// ---------------------------------------------------------------------------
class ISqlExecutor {
public:
    virtual ~ISqlExecutor() = default;

    ISqlExecutor(const ISqlExecutor&) = delete;
    ISqlExecutor& operator=(const ISqlExecutor&) = delete;
    ISqlExecutor(ISqlExecutor&&) = delete;
    ISqlExecutor& operator=(ISqlExecutor&&) = delete;

    [[nodiscard]] virtual Result<std::string, Error> Execute(std::string_view sql) = 0;

protected:
    ISqlExecutor() = default;
};

} // namespace querygraph
