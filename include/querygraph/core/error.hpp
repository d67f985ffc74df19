#pragma once

#include <ostream>
#include <string>

namespace querygraph {

// ---------------------------------------------------------------------------
// ErrorCategory: classifies errors for exit codes and structured output.
//
// Structural graph errors (NodeNotFound, DuplicateNode, InvalidMapping,
// InvalidArgument) fail the mutating call and leave the model unchanged.
// DML generation problems are never errors: they degrade to comment text.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    NodeNotFound,
    DuplicateNode,
    InvalidMapping,
    InvalidArgument,
    Parse,
    Config,
    Io,
    Execution,
    Internal,
};

/// snake_case name used in JSON output ("node_not_found", "io", ...).
const char* ErrorCategoryName(ErrorCategory category);

/// Process exit code for a command that fails with `category`.
int ErrorCategoryExitCode(ErrorCategory category);

struct Error {
    std::string operation; // "AddJoinEdge", "LoadSession", ...
    std::string subject;   // node id, edge reference, file path, ...
    std::string message;
    ErrorCategory category = ErrorCategory::Internal;

    [[nodiscard]] int ExitCode() const { return ErrorCategoryExitCode(category); }
    [[nodiscard]] std::string CategoryName() const { return ErrorCategoryName(category); }

    // Copy with "<context>: " in front of the message, e.g. "joins[2]: ...".
    [[nodiscard]] Error Within(const std::string& context) const;

    // "operation [subject]: message"
    [[nodiscard]] std::string ToString() const;

    // {"error":{"category","operation","subject"?,"message","exit_code"}}
    [[nodiscard]] std::string ToJson() const;

    bool operator==(const Error& other) const {
        return category == other.category && operation == other.operation &&
               subject == other.subject && message == other.message;
    }
    bool operator!=(const Error& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, const Error& error);

} // namespace querygraph
