#pragma once

#include <optional>

namespace querygraph {

enum class OutputStream {
    Stdout, // tables, SQL text, validation status
    Stderr, // log lines and error reports
};

// Escape sequences, named by what they mark rather than by color.
namespace style {

inline constexpr const char* kReset   = "\033[0m";
inline constexpr const char* kHeading = "\033[1m";
inline constexpr const char* kMuted   = "\033[90m";
inline constexpr const char* kFailure = "\033[1;31m";
inline constexpr const char* kSuccess = "\033[1;32m";
inline constexpr const char* kWarning = "\033[33m";
inline constexpr const char* kNotice  = "\033[36m";

} // namespace style

/// True if `stream` is attached to a terminal.
bool IsTerminal(OutputStream stream);

/// True if NO_COLOR is set to a non-empty value (https://no-color.org/).
bool NoColorEnvSet();

/// Decide whether to emit escape sequences on `stream`. NO_COLOR always
/// disables color; otherwise an explicit choice wins over terminal detection.
bool ColorEnabled(OutputStream stream, std::optional<bool> explicit_choice);

} // namespace querygraph
