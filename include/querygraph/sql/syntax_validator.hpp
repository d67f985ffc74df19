#pragma once

#include <string>
#include <string_view>

namespace querygraph {

enum class ValidationStatus {
    Pending, // generated, waiting for the debounce interval
    Valid,
    Invalid,
    Empty,   // nothing to validate (no text, or comments only)
};

std::string ValidationStatusName(ValidationStatus status);

struct ValidationResult {
    ValidationStatus status = ValidationStatus::Pending;
    std::string message;

    [[nodiscard]] bool Ok() const noexcept { return status == ValidationStatus::Valid; }
};

// ---------------------------------------------------------------------------
// ValidateSql: advisory syntax check.
//
// Lexes the text, checks that parentheses balance, and checks the shape of
// the leading statement (after any WITH list): a SELECT needs select items and
// a FROM source, INSERT needs INTO <table>, UPDATE needs SET, DELETE needs
// FROM <table>. No name resolution or type checking.
// ---------------------------------------------------------------------------
[[nodiscard]] ValidationResult ValidateSql(std::string_view sql);

} // namespace querygraph
