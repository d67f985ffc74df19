#include <querygraph/core/error.hpp>

#include <nlohmann/json.hpp>

#include <iterator>

namespace querygraph {

namespace {

struct CategoryInfo {
    ErrorCategory category;
    const char* name;
    int exit_code;
};

// Exit code 1 is reserved for routing errors and invalid SQL.
constexpr CategoryInfo kCategories[] = {
    {ErrorCategory::NodeNotFound,    "node_not_found",   2},
    {ErrorCategory::DuplicateNode,   "duplicate_node",   2},
    {ErrorCategory::InvalidMapping,  "invalid_mapping",  3},
    {ErrorCategory::InvalidArgument, "invalid_argument", 4},
    {ErrorCategory::Parse,           "parse",            5},
    {ErrorCategory::Config,          "config",           6},
    {ErrorCategory::Io,              "io",               7},
    {ErrorCategory::Execution,       "execution",        8},
    {ErrorCategory::Internal,        "internal",         99},
};

const CategoryInfo& Lookup(ErrorCategory category) {
    for (const auto& info : kCategories) {
        if (info.category == category) {
            return info;
        }
    }
    return kCategories[std::size(kCategories) - 1];
}

} // anonymous namespace

const char* ErrorCategoryName(ErrorCategory category) {
    return Lookup(category).name;
}

int ErrorCategoryExitCode(ErrorCategory category) {
    return Lookup(category).exit_code;
}

Error Error::Within(const std::string& context) const {
    Error copy = *this;
    copy.message = context + ": " + message;
    return copy;
}

std::string Error::ToString() const {
    std::string text = operation;
    if (!subject.empty()) {
        text += " [" + subject + "]";
    }
    return text + ": " + message;
}

std::string Error::ToJson() const {
    nlohmann::json body = {{"category", CategoryName()}, {"operation", operation}};
    if (!subject.empty()) {
        body["subject"] = subject;
    }
    body["message"] = message;
    body["exit_code"] = ExitCode();
    return nlohmann::json{{"error", std::move(body)}}.dump();
}

std::ostream& operator<<(std::ostream& os, const Error& error) {
    return os << error.ToString();
}

} // namespace querygraph
