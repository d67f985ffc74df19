#include <querygraph/sql/cte_inliner.hpp>

#include <querygraph/core/log.hpp>

#include <algorithm>
#include <cctype>

namespace querygraph {

namespace {

bool IsCteName(const std::string& name) {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front()))) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    });
}

} // anonymous namespace

Result<void, Error> CteInliner::AddCte(const std::string& name, const std::string& body) {
    if (!IsCteName(name)) {
        return Result<void, Error>::Err(Error{
            "AddCte", name, "CTE name must be a plain identifier",
            ErrorCategory::InvalidArgument});
    }
    if (body.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Result<void, Error>::Err(Error{
            "AddCte", name, "CTE body must not be empty", ErrorCategory::InvalidArgument});
    }
    auto it = std::find_if(ctes_.begin(), ctes_.end(),
                           [&](const CteDefinition& c) { return c.name == name; });
    if (it != ctes_.end()) {
        return Result<void, Error>::Err(Error{
            "AddCte", name, "A CTE with this name already exists",
            ErrorCategory::InvalidArgument});
    }
    ctes_.push_back(CteDefinition{name, body});
    LogDebug("cte", "Added CTE " + name);
    return Result<void, Error>::Ok();
}

Result<void, Error> CteInliner::RemoveCte(const std::string& name) {
    auto it = std::find_if(ctes_.begin(), ctes_.end(),
                           [&](const CteDefinition& c) { return c.name == name; });
    if (it == ctes_.end()) {
        return Result<void, Error>::Err(Error{
            "RemoveCte", name, "No CTE with this name", ErrorCategory::InvalidArgument});
    }
    ctes_.erase(it);
    return Result<void, Error>::Ok();
}

std::string CteInliner::Apply(const std::string& main) const {
    if (ctes_.empty()) {
        return main;
    }
    std::string out = "WITH ";
    for (size_t i = 0; i < ctes_.size(); ++i) {
        if (i > 0) {
            out += ",\n  ";
        }
        out += ctes_[i].name + " AS (\n" + ctes_[i].body + "\n)";
    }
    out += "\n" + main;
    return out;
}

} // namespace querygraph
