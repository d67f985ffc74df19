#pragma once

#include <querygraph/core/result.hpp>

#include <string>
#include <vector>

namespace querygraph {

struct CteDefinition {
    std::string name;
    std::string body;  // opaque, never parsed
};

// ---------------------------------------------------------------------------
// CteInliner: ordered, name-unique set of CTE definitions and the WITH
// prefix built from them:
//
//   WITH n1 AS (
//   <b1>
//   ),
//     n2 AS (
//   <b2>
//   )
//   <main>
// ---------------------------------------------------------------------------
class CteInliner {
public:
    [[nodiscard]] Result<void, Error> AddCte(const std::string& name, const std::string& body);
    [[nodiscard]] Result<void, Error> RemoveCte(const std::string& name);
    void Clear() { ctes_.clear(); }

    [[nodiscard]] const std::vector<CteDefinition>& Definitions() const noexcept { return ctes_; }
    [[nodiscard]] bool Empty() const noexcept { return ctes_.empty(); }

    // Returns `main` unchanged when no CTE is defined.
    [[nodiscard]] std::string Apply(const std::string& main) const;

private:
    std::vector<CteDefinition> ctes_;
};

} // namespace querygraph
