#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <utility>

namespace querygraph {

// alias -> linked server name.
using LinkedServerMap = std::map<std::string, std::string>;

struct RewriteResult {
    std::string text;
    std::size_t rewritten = 0;
};

// ---------------------------------------------------------------------------
// IdentifierRewriter: cross-database name rewriting for FROM/JOIN text.
//
// A token is a maximal run of characters that are neither whitespace nor one
// of "(),=<>!;". A token of exactly three identifier parts
// "<alias>.<database>.<table>" whose alias is in the map becomes
// "[<server>].[<database>].dbo.[<table>]". Every other token, and every
// delimiter, is copied unchanged.
// ---------------------------------------------------------------------------
class IdentifierRewriter {
public:
    IdentifierRewriter() = default;
    explicit IdentifierRewriter(LinkedServerMap servers) : servers_(std::move(servers)) {}

    [[nodiscard]] RewriteResult Rewrite(std::string_view text) const;

    // Rewrites a single token, or returns it unchanged.
    [[nodiscard]] std::string RewriteToken(std::string_view token) const;

    [[nodiscard]] bool Empty() const noexcept { return servers_.empty(); }
    [[nodiscard]] const LinkedServerMap& Servers() const noexcept { return servers_; }

private:
    LinkedServerMap servers_;
};

} // namespace querygraph
