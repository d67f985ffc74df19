#include <querygraph/sql/identifier_rewriter.hpp>

#include <querygraph/core/log.hpp>

#include <cctype>
#include <vector>

namespace querygraph {

namespace {

bool IsDelimiter(char c) {
    if (std::isspace(static_cast<unsigned char>(c))) {
        return true;
    }
    switch (c) {
        case '(': case ')': case ',': case '=':
        case '<': case '>': case '!': case ';':
            return true;
        default:
            return false;
    }
}

bool IsIdentifierPart(std::string_view part) {
    if (part.empty() || std::isdigit(static_cast<unsigned char>(part.front()))) {
        return false;
    }
    for (char c : part) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return true;
}

std::vector<std::string_view> SplitDots(std::string_view token) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        const auto dot = token.find('.', start);
        if (dot == std::string_view::npos) {
            parts.push_back(token.substr(start));
            return parts;
        }
        parts.push_back(token.substr(start, dot - start));
        start = dot + 1;
    }
}

} // anonymous namespace

std::string IdentifierRewriter::RewriteToken(std::string_view token) const {
    const auto parts = SplitDots(token);
    if (parts.size() != 3) {
        return std::string(token);
    }
    for (const auto& part : parts) {
        if (!IsIdentifierPart(part)) {
            return std::string(token);
        }
    }
    auto it = servers_.find(std::string(parts[0]));
    if (it == servers_.end()) {
        return std::string(token);
    }
    return "[" + it->second + "].[" + std::string(parts[1]) + "].dbo.[" +
           std::string(parts[2]) + "]";
}

RewriteResult IdentifierRewriter::Rewrite(std::string_view text) const {
    RewriteResult result;
    if (servers_.empty()) {
        result.text = std::string(text);
        return result;
    }

    result.text.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (IsDelimiter(text[i])) {
            result.text += text[i];
            ++i;
            continue;
        }
        const auto start = i;
        while (i < text.size() && !IsDelimiter(text[i])) {
            ++i;
        }
        const auto token = text.substr(start, i - start);
        auto rewritten = RewriteToken(token);
        if (rewritten != token) {
            ++result.rewritten;
        }
        result.text += rewritten;
    }

    if (result.rewritten > 0 && LogEnabled(LogLevel::Debug)) {
        LogDebug("rewrite", "Rewrote " + std::to_string(result.rewritten) +
                                " identifier(s) to linked-server references");
    }
    return result;
}

} // namespace querygraph
