#pragma once

#include "../config.hpp"
#include "../core.hpp"
#include "../node.hpp"
#include "percent.hpp"
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace co::form::urlencoded {

// =============================================================================
// Key Syntax
// =============================================================================

// "[]" in a bracketed key
struct append_segment {
    bool operator==(const append_segment&) const = default;
};

using key_segment = std::variant<std::string, std::size_t, append_segment>;

// Splits "a[b][0][]" into segments. Under brackets every segment is a name;
// under indexed_brackets all-digit segments are indices. A key starting with
// '[' addresses the root container directly.
result<std::vector<key_segment>> parse_key(std::string_view key, nesting_strategy nesting);

// =============================================================================
// Flat Wire Parser (application/x-www-form-urlencoded -> node)
// =============================================================================

class parser {
public:
    explicit parser(nesting_strategy nesting = nesting_strategy::accumulate);

    result<node> parse(std::string_view wire) const;

    // Builds the tree from pairs that are already decoded
    result<node> parse_pairs(const std::vector<field_pair>& pairs) const;

    nesting_strategy nesting() const noexcept { return nesting_; }

private:
    result<node> accumulate(const std::vector<field_pair>& pairs) const;
    result<node> nest(const std::vector<field_pair>& pairs) const;

    nesting_strategy nesting_;
};

} // namespace co::form::urlencoded

// Include implementation
#include "parser_impl.hpp"
