#pragma once

#include "../config.hpp"
#include "../core.hpp"
#include "../node.hpp"
#include "percent.hpp"
#include <string>
#include <vector>

namespace co::form::urlencoded {

// =============================================================================
// Flat Wire Serializer (node -> application/x-www-form-urlencoded)
// =============================================================================

class serializer {
public:
    explicit serializer(nesting_strategy nesting = nesting_strategy::accumulate,
                        key_ordering ordering = key_ordering::sorted);

    // Percent-encoded wire text, pairs joined with '&'
    result<std::string> serialize(const node& tree) const;

    // Decoded pairs in wire order
    result<std::vector<field_pair>> pairs(const node& tree) const;

    nesting_strategy nesting() const noexcept { return nesting_; }
    key_ordering ordering() const noexcept { return ordering_; }

private:
    result<void> flatten_accumulate(const node& tree, std::vector<field_pair>& out) const;
    result<void> flatten_brackets(const node& current, path& where, const std::string& prefix,
                                  std::vector<field_pair>& out) const;

    std::vector<const node::entry*> ordered_entries(const node& mapping) const;

    nesting_strategy nesting_;
    key_ordering ordering_;
};

} // namespace co::form::urlencoded

// Include implementation
#include "serializer_impl.hpp"
