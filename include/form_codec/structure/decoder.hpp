#pragma once

#include "../config.hpp"
#include "../core.hpp"
#include "../node.hpp"
#include "concepts.hpp"
#include "record.hpp"

namespace co::form::structure {

// =============================================================================
// Structural Decoder (node -> typed value)
// =============================================================================

class decoder {
public:
    explicit decoder(codec_config config = {});

    template<typename T>
    result<T> decode(const node& tree) const;

    const codec_config& config() const noexcept { return config_; }

private:
    codec_config config_;
};

// Decodes the node at ctx.where; a null node means the key was absent.
// Accepted shapes per target:
//   scalar    - scalar, or one-element sequence holding a scalar
//   sequence  - sequence, index-keyed mapping, or a scalar as one element
//   std::array- exactly N elements; an index-keyed mapping must be contiguous
//   map       - mapping, sequence (keys "0".."n-1"), or empty scalar
//   optional  - absent or empty scalar is nullopt
//   record    - mapping; absent or empty scalar reads as an empty mapping
template<typename T>
result<T> decode_value(const node* n, decode_context& ctx);

} // namespace co::form::structure

namespace co::form {

template<typename T>
result<T> from_node(const node& tree, const codec_config& config = {});

} // namespace co::form

// Include implementation
#include "decoder_impl.hpp"
