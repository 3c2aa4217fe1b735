#pragma once

#include "../config.hpp"
#include "../core.hpp"
#include "../node.hpp"
#include "concepts.hpp"
#include "record.hpp"

namespace co::form::structure {

// =============================================================================
// Structural Encoder (typed value -> node)
// =============================================================================

class encoder {
public:
    explicit encoder(codec_config config = {});

    // Records become mappings in declaration order, containers become
    // sequences, leaves become scalars formatted by the configured strategies.
    template<typename T>
    result<node> encode(const T& value) const;

    const codec_config& config() const noexcept { return config_; }

private:
    codec_config config_;
};

// Encodes value at ctx.where; used by the encoder and by value_codec
// specializations that need to encode members.
template<typename T>
result<node> encode_value(const T& value, encode_context& ctx);

} // namespace co::form::structure

namespace co::form {

template<typename T>
result<node> to_node(const T& value, const codec_config& config = {});

} // namespace co::form

// Include implementation
#include "encoder_impl.hpp"
