#ifndef BIGLIST_CODECS_BINARY_CODEC_HPP
#define BIGLIST_CODECS_BINARY_CODEC_HPP

#include "biglist/codec.hpp"

#include <fmt/format.h>
#include <tpie/serialization2.h>

#include <sstream>
#include <stdexcept>

namespace biglist {

/// Stores a batch in TPIE's binary serialization format.
/// Supports every element type that TPIE can serialize (arithmetic types,
/// strings, vectors and types providing `serialize` / `unserialize` overloads).
template<typename T>
class binary_codec : public codec<T> {
public:
    using typename codec<T>::batch_type;

    std::string serialize(const batch_type& batch) const override {
        std::ostringstream out(std::ios_base::out | std::ios_base::binary);
        tpie::serialize(out, batch);
        if (!out) {
            throw std::runtime_error("Failed to serialize batch.");
        }
        return out.str();
    }

    batch_type deserialize(const std::string& bytes) const override {
        std::istringstream in(bytes, std::ios_base::in | std::ios_base::binary);
        batch_type batch;
        tpie::unserialize(in, batch);
        if (!in) {
            throw std::runtime_error(fmt::format("Truncated batch ({} bytes).", bytes.size()));
        }
        return batch;
    }
};

} // namespace biglist

#endif // BIGLIST_CODECS_BINARY_CODEC_HPP
