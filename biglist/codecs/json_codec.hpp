#ifndef BIGLIST_CODECS_JSON_CODEC_HPP
#define BIGLIST_CODECS_JSON_CODEC_HPP

#include "biglist/codec.hpp"
#include "biglist/codecs/gzip.hpp"

#include <nlohmann/json.hpp>

namespace biglist {

/// Stores a batch as a json array.
/// The element type must be convertible from and to nlohmann::json.
/// Tuples come back as whatever `T` reads from a json array.
template<typename T>
class json_codec : public codec<T> {
public:
    using typename codec<T>::batch_type;

    /// \param indent
    ///     Passed to nlohmann::json::dump; -1 for compact output.
    explicit json_codec(int indent = -1)
        : m_indent(indent)
    {}

    std::string serialize(const batch_type& batch) const override {
        return nlohmann::json(batch).dump(m_indent);
    }

    batch_type deserialize(const std::string& bytes) const override {
        return nlohmann::json::parse(bytes).template get<batch_type>();
    }

private:
    int m_indent;
};

/// A json array, compressed with gzip.
template<typename T>
class json_gzip_codec : public codec<T> {
public:
    using typename codec<T>::batch_type;

    explicit json_gzip_codec(int level = 6)
        : m_level(level)
    {}

    std::string serialize(const batch_type& batch) const override {
        return gzip_compress(nlohmann::json(batch).dump(), m_level);
    }

    batch_type deserialize(const std::string& bytes) const override {
        return nlohmann::json::parse(gzip_decompress(bytes)).template get<batch_type>();
    }

private:
    int m_level;
};

} // namespace biglist

#endif // BIGLIST_CODECS_JSON_CODEC_HPP
