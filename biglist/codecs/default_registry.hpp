#ifndef BIGLIST_CODECS_DEFAULT_REGISTRY_HPP
#define BIGLIST_CODECS_DEFAULT_REGISTRY_HPP

#include "biglist/codec.hpp"
#include "biglist/codecs/binary_codec.hpp"
#include "biglist/codecs/json_codec.hpp"

#include <memory>

namespace biglist {

/// Returns a registry with the built-in formats "json", "json-gzip" and "binary".
/// `T` must be supported by both nlohmann::json and TPIE serialization;
/// build a registry by hand for other element types.
template<typename T>
codec_registry<T> default_registry() {
    codec_registry<T> registry;
    registry.add("json", std::make_shared<json_codec<T>>());
    registry.add("json-gzip", std::make_shared<json_gzip_codec<T>>());
    registry.add("binary", std::make_shared<binary_codec<T>>());
    return registry;
}

} // namespace biglist

#endif // BIGLIST_CODECS_DEFAULT_REGISTRY_HPP
