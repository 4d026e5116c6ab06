#ifndef BIGLIST_CODECS_GZIP_HPP
#define BIGLIST_CODECS_GZIP_HPP

#include "biglist/common.hpp"

#include <string>

namespace biglist {

/// Compresses `data` into a gzip stream. `level` ranges from 0 (none) to 9 (best).
std::string gzip_compress(const std::string& data, int level = 6);

/// Decompresses a gzip stream. Throws boost::iostreams::gzip_error on malformed input.
std::string gzip_decompress(const std::string& data);

} // namespace biglist

#endif // BIGLIST_CODECS_GZIP_HPP
