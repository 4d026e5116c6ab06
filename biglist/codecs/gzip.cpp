#include "biglist/codecs/gzip.hpp"

#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>

namespace biglist {

namespace io = boost::iostreams;

std::string gzip_compress(const std::string& data, int level) {
    std::string result;

    io::filtering_ostream out;
    out.push(io::gzip_compressor(io::gzip_params(level)));
    out.push(io::back_inserter(result));
    io::copy(io::array_source(data.data(), data.size()), out);
    return result;
}

std::string gzip_decompress(const std::string& data) {
    std::string result;

    io::filtering_istream in;
    in.push(io::gzip_decompressor());
    in.push(io::array_source(data.data(), data.size()));
    io::copy(in, io::back_inserter(result));
    return result;
}

} // namespace biglist
