#include "biglist/upath.hpp"

#include "biglist/local_upath.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <fmt/format.h>

#include <stdexcept>

namespace biglist {

nlohmann::json upath::read_json() const {
    return nlohmann::json::parse(read_bytes());
}

void upath::write_json(const nlohmann::json& value, bool overwrite) const {
    write_bytes(value.dump(), overwrite);
}

upath_ptr resolve_path(const std::string& path) {
    static const char* const remote_schemes[] = {"gs://", "s3://", "https://", "http://"};
    for (const char* scheme : remote_schemes) {
        if (boost::starts_with(path, scheme)) {
            throw std::invalid_argument(fmt::format(
                "No storage backend for \"{}\" (scheme {}).", path, scheme));
        }
    }
    if (path.empty()) {
        throw std::invalid_argument("Empty path.");
    }
    return std::make_shared<local_upath>(path);
}

} // namespace biglist
