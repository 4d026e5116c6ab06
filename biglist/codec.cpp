#include "biglist/codec.hpp"

#include <algorithm>

namespace biglist {

std::string normalize_format_name(const std::string& name) {
    auto valid = [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')
                || (c >= '0' && c <= '9') || c == '-' || c == '_';
    };
    if (name.empty() || !std::all_of(name.begin(), name.end(), valid)) {
        throw std::invalid_argument(fmt::format("Invalid storage format name \"{}\".", name));
    }

    std::string result = name;
    std::replace(result.begin(), result.end(), '_', '-');
    return result;
}

std::string format_extension(const std::string& name) {
    std::string result = normalize_format_name(name);
    std::replace(result.begin(), result.end(), '-', '_');
    return result;
}

} // namespace biglist
