#ifndef BIGLIST_CODEC_HPP
#define BIGLIST_CODEC_HPP

#include "biglist/common.hpp"
#include "biglist/exception.hpp"

#include <fmt/format.h>

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

/// \file
/// Conversion of element batches from and to bytes, and
/// a lookup table of codecs by storage format name.

namespace biglist {

/// Serializes a batch (the content of one data file) to bytes and back.
/// Codecs must be stateless, they are used by many threads at once.
template<typename T>
class codec {
public:
    using value_type = T;
    using batch_type = std::vector<T>;

public:
    virtual ~codec() = default;

    virtual std::string serialize(const batch_type& batch) const = 0;

    virtual batch_type deserialize(const std::string& bytes) const = 0;
};

template<typename T>
using codec_ptr = std::shared_ptr<const codec<T>>;

/// Normalizes a storage format name ('_' becomes '-').
/// Throws std::invalid_argument if the name is empty or contains
/// characters other than letters, digits, '-' and '_'.
std::string normalize_format_name(const std::string& name);

/// File name extension used for data files of the given format.
std::string format_extension(const std::string& name);

/// Maps storage format names to codecs.
///
/// A registry is built by the application and handed to the datasets
/// that need it; the same format names must be registered wherever
/// a dataset is read back.
template<typename T>
class codec_registry {
public:
    using codec_type = codec<T>;
    using pointer = codec_ptr<T>;

public:
    codec_registry() = default;

    /// Registers a new codec under the given name.
    /// Throws std::invalid_argument if the name is invalid or already taken.
    codec_registry& add(const std::string& name, pointer c) {
        if (!c) {
            throw std::invalid_argument("Codec must not be null.");
        }

        std::string key = normalize_format_name(name);
        if (m_codecs.count(key)) {
            throw std::invalid_argument(fmt::format("Codec \"{}\" is already registered.", name));
        }
        m_codecs.emplace(std::move(key), std::move(c));
        return *this;
    }

    bool contains(const std::string& name) const {
        return m_codecs.count(normalize_format_name(name)) > 0;
    }

    /// Returns the codec for the given name.
    /// Throws \ref unknown_format_error if there is none.
    const pointer& get(const std::string& name) const {
        auto pos = m_codecs.find(normalize_format_name(name));
        if (pos == m_codecs.end()) {
            throw unknown_format_error(fmt::format("Invalid storage format \"{}\".", name));
        }
        return pos->second;
    }

    /// Names of all registered formats, in sorted order.
    std::vector<std::string> names() const {
        std::vector<std::string> result;
        for (const auto& entry : m_codecs) {
            result.push_back(entry.first);
        }
        return result;
    }

private:
    std::map<std::string, pointer> m_codecs;
};

} // namespace biglist

#endif // BIGLIST_CODEC_HPP
