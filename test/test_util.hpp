#ifndef TEST_TEST_UTIL_HPP
#define TEST_TEST_UTIL_HPP

#include "biglist/biglist.hpp"
#include "biglist/codec.hpp"
#include "biglist/codecs/default_registry.hpp"
#include "biglist/codecs/json_codec.hpp"
#include "biglist/upath.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// The class shares its name with the namespace; refer to it through
// these aliases in files that use `using namespace biglist`.
using int_biglist = biglist::biglist<int>;
using string_biglist = biglist::biglist<std::string>;

// Serializes like the json codec, but fails for batches that
// contain `poison`.
class failing_codec : public biglist::json_codec<int> {
public:
    explicit failing_codec(int poison)
        : m_poison(poison)
    {}

    std::string serialize(const std::vector<int>& batch) const override {
        for (int v : batch) {
            if (v == m_poison) {
                throw std::runtime_error("poisoned batch");
            }
        }
        return biglist::json_codec<int>::serialize(batch);
    }

private:
    int m_poison;
};

inline biglist::codec_registry<int> failing_registry(int poison) {
    biglist::codec_registry<int> registry;
    registry.add("json", std::make_shared<failing_codec>(poison));
    return registry;
}

inline biglist::biglist_options options_with_batch(biglist::u64 batch_size,
                                                   const std::string& format = "json")
{
    biglist::biglist_options options;
    options.batch_size = batch_size;
    options.storage_format = format;
    return options;
}

// Forwards to another path, but runs a callback before files are
// checked or removed. Paths derived from a hooked path share the callback.
class hooked_upath : public biglist::upath {
public:
    using hook = std::function<void(const std::string& operation, const biglist::upath& path)>;

    static biglist::upath_ptr wrap(biglist::upath_ptr inner, std::shared_ptr<hook> callback) {
        return std::make_shared<hooked_upath>(std::move(inner), std::move(callback));
    }

    hooked_upath(biglist::upath_ptr inner, std::shared_ptr<hook> callback)
        : m_inner(std::move(inner))
        , m_hook(std::move(callback))
    {}

    std::string string() const override { return m_inner->string(); }
    std::string name() const override { return m_inner->name(); }
    biglist::upath_ptr parent() const override { return wrap(m_inner->parent(), m_hook); }

    biglist::upath_ptr join(const std::string& name) const override {
        return wrap(m_inner->join(name), m_hook);
    }

    bool is_file() const override {
        (*m_hook)("is_file", *this);
        return m_inner->is_file();
    }

    bool is_dir() const override { return m_inner->is_dir(); }
    std::string read_bytes() const override { return m_inner->read_bytes(); }

    void write_bytes(const std::string& data, bool overwrite) const override {
        m_inner->write_bytes(data, overwrite);
    }

    void remove_file() const override {
        (*m_hook)("remove_file", *this);
        m_inner->remove_file();
    }

    biglist::u64 remove_dir() const override { return m_inner->remove_dir(); }

    std::vector<biglist::upath_ptr> iterdir() const override {
        std::vector<biglist::upath_ptr> children;
        for (const biglist::upath_ptr& child : m_inner->iterdir()) {
            children.push_back(wrap(child, m_hook));
        }
        return children;
    }

    std::unique_ptr<biglist::path_lock> lock(std::chrono::milliseconds timeout) const override {
        return m_inner->lock(timeout);
    }

private:
    biglist::upath_ptr m_inner;
    std::shared_ptr<hook> m_hook;
};

template<typename List>
std::vector<typename List::value_type> read_all(List& list) {
    std::vector<typename List::value_type> result;
    for (auto it = list.begin(), end = list.end(); it != end; ++it) {
        result.push_back(*it);
    }
    return result;
}

#endif // TEST_TEST_UTIL_HPP
