#ifndef BIGLIST_BIGLIST_BASE_HPP
#define BIGLIST_BIGLIST_BASE_HPP

#include "biglist/common.hpp"
#include "biglist/file_reader.hpp"
#include "biglist/upath.hpp"
#include "biglist/worker_pool.hpp"

#include <boost/iterator/iterator_facade.hpp>
#include <boost/optional.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <deque>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/// \file
/// The read side of a dataset: element access by index and
/// ordered iteration with background prefetching.

namespace biglist {

/// Implements reading for a dataset whose data files are described by
/// `Derived::files()`, which must return a `file_seq<T>` snapshot of the
/// current index.
///
/// \note Instances are not thread-safe. Element access by index
/// caches the most recently used data file.
template<typename Derived, typename T>
class biglist_base {
public:
    using value_type = T;
    using size_type = u64;
    using file_seq_type = file_seq<T>;
    using reader_type = file_reader<T>;
    using batch_type = typename reader_type::batch_type;

private:
    using batch_ptr = std::shared_ptr<const batch_type>;

    // Shared by all copies of an iterator. Files are loaded in the background
    // and consumed in index order; at most `window` files are in flight.
    struct prefetch_state {
        prefetch_state(file_seq_type f, std::shared_ptr<worker_pool> p, size_t w)
            : files(std::move(f))
            , pool(std::move(p))
            , window(w)
        {}

        file_seq_type files;
        std::shared_ptr<worker_pool> pool;
        size_t window = 1;

        // Results for the files [next_file - pending.size(), next_file).
        std::deque<std::future<batch_ptr>> pending;
        size_t next_file = 0;

        batch_ptr current;
        size_t position = 0;

        void schedule_next() {
            file_seq_type snapshot = files;
            const size_t index = next_file++;
            pending.push_back(pool->submit([snapshot, index]() {
                reader_type reader = snapshot[index];
                return reader.shared_data();
            }));
        }

        // Moves to the next file that contains at least one element.
        // Returns false when all files have been consumed.
        bool next_batch() {
            while (true) {
                if (pending.empty()) {
                    current.reset();
                    return false;
                }

                // Pop before loading, so that after a load error the next
                // call continues with the following file.
                std::future<batch_ptr> loaded = std::move(pending.front());
                pending.pop_front();

                // Keep the prefetch window busy before handing out data.
                if (next_file < files.size()) {
                    schedule_next();
                }

                batch_ptr batch = loaded.get();

                if (!batch->empty()) {
                    current = std::move(batch);
                    position = 0;
                    return true;
                }
            }
        }
    };

public:
    /// Iterates over all elements in index order.
    /// The next few data files are loaded in the background while
    /// the current one is consumed.
    class iterator : public boost::iterator_facade<
            iterator,
            value_type,
            boost::single_pass_traversal_tag,
            const value_type&
    >
    {
    public:
        /// Constructs the past-the-end iterator.
        iterator() = default;

    private:
        friend class biglist_base;

        explicit iterator(std::shared_ptr<prefetch_state> state)
            : m_state(std::move(state))
        {
            if (!m_state->next_batch()) {
                m_state.reset();
            }
        }

    private:
        friend class boost::iterator_core_access;

        const value_type& dereference() const {
            biglist_assert(m_state && m_state->current, "dereferencing end iterator");
            return (*m_state->current)[m_state->position];
        }

        void increment() {
            biglist_assert(m_state, "incrementing past the end");
            if (++m_state->position >= m_state->current->size()) {
                if (!m_state->next_batch()) {
                    m_state.reset();
                }
            }
        }

        bool equal(const iterator& other) const {
            return m_state == other.m_state;
        }

    private:
        std::shared_ptr<prefetch_state> m_state;
    };

    using const_iterator = iterator;

public:
    /// \param path
    ///     Root directory of the dataset.
    /// \param read_threads
    ///     Maximum number of data files loaded concurrently during iteration.
    /// \param read_pool
    ///     Pool used for loading. Created on first use if null.
    biglist_base(upath_ptr path, size_t read_threads, std::shared_ptr<worker_pool> read_pool)
        : m_path(std::move(path))
        , m_read_threads(std::max<size_t>(read_threads, 1))
        , m_read_pool(std::move(read_pool))
    {}

    biglist_base(biglist_base&&) = default;

    biglist_base& operator=(biglist_base&&) = delete;

    /// Root directory of this dataset.
    const upath_ptr& path() const { return m_path; }

    /// Number of elements in the dataset (as of the current index).
    size_type size() {
        return num_data_items();
    }

    size_type num_data_items() {
        return derived().files().num_data_items();
    }

    size_t num_data_files() {
        return derived().files().num_data_files();
    }

    /// Returns the element at `index`. Negative indices count from the end.
    /// Throws std::out_of_range if the index is not in `[-size(), size())`.
    ///
    /// Accessing elements in the data file of the previous access is fast;
    /// for other elements the containing file is located by binary search
    /// and loaded. Use iteration to read the whole dataset.
    value_type operator[](i64 index) {
        return get(index);
    }

    value_type get(i64 index) {
        if (index >= 0 && m_cached_file) {
            if (static_cast<u64>(index) >= m_cached_range.first
                    && static_cast<u64>(index) < m_cached_range.second) {
                derived().warn_flush("get");
                return (*m_cached_batch)[index - m_cached_range.first];
            }
        }

        file_seq_type files = derived().files();
        const auto& info = files.data_files_info();
        const i64 length = static_cast<i64>(files.num_data_items());
        if (index < -length || index >= length) {
            throw std::out_of_range(fmt::format("Index {} out of range for dataset of size {}.", index, length));
        }
        const u64 item = static_cast<u64>(index < 0 ? index + length : index);

        // Restrict the search to one side of the cached file.
        size_t first = 0;
        size_t last = info.size();
        if (m_cached_file) {
            if (item < m_cached_range.first) {
                last = *m_cached_file;
            } else if (item < m_cached_range.second) {
                return (*m_cached_batch)[item - m_cached_range.first];
            } else {
                first = *m_cached_file + 1;
            }
        }

        auto pos = std::upper_bound(info.begin() + first, info.begin() + last, item,
                                    [](u64 value, const data_file_info& f) {
            return value < f.cumcount;
        });
        biglist_assert(pos != info.end(), "item must be inside some file");

        const size_t file = static_cast<size_t>(pos - info.begin());
        const u64 begin = file == 0 ? 0 : info[file - 1].cumcount;

        reader_type reader = files[file];
        m_cached_batch = reader.shared_data();
        m_cached_file = file;
        m_cached_range = std::make_pair(begin, pos->cumcount);
        return (*m_cached_batch)[item - begin];
    }

    /// Starts iteration over all elements.
    iterator begin() {
        file_seq_type files = derived().files();
        const size_t count = files.size();
        if (count == 0) {
            return iterator();
        }

        if (count == 1) {
            // No point in prefetching.
            auto state = std::make_shared<prefetch_state>(files, nullptr, 1);
            std::promise<batch_ptr> loaded;
            reader_type reader = files[0];
            loaded.set_value(reader.shared_data());
            state->pending.push_back(loaded.get_future());
            state->next_file = 1;
            return iterator(std::move(state));
        }

        const size_t window = std::min(m_read_threads, count);
        auto state = std::make_shared<prefetch_state>(files, read_pool(), window);
        for (size_t i = 0; i < window; ++i) {
            state->schedule_next();
        }
        return iterator(std::move(state));
    }

    iterator end() {
        return iterator();
    }

    /// Removes the dataset and all its files.
    void destroy() {
        invalidate_read_cache();
        m_path->remove_dir();
    }

    std::string to_string() {
        file_seq_type files = derived().files();
        return fmt::format("<biglist at '{}' with {} elements in {} data file(s)>",
                           m_path->string(), files.num_data_items(), files.num_data_files());
    }

protected:
    ~biglist_base() = default;

    /// Must be called whenever the index changes.
    void invalidate_read_cache() {
        m_cached_file = boost::none;
        m_cached_batch.reset();
        m_cached_range = std::make_pair(0, 0);
    }

    /// The pool used for prefetching.
    const std::shared_ptr<worker_pool>& read_pool() {
        if (!m_read_pool) {
            m_read_pool = std::make_shared<worker_pool>(m_read_threads);
        }
        return m_read_pool;
    }

private:
    Derived& derived() { return static_cast<Derived&>(*this); }

private:
    upath_ptr m_path;
    size_t m_read_threads;
    std::shared_ptr<worker_pool> m_read_pool;

    // The data file used by the most recent indexed access.
    boost::optional<size_t> m_cached_file;
    batch_ptr m_cached_batch;
    std::pair<u64, u64> m_cached_range{0, 0};
};

} // namespace biglist

#endif // BIGLIST_BIGLIST_BASE_HPP
