#ifndef BIGLIST_FILE_READER_HPP
#define BIGLIST_FILE_READER_HPP

#include "biglist/common.hpp"
#include "biglist/data_file_info.hpp"
#include "biglist/upath.hpp"

#include <boost/iterator/iterator_facade.hpp>
#include <fmt/format.h>

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

/// \file
/// Read access to individual data files and to the ordered sequence
/// of data files that make up a dataset.

namespace biglist {

/// A lazy handle to a single data file.
///
/// The reader only stores the path and the function used to load the file.
/// Nothing is read until \ref load() is called (explicitly or by accessing
/// the data). Readers are cheap to copy; copies made after loading share
/// the loaded batch.
template<typename T>
class file_reader {
public:
    using value_type = T;
    using batch_type = std::vector<T>;
    using loader_type = std::function<batch_type(const upath&)>;
    using const_iterator = typename batch_type::const_iterator;

public:
    file_reader(upath_ptr path, loader_type loader)
        : m_path(std::move(path))
        , m_loader(std::move(loader))
    {}

    const upath_ptr& path() const { return m_path; }

    const loader_type& loader() const { return m_loader; }

    /// Loads the file content. Does nothing if the file is already loaded.
    void load() {
        if (!m_data) {
            m_data = std::make_shared<const batch_type>(m_loader(*m_path));
        }
    }

    bool is_loaded() const { return static_cast<bool>(m_data); }

    /// Discards the loaded content. It will be loaded again on demand.
    void unload() { m_data.reset(); }

    /// The content of the file, loading it if necessary.
    const batch_type& data() {
        load();
        return *m_data;
    }

    /// Like \ref data(), but the returned batch may outlive this reader.
    std::shared_ptr<const batch_type> shared_data() {
        load();
        return m_data;
    }

    size_t size() { return data().size(); }

    const T& operator[](size_t index) { return data()[index]; }

    /// Bounds checked element access.
    const T& at(size_t index) {
        const batch_type& batch = data();
        if (index >= batch.size()) {
            throw std::out_of_range(fmt::format("Index {} out of range for file \"{}\" with {} elements.",
                                                index, m_path->string(), batch.size()));
        }
        return batch[index];
    }

    const_iterator begin() { return data().begin(); }

    const_iterator end() { return data().end(); }

    std::string to_string() const {
        return fmt::format("<file_reader for '{}'>", m_path->string());
    }

private:
    upath_ptr m_path;
    loader_type m_loader;
    std::shared_ptr<const batch_type> m_data;
};

/// The ordered sequence of data files of a dataset.
///
/// A file_seq is a snapshot of the index at the time it was created.
/// Indexing returns a fresh (unloaded) reader for the file at that position.
template<typename T>
class file_seq {
public:
    using reader_type = file_reader<T>;
    using loader_type = typename reader_type::loader_type;
    using info_type = std::vector<data_file_info>;

    /// Iterates over the readers of all files in order.
    class iterator : public boost::iterator_facade<
            iterator,
            reader_type,
            boost::random_access_traversal_tag,
            reader_type
    >
    {
    public:
        iterator() = default;

    private:
        friend class file_seq;

        iterator(const file_seq* seq, size_t index)
            : m_seq(seq)
            , m_index(index)
        {}

    private:
        friend class boost::iterator_core_access;

        reader_type dereference() const {
            biglist_assert(m_seq, "dereferencing invalid iterator");
            return (*m_seq)[m_index];
        }

        void increment() { ++m_index; }

        void decrement() { --m_index; }

        void advance(std::ptrdiff_t n) { m_index += n; }

        std::ptrdiff_t distance_to(const iterator& other) const {
            return static_cast<std::ptrdiff_t>(other.m_index) - static_cast<std::ptrdiff_t>(m_index);
        }

        bool equal(const iterator& other) const {
            biglist_assert(m_seq == other.m_seq, "comparing iterators of different sequences");
            return m_index == other.m_index;
        }

    private:
        const file_seq* m_seq = nullptr;
        size_t m_index = 0;
    };

    using const_iterator = iterator;

public:
    /// \param root
    ///     The root directory of the dataset.
    /// \param data_dir
    ///     The directory that contains the data files.
    /// \param files
    ///     The index entries (names are relative to `data_dir`).
    /// \param loader
    ///     Reads the elements of a single data file.
    file_seq(upath_ptr root, upath_ptr data_dir,
             std::shared_ptr<const info_type> files, loader_type loader)
        : m_root(std::move(root))
        , m_data_dir(std::move(data_dir))
        , m_files(std::move(files))
        , m_loader(std::move(loader))
    {
        biglist_assert(m_files, "file list must not be null");
    }

    /// The root directory of the dataset.
    const upath_ptr& path() const { return m_root; }

    /// The index entries of all data files.
    const info_type& data_files_info() const { return *m_files; }

    /// Number of data files.
    size_t size() const { return m_files->size(); }

    bool empty() const { return m_files->empty(); }

    size_t num_data_files() const { return m_files->size(); }

    /// Total number of elements in all data files.
    u64 num_data_items() const {
        return m_files->empty() ? 0 : m_files->back().cumcount;
    }

    /// Returns an unloaded reader for the file at `index`.
    reader_type operator[](size_t index) const {
        biglist_assert(index < m_files->size(), "file index out of bounds");
        return reader_type(m_data_dir->join((*m_files)[index].name), m_loader);
    }

    iterator begin() const { return iterator(this, 0); }

    iterator end() const { return iterator(this, size()); }

    std::string to_string() const {
        return fmt::format("<file_seq at '{}' with {} elements in {} data file(s)>",
                           m_root->string(), num_data_items(), num_data_files());
    }

private:
    upath_ptr m_root;
    upath_ptr m_data_dir;
    std::shared_ptr<const info_type> m_files;
    loader_type m_loader;
};

} // namespace biglist

#endif // BIGLIST_FILE_READER_HPP
