#ifndef BIGLIST_BIGLIST_HPP
#define BIGLIST_BIGLIST_HPP

#include "biglist/biglist_base.hpp"
#include "biglist/codec.hpp"
#include "biglist/common.hpp"
#include "biglist/data_file_info.hpp"
#include "biglist/dumper.hpp"
#include "biglist/exception.hpp"
#include "biglist/file_reader.hpp"
#include "biglist/filesystem.hpp"
#include "biglist/log.hpp"
#include "biglist/options.hpp"
#include "biglist/upath.hpp"
#include "biglist/utility/random_token.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/// \file
/// A persisted, append-only list of elements that may be much larger than
/// main memory and may be written by many independent instances at once.

namespace biglist {

/// State of a data file handed to the background writer.
enum class file_state {
    pending,    ///< Scheduled, outcome unknown.
    confirmed,  ///< Written successfully, not yet merged into the index.
    failed      ///< Could not be written. Never enters the index.
};

/// A data file created by this instance that has not been merged into the index.
struct pending_file {
    std::string name;
    u64 count = 0;
    file_state state = file_state::pending;
};

/// A list of elements of type `T` stored in a directory of data files.
///
/// Layout of the dataset directory:
///
///     info.json           the index: format, batch size and the ordered data files
///     store/              data files, one batch each
///     _flush_eager/       interim records written by eager flushes
///
/// Appended elements are collected in memory. Every `batch_size` elements
/// are written to a new data file in the background; \ref flush() writes the
/// remaining elements and merges all new files into the index. Only then do
/// the elements become visible to readers.
///
/// Many instances (threads, processes or machines) may append to the same
/// dataset at once. They never coordinate except through the index lock
/// taken by \ref flush(). The order of the data files in the index
/// defines the order of the elements.
///
/// \note An instance must only be used by one thread at a time.
template<typename T>
class biglist : public biglist_base<biglist<T>, T> {
    using base_type = biglist_base<biglist<T>, T>;

public:
    using typename base_type::value_type;
    using typename base_type::file_seq_type;
    using typename base_type::batch_type;
    using registry_type = codec_registry<T>;

public:
    /// Creates a new dataset at `path` and opens it.
    ///
    /// \param path
    ///     A location that does not exist yet. If null, a new directory
    ///     in the system's temporary directory is used.
    /// \param registry
    ///     The codecs available to this instance. Must contain the
    ///     requested storage format.
    /// \param options
    ///     Batch size and storage format, persisted in the info record.
    /// \param open
    ///     Settings for the returned instance.
    static biglist create(upath_ptr path, registry_type registry,
                          const biglist_options& options = biglist_options(),
                          open_options open = open_options())
    {
        if (!path) {
            path = resolve_path((fs::temp_directory_path() / random_token(32)).string());
        }
        if (path->is_dir()) {
            throw file_exists_error(fmt::format("Directory \"{}\" already exists.", path->string()));
        }
        if (path->is_file()) {
            throw file_exists_error(fmt::format("File exists: \"{}\".", path->string()));
        }

        u64 batch_size = default_batch_size;
        if (options.batch_size) {
            batch_size = *options.batch_size;
            if (batch_size == 0) {
                throw std::invalid_argument("Batch size must be positive.");
            }
        } else {
            log()->warn("The default batch size, {}, may not be optimal for your use case; "
                        "consider setting the batch size explicitly.", default_batch_size);
        }

        const std::string format = normalize_format_name(options.storage_format);
        registry.get(format);

        nlohmann::json info = options.init_info.is_object() ? options.init_info : nlohmann::json::object();
        info["storage_format"] = format;
        info["storage_version"] = current_storage_version;
        info["batch_size"] = batch_size;
        info["data_files_info"] = nlohmann::json::array();
        path->join(info_file_name)->write_json(info, false);

        log()->info("created biglist at '{}' (format {}, batch size {})", path->string(), format, batch_size);
        return biglist(std::move(path), std::move(registry), std::move(open));
    }

    /// Opens an existing dataset.
    ///
    /// Throws \ref file_not_found_error if there is no dataset at `path` and
    /// \ref unknown_format_error if the dataset's storage format is not in `registry`.
    biglist(upath_ptr path, registry_type registry, open_options open = open_options())
        : base_type(path, open.read_threads, open.read_pool)
        , m_registry(std::move(registry))
        , m_info_file(path->join(info_file_name))
        , m_write_threads(std::max<size_t>(open.write_threads, 1))
        , m_write_pool(std::move(open.write_pool))
    {
        set_info(m_info_file->read_json());
        if (m_info.value("storage_version", 0) < current_storage_version) {
            throw std::runtime_error(fmt::format(
                "Dataset at \"{}\" uses storage version {}; migrate it to version {} first.",
                path->string(), m_info.value("storage_version", 0), current_storage_version));
        }
        m_codec = m_registry.get(storage_format());
        m_info_backup = m_info;
    }

    biglist(biglist&&) = default;

    biglist& operator=(biglist&&) = delete;

    /// Flushes unsaved elements (with a warning) unless the dataset has been destroyed.
    /// Errors are logged, not thrown.
    ~biglist() {
        if (!m_info_file) {
            return;
        }
        try {
            if (m_info_file->is_file() && warn_flush("destructor")) {
                flush();
            }
        } catch (const std::exception& e) {
            log()->error("failed to flush biglist at '{}' on destruction: {}", this->path()->string(), e.what());
        }
    }

    /// Maximum number of elements per data file.
    u64 batch_size() const { return m_info.at("batch_size").template get<u64>(); }

    /// Name of the storage format.
    std::string storage_format() const {
        return normalize_format_name(m_info.at("storage_format").template get<std::string>());
    }

    int storage_version() const { return m_info.value("storage_version", 0); }

    /// The directory containing the data files.
    upath_ptr data_path() const { return this->path()->join(data_dir_name); }

    /// The info record as seen by this instance.
    const nlohmann::json& info() const { return m_info; }

    /// Elements appended since the last data file was scheduled.
    const batch_type& append_buffer() const { return m_append_buffer; }

    /// Data files created by this instance that are not part of the index yet.
    const std::vector<pending_file>& pending_files() const { return m_pending; }

    /// Data files that could not be written. They never enter the index.
    const std::vector<pending_file>& failed_files() const { return m_failed; }

    /// Appends an element. Every `batch_size` elements, a data file
    /// is written in the background.
    void append(const T& value) {
        m_append_buffer.push_back(value);
        if (m_append_buffer.size() >= batch_size()) {
            flush_buffer();
        }
    }

    void append(T&& value) {
        m_append_buffer.push_back(std::move(value));
        if (m_append_buffer.size() >= batch_size()) {
            flush_buffer();
        }
    }

    template<typename Range>
    void extend(const Range& values) {
        for (const auto& v : values) {
            append(v);
        }
    }

    /// Makes all appended elements visible to readers.
    ///
    /// 1. The remaining buffered elements are written to a data file.
    /// 2. All background writes are awaited. Files that failed are removed
    ///    and will not be indexed.
    /// 3. New files are recorded: by default in the index itself, under the
    ///    index lock, together with all interim records left by eager flushes;
    ///    with `eager` set, in a new interim record, without locking.
    ///
    /// Returns the write failures, unless `raise_on_write_error` is set,
    /// in which case the first failure is rethrown after clean up.
    /// Lock errors are propagated; the new files stay pending and are
    /// recorded by the next flush.
    std::vector<write_failure> flush(const flush_options& options = flush_options()) {
        flush_buffer();

        std::vector<write_failure> failures;
        if (m_dumper) {
            failures = m_dumper->wait(false);
        }
        handle_failures(failures);
        for (pending_file& f : m_pending) {
            f.state = file_state::confirmed;
        }

        if (options.raise_on_write_error && !failures.empty()) {
            std::rethrow_exception(failures.front().error);
        }

        if (options.eager) {
            flush_eager();
        } else {
            merge_into_index(options.lock_timeout);
        }
        return failures;
    }

    /// Re-reads the index, including the entries of all interim records
    /// that have not been merged yet. Nothing is written.
    void reload() {
        std::vector<file_entry> interim = read_interim_records(nullptr);
        nlohmann::json info = m_info_file->read_json();

        std::vector<data_file_info> files = info.at("data_files_info").get<std::vector<data_file_info>>();
        if (!interim.empty()) {
            info["data_files_info"] = merge_data_files_info(files, interim);
        }
        set_info(std::move(info));
        m_info_backup = m_info;
    }

    /// Snapshot of the data files of this dataset.
    file_seq_type files() {
        warn_flush("files");

        codec_ptr<T> c = m_codec;
        auto loader = [c](const upath& p) {
            return c->deserialize(p.read_bytes());
        };
        return file_seq_type(this->path(), data_path(), m_files, std::move(loader));
    }

    /// Creates a collision free name for a data file with `length` elements.
    std::string make_file_name(u64 length, const std::string& extra = "") const {
        return make_data_file_name(length, extra);
    }

    /// Removes the dataset. Buffered elements are discarded.
    void destroy() {
        if (m_dumper) {
            m_dumper->wait(false);
        }
        m_append_buffer.clear();
        m_pending.clear();
        base_type::destroy();
        log()->info("destroyed biglist at '{}'", this->path()->string());
    }

    /// True (and a warning is logged) if this instance holds elements or
    /// files that readers cannot see yet.
    bool warn_flush(const char* source) const {
        if (!m_append_buffer.empty() || !m_pending.empty() || m_info != m_info_backup) {
            log()->warn("did you forget to flush biglist at '{}' (about to call `{}`)?",
                        this->path()->string(), source);
            return true;
        }
        return false;
    }

private:
    static constexpr const char* info_file_name = "info.json";
    static constexpr const char* data_dir_name = "store";
    static constexpr const char* interim_dir_name = "_flush_eager";

    void set_info(nlohmann::json info) {
        auto files = std::make_shared<const std::vector<data_file_info>>(
                    info.at("data_files_info").get<std::vector<data_file_info>>());
        m_info = std::move(info);
        m_files = std::move(files);
        this->invalidate_read_cache();
    }

    void set_data_files_info(std::vector<data_file_info> files) {
        biglist_assert(is_consistent(files), "cumulative counts must be consistent");
        m_info["data_files_info"] = files;
        m_files = std::make_shared<const std::vector<data_file_info>>(std::move(files));
        this->invalidate_read_cache();
    }

    upath_ptr interim_path() const { return this->path()->join(interim_dir_name); }

    // Schedules the current buffer to be written to a new data file.
    // The file is recorded as pending right away; failures are
    // sorted out by flush().
    void flush_buffer() {
        if (m_append_buffer.empty()) {
            return;
        }

        batch_type batch;
        batch.swap(m_append_buffer);
        const u64 count = batch.size();

        const std::string name = make_file_name(count) + "." + format_extension(storage_format());
        if (!m_dumper) {
            if (!m_write_pool) {
                m_write_pool = std::make_shared<worker_pool>(m_write_threads);
            }
            m_dumper = std::make_unique<dumper>(m_write_pool, m_write_threads);
        }
        m_dumper->dump_file(m_codec, std::move(batch), data_path()->join(name));
        m_pending.push_back(pending_file{name, count, file_state::pending});
    }

    void handle_failures(const std::vector<write_failure>& failures) {
        for (const write_failure& f : failures) {
            log()->error("failed to write file {}: {}", f.path->string(), f.message());

            const std::string name = f.path->name();
            auto pos = std::find_if(m_pending.begin(), m_pending.end(), [&](const pending_file& p) {
                return p.name == name;
            });
            if (pos != m_pending.end()) {
                pos->state = file_state::failed;
                m_failed.push_back(*pos);
                m_pending.erase(pos);
            }

            if (f.path->is_file()) {
                try {
                    f.path->remove_file();
                } catch (const std::exception& e) {
                    log()->error("failed to delete file {}: {}", f.path->string(), e.what());
                }
            }
        }
    }

    std::vector<file_entry> confirmed_entries() const {
        std::vector<file_entry> entries;
        for (const pending_file& f : m_pending) {
            biglist_assert(f.state == file_state::confirmed, "only confirmed files are recorded");
            entries.push_back(file_entry{f.name, f.count});
        }
        return entries;
    }

    // Records the new files in a new interim record and in the in-memory
    // index, without touching the shared index. Records are never rewritten:
    // a concurrent regular flush deletes exactly the records it has merged.
    void flush_eager() {
        if (m_pending.empty()) {
            return;
        }

        if (m_flush_eager_file.empty()) {
            m_flush_eager_file = utc_timestamp() + "_" + random_token(32);
        }
        const std::string name = fmt::format("{}_{:06}", m_flush_eager_file, m_flush_eager_seq++);

        std::vector<file_entry> entries = confirmed_entries();
        interim_path()->join(name)->write_json(entries, false);
        log()->debug("recorded {} file(s) in interim record {}", entries.size(), name);

        set_data_files_info(merge_data_files_info(*m_files, entries));
        m_pending.clear();
        m_info_backup["data_files_info"] = m_info["data_files_info"];
    }

    // Reads all interim records. If `consumed` is not null, the paths of
    // the records are appended to it.
    std::vector<file_entry> read_interim_records(std::vector<upath_ptr>* consumed) const {
        std::vector<file_entry> entries;
        for (const upath_ptr& record : interim_path()->iterdir()) {
            // Files being written by upath::write_bytes.
            if (boost::starts_with(record->name(), ".")) {
                continue;
            }

            std::vector<file_entry> recorded;
            try {
                recorded = record->read_json().get<std::vector<file_entry>>();
            } catch (const file_not_found_error&) {
                // Consumed by somebody else.
                continue;
            }
            entries.insert(entries.end(), recorded.begin(), recorded.end());
            if (consumed) {
                consumed->push_back(record);
            }
        }
        return entries;
    }

    // Merges the new files and all interim records into the shared index.
    void merge_into_index(std::chrono::milliseconds lock_timeout) {
        std::vector<file_entry> entries = confirmed_entries();

        std::unique_ptr<path_lock> lock = m_info_file->lock(lock_timeout);

        // Other instances may have changed the index.
        nlohmann::json current = m_info;
        current.update(m_info_file->read_json());
        set_info(std::move(current));

        std::vector<upath_ptr> records;
        std::vector<file_entry> interim = read_interim_records(&records);
        entries.insert(entries.end(), interim.begin(), interim.end());

        if (!entries.empty()) {
            set_data_files_info(merge_data_files_info(*m_files, entries));
            lock->check();
            m_info_file->write_json(m_info, true);
            log()->debug("merged {} file(s) into the index at '{}' ({} interim record(s))",
                         entries.size(), m_info_file->string(), records.size());
        }

        // The index already contains these entries; merging them again is harmless,
        // so a failure to delete only leaves redundant records behind.
        for (const upath_ptr& record : records) {
            try {
                record->remove_file();
            } catch (const file_not_found_error&) {
                continue;
            }
        }
        lock->release();

        m_pending.clear();
        m_info_backup = m_info;
    }

private:
    registry_type m_registry;
    codec_ptr<T> m_codec;

    upath_ptr m_info_file;
    nlohmann::json m_info;
    nlohmann::json m_info_backup;
    std::shared_ptr<const std::vector<data_file_info>> m_files;

    batch_type m_append_buffer;
    std::vector<pending_file> m_pending;
    std::vector<pending_file> m_failed;

    size_t m_write_threads;
    std::shared_ptr<worker_pool> m_write_pool;
    std::unique_ptr<dumper> m_dumper;

    std::string m_flush_eager_file;
    u64 m_flush_eager_seq = 0;
};

template<typename T>
constexpr const char* biglist<T>::info_file_name;

template<typename T>
constexpr const char* biglist<T>::data_dir_name;

template<typename T>
constexpr const char* biglist<T>::interim_dir_name;

} // namespace biglist

#endif // BIGLIST_BIGLIST_HPP
