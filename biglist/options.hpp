#ifndef BIGLIST_OPTIONS_HPP
#define BIGLIST_OPTIONS_HPP

#include "biglist/common.hpp"
#include "biglist/worker_pool.hpp"

#include <boost/optional.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace biglist {

/// The format used by new datasets unless another one is requested.
static constexpr const char* default_storage_format = "json-gzip";

/// Batch size used when none is given. Rarely a good choice.
static constexpr u64 default_batch_size = 1000;

/// Settings fixed when a dataset is created. They are stored in the info record.
struct biglist_options {
    /// Maximum number of elements per data file.
    boost::optional<u64> batch_size;

    /// Name of a format in the codec registry.
    std::string storage_format = default_storage_format;

    /// Additional entries for the info record.
    nlohmann::json init_info = nlohmann::json::object();
};

/// Per-instance settings. They are not persisted.
struct open_options {
    /// Number of data files prefetched concurrently during iteration.
    size_t read_threads = 3;

    /// Number of data files written concurrently in the background.
    /// Each in-flight file keeps its batch in memory.
    size_t write_threads = 4;

    /// Pool for prefetching. Created on first use if null.
    std::shared_ptr<worker_pool> read_pool;

    /// Pool for writing data files. Created on first use if null.
    std::shared_ptr<worker_pool> write_pool;
};

/// Parameters of biglist::flush.
struct flush_options {
    /// Record new files in a private interim record instead of the index,
    /// without taking the index lock. The next non-eager flush (by any
    /// instance) moves interim records into the index.
    bool eager = false;

    /// Maximum time spent waiting for the index lock.
    std::chrono::milliseconds lock_timeout = std::chrono::seconds(300);

    /// Rethrow the first data file write error (after clean up).
    /// If false, failures are returned to the caller instead.
    bool raise_on_write_error = true;
};

} // namespace biglist

#endif // BIGLIST_OPTIONS_HPP
