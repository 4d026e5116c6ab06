#ifndef BIGLIST_DUMPER_HPP
#define BIGLIST_DUMPER_HPP

#include "biglist/codec.hpp"
#include "biglist/common.hpp"
#include "biglist/upath.hpp"
#include "biglist/utility/semaphore.hpp"
#include "biglist/worker_pool.hpp"

#include <boost/noncopyable.hpp>

#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace biglist {

/// A data file that could not be written.
struct write_failure {
    upath_ptr path;
    std::exception_ptr error;

    /// The message of the stored exception.
    std::string message() const;
};

/// Writes data files in the background.
///
/// Every job serializes one batch and writes it to its destination on a
/// worker pool. At most `min(n_threads, pool->max_workers())` jobs are in
/// flight at any time; \ref dump_file blocks while that limit is reached.
///
/// Failed jobs are retained until they are reported by \ref wait.
///
/// \note The submitting side is not thread-safe: one thread at a time
/// may call \ref dump_file and \ref wait.
class dumper : boost::noncopyable {
public:
    dumper(std::shared_ptr<worker_pool> pool, size_t n_threads);

    /// Waits for outstanding jobs. Failures that were never reported are logged.
    ~dumper();

    /// Schedules `serialize()` to be written to `destination`.
    /// Blocks until a slot is free.
    void dump_file(upath_ptr destination, std::function<std::string()> serialize);

    /// Schedules the serialization of `batch` with codec `c` into `destination`.
    template<typename T>
    void dump_file(codec_ptr<T> c, std::vector<T> batch, upath_ptr destination) {
        auto shared_batch = std::make_shared<const std::vector<T>>(std::move(batch));
        dump_file(std::move(destination), [c, shared_batch]() {
            return c->serialize(*shared_batch);
        });
    }

    /// Blocks until all scheduled jobs have finished.
    ///
    /// If `raise_on_error` is true, the exception of the first failed job
    /// is rethrown. Otherwise, all failures are returned.
    /// Either way, the reported failures are forgotten afterwards.
    std::vector<write_failure> wait(bool raise_on_error = true);

    /// Maximum number of concurrent jobs.
    size_t capacity() const { return m_capacity; }

    /// Number of jobs that have been scheduled but have not finished yet.
    size_t running() const;

private:
    void finish(upath_ptr destination, std::exception_ptr error);

private:
    std::shared_ptr<worker_pool> m_pool;
    size_t m_capacity;
    semaphore m_slots;

    mutable std::mutex m_mutex;
    std::condition_variable m_idle;
    size_t m_running = 0;
    std::vector<write_failure> m_failures;
};

} // namespace biglist

#endif // BIGLIST_DUMPER_HPP
