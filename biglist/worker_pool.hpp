#ifndef BIGLIST_WORKER_POOL_HPP
#define BIGLIST_WORKER_POOL_HPP

#include "biglist/common.hpp"

#include <boost/asio/thread_pool.hpp>
#include <boost/noncopyable.hpp>

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <type_traits>

namespace biglist {

/// A fixed number of worker threads executing submitted tasks.
///
/// Pools are handed to datasets explicitly (or created by them on demand)
/// and can be shared between datasets of the same process.
/// A pool does not survive `fork()`: the child process must create its own pools.
class worker_pool : boost::noncopyable {
public:
    /// The default number of workers: `min(32, hardware threads + 4)`.
    static size_t default_workers();

public:
    explicit worker_pool(size_t max_workers = default_workers());

    /// Waits for all queued tasks to finish.
    ~worker_pool();

    size_t max_workers() const { return m_max_workers; }

    /// Schedules `task` for execution. Exceptions thrown by the task
    /// must be handled by the task itself.
    /// Throws std::logic_error after \ref shutdown().
    void post(std::function<void()> task);

    /// Schedules `f` for execution and returns a future for its result
    /// (or the exception it throws).
    template<typename Func>
    auto submit(Func&& f) -> std::future<std::result_of_t<std::decay_t<Func>()>> {
        using result_type = std::result_of_t<std::decay_t<Func>()>;

        auto task = std::make_shared<std::packaged_task<result_type()>>(std::forward<Func>(f));
        std::future<result_type> result = task->get_future();
        post([task]{ (*task)(); });
        return result;
    }

    /// Stops accepting new tasks and waits for the queued tasks to finish.
    void shutdown();

    bool is_shutdown() const;

private:
    size_t m_max_workers;
    boost::asio::thread_pool m_pool;

    mutable std::mutex m_mutex;
    bool m_shutdown = false;
};

} // namespace biglist

#endif // BIGLIST_WORKER_POOL_HPP
