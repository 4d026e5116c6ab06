#ifndef BIGLIST_UTILITY_SEMAPHORE_HPP
#define BIGLIST_UTILITY_SEMAPHORE_HPP

#include "biglist/common.hpp"

#include <boost/noncopyable.hpp>

#include <condition_variable>
#include <mutex>

namespace biglist {

/// A counting semaphore.
class semaphore : boost::noncopyable {
public:
    explicit semaphore(size_t count)
        : m_count(count)
    {}

    /// Blocks until a unit is available and takes it.
    void acquire() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_available.wait(lock, [&]{ return m_count > 0; });
        --m_count;
    }

    /// Returns a unit, waking up one waiting thread.
    void release() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_count;
        }
        m_available.notify_one();
    }

    /// Number of units currently available.
    size_t available() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_count;
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_available;
    size_t m_count;
};

} // namespace biglist

#endif // BIGLIST_UTILITY_SEMAPHORE_HPP
