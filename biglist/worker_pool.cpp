#include "biglist/worker_pool.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace biglist {

size_t worker_pool::default_workers() {
    const size_t hardware = std::max(std::thread::hardware_concurrency(), 1u);
    return std::min<size_t>(32, hardware + 4);
}

worker_pool::worker_pool(size_t max_workers)
    : m_max_workers(std::max<size_t>(max_workers, 1))
    , m_pool(m_max_workers)
{}

worker_pool::~worker_pool() {
    shutdown();
}

void worker_pool::post(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_shutdown) {
        throw std::logic_error("Worker pool has been shut down.");
    }
    boost::asio::post(m_pool, std::move(task));
}

void worker_pool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            return;
        }
        m_shutdown = true;
    }
    m_pool.join();
}

bool worker_pool::is_shutdown() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_shutdown;
}

} // namespace biglist
