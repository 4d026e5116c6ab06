#include "biglist/dumper.hpp"

#include "biglist/log.hpp"

#include <algorithm>
#include <stdexcept>

namespace biglist {

std::string write_failure::message() const {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

dumper::dumper(std::shared_ptr<worker_pool> pool, size_t n_threads)
    : m_pool(std::move(pool))
    , m_capacity(std::max<size_t>(1, std::min(n_threads, m_pool->max_workers())))
    , m_slots(m_capacity)
{}

dumper::~dumper() {
    std::vector<write_failure> failures = wait(false);
    for (const write_failure& f : failures) {
        log()->error("failed to write file {}: {}", f.path->string(), f.message());
    }
}

void dumper::dump_file(upath_ptr destination, std::function<std::string()> serialize) {
    m_slots.acquire();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_running;
    }

    auto job = [this, destination, serialize]() {
        std::exception_ptr error;
        try {
            destination->write_bytes(serialize(), false);
        } catch (...) {
            error = std::current_exception();
        }
        finish(destination, std::move(error));
    };

    try {
        m_pool->post(std::move(job));
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_running;
        }
        m_slots.release();
        throw;
    }
}

void dumper::finish(upath_ptr destination, std::exception_ptr error) {
    m_slots.release();

    // The dumper may be destroyed as soon as m_running drops to zero.
    std::lock_guard<std::mutex> lock(m_mutex);
    if (error) {
        m_failures.push_back(write_failure{std::move(destination), std::move(error)});
    }
    --m_running;
    m_idle.notify_all();
}

std::vector<write_failure> dumper::wait(bool raise_on_error) {
    std::vector<write_failure> failures;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_idle.wait(lock, [&]{ return m_running == 0; });
        failures.swap(m_failures);
    }

    if (raise_on_error && !failures.empty()) {
        std::rethrow_exception(failures.front().error);
    }
    return failures;
}

size_t dumper::running() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_running;
}

} // namespace biglist
