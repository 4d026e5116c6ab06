#include "biglist/local_upath.hpp"

#include "biglist/exception.hpp"
#include "biglist/log.hpp"
#include "biglist/utility/random_token.hpp"

#include <boost/filesystem/fstream.hpp>
#include <boost/interprocess/exceptions.hpp>
#include <boost/interprocess/sync/file_lock.hpp>
#include <fmt/format.h>
#include <gsl/gsl_util>

#include <algorithm>
#include <condition_variable>
#include <iterator>
#include <mutex>
#include <set>
#include <thread>

namespace biglist {

constexpr std::chrono::milliseconds local_upath::lock_poll_interval;

namespace {

using lock_clock = std::chrono::steady_clock;

// fcntl-style file locks are owned by the process, not by the thread.
// Threads of the same process are excluded by this registry of held lock files.
// Guards may be released by a different thread than the one that acquired them.
class held_locks {
public:
    bool try_acquire_until(const std::string& key, lock_clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (!m_released.wait_until(lock, deadline, [&]{ return m_held.count(key) == 0; })) {
            return false;
        }
        m_held.insert(key);
        return true;
    }

    void release(const std::string& key) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_held.erase(key);
        }
        m_released.notify_all();
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_released;
    std::set<std::string> m_held;
};

held_locks& lock_registry() {
    static held_locks registry;
    return registry;
}

u64 read_generation(const fs::path& path) {
    fs::ifstream in(path);
    u64 generation = 0;
    if (in) {
        in >> generation;
    }
    return generation;
}

void write_generation(const fs::path& path, u64 generation) {
    fs::ofstream out(path, std::ios_base::trunc);
    out << generation;
    out.flush();
    if (!out) {
        throw lock_acquire_error(fmt::format("Failed to write lock generation to \"{}\".", path.string()));
    }
}

class local_path_lock : public path_lock {
public:
    local_path_lock(const fs::path& target, std::chrono::milliseconds timeout)
        : m_target(target)
        , m_lock_file(target.string() + ".lock")
        , m_generation_file(target.string() + ".lock.generation")
    {
        const auto start = lock_clock::now();
        const auto deadline = start + timeout;

        const std::string key = m_lock_file.string();
        if (!lock_registry().try_acquire_until(key, deadline)) {
            throw lock_acquire_error(fail_message(start));
        }
        auto registered = gsl::finally([&]{
            if (!m_locked) {
                close_lock_file();
                lock_registry().release(key);
            }
        });

        ensure_directory(m_lock_file.parent_path());
        if (!fs::exists(m_lock_file)) {
            fs::ofstream create(m_lock_file, std::ios_base::app);
        }

        try {
            m_file_lock = boost::interprocess::file_lock(m_lock_file.string().c_str());
            while (!m_file_lock.try_lock()) {
                if (lock_clock::now() >= deadline) {
                    throw lock_acquire_error(fail_message(start));
                }
                std::this_thread::sleep_for(local_upath::lock_poll_interval);
            }
        } catch (const boost::interprocess::interprocess_exception& e) {
            throw lock_acquire_error(fmt::format("{} ({})", fail_message(start), e.what()));
        }

        m_generation = read_generation(m_generation_file) + 1;
        write_generation(m_generation_file, m_generation);

        m_locked = true;
    }

    ~local_path_lock() {
        try {
            release();
        } catch (const lock_release_error& e) {
            log()->error("{}", e.what());
        }
    }

    u64 generation() const override { return m_generation; }

    void check() const override {
        const u64 current = read_generation(m_generation_file);
        if (current != m_generation) {
            throw lock_fencing_error(fmt::format(
                "Lock on \"{}\" was taken over (generation {}, current {}).",
                m_target.string(), m_generation, current));
        }
    }

    void release() override {
        if (!m_locked) {
            return;
        }
        m_locked = false;

        // Other threads may proceed even if the file lock fails.
        auto unregister = gsl::finally([&]{
            close_lock_file();
            lock_registry().release(m_lock_file.string());
        });
        try {
            m_file_lock.unlock();
        } catch (const boost::interprocess::interprocess_exception& e) {
            throw lock_release_error(fmt::format(
                "Failed to unlock \"{}\": {}.", m_target.string(), e.what()));
        }
    }

private:
    // Closing any descriptor of the lock file drops all of this process's
    // locks on it, so this must happen before another thread may lock it.
    void close_lock_file() {
        m_file_lock = boost::interprocess::file_lock();
    }

    std::string fail_message(lock_clock::time_point start) const {
        const std::chrono::duration<double> waited = lock_clock::now() - start;
        return fmt::format("Failed to lock \"{}\" trying for {:.2f} seconds.",
                           m_target.string(), waited.count());
    }

private:
    fs::path m_target;
    fs::path m_lock_file;
    fs::path m_generation_file;
    boost::interprocess::file_lock m_file_lock;
    u64 m_generation = 0;
    bool m_locked = false;
};

} // namespace

local_upath::local_upath(const fs::path& path)
    : m_path(fs::absolute(path).lexically_normal())
{
    // "a/b/" normalizes to "a/b/."
    if (m_path.filename() == ".") {
        m_path = m_path.parent_path();
    }
}

std::string local_upath::string() const {
    return m_path.string();
}

std::string local_upath::name() const {
    return m_path.filename().string();
}

upath_ptr local_upath::parent() const {
    return std::make_shared<local_upath>(m_path.parent_path());
}

upath_ptr local_upath::join(const std::string& name) const {
    return std::make_shared<local_upath>(m_path / name);
}

bool local_upath::is_file() const {
    return fs::is_regular_file(m_path);
}

bool local_upath::is_dir() const {
    return fs::is_directory(m_path);
}

std::string local_upath::read_bytes() const {
    if (!is_file()) {
        throw file_not_found_error(fmt::format("No such file: \"{}\".", m_path.string()));
    }

    fs::ifstream in(m_path, std::ios_base::binary);
    if (!in) {
        throw std::runtime_error(fmt::format("Failed to open \"{}\" for reading.", m_path.string()));
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void local_upath::write_bytes(const std::string& data, bool overwrite) const {
    if (!overwrite && fs::exists(m_path)) {
        throw file_exists_error(fmt::format("File exists: \"{}\".", m_path.string()));
    }
    ensure_directory(m_path.parent_path());

    // Write a sibling file and move it into place, so that readers
    // never observe a partially written file.
    const fs::path temp = m_path.parent_path() / fmt::format(".{}.{}.tmp", m_path.filename().string(), random_token(8));
    auto cleanup = gsl::finally([&] {
        boost::system::error_code ec;
        fs::remove(temp, ec);
    });
    {
        fs::ofstream out(temp, std::ios_base::binary | std::ios_base::trunc);
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        out.close();
        if (!out) {
            throw std::runtime_error(fmt::format("Failed to write \"{}\".", m_path.string()));
        }
    }

    if (overwrite) {
        fs::rename(temp, m_path);
        return;
    }

    // Linking fails if the target exists, even if it was created
    // after the check above.
    boost::system::error_code ec;
    fs::create_hard_link(temp, m_path, ec);
    if (ec == boost::system::errc::file_exists) {
        throw file_exists_error(fmt::format("File exists: \"{}\".", m_path.string()));
    }
    if (ec) {
        throw fs::filesystem_error("create_hard_link", temp, m_path, ec);
    }
}

void local_upath::remove_file() const {
    if (!is_file()) {
        throw file_not_found_error(fmt::format("No such file: \"{}\".", m_path.string()));
    }
    fs::remove(m_path);
}

u64 local_upath::remove_dir() const {
    if (!is_dir()) {
        return 0;
    }
    return fs::remove_all(m_path);
}

std::vector<upath_ptr> local_upath::iterdir() const {
    std::vector<fs::path> children;
    if (is_dir()) {
        for (fs::directory_iterator it(m_path), end; it != end; ++it) {
            children.push_back(it->path());
        }
    }
    std::sort(children.begin(), children.end());

    std::vector<upath_ptr> result;
    result.reserve(children.size());
    for (const fs::path& child : children) {
        result.push_back(std::make_shared<local_upath>(child));
    }
    return result;
}

std::unique_ptr<path_lock> local_upath::lock(std::chrono::milliseconds timeout) const {
    return std::make_unique<local_path_lock>(m_path, timeout);
}

} // namespace biglist
