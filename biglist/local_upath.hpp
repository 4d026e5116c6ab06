#ifndef BIGLIST_LOCAL_UPATH_HPP
#define BIGLIST_LOCAL_UPATH_HPP

#include "biglist/common.hpp"
#include "biglist/filesystem.hpp"
#include "biglist/upath.hpp"

namespace biglist {

/// A path on the local file system.
///
/// Locking `X` uses the lock file `X.lock` and stores the fencing generation
/// in `X.lock.generation`. The lock excludes other threads of this process
/// as well as other processes on the same machine.
class local_upath : public upath {
public:
    /// Poll interval while waiting for a lock held by another process.
    static constexpr std::chrono::milliseconds lock_poll_interval{30};

public:
    /// The path is made absolute and normalized.
    explicit local_upath(const fs::path& path);

    /// The underlying file system path.
    const fs::path& path() const { return m_path; }

    std::string string() const override;
    std::string name() const override;
    upath_ptr parent() const override;
    upath_ptr join(const std::string& name) const override;

    bool is_file() const override;
    bool is_dir() const override;

    std::string read_bytes() const override;
    void write_bytes(const std::string& data, bool overwrite = false) const override;

    void remove_file() const override;
    u64 remove_dir() const override;

    std::vector<upath_ptr> iterdir() const override;

    std::unique_ptr<path_lock> lock(std::chrono::milliseconds timeout) const override;

private:
    fs::path m_path;
};

} // namespace biglist

#endif // BIGLIST_LOCAL_UPATH_HPP
