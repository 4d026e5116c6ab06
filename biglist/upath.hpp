#ifndef BIGLIST_UPATH_HPP
#define BIGLIST_UPATH_HPP

#include "biglist/common.hpp"

#include <boost/noncopyable.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

/// \file
/// A uniform interface for files and directories in some storage backend.

namespace biglist {

class upath;

/// Paths are immutable and shared between readers, writers and worker threads.
using upath_ptr = std::shared_ptr<const upath>;

/// An acquired lock on some path. The lock is released when
/// the guard is destroyed.
///
/// Locks are fenced: every acquisition increments a generation counter
/// stored next to the locked path. A guard whose generation is no longer
/// the current one has lost its lock to another holder and must not
/// modify the protected data.
class path_lock : boost::noncopyable {
public:
    virtual ~path_lock() = default;

    /// The generation number obtained when the lock was acquired.
    virtual u64 generation() const = 0;

    /// Throws \ref lock_fencing_error if another holder has acquired
    /// the lock since this guard was created.
    virtual void check() const = 0;

    /// Releases the lock early. Throws \ref lock_release_error on failure.
    /// Calling this more than once has no effect.
    virtual void release() = 0;
};

/// A path in some storage system (local disk or a blob store).
///
/// Implementations must be safe to use from multiple threads
/// at the same time; all operations are const.
class upath {
public:
    virtual ~upath() = default;

    /// Full textual representation of this path.
    virtual std::string string() const = 0;

    /// The last component of this path.
    virtual std::string name() const = 0;

    virtual upath_ptr parent() const = 0;

    /// Returns the path to the child `name` of this path.
    virtual upath_ptr join(const std::string& name) const = 0;

    virtual bool is_file() const = 0;

    virtual bool is_dir() const = 0;

    /// Reads the content of this file.
    /// Throws \ref file_not_found_error if there is no such file.
    virtual std::string read_bytes() const = 0;

    /// Writes `data` to this file, creating parent directories as needed.
    /// Throws \ref file_exists_error if the file exists and `overwrite` is false.
    virtual void write_bytes(const std::string& data, bool overwrite = false) const = 0;

    /// Removes this file. Throws \ref file_not_found_error if there is no such file.
    virtual void remove_file() const = 0;

    /// Removes this directory recursively.
    /// Returns the number of removed entries (0 if the directory does not exist).
    virtual u64 remove_dir() const = 0;

    /// Returns the direct children of this directory, sorted by name.
    /// A missing directory has no children.
    virtual std::vector<upath_ptr> iterdir() const = 0;

    /// Locks this path for exclusive access by a single holder
    /// (across threads, processes or machines, depending on the backend).
    /// Throws \ref lock_acquire_error if the lock could not be obtained in time.
    virtual std::unique_ptr<path_lock> lock(std::chrono::milliseconds timeout) const = 0;

    /// Reads the file and parses its content as json.
    nlohmann::json read_json() const;

    /// Serializes `value` as json and writes it to this file.
    void write_json(const nlohmann::json& value, bool overwrite = false) const;
};

inline upath_ptr operator/(const upath_ptr& p, const std::string& name) {
    return p->join(name);
}

/// Maps a textual path to its storage backend.
/// Plain paths (absolute or relative) refer to the local file system.
/// Throws std::invalid_argument for remote schemes that have no backend
/// in this library.
upath_ptr resolve_path(const std::string& path);

} // namespace biglist

#endif // BIGLIST_UPATH_HPP
