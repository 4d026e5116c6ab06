#ifndef BIGLIST_UTILITY_TEMP_DIR_HPP
#define BIGLIST_UTILITY_TEMP_DIR_HPP

#include "biglist/common.hpp"
#include "biglist/filesystem.hpp"
#include "biglist/upath.hpp"

#include <tpie/tempname.h>

#include <memory>
#include <string>

namespace biglist {

/// A scratch directory on disk, e.g. for datasets that only live as
/// long as a test or a batch job.
///
/// Copies share the directory. It is removed (with its content) when the
/// last copy goes out of scope.
class temp_dir {
private:
    struct inner {
        fs::path path;

        inner(fs::path p)
            : path(std::move(p))
        {
            fs::create_directories(path);
        }

        ~inner() {
            boost::system::error_code ec;
            fs::remove_all(path, ec);
        }
    };

public:
    /// \param id
    ///     This string will become part of the directory name.
    temp_dir(const std::string& id = "")
        : m_inner(std::make_shared<inner>(tpie::tempname::tpie_dir_name(id)))
    {}

    const fs::path& path() const { return m_inner->path; }

    /// Returns a path to the (not yet existing) child `name`.
    upath_ptr child(const std::string& name) const {
        return resolve_path((path() / name).string());
    }

private:
    std::shared_ptr<inner> m_inner;
};

} // namespace biglist

#endif // BIGLIST_UTILITY_TEMP_DIR_HPP
