#ifndef BIGLIST_FILESYSTEM_HPP
#define BIGLIST_FILESYSTEM_HPP

#include "biglist/common.hpp"

#include <boost/filesystem.hpp>

namespace biglist {

namespace fs = boost::filesystem;

/// Creates the directory `p` and all required parents.
/// Existing directories are not an error.
/// \return Returns the path.
inline fs::path ensure_directory(fs::path p) {
    fs::create_directories(p);
    return p;
}

} // namespace biglist

#endif // BIGLIST_FILESYSTEM_HPP
