#ifndef BIGLIST_EXCEPTION_HPP
#define BIGLIST_EXCEPTION_HPP

#include "biglist/common.hpp"

#include <stdexcept>

/// \file
/// Exception types raised by the storage layer.

namespace biglist {

/// The lock could not be acquired within the given timeout.
class lock_acquire_error : public std::runtime_error {
public:
    using runtime_error::runtime_error;
};

/// The lock could not be released.
class lock_release_error : public std::runtime_error {
public:
    using runtime_error::runtime_error;
};

/// The holder of a lock guard is no longer the most recent holder
/// of the lock, i.e. somebody else acquired the lock in the meantime.
class lock_fencing_error : public std::runtime_error {
public:
    using runtime_error::runtime_error;
};

/// Attempted to create a file that already exists.
class file_exists_error : public std::runtime_error {
public:
    using runtime_error::runtime_error;
};

/// Attempted to read a file that does not exist.
class file_not_found_error : public std::runtime_error {
public:
    using runtime_error::runtime_error;
};

/// A storage format name has no registered codec.
class unknown_format_error : public std::invalid_argument {
public:
    using invalid_argument::invalid_argument;
};

} // namespace biglist

#endif // BIGLIST_EXCEPTION_HPP
