#ifndef BIGLIST_UTILITY_RANDOM_TOKEN_HPP
#define BIGLIST_UTILITY_RANDOM_TOKEN_HPP

#include "biglist/common.hpp"

#include <string>

namespace biglist {

/// Returns `length` random lowercase hex characters (at most 32).
/// Tokens come from a random uuid, so independent processes
/// produce independent tokens without coordination.
std::string random_token(size_t length = 32);

/// Returns the current UTC time formatted as `YYYYmmddHHMMSS.ffffff`.
/// Strings produced by this function sort in chronological order.
std::string utc_timestamp();

} // namespace biglist

#endif // BIGLIST_UTILITY_RANDOM_TOKEN_HPP
