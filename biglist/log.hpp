#ifndef BIGLIST_LOG_HPP
#define BIGLIST_LOG_HPP

#include "biglist/common.hpp"

#include <spdlog/spdlog.h>

#include <memory>

namespace biglist {

/// Returns the logger used by this library.
///
/// If the application registered a spdlog logger named "biglist",
/// that logger is used. Otherwise a colored stderr logger with that name
/// is created on first use.
std::shared_ptr<spdlog::logger> log();

/// Replaces the library logger. Passing a null pointer restores the default.
void set_logger(std::shared_ptr<spdlog::logger> logger);

} // namespace biglist

#endif // BIGLIST_LOG_HPP
