#ifndef BIGLIST_COMMON_HPP
#define BIGLIST_COMMON_HPP

#include <climits>
#include <cstddef>
#include <cstdint>

namespace biglist {

static_assert(CHAR_BIT == 8, "Byte width sanity check.");

using byte = unsigned char;

using u32 = uint32_t;
using u64 = uint64_t;

using i32 = int32_t;
using i64 = int64_t;

/// Version tag written into the info record of new datasets.
static constexpr int current_storage_version = 3;

#ifndef NDEBUG

/// Similar to standard assert, but allows for a custom message.
#define biglist_assert(condition, message)                        \
    do {                                                          \
        if (!(condition)) {                                       \
            ::biglist::assertion_failed_impl(__FILE__, __LINE__,  \
                #condition, message);                             \
        }                                                         \
    } while (0)

#else

#define biglist_assert(condition, message) do { } while(0)

#endif

// Do not call directly.
void assertion_failed_impl(const char* file, int line,
                           const char* condition, const char* message);

} // namespace biglist

#endif // BIGLIST_COMMON_HPP
