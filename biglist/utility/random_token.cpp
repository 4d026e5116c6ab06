#include "biglist/utility/random_token.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <fmt/format.h>

#include <algorithm>

namespace biglist {

std::string random_token(size_t length) {
    // The generator is not thread safe; give each thread its own.
    thread_local boost::uuids::random_generator gen;
    const boost::uuids::uuid id = gen();

    std::string result;
    result.reserve(32);
    for (byte b : id) {
        result += fmt::format("{:02x}", static_cast<unsigned>(b));
    }
    result.resize(std::min(length, result.size()));
    return result;
}

std::string utc_timestamp() {
    namespace pt = boost::posix_time;

    const pt::ptime now = pt::microsec_clock::universal_time();
    const auto date = now.date();
    const auto tod = now.time_of_day();
    const auto micros = tod.total_microseconds() % 1000000;
    return fmt::format("{:04}{:02}{:02}{:02}{:02}{:02}.{:06}",
                       static_cast<int>(date.year()), static_cast<int>(date.month()),
                       static_cast<int>(date.day()), tod.hours(), tod.minutes(),
                       tod.seconds(), micros);
}

} // namespace biglist
