#include "biglist/data_file_info.hpp"

#include "biglist/utility/random_token.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <set>

namespace biglist {

void to_json(nlohmann::json& j, const data_file_info& f) {
    j = nlohmann::json::array({f.name, f.count, f.cumcount});
}

void from_json(const nlohmann::json& j, data_file_info& f) {
    f.name = j.at(0).get<std::string>();
    f.count = j.at(1).get<u64>();
    f.cumcount = j.at(2).get<u64>();
}

void to_json(nlohmann::json& j, const file_entry& f) {
    j = nlohmann::json::array({f.name, f.count});
}

void from_json(const nlohmann::json& j, file_entry& f) {
    f.name = j.at(0).get<std::string>();
    f.count = j.at(1).get<u64>();
}

std::vector<data_file_info> merge_data_files_info(const std::vector<data_file_info>& existing,
                                                  const std::vector<file_entry>& additions)
{
    std::set<file_entry> entries;
    for (const data_file_info& f : existing) {
        entries.insert(file_entry{f.name, f.count});
    }
    entries.insert(additions.begin(), additions.end());

    std::vector<data_file_info> result;
    result.reserve(entries.size());

    u64 cumcount = 0;
    for (const file_entry& e : entries) {
        cumcount += e.count;
        result.push_back(data_file_info{e.name, e.count, cumcount});
    }
    return result;
}

bool is_consistent(const std::vector<data_file_info>& files) {
    u64 cumcount = 0;
    for (const data_file_info& f : files) {
        cumcount += f.count;
        if (f.cumcount != cumcount) {
            return false;
        }
    }
    return true;
}

std::string make_data_file_name(u64 length, const std::string& extra) {
    std::string prefix = boost::trim_copy_if(extra, boost::is_any_of("_"));
    if (!prefix.empty()) {
        prefix += "_";
    }
    return fmt::format("{}_{}{}_{}", utc_timestamp(), prefix, random_token(16), length);
}

} // namespace biglist
