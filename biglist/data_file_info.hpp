#ifndef BIGLIST_DATA_FILE_INFO_HPP
#define BIGLIST_DATA_FILE_INFO_HPP

#include "biglist/common.hpp"

#include <nlohmann/json.hpp>

#include <ostream>
#include <string>
#include <vector>

/// \file
/// Entries of the dataset index and the rules for merging them.

namespace biglist {

/// A data file as recorded in the index: its name (relative to the
/// data directory), the number of elements it holds, and the number of
/// elements in this file and all files before it.
///
/// Serialized as a json array `[name, count, cumcount]`.
struct data_file_info {
    std::string name;
    u64 count = 0;
    u64 cumcount = 0;
};

inline bool operator==(const data_file_info& a, const data_file_info& b) {
    return a.name == b.name && a.count == b.count && a.cumcount == b.cumcount;
}

inline bool operator!=(const data_file_info& a, const data_file_info& b) {
    return !(a == b);
}

inline std::ostream& operator<<(std::ostream& o, const data_file_info& f) {
    return o << "[" << f.name << ", " << f.count << ", " << f.cumcount << "]";
}

void to_json(nlohmann::json& j, const data_file_info& f);
void from_json(const nlohmann::json& j, data_file_info& f);

/// A data file that has not been merged into the index yet.
/// Serialized as a json array `[name, count]`.
struct file_entry {
    std::string name;
    u64 count = 0;
};

inline bool operator==(const file_entry& a, const file_entry& b) {
    return a.name == b.name && a.count == b.count;
}

inline bool operator<(const file_entry& a, const file_entry& b) {
    return a.name < b.name || (a.name == b.name && a.count < b.count);
}

void to_json(nlohmann::json& j, const file_entry& f);
void from_json(const nlohmann::json& j, file_entry& f);

/// Merges new file entries into an index.
///
/// Entries are treated as a set of (name, count) pairs: duplicates are removed,
/// so merging the same additions twice has no effect. The result is sorted by
/// name, which is creation order for names produced by \ref make_data_file_name,
/// and the cumulative counts are recomputed.
std::vector<data_file_info> merge_data_files_info(const std::vector<data_file_info>& existing,
                                                  const std::vector<file_entry>& additions);

/// Checks that cumulative counts are the running sum of the counts.
bool is_consistent(const std::vector<data_file_info>& files);

/// Creates a collision free name for a new data file with `length` elements:
/// `{utc timestamp}_{extra_}{16 random hex chars}_{length}`.
/// The caller appends the extension.
std::string make_data_file_name(u64 length, const std::string& extra = "");

} // namespace biglist

#endif // BIGLIST_DATA_FILE_INFO_HPP
