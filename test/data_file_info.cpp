#include <catch2/catch.hpp>

#include "biglist/data_file_info.hpp"

#include <nlohmann/json.hpp>

#include <regex>

using namespace biglist;

TEST_CASE("merging file entries into an empty index", "[data-file-info]") {
    std::vector<file_entry> additions{{"b", 2}, {"a", 3}, {"c", 0}};

    auto merged = merge_data_files_info({}, additions);
    REQUIRE(merged.size() == 3);
    REQUIRE(merged[0] == (data_file_info{"a", 3, 3}));
    REQUIRE(merged[1] == (data_file_info{"b", 2, 5}));
    REQUIRE(merged[2] == (data_file_info{"c", 0, 5}));
    REQUIRE(is_consistent(merged));
}

TEST_CASE("merging is idempotent", "[data-file-info]") {
    std::vector<file_entry> additions{{"20240101000000.000001_aa_3", 3},
                                      {"20240101000000.000002_bb_4", 4}};

    auto once = merge_data_files_info({}, additions);
    auto twice = merge_data_files_info(once, additions);
    REQUIRE(once == twice);

    // Duplicates within the additions collapse as well.
    std::vector<file_entry> doubled = additions;
    doubled.insert(doubled.end(), additions.begin(), additions.end());
    REQUIRE(merge_data_files_info({}, doubled) == once);
}

TEST_CASE("merging recomputes cumulative counts", "[data-file-info]") {
    std::vector<data_file_info> existing{{"b", 2, 2}, {"d", 4, 6}};
    std::vector<file_entry> additions{{"a", 1}, {"c", 3}};

    auto merged = merge_data_files_info(existing, additions);
    std::vector<data_file_info> expected{{"a", 1, 1}, {"b", 2, 3}, {"c", 3, 6}, {"d", 4, 10}};
    REQUIRE(merged == expected);
}

TEST_CASE("consistency of cumulative counts", "[data-file-info]") {
    REQUIRE(is_consistent({}));
    REQUIRE(is_consistent({{"a", 1, 1}, {"b", 0, 1}, {"c", 5, 6}}));
    REQUIRE_FALSE(is_consistent({{"a", 1, 1}, {"b", 2, 2}}));
}

TEST_CASE("json representation of index entries", "[data-file-info]") {
    nlohmann::json j = std::vector<data_file_info>{{"x.json", 3, 3}, {"y.json", 2, 5}};
    REQUIRE(j.dump() == R"([["x.json",3,3],["y.json",2,5]])");

    auto parsed = nlohmann::json::parse(R"([["a",1],["b",2]])").get<std::vector<file_entry>>();
    REQUIRE(parsed.size() == 2);
    REQUIRE(parsed[1] == (file_entry{"b", 2}));
}

TEST_CASE("data file names", "[data-file-info]") {
    const std::regex plain(R"(\d{14}\.\d{6}_[0-9a-f]{16}_42)");
    const std::regex with_extra(R"(\d{14}\.\d{6}_worker1_[0-9a-f]{16}_7)");

    REQUIRE(std::regex_match(make_data_file_name(42), plain));
    REQUIRE(std::regex_match(make_data_file_name(7, "_worker1_"), with_extra));
    REQUIRE(make_data_file_name(1) != make_data_file_name(1));
}

TEST_CASE("data file names sort by creation time", "[data-file-info]") {
    std::string previous = make_data_file_name(1);
    for (int i = 0; i < 20; ++i) {
        std::string next = make_data_file_name(1);
        REQUIRE(next.substr(0, 21) >= previous.substr(0, 21));
        previous = next;
    }
}
