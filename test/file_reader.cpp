#include <catch2/catch.hpp>

#include "biglist/codecs/json_codec.hpp"
#include "biglist/exception.hpp"
#include "biglist/file_reader.hpp"
#include "biglist/utility/temp_dir.hpp"

#include <atomic>

using namespace biglist;

namespace {

struct fixture {
    temp_dir dir;
    upath_ptr root = resolve_path(dir.path().string());
    upath_ptr data = root / "store";
    std::shared_ptr<std::atomic<int>> loads = std::make_shared<std::atomic<int>>(0);

    file_reader<int>::loader_type loader() const {
        auto counter = loads;
        return [counter](const upath& p) {
            ++*counter;
            return json_codec<int>().deserialize(p.read_bytes());
        };
    }
};

} // namespace

TEST_CASE("file reader loads lazily", "[file-reader]") {
    fixture f;
    (f.data / "a.json")->write_bytes("[1,2,3]");

    file_reader<int> reader(f.data / "a.json", f.loader());
    REQUIRE_FALSE(reader.is_loaded());
    REQUIRE(f.loads->load() == 0);

    REQUIRE(reader.size() == 3);
    REQUIRE(reader.is_loaded());
    REQUIRE(reader[1] == 2);
    REQUIRE(reader.at(2) == 3);
    REQUIRE_THROWS_AS(reader.at(3), std::out_of_range);
    REQUIRE(std::vector<int>(reader.begin(), reader.end()) == (std::vector<int>{1, 2, 3}));

    reader.load();
    REQUIRE(f.loads->load() == 1);

    reader.unload();
    REQUIRE_FALSE(reader.is_loaded());
    REQUIRE(reader.data().size() == 3);
    REQUIRE(f.loads->load() == 2);

    REQUIRE(reader.to_string().find("a.json") != std::string::npos);
}

TEST_CASE("loaded data outlives the reader", "[file-reader]") {
    fixture f;
    (f.data / "a.json")->write_bytes("[7]");

    std::shared_ptr<const std::vector<int>> batch;
    {
        file_reader<int> reader(f.data / "a.json", f.loader());
        batch = reader.shared_data();
    }
    REQUIRE(*batch == std::vector<int>{7});
}

TEST_CASE("missing data files", "[file-reader]") {
    fixture f;
    file_reader<int> reader(f.data / "missing.json", f.loader());
    REQUIRE_THROWS_AS(reader.load(), file_not_found_error);
    REQUIRE_FALSE(reader.is_loaded());
}

TEST_CASE("file sequence", "[file-reader]") {
    fixture f;
    (f.data / "a.json")->write_bytes("[1,2]");
    (f.data / "b.json")->write_bytes("[]");
    (f.data / "c.json")->write_bytes("[3,4,5]");

    auto info = std::make_shared<const std::vector<data_file_info>>(std::vector<data_file_info>{
        {"a.json", 2, 2}, {"b.json", 0, 2}, {"c.json", 3, 5}
    });
    file_seq<int> seq(f.root, f.data, info, f.loader());

    REQUIRE(seq.size() == 3);
    REQUIRE_FALSE(seq.empty());
    REQUIRE(seq.num_data_files() == 3);
    REQUIRE(seq.num_data_items() == 5);
    REQUIRE(seq.path()->string() == f.root->string());
    REQUIRE(seq.data_files_info() == *info);

    // Readers are created unloaded.
    REQUIRE_FALSE(seq[2].is_loaded());
    REQUIRE(seq[2].path()->name() == "c.json");
    REQUIRE(f.loads->load() == 0);

    std::vector<int> all;
    for (auto reader : seq) {
        for (int v : reader) {
            all.push_back(v);
        }
    }
    REQUIRE(all == (std::vector<int>{1, 2, 3, 4, 5}));
    REQUIRE(seq.end() - seq.begin() == 3);
}

TEST_CASE("empty file sequence", "[file-reader]") {
    fixture f;
    file_seq<int> seq(f.root, f.data, std::make_shared<const std::vector<data_file_info>>(), f.loader());
    REQUIRE(seq.empty());
    REQUIRE(seq.num_data_items() == 0);
    REQUIRE(seq.begin() == seq.end());
}
