#include <catch2/catch.hpp>

#include "biglist/codec.hpp"
#include "biglist/codecs/binary_codec.hpp"
#include "biglist/codecs/default_registry.hpp"
#include "biglist/codecs/gzip.hpp"
#include "biglist/codecs/json_codec.hpp"
#include "biglist/exception.hpp"

#include <string>
#include <vector>

using namespace biglist;

TEST_CASE("format names are normalized", "[codec]") {
    REQUIRE(normalize_format_name("json_gzip") == "json-gzip");
    REQUIRE(normalize_format_name("json-gzip") == "json-gzip");
    REQUIRE(format_extension("json-gzip") == "json_gzip");
    REQUIRE(format_extension("binary") == "binary");

    REQUIRE_THROWS_AS(normalize_format_name(""), std::invalid_argument);
    REQUIRE_THROWS_AS(normalize_format_name("a b"), std::invalid_argument);
    REQUIRE_THROWS_AS(normalize_format_name("x.y"), std::invalid_argument);
}

TEST_CASE("codec registry", "[codec]") {
    codec_registry<int> registry;
    registry.add("json", std::make_shared<json_codec<int>>())
            .add("json_gzip", std::make_shared<json_gzip_codec<int>>());

    REQUIRE(registry.contains("json"));
    REQUIRE(registry.contains("json-gzip"));
    REQUIRE(registry.contains("json_gzip"));
    REQUIRE_FALSE(registry.contains("binary"));
    REQUIRE(registry.names() == (std::vector<std::string>{"json", "json-gzip"}));

    SECTION("duplicate names are rejected") {
        REQUIRE_THROWS_AS(registry.add("json-gzip", std::make_shared<json_codec<int>>()),
                          std::invalid_argument);
    }

    SECTION("null codecs are rejected") {
        REQUIRE_THROWS_AS(registry.add("other", nullptr), std::invalid_argument);
    }

    SECTION("unknown formats") {
        REQUIRE_THROWS_AS(registry.get("parquet"), unknown_format_error);
        // Also an invalid_argument.
        REQUIRE_THROWS_AS(registry.get("parquet"), std::invalid_argument);
    }
}

TEST_CASE("default registry", "[codec]") {
    auto registry = default_registry<int>();
    REQUIRE(registry.names() == (std::vector<std::string>{"binary", "json", "json-gzip"}));
}

TEST_CASE("json codec", "[codec]") {
    json_codec<int> c;
    REQUIRE(c.serialize({1, 2, 3}) == "[1,2,3]");
    REQUIRE(c.deserialize("[4, 5]") == (std::vector<int>{4, 5}));
    REQUIRE(c.deserialize("[]").empty());
    REQUIRE_THROWS(c.deserialize("[1, 2"));
}

TEST_CASE("json codec with tuples", "[codec]") {
    using pair_t = std::pair<std::string, int>;

    json_codec<pair_t> c;
    std::string bytes = c.serialize({{"a", 1}, {"b", 2}});
    REQUIRE(bytes == R"([["a",1],["b",2]])");
    REQUIRE(c.deserialize(bytes) == (std::vector<pair_t>{{"a", 1}, {"b", 2}}));
}

TEST_CASE("gzip compression", "[codec]") {
    std::string data;
    for (int i = 0; i < 1000; ++i) {
        data += "repetitive content ";
    }

    std::string compressed = gzip_compress(data);
    REQUIRE(compressed.size() < data.size());
    // gzip magic number
    REQUIRE(static_cast<unsigned char>(compressed[0]) == 0x1f);
    REQUIRE(static_cast<unsigned char>(compressed[1]) == 0x8b);
    REQUIRE(gzip_decompress(compressed) == data);

    REQUIRE(gzip_decompress(gzip_compress("")).empty());
    REQUIRE_THROWS(gzip_decompress("definitely not gzip"));
}

TEST_CASE("json-gzip codec", "[codec]") {
    json_gzip_codec<std::string> c;
    std::vector<std::string> batch{"x", "", "a longer string"};
    std::string bytes = c.serialize(batch);
    REQUIRE(gzip_decompress(bytes) == R"(["x","","a longer string"])");
    REQUIRE(c.deserialize(bytes) == batch);
}

TEST_CASE("binary codec", "[codec]") {
    binary_codec<std::string> c;
    std::vector<std::string> batch{"first", "", "third"};
    REQUIRE(c.deserialize(c.serialize(batch)) == batch);

    binary_codec<int> ints;
    std::string bytes = ints.serialize({1, 2, 3, 4});
    REQUIRE_THROWS(ints.deserialize(bytes.substr(0, bytes.size() - 2)));
}
