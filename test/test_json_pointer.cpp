// test_json_pointer.cpp - Tests for JSON Pointer conversion and lookup

#include <catch2/catch_all.hpp>
#include <jsondiff/json_pointer.h>
#include <jsondiff/serialization.h>

using namespace jsondiff;

namespace {

DiffPath make_path(std::initializer_list<std::string> segments)
{
    DiffPath path;
    for (const auto& s : segments) {
        path = path.push_back(s);
    }
    return path;
}

} // namespace

TEST_CASE("path_to_json_pointer", "[json_pointer]") {
    SECTION("root is the empty pointer") {
        REQUIRE(path_to_json_pointer(DiffPath{}).empty());
    }

    SECTION("segments are joined with '/'") {
        REQUIRE(path_to_json_pointer(make_path({"users", "0", "name"})) == "/users/0/name");
        REQUIRE(path_to_json_pointer(std::vector<std::string>{"a", "3"}) == "/a/3");
    }

    SECTION("'~' and '/' are escaped") {
        REQUIRE(path_to_json_pointer(make_path({"a/b", "c~d"})) == "/a~1b/c~0d");
        REQUIRE(path_to_json_pointer(make_path({"~1"})) == "/~01");
    }

    SECTION("empty key") {
        REQUIRE(path_to_json_pointer(make_path({""})) == "/");
    }
}

TEST_CASE("parse_json_pointer", "[json_pointer]") {
    SECTION("root") {
        REQUIRE(parse_json_pointer("").empty());
    }

    SECTION("segments") {
        REQUIRE(parse_json_pointer("/users/0/name") == make_path({"users", "0", "name"}));
        REQUIRE(parse_json_pointer("/") == make_path({""}));
        REQUIRE(parse_json_pointer("/a/") == make_path({"a", ""}));
    }

    SECTION("escapes are decoded") {
        REQUIRE(parse_json_pointer("/a~1b/c~0d") == make_path({"a/b", "c~d"}));
        REQUIRE(parse_json_pointer("/~01") == make_path({"~1"}));
    }

    SECTION("invalid pointer yields root") {
        REQUIRE(parse_json_pointer("users/0").empty());
    }

    SECTION("round trip through escaping") {
        auto path = make_path({"x/y", "~", "0"});
        REQUIRE(parse_json_pointer(path_to_json_pointer(path)) == path);
    }
}

TEST_CASE("get_by_pointer", "[json_pointer]") {
    auto doc = from_json(R"({
        "users": [{"name": "Alice"}, {"name": "Bob"}],
        "config": {"theme~mode": "dark", "a/b": 1}
    })");

    REQUIRE(get_by_pointer(doc, "") == doc);
    REQUIRE(get_by_pointer(doc, "/users/1/name").as_string() == "Bob");
    REQUIRE(get_by_pointer(doc, "/config/theme~0mode").as_string() == "dark");
    REQUIRE(get_by_pointer(doc, "/config/a~1b").as_number() == 1.0);

    SECTION("misses return null") {
        REQUIRE(get_by_pointer(doc, "/users/5").is_null());
        REQUIRE(get_by_pointer(doc, "/users/-").is_null());
        REQUIRE(get_by_pointer(doc, "/config/missing").is_null());
        REQUIRE(get_by_pointer(doc, "/config/theme~0mode/deeper").is_null());
    }
}
