// test_line_tokenizer.cpp - Tests for line tokens and key extraction

#include <catch2/catch_all.hpp>
#include <jsondiff/line_tokenizer.h>

#include <string>
#include <vector>

using namespace jsondiff;

namespace {

std::string join(const std::vector<Token>& tokens)
{
    std::string out;
    for (const auto& t : tokens) out += t.text;
    return out;
}

std::vector<TokenKind> kinds(const std::vector<Token>& tokens)
{
    std::vector<TokenKind> out;
    for (const auto& t : tokens) out.push_back(t.kind);
    return out;
}

} // namespace

TEST_CASE("extract_key", "[tokenizer][key]") {
    SECTION("simple key") {
        REQUIRE(extract_key(R"("name": "Alice")") == "name");
        REQUIRE(extract_key(R"("count": 42,)") == "count");
    }

    SECTION("container opener") {
        REQUIRE(extract_key(R"("items": [)") == "items");
        REQUIRE(extract_key(R"("config": {)") == "config");
    }

    SECTION("escaped quote stays raw") {
        REQUIRE(extract_key(R"("key\"name": 1)") == R"(key\"name)");
    }

    SECTION("spaces before the colon") {
        REQUIRE(extract_key(R"("spaced"   : true)") == "spaced");
    }

    SECTION("empty key") {
        REQUIRE(extract_key(R"("": 0)") == "");
    }

    SECTION("no key") {
        REQUIRE_FALSE(extract_key("{").has_value());
        REQUIRE_FALSE(extract_key("},").has_value());
        REQUIRE_FALSE(extract_key("]").has_value());
        REQUIRE_FALSE(extract_key("42,").has_value());
        REQUIRE_FALSE(extract_key("true").has_value());
        REQUIRE_FALSE(extract_key(R"("hello",)").has_value());
        REQUIRE_FALSE(extract_key(R"("a:b")").has_value());
        REQUIRE_FALSE(extract_key(R"("unterminated)").has_value());
        REQUIRE_FALSE(extract_key("").has_value());
    }
}

TEST_CASE("trim_line", "[tokenizer]") {
    REQUIRE(trim_line("    \"a\": 1,\t") == "\"a\": 1,");
    REQUIRE(trim_line("   ").empty());
    REQUIRE(trim_line("x") == "x");
}

TEST_CASE("tokenize_line", "[tokenizer]") {
    SECTION("key and string value") {
        const std::string line = R"(    "name": "Alice",)";
        auto tokens = tokenize_line(line);
        REQUIRE(join(tokens) == line);
        REQUIRE(kinds(tokens) == std::vector<TokenKind>{
            TokenKind::Whitespace, TokenKind::Key, TokenKind::Structure, TokenKind::Whitespace,
            TokenKind::String, TokenKind::Structure});
        REQUIRE(tokens[1].text == R"("name")");
        REQUIRE(tokens[4].text == R"("Alice")");
    }

    SECTION("numbers") {
        auto tokens = tokenize_line(R"("n": -1.5e3)");
        REQUIRE(tokens.back() == Token{"-1.5e3", TokenKind::Number});
    }

    SECTION("literals") {
        REQUIRE(tokenize_line("true,").front() == Token{"true", TokenKind::Boolean});
        REQUIRE(tokenize_line("false").front() == Token{"false", TokenKind::Boolean});
        REQUIRE(tokenize_line("null").front() == Token{"null", TokenKind::Null});
    }

    SECTION("brackets") {
        auto tokens = tokenize_line("  ],");
        REQUIRE(kinds(tokens) == std::vector<TokenKind>{
            TokenKind::Whitespace, TokenKind::Structure, TokenKind::Structure});
    }

    SECTION("escaped quote inside a string") {
        auto tokens = tokenize_line(R"("a\"b": "c\\")");
        REQUIRE(tokens[0] == Token{R"("a\"b")", TokenKind::Key});
        REQUIRE(tokens.back() == Token{R"("c\\")", TokenKind::String});
    }

    SECTION("bare string in an array is not a key") {
        auto tokens = tokenize_line(R"(  "x",)");
        REQUIRE(tokens[1].kind == TokenKind::String);
    }

    SECTION("invalid text still round-trips") {
        const std::string line = R"({not "json)";
        auto tokens = tokenize_line(line);
        REQUIRE(join(tokens) == line);
    }

    SECTION("empty line") {
        REQUIRE(tokenize_line("").empty());
    }
}
