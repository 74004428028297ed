// line_tokenizer.h - Syntax tokens of one pretty-printed JSON line

#pragma once

#include <jsondiff/api.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsondiff {

enum class TokenKind : std::uint8_t {
    Key,
    String,
    Number,
    Boolean,
    Null,
    Structure,
    Whitespace
};

struct Token {
    std::string text;
    TokenKind kind = TokenKind::Structure;

    bool operator==(const Token&) const = default;
};

/// Split a line into typed spans. Concatenating the token texts gives
/// back the line. A string followed (after spaces) by ':' is a Key;
/// characters that start no token become single-character Structure tokens.
[[nodiscard]] JSONDIFF_API std::vector<Token> tokenize_line(std::string_view line);

/// Raw key of a `"key": ...` line (escape sequences kept as written).
/// nullopt for braces, bare values and bare strings.
///   "\"name\": \"Alice\""  -> name
///   "\"hello\","           -> nullopt
[[nodiscard]] JSONDIFF_API std::optional<std::string> extract_key(std::string_view trimmed_line);

/// Strip leading and trailing spaces and tabs
[[nodiscard]] JSONDIFF_API std::string_view trim_line(std::string_view line) noexcept;

} // namespace jsondiff
