// line_tokenizer.cpp - tokenize_line / extract_key

#include <jsondiff/line_tokenizer.h>

#include <cctype>

namespace jsondiff {

namespace {

constexpr std::string_view kStructureChars = "{}[]:,";

bool is_blank(char c)
{
    return c == ' ' || c == '\t';
}

/// Position of the closing quote of the string starting at `text[0]`
std::optional<std::size_t> find_string_end(std::string_view text)
{
    bool escaped = false;
    for (std::size_t i = 1; i < text.size(); ++i) {
        if (escaped) {
            escaped = false;
        } else if (text[i] == '\\') {
            escaped = true;
        } else if (text[i] == '"') {
            return i;
        }
    }
    return std::nullopt;
}

bool is_number_char(char c)
{
    return std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == '-' || c == '+' || c == 'e' || c == 'E';
}

} // anonymous namespace

std::string_view trim_line(std::string_view line) noexcept
{
    while (!line.empty() && is_blank(line.front())) line.remove_prefix(1);
    while (!line.empty() && is_blank(line.back())) line.remove_suffix(1);
    return line;
}

std::vector<Token> tokenize_line(std::string_view line)
{
    std::vector<Token> tokens;
    std::string_view rest = line;

    while (!rest.empty()) {
        const char first = rest.front();

        if (is_blank(first)) {
            std::size_t n = 0;
            while (n < rest.size() && is_blank(rest[n])) ++n;
            tokens.push_back({std::string(rest.substr(0, n)), TokenKind::Whitespace});
            rest.remove_prefix(n);
            continue;
        }

        if (kStructureChars.find(first) != std::string_view::npos) {
            tokens.push_back({std::string(1, first), TokenKind::Structure});
            rest.remove_prefix(1);
            continue;
        }

        if (first == '"') {
            if (auto end = find_string_end(rest)) {
                std::string text(rest.substr(0, *end + 1));
                rest.remove_prefix(*end + 1);

                auto after = rest;
                while (!after.empty() && after.front() == ' ') after.remove_prefix(1);
                const bool is_key = !after.empty() && after.front() == ':';

                tokens.push_back({std::move(text), is_key ? TokenKind::Key : TokenKind::String});
                continue;
            }
        }

        if (first == '-' || std::isdigit(static_cast<unsigned char>(first))) {
            std::size_t n = 0;
            while (n < rest.size() && is_number_char(rest[n])) ++n;
            tokens.push_back({std::string(rest.substr(0, n)), TokenKind::Number});
            rest.remove_prefix(n);
            continue;
        }

        if (rest.starts_with("true")) {
            tokens.push_back({"true", TokenKind::Boolean});
            rest.remove_prefix(4);
            continue;
        }
        if (rest.starts_with("false")) {
            tokens.push_back({"false", TokenKind::Boolean});
            rest.remove_prefix(5);
            continue;
        }
        if (rest.starts_with("null")) {
            tokens.push_back({"null", TokenKind::Null});
            rest.remove_prefix(4);
            continue;
        }

        // Unterminated string or stray character
        tokens.push_back({std::string(1, first), TokenKind::Structure});
        rest.remove_prefix(1);
    }

    return tokens;
}

std::optional<std::string> extract_key(std::string_view trimmed_line)
{
    if (trimmed_line.empty() || trimmed_line.front() != '"') {
        return std::nullopt;
    }
    auto end = find_string_end(trimmed_line);
    if (!end) {
        return std::nullopt;
    }

    auto after = trimmed_line.substr(*end + 1);
    while (!after.empty() && is_blank(after.front())) after.remove_prefix(1);
    if (after.empty() || after.front() != ':') {
        return std::nullopt;
    }
    return std::string(trimmed_line.substr(1, *end - 1));
}

} // namespace jsondiff
