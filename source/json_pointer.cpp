// json_pointer.cpp
// Implementation of JSON Pointer (RFC 6901) conversion for diff paths

#include <jsondiff/json_pointer.h>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace jsondiff {

namespace {

/// Unescape a JSON Pointer segment according to RFC 6901
/// ~1 -> /, ~0 -> ~
std::string unescape_segment(std::string_view segment)
{
    std::string result;
    result.reserve(segment.size());

    for (size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] == '~' && i + 1 < segment.size()) {
            if (segment[i + 1] == '1') {
                result += '/';
                ++i;
                continue;
            } else if (segment[i + 1] == '0') {
                result += '~';
                ++i;
                continue;
            }
        }
        result += segment[i];
    }

    return result;
}

void append_escaped(std::string& out, const std::string& segment)
{
    out += '/';
    for (char c : segment) {
        if (c == '~') {
            out += "~0";
        } else if (c == '/') {
            out += "~1";
        } else {
            out += c;
        }
    }
}

template <typename Segments>
std::string to_pointer(const Segments& path)
{
    std::string result;
    for (const auto& segment : path) {
        append_escaped(result, segment);
    }
    return result;
}

/// Parse a segment as an array index (digits only, no sign)
bool parse_index(const std::string& s, std::size_t& index)
{
    if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), index);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

} // anonymous namespace

std::string path_to_json_pointer(const DiffPath& path)
{
    return to_pointer(path);
}

std::string path_to_json_pointer(const std::vector<std::string>& path)
{
    return to_pointer(path);
}

DiffPath parse_json_pointer(std::string_view pointer)
{
    // Empty pointer refers to root
    if (pointer.empty()) {
        return DiffPath{};
    }

    // JSON Pointer must start with '/'
    if (pointer[0] != '/') {
        detail::log_access_error("parse_json_pointer",
                                 "invalid pointer, must start with '/': " + std::string(pointer));
        return DiffPath{};
    }

    auto segments = DiffPath{}.transient();

    // Skip leading '/'
    pointer = pointer.substr(1);

    // Split by '/'; "/a/" has a trailing empty key
    while (true) {
        auto pos = pointer.find('/');
        std::string_view segment = (pos == std::string_view::npos)
                                    ? pointer
                                    : pointer.substr(0, pos);

        segments.push_back(unescape_segment(segment));

        if (pos == std::string_view::npos) {
            break;
        }
        pointer = pointer.substr(pos + 1);
    }

    return segments.persistent();
}

Value get_by_path(const Value& data, const DiffPath& path)
{
    const Value* current = &data;
    for (const auto& segment : path) {
        if (auto* obj = current->get_if<ValueObject>()) {
            current = obj->find(segment);
        } else if (auto* arr = current->get_if<ValueVector>()) {
            std::size_t index = 0;
            if (parse_index(segment, index) && index < arr->size()) {
                current = &(*arr)[index].get();
            } else {
                current = nullptr;
            }
        } else {
            current = nullptr;
        }

        if (!current) {
            detail::log_key_error("get_by_path", segment, "not found");
            return Value{};
        }
    }
    return *current;
}

Value get_by_pointer(const Value& data, std::string_view pointer)
{
    return get_by_path(data, parse_json_pointer(pointer));
}

} // namespace jsondiff
