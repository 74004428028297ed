// value.cpp - Value type utilities

#include <jsondiff/value.h>
#include <jsondiff/serialization.h>

#include <charconv>   // for std::to_chars
#include <cmath>      // for std::isfinite, std::trunc
#include <cstdio>     // for std::snprintf
#include <system_error>

namespace jsondiff {

std::string_view value_type_name(ValueType type) noexcept
{
    switch (type) {
        case ValueType::Object:  return "object";
        case ValueType::Array:   return "array";
        case ValueType::String:  return "string";
        case ValueType::Number:  return "number";
        case ValueType::Boolean: return "boolean";
        case ValueType::Null:    return "null";
    }
    return "null";
}

std::string format_number(double n)
{
    if (!std::isfinite(n)) {
        return "null";
    }
    if (n == std::trunc(n)) {
        char buf[352];
        std::snprintf(buf, sizeof(buf), "%.0f", n);
        return buf;
    }
    char buf[32];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), n);
    if (ec != std::errc{}) {
        return "null";
    }
    return std::string(buf, end);
}

std::string primitive_to_string(const Value& val)
{
    return std::visit([&val](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return arg;
        } else if constexpr (std::is_same_v<T, double>) {
            return format_number(arg);
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else {
            return to_canonical_json(val);
        }
    }, val.data);
}

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, double>) {
            return format_number(arg);
        } else if constexpr (std::is_same_v<T, ValueObject>) {
            return "{object:" + std::to_string(arg.size()) + "}";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return "[array:" + std::to_string(arg.size()) + "]";
        } else {
            return "null";
        }
    }, val.data);
}

// ============================================================
// Explicit Template Instantiations
//
// These instantiations generate the actual code for the templated classes
// that are declared with 'extern template' in value.h.
// ============================================================

template struct BasicValue<immer::default_memory_policy>;
template struct BasicValueObject<immer::default_memory_policy>;

} // namespace jsondiff
