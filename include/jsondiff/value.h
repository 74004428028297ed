// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief JSON Value type: the parsed, typed tree both sides of a comparison are held in.
///
/// This file defines the core Value type that can represent:
/// - Object: string -> Value mapping (keys unique, insertion order remembered)
/// - Array: ordered sequence of Value
/// - String, Number (double), Boolean
/// - Null (std::monostate)
///
/// Containers are immer persistent structures, so copying a Value (or a
/// subtree of it into a DiffItem) only bumps a reference count.
///
/// The Value type is templated on a memory policy, allowing users to
/// customize memory allocation strategies for the underlying immer containers.

#pragma once

#include <jsondiff/jsondiff_config.h>
#include <jsondiff/api.h>

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace jsondiff {

namespace detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if JSONDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if JSONDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if JSONDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

} // namespace detail

/// JSON type of a Value. The enumerator order matches the variant order
/// in BasicValue::data, so type() is a plain index cast.
enum class ValueType : std::uint8_t {
    Object,
    Array,
    String,
    Number,
    Boolean,
    Null
};

// Forward declaration
template <typename MemoryPolicy>
struct BasicValue;

template <typename MemoryPolicy>
using BasicValueBox = immer::box<BasicValue<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueMap = immer::map<std::string,
                                  BasicValueBox<MemoryPolicy>,
                                  std::hash<std::string>,
                                  std::equal_to<std::string>,
                                  MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueVector = immer::vector<BasicValueBox<MemoryPolicy>,
                                        MemoryPolicy>;

template <typename MemoryPolicy>
using BasicKeyVector = immer::vector<std::string, MemoryPolicy>;

// ============================================================
// BasicValueObject - JSON object
//
// `entries` answers lookups; `order` remembers the order in which keys
// were first inserted (document order when built by the reader).
// Equality looks at `entries` only: two objects with the same members
// in a different order are equal.
// ============================================================

template <typename MemoryPolicy>
struct BasicValueObject {
    using value_type = BasicValue<MemoryPolicy>;
    using value_box  = BasicValueBox<MemoryPolicy>;
    using value_map  = BasicValueMap<MemoryPolicy>;
    using key_vector = BasicKeyVector<MemoryPolicy>;

    value_map entries;
    key_vector order;

    [[nodiscard]] std::size_t size() const noexcept { return entries.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries.empty(); }
    [[nodiscard]] std::size_t count(const std::string& key) const { return entries.count(key); }

    /// Pointer to the member value, or nullptr when the key is absent
    [[nodiscard]] const value_type* find(const std::string& key) const {
        if (auto* found = entries.find(key)) return &found->get();
        return nullptr;
    }

    /// Return a copy with `key` set to `val`; new keys go to the end of `order`
    [[nodiscard]] BasicValueObject set(const std::string& key, value_type val) const {
        BasicValueObject result{entries.set(key, value_box{std::move(val)}), order};
        if (!entries.count(key)) {
            result.order = order.push_back(key);
        }
        return result;
    }

    bool operator==(const BasicValueObject& other) const {
        return entries == other.entries;
    }

    bool operator!=(const BasicValueObject& other) const {
        return !(*this == other);
    }
};

template <typename MemoryPolicy = immer::default_memory_policy>
struct BasicValue
{
    using memory_policy = MemoryPolicy;
    using value_box     = BasicValueBox<MemoryPolicy>;
    using value_map     = BasicValueMap<MemoryPolicy>;
    using value_vector  = BasicValueVector<MemoryPolicy>;
    using value_object  = BasicValueObject<MemoryPolicy>;
    using key_vector    = BasicKeyVector<MemoryPolicy>;

    std::variant<value_object,
                 value_vector,
                 std::string,
                 double,
                 bool,
                 std::monostate>
        data;

    constexpr BasicValue() noexcept : data(std::monostate{}) {}
    constexpr BasicValue(std::nullptr_t) noexcept : data(std::monostate{}) {}
    constexpr BasicValue(int v) noexcept : data(static_cast<double>(v)) {}
    constexpr BasicValue(int64_t v) noexcept : data(static_cast<double>(v)) {}
    constexpr BasicValue(double v) noexcept : data(v) {}
    constexpr BasicValue(bool v) noexcept : data(v) {}
    BasicValue(const std::string& v) : data(v) {}
    BasicValue(std::string&& v) noexcept : data(std::move(v)) {}
    BasicValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(value_object v) : data(std::move(v)) {}
    BasicValue(value_vector v) : data(std::move(v)) {}

    // Factory functions for container types
    static BasicValue object(std::initializer_list<std::pair<std::string, BasicValue>> init) {
        auto entries = value_map{}.transient();
        auto order = key_vector{}.transient();
        for (const auto& [key, val] : init) {
            if (!entries.count(key)) order.push_back(key);
            entries.set(key, value_box{val});
        }
        return BasicValue{value_object{entries.persistent(), order.persistent()}};
    }

    static BasicValue array(std::initializer_list<BasicValue> init) {
        auto t = value_vector{}.transient();
        for (const auto& val : init) {
            t.push_back(value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] ValueType type() const noexcept { return static_cast<ValueType>(data.index()); }
    [[nodiscard]] bool is_object() const noexcept { return is<value_object>(); }
    [[nodiscard]] bool is_array() const noexcept { return is<value_vector>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_number() const noexcept { return is<double>(); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_container() const noexcept { return is_object() || is_array(); }

    [[nodiscard]] BasicValue at(const std::string& key) const {
        if (auto* o = get_if<value_object>()) {
            if (auto* found = o->find(key)) return *found;
        }
        detail::log_key_error("Value::at", key, "not found or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] BasicValue at(std::size_t index) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return (*v)[index].get();
        }
        detail::log_index_error("Value::at", index, "out of range or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] double as_number(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        return default_val;
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] BasicValue set(const std::string& key, BasicValue val) const {
        if (auto* o = get_if<value_object>()) return o->set(key, std::move(val));
        detail::log_key_error("Value::set", key, "cannot set on non-object type");
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        if (auto* o = get_if<value_object>()) return o->size();
        if (auto* v = get_if<value_vector>()) return v->size();
        return 0;
    }

    using size_type = std::size_t;
};

// ============================================================
// Default Value Type Aliases
//
// Value uses immer's default (thread-safe) memory policy: a diff result
// may be computed on a worker thread and read on another, so reference
// counts must be atomic.
// ============================================================

using Value       = BasicValue<immer::default_memory_policy>;
using ValueBox    = BasicValueBox<immer::default_memory_policy>;
using ValueMap    = BasicValueMap<immer::default_memory_policy>;
using ValueVector = BasicValueVector<immer::default_memory_policy>;
using ValueObject = BasicValueObject<immer::default_memory_policy>;
using KeyVector   = BasicKeyVector<immer::default_memory_policy>;

/// Structural, type-sensitive equality: string "1" != number 1,
/// objects compare members regardless of key order.
template <typename MemoryPolicy>
bool operator==(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return a.data == b.data;
}

template <typename MemoryPolicy>
bool operator!=(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return !(a == b);
}

// ============================================================
// Utility functions
// ============================================================

/// "object", "array", "string", "number", "boolean" or "null"
[[nodiscard]] JSONDIFF_API std::string_view value_type_name(ValueType type) noexcept;

/// Render a number the way comparisons and line matching see it:
/// integral values without a decimal point, others as the shortest
/// text that reads back to the same double.
[[nodiscard]] JSONDIFF_API std::string format_number(double n);

/// String rendering used for non-strict equivalence and key matching.
/// Strings render as-is (unquoted); containers render as canonical JSON.
[[nodiscard]] JSONDIFF_API std::string primitive_to_string(const Value& val);

// Convert Value to human-readable string (strings quoted, containers summarized)
[[nodiscard]] JSONDIFF_API std::string value_to_string(const Value& val);

// ============================================================
// Extern Template Declarations
//
// The actual instantiations are in value.cpp.
// ============================================================

JSONDIFF_EXTERN_TEMPLATE struct BasicValue<immer::default_memory_policy>;
JSONDIFF_EXTERN_TEMPLATE struct BasicValueObject<immer::default_memory_policy>;

} // namespace jsondiff
