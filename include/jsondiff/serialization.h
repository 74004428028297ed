// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief JSON text <-> Value conversion.
///
/// Usage:
/// @code
///   #include <jsondiff/serialization.h>
///
///   Value data = Value::object({{"b", 1}, {"a", "x"}});
///   std::string pretty = to_json(data, false, 4);   // {"a", "b"} order, 4-space indent
///   std::string hash   = to_canonical_json(data);   // {"a":"x","b":1}
///
///   std::string error;
///   Value parsed = from_json(text, &error);
/// @endcode
///
/// The writer always emits object keys in sorted (byte-wise) order so
/// that output is deterministic regardless of how the object was built.
/// Numbers are written with format_number(): integral values carry no
/// decimal point.

#pragma once

#include "api.h"
#include "value.h"

#include <optional>
#include <string>

namespace jsondiff {

/// Maximum container nesting accepted by the reader
inline constexpr int kMaxJsonDepth = 512;

/// Convert Value to JSON string
/// @param val The Value to convert
/// @param compact If true, produce minimal output; if false, pretty-print with indentation
/// @param indent_width Spaces per nesting level when pretty-printing
/// @return JSON string representation with sorted object keys
JSONDIFF_API std::string to_json(const Value& val, bool compact = false, int indent_width = 2);

/// Canonical compact JSON (sorted keys, no whitespace).
/// Used as the content hash of array elements.
JSONDIFF_API std::string to_canonical_json(const Value& val);

/// Parse JSON string to Value
/// @param json_str The JSON string to parse
/// @param error_out If provided, receives error message on failure
/// @return Parsed Value, or null Value on parse error
JSONDIFF_API Value from_json(const std::string& json_str, std::string* error_out = nullptr);

/// Parse JSON string to Value, distinguishing a literal `null` from failure
/// @return Parsed Value, or std::nullopt on parse error
JSONDIFF_API std::optional<Value> try_parse_json(const std::string& json_str,
                                                 std::string* error_out = nullptr);

/// Parse-and-reformat raw JSON text with sorted keys and the given indent.
///
/// Blank or malformed input is returned unchanged (the caller renders it
/// as-is); `formatted` tells the two cases apart.
struct PrettyPrintResult {
    std::string text;
    bool formatted = false;
    std::string error;
};

JSONDIFF_API PrettyPrintResult pretty_print(const std::string& raw_text, int indent_width = 4);

} // namespace jsondiff
