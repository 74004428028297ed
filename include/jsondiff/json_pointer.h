// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json_pointer.h
/// @brief JSON Pointer (RFC 6901) conversion for diff paths.
///
/// A diff path is a sequence of segments: object keys as-is, array
/// indices as their decimal text. Pointers address the same locations:
///   ["users", "0", "name"]  <->  "/users/0/name"
///
/// RFC 6901: https://datatracker.ietf.org/doc/html/rfc6901
///
/// - The empty pointer "" refers to the whole document
/// - Escape sequences: "~0" -> "~", "~1" -> "/"

#pragma once

#include <jsondiff/api.h>
#include <jsondiff/value.h>

#include <immer/vector.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace jsondiff {

/// Path of a node inside a Value tree. Persistent, so a child's path
/// shares structure with its parent's.
using DiffPath = immer::vector<std::string>;

// Convert a path to a JSON Pointer string
//   []                     -> ""
//   ["users", "0", "name"] -> "/users/0/name"
//   ["a/b", "c~d"]         -> "/a~1b/c~0d"
[[nodiscard]] JSONDIFF_API std::string path_to_json_pointer(const DiffPath& path);
[[nodiscard]] JSONDIFF_API std::string path_to_json_pointer(const std::vector<std::string>& path);

// Parse JSON Pointer string into a path
//   "/users/0/name"  -> ["users", "0", "name"]
//   ""               -> []  (root)
//   "/"              -> [""]  (key is empty string)
// A pointer that does not start with '/' is logged and yields the root path.
[[nodiscard]] JSONDIFF_API DiffPath parse_json_pointer(std::string_view pointer);

// Get value by JSON Pointer
// Returns null Value if path not found
[[nodiscard]] JSONDIFF_API Value get_by_pointer(const Value& data, std::string_view pointer);

// Get value by path; null Value if any segment misses
[[nodiscard]] JSONDIFF_API Value get_by_path(const Value& data, const DiffPath& path);

} // namespace jsondiff
