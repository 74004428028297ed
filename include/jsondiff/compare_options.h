// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file compare_options.h
/// @brief Runtime configuration for comparison and rendering.
///
/// All options are plain value structs; a default-constructed struct is
/// the configuration the application starts with.

#pragma once

#include <jsondiff/api.h>

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace jsondiff {

/// Classification of a diff node or an annotated line
enum class DiffType : std::uint8_t {
    Added,      ///< only on the right
    Removed,    ///< only on the left
    Modified,   ///< on both sides, different
    Unchanged   ///< on both sides, equal
};

/// "added", "removed", "modified" or "unchanged"
[[nodiscard]] JSONDIFF_API std::string_view diff_type_name(DiffType type) noexcept;

/// Engine policy
struct CompareOptions {
    /// Diff object members in sorted key order instead of left-document order
    bool ignore_key_order = true;
    /// Match array elements by identity/content instead of by position
    bool ignore_array_order = false;
    /// When false, primitives of different JSON types are equal if their
    /// string renderings match ("1" vs 1)
    bool strict_type = true;

    bool operator==(const CompareOptions&) const = default;
};

/// How diff items are mapped onto pretty-printed lines
enum class LineMatching : std::uint8_t {
    /// First unclaimed line containing the item's rendered primitive value.
    /// Container values are not matched.
    value_search,
    /// Exact per-line JSON path; containers mark their whole subtree.
    path_map
};

/// Layout policy for the side-by-side renderer
struct RenderOptions {
    /// Unchanged lines kept visible around each diff line
    std::size_t collapse_context = 3;
    /// Hard cap on paired display lines per side
    std::size_t max_display_lines = 10000;
    LineMatching line_matching = LineMatching::path_map;

    bool operator==(const RenderOptions&) const = default;
};

} // namespace jsondiff
