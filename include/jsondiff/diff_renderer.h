// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diff_renderer.h
/// @brief Side-by-side line layout of a DiffResult over pretty-printed text.
///
/// Pipeline (see render()):
///   1. pretty_print() both texts (raw text on parse failure)
///   2. annotate each line with a DiffType
///   3. pair lines index by index, padding the shorter side
///   4. collapse unchanged runs outside the context window
///   5. truncate both sides to RenderOptions::max_display_lines
///   6. collect navigation markers
///
/// Every step is a pure function and is exposed on its own so that a
/// collaborator can re-run a later step (e.g. toggling a collapse section)
/// without recomputing the earlier ones.

#pragma once

#include <jsondiff/api.h>
#include <jsondiff/compare_options.h>
#include <jsondiff/diff_result.h>

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace jsondiff {

enum class DiffSide : std::uint8_t { Left, Right };

enum class RenderLineKind : std::uint8_t {
    Content,    ///< a line of the pretty-printed document
    Padding,    ///< alignment filler on the shorter side
    Collapse    ///< marker standing in for a run of hidden lines
};

// ============================================================
// RenderLine
// ============================================================

struct RenderLine {
    /// Content: line number in the pretty-printed text.
    /// Collapse: first hidden paired position. Padding: -1.
    int line_index = -1;
    RenderLineKind kind = RenderLineKind::Padding;
    DiffType diff = DiffType::Unchanged;    // Content only
    int section_index = -1;                 // Collapse only
    std::string text;

    [[nodiscard]] static RenderLine content(int line_index, DiffType diff, std::string text) {
        return RenderLine{line_index, RenderLineKind::Content, diff, -1, std::move(text)};
    }
    [[nodiscard]] static RenderLine padding() { return RenderLine{}; }
    [[nodiscard]] static RenderLine collapse(int first_hidden, int section_index, std::size_t hidden_count);

    [[nodiscard]] bool is_content() const noexcept { return kind == RenderLineKind::Content; }
    [[nodiscard]] bool is_padding() const noexcept { return kind == RenderLineKind::Padding; }
    [[nodiscard]] bool is_collapse() const noexcept { return kind == RenderLineKind::Collapse; }

    /// Content line annotated as something other than Unchanged
    [[nodiscard]] bool is_diff() const noexcept { return is_content() && diff != DiffType::Unchanged; }

    bool operator==(const RenderLine&) const = default;
};

/// Navigation marker: a paired position holding a changed line
struct DiffLocation {
    std::size_t line = 0;
    DiffType type = DiffType::Modified;

    bool operator==(const DiffLocation&) const = default;
};

/// One run of hidden lines, in scan order
struct CollapseSection {
    int section_index = 0;
    std::size_t first_line = 0;     // Paired position of the first hidden line
    std::size_t hidden_count = 0;
    bool expanded = false;

    bool operator==(const CollapseSection&) const = default;
};

// ============================================================
// RenderResult
//
// left_lines.size() == right_lines.size() always.
// ============================================================

struct JSONDIFF_API RenderResult {
    std::vector<RenderLine> left_lines;
    std::vector<RenderLine> right_lines;
    std::vector<DiffLocation> diff_locations;
    std::vector<CollapseSection> collapse_sections;
    std::size_t total_lines = 0;
    bool truncated = false;

    [[nodiscard]] bool empty() const noexcept { return left_lines.empty(); }

    /// Lines currently hidden behind collapse markers
    [[nodiscard]] std::size_t hidden_line_count() const;

    /// First marker after `current` (the first marker when `current` is
    /// nullopt), wrapping around to the first. nullopt if there are none.
    [[nodiscard]] std::optional<DiffLocation> next_diff(std::optional<std::size_t> current = std::nullopt) const;

    /// Last marker before `current`, wrapping around to the last.
    [[nodiscard]] std::optional<DiffLocation> previous_diff(std::optional<std::size_t> current = std::nullopt) const;

    bool operator==(const RenderResult&) const = default;
};

/// Path of each line of a pretty-printed document. A container's opening
/// and closing lines both carry the container's path; the root is [].
using LinePathMap = std::vector<std::vector<std::string>>;

// ============================================================
// Pipeline steps
// ============================================================

/// Split text on '\n'. Empty text is one empty line.
[[nodiscard]] JSONDIFF_API std::vector<std::string> split_lines(const std::string& text);

[[nodiscard]] JSONDIFF_API LinePathMap build_line_path_map(const std::vector<std::string>& lines);

/// DiffType per line for one side.
///   Left:  Removed and Modified items, with their left values at path
///   Right: Added and Modified items, with their right values at right_path
[[nodiscard]] JSONDIFF_API std::vector<DiffType> assign_line_diffs(const std::vector<std::string>& lines,
                                                                   const std::vector<DiffItem>& flattened,
                                                                   DiffSide side,
                                                                   LineMatching strategy = LineMatching::path_map);

struct PairedLines {
    std::vector<RenderLine> left;
    std::vector<RenderLine> right;
};

[[nodiscard]] JSONDIFF_API PairedLines pair_lines(const std::vector<std::string>& left_lines,
                                                  const std::vector<DiffType>& left_diffs,
                                                  const std::vector<std::string>& right_lines,
                                                  const std::vector<DiffType>& right_diffs);

struct CollapsedLines {
    std::vector<RenderLine> left;
    std::vector<RenderLine> right;
    std::vector<CollapseSection> sections;
};

/// Replace each maximal run of lines farther than `context` from any
/// changed position with one Collapse marker, unless its section index
/// is in `expanded_sections`.
[[nodiscard]] JSONDIFF_API CollapsedLines apply_collapse(const PairedLines& paired,
                                                         const std::set<int>& expanded_sections,
                                                         std::size_t context);

[[nodiscard]] JSONDIFF_API std::vector<DiffLocation> build_diff_locations(const std::vector<RenderLine>& left_lines,
                                                                          const std::vector<RenderLine>& right_lines);

/// Run the whole pipeline
[[nodiscard]] JSONDIFF_API RenderResult render(const std::string& left_text,
                                               const std::string& right_text,
                                               const DiffResult& diff_result,
                                               const std::set<int>& expanded_sections = {},
                                               int indent_width = 4,
                                               const RenderOptions& options = {});

} // namespace jsondiff
