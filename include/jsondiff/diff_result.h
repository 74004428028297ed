// diff_result.h - Diff tree and its read-only summaries

#pragma once

#include <jsondiff/api.h>
#include <jsondiff/compare_options.h>
#include <jsondiff/json_pointer.h>
#include <jsondiff/value.h>

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace jsondiff {

// ============================================================
// DiffItem - one node of the comparison tree
//
// left_value is present unless type == Added; right_value is present
// unless type == Removed. A container node is Unchanged iff none of its
// descendants differ, and carries both full container values either way.
//
// path locates the item in the left document (for Added items, the left
// parent plus the right index). right_path locates it in the right
// document; the two differ below arrays matched without regard to order.
// For Removed items right_path equals path.
// ============================================================

struct JSONDIFF_API DiffItem {
    DiffPath path;                          // Segments from the root; indices as decimal text
    DiffPath right_path;
    DiffType type = DiffType::Unchanged;
    std::optional<std::string> key;         // Last path segment, absent at the root
    std::optional<Value> left_value;
    std::optional<Value> right_value;
    std::vector<DiffItem> children;
    int depth = 0;

    /// True when this item or any descendant differs
    [[nodiscard]] bool has_diff() const;

    /// True when at least one child has_diff()
    [[nodiscard]] bool has_differing_child() const;

    /// RFC 6901 pointer of path ("" for the root)
    [[nodiscard]] std::string json_pointer() const { return path_to_json_pointer(path); }

    [[nodiscard]] bool has_left() const noexcept { return left_value.has_value(); }
    [[nodiscard]] bool has_right() const noexcept { return right_value.has_value(); }

    /// Left value (throws if not available)
    [[nodiscard]] const Value& get_left() const {
        if (!left_value) throw std::runtime_error("DiffItem: left value not available at '" + json_pointer() + "'");
        return *left_value;
    }

    /// Right value (throws if not available)
    [[nodiscard]] const Value& get_right() const {
        if (!right_value) throw std::runtime_error("DiffItem: right value not available at '" + json_pointer() + "'");
        return *right_value;
    }

    bool operator==(const DiffItem& other) const;
    bool operator!=(const DiffItem& other) const { return !(*this == other); }
};

/// One entry of the "copy diff" output
struct DiffRecord {
    std::string path;                   // JSON Pointer
    DiffType type = DiffType::Modified;
    std::optional<Value> left;          // Removed and Modified only
    std::optional<Value> right;         // Added and Modified only

    bool operator==(const DiffRecord& other) const {
        return path == other.path && type == other.type && left == other.left && right == other.right;
    }
};

/// Leaf-rule totals per change type
struct DiffCounts {
    std::size_t added = 0;
    std::size_t removed = 0;
    std::size_t modified = 0;

    [[nodiscard]] std::size_t total() const noexcept { return added + removed + modified; }
};

// ============================================================
// DiffResult - wraps the root item(s) of one comparison
//
// Counts and the flattened list follow the same leaf rule: an item that
// differs is reported at its own level only if none of its children
// differ; otherwise its children are reported instead.
// ============================================================

class JSONDIFF_API DiffResult {
public:
    DiffResult() = default;
    explicit DiffResult(std::vector<DiffItem> items) : items_(std::move(items)) {}

    [[nodiscard]] const std::vector<DiffItem>& items() const noexcept { return items_; }

    /// All three counts in one walk of the tree
    [[nodiscard]] DiffCounts counts() const;

    [[nodiscard]] std::size_t added_count() const { return counts().added; }
    [[nodiscard]] std::size_t removed_count() const { return counts().removed; }
    [[nodiscard]] std::size_t modified_count() const { return counts().modified; }
    [[nodiscard]] std::size_t total_diff_count() const { return counts().total(); }
    [[nodiscard]] bool is_identical() const { return total_diff_count() == 0; }

    /// Leaf-level differing items, depth-first
    [[nodiscard]] std::vector<DiffItem> flattened_diff_items() const;

    /// Flattened items as {path, type, left?, right?} records
    [[nodiscard]] std::vector<DiffRecord> serialize_diff() const;

    /// serialize_diff() as pretty JSON text
    [[nodiscard]] std::string serialize_diff_json(int indent_width = 2) const;

    /// One line per flattened item: ADD / REMOVE / CHANGE, pointer, values
    void print_diffs(std::ostream& os = std::cout) const;

    bool operator==(const DiffResult& other) const { return items_ == other.items_; }
    bool operator!=(const DiffResult& other) const { return !(*this == other); }

private:
    std::vector<DiffItem> items_;
};

/// Convert records to a Value array of objects with keys
/// "path", "type", and "left" / "right" where present
[[nodiscard]] JSONDIFF_API Value diff_records_to_value(const std::vector<DiffRecord>& records);

} // namespace jsondiff
