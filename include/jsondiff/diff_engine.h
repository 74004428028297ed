// diff_engine.h - Structural comparison of two Value trees

#pragma once

#include <jsondiff/api.h>
#include <jsondiff/compare_options.h>
#include <jsondiff/diff_result.h>
#include <jsondiff/value.h>

#include <optional>
#include <string>
#include <vector>

namespace jsondiff {

// ============================================================
// DiffEngine - recursive comparison under one CompareOptions
//
// Usage:
//   DiffEngine engine{CompareOptions{.ignore_array_order = true}};
//   DiffResult result = engine.compare(left, right);
//
// The engine holds only its options; compare() is const and may be
// called concurrently on different inputs.
// ============================================================

class JSONDIFF_API DiffEngine {
public:
    DiffEngine() = default;
    explicit DiffEngine(CompareOptions options) : options_(options) {}

    [[nodiscard]] const CompareOptions& options() const noexcept { return options_; }

    [[nodiscard]] DiffResult compare(const Value& left, const Value& right) const;

    /// Field that identifies elements in both arrays: present in every
    /// element, primitive, and unique per array. Candidates are id, _id,
    /// uuid, key, name, then the other common keys alphabetically.
    [[nodiscard]] static std::optional<std::string> infer_matching_key(const ValueVector& left,
                                                                       const ValueVector& right);

    /// Equality of two values under strict_type
    [[nodiscard]] bool values_equal(const Value& left, const Value& right) const;

private:
    DiffItem compare_values(const Value& left, const Value& right, const DiffPath& path,
                            const DiffPath& right_path, int depth) const;
    DiffItem compare_objects(const Value& left, const Value& right, const DiffPath& path,
                             const DiffPath& right_path, int depth) const;
    DiffItem compare_arrays(const Value& left, const Value& right, const DiffPath& path,
                            const DiffPath& right_path, int depth) const;

    std::vector<DiffItem> compare_arrays_ordered(const ValueVector& left, const ValueVector& right,
                                                 const DiffPath& path, const DiffPath& right_path,
                                                 int depth) const;
    std::vector<DiffItem> compare_arrays_unordered(const ValueVector& left, const ValueVector& right,
                                                   const DiffPath& path, const DiffPath& right_path,
                                                   int depth) const;
    std::vector<DiffItem> compare_primitive_arrays_unordered(const ValueVector& left, const ValueVector& right,
                                                             const DiffPath& path, const DiffPath& right_path,
                                                             int depth) const;
    std::vector<DiffItem> compare_object_arrays_by_key(const ValueVector& left, const ValueVector& right,
                                                       const std::string& matching_key,
                                                       const DiffPath& path, const DiffPath& right_path,
                                                       int depth) const;
    std::vector<DiffItem> compare_arrays_by_hash(const ValueVector& left, const ValueVector& right,
                                                 const DiffPath& path, const DiffPath& right_path,
                                                 int depth) const;

    CompareOptions options_;
};

/// Compare two documents: one root DiffItem at the empty path
[[nodiscard]] JSONDIFF_API DiffResult compare(const Value& left, const Value& right,
                                              const CompareOptions& options = {});

} // namespace jsondiff
