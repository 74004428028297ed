// diff_engine.cpp - DiffEngine implementation

#include <jsondiff/diff_engine.h>
#include <jsondiff/serialization.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace jsondiff {

namespace {

constexpr std::array<const char*, 5> kPreferredKeys = {"id", "_id", "uuid", "key", "name"};

DiffItem make_item(const DiffPath& path, const DiffPath& right_path, DiffType type,
                   std::optional<Value> left, std::optional<Value> right, int depth)
{
    DiffItem item;
    item.path = path;
    item.right_path = right_path;
    item.type = type;
    if (!path.empty()) item.key = path.back();
    item.left_value = std::move(left);
    item.right_value = std::move(right);
    item.depth = depth;
    return item;
}

DiffItem make_container_item(const DiffPath& path, const DiffPath& right_path, const Value& left,
                             const Value& right, std::vector<DiffItem> children, int depth)
{
    // Children built here are Modified iff they differ anywhere below
    const bool any_diff = std::any_of(children.begin(), children.end(),
                                      [](const DiffItem& c) { return c.type != DiffType::Unchanged; });
    DiffItem item = make_item(path, right_path, any_diff ? DiffType::Modified : DiffType::Unchanged,
                              left, right, depth);
    item.children = std::move(children);
    return item;
}

DiffPath child_path(const DiffPath& path, std::size_t index)
{
    return path.push_back(std::to_string(index));
}

bool same_type(const Value& left, const Value& right)
{
    return left.type() == right.type();
}

/// Different-type primitives that render to the same string ("1" vs 1)
bool primitive_equivalent(const Value& left, const Value& right)
{
    if (left.is_container() || right.is_container()) return false;
    return primitive_to_string(left) == primitive_to_string(right);
}

/// Keys present in every object of the array; nullopt if any element is not an object
std::optional<std::set<std::string>> common_object_keys(const ValueVector& arr)
{
    std::optional<std::set<std::string>> common;
    for (const auto& box : arr) {
        auto* obj = box->get_if<ValueObject>();
        if (!obj) return std::nullopt;

        std::set<std::string> keys(obj->order.begin(), obj->order.end());
        if (!common) {
            common = std::move(keys);
        } else {
            std::set<std::string> kept;
            std::set_intersection(common->begin(), common->end(), keys.begin(), keys.end(),
                                  std::inserter(kept, kept.begin()));
            common = std::move(kept);
        }
    }
    return common;
}

bool is_valid_matching_key(const std::string& key, const ValueVector& arr)
{
    std::unordered_set<std::string> seen;
    for (const auto& box : arr) {
        auto* obj = box->get_if<ValueObject>();
        if (!obj) return false;
        auto* value = obj->find(key);
        if (!value || value->is_container()) return false;
        if (!seen.insert(primitive_to_string(*value)).second) return false;
    }
    return true;
}

/// Stringified matching-key value of an object element
std::optional<std::string> key_string(const Value& element, const std::string& matching_key)
{
    if (auto* obj = element.get_if<ValueObject>()) {
        if (auto* value = obj->find(matching_key)) return primitive_to_string(*value);
    }
    return std::nullopt;
}

} // anonymous namespace

// ============================================================
// Entry points
// ============================================================

DiffResult DiffEngine::compare(const Value& left, const Value& right) const
{
    std::vector<DiffItem> items;
    items.push_back(compare_values(left, right, DiffPath{}, DiffPath{}, 0));
    return DiffResult{std::move(items)};
}

DiffResult compare(const Value& left, const Value& right, const CompareOptions& options)
{
    return DiffEngine{options}.compare(left, right);
}

bool DiffEngine::values_equal(const Value& left, const Value& right) const
{
    if (options_.strict_type) {
        return left == right;
    }
    return primitive_to_string(left) == primitive_to_string(right);
}

// ============================================================
// Recursive comparison
// ============================================================

DiffItem DiffEngine::compare_values(const Value& left, const Value& right, const DiffPath& path,
                                    const DiffPath& right_path, int depth) const
{
    if (!same_type(left, right)) [[unlikely]] {
        // Type mismatch is never decomposed further
        if (!options_.strict_type && primitive_equivalent(left, right)) {
            return make_item(path, right_path, DiffType::Unchanged, left, right, depth);
        }
        return make_item(path, right_path, DiffType::Modified, left, right, depth);
    }

    if (left.is_object()) {
        return compare_objects(left, right, path, right_path, depth);
    }
    if (left.is_array()) {
        return compare_arrays(left, right, path, right_path, depth);
    }

    const auto type = values_equal(left, right) ? DiffType::Unchanged : DiffType::Modified;
    return make_item(path, right_path, type, left, right, depth);
}

DiffItem DiffEngine::compare_objects(const Value& left, const Value& right, const DiffPath& path,
                                     const DiffPath& right_path, int depth) const
{
    const auto& left_obj = *left.get_if<ValueObject>();
    const auto& right_obj = *right.get_if<ValueObject>();

    // Common and removed keys in left order, then added keys in right order
    std::vector<std::string> ordered_keys(left_obj.order.begin(), left_obj.order.end());
    for (const auto& key : right_obj.order) {
        if (!left_obj.count(key)) ordered_keys.push_back(key);
    }
    if (options_.ignore_key_order) {
        std::sort(ordered_keys.begin(), ordered_keys.end());
    }

    std::vector<DiffItem> children;
    children.reserve(ordered_keys.size());

    for (const auto& key : ordered_keys) {
        auto key_path = path.push_back(key);
        auto right_key_path = right_path.push_back(key);
        const Value* l = left_obj.find(key);
        const Value* r = right_obj.find(key);

        if (l && r) {
            children.push_back(compare_values(*l, *r, key_path, right_key_path, depth + 1));
        } else if (l) {
            children.push_back(make_item(key_path, key_path, DiffType::Removed, *l, std::nullopt, depth + 1));
        } else {
            children.push_back(make_item(key_path, right_key_path, DiffType::Added, std::nullopt, *r, depth + 1));
        }
    }

    return make_container_item(path, right_path, left, right, std::move(children), depth);
}

DiffItem DiffEngine::compare_arrays(const Value& left, const Value& right, const DiffPath& path,
                                    const DiffPath& right_path, int depth) const
{
    const auto& left_arr = *left.get_if<ValueVector>();
    const auto& right_arr = *right.get_if<ValueVector>();

    auto children = options_.ignore_array_order
        ? compare_arrays_unordered(left_arr, right_arr, path, right_path, depth)
        : compare_arrays_ordered(left_arr, right_arr, path, right_path, depth);

    return make_container_item(path, right_path, left, right, std::move(children), depth);
}

// ============================================================
// Array strategies
// ============================================================

std::vector<DiffItem> DiffEngine::compare_arrays_ordered(const ValueVector& left, const ValueVector& right,
                                                         const DiffPath& path, const DiffPath& right_path,
                                                         int depth) const
{
    std::vector<DiffItem> children;
    const std::size_t max_count = std::max(left.size(), right.size());
    children.reserve(max_count);

    for (std::size_t i = 0; i < max_count; ++i) {
        auto index_path = child_path(path, i);
        auto right_index_path = child_path(right_path, i);

        if (i < left.size() && i < right.size()) {
            children.push_back(compare_values(*left[i], *right[i], index_path, right_index_path, depth + 1));
        } else if (i < left.size()) {
            children.push_back(make_item(index_path, index_path, DiffType::Removed, *left[i], std::nullopt, depth + 1));
        } else {
            children.push_back(make_item(index_path, right_index_path, DiffType::Added, std::nullopt, *right[i], depth + 1));
        }
    }

    return children;
}

std::vector<DiffItem> DiffEngine::compare_arrays_unordered(const ValueVector& left, const ValueVector& right,
                                                           const DiffPath& path, const DiffPath& right_path,
                                                           int depth) const
{
    auto all_of_both = [&](auto&& pred) {
        return std::all_of(left.begin(), left.end(), pred) && std::all_of(right.begin(), right.end(), pred);
    };

    // Vacuously true for two empty arrays
    if (all_of_both([](const ValueBox& v) { return !v->is_container(); })) {
        return compare_primitive_arrays_unordered(left, right, path, right_path, depth);
    }

    if (all_of_both([](const ValueBox& v) { return v->is_object(); })) {
        if (auto matching_key = infer_matching_key(left, right)) {
            return compare_object_arrays_by_key(left, right, *matching_key, path, right_path, depth);
        }
        return compare_arrays_by_hash(left, right, path, right_path, depth);
    }

    // Mixed content
    return compare_arrays_ordered(left, right, path, right_path, depth);
}

std::vector<DiffItem> DiffEngine::compare_primitive_arrays_unordered(const ValueVector& left,
                                                                     const ValueVector& right,
                                                                     const DiffPath& path, const DiffPath& right_path,
                                                                     int depth) const
{
    std::vector<DiffItem> children;
    std::vector<bool> matched(right.size(), false);

    for (std::size_t li = 0; li < left.size(); ++li) {
        const Value& lv = *left[li];
        auto index_path = child_path(path, li);

        // Greedy: first unmatched right element that is equal
        std::optional<std::size_t> match;
        for (std::size_t ri = 0; ri < right.size(); ++ri) {
            if (!matched[ri] && values_equal(lv, *right[ri])) {
                match = ri;
                break;
            }
        }

        if (match) {
            matched[*match] = true;
            children.push_back(make_item(index_path, child_path(right_path, *match), DiffType::Unchanged,
                                         lv, *right[*match], depth + 1));
        } else {
            children.push_back(make_item(index_path, index_path, DiffType::Removed, lv, std::nullopt, depth + 1));
        }
    }

    for (std::size_t ri = 0; ri < right.size(); ++ri) {
        if (!matched[ri]) {
            children.push_back(make_item(child_path(path, ri), child_path(right_path, ri), DiffType::Added,
                                         std::nullopt, *right[ri], depth + 1));
        }
    }

    return children;
}

std::optional<std::string> DiffEngine::infer_matching_key(const ValueVector& left, const ValueVector& right)
{
    if (left.empty() || right.empty()) return std::nullopt;

    auto left_keys = common_object_keys(left);
    auto right_keys = common_object_keys(right);
    if (!left_keys || !right_keys) return std::nullopt;

    std::vector<std::string> common;
    std::set_intersection(left_keys->begin(), left_keys->end(), right_keys->begin(), right_keys->end(),
                          std::back_inserter(common));

    // Preferred identifiers first, then the rest alphabetically (std::set order)
    std::vector<std::string> candidates;
    for (const char* preferred : kPreferredKeys) {
        if (std::binary_search(common.begin(), common.end(), std::string(preferred))) {
            candidates.emplace_back(preferred);
        }
    }
    for (const auto& key : common) {
        if (std::find(kPreferredKeys.begin(), kPreferredKeys.end(), key) == kPreferredKeys.end()) {
            candidates.push_back(key);
        }
    }

    for (const auto& candidate : candidates) {
        if (is_valid_matching_key(candidate, left) && is_valid_matching_key(candidate, right)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::vector<DiffItem> DiffEngine::compare_object_arrays_by_key(const ValueVector& left, const ValueVector& right,
                                                               const std::string& matching_key,
                                                               const DiffPath& path, const DiffPath& right_path,
                                                               int depth) const
{
    std::unordered_map<std::string, std::size_t> right_index;
    for (std::size_t i = 0; i < right.size(); ++i) {
        if (auto k = key_string(*right[i], matching_key)) {
            right_index[*k] = i;
        }
    }

    std::vector<DiffItem> children;
    std::unordered_set<std::string> consumed;

    for (std::size_t i = 0; i < left.size(); ++i) {
        auto k = key_string(*left[i], matching_key);
        if (!k) continue;

        auto index_path = child_path(path, i);
        auto found = right_index.find(*k);
        if (found != right_index.end()) {
            consumed.insert(*k);
            children.push_back(compare_values(*left[i], *right[found->second], index_path,
                                              child_path(right_path, found->second), depth + 1));
        } else {
            children.push_back(make_item(index_path, index_path, DiffType::Removed, *left[i], std::nullopt, depth + 1));
        }
    }

    for (std::size_t i = 0; i < right.size(); ++i) {
        auto k = key_string(*right[i], matching_key);
        if (k && !consumed.count(*k)) {
            children.push_back(make_item(child_path(path, i), child_path(right_path, i), DiffType::Added,
                                         std::nullopt, *right[i], depth + 1));
        }
    }

    return children;
}

std::vector<DiffItem> DiffEngine::compare_arrays_by_hash(const ValueVector& left, const ValueVector& right,
                                                         const DiffPath& path, const DiffPath& right_path,
                                                         int depth) const
{
    std::vector<std::string> right_hashes;
    right_hashes.reserve(right.size());
    for (const auto& box : right) {
        right_hashes.push_back(to_canonical_json(*box));
    }

    std::vector<bool> matched(right.size(), false);
    std::vector<DiffItem> children;

    for (std::size_t li = 0; li < left.size(); ++li) {
        const std::string left_hash = to_canonical_json(*left[li]);
        auto index_path = child_path(path, li);

        std::optional<std::size_t> match;
        for (std::size_t ri = 0; ri < right.size(); ++ri) {
            if (!matched[ri] && right_hashes[ri] == left_hash) {
                match = ri;
                break;
            }
        }

        if (match) {
            matched[*match] = true;
            children.push_back(compare_values(*left[li], *right[*match], index_path,
                                              child_path(right_path, *match), depth + 1));
        } else {
            children.push_back(make_item(index_path, index_path, DiffType::Removed, *left[li], std::nullopt, depth + 1));
        }
    }

    for (std::size_t ri = 0; ri < right.size(); ++ri) {
        if (!matched[ri]) {
            children.push_back(make_item(child_path(path, ri), child_path(right_path, ri), DiffType::Added,
                                         std::nullopt, *right[ri], depth + 1));
        }
    }

    return children;
}

} // namespace jsondiff
