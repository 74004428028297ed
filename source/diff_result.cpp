// diff_result.cpp - DiffItem / DiffResult summaries and "copy diff" output

#include <jsondiff/diff_result.h>
#include <jsondiff/serialization.h>

#include <algorithm>

namespace jsondiff {

std::string_view diff_type_name(DiffType type) noexcept
{
    switch (type) {
        case DiffType::Added:     return "added";
        case DiffType::Removed:   return "removed";
        case DiffType::Modified:  return "modified";
        case DiffType::Unchanged: return "unchanged";
    }
    return "unchanged";
}

// ============================================================
// DiffItem
// ============================================================

bool DiffItem::has_diff() const
{
    return type != DiffType::Unchanged || has_differing_child();
}

bool DiffItem::has_differing_child() const
{
    return std::any_of(children.begin(), children.end(),
                       [](const DiffItem& child) { return child.has_diff(); });
}

bool DiffItem::operator==(const DiffItem& other) const
{
    return type == other.type && depth == other.depth && path == other.path &&
           right_path == other.right_path && key == other.key &&
           left_value == other.left_value && right_value == other.right_value &&
           children == other.children;
}

// ============================================================
// DiffResult
// ============================================================

namespace {

/// Appends the leaf-rule items of one subtree. A differing subtree always
/// contributes at least one item, so an empty contribution from the
/// children means the item itself is the leaf.
void flatten_item(const DiffItem& item, std::vector<DiffItem>& out)
{
    const std::size_t before = out.size();
    for (const auto& child : item.children) {
        flatten_item(child, out);
    }
    if (out.size() == before && item.type != DiffType::Unchanged) {
        out.push_back(item);
    }
}

bool count_item(const DiffItem& item, DiffCounts& counts)
{
    bool child_differs = false;
    for (const auto& child : item.children) {
        child_differs = count_item(child, counts) || child_differs;
    }
    if (child_differs) {
        return true;
    }
    switch (item.type) {
        case DiffType::Added:     ++counts.added; return true;
        case DiffType::Removed:   ++counts.removed; return true;
        case DiffType::Modified:  ++counts.modified; return true;
        case DiffType::Unchanged: return false;
    }
    return false;
}

} // anonymous namespace

DiffCounts DiffResult::counts() const
{
    DiffCounts result;
    for (const auto& item : items_) {
        count_item(item, result);
    }
    return result;
}

std::vector<DiffItem> DiffResult::flattened_diff_items() const
{
    std::vector<DiffItem> result;
    for (const auto& item : items_) {
        flatten_item(item, result);
    }
    return result;
}

std::vector<DiffRecord> DiffResult::serialize_diff() const
{
    std::vector<DiffRecord> records;
    for (const auto& item : flattened_diff_items()) {
        DiffRecord record;
        record.path = item.json_pointer();
        record.type = item.type;
        if (item.type == DiffType::Removed || item.type == DiffType::Modified) {
            record.left = item.left_value;
        }
        if (item.type == DiffType::Added || item.type == DiffType::Modified) {
            record.right = item.right_value;
        }
        records.push_back(std::move(record));
    }
    return records;
}

std::string DiffResult::serialize_diff_json(int indent_width) const
{
    return to_json(diff_records_to_value(serialize_diff()), false, indent_width);
}

void DiffResult::print_diffs(std::ostream& os) const
{
    const auto flattened = flattened_diff_items();
    if (flattened.empty()) {
        os << "  (no changes)\n";
        return;
    }
    for (const auto& d : flattened) {
        std::string type_str;
        switch (d.type) {
            case DiffType::Added:     type_str = "ADD   "; break;
            case DiffType::Removed:   type_str = "REMOVE"; break;
            case DiffType::Modified:  type_str = "CHANGE"; break;
            case DiffType::Unchanged: type_str = "SAME  "; break;
        }
        const std::string pointer = d.json_pointer();
        os << "  " << type_str << " " << (pointer.empty() ? "/" : pointer);
        if (d.type == DiffType::Modified) {
            os << ": " << value_to_string(d.get_left()) << " -> " << value_to_string(d.get_right());
        } else if (d.type == DiffType::Added) {
            os << ": " << value_to_string(d.get_right());
        } else if (d.type == DiffType::Removed) {
            os << ": " << value_to_string(d.get_left());
        }
        os << "\n";
    }
}

Value diff_records_to_value(const std::vector<DiffRecord>& records)
{
    auto array = ValueVector{}.transient();
    for (const auto& record : records) {
        auto entry = Value::object({
            {"path", record.path},
            {"type", std::string(diff_type_name(record.type))},
        });
        if (record.left) entry = entry.set("left", *record.left);
        if (record.right) entry = entry.set("right", *record.right);
        array.push_back(ValueBox{std::move(entry)});
    }
    return Value{array.persistent()};
}

} // namespace jsondiff
