// diff_renderer.cpp - side-by-side layout pipeline

#include <jsondiff/diff_renderer.h>
#include <jsondiff/line_tokenizer.h>
#include <jsondiff/serialization.h>

#include <algorithm>
#include <map>

namespace jsondiff {

// ============================================================
// RenderLine / RenderResult
// ============================================================

RenderLine RenderLine::collapse(int first_hidden, int section_index, std::size_t hidden_count)
{
    std::string text = "··· " + std::to_string(hidden_count) + " unchanged lines ···";
    return RenderLine{first_hidden, RenderLineKind::Collapse, DiffType::Unchanged, section_index, std::move(text)};
}

std::size_t RenderResult::hidden_line_count() const
{
    std::size_t total = 0;
    for (const auto& section : collapse_sections) {
        if (!section.expanded) total += section.hidden_count;
    }
    return total;
}

std::optional<DiffLocation> RenderResult::next_diff(std::optional<std::size_t> current) const
{
    if (diff_locations.empty()) return std::nullopt;
    if (current) {
        for (const auto& loc : diff_locations) {
            if (loc.line > *current) return loc;
        }
    }
    return diff_locations.front();
}

std::optional<DiffLocation> RenderResult::previous_diff(std::optional<std::size_t> current) const
{
    if (diff_locations.empty()) return std::nullopt;
    if (current) {
        for (auto it = diff_locations.rbegin(); it != diff_locations.rend(); ++it) {
            if (it->line < *current) return *it;
        }
    }
    return diff_locations.back();
}

// ============================================================
// Line path map
// ============================================================

namespace {

struct PathFrame {
    std::vector<std::string> path;
    bool is_array = false;
    std::size_t next_index = 0;
};

std::string_view strip_trailing_comma(std::string_view text)
{
    if (!text.empty() && text.back() == ',') text.remove_suffix(1);
    return trim_line(text);
}

/// Key text as it appears in a DiffPath (escape sequences decoded)
std::string decode_key(const std::string& raw)
{
    if (raw.find('\\') == std::string::npos) return raw;
    if (auto parsed = try_parse_json("\"" + raw + "\""); parsed && parsed->is_string()) {
        return parsed->as_string();
    }
    return raw;
}

bool path_equals(const std::vector<std::string>& line_path, const DiffPath& item_path)
{
    return line_path.size() == item_path.size() &&
           std::equal(line_path.begin(), line_path.end(), item_path.begin());
}

bool path_has_prefix(const std::vector<std::string>& line_path, const DiffPath& prefix)
{
    return line_path.size() >= prefix.size() &&
           std::equal(prefix.begin(), prefix.end(), line_path.begin());
}

} // anonymous namespace

std::vector<std::string> split_lines(const std::string& text)
{
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (true) {
        auto pos = text.find('\n', start);
        if (pos == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return lines;
}

LinePathMap build_line_path_map(const std::vector<std::string>& lines)
{
    LinePathMap paths;
    paths.reserve(lines.size());
    std::vector<PathFrame> stack;

    for (const auto& line : lines) {
        const auto text = strip_trailing_comma(trim_line(line));

        // Closing line of the innermost container
        if (!text.empty() && (text.front() == '}' || text.front() == ']') && !stack.empty()) {
            paths.push_back(stack.back().path);
            stack.pop_back();
            continue;
        }

        std::vector<std::string> path;
        if (!stack.empty()) {
            auto& top = stack.back();
            path = top.path;
            if (top.is_array) {
                path.push_back(std::to_string(top.next_index++));
            } else if (auto key = extract_key(text)) {
                path.push_back(decode_key(*key));
            }
        }

        if (!text.empty() && (text.back() == '{' || text.back() == '[')) {
            stack.push_back(PathFrame{path, text.back() == '[', 0});
        }
        paths.push_back(std::move(path));
    }

    return paths;
}

// ============================================================
// Line annotation
// ============================================================

namespace {

/// Text a value is searched for by LineMatching::value_search
std::optional<std::string> search_text(const Value& value)
{
    if (value.is_container()) return std::nullopt;
    if (auto* s = value.get_if<std::string>()) return "\"" + *s + "\"";
    return primitive_to_string(value);
}

void mark_by_value_search(const std::vector<std::string>& lines, std::vector<DiffType>& diffs,
                          const Value& value, DiffType type)
{
    auto needle = search_text(value);
    if (!needle) return;

    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (diffs[i] == DiffType::Unchanged && trim_line(lines[i]).find(*needle) != std::string_view::npos) {
            diffs[i] = type;
            return;
        }
    }
}

void mark_by_path(const LinePathMap& paths, std::vector<DiffType>& diffs,
                  const DiffPath& path, const Value& value, DiffType type, bool key_line_only)
{
    if (key_line_only || !value.is_container()) {
        for (std::size_t i = 0; i < paths.size(); ++i) {
            if (path_equals(paths[i], path)) {
                diffs[i] = type;
                return;
            }
        }
        return;
    }
    for (std::size_t i = 0; i < paths.size(); ++i) {
        if (path_has_prefix(paths[i], path)) {
            diffs[i] = type;
        }
    }
}

DiffPath parent_path(const DiffPath& path)
{
    return path.empty() ? path : path.take(path.size() - 1);
}

/// Indices of flattened items that are one half of a key rename: a
/// Removed and an Added sibling holding equal values
std::vector<bool> find_renames(const std::vector<DiffItem>& flattened)
{
    std::vector<bool> renamed(flattened.size(), false);
    for (std::size_t r = 0; r < flattened.size(); ++r) {
        const auto& removed = flattened[r];
        if (removed.type != DiffType::Removed || removed.path.empty()) continue;

        for (std::size_t a = 0; a < flattened.size(); ++a) {
            const auto& added = flattened[a];
            if (renamed[a] || added.type != DiffType::Added || added.path.empty()) continue;
            if (parent_path(added.path) == parent_path(removed.path) &&
                added.get_right() == removed.get_left()) {
                renamed[r] = true;
                renamed[a] = true;
                break;
            }
        }
    }
    return renamed;
}

} // anonymous namespace

std::vector<DiffType> assign_line_diffs(const std::vector<std::string>& lines,
                                        const std::vector<DiffItem>& flattened,
                                        DiffSide side,
                                        LineMatching strategy)
{
    std::vector<DiffType> diffs(lines.size(), DiffType::Unchanged);

    LinePathMap paths;
    std::vector<bool> renamed;
    if (strategy == LineMatching::path_map) {
        paths = build_line_path_map(lines);
        renamed = find_renames(flattened);
    }

    for (std::size_t i = 0; i < flattened.size(); ++i) {
        const auto& item = flattened[i];

        const Value* value = nullptr;
        if (side == DiffSide::Left && (item.type == DiffType::Removed || item.type == DiffType::Modified)) {
            value = item.left_value ? &*item.left_value : nullptr;
        } else if (side == DiffSide::Right && (item.type == DiffType::Added || item.type == DiffType::Modified)) {
            value = item.right_value ? &*item.right_value : nullptr;
        }
        if (!value) continue;

        if (strategy == LineMatching::value_search) {
            mark_by_value_search(lines, diffs, *value, item.type);
        } else {
            const auto& path = side == DiffSide::Left ? item.path : item.right_path;
            mark_by_path(paths, diffs, path, *value, item.type, renamed[i]);
        }
    }

    return diffs;
}

// ============================================================
// Pairing, collapsing, navigation
// ============================================================

PairedLines pair_lines(const std::vector<std::string>& left_lines,
                       const std::vector<DiffType>& left_diffs,
                       const std::vector<std::string>& right_lines,
                       const std::vector<DiffType>& right_diffs)
{
    auto diff_at = [](const std::vector<DiffType>& diffs, std::size_t i) {
        return i < diffs.size() ? diffs[i] : DiffType::Unchanged;
    };

    PairedLines paired;
    const std::size_t max_count = std::max(left_lines.size(), right_lines.size());
    paired.left.reserve(max_count);
    paired.right.reserve(max_count);

    for (std::size_t i = 0; i < max_count; ++i) {
        const int index = static_cast<int>(i);
        if (i < left_lines.size()) {
            paired.left.push_back(RenderLine::content(index, diff_at(left_diffs, i), left_lines[i]));
        } else {
            paired.left.push_back(RenderLine::padding());
        }
        if (i < right_lines.size()) {
            paired.right.push_back(RenderLine::content(index, diff_at(right_diffs, i), right_lines[i]));
        } else {
            paired.right.push_back(RenderLine::padding());
        }
    }

    return paired;
}

CollapsedLines apply_collapse(const PairedLines& paired,
                              const std::set<int>& expanded_sections,
                              std::size_t context)
{
    CollapsedLines result;
    const std::size_t count = paired.left.size();
    if (paired.right.size() != count) {
        result.left = paired.left;
        result.right = paired.right;
        return result;
    }

    std::vector<bool> visible(count, false);
    for (std::size_t i = 0; i < count; ++i) {
        if (paired.left[i].is_diff() || paired.right[i].is_diff()) {
            const std::size_t start = i > context ? i - context : 0;
            const std::size_t end = std::min(count - 1, i + context);
            std::fill(visible.begin() + start, visible.begin() + end + 1, true);
        }
    }

    int section_index = 0;
    std::size_t i = 0;
    while (i < count) {
        if (visible[i]) {
            result.left.push_back(paired.left[i]);
            result.right.push_back(paired.right[i]);
            ++i;
            continue;
        }

        const std::size_t section_start = i;
        while (i < count && !visible[i]) ++i;
        const std::size_t hidden = i - section_start;
        const bool expanded = expanded_sections.count(section_index) > 0;

        if (expanded) {
            result.left.insert(result.left.end(), paired.left.begin() + section_start, paired.left.begin() + i);
            result.right.insert(result.right.end(), paired.right.begin() + section_start, paired.right.begin() + i);
        } else {
            auto marker = RenderLine::collapse(static_cast<int>(section_start), section_index, hidden);
            result.left.push_back(marker);
            result.right.push_back(std::move(marker));
        }

        result.sections.push_back(CollapseSection{section_index, section_start, hidden, expanded});
        ++section_index;
    }

    return result;
}

std::vector<DiffLocation> build_diff_locations(const std::vector<RenderLine>& left_lines,
                                               const std::vector<RenderLine>& right_lines)
{
    std::vector<DiffLocation> locations;
    const std::size_t count = std::max(left_lines.size(), right_lines.size());
    for (std::size_t i = 0; i < count; ++i) {
        if (i < left_lines.size() && left_lines[i].is_diff()) {
            locations.push_back({i, left_lines[i].diff});
        } else if (i < right_lines.size() && right_lines[i].is_diff()) {
            locations.push_back({i, right_lines[i].diff});
        }
    }
    return locations;
}

// ============================================================
// render
// ============================================================

RenderResult render(const std::string& left_text,
                    const std::string& right_text,
                    const DiffResult& diff_result,
                    const std::set<int>& expanded_sections,
                    int indent_width,
                    const RenderOptions& options)
{
    const auto left_lines = split_lines(pretty_print(left_text, indent_width).text);
    const auto right_lines = split_lines(pretty_print(right_text, indent_width).text);

    const auto flattened = diff_result.flattened_diff_items();
    const auto left_diffs = assign_line_diffs(left_lines, flattened, DiffSide::Left, options.line_matching);
    const auto right_diffs = assign_line_diffs(right_lines, flattened, DiffSide::Right, options.line_matching);

    auto collapsed = apply_collapse(pair_lines(left_lines, left_diffs, right_lines, right_diffs),
                                    expanded_sections, options.collapse_context);

    RenderResult result;
    result.left_lines = std::move(collapsed.left);
    result.right_lines = std::move(collapsed.right);
    result.collapse_sections = std::move(collapsed.sections);

    if (result.left_lines.size() > options.max_display_lines) {
        result.left_lines.resize(options.max_display_lines);
        result.right_lines.resize(options.max_display_lines);
        result.truncated = true;
    }

    result.diff_locations = build_diff_locations(result.left_lines, result.right_lines);
    result.total_lines = result.left_lines.size();
    return result;
}

} // namespace jsondiff
