// test_diff_renderer.cpp - Tests for the side-by-side layout pipeline

#include <catch2/catch_all.hpp>
#include <jsondiff/diff_engine.h>
#include <jsondiff/diff_renderer.h>
#include <jsondiff/serialization.h>

#include <string>
#include <vector>

using namespace jsondiff;

namespace {

using Path = std::vector<std::string>;

constexpr DiffType U = DiffType::Unchanged;
constexpr DiffType A = DiffType::Added;
constexpr DiffType R = DiffType::Removed;
constexpr DiffType M = DiffType::Modified;

/// Line annotations of both sides, computed from pretty-printed text
struct SideDiffs {
    std::vector<DiffType> left;
    std::vector<DiffType> right;
};

SideDiffs annotate(const std::string& left_json, const std::string& right_json,
                   LineMatching strategy = LineMatching::path_map, const CompareOptions& options = {})
{
    auto result = compare(from_json(left_json), from_json(right_json), options);
    auto flattened = result.flattened_diff_items();
    auto left_lines = split_lines(pretty_print(left_json, 4).text);
    auto right_lines = split_lines(pretty_print(right_json, 4).text);
    return SideDiffs{assign_line_diffs(left_lines, flattened, DiffSide::Left, strategy),
                     assign_line_diffs(right_lines, flattened, DiffSide::Right, strategy)};
}

RenderResult render_json(const std::string& left_json, const std::string& right_json,
                         const std::set<int>& expanded = {}, const RenderOptions& options = {})
{
    auto result = compare(from_json(left_json), from_json(right_json));
    return render(left_json, right_json, result, expanded, 4, options);
}

/// {"k00": 0, ..., "k19": 19} with k10 optionally changed
std::string numbered_object(bool change_middle)
{
    Value obj{ValueObject{}};
    for (int i = 0; i < 20; ++i) {
        std::string key = (i < 10 ? "k0" : "k") + std::to_string(i);
        obj = obj.set(key, (change_middle && i == 10) ? 100 : i);
    }
    return to_json(obj, true);
}

} // namespace

// ============================================================
// split_lines / build_line_path_map
// ============================================================

TEST_CASE("split_lines", "[renderer][lines]") {
    REQUIRE(split_lines("") == std::vector<std::string>{""});
    REQUIRE(split_lines("a\nb") == std::vector<std::string>{"a", "b"});
    REQUIRE(split_lines("a\n") == std::vector<std::string>{"a", ""});
}

TEST_CASE("build_line_path_map", "[renderer][path_map]") {
    SECTION("flat object") {
        auto paths = build_line_path_map({"{", R"(    "a": 1,)", R"(    "b": 2)", "}"});
        REQUIRE(paths == LinePathMap{{}, {"a"}, {"b"}, {}});
    }

    SECTION("nested object") {
        auto paths = build_line_path_map({"{", R"(  "o": {)", R"(    "x": 1)", "  }", "}"});
        REQUIRE(paths == LinePathMap{{}, {"o"}, {"o", "x"}, {"o"}, {}});
    }

    SECTION("primitive array at the root") {
        auto paths = build_line_path_map({"[", "  1,", "  2", "]"});
        REQUIRE(paths == LinePathMap{{}, {"0"}, {"1"}, {}});
    }

    SECTION("array of objects") {
        auto paths = build_line_path_map({
            "{",
            R"(  "items": [)",
            "    {",
            R"(      "id": 1)",
            "    },",
            "    {",
            R"(      "id": 2)",
            "    }",
            "  ]",
            "}",
        });
        REQUIRE(paths == LinePathMap{
            {},
            {"items"},
            {"items", "0"},
            {"items", "0", "id"},
            {"items", "0"},
            {"items", "1"},
            {"items", "1", "id"},
            {"items", "1"},
            {"items"},
            {},
        });
    }

    SECTION("deep nesting") {
        auto lines = split_lines(pretty_print(R"({"a": {"b": {"c": [true]}}})", 2).text);
        auto paths = build_line_path_map(lines);
        REQUIRE(paths.size() == 9);
        REQUIRE(paths[4] == Path{"a", "b", "c", "0"});
        REQUIRE(paths[5] == Path{"a", "b", "c"});
        REQUIRE(paths[8] == Path{});
    }

    SECTION("empty containers stay on their key") {
        auto paths = build_line_path_map({"{", R"(  "e": {},)", R"(  "f": [],)", R"(  "g": 1)", "}"});
        REQUIRE(paths == LinePathMap{{}, {"e"}, {"f"}, {"g"}, {}});
    }

    SECTION("empty root") {
        REQUIRE(build_line_path_map({"{}"}) == LinePathMap{{}});
    }

    SECTION("escaped keys are decoded") {
        auto paths = build_line_path_map({"{", R"(  "a\"b": 1,)", R"(  "c\\d": 2)", "}"});
        REQUIRE(paths[1] == Path{"a\"b"});
        REQUIRE(paths[2] == Path{"c\\d"});
    }
}

// ============================================================
// assign_line_diffs
// ============================================================

TEST_CASE("Line annotation by path", "[renderer][annotate]") {
    SECTION("modified on both sides") {
        auto d = annotate(R"({"a": 1, "b": 2})", R"({"a": 1, "b": 3})");
        REQUIRE(d.left == std::vector<DiffType>{U, U, M, U});
        REQUIRE(d.right == std::vector<DiffType>{U, U, M, U});
    }

    SECTION("equal numbers on other lines are not confused") {
        auto d = annotate(R"({"a": 1, "b": 2})", R"({"a": 1, "b": 1})");
        REQUIRE(d.right == std::vector<DiffType>{U, U, M, U});
    }

    SECTION("same value under different paths") {
        auto d = annotate(R"({"x": "v", "y": "v"})", R"({"x": "v", "y": "w"})");
        REQUIRE(d.left == std::vector<DiffType>{U, U, M, U});
    }

    SECTION("added object marks its whole subtree") {
        auto d = annotate(R"({"a": 1})", R"({"a": 1, "n": {"k": 1}})");
        REQUIRE(d.left == std::vector<DiffType>{U, U, U});
        REQUIRE(d.right == std::vector<DiffType>{U, U, A, A, A, U});
    }

    SECTION("removed object marks its whole subtree") {
        auto d = annotate(R"({"gone": {"k": [1]}, "z": 0})", R"({"z": 0})");
        REQUIRE(d.left == std::vector<DiffType>{U, R, R, R, R, R, U, U});
    }

    SECTION("array element added") {
        auto d = annotate("[1, 2]", "[1, 2, 3]");
        REQUIRE(d.left == std::vector<DiffType>{U, U, U, U});
        REQUIRE(d.right == std::vector<DiffType>{U, U, U, A, U});
    }

    SECTION("identical documents") {
        auto d = annotate(R"({"a": [1, {"b": null}]})", R"({"a": [1, {"b": null}]})");
        for (auto t : d.left) REQUIRE(t == U);
        for (auto t : d.right) REQUIRE(t == U);
    }
}

TEST_CASE("Line annotation of key renames", "[renderer][annotate][rename]") {
    SECTION("primitive value") {
        auto d = annotate(R"({"id": "abc", "version": 1})", R"({"name": "abc", "version": 1})");
        REQUIRE(d.left == std::vector<DiffType>{U, R, U, U});
        REQUIRE(d.right == std::vector<DiffType>{U, A, U, U});
    }

    SECTION("object value marks the key line only") {
        auto d = annotate(R"({"a": {"x": 1, "y": 2}})", R"({"b": {"x": 1, "y": 2}})");
        REQUIRE(d.left == std::vector<DiffType>{U, R, U, U, U, U});
        REQUIRE(d.right == std::vector<DiffType>{U, A, U, U, U, U});
    }

    SECTION("array value marks the key line only") {
        auto d = annotate(R"({"old": [1, 2]})", R"({"new": [1, 2]})");
        REQUIRE(d.left == std::vector<DiffType>{U, R, U, U, U, U});
        REQUIRE(d.right == std::vector<DiffType>{U, A, U, U, U, U});
    }

    SECTION("rename with a value change marks the subtree") {
        auto d = annotate(R"({"a": {"x": 1}})", R"({"b": {"x": 2}})");
        REQUIRE(d.left == std::vector<DiffType>{U, R, R, R, U});
        REQUIRE(d.right == std::vector<DiffType>{U, A, A, A, U});
    }

    SECTION("several renames pair up one to one") {
        auto d = annotate(R"({"a": {"v": 1}, "b": {"v": 2}, "keep": 0})",
                          R"({"c": {"v": 1}, "d": {"v": 2}, "keep": 0})");
        REQUIRE(d.left == std::vector<DiffType>{U, R, U, U, R, U, U, U, U});
        REQUIRE(d.right == std::vector<DiffType>{U, A, U, U, A, U, U, U, U});
    }
}

TEST_CASE("Line annotation of arrays matched without order", "[renderer][annotate][unordered]") {
    CompareOptions unordered;
    unordered.ignore_array_order = true;

    SECTION("field change in an element that moved") {
        auto d = annotate(R"([{"id": 1, "v": "a"}, {"id": 2, "v": "b"}])",
                          R"([{"id": 2, "v": "b"}, {"id": 1, "v": "X"}])",
                          LineMatching::path_map, unordered);
        REQUIRE(d.left == std::vector<DiffType>{U, U, U, M, U, U, U, U, U, U});
        REQUIRE(d.right == std::vector<DiffType>{U, U, U, U, U, U, U, M, U, U});
    }

    SECTION("added element marks its own rows") {
        auto d = annotate(R"([{"id": 1}])", R"([{"id": 2}, {"id": 1}])", LineMatching::path_map, unordered);
        REQUIRE(d.left == std::vector<DiffType>{U, U, U, U, U});
        REQUIRE(d.right == std::vector<DiffType>{U, A, A, A, U, U, U, U});
    }

    SECTION("nested array inside a moved element") {
        auto d = annotate(R"([{"id": 1, "tags": ["a"]}, {"id": 2, "tags": ["b"]}])",
                          R"([{"id": 2, "tags": ["b"]}, {"id": 1, "tags": ["a", "c"]}])",
                          LineMatching::path_map, unordered);
        std::vector<DiffType> expected(15, U);
        expected[11] = A;
        REQUIRE(d.right == expected);
        for (auto t : d.left) REQUIRE(t == U);
    }
}

TEST_CASE("Line annotation by value search", "[renderer][annotate]") {
    SECTION("first unmarked line containing the value") {
        auto d = annotate(R"({"a": 1, "b": 2})", R"({"a": 1, "b": 1})", LineMatching::value_search);
        // Approximation: "1" is found on the "a" line first
        REQUIRE(d.right == std::vector<DiffType>{U, M, U, U});
    }

    SECTION("strings are matched quoted") {
        auto d = annotate(R"({"name": "x", "v": "old"})", R"({"name": "x", "v": "new"})",
                          LineMatching::value_search);
        REQUIRE(d.left == std::vector<DiffType>{U, U, M, U});
        REQUIRE(d.right == std::vector<DiffType>{U, U, M, U});
    }

    SECTION("container values are not searched") {
        auto d = annotate(R"({"a": 1})", R"({"a": 1, "n": {"k": 1}})", LineMatching::value_search);
        REQUIRE(d.right == std::vector<DiffType>{U, U, U, U, U, U});
    }
}

// ============================================================
// pair_lines / apply_collapse
// ============================================================

TEST_CASE("Pairing pads the shorter side", "[renderer][pair]") {
    auto paired = pair_lines({"{", "}"}, {U, U}, {"{", "  x", "}"}, {U, A, U});
    REQUIRE(paired.left.size() == 3);
    REQUIRE(paired.right.size() == 3);
    REQUIRE(paired.left[1] == RenderLine::content(1, U, "}"));
    REQUIRE(paired.left[2].is_padding());
    REQUIRE(paired.left[2].line_index == -1);
    REQUIRE(paired.right[1] == RenderLine::content(1, A, "  x"));
    REQUIRE(paired.right[1].is_diff());
}

TEST_CASE("Collapsing unchanged runs", "[renderer][collapse]") {
    const auto left = numbered_object(false);
    const auto right = numbered_object(true);

    SECTION("context window around the change") {
        auto r = render_json(left, right);
        // 22 lines, change on line 11, three lines of context each way
        REQUIRE(r.collapse_sections.size() == 2);
        REQUIRE(r.collapse_sections[0] == CollapseSection{0, 0, 8, false});
        REQUIRE(r.collapse_sections[1] == CollapseSection{1, 15, 7, false});
        REQUIRE(r.total_lines == 9);
        REQUIRE(r.left_lines.size() == r.right_lines.size());
        REQUIRE(r.hidden_line_count() == 15);

        REQUIRE(r.left_lines[0].is_collapse());
        REQUIRE(r.left_lines[0].line_index == 0);
        REQUIRE(r.left_lines[0].section_index == 0);
        REQUIRE(r.left_lines[0].text == "··· 8 unchanged lines ···");
        REQUIRE(r.right_lines[0] == r.left_lines[0]);

        REQUIRE(r.left_lines[1].line_index == 8);
        REQUIRE(r.left_lines[4].diff == M);
        REQUIRE(r.right_lines[4].text == R"(    "k10": 100,)");
        REQUIRE(r.left_lines[8].is_collapse());
        REQUIRE(r.left_lines[8].line_index == 15);

        REQUIRE(r.diff_locations == std::vector<DiffLocation>{{4, M}});
    }

    SECTION("expanding one section") {
        auto r = render_json(left, right, {0});
        REQUIRE(r.total_lines == 16);
        REQUIRE(r.collapse_sections[0].expanded);
        REQUIRE_FALSE(r.collapse_sections[1].expanded);
        REQUIRE(r.hidden_line_count() == 7);
        REQUIRE(r.left_lines[0] == RenderLine::content(0, U, "{"));
        REQUIRE(r.diff_locations == std::vector<DiffLocation>{{11, M}});
    }

    SECTION("expanding everything restores the full document") {
        auto r = render_json(left, right, {0, 1});
        REQUIRE(r.total_lines == 22);
        REQUIRE(r.hidden_line_count() == 0);
        for (std::size_t i = 0; i < r.left_lines.size(); ++i) {
            REQUIRE(r.left_lines[i].line_index == static_cast<int>(i));
        }
    }

    SECTION("unknown section indices are ignored") {
        REQUIRE(render_json(left, right, {7}) == render_json(left, right));
    }

    SECTION("wider context") {
        RenderOptions options;
        options.collapse_context = 11;
        auto r = render_json(left, right, {}, options);
        REQUIRE(r.collapse_sections.empty());
        REQUIRE(r.total_lines == 22);
    }

    SECTION("identical documents collapse to one marker") {
        auto r = render_json(left, left);
        REQUIRE(r.total_lines == 1);
        REQUIRE(r.collapse_sections == std::vector<CollapseSection>{{0, 0, 22, false}});
        REQUIRE(r.diff_locations.empty());
    }

    SECTION("a short gap between changes is not collapsed") {
        auto r = render_json(R"({"a": 1, "b": 0, "c": 0, "d": 1})", R"({"a": 2, "b": 0, "c": 0, "d": 2})");
        REQUIRE(r.collapse_sections.empty());
        REQUIRE(r.diff_locations.size() == 2);
    }
}

// ============================================================
// render
// ============================================================

TEST_CASE("render", "[renderer]") {
    SECTION("uses the indent width") {
        auto result = compare(from_json(R"({"a": 1})"), from_json(R"({"a": 2})"));
        auto r = render(R"({"a": 1})", R"({"a": 2})", result, {}, 2);
        REQUIRE(r.left_lines[1].text == R"(  "a": 1)");
        REQUIRE(r.right_lines[1].text == R"(  "a": 2)");
    }

    SECTION("padding when the right side is longer") {
        auto r = render_json(R"({"a": 1})", R"({"a": 1, "b": 2})");
        REQUIRE(r.total_lines == 4);
        REQUIRE(r.left_lines[2].text == "}");
        REQUIRE(r.left_lines[3].is_padding());
        REQUIRE(r.right_lines[2].diff == A);
        REQUIRE(r.diff_locations == std::vector<DiffLocation>{{2, A}});
    }

    SECTION("navigation reaches right-only rows beside padding") {
        auto r = render_json("[1]", "[1, 2, 3]");
        REQUIRE(r.total_lines == 5);
        REQUIRE(r.left_lines[2].text == "]");
        REQUIRE(r.left_lines[3].is_padding());
        REQUIRE(r.left_lines[4].is_padding());
        REQUIRE(r.right_lines[2].diff == A);
        REQUIRE(r.right_lines[3].diff == A);
        REQUIRE(r.diff_locations == std::vector<DiffLocation>{{2, A}, {3, A}});
        REQUIRE(r.next_diff(2)->line == 3);
        REQUIRE(r.previous_diff(2)->line == 3);
    }

    SECTION("arrays matched without order mark the moved rows") {
        const std::string left = R"([{"id": 1, "v": "a"}, {"id": 2, "v": "b"}])";
        const std::string right = R"([{"id": 2, "v": "b"}, {"id": 1, "v": "X"}])";
        CompareOptions unordered;
        unordered.ignore_array_order = true;
        auto result = compare(from_json(left), from_json(right), unordered);
        auto r = render(left, right, result);

        REQUIRE(r.total_lines == 10);
        REQUIRE(r.left_lines[3].diff == M);
        REQUIRE(r.right_lines[3].diff == U);
        REQUIRE(r.right_lines[7].diff == M);
        REQUIRE(r.right_lines[7].text == R"(        "v": "X")");
        REQUIRE(r.diff_locations == std::vector<DiffLocation>{{3, M}, {7, M}});
    }

    SECTION("navigation markers prefer the left side") {
        auto r = render_json(R"({"a": 1})", R"({"b": 2})");
        REQUIRE(r.diff_locations == std::vector<DiffLocation>{{1, R}});
    }

    SECTION("truncation keeps both sides paired") {
        RenderOptions options;
        options.collapse_context = 100;
        options.max_display_lines = 5;
        auto r = render_json(numbered_object(false), numbered_object(true), {}, options);
        REQUIRE(r.truncated);
        REQUIRE(r.total_lines == 5);
        REQUIRE(r.left_lines.size() == 5);
        REQUIRE(r.right_lines.size() == 5);
        REQUIRE(r.diff_locations.empty());
    }

    SECTION("invalid text is shown raw") {
        auto r = render("{bad\njson", "{}", DiffResult{});
        REQUIRE(r.collapse_sections.size() == 1);
        auto expanded = render("{bad\njson", "{}", DiffResult{}, {0});
        REQUIRE(expanded.left_lines[0].text == "{bad");
        REQUIRE(expanded.left_lines[1].text == "json");
        REQUIRE(expanded.right_lines[1].is_padding());
    }
}

TEST_CASE("Diff navigation wraps around", "[renderer][navigation]") {
    RenderResult r;
    REQUIRE_FALSE(r.next_diff().has_value());
    REQUIRE_FALSE(r.previous_diff(3).has_value());

    r.diff_locations = {{2, M}, {5, A}, {9, R}};

    REQUIRE(r.next_diff()->line == 2);
    REQUIRE(r.next_diff(2)->line == 5);
    REQUIRE(r.next_diff(6)->line == 9);
    REQUIRE(r.next_diff(9)->line == 2);

    REQUIRE(r.previous_diff()->line == 9);
    REQUIRE(r.previous_diff(5)->line == 2);
    REQUIRE(r.previous_diff(2)->line == 9);
    REQUIRE(r.previous_diff(100)->type == R);
}
