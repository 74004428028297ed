// test_compare_controller.cpp - Tests for the compare reducer and store wrapper

#include <catch2/catch_all.hpp>
#include <jsondiff/compare_controller.h>

#include <string>
#include <vector>

using namespace jsondiff;

// ============================================================
// Reducer
// ============================================================

TEST_CASE("compare_update runs the pipeline", "[controller][reducer]") {
    CompareModel model;

    SECTION("one side alone produces no results") {
        model = compare_update(model, actions::SetLeftText{R"({"a": 1})"});
        REQUIRE(model.left.value.has_value());
        REQUIRE_FALSE(model.diff);
        REQUIRE_FALSE(model.render);
        REQUIRE(model.version == 1);
    }

    SECTION("both sides produce a diff and a layout") {
        model = compare_update(model, actions::SetLeftText{R"({"a": 1})"});
        model = compare_update(model, actions::SetRightText{R"({"a": 2})"});
        REQUIRE(model.diff);
        REQUIRE(model.diff->modified_count() == 1);
        REQUIRE(model.render);
        REQUIRE(model.render->diff_locations.size() == 1);
        REQUIRE(model.version == 2);
    }

    SECTION("same text is a no-op") {
        model = compare_update(model, actions::SetLeftText{"[1]"});
        const auto version = model.version;
        model = compare_update(model, actions::SetLeftText{"[1]"});
        REQUIRE(model.version == version);
    }

    SECTION("invalid text keeps its error and clears results") {
        model = compare_update(model, actions::SetLeftText{"[1]"});
        model = compare_update(model, actions::SetRightText{"[1]"});
        REQUIRE(model.diff);

        model = compare_update(model, actions::SetRightText{"[1,"});
        REQUIRE(model.right.has_error());
        REQUIRE_FALSE(model.right.value.has_value());
        REQUIRE_FALSE(model.diff);
        REQUIRE_FALSE(model.render);
    }

    SECTION("blank text is neither valid nor an error") {
        model = compare_update(model, actions::SetLeftText{"   \n"});
        REQUIRE(model.left.blank());
        REQUIRE_FALSE(model.left.has_error());
        REQUIRE_FALSE(model.left.value.has_value());
    }
}

TEST_CASE("compare_update options", "[controller][reducer]") {
    CompareModel model;
    model = compare_update(model, actions::SetLeftText{"[1, 2, 3]"});
    model = compare_update(model, actions::SetRightText{"[3, 2, 1]"});
    REQUIRE(model.diff->modified_count() == 2);

    SECTION("ignore_array_order") {
        CompareOptions options;
        options.ignore_array_order = true;
        model = compare_update(model, actions::SetOptions{options});
        REQUIRE(model.diff->is_identical());
    }

    SECTION("equal options do not recompute") {
        const auto version = model.version;
        model = compare_update(model, actions::SetOptions{CompareOptions{}});
        REQUIRE(model.version == version);
    }

    SECTION("indent width re-renders") {
        model = compare_update(model, actions::SetIndentWidth{2});
        REQUIRE(model.indent_width == 2);
        REQUIRE(model.render->left_lines[1].text == "  1,");
    }

    SECTION("render options re-render") {
        RenderOptions options;
        options.max_display_lines = 2;
        model = compare_update(model, actions::SetRenderOptions{options});
        REQUIRE(model.render->truncated);
        REQUIRE(model.render->total_lines == 2);
    }
}

TEST_CASE("compare_update collapse sections", "[controller][reducer][collapse]") {
    // Change at the end of a long array: one hidden run at the top
    std::string left = "[";
    std::string right = "[";
    for (int i = 0; i < 20; ++i) {
        left += std::to_string(i) + ",";
        right += std::to_string(i) + ",";
    }
    left += "20]";
    right += "99]";

    CompareModel model;
    model = compare_update(model, actions::SetLeftText{left});
    model = compare_update(model, actions::SetRightText{right});
    REQUIRE(model.render->collapse_sections.size() == 1);
    REQUIRE(model.render->hidden_line_count() > 0);

    SECTION("toggle expands and collapses") {
        model = compare_update(model, actions::ToggleSection{0});
        REQUIRE(model.expanded_sections.count(0));
        REQUIRE(model.render->hidden_line_count() == 0);
        REQUIRE(model.render->collapse_sections[0].expanded);
        // Diff is shared, not recomputed
        const auto diff = model.diff;

        model = compare_update(model, actions::ToggleSection{0});
        REQUIRE(model.expanded_sections.empty());
        REQUIRE(model.render->hidden_line_count() > 0);
        REQUIRE(model.diff == diff);
    }

    SECTION("expand all and collapse all") {
        model = compare_update(model, actions::ExpandAllSections{});
        REQUIRE(model.render->hidden_line_count() == 0);

        const auto version = model.version;
        model = compare_update(model, actions::ExpandAllSections{});
        REQUIRE(model.version == version);

        model = compare_update(model, actions::CollapseAllSections{});
        REQUIRE(model.expanded_sections.empty());
        REQUIRE(model.render->hidden_line_count() > 0);
    }

    SECTION("new input forgets expanded sections") {
        model = compare_update(model, actions::ToggleSection{0});
        model = compare_update(model, actions::SetRightText{left});
        REQUIRE(model.expanded_sections.empty());
        REQUIRE(model.diff->is_identical());
    }
}

TEST_CASE("compare_update swap and clear", "[controller][reducer]") {
    CompareModel model;
    model = compare_update(model, actions::SetLeftText{R"({"a": 1})"});
    model = compare_update(model, actions::SetRightText{R"({"a": 1, "b": 2})"});
    REQUIRE(model.diff->added_count() == 1);

    SECTION("swap") {
        model = compare_update(model, actions::SwapSides{});
        REQUIRE(model.left.text == R"({"a": 1, "b": 2})");
        REQUIRE(model.diff->removed_count() == 1);
        REQUIRE(model.diff->added_count() == 0);
    }

    SECTION("clear") {
        model = compare_update(model, actions::Clear{});
        REQUIRE(model.left.text.empty());
        REQUIRE(model.right.text.empty());
        REQUIRE_FALSE(model.diff);
        REQUIRE_FALSE(model.render);
    }
}

// ============================================================
// CompareController
// ============================================================

TEST_CASE("CompareController", "[controller]") {
    CompareController session;
    REQUIRE_FALSE(session.diff_result());
    REQUIRE(session.copy_diff_text().empty());

    std::vector<std::uint64_t> seen;
    auto unwatch = session.watch([&](const CompareModel& m) { seen.push_back(m.version); });

    session.set_left_text(R"({"a": 1})");
    session.set_right_text(R"({"a": 2})");
    REQUIRE(seen == std::vector<std::uint64_t>{1, 2});

    SECTION("results") {
        REQUIRE(session.diff_result()->modified_count() == 1);
        REQUIRE(session.render_result()->total_lines == 3);
        REQUIRE(session.copy_diff_text() ==
                "[\n"
                "  {\n"
                "    \"left\": 1,\n"
                "    \"path\": \"/a\",\n"
                "    \"right\": 2,\n"
                "    \"type\": \"modified\"\n"
                "  }\n"
                "]");
    }

    SECTION("no-op dispatch does not notify") {
        session.set_right_text(R"({"a": 2})");
        REQUIRE(seen.size() == 2);
    }

    SECTION("unsubscribe") {
        unwatch();
        session.swap_sides();
        REQUIRE(seen.size() == 2);
        REQUIRE(session.get_model().left.text == R"({"a": 2})");
    }

    SECTION("options and clear") {
        CompareOptions options;
        options.strict_type = false;
        session.set_options(options);
        REQUIRE(session.get_model().options.strict_type == false);
        session.clear();
        REQUIRE_FALSE(session.render_result());
        REQUIRE(seen.size() == 4);
    }
}
