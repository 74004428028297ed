// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file compare_controller.h
/// @brief Compare session: two texts, options and view state in a lager store.
///
/// Every input change runs parse -> compare -> render inside the reducer,
/// so the model always holds results that match its inputs.
///
/// Usage:
/// @code
///   CompareController session;
///   auto unwatch = session.watch([](const CompareModel& m) { redraw(*m.render); });
///   session.set_left_text(R"({"a": 1})");
///   session.set_right_text(R"({"a": 2})");
///   session.dispatch(actions::ToggleSection{0});
///   unwatch();
/// @endcode
///
/// Not thread-safe: dispatch from one thread.

#pragma once

#include <jsondiff/api.h>
#include <jsondiff/compare_options.h>
#include <jsondiff/diff_renderer.h>
#include <jsondiff/diff_result.h>
#include <jsondiff/value.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <variant>

namespace jsondiff {

// ============================================================
// Actions
// ============================================================

namespace actions {

struct SetLeftText {
    std::string text;
};

struct SetRightText {
    std::string text;
};

struct SetOptions {
    CompareOptions options;
};

struct SetRenderOptions {
    RenderOptions options;
};

struct SetIndentWidth {
    int indent_width = 4;
};

struct ToggleSection {
    int section_index = 0;
};

struct ExpandAllSections {};
struct CollapseAllSections {};
struct SwapSides {};
struct Clear {};

} // namespace actions

using CompareAction = std::variant<actions::SetLeftText,
                                   actions::SetRightText,
                                   actions::SetOptions,
                                   actions::SetRenderOptions,
                                   actions::SetIndentWidth,
                                   actions::ToggleSection,
                                   actions::ExpandAllSections,
                                   actions::CollapseAllSections,
                                   actions::SwapSides,
                                   actions::Clear>;

// ============================================================
// Model
// ============================================================

/// One input pane: raw text and its parse outcome.
/// Blank text has neither a value nor an error.
struct CompareSide {
    std::string text;
    std::optional<Value> value;
    std::string error;

    [[nodiscard]] bool blank() const;
    [[nodiscard]] bool has_error() const noexcept { return !error.empty(); }
};

struct CompareModel {
    CompareSide left;
    CompareSide right;
    CompareOptions options;
    RenderOptions render_options;
    int indent_width = 4;
    std::set<int> expanded_sections;

    // Null until both sides parse
    std::shared_ptr<const DiffResult> diff;
    std::shared_ptr<const RenderResult> render;

    // Bumped by every action that changes the model
    std::uint64_t version = 0;

    bool operator==(const CompareModel& other) const { return version == other.version; }
    bool operator!=(const CompareModel& other) const { return !(*this == other); }
};

/// Reducer for the compare store
[[nodiscard]] JSONDIFF_API CompareModel compare_update(CompareModel model, CompareAction action);

// ============================================================
// CompareController
// ============================================================

class JSONDIFF_API CompareController {
public:
    CompareController();
    ~CompareController();

    CompareController(const CompareController&) = delete;
    CompareController& operator=(const CompareController&) = delete;

    void dispatch(CompareAction action);

    [[nodiscard]] const CompareModel& get_model() const;

    void set_left_text(std::string text);
    void set_right_text(std::string text);
    void set_options(CompareOptions options);
    void toggle_section(int section_index);
    void swap_sides();
    void clear();

    /// Latest results, null while either side is blank or invalid
    [[nodiscard]] std::shared_ptr<const DiffResult> diff_result() const;
    [[nodiscard]] std::shared_ptr<const RenderResult> render_result() const;

    /// serialize_diff_json() of the latest result, or "" without one
    [[nodiscard]] std::string copy_diff_text(int indent_width = 2) const;

    // Watch for changes (returns unsubscribe function)
    using WatchCallback = std::function<void(const CompareModel&)>;
    [[nodiscard]] std::function<void()> watch(WatchCallback callback);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace jsondiff
