// compare_controller.cpp - compare_update reducer and CompareController

#include <jsondiff/compare_controller.h>
#include <jsondiff/diff_engine.h>
#include <jsondiff/serialization.h>

#include <lager/event_loop/manual.hpp>
#include <lager/store.hpp>

#include <algorithm>
#include <cctype>
#include <utility>
#include <vector>

namespace jsondiff {

bool CompareSide::blank() const
{
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

// ============================================================
// Reducer
// ============================================================

namespace {

CompareSide parse_side(std::string text)
{
    CompareSide side;
    side.text = std::move(text);
    if (!side.blank()) {
        side.value = try_parse_json(side.text, &side.error);
    }
    return side;
}

void recompute_render(CompareModel& model)
{
    if (!model.diff) {
        model.render.reset();
        return;
    }
    model.render = std::make_shared<const RenderResult>(render(model.left.text, model.right.text, *model.diff,
                                                               model.expanded_sections, model.indent_width,
                                                               model.render_options));
}

/// Inputs changed: forget expanded sections, compare and render again
void recompute_all(CompareModel& model)
{
    model.expanded_sections.clear();
    if (model.left.value && model.right.value) {
        model.diff = std::make_shared<const DiffResult>(compare(*model.left.value, *model.right.value, model.options));
    } else {
        model.diff.reset();
    }
    recompute_render(model);
    ++model.version;
}

} // anonymous namespace

CompareModel compare_update(CompareModel model, CompareAction action)
{
    return std::visit(
        [&](auto&& act) -> CompareModel {
            using T = std::decay_t<decltype(act)>;

            if constexpr (std::is_same_v<T, actions::SetLeftText>) {
                if (act.text == model.left.text) return model;
                model.left = parse_side(std::move(act.text));
                recompute_all(model);
            }

            else if constexpr (std::is_same_v<T, actions::SetRightText>) {
                if (act.text == model.right.text) return model;
                model.right = parse_side(std::move(act.text));
                recompute_all(model);
            }

            else if constexpr (std::is_same_v<T, actions::SetOptions>) {
                if (act.options == model.options) return model;
                model.options = act.options;
                recompute_all(model);
            }

            else if constexpr (std::is_same_v<T, actions::SetRenderOptions>) {
                if (act.options == model.render_options) return model;
                model.render_options = act.options;
                recompute_all(model);
            }

            else if constexpr (std::is_same_v<T, actions::SetIndentWidth>) {
                const int width = std::max(act.indent_width, 0);
                if (width == model.indent_width) return model;
                model.indent_width = width;
                recompute_all(model);
            }

            else if constexpr (std::is_same_v<T, actions::ToggleSection>) {
                if (!model.render) return model;
                if (!model.expanded_sections.erase(act.section_index)) {
                    model.expanded_sections.insert(act.section_index);
                }
                recompute_render(model);
                ++model.version;
            }

            else if constexpr (std::is_same_v<T, actions::ExpandAllSections>) {
                if (!model.render) return model;
                std::set<int> all;
                for (const auto& section : model.render->collapse_sections) {
                    all.insert(section.section_index);
                }
                if (all == model.expanded_sections) return model;
                model.expanded_sections = std::move(all);
                recompute_render(model);
                ++model.version;
            }

            else if constexpr (std::is_same_v<T, actions::CollapseAllSections>) {
                if (model.expanded_sections.empty()) return model;
                model.expanded_sections.clear();
                recompute_render(model);
                ++model.version;
            }

            else if constexpr (std::is_same_v<T, actions::SwapSides>) {
                std::swap(model.left, model.right);
                recompute_all(model);
            }

            else if constexpr (std::is_same_v<T, actions::Clear>) {
                model.left = CompareSide{};
                model.right = CompareSide{};
                recompute_all(model);
            }

            return model;
        },
        std::move(action));
}

// ============================================================
// CompareController Implementation
// ============================================================

namespace {

// Store type deduction helper
inline auto make_compare_store_impl(CompareModel initial)
{
    return lager::make_store<CompareAction>(std::move(initial), lager::with_manual_event_loop{},
                                            lager::with_reducer(compare_update));
}

using CompareStoreType = decltype(make_compare_store_impl(std::declval<CompareModel>()));

} // anonymous namespace

struct CompareController::Impl {
    CompareStoreType store = make_compare_store_impl(CompareModel{});
    std::vector<WatchCallback> watchers;

    void notify_watchers() {
        const auto& model = store.get();
        for (auto& watcher : watchers) {
            if (watcher) {
                watcher(model);
            }
        }
    }
};

CompareController::CompareController() : impl_(std::make_unique<Impl>()) {}
CompareController::~CompareController() = default;

void CompareController::dispatch(CompareAction action)
{
    const auto before = impl_->store.get().version;
    impl_->store.dispatch(std::move(action));
    if (impl_->store.get().version != before) {
        impl_->notify_watchers();
    }
}

const CompareModel& CompareController::get_model() const
{
    return impl_->store.get();
}

void CompareController::set_left_text(std::string text)
{
    dispatch(actions::SetLeftText{std::move(text)});
}

void CompareController::set_right_text(std::string text)
{
    dispatch(actions::SetRightText{std::move(text)});
}

void CompareController::set_options(CompareOptions options)
{
    dispatch(actions::SetOptions{options});
}

void CompareController::toggle_section(int section_index)
{
    dispatch(actions::ToggleSection{section_index});
}

void CompareController::swap_sides()
{
    dispatch(actions::SwapSides{});
}

void CompareController::clear()
{
    dispatch(actions::Clear{});
}

std::shared_ptr<const DiffResult> CompareController::diff_result() const
{
    return get_model().diff;
}

std::shared_ptr<const RenderResult> CompareController::render_result() const
{
    return get_model().render;
}

std::string CompareController::copy_diff_text(int indent_width) const
{
    const auto& diff = get_model().diff;
    return diff ? diff->serialize_diff_json(indent_width) : std::string{};
}

std::function<void()> CompareController::watch(WatchCallback callback)
{
    impl_->watchers.push_back(std::move(callback));
    size_t index = impl_->watchers.size() - 1;

    // Return unsubscribe function
    return [this, index]() {
        if (index < impl_->watchers.size()) {
            impl_->watchers[index] = nullptr;
        }
    };
}

} // namespace jsondiff
