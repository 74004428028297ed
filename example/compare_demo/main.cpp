// main.cpp
// Compare Demo - side-by-side JSON diff in a terminal
//
// Usage:
//   compare_demo [options] <left.json> <right.json>
//
// Options:
//   --ignore-array-order   match array elements regardless of position
//   --keep-key-order       list object keys in document order
//   --loose-types          treat "1" and 1 as equal
//   --value-search         annotate lines by value search instead of paths
//   --expand-all           show unchanged runs instead of collapse markers
//   --no-color             plain text output
//   --copy                 print the diff records as JSON and exit
//
// Everything goes through CompareController, the same store a GUI would
// drive: text actions in, RenderResult out.

#include <jsondiff/compare_controller.h>
#include <jsondiff/styled_output.h>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace jsondiff;

namespace {

struct DemoArgs {
    std::string left_file;
    std::string right_file;
    CompareOptions options;
    RenderOptions render_options;
    bool expand_all = false;
    bool color = true;
    bool copy = false;
};

bool read_file(const std::string& path, std::string& out)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

bool parse_args(int argc, char** argv, DemoArgs& args)
{
    std::vector<std::string> files;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--ignore-array-order") {
            args.options.ignore_array_order = true;
        } else if (arg == "--keep-key-order") {
            args.options.ignore_key_order = false;
        } else if (arg == "--loose-types") {
            args.options.strict_type = false;
        } else if (arg == "--value-search") {
            args.render_options.line_matching = LineMatching::value_search;
        } else if (arg == "--expand-all") {
            args.expand_all = true;
        } else if (arg == "--no-color") {
            args.color = false;
        } else if (arg == "--copy") {
            args.copy = true;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        } else {
            files.push_back(arg);
        }
    }
    if (files.size() != 2) {
        return false;
    }
    args.left_file = files[0];
    args.right_file = files[1];
    return true;
}

// ============================================================
// ANSI output
// ============================================================

std::string ansi_color(const Rgba& c, bool background)
{
    return "\x1b[" + std::string(background ? "48" : "38") + ";2;" + std::to_string(c.r) + ";" +
           std::to_string(c.g) + ";" + std::to_string(c.b) + "m";
}

/// Terminal cells occupied by UTF-8 text (one per code point)
std::size_t display_width(const std::string& text)
{
    return static_cast<std::size_t>(
        std::count_if(text.begin(), text.end(), [](unsigned char c) { return (c & 0xC0) != 0x80; }));
}

std::string format_cell(const StyledLine& line, const GutterMark& mark, const Palette& palette,
                        std::size_t width, bool color)
{
    std::string out;

    if (color) {
        if (auto gutter = palette.gutter(mark)) out += ansi_color(*gutter, false);
        out += std::string(mark.glyph());
        out += "\x1b[0m";
    } else {
        out += std::string(mark.glyph());
    }

    std::size_t used = 0;
    for (const auto& span : line.spans) {
        if (color) {
            // Terminal backgrounds have no alpha: only tint changed lines
            if (auto bg = palette.background(span.background); bg && span.background != Background::Padding) {
                out += ansi_color(*bg, true);
            }
            out += ansi_color(palette.foreground(span.foreground), false);
        }
        out += span.text;
        used += display_width(span.text);
        if (color) out += "\x1b[0m";
    }

    if (used < width) out += std::string(width - used, ' ');
    return out;
}

void print_side_by_side(const RenderResult& render, bool color)
{
    const auto left = build_styled_lines(render.left_lines);
    const auto right = build_styled_lines(render.right_lines);
    const auto left_gutter = build_gutter(render.left_lines);
    const auto right_gutter = build_gutter(render.right_lines);

    std::size_t width = 0;
    for (const auto& line : left) width = std::max(width, display_width(line.text()));

    Palette palette;
    for (std::size_t i = 0; i < left.size(); ++i) {
        std::cout << format_cell(left[i], left_gutter[i], palette, width, color) << " | "
                  << format_cell(right[i], right_gutter[i], palette, 0, color) << "\n";
    }

    if (render.truncated) {
        std::cout << "(output truncated)\n";
    }
}

} // anonymous namespace

int main(int argc, char** argv)
{
    DemoArgs args;
    if (!parse_args(argc, argv, args)) {
        std::cerr << "Usage: compare_demo [--ignore-array-order] [--keep-key-order] [--loose-types]\n"
                  << "                    [--value-search] [--expand-all] [--no-color] [--copy]\n"
                  << "                    <left.json> <right.json>\n";
        return 2;
    }

    std::string left_text, right_text;
    if (!read_file(args.left_file, left_text)) {
        std::cerr << "Cannot read " << args.left_file << "\n";
        return 2;
    }
    if (!read_file(args.right_file, right_text)) {
        std::cerr << "Cannot read " << args.right_file << "\n";
        return 2;
    }

    CompareController session;
    session.set_options(args.options);
    session.dispatch(actions::SetRenderOptions{args.render_options});
    session.set_left_text(std::move(left_text));
    session.set_right_text(std::move(right_text));

    const auto& model = session.get_model();
    if (model.left.has_error()) {
        std::cerr << args.left_file << ": " << model.left.error << "\n";
    }
    if (model.right.has_error()) {
        std::cerr << args.right_file << ": " << model.right.error << "\n";
    }

    auto diff = session.diff_result();
    if (!diff) {
        return 2;
    }

    if (args.copy) {
        std::cout << session.copy_diff_text() << "\n";
        return diff->is_identical() ? 0 : 1;
    }

    if (args.expand_all) {
        session.dispatch(actions::ExpandAllSections{});
    }

    std::cout << "=== Differences ===\n";
    std::cout << "  added: " << diff->added_count() << ", removed: " << diff->removed_count()
              << ", modified: " << diff->modified_count() << "\n";
    diff->print_diffs();

    std::cout << "\n=== Side by side ===\n";
    print_side_by_side(*session.render_result(), args.color);

    return diff->is_identical() ? 0 : 1;
}
