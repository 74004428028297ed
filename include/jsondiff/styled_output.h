// styled_output.h - Re-styling render lines for a text view
//
// Pure functions of already computed RenderLines: a theme change re-runs
// these without recomputing the diff or the layout.

#pragma once

#include <jsondiff/api.h>
#include <jsondiff/diff_renderer.h>
#include <jsondiff/line_tokenizer.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsondiff {

enum class Background : std::uint8_t {
    None,
    Added,
    Removed,
    Modified,
    Padding
};

/// Role of a span's foreground; token kinds plus the collapse marker text
enum class Foreground : std::uint8_t {
    Key,
    String,
    Number,
    Boolean,
    Null,
    Structure,
    Whitespace,
    Muted
};

struct StyledSpan {
    std::string text;
    Foreground foreground = Foreground::Structure;
    Background background = Background::None;

    bool operator==(const StyledSpan&) const = default;
};

struct StyledLine {
    std::vector<StyledSpan> spans;

    /// Concatenated span texts
    [[nodiscard]] std::string text() const;

    bool operator==(const StyledLine&) const = default;
};

struct GutterMark {
    bool bar = false;                       // Changed content line
    DiffType diff = DiffType::Unchanged;

    /// "▎" for a bar, " " otherwise
    [[nodiscard]] std::string_view glyph() const noexcept { return bar ? "▎" : " "; }

    bool operator==(const GutterMark&) const = default;
};

[[nodiscard]] JSONDIFF_API Background background_for(DiffType type) noexcept;
[[nodiscard]] JSONDIFF_API Foreground foreground_for(TokenKind kind) noexcept;

/// Content lines become token spans on the line's diff background;
/// padding lines become one blank span on the padding background;
/// collapse markers become one muted span.
[[nodiscard]] JSONDIFF_API std::vector<StyledLine> build_styled_lines(const std::vector<RenderLine>& lines);

/// One mark per line: a bar for changed content lines, blank otherwise
[[nodiscard]] JSONDIFF_API std::vector<GutterMark> build_gutter(const std::vector<RenderLine>& lines);

// ============================================================
// Palette - concrete colors for collaborators that want them
// ============================================================

struct Rgba {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;

    bool operator==(const Rgba&) const = default;
};

struct JSONDIFF_API Palette {
    Rgba key{0x9c, 0xdc, 0xfe};
    Rgba string{0xce, 0x91, 0x78};
    Rgba number{0xb5, 0xce, 0xa8};
    Rgba boolean{0x56, 0x9c, 0xd6};
    Rgba null{0x56, 0x9c, 0xd6};
    Rgba structure{0xd4, 0xd4, 0xd4};
    Rgba muted{0x80, 0x80, 0x80, 0x99};

    Rgba added_bg{0x2e, 0xa0, 0x43, 0x33};
    Rgba removed_bg{0xf8, 0x51, 0x49, 0x33};
    Rgba modified_bg{0xd2, 0x99, 0x22, 0x33};
    Rgba padding_bg{0x80, 0x80, 0x80, 0x14};

    Rgba added_gutter{0x2e, 0xa0, 0x43};
    Rgba removed_gutter{0xf8, 0x51, 0x49};
    Rgba modified_gutter{0xd2, 0x99, 0x22};

    /// Whitespace is fully transparent
    [[nodiscard]] Rgba foreground(Foreground role) const noexcept;

    /// nullopt for Background::None
    [[nodiscard]] std::optional<Rgba> background(Background role) const noexcept;

    /// nullopt for blank marks
    [[nodiscard]] std::optional<Rgba> gutter(const GutterMark& mark) const noexcept;
};

} // namespace jsondiff
