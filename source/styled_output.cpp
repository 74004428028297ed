// styled_output.cpp - build_styled_lines / build_gutter / Palette

#include <jsondiff/styled_output.h>

namespace jsondiff {

std::string StyledLine::text() const
{
    std::string result;
    for (const auto& span : spans) {
        result += span.text;
    }
    return result;
}

Background background_for(DiffType type) noexcept
{
    switch (type) {
        case DiffType::Added:     return Background::Added;
        case DiffType::Removed:   return Background::Removed;
        case DiffType::Modified:  return Background::Modified;
        case DiffType::Unchanged: return Background::None;
    }
    return Background::None;
}

Foreground foreground_for(TokenKind kind) noexcept
{
    switch (kind) {
        case TokenKind::Key:        return Foreground::Key;
        case TokenKind::String:     return Foreground::String;
        case TokenKind::Number:     return Foreground::Number;
        case TokenKind::Boolean:    return Foreground::Boolean;
        case TokenKind::Null:       return Foreground::Null;
        case TokenKind::Structure:  return Foreground::Structure;
        case TokenKind::Whitespace: return Foreground::Whitespace;
    }
    return Foreground::Structure;
}

std::vector<StyledLine> build_styled_lines(const std::vector<RenderLine>& lines)
{
    std::vector<StyledLine> styled;
    styled.reserve(lines.size());

    for (const auto& line : lines) {
        StyledLine out;
        switch (line.kind) {
            case RenderLineKind::Content: {
                const auto background = background_for(line.diff);
                for (auto& token : tokenize_line(line.text)) {
                    out.spans.push_back({std::move(token.text), foreground_for(token.kind), background});
                }
                break;
            }
            case RenderLineKind::Padding:
                out.spans.push_back({" ", Foreground::Whitespace, Background::Padding});
                break;
            case RenderLineKind::Collapse:
                out.spans.push_back({line.text, Foreground::Muted, Background::None});
                break;
        }
        styled.push_back(std::move(out));
    }

    return styled;
}

std::vector<GutterMark> build_gutter(const std::vector<RenderLine>& lines)
{
    std::vector<GutterMark> gutter;
    gutter.reserve(lines.size());
    for (const auto& line : lines) {
        if (line.is_diff()) {
            gutter.push_back({true, line.diff});
        } else {
            gutter.push_back({});
        }
    }
    return gutter;
}

// ============================================================
// Palette
// ============================================================

Rgba Palette::foreground(Foreground role) const noexcept
{
    switch (role) {
        case Foreground::Key:        return key;
        case Foreground::String:     return string;
        case Foreground::Number:     return number;
        case Foreground::Boolean:    return boolean;
        case Foreground::Null:       return null;
        case Foreground::Structure:  return structure;
        case Foreground::Whitespace: return Rgba{0, 0, 0, 0};
        case Foreground::Muted:      return muted;
    }
    return structure;
}

std::optional<Rgba> Palette::background(Background role) const noexcept
{
    switch (role) {
        case Background::None:     return std::nullopt;
        case Background::Added:    return added_bg;
        case Background::Removed:  return removed_bg;
        case Background::Modified: return modified_bg;
        case Background::Padding:  return padding_bg;
    }
    return std::nullopt;
}

std::optional<Rgba> Palette::gutter(const GutterMark& mark) const noexcept
{
    if (!mark.bar) return std::nullopt;
    switch (mark.diff) {
        case DiffType::Added:    return added_gutter;
        case DiffType::Removed:  return removed_gutter;
        case DiffType::Modified: return modified_gutter;
        default:                 return std::nullopt;
    }
}

} // namespace jsondiff
