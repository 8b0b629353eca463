#pragma once

#include "util/config_file/config_file.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace mender {

struct TermColor {
    enum class Kind : uint8_t {
        Color4bit = 0,
        Color24bit,
        DefaultColor,
        Ignore,
        Reset
    };

    Kind kind;

    uint8_t r;
    uint8_t g;
    uint8_t b;

    TermColor() {
        *this = TermColor::kDefault;
    }

    TermColor(Kind kind, uint8_t r, uint8_t g, uint8_t b)
        : kind(kind)
        , r(r)
        , g(g)
        , b(b) {}

    bool operator == (const TermColor& other) const {
        return other.kind == kind && other.r == r && other.g == g && other.b == b;
    }

    // Parse color from configuration value; palette name or hex string
    static std::optional<TermColor>
    from_value(Value value);

    // "green", "light_red", ...
    static std::optional<TermColor>
    from_name(const std::string& name);

    // #rgb, #rrggbb
    static std::optional<TermColor>
    from_hex(const std::string& value);

    static TermColor kNone;
    static TermColor kReset;
    static TermColor kDefault;

    // Colors (standard 4 bit palette)
    static TermColor kBlack;
    static TermColor kRed;
    static TermColor kGreen;
    static TermColor kYellow;
    static TermColor kBlue;
    static TermColor kMagenta;
    static TermColor kCyan;
    static TermColor kLightGray;
    static TermColor kDarkGray;
    static TermColor kLightRed;
    static TermColor kLightGreen;
    static TermColor kLightYellow;
    static TermColor kLightBlue;
    static TermColor kLightMagenta;
    static TermColor kLightCyan;
    static TermColor kWhite;
};

// Palette name of `color`, or "#rrggbb" for colors outside the palette.
// Inverse of TermColor::from_value.
std::string
color_name(const TermColor& color);

struct TermStyle {

    enum class Attribute : uint16_t {
        None = 0,
        Bold = 1 << 0,
    };

    TermColor fg;
    TermColor bg;
    Attribute attr;

    TermStyle()
    : TermStyle(TermColor::kNone, TermColor::kNone) {}

    explicit TermStyle(TermColor fg, TermColor bg, Attribute attr)
        : fg(fg)
        , bg(bg)
        , attr(attr) {}

    explicit TermStyle(TermColor fg, TermColor bg)
        : TermStyle(fg, bg, Attribute::None) {}

    // Convert style to ansi escape sequence
    std::string
    to_ansi() const;
};

// Wrap `text` in the escape codes of `style`, followed by a reset.
// Returns `text` untouched when `enabled` is false.
std::string
colorize(const TermStyle& style, const std::string& text, bool enabled);

}  // namespace mender
