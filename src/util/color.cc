#include "color.hpp"

#include <fmt/format.h>

#include <array>
#include <cctype>
#include <cstdlib>
#include <tuple>
#include <unordered_map>
#include <vector>

using namespace mender;

// clang-format off
const std::array<std::tuple<const TermStyle::Attribute, int>, 1> kAttributes {{
    { TermStyle::Attribute::Bold, 1 },
}};

// Special colors for default colors and for resetting colors + attributes.
TermColor TermColor::kNone    = TermColor {TermColor::Kind::Ignore, 0, 0, 0};
TermColor TermColor::kReset   = TermColor {TermColor::Kind::Reset, 0, 0, 0};
TermColor TermColor::kDefault = TermColor {TermColor::Kind::DefaultColor, 39, 49, 0};

// Color identifiers for 4 bit terminals. r = foreground id, g = background id.
TermColor TermColor::kBlack        = TermColor { TermColor::Kind::Color4bit, 30,  40, 0 };
TermColor TermColor::kRed          = TermColor { TermColor::Kind::Color4bit, 31,  41, 0 };
TermColor TermColor::kGreen        = TermColor { TermColor::Kind::Color4bit, 32,  42, 0 };
TermColor TermColor::kYellow       = TermColor { TermColor::Kind::Color4bit, 33,  43, 0 };
TermColor TermColor::kBlue         = TermColor { TermColor::Kind::Color4bit, 34,  44, 0 };
TermColor TermColor::kMagenta      = TermColor { TermColor::Kind::Color4bit, 35,  45, 0 };
TermColor TermColor::kCyan         = TermColor { TermColor::Kind::Color4bit, 36,  46, 0 };
TermColor TermColor::kLightGray    = TermColor { TermColor::Kind::Color4bit, 37,  47, 0 };
TermColor TermColor::kDarkGray     = TermColor { TermColor::Kind::Color4bit, 90, 100, 0 };
TermColor TermColor::kLightRed     = TermColor { TermColor::Kind::Color4bit, 91, 101, 0 };
TermColor TermColor::kLightGreen   = TermColor { TermColor::Kind::Color4bit, 92, 102, 0 };
TermColor TermColor::kLightYellow  = TermColor { TermColor::Kind::Color4bit, 93, 103, 0 };
TermColor TermColor::kLightBlue    = TermColor { TermColor::Kind::Color4bit, 94, 104, 0 };
TermColor TermColor::kLightMagenta = TermColor { TermColor::Kind::Color4bit, 95, 105, 0 };
TermColor TermColor::kLightCyan    = TermColor { TermColor::Kind::Color4bit, 96, 106, 0 };
TermColor TermColor::kWhite        = TermColor { TermColor::Kind::Color4bit, 97, 107, 0 };

static const std::unordered_map<std::string, TermColor>&
palette() {
    static const std::unordered_map<std::string, TermColor> k16Colors = {
        { "none",          TermColor::kNone },
        { "default",       TermColor::kDefault },
        { "black",         TermColor::kBlack },
        { "red",           TermColor::kRed },
        { "green",         TermColor::kGreen },
        { "yellow",        TermColor::kYellow },
        { "blue",          TermColor::kBlue },
        { "magenta",       TermColor::kMagenta },
        { "cyan",          TermColor::kCyan },
        { "light_gray",    TermColor::kLightGray },
        { "dark_gray",     TermColor::kDarkGray },
        { "light_red",     TermColor::kLightRed },
        { "light_green",   TermColor::kLightGreen },
        { "light_yellow",  TermColor::kLightYellow },
        { "light_blue",    TermColor::kLightBlue },
        { "light_magenta", TermColor::kLightMagenta },
        { "light_cyan",    TermColor::kLightCyan },
        { "white",         TermColor::kWhite }
    };
    return k16Colors;
}
// clang-format on

std::optional<TermColor>
TermColor::from_hex(const std::string& s) {
    // Hex code parser that supports '#FFF' and '#FE83EE'
    if (!((s.size() == 4 || s.size() == 7) && s[0] == '#')) {
        return {};
    }

    for (std::size_t i = 1; i < s.size(); i++) {
        if (!std::isxdigit(static_cast<unsigned char>(s[i]))) {
            return {};
        }
    }

    long color24 = strtol(&s[1], nullptr, 16);
    if (s.size() == 4) {
        auto r = static_cast<uint8_t>(((color24 >> 8) & 0x0F) * 17);
        auto g = static_cast<uint8_t>(((color24 >> 4) & 0x0F) * 17);
        auto b = static_cast<uint8_t>(((color24 >> 0) & 0x0F) * 17);
        return TermColor(TermColor::Kind::Color24bit, r, g, b);
    }

    auto r = static_cast<uint8_t>((color24 >> 16) & 0xFF);
    auto g = static_cast<uint8_t>((color24 >> 8) & 0xFF);
    auto b = static_cast<uint8_t>((color24 >> 0) & 0xFF);
    return TermColor(TermColor::Kind::Color24bit, r, g, b);
}

std::optional<TermColor>
TermColor::from_name(const std::string& name) {
    const auto& colors = palette();
    if (auto it = colors.find(name); it != colors.end()) {
        return it->second;
    }
    return {};
}

std::optional<TermColor>
TermColor::from_value(Value value) {
    if (!value.is_string()) {
        return {};
    }

    auto s = value.as_string();
    if (s.empty()) {
        return {};
    }

    if (auto color = from_name(s); color) {
        return color;
    }

    return from_hex(s);
}

std::string
mender::color_name(const TermColor& color) {
    for (const auto& [name, palette_color] : palette()) {
        if (palette_color == color) {
            return name;
        }
    }
    return fmt::format("#{:02x}{:02x}{:02x}", color.r, color.g, color.b);
}

std::string
TermStyle::to_ansi() const {
    std::vector<int> escseq;

    auto apply_color = [&](const TermColor& color, bool is_fg) {
        switch (color.kind) {
            // ESC[38;2;{r};{g};{b}m	Set foreground color as RGB.
            // ESC[48;2;{r};{g};{b}m	Set background color as RGB.
            case TermColor::Kind::Color24bit: {
                escseq.insert(escseq.end(), {is_fg ? 38 : 48, 2});
                escseq.insert(escseq.end(), {color.r, color.g, color.b});
            } break;
            case TermColor::Kind::DefaultColor:
            case TermColor::Kind::Color4bit: {
                escseq.push_back(is_fg ? color.r : color.g);
            } break;
            case TermColor::Kind::Reset: {
                escseq.push_back(0);
            } break;
            case TermColor::Kind::Ignore: {
            } break;
        }
    };

    apply_color(fg, true);
    for (const auto& [attr_flag, attr_code] : kAttributes) {
        if ((uint16_t) attr & (uint16_t) attr_flag) {
            escseq.push_back(attr_code);
        }
    }
    apply_color(bg, false);

    std::string result;
    if (escseq.empty()) {
        return result;
    }

    result += "\033[";
    for (const int code : escseq) {
        result += fmt::format("{};", code);
    }
    result.back() = 'm';
    return result;
}

std::string
mender::colorize(const TermStyle& style, const std::string& text, bool enabled) {
    if (!enabled) {
        return text;
    }
    auto escape = style.to_ansi();
    if (escape.empty()) {
        return text;
    }
    return escape + text + "\033[0m";
}
