#ifndef GRADUS_TERMINAL_HPP
#define GRADUS_TERMINAL_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace Gradus::Utils::Terminal {
    namespace Colors {
        inline constexpr std::string_view kReset = "\033[0m";

        inline constexpr std::string_view kRed          = "\033[31m";
        inline constexpr std::string_view kGreen        = "\033[32m";
        inline constexpr std::string_view kYellow       = "\033[33m";
        inline constexpr std::string_view kBlue         = "\033[34m";
        inline constexpr std::string_view kCyan         = "\033[36m";

        inline constexpr std::string_view kBrightBlack  = "\033[90m";
        inline constexpr std::string_view kBrightRed    = "\033[91m";
        inline constexpr std::string_view kBrightGreen  = "\033[92m";
        inline constexpr std::string_view kBrightYellow = "\033[93m";
        inline constexpr std::string_view kBrightBlue   = "\033[94m";
        inline constexpr std::string_view kBrightCyan   = "\033[96m";

        inline constexpr std::string_view kOrange       = "\033[38;5;208m";
        inline constexpr std::string_view kGoldenrod    = "\033[38;5;221m";
    }

    namespace Styles {
        inline constexpr std::string_view kBold      = "\033[1m";
        inline constexpr std::string_view kDim       = "\033[2m";
        inline constexpr std::string_view kItalic    = "\033[3m";
        inline constexpr std::string_view kUnderline = "\033[4m";
    }

    namespace Symbols {
        inline constexpr std::string_view kCheck = "✔";
        inline constexpr std::string_view kCross = "✘";
        inline constexpr std::string_view kDot   = "•";
        inline constexpr std::string_view kArrowLeft = "◀";
        inline constexpr std::string_view kNabla = "∇";

        inline constexpr std::string_view kFullBlock = "█";

        // Heavy box drawing
        inline constexpr std::string_view kBoxTopLeft         = "┏";
        inline constexpr std::string_view kBoxTopSeparator    = "┳";
        inline constexpr std::string_view kBoxTopRight        = "┓";
        inline constexpr std::string_view kBoxMiddleLeft      = "┣";
        inline constexpr std::string_view kBoxMiddleSeparator = "╋";
        inline constexpr std::string_view kBoxMiddleRight     = "┫";
        inline constexpr std::string_view kBoxBottomLeft      = "┗";
        inline constexpr std::string_view kBoxBottomSeparator = "┻";
        inline constexpr std::string_view kBoxBottomRight     = "┛";
        inline constexpr std::string_view kBoxHorizontal      = "━";
        inline constexpr std::string_view kBoxVertical        = "┃";

        inline constexpr std::string_view kRoundedTopLeft     = "╭";
        inline constexpr std::string_view kRoundedTopRight    = "╮";
        inline constexpr std::string_view kRoundedBottomLeft  = "╰";
        inline constexpr std::string_view kRoundedBottomRight = "╯";
    }

    // 256-colour greyscale ramp occupies indices 232..255.
    inline std::string Bg256(std::uint8_t idx) { return "\033[48;5;" + std::to_string(idx) + "m"; }
    inline std::string Fg256(std::uint8_t idx) { return "\033[38;5;" + std::to_string(idx) + "m"; }

    inline std::uint8_t GreyIndex(double intensity) {
        const double clamped = std::clamp(intensity, 0.0, 1.0);
        return static_cast<std::uint8_t>(232 + static_cast<int>(clamped * 23.0 + 0.5));
    }

    inline std::string Repeat(std::string_view glyph, std::size_t count) {
        std::string s; s.reserve(glyph.size() * count);
        for (std::size_t i = 0; i < count; ++i) s.append(glyph);
        return s;
    }

    inline std::string ApplyColor(std::string_view s, std::string_view color) {
        if (color.empty()) {
            return std::string(s);
        }
        std::string out; out.reserve(color.size() + s.size() + Colors::kReset.size());
        out.append(color).append(s).append(Colors::kReset);
        return out;
    }

    enum class FrameStyle { Rounded, Box };
    enum class HSepKind { Top, Middle, Bottom };

    // spacings = widths of each cell between vertical junctions.
    inline std::string HSeparator(const std::vector<std::size_t>& spacings,
                                  std::string_view color,
                                  FrameStyle style,
                                  HSepKind kind) {
        using namespace Symbols;

        std::string_view left;
        std::string_view junction;
        std::string_view right;
        switch (kind) {
            case HSepKind::Top:
                left = (style == FrameStyle::Rounded) ? kRoundedTopLeft : kBoxTopLeft;
                junction = kBoxTopSeparator;
                right = (style == FrameStyle::Rounded) ? kRoundedTopRight : kBoxTopRight;
                break;
            case HSepKind::Middle:
                left = kBoxMiddleLeft;
                junction = kBoxMiddleSeparator;
                right = kBoxMiddleRight;
                break;
            case HSepKind::Bottom:
                left = (style == FrameStyle::Rounded) ? kRoundedBottomLeft : kBoxBottomLeft;
                junction = kBoxBottomSeparator;
                right = (style == FrameStyle::Rounded) ? kRoundedBottomRight : kBoxBottomRight;
                break;
        }

        std::string out;
        out.reserve(16 + spacings.size() * 8);
        out.append(left);
        for (std::size_t i = 0; i < spacings.size(); ++i) {
            out.append(Repeat(kBoxHorizontal, spacings[i]));
            if (i + 1 < spacings.size()) out.append(junction);
        }
        out.append(right);
        return ApplyColor(out, color);
    }

    inline std::string HTop(const std::vector<std::size_t>& spacings, std::string_view color, FrameStyle style) {
        return HSeparator(spacings, color, style, HSepKind::Top);
    }
    inline std::string HMid(const std::vector<std::size_t>& spacings, std::string_view color) {
        return HSeparator(spacings, color, FrameStyle::Box, HSepKind::Middle);
    }
    inline std::string HBottom(const std::vector<std::size_t>& spacings, std::string_view color,
                               FrameStyle style = FrameStyle::Box) {
        return HSeparator(spacings, color, style, HSepKind::Bottom);
    }
}

/* Instance:
using namespace Gradus::Utils::Terminal;

std::vector<std::size_t> spans{6,4,8};
auto top = HTop(spans, Colors::kBrightGreen, FrameStyle::Box);   // ┏━━━━━━┳━━━━┳━━━━━━━━┓
auto mid = HMid(spans, Colors::kBrightGreen);                    // ┣━━━━━━╋━━━━╋━━━━━━━━┫
auto bot = HBottom(spans, Colors::kBrightGreen, FrameStyle::Box);// ┗━━━━━━┻━━━━┻━━━━━━━━┛
*/
#endif // GRADUS_TERMINAL_HPP
