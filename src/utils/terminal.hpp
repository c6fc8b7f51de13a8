#ifndef LATTICE_UTILS_TERMINAL_HPP
#define LATTICE_UTILS_TERMINAL_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace Lattice::Utils::Terminal {
    namespace Colors {
        inline constexpr std::string_view kReset = "\033[0m";

        inline constexpr std::string_view kAzure     = "\033[38;5;33m";
        inline constexpr std::string_view kOrange    = "\033[38;5;208m";
        inline constexpr std::string_view kGoldenrod = "\033[38;5;221m";
    }

    namespace Symbols {
        inline constexpr std::string_view kInfo = "ℹ";
        inline constexpr std::string_view kWarn = "⚠";

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
    }

    inline std::string Repeat(std::string_view glyph, std::size_t count) {
        std::string s; s.reserve(glyph.size() * count);
        for (std::size_t i = 0; i < count; ++i) s.append(glyph);
        return s;
    }

    inline std::string ApplyColor(std::string_view s, std::string_view color) {
        std::string out; out.reserve(color.size() + s.size() + Colors::kReset.size());
        out.append(color).append(s).append(Colors::kReset);
        return out;
    }

    enum class HSepKind { Top, Middle, Bottom };

    // spacings = widths of each column between vertical junctions.
    inline std::string HSeparator(const std::vector<std::size_t>& spacings, std::string_view color, HSepKind kind) {
        using namespace Symbols;

        std::string_view left;
        std::string_view junction;
        std::string_view right;
        switch (kind) {
            case HSepKind::Top:
                left = kBoxTopLeft; junction = kBoxTopSeparator; right = kBoxTopRight;
                break;
            case HSepKind::Middle:
                left = kBoxMiddleLeft; junction = kBoxMiddleSeparator; right = kBoxMiddleRight;
                break;
            case HSepKind::Bottom:
                left = kBoxBottomLeft; junction = kBoxBottomSeparator; right = kBoxBottomRight;
                break;
        }

        std::string out;
        out.append(left);
        for (std::size_t i = 0; i < spacings.size(); ++i) {
            out.append(Repeat(kBoxHorizontal, spacings[i]));
            if (i + 1 < spacings.size()) out.append(junction);
        }
        out.append(right);
        return ApplyColor(out, color);
    }

    // Pads (or truncates) a cell to exactly `width` columns.
    inline std::string Cell(std::string_view text, std::size_t width) {
        std::string out(text.substr(0, width));
        out.append(width - out.size(), ' ');
        return out;
    }
}

#endif // LATTICE_UTILS_TERMINAL_HPP
