#ifndef INPAINT_TERMINAL_HPP
#define INPAINT_TERMINAL_HPP

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace Inpaint::Utils::Terminal {
    // ---------- Colors ----------
    namespace Colors {
        inline constexpr std::string_view kReset = "\033[0m";

        inline constexpr std::string_view kBrightBlack   = "\033[90m";
        inline constexpr std::string_view kBrightRed     = "\033[91m";
        inline constexpr std::string_view kBrightGreen   = "\033[92m";
        inline constexpr std::string_view kBrightYellow  = "\033[93m";
        inline constexpr std::string_view kBrightBlue    = "\033[94m";

        inline constexpr std::string_view kGoldenrod    = "\033[38;5;221m";
    }

    // ---------- Symbols ----------
    namespace Symbols {
        inline constexpr std::string_view kCheck     = "✔";
        inline constexpr std::string_view kCross     = "✘";
        inline constexpr std::string_view kInfo      = "ℹ";
        inline constexpr std::string_view kWarn      = "⚠";

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

    // ---------- Small helpers ----------
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
    // Left-aligned cell, truncated to width.
    inline std::string Cell(std::string_view text, std::size_t width) {
        std::string out{text.substr(0, width)};
        out.append(width - out.size(), ' ');
        return out;
    }

    // ---------- Table frames ----------
    // spacings = widths of each column between vertical junctions.
    enum class HSepKind { Top, Middle, Bottom };

    inline std::string HSeparator(const std::vector<std::size_t>& spacings,
                                  std::string_view color,
                                  HSepKind kind) {
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
        out.reserve(16 + spacings.size() * 8);
        out.append(left);
        for (std::size_t i = 0; i < spacings.size(); ++i) {
            out.append(Repeat(kBoxHorizontal, spacings[i]));
            if (i + 1 < spacings.size()) out.append(junction);
        }
        out.append(right);
        return ApplyColor(out, color);
    }

    inline std::string Row(const std::vector<std::string>& cells,
                           const std::vector<std::size_t>& spacings,
                           std::string_view color) {
        const auto bar = ApplyColor(Symbols::kBoxVertical, color);
        std::string out{bar};
        for (std::size_t i = 0; i < spacings.size(); ++i) {
            out.append(Cell(i < cells.size() ? cells[i] : std::string{}, spacings[i]));
            out.append(bar);
        }
        return out;
    }

    // ---------- Log lines ----------
    inline void Info(std::ostream& stream, std::string_view message) {
        stream << ApplyColor(Symbols::kInfo, Colors::kBrightBlue) << ' ' << message << '\n';
    }
    inline void Success(std::ostream& stream, std::string_view message) {
        stream << ApplyColor(Symbols::kCheck, Colors::kBrightGreen) << ' ' << message << '\n';
    }
    inline void Warning(std::ostream& stream, std::string_view message) {
        stream << ApplyColor(Symbols::kWarn, Colors::kBrightYellow) << ' ' << message << '\n';
    }
    inline void Failure(std::ostream& stream, std::string_view message) {
        stream << ApplyColor(Symbols::kCross, Colors::kBrightRed) << ' ' << message << '\n';
    }
}

#endif // INPAINT_TERMINAL_HPP
