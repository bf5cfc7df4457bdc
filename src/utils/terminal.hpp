#ifndef NABLA_TERMINAL_HPP
#define NABLA_TERMINAL_HPP

#include <cstddef>
#include <string>
#include <string_view>

namespace Nabla::Utils::Terminal {
    // ---------- Colors ----------
    namespace Colors {
        inline constexpr std::string_view kReset = "\033[0m";

        inline constexpr std::string_view kBrightBlack   = "\033[90m";
        inline constexpr std::string_view kBrightYellow  = "\033[93m";
        inline constexpr std::string_view kBrightBlue    = "\033[94m";
    }

    // ---------- Symbols ----------
    namespace Symbols {
        inline constexpr std::string_view kBoxHorizontal = "━";
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
}

#endif // NABLA_TERMINAL_HPP
