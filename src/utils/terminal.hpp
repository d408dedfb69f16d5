#ifndef FATHOM_UTILS_TERMINAL_HPP
#define FATHOM_UTILS_TERMINAL_HPP

#include <string>
#include <string_view>

namespace Fathom::Utils::Terminal {
    namespace Colors {
        inline constexpr std::string_view kReset         = "\033[0m";
        inline constexpr std::string_view kRed           = "\033[31m";
        inline constexpr std::string_view kBrightBlack   = "\033[90m";
        inline constexpr std::string_view kBrightYellow  = "\033[93m";
        inline constexpr std::string_view kBrightBlue    = "\033[94m";
        inline constexpr std::string_view kBrightMagenta = "\033[95m";
    }

    [[nodiscard]] inline std::string ApplyColor(std::string_view text, std::string_view color)
    {
        std::string result;
        result.reserve(text.size() + color.size() + Colors::kReset.size());
        result.append(color);
        result.append(text);
        result.append(Colors::kReset);
        return result;
    }
}

#endif // FATHOM_UTILS_TERMINAL_HPP
