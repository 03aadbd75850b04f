// include/daiji/core/detail/tables.hpp - Default daiji glyph and unit tables.

#pragma once

#include <array>
#include <cstddef>
#include <string_view>

namespace daiji::core::detail {

    inline constexpr std::size_t POSITIONAL_UNIT_COUNT = 4;
    inline constexpr std::size_t DIGIT_GLYPH_COUNT = 10;
    inline constexpr std::size_t GROUP_WIDTH = 4;

    // Index 0 is the ones group; each further entry scales by 10^4.
    inline constexpr std::array<std::string_view, 17> DEFAULT_LARGE_UNITS = {
        "",   "万", "億", "兆", "京", "垓",     "𥝱",     "穣",     "溝",
        "澗", "正", "載", "極", "恒河沙", "阿僧祇", "那由他", "不可思議"};

    // Thousand, hundred, ten, one's place within a group.
    inline constexpr std::array<std::string_view, POSITIONAL_UNIT_COUNT> DEFAULT_POSITIONAL_UNITS = {
        "千", "百", "拾", ""};

    inline constexpr std::array<std::string_view, DIGIT_GLYPH_COUNT> DEFAULT_DIGIT_GLYPHS = {
        "零", "壱", "弐", "参", "四", "五", "六", "七", "八", "九"};

    constexpr bool is_decimal_digit(char ch) noexcept {
        return ch >= '0' && ch <= '9';
    }

    constexpr bool all_decimal_digits(std::string_view text) noexcept {
        for (const char ch : text) {
            if (!is_decimal_digit(ch)) {
                return false;
            }
        }
        return true;
    }

    constexpr std::string_view trim_leading_zeros(std::string_view digits) noexcept {
        const auto first = digits.find_first_not_of('0');
        return first == std::string_view::npos ? std::string_view{} : digits.substr(first);
    }

    constexpr std::string_view trim_trailing_zeros(std::string_view digits) noexcept {
        const auto last = digits.find_last_not_of('0');
        return last == std::string_view::npos ? std::string_view{} : digits.substr(0, last + 1);
    }

} // namespace daiji::core::detail
