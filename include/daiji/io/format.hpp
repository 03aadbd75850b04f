// include/daiji/io/format.hpp - Decimal formatting for decompositions and built-in numbers.

#pragma once

#include <array>
#include <charconv>
#include <cmath>
#include <concepts>
#include <ostream>
#include <string>
#include <system_error>
#include <type_traits>

#include <daiji/core/decomposition.hpp>
#include <daiji/errors.hpp>

namespace daiji::io {

    // Enough significant digits to carry any built-in floating type without loss.
    inline constexpr int DEFAULT_SIGNIFICANT_DIGITS = 35;

    namespace detail {

        template <typename T> struct is_character : std::false_type {};
        template <> struct is_character<bool> : std::true_type {};
        template <> struct is_character<char> : std::true_type {};
        template <> struct is_character<wchar_t> : std::true_type {};
        template <> struct is_character<char8_t> : std::true_type {};
        template <> struct is_character<char16_t> : std::true_type {};
        template <> struct is_character<char32_t> : std::true_type {};

    } // namespace detail

    // Integer and floating-point types; bool and character types are not numbers.
    template <typename T>
    concept Numeric = std::floating_point<T> ||
                      (std::integral<T> && !detail::is_character<std::remove_cv_t<T>>::value);

    // Formats as [-]integer[.fraction]; an empty integer part prints as "0".
    inline std::string to_string(const core::NumeralDecomposition &value) {
        if (value.is_zero()) {
            return "0";
        }
        std::string result;
        result.reserve(value.integer_digits().size() + value.fraction_digits().size() + 3);
        if (value.is_negative()) {
            result.push_back('-');
        }
        if (value.has_integer_part()) {
            result += value.integer_digits();
        } else {
            result.push_back('0');
        }
        if (value.has_fraction_part()) {
            result.push_back('.');
            result += value.fraction_digits();
        }
        return result;
    }

    // Renders a built-in number as a numeral string accepted by normalize().
    template <Numeric T> std::string numeral_string(T value) {
        std::array<char, 128> buffer{};
        std::to_chars_result result{};
        if constexpr (std::is_floating_point_v<T>) {
            if (!std::isfinite(value)) {
                throw MalformedNumeralError("non-finite value has no numeral form");
            }
            result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value,
                                   std::chars_format::general, DEFAULT_SIGNIFICANT_DIGITS);
        } else {
            result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
        }
        if (result.ec != std::errc{}) {
            throw MalformedNumeralError("value could not be formatted as a numeral");
        }
        return std::string(buffer.data(), result.ptr);
    }

} // namespace daiji::io

namespace daiji::core {

    inline std::ostream &operator<<(std::ostream &os, const NumeralDecomposition &value) {
        return os << io::to_string(value);
    }

} // namespace daiji::core
