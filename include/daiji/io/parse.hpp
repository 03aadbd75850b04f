// include/daiji/io/parse.hpp - Normalization of sign/mantissa/exponent numeral strings.

#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>

#include <daiji/core/decomposition.hpp>
#include <daiji/core/detail/tables.hpp>
#include <daiji/errors.hpp>

namespace daiji::io {

    namespace detail {

        inline std::string strip_separators(std::string_view text) {
            std::string result;
            result.reserve(text.size());
            for (const char ch : text) {
                if (ch == ',' || ch == ' ') {
                    continue;
                }
                result.push_back(ch);
            }
            return result;
        }

        inline std::string_view trim(std::string_view text) noexcept {
            const auto is_whitespace = [](char ch) {
                return std::isspace(static_cast<unsigned char>(ch)) != 0;
            };
            std::size_t start = 0;
            while (start < text.size() && is_whitespace(text[start])) {
                ++start;
            }
            std::size_t end = text.size();
            while (end > start && is_whitespace(text[end - 1])) {
                --end;
            }
            return text.substr(start, end - start);
        }

        inline int parse_exponent(std::string_view field) {
            std::size_t index = 0;
            if (!field.empty() && (field[0] == '+' || field[0] == '-')) {
                ++index;
            }
            const std::string_view digits = field.substr(index);
            if (digits.empty()) {
                throw MalformedNumeralError("numeral exponent missing digits");
            }
            if (!core::detail::all_decimal_digits(digits)) {
                throw MalformedNumeralError("invalid numeral exponent digit");
            }
            // from_chars takes '-' but not '+', so parse from the sign only when negative.
            const char *first = field[0] == '-' ? field.data() : digits.data();
            const char *last = field.data() + field.size();
            int value = 0;
            const auto [ptr, ec] = std::from_chars(first, last, value);
            if (ec == std::errc::result_out_of_range) {
                throw MalformedNumeralError("numeral exponent out of range");
            }
            if (ec != std::errc{} || ptr != last) {
                throw MalformedNumeralError("invalid numeral exponent");
            }
            return value;
        }

        // Moves the decimal point `exponent` places to the right (left when
        // negative), padding with '0' once either side runs out of digits.
        inline void shift_decimal_point(std::string &integer, std::string &fraction, int exponent) {
            if (exponent > 0) {
                const auto count = static_cast<std::size_t>(exponent);
                const std::size_t moved = std::min(count, fraction.size());
                integer.append(fraction, 0, moved);
                fraction.erase(0, moved);
                integer.append(count - moved, '0');
            } else if (exponent < 0) {
                const auto count = static_cast<std::size_t>(-static_cast<long long>(exponent));
                const std::size_t moved = std::min(count, integer.size());
                fraction.insert(0, integer, integer.size() - moved, moved);
                integer.erase(integer.size() - moved);
                fraction.insert(fraction.begin(), count - moved, '0');
            }
        }

    } // namespace detail

    // Accepts [+-]digits[.digits][(E|e)[+-]digits]; commas and spaces anywhere
    // are ignored. The exponent is applied lexically so its size is bounded
    // only by memory.
    inline core::NumeralDecomposition normalize(std::string_view text) {
        const std::string cleaned = detail::strip_separators(text);
        std::string_view body = detail::trim(cleaned);
        if (body.empty()) {
            throw MalformedNumeralError("numeral has no significant characters");
        }

        const bool negative = body.front() == '-';
        while (!body.empty() && (body.front() == '+' || body.front() == '-')) {
            body.remove_prefix(1);
        }

        std::string_view mantissa = body;
        int exponent = 0;
        const std::size_t marker = body.find_first_of("Ee");
        if (marker != std::string_view::npos) {
            mantissa = body.substr(0, marker);
            const std::string_view exponent_field = body.substr(marker + 1);
            if (exponent_field.find_first_of("Ee") != std::string_view::npos) {
                throw MalformedNumeralError("numeral has multiple exponent markers");
            }
            exponent = detail::parse_exponent(exponent_field);
        }

        const std::size_t point = mantissa.find('.');
        const std::string_view integer_field = mantissa.substr(0, point);
        const std::string_view fraction_field =
            point == std::string_view::npos ? std::string_view{} : mantissa.substr(point + 1);
        if (fraction_field.find('.') != std::string_view::npos) {
            throw MalformedNumeralError("numeral has multiple decimal points");
        }
        if (!core::detail::all_decimal_digits(integer_field) ||
            !core::detail::all_decimal_digits(fraction_field)) {
            throw MalformedNumeralError("invalid character in numeral");
        }
        if (integer_field.empty() && fraction_field.empty()) {
            throw MalformedNumeralError("numeral missing digits");
        }

        std::string integer(core::detail::trim_leading_zeros(integer_field));
        std::string fraction(core::detail::trim_trailing_zeros(fraction_field));
        if (integer.empty() && fraction.empty()) {
            return core::NumeralDecomposition::zero();
        }

        detail::shift_decimal_point(integer, fraction, exponent);
        return core::NumeralDecomposition(negative, integer, fraction);
    }

    inline bool is_numeral(std::string_view text) {
        try {
            static_cast<void>(normalize(text));
        } catch (const MalformedNumeralError &) {
            return false;
        }
        return true;
    }

} // namespace daiji::io
