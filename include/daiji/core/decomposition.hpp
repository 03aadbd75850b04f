// include/daiji/core/decomposition.hpp - Canonical sign/integer/fraction form of a numeral.

#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <daiji/core/detail/tables.hpp>
#include <daiji/errors.hpp>

namespace daiji::core {

    // Exponent-free decimal value held as two digit strings.
    // The integer digits never start with '0' and the fraction digits never end
    // with '0'; a zero value is never negative.
    class NumeralDecomposition {
      public:
        NumeralDecomposition() noexcept = default;

        NumeralDecomposition(bool negative, std::string_view integer_digits,
                             std::string_view fraction_digits) {
            if (!detail::all_decimal_digits(integer_digits)) {
                throw MalformedNumeralError("integer part contains a non-digit character");
            }
            if (!detail::all_decimal_digits(fraction_digits)) {
                throw MalformedNumeralError("fraction part contains a non-digit character");
            }
            integer_ = std::string(detail::trim_leading_zeros(integer_digits));
            fraction_ = std::string(detail::trim_trailing_zeros(fraction_digits));
            negative_ = negative;
            refresh_zero();
        }

        static NumeralDecomposition zero() noexcept {
            return {};
        }

        bool is_negative() const noexcept {
            return negative_;
        }
        bool is_zero() const noexcept {
            return zero_;
        }
        const std::string &integer_digits() const noexcept {
            return integer_;
        }
        const std::string &fraction_digits() const noexcept {
            return fraction_;
        }
        bool has_integer_part() const noexcept {
            return !integer_.empty();
        }
        bool has_fraction_part() const noexcept {
            return !fraction_.empty();
        }

        // Drops the fractional digits; the result may become zero.
        NumeralDecomposition without_fraction() const {
            NumeralDecomposition result = *this;
            result.fraction_.clear();
            result.refresh_zero();
            return result;
        }

        // Drops the integer digits; the result may become zero.
        NumeralDecomposition without_integer() const {
            NumeralDecomposition result = *this;
            result.integer_.clear();
            result.refresh_zero();
            return result;
        }

        friend bool operator==(const NumeralDecomposition &,
                               const NumeralDecomposition &) = default;

      private:
        void refresh_zero() noexcept {
            zero_ = integer_.empty() && fraction_.empty();
            if (zero_) {
                negative_ = false;
            }
        }

        bool negative_ = false;
        bool zero_ = true;
        std::string integer_;
        std::string fraction_;
    };

    inline NumeralDecomposition without_fraction(const NumeralDecomposition &value) {
        return value.without_fraction();
    }

    inline NumeralDecomposition without_integer(const NumeralDecomposition &value) {
        return value.without_integer();
    }

} // namespace daiji::core
