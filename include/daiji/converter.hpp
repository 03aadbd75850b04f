// include/daiji/converter.hpp - Public entry points for daiji conversion.

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <daiji/core/decomposition.hpp>
#include <daiji/core/options.hpp>
#include <daiji/io/format.hpp>

namespace daiji {

    using OverflowPolicy = core::OverflowPolicy;
    using ConverterOptions = core::RenderOptions;

    // Converts numerals such as "120.3045E4" or 123456789 into daiji strings
    // ("壱百弐拾万参千四拾五", "壱億弐千参百四拾五万六千七百八拾九").
    //
    // The fraction is truncated, never rounded. A negative result carries a
    // leading '-'. Configuration is expected to be set before the converter is
    // shared; the const conversion calls hold no per-call state, so concurrent
    // readers are safe while no setter runs.
    class Converter {
      public:
        Converter();
        explicit Converter(ConverterOptions options);

        template <io::Numeric T> std::string convert_number(T value) const {
            return convert_numeral_string(io::numeral_string(value));
        }

        std::string convert_numeral_string(std::string_view text) const;

        // First stage of conversion, exposed for callers that want the digits.
        core::NumeralDecomposition normalize(std::string_view text) const;

        const std::vector<std::string> &large_units() const noexcept {
            return options_.large_units;
        }
        const std::vector<std::string> &positional_units() const noexcept {
            return options_.positional_units;
        }
        const std::vector<std::string> &digit_glyphs() const noexcept {
            return options_.digit_glyphs;
        }
        bool append_one_before_small_units() const noexcept {
            return options_.append_one_before_small_units;
        }
        OverflowPolicy overflow_policy() const noexcept {
            return options_.overflow_policy;
        }
        const ConverterOptions &options() const noexcept {
            return options_;
        }

        void set_large_units(std::vector<std::string> units);
        void set_positional_units(std::vector<std::string> units);
        void set_digit_glyphs(std::vector<std::string> glyphs);
        void set_append_one_before_small_units(bool enabled) noexcept {
            options_.append_one_before_small_units = enabled;
        }
        void set_overflow_policy(OverflowPolicy policy) noexcept {
            options_.overflow_policy = policy;
        }

      private:
        ConverterOptions options_;
    };

} // namespace daiji
