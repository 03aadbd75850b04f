// include/daiji/core/options.hpp - Glyph tables and flags that drive daiji rendering.

#pragma once

#include <string>
#include <vector>

#include <daiji/core/detail/tables.hpp>
#include <daiji/errors.hpp>

namespace daiji::core {

    // What to do when a 4-digit group has no large unit name.
    enum class OverflowPolicy { Fail, OmitUnit };

    struct RenderOptions {
        // Indexed by 4-digit group; entry 0 is the ones group.
        std::vector<std::string> large_units;
        // Thousand, hundred, ten, one's place.
        std::vector<std::string> positional_units;
        // Indexed by digit value; entry 0 is only used for a zero result.
        std::vector<std::string> digit_glyphs;
        // Emit the digit-1 glyph before thousand/hundred/ten names.
        bool append_one_before_small_units = true;
        OverflowPolicy overflow_policy = OverflowPolicy::OmitUnit;

        static RenderOptions defaults() {
            RenderOptions options;
            options.large_units.assign(detail::DEFAULT_LARGE_UNITS.begin(),
                                       detail::DEFAULT_LARGE_UNITS.end());
            options.positional_units.assign(detail::DEFAULT_POSITIONAL_UNITS.begin(),
                                            detail::DEFAULT_POSITIONAL_UNITS.end());
            options.digit_glyphs.assign(detail::DEFAULT_DIGIT_GLYPHS.begin(),
                                        detail::DEFAULT_DIGIT_GLYPHS.end());
            return options;
        }
    };

    inline void validate_large_units(const std::vector<std::string> &units) {
        if (units.empty()) {
            throw ConfigurationError("large unit table must not be empty");
        }
    }

    inline void validate_positional_units(const std::vector<std::string> &units) {
        if (units.size() < detail::POSITIONAL_UNIT_COUNT) {
            throw ConfigurationError("positional unit table needs at least 4 entries");
        }
    }

    inline void validate_digit_glyphs(const std::vector<std::string> &glyphs) {
        if (glyphs.size() < detail::DIGIT_GLYPH_COUNT) {
            throw ConfigurationError("digit glyph table needs at least 10 entries");
        }
    }

    inline void validate(const RenderOptions &options) {
        validate_large_units(options.large_units);
        validate_positional_units(options.positional_units);
        validate_digit_glyphs(options.digit_glyphs);
    }

} // namespace daiji::core
