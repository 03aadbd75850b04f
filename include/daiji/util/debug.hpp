#pragma once

#include <ostream>

#include <daiji/core/decomposition.hpp>
#include <daiji/core/options.hpp>
#include <daiji/io/format.hpp>

namespace daiji::util {

inline const char* overflow_policy_name(core::OverflowPolicy policy) {
    switch (policy) {
        case core::OverflowPolicy::Fail:
            return "fail";
        case core::OverflowPolicy::OmitUnit:
            return "omit-unit";
    }
    return "omit-unit";
}

inline std::ostream& dump(std::ostream& os, const core::NumeralDecomposition& value) {
    if (value.is_zero()) {
        return os << "decomposition(ZERO)";
    }
    return os << "decomposition(" << io::to_string(value) << ')';
}

inline std::ostream& dump(std::ostream& os, const core::RenderOptions& options) {
    os << "options(large_units=" << options.large_units.size()
       << ", positional_units=" << options.positional_units.size()
       << ", digit_glyphs=" << options.digit_glyphs.size()
       << ", append_one=" << (options.append_one_before_small_units ? "true" : "false")
       << ", overflow=" << overflow_policy_name(options.overflow_policy) << ')';
    return os;
}

} // namespace daiji::util
