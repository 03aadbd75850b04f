// include/daiji/daijilib.hpp - Umbrella header that exposes daijilib components.

#pragma once

// Umbrella header for daijilib.
// Users should generally include only this file.

#include <daiji/converter.hpp>
#include <daiji/core/decomposition.hpp>
#include <daiji/core/options.hpp>
#include <daiji/core/render.hpp>
#include <daiji/errors.hpp>
#include <daiji/io/format.hpp>
#include <daiji/io/parse.hpp>
#include <daiji/util/debug.hpp>

#include <string>
#include <string_view>

namespace daiji {

    // One-shot conversions with the default tables.
    inline std::string to_daiji(std::string_view numeral) {
        return core::render(io::normalize(numeral), core::RenderOptions::defaults());
    }

    template <io::Numeric T> std::string to_daiji(T value) {
        return to_daiji(io::numeral_string(value));
    }

    inline constexpr int DAIJILIB_VERSION_MAJOR = 0;
    inline constexpr int DAIJILIB_VERSION_MINOR = 1;
    inline constexpr int DAIJILIB_VERSION_PATCH = 0;

} // namespace daiji
