// include/daiji/core/render.hpp - Daiji rendering of a normalized decomposition.

#pragma once

#include <string>

#include <daiji/core/decomposition.hpp>
#include <daiji/core/options.hpp>

namespace daiji::core {

    // Renders the integer part of `value` in 4-digit groups; the fraction is
    // truncated. Throws ConfigurationError for tables that are too short and
    // LargeUnitOverflowError when a group has no unit under OverflowPolicy::Fail.
    std::string render(const NumeralDecomposition &value, const RenderOptions &options);

} // namespace daiji::core
