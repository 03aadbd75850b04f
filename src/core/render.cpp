#include <daiji/core/render.hpp>
#include <daiji/core/detail/tables.hpp>
#include <daiji/errors.hpp>

#include <cstddef>
#include <string>

namespace daiji::core {

namespace {

constexpr std::size_t ONES_POSITION = detail::GROUP_WIDTH - 1;

inline std::size_t leading_group_index(const std::string &digits) noexcept {
    return (digits.size() - 1) / detail::GROUP_WIDTH;
}

// Position of the first digit within its group: 0 = thousand ... 3 = one's place.
inline std::size_t leading_position(const std::string &digits) noexcept {
    return (detail::GROUP_WIDTH - digits.size() % detail::GROUP_WIDTH) % detail::GROUP_WIDTH;
}

void ensure_large_unit(std::size_t group, const RenderOptions &options) {
    if (group < options.large_units.size() || options.overflow_policy != OverflowPolicy::Fail) {
        return;
    }
    throw LargeUnitOverflowError("no large unit name for digit group " + std::to_string(group) +
                                 " (10^" + std::to_string(group * detail::GROUP_WIDTH) + ")");
}

} // namespace

std::string render(const NumeralDecomposition &value, const RenderOptions &options) {
    validate(options);

    const NumeralDecomposition integral = value.without_fraction();
    if (integral.is_zero()) {
        return options.digit_glyphs[0];
    }

    const std::string &digits = integral.integer_digits();
    std::size_t group = leading_group_index(digits);
    std::size_t position = leading_position(digits);
    ensure_large_unit(group, options);

    std::string result;
    result.reserve(digits.size() * 8 + 1);
    if (integral.is_negative()) {
        result.push_back('-');
    }

    bool group_emitted = false;
    for (const char ch : digits) {
        if (ch != '0') {
            const auto digit = static_cast<std::size_t>(ch - '0');
            if (position == ONES_POSITION || digit != 1 || options.append_one_before_small_units) {
                result += options.digit_glyphs[digit];
                group_emitted = true;
            }
            const std::string &unit = options.positional_units[position];
            if (!unit.empty()) {
                result += unit;
                group_emitted = true;
            }
        }

        if (position != ONES_POSITION) {
            ++position;
            continue;
        }
        if (group_emitted && group < options.large_units.size()) {
            result += options.large_units[group];
        }
        position = 0;
        group_emitted = false;
        if (group > 0) {
            --group;
        }
    }
    return result;
}

} // namespace daiji::core
