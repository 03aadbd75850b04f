// examples/example_daiji.cpp - Illustrates daiji conversion, configuration and errors.

#include <iostream>
#include <stdexcept>

#include <daiji/daijilib.hpp>

int
main() {
    daiji::Converter converter;

    std::cout << "123456789 = " << converter.convert_number(123456789) << "\n";
    std::cout << "120.3045E4 = " << converter.convert_numeral_string("120.3045E4") << "\n";
    std::cout << "1,000 = " << converter.convert_numeral_string("1,000") << "\n";
    std::cout << "0.9 = " << converter.convert_number(0.9) << " (fraction truncated)\n";

    const auto value = converter.normalize("-31.4E-1");
    daiji::util::dump(std::cout << "normalized: ", value) << "\n";

    converter.set_append_one_before_small_units(false);
    std::cout << "1000 without leading one = " << converter.convert_number(1000) << "\n";

    converter.set_large_units({"", "万", "億"});
    converter.set_overflow_policy(daiji::OverflowPolicy::Fail);
    try {
        std::cout << converter.convert_numeral_string("1E12") << "\n";
    } catch (const daiji::LargeUnitOverflowError &err) {
        std::cout << "overflow: " << err.what() << "\n";
    }

    try {
        converter.set_digit_glyphs({"0", "1"});
    } catch (const daiji::ConfigurationError &err) {
        std::cout << "configuration rejected: " << err.what() << "\n";
    }

    try {
        std::cout << converter.convert_numeral_string("12..5") << "\n";
    } catch (const std::invalid_argument &err) {
        std::cout << "malformed: " << err.what() << "\n";
    }

    return 0;
}
