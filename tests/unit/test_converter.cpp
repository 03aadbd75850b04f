// tests/unit/test_converter.cpp - Public converter entry points and configuration surface.

#include <daiji/daijilib.hpp>

#include <cstdint>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

namespace {

bool expect_equal(const std::string& actual, const std::string& expected, const char* label) {
    if (actual != expected) {
        std::cerr << label << ": got " << actual << ", expected " << expected << '\n';
        return false;
    }
    return true;
}

bool test_numeric_entry_points() {
    const daiji::Converter converter;
    if (!expect_equal(converter.convert_number(0), "零", "int 0") ||
        !expect_equal(converter.convert_number(1), "壱", "int 1") ||
        !expect_equal(converter.convert_number(10), "壱拾", "int 10") ||
        !expect_equal(converter.convert_number(1000), "壱千", "int 1000") ||
        !expect_equal(converter.convert_number(12345), "壱万弐千参百四拾五", "int 12345") ||
        !expect_equal(converter.convert_number(123456789), "壱億弐千参百四拾五万六千七百八拾九",
                      "int 123456789") ||
        !expect_equal(converter.convert_number(-7L), "-七", "long -7") ||
        !expect_equal(converter.convert_number(std::uint8_t{200}), "弐百", "uint8 200") ||
        !expect_equal(converter.convert_number(12345.678), "壱万弐千参百四拾五", "double") ||
        !expect_equal(converter.convert_number(0.9f), "零", "float 0.9") ||
        !expect_equal(converter.convert_number(-0.9), "零", "double -0.9") ||
        !expect_equal(converter.convert_number(1e16), "壱京", "double 1e16") ||
        !expect_equal(converter.convert_number(2.5e8L), "弐億五千万", "long double")) {
        return false;
    }
    return expect_equal(
        converter.convert_number(std::numeric_limits<std::uint64_t>::max()),
        "壱千八百四拾四京六千七百四拾四兆七百参拾七億九百五拾五万壱千六百壱拾五", "uint64 max");
}

bool test_string_entry_point() {
    const daiji::Converter converter;
    if (converter.convert_numeral_string("120.3045E4") !=
        converter.convert_numeral_string("1203045")) {
        std::cerr << "exponent form differs from plain form\n";
        return false;
    }
    if (!expect_equal(converter.convert_numeral_string("120.3045E4"), "壱百弐拾万参千四拾五",
                      "120.3045E4") ||
        !expect_equal(converter.convert_numeral_string("1,000,000"), "壱百万", "1,000,000") ||
        !expect_equal(converter.convert_numeral_string("0E5"), "零", "0E5")) {
        return false;
    }
    try {
        static_cast<void>(converter.convert_numeral_string("twelve"));
        std::cerr << "converted a non-numeral\n";
        return false;
    } catch (const daiji::MalformedNumeralError&) {
    }
    const daiji::core::NumeralDecomposition value = converter.normalize("-31.4E-1");
    return expect_equal(daiji::io::to_string(value), "-3.14", "normalize(-31.4E-1)");
}

bool test_configuration_surface() {
    daiji::Converter converter;
    if (converter.large_units().size() != 17 || converter.large_units()[2] != "億" ||
        converter.positional_units().size() != 4 || converter.digit_glyphs()[0] != "零" ||
        !converter.append_one_before_small_units() ||
        converter.overflow_policy() != daiji::OverflowPolicy::OmitUnit) {
        std::cerr << "unexpected default configuration\n";
        return false;
    }

    converter.set_append_one_before_small_units(false);
    if (!expect_equal(converter.convert_number(1000), "千", "flag off 1000") ||
        !expect_equal(converter.convert_number(12345), "壱万弐千参百四拾五", "flag off 12345")) {
        return false;
    }
    converter.set_append_one_before_small_units(true);

    converter.set_large_units({"", "萬"});
    converter.set_overflow_policy(daiji::OverflowPolicy::Fail);
    if (!expect_equal(converter.convert_number(50000), "五萬", "custom large unit")) {
        return false;
    }
    try {
        static_cast<void>(converter.convert_number(123456789));
        std::cerr << "overflow did not propagate through converter\n";
        return false;
    } catch (const daiji::LargeUnitOverflowError&) {
    }
    converter.set_overflow_policy(daiji::OverflowPolicy::OmitUnit);
    if (!expect_equal(converter.convert_number(123456789),
                      "壱弐千参百四拾五萬六千七百八拾九", "omit unit")) {
        return false;
    }
    return true;
}

bool test_configuration_errors() {
    daiji::Converter converter;
    const std::vector<std::string> before = converter.positional_units();
    try {
        converter.set_positional_units({"千", "百", "拾"});
        std::cerr << "accepted 3 positional units\n";
        return false;
    } catch (const daiji::ConfigurationError&) {
    }
    if (converter.positional_units() != before) {
        std::cerr << "failed setter changed the table\n";
        return false;
    }
    try {
        converter.set_digit_glyphs({"零", "壱", "弐"});
        std::cerr << "accepted 3 digit glyphs\n";
        return false;
    } catch (const daiji::ConfigurationError&) {
    }
    try {
        converter.set_large_units({});
        std::cerr << "accepted an empty large unit table\n";
        return false;
    } catch (const daiji::ConfigurationError&) {
    }

    daiji::ConverterOptions options = daiji::ConverterOptions::defaults();
    options.digit_glyphs.pop_back();
    try {
        const daiji::Converter invalid(options);
        std::cerr << "constructed a converter with 9 glyphs\n";
        return false;
    } catch (const daiji::ConfigurationError&) {
    }

    converter.set_positional_units({"千", "百", "拾", "", "unused"});
    converter.set_digit_glyphs({"〇", "一", "二", "三", "四", "五", "六", "七", "八", "九", "十"});
    return expect_equal(converter.convert_number(305), "三百五", "longer tables");
}

bool test_one_shot_helpers() {
    return expect_equal(daiji::to_daiji("120.3045E4"), "壱百弐拾万参千四拾五", "to_daiji string") &&
           expect_equal(daiji::to_daiji(12345), "壱万弐千参百四拾五", "to_daiji int");
}

} // namespace

int main() {
    if (!test_numeric_entry_points()) {
        return 1;
    }
    if (!test_string_entry_point()) {
        return 1;
    }
    if (!test_configuration_surface()) {
        return 1;
    }
    if (!test_configuration_errors()) {
        return 1;
    }
    if (!test_one_shot_helpers()) {
        return 1;
    }
    std::cout << "converter passed\n";
    return 0;
}
