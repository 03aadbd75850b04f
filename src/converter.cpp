#include <daiji/converter.hpp>
#include <daiji/core/render.hpp>
#include <daiji/io/parse.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace daiji {

Converter::Converter() : options_(ConverterOptions::defaults()) {}

Converter::Converter(ConverterOptions options) : options_(std::move(options)) {
    core::validate(options_);
}

std::string Converter::convert_numeral_string(std::string_view text) const {
    return core::render(io::normalize(text), options_);
}

core::NumeralDecomposition Converter::normalize(std::string_view text) const {
    return io::normalize(text);
}

void Converter::set_large_units(std::vector<std::string> units) {
    core::validate_large_units(units);
    options_.large_units = std::move(units);
}

void Converter::set_positional_units(std::vector<std::string> units) {
    core::validate_positional_units(units);
    options_.positional_units = std::move(units);
}

void Converter::set_digit_glyphs(std::vector<std::string> glyphs) {
    core::validate_digit_glyphs(glyphs);
    options_.digit_glyphs = std::move(glyphs);
}

} // namespace daiji
