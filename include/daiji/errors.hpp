// include/daiji/errors.hpp - Exception types raised by numeral parsing and rendering.

#pragma once

#include <stdexcept>
#include <string>

namespace daiji {

    // Input is not a sign/digit/decimal-point/exponent numeral.
    class MalformedNumeralError : public std::invalid_argument {
      public:
        using std::invalid_argument::invalid_argument;
    };

    // A replacement unit or glyph table is too short.
    class ConfigurationError : public std::invalid_argument {
      public:
        using std::invalid_argument::invalid_argument;
    };

    // The integer part needs a large unit beyond the configured table.
    class LargeUnitOverflowError : public std::overflow_error {
      public:
        using std::overflow_error::overflow_error;
    };

} // namespace daiji
