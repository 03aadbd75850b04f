// python/bindings.cpp - Pybind11 bindings for the daijilib module.

#include <string>
#include <vector>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <daiji/daijilib.hpp>

namespace py = pybind11;
namespace core = daiji::core;

// Python ints are unbounded, so they go through their decimal text; floats use
// the 35-digit formatting of the C++ entry point.
static std::string convert_python_number(const daiji::Converter& converter, const py::handle& value) {
    if (py::isinstance<py::bool_>(value)) {
        throw py::type_error("bool is not a numeral");
    }
    if (py::isinstance<py::int_>(value)) {
        return converter.convert_numeral_string(py::str(value).cast<std::string>());
    }
    if (py::isinstance<py::float_>(value)) {
        return converter.convert_number(value.cast<double>());
    }
    throw py::type_error("convert_number expects an int or float");
}

PYBIND11_MODULE(daijilib, module) {
    module.doc() = "Pybind11 bindings for daijilib formal Japanese numerals";
    module.attr("VERSION") = py::make_tuple(daiji::DAIJILIB_VERSION_MAJOR,
                                            daiji::DAIJILIB_VERSION_MINOR,
                                            daiji::DAIJILIB_VERSION_PATCH);

    py::register_exception<daiji::MalformedNumeralError>(module, "MalformedNumeralError",
                                                         PyExc_ValueError);
    py::register_exception<daiji::ConfigurationError>(module, "ConfigurationError",
                                                      PyExc_ValueError);
    py::register_exception<daiji::LargeUnitOverflowError>(module, "LargeUnitOverflowError",
                                                          PyExc_OverflowError);

    py::enum_<core::OverflowPolicy>(module, "OverflowPolicy")
        .value("FAIL", core::OverflowPolicy::Fail)
        .value("OMIT_UNIT", core::OverflowPolicy::OmitUnit);

    py::class_<core::NumeralDecomposition> py_decomposition(
        module, "Decomposition", "Exponent-free sign/integer/fraction form of a numeral");
    py_decomposition.def(py::init<>())
        .def(py::init<bool, std::string, std::string>(), py::arg("negative"),
             py::arg("integer_digits"), py::arg("fraction_digits") = std::string())
        .def_property_readonly("is_negative", &core::NumeralDecomposition::is_negative)
        .def_property_readonly("is_zero", &core::NumeralDecomposition::is_zero)
        .def_property_readonly("integer_digits", &core::NumeralDecomposition::integer_digits)
        .def_property_readonly("fraction_digits", &core::NumeralDecomposition::fraction_digits)
        .def("without_fraction", &core::NumeralDecomposition::without_fraction)
        .def("without_integer", &core::NumeralDecomposition::without_integer)
        .def("__str__", [](const core::NumeralDecomposition& value) {
            return daiji::io::to_string(value);
        })
        .def("__repr__", [](const core::NumeralDecomposition& value) {
            return "<daijilib.Decomposition " + daiji::io::to_string(value) + ">";
        })
        .def("__eq__", [](const core::NumeralDecomposition& a, const core::NumeralDecomposition& b) {
            return a == b;
        });

    module.def("normalize", [](const std::string& text) { return daiji::io::normalize(text); },
               py::arg("text"), "Parse a numeral string into its exponent-free form");
    module.def("is_numeral", [](const std::string& text) { return daiji::io::is_numeral(text); },
               py::arg("text"));

    py::class_<daiji::Converter> py_converter(module, "Converter",
                                              "Converts numerals into daiji strings");
    py_converter.def(py::init<>())
        .def("convert_number", &convert_python_number, py::arg("value"))
        .def("convert_numeral_string", &daiji::Converter::convert_numeral_string, py::arg("text"))
        .def("normalize", &daiji::Converter::normalize, py::arg("text"))
        .def_property("large_units", &daiji::Converter::large_units,
                      &daiji::Converter::set_large_units)
        .def_property("positional_units", &daiji::Converter::positional_units,
                      &daiji::Converter::set_positional_units)
        .def_property("digit_glyphs", &daiji::Converter::digit_glyphs,
                      &daiji::Converter::set_digit_glyphs)
        .def_property("append_one_before_small_units",
                      &daiji::Converter::append_one_before_small_units,
                      &daiji::Converter::set_append_one_before_small_units)
        .def_property("overflow_policy", &daiji::Converter::overflow_policy,
                      &daiji::Converter::set_overflow_policy);
}
