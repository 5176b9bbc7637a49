#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "libbinom/core/validation.hpp"
#include "libbinom/math/combinatorics.hpp"
#include "libbinom/models/binomial.hpp"

#include <gmpxx.h>
#include <sstream>
#include <string>

namespace py = pybind11;

namespace {

// Python ints are arbitrary precision; route them through mpz_class so that
// validation sees the exact value. bool is an int subclass and is accepted
// (True == 1); float, str and everything else is a type error.
mpz_class as_integer(const py::handle& obj) {
    if (!py::isinstance<py::int_>(obj)) {
        throw binom::TypeError(py::str(obj).cast<std::string>() + " must be an integer");
    }
    return mpz_class(py::str(py::int_(py::reinterpret_borrow<py::object>(obj))).cast<std::string>(), 10);
}

// Type check and sign check together, matching the order of the C++ validators.
mpz_class as_non_negative(const py::handle& obj) {
    mpz_class out = as_integer(obj);
    binom::validate_non_negative_integer(out);
    return out;
}

py::int_ to_python(const mpz_class& z) {
    PyObject* out = PyLong_FromString(z.get_str().c_str(), nullptr, 10);
    if (!out) {
        throw py::error_already_set();
    }
    return py::reinterpret_steal<py::int_>(out);
}

} // namespace

PYBIND11_MODULE(binompy, m) {
    m.doc() = "Exact binomial distribution: factorials, combinations, pmf and cumulative probabilities";

    py::register_exception<binom::TypeError>(m, "BinomTypeError", PyExc_TypeError);

    // --- Validation ---
    m.def("validate_non_negative_integer",
        [](py::object x) {
            as_non_negative(x);
        },
        "Raise TypeError if x is not an int, ValueError if it is negative",
        py::arg("x"));

    m.def("validate_less_equal",
        [](py::object x, py::object y) {
            const mpz_class xi = as_non_negative(x);
            const mpz_class yi = as_non_negative(y);
            binom::validate_less_equal(xi, yi);
        },
        "Validate x and y as non-negative ints and require x <= y",
        py::arg("x"), py::arg("y"));

    // --- Combinatorics ---
    m.def("factorial",
        [](py::object n) {
            return to_python(binom::comb::factorial(as_integer(n)));
        },
        "Exact n!",
        py::arg("n"));

    m.def("combinations",
        [](py::object n, py::object r) {
            const mpz_class ni = as_non_negative(n);
            const mpz_class ri = as_non_negative(r);
            return to_python(binom::comb::combinations(ni, ri));
        },
        "Exact n! / (r! (n-r)!)",
        py::arg("n"), py::arg("r"));

    // --- Distribution ---
    py::class_<binom::dist::ReportConfig>(m, "ReportConfig")
        .def(py::init<>())
        .def_readwrite("param_precision", &binom::dist::ReportConfig::param_precision)
        .def_readwrite("value_precision", &binom::dist::ReportConfig::value_precision);

    py::class_<binom::dist::Binomial>(m, "Binomial")
        .def(py::init([](py::object num_trials, double prob_success) {
                return binom::dist::Binomial(as_integer(num_trials), prob_success);
            }),
            py::arg("num_trials"), py::arg("prob_success"))
        .def_property_readonly("num_trials", &binom::dist::Binomial::num_trials)
        .def_property_readonly("prob_success", &binom::dist::Binomial::prob_success)
        .def_property_readonly("prob_failure", &binom::dist::Binomial::prob_failure)
        .def_property_readonly("expected_value", &binom::dist::Binomial::expected_value)
        .def_property_readonly("variance", &binom::dist::Binomial::variance)
        .def_property_readonly("skewness", &binom::dist::Binomial::skewness)
        .def_property_readonly("distribution", &binom::dist::Binomial::distribution)
        .def("probability_k",
            [](const binom::dist::Binomial& b, py::object k) {
                return b.probability_k(as_integer(k));
            },
            py::arg("k"))
        .def("cumulative",
            [](const binom::dist::Binomial& b, py::object k) {
                return b.cumulative(as_integer(k));
            },
            py::arg("k"))
        .def("cumulative_range",
            [](const binom::dist::Binomial& b, py::object k1, py::object k2) {
                const mpz_class lo = as_non_negative(k1);
                const mpz_class hi = as_non_negative(k2);
                return b.cumulative_range(lo, hi);
            },
            py::arg("k1"), py::arg("k2"))
        .def("print_distribution",
            [](const binom::dist::Binomial& b, const binom::dist::ReportConfig& cfg) {
                std::ostringstream oss;
                b.print_distribution(oss, cfg);
                py::print(oss.str(), py::arg("end") = "");
            },
            py::arg("cfg") = binom::dist::ReportConfig{})
        .def("print_stats",
            [](const binom::dist::Binomial& b, const binom::dist::ReportConfig& cfg) {
                std::ostringstream oss;
                b.print_stats(oss, cfg);
                py::print(oss.str(), py::arg("end") = "");
            },
            py::arg("cfg") = binom::dist::ReportConfig{})
        .def("__str__", [](const binom::dist::Binomial& b) { return b.to_string(); })
        .def("__repr__", [](const binom::dist::Binomial& b) {
            return "Binomial(num_trials=" + std::to_string(b.num_trials()) +
                ", prob_success=" + std::to_string(b.prob_success()) + ")";
        });
}
