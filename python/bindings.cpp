// python/bindings.cpp - Pybind11 bindings for the u128lib module.

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <utility>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <u128/u128lib.hpp>

namespace py = pybind11;
namespace core = u128::core;

namespace {

std::uint8_t checked_first_bit(int first_bit) {
    if (first_bit < 0 || first_bit > core::uint128::BITS) {
        throw py::value_error("bit index must be 0..128");
    }
    return static_cast<std::uint8_t>(first_bit);
}

py::int_ to_python_int(const core::uint128& value) {
    const py::int_ high(value.hi());
    const py::int_ low(value.lo());
    return py::int_(high.attr("__lshift__")(core::uint128::HALF_BITS).attr("__or__")(low));
}

core::uint128 from_python_int(const py::int_& value) {
    const py::int_ zero(0);
    if (value < zero || value.attr("bit_length")().cast<int>() > core::uint128::BITS) {
        throw py::value_error("Uint128 value must be in [0, 2**128)");
    }
    const py::int_ low_mask(0xFFFFFFFFFFFFFFFFULL);
    const auto low = value.attr("__and__")(low_mask).cast<std::uint64_t>();
    const auto high = value.attr("__rshift__")(core::uint128::HALF_BITS).cast<std::uint64_t>();
    return core::uint128(high, low);
}

} // namespace

PYBIND11_MODULE(u128lib, module) {
    module.doc() = "Pybind11 bindings for the u128lib 128-bit unsigned value type";
    module.attr("BITS") = core::uint128::BITS;
    module.attr("BYTES") = core::uint128::BYTES;

    py::class_<core::uint128> py_uint128(
        module, "Uint128", "128-bit unsigned value stored as two 64-bit halves (bit 0 = MSB)");
    py_uint128.def(py::init<>())
        .def(py::init<std::uint64_t, std::uint64_t>(), py::arg("hi"), py::arg("lo"))
        .def_static("zero", &core::uint128::zero)
        .def_static("one", &core::uint128::one)
        .def_static("max", &core::uint128::max)
        .def_static("mask6", &core::uint128::checked_mask6, py::arg("n"))
        .def_static("from_int", &from_python_int, py::arg("value"))
        .def_static("from_bytes", [](const py::bytes& data) {
            const std::string raw = data;
            if (raw.size() != static_cast<std::size_t>(core::uint128::BYTES)) {
                throw py::value_error("from_bytes expects 16 big-endian bytes");
            }
            std::array<std::uint8_t, core::uint128::BYTES> bytes{};
            std::memcpy(bytes.data(), raw.data(), bytes.size());
            return core::uint128::from_bytes(bytes);
        })
        .def_property_readonly("hi", &core::uint128::hi)
        .def_property_readonly("lo", &core::uint128::lo)
        .def("halves", [](const core::uint128& self) { return std::make_pair(self.hi(), self.lo()); })
        .def("set_halves",
             [](core::uint128& self, std::uint64_t hi, std::uint64_t lo) { self.set_halves(hi, lo); },
             py::arg("hi"),
             py::arg("lo"))
        .def("is_zero", &core::uint128::is_zero)
        .def("bit", &core::uint128::checked_bit, py::arg("index"))
        .def("add_one", &core::uint128::add_one)
        .def("sub_one", &core::uint128::sub_one)
        .def("bits_set_from",
             [](const core::uint128& self, int first_bit) {
                 return self.bits_set_from(checked_first_bit(first_bit));
             },
             py::arg("bit"))
        .def("bits_cleared_from",
             [](const core::uint128& self, int first_bit) {
                 return self.bits_cleared_from(checked_first_bit(first_bit));
             },
             py::arg("bit"))
        .def("to_int", &to_python_int)
        .def("to_bytes", [](const core::uint128& self) {
            const auto bytes = self.to_bytes();
            return py::bytes(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        })
        .def("__and__", [](const core::uint128& a, const core::uint128& b) { return a & b; })
        .def("__or__", [](const core::uint128& a, const core::uint128& b) { return a | b; })
        .def("__xor__", [](const core::uint128& a, const core::uint128& b) { return a ^ b; })
        .def("__invert__", [](const core::uint128& a) { return ~a; })
        .def("__eq__", [](const core::uint128& a, const core::uint128& b) { return a == b; })
        .def("__hash__", [](const core::uint128& a) { return core::canonical_hash(a); })
        .def("__int__", &to_python_int)
        .def("__bool__", [](const core::uint128& a) { return !a.is_zero(); });
}
