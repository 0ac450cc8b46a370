#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstdint>
#include <string>
#include <vector>

#include "bitops.h"
#include "anf.h"
#include "truth_table.h"

// Python bindings (anfcore) for the ANF transform engine.
//
// Truth tables cross the boundary in three shapes:
//   * an int holding up to 64 packed bits (n <= 6),
//   * a list of bools of length 2^n,
//   * a bytes object holding 2^n bits in little-endian order, consistent with BitVec::from_bytes_le()/to_bytes_le().
//
// Every function validates its input and raises ValueError with the status text instead of returning a partial result.

namespace py = pybind11;

static void throw_if_failed(AnfStatus st){
    if (st != AnfStatus::Ok) throw py::value_error(anf_status_str(st));
}

PYBIND11_MODULE(anfcore, m) {
    m.doc() = "Algebraic normal form of Boolean functions given by truth tables";

    py::enum_<AnfStatus>(m, "AnfStatus")
        .value("Ok", AnfStatus::Ok)
        .value("OutOfDomain", AnfStatus::OutOfDomain)
        .value("InsufficientCapacity", AnfStatus::InsufficientCapacity)
        .value("InvalidLength", AnfStatus::InvalidLength)
        .value("InvalidArgument", AnfStatus::InvalidArgument);

    // Packed truth table (rule number) of n <= 6 variables.
    m.def("transform_packed",
          [](uint64_t rule_value, int n){
              uint64_t out = 0;
              throw_if_failed(anf_transform_packed_checked(rule_value, n, out));
              return out;
          }, py::arg("rule_value"), py::arg("num_variables"));

    // Explicit boolean table, returned as a new list (Python lists are not mutated through the binding).
    m.def("transform_array",
          [](std::vector<bool> table){
              throw_if_failed(anf_transform_array_checked(table));
              return table;
          }, py::arg("table"));

    // Arbitrary n: 2^n bits packed little-endian into bytes.
    m.def("transform_bytes",
          [](py::bytes table, int n){
              std::string s = table;
              std::vector<uint8_t> v(s.begin(), s.end());
              BitVec b;
              throw_if_failed(bitvec_from_bytes_checked(v, n, b));
              throw_if_failed(anf_transform_bitvec_checked(b));
              auto o = b.to_bytes_le();
              return py::bytes(reinterpret_cast<const char*>(o.data()), o.size());
          }, py::arg("table"), py::arg("num_variables"));

    m.def("truth_table_from_rule",
          [](uint64_t rule_value, int n){
              throw_if_failed(anf_check_packed(rule_value, n));
              return truth_table_from_packed(rule_value, n);
          }, py::arg("rule_value"), py::arg("num_variables"));
}
