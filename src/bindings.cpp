/**
 * @file bindings.cpp
 * @brief Python bindings for the range coder module.
 */

#include "cdf_model.hpp"
#include "range_decoder.hpp"
#include "range_encoder.hpp"
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;

PYBIND11_MODULE(rangecoder, m) {
  m.doc() = "Q15 adaptive range coder";

  py::class_<CdfModel>(m, "CdfModel")
      .def(py::init<const std::vector<uint16_t> &>(), py::arg("icdf"),
           "Adaptive model from an inverted CDF table (last entry 0).")
      .def_static("uniform", &CdfModel::uniform, py::arg("num_symbols"))
      .def("update", &CdfModel::update, py::arg("symbol"))
      .def("reset", &CdfModel::reset)
      .def("probability", &CdfModel::probability, py::arg("symbol"))
      .def_property_readonly("icdf", &CdfModel::icdf)
      .def_property_readonly("num_symbols", &CdfModel::num_symbols)
      .def_property_readonly("count", &CdfModel::count)
      .def("__eq__", &CdfModel::operator==);

  py::class_<RangeEncoder>(m, "RangeEncoder")
      .def(py::init<>())
      .def("encode_bool", &RangeEncoder::encode_bool, py::arg("value"),
           py::arg("f"))
      .def("encode_bit", &RangeEncoder::encode_bit, py::arg("bit"))
      .def("encode_literal", &RangeEncoder::encode_literal, py::arg("value"),
           py::arg("num_bits"))
      .def("encode_cdf", &RangeEncoder::encode_cdf, py::arg("symbol"),
           py::arg("icdf"))
      .def("encode_symbol", &RangeEncoder::encode_symbol, py::arg("symbol"),
           py::arg("model"))

      // --- DONE ---
      // Return the stream as 'bytes' rather than a list of ints
      .def(
          "done",
          [](RangeEncoder &self) {
            std::vector<uint8_t> out = self.done();
            return py::bytes(reinterpret_cast<const char *>(out.data()),
                             out.size());
          },
          "Finish the stream and return the coded bytes.\n")
      .def("tell", &RangeEncoder::tell)
      .def("tell_frac", &RangeEncoder::tell_frac)
      .def_property_readonly("finalized", &RangeEncoder::is_finalized);

  py::class_<RangeDecoder>(m, "RangeDecoder")
      // We use a lambda to accept 'py::bytes' and convert it to
      // 'std::vector<uint8_t>'
      .def(py::init([](py::bytes data) {
             std::string s = data;
             return RangeDecoder(std::vector<uint8_t>(s.begin(), s.end()));
           }),
           py::arg("data"))
      .def("decode_bool", &RangeDecoder::decode_bool, py::arg("f"))
      .def("decode_bit", &RangeDecoder::decode_bit)
      .def("decode_literal", &RangeDecoder::decode_literal,
           py::arg("num_bits"))
      .def("decode_cdf", &RangeDecoder::decode_cdf, py::arg("icdf"))
      .def("decode_symbol", &RangeDecoder::decode_symbol, py::arg("model"))
      .def("tell", &RangeDecoder::tell)
      .def("tell_frac", &RangeDecoder::tell_frac)
      .def("has_overflowed", &RangeDecoder::has_overflowed);
}
