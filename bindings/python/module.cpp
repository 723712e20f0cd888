// SPDX-License-Identifier: MIT

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/complex.h>
#include <pybind11/eigen.h>
#include "qtk/qtk.hpp"

namespace py = pybind11;
using namespace qtk;

// scipy.sparse input stays sparse, anything array-like becomes dense.
static Qarray to_qarray(const py::handle& obj){
  auto sp = py::module_::import("scipy.sparse");
  if (sp.attr("issparse")(obj).cast<bool>())
    return Qarray(sp.attr("csr_matrix")(obj).cast<SparseMatrix>());
  return Qarray(py::cast<DenseMatrix>(obj));
}

static py::object to_py(const Qarray& q){
  if (q.is_sparse()) return py::cast(q.sparse());
  return py::cast(q.dense());
}

static bool is_flat(const py::handle& obj){
  auto np = py::module_::import("numpy");
  auto sp = py::module_::import("scipy.sparse");
  return !sp.attr("issparse")(obj).cast<bool>() && np.attr("ndim")(obj).cast<int>() == 1;
}

static Inds to_inds(const py::object& obj){
  if (py::isinstance<py::int_>(obj)) return Inds{obj.cast<std::size_t>()};
  return obj.cast<Inds>();
}

PYBIND11_MODULE(qtk_python, m){
  py::register_exception<ShapeError>(m, "ShapeError", PyExc_ValueError);
  py::register_exception<KindError>(m, "KindError", PyExc_ValueError);
  py::register_exception<IndexError>(m, "SubsystemIndexError", PyExc_IndexError);
  py::register_exception<ValueError>(m, "DegenerateError", PyExc_ValueError);

  m.def("quijify", [](const py::object& data, std::optional<std::string> qtype, bool sparse,
                      bool normalized, bool chopped, double tol){
    QuijifyOptions o;
    if (qtype) o.qtype = parse_qtype(*qtype);
    o.sparse = sparse; o.normalized = normalized; o.chopped = chopped; o.tol = real_t(tol);
    if (is_flat(data)) return to_py(quijify(data.cast<vec_c64>(), o));
    return to_py(quijify(to_qarray(data), o));
  }, py::arg("data"), py::arg("qtype") = py::none(), py::arg("sparse") = false,
     py::arg("normalized") = false, py::arg("chopped") = false, py::arg("tol") = double(kChopTol));

  m.def("isherm", [](const py::object& a, double tol){ return isherm(to_qarray(a), real_t(tol)); },
        py::arg("a"), py::arg("tol") = double(kHermTol));
  m.def("tr", [](const py::object& a){ return tr(to_qarray(a)); });
  m.def("nmlz", [](const py::object& a){ return to_py(nmlz(to_qarray(a))); });
  m.def("chop", [](const py::object& a, double tol, bool magnitude){
    return to_py(chop(to_qarray(a), real_t(tol), magnitude ? ChopMode::Magnitude : ChopMode::Components));
  }, py::arg("a"), py::arg("tol") = double(kChopTol), py::arg("magnitude") = false);

  m.def("kron", [](py::args args){
    std::vector<Qarray> ops;
    for (auto a : args) ops.push_back(to_qarray(a));
    return to_py(kron(ops));
  });
  m.def("eyepad", [](const py::object& ops, const Dims& dims, const py::object& inds, std::optional<bool> sparse){
    std::vector<Qarray> qs;
    if (py::isinstance<py::list>(ops) || py::isinstance<py::tuple>(ops))
      for (auto o : ops) qs.push_back(to_qarray(o));
    else
      qs.push_back(to_qarray(ops));
    return to_py(eyepad(qs, dims, to_inds(inds), sparse));
  }, py::arg("ops"), py::arg("dims"), py::arg("inds"), py::arg("sparse") = py::none());
  m.def("ptr", [](const py::object& state, const Dims& dims, const py::object& keep){
    return to_py(ptr(to_qarray(state), dims, to_inds(keep)));
  }, py::arg("state"), py::arg("dims"), py::arg("keep"));

  m.def("bell_state", [](const std::string& label, const std::string& qtype, bool sparse){
    return to_py(bell_state(label, parse_qtype(qtype), sparse));
  }, py::arg("label"), py::arg("qtype") = "ket", py::arg("sparse") = false);
}
