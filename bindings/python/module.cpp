// SPDX-License-Identifier: MIT

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "qrecon/art.hpp"
#include "qrecon/hhl.hpp"
#include "qrecon/reconstruct.hpp"
#include "qrecon/errors.hpp"

namespace py = pybind11;
using namespace qrecon;

static LinearSystem to_system(const std::vector<std::vector<double>>& A, const std::vector<double>& b){
  LinearSystem s;
  std::size_t m = A.size(), n = m ? A[0].size() : 0;
  s.A = RealMatrix::Zero(Eigen::Index(m), Eigen::Index(n));
  for (std::size_t i=0;i<m;++i){
    if (A[i].size()!=n) throw ConfigurationMismatch("ragged matrix rows");
    for (std::size_t j=0;j<n;++j) s.A(Eigen::Index(i), Eigen::Index(j)) = A[i][j];
  }
  s.b = RealVector::Map(b.data(), Eigen::Index(b.size()));
  return s;
}

static std::vector<double> to_list(const RealVector& v){ return std::vector<double>(v.data(), v.data()+v.size()); }

PYBIND11_MODULE(qrecon_python, m){
  py::register_exception<DegenerateSystem>(m, "DegenerateSystem");
  py::register_exception<UnitarityViolation>(m, "UnitarityViolation");
  py::register_exception<FailedPostselection>(m, "FailedPostselection");
  py::register_exception<ConfigurationMismatch>(m, "ConfigurationMismatch");

  m.def("art_solve", [](const std::vector<std::vector<double>>& A, const std::vector<double>& b,
                        std::size_t iterations, double relaxation){
    ArtOptions o; o.iterations = iterations; o.relaxation = relaxation;
    return to_list(art_solve(to_system(A, b), o).x);
  }, py::arg("A"), py::arg("b"), py::arg("iterations") = 10, py::arg("relaxation") = 1.0);

  m.def("hhl_solve", [](const std::vector<std::vector<double>>& A, const std::vector<double>& b,
                        const std::string& table, const std::string& pixel_order, std::size_t clock_qubits){
    HhlOptions o; std::string err;
    o.clock_qubits = clock_qubits;
    auto t = parse_eigen_table(table, err);
    if (!t) throw ConfigurationMismatch(err);
    o.table = *t;
    auto p = parse_index_list(pixel_order, err);
    if (!p) throw ConfigurationMismatch(err);
    o.pixel_order = *p;
    auto r = hhl_solve(to_system(A, b), o);
    return py::make_tuple(to_list(r.solution), r.success_probability);
  }, py::arg("A"), py::arg("b"), py::arg("table") = "00000:5,10011:3,00110:1",
     py::arg("pixel_order") = "3,1,2,0", py::arg("clock_qubits") = 5);

  m.def("cosine_similarity", [](const std::vector<double>& x, const std::vector<double>& y){
    return cosine_similarity(RealVector::Map(x.data(), Eigen::Index(x.size())),
                             RealVector::Map(y.data(), Eigen::Index(y.size())));
  });
}
