// SPDX-License-Identifier: MIT

#include "qtk/qarray.hpp"
#include "qtk/errors.hpp"
#include <cmath>

namespace qtk {

Index Qarray::rows() const { return visit([](const auto& m){ return Index(m.rows()); }); }
Index Qarray::cols() const { return visit([](const auto& m){ return Index(m.cols()); }); }

Index Qarray::nnz() const {
  if (is_sparse()) return sparse().nonZeros();
  const auto& d = dense();
  Index n = 0;
  for (Index i=0;i<d.size();++i) if (d.data()[i] != c64(0)) ++n;
  return n;
}

c64 Qarray::coeff(Index r, Index c) const {
  if (r < 0 || c < 0 || r >= rows() || c >= cols())
    throw IndexError("coefficient (" + std::to_string(r) + "," + std::to_string(c) + ") out of range");
  return visit([&](const auto& m){ return c64(m.coeff(r, c)); });
}

const DenseMatrix& Qarray::dense() const {
  if (is_sparse()) throw KindError("Qarray holds a sparse matrix");
  return std::get<DenseMatrix>(m_);
}
DenseMatrix& Qarray::dense() {
  if (is_sparse()) throw KindError("Qarray holds a sparse matrix");
  return std::get<DenseMatrix>(m_);
}
const SparseMatrix& Qarray::sparse() const {
  if (!is_sparse()) throw KindError("Qarray holds a dense matrix");
  return std::get<SparseMatrix>(m_);
}
SparseMatrix& Qarray::sparse() {
  if (!is_sparse()) throw KindError("Qarray holds a dense matrix");
  return std::get<SparseMatrix>(m_);
}

DenseMatrix Qarray::to_dense() const {
  if (is_sparse()) return DenseMatrix(sparse());
  return dense();
}

SparseMatrix Qarray::to_sparse() const {
  if (is_sparse()) return sparse();
  // sparseView drops exact zeros only
  SparseMatrix s = dense().sparseView(c64(0), real_t(0));
  s.makeCompressed();
  return s;
}

Qarray Qarray::as(bool want_sparse) const {
  if (want_sparse == is_sparse()) return *this;
  return want_sparse ? Qarray(to_sparse()) : Qarray(to_dense());
}

Qarray Qarray::adjoint() const {
  if (is_sparse()) return Qarray(SparseMatrix(sparse().adjoint()));
  return Qarray(DenseMatrix(dense().adjoint()));
}

Qarray Qarray::conjugate() const {
  if (is_sparse()) return Qarray(SparseMatrix(sparse().conjugate()));
  return Qarray(DenseMatrix(dense().conjugate()));
}

Qarray& Qarray::operator*=(c64 s){
  visit([&](auto& m){ m *= s; });
  return *this;
}

Qarray& Qarray::operator/=(c64 s){
  visit([&](auto& m){ m /= s; });
  return *this;
}

Qarray operator*(const Qarray& a, c64 s){ Qarray r = a; r *= s; return r; }
Qarray operator*(c64 s, const Qarray& a){ return a * s; }
Qarray operator/(const Qarray& a, c64 s){ Qarray r = a; r /= s; return r; }

static void check_same_shape(const Qarray& a, const Qarray& b, const char* what){
  if (a.rows()!=b.rows() || a.cols()!=b.cols())
    throw ShapeError(std::string(what) + ": shapes (" + std::to_string(a.rows()) + "," + std::to_string(a.cols()) +
                     ") and (" + std::to_string(b.rows()) + "," + std::to_string(b.cols()) + ") differ");
}

Qarray operator+(const Qarray& a, const Qarray& b){
  check_same_shape(a, b, "add");
  if (a.is_sparse() && b.is_sparse()) return Qarray(SparseMatrix(a.sparse() + b.sparse()));
  return Qarray(DenseMatrix(a.to_dense() + b.to_dense()));
}

Qarray operator-(const Qarray& a, const Qarray& b){
  check_same_shape(a, b, "subtract");
  if (a.is_sparse() && b.is_sparse()) return Qarray(SparseMatrix(a.sparse() - b.sparse()));
  return Qarray(DenseMatrix(a.to_dense() - b.to_dense()));
}

Qarray matmul(const Qarray& a, const Qarray& b){
  if (a.cols() != b.rows())
    throw ShapeError("matmul: inner dimensions " + std::to_string(a.cols()) + " and " + std::to_string(b.rows()) + " differ");
  if (a.is_sparse() && b.is_sparse()) return Qarray(SparseMatrix(a.sparse() * b.sparse()));
  if (a.is_sparse()) return Qarray(DenseMatrix(a.sparse() * b.dense()));
  if (b.is_sparse()) return Qarray(DenseMatrix(a.dense() * b.sparse()));
  return Qarray(DenseMatrix(a.dense() * b.dense()));
}

bool allclose(const Qarray& a, const Qarray& b, real_t rtol, real_t atol){
  if (a.rows()!=b.rows() || a.cols()!=b.cols()) return false;
  if (a.is_sparse() && b.is_sparse()){
    // Only positions stored in either operand can differ.
    SparseMatrix d = a.sparse() - b.sparse();
    for (Index k=0;k<d.outerSize();++k)
      for (SparseMatrix::InnerIterator it(d,k); it; ++it)
        if (std::abs(it.value()) > atol + rtol*std::abs(b.sparse().coeff(it.row(), it.col()))) return false;
    return true;
  }
  DenseMatrix da = a.to_dense(), db = b.to_dense();
  for (Index j=0;j<da.cols();++j)
    for (Index i=0;i<da.rows();++i)
      if (std::abs(da(i,j) - db(i,j)) > atol + rtol*std::abs(db(i,j))) return false;
  return true;
}

} // namespace qtk
