// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include <variant>
#include <utility>

namespace qtk {

// A ket, bra or operator held either as a dense matrix or as a CSR
// sparse matrix. Every operation dispatches on the held alternative.
class Qarray {
  std::variant<DenseMatrix, SparseMatrix> m_;
public:
  Qarray() : m_(DenseMatrix()) {}
  Qarray(DenseMatrix d) : m_(std::move(d)) {}
  Qarray(SparseMatrix s) : m_(std::move(s)) {}

  bool is_sparse() const { return std::holds_alternative<SparseMatrix>(m_); }
  Index rows() const;
  Index cols() const;
  Index size() const { return rows() * cols(); }
  // Stored entries for sparse values, non-zero entries for dense ones.
  Index nnz() const;
  c64 coeff(Index r, Index c) const;

  const DenseMatrix& dense() const;
  DenseMatrix& dense();
  const SparseMatrix& sparse() const;
  SparseMatrix& sparse();

  DenseMatrix to_dense() const;
  SparseMatrix to_sparse() const;
  // Same values, requested representation.
  Qarray as(bool sparse) const;

  Qarray adjoint() const;
  Qarray conjugate() const;

  Qarray& operator*=(c64 s);
  Qarray& operator/=(c64 s);

  template <typename F>
  decltype(auto) visit(F&& f) const { return std::visit(std::forward<F>(f), m_); }
  template <typename F>
  decltype(auto) visit(F&& f) { return std::visit(std::forward<F>(f), m_); }
};

Qarray operator*(const Qarray& a, c64 s);
Qarray operator*(c64 s, const Qarray& a);
Qarray operator/(const Qarray& a, c64 s);
Qarray operator+(const Qarray& a, const Qarray& b);
Qarray operator-(const Qarray& a, const Qarray& b);

// Matrix product; sparse only when both operands are sparse.
Qarray matmul(const Qarray& a, const Qarray& b);

// Element-wise |a - b| <= atol + rtol * |b|, shapes must agree.
bool allclose(const Qarray& a, const Qarray& b, real_t rtol = real_t(1e-5), real_t atol = real_t(1e-8));

} // namespace qtk
