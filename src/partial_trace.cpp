// SPDX-License-Identifier: MIT

#include "qtk/partial_trace.hpp"
#include "qtk/subsystems.hpp"
#include "qtk/core.hpp"
#include "qtk/errors.hpp"
#include <string>
#ifdef QTK_OPENMP
#include <omp.h>
#endif

namespace qtk {

// Pure state: arrange the amplitudes as psi(kept, rest) and contract
// the rest away, rho = psi psi^H.
static DenseMatrix ptr_vector(const DenseMatrix& ket, const SplitIndex& si){
  DenseMatrix psi = DenseMatrix::Zero(si.kept_dim, si.rest_dim);
  for (Index i=0;i<ket.rows();++i) psi(si.kept[std::size_t(i)], si.rest[std::size_t(i)]) = ket(i, 0);
  return psi * psi.adjoint();
}

static DenseMatrix ptr_dense_op(const DenseMatrix& rho, const SplitIndex& si){
  // full[a*rest_dim + t] is the flat index of (kept a, rest t)
  std::vector<Index> full(si.kept.size());
  for (std::size_t i=0;i<si.kept.size();++i) full[std::size_t(si.kept[i]*si.rest_dim + si.rest[i])] = Index(i);
  DenseMatrix out = DenseMatrix::Zero(si.kept_dim, si.kept_dim);
  const Index dk = si.kept_dim, dt = si.rest_dim;
#ifdef QTK_OPENMP
#pragma omp parallel for schedule(static)
#endif
  for (Index a=0;a<dk;++a){
    for (Index b=0;b<dk;++b){
      c64 acc{0,0};
      for (Index t=0;t<dt;++t) acc += rho(full[std::size_t(a*dt + t)], full[std::size_t(b*dt + t)]);
      out(a,b) = acc;
    }
  }
  return out;
}

// Only entries whose traced-out parts agree contribute.
static DenseMatrix ptr_sparse_op(const SparseMatrix& rho, const SplitIndex& si){
  DenseMatrix out = DenseMatrix::Zero(si.kept_dim, si.kept_dim);
  for (Index k=0;k<rho.outerSize();++k)
    for (SparseMatrix::InnerIterator it(rho,k); it; ++it){
      const auto r = std::size_t(it.row()), c = std::size_t(it.col());
      if (si.rest[r] == si.rest[c]) out(si.kept[r], si.kept[c]) += it.value();
    }
  return out;
}

Qarray ptr(const Qarray& state, const Dims& dims_in, const Inds& keep_in){
  const bool vec = isket(state) || isbra(state);
  if (!vec && !isop(state)) throw ShapeError("ptr: expected a ket, bra or square operator");
  const Index total = isbra(state) ? state.cols() : state.rows();
  const Dims dims = infer_dims(dims_in, total);
  const Inds keep = checked_indices(keep_in, dims.size(), "ptr");

  // A 1x1 state is an operator as much as a vector; both paths agree.
  if (vec){
    DenseMatrix ket = isket(state) ? state.to_dense() : DenseMatrix(state.to_dense().adjoint());
    if (keep.size() == dims.size()) return Qarray(DenseMatrix(ket * ket.adjoint()));
    return Qarray(ptr_vector(ket, split_index(dims, keep)));
  }
  if (keep.size() == dims.size()) return Qarray(state.to_dense());

  const SplitIndex si = split_index(dims, keep);
  if (state.is_sparse()) return Qarray(ptr_sparse_op(state.sparse(), si));
  return Qarray(ptr_dense_op(state.dense(), si));
}

Qarray ptr(const Qarray& state, const Dims& dims, std::size_t keep){
  return ptr(state, dims, Inds{keep});
}

} // namespace qtk
