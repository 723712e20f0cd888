// SPDX-License-Identifier: MIT

#include "qtk/subsystems.hpp"
#include "qtk/core.hpp"
#include "qtk/errors.hpp"
#include <algorithm>
#include <string>

namespace qtk {

Dims infer_dims(const Dims& dims, Index total){
  if (dims.empty()) throw ShapeError("empty dimension list");
  Dims out = dims;
  long known = 1;
  std::size_t wild = dims.size();
  for (std::size_t i=0;i<dims.size();++i){
    if (dims[i] == 0) throw ShapeError("zero dimension at index " + std::to_string(i));
    if (dims[i] < 0){
      if (wild != dims.size()) throw ShapeError("more than one wildcard dimension");
      wild = i;
    } else {
      known *= dims[i];
    }
  }
  if (wild != dims.size()){
    if (total % known != 0)
      throw ShapeError("cannot infer wildcard dimension: " + std::to_string(total) + " is not divisible by " + std::to_string(known));
    out[wild] = long(total / known);
    known = total;
  }
  if (known != total)
    throw ShapeError("dimensions multiply to " + std::to_string(known) + ", state has size " + std::to_string(total));
  return out;
}

Inds checked_indices(const Inds& inds, std::size_t n, const char* who){
  if (inds.empty()) throw IndexError(std::string(who) + ": no subsystem indices given");
  Inds out = inds;
  std::sort(out.begin(), out.end());
  for (std::size_t i=0;i<out.size();++i){
    if (out[i] >= n)
      throw IndexError(std::string(who) + ": index " + std::to_string(out[i]) + " out of range for " + std::to_string(n) + " subsystems");
    if (i > 0 && out[i] == out[i-1])
      throw IndexError(std::string(who) + ": index " + std::to_string(out[i]) + " given twice");
  }
  return out;
}

SplitIndex split_index(const Dims& dims, const Inds& kept){
  const std::size_t n = dims.size();
  std::vector<bool> is_kept(n, false);
  for (auto k : kept) is_kept[k] = true;
  // Row-major strides within each group.
  std::vector<Index> stride(n, 0);
  SplitIndex si;
  for (std::size_t s=n; s-- > 0;){
    if (is_kept[s]){ stride[s] = si.kept_dim; si.kept_dim *= Index(dims[s]); }
    else { stride[s] = si.rest_dim; si.rest_dim *= Index(dims[s]); }
  }
  const Index total = si.kept_dim * si.rest_dim;
  si.kept.assign(std::size_t(total), 0);
  si.rest.assign(std::size_t(total), 0);
  for (Index i=0;i<total;++i){
    Index rem = i, k = 0, r = 0;
    for (std::size_t s=n; s-- > 0;){
      const Index digit = rem % Index(dims[s]);
      rem /= Index(dims[s]);
      if (is_kept[s]) k += digit * stride[s];
      else r += digit * stride[s];
    }
    si.kept[std::size_t(i)] = k;
    si.rest[std::size_t(i)] = r;
  }
  return si;
}

std::size_t infer_size(const Qarray& a, unsigned base){
  if (base < 2) throw ShapeError("infer_size: base must be at least 2");
  Index d = std::max(a.rows(), a.cols());
  std::size_t n = 0;
  while (d > 1 && d % Index(base) == 0){ d /= Index(base); ++n; }
  if (d != 1)
    throw ShapeError("infer_size: size " + std::to_string(std::max(a.rows(), a.cols())) +
                     " is not a power of " + std::to_string(base));
  return n;
}

// newpos[i] is where flat index i lands after the permutation.
static std::vector<Index> permuted_positions(const Dims& dims, const Inds& perm){
  const std::size_t n = dims.size();
  Index total = 1;
  for (long d : dims) total *= Index(d);
  // Strides of the output layout, looked up by input subsystem.
  std::vector<Index> out_stride(n, 0);
  Index acc = 1;
  for (std::size_t pos=n; pos-- > 0;){
    out_stride[perm[pos]] = acc;
    acc *= Index(dims[perm[pos]]);
  }
  std::vector<Index> newpos(std::size_t(total), 0);
  for (Index i=0;i<total;++i){
    Index rem = i, j = 0;
    for (std::size_t s=n; s-- > 0;){
      j += (rem % Index(dims[s])) * out_stride[s];
      rem /= Index(dims[s]);
    }
    newpos[std::size_t(i)] = j;
  }
  return newpos;
}

Qarray permute_subsystems(const Qarray& a, const Dims& dims_in, const Inds& perm){
  const Index total = isbra(a) ? a.cols() : a.rows();
  Dims dims = infer_dims(dims_in, total);
  if (perm.size() != dims.size())
    throw IndexError("permute_subsystems: permutation of length " + std::to_string(perm.size()) +
                     " for " + std::to_string(dims.size()) + " subsystems");
  checked_indices(perm, dims.size(), "permute_subsystems");
  if (!(isket(a) || isbra(a) || isop(a)))
    throw ShapeError("permute_subsystems: expected a ket, bra or square operator");
  const auto newpos = permuted_positions(dims, perm);
  const bool rows_move = !isbra(a) || isop(a);
  const bool cols_move = !isket(a) || isop(a);
  auto row_of = [&](Index r){ return rows_move ? newpos[std::size_t(r)] : r; };
  auto col_of = [&](Index c){ return cols_move ? newpos[std::size_t(c)] : c; };

  if (a.is_sparse()){
    const SparseMatrix& s = a.sparse();
    std::vector<Eigen::Triplet<c64>> trips;
    trips.reserve(std::size_t(s.nonZeros()));
    for (Index k=0;k<s.outerSize();++k)
      for (SparseMatrix::InnerIterator it(s,k); it; ++it)
        trips.emplace_back(row_of(it.row()), col_of(it.col()), it.value());
    SparseMatrix out(s.rows(), s.cols());
    out.setFromTriplets(trips.begin(), trips.end());
    return Qarray(std::move(out));
  }
  const DenseMatrix& m = a.dense();
  DenseMatrix out(m.rows(), m.cols());
  for (Index j=0;j<m.cols();++j)
    for (Index i=0;i<m.rows();++i) out(row_of(i), col_of(j)) = m(i,j);
  return Qarray(std::move(out));
}

Qarray ldmul(const DenseVector& diag, const Qarray& m){
  if (diag.size() != m.rows())
    throw ShapeError("ldmul: diagonal of size " + std::to_string(diag.size()) + " for " + std::to_string(m.rows()) + " rows");
  if (m.is_sparse()) return Qarray(SparseMatrix(diag.asDiagonal() * m.sparse()));
  return Qarray(DenseMatrix(diag.asDiagonal() * m.dense()));
}

Qarray rdmul(const Qarray& m, const DenseVector& diag){
  if (diag.size() != m.cols())
    throw ShapeError("rdmul: diagonal of size " + std::to_string(diag.size()) + " for " + std::to_string(m.cols()) + " columns");
  if (m.is_sparse()) return Qarray(SparseMatrix(m.sparse() * diag.asDiagonal()));
  return Qarray(DenseMatrix(m.dense() * diag.asDiagonal()));
}

} // namespace qtk
