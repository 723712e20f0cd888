// SPDX-License-Identifier: MIT

#include "qtk/kron.hpp"
#include "qtk/errors.hpp"
#include <unsupported/Eigen/KroneckerProduct>
#include <algorithm>
#include <string>

namespace qtk {

Qarray eye(Index n, bool sparse){
  if (n < 1) throw ShapeError("eye: dimension must be positive, got " + std::to_string(n));
  if (sparse){
    SparseMatrix s(n, n);
    s.setIdentity();
    s.makeCompressed();
    return Qarray(std::move(s));
  }
  return Qarray(DenseMatrix(DenseMatrix::Identity(n, n)));
}

DenseMatrix kron_dense(const DenseMatrix& a, const DenseMatrix& b){
  DenseMatrix out = Eigen::kroneckerProduct(a, b);
  return out;
}

SparseMatrix kron_sparse(const SparseMatrix& a, const SparseMatrix& b){
  SparseMatrix out = Eigen::kroneckerProduct(a, b);
  out.makeCompressed();
  return out;
}

Qarray kron(){ return Qarray(DenseMatrix(DenseMatrix::Ones(1, 1))); }

Qarray kron(const Qarray& a){ return a; }

Qarray kron(const Qarray& a, const Qarray& b){
  if (a.is_sparse() || b.is_sparse()) return Qarray(kron_sparse(a.to_sparse(), b.to_sparse()));
  return Qarray(kron_dense(a.dense(), b.dense()));
}

Qarray kron(const std::vector<Qarray>& ops){
  if (ops.empty()) return kron();
  Qarray out = ops.front();
  for (std::size_t i=1;i<ops.size();++i) out = kron(out, ops[i]);
  return out;
}

Qarray kronpow(const Qarray& a, unsigned n){
  if (n == 0) return kron();
  Qarray out = a;
  for (unsigned i=1;i<n;++i) out = kron(out, a);
  return out;
}

namespace {

struct Block {
  std::size_t op;           // index into ops
  std::vector<std::size_t> sites;
};

// Match ops to consecutive runs of inds whose dimensions multiply to
// the op size. A wildcard closes the run it falls in.
std::vector<Block> assign_blocks(const std::vector<Qarray>& ops, Dims& dims, const Inds& inds){
  std::vector<Block> blocks;
  const bool repeat = ops.size() == 1;
  std::size_t next = 0;
  for (std::size_t k=0; next < inds.size(); ++k){
    if (!repeat && k >= ops.size())
      throw ShapeError("eyepad: " + std::to_string(inds.size() - next) + " subsystem index(es) left without an operator");
    const std::size_t oi = repeat ? 0 : k;
    const long size = long(ops[oi].rows());
    Block b{oi, {}};
    long acc = 1;
    do {
      if (next >= inds.size())
        throw ShapeError("eyepad: operator " + std::to_string(oi) + " of size " + std::to_string(size) +
                         " exceeds the remaining subsystems");
      const std::size_t site = inds[next++];
      b.sites.push_back(site);
      if (dims[site] < 0){
        if (size % acc != 0)
          throw ShapeError("eyepad: cannot infer wildcard dimension at index " + std::to_string(site));
        dims[site] = size / acc;
        acc = size;
      } else {
        acc *= dims[site];
      }
    } while (acc < size);
    if (acc != size)
      throw ShapeError("eyepad: operator " + std::to_string(oi) + " of size " + std::to_string(size) +
                       " does not match the product of its subsystem dimensions (" + std::to_string(acc) + ")");
    for (std::size_t s=1;s<b.sites.size();++s)
      if (b.sites[s] != b.sites[s-1] + 1)
        throw IndexError("eyepad: an operator spanning several subsystems needs adjacent ascending indices");
    blocks.push_back(std::move(b));
  }
  if (!repeat && blocks.size() != ops.size())
    throw ShapeError("eyepad: " + std::to_string(ops.size()) + " operators for " + std::to_string(blocks.size()) + " block(s)");
  return blocks;
}

} // namespace

Qarray eyepad(const std::vector<Qarray>& ops, const Dims& dims_in, const Inds& inds, std::optional<bool> sparse){
  if (ops.empty()) throw ShapeError("eyepad: no operators given");
  if (inds.empty()) throw IndexError("eyepad: no subsystem indices given");
  const std::size_t n = dims_in.size();
  std::size_t wildcards = 0;
  for (long d : dims_in){
    if (d == 0) throw ShapeError("eyepad: zero dimension");
    if (d < 0) ++wildcards;
  }
  if (wildcards > 1) throw ShapeError("eyepad: more than one wildcard dimension");
  std::vector<bool> seen(n, false);
  for (auto i : inds){
    if (i >= n) throw IndexError("eyepad: index " + std::to_string(i) + " out of range for " + std::to_string(n) + " subsystems");
    if (seen[i]) throw IndexError("eyepad: index " + std::to_string(i) + " given twice");
    seen[i] = true;
  }
  bool any_sparse = false;
  for (const auto& op : ops){
    if (!(op.rows() == op.cols() && op.rows() >= 1)) throw ShapeError("eyepad: operators must be square");
    any_sparse = any_sparse || op.is_sparse();
  }
  const bool want_sparse = sparse.value_or(any_sparse);

  Dims dims = dims_in;
  std::vector<Block> blocks = assign_blocks(ops, dims, inds);
  for (std::size_t i=0;i<n;++i)
    if (dims[i] < 0) throw ShapeError("eyepad: wildcard dimension at untargeted index " + std::to_string(i));
  std::sort(blocks.begin(), blocks.end(), [](const Block& a, const Block& b){ return a.sites.front() < b.sites.front(); });

  // Walk dims in order, merging runs of identities into one factor.
  std::vector<Qarray> factors;
  Index id_dim = 1;
  std::size_t pos = 0, bi = 0;
  while (pos < n){
    if (bi < blocks.size() && blocks[bi].sites.front() == pos){
      if (id_dim > 1){ factors.push_back(eye(id_dim, want_sparse)); id_dim = 1; }
      factors.push_back(ops[blocks[bi].op].as(want_sparse));
      pos += blocks[bi].sites.size();
      ++bi;
    } else {
      id_dim *= Index(dims[pos]);
      ++pos;
    }
  }
  if (id_dim > 1) factors.push_back(eye(id_dim, want_sparse));
  return kron(factors).as(want_sparse);
}

Qarray eyepad(const Qarray& op, const Dims& dims, const Inds& inds, std::optional<bool> sparse){
  return eyepad(std::vector<Qarray>{op}, dims, inds, sparse);
}

Qarray eyepad(const Qarray& op, const Dims& dims, std::size_t ind, std::optional<bool> sparse){
  return eyepad(std::vector<Qarray>{op}, dims, Inds{ind}, sparse);
}

} // namespace qtk
