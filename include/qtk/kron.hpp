// SPDX-License-Identifier: MIT

#pragma once
#include "qarray.hpp"
#include <optional>
#include <vector>

namespace qtk {

Qarray eye(Index n, bool sparse = false);

DenseMatrix kron_dense(const DenseMatrix& a, const DenseMatrix& b);
SparseMatrix kron_sparse(const SparseMatrix& a, const SparseMatrix& b);

// Left fold of Kronecker products. The result is sparse when any
// operand is sparse; kron() is the 1x1 identity.
Qarray kron();
Qarray kron(const Qarray& a);
Qarray kron(const Qarray& a, const Qarray& b);
Qarray kron(const std::vector<Qarray>& ops);

template <typename... Ts>
Qarray kron(const Qarray& a, const Qarray& b, const Qarray& c, const Ts&... rest) {
  return kron(kron(a, b), c, rest...);
}

// n copies of a composed together.
Qarray kronpow(const Qarray& a, unsigned n);

// Tensor ops into the subsystems named by inds and identities
// everywhere else, in the order of dims.
//   - a single op is repeated over inds;
//   - an op whose size is the product of several consecutive entries
//     of inds spans those subsystems, which must be adjacent and
//     ascending in dims;
//   - inds may be unordered, ops are matched to them in order;
//   - one negative entry of dims is inferred from the op covering it;
//   - sparse forces the output representation, otherwise the output
//     is sparse iff any op is.
Qarray eyepad(const std::vector<Qarray>& ops, const Dims& dims, const Inds& inds,
              std::optional<bool> sparse = std::nullopt);
Qarray eyepad(const Qarray& op, const Dims& dims, const Inds& inds,
              std::optional<bool> sparse = std::nullopt);
Qarray eyepad(const Qarray& op, const Dims& dims, std::size_t ind,
              std::optional<bool> sparse = std::nullopt);

} // namespace qtk
