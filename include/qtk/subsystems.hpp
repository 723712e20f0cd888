// SPDX-License-Identifier: MIT

#pragma once
#include "qarray.hpp"
#include <vector>

namespace qtk {

// Resolve the (single) negative entry of dims so that the product is
// total. Throws ShapeError on zero entries, several wildcards, or a
// product that cannot match.
Dims infer_dims(const Dims& dims, Index total);

// Checks that every index is below n and appears once, and returns them
// sorted. Throws IndexError otherwise or when inds is empty.
Inds checked_indices(const Inds& inds, std::size_t n, const char* who);

// For every flat index of the space described by dims: its index within
// the subsystems in kept and within the remaining ones, both row-major
// in the order of dims. kept must be sorted.
struct SplitIndex {
  std::vector<Index> kept, rest;
  Index kept_dim = 1, rest_dim = 1;
};
SplitIndex split_index(const Dims& dims, const Inds& kept);

// Number of base-sized subsystems making up a ket, bra or operator.
std::size_t infer_size(const Qarray& a, unsigned base = 2);

// Reorder the tensor factors of a ket, bra or operator: subsystem
// perm[i] of the input becomes subsystem i of the output.
Qarray permute_subsystems(const Qarray& a, const Dims& dims, const Inds& perm);

// diag(d) * m and m * diag(d) without forming the diagonal matrix.
Qarray ldmul(const DenseVector& diag, const Qarray& m);
Qarray rdmul(const Qarray& m, const DenseVector& diag);

} // namespace qtk
