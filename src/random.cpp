// SPDX-License-Identifier: MIT

#include "qtk/random.hpp"
#include "qtk/core.hpp"
#include "qtk/errors.hpp"

namespace qtk {

static DenseMatrix gaussian(Index rows, Index cols, Rng& rng){
  if (rows < 1 || cols < 1) throw ShapeError("random state: dimension must be positive");
  DenseMatrix m(rows, cols);
  for (Index j=0;j<cols;++j)
    for (Index i=0;i<rows;++i) m(i,j) = c64(real_t(rng.normal()), real_t(rng.normal()));
  return m;
}

Qarray rand_matrix(Index d, Rng& rng, bool sparse){
  return Qarray(gaussian(d, d, rng)).as(sparse);
}

Qarray rand_herm(Index d, Rng& rng, bool sparse){
  DenseMatrix m = gaussian(d, d, rng);
  DenseMatrix h = (m + m.adjoint()) / real_t(2);
  return Qarray(std::move(h)).as(sparse);
}

Qarray rand_ket(Index d, Rng& rng, bool sparse){
  Qarray k(gaussian(d, 1, rng));
  nmlz_inplace(k);
  return k.as(sparse);
}

Qarray rand_rho(Index d, Rng& rng, bool sparse){
  DenseMatrix m = gaussian(d, d, rng);
  Qarray rho(DenseMatrix(m * m.adjoint()));
  nmlz_inplace(rho);
  return rho.as(sparse);
}

} // namespace qtk
