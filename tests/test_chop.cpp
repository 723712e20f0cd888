// SPDX-License-Identifier: MIT

#include "test_util.hpp"

using namespace qtk;

int main(){
  // in place on a ket
  Qarray a = quijify(vec_c64{c64(0.1,0.2), c64(0.2,0.1)}, QType::Ket);
  chop_inplace(a, 0.11);
  CHECK_ALLCLOSE(a, quijify(vec_c64{c64(0,0.2), c64(0.2,0)}, QType::Ket));

  // in place on an operator
  Qarray d = mat({{c64(0.1,0.2), 1}, {c64(0,0.1), 0.05}});
  chop_inplace(d, 0.11);
  CHECK_ALLCLOSE(d, mat({{c64(0,0.2), 1}, {0, 0}}));

  // copy leaves the input alone
  Qarray b = quijify(vec_c64{c64(0.1,0.2), c64(0.2,0.1)}, QType::Ket);
  Qarray c = chop(b, 0.11);
  CHECK_NEAR(b.coeff(0,0), c64(0.1,0.2), 1e-15);
  CHECK_NEAR(c.coeff(0,0), c64(0,0.2), 1e-15);

  // whole entries by magnitude
  Qarray m = chop(b, 0.11, ChopMode::Magnitude);
  CHECK_ALLCLOSE(m, b);
  m = chop(quijify(vec_c64{c64(0.05,0.05), 1}, QType::Ket), 0.11, ChopMode::Magnitude);
  CHECK(m.coeff(0,0) == c64(0));
  CHECK(m.coeff(1,0) == c64(1));

  // magnitude mode: below tol exactly zero, the rest untouched; copy
  // and in-place agree
  Rng rng(13);
  Qarray r = rand_matrix(6, rng) * c64(0.5);
  const real_t tol = 0.4;
  Qarray rc = chop(r, tol, ChopMode::Magnitude);
  Qarray ri = r;
  chop_inplace(ri, tol, ChopMode::Magnitude);
  CHECK_ALLCLOSE(rc, ri);
  for (Index i=0;i<6;++i)
    for (Index j=0;j<6;++j){
      if (std::abs(r.coeff(i,j)) < tol) CHECK(rc.coeff(i,j)==c64(0));
      else CHECK(rc.coeff(i,j)==r.coeff(i,j));
    }

  // sparse storage drops the chopped entries
  Qarray s = quijify(vec_c64{1e-16, 1, 1e-17, c64(0,2)}, QType::Ket, true);
  CHECK(s.nnz()==4);
  chop_inplace(s);
  CHECK(s.is_sparse());
  CHECK(s.nnz()==2);
  CHECK_NEAR(s.coeff(3,0), c64(0,2), 1e-15);

  // default tolerance is tiny
  Qarray t = chop(quijify(vec_c64{1e-14, 1}, QType::Ket));
  CHECK(t.coeff(0,0) != c64(0));
  return report();
}
