// SPDX-License-Identifier: MIT

#include "test_util.hpp"
#include "qtk/c_api.h"
#include <cstring>
#include <vector>

using namespace qtk;

static std::vector<double> interleave(const DenseMatrix& m){
  std::vector<double> buf(std::size_t(2*m.size()));
  for (Index i=0;i<m.rows();++i)
    for (Index j=0;j<m.cols();++j){
      buf[std::size_t(2*(i*m.cols()+j))] = double(m(i,j).real());
      buf[std::size_t(2*(i*m.cols()+j)+1)] = double(m(i,j).imag());
    }
  return buf;
}

int main(){
  Rng rng(31);
  Qarray rho = rand_rho(8, rng);
  std::vector<double> in = interleave(rho.dense());
  const long dims[] = {2, 2, 2};
  const size_t keep[] = {2, 0};
  double* out = nullptr;
  size_t n = 0;
  int rc = qtk_ptr(in.data(), 8, 8, dims, 3, keep, 2, &out, &n);
  CHECK(rc==QTK_OK);
  CHECK(n==4);
  if (rc==QTK_OK){
    DenseMatrix expect = ptr(rho, Dims{2, 2, 2}, Inds{0, 2}).dense();
    for (size_t i=0;i<n;++i)
      for (size_t j=0;j<n;++j){
        c64 got(out[2*(i*n+j)], out[2*(i*n+j)+1]);
        CHECK_NEAR(got, expect(Index(i), Index(j)), 1e-12);
      }
    qtk_free(out);
  }

  // a ket works too
  Qarray psi = bell_state("phi-");
  std::vector<double> kin = interleave(psi.dense());
  const long d2[] = {2, -1};
  const size_t k0[] = {0};
  out = nullptr;
  CHECK(qtk_ptr(kin.data(), 4, 1, d2, 2, k0, 1, &out, &n)==QTK_OK);
  CHECK(n==2);
  if (out){ CHECK_NEAR(out[0], 0.5, 1e-12); qtk_free(out); }

  // error codes
  const long bad_dims[] = {2, 2};
  out = nullptr;
  CHECK(qtk_ptr(in.data(), 8, 8, bad_dims, 2, keep, 1, &out, &n)==QTK_ERR_SHAPE);
  CHECK(out==nullptr);
  const size_t bad_keep[] = {5};
  CHECK(qtk_ptr(in.data(), 8, 8, dims, 3, bad_keep, 1, &out, &n)==QTK_ERR_INDEX);
  CHECK(qtk_ptr(nullptr, 8, 8, dims, 3, keep, 2, &out, &n)==QTK_ERR_ARGS);
  CHECK(qtk_ptr(in.data(), 8, 8, dims, 3, keep, 0, &out, &n)==QTK_ERR_ARGS);

  CHECK(std::strlen(qtk_version()) > 0);
  return report();
}
