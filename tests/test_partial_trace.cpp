// SPDX-License-Identifier: MIT

#include "test_util.hpp"

using namespace qtk;

static void keep_everything(){
  Qarray a = quijify(vec_c64{0.5, 0.5, 0.5, 0.5}, QType::Ket);
  CHECK_ALLCLOSE(ptr(a, Dims{2, 2}, Inds{0, 1}), matmul(a, a.adjoint()));
  Qarray d = quijify(vec_c64{0.5, 0.5, 0.5, 0.5}, QType::Dop);
  Qarray b = ptr(d, Dims{2, 2}, Inds{1, 0});
  CHECK(!b.is_sparse());
  CHECK_ALLCLOSE(b, d);

  // a bra keeps its ket's density operator
  Qarray bra = quijify(vec_c64{1, c64(0,1), 0, 0}, QType::Bra);
  Qarray ref = mat({{1, c64(0,-1), 0, 0}, {c64(0,1), 1, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});
  CHECK_ALLCLOSE(ptr(bra, Dims{2, 2}, Inds{0, 1}), ref);
  CHECK_ALLCLOSE(ptr(bra.as(true), Dims{2, 2}, Inds{0, 1}), ref);
  Rng rng(17);
  Dims dims{2, 3, 2};
  Qarray psi = rand_ket(12, rng);
  Qarray all = ptr(psi, dims, Inds{0, 1, 2});
  CHECK_ALLCLOSE(ptr(psi.adjoint(), dims, Inds{0, 1, 2}), all);
  CHECK_ALLCLOSE(all, matmul(psi, psi.adjoint()));
  CHECK_ALLCLOSE(ptr(quijify(psi, QType::Dop, true), dims, Inds{2, 0, 1}), all);
}

static void shapes(){
  Rng rng(1);
  Dims dims{2, 3, 4};
  Qarray a = rand_ket(24, rng);
  for (std::size_t i=0;i<dims.size();++i){
    Qarray b = ptr(a, dims, i);
    CHECK(b.rows()==dims[i] && b.cols()==dims[i]);
  }
  const std::size_t pairs[3][2] = {{0,1}, {0,2}, {1,2}};
  for (const auto& p : pairs){
    Qarray b = ptr(a, dims, Inds{p[0], p[1]});
    CHECK(b.cols()==dims[p[0]]*dims[p[1]]);
    CHECK_NEAR(tr(b), c64(1), 1e-12);
    CHECK(isherm(b));
  }
}

static void product_state(){
  Rng rng(2);
  Dims dims{3, 2, 4, 2, 3};
  std::vector<Qarray> ps;
  for (long d : dims) ps.push_back(rand_rho(d, rng));
  Qarray pt = kron(ps);
  for (std::size_t i=0;i<dims.size();++i) CHECK_ALLCLOSE(ptr(pt, dims, i), ps[i]);
  // several kept subsystems come out in the order of dims
  CHECK_ALLCLOSE(ptr(pt, dims, Inds{3, 0}), kron(ps[0], ps[3]));
  // sparse input takes the same route to the same answer
  CHECK_ALLCLOSE(ptr(pt.as(true), dims, Inds{1, 4}), kron(ps[1], ps[4]));
}

static void bell_states(){
  const char* labels[] = {"psi-", "psi+", "phi-", "phi+"};
  for (const char* lab : labels){
    Qarray rho = bell_state(lab, QType::Dop);
    CHECK_ALLCLOSE(ptr(rho, Dims{2, 2}, 0), eye(2) / c64(2));
    CHECK_ALLCLOSE(ptr(bell_state(lab), Dims{2, 2}, 1), eye(2) / c64(2));
  }
}

static void vector_and_operator_agree(){
  Rng rng(9);
  Dims dims{2, 3, 2};
  Qarray psi = rand_ket(12, rng);
  Qarray rho = quijify(psi, QType::Dop);
  for (const Inds& keep : {Inds{0}, Inds{1}, Inds{2}, Inds{0, 2}, Inds{2, 1}}){
    Qarray from_ket = ptr(psi, dims, keep);
    CHECK_ALLCLOSE(from_ket, ptr(rho, dims, keep));
    CHECK_ALLCLOSE(from_ket, ptr(psi.adjoint(), dims, keep));
    CHECK_ALLCLOSE(from_ket, ptr(rho.as(true), dims, keep));
  }
}

static void wildcard_and_errors(){
  Rng rng(4);
  Qarray rho = rand_rho(8, rng);
  CHECK(ptr(rho, Dims{2, -1, 2}, 1).rows()==2);
  CHECK_ALLCLOSE(ptr(rho, Dims{2, -1}, 1), ptr(rho, Dims{2, 4}, 1));
  CHECK_THROWS(ptr(rho, Dims{2, 2}, 0), ShapeError);
  CHECK_THROWS(ptr(rho, Dims{3, -1}, 0), ShapeError);
  CHECK_THROWS(ptr(rho, Dims{2, 2, 2}, 3), IndexError);
  CHECK_THROWS(ptr(rho, Dims{2, 2, 2}, Inds{0, 0}), IndexError);
  CHECK_THROWS(ptr(rho, Dims{2, 2, 2}, Inds{}), IndexError);
  CHECK_THROWS(ptr(mat({{1, 2, 3}, {4, 5, 6}}), Dims{2, 3}, 0), ShapeError);
}

int main(){
  keep_everything();
  shapes();
  product_state();
  bell_states();
  vector_and_operator_agree();
  wildcard_and_errors();
  return report();
}
