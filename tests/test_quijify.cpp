// SPDX-License-Identifier: MIT

#include "test_util.hpp"

using namespace qtk;

static void vector_create(){
  vec_c64 x{1, 2, c64(0,3)};
  Qarray p = quijify(x, QType::Ket);
  CHECK(!p.is_sparse());
  CHECK(p.rows()==3 && p.cols()==1);
  p = quijify(x, QType::Bra);
  CHECK(p.rows()==1 && p.cols()==3);
  CHECK_NEAR(p.coeff(0,2), c64(0,-3), 1e-15);
  // no qtype: a row, unchanged
  p = quijify(x);
  CHECK(isbra(p));
  CHECK_NEAR(p.coeff(0,2), c64(0,3), 1e-15);
  // the same data as a nested row makes the same bra
  Qarray nested = quijify(rows_c64{vec_c64{1, 2, c64(0,3)}}, QType::Bra);
  CHECK(isbra(nested));
  CHECK_NEAR(nested.coeff(0,2), c64(0,-3), 1e-15);
  CHECK_ALLCLOSE(nested, quijify(x, QType::Bra));
  // a bra asked to be a bra again conjugates back to the raw row
  CHECK_ALLCLOSE(quijify(nested.as(true), QType::Bra), quijify(x));
}

static void dop_create(){
  Rng rng(3);
  Qarray x = rand_matrix(3, rng);
  Qarray p = quijify(x, QType::Dop);
  CHECK(p.rows()==3 && p.cols()==3);
  CHECK_ALLCLOSE(p, x);
}

static void vector_to_dop(){
  Qarray p = quijify(vec_c64{1, 2, c64(0,3)}, QType::Dop);
  CHECK_ALLCLOSE(p, mat({{1, 2, c64(0,-3)},
                         {2, 4, c64(0,-6)},
                         {c64(0,3), c64(0,6), 9}}));
}

static void chopped(){
  vec_c64 x{9e-16, 1};
  QuijifyOptions o; o.qtype = QType::Ket;
  Qarray p = quijify(x, o);
  CHECK(p.coeff(0,0) != c64(0));
  o.chopped = true;
  p = quijify(x, o);
  CHECK(p.coeff(0,0) == c64(0));
}

static void normalized(){
  vec_c64 x{c64(0,3), c64(0,4)};
  QuijifyOptions o; o.qtype = QType::Ket;
  Qarray p = quijify(x, o);
  CHECK_NEAR(tr(matmul(p.adjoint(), p)), c64(25), 1e-12);
  o.normalized = true;
  p = quijify(x, o);
  CHECK_NEAR(tr(matmul(p.adjoint(), p)), c64(1), 1e-12);
  o.qtype = QType::Dop;
  p = quijify(x, o);
  CHECK_NEAR(tr(p), c64(1), 1e-12);
}

static void sparse_create(){
  rows_c64 x{vec_c64{1, 0}, vec_c64{3, 0}};
  Qarray p = quijify(x, QType::Dop, false);
  CHECK(!p.is_sparse());
  p = quijify(x, QType::Dop, true);
  CHECK(p.is_sparse());
  CHECK(p.nnz()==2);
}

static void sparse_convert_to_dop(){
  vec_c64 x{1, 0, 9e-16, 0, c64(0,3)};
  Qarray p = quijify(x, QType::Ket, true);
  Qarray q = quijify(p, QType::Dop, true);
  CHECK(q.rows()==5 && q.cols()==5);
  CHECK(q.nnz()==9);
  CHECK_NEAR(q.coeff(4,4), c64(9), 1e-12);
  QuijifyOptions o; o.qtype = QType::Dop; o.sparse = true; o.normalized = true;
  q = quijify(p, o);
  CHECK_NEAR(tr(q), c64(1), 1e-12);
  // sparse input stays sparse without asking
  CHECK(quijify(p, QType::Bra).is_sparse());
}

static void shapes(){
  CHECK(isket(quijify(rows_c64{vec_c64{1}, vec_c64{0}})));
  Qarray b = qjf(rows_c64{vec_c64{1, 0}});
  CHECK(!isket(b) && isbra(b) && !isop(b));
  Qarray o = mat({{1, 0}, {0, 1}});
  CHECK(!isket(o) && !isbra(o) && isop(o));
  // row-major reshape of a matrix into a ket
  Qarray k = quijify(mat({{1, 2}, {3, 4}}), QType::Ket);
  CHECK(k.rows()==4 && k.cols()==1);
  CHECK_NEAR(k.coeff(1,0), c64(2), 1e-15);
}

static void hermitian(){
  Qarray a = mat({{1, c64(2,3)}, {c64(2,-3), 1}});
  Qarray b = mat({{1, c64(2,-3)}, {c64(2,-3), 1}});
  CHECK(isherm(a));
  CHECK(!isherm(b));
  CHECK(isherm(a.as(true)));
  CHECK(!isherm(b.as(true)));
  CHECK(!isherm(mat({{1, 2}})));
}

static void errors(){
  CHECK_THROWS(quijify(vec_c64{}), ShapeError);
  CHECK_THROWS(quijify(rows_c64{vec_c64{1, 2}, vec_c64{3}}), ShapeError);
  CHECK_THROWS(parse_qtype("matrix"), KindError);
  CHECK(parse_qtype("r")==QType::Dop);
  CHECK(parse_qtype("b")==QType::Bra);
  CHECK(std::string(qtype_name(QType::Ket))=="ket");
}

int main(){
  vector_create();
  dop_create();
  vector_to_dop();
  chopped();
  normalized();
  sparse_create();
  sparse_convert_to_dop();
  shapes();
  hermitian();
  errors();
  return report();
}
