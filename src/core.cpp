// SPDX-License-Identifier: MIT

#include "qtk/core.hpp"
#include "qtk/errors.hpp"
#include <cmath>
#include <vector>
#ifdef QTK_OPENMP
#include <omp.h>
#endif

namespace qtk {

QType parse_qtype(const std::string& tag){
  if (tag=="k" || tag=="ket") return QType::Ket;
  if (tag=="b" || tag=="bra") return QType::Bra;
  if (tag=="r" || tag=="p" || tag=="d" || tag=="rho" || tag=="op" || tag=="dop") return QType::Dop;
  throw KindError("Unknown qtype '" + tag + "'");
}

const char* qtype_name(QType t){
  switch(t){
    case QType::Ket: return "ket";
    case QType::Bra: return "bra";
    case QType::Dop: return "dop";
  }
  return "unknown";
}

// Row-major reshape into (n*m, 1).
static Qarray flatten_to_ket(const Qarray& a){
  const Index r = a.rows(), c = a.cols();
  if (c == 1) return a;
  if (a.is_sparse()){
    std::vector<Eigen::Triplet<c64>> trips;
    trips.reserve(std::size_t(a.sparse().nonZeros()));
    for (Index k=0;k<a.sparse().outerSize();++k)
      for (SparseMatrix::InnerIterator it(a.sparse(),k); it; ++it)
        trips.emplace_back(it.row()*c + it.col(), 0, it.value());
    SparseMatrix out(r*c, 1);
    out.setFromTriplets(trips.begin(), trips.end());
    return Qarray(std::move(out));
  }
  DenseMatrix out(r*c, 1);
  for (Index i=0;i<r;++i)
    for (Index j=0;j<c;++j) out(i*c+j, 0) = a.dense()(i,j);
  return Qarray(std::move(out));
}

static Qarray outer(const Qarray& ket){
  if (ket.is_sparse()){
    SparseMatrix rho = ket.sparse() * SparseMatrix(ket.sparse().adjoint());
    rho.makeCompressed();
    return Qarray(std::move(rho));
  }
  return Qarray(DenseMatrix(ket.dense() * ket.dense().adjoint()));
}

Qarray quijify(const Qarray& data, const QuijifyOptions& opts){
  if (data.size() == 0) throw ShapeError("quijify: empty data");
  const bool sparse_in = data.is_sparse();
  Qarray q = data;
  if (opts.qtype){
    switch(*opts.qtype){
      case QType::Ket: q = flatten_to_ket(q); break;
      case QType::Bra: q = flatten_to_ket(q).adjoint(); break;
      case QType::Dop: if (!isop(q)) q = outer(flatten_to_ket(q)); break;
    }
  }
  if (opts.chopped) chop_inplace(q, opts.tol);
  if (opts.normalized) nmlz_inplace(q);
  return q.as(opts.sparse || sparse_in);
}

Qarray quijify(const vec_c64& data, const QuijifyOptions& opts){
  const Index n = Index(data.size());
  if (n == 0) throw ShapeError("quijify: empty data");
  // Amplitudes form a ket once a qtype is requested, a row otherwise.
  DenseMatrix m = opts.qtype ? DenseMatrix(n, 1) : DenseMatrix(1, n);
  for (Index i=0;i<n;++i) m(i) = data[std::size_t(i)];
  return quijify(Qarray(std::move(m)), opts);
}

Qarray quijify(const rows_c64& data, const QuijifyOptions& opts){
  if (data.empty() || data[0].empty()) throw ShapeError("quijify: empty data");
  const Index r = Index(data.size()), c = Index(data[0].size());
  DenseMatrix m(r, c);
  for (Index i=0;i<r;++i){
    const auto& row = data[std::size_t(i)];
    if (Index(row.size()) != c)
      throw ShapeError("quijify: ragged rows (row " + std::to_string(i) + " has " + std::to_string(row.size()) +
                       " entries, expected " + std::to_string(c) + ")");
    for (Index j=0;j<c;++j) m(i,j) = row[std::size_t(j)];
  }
  return quijify(Qarray(std::move(m)), opts);
}

Qarray quijify(const Qarray& data, QType qtype, bool sparse){
  QuijifyOptions o; o.qtype = qtype; o.sparse = sparse;
  return quijify(data, o);
}
Qarray quijify(const vec_c64& data, QType qtype, bool sparse){
  QuijifyOptions o; o.qtype = qtype; o.sparse = sparse;
  return quijify(data, o);
}
Qarray quijify(const rows_c64& data, QType qtype, bool sparse){
  QuijifyOptions o; o.qtype = qtype; o.sparse = sparse;
  return quijify(data, o);
}

bool isket(const Qarray& a){ return a.cols() == 1 && a.rows() >= 1; }
bool isbra(const Qarray& a){ return a.rows() == 1 && a.cols() >= 1; }
bool isop(const Qarray& a){ return a.rows() == a.cols() && a.rows() >= 1; }

bool isherm(const Qarray& a, real_t tol){
  if (!isop(a)) return false;
  if (a.is_sparse()){
    SparseMatrix d = a.sparse() - SparseMatrix(a.sparse().adjoint());
    for (Index k=0;k<d.outerSize();++k)
      for (SparseMatrix::InnerIterator it(d,k); it; ++it)
        if (std::abs(it.value()) > tol) return false;
    return true;
  }
  const auto& m = a.dense();
  for (Index j=0;j<m.cols();++j)
    for (Index i=0;i<=j;++i)
      if (std::abs(m(i,j) - std::conj(m(j,i))) > tol) return false;
  return true;
}

c64 trace(const DenseMatrix& a){
  if (a.rows() != a.cols()) throw ShapeError("trace: matrix is not square");
  return a.trace();
}

c64 sparse_trace(const SparseMatrix& a){
  if (a.rows() != a.cols()) throw ShapeError("trace: matrix is not square");
  c64 t{0,0};
  for (Index k=0;k<a.outerSize();++k)
    for (SparseMatrix::InnerIterator it(a,k); it; ++it)
      if (it.row() == it.col()) t += it.value();
  return t;
}

c64 tr(const Qarray& a){
  return a.is_sparse() ? sparse_trace(a.sparse()) : trace(a.dense());
}

void nmlz_inplace(Qarray& a){
  if (isket(a) || isbra(a)){
    real_t n = a.visit([](const auto& m){ return real_t(m.norm()); });
    if (n == real_t(0)) throw ValueError("nmlz: zero vector");
    a /= c64(n);
  } else if (isop(a)){
    c64 t = tr(a);
    if (t == c64(0)) throw ValueError("nmlz: zero trace");
    a /= t;
  } else {
    throw ShapeError("nmlz: expected a ket, bra or square operator");
  }
}

Qarray nmlz(const Qarray& a){
  Qarray r = a;
  nmlz_inplace(r);
  return r;
}

static inline c64 chop_value(c64 z, real_t tol, ChopMode mode){
  if (mode == ChopMode::Magnitude) return std::abs(z) < tol ? c64(0) : z;
  real_t re = std::real(z), im = std::imag(z);
  if (std::abs(re) < tol) re = 0;
  if (std::abs(im) < tol) im = 0;
  return {re, im};
}

void chop_inplace(Qarray& a, real_t tol, ChopMode mode){
  if (a.is_sparse()){
    SparseMatrix& s = a.sparse();
    for (Index k=0;k<s.outerSize();++k)
      for (SparseMatrix::InnerIterator it(s,k); it; ++it)
        it.valueRef() = chop_value(it.value(), tol, mode);
    s.prune([](const Index&, const Index&, const c64& v){ return v != c64(0); });
    s.makeCompressed();
    return;
  }
  DenseMatrix& d = a.dense();
  c64* p = d.data();
  const Index n = d.size();
#ifdef QTK_OPENMP
#pragma omp parallel for schedule(static)
#endif
  for (Index i=0;i<n;++i) p[i] = chop_value(p[i], tol, mode);
}

Qarray chop(const Qarray& a, real_t tol, ChopMode mode){
  Qarray r = a;
  chop_inplace(r, tol, mode);
  return r;
}

static Qarray as_bra(const Qarray& v){
  if (isbra(v)) return v;
  if (isket(v)) return v.adjoint();
  throw ShapeError("expected a ket or bra");
}

static Qarray as_ket(const Qarray& v){
  if (isket(v)) return v;
  if (isbra(v)) return v.adjoint();
  throw ShapeError("expected a ket or bra");
}

c64 inner(const Qarray& a, const Qarray& b){
  Qarray r = matmul(as_bra(a), as_ket(b));
  return r.coeff(0, 0);
}

c64 expec(const Qarray& op, const Qarray& state){
  if (!isop(op)) throw ShapeError("expec: operator is not square");
  if (isop(state)) return tr(matmul(op, state));
  Qarray ket = as_ket(state);
  return inner(ket, matmul(op, ket));
}

} // namespace qtk
