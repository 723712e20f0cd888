// SPDX-License-Identifier: MIT

#include "qtk/gen.hpp"
#include "qtk/errors.hpp"
#include <cmath>

namespace qtk {

Qarray basis_vec(Index i, Index d, QType qtype, bool sparse){
  if (d < 1) throw ShapeError("basis_vec: dimension must be positive");
  if (i < 0 || i >= d) throw IndexError("basis_vec: index " + std::to_string(i) + " out of range for dimension " + std::to_string(d));
  DenseMatrix k = DenseMatrix::Zero(d, 1);
  k(i, 0) = {1.0, 0.0};
  return quijify(Qarray(std::move(k)), qtype, sparse);
}

Qarray pauli(const std::string& label, bool sparse){
  DenseMatrix m(2, 2);
  if (label=="I" || label=="i"){
    m << c64{1,0}, c64{0,0}, c64{0,0}, c64{1,0};
  } else if (label=="X" || label=="x"){
    m << c64{0,0}, c64{1,0}, c64{1,0}, c64{0,0};
  } else if (label=="Y" || label=="y"){
    m << c64{0,0}, c64{0,-1}, c64{0,1}, c64{0,0};
  } else if (label=="Z" || label=="z"){
    m << c64{1,0}, c64{0,0}, c64{0,0}, c64{-1,0};
  } else {
    throw KindError("Unknown Pauli label '" + label + "'");
  }
  return Qarray(std::move(m)).as(sparse);
}

Qarray bell_state(const std::string& label, QType qtype, bool sparse){
  const real_t s = real_t(1.0/std::sqrt(2.0));
  vec_c64 amp(4, c64{0,0});
  if (label=="phi+"){ amp[0] = s; amp[3] = s; }
  else if (label=="phi-"){ amp[0] = s; amp[3] = -s; }
  else if (label=="psi+"){ amp[1] = s; amp[2] = s; }
  else if (label=="psi-"){ amp[1] = s; amp[2] = -s; }
  else throw KindError("Unknown Bell state '" + label + "'");
  return quijify(amp, qtype, sparse);
}

} // namespace qtk
