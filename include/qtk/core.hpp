// SPDX-License-Identifier: MIT

#pragma once
#include "qarray.hpp"
#include <optional>
#include <string>
#include <utility>

namespace qtk {

enum class QType { Ket, Bra, Dop };

// Accepts k/ket, b/bra and r/p/d/rho/op/dop. Throws KindError otherwise.
QType parse_qtype(const std::string& tag);
const char* qtype_name(QType t);

struct QuijifyOptions {
  std::optional<QType> qtype;  // keep the input shape when unset
  bool sparse = false;         // force CSR output; sparse input stays sparse
  bool normalized = false;     // 2-norm for vectors, trace for operators
  bool chopped = false;        // zero entries below tol before normalizing
  real_t tol = kChopTol;
};

// Build a state from raw data.
//   Flat sequences are amplitudes: a row when no qtype is requested, a
//   ket otherwise (so Bra conjugates them and Dop forms |v><v|).
//   Nested sequences are matrix rows.
//   Matrices keep their orientation: Ket reshapes row-major into a
//   column, Bra is the adjoint of that column (a row input is
//   conjugated), Dop keeps square input and forms |v><v| from vectors.
Qarray quijify(const Qarray& data, const QuijifyOptions& opts = {});
Qarray quijify(const vec_c64& data, const QuijifyOptions& opts = {});
Qarray quijify(const rows_c64& data, const QuijifyOptions& opts = {});
Qarray quijify(const Qarray& data, QType qtype, bool sparse = false);
Qarray quijify(const vec_c64& data, QType qtype, bool sparse = false);
Qarray quijify(const rows_c64& data, QType qtype, bool sparse = false);

template <typename T, typename... Rest>
Qarray qjf(const T& data, Rest&&... rest) { return quijify(data, std::forward<Rest>(rest)...); }

bool isket(const Qarray& a);
bool isbra(const Qarray& a);
bool isop(const Qarray& a);
// a == a^H within tol; sparse input is compared without densifying.
bool isherm(const Qarray& a, real_t tol = kHermTol);

c64 trace(const DenseMatrix& a);
c64 sparse_trace(const SparseMatrix& a);
c64 tr(const Qarray& a);

Qarray nmlz(const Qarray& a);
void nmlz_inplace(Qarray& a);

enum class ChopMode {
  Components, // real and imaginary parts chopped independently
  Magnitude   // whole entry zeroed when |z| < tol
};

Qarray chop(const Qarray& a, real_t tol = kChopTol, ChopMode mode = ChopMode::Components);
void chop_inplace(Qarray& a, real_t tol = kChopTol, ChopMode mode = ChopMode::Components);

// <a|b>; either argument may be a ket or a bra of the same dimension.
c64 inner(const Qarray& a, const Qarray& b);
// <psi|op|psi> for a ket/bra, tr(op rho) for a density operator.
c64 expec(const Qarray& op, const Qarray& state);

} // namespace qtk
