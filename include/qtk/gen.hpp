// SPDX-License-Identifier: MIT

#pragma once
#include "core.hpp"
#include <string>

namespace qtk {

// |i> in a d-dimensional space, as a ket, bra or projector.
Qarray basis_vec(Index i, Index d, QType qtype = QType::Ket, bool sparse = false);

// 2x2 Pauli matrix for "I", "X", "Y" or "Z" (either case).
Qarray pauli(const std::string& label, bool sparse = false);

// Maximally entangled two-qubit states "phi+", "phi-", "psi+", "psi-".
Qarray bell_state(const std::string& label, QType qtype = QType::Ket, bool sparse = false);

} // namespace qtk
