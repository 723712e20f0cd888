// SPDX-License-Identifier: MIT

#pragma once
#include "qarray.hpp"

namespace qtk {

// Reduced density operator of a ket, bra or operator on the subsystems
// in keep, which come out in the order of dims whatever order they are
// given in. dims may hold one wildcard, inferred from the state size.
// The result is always dense.
Qarray ptr(const Qarray& state, const Dims& dims, const Inds& keep);
Qarray ptr(const Qarray& state, const Dims& dims, std::size_t keep);

} // namespace qtk
