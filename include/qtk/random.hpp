// SPDX-License-Identifier: MIT

#pragma once
#include "qarray.hpp"
#include <random>
#include <cstdint>

namespace qtk {
class Rng {
  std::mt19937_64 gen;
  std::uniform_real_distribution<double> dist;
  std::normal_distribution<double> gauss;
public:
  explicit Rng(uint64_t seed) : gen(seed), dist(0.0, 1.0), gauss(0.0, 1.0) {}
  double uniform() { return dist(gen); }
  double normal() { return gauss(gen); }
};

// Entries with independent standard normal real and imaginary parts.
Qarray rand_matrix(Index d, Rng& rng, bool sparse = false);
Qarray rand_herm(Index d, Rng& rng, bool sparse = false);
// Normalized ket.
Qarray rand_ket(Index d, Rng& rng, bool sparse = false);
// Positive semidefinite, unit trace.
Qarray rand_rho(Index d, Rng& rng, bool sparse = false);
}
