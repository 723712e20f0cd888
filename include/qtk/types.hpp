// SPDX-License-Identifier: MIT

#pragma once
#include <complex>
#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>
#include <Eigen/Dense>
#include <Eigen/SparseCore>

namespace qtk {
#ifdef QTK_FP32
  using real_t = float;
#else
  using real_t = double;
#endif
  using c64 = std::complex<real_t>;
  using vec_c64 = std::vector<c64>;
  using rows_c64 = std::vector<vec_c64>;

  using DenseMatrix = Eigen::Matrix<c64, Eigen::Dynamic, Eigen::Dynamic>;
  using SparseMatrix = Eigen::SparseMatrix<c64, Eigen::RowMajor>; // CSR
  using DenseVector = Eigen::Matrix<c64, Eigen::Dynamic, 1>;
  using Index = Eigen::Index;

  // Subsystem dimensions; a single negative entry is a wildcard.
  using Dims = std::vector<long>;
  using Inds = std::vector<std::size_t>;

  constexpr real_t kChopTol = real_t(1e-15);
  constexpr real_t kHermTol = real_t(1e-12);
}
