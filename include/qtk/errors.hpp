// SPDX-License-Identifier: MIT

#pragma once
#include <stdexcept>
#include <string>

namespace qtk {

// Dimension list disagrees with a matrix shape, or a shape is unusable.
struct ShapeError : std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

// Unknown representation tag or state label.
struct KindError : std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

// Subsystem index out of range, duplicated, or an empty selection.
struct IndexError : std::out_of_range {
  using std::out_of_range::out_of_range;
};

// Numerically degenerate input, e.g. normalizing a zero vector.
struct ValueError : std::domain_error {
  using std::domain_error::domain_error;
};

} // namespace qtk
