// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include <map>
#include <optional>
#include <string>

namespace qtk {

struct Settings {
  real_t chop_tol = kChopTol;
  real_t herm_tol = kHermTol;
  int print_precision = 6;
};

// Reads key=value lines; blank lines and lines starting with '#' are
// skipped. Returns false when the file cannot be opened.
bool load_config_kv(const std::string& path, std::map<std::string,std::string>& kv);

// Settings from a key=value file. Keys: chop_tol, herm_tol,
// print_precision. Unknown keys and malformed values are errors.
std::optional<Settings> load_settings(const std::string& path, std::string& err);

} // namespace qtk
