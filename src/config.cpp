// SPDX-License-Identifier: MIT

#include "qtk/config.hpp"
#include <fstream>
#include <algorithm>
#include <cctype>

namespace qtk {

static std::string trim(const std::string& s){
  auto notspace = [](unsigned char ch){ return !std::isspace(ch); };
  auto l = std::find_if(s.begin(), s.end(), notspace);
  auto r = std::find_if(s.rbegin(), s.rend(), notspace).base();
  return l < r ? std::string(l, r) : std::string();
}

bool load_config_kv(const std::string& path, std::map<std::string,std::string>& kv){
  std::ifstream in(path);
  if (!in) return false;
  std::string line;
  while (std::getline(in, line)){
    line = trim(line);
    if (line.empty() || line[0]=='#') continue;
    auto p = line.find('=');
    if (p == std::string::npos) continue;
    kv[trim(line.substr(0, p))] = trim(line.substr(p+1));
  }
  return true;
}

static bool parse_positive(const std::string& s, double& out){
  try {
    std::size_t pos = 0;
    double v = std::stod(s, &pos);
    if (pos != s.size() || !(v > 0.0)) return false;
    out = v;
    return true;
  } catch (const std::exception&) { return false; }
}

std::optional<Settings> load_settings(const std::string& path, std::string& err){
  std::map<std::string,std::string> kv;
  if (!load_config_kv(path, kv)) { err = "Cannot open config file: " + path; return std::nullopt; }
  Settings s;
  for (const auto& [key, value] : kv){
    double v = 0.0;
    if (!parse_positive(value, v)) { err = "Invalid value for '" + key + "': " + value; return std::nullopt; }
    if (key == "chop_tol") s.chop_tol = real_t(v);
    else if (key == "herm_tol") s.herm_tol = real_t(v);
    else if (key == "print_precision") s.print_precision = int(v);
    else { err = "Unknown config key '" + key + "'"; return std::nullopt; }
  }
  return s;
}

} // namespace qtk
