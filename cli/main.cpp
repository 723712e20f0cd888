// SPDX-License-Identifier: MIT

#include "qtk/qtk.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <chrono>
#include <string>
#include <vector>

using namespace qtk;

#ifndef QTK_VERSION
#define QTK_VERSION "unknown"
#endif

static std::vector<std::string> split_str(const std::string& s, char sep){
  std::vector<std::string> out; size_t p=0;
  while (p<=s.size()){
    size_t q = s.find(sep, p);
    if (q==std::string::npos){ out.push_back(s.substr(p)); break; }
    out.push_back(s.substr(p, q-p)); p = q+1;
  }
  return out;
}

static bool parse_list(const std::string& s, std::vector<long>& out){
  out.clear();
  for (const auto& tok : split_str(s, ',')){
    try {
      std::size_t pos=0;
      long v = std::stol(tok, &pos, 10);
      if (pos != tok.size()) return false;
      out.push_back(v);
    } catch (const std::exception&) { return false; }
  }
  return !out.empty();
}

static bool parse_inds(const std::string& s, Inds& out){
  std::vector<long> v;
  if (!parse_list(s, v)) return false;
  out.clear();
  for (long x : v){ if (x < 0) return false; out.push_back(std::size_t(x)); }
  return true;
}

static std::string fmt_c64(c64 z, int prec){
  std::ostringstream os; os << std::setprecision(prec);
  os << z.real() << (z.imag() < 0 ? "-" : "+") << std::abs(z.imag()) << "j";
  return os.str();
}

static void print_matrix(const Qarray& q, int prec){
  DenseMatrix m = q.to_dense();
  for (Index i=0;i<m.rows();++i){
    std::cout << "[";
    for (Index j=0;j<m.cols();++j){ std::cout << fmt_c64(m(i,j), prec); if (j+1<m.cols()) std::cout << ", "; }
    std::cout << "]\n";
  }
}

static void usage() {
  std::cout << "qtk [--version|--build-info] <command> [--config file.cfg]\n"
               "  bell --label phi+|phi-|psi+|psi- [--keep i,j]\n"
               "  pad --pauli I|X|Y|Z --dims d0,d1,... --inds i,j [--sparse]\n"
               "  bench [--n N] [--reps R]\n";
}

int main(int argc, char** argv) {
  if (argc < 2) { usage(); return 1; }
  std::string cmd = argv[1];
  if (cmd == "--version") { std::cout << QTK_VERSION << "\n"; return 0; }
  if (cmd == "--build-info") {
    std::cout << "version=" << QTK_VERSION << "\n";
#ifdef QTK_OPENMP
    std::cout << "openmp=on\n";
#else
    std::cout << "openmp=off\n";
#endif
    std::cout << "eigen=" << EIGEN_WORLD_VERSION << "." << EIGEN_MAJOR_VERSION << "." << EIGEN_MINOR_VERSION << "\n";
    std::cout << "scalar=" << (sizeof(real_t)==sizeof(float) ? "complex<float>" : "complex<double>") << "\n";
    return 0;
  }
  if (cmd == "--help" || cmd == "-h") { usage(); return 0; }

  std::string label="phi+", pauli_label="X", keep_s="0", dims_s="2,2,2", inds_s="1", config_path;
  bool sparse=false; int n=8; int reps=3;
  for (int i=2;i<argc;i++){
    std::string a=argv[i];
    auto nx=[&](const char* name){ if(i+1>=argc){ std::cerr<<"Missing value for "<<name<<"\n"; return std::string(); } return std::string(argv[++i]); };
    if (a=="--label") label=nx("--label");
    else if (a=="--keep") keep_s=nx("--keep");
    else if (a=="--pauli") pauli_label=nx("--pauli");
    else if (a=="--dims") dims_s=nx("--dims");
    else if (a=="--inds") inds_s=nx("--inds");
    else if (a=="--sparse") sparse=true;
    else if (a=="--config") config_path=nx("--config");
    else if (a=="--n" || a=="--reps"){
      std::string v = nx(a.c_str());
      try { (a=="--n" ? n : reps) = std::stoi(v); } catch (const std::exception&) { std::cerr<<"Invalid "<<a<<": "<<v<<"\n"; return 2; }
    }
    else { std::cerr<<"Unknown arg: "<<a<<"\n"; return 2; }
  }

  Settings settings;
  if (!config_path.empty()){
    std::string err;
    auto s = load_settings(config_path, err);
    if (!s){ std::cerr<<err<<"\n"; return 3; }
    settings = *s;
  }

  try {
    if (cmd == "bell") {
      Inds keep;
      if (!parse_inds(keep_s, keep)) { std::cerr<<"Invalid --keep list: "<<keep_s<<"\n"; return 2; }
      Qarray rho = ptr(bell_state(label, QType::Dop), {2, 2}, keep);
      chop_inplace(rho, settings.chop_tol);
      print_matrix(rho, settings.print_precision);
      std::cout << "hermitian=" << (isherm(rho, settings.herm_tol) ? "yes" : "no") << "\n";
      return 0;
    }
    if (cmd == "pad") {
      Dims dims; Inds inds;
      if (!parse_list(dims_s, dims)) { std::cerr<<"Invalid --dims list: "<<dims_s<<"\n"; return 2; }
      if (!parse_inds(inds_s, inds)) { std::cerr<<"Invalid --inds list: "<<inds_s<<"\n"; return 2; }
      Qarray op = eyepad(pauli(pauli_label), dims, inds, sparse);
      if (op.is_sparse()) std::cout << "nnz=" << op.nnz() << "\n";
      print_matrix(op, settings.print_precision);
      return 0;
    }
    if (cmd == "bench") {
      if (n < 2 || n > 14) { std::cerr<<"--n must be between 2 and 14\n"; return 2; }
      if (reps < 1) { std::cerr<<"--reps must be positive\n"; return 2; }
      Rng rng(42);
      Dims dims(std::size_t(n), 2);
      Qarray x = pauli("X", true);
      Qarray psi = rand_ket(Index(1) << n, rng);
      Qarray rho = quijify(psi, QType::Dop);
      auto time_it = [&](const char* what, auto&& fn){
        auto t0 = std::chrono::steady_clock::now();
        for (int r=0;r<reps;++r) fn();
        auto t1 = std::chrono::steady_clock::now();
        std::chrono::duration<double> dt = t1 - t0;
        std::cout << what << ": " << dt.count()/reps << " s\n";
      };
      time_it("kronpow", [&]{ auto k = kronpow(x, unsigned(n)); (void)k; });
      time_it("eyepad", [&]{ auto k = eyepad(x, dims, Inds{0, std::size_t(n-1)}); (void)k; });
      time_it("ptr(ket)", [&]{ auto k = ptr(psi, dims, Inds{0, 1}); (void)k; });
      time_it("ptr(dop)", [&]{ auto k = ptr(rho, dims, Inds{0, 1}); (void)k; });
      return 0;
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 3;
  }
  std::cerr << "Unknown command: " << cmd << "\n";
  usage();
  return 2;
}
