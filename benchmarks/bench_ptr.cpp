// SPDX-License-Identifier: MIT

#include "qtk/qtk.hpp"
#include <chrono>
#include <iostream>

using namespace qtk;

int main(){
  int n=12;
  Rng rng(42);
  Dims dims(std::size_t(n), 2);
  Qarray psi = rand_ket(Index(1) << n, rng);
  Qarray rho = rand_rho(Index(1) << 8, rng);
  Dims dims8(8, 2);
  auto t0 = std::chrono::steady_clock::now();
  Qarray a = ptr(psi, dims, Inds{0, 3, 7}); (void)a;
  auto t1 = std::chrono::steady_clock::now();
  Qarray b = ptr(rho, dims8, Inds{1, 2}); (void)b;
  auto t2 = std::chrono::steady_clock::now();
  Qarray c = ptr(rho.as(true), dims8, Inds{1, 2}); (void)c;
  auto t3 = std::chrono::steady_clock::now();
  Qarray d = eyepad(pauli("Z", true), dims, Inds{0, std::size_t(n-1)}); (void)d;
  auto t4 = std::chrono::steady_clock::now();
  std::chrono::duration<double> dk = t1 - t0, dd = t2 - t1, ds = t3 - t2, de = t4 - t3;
  std::cout << "ptr(ket, 12 qubits) seconds: " << dk.count() << "\n";
  std::cout << "ptr(dense dop, 8 qubits) seconds: " << dd.count() << "\n";
  std::cout << "ptr(sparse dop, 8 qubits) seconds: " << ds.count() << "\n";
  std::cout << "eyepad(sparse, 12 qubits) seconds: " << de.count() << "\n";
  return 0;
}
