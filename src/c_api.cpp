// SPDX-License-Identifier: MIT

#include "qtk/c_api.h"
#include "qtk/partial_trace.hpp"
#include "qtk/errors.hpp"
#include <cstdlib>

extern "C" {

int qtk_ptr(const double* state, size_t rows, size_t cols,
            const long* dims, size_t ndims,
            const size_t* keep, size_t nkeep,
            double** out, size_t* out_dim){
  if (!state || !dims || !keep || !out || !out_dim || rows==0 || cols==0 || ndims==0 || nkeep==0) return QTK_ERR_ARGS;
  try {
    qtk::DenseMatrix m{qtk::Index(rows), qtk::Index(cols)};
    for (size_t i=0;i<rows;++i)
      for (size_t j=0;j<cols;++j){
        const double* z = state + 2*(i*cols + j);
        m(qtk::Index(i), qtk::Index(j)) = qtk::c64(qtk::real_t(z[0]), qtk::real_t(z[1]));
      }
    qtk::Dims d(dims, dims + ndims);
    qtk::Inds k(keep, keep + nkeep);
    qtk::DenseMatrix rho = qtk::ptr(qtk::Qarray(std::move(m)), d, k).dense();
    const size_t n = size_t(rho.rows());
    double* buf = static_cast<double*>(std::malloc(sizeof(double)*2*n*n));
    if (!buf) return QTK_ERR_OTHER;
    for (size_t i=0;i<n;++i)
      for (size_t j=0;j<n;++j){
        auto z = rho(qtk::Index(i), qtk::Index(j));
        buf[2*(i*n + j)] = double(z.real());
        buf[2*(i*n + j) + 1] = double(z.imag());
      }
    *out = buf;
    *out_dim = n;
    return QTK_OK;
  } catch (const qtk::ShapeError&) {
    return QTK_ERR_SHAPE;
  } catch (const qtk::IndexError&) {
    return QTK_ERR_INDEX;
  } catch (const std::exception&) {
    return QTK_ERR_OTHER;
  }
}

void qtk_free(double* p){ if (p) std::free(p); }

const char* qtk_version(void){
#ifdef QTK_VERSION
  return QTK_VERSION;
#else
  return "unknown";
#endif
}

} // extern "C"
