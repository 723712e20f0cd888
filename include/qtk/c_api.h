// SPDX-License-Identifier: MIT

#pragma once
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Status codes shared by every entry point.
#define QTK_OK 0
#define QTK_ERR_ARGS 2
#define QTK_ERR_SHAPE 3
#define QTK_ERR_INDEX 4
#define QTK_ERR_OTHER 5

// Partial trace of a ket (rows x 1), bra (1 x cols) or operator given as
// a row-major buffer of interleaved (re, im) doubles. dims may contain
// one negative wildcard. On success *out holds the reduced operator
// (*out_dim x *out_dim, same layout) and must be freed with qtk_free().
int qtk_ptr(const double* state, size_t rows, size_t cols,
            const long* dims, size_t ndims,
            const size_t* keep, size_t nkeep,
            double** out, size_t* out_dim);

// Frees buffers allocated by the library.
void qtk_free(double* p);

// Returns the compiled library version string.
const char* qtk_version(void);

#ifdef __cplusplus
}
#endif
