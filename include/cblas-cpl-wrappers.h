// include/cblas-cpl-wrappers.h

// Copyright 2018 Jian Wu

// See ../../COPYING for clarification regarding multiple authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//  http://www.apache.org/licenses/LICENSE-2.0
//
// THIS CODE IS PROVIDED *AS IS* BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, EITHER EXPRESS OR IMPLIED, INCLUDING WITHOUT LIMITATION ANY IMPLIED
// WARRANTIES OR CONDITIONS OF TITLE, FITNESS FOR A PARTICULAR PURPOSE,
// MERCHANTABLITY OR NON-INFRINGEMENT.
// See the Apache 2 License for the specific language governing permissions and
// limitations under the License.

#ifndef BFTK_CBLAS_CPL_WRAPPERS_H_
#define BFTK_CBLAS_CPL_WRAPPERS_H_

#include "matrix/kaldi-blas.h"
#include "matrix/matrix-common.h"

namespace bftk {

#if defined(HAVE_OPENBLAS)
#define BFTK_COMPLEX_FLOAT lapack_complex_float
#define BFTK_COMPLEX_DOUBLE lapack_complex_double
#elif defined(HAVE_CLAPACK)
#define BFTK_COMPLEX_FLOAT complex
#define BFTK_COMPLEX_DOUBLE doublecomplex
#else
#error \
    "You must add definitions in CMakeLists.txt(-DHAVE_OPENBLAS or -DHAVE_CLAPACK)"
#endif

using kaldi::KaldiBlasInt;
using kaldi::MatrixIndexT;

// kaldi::MatrixTransposeType only carries kNoTrans/kTrans, values follow
// CBLAS_TRANSPOSE so they can be passed to cblas_{c,z}* directly
typedef enum {
  kNoTrans = 111,     // CblasNoTrans
  kTrans = 112,       // CblasTrans
  kConjTrans = 113,   // CblasConjTrans
  kConjNoTrans = 114  // CblasConjNoTrans
} CMatrixTransposeType;

inline void cblas_CZscal(const int N, const void *alpha, float *data,
                         const int inc) {
  cblas_cscal(N, alpha, data, inc);
}

inline void cblas_CZscal(const int N, const void *alpha, double *data,
                         const int inc) {
  cblas_zscal(N, alpha, data, inc);
}

inline void cblas_CZaxpy(const int N, const void *alpha, const float *X,
                         const int incX, float *Y, const int incY) {
  cblas_caxpy(N, alpha, X, incX, Y, incY);
}

inline void cblas_CZaxpy(const int N, const void *alpha, const double *X,
                         const int incX, double *Y, const int incY) {
  cblas_zaxpy(N, alpha, X, incX, Y, incY);
}

inline void cblas_CZdot(const int N, const float *X, const int incX,
                        const float *Y, const int incY, bool conj, void *dot) {
  if (conj)
    cblas_cdotc_sub(N, X, incX, Y, incY, dot);
  else
    cblas_cdotu_sub(N, X, incX, Y, incY, dot);
}

inline void cblas_CZdot(const int N, const double *X, const int incX,
                        const double *Y, const int incY, bool conj, void *dot) {
  if (conj)
    cblas_zdotc_sub(N, X, incX, Y, incY, dot);
  else
    cblas_zdotu_sub(N, X, incX, Y, incY, dot);
}

// NOTE: strides passed in are in number of Real, blas wants number of complex
inline void cblas_CZgemm(const void *alpha, CMatrixTransposeType transA,
                         const float *Adata, MatrixIndexT a_num_rows,
                         MatrixIndexT a_num_cols, MatrixIndexT a_stride,
                         CMatrixTransposeType transB, const float *Bdata,
                         MatrixIndexT b_stride, const void *beta, float *Mdata,
                         MatrixIndexT num_rows, MatrixIndexT num_cols,
                         MatrixIndexT stride) {
  cblas_cgemm(CblasRowMajor, static_cast<CBLAS_TRANSPOSE>(transA),
              static_cast<CBLAS_TRANSPOSE>(transB), num_rows, num_cols,
              (transA == kNoTrans || transA == kConjNoTrans) ? a_num_cols
                                                             : a_num_rows,
              alpha, Adata, a_stride >> 1, Bdata, b_stride >> 1, beta, Mdata,
              stride >> 1);
}

inline void cblas_CZgemm(const void *alpha, CMatrixTransposeType transA,
                         const double *Adata, MatrixIndexT a_num_rows,
                         MatrixIndexT a_num_cols, MatrixIndexT a_stride,
                         CMatrixTransposeType transB, const double *Bdata,
                         MatrixIndexT b_stride, const void *beta, double *Mdata,
                         MatrixIndexT num_rows, MatrixIndexT num_cols,
                         MatrixIndexT stride) {
  cblas_zgemm(CblasRowMajor, static_cast<CBLAS_TRANSPOSE>(transA),
              static_cast<CBLAS_TRANSPOSE>(transB), num_rows, num_cols,
              (transA == kNoTrans || transA == kConjNoTrans) ? a_num_cols
                                                             : a_num_rows,
              alpha, Adata, a_stride >> 1, Bdata, b_stride >> 1, beta, Mdata,
              stride >> 1);
}

inline void cblas_CZger(MatrixIndexT num_rows, MatrixIndexT num_cols,
                        const void *alpha, const float *xdata,
                        MatrixIndexT incX, const float *ydata,
                        MatrixIndexT incY, float *Mdata, MatrixIndexT stride,
                        bool conj) {
  if (conj)
    cblas_cgerc(CblasRowMajor, num_rows, num_cols, alpha, xdata, incX, ydata,
                incY, Mdata, stride >> 1);
  else
    cblas_cgeru(CblasRowMajor, num_rows, num_cols, alpha, xdata, incX, ydata,
                incY, Mdata, stride >> 1);
}

inline void cblas_CZger(MatrixIndexT num_rows, MatrixIndexT num_cols,
                        const void *alpha, const double *xdata,
                        MatrixIndexT incX, const double *ydata,
                        MatrixIndexT incY, double *Mdata, MatrixIndexT stride,
                        bool conj) {
  if (conj)
    cblas_zgerc(CblasRowMajor, num_rows, num_cols, alpha, xdata, incX, ydata,
                incY, Mdata, stride >> 1);
  else
    cblas_zgeru(CblasRowMajor, num_rows, num_cols, alpha, xdata, incX, ydata,
                incY, Mdata, stride >> 1);
}

inline void cblas_CZgemv(CMatrixTransposeType trans, MatrixIndexT num_rows,
                         MatrixIndexT num_cols, const void *alpha,
                         const float *Mdata, MatrixIndexT stride,
                         const float *xdata, MatrixIndexT incX,
                         const void *beta, float *ydata, MatrixIndexT incY) {
  cblas_cgemv(CblasRowMajor, static_cast<CBLAS_TRANSPOSE>(trans), num_rows,
              num_cols, alpha, Mdata, stride >> 1, xdata, incX, beta, ydata,
              incY);
}

inline void cblas_CZgemv(CMatrixTransposeType trans, MatrixIndexT num_rows,
                         MatrixIndexT num_cols, const void *alpha,
                         const double *Mdata, MatrixIndexT stride,
                         const double *xdata, MatrixIndexT incX,
                         const void *beta, double *ydata, MatrixIndexT incY) {
  cblas_zgemv(CblasRowMajor, static_cast<CBLAS_TRANSPOSE>(trans), num_rows,
              num_cols, alpha, Mdata, stride >> 1, xdata, incX, beta, ydata,
              incY);
}

// function prototype: compute eigen vector & value for hermite matrix
// int cheev_(char *jobz, char *uplo, integer *n, complex *a,
//            integer *lda, real *w, complex *work, integer *lwork, real *rwork,
//            integer *info);

inline void clapack_CZheev(KaldiBlasInt *num_rows, void *V,
                           KaldiBlasInt *stride, float *D, void *work,
                           KaldiBlasInt *lwork, float *rwork,
                           KaldiBlasInt *info) {
  cheev_(const_cast<char *>("V"), const_cast<char *>("U"), num_rows,
         reinterpret_cast<BFTK_COMPLEX_FLOAT *>(V), stride, D,
         reinterpret_cast<BFTK_COMPLEX_FLOAT *>(work), lwork, rwork, info);
}

inline void clapack_CZheev(KaldiBlasInt *num_rows, void *V,
                           KaldiBlasInt *stride, double *D, void *work,
                           KaldiBlasInt *lwork, double *rwork,
                           KaldiBlasInt *info) {
  zheev_(const_cast<char *>("V"), const_cast<char *>("U"), num_rows,
         reinterpret_cast<BFTK_COMPLEX_DOUBLE *>(V), stride, D,
         reinterpret_cast<BFTK_COMPLEX_DOUBLE *>(work), lwork, rwork, info);
}

// function prototype: compute generalized eigen vector & value for hermite
// matrix
// int chegv_(integer *itype, char *jobz, char *uplo, integer *n,
//            complex *a, integer *lda, complex *b, integer *ldb, real *w,
//            complex *work, integer *lwork, real *rwork, integer *info);

inline void clapack_CZhegv(KaldiBlasInt *itype, KaldiBlasInt *num_rows, void *A,
                           KaldiBlasInt *stride_a, void *B,
                           KaldiBlasInt *stride_b, float *D, void *work,
                           KaldiBlasInt *lwork, float *rwork,
                           KaldiBlasInt *info) {
  chegv_(itype, const_cast<char *>("V"), const_cast<char *>("U"), num_rows,
         reinterpret_cast<BFTK_COMPLEX_FLOAT *>(A), stride_a,
         reinterpret_cast<BFTK_COMPLEX_FLOAT *>(B), stride_b, D,
         reinterpret_cast<BFTK_COMPLEX_FLOAT *>(work), lwork, rwork, info);
}

inline void clapack_CZhegv(KaldiBlasInt *itype, KaldiBlasInt *num_rows, void *A,
                           KaldiBlasInt *stride_a, void *B,
                           KaldiBlasInt *stride_b, double *D, void *work,
                           KaldiBlasInt *lwork, double *rwork,
                           KaldiBlasInt *info) {
  zhegv_(itype, const_cast<char *>("V"), const_cast<char *>("U"), num_rows,
         reinterpret_cast<BFTK_COMPLEX_DOUBLE *>(A), stride_a,
         reinterpret_cast<BFTK_COMPLEX_DOUBLE *>(B), stride_b, D,
         reinterpret_cast<BFTK_COMPLEX_DOUBLE *>(work), lwork, rwork, info);
}

// function prototype: generalized eigen problem for general matrix pair
// int cggev_(char *jobvl, char *jobvr, integer *n, complex *a, integer *lda,
//            complex *b, integer *ldb, complex *alpha, complex *beta,
//            complex *vl, integer *ldvl, complex *vr, integer *ldvr,
//            complex *work, integer *lwork, real *rwork, integer *info);
// only right eigen vectors are computed

inline void clapack_CZggev(KaldiBlasInt *num_rows, void *A,
                           KaldiBlasInt *stride_a, void *B,
                           KaldiBlasInt *stride_b, void *alpha, void *beta,
                           void *VR, KaldiBlasInt *stride_vr, void *work,
                           KaldiBlasInt *lwork, float *rwork,
                           KaldiBlasInt *info) {
  KaldiBlasInt ldvl = 1;
  cggev_(const_cast<char *>("N"), const_cast<char *>("V"), num_rows,
         reinterpret_cast<BFTK_COMPLEX_FLOAT *>(A), stride_a,
         reinterpret_cast<BFTK_COMPLEX_FLOAT *>(B), stride_b,
         reinterpret_cast<BFTK_COMPLEX_FLOAT *>(alpha),
         reinterpret_cast<BFTK_COMPLEX_FLOAT *>(beta), NULL, &ldvl,
         reinterpret_cast<BFTK_COMPLEX_FLOAT *>(VR), stride_vr,
         reinterpret_cast<BFTK_COMPLEX_FLOAT *>(work), lwork, rwork, info);
}

inline void clapack_CZggev(KaldiBlasInt *num_rows, void *A,
                           KaldiBlasInt *stride_a, void *B,
                           KaldiBlasInt *stride_b, void *alpha, void *beta,
                           void *VR, KaldiBlasInt *stride_vr, void *work,
                           KaldiBlasInt *lwork, double *rwork,
                           KaldiBlasInt *info) {
  KaldiBlasInt ldvl = 1;
  zggev_(const_cast<char *>("N"), const_cast<char *>("V"), num_rows,
         reinterpret_cast<BFTK_COMPLEX_DOUBLE *>(A), stride_a,
         reinterpret_cast<BFTK_COMPLEX_DOUBLE *>(B), stride_b,
         reinterpret_cast<BFTK_COMPLEX_DOUBLE *>(alpha),
         reinterpret_cast<BFTK_COMPLEX_DOUBLE *>(beta), NULL, &ldvl,
         reinterpret_cast<BFTK_COMPLEX_DOUBLE *>(VR), stride_vr,
         reinterpret_cast<BFTK_COMPLEX_DOUBLE *>(work), lwork, rwork, info);
}

// function prototype: solve A * X = B with LU factorization
// int cgesv_(integer *n, integer *nrhs, complex *a, integer *lda,
//            integer *ipiv, complex *b, integer *ldb, integer *info);

inline void clapack_CZgesv(KaldiBlasInt *num_rows, KaldiBlasInt *num_rhs,
                           float *A, KaldiBlasInt *stride_a,
                           KaldiBlasInt *pivot, float *B,
                           KaldiBlasInt *stride_b, KaldiBlasInt *info) {
  cgesv_(num_rows, num_rhs, reinterpret_cast<BFTK_COMPLEX_FLOAT *>(A),
         stride_a, pivot, reinterpret_cast<BFTK_COMPLEX_FLOAT *>(B), stride_b,
         info);
}

inline void clapack_CZgesv(KaldiBlasInt *num_rows, KaldiBlasInt *num_rhs,
                           double *A, KaldiBlasInt *stride_a,
                           KaldiBlasInt *pivot, double *B,
                           KaldiBlasInt *stride_b, KaldiBlasInt *info) {
  zgesv_(num_rows, num_rhs, reinterpret_cast<BFTK_COMPLEX_DOUBLE *>(A),
         stride_a, pivot, reinterpret_cast<BFTK_COMPLEX_DOUBLE *>(B), stride_b,
         info);
}

}  // namespace bftk

#endif
