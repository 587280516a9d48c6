// include/complex-base.h

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

#ifndef BFTK_COMPLEX_BASE_H_
#define BFTK_COMPLEX_BASE_H_

#include <complex>
#include "base/kaldi-common.h"
#include "matrix/cblas-wrappers.h"
#include "matrix/kaldi-matrix.h"
#include "matrix/kaldi-vector.h"
#include "matrix/matrix-common.h"

#include "include/cblas-cpl-wrappers.h"
#include "include/numeric-error.h"

namespace bftk {

using kaldi::int32;
using kaldi::BaseFloat;
using kaldi::MatrixIndexT;
using kaldi::UnsignedMatrixIndexT;
using kaldi::MatrixResizeType;
using kaldi::MatrixStrideType;
using kaldi::kSetZero;
using kaldi::kUndefined;
using kaldi::kCopyData;
using kaldi::kDefaultStride;
using kaldi::kStrideEqualNumCols;
using kaldi::Matrix;
using kaldi::MatrixBase;
using kaldi::SubMatrix;
using kaldi::Vector;
using kaldi::VectorBase;
using kaldi::SubVector;

typedef enum { kReal, kImag } ComplexIndexType;

typedef enum {
  kConj,
  kNoConj,
} ConjugateType;

// Layout-compatible with std::complex<Real> and the BLAS complex types,
// used to pass scalars into cblas_{c,z}* routines.
template <typename Real>
struct Complex {
  Real real, imag;
  Complex(Real r, Real i) : real(r), imag(i) {}
  Complex() {}
};

template <typename Real>
class CVectorBase;
template <typename Real>
class CVector;
template <typename Real>
class SubCVector;

template <typename Real>
class CMatrixBase;
template <typename Real>
class CMatrix;
template <typename Real>
class SubCMatrix;

}  // namespace bftk

#endif
