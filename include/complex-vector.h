// include/complex-vector.h

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

#ifndef BFTK_COMPLEX_VECTOR_H_
#define BFTK_COMPLEX_VECTOR_H_

#include "include/complex-base.h"

namespace bftk {

template <typename Real>
class CVectorBase {
 public:
  void SetZero();

  void SetRandn();

  inline MatrixIndexT Dim() const { return dim_; }

  inline Real *Data() { return data_; }

  inline const Real *Data() const { return data_; }

  inline Real operator()(MatrixIndexT i, ComplexIndexType kIndex) const {
    KALDI_PARANOID_ASSERT(static_cast<UnsignedMatrixIndexT>(i) <
                          static_cast<UnsignedMatrixIndexT>(dim_));
    return *(data_ + (kIndex == kReal ? i * 2 : i * 2 + 1));
  }

  inline Real &operator()(MatrixIndexT i, ComplexIndexType kIndex) {
    KALDI_PARANOID_ASSERT(static_cast<UnsignedMatrixIndexT>(i) <
                          static_cast<UnsignedMatrixIndexT>(dim_));
    return *(data_ + (kIndex == kReal ? i * 2 : i * 2 + 1));
  }

  inline std::complex<Real> Value(MatrixIndexT i) const {
    return std::complex<Real>((*this)(i, kReal), (*this)(i, kImag));
  }

  inline void SetValue(MatrixIndexT i, const std::complex<Real> &c) {
    (*this)(i, kReal) = std::real(c);
    (*this)(i, kImag) = std::imag(c);
  }

  SubCVector<Real> Range(const MatrixIndexT offset, const MatrixIndexT dim) {
    return SubCVector<Real>(*this, offset, dim);
  }

  const SubCVector<Real> Range(const MatrixIndexT offset,
                               const MatrixIndexT dim) const {
    return SubCVector<Real>(*this, offset, dim);
  }

  std::complex<Real> Sum() const;

  // sqrt(\sum |v_i|^2)
  Real Norm() const;

  // this = this + alpha * v
  void AddVec(Real alpha_r, Real alpha_i, const CVectorBase<Real> &v);

  // this = beta * this + alpha * M * v
  void AddMatVec(const Real alpha_r, const Real alpha_i,
                 const CMatrixBase<Real> &M, const CMatrixTransposeType trans,
                 const CVectorBase<Real> &v, const Real beta_r,
                 const Real beta_i);

  // this = this * alpha
  void Scale(const Real alpha_r, const Real alpha_i);

  // this = this'
  void Conjugate();

  void CopyFromVec(const CVectorBase<Real> &v, ConjugateType conj = kNoConj);

  void CopyFromVec(const VectorBase<Real> &v, ComplexIndexType kIndex);

  // [r0, r(n/2), r1, i1, ...] => [r0+0i, r1+i1, ..., r(n/2)+0i]
  void CopyFromRealfft(const VectorBase<Real> &v);

 protected:
  ~CVectorBase() {}

  explicit CVectorBase() : data_(NULL), dim_(0) {}

  Real *data_;
  MatrixIndexT dim_;

  KALDI_DISALLOW_COPY_AND_ASSIGN(CVectorBase);
};

template <typename Real>
class CVector : public CVectorBase<Real> {
 public:
  CVector() : CVectorBase<Real>() {}

  explicit CVector(const MatrixIndexT s,
                   MatrixResizeType resize_type = kSetZero)
      : CVectorBase<Real>() {
    Resize(s, resize_type);
  }

  CVector(const CVectorBase<Real> &v) : CVectorBase<Real>() {
    Resize(v.Dim(), kUndefined);
    this->CopyFromVec(v);
  }

  CVector(const VectorBase<Real> &v, ComplexIndexType kIndex = kReal)
      : CVectorBase<Real>() {
    Resize(v.Dim(), kSetZero);
    this->CopyFromVec(v, kIndex);
  }

  CVector(const CVector<Real> &v) : CVectorBase<Real>() {
    Resize(v.Dim(), kUndefined);
    this->CopyFromVec(v);
  }

  CVector<Real> &operator=(const CVectorBase<Real> &other) {
    Resize(other.Dim(), kUndefined);
    this->CopyFromVec(other);
    return *this;
  }

  CVector<Real> &operator=(const CVector<Real> &other) {
    Resize(other.Dim(), kUndefined);
    this->CopyFromVec(other);
    return *this;
  }

  void Swap(CVector<Real> *other);

  ~CVector() { Destroy(); }

  void Resize(MatrixIndexT length, MatrixResizeType resize_type = kSetZero);

 private:
  void Init(const MatrixIndexT dim);

  void Destroy();
};

template <typename Real>
class SubCVector : public CVectorBase<Real> {
 public:
  SubCVector(const CVectorBase<Real> &t, const MatrixIndexT offset,
             const MatrixIndexT dim)
      : CVectorBase<Real>() {
    KALDI_ASSERT(static_cast<UnsignedMatrixIndexT>(offset) +
                     static_cast<UnsignedMatrixIndexT>(dim) <=
                 static_cast<UnsignedMatrixIndexT>(t.Dim()));
    CVectorBase<Real>::data_ = const_cast<Real *>(t.Data() + offset * 2);
    CVectorBase<Real>::dim_ = dim;
  }

  SubCVector(const SubCVector &other) : CVectorBase<Real>() {
    CVectorBase<Real>::data_ = other.data_;
    CVectorBase<Real>::dim_ = other.dim_;
  }

  SubCVector(Real *data, MatrixIndexT size) : CVectorBase<Real>() {
    CVectorBase<Real>::data_ = data;
    CVectorBase<Real>::dim_ = size;
  }

  SubCVector(const CMatrixBase<Real> &matrix, MatrixIndexT row);

  ~SubCVector() {}

 private:
  SubCVector &operator=(const SubCVector &other);
};

template <typename Real>
std::complex<Real> VecVec(const CVectorBase<Real> &v1,
                          const CVectorBase<Real> &v2,
                          ConjugateType conj = kNoConj) {
  MatrixIndexT dim = v1.Dim();
  KALDI_ASSERT(dim == v2.Dim());
  Complex<Real> dot;
  // cblas_?dotc conjugates the first argument
  cblas_CZdot(dim, v1.Data(), 1, v2.Data(), 1, conj == kConj ? true : false,
              &dot);
  return std::complex<Real>(dot.real, dot.imag);
}

// Only used for debug
template <typename Real>
std::ostream &operator<<(std::ostream &os, const CVectorBase<Real> &cv) {
  os << " [ ";
  for (MatrixIndexT i = 0; i < cv.Dim(); i++)
    os << cv(i, kReal) << (cv(i, kImag) >= 0 ? "+" : "") << cv(i, kImag)
       << "i ";
  os << "]\n";
  return os;
}
}  // namespace bftk

#endif
