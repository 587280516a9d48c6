// include/complex-matrix.h

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

#ifndef BFTK_COMPLEX_MATRIX_H_
#define BFTK_COMPLEX_MATRIX_H_

#include "include/complex-base.h"
#include "include/complex-vector.h"

namespace bftk {

template <typename Real>
class CMatrixBase {
 public:
  friend class CMatrix<Real>;
  friend class SubCMatrix<Real>;

  inline MatrixIndexT NumRows() const { return num_rows_; }

  inline MatrixIndexT NumCols() const { return num_cols_; }

  // in number of Real, not complex
  inline MatrixIndexT Stride() const { return stride_; }

  inline const Real *Data() const { return data_; }

  inline Real *Data() { return data_; }

  inline const Real *RowData(MatrixIndexT i) const {
    KALDI_ASSERT(static_cast<UnsignedMatrixIndexT>(i) <
                 static_cast<UnsignedMatrixIndexT>(num_rows_));
    return data_ + i * stride_;
  }

  inline Real *RowData(MatrixIndexT i) {
    KALDI_ASSERT(static_cast<UnsignedMatrixIndexT>(i) <
                 static_cast<UnsignedMatrixIndexT>(num_rows_));
    return data_ + i * stride_;
  }

  inline Real &operator()(MatrixIndexT r, MatrixIndexT c,
                          ComplexIndexType kIndex) {
    KALDI_PARANOID_ASSERT(static_cast<UnsignedMatrixIndexT>(r) <
                              static_cast<UnsignedMatrixIndexT>(num_rows_) &&
                          static_cast<UnsignedMatrixIndexT>(c) <
                              static_cast<UnsignedMatrixIndexT>(num_cols_));
    return *(data_ + r * stride_ + (kIndex == kReal ? c * 2 : c * 2 + 1));
  }

  inline Real operator()(MatrixIndexT r, MatrixIndexT c,
                         ComplexIndexType kIndex) const {
    KALDI_PARANOID_ASSERT(static_cast<UnsignedMatrixIndexT>(r) <
                              static_cast<UnsignedMatrixIndexT>(num_rows_) &&
                          static_cast<UnsignedMatrixIndexT>(c) <
                              static_cast<UnsignedMatrixIndexT>(num_cols_));
    return *(data_ + r * stride_ + (kIndex == kReal ? c * 2 : c * 2 + 1));
  }

  inline std::complex<Real> Value(MatrixIndexT r, MatrixIndexT c) const {
    return std::complex<Real>((*this)(r, c, kReal), (*this)(r, c, kImag));
  }

  inline void SetValue(MatrixIndexT r, MatrixIndexT c,
                       const std::complex<Real> &v) {
    (*this)(r, c, kReal) = std::real(v);
    (*this)(r, c, kImag) = std::imag(v);
  }

  inline SubCMatrix<Real> Range(const MatrixIndexT row_offset,
                                const MatrixIndexT num_rows,
                                const MatrixIndexT col_offset,
                                const MatrixIndexT num_cols) const {
    return SubCMatrix<Real>(*this, row_offset, num_rows, col_offset, num_cols);
  }

  inline const SubCVector<Real> Row(MatrixIndexT i) const {
    KALDI_ASSERT(static_cast<UnsignedMatrixIndexT>(i) <
                 static_cast<UnsignedMatrixIndexT>(num_rows_));
    return SubCVector<Real>(data_ + (i * stride_), num_cols_);
  }

  inline SubCVector<Real> Row(MatrixIndexT i) {
    KALDI_ASSERT(static_cast<UnsignedMatrixIndexT>(i) <
                 static_cast<UnsignedMatrixIndexT>(num_rows_));
    return SubCVector<Real>(data_ + (i * stride_), num_cols_);
  }

  void SetZero();

  void SetRandn();

  void SetUnit();

  // this = this * alpha
  void Scale(Real alpha_r, Real alpha_i);

  // this = this'
  void Conjugate();

  // this = this^T, square only
  void Transpose();

  // this = this^H, square only
  void Hermite();

  // this = (this + this^H) / 2, square only
  void Symmetrize();

  // this == this^H
  bool IsHermitian(Real cutoff = 1.0e-5) const;

  // init from complex matrix, enable conjugate & transpose
  void CopyFromMat(const CMatrixBase<Real> &M,
                   CMatrixTransposeType trans = kNoTrans);

  // init from real matrix
  void CopyFromMat(const MatrixBase<Real> &M, ComplexIndexType index = kReal);

  void CopyFromRealfft(const MatrixBase<Real> &M);

  void AddToDiag(const Real alpha_r, const Real alpha_i);

  // this[:, c] = this[:, c] * scale(c)
  void MulColsVec(const VectorBase<Real> &scale);

  // this = this * beta + alpha * A * B
  void AddMatMat(const Real alpha_r, const Real alpha_i,
                 const CMatrixBase<Real> &A, CMatrixTransposeType transA,
                 const CMatrixBase<Real> &B, CMatrixTransposeType transB,
                 const Real beta_r, const Real beta_i);

  // this = this + alpha * a * b^{T or H}
  void AddVecVec(const Real alpha_r, const Real alpha_i,
                 const CVectorBase<Real> &a, const CVectorBase<Real> &b,
                 ConjugateType conj = kNoConj);

  // this = this + alpha * M
  void AddMat(const Real alpha_r, const Real alpha_i, const CMatrixBase<Real> &M,
              CMatrixTransposeType trans = kNoTrans);

  // Solve this * x = b for each row b of X, X is overwritten by solutions.
  // Throws NumericalFailure if this is singular.
  void SolveVecs(CMatrixBase<Real> *X) const;

  // For Hermite matrix, eigen values are all real and in ascend order.
  // Each row of V is an eigen vector: this * V.Row(i)^T = D(i) * V.Row(i)^T
  // Only the lower triangle of this is referenced.
  void Hed(VectorBase<Real> *D, CMatrixBase<Real> *V) const;

  // this * v = d * B * v, B must be Hermitian positive definite, otherwise
  // throws NotPositiveDefinite. Eigen values are in ascend order and each
  // row of V is an eigen vector, normalized as v^H * B * v = 1.
  // B is not modified.
  void Hged(const CMatrixBase<Real> &B, VectorBase<Real> *D,
            CMatrixBase<Real> *V) const;

  // this * v = (alpha / beta) * B * v, for general matrix pair.
  // Each row of V is an eigen vector with unit norm.
  void Ged(const CMatrixBase<Real> &B, CVectorBase<Real> *alpha,
           CVectorBase<Real> *beta, CMatrixBase<Real> *V) const;

  // Now binary must be true
  void Read(std::istream &in, bool binary);

  void Write(std::ostream &out, bool binary) const;

 protected:
  CMatrixBase(Real *data, MatrixIndexT cols, MatrixIndexT rows,
              MatrixIndexT stride)
      : data_(data), num_cols_(cols), num_rows_(rows), stride_(stride) {}

  CMatrixBase() : data_(NULL), num_cols_(0), num_rows_(0), stride_(0) {}

  inline Real *Data_workaround() const { return data_; }

  ~CMatrixBase() {}

  Real *data_;

  MatrixIndexT num_cols_;
  MatrixIndexT num_rows_;
  MatrixIndexT stride_;

 private:
  KALDI_DISALLOW_COPY_AND_ASSIGN(CMatrixBase);
};

template <typename Real>
class CMatrix : public CMatrixBase<Real> {
 public:
  CMatrix() {}

  CMatrix(const MatrixIndexT r, const MatrixIndexT c,
          MatrixResizeType resize_type = kSetZero,
          MatrixStrideType stride_type = kDefaultStride)
      : CMatrixBase<Real>() {
    Resize(r, c, resize_type, stride_type);
  }

  // copy constructor, from complex matrix
  explicit CMatrix(const CMatrixBase<Real> &M,
                   CMatrixTransposeType trans = kNoTrans,
                   MatrixStrideType stride_type = kDefaultStride);

  CMatrix(const CMatrix<Real> &M);

  // diagonal matrix
  explicit CMatrix(const VectorBase<Real> &v);

  // copy constructor, from real matrix
  explicit CMatrix(const MatrixBase<Real> &M, ComplexIndexType index = kReal);

  CMatrix<Real> &operator=(const CMatrixBase<Real> &other) {
    if (CMatrixBase<Real>::NumRows() != other.NumRows() ||
        CMatrixBase<Real>::NumCols() != other.NumCols())
      Resize(other.NumRows(), other.NumCols(), kUndefined);
    CMatrixBase<Real>::CopyFromMat(other);
    return *this;
  }

  CMatrix<Real> &operator=(const CMatrix<Real> &other) {
    if (CMatrixBase<Real>::NumRows() != other.NumRows() ||
        CMatrixBase<Real>::NumCols() != other.NumCols())
      Resize(other.NumRows(), other.NumCols(), kUndefined);
    CMatrixBase<Real>::CopyFromMat(other);
    return *this;
  }

  void Swap(CMatrix<Real> *other);

  void Transpose();

  void Hermite();

  ~CMatrix() { Destroy(); }

  void Resize(const MatrixIndexT rows, const MatrixIndexT cols,
              MatrixResizeType resize_type = kSetZero,
              MatrixStrideType stride_type = kDefaultStride);

  void Read(std::istream &in, bool binary);

 private:
  void Destroy();

  void Init(const MatrixIndexT rows, const MatrixIndexT cols,
            const MatrixStrideType stride_type);
};

template <typename Real>
class SubCMatrix : public CMatrixBase<Real> {
 public:
  SubCMatrix(const CMatrixBase<Real> &T, const MatrixIndexT row_offset,
             const MatrixIndexT rows, const MatrixIndexT col_offset,
             const MatrixIndexT cols);

  // stride in number of Real
  SubCMatrix(Real *data, MatrixIndexT num_rows, MatrixIndexT num_cols,
             MatrixIndexT stride);

  SubCMatrix(const SubCMatrix &other)
      : CMatrixBase<Real>(other.data_, other.num_cols_, other.num_rows_,
                          other.stride_) {}

  ~SubCMatrix() {}

 private:
  SubCMatrix<Real> &operator=(const SubCMatrix<Real> &other);
};

template <typename Real>
std::ostream &operator<<(std::ostream &os, const CMatrixBase<Real> &cm) {
  cm.Write(os, false);
  return os;
}

}  // namespace bftk

#endif
