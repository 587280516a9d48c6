// include/tensor.h

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

#ifndef BFTK_TENSOR_H_
#define BFTK_TENSOR_H_

#include <vector>

#include "include/complex-base.h"
#include "include/complex-matrix.h"
#include "include/complex-vector.h"

namespace bftk {

typedef std::vector<MatrixIndexT> TensorDims;

// Map axis in [-num_axes, num_axes) into its negative form [-num_axes, -1],
// throws InvalidArgument if out of range
MatrixIndexT NormalizeAxis(MatrixIndexT axis, MatrixIndexT num_axes);

// Product of dims[begin, end)
MatrixIndexT DimsProduct(const TensorDims &dims, MatrixIndexT begin,
                         MatrixIndexT end);

std::string DimsToString(const TensorDims &dims);

// Copy src (row major, shape dims, each element has width Reals) into dst
// with axis i of dst being axis perm[i] of src
template <typename Real>
void PermuteAxes(const Real *src, const TensorDims &dims,
                 const std::vector<MatrixIndexT> &perm, MatrixIndexT width,
                 Real *dst);

// Real valued N-d array, used for masks
template <typename Real>
class Tensor {
 public:
  Tensor() {}

  explicit Tensor(const TensorDims &dims) { Resize(dims); }

  Tensor(const Tensor<Real> &other) : dims_(other.dims_), data_(other.data_) {}

  Tensor<Real> &operator=(const Tensor<Real> &other) {
    dims_ = other.dims_;
    data_ = other.data_;
    return *this;
  }

  void Resize(const TensorDims &dims, MatrixResizeType resize_type = kSetZero);

  // keep data, size must not change
  void Reshape(const TensorDims &dims);

  inline const TensorDims &Dims() const { return dims_; }

  inline MatrixIndexT NumAxes() const { return dims_.size(); }

  // axis could be negative
  MatrixIndexT Dim(MatrixIndexT axis) const;

  inline MatrixIndexT Size() const { return data_.Dim(); }

  inline Real *Data() { return data_.Data(); }

  inline const Real *Data() const { return data_.Data(); }

  inline Real operator()(const TensorDims &index) const {
    return data_(Offset(index));
  }

  inline Real &operator()(const TensorDims &index) {
    return data_(Offset(index));
  }

  void SetZero() { data_.SetZero(); }

  void Set(Real value) { data_.Set(value); }

  // axis i of this becomes axis perm[i] of the original one
  void Transpose(const std::vector<MatrixIndexT> &perm);

  // move axis to the position dest, others keep their order
  void MoveAxis(MatrixIndexT axis, MatrixIndexT dest);

  void ReverseAxes();

  // number of sub-tensors formed by the trailing num_trailing axes
  MatrixIndexT NumBatches(MatrixIndexT num_trailing) const;

  // view on the b-th trailing (rows, cols) matrix
  SubMatrix<Real> Slice(MatrixIndexT b) const;

  // view on the b-th trailing vector
  SubVector<Real> Row(MatrixIndexT b) const;

 private:
  MatrixIndexT Offset(const TensorDims &index) const;

  TensorDims dims_;
  Vector<Real> data_;
};

// Complex valued N-d array, interleaved (real, imag) in row major
template <typename Real>
class CTensor {
 public:
  CTensor() {}

  explicit CTensor(const TensorDims &dims) { Resize(dims); }

  CTensor(const CTensor<Real> &other) : dims_(other.dims_), data_(other.data_) {}

  CTensor<Real> &operator=(const CTensor<Real> &other) {
    dims_ = other.dims_;
    data_ = other.data_;
    return *this;
  }

  void Resize(const TensorDims &dims, MatrixResizeType resize_type = kSetZero);

  void Reshape(const TensorDims &dims);

  inline const TensorDims &Dims() const { return dims_; }

  inline MatrixIndexT NumAxes() const { return dims_.size(); }

  MatrixIndexT Dim(MatrixIndexT axis) const;

  // in number of complex
  inline MatrixIndexT Size() const { return data_.Dim(); }

  inline Real *Data() { return data_.Data(); }

  inline const Real *Data() const { return data_.Data(); }

  inline std::complex<Real> Value(const TensorDims &index) const {
    return data_.Value(Offset(index));
  }

  inline void SetValue(const TensorDims &index, const std::complex<Real> &c) {
    data_.SetValue(Offset(index), c);
  }

  void SetZero() { data_.SetZero(); }

  void SetRandn() { data_.SetRandn(); }

  void Scale(Real alpha_r, Real alpha_i) { data_.Scale(alpha_r, alpha_i); }

  void AddTensor(Real alpha_r, Real alpha_i, const CTensor<Real> &other);

  void Transpose(const std::vector<MatrixIndexT> &perm);

  void MoveAxis(MatrixIndexT axis, MatrixIndexT dest);

  void ReverseAxes();

  MatrixIndexT NumBatches(MatrixIndexT num_trailing) const;

  SubCMatrix<Real> Slice(MatrixIndexT b) const;

  SubCVector<Real> Row(MatrixIndexT b) const;

 private:
  MatrixIndexT Offset(const TensorDims &index) const;

  TensorDims dims_;
  CVector<Real> data_;
};

}  // namespace bftk

#endif
