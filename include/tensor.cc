// include/tensor.cc

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

#include "include/tensor.h"

namespace bftk {

MatrixIndexT NormalizeAxis(MatrixIndexT axis, MatrixIndexT num_axes) {
  if (num_axes <= 0 || axis < -num_axes || axis >= num_axes)
    ThrowError<InvalidArgument>(
        ErrorStream() << "Axis " << axis << " is out of range for "
                      << num_axes << "-d tensor");
  return (axis < 0 ? axis : axis - num_axes);
}

MatrixIndexT DimsProduct(const TensorDims &dims, MatrixIndexT begin,
                         MatrixIndexT end) {
  KALDI_ASSERT(begin >= 0 && end <= static_cast<MatrixIndexT>(dims.size()));
  MatrixIndexT prod = 1;
  for (MatrixIndexT i = begin; i < end; i++) prod *= dims[i];
  return prod;
}

std::string DimsToString(const TensorDims &dims) {
  std::ostringstream ostr;
  ostr << "(";
  for (size_t i = 0; i < dims.size(); i++)
    ostr << (i == 0 ? "" : ", ") << dims[i];
  ostr << ")";
  return ostr.str();
}

template <typename Real>
void PermuteAxes(const Real *src, const TensorDims &dims,
                 const std::vector<MatrixIndexT> &perm, MatrixIndexT width,
                 Real *dst) {
  MatrixIndexT num_axes = dims.size();
  KALDI_ASSERT(static_cast<MatrixIndexT>(perm.size()) == num_axes);
  std::vector<MatrixIndexT> src_strides(num_axes, width);
  for (MatrixIndexT i = num_axes - 2; i >= 0; i--)
    src_strides[i] = src_strides[i + 1] * dims[i + 1];
  // walk dst in order, steps on src follow the permuted strides
  std::vector<MatrixIndexT> dst_dims(num_axes), steps(num_axes),
      index(num_axes, 0);
  for (MatrixIndexT i = 0; i < num_axes; i++) {
    dst_dims[i] = dims[perm[i]];
    steps[i] = src_strides[perm[i]];
  }
  MatrixIndexT size = DimsProduct(dims, 0, num_axes), offset = 0;
  for (MatrixIndexT n = 0; n < size; n++) {
    std::memcpy(dst + n * width, src + offset, sizeof(Real) * width);
    for (MatrixIndexT i = num_axes - 1; i >= 0; i--) {
      index[i]++;
      offset += steps[i];
      if (index[i] < dst_dims[i]) break;
      offset -= steps[i] * dst_dims[i];
      index[i] = 0;
    }
  }
}

// Check perm is a permutation of [0, num_axes), negative axis allowed
static std::vector<MatrixIndexT> CheckPermutation(
    const std::vector<MatrixIndexT> &perm, MatrixIndexT num_axes) {
  if (static_cast<MatrixIndexT>(perm.size()) != num_axes)
    ThrowError<InvalidArgument>(
        ErrorStream() << "Permutation has " << perm.size()
                      << " axes, expected "
                      << num_axes);
  std::vector<MatrixIndexT> axes(num_axes);
  std::vector<bool> seen(num_axes, false);
  for (MatrixIndexT i = 0; i < num_axes; i++) {
    axes[i] = NormalizeAxis(perm[i], num_axes) + num_axes;
    if (seen[axes[i]])
      ThrowError<InvalidArgument>(
          ErrorStream() << "Repeated axis " << perm[i]
                        << " in permutation");
    seen[axes[i]] = true;
  }
  return axes;
}

static std::vector<MatrixIndexT> MoveAxisPermutation(MatrixIndexT axis,
                                                     MatrixIndexT dest,
                                                     MatrixIndexT num_axes) {
  axis = NormalizeAxis(axis, num_axes) + num_axes;
  dest = NormalizeAxis(dest, num_axes) + num_axes;
  std::vector<MatrixIndexT> perm;
  for (MatrixIndexT i = 0; i < num_axes; i++)
    if (i != axis) perm.push_back(i);
  perm.insert(perm.begin() + dest, axis);
  return perm;
}

static std::vector<MatrixIndexT> ReversePermutation(MatrixIndexT num_axes) {
  std::vector<MatrixIndexT> perm(num_axes);
  for (MatrixIndexT i = 0; i < num_axes; i++) perm[i] = num_axes - 1 - i;
  return perm;
}

static void CheckDims(const TensorDims &dims) {
  for (size_t i = 0; i < dims.size(); i++)
    if (dims[i] < 0)
      ThrowError<InvalidArgument>(
          ErrorStream() << "Negative dimension in " << DimsToString(dims));
}

// Implement for Tensor

template <typename Real>
void Tensor<Real>::Resize(const TensorDims &dims,
                          MatrixResizeType resize_type) {
  CheckDims(dims);
  dims_ = dims;
  data_.Resize(DimsProduct(dims, 0, dims.size()), resize_type);
}

template <typename Real>
void Tensor<Real>::Reshape(const TensorDims &dims) {
  CheckDims(dims);
  if (DimsProduct(dims, 0, dims.size()) != Size())
    ThrowError<InvalidArgument>(
        ErrorStream() << "Could not reshape " << DimsToString(dims_)
                      << " into "
                      << DimsToString(dims));
  dims_ = dims;
}

template <typename Real>
MatrixIndexT Tensor<Real>::Dim(MatrixIndexT axis) const {
  return dims_[NormalizeAxis(axis, NumAxes()) + NumAxes()];
}

template <typename Real>
MatrixIndexT Tensor<Real>::Offset(const TensorDims &index) const {
  KALDI_ASSERT(index.size() == dims_.size());
  MatrixIndexT offset = 0;
  for (size_t i = 0; i < dims_.size(); i++) {
    KALDI_ASSERT(index[i] >= 0 && index[i] < dims_[i]);
    offset = offset * dims_[i] + index[i];
  }
  return offset;
}

template <typename Real>
void Tensor<Real>::Transpose(const std::vector<MatrixIndexT> &perm) {
  std::vector<MatrixIndexT> axes = CheckPermutation(perm, NumAxes());
  Vector<Real> permuted(Size(), kUndefined);
  PermuteAxes(data_.Data(), dims_, axes, 1, permuted.Data());
  TensorDims dims(dims_.size());
  for (size_t i = 0; i < axes.size(); i++) dims[i] = dims_[axes[i]];
  data_.Swap(&permuted);
  dims_ = dims;
}

template <typename Real>
void Tensor<Real>::MoveAxis(MatrixIndexT axis, MatrixIndexT dest) {
  Transpose(MoveAxisPermutation(axis, dest, NumAxes()));
}

template <typename Real>
void Tensor<Real>::ReverseAxes() {
  Transpose(ReversePermutation(NumAxes()));
}

template <typename Real>
MatrixIndexT Tensor<Real>::NumBatches(MatrixIndexT num_trailing) const {
  KALDI_ASSERT(num_trailing >= 0 && num_trailing <= NumAxes());
  return DimsProduct(dims_, 0, NumAxes() - num_trailing);
}

template <typename Real>
SubMatrix<Real> Tensor<Real>::Slice(MatrixIndexT b) const {
  KALDI_ASSERT(NumAxes() >= 2 && b >= 0 && b < NumBatches(2));
  MatrixIndexT rows = dims_[NumAxes() - 2], cols = dims_[NumAxes() - 1];
  return SubMatrix<Real>(const_cast<Real *>(data_.Data()) + b * rows * cols,
                         rows, cols, cols);
}

template <typename Real>
SubVector<Real> Tensor<Real>::Row(MatrixIndexT b) const {
  KALDI_ASSERT(NumAxes() >= 1 && b >= 0 && b < NumBatches(1));
  MatrixIndexT dim = dims_[NumAxes() - 1];
  return SubVector<Real>(const_cast<Real *>(data_.Data()) + b * dim, dim);
}

// Implement for CTensor

template <typename Real>
void CTensor<Real>::Resize(const TensorDims &dims,
                           MatrixResizeType resize_type) {
  CheckDims(dims);
  dims_ = dims;
  data_.Resize(DimsProduct(dims, 0, dims.size()), resize_type);
}

template <typename Real>
void CTensor<Real>::Reshape(const TensorDims &dims) {
  CheckDims(dims);
  if (DimsProduct(dims, 0, dims.size()) != Size())
    ThrowError<InvalidArgument>(
        ErrorStream() << "Could not reshape " << DimsToString(dims_)
                      << " into "
                      << DimsToString(dims));
  dims_ = dims;
}

template <typename Real>
MatrixIndexT CTensor<Real>::Dim(MatrixIndexT axis) const {
  return dims_[NormalizeAxis(axis, NumAxes()) + NumAxes()];
}

template <typename Real>
MatrixIndexT CTensor<Real>::Offset(const TensorDims &index) const {
  KALDI_ASSERT(index.size() == dims_.size());
  MatrixIndexT offset = 0;
  for (size_t i = 0; i < dims_.size(); i++) {
    KALDI_ASSERT(index[i] >= 0 && index[i] < dims_[i]);
    offset = offset * dims_[i] + index[i];
  }
  return offset;
}

template <typename Real>
void CTensor<Real>::AddTensor(Real alpha_r, Real alpha_i,
                              const CTensor<Real> &other) {
  if (other.dims_ != dims_)
    ThrowError<InvalidArgument>(
        ErrorStream() << "Shape mismatch: " << DimsToString(dims_)
                      << " vs "
                      << DimsToString(other.dims_));
  data_.AddVec(alpha_r, alpha_i, other.data_);
}

template <typename Real>
void CTensor<Real>::Transpose(const std::vector<MatrixIndexT> &perm) {
  std::vector<MatrixIndexT> axes = CheckPermutation(perm, NumAxes());
  CVector<Real> permuted(Size(), kUndefined);
  PermuteAxes(data_.Data(), dims_, axes, 2, permuted.Data());
  TensorDims dims(dims_.size());
  for (size_t i = 0; i < axes.size(); i++) dims[i] = dims_[axes[i]];
  data_.Swap(&permuted);
  dims_ = dims;
}

template <typename Real>
void CTensor<Real>::MoveAxis(MatrixIndexT axis, MatrixIndexT dest) {
  Transpose(MoveAxisPermutation(axis, dest, NumAxes()));
}

template <typename Real>
void CTensor<Real>::ReverseAxes() {
  Transpose(ReversePermutation(NumAxes()));
}

template <typename Real>
MatrixIndexT CTensor<Real>::NumBatches(MatrixIndexT num_trailing) const {
  KALDI_ASSERT(num_trailing >= 0 && num_trailing <= NumAxes());
  return DimsProduct(dims_, 0, NumAxes() - num_trailing);
}

template <typename Real>
SubCMatrix<Real> CTensor<Real>::Slice(MatrixIndexT b) const {
  KALDI_ASSERT(NumAxes() >= 2 && b >= 0 && b < NumBatches(2));
  MatrixIndexT rows = dims_[NumAxes() - 2], cols = dims_[NumAxes() - 1];
  return SubCMatrix<Real>(
      const_cast<Real *>(data_.Data()) + b * rows * cols * 2, rows, cols,
      cols * 2);
}

template <typename Real>
SubCVector<Real> CTensor<Real>::Row(MatrixIndexT b) const {
  KALDI_ASSERT(NumAxes() >= 1 && b >= 0 && b < NumBatches(1));
  MatrixIndexT dim = dims_[NumAxes() - 1];
  return SubCVector<Real>(const_cast<Real *>(data_.Data()) + b * dim * 2, dim);
}

template void PermuteAxes(const float *src, const TensorDims &dims,
                          const std::vector<MatrixIndexT> &perm,
                          MatrixIndexT width, float *dst);
template void PermuteAxes(const double *src, const TensorDims &dims,
                          const std::vector<MatrixIndexT> &perm,
                          MatrixIndexT width, double *dst);

template class Tensor<float>;
template class Tensor<double>;
template class CTensor<float>;
template class CTensor<double>;

}  // namespace bftk
