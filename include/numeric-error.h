// include/numeric-error.h

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

#ifndef BFTK_NUMERIC_ERROR_H_
#define BFTK_NUMERIC_ERROR_H_

#include <sstream>
#include <stdexcept>
#include <string>

#include "base/kaldi-error.h"

namespace bftk {

// Bad shapes, axes or missing inputs
class InvalidArgument : public std::invalid_argument {
 public:
  explicit InvalidArgument(const std::string &what)
      : std::invalid_argument(what) {}
};

// LAPACK could not factorize or did not converge
class NumericalFailure : public std::runtime_error {
 public:
  explicit NumericalFailure(const std::string &what)
      : std::runtime_error(what) {}
};

// Right hand side of a Hermitian-definite generalized problem
// is not positive definite
class NotPositiveDefinite : public NumericalFailure {
 public:
  explicit NotPositiveDefinite(const std::string &what)
      : NumericalFailure(what) {}
};

// Collects the message of a typed failure, e.g.
//   ThrowError<InvalidArgument>(ErrorStream() << "Expect " << n << " axes");
class ErrorStream {
 public:
  template <typename T>
  ErrorStream &operator<<(const T &value) {
    oss_ << value;
    return *this;
  }

  std::string str() const { return oss_.str(); }

 private:
  std::ostringstream oss_;
};

// Same behaviour as KALDI_ERR (report, then throw) but with a typed
// exception. Failures the caller is expected to recover from are thrown
// without report.
template <class ErrorType>
inline void ThrowError(const ErrorStream &message, bool report = true) {
  if (report) KALDI_WARN << message.str();
  throw ErrorType(message.str());
}

}  // namespace bftk

#endif
