// include/batch-task.h

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

#ifndef BFTK_BATCH_TASK_H_
#define BFTK_BATCH_TASK_H_

#include <exception>
#include <vector>

#include "base/kaldi-common.h"
#include "util/kaldi-thread.h"

namespace bftk {

// Runs kernel(b) for b in [0, num_batches), batch b goes to worker
// b % num_threads_. Each copy made by RunMultiThreaded shares the error slots.
template <class Kernel>
class BatchTask : public kaldi::MultiThreadable {
 public:
  BatchTask(const Kernel &kernel, kaldi::int32 num_batches,
            std::vector<std::exception_ptr> *errors)
      : kernel_(kernel), num_batches_(num_batches), errors_(errors) {}

  void operator()() {
    for (kaldi::int32 b = thread_id_; b < num_batches_; b += num_threads_) {
      try {
        kernel_(b);
      } catch (...) {
        (*errors_)[b] = std::current_exception();
      }
    }
  }

 private:
  Kernel kernel_;
  kaldi::int32 num_batches_;
  std::vector<std::exception_ptr> *errors_;
};

// Workers write disjoint outputs. After all of them joined, the failure
// of the smallest batch index is rethrown on the calling thread.
template <class Kernel>
void RunBatches(const Kernel &kernel, kaldi::int32 num_batches) {
  if (num_batches <= 0) return;
  std::vector<std::exception_ptr> errors(num_batches);
  BatchTask<Kernel> task(kernel, num_batches, &errors);
  if (kaldi::g_num_threads > 1 && num_batches > 1) {
    kaldi::RunMultiThreaded(task);
  } else {
    task.thread_id_ = 0;
    task.num_threads_ = 1;
    task();
  }
  for (kaldi::int32 b = 0; b < num_batches; b++)
    if (errors[b]) std::rethrow_exception(errors[b]);
}

}  // namespace bftk

#endif
