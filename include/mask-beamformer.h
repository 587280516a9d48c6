// include/mask-beamformer.h

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

#ifndef BFTK_MASK_BEAMFORMER_H_
#define BFTK_MASK_BEAMFORMER_H_

#include <string>

#include "include/beamformer.h"
#include "include/tensor.h"
#include "itf/options-itf.h"

namespace bftk {

struct MaskBeamformerOptions {
    std::string beamformer;
    bool normalize;
    double regularization;
    double mask_clip;

    MaskBeamformerOptions()
        : beamformer("gev"), normalize(false), regularization(0.0),
          mask_clip(1e-6) {}

    void Register(kaldi::OptionsItf *opts) {
        opts->Register("beamformer", &beamformer,
                       "Type of beamformer, one of gev|pca|pca-mvdr");
        opts->Register("normalize", &normalize,
                       "If true, apply blind analytic normalization on "
                       "gev beamformer");
        opts->Register("regularization", &regularization,
                       "Scale of identity matrix added to noise psd in "
                       "pca-mvdr beamformer");
        opts->Register("mask-clip", &mask_clip,
                       "Lower bound of the mask derived as 1 - (the other mask)");
    }
};

// All functions below take signals in caller layout:
// mix:         (frames, sensors, bins)
// target_mask: (frames, bins) or NULL
// noise_mask:  (frames, bins) or NULL
// enhanced:    (frames, bins)
// At least one mask must be given, otherwise InvalidArgument is thrown.
// The missing one is derived as clip(1 - other, mask_clip, 1).
// Caller's masks are never modified.

void GevOnMasks(const CTensor<double> &mix, const Tensor<double> *target_mask,
                const Tensor<double> *noise_mask, bool normalize,
                CTensor<double> *enhanced, double mask_clip = 1e-6);

// noise_mask is used only to derive a missing target_mask
void PcaOnMasks(const CTensor<double> &mix, const Tensor<double> *target_mask,
                const Tensor<double> *noise_mask, CTensor<double> *enhanced,
                double mask_clip = 1e-6);

// PCA vector of target psd is used as steer vector of MVDR,
// regularization * I is added to noise psd if regularization != 0
void PcaMvdrOnMasks(const CTensor<double> &mix,
                    const Tensor<double> *target_mask,
                    const Tensor<double> *noise_mask, double regularization,
                    CTensor<double> *enhanced, double mask_clip = 1e-6);

// Dispatch on opts.beamformer
void MaskBeamform(const MaskBeamformerOptions &opts, const CTensor<double> &mix,
                  const Tensor<double> *target_mask,
                  const Tensor<double> *noise_mask, CTensor<double> *enhanced);

}  // namespace bftk

#endif
