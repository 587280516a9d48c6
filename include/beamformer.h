// include/beamformer.h

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

#ifndef BFTK_BEAMFORMER_H_
#define BFTK_BEAMFORMER_H_

#include "include/complex-base.h"
#include "include/complex-matrix.h"
#include "include/complex-vector.h"
#include "include/tensor.h"
#include "itf/options-itf.h"

namespace bftk {

struct PsdOptions {
    int32 sensor_axis;
    int32 source_axis;
    int32 time_axis;
    double mask_floor;

    PsdOptions()
        : sensor_axis(-2), source_axis(-2), time_axis(-1), mask_floor(1e-10) {}

    void Register(kaldi::OptionsItf *opts) {
        opts->Register("sensor-axis", &sensor_axis,
                       "Axis of sensors in the observation tensor");
        opts->Register("source-axis", &source_axis,
                       "Axis of sources in the mask tensor, if the mask "
                       "carries one");
        opts->Register("time-axis", &time_axis,
                       "Axis of time frames in the observation tensor");
        opts->Register("mask-floor", &mask_floor,
                       "Floor of the mask sum when normalizing along time");
    }
};

// Cast CMatrix into Matrix, in Realfft format, to reconstruct speech
// cstft:   (num_frames, num_bins), num_bins = fft_len / 2 + 1
// rstft:   (num_frames, fft_len)
template <typename Real>
void CastIntoRealfft(const CMatrixBase<Real> &cstft, Matrix<Real> *rstft);

// observation: (..., sensors, frames), positions given by opts
// mask:        NULL, (...,  frames) or (..., sources, frames)
// psd:         (..., sensors, sensors) or (..., sources, sensors, sensors)
//
// Without mask, psd = \sum_t x(t) * x(t)^H / T. Otherwise the mask is copied
// and normalized along time by max(sum, mask_floor), then
//      psd = \sum_t m(t) * x(t) * x(t)^H
// A mask without source axis shares the layout of the observation with the
// sensor axis removed. If the source axis is in front of the batch axes
// (source_axis < -2), it stays there in psd.
void EstimatePsd(const CTensor<double> &observation,
                 const Tensor<double> *mask, const PsdOptions &opts,
                 CTensor<double> *psd);

// target_psd:  (..., sensors, sensors), Hermitian
// vector:      (..., sensors)
// eigen vector of the largest eigen value, with unit norm
void ComputePcaVector(const CTensor<double> &target_psd,
                      CTensor<double> *vector);

// atf:         (..., bins, sensors)
// noise_psd:   (bins, sensors, sensors), leading axes of noise_psd must
//              match the trailing batch axes of atf
// vector:      (..., bins, sensors)
// NOTE mvdr:
//      x = N^{-1} * a, solved from N * x = a
//      w = x / (a^H * x)
// Throws NumericalFailure if noise_psd is singular
void ComputeMvdrVector(const CTensor<double> &atf,
                       const CTensor<double> &noise_psd,
                       CTensor<double> *vector);

// target_psd:  (bins, sensors, sensors)
// noise_psd:   (bins, sensors, sensors)
// vector:      (bins, sensors)
// solve T * v = l * N * v and keep v of the largest l. Falls back to the
// general generalized eigen solver if N is not positive definite.
void ComputeGevVector(const CTensor<double> &target_psd,
                      const CTensor<double> &noise_psd,
                      CTensor<double> *vector);

// atf:         (targets, bins, sensors)
// response:    (targets)
// noise_psd:   (bins, sensors, sensors)
// vector:      (bins, sensors)
//      w = N^{-1} * H * (H^H * N^{-1} * H)^{-1} * r
void ComputeLcmvVector(const CTensor<double> &atf,
                       const CVectorBase<double> &response,
                       const CTensor<double> &noise_psd,
                       CTensor<double> *vector);

// vector:      (bins, sensors), scaled in place by
//      |sqrt(v^H * N * N * v)| / |v^H * N * v|
// noise_psd:   (bins, sensors, sensors)
void BlindAnalyticNormalization(const CTensor<double> &noise_psd,
                                CTensor<double> *vector);

// vector:      (..., sensors)
// mix:         (..., sensors, frames)
// output:      (..., frames), output(t) = \sum_d v(d)' * x(d, t)
void ApplyBeamformingVector(const CTensor<double> &vector,
                            const CTensor<double> &mix,
                            CTensor<double> *output);

// src_stft:    (num_frames, num_channels, num_bins)
// weights:     (num_bins, num_channels)
// enh_stft:    (num_frames, num_bins)
void Beamform(const CTensor<double> &src_stft,
              const CMatrixBase<double> &weights,
              CMatrix<double> *enh_stft);

}  // namespace bftk

#endif
