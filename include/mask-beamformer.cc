// mask-beamformer.cc
// wujian@2018

#include "include/mask-beamformer.h"

namespace bftk {

// Reverse axes of mix and given masks into (bins, sensors, frames) and
// (bins, frames), and derive the missing mask(if required)
static void PrepareInputs(const CTensor<double> &mix,
                          const Tensor<double> *target_mask,
                          const Tensor<double> *noise_mask,
                          bool require_noise, double mask_clip,
                          CTensor<double> *obs, Tensor<double> *target,
                          Tensor<double> *noise) {
    if (target_mask == NULL && noise_mask == NULL)
        ThrowError<InvalidArgument>(
            ErrorStream() << "At least one mask needs to be present");
    *obs = mix;
    obs->ReverseAxes();
    if (target_mask) {
        *target = *target_mask;
        target->ReverseAxes();
    }
    if (noise_mask) {
        *noise = *noise_mask;
        noise->ReverseAxes();
    }
    // mask = clip(1 - other, mask_clip, 1)
    Tensor<double> *missing = NULL;
    if (target_mask == NULL) {
        *target = *noise;
        missing = target;
    } else if (noise_mask == NULL && require_noise) {
        *noise = *target;
        missing = noise;
    }
    if (missing) {
        double *data = missing->Data();
        for (int32 i = 0; i < missing->Size(); i++)
            data[i] = std::min(std::max(1.0 - data[i], mask_clip), 1.0);
    }
}

static void ApplyAndRestore(const CTensor<double> &vector,
                            const CTensor<double> &obs,
                            CTensor<double> *enhanced) {
    ApplyBeamformingVector(vector, obs, enhanced);
    enhanced->ReverseAxes();
}

void GevOnMasks(const CTensor<double> &mix, const Tensor<double> *target_mask,
                const Tensor<double> *noise_mask, bool normalize,
                CTensor<double> *enhanced, double mask_clip) {
    CTensor<double> obs, target_psd, noise_psd, vector;
    Tensor<double> target, noise;
    PrepareInputs(mix, target_mask, noise_mask, true, mask_clip, &obs, &target,
                  &noise);
    PsdOptions psd_opts;
    EstimatePsd(obs, &target, psd_opts, &target_psd);
    EstimatePsd(obs, &noise, psd_opts, &noise_psd);

    ComputeGevVector(target_psd, noise_psd, &vector);
    if (normalize)
        BlindAnalyticNormalization(noise_psd, &vector);
    ApplyAndRestore(vector, obs, enhanced);
}

void PcaOnMasks(const CTensor<double> &mix, const Tensor<double> *target_mask,
                const Tensor<double> *noise_mask, CTensor<double> *enhanced,
                double mask_clip) {
    CTensor<double> obs, target_psd, vector;
    Tensor<double> target, noise;
    PrepareInputs(mix, target_mask, noise_mask, false, mask_clip, &obs, &target,
                  &noise);
    PsdOptions psd_opts;
    EstimatePsd(obs, &target, psd_opts, &target_psd);

    ComputePcaVector(target_psd, &vector);
    ApplyAndRestore(vector, obs, enhanced);
}

void PcaMvdrOnMasks(const CTensor<double> &mix,
                    const Tensor<double> *target_mask,
                    const Tensor<double> *noise_mask, double regularization,
                    CTensor<double> *enhanced, double mask_clip) {
    CTensor<double> obs, target_psd, noise_psd, steer_vector, vector;
    Tensor<double> target, noise;
    PrepareInputs(mix, target_mask, noise_mask, true, mask_clip, &obs, &target,
                  &noise);
    PsdOptions psd_opts;
    EstimatePsd(obs, &target, psd_opts, &target_psd);
    EstimatePsd(obs, &noise, psd_opts, &noise_psd);

    if (regularization != 0) {
        for (int32 f = 0; f < noise_psd.NumBatches(2); f++)
            noise_psd.Slice(f).AddToDiag(regularization, 0);
    }
    ComputePcaVector(target_psd, &steer_vector);
    ComputeMvdrVector(steer_vector, noise_psd, &vector);
    ApplyAndRestore(vector, obs, enhanced);
}

void MaskBeamform(const MaskBeamformerOptions &opts, const CTensor<double> &mix,
                  const Tensor<double> *target_mask,
                  const Tensor<double> *noise_mask, CTensor<double> *enhanced) {
    KALDI_VLOG(2) << "Apply " << opts.beamformer << " beamformer on mixture "
                  << DimsToString(mix.Dims());
    if (opts.beamformer == "gev")
        GevOnMasks(mix, target_mask, noise_mask, opts.normalize, enhanced,
                   opts.mask_clip);
    else if (opts.beamformer == "pca")
        PcaOnMasks(mix, target_mask, noise_mask, enhanced, opts.mask_clip);
    else if (opts.beamformer == "pca-mvdr")
        PcaMvdrOnMasks(mix, target_mask, noise_mask, opts.regularization,
                       enhanced, opts.mask_clip);
    else
        ThrowError<InvalidArgument>(
            ErrorStream() << "Unknown beamformer: " << opts.beamformer
                          << ", expect gev|pca|pca-mvdr");
}

}  // namespace bftk
