// beamformer.cc
// wujian@2018

#include <algorithm>
#include <limits>

#include "include/batch-task.h"
#include "include/beamformer.h"

namespace bftk {

// Cast CMatrix into Matrix(in Realfft format), for speech reconstrucion
template <typename Real>
void CastIntoRealfft(const CMatrixBase<Real> &cstft, Matrix<Real> *rstft) {
    int32 num_rows = cstft.NumRows(), num_cols = (cstft.NumCols() - 1) * 2;
    KALDI_ASSERT(cstft.NumCols() >= 2);
    rstft->Resize(num_rows, num_cols);
    for (int32 r = 0; r < num_rows; r++) {
        for (int32 c = 0; c < cstft.NumCols(); c++) {
            if (c == 0)
                (*rstft)(r, 0) = cstft(r, c, kReal);
            else if (c == cstft.NumCols() - 1)
                (*rstft)(r, 1) = cstft(r, c, kReal);
            else
                (*rstft)(r, c * 2) = cstft(r, c, kReal), (*rstft)(r, c * 2 + 1) = cstft(r, c, kImag);
        }
    }
}

template void CastIntoRealfft(const CMatrixBase<float> &cstft, Matrix<float> *rstft);
template void CastIntoRealfft(const CMatrixBase<double> &cstft, Matrix<double> *rstft);

// psd in shape (..., D, D), returns D
static int32 CheckSquareBatches(const CTensor<double> &psd, const char *name) {
    if (psd.NumAxes() < 2 || psd.Dim(-1) != psd.Dim(-2) || psd.Dim(-1) == 0)
        ThrowError<InvalidArgument>(
            ErrorStream() << "Expect " << name << " in shape (..., D, D), got "
                          << DimsToString(psd.Dims()));
    return psd.Dim(-1);
}

static bool DimsEqual(const TensorDims &a, int32 a_begin, int32 a_end,
                      const TensorDims &b, int32 b_begin, int32 b_end) {
    if (a_end - a_begin != b_end - b_begin) return false;
    return std::equal(a.begin() + a_begin, a.begin() + a_end, b.begin() + b_begin);
}

// Largest real part of alpha / beta, infinite eigen values (beta == 0) count
// as +inf if Re(alpha) > 0 and -inf otherwise
static int32 ArgmaxRealPart(const CVectorBase<double> &alpha,
                            const CVectorBase<double> &beta) {
    const double inf = std::numeric_limits<double>::infinity();
    int32 max_index = 0;
    double max_value = -inf;
    for (int32 i = 0; i < alpha.Dim(); i++) {
        std::complex<double> a = alpha.Value(i), b = beta.Value(i);
        double value = (b == std::complex<double>(0, 0) ?
                        (std::real(a) > 0 ? inf : -inf) : std::real(a / b));
        if (i == 0 || value > max_value) max_value = value, max_index = i;
    }
    return max_index;
}

// observation is transposed into (..., sensors, frames) and mask into
// (..., sources, frames), sources = 1 if mask has no source axis
void EstimatePsd(const CTensor<double> &observation,
                 const Tensor<double> *mask, const PsdOptions &opts,
                 CTensor<double> *psd) {
    int32 num_axes = observation.NumAxes();
    if (num_axes < 2)
        ThrowError<InvalidArgument>(
            ErrorStream() << "Expect at least 2 axes in observation, got "
                          << DimsToString(observation.Dims()));
    int32 sensor_axis = NormalizeAxis(opts.sensor_axis, num_axes),
          time_axis = NormalizeAxis(opts.time_axis, num_axes);
    if (sensor_axis == time_axis)
        ThrowError<InvalidArgument>(
            ErrorStream() << "Sensor axis and time axis are both "
                          << sensor_axis);

    std::vector<MatrixIndexT> perm;
    for (int32 i = -num_axes; i < 0; i++)
        if (i != sensor_axis && i != time_axis) perm.push_back(i);
    perm.push_back(sensor_axis);
    perm.push_back(time_axis);

    CTensor<double> obs(observation);
    obs.Transpose(perm);
    int32 num_sensors = obs.Dim(-2), num_frames = obs.Dim(-1),
          num_batches = obs.NumBatches(2);
    if (num_sensors == 0 || num_frames == 0)
        ThrowError<InvalidArgument>(
            ErrorStream() << "No sensors or frames in observation "
                          << DimsToString(observation.Dims()));
    TensorDims batch_dims(obs.Dims().begin(), obs.Dims().end() - 2);

    // copy then normalize, caller's mask is untouched
    Tensor<double> weights;
    int32 num_sources = 1, source_axis = 0;
    if (mask == NULL) {
        weights.Resize(TensorDims(1, num_batches * num_frames), kUndefined);
        weights.Set(1.0 / num_frames);
    } else {
        weights = *mask;
        std::vector<MatrixIndexT> mask_perm;
        if (mask->NumAxes() + 1 == num_axes) {
            int32 mask_axes = mask->NumAxes(),
                  mask_time = (time_axis > sensor_axis ? time_axis : time_axis + 1);
            for (int32 i = -mask_axes; i < 0; i++)
                if (i != mask_time) mask_perm.push_back(i);
            mask_perm.push_back(mask_time);
        } else if (mask->NumAxes() == num_axes) {
            source_axis = NormalizeAxis(opts.source_axis, num_axes);
            if (source_axis == time_axis)
                ThrowError<InvalidArgument>(
                    ErrorStream() << "Source axis and time axis are both "
                                  << source_axis);
            for (int32 i = -num_axes; i < 0; i++)
                if (i != source_axis && i != time_axis) mask_perm.push_back(i);
            mask_perm.push_back(source_axis);
            mask_perm.push_back(time_axis);
        } else {
            ThrowError<InvalidArgument>(
                ErrorStream() << "Mask " << DimsToString(mask->Dims())
                              << " does not fit observation "
                              << DimsToString(observation.Dims()));
        }
        weights.Transpose(mask_perm);
        if (mask->NumAxes() == num_axes) num_sources = weights.Dim(-2);
        int32 num_lead = weights.NumAxes() - (mask->NumAxes() == num_axes ? 2 : 1);
        if (weights.Dim(-1) != num_frames ||
            !DimsEqual(weights.Dims(), 0, num_lead, batch_dims, 0, batch_dims.size()))
            ThrowError<InvalidArgument>(
                ErrorStream() << "Mask " << DimsToString(mask->Dims())
                              << " does not fit observation "
                              << DimsToString(observation.Dims()));
        weights.Reshape(TensorDims(1, weights.Size()));
        for (int32 r = 0; r < num_batches * num_sources; r++) {
            SubVector<double> m(weights.Data() + r * num_frames, num_frames);
            m.Scale(1.0 / std::max(m.Sum(), opts.mask_floor));
        }
    }
    weights.Reshape(TensorDims{num_batches * num_sources, num_frames});

    TensorDims psd_dims(batch_dims);
    if (mask != NULL && mask->NumAxes() == num_axes) psd_dims.push_back(num_sources);
    psd_dims.push_back(num_sensors);
    psd_dims.push_back(num_sensors);
    psd->Resize(psd_dims);
    psd->Reshape(TensorDims{num_batches * num_sources, num_sensors, num_sensors});

    // psd = \sum_t m(t) * x(t) * x(t)^H = (X .* m) * X^H
    RunBatches([&](int32 b) {
        SubCMatrix<double> x(obs.Slice(b));
        CMatrix<double> weighted(num_sensors, num_frames, kUndefined);
        for (int32 k = 0; k < num_sources; k++) {
            weighted.CopyFromMat(x);
            weighted.MulColsVec(weights.Row(b * num_sources + k));
            psd->Slice(b * num_sources + k).AddMatMat(1, 0, weighted, kNoTrans,
                                                      x, kConjTrans, 0, 0);
        }
    }, num_batches);

    psd->Reshape(psd_dims);
    // keep psd in shape (sources, ..., sensors, sensors)
    if (mask != NULL && mask->NumAxes() == num_axes && source_axis < -2)
        psd->MoveAxis(-3, source_axis + num_axes);
}

// using maximum eigen vector as estimation of steer vector
void ComputePcaVector(const CTensor<double> &target_psd,
                      CTensor<double> *vector) {
    int32 num_sensors = CheckSquareBatches(target_psd, "target_psd"),
          num_batches = target_psd.NumBatches(2);
    TensorDims dims(target_psd.Dims().begin(), target_psd.Dims().end() - 1);
    vector->Resize(dims);

    RunBatches([&](int32 b) {
        CMatrix<double> V(num_sensors, num_sensors);
        Vector<double> D(num_sensors);
        target_psd.Slice(b).Hed(&D, &V);
        int32 max_index;
        D.Max(&max_index);
        KALDI_VLOG(3) << "Computed eigen values:" << D;
        vector->Row(b).CopyFromVec(V.Row(max_index));
    }, num_batches);
}

// note mvdr beam weights computation:
//      w = \frac{R^{-1} * d}{d^H * R^{-1} * d}
void ComputeMvdrVector(const CTensor<double> &atf,
                       const CTensor<double> &noise_psd,
                       CTensor<double> *vector) {
    int32 num_sensors = CheckSquareBatches(noise_psd, "noise_psd");
    int32 num_lead = noise_psd.NumAxes() - 2;
    if (atf.NumAxes() < num_lead + 1 || atf.Dim(-1) != num_sensors ||
        !DimsEqual(atf.Dims(), atf.NumAxes() - 1 - num_lead, atf.NumAxes() - 1,
                   noise_psd.Dims(), 0, num_lead))
        ThrowError<InvalidArgument>(
            ErrorStream() << "ATF " << DimsToString(atf.Dims())
                          << " does not fit noise_psd "
                          << DimsToString(noise_psd.Dims()));
    // make sure matrix is hermitian
    CTensor<double> psd(noise_psd);
    int32 num_psd = psd.NumBatches(2), num_batches = atf.NumBatches(1);
    for (int32 f = 0; f < num_psd; f++)
        psd.Slice(f).Symmetrize();

    vector->Resize(atf.Dims());
    RunBatches([&](int32 b) {
        SubCVector<double> steer(atf.Row(b));
        CMatrix<double> numerator(1, num_sensors);
        numerator.Row(0).CopyFromVec(steer);
        psd.Slice(b % num_psd).SolveVecs(&numerator);
        // near zero denominator gives inf/nan
        std::complex<double> s = std::complex<double>(1.0, 0) /
                                 VecVec(steer, numerator.Row(0), kConj);
        KALDI_VLOG(3) << "1 / (d^H * R^{-1} * d): " << "(" << std::real(s)
                      << (std::imag(s) >= 0 ? "+": "") << std::imag(s) << ")";
        SubCVector<double> w(vector->Row(b));
        w.CopyFromVec(numerator.Row(0));
        w.Scale(std::real(s), std::imag(s));
    }, num_batches);
}

void ComputeGevVector(const CTensor<double> &target_psd,
                      const CTensor<double> &noise_psd,
                      CTensor<double> *vector) {
    if (target_psd.NumAxes() != 3 || target_psd.Dims() != noise_psd.Dims())
        ThrowError<InvalidArgument>(
            ErrorStream() << "Expect target_psd and noise_psd in shape "
                          << "(bins, sensors, sensors), got "
                          << DimsToString(target_psd.Dims()) << " and "
                          << DimsToString(noise_psd.Dims()));
    int32 num_sensors = CheckSquareBatches(target_psd, "target_psd"),
          num_bins = target_psd.Dim(0);
    vector->Resize(TensorDims{num_bins, num_sensors});

    RunBatches([&](int32 f) {
        CMatrix<double> T(target_psd.Slice(f)), N(noise_psd.Slice(f)),
                        V(num_sensors, num_sensors);
        T.Symmetrize();
        N.Symmetrize();
        int32 max_index;
        try {
            Vector<double> D(num_sensors);
            T.Hged(N, &D, &V);
            D.Max(&max_index);
            KALDI_VLOG(3) << "Computed eigen values:" << D;
        } catch (const NumericalFailure &e) {
            KALDI_VLOG(3) << "Bin " << f << ": " << e.what()
                          << ", fall back to general eigen solver";
            CVector<double> alpha(num_sensors), beta(num_sensors);
            T.Ged(N, &alpha, &beta, &V);
            max_index = ArgmaxRealPart(alpha, beta);
            KALDI_VLOG(3) << "Computed alpha:" << alpha << "beta:" << beta;
        }
        vector->Row(f).CopyFromVec(V.Row(max_index));
    }, num_bins);
}

void ComputeLcmvVector(const CTensor<double> &atf,
                       const CVectorBase<double> &response,
                       const CTensor<double> &noise_psd,
                       CTensor<double> *vector) {
    if (noise_psd.NumAxes() != 3)
        ThrowError<InvalidArgument>(
            ErrorStream() << "Expect noise_psd in shape (bins, sensors, sensors), got "
                          << DimsToString(noise_psd.Dims()));
    int32 num_sensors = CheckSquareBatches(noise_psd, "noise_psd"),
          num_bins = noise_psd.Dim(0);
    if (atf.NumAxes() != 3 || atf.Dim(1) != num_bins || atf.Dim(2) != num_sensors ||
        atf.Dim(0) != response.Dim() || response.Dim() == 0)
        ThrowError<InvalidArgument>(
            ErrorStream() << "ATF " << DimsToString(atf.Dims())
                          << " and response (" << response.Dim()
                          << ") do not fit noise_psd "
                          << DimsToString(noise_psd.Dims()));
    int32 num_targets = atf.Dim(0);
    vector->Resize(TensorDims{num_bins, num_sensors});

    RunBatches([&](int32 f) {
        // row k of H is atf[k, f]
        CMatrix<double> H(num_targets, num_sensors);
        for (int32 k = 0; k < num_targets; k++)
            H.Row(k).CopyFromVec(atf.Row(k * num_bins + f));
        // row k of X is N^{-1} * h_k
        CMatrix<double> X(H);
        noise_psd.Slice(f).SolveVecs(&X);
        // G(k, l) = h_k^H * N^{-1} * h_l, computed as its transpose X * H^H
        CMatrix<double> GT(num_targets, num_targets);
        GT.AddMatMat(1, 0, X, kNoTrans, H, kConjTrans, 0, 0);
        CMatrix<double> G(GT, kTrans), r(1, num_targets);
        r.Row(0).CopyFromVec(response);
        G.SolveVecs(&r);
        vector->Row(f).AddMatVec(1, 0, X, kTrans, r.Row(0), 0, 0);
    }, num_bins);
}

void BlindAnalyticNormalization(const CTensor<double> &noise_psd,
                                CTensor<double> *vector) {
    int32 num_sensors = CheckSquareBatches(noise_psd, "noise_psd");
    if (noise_psd.NumAxes() != 3 || vector->NumAxes() != 2 ||
        vector->Dim(0) != noise_psd.Dim(0) || vector->Dim(1) != num_sensors)
        ThrowError<InvalidArgument>(
            ErrorStream() << "Vector " << DimsToString(vector->Dims())
                          << " does not fit noise_psd "
                          << DimsToString(noise_psd.Dims()));
    int32 num_bins = noise_psd.Dim(0);
    RunBatches([&](int32 f) {
        SubCVector<double> v(vector->Row(f));
        SubCMatrix<double> N(noise_psd.Slice(f));
        CVector<double> nv(num_sensors), nnv(num_sensors);
        nv.AddMatVec(1, 0, N, kNoTrans, v, 0, 0);
        nnv.AddMatVec(1, 0, N, kNoTrans, nv, 0, 0);
        double scale = std::abs(std::sqrt(VecVec(v, nnv, kConj))) /
                       std::abs(VecVec(v, nv, kConj));
        KALDI_VLOG(3) << "Bin " << f << ": normalization factor " << scale;
        v.Scale(scale, 0);
    }, num_bins);
}

void ApplyBeamformingVector(const CTensor<double> &vector,
                            const CTensor<double> &mix,
                            CTensor<double> *output) {
    if (vector.NumAxes() < 1 || mix.NumAxes() != vector.NumAxes() + 1 ||
        !DimsEqual(vector.Dims(), 0, vector.NumAxes(), mix.Dims(), 0, mix.NumAxes() - 1))
        ThrowError<InvalidArgument>(
            ErrorStream() << "Vector " << DimsToString(vector.Dims())
                          << " does not fit mix "
                          << DimsToString(mix.Dims()));
    TensorDims dims(mix.Dims());
    dims.erase(dims.end() - 2);
    output->Resize(dims);
    if (mix.Dim(-1) == 0 || mix.Dim(-2) == 0) return;
    // y = (X^H * w)' = X^T * w'
    RunBatches([&](int32 b) {
        SubCVector<double> y(output->Row(b));
        y.AddMatVec(1, 0, mix.Slice(b), kConjTrans, vector.Row(b), 0, 0);
        y.Conjugate();
    }, vector.NumBatches(1));
}

// enh_stft[t, f] = w_f^H * src_stft[t, :, f]
void Beamform(const CTensor<double> &src_stft,
              const CMatrixBase<double> &weights,
              CMatrix<double> *enh_stft) {
    if (src_stft.NumAxes() != 3 || src_stft.Dim(1) != weights.NumCols() ||
        src_stft.Dim(2) != weights.NumRows())
        ThrowError<InvalidArgument>(
            ErrorStream() << "Weights " << weights.NumRows() << " x "
                          << weights.NumCols() << " do not fit stft "
                          << DimsToString(src_stft.Dims()));
    int32 num_bins = weights.NumRows(), num_channels = weights.NumCols();
    // CMatrix can not be (0 x N) or (N x 0)
    if (src_stft.Dim(0) == 0 || num_bins == 0) {
        enh_stft->Resize(0, 0);
        return;
    }
    CTensor<double> mix(src_stft), vector(TensorDims{num_bins, num_channels}),
                    enh;
    mix.ReverseAxes();
    for (int32 f = 0; f < num_bins; f++)
        vector.Row(f).CopyFromVec(weights.Row(f));
    ApplyBeamformingVector(vector, mix, &enh);
    enh_stft->Resize(src_stft.Dim(0), num_bins);
    enh_stft->CopyFromMat(enh.Slice(0), kTrans);
}

}  // namespace bftk
