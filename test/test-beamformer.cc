// test-beamformer.cc
// wujian@2018

#include <algorithm>

#include "util/kaldi-thread.h"
#include "include/beamformer.h"
#include "include/complex-base.h"
#include "include/complex-matrix.h"
#include "include/complex-vector.h"
#include "include/tensor.h"

using namespace bftk;

double MaxDiff(const CTensor<double> &a, const CTensor<double> &b) {
    KALDI_ASSERT(a.Dims() == b.Dims());
    double diff = 0;
    for (int32 i = 0; i < a.Size() * 2; i++)
        diff = std::max(diff, std::abs(a.Data()[i] - b.Data()[i]));
    return diff;
}

void RandomMask(const TensorDims &dims, Tensor<double> *mask) {
    mask->Resize(dims);
    for (int32 i = 0; i < mask->Size(); i++)
        mask->Data()[i] = kaldi::RandUniform();
}

// (num_bins, dim, dim), each one is A^H * A + I
void CreateHposdefPsd(int32 num_bins, int32 dim, CTensor<double> *psd) {
    psd->Resize(TensorDims{num_bins, dim, dim});
    CMatrix<double> a(dim, dim);
    for (int32 f = 0; f < num_bins; f++) {
        a.SetRandn();
        SubCMatrix<double> p(psd->Slice(f));
        p.AddMatMat(1, 0, a, kConjTrans, a, kNoTrans, 0, 0);
        p.AddToDiag(1, 0);
    }
}

void TestEstimatePsdHermitian() {
    for (int32 i = 0; i < 10; i++) {
        int32 f = kaldi::Rand() % 6 + 4, t = kaldi::Rand() % 6 + 4, c = kaldi::Rand() % 5 + 3;
        CTensor<double> obs(TensorDims{f, c, t}), psd;
        Tensor<double> mask;
        obs.SetRandn();
        RandomMask(TensorDims{f, t}, &mask);
        Tensor<double> mask_copy(mask);
        EstimatePsd(obs, &mask, PsdOptions(), &psd);
        KALDI_ASSERT(psd.Dims() == (TensorDims{f, c, c}));
        for (int32 j = 0; j < f; j++)
            KALDI_ASSERT(psd.Slice(j).IsHermitian());
        // caller's mask is untouched
        for (int32 j = 0; j < mask.Size(); j++)
            KALDI_ASSERT(mask.Data()[j] == mask_copy.Data()[j]);
    }
}

void TestEstimatePsdWithoutMask() {
    int32 f = 5, t = 7, c = 3;
    CTensor<double> obs(TensorDims{f, c, t}), psd, ref;
    Tensor<double> ones(TensorDims{f, t});
    obs.SetRandn();
    ones.Set(1.0);
    EstimatePsd(obs, NULL, PsdOptions(), &psd);
    EstimatePsd(obs, &ones, PsdOptions(), &ref);
    KALDI_ASSERT(MaxDiff(psd, ref) < 1e-12);
    // psd = \sum_t x(t) * x(t)^H / T
    for (int32 d = 0; d < c; d++)
        for (int32 e = 0; e < c; e++) {
            std::complex<double> sum = 0;
            for (int32 n = 0; n < t; n++)
                sum += obs.Value(TensorDims{2, d, n}) * std::conj(obs.Value(TensorDims{2, e, n}));
            KALDI_ASSERT(std::abs(sum / static_cast<double>(t) -
                                  psd.Value(TensorDims{2, d, e})) < 1e-12);
        }
}

void TestEstimatePsdShapes() {
    int32 F = 51, T = 31, D = 6, K = 2;
    CTensor<double> obs(TensorDims{F, D, T}), psd, psd_k, psd_front;
    obs.SetRandn();
    Tensor<double> mask, mask_k;
    RandomMask(TensorDims{F, T}, &mask);
    EstimatePsd(obs, &mask, PsdOptions(), &psd);
    KALDI_ASSERT(psd.Dims() == (TensorDims{F, D, D}));

    RandomMask(TensorDims{F, K, T}, &mask_k);
    EstimatePsd(obs, &mask_k, PsdOptions(), &psd_k);
    KALDI_ASSERT(psd_k.Dims() == (TensorDims{F, K, D, D}));

    // source axis in front, psd keeps it there
    Tensor<double> mask_front(mask_k);
    mask_front.MoveAxis(1, 0);
    PsdOptions opts;
    opts.source_axis = 0;
    EstimatePsd(obs, &mask_front, opts, &psd_front);
    KALDI_ASSERT(psd_front.Dims() == (TensorDims{K, F, D, D}));
    psd_front.MoveAxis(0, 1);
    KALDI_ASSERT(MaxDiff(psd_front, psd_k) < 1e-12);

    bool thrown = false;
    try {
        Tensor<double> bad(TensorDims{F, T + 1});
        EstimatePsd(obs, &bad, PsdOptions(), &psd);
    } catch (const InvalidArgument &e) {
        thrown = true;
    }
    KALDI_ASSERT(thrown);
}

// bin without any mask weight gives zero psd, others are not affected
void TestEstimatePsdZeroMask() {
    int32 f = 4, t = 6, c = 3, zero_bin = 2;
    CTensor<double> obs(TensorDims{f, c, t}), psd, ref;
    Tensor<double> mask;
    obs.SetRandn();
    RandomMask(TensorDims{f, t}, &mask);
    EstimatePsd(obs, &mask, PsdOptions(), &ref);
    mask.Slice(0).Row(zero_bin).SetZero();
    EstimatePsd(obs, &mask, PsdOptions(), &psd);
    for (int32 i = 0; i < psd.Size() * 2; i++)
        KALDI_ASSERT(KALDI_ISFINITE(psd.Data()[i]));
    for (int32 j = 0; j < f; j++) {
        SubCMatrix<double> p(psd.Slice(j)), r(ref.Slice(j));
        for (int32 d = 0; d < c; d++)
            for (int32 e = 0; e < c; e++) {
                if (j == zero_bin)
                    KALDI_ASSERT(p.Value(d, e) == std::complex<double>(0, 0));
                else
                    KALDI_ASSERT(std::abs(p.Value(d, e) - r.Value(d, e)) < 1e-12);
            }
    }
    // psd = \sum_t m(t) * x(t) * x(t)^H / \sum_t m(t)
    double sum = mask.Slice(0).Row(0).Sum();
    for (int32 d = 0; d < c; d++) {
        std::complex<double> acc = 0;
        for (int32 n = 0; n < t; n++)
            acc += mask(TensorDims{0, n}) * obs.Value(TensorDims{0, d, n}) *
                   std::conj(obs.Value(TensorDims{0, 0, n}));
        KALDI_ASSERT(std::abs(acc / sum - psd.Value(TensorDims{0, d, 0})) < 1e-12);
    }
}

// observation in (frames, sensors, bins) gives the same psd
void TestEstimatePsdAxes() {
    int32 f = 4, t = 9, c = 3;
    CTensor<double> obs(TensorDims{f, c, t}), psd, psd_rev;
    Tensor<double> mask;
    obs.SetRandn();
    RandomMask(TensorDims{f, t}, &mask);
    EstimatePsd(obs, &mask, PsdOptions(), &psd);

    CTensor<double> obs_rev(obs);
    Tensor<double> mask_rev(mask);
    obs_rev.ReverseAxes();
    mask_rev.ReverseAxes();
    PsdOptions opts;
    opts.sensor_axis = 1;
    opts.time_axis = 0;
    EstimatePsd(obs_rev, &mask_rev, opts, &psd_rev);
    KALDI_ASSERT(MaxDiff(psd, psd_rev) < 1e-12);
}

void TestPcaVector() {
    int32 f = 6, c = 4;
    // rank one psd a * a^H + 0.01 * I
    CTensor<double> atf(TensorDims{f, c}), psd(TensorDims{f, c, c}), vector;
    atf.SetRandn();
    for (int32 j = 0; j < f; j++) {
        SubCMatrix<double> p(psd.Slice(j));
        p.AddVecVec(1, 0, atf.Row(j), atf.Row(j), kConj);
        p.AddToDiag(0.01, 0);
    }
    ComputePcaVector(psd, &vector);
    KALDI_ASSERT(vector.Dims() == atf.Dims());
    for (int32 j = 0; j < f; j++) {
        KALDI_ASSERT(std::abs(vector.Row(j).Norm() - 1) < 1e-10);
        double cosine = std::abs(VecVec(vector.Row(j), atf.Row(j), kConj)) /
                        atf.Row(j).Norm();
        KALDI_ASSERT(std::abs(cosine - 1) < 1e-8);
    }
}

void TestMvdrVector() {
    int32 f = 7, c = 4;
    CTensor<double> noise_psd, atf(TensorDims{2, f, c}), vector;
    CreateHposdefPsd(f, c, &noise_psd);
    atf.SetRandn();
    ComputeMvdrVector(atf, noise_psd, &vector);
    KALDI_ASSERT(vector.Dims() == atf.Dims());
    // a^H * w = 1
    for (int32 b = 0; b < atf.NumBatches(1); b++) {
        std::complex<double> response = VecVec(atf.Row(b), vector.Row(b), kConj);
        KALDI_ASSERT(std::abs(response - std::complex<double>(1, 0)) < 1e-8);
    }
    bool thrown = false;
    try {
        CTensor<double> bad_atf(TensorDims{f + 1, c});
        ComputeMvdrVector(bad_atf, noise_psd, &vector);
    } catch (const InvalidArgument &e) {
        thrown = true;
    }
    KALDI_ASSERT(thrown);
}

// T * v = l * N * v, l is the largest one
void TestGevVector() {
    int32 f = 5, c = 4;
    CTensor<double> target_psd, noise_psd, vector;
    CreateHposdefPsd(f, c, &target_psd);
    CreateHposdefPsd(f, c, &noise_psd);
    ComputeGevVector(target_psd, noise_psd, &vector);
    KALDI_ASSERT(vector.Dims() == (TensorDims{f, c}));
    for (int32 j = 0; j < f; j++) {
        SubCVector<double> v(vector.Row(j));
        CVector<double> tv(c), nv(c), u(c);
        tv.AddMatVec(1, 0, target_psd.Slice(j), kNoTrans, v, 0, 0);
        nv.AddMatVec(1, 0, noise_psd.Slice(j), kNoTrans, v, 0, 0);
        double l = std::real(VecVec(v, tv, kConj)) / std::real(VecVec(v, nv, kConj));
        CVector<double> res(tv);
        res.AddVec(-l, 0, nv);
        KALDI_ASSERT(res.Norm() < 1e-8 * tv.Norm());
        // no random vector gives a larger rayleigh quotient
        for (int32 n = 0; n < 10; n++) {
            u.SetRandn();
            tv.AddMatVec(1, 0, target_psd.Slice(j), kNoTrans, u, 0, 0);
            nv.AddMatVec(1, 0, noise_psd.Slice(j), kNoTrans, u, 0, 0);
            KALDI_ASSERT(std::real(VecVec(u, tv, kConj)) / std::real(VecVec(u, nv, kConj))
                         <= l * (1 + 1e-10));
        }
    }
}

int32 g_num_warnings = 0;

void CountWarnings(const kaldi::LogMessageEnvelope &envelope,
                   const char *message) {
    if (envelope.severity == kaldi::LogMessageEnvelope::kWarning)
        g_num_warnings++;
}

// N = -I is not positive definite, fall back to the general solver:
// T * v = -l * v, the largest -l comes from the smallest eigen value of T
void TestGevVectorFallback() {
    int32 f = 3, c = 3;
    CTensor<double> target_psd, noise_psd(TensorDims{f, c, c}), vector;
    CreateHposdefPsd(f, c, &target_psd);
    for (int32 j = 0; j < f; j++)
        noise_psd.Slice(j).AddToDiag(-1, 0);
    // fallback is expected, no warnings are reported
    g_num_warnings = 0;
    kaldi::LogHandler prev_handler = kaldi::SetLogHandler(CountWarnings);
    ComputeGevVector(target_psd, noise_psd, &vector);
    int32 num_fallback_warnings = g_num_warnings;
    // while a singular system is still reported
    CMatrix<double> singular(c, c), rhs(1, c);
    rhs.SetRandn();
    try {
        singular.SolveVecs(&rhs);
    } catch (const NumericalFailure &e) {
    }
    kaldi::SetLogHandler(prev_handler);
    KALDI_ASSERT(num_fallback_warnings == 0);
    KALDI_ASSERT(g_num_warnings == 1);
    for (int32 j = 0; j < f; j++) {
        CMatrix<double> V(c, c);
        Vector<double> D(c);
        target_psd.Slice(j).Hed(&D, &V);
        SubCVector<double> v(vector.Row(j));
        KALDI_ASSERT(std::abs(v.Norm() - 1) < 1e-8);
        KALDI_ASSERT(std::abs(std::abs(VecVec(V.Row(0), v, kConj)) - 1) < 1e-6);
    }
}

void TestLcmvVector() {
    int32 k = 2, f = 6, c = 4;
    CTensor<double> noise_psd, atf(TensorDims{k, f, c}), vector;
    CreateHposdefPsd(f, c, &noise_psd);
    atf.SetRandn();
    CVector<double> response(k);
    response(0, kReal) = 1;
    ComputeLcmvVector(atf, response, noise_psd, &vector);
    KALDI_ASSERT(vector.Dims() == (TensorDims{f, c}));
    for (int32 j = 0; j < f; j++) {
        std::complex<double> pass = VecVec(atf.Row(j), vector.Row(j), kConj),
                             null = VecVec(atf.Row(f + j), vector.Row(j), kConj);
        KALDI_ASSERT(std::abs(pass - std::complex<double>(1, 0)) < 1e-8);
        KALDI_ASSERT(std::abs(null) < 1e-8);
    }
    // single constraint is MVDR
    CTensor<double> steer(TensorDims{1, f, c}), lcmv, mvdr;
    CVector<double> unit(1);
    unit(0, kReal) = 1;
    steer.SetRandn();
    ComputeLcmvVector(steer, unit, noise_psd, &lcmv);
    steer.Reshape(TensorDims{f, c});
    ComputeMvdrVector(steer, noise_psd, &mvdr);
    KALDI_ASSERT(MaxDiff(lcmv, mvdr) < 1e-8);
}

void TestBlindAnalyticNormalization() {
    int32 f = 5, c = 3;
    CTensor<double> noise_psd, vector(TensorDims{f, c});
    CreateHposdefPsd(f, c, &noise_psd);
    vector.SetRandn();
    CTensor<double> normalized(vector);
    BlindAnalyticNormalization(noise_psd, &normalized);
    for (int32 j = 0; j < f; j++) {
        CMatrix<double> nn(c, c);
        nn.AddMatMat(1, 0, noise_psd.Slice(j), kNoTrans, noise_psd.Slice(j), kNoTrans, 0, 0);
        CVector<double> nv(c), nnv(c);
        nv.AddMatVec(1, 0, noise_psd.Slice(j), kNoTrans, vector.Row(j), 0, 0);
        nnv.AddMatVec(1, 0, nn, kNoTrans, vector.Row(j), 0, 0);
        double scale = std::sqrt(std::abs(VecVec(vector.Row(j), nnv, kConj))) /
                       std::abs(VecVec(vector.Row(j), nv, kConj));
        CVector<double> ref(vector.Row(j));
        ref.Scale(scale, 0);
        ref.AddVec(-1, 0, normalized.Row(j));
        KALDI_ASSERT(ref.Norm() < 1e-10);
    }
}

void TestApplyBeamformingVector() {
    int32 f = 4, c = 3, t = 8;
    CTensor<double> vector(TensorDims{f, c}), x(TensorDims{f, c, t}),
                    y(TensorDims{f, c, t}), out_x, out_y, out_mix;
    vector.SetRandn();
    x.SetRandn();
    y.SetRandn();
    ApplyBeamformingVector(vector, x, &out_x);
    KALDI_ASSERT(out_x.Dims() == (TensorDims{f, t}));
    std::complex<double> sum = 0;
    for (int32 d = 0; d < c; d++)
        sum += std::conj(vector.Value(TensorDims{1, d})) * x.Value(TensorDims{1, d, 5});
    KALDI_ASSERT(std::abs(sum - out_x.Value(TensorDims{1, 5})) < 1e-12);

    // linear in mix
    ApplyBeamformingVector(vector, y, &out_y);
    CTensor<double> mix(x);
    mix.Scale(2, -1);
    mix.AddTensor(0.5, 3, y);
    ApplyBeamformingVector(vector, mix, &out_mix);
    out_x.Scale(2, -1);
    out_x.AddTensor(0.5, 3, out_y);
    KALDI_ASSERT(MaxDiff(out_x, out_mix) < 1e-10);
}

void TestBeamformAndRealfft() {
    int32 f = 5, c = 3, t = 6;
    CTensor<double> stft(TensorDims{t, c, f}), mix, vector(TensorDims{f, c}), ref;
    CMatrix<double> weights(f, c), enh;
    stft.SetRandn();
    weights.SetRandn();
    Beamform(stft, weights, &enh);
    KALDI_ASSERT(enh.NumRows() == t && enh.NumCols() == f);
    mix = stft;
    mix.ReverseAxes();
    for (int32 j = 0; j < f; j++)
        vector.Row(j).CopyFromVec(weights.Row(j));
    ApplyBeamformingVector(vector, mix, &ref);
    for (int32 n = 0; n < t; n++)
        for (int32 j = 0; j < f; j++)
            KALDI_ASSERT(std::abs(enh.Value(n, j) - ref.Value(TensorDims{j, n})) < 1e-12);

    Matrix<double> rstft(t, 2 * (f - 1)), cast;
    rstft.SetRandn();
    CMatrix<double> cstft(t, f);
    cstft.CopyFromRealfft(rstft);
    CastIntoRealfft(cstft, &cast);
    KALDI_ASSERT(cast.ApproxEqual(rstft, 1e-12));

    // no frames
    CTensor<double> empty(TensorDims{0, c, f});
    Beamform(empty, weights, &enh);
    KALDI_ASSERT(enh.NumRows() == 0 && enh.NumCols() == 0);
}

// multi-threaded results equal single thread ones, failure of the first
// bad batch reaches the caller
void TestMultiThreaded() {
    int32 f = 16, c = 4;
    CTensor<double> noise_psd, atf(TensorDims{f, c}), single, multi;
    CreateHposdefPsd(f, c, &noise_psd);
    atf.SetRandn();
    kaldi::g_num_threads = 1;
    ComputeMvdrVector(atf, noise_psd, &single);
    kaldi::g_num_threads = 4;
    ComputeMvdrVector(atf, noise_psd, &multi);
    KALDI_ASSERT(MaxDiff(single, multi) < 1e-12);

    noise_psd.Slice(9).SetZero();
    noise_psd.Slice(13).SetZero();
    bool thrown = false;
    try {
        ComputeMvdrVector(atf, noise_psd, &multi);
    } catch (const NumericalFailure &e) {
        thrown = true;
    }
    KALDI_ASSERT(thrown);
    kaldi::g_num_threads = 1;
}

int main() {
    TestEstimatePsdHermitian();
    TestEstimatePsdWithoutMask();
    TestEstimatePsdShapes();
    TestEstimatePsdZeroMask();
    TestEstimatePsdAxes();
    TestPcaVector();
    TestMvdrVector();
    TestGevVector();
    TestGevVectorFallback();
    TestLcmvVector();
    TestBlindAnalyticNormalization();
    TestApplyBeamformingVector();
    TestBeamformAndRealfft();
    TestMultiThreaded();
    KALDI_LOG << "Test OK.";
    return 0;
}
