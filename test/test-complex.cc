// test-complex.cc
// wujian@2018

#include <algorithm>
#include <sstream>

#include "include/complex-base.h"
#include "include/complex-vector.h"
#include "include/complex-matrix.h"

using namespace bftk;

template <typename Real>
Real MaxDiff(const CVectorBase<Real> &a, const CVectorBase<Real> &b) {
    KALDI_ASSERT(a.Dim() == b.Dim());
    Real diff = 0;
    for (int32 i = 0; i < a.Dim(); i++)
        diff = std::max(diff, std::abs(a.Value(i) - b.Value(i)));
    return diff;
}

template <typename Real>
Real MaxDiff(const CMatrixBase<Real> &a, const CMatrixBase<Real> &b) {
    KALDI_ASSERT(a.NumRows() == b.NumRows() && a.NumCols() == b.NumCols());
    Real diff = 0;
    for (int32 i = 0; i < a.NumRows(); i++)
        diff = std::max(diff, MaxDiff(a.Row(i), b.Row(i)));
    return diff;
}

void CreateHermiteCmatrix(CMatrix<double> *cm, MatrixIndexT s) {
    cm->Resize(s, s);
    cm->SetRandn();
    for (MatrixIndexT i = 0; i < s; i++) {
        for (MatrixIndexT j = 0; j < i; j++) {
            (*cm)(j, i, kReal) = (*cm)(i, j, kReal);
            (*cm)(j, i, kImag) = -(*cm)(i, j, kImag);
        }
        (*cm)(i, i, kImag) = 0;
    }
}

// A^H * A + I
void CreateHposdefCmatrix(CMatrix<double> *cm, int32 dim) {
    CMatrix<double> a(dim, dim);
    cm->Resize(dim, dim);
    a.SetRandn();
    cm->AddMatMat(1, 0, a, kConjTrans, a, kNoTrans, 0, 0);
    cm->AddToDiag(1, 0);
}

void TestCVectorInit() {
    CVector<float> v(10);
    v.SetRandn();
    CVector<float> copy(v);
    v.Resize(20, kCopyData);
    KALDI_ASSERT(v.Dim() == 20);
    KALDI_ASSERT(MaxDiff(v.Range(0, 10), copy) == 0);
    KALDI_ASSERT(v(15, kReal) == 0 && v(15, kImag) == 0);
    v.Resize(8, kCopyData);
    KALDI_ASSERT(MaxDiff(v, copy.Range(0, 8)) == 0);

    Vector<float> rv(10);
    rv.SetRandn();
    CVector<float> real(rv, kReal), imag(rv, kImag);
    for (int32 i = 0; i < 10; i++) {
        KALDI_ASSERT(real(i, kReal) == rv(i) && real(i, kImag) == 0);
        KALDI_ASSERT(imag(i, kImag) == rv(i) && imag(i, kReal) == 0);
    }
    std::complex<float> sum = 0;
    for (int32 i = 0; i < copy.Dim(); i++) sum += copy.Value(i);
    KALDI_ASSERT(std::abs(sum - copy.Sum()) < 1e-4);
}

void TestCVectorScaleAddVec() {
    for (int32 i = 0; i < 5; i++) {
        int32 dim = kaldi::Rand() % 6 + 2;
        CVector<double> v1(dim), v2(dim), ans(dim);
        v1.SetRandn(), v2.SetRandn();
        std::complex<double> a(kaldi::RandGauss(), kaldi::RandGauss());
        for (int32 d = 0; d < dim; d++)
            ans.SetValue(d, v1.Value(d) * a + v2.Value(d));
        v1.Scale(std::real(a), std::imag(a));
        v1.AddVec(1, 0, v2);
        KALDI_ASSERT(MaxDiff(v1, ans) < 1e-10);
    }
}

void TestVecVec() {
    for (int32 i = 0; i < 10; i++) {
        int32 dim = kaldi::Rand() % 6 + 2;
        CVector<double> v1(dim), v2(dim);
        v1.SetRandn(), v2.SetRandn();
        std::complex<double> dotu = 0, dotc = 0;
        for (int32 d = 0; d < dim; d++) {
            dotu += v1.Value(d) * v2.Value(d);
            dotc += std::conj(v1.Value(d)) * v2.Value(d);
        }
        KALDI_ASSERT(std::abs(VecVec(v1, v2) - dotu) < 1e-10);
        KALDI_ASSERT(std::abs(VecVec(v1, v2, kConj) - dotc) < 1e-10);
    }
}

void TestAddMatVec() {
    for (int32 i = 0; i < 10; i++) {
        int32 r = kaldi::Rand() % 6 + 2, c = kaldi::Rand() % 6 + 2;
        CMatrix<double> m(r, c);
        CVector<double> x(c), y(r), mv(r), mhy(c), ans_mv(r), ans_mhy(c);
        m.SetRandn(), x.SetRandn(), y.SetRandn();
        for (int32 j = 0; j < r; j++)
            for (int32 k = 0; k < c; k++) {
                ans_mv.SetValue(j, ans_mv.Value(j) + m.Value(j, k) * x.Value(k));
                ans_mhy.SetValue(k, ans_mhy.Value(k) + std::conj(m.Value(j, k)) * y.Value(j));
            }
        mv.AddMatVec(1, 0, m, kNoTrans, x, 0, 0);
        mhy.AddMatVec(1, 0, m, kConjTrans, y, 0, 0);
        KALDI_ASSERT(MaxDiff(mv, ans_mv) < 1e-10);
        KALDI_ASSERT(MaxDiff(mhy, ans_mhy) < 1e-10);
    }
}

void TestAddMatMat() {
    for (int32 i = 0; i < 10; i++) {
        int32 m = kaldi::Rand() % 5 + 2, n = kaldi::Rand() % 5 + 2, k = kaldi::Rand() % 5 + 2;
        CMatrix<double> a(m, n), b(n, k), bh(k, n), ans(m, k), ans2(m, k), ref(m, k);
        a.SetRandn(), b.SetRandn(), ans.SetRandn();
        bh.CopyFromMat(b, kConjTrans);
        ans2.CopyFromMat(ans);
        std::complex<double> alpha(2, 1), beta(0.5, 1);
        for (int32 r = 0; r < m; r++)
            for (int32 c = 0; c < k; c++) {
                std::complex<double> sum = 0;
                for (int32 j = 0; j < n; j++) sum += a.Value(r, j) * b.Value(j, c);
                ref.SetValue(r, c, beta * ans.Value(r, c) + alpha * sum);
            }
        // ans = (0.5+1i) * ans + (2+1i) * a * b
        ans.AddMatMat(2, 1, a, kNoTrans, b, kNoTrans, 0.5, 1);
        KALDI_ASSERT(MaxDiff(ans, ref) < 1e-10);
        // (b^H)^H = b
        ans2.AddMatMat(2, 1, a, kNoTrans, bh, kConjTrans, 0.5, 1);
        KALDI_ASSERT(MaxDiff(ans2, ref) < 1e-10);
    }
}

void TestAddVecVec() {
    for (int32 i = 0; i < 10; i++) {
        int32 r = kaldi::Rand() % 5 + 2, c = kaldi::Rand() % 5 + 2;
        CMatrix<double> cm(r, c), ref(r, c);
        CVector<double> x(r), y(c);
        x.SetRandn(), y.SetRandn();
        std::complex<double> alpha(0.5, 2);
        for (int32 j = 0; j < r; j++)
            for (int32 k = 0; k < c; k++)
                ref.SetValue(j, k, alpha * x.Value(j) * std::conj(y.Value(k)));
        cm.AddVecVec(0.5, 2, x, y, kConj);
        KALDI_ASSERT(MaxDiff(cm, ref) < 1e-10);
    }
}

void TestAddMat() {
    for (int32 i = 0; i < 10; i++) {
        int32 r = kaldi::Rand() % 5 + 2, c = kaldi::Rand() % 5 + 2;
        CMatrix<double> cm(r, c), m1(r, c), m2(c, r), ref(r, c);
        cm.SetRandn(), m1.SetRandn(), m2.SetRandn();
        std::complex<double> alpha(1, 1);
        for (int32 j = 0; j < r; j++)
            for (int32 k = 0; k < c; k++)
                ref.SetValue(j, k, cm.Value(j, k) + alpha * m1.Value(j, k) +
                                   alpha * std::conj(m2.Value(k, j)));
        cm.AddMat(1, 1, m1, kNoTrans);
        cm.AddMat(1, 1, m2, kConjTrans);
        KALDI_ASSERT(MaxDiff(cm, ref) < 1e-10);
    }
}

void TestCMatrixHermite() {
    for (int32 i = 0; i < 10; i++) {
        int32 r = kaldi::Rand() % 6 + 2, c = kaldi::Rand() % 6 + 2;
        CMatrix<double> m(r, c);
        m.SetRandn();
        CMatrix<double> hermite(m), ref(m, kConjTrans);
        hermite.Hermite();
        KALDI_ASSERT(hermite.NumRows() == c && hermite.NumCols() == r);
        KALDI_ASSERT(MaxDiff(hermite, ref) == 0);

        CMatrix<double> s(c, c);
        s.SetRandn();
        KALDI_ASSERT(!s.IsHermitian());
        CMatrix<double> sh(s, kConjTrans), ans(s);
        ans.AddMat(1, 0, sh);
        ans.Scale(0.5, 0);
        s.Symmetrize();
        KALDI_ASSERT(s.IsHermitian());
        KALDI_ASSERT(MaxDiff(s, ans) < 1e-12);
    }
}

void TestCMatrixResize() {
    CMatrix<float> cm(4, 3);
    cm.SetRandn();
    CMatrix<float> copy(cm);
    cm.Resize(6, 5, kCopyData);
    KALDI_ASSERT(MaxDiff(cm.Range(0, 4, 0, 3), copy) == 0);
    KALDI_ASSERT(cm(5, 4, kReal) == 0 && cm(5, 4, kImag) == 0);
    cm.Resize(2, 2, kCopyData);
    KALDI_ASSERT(MaxDiff(cm, copy.Range(0, 2, 0, 2)) == 0);
    cm.SetUnit();
    KALDI_ASSERT(cm(1, 1, kReal) == 1 && cm(0, 1, kReal) == 0);
}

void TestMulColsVec() {
    CMatrix<double> cm(3, 4), ref(3, 4);
    Vector<double> scale(4);
    cm.SetRandn(), scale.SetRandn();
    for (int32 r = 0; r < 3; r++)
        for (int32 c = 0; c < 4; c++)
            ref.SetValue(r, c, cm.Value(r, c) * scale(c));
    cm.MulColsVec(scale);
    KALDI_ASSERT(MaxDiff(cm, ref) < 1e-12);
}

// A * v_i = d_i * v_i, with v_i = V.Row(i)
void TestCMatrixHed() {
    for (int32 i = 0; i < 10; i++) {
        CMatrix<double> cm;
        int32 dim = kaldi::Rand() % 6 + 2;
        CreateHermiteCmatrix(&cm, dim);
        CMatrix<double> V(dim, dim);
        Vector<double> D(dim);
        cm.Hed(&D, &V);
        for (int32 j = 0; j < dim; j++) {
            if (j > 0) KALDI_ASSERT(D(j - 1) <= D(j));
            CVector<double> av(dim), dv(V.Row(j));
            av.AddMatVec(1, 0, cm, kNoTrans, V.Row(j), 0, 0);
            dv.Scale(D(j), 0);
            KALDI_ASSERT(MaxDiff(av, dv) < 1e-8);
            KALDI_ASSERT(std::abs(V.Row(j).Norm() - 1) < 1e-8);
        }
    }
}

// A * v_i = d_i * B * v_i
void TestCMatrixHged() {
    for (int32 i = 0; i < 10; i++) {
        CMatrix<double> a, b;
        int32 dim = kaldi::Rand() % 6 + 2;
        CreateHermiteCmatrix(&a, dim);
        CreateHposdefCmatrix(&b, dim);
        CMatrix<double> b_copy(b), V(dim, dim);
        Vector<double> D(dim);
        a.Hged(b, &D, &V);
        KALDI_ASSERT(MaxDiff(b, b_copy) == 0);
        for (int32 j = 0; j < dim; j++) {
            CVector<double> av(dim), bv(dim);
            av.AddMatVec(1, 0, a, kNoTrans, V.Row(j), 0, 0);
            bv.AddMatVec(D(j), 0, b, kNoTrans, V.Row(j), 0, 0);
            KALDI_ASSERT(MaxDiff(av, bv) < 1e-8);
        }
    }
}

void TestCMatrixHgedNotPosDef() {
    CMatrix<double> a, b(3, 3), V(3, 3);
    Vector<double> D(3);
    CreateHermiteCmatrix(&a, 3);
    b.SetUnit();
    b.Scale(-1, 0);
    bool thrown = false;
    try {
        a.Hged(b, &D, &V);
    } catch (const NotPositiveDefinite &e) {
        thrown = true;
    }
    KALDI_ASSERT(thrown);
}

// beta_i * A * v_i = alpha_i * B * v_i
void TestCMatrixGed() {
    for (int32 i = 0; i < 10; i++) {
        int32 dim = kaldi::Rand() % 6 + 2;
        CMatrix<double> a(dim, dim), b(dim, dim), V(dim, dim);
        a.SetRandn(), b.SetRandn();
        CVector<double> alpha(dim), beta(dim);
        a.Ged(b, &alpha, &beta, &V);
        for (int32 j = 0; j < dim; j++) {
            CVector<double> av(dim), bv(dim);
            av.AddMatVec(std::real(beta.Value(j)), std::imag(beta.Value(j)), a,
                         kNoTrans, V.Row(j), 0, 0);
            bv.AddMatVec(std::real(alpha.Value(j)), std::imag(alpha.Value(j)), b,
                         kNoTrans, V.Row(j), 0, 0);
            KALDI_ASSERT(MaxDiff(av, bv) < 1e-8);
            KALDI_ASSERT(std::abs(V.Row(j).Norm() - 1) < 1e-8);
        }
    }
}

// A * x_r = b_r for each row
void TestSolveVecs() {
    for (int32 i = 0; i < 10; i++) {
        int32 dim = kaldi::Rand() % 6 + 2, num_rhs = kaldi::Rand() % 3 + 1;
        CMatrix<double> a(dim, dim), b(num_rhs, dim);
        a.SetRandn(), b.SetRandn();
        a.AddToDiag(dim, 0);
        CMatrix<double> x(b), a_copy(a);
        a.SolveVecs(&x);
        KALDI_ASSERT(MaxDiff(a, a_copy) == 0);
        for (int32 r = 0; r < num_rhs; r++) {
            CVector<double> ax(dim);
            ax.AddMatVec(1, 0, a, kNoTrans, x.Row(r), 0, 0);
            KALDI_ASSERT(MaxDiff(ax, b.Row(r)) < 1e-8);
        }
    }
    CMatrix<double> singular(3, 3), x(1, 3);
    x.SetRandn();
    bool thrown = false;
    try {
        singular.SolveVecs(&x);
    } catch (const NumericalFailure &e) {
        thrown = true;
    }
    KALDI_ASSERT(thrown);
}

void TestCopyFromRealfft() {
    for (int32 i = 0; i < 10; i++) {
        int32 r = kaldi::Rand() % 8 + 2, c = kaldi::Rand() % 8 + 2;
        Matrix<float> rm(r, c * 2);
        CMatrix<float> cm(r, c + 1);
        rm.SetRandn();
        cm.CopyFromRealfft(rm);
        for (int32 j = 0; j < r; j++) {
            KALDI_ASSERT(cm(j, 0, kReal) == rm(j, 0) && cm(j, 0, kImag) == 0);
            KALDI_ASSERT(cm(j, c, kReal) == rm(j, 1) && cm(j, c, kImag) == 0);
            KALDI_ASSERT(cm(j, 1, kReal) == rm(j, 2) && cm(j, 1, kImag) == rm(j, 3));
        }
    }
}

void TestCMatrixIO() {
    CMatrix<float> cm(kaldi::Rand() % 5 + 1, kaldi::Rand() % 5 + 1), cache;
    cm.SetRandn();
    std::ostringstream os;
    cm.Write(os, true);
    std::istringstream is(os.str());
    cache.Read(is, true);
    KALDI_ASSERT(MaxDiff(cm, cache) == 0);
    // FCM can not be read as DCM
    CMatrix<double> wrong;
    std::istringstream is_wrong(os.str());
    bool thrown = false;
    try {
        wrong.Read(is_wrong, true);
    } catch (const std::exception &e) {
        thrown = true;
    }
    KALDI_ASSERT(thrown);
}

int main() {
    TestCVectorInit();
    TestCVectorScaleAddVec();
    TestVecVec();
    TestAddMatVec();
    TestAddMatMat();
    TestAddVecVec();
    TestAddMat();
    TestCMatrixHermite();
    TestCMatrixResize();
    TestMulColsVec();
    TestCMatrixHed();
    TestCMatrixHged();
    TestCMatrixHgedNotPosDef();
    TestCMatrixGed();
    TestSolveVecs();
    TestCopyFromRealfft();
    TestCMatrixIO();
    KALDI_LOG << "Test OK.";
    return 0;
}
