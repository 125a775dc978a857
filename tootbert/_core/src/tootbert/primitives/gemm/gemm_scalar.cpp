#include "gemm_impl.h"
#include "tootbert/dispatch/scalar_traits.h"
#include "tootbert/common/tuning.h"
#include <algorithm>

namespace tootbert {
namespace gemm {

// Blocked over N (NC), K (KC) and M (MC) from tuning::GEMMTuning. Inside a
// block, full 4x4 tiles go through tile_4x4 and the ragged right/bottom
// edges through edge_dot. With OpenMP the MC row blocks run in parallel;
// each owns a disjoint set of C rows.

namespace {

// C[4 x 4] = alpha * A[4 x K] @ B[K x 4] + beta * C
inline void tile_4x4(const float* A, const float* B, float* C, int K, int lda, int ldb, int ldc,
                     float alpha, float beta) {
    float acc[4][4] = {};
    for (int k = 0; k < K; k++) {
        const float* b = B + k * ldb;
        for (int r = 0; r < 4; r++) {
            const float a = A[r * lda + k];
            acc[r][0] += a * b[0];
            acc[r][1] += a * b[1];
            acc[r][2] += a * b[2];
            acc[r][3] += a * b[3];
        }
    }
    for (int r = 0; r < 4; r++) {
        float* c = C + r * ldc;
        for (int j = 0; j < 4; j++) {
            c[j] = beta == 0.0f ? alpha * acc[r][j] : alpha * acc[r][j] + beta * c[j];
        }
    }
}

// Single C element, used for the ragged right and bottom edges
inline void edge_dot(const float* A, const float* B, float* C, int K, int ldb, float alpha,
                     float beta) {
    float sum = 0.0f;
    for (int k = 0; k < K; k++) sum += A[k] * B[k * ldb];
    *C = beta == 0.0f ? alpha * sum : alpha * sum + beta * (*C);
}

// One (rows x cols x depth) cache block of C += A @ B
void block(const float* A, const float* B, float* C, int rows, int cols, int depth, int lda,
           int ldb, int ldc, float alpha, float beta) {
    constexpr int MR = tuning::GEMMTuning::MR;
    constexpr int NR = tuning::GEMMTuning::NR;
    const int full_rows = rows - rows % MR;
    const int full_cols = cols - cols % NR;

    for (int i = 0; i < full_rows; i += MR) {
        for (int j = 0; j < full_cols; j += NR) {
            tile_4x4(A + i * lda, B + j, C + i * ldc + j, depth, lda, ldb, ldc, alpha, beta);
        }
    }
    for (int i = 0; i < rows; i++) {
        const int j0 = i < full_rows ? full_cols : 0;
        for (int j = j0; j < cols; j++) {
            edge_dot(A + i * lda, B + j, C + i * ldc + j, depth, ldb, alpha, beta);
        }
    }
}

}  // namespace

template <>
void gemm<ScalarBackend>(const float* A, const float* B, float* C, int M, int N, int K, float alpha,
                         float beta, int lda, int ldb, int ldc) {
    if (lda < 0) lda = K;
    if (ldb < 0) ldb = N;
    if (ldc < 0) ldc = N;
    if (M <= 0 || N <= 0) return;

    if (K <= 0) {
        for (int i = 0; i < M; i++) {
            float* c = C + i * ldc;
            for (int j = 0; j < N; j++) c[j] = beta == 0.0f ? 0.0f : beta * c[j];
        }
        return;
    }

    const auto t = tuning::GEMMTuning::get_for_size(M, N, K);

    for (int jj = 0; jj < N; jj += t.NC) {
        const int cols = std::min(t.NC, N - jj);
        for (int kk = 0; kk < K; kk += t.KC) {
            const int depth = std::min(t.KC, K - kk);
            // beta only on the first K block; later blocks accumulate
            const float b = kk == 0 ? beta : 1.0f;

#ifdef _OPENMP
#pragma omp parallel for schedule(static) if (M >= 4 * t.MC)
#endif
            for (int ii = 0; ii < M; ii += t.MC) {
                block(A + ii * lda + kk, B + kk * ldb + jj, C + ii * ldc + jj,
                      std::min(t.MC, M - ii), cols, depth, lda, ldb, ldc, alpha, b);
            }
        }
    }
}

template <>
void linear<ScalarBackend>(const float* X, const float* W, const float* bias, float* Y, int M,
                           int N, int K) {
    if (bias != nullptr) {
        for (int i = 0; i < M; i++) {
            std::copy(bias, bias + N, Y + static_cast<size_t>(i) * N);
        }
        gemm<ScalarBackend>(X, W, Y, M, N, K, 1.0f, 1.0f);
    } else {
        gemm<ScalarBackend>(X, W, Y, M, N, K, 1.0f, 0.0f);
    }
}

}  // namespace gemm
}  // namespace tootbert
