/**
 * Unit tests for the scalar GEMM and dense-layer kernels.
 */

#include "tootbert/primitives/gemm/gemm_impl.h"
#include "tootbert/dispatch/scalar_traits.h"
#include <iostream>
#include <cmath>
#include <iomanip>
#include <random>
#include <vector>

using tootbert::ScalarBackend;
using tootbert::gemm::gemm;
using tootbert::gemm::linear;

// Helper: Check if matrices are close
bool matrices_close(const float* A, const float* B, int n, float tol = 1e-4f) {
    for (int i = 0; i < n; i++) {
        if (std::abs(A[i] - B[i]) > tol) {
            std::cout << "Mismatch at index " << i << ": " << A[i] << " vs " << B[i] << std::endl;
            return false;
        }
    }
    return true;
}

// Reference triple loop with explicit strides
void naive_gemm(const float* A, const float* B, float* C, int M, int N, int K, float alpha,
                float beta, int lda, int ldb, int ldc) {
    for (int i = 0; i < M; i++) {
        for (int j = 0; j < N; j++) {
            double acc = 0.0;
            for (int k = 0; k < K; k++) {
                acc += static_cast<double>(A[i * lda + k]) * B[k * ldb + j];
            }
            C[i * ldc + j] = static_cast<float>(alpha * acc + beta * C[i * ldc + j]);
        }
    }
}

std::vector<float> random_matrix(int n, unsigned seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    std::vector<float> v(static_cast<size_t>(n));
    for (auto& x : v) x = dist(rng);
    return v;
}

// Test 1: Small matrix multiply
bool test_small_gemm() {
    std::cout << "=== Test 1: Small GEMM (2x3 @ 3x2) ===" << std::endl;

    float A[6] = {1, 2, 3, 4, 5, 6};
    float B[6] = {7, 8, 9, 10, 11, 12};
    float C[4] = {0, 0, 0, 0};
    float expected[4] = {58, 64, 139, 154};

    gemm<ScalarBackend>(A, B, C, 2, 2, 3);

    if (!matrices_close(C, expected, 4)) {
        std::cout << "✗ FAIL" << std::endl;
        return false;
    }
    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

// Test 2: Sizes that are not multiples of the 4x4 micro-tile
bool test_edge_tiles() {
    std::cout << "=== Test 2: Ragged sizes vs naive reference ===" << std::endl;

    const int sizes[][3] = {{1, 1, 1}, {5, 7, 3}, {17, 9, 33}, {64, 8, 16}, {3, 130, 5}};
    for (const auto& s : sizes) {
        const int M = s[0], N = s[1], K = s[2];
        auto A = random_matrix(M * K, 1);
        auto B = random_matrix(K * N, 2);
        std::vector<float> C(static_cast<size_t>(M) * N, 0.0f);
        std::vector<float> ref(C.size(), 0.0f);

        gemm<ScalarBackend>(A.data(), B.data(), C.data(), M, N, K);
        naive_gemm(A.data(), B.data(), ref.data(), M, N, K, 1.0f, 0.0f, K, N, N);

        std::cout << "  M=" << M << " N=" << N << " K=" << K << std::endl;
        if (!matrices_close(C.data(), ref.data(), M * N)) {
            std::cout << "✗ FAIL" << std::endl;
            return false;
        }
    }
    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

// Test 3: alpha/beta accumulate into C
bool test_alpha_beta() {
    std::cout << "=== Test 3: alpha and beta ===" << std::endl;

    float A[4] = {1, 2, 3, 4};
    float B[4] = {1, 0, 0, 1};
    float C[4] = {10, 10, 10, 10};
    // C = 2 * A + 0.5 * C
    float expected[4] = {7, 9, 11, 13};

    gemm<ScalarBackend>(A, B, C, 2, 2, 2, 2.0f, 0.5f);

    if (!matrices_close(C, expected, 4)) {
        std::cout << "✗ FAIL" << std::endl;
        return false;
    }
    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

// Test 4: Leading dimensions select a sub-block (per-head attention slices)
bool test_strided() {
    std::cout << "=== Test 4: Strided operands ===" << std::endl;

    const int M = 6, N = 5, K = 4;
    const int lda = 10, ldb = 7, ldc = 9;
    auto A = random_matrix(M * lda, 3);
    auto B = random_matrix(K * ldb, 4);
    std::vector<float> C(static_cast<size_t>(M) * ldc, 0.25f);
    std::vector<float> ref = C;

    gemm<ScalarBackend>(A.data(), B.data(), C.data(), M, N, K, 0.5f, 1.0f, lda, ldb, ldc);
    naive_gemm(A.data(), B.data(), ref.data(), M, N, K, 0.5f, 1.0f, lda, ldb, ldc);

    // Columns past N must be left untouched
    if (!matrices_close(C.data(), ref.data(), M * ldc)) {
        std::cout << "✗ FAIL" << std::endl;
        return false;
    }
    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

// Test 5: Dense layer with bias
bool test_linear() {
    std::cout << "=== Test 5: linear = X @ W + b ===" << std::endl;

    const int M = 7, N = 6, K = 5;
    auto X = random_matrix(M * K, 5);
    auto W = random_matrix(K * N, 6);
    auto b = random_matrix(N, 7);
    std::vector<float> Y(static_cast<size_t>(M) * N, 123.0f);  // stale values must not leak
    std::vector<float> ref(Y.size(), 0.0f);

    linear<ScalarBackend>(X.data(), W.data(), b.data(), Y.data(), M, N, K);
    naive_gemm(X.data(), W.data(), ref.data(), M, N, K, 1.0f, 0.0f, K, N, N);
    for (int i = 0; i < M; i++) {
        for (int j = 0; j < N; j++) {
            ref[i * N + j] += b[j];
        }
    }

    std::vector<float> no_bias(Y.size(), -1.0f);
    linear<ScalarBackend>(X.data(), W.data(), nullptr, no_bias.data(), M, N, K);
    std::vector<float> ref_no_bias(Y.size(), 0.0f);
    naive_gemm(X.data(), W.data(), ref_no_bias.data(), M, N, K, 1.0f, 0.0f, K, N, N);

    if (!matrices_close(Y.data(), ref.data(), M * N) ||
        !matrices_close(no_bias.data(), ref_no_bias.data(), M * N)) {
        std::cout << "✗ FAIL" << std::endl;
        return false;
    }
    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

// Test 6: Encoder-sized projection
bool test_encoder_scale() {
    std::cout << "=== Test 6: Encoder-scale GEMM (300x256 @ 256x192) ===" << std::endl;

    const int M = 300, N = 192, K = 256;
    auto A = random_matrix(M * K, 8);
    auto B = random_matrix(K * N, 9);
    std::vector<float> C(static_cast<size_t>(M) * N, 0.0f);
    std::vector<float> ref(C.size(), 0.0f);

    gemm<ScalarBackend>(A.data(), B.data(), C.data(), M, N, K);
    naive_gemm(A.data(), B.data(), ref.data(), M, N, K, 1.0f, 0.0f, K, N, N);

    if (!matrices_close(C.data(), ref.data(), M * N, 1e-3f)) {
        std::cout << "✗ FAIL" << std::endl;
        return false;
    }
    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "  Scalar GEMM Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl << std::endl;

    int passed = 0;
    int total = 6;

    if (test_small_gemm()) passed++;
    if (test_edge_tiles()) passed++;
    if (test_alpha_beta()) passed++;
    if (test_strided()) passed++;
    if (test_linear()) passed++;
    if (test_encoder_scale()) passed++;

    std::cout << "========================================" << std::endl;
    std::cout << "Results: " << passed << "/" << total << " tests passed" << std::endl;
    std::cout << "========================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
