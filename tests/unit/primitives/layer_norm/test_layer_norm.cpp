/**
 * LayerNorm kernels as used after every BERT attention and FFN sublayer.
 */

#include "tootbert/dispatch/scalar_traits.h"
#include "tootbert/primitives/layer_norm/layer_norm_impl.h"

#include <cmath>
#include <iostream>
#include <vector>

using tootbert::ScalarBackend;
using tootbert::layer_norm::add_layer_norm_batch;
using tootbert::layer_norm::layer_norm_batch;
using tootbert::layer_norm::layer_norm_forward;

namespace {

bool close(float a, float b, float tol = 1e-4f) {
    return std::fabs(a - b) < tol;
}

void print_row(const char* label, const std::vector<float>& v) {
    std::cout << "  " << label << ":";
    for (size_t i = 0; i < v.size() && i < 8; i++) std::cout << " " << v[i];
    if (v.size() > 8) std::cout << " ...";
    std::cout << std::endl;
}

void moments(const float* x, int D, float& mean, float& variance) {
    double sum = 0.0, sum_sq = 0.0;
    for (int i = 0; i < D; i++) {
        sum += x[i];
        sum_sq += static_cast<double>(x[i]) * x[i];
    }
    mean = static_cast<float>(sum / D);
    variance = static_cast<float>(sum_sq / D - (sum / D) * (sum / D));
}

}  // namespace

/**
 * Test 1: Without gamma/beta the row comes out with mean 0 and variance 1
 */
bool test_simple_normalization() {
    std::cout << "=== Test 1: Zero mean, unit variance ===" << std::endl;

    std::vector<float> x = {-2.0f, 0.5f, 4.0f, 1.5f, 7.0f, -3.0f};
    std::vector<float> y(x.size());
    layer_norm_forward<ScalarBackend>(x.data(), y.data(), nullptr, nullptr, 6);
    print_row("y", y);

    float mean, variance;
    moments(y.data(), 6, mean, variance);
    // ordering is preserved
    const bool ordered = y[5] < y[0] && y[0] < y[1] && y[1] < y[3] && y[3] < y[2] && y[2] < y[4];
    if (!close(mean, 0.0f, 1e-5f) || !close(variance, 1.0f) || !ordered) {
        std::cout << "✗ FAIL: mean " << mean << " variance " << variance << std::endl;
        return false;
    }
    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

/**
 * Test 2: gamma scales and beta shifts each normalized coordinate
 */
bool test_with_affine() {
    std::cout << "=== Test 2: gamma/beta applied per coordinate ===" << std::endl;

    // x = {0, 2}: mean 1, variance 1, normalized {-1, +1} (eps is negligible)
    std::vector<float> x = {0.0f, 2.0f};
    std::vector<float> gamma = {3.0f, 0.5f};
    std::vector<float> beta = {10.0f, -1.0f};
    std::vector<float> y(2);
    layer_norm_forward<ScalarBackend>(x.data(), y.data(), gamma.data(), beta.data(), 2);
    print_row("y", y);

    if (!close(y[0], 7.0f) || !close(y[1], -0.5f)) {
        std::cout << "✗ FAIL: expected {7, -0.5}" << std::endl;
        return false;
    }
    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

/**
 * Test 3: A constant row has zero variance; eps keeps the result at beta
 */
bool test_constant_input() {
    std::cout << "=== Test 3: Constant row maps to beta ===" << std::endl;

    std::vector<float> x(16, -4.25f);
    std::vector<float> beta(16, 0.0f);
    beta[3] = 2.0f;
    std::vector<float> y(16);
    layer_norm_forward<ScalarBackend>(x.data(), y.data(), nullptr, beta.data(), 16);

    for (int i = 0; i < 16; i++) {
        if (!std::isfinite(y[i]) || !close(y[i], beta[i])) {
            std::cout << "✗ FAIL at " << i << ": " << y[i] << std::endl;
            return false;
        }
    }
    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

/**
 * Test 4: Batch normalizes each row independently, in place
 */
bool test_batch_in_place() {
    std::cout << "=== Test 4: Row-wise batch (in place) ===" << std::endl;

    const int N = 3, D = 6;
    std::vector<float> x(N * D);
    for (int i = 0; i < N * D; i++) x[i] = static_cast<float>((i * 7) % 11) * (1 + i / D);

    std::vector<float> expected(N * D);
    for (int n = 0; n < N; n++) {
        layer_norm_forward<ScalarBackend>(x.data() + n * D, expected.data() + n * D, nullptr,
                                          nullptr, D);
    }
    layer_norm_batch<ScalarBackend>(x.data(), x.data(), nullptr, nullptr, N, D);

    for (int i = 0; i < N * D; i++) {
        if (!close(x[i], expected[i])) {
            std::cout << "✗ FAIL at " << i << std::endl;
            return false;
        }
    }
    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

/**
 * Test 5: Fused residual add
 */
bool test_add_layer_norm() {
    std::cout << "=== Test 5: LayerNorm(x + residual) ===" << std::endl;

    const int N = 2, D = 4;
    std::vector<float> x = {1, 2, 3, 4, -1, 0, 1, 2};
    std::vector<float> residual = {0.5f, 0.5f, -1, 2, 3, 3, 3, 3};
    std::vector<float> gamma = {1, 2, 1, 2};
    std::vector<float> beta = {0, 0, 1, 1};

    std::vector<float> summed(N * D);
    for (int i = 0; i < N * D; i++) summed[i] = x[i] + residual[i];
    std::vector<float> expected(N * D);
    layer_norm_batch<ScalarBackend>(summed.data(), expected.data(), gamma.data(), beta.data(), N,
                                    D);

    add_layer_norm_batch<ScalarBackend>(x.data(), residual.data(), gamma.data(), beta.data(), N,
                                        D);
    print_row("x", x);

    for (int i = 0; i < N * D; i++) {
        if (!close(x[i], expected[i])) {
            std::cout << "✗ FAIL at " << i << std::endl;
            return false;
        }
    }
    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

/**
 * Test 6: BERT hidden size with large offsets
 */
bool test_hidden_scale() {
    std::cout << "=== Test 6: Hidden size 1024 with offset 1000 ===" << std::endl;

    const int D = 1024;
    std::vector<float> input(D);
    std::vector<float> output(D);
    for (int i = 0; i < D; i++) {
        input[i] = 1000.0f + std::sin(static_cast<float>(i) * 0.1f);
    }

    layer_norm_forward<ScalarBackend>(input.data(), output.data(), nullptr, nullptr, D);

    float mean, variance;
    moments(output.data(), D, mean, variance);
    std::cout << "Output mean: " << mean << " variance: " << variance << std::endl;

    if (!close(mean, 0.0f, 1e-3f) || !close(variance, 1.0f, 1e-2f)) {
        std::cout << "✗ FAIL" << std::endl;
        return false;
    }
    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "  LayerNorm Tests" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    int passed = 0;
    int total = 6;

    if (test_simple_normalization()) passed++;
    if (test_with_affine()) passed++;
    if (test_constant_input()) passed++;
    if (test_batch_in_place()) passed++;
    if (test_add_layer_norm()) passed++;
    if (test_hidden_scale()) passed++;

    std::cout << "========================================" << std::endl;
    std::cout << "Results: " << passed << "/" << total << " tests passed" << std::endl;
    std::cout << "========================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
