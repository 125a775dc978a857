#include "layer_norm_impl.h"

#include "tootbert/dispatch/scalar_traits.h"

#include <cmath>

namespace tootbert {
namespace layer_norm {

namespace {

struct RowStats {
    float mean;
    float inv_std;
};

// Two passes in double: ProtBert rows are 1024 wide and eps is 1e-12, so a
// float running sum loses the variance of near-constant rows.
RowStats row_stats(const float* x, int D, float eps) {
    double mean = 0.0;
    for (int i = 0; i < D; i++) mean += x[i];
    mean /= D;

    double ss = 0.0;
    for (int i = 0; i < D; i++) {
        const double d = x[i] - mean;
        ss += d * d;
    }
    return RowStats{static_cast<float>(mean), static_cast<float>(1.0 / std::sqrt(ss / D + eps))};
}

void apply(const float* x, float* y, const RowStats& s, const float* gamma, const float* beta,
           int D) {
    for (int i = 0; i < D; i++) {
        const float g = gamma ? gamma[i] : 1.0f;
        const float b = beta ? beta[i] : 0.0f;
        y[i] = (x[i] - s.mean) * s.inv_std * g + b;
    }
}

}  // namespace

template <>
void layer_norm_forward<ScalarBackend>(const float* input, float* output, const float* gamma,
                                       const float* beta, int D, float eps) {
    apply(input, output, row_stats(input, D, eps), gamma, beta, D);
}

template <>
void layer_norm_batch<ScalarBackend>(const float* input, float* output, const float* gamma,
                                     const float* beta, int N, int D, float eps) {
    for (int n = 0; n < N; n++) {
        const float* x = input + static_cast<size_t>(n) * D;
        apply(x, output + static_cast<size_t>(n) * D, row_stats(x, D, eps), gamma, beta, D);
    }
}

template <>
void add_layer_norm_batch<ScalarBackend>(float* x, const float* residual, const float* gamma,
                                         const float* beta, int N, int D, float eps) {
    for (int n = 0; n < N; n++) {
        float* row = x + static_cast<size_t>(n) * D;
        const float* skip = residual + static_cast<size_t>(n) * D;
        for (int i = 0; i < D; i++) row[i] += skip[i];
        apply(row, row, row_stats(row, D, eps), gamma, beta, D);
    }
}

}  // namespace layer_norm
}  // namespace tootbert
