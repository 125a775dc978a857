#pragma once

#include "tootbert/dispatch/backend_traits.h"

namespace tootbert {
namespace layer_norm {

/**
 * y = gamma * (x - mean(x)) / sqrt(var(x) + eps) + beta over one row of D.
 *
 * gamma and beta may be nullptr (identity scale / zero shift). output may
 * alias input. The default eps is BERT's 1e-12.
 */
template <typename Backend>
void layer_norm_forward(const float* input, float* output, const float* gamma, const float* beta,
                        int D, float eps = 1e-12f);

/// layer_norm_forward on each of N rows of an [N x D] matrix.
template <typename Backend>
void layer_norm_batch(const float* input, float* output, const float* gamma, const float* beta,
                      int N, int D, float eps = 1e-12f);

/**
 * Post-LN residual step of a BERT block: x = LayerNorm(x + residual).
 *
 * x holds the sublayer output and is overwritten.
 */
template <typename Backend>
void add_layer_norm_batch(float* x, const float* residual, const float* gamma, const float* beta,
                          int N, int D, float eps = 1e-12f);

}  // namespace layer_norm
}  // namespace tootbert
