#pragma once

#include "tootbert/dispatch/backend_traits.h"

namespace tootbert {
namespace gemm {

/**
 * C = alpha * A @ B + beta * C, row-major.
 *
 * A is [M x K], B is [K x N], C is [M x N]. A leading dimension of -1
 * means "packed" (K, N and N respectively). The attention code passes the
 * model width as lda/ldc to address one head's columns of Q, K, V and the
 * context without copying them out.
 *
 * beta == 0 overwrites C without reading it, so C may be uninitialized.
 */
template <typename Backend>
void gemm(const float* A, const float* B, float* C, int M, int N, int K, float alpha = 1.0f,
          float beta = 0.0f, int lda = -1, int ldb = -1, int ldc = -1);

/**
 * Dense layer over a batch of token rows: Y[M x N] = X[M x K] @ W[K x N] + bias.
 *
 * W is in [in x out] order, i.e. a PyTorch Linear weight after
 * BertWeightLoader::transpose. bias may be nullptr.
 */
template <typename Backend>
void linear(const float* X, const float* W, const float* bias, float* Y, int M, int N, int K);

}  // namespace gemm
}  // namespace tootbert
