#include "bert_encoder.h"
#include "tootbert/dispatch/scalar_traits.h"
#include "tootbert/primitives/gemm/gemm_impl.h"
#include "tootbert/primitives/layer_norm/layer_norm_impl.h"
#include "tootbert/primitives/activation/activation_impl.h"
#include <algorithm>
#include <cmath>

namespace tootbert {
namespace model {

namespace {

size_t checked_size(int a, int b, const char* buffer_name) {
    size_t size = static_cast<size_t>(a) * static_cast<size_t>(b);
    if (b != 0 && size / static_cast<size_t>(b) != static_cast<size_t>(a)) {
        throw std::overflow_error(std::string("BertWorkspace: size overflow for ") + buffer_name);
    }
    return size;
}

}  // namespace

BertWorkspace::BertWorkspace(int L_, const BertConfig& config, int block_rows_)
    : L(L_), block_rows(std::max(1, std::min(block_rows_, L_))) {
    if (L <= 0) {
        throw std::invalid_argument("BertWorkspace: sequence length must be positive, got " +
                                    std::to_string(L));
    }
    const size_t LH = checked_size(L, config.hidden_dim, "hidden");
    hidden.resize(LH);
    query.resize(LH);
    key.resize(LH);
    value.resize(LH);
    context.resize(LH);
    scratch.resize(LH);
    key_t.resize(checked_size(config.head_dim(), L, "key_t"));
    scores.resize(checked_size(block_rows, L, "scores"));
    inter.resize(checked_size(block_rows, config.intermediate_dim, "inter"));
    mask_bias.resize(static_cast<size_t>(L));
}

/**
 * Multi-head self-attention for one layer.
 *
 * Reads workspace.hidden, leaves the concatenated head outputs in
 * workspace.context.
 */
static void self_attention(const BertWeights::LayerWeights& layer, const BertConfig& config,
                           BertWorkspace& ws) {
    const int L = ws.L;
    const int H = config.hidden_dim;
    const int dh = config.head_dim();
    const float scale = 1.0f / std::sqrt(static_cast<float>(dh));

    gemm::linear<ScalarBackend>(ws.hidden.data(), layer.query_weight.data(),
                                layer.query_bias.data(), ws.query.data(), L, H, H);
    gemm::linear<ScalarBackend>(ws.hidden.data(), layer.key_weight.data(),
                                layer.key_bias.data(), ws.key.data(), L, H, H);
    gemm::linear<ScalarBackend>(ws.hidden.data(), layer.value_weight.data(),
                                layer.value_bias.data(), ws.value.data(), L, H, H);

    for (int h = 0; h < config.num_heads; h++) {
        const int col = h * dh;

        // K_h^T [dh x L]
        for (int j = 0; j < L; j++) {
            const float* k_row = ws.key.data() + static_cast<size_t>(j) * H + col;
            for (int d = 0; d < dh; d++) {
                ws.key_t[static_cast<size_t>(d) * L + j] = k_row[d];
            }
        }

        for (int r0 = 0; r0 < L; r0 += ws.block_rows) {
            const int rows = std::min(ws.block_rows, L - r0);

            // scores = scale * Q_h[r0:r0+rows] @ K_h^T
            gemm::gemm<ScalarBackend>(ws.query.data() + static_cast<size_t>(r0) * H + col,
                                      ws.key_t.data(), ws.scores.data(), rows, L, dh, scale, 0.0f,
                                      H, L, L);

            for (int r = 0; r < rows; r++) {
                float* s = ws.scores.data() + static_cast<size_t>(r) * L;
                for (int j = 0; j < L; j++) {
                    s[j] += ws.mask_bias[j];
                }
                activation::softmax_row<ScalarBackend>(s, L);
            }

            // context_h[r0:r0+rows] = P @ V_h
            gemm::gemm<ScalarBackend>(ws.scores.data(), ws.value.data() + col,
                                      ws.context.data() + static_cast<size_t>(r0) * H + col, rows,
                                      dh, L, 1.0f, 0.0f, L, H, H);
        }
    }
}

/**
 * Position-wise feed-forward, row-blocked. Result in workspace.scratch.
 */
static void feed_forward(const BertWeights::LayerWeights& layer, const BertConfig& config,
                         BertWorkspace& ws) {
    const int L = ws.L;
    const int H = config.hidden_dim;
    const int I = config.intermediate_dim;

    for (int r0 = 0; r0 < L; r0 += ws.block_rows) {
        const int rows = std::min(ws.block_rows, L - r0);
        const size_t off = static_cast<size_t>(r0) * H;

        gemm::linear<ScalarBackend>(ws.hidden.data() + off, layer.intermediate_weight.data(),
                                    layer.intermediate_bias.data(), ws.inter.data(), rows, I, H);
        activation::gelu<ScalarBackend>(ws.inter.data(), rows * I);
        gemm::linear<ScalarBackend>(ws.inter.data(), layer.output_weight.data(),
                                    layer.output_bias.data(), ws.scratch.data() + off, rows, H, I);
    }
}

template <>
void bert_forward<ScalarBackend>(const int32_t* input_ids, const int32_t* attention_mask, int L,
                                 const BertWeights& weights, const BertConfig& config,
                                 float* output, BertWorkspace& ws) {
    const int H = config.hidden_dim;
    const float eps = config.layer_norm_eps;

    // ========================================================================
    // Embeddings
    // ========================================================================
    const float* type0 = weights.token_type_embeddings.data();
    for (int i = 0; i < L; i++) {
        const float* word = weights.word_embeddings.data() + static_cast<size_t>(input_ids[i]) * H;
        const float* pos = weights.position_embeddings.data() + static_cast<size_t>(i) * H;
        float* h = ws.hidden.data() + static_cast<size_t>(i) * H;
        for (int d = 0; d < H; d++) {
            h[d] = word[d] + pos[d] + type0[d];
        }
        ws.mask_bias[i] = (attention_mask[i] == 0) ? kMaskedScore : 0.0f;
    }
    layer_norm::layer_norm_batch<ScalarBackend>(ws.hidden.data(), ws.hidden.data(),
                                                weights.embedding_norm_gamma.data(),
                                                weights.embedding_norm_beta.data(), L, H, eps);

    // ========================================================================
    // Transformer blocks
    // ========================================================================
    for (const auto& layer : weights.layers) {
        self_attention(layer, config, ws);

        gemm::linear<ScalarBackend>(ws.context.data(), layer.attn_output_weight.data(),
                                    layer.attn_output_bias.data(), ws.scratch.data(), L, H, H);
        layer_norm::add_layer_norm_batch<ScalarBackend>(ws.scratch.data(), ws.hidden.data(),
                                                        layer.attn_norm_gamma.data(),
                                                        layer.attn_norm_beta.data(), L, H, eps);
        ws.hidden.swap(ws.scratch);

        feed_forward(layer, config, ws);
        layer_norm::add_layer_norm_batch<ScalarBackend>(ws.scratch.data(), ws.hidden.data(),
                                                        layer.output_norm_gamma.data(),
                                                        layer.output_norm_beta.data(), L, H, eps);
        ws.hidden.swap(ws.scratch);
    }

    std::copy(ws.hidden.begin(), ws.hidden.end(), output);
}

}  // namespace model
}  // namespace tootbert
