#pragma once

#include "tootbert/dispatch/backend_traits.h"
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace tootbert {
namespace model {

/**
 * BERT encoder for protein sequences (ProtBert family).
 *
 * Architecture:
 * 1. Embeddings: word[id] + position[i] + token_type[0] -> LayerNorm
 * 2. num_layers transformer blocks:
 *    - Q/K/V projections, scaled dot-product attention per head
 *      (keys with attention_mask == 0 are excluded)
 *    - Output projection -> residual -> LayerNorm
 *    - Intermediate dense -> GELU -> output dense -> residual -> LayerNorm
 * 3. Output: last hidden state [L * hidden_dim]
 *
 * Dropout is absent: only inference is supported.
 */

/**
 * Encoder hyperparameters. Defaults are the ProtBert-BFD values.
 */
struct BertConfig {
    int vocab_size;          // Token vocabulary (default: 30)
    int hidden_dim;          // Model width (default: 1024)
    int num_layers;          // Transformer blocks (default: 30)
    int num_heads;           // Attention heads (default: 16)
    int intermediate_dim;    // Feed-forward width (default: 4096)
    int max_positions;       // Position embedding table size (default: 40000)
    int type_vocab_size;     // Token type table size (default: 2)
    float layer_norm_eps;    // LayerNorm epsilon (default: 1e-12)

    BertConfig()
        : vocab_size(30),
          hidden_dim(1024),
          num_layers(30),
          num_heads(16),
          intermediate_dim(4096),
          max_positions(40000),
          type_vocab_size(2),
          layer_norm_eps(1e-12f) {
    }

    int head_dim() const { return hidden_dim / num_heads; }
};

/**
 * Encoder parameters.
 *
 * Dense weights are stored [in * out] row-major (transposed from the
 * PyTorch [out, in] layout at load time) so a projection is X @ W.
 */
struct BertWeights {
    std::vector<float> word_embeddings;        // [vocab_size * hidden_dim]
    std::vector<float> position_embeddings;    // [max_positions * hidden_dim]
    std::vector<float> token_type_embeddings;  // [type_vocab_size * hidden_dim]
    std::vector<float> embedding_norm_gamma;   // [hidden_dim]
    std::vector<float> embedding_norm_beta;    // [hidden_dim]

    struct LayerWeights {
        std::vector<float> query_weight;   // [hidden_dim * hidden_dim]
        std::vector<float> query_bias;     // [hidden_dim]
        std::vector<float> key_weight;     // [hidden_dim * hidden_dim]
        std::vector<float> key_bias;       // [hidden_dim]
        std::vector<float> value_weight;   // [hidden_dim * hidden_dim]
        std::vector<float> value_bias;     // [hidden_dim]

        std::vector<float> attn_output_weight;  // [hidden_dim * hidden_dim]
        std::vector<float> attn_output_bias;    // [hidden_dim]
        std::vector<float> attn_norm_gamma;     // [hidden_dim]
        std::vector<float> attn_norm_beta;      // [hidden_dim]

        std::vector<float> intermediate_weight;  // [hidden_dim * intermediate_dim]
        std::vector<float> intermediate_bias;    // [intermediate_dim]
        std::vector<float> output_weight;        // [intermediate_dim * hidden_dim]
        std::vector<float> output_bias;          // [hidden_dim]
        std::vector<float> output_norm_gamma;    // [hidden_dim]
        std::vector<float> output_norm_beta;     // [hidden_dim]
    };

    std::vector<LayerWeights> layers;

    BertWeights() = default;
    explicit BertWeights(int num_layers) : layers(static_cast<size_t>(num_layers)) {}
};

/**
 * Scratch buffers for one forward pass.
 *
 * Attention and feed-forward are evaluated in blocks of `block_rows`
 * rows, so peak memory is O(L * hidden + block_rows * max(L, intermediate))
 * rather than O(L^2).
 */
struct BertWorkspace {
    int L;
    int block_rows;

    std::vector<float> hidden;   // [L * hidden_dim]
    std::vector<float> query;    // [L * hidden_dim]
    std::vector<float> key;      // [L * hidden_dim]
    std::vector<float> value;    // [L * hidden_dim]
    std::vector<float> context;  // [L * hidden_dim]
    std::vector<float> scratch;  // [L * hidden_dim]
    std::vector<float> key_t;    // [head_dim * L] one head's keys, transposed
    std::vector<float> scores;   // [block_rows * L]
    std::vector<float> inter;    // [block_rows * intermediate_dim]
    std::vector<float> mask_bias;  // [L] 0 or a large negative value

    /**
     * @throws std::invalid_argument on non-positive sizes
     * @throws std::bad_alloc when the sequence does not fit in memory
     */
    BertWorkspace(int L_, const BertConfig& config, int block_rows_);
};

/// Additive attention bias for padded keys.
constexpr float kMaskedScore = -1.0e9f;

/**
 * Encoder forward pass.
 *
 * @param input_ids       Token ids [L]
 * @param attention_mask  1 for attended tokens, 0 for padding [L]
 * @param L               Sequence length (<= config.max_positions)
 * @param weights         Encoder parameters
 * @param config          Encoder hyperparameters
 * @param output          Last hidden state [L * hidden_dim]
 * @param workspace       Scratch sized for L
 *
 * Example:
 *   BertWorkspace ws(L, config, 256);
 *   std::vector<float> out(L * config.hidden_dim);
 *   bert_forward<ScalarBackend>(ids, mask, L, weights, config, out.data(), ws);
 */
template <typename Backend>
void bert_forward(const int32_t* input_ids, const int32_t* attention_mask, int L,
                  const BertWeights& weights, const BertConfig& config, float* output,
                  BertWorkspace& workspace);

/**
 * Check hyperparameters for consistency.
 *
 * @throws std::invalid_argument describing the first problem found
 */
inline void validate_config(const BertConfig& config) {
    auto require_positive = [](int v, const char* name) {
        if (v <= 0) {
            throw std::invalid_argument(std::string(name) + " must be positive, got " +
                                        std::to_string(v));
        }
    };
    require_positive(config.vocab_size, "vocab_size");
    require_positive(config.hidden_dim, "hidden_dim");
    require_positive(config.num_layers, "num_layers");
    require_positive(config.num_heads, "num_heads");
    require_positive(config.intermediate_dim, "intermediate_dim");
    require_positive(config.max_positions, "max_positions");
    require_positive(config.type_vocab_size, "type_vocab_size");

    if (config.hidden_dim % config.num_heads != 0) {
        throw std::invalid_argument("hidden_dim " + std::to_string(config.hidden_dim) +
                                    " is not divisible by num_heads " +
                                    std::to_string(config.num_heads));
    }
}

}  // namespace model
}  // namespace tootbert
