#pragma once

#include "tootbert/types/pipeline_types.h"
#include <cstdint>
#include <vector>

namespace tootbert {
namespace pooling {

/**
 * Mean-pool residue embeddings into one feature vector.
 *
 * seq_len = number of positions with mask == 1. Rows [1, seq_len - 1)
 * are averaged, which drops [CLS] (row 0) and [SEP] (row seq_len - 1).
 * Padding rows beyond seq_len never contribute.
 *
 * @param embeddings  Hidden states [rows x dim]
 * @param mask        Attention mask, same length as embeddings.rows
 * @return FeatureVector of length embeddings.dim
 * @throws EmptySequenceError when seq_len <= 2 (nothing between the boundaries)
 * @throws InferenceError when mask and embeddings disagree in length
 *
 * Example:
 * ```cpp
 *   // 5 attended tokens: [CLS] M K V [SEP]
 *   FeatureVector f = pool(emb, {1, 1, 1, 1, 1});  // mean of rows 1, 2, 3
 * ```
 */
types::FeatureVector pool(const types::EmbeddingMatrix& embeddings,
                          const std::vector<int32_t>& mask);

}  // namespace pooling
}  // namespace tootbert
