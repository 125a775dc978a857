#include "mean_pool.h"
#include "tootbert/errors/tootbert_error.h"

namespace tootbert {
namespace pooling {

types::FeatureVector pool(const types::EmbeddingMatrix& embeddings,
                          const std::vector<int32_t>& mask) {
    if (static_cast<int>(mask.size()) != embeddings.rows) {
        throw errors::InferenceError("attention_mask has " + std::to_string(mask.size()) +
                                     " entries for " + std::to_string(embeddings.rows) +
                                     " embedding rows");
    }

    int seq_len = 0;
    for (int32_t m : mask) {
        if (m == 1) ++seq_len;
    }
    if (seq_len <= 2) {
        throw errors::EmptySequenceError(seq_len);
    }

    const int dim = embeddings.dim;
    std::vector<double> acc(static_cast<size_t>(dim), 0.0);
    for (int r = 1; r < seq_len - 1; r++) {
        const float* row = embeddings.row(r);
        for (int d = 0; d < dim; d++) {
            acc[d] += row[d];
        }
    }

    const double count = static_cast<double>(seq_len - 2);
    types::FeatureVector features(static_cast<size_t>(dim));
    for (int d = 0; d < dim; d++) {
        features[d] = static_cast<float>(acc[d] / count);
    }
    return features;
}

}  // namespace pooling
}  // namespace tootbert
