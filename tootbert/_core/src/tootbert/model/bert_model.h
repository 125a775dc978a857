#pragma once

#include "embedding_model.h"
#include "bert_encoder.h"
#include <memory>
#include <string>

namespace tootbert {
namespace model {

struct BertModelOptions {
    int default_num_heads = 16;  // Used when the weights carry no head count
    std::string device = "auto";
};

/**
 * BERT encoder behind the EmbeddingModel seam.
 *
 * Immutable after construction; infer() allocates its own workspace so
 * one instance can serve any number of sequential calls.
 */
class BertModel : public EmbeddingModel {
public:
    BertModel(BertWeights weights, BertConfig config, std::string device = "cpu");

    /**
     * Load from a safetensors file or a directory holding model.safetensors.
     *
     * @throws FileNotFoundError, FormatError, SetupError
     */
    static std::shared_ptr<const BertModel> load(const std::string& path,
                                                 const BertModelOptions& options = BertModelOptions());

    /**
     * @throws InferenceError for empty or over-long batches, out-of-range
     *         token ids, allocation failure and non-finite output
     */
    types::EmbeddingMatrix infer(const types::TokenBatch& batch) const override;

    int hidden_dim() const override { return config_.hidden_dim; }
    std::string device() const override { return device_; }

    const BertConfig& config() const { return config_; }

private:
    BertWeights weights_;
    BertConfig config_;
    std::string device_;
};

}  // namespace model
}  // namespace tootbert
