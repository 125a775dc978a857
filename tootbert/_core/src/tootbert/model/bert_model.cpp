#include "bert_model.h"
#include "device.h"
#include "tootbert/common/tuning.h"
#include "tootbert/errors/messages.h"
#include "tootbert/errors/validators.h"
#include "tootbert/tools/weights/bert_weight_loader.h"
#include <cmath>
#include <new>

namespace tootbert {
namespace model {

BertModel::BertModel(BertWeights weights, BertConfig config, std::string device)
    : weights_(std::move(weights)), config_(config), device_(std::move(device)) {
    validate_config(config_);
    if (static_cast<int>(weights_.layers.size()) != config_.num_layers) {
        throw std::invalid_argument("BertModel: weights have " +
                                    std::to_string(weights_.layers.size()) + " layers, config has " +
                                    std::to_string(config_.num_layers));
    }
}

std::shared_ptr<const BertModel> BertModel::load(const std::string& path,
                                                 const BertModelOptions& options) {
    const std::string device = resolve_device(options.device);
    const std::string file =
        validation::resolve_model_file(path, "model.safetensors", "Model weights");

    auto loaded = weights::BertWeightLoader::load(file, options.default_num_heads);
    return std::make_shared<const BertModel>(std::move(loaded.first), loaded.second, device);
}

types::EmbeddingMatrix BertModel::infer(const types::TokenBatch& batch) const {
    const int L = batch.size();

    if (L == 0) {
        throw errors::InferenceError("empty token batch");
    }
    if (batch.attention_mask.size() != batch.input_ids.size()) {
        throw errors::InferenceError("attention_mask length differs from input_ids length");
    }
    if (L > config_.max_positions) {
        throw errors::messages::sequence_too_long(L, config_.max_positions);
    }
    for (int i = 0; i < L; i++) {
        int32_t id = batch.input_ids[i];
        if (id < 0 || id >= config_.vocab_size) {
            throw errors::InferenceError("token id " + std::to_string(id) + " at position " +
                                         std::to_string(i) + " is outside the vocabulary (" +
                                         std::to_string(config_.vocab_size) + ")");
        }
    }

    types::EmbeddingMatrix out;
    try {
        BertWorkspace ws(L, config_, tuning::AttentionTuning::get().query_block);
        out = types::EmbeddingMatrix(L, config_.hidden_dim);
        bert_forward<ScalarBackend>(batch.input_ids.data(), batch.attention_mask.data(), L,
                                    weights_, config_, out.data.data(), ws);
    } catch (const std::bad_alloc&) {
        throw errors::InferenceError("out of memory encoding " + std::to_string(L) + " tokens",
                                     "Lower --max-seq-len");
    }

    for (float v : out.data) {
        if (!std::isfinite(v)) {
            throw errors::InferenceError("non-finite value in hidden states");
        }
    }
    return out;
}

}  // namespace model
}  // namespace tootbert
