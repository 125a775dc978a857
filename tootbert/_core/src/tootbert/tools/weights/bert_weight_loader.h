/**
 * BERT weight loader using safetensors format
 *
 * Expected tensor names (Hugging Face BertModel export, optional "bert." prefix):
 *   - embeddings.word_embeddings.weight          [vocab_size, hidden]
 *   - embeddings.position_embeddings.weight      [max_positions, hidden]
 *   - embeddings.token_type_embeddings.weight    [type_vocab_size, hidden]
 *   - embeddings.LayerNorm.{weight,bias}         [hidden]
 *   - encoder.layer.{i}.attention.self.{query,key,value}.weight   [hidden, hidden]
 *   - encoder.layer.{i}.attention.self.{query,key,value}.bias     [hidden]
 *   - encoder.layer.{i}.attention.output.dense.{weight,bias}      [hidden, hidden], [hidden]
 *   - encoder.layer.{i}.attention.output.LayerNorm.{weight,bias}  [hidden]
 *   - encoder.layer.{i}.intermediate.dense.{weight,bias}          [inter, hidden], [inter]
 *   - encoder.layer.{i}.output.dense.{weight,bias}                [hidden, inter], [hidden]
 *   - encoder.layer.{i}.output.LayerNorm.{weight,bias}            [hidden]
 *
 * Older exports name LayerNorm parameters gamma/beta; both spellings load.
 *
 * Shapes give every hyperparameter except the head count, which comes
 * from the "num_attention_heads" metadata entry or the caller's default.
 */

#pragma once

#include "safetensors_loader.h"
#include "tootbert/model/bert_encoder.h"
#include "tootbert/errors/messages.h"
#include <utility>

namespace tootbert {
namespace weights {

class BertWeightLoader {
public:
    /**
     * Load encoder weights and infer the config.
     *
     * @param filepath           safetensors file
     * @param default_num_heads  Used when the file has no head-count metadata
     * @throws SetupError on missing tensors, wrong shapes or bad metadata
     * @throws FileNotFoundError, FormatError from the safetensors reader
     */
    static std::pair<model::BertWeights, model::BertConfig>
    load(const std::string& filepath, int default_num_heads = model::BertConfig().num_heads) {
        SafetensorsLoader loader(filepath);
        return load(loader, default_num_heads);
    }

    static std::pair<model::BertWeights, model::BertConfig>
    load(const SafetensorsLoader& loader, int default_num_heads) {
        const std::string prefix = detect_prefix(loader);
        model::BertConfig config = infer_config(loader, prefix, default_num_heads);

        model::BertWeights weights(config.num_layers);
        load_embeddings(loader, prefix, config, weights);
        for (int i = 0; i < config.num_layers; i++) {
            load_layer(loader, prefix, config, i, weights.layers[i]);
        }
        return {std::move(weights), config};
    }

    /**
     * Convert a PyTorch Linear weight [out, in] to [in, out].
     */
    static std::vector<float> transpose(const std::vector<float>& w, int out_dim, int in_dim) {
        std::vector<float> t(w.size());
        for (int o = 0; o < out_dim; o++) {
            for (int i = 0; i < in_dim; i++) {
                t[static_cast<size_t>(i) * out_dim + o] = w[static_cast<size_t>(o) * in_dim + i];
            }
        }
        return t;
    }

private:
    static constexpr const char* kComponent = "embedding model";

    static std::string detect_prefix(const SafetensorsLoader& loader) {
        if (loader.has_tensor("embeddings.word_embeddings.weight")) {
            return "";
        }
        if (loader.has_tensor("bert.embeddings.word_embeddings.weight")) {
            return "bert.";
        }
        throw errors::messages::missing_tensor(kComponent, "embeddings.word_embeddings.weight",
                                               loader.path());
    }

    static const TensorInfo& require(const SafetensorsLoader& loader, const std::string& name) {
        if (!loader.has_tensor(name)) {
            throw errors::messages::missing_tensor(kComponent, name, loader.path());
        }
        return loader.get_info(name);
    }

    static std::vector<float> load_shaped(const SafetensorsLoader& loader, const std::string& name,
                                          const std::vector<size_t>& expected) {
        const TensorInfo& info = require(loader, name);
        if (info.shape != expected) {
            TensorInfo want;
            want.shape = expected;
            throw errors::messages::tensor_shape_mismatch(kComponent, name, info.shape_string(),
                                                          want.shape_string());
        }
        return loader.load_tensor(name);
    }

    // LayerNorm parameters: "weight"/"bias" or legacy "gamma"/"beta"
    static std::vector<float> load_norm(const SafetensorsLoader& loader, const std::string& base,
                                        const std::string& modern, const std::string& legacy,
                                        int dim) {
        const std::string name =
            loader.has_tensor(base + "." + modern) || !loader.has_tensor(base + "." + legacy)
                ? base + "." + modern
                : base + "." + legacy;
        return load_shaped(loader, name, {static_cast<size_t>(dim)});
    }

    static std::vector<float> load_linear(const SafetensorsLoader& loader, const std::string& name,
                                          int out_dim, int in_dim) {
        auto w = load_shaped(loader, name,
                             {static_cast<size_t>(out_dim), static_cast<size_t>(in_dim)});
        return transpose(w, out_dim, in_dim);
    }

    static model::BertConfig infer_config(const SafetensorsLoader& loader,
                                          const std::string& prefix, int default_num_heads) {
        model::BertConfig config;

        auto rank2 = [&](const std::string& name) -> const TensorInfo& {
            const TensorInfo& info = require(loader, name);
            if (info.shape.size() != 2) {
                throw errors::messages::tensor_shape_mismatch(kComponent, name,
                                                              info.shape_string(), "2D");
            }
            return info;
        };

        const TensorInfo& word = rank2(prefix + "embeddings.word_embeddings.weight");
        config.vocab_size = static_cast<int>(word.shape[0]);
        config.hidden_dim = static_cast<int>(word.shape[1]);
        config.max_positions =
            static_cast<int>(rank2(prefix + "embeddings.position_embeddings.weight").shape[0]);
        config.type_vocab_size =
            static_cast<int>(rank2(prefix + "embeddings.token_type_embeddings.weight").shape[0]);

        config.num_layers = 0;
        while (loader.has_tensor(layer_prefix(prefix, config.num_layers) +
                                 "attention.self.query.weight")) {
            config.num_layers++;
        }
        if (config.num_layers == 0) {
            throw errors::SetupError(kComponent, "no encoder layers found in " + loader.path());
        }

        config.intermediate_dim = static_cast<int>(
            rank2(layer_prefix(prefix, 0) + "intermediate.dense.weight").shape[0]);

        config.num_heads = default_num_heads;
        std::string heads = loader.metadata_value("num_attention_heads");
        if (!heads.empty()) {
            try {
                config.num_heads = std::stoi(heads);
            } catch (const std::exception&) {
                throw errors::SetupError(kComponent,
                                         "metadata num_attention_heads is not an integer: " + heads);
            }
        }
        std::string eps = loader.metadata_value("layer_norm_eps");
        if (!eps.empty()) {
            try {
                config.layer_norm_eps = std::stof(eps);
            } catch (const std::exception&) {
                throw errors::SetupError(kComponent,
                                         "metadata layer_norm_eps is not a number: " + eps);
            }
        }

        try {
            model::validate_config(config);
        } catch (const std::invalid_argument& e) {
            throw errors::SetupError(kComponent, e.what(),
                                     "Set --num-heads to the model's attention head count");
        }
        return config;
    }

    static std::string layer_prefix(const std::string& prefix, int i) {
        return prefix + "encoder.layer." + std::to_string(i) + ".";
    }

    static void load_embeddings(const SafetensorsLoader& loader, const std::string& prefix,
                                const model::BertConfig& c, model::BertWeights& w) {
        const size_t H = static_cast<size_t>(c.hidden_dim);
        w.word_embeddings = load_shaped(loader, prefix + "embeddings.word_embeddings.weight",
                                        {static_cast<size_t>(c.vocab_size), H});
        w.position_embeddings =
            load_shaped(loader, prefix + "embeddings.position_embeddings.weight",
                        {static_cast<size_t>(c.max_positions), H});
        w.token_type_embeddings =
            load_shaped(loader, prefix + "embeddings.token_type_embeddings.weight",
                        {static_cast<size_t>(c.type_vocab_size), H});
        w.embedding_norm_gamma =
            load_norm(loader, prefix + "embeddings.LayerNorm", "weight", "gamma", c.hidden_dim);
        w.embedding_norm_beta =
            load_norm(loader, prefix + "embeddings.LayerNorm", "bias", "beta", c.hidden_dim);
    }

    static void load_layer(const SafetensorsLoader& loader, const std::string& prefix,
                           const model::BertConfig& c, int i,
                           model::BertWeights::LayerWeights& layer) {
        const std::string p = layer_prefix(prefix, i);
        const int H = c.hidden_dim;
        const int I = c.intermediate_dim;
        const std::vector<size_t> vec_h = {static_cast<size_t>(H)};

        layer.query_weight = load_linear(loader, p + "attention.self.query.weight", H, H);
        layer.query_bias = load_shaped(loader, p + "attention.self.query.bias", vec_h);
        layer.key_weight = load_linear(loader, p + "attention.self.key.weight", H, H);
        layer.key_bias = load_shaped(loader, p + "attention.self.key.bias", vec_h);
        layer.value_weight = load_linear(loader, p + "attention.self.value.weight", H, H);
        layer.value_bias = load_shaped(loader, p + "attention.self.value.bias", vec_h);

        layer.attn_output_weight = load_linear(loader, p + "attention.output.dense.weight", H, H);
        layer.attn_output_bias = load_shaped(loader, p + "attention.output.dense.bias", vec_h);
        layer.attn_norm_gamma = load_norm(loader, p + "attention.output.LayerNorm", "weight", "gamma", H);
        layer.attn_norm_beta = load_norm(loader, p + "attention.output.LayerNorm", "bias", "beta", H);

        layer.intermediate_weight = load_linear(loader, p + "intermediate.dense.weight", I, H);
        layer.intermediate_bias =
            load_shaped(loader, p + "intermediate.dense.bias", {static_cast<size_t>(I)});
        layer.output_weight = load_linear(loader, p + "output.dense.weight", H, I);
        layer.output_bias = load_shaped(loader, p + "output.dense.bias", vec_h);
        layer.output_norm_gamma = load_norm(loader, p + "output.LayerNorm", "weight", "gamma", H);
        layer.output_norm_beta = load_norm(loader, p + "output.LayerNorm", "bias", "beta", H);
    }
};

}  // namespace weights
}  // namespace tootbert
