#include "model_handles.h"
#include "tootbert/classifier/logistic_regression.h"
#include "tootbert/errors/tootbert_error.h"
#include "tootbert/model/bert_model.h"
#include "tootbert/primitives/gemm/thread_utils.h"
#include "tootbert/tokenizer/bert_tokenizer.h"

namespace tootbert {
namespace pipeline {

namespace {

/**
 * Run a loader and report any failure as SetupError for `component`.
 */
template <typename Loader>
auto load_component(const std::string& component, Loader&& loader) -> decltype(loader()) {
    try {
        return loader();
    } catch (const errors::SetupError&) {
        throw;
    } catch (const errors::TootBertError& e) {
        throw errors::SetupError(component, e.message(), e.suggestion());
    } catch (const std::exception& e) {
        throw errors::SetupError(component, e.what());
    }
}

}  // namespace

ModelHandles load_encoder(const PipelineConfig& config) {
    gemm::set_thread_count(config.num_threads);

    ModelHandles handles;

    handles.tokenizer = load_component("tokenizer", [&]() {
        return tokenizer::BertTokenizer::load(config.tokenizer_path);
    });

    auto bert = load_component("embedding model", [&]() {
        model::BertModelOptions options;
        options.default_num_heads = config.num_heads;
        options.device = config.device;
        return model::BertModel::load(config.model_path, options);
    });

    if (bert->config().vocab_size < handles.tokenizer->vocab_size()) {
        throw errors::SetupError(
            "embedding model",
            "word embedding table has " + std::to_string(bert->config().vocab_size) +
                " rows but the vocabulary has " +
                std::to_string(handles.tokenizer->vocab_size()) + " tokens",
            "Use the tokenizer that belongs to the model");
    }
    handles.model = bert;
    return handles;
}

void attach_classifier(ModelHandles& handles, const PipelineConfig& config) {
    if (!handles.model) {
        throw errors::SetupError("classifier", "no embedding model loaded");
    }
    auto clf = load_component("classifier", [&]() {
        return classifier::LogisticRegression::load(config.lr_model_path);
    });
    if (clf->input_dim() != handles.model->hidden_dim()) {
        throw errors::SetupError(
            "classifier",
            "expects " + std::to_string(clf->input_dim()) +
                " features but the model produces " +
                std::to_string(handles.model->hidden_dim()),
            "Use a classifier trained on embeddings from this model");
    }
    handles.classifier = std::move(clf);
}

ModelHandles load_models(const PipelineConfig& config, bool with_classifier) {
    ModelHandles handles = load_encoder(config);
    if (with_classifier) {
        attach_classifier(handles, config);
    }
    return handles;
}

}  // namespace pipeline
}  // namespace tootbert
