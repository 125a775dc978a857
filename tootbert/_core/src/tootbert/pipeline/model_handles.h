#pragma once

#include "pipeline_config.h"
#include "tootbert/classifier/classifier.h"
#include "tootbert/model/embedding_model.h"
#include "tootbert/tokenizer/tokenizer.h"
#include <memory>

namespace tootbert {
namespace pipeline {

/**
 * Loaded, read-only models shared by every record of a run.
 *
 * Built once before the batch loop and passed in explicitly. The
 * classifier may be null when only embeddings are wanted.
 */
struct ModelHandles {
    std::shared_ptr<const tokenizer::Tokenizer> tokenizer;
    std::shared_ptr<const model::EmbeddingModel> model;
    std::shared_ptr<const classifier::Classifier> classifier;

    bool has_classifier() const { return classifier != nullptr; }
};

/**
 * Load tokenizer, encoder and (optionally) classifier.
 *
 * Fails fast: the first component that cannot be loaded aborts the run.
 * When the classifier is loaded its input width must equal the encoder's
 * hidden size.
 *
 * @throws SetupError naming the component that failed
 */
ModelHandles load_models(const PipelineConfig& config, bool with_classifier = true);

/**
 * Tokenizer and encoder only; also applies config.num_threads.
 *
 * @throws SetupError
 */
ModelHandles load_encoder(const PipelineConfig& config);

/**
 * Load the classifier into handles that already hold an encoder.
 *
 * @throws SetupError if loading fails or the widths disagree
 */
void attach_classifier(ModelHandles& handles, const PipelineConfig& config);

}  // namespace pipeline
}  // namespace tootbert
