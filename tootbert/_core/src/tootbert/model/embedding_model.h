#pragma once

#include "tootbert/types/pipeline_types.h"
#include <string>

namespace tootbert {
namespace model {

/**
 * Abstract embedding model seam.
 *
 * One call encodes one tokenized sequence and returns its last-layer
 * hidden states, one row per token.
 */
class EmbeddingModel {
public:
    virtual ~EmbeddingModel() = default;

    /**
     * @throws InferenceError on runtime failure
     */
    virtual types::EmbeddingMatrix infer(const types::TokenBatch& batch) const = 0;

    virtual int hidden_dim() const = 0;

    /// Device the model runs on ("cpu" for the scalar backend).
    virtual std::string device() const { return "cpu"; }
};

/**
 * Embedding extractor used by the pipeline.
 *
 * Runs the model and checks the result against the batch. Failures that
 * are not already InferenceError (bad_alloc, runtime_error from a model
 * backend) are converted so callers see one error kind for this stage.
 *
 * @throws InferenceError
 */
types::EmbeddingMatrix embed(const EmbeddingModel& model, const types::TokenBatch& batch);

}  // namespace model
}  // namespace tootbert
