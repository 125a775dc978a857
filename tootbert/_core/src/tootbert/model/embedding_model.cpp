#include "embedding_model.h"
#include "tootbert/errors/tootbert_error.h"
#include <new>

namespace tootbert {
namespace model {

types::EmbeddingMatrix embed(const EmbeddingModel& model, const types::TokenBatch& batch) {
    types::EmbeddingMatrix out;
    try {
        out = model.infer(batch);
    } catch (const errors::InferenceError&) {
        throw;
    } catch (const std::bad_alloc&) {
        throw errors::InferenceError(
            "out of memory encoding " + std::to_string(batch.size()) + " tokens",
            "Lower --max-seq-len");
    } catch (const errors::TootBertError& e) {
        throw errors::InferenceError(e.message());
    } catch (const std::exception& e) {
        throw errors::InferenceError(e.what());
    }

    if (out.rows != batch.size() || out.dim != model.hidden_dim() ||
        out.data.size() != static_cast<size_t>(out.rows) * out.dim) {
        throw errors::InferenceError(
            "model returned a " + std::to_string(out.rows) + " x " + std::to_string(out.dim) +
            " matrix for " + std::to_string(batch.size()) + " tokens");
    }
    return out;
}

}  // namespace model
}  // namespace tootbert
