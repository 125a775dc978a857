#include "tokenizer.h"
#include "tootbert/errors/tootbert_error.h"

namespace tootbert {
namespace tokenizer {

types::TokenBatch tokenize(const Tokenizer& tok, const std::string& normalized, int max_length) {
    types::TokenBatch batch = tok.encode(normalized, max_length);

    if (batch.input_ids.size() != batch.attention_mask.size()) {
        throw errors::TokenizationError(
            "input_ids (" + std::to_string(batch.input_ids.size()) +
            ") and attention_mask (" + std::to_string(batch.attention_mask.size()) +
            ") differ in length");
    }
    if (batch.size() > max_length) {
        throw errors::TokenizationError(
            "tokenizer returned " + std::to_string(batch.size()) +
            " tokens for max_length " + std::to_string(max_length));
    }
    return batch;
}

}  // namespace tokenizer
}  // namespace tootbert
