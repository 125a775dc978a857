#pragma once

#include "tootbert/types/pipeline_types.h"
#include <string>

namespace tootbert {
namespace tokenizer {

/**
 * Abstract tokenizer seam.
 *
 * Implementations turn normalized, space-separated residue text into
 * model input ids with [CLS]/[SEP] boundary tokens, truncating so that
 * the result never exceeds max_length.
 */
class Tokenizer {
public:
    virtual ~Tokenizer() = default;

    /**
     * @throws TokenizationError if the input cannot be tokenized
     */
    virtual types::TokenBatch encode(const std::string& text, int max_length) const = 0;

    virtual int vocab_size() const = 0;
};

/**
 * Tokenizer adapter used by the pipeline.
 *
 * Calls tok.encode() and checks the result shape, so every tokenizer
 * behind the seam honours the same contract.
 *
 * @param tok Tokenizer implementation
 * @param normalized Output of sequence::normalize()
 * @param max_length Maximum total tokens including [CLS] and [SEP]
 * @throws TokenizationError on tokenizer failure or a malformed batch
 */
types::TokenBatch tokenize(const Tokenizer& tok, const std::string& normalized, int max_length);

}  // namespace tokenizer
}  // namespace tootbert
