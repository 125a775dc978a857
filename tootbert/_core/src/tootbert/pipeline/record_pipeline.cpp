#include "record_pipeline.h"
#include "tootbert/errors/tootbert_error.h"
#include "tootbert/pooling/mean_pool.h"
#include "tootbert/sequence/normalizer.h"

namespace tootbert {
namespace pipeline {

namespace {

// Per-record stage failures carry their own message; anything else
// (a bug or a foreign backend) is labelled so it stands out in the log.
types::ProblemRecord to_problem(const std::string& id, const std::exception& e) {
    if (dynamic_cast<const errors::RecordError*>(&e) != nullptr) {
        return {id, e.what()};
    }
    return {id, std::string("Unexpected error: ") + e.what()};
}

}  // namespace

types::FeatureVector extract_features(const std::string& raw_sequence,
                                      const tokenizer::Tokenizer& tok,
                                      const model::EmbeddingModel& model, int max_seq_len) {
    const std::string normalized = sequence::normalize(raw_sequence);
    const types::TokenBatch batch = tokenizer::tokenize(tok, normalized, max_seq_len);
    const types::EmbeddingMatrix hidden = model::embed(model, batch);
    return pooling::pool(hidden, batch.attention_mask);
}

RecordOutcome classify_record(const types::SequenceRecord& record, const ModelHandles& handles,
                              int max_seq_len) {
    if (!handles.classifier) {
        throw errors::ValidationError("classify_record called without a classifier");
    }
    try {
        types::FeatureVector features =
            extract_features(record.raw_sequence, *handles.tokenizer, *handles.model, max_seq_len);
        return types::Prediction{record.id, classifier::classify(*handles.classifier, features)};
    } catch (const std::exception& e) {
        return to_problem(record.id, e);
    }
}

FeatureOutcome embed_record(const types::SequenceRecord& record, const ModelHandles& handles,
                            int max_seq_len) {
    try {
        return FeatureRow{record.id, extract_features(record.raw_sequence, *handles.tokenizer,
                                                      *handles.model, max_seq_len)};
    } catch (const std::exception& e) {
        return to_problem(record.id, e);
    }
}

}  // namespace pipeline
}  // namespace tootbert
