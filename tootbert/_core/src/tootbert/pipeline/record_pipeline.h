/**
 * Per-record processing.
 *
 *   raw -> normalize -> tokenize -> embed -> pool -> classify
 *
 * These functions do no I/O. Failures are returned as ProblemRecord
 * values so the caller decides where they go.
 */

#pragma once

#include "model_handles.h"
#include "tootbert/types/pipeline_types.h"
#include <string>
#include <variant>

namespace tootbert {
namespace pipeline {

/// Outcome of classifying one record.
using RecordOutcome = std::variant<types::Prediction, types::ProblemRecord>;

/// Pooled features of one record, or why there are none.
struct FeatureRow {
    std::string id;
    types::FeatureVector features;
};
using FeatureOutcome = std::variant<FeatureRow, types::ProblemRecord>;

/**
 * Normalize, tokenize, embed and pool one raw sequence.
 *
 * @throws TokenizationError, InferenceError, EmptySequenceError
 */
types::FeatureVector extract_features(const std::string& raw_sequence,
                                      const tokenizer::Tokenizer& tok,
                                      const model::EmbeddingModel& model, int max_seq_len);

/**
 * Classify one record; never throws for per-record failures.
 *
 * The problem message is the failing stage's message (what()).
 *
 * @throws ValidationError if handles has no classifier
 */
RecordOutcome classify_record(const types::SequenceRecord& record, const ModelHandles& handles,
                              int max_seq_len);

/**
 * Feature extraction counterpart of classify_record (no classifier needed).
 */
FeatureOutcome embed_record(const types::SequenceRecord& record, const ModelHandles& handles,
                            int max_seq_len);

inline bool is_prediction(const RecordOutcome& o) {
    return std::holds_alternative<types::Prediction>(o);
}

/// Id of either alternative.
inline const std::string& outcome_id(const RecordOutcome& o) {
    return std::visit([](const auto& v) -> const std::string& { return v.id; }, o);
}

}  // namespace pipeline
}  // namespace tootbert
