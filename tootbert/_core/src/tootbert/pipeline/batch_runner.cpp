#include "batch_runner.h"
#include "tootbert/errors/messages.h"

namespace tootbert {
namespace pipeline {

BatchRunner::BatchRunner(ModelHandles handles, int max_seq_len)
    : handles_(std::move(handles)), max_seq_len_(max_seq_len) {
    if (!handles_.tokenizer || !handles_.model) {
        throw errors::ValidationError("BatchRunner needs a tokenizer and an embedding model");
    }
    if (max_seq_len_ < 2) {
        throw errors::ValidationError("max_seq_len", std::to_string(max_seq_len_),
                                      "integer >= 2 (room for [CLS] and [SEP])");
    }
}

BatchSummary BatchRunner::run(const std::vector<types::SequenceRecord>& records,
                              const OutcomeSink& sink) const {
    size_t next = 0;
    return run(
        [&]() -> std::optional<types::SequenceRecord> {
            if (next >= records.size()) return std::nullopt;
            return records[next++];
        },
        sink);
}

BatchSummary BatchRunner::run(const RecordSource& source, const OutcomeSink& sink) const {
    if (!handles_.classifier) {
        throw errors::ValidationError("BatchRunner::run needs a classifier",
                                      "Load models with the classifier enabled");
    }

    BatchSummary summary;
    while (std::optional<types::SequenceRecord> record = source()) {
        RecordOutcome outcome = classify_record(*record, handles_, max_seq_len_);
        if (is_prediction(outcome)) {
            summary.succeeded++;
        } else {
            summary.problems++;
        }
        sink(summary.total++, outcome);
    }
    return summary;
}

BatchSummary BatchRunner::run_features(const std::vector<types::SequenceRecord>& records,
                                       const FeatureSink& sink) const {
    BatchSummary summary;
    for (const auto& record : records) {
        FeatureOutcome outcome = embed_record(record, handles_, max_seq_len_);
        if (std::holds_alternative<FeatureRow>(outcome)) {
            summary.succeeded++;
        } else {
            summary.problems++;
        }
        sink(summary.total++, outcome);
    }
    return summary;
}

}  // namespace pipeline
}  // namespace tootbert
