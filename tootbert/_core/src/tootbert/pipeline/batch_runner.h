#pragma once

#include "record_pipeline.h"
#include <functional>
#include <optional>
#include <vector>

namespace tootbert {
namespace pipeline {

/// Pulls the next record; std::nullopt at end of input.
using RecordSource = std::function<std::optional<types::SequenceRecord>()>;

/// Receives each outcome as soon as it is produced (index is 0-based).
using OutcomeSink = std::function<void(size_t index, const RecordOutcome& outcome)>;
using FeatureSink = std::function<void(size_t index, const FeatureOutcome& outcome)>;

struct BatchSummary {
    size_t total = 0;
    size_t succeeded = 0;
    size_t problems = 0;
};

/**
 * Drives the per-record pipeline over a sequence of records.
 *
 * One record in flight at a time, in input order. Each record yields
 * exactly one outcome, delivered to the sink before the next record is
 * read, so succeeded + problems == total and ids come out in input order.
 * Exceptions thrown by the source or the sink are not per-record
 * failures and propagate.
 *
 * Example:
 * ```cpp
 *   BatchRunner runner(handles, config.max_seq_len);
 *   runner.run(records, [&](size_t, const RecordOutcome& o) { writer.write(o); });
 * ```
 */
class BatchRunner {
public:
    /**
     * @throws ValidationError if handles are incomplete or max_seq_len < 2
     */
    BatchRunner(ModelHandles handles, int max_seq_len);

    BatchSummary run(const std::vector<types::SequenceRecord>& records, const OutcomeSink& sink) const;
    BatchSummary run(const RecordSource& source, const OutcomeSink& sink) const;

    /**
     * Feature extraction only; the classifier handle may be null.
     */
    BatchSummary run_features(const std::vector<types::SequenceRecord>& records,
                              const FeatureSink& sink) const;

    int max_seq_len() const { return max_seq_len_; }

private:
    ModelHandles handles_;
    int max_seq_len_;
};

}  // namespace pipeline
}  // namespace tootbert
