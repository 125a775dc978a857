/**
 * Data carried between pipeline stages.
 *
 * Every value here lives for one iteration of the batch runner:
 *
 *   SequenceRecord -> normalized text -> TokenBatch -> EmbeddingMatrix
 *     -> FeatureVector -> Prediction | ProblemRecord
 *
 * Pure data structures, no algorithm dependencies.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tootbert::types {

/**
 * One input sequence with its identifier.
 */
struct SequenceRecord {
    std::string id;            ///< First whitespace token of the FASTA header
    std::string raw_sequence;  ///< Residue letters as read (no whitespace)
    std::string description;   ///< Remainder of the header line, may be empty

    SequenceRecord() = default;
    SequenceRecord(std::string id_, std::string seq, std::string desc = "")
        : id(std::move(id_)), raw_sequence(std::move(seq)), description(std::move(desc)) {}
};

/**
 * Tokenizer output for a single sequence.
 *
 * input_ids and attention_mask always have the same length. Mask is 1 for
 * [CLS], residue tokens and [SEP], 0 for trailing [PAD].
 */
struct TokenBatch {
    std::vector<int32_t> input_ids;
    std::vector<int32_t> attention_mask;

    int size() const { return static_cast<int>(input_ids.size()); }

    /// Number of positions with mask == 1.
    int attended_length() const {
        int n = 0;
        for (int32_t m : attention_mask) {
            if (m == 1) ++n;
        }
        return n;
    }
};

/**
 * Last-layer hidden states, row-major [rows * dim].
 *
 * Row i corresponds to token i of the TokenBatch it was computed from.
 */
struct EmbeddingMatrix {
    int rows = 0;
    int dim = 0;
    std::vector<float> data;

    EmbeddingMatrix() = default;
    EmbeddingMatrix(int rows_, int dim_)
        : rows(rows_), dim(dim_), data(static_cast<size_t>(rows_) * dim_, 0.0f) {}

    float* row(int i) { return data.data() + static_cast<size_t>(i) * dim; }
    const float* row(int i) const { return data.data() + static_cast<size_t>(i) * dim; }
};

/// Fixed-size sequence representation (length = hidden dimension).
using FeatureVector = std::vector<float>;

/// Class label as produced by the classifier.
using Label = std::string;

struct Prediction {
    std::string id;
    Label label;
};

struct ProblemRecord {
    std::string id;
    std::string message;
};

}  // namespace tootbert::types
