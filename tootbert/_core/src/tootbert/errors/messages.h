#pragma once

#include "error_categories.h"
#include "tootbert_error.h"

#include <string>
#include <vector>

/**
 * Message factories for the failures tootbert reports most often.
 *
 * Each returns its concrete error type, so call sites read
 * `throw messages::missing_tensor(...)` and handlers still match on type.
 */
namespace tootbert {
namespace errors {
namespace messages {

namespace detail {
inline std::string quoted_list(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += "'" + item + "'";
    }
    return out;
}
}  // namespace detail

// --- files -----------------------------------------------------------------

inline FileNotFoundError file_not_found(const std::string& path,
                                        const std::string& file_type = "file") {
    return FileNotFoundError(path, file_type);
}

inline FileWriteError file_write_error(const std::string& path, const std::string& reason = "") {
    return FileWriteError(path, reason);
}

inline FormatError not_a_fasta_file(const std::string& path) {
    return FormatError(path, "Input file is not a FASTA file (first line must start with '>')",
                       {".fasta", ".fa", ".faa"});
}

inline FormatError invalid_safetensors(const std::string& path, const std::string& reason) {
    return FormatError(path, "Invalid safetensors file: " + reason, {".safetensors"});
}

// --- model loading (fatal) -------------------------------------------------

inline SetupError missing_tensor(const std::string& component, const std::string& tensor_name,
                                 const std::string& path) {
    return SetupError(component, "tensor '" + tensor_name + "' not found in " + path,
                      "Export the weights with Hugging Face tensor names");
}

inline SetupError tensor_shape_mismatch(const std::string& component,
                                        const std::string& tensor_name,
                                        const std::string& actual, const std::string& expected) {
    return SetupError(component, "tensor '" + tensor_name + "' has shape " + actual +
                                     ", expected " + expected);
}

inline SetupError missing_special_token(const std::string& token, const std::string& vocab_path) {
    return SetupError("tokenizer", "vocabulary " + vocab_path + " has no " + token + " token",
                      "Use the vocab.txt shipped with the model");
}

// --- one sequence ----------------------------------------------------------

inline TokenizationError unknown_word_without_unk(const std::string& word) {
    return TokenizationError("word '" + word +
                             "' cannot be split into vocabulary pieces and the vocabulary "
                             "has no [UNK] token");
}

inline TokenizationError non_ascii_input(size_t byte_offset) {
    return TokenizationError("non-ASCII byte at offset " + std::to_string(byte_offset),
                             "Sequences must contain single-letter amino acid codes");
}

inline InferenceError sequence_too_long(int tokens, int max_positions) {
    const std::string limit = std::to_string(max_positions);
    return InferenceError(std::to_string(tokens) + " tokens exceed the model's " + limit +
                              " position embeddings",
                          "Lower --max-seq-len to at most " + limit);
}

inline ClassificationError feature_width_mismatch(int actual, int expected) {
    return ClassificationError("feature vector has " + std::to_string(actual) +
                                   " dimensions, classifier expects " + std::to_string(expected),
                               "Use a classifier trained on embeddings from the same model");
}

// --- parameters ------------------------------------------------------------

inline ValidationError parameter_out_of_range(const std::string& param_name, int value, int min,
                                              int max) {
    return ValidationError(param_name, std::to_string(value),
                           "value in range [" + std::to_string(min) + ", " +
                               std::to_string(max) + "]");
}

inline ValidationError parameter_must_be_positive(const std::string& param_name, int value) {
    return ValidationError(param_name, std::to_string(value), "positive value (> 0)");
}

inline ValidationError invalid_enum_value(const std::string& param_name, const std::string& value,
                                          const std::vector<std::string>& valid_values) {
    return ValidationError(param_name, value, "one of: " + detail::quoted_list(valid_values));
}

}  // namespace messages
}  // namespace errors
}  // namespace tootbert
