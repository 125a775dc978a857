#pragma once

#include "error_categories.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace tootbert {
namespace errors {

/**
 * Root of every error tootbert raises on purpose.
 *
 * what() is the one-line message, which is also what lands in the
 * problems file. formatted() is the multi-line form for the terminal:
 *
 *   [ERROR] Setup: Failed to load classifier: coef is missing
 *     Context: ...
 *     Suggestion: ...
 */
class TootBertError : public std::runtime_error {
public:
    TootBertError(ErrorCategory category, const std::string& message,
                  const std::string& suggestion = "", const std::string& context = "");
    explicit TootBertError(const ErrorInfo& info);

    ErrorCategory category() const { return info_.category; }
    const std::string& message() const { return info_.message; }
    const std::string& suggestion() const { return info_.suggestion; }
    const std::string& context() const { return info_.context; }

    std::string formatted() const;

private:
    ErrorInfo info_;
};

// ---------------------------------------------------------------------------
// Run-level errors. Any of these ends the command with a non-zero status.
// ---------------------------------------------------------------------------

class FileNotFoundError : public TootBertError {
public:
    FileNotFoundError(const std::string& path, const std::string& file_type = "file");
};

class FileWriteError : public TootBertError {
public:
    FileWriteError(const std::string& path, const std::string& reason = "");
};

class ValidationError : public TootBertError {
public:
    /// "Invalid value for <param>: <value>" with "Expected: <expected>".
    ValidationError(const std::string& param_name, const std::string& value,
                    const std::string& expected);
    ValidationError(const std::string& message, const std::string& suggestion = "");
};

/// Input that is not what its extension or caller promised (FASTA, safetensors, vocab).
class FormatError : public TootBertError {
public:
    FormatError(const std::string& path, const std::string& reason,
                const std::vector<std::string>& supported_formats = {});
};

class DimensionError : public TootBertError {
public:
    DimensionError(const std::string& param_name, const std::string& actual_shape,
                   const std::string& expected_shape);
};

/// Tokenizer, encoder or classifier unusable; raised before any record is read.
class SetupError : public TootBertError {
public:
    SetupError(const std::string& component, const std::string& reason,
               const std::string& suggestion = "");
};

// ---------------------------------------------------------------------------
// Record-level errors. The batch runner writes the message to the problems
// file and continues with the next sequence.
// ---------------------------------------------------------------------------

class RecordError : public TootBertError {
protected:
    RecordError(ErrorCategory category, const std::string& message,
                const std::string& suggestion = "")
        : TootBertError(category, message, suggestion) {}
};

class TokenizationError : public RecordError {
public:
    explicit TokenizationError(const std::string& reason, const std::string& suggestion = "");
};

/// Nothing left between [CLS] and [SEP] to average.
class EmptySequenceError : public RecordError {
public:
    explicit EmptySequenceError(int attended_positions);
};

class InferenceError : public RecordError {
public:
    explicit InferenceError(const std::string& reason, const std::string& suggestion = "");
};

class ClassificationError : public RecordError {
public:
    explicit ClassificationError(const std::string& reason, const std::string& suggestion = "");
};

}  // namespace errors
}  // namespace tootbert
