#include "tootbert_error.h"

namespace tootbert {
namespace errors {

namespace {

std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += sep;
        out += item;
    }
    return out;
}

}  // namespace

TootBertError::TootBertError(ErrorCategory category, const std::string& message,
                             const std::string& suggestion, const std::string& context)
    : std::runtime_error(message), info_(category, message, suggestion, context) {}

TootBertError::TootBertError(const ErrorInfo& info)
    : std::runtime_error(info.message), info_(info) {}

std::string TootBertError::formatted() const {
    std::string text = "[ERROR] " + category_to_string(info_.category) + ": " + info_.message;
    if (!info_.context.empty()) text += "\n  Context: " + info_.context;
    if (!info_.suggestion.empty()) text += "\n  Suggestion: " + info_.suggestion;
    return text;
}

FileNotFoundError::FileNotFoundError(const std::string& path, const std::string& file_type)
    : TootBertError(ErrorCategory::FileIO, file_type + " not found: " + path,
                    "Check that the file path exists and is readable") {}

FileWriteError::FileWriteError(const std::string& path, const std::string& reason)
    : TootBertError(ErrorCategory::FileIO, "Cannot write to file: " + path,
                    "Check that the directory exists and you have write permissions",
                    reason.empty() ? std::string() : "Reason: " + reason) {}

ValidationError::ValidationError(const std::string& param_name, const std::string& value,
                                 const std::string& expected)
    : TootBertError(ErrorCategory::Validation, "Invalid value for " + param_name + ": " + value,
                    "Expected: " + expected) {}

ValidationError::ValidationError(const std::string& message, const std::string& suggestion)
    : TootBertError(ErrorCategory::Validation, message, suggestion) {}

FormatError::FormatError(const std::string& path, const std::string& reason,
                         const std::vector<std::string>& supported_formats)
    : TootBertError(ErrorCategory::Format, "Format error in " + path + ": " + reason,
                    supported_formats.empty()
                        ? std::string()
                        : "Supported formats: " + join(supported_formats, ", ")) {}

DimensionError::DimensionError(const std::string& param_name, const std::string& actual_shape,
                               const std::string& expected_shape)
    : TootBertError(ErrorCategory::Validation,
                    "Invalid shape for " + param_name + ": " + actual_shape,
                    "Expected shape: " + expected_shape) {}

SetupError::SetupError(const std::string& component, const std::string& reason,
                       const std::string& suggestion)
    : TootBertError(ErrorCategory::Setup, "Failed to load " + component + ": " + reason,
                    suggestion.empty() ? "Check the " + component + " path and file contents"
                                       : suggestion) {}

TokenizationError::TokenizationError(const std::string& reason, const std::string& suggestion)
    : RecordError(ErrorCategory::Tokenization, "Tokenization failed: " + reason, suggestion) {}

EmptySequenceError::EmptySequenceError(int attended_positions)
    : RecordError(ErrorCategory::Pooling,
                  "No residue positions to pool (" + std::to_string(attended_positions) +
                      " attended tokens, boundary tokens excluded)",
                  "Provide a non-empty sequence") {}

InferenceError::InferenceError(const std::string& reason, const std::string& suggestion)
    : RecordError(ErrorCategory::Inference, "Inference failed: " + reason, suggestion) {}

ClassificationError::ClassificationError(const std::string& reason,
                                         const std::string& suggestion)
    : RecordError(ErrorCategory::Classification, "Classification failed: " + reason,
                  suggestion) {}

}  // namespace errors
}  // namespace tootbert
