#pragma once

#include <string>
#include <utility>

namespace tootbert {
namespace errors {

/**
 * What went wrong, at the granularity a user acts on.
 *
 * FileIO through Setup abort a run. Tokenization, Inference, Pooling and
 * Classification are the four per-record stages; a failure there turns
 * one sequence into a problem record and the batch continues.
 */
enum class ErrorCategory {
    FileIO,
    Validation,
    Format,
    Setup,
    Tokenization,
    Inference,
    Pooling,
    Classification,
};

/// Label printed in the "Error [..]" prefix.
inline std::string category_to_string(ErrorCategory category) {
    static const char* const kLabels[] = {
        "File I/O", "Validation", "Format",  "Setup",
        "Tokenization", "Inference", "Pooling", "Classification",
    };
    const auto index = static_cast<size_t>(category);
    return index < sizeof(kLabels) / sizeof(kLabels[0]) ? kLabels[index] : "Unknown";
}

/// Payload shared by every TootBertError.
struct ErrorInfo {
    ErrorCategory category;
    std::string message;
    std::string suggestion;  // shown as "Suggestion: ..."
    std::string context;     // file, parameter or record the error refers to

    ErrorInfo(ErrorCategory cat, std::string msg, std::string sug = "", std::string ctx = "")
        : category(cat),
          message(std::move(msg)),
          suggestion(std::move(sug)),
          context(std::move(ctx)) {}
};

}  // namespace errors
}  // namespace tootbert
