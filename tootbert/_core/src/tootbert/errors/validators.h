#pragma once

#include "tootbert_error.h"

#include <string>

namespace tootbert {
namespace validation {

// Argument and path checks shared by the loaders and the CLI commands.
// Each one throws the matching TootBertError subclass and returns
// normally when the input is acceptable.

/// @throws FileNotFoundError when missing, ValidationError for a directory
void validate_file_exists(const std::string& path, const std::string& file_type = "file");

/// The file itself may be absent; its parent directory must exist.
/// @throws FileWriteError
void validate_output_path(const std::string& path);

/**
 * Model locations are given either as the file itself or as the directory
 * a Hugging Face export was saved to. For a directory, `default_filename`
 * inside it is used ("vocab.txt", "model.safetensors", ...).
 *
 * @return path of an existing regular file
 * @throws FileNotFoundError
 */
std::string resolve_model_file(const std::string& path, const std::string& default_filename,
                               const std::string& file_type);

/// @throws ValidationError when value <= 0
void validate_positive(int value, const std::string& param_name);

/// Inclusive bounds. @throws ValidationError
void validate_range(int value, int min, int max, const std::string& param_name);

/// @throws DimensionError when dim1 != dim2
void validate_dimensions_match(int dim1, int dim2, const std::string& param1_name,
                               const std::string& param2_name);

}  // namespace validation
}  // namespace tootbert
