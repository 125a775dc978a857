#include "validators.h"

#include "messages.h"

#include <filesystem>

namespace fs = std::filesystem;

namespace tootbert {
namespace validation {

void validate_file_exists(const std::string& path, const std::string& file_type) {
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        throw errors::messages::file_not_found(path, file_type);
    }
    if (!fs::is_regular_file(status)) {
        throw errors::ValidationError(file_type + " is not a regular file: " + path,
                                      "Provide a path to a file, not a directory");
    }
}

void validate_output_path(const std::string& path) {
    const fs::path parent = fs::path(path).parent_path();
    if (parent.empty() || fs::is_directory(parent)) {
        return;
    }
    throw errors::messages::file_write_error(path,
                                             "Parent directory does not exist: " + parent.string());
}

std::string resolve_model_file(const std::string& path, const std::string& default_filename,
                               const std::string& file_type) {
    const fs::path given(path);
    const fs::path file = fs::is_directory(given) ? given / default_filename : given;
    if (!fs::is_regular_file(file)) {
        throw errors::messages::file_not_found(file.string(), file_type);
    }
    return file.string();
}

void validate_positive(int value, const std::string& param_name) {
    if (value > 0) return;
    throw errors::messages::parameter_must_be_positive(param_name, value);
}

void validate_range(int value, int min, int max, const std::string& param_name) {
    if (value >= min && value <= max) return;
    throw errors::messages::parameter_out_of_range(param_name, value, min, max);
}

void validate_dimensions_match(int dim1, int dim2, const std::string& param1_name,
                               const std::string& param2_name) {
    if (dim1 == dim2) return;
    throw errors::DimensionError(param1_name + " vs " + param2_name, std::to_string(dim1),
                                 std::to_string(dim2));
}

}  // namespace validation
}  // namespace tootbert
