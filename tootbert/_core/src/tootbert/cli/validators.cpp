#include "validators.h"

#include "types.h"

#include <algorithm>
#include <filesystem>
#include <sstream>

namespace tootbert {
namespace cli {

Validator ExistingFile() {
    return Validator(
        [](const std::string& path) {
            std::error_code ec;
            return std::filesystem::is_regular_file(path, ec) ? std::string()
                                                              : "File does not exist: " + path;
        },
        "FILE");
}

Validator Range(double min, double max) {
    std::ostringstream label;
    label << "[" << min << ", " << max << "]";
    const std::string bounds = label.str();

    return Validator(
        [min, max, bounds](const std::string& text) {
            double value = 0.0;
            if (!parse_value(text, value)) {
                return "Not a valid number: " + text;
            }
            if (value < min || value > max) {
                return "Value " + text + " not in range " + bounds;
            }
            return std::string();
        },
        bounds);
}

Validator IsMember(const std::vector<std::string>& choices) {
    std::string joined;
    for (const auto& choice : choices) {
        joined += (joined.empty() ? "" : "|") + choice;
    }
    return Validator(
        [choices, joined](const std::string& text) {
            if (std::find(choices.begin(), choices.end(), text) != choices.end()) {
                return std::string();
            }
            return "Value '" + text + "' not one of: " + joined;
        },
        joined);
}

}  // namespace cli
}  // namespace tootbert
