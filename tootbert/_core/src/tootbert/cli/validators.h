#pragma once

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace tootbert {
namespace cli {

/**
 * A check run on an argument's raw text before it is converted.
 * The callable returns a message describing the problem, or "" to accept.
 */
class Validator {
public:
    using Check = std::function<std::string(const std::string&)>;

    Validator(Check check, std::string label) : check_(std::move(check)), label_(std::move(label)) {}

    std::string operator()(const std::string& text) const { return check_(text); }
    const std::string& description() const { return label_; }

private:
    Check check_;
    std::string label_;
};

/// Path to an existing regular file.
Validator ExistingFile();

/// Number within [min, max]; rejects text that is not entirely numeric.
Validator Range(double min, double max);

/// One of the listed words, case-sensitive.
Validator IsMember(const std::vector<std::string>& choices);

}  // namespace cli
}  // namespace tootbert
