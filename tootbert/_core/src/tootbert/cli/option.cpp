#include "option.h"

#include "errors.h"

namespace tootbert {
namespace cli {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

}  // namespace

bool split_inline_value(const std::string& arg, std::string& name, std::string& value) {
    const auto eq = arg.find('=');
    if (eq == std::string::npos) {
        name = arg;
        value.clear();
        return false;
    }
    name = arg.substr(0, eq);
    value = arg.substr(eq + 1);
    return true;
}

Option::Option(const std::string& names, const std::string& description)
    : description_(description) {
    size_t start = 0;
    while (start <= names.size()) {
        auto comma = names.find(',', start);
        if (comma == std::string::npos) comma = names.size();
        const std::string name = trim(names.substr(start, comma - start));
        if (name.size() >= 2 && name[0] == '-') {
            spellings_.push_back(name);
        } else if (!name.empty() && positional_name_.empty()) {
            positional_name_ = name;
        }
        start = comma + 1;
    }
}

void Option::parse(const std::string& text) {
    for (const auto& validator : validators_) {
        const std::string problem = validator(text);
        if (!problem.empty()) {
            throw ValidationError(help_name() + ": " + problem);
        }
    }
    if (!assign_) {
        throw ParseError("Option not bound to a variable: " + help_name());
    }
    if (!assign_(text)) {
        throw ParseError("Invalid value '" + text + "' for " + help_name());
    }
    ++seen_;
}

bool Option::matches(const std::string& arg) const {
    std::string name, value;
    split_inline_value(arg, name, value);
    for (const auto& spelling : spellings_) {
        if (spelling == name) return true;
    }
    return false;
}

std::string Option::help_name() const {
    if (spellings_.empty()) return positional_name_;
    std::string joined = spellings_.front();
    for (size_t i = 1; i < spellings_.size(); ++i) {
        joined += "," + spellings_[i];
    }
    return joined;
}

}  // namespace cli
}  // namespace tootbert
