#pragma once

#include "types.h"
#include "validators.h"

#include <functional>
#include <string>
#include <vector>

namespace tootbert {
namespace cli {

/**
 * One command-line option, flag or positional argument, bound to a
 * caller-owned variable.
 *
 * `names` is a comma separated spelling list such as
 * "--max-seq-len,-max_seq_len". Every spelling that starts with '-' is
 * matched literally, which keeps the historical single-dash long names
 * working next to the double-dash ones. A spelling without a dash names
 * a positional.
 */
class Option {
public:
    Option(const std::string& names, const std::string& description);

    template <typename T>
    Option* bind(T* target) {
        assign_ = [target](const std::string& text) { return parse_value(text, *target); };
        hint_ = value_hint<T>();
        return this;
    }

    Option* required(bool value = true) {
        required_ = value;
        return this;
    }
    Option* flag(bool value = true) {
        flag_ = value;
        return this;
    }
    Option* check(Validator validator) {
        validators_.push_back(std::move(validator));
        return this;
    }

    /**
     * Run the validators, then convert into the bound variable.
     *
     * @throws ValidationError when a validator rejects `text`
     * @throws ParseError when `text` does not convert
     */
    void parse(const std::string& text);

    /// "--name" or "--name=value" for any dash spelling.
    bool matches(const std::string& arg) const;

    bool is_flag() const { return flag_; }
    bool is_required() const { return required_; }
    bool seen() const { return seen_ > 0; }
    bool is_satisfied() const { return !required_ || seen(); }
    const std::string& description() const { return description_; }
    const std::string& hint() const { return hint_; }

    /// Spellings joined by ',' or the positional's name.
    std::string help_name() const;

private:
    std::vector<std::string> spellings_;
    std::string positional_name_;
    std::string description_;
    std::string hint_;
    std::function<bool(const std::string&)> assign_;
    std::vector<Validator> validators_;
    bool required_ = false;
    bool flag_ = false;
    int seen_ = 0;
};

/// Splits "--name=value"; `value` is empty and false is returned without '='.
bool split_inline_value(const std::string& arg, std::string& name, std::string& value);

}  // namespace cli
}  // namespace tootbert
