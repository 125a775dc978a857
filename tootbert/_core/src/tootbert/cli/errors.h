#pragma once

#include <stdexcept>
#include <string>

namespace tootbert {
namespace cli {

/**
 * Thrown by App::parse. App::exit turns it into output and the exit code:
 * 0 for a help request, 2 for anything the user typed wrong.
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg, int exit_code = 2)
        : std::runtime_error(msg), exit_code_(exit_code) {}

    int get_exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

class ParseError : public Error {
public:
    using Error::Error;
};

/// Raised with the validator's message, prefixed by the option name.
class ValidationError : public Error {
public:
    using Error::Error;
};

class MissingArgument : public Error {
public:
    using Error::Error;
};

class CallForHelp : public Error {
public:
    CallForHelp() : Error("help requested", 0) {}
};

}  // namespace cli
}  // namespace tootbert
