#pragma once

#include "errors.h"
#include "option.h"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace tootbert {
namespace cli {

/**
 * A command, or a subcommand of one, with its options and positionals.
 *
 * Parsing descends into the first subcommand named on the command line and
 * hands it the remaining arguments. Options of every enclosing command stay
 * visible there, so `tootbert classify in.fa out.txt --quiet` sets the
 * top-level --quiet flag.
 */
class App {
public:
    explicit App(std::string name, std::string description = "");

    App* add_subcommand(const std::string& name, const std::string& description);
    void require_subcommand(bool value = true) { require_subcommand_ = value; }

    template <typename T>
    Option* add_option(const std::string& names, T& variable, const std::string& description = "") {
        return adopt(options_, names, description)->bind(&variable);
    }

    /// Presence sets `variable` to true; `--flag=false` is accepted too.
    Option* add_flag(const std::string& names, bool& variable, const std::string& description = "") {
        return add_option(names, variable, description)->flag();
    }

    /// Positionals are filled in declaration order and are required.
    template <typename T>
    Option* add_positional(const std::string& name, T& variable,
                           const std::string& description = "") {
        return adopt(positionals_, name, description)->bind(&variable)->required();
    }

    /**
     * @throws CallForHelp on -h or --help
     * @throws ParseError, ValidationError or MissingArgument otherwise
     */
    void parse(int argc, char** argv);
    void parse(const std::vector<std::string>& args);

    /**
     * Print help (for CallForHelp) or the error followed by help, and
     * return the process exit code carried by `e`.
     */
    int exit(const Error& e, std::ostream& out = std::cout, std::ostream& err = std::cerr) const;

    /// Help of the innermost subcommand reached by the last parse().
    std::string help() const;

    const std::string& name() const { return name_; }
    std::string full_name() const;
    const std::string& description() const { return description_; }

    App* get_active_subcommand() { return active_; }
    const App* get_active_subcommand() const { return active_; }

    const std::vector<std::unique_ptr<Option>>& get_options() const { return options_; }
    const std::vector<std::unique_ptr<Option>>& get_positionals() const { return positionals_; }
    const std::vector<std::unique_ptr<App>>& get_subcommands() const { return subcommands_; }

private:
    static Option* adopt(std::vector<std::unique_ptr<Option>>& list, const std::string& names,
                         const std::string& description);

    App* find_subcommand(const std::string& name) const;
    Option* find_option(const std::string& arg) const;
    void check_required() const;

    std::string name_;
    std::string description_;
    App* parent_ = nullptr;
    App* active_ = nullptr;
    bool require_subcommand_ = false;
    std::vector<std::unique_ptr<Option>> options_;
    std::vector<std::unique_ptr<Option>> positionals_;
    std::vector<std::unique_ptr<App>> subcommands_;
};

}  // namespace cli
}  // namespace tootbert
