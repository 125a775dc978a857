#include "app.h"

#include "formatter.h"

#include <utility>

namespace tootbert {
namespace cli {

App::App(std::string name, std::string description)
    : name_(std::move(name)), description_(std::move(description)) {}

Option* App::adopt(std::vector<std::unique_ptr<Option>>& list, const std::string& names,
                   const std::string& description) {
    list.push_back(std::make_unique<Option>(names, description));
    return list.back().get();
}

App* App::add_subcommand(const std::string& name, const std::string& description) {
    subcommands_.push_back(std::make_unique<App>(name, description));
    subcommands_.back()->parent_ = this;
    return subcommands_.back().get();
}

std::string App::full_name() const {
    return parent_ == nullptr ? name_ : parent_->full_name() + " " + name_;
}

App* App::find_subcommand(const std::string& name) const {
    for (const auto& sub : subcommands_) {
        if (sub->name_ == name) return sub.get();
    }
    return nullptr;
}

Option* App::find_option(const std::string& arg) const {
    for (const App* scope = this; scope != nullptr; scope = scope->parent_) {
        for (const auto& opt : scope->options_) {
            if (opt->matches(arg)) return opt.get();
        }
    }
    return nullptr;
}

void App::parse(int argc, char** argv) {
    std::vector<std::string> args;
    args.reserve(argc > 1 ? static_cast<size_t>(argc - 1) : 0);
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    parse(args);
}

void App::parse(const std::vector<std::string>& args) {
    size_t next_positional = 0;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            throw CallForHelp();
        }

        // A subcommand name ends this level once no positional has been taken
        if (next_positional == 0) {
            if (App* sub = find_subcommand(arg)) {
                check_required();
                active_ = sub;
                sub->parse(std::vector<std::string>(args.begin() + static_cast<long>(i) + 1,
                                                    args.end()));
                return;
            }
        }

        if (Option* opt = find_option(arg)) {
            std::string name, value;
            if (split_inline_value(arg, name, value)) {
                opt->parse(value);
            } else if (opt->is_flag()) {
                opt->parse("true");
            } else if (i + 1 < args.size()) {
                opt->parse(args[++i]);
            } else {
                throw MissingArgument("Option " + arg + " requires a value");
            }
            continue;
        }

        if (arg.size() > 1 && arg[0] == '-') {
            throw ParseError("Unknown option: " + arg);
        }
        if (next_positional >= positionals_.size()) {
            throw ParseError("Unexpected argument: " + arg);
        }
        positionals_[next_positional++]->parse(arg);
    }

    check_required();
    if (require_subcommand_ && active_ == nullptr) {
        throw ParseError("Subcommand required. Use --help to see available subcommands.");
    }
}

void App::check_required() const {
    for (const auto& pos : positionals_) {
        if (!pos->is_satisfied()) {
            throw MissingArgument("Required argument missing: " + pos->help_name());
        }
    }
    for (const auto& opt : options_) {
        if (!opt->is_satisfied()) {
            throw MissingArgument("Required option missing: " + opt->help_name());
        }
    }
}

std::string App::help() const {
    return active_ != nullptr ? active_->help() : HelpFormatter::format(*this);
}

int App::exit(const Error& e, std::ostream& out, std::ostream& err) const {
    if (dynamic_cast<const CallForHelp*>(&e) != nullptr) {
        out << help() << std::endl;
    } else {
        err << "Error: " << e.what() << "\n\n" << help() << std::endl;
    }
    return e.get_exit_code();
}

}  // namespace cli
}  // namespace tootbert
