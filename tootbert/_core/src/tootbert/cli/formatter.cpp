#include "formatter.h"

#include "app.h"

#include <sstream>

namespace tootbert {
namespace cli {

namespace {

constexpr size_t kColumn = 32;

// Name padded to kColumn; long names push the text onto its own line
void row(std::ostream& os, const std::string& name, const std::string& text) {
    os << "  " << name;
    if (name.size() < kColumn) {
        os << std::string(kColumn - name.size(), ' ');
    } else {
        os << "\n  " << std::string(kColumn, ' ');
    }
    os << text << '\n';
}

void usage(std::ostream& os, const App& app) {
    os << "USAGE:\n  " << app.full_name();
    if (!app.get_subcommands().empty()) os << " <subcommand>";
    for (const auto& pos : app.get_positionals()) {
        os << " <" << pos->help_name() << ">";
    }
    if (!app.get_options().empty()) os << " [options]";
    os << "\n\n";
}

void subcommands(std::ostream& os, const App& app) {
    os << "SUBCOMMANDS:\n";
    for (const auto& sub : app.get_subcommands()) {
        row(os, sub->name(), sub->description());
    }
    os << "\nRun \"" << app.full_name() << " <subcommand> --help\" for subcommand options.\n\n";
}

void arguments(std::ostream& os, const App& app) {
    os << "ARGUMENTS:\n";
    for (const auto& pos : app.get_positionals()) {
        row(os, pos->help_name(), pos->description());
    }
    os << '\n';
}

void options(std::ostream& os, const App& app) {
    os << "OPTIONS:\n";
    for (const auto& opt : app.get_options()) {
        std::string name = opt->help_name();
        if (!opt->is_flag() && !opt->hint().empty()) {
            name += " " + opt->hint();
        }
        row(os, name, opt->is_required() ? opt->description() + " [REQUIRED]" : opt->description());
    }
    row(os, "-h,--help", "Show this help message and exit");
}

}  // namespace

std::string HelpFormatter::format(const App& app) {
    std::ostringstream os;
    os << app.full_name();
    if (!app.description().empty()) os << " - " << app.description();
    os << "\n\n";

    usage(os, app);
    if (!app.get_subcommands().empty()) subcommands(os, app);
    if (!app.get_positionals().empty()) arguments(os, app);
    options(os, app);
    return os.str();
}

}  // namespace cli
}  // namespace tootbert
