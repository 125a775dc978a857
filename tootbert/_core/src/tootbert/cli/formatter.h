#pragma once

#include <string>

namespace tootbert {
namespace cli {

class App;

/**
 * Renders --help for one App:
 *
 *   tootbert classify - Classify FASTA sequences
 *
 *   USAGE:
 *     tootbert classify <input_file> <output_file> [options]
 *
 * followed by SUBCOMMANDS, ARGUMENTS and OPTIONS sections as applicable.
 */
class HelpFormatter {
public:
    static std::string format(const App& app);
};

}  // namespace cli
}  // namespace tootbert
