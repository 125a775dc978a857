/**
 * FASTA record reader.
 *
 * Input format:
 * ```
 * >sp|P0AEX9|MALE_ECOLI Maltose-binding periplasmic protein
 * MKIKTGARILALSALTTMMFSASALAKIEEGKLVIWINGDKGYNGLAEVGKKFEKDTGIKVTVEHPDKLEEKFPQVAATGDGPDIIF
 * WAHDRFGGYAQSGLLAEITPDKAFQDKLYPFTWDAVRYNGKLIAYPIAVEALSLIYNKDLLPNPPKTWEEIPALDKELKAKGKSAL
 * >seq2
 * ...
 * ```
 *
 * - The first non-blank line must start with '>'
 * - Record id is the first whitespace-delimited token after '>'; the rest
 *   of the header is kept as the description
 * - Sequence lines are concatenated with all whitespace removed
 * - A header followed by no sequence lines yields an empty sequence
 */

#pragma once

#include "tootbert/types/pipeline_types.h"
#include <iosfwd>
#include <optional>
#include <utility>
#include <string>
#include <vector>

namespace tootbert {
namespace io {

class FastaReader {
public:
    /**
     * @param in           Stream positioned at the start of the FASTA text
     * @param source_name  Name used in error messages
     */
    explicit FastaReader(std::istream& in, std::string source_name = "<stream>");

    /**
     * Read the next record.
     *
     * @return Record, or std::nullopt at end of input
     * @throws FormatError if the input does not start with a header or a
     *         header has no id
     */
    std::optional<types::SequenceRecord> next();

    /**
     * Read every record of a file, in file order.
     *
     * @throws FileNotFoundError, FormatError
     */
    static std::vector<types::SequenceRecord> read_file(const std::string& path);

private:
    types::SequenceRecord make_record(const std::string& header_line, std::string sequence) const;

    std::istream& in_;
    std::string source_name_;
    std::optional<std::string> pending_header_;
    bool started_ = false;
};

/**
 * Split a header line (without '>') into id and description.
 */
std::pair<std::string, std::string> split_header(const std::string& header);

}  // namespace io
}  // namespace tootbert
