/**
 * Sequence normalization for the protein language model tokenizer.
 *
 * The vocabulary has one token per residue letter, and the model was
 * trained with the rare/ambiguous codes U (selenocysteine), O (pyrrolysine),
 * B (D/N) and Z (E/Q) collapsed to X.
 */

#pragma once

#include <string>

namespace tootbert {
namespace sequence {

/**
 * Returns true for residue codes that are rewritten to 'X'.
 */
inline bool is_substituted_residue(char c) {
    return c == 'U' || c == 'O' || c == 'B' || c == 'Z';
}

/**
 * Normalize a raw residue string into tokenizer input.
 *
 * Inserts one space between adjacent residues and replaces U, O, B and Z
 * with X. Never fails; empty input yields an empty string. Other
 * characters, including lowercase letters, are passed through unchanged.
 *
 * @param raw Residue letters without separators
 * @return Space-separated residues
 *
 * Example:
 * ```cpp
 *   normalize("MUOBZK");  // -> "M X X X X K"
 *   normalize("");        // -> ""
 * ```
 */
std::string normalize(const std::string& raw);

}  // namespace sequence
}  // namespace tootbert
