/**
 * BERT WordPiece tokenizer (case-sensitive).
 *
 * Reproduces the reference BERT pipeline with do_lower_case disabled:
 *
 *   1. Clean: drop NUL/control bytes, map whitespace to ' '
 *   2. Split on whitespace, then split out punctuation characters
 *   3. WordPiece: greedy longest-match-first, continuation pieces
 *      prefixed with "##", words over max_chars_per_word become [UNK]
 *   4. Truncate to max_length - 2 pieces, wrap in [CLS] ... [SEP]
 *
 * Only ASCII input is accepted; residue alphabets never need more.
 */

#pragma once

#include "tokenizer.h"
#include "vocab.h"
#include <memory>
#include <string>
#include <vector>

namespace tootbert {
namespace tokenizer {

struct BertTokenizerConfig {
    std::string cls_token = "[CLS]";
    std::string sep_token = "[SEP]";
    std::string pad_token = "[PAD]";
    std::string unk_token = "[UNK]";
    int max_chars_per_word = 100;
    bool pad_to_max_length = false;  // Pad with [PAD] (mask 0) up to max_length
};

class BertTokenizer : public Tokenizer {
public:
    /**
     * @throws SetupError if [CLS], [SEP] or [PAD] are missing from vocab
     */
    BertTokenizer(WordPieceVocab vocab, BertTokenizerConfig config = BertTokenizerConfig());

    /**
     * Load from vocab.txt or a directory containing it.
     *
     * @throws FileNotFoundError, SetupError
     */
    static std::shared_ptr<const BertTokenizer> load(const std::string& path,
                                                     BertTokenizerConfig config = BertTokenizerConfig());

    types::TokenBatch encode(const std::string& text, int max_length) const override;

    int vocab_size() const override { return vocab_.size(); }

    /**
     * Whitespace + punctuation split (no vocabulary lookup).
     *
     * @throws TokenizationError on non-ASCII input
     */
    std::vector<std::string> basic_tokenize(const std::string& text) const;

    /**
     * Split one word into WordPiece ids.
     *
     * @throws TokenizationError if the word cannot be covered and [UNK] is absent
     */
    std::vector<int32_t> wordpiece(const std::string& word) const;

    int32_t cls_id() const { return cls_id_; }
    int32_t sep_id() const { return sep_id_; }
    int32_t pad_id() const { return pad_id_; }

private:
    int32_t unk_or_throw(const std::string& word) const;

    WordPieceVocab vocab_;
    BertTokenizerConfig config_;
    int32_t cls_id_;
    int32_t sep_id_;
    int32_t pad_id_;
    int32_t unk_id_;  // -1 when the vocabulary has no [UNK]
};

}  // namespace tokenizer
}  // namespace tootbert
