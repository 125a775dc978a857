#include "bert_tokenizer.h"
#include "tootbert/errors/messages.h"
#include "tootbert/errors/validators.h"

namespace tootbert {
namespace tokenizer {

namespace {

bool is_whitespace(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool is_control(unsigned char c) {
    return (c < 0x20 || c == 0x7f) && !is_whitespace(c);
}

// ASCII ranges BERT treats as punctuation regardless of Unicode category
bool is_punctuation(unsigned char c) {
    return (c >= 33 && c <= 47) || (c >= 58 && c <= 64) ||
           (c >= 91 && c <= 96) || (c >= 123 && c <= 126);
}

int32_t require_token(const WordPieceVocab& vocab, const std::string& token) {
    auto id = vocab.find(token);
    if (!id) {
        throw errors::messages::missing_special_token(token, "(in memory)");
    }
    return *id;
}

}  // namespace

BertTokenizer::BertTokenizer(WordPieceVocab vocab, BertTokenizerConfig config)
    : vocab_(std::move(vocab)),
      config_(std::move(config)),
      cls_id_(require_token(vocab_, config_.cls_token)),
      sep_id_(require_token(vocab_, config_.sep_token)),
      pad_id_(require_token(vocab_, config_.pad_token)),
      unk_id_(vocab_.find(config_.unk_token).value_or(-1)) {}

std::shared_ptr<const BertTokenizer> BertTokenizer::load(const std::string& path,
                                                         BertTokenizerConfig config) {
    std::string vocab_path = validation::resolve_model_file(path, "vocab.txt", "Vocabulary file");
    WordPieceVocab vocab = WordPieceVocab::load_file(vocab_path);

    for (const std::string* tok : {&config.cls_token, &config.sep_token, &config.pad_token}) {
        if (!vocab.contains(*tok)) {
            throw errors::messages::missing_special_token(*tok, vocab_path);
        }
    }
    return std::make_shared<const BertTokenizer>(std::move(vocab), std::move(config));
}

std::vector<std::string> BertTokenizer::basic_tokenize(const std::string& text) const {
    std::vector<std::string> words;
    std::string current;

    auto flush = [&]() {
        if (!current.empty()) {
            words.push_back(current);
            current.clear();
        }
    };

    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c >= 0x80) {
            throw errors::messages::non_ascii_input(i);
        }
        if (c == 0 || is_control(c)) {
            continue;
        }
        if (is_whitespace(c)) {
            flush();
        } else if (is_punctuation(c)) {
            flush();
            words.emplace_back(1, static_cast<char>(c));
        } else {
            current += static_cast<char>(c);
        }
    }
    flush();
    return words;
}

int32_t BertTokenizer::unk_or_throw(const std::string& word) const {
    if (unk_id_ < 0) {
        throw errors::messages::unknown_word_without_unk(word);
    }
    return unk_id_;
}

std::vector<int32_t> BertTokenizer::wordpiece(const std::string& word) const {
    if (static_cast<int>(word.size()) > config_.max_chars_per_word) {
        return {unk_or_throw(word)};
    }

    std::vector<int32_t> pieces;
    size_t start = 0;
    while (start < word.size()) {
        size_t end = word.size();
        int32_t match = -1;

        // Greedy longest match
        while (start < end) {
            std::string sub = word.substr(start, end - start);
            if (start > 0) {
                sub = "##" + sub;
            }
            if (auto id = vocab_.find(sub)) {
                match = *id;
                break;
            }
            --end;
        }

        if (match < 0) {
            // Whole word collapses to a single [UNK]
            return {unk_or_throw(word)};
        }
        pieces.push_back(match);
        start = end;
    }
    return pieces;
}

types::TokenBatch BertTokenizer::encode(const std::string& text, int max_length) const {
    if (max_length < 2) {
        throw errors::TokenizationError(
            "max_length " + std::to_string(max_length) + " leaves no room for [CLS] and [SEP]",
            "Use a maximum sequence length of at least 2");
    }

    std::vector<int32_t> content;
    for (const auto& word : basic_tokenize(text)) {
        std::vector<int32_t> ids = wordpiece(word);
        content.insert(content.end(), ids.begin(), ids.end());
    }

    const size_t room = static_cast<size_t>(max_length) - 2;
    if (content.size() > room) {
        content.resize(room);
    }

    types::TokenBatch batch;
    batch.input_ids.reserve(content.size() + 2);
    batch.input_ids.push_back(cls_id_);
    batch.input_ids.insert(batch.input_ids.end(), content.begin(), content.end());
    batch.input_ids.push_back(sep_id_);
    batch.attention_mask.assign(batch.input_ids.size(), 1);

    if (config_.pad_to_max_length) {
        batch.input_ids.resize(max_length, pad_id_);
        batch.attention_mask.resize(max_length, 0);
    }
    return batch;
}

}  // namespace tokenizer
}  // namespace tootbert
