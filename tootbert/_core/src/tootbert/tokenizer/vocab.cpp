#include "vocab.h"
#include "tootbert/errors/tootbert_error.h"
#include <fstream>

namespace tootbert {
namespace tokenizer {

WordPieceVocab::WordPieceVocab(const std::vector<std::string>& tokens)
    : id_to_token_(tokens) {
    token_to_id_.reserve(tokens.size());
    for (size_t i = 0; i < tokens.size(); ++i) {
        token_to_id_[tokens[i]] = static_cast<int32_t>(i);
    }
}

WordPieceVocab WordPieceVocab::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw errors::FileNotFoundError(path, "Vocabulary file");
    }

    std::vector<std::string> tokens;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        tokens.push_back(line);
    }
    while (!tokens.empty() && tokens.back().empty()) {
        tokens.pop_back();
    }

    if (tokens.empty()) {
        throw errors::SetupError("tokenizer", "vocabulary file is empty: " + path);
    }
    return WordPieceVocab(tokens);
}

const std::string& WordPieceVocab::token(int32_t id) const {
    static const std::string kEmpty;
    if (id < 0 || id >= static_cast<int32_t>(id_to_token_.size())) {
        return kEmpty;
    }
    return id_to_token_[id];
}

}  // namespace tokenizer
}  // namespace tootbert
