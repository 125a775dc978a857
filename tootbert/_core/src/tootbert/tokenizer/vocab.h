#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tootbert {
namespace tokenizer {

/**
 * WordPiece vocabulary: token string <-> integer id.
 *
 * Token ids are line indices of vocab.txt. When a token appears twice the
 * later line wins, as in the reference BERT loader.
 */
class WordPieceVocab {
public:
    WordPieceVocab() = default;

    /**
     * Build from an ordered token list (id = position).
     */
    explicit WordPieceVocab(const std::vector<std::string>& tokens);

    /**
     * Load vocab.txt (one token per line).
     *
     * @throws FileNotFoundError if the file cannot be opened
     * @throws SetupError if the file holds no tokens
     */
    static WordPieceVocab load_file(const std::string& path);

    std::optional<int32_t> find(const std::string& token) const {
        auto it = token_to_id_.find(token);
        if (it == token_to_id_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool contains(const std::string& token) const {
        return token_to_id_.count(token) > 0;
    }

    /// Token string for an id; empty if out of range.
    const std::string& token(int32_t id) const;

    int size() const { return static_cast<int>(id_to_token_.size()); }
    bool empty() const { return id_to_token_.empty(); }

private:
    std::unordered_map<std::string, int32_t> token_to_id_;
    std::vector<std::string> id_to_token_;
};

}  // namespace tokenizer
}  // namespace tootbert
