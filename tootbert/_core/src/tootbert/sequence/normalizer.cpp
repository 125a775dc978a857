#include "normalizer.h"

namespace tootbert {
namespace sequence {

std::string normalize(const std::string& raw) {
    std::string out;
    if (raw.empty()) {
        return out;
    }
    out.reserve(raw.size() * 2 - 1);

    for (size_t i = 0; i < raw.size(); ++i) {
        if (i > 0) {
            out += ' ';
        }
        char c = raw[i];
        out += is_substituted_residue(c) ? 'X' : c;
    }
    return out;
}

}  // namespace sequence
}  // namespace tootbert
