#pragma once

#include <cstdlib>

#ifndef TOOTBERT_GEMM_MC
#define TOOTBERT_GEMM_MC 64
#endif
#ifndef TOOTBERT_GEMM_NC
#define TOOTBERT_GEMM_NC 64
#endif
#ifndef TOOTBERT_GEMM_KC
#define TOOTBERT_GEMM_KC 64
#endif
#ifndef TOOTBERT_ATTN_BLOCK
#define TOOTBERT_ATTN_BLOCK 256
#endif

namespace tootbert {
namespace tuning {

/// Positive integer from the environment, or `fallback`.
inline int env_int(const char* name, int fallback) {
    const char* text = std::getenv(name);
    if (text == nullptr) return fallback;
    const int v = std::atoi(text);
    return v > 0 ? v : fallback;
}

inline bool env_set(const char* name) {
    return std::getenv(name) != nullptr;
}

/**
 * Cache block sizes for gemm<ScalarBackend>.
 *
 * Compile-time defaults come from the TOOTBERT_GEMM_{MC,NC,KC} macros and
 * are overridden by environment variables of the same name. The 4x4
 * register tile is fixed by the microkernel.
 */
struct GEMMTuning {
    int MC;
    int NC;
    int KC;
    static constexpr int MR = 4;
    static constexpr int NR = 4;

    static GEMMTuning get() {
        return GEMMTuning{env_int("TOOTBERT_GEMM_MC", TOOTBERT_GEMM_MC),
                          env_int("TOOTBERT_GEMM_NC", TOOTBERT_GEMM_NC),
                          env_int("TOOTBERT_GEMM_KC", TOOTBERT_GEMM_KC)};
    }

    /**
     * Shape-dependent blocks. The encoder mixes tiny per-head products
     * (L x 64) with 1024 x 4096 FFN products; explicit env settings win.
     */
    static GEMMTuning get_for_size(int M, int N, int /*K*/) {
        if (env_set("TOOTBERT_GEMM_MC") || env_set("TOOTBERT_GEMM_NC") ||
            env_set("TOOTBERT_GEMM_KC")) {
            return get();
        }
        if (M < 32 && N < 32) return GEMMTuning{16, 16, 32};
        if (M > 512 && N > 512) return GEMMTuning{128, 128, 128};
        return get();
    }
};

/**
 * Query rows per attention block; the score buffer is [block x L].
 * Overridden by TOOTBERT_ATTN_BLOCK.
 */
struct AttentionTuning {
    int query_block;

    static AttentionTuning get() {
        return AttentionTuning{env_int("TOOTBERT_ATTN_BLOCK", TOOTBERT_ATTN_BLOCK)};
    }
};

}  // namespace tuning
}  // namespace tootbert
