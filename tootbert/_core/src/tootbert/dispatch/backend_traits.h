#pragma once

namespace tootbert {

/// Tag for the portable CPU kernels.
struct ScalarBackend {};

/**
 * Per-backend arithmetic used by the encoder kernels.
 *
 * Each kernel (gemm, layer_norm, activation, bert_forward) is declared as a
 * template over the backend tag in <kernel>_impl.h and specialized in
 * <kernel>_<backend>.cpp. A BackendTraits specialization carries the
 * elementwise math those kernels share and the device name reported by
 * `--device` and `tootbert version`.
 */
template <typename Backend>
struct BackendTraits;

}  // namespace tootbert
