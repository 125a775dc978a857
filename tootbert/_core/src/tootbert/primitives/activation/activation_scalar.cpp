#include "activation_impl.h"
#include "tootbert/dispatch/scalar_traits.h"
#include <cmath>
#include <limits>

namespace tootbert {
namespace activation {

template <>
void gelu<ScalarBackend>(float* x, int size) {
    using Traits = BackendTraits<ScalarBackend>;
    const float inv_sqrt_2 = 0.70710678118654752f;
    for (int i = 0; i < size; i++) {
        x[i] = 0.5f * x[i] * (1.0f + Traits::erf(x[i] * inv_sqrt_2));
    }
}

template <>
void softmax_row<ScalarBackend>(float* x, int size) {
    using Traits = BackendTraits<ScalarBackend>;

    float max_val = -std::numeric_limits<float>::infinity();
    for (int i = 0; i < size; i++) {
        max_val = Traits::max(max_val, x[i]);
    }
    if (std::isinf(max_val) && max_val < 0) {
        for (int i = 0; i < size; i++) x[i] = 0.0f;
        return;
    }

    float sum = 0.0f;
    for (int i = 0; i < size; i++) {
        x[i] = Traits::exp(x[i] - max_val);
        sum += x[i];
    }
    const float inv = 1.0f / sum;
    for (int i = 0; i < size; i++) {
        x[i] *= inv;
    }
}

}  // namespace activation
}  // namespace tootbert
