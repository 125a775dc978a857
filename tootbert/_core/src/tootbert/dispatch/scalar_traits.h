#pragma once

#include "backend_traits.h"
#include <cmath>

namespace tootbert {

template <>
struct BackendTraits<ScalarBackend> {
    static constexpr const char* name = "scalar";
    static constexpr const char* device = "cpu";

    using vec_type = float;

    static inline vec_type max(vec_type a, vec_type b) { return (a > b) ? a : b; }
    static inline vec_type exp(vec_type x) { return std::exp(x); }
    static inline vec_type erf(vec_type x) { return std::erf(x); }
};

}  // namespace tootbert
