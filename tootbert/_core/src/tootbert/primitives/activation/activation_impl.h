#pragma once

#include "tootbert/dispatch/backend_traits.h"

namespace tootbert {
namespace activation {

/**
 * Exact GELU in place: x = 0.5 * x * (1 + erf(x / sqrt(2)))
 *
 * BERT uses the erf form, not the tanh approximation.
 */
template <typename Backend>
void gelu(float* x, int size);

/**
 * Numerically stable softmax of one row in place.
 *
 * Subtracts the row max before exponentiating. A row whose entries are
 * all -inf is left as zeros.
 */
template <typename Backend>
void softmax_row(float* x, int size);

}  // namespace activation
}  // namespace tootbert
