#pragma once

#ifdef _OPENMP
#include <omp.h>
#endif

namespace tootbert {
namespace gemm {

// Worker threads used by the OpenMP loops in gemm_scalar.cpp
// (1 in a build without OpenMP). OMP_NUM_THREADS applies as usual.
inline int get_thread_count() {
#ifdef _OPENMP
    return omp_get_max_threads();
#else
    return 1;
#endif
}

/**
 * Apply `--threads N`. N <= 0 keeps the runtime default.
 *
 * @return Thread count in effect afterwards
 */
inline int set_thread_count(int num_threads) {
#ifdef _OPENMP
    if (num_threads > 0) {
        omp_set_num_threads(num_threads);
    }
#else
    (void)num_threads;
#endif
    return get_thread_count();
}

}  // namespace gemm
}  // namespace tootbert
