/**
 * @file WrapOpenMP.h
 * @author F. Gratl
 * @date 4/20/18
 *
 * @details
 * Provide non-OpenMP versions of the most common OpenMP function calls,
 * so that they don't have to be wrapped in ifdef-s every time.
 *
 * Proper wrapper and renaming necessary, because of -fopenmp-simd handling of
 * gcc.
 *
 * Extend when necessary.
 */

#pragma once

#if defined(NEUROFIS_OPENMP)
#include <omp.h>
#endif

namespace neurofis {

#if defined(NEUROFIS_OPENMP)

/**
 * Wrapper for omp_get_max_threads().
 * @return Number of threads that can be activated.
 */
inline int neurofis_get_max_threads() { return omp_get_max_threads(); }

#else

/**
 * Dummy for omp_get_max_threads() when no OpenMP is available.
 * @return Always 1.
 */
inline int neurofis_get_max_threads() { return 1; }

#endif

}  // namespace neurofis
