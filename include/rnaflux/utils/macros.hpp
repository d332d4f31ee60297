#ifndef RNAFLUX_MACROS_HPP
#define RNAFLUX_MACROS_HPP

/**
 * @file macros.hpp
 *
 * @brief Set common macros used through **rnaflux**.
 *
 * @details
 * The `RNAFLUX_CUSTOM_PARALLEL` macro can be set to a function that specifies a custom parallelization scheme.
 * This function should be a template that accept three arguments:
 *
 * - `fun`, a lambda that accepts three arguments, `thread`, `start` and `length`.
 * - `njobs`, an integer specifying the number of jobs.
 * - `nthreads`, an integer specifying the number of threads to use.
 *
 * The function should split `[0, njobs)` into any number of contiguous, non-overlapping intervals, and call `fun` on each interval, possibly in different threads.
 * The function should only return once all evaluations of `fun` are complete.
 *
 * If `RNAFLUX_CUSTOM_PARALLEL` is set, the following macros are also set (if they are not already defined):
 *
 * - `TATAMI_CUSTOM_PARALLEL`, from the [**tatami**](https://ltla.github.io/tatami) library.
 * - `IRLBA_CUSTOM_PARALLEL`, from the [**irlba**](https://ltla.github.io/CppIrlba) library.
 *
 * All per-cell loops in **rnaflux** are dispatched through `tatami::parallelize()`,
 * so the custom scheme reaches every parallel section once these macros are synchronized.
 */

#ifdef RNAFLUX_CUSTOM_PARALLEL

#ifndef TATAMI_CUSTOM_PARALLEL
#define TATAMI_CUSTOM_PARALLEL RNAFLUX_CUSTOM_PARALLEL
#endif

#ifndef IRLBA_CUSTOM_PARALLEL
namespace rnaflux {

template<class Function>
void irlba_parallelize_(int nthreads, Function fun) {
    RNAFLUX_CUSTOM_PARALLEL([&](size_t, size_t f, size_t l) -> void {
        for (size_t i = 0; i < l; ++i) {
            fun(f + i);
        }
    }, nthreads, nthreads);
}

}

#define IRLBA_CUSTOM_PARALLEL rnaflux::irlba_parallelize_
#endif

#endif

#endif
