#ifndef CUSTOM_PARALLEL_H
#define CUSTOM_PARALLEL_H

#include <vector>
#include <thread>
#include <cmath>
#include <algorithm>

template<class Function>
void test_parallelize(Function fun, size_t njobs, size_t nthreads) {
    if (nthreads == 0) {
        nthreads = 1;
    }

    size_t per_worker = std::ceil(static_cast<double>(njobs) / nthreads);
    std::vector<std::thread> workers;
    workers.reserve(nthreads);

    size_t start = 0;
    for (size_t w = 0; w < nthreads && start < njobs; ++w) {
        size_t length = std::min(per_worker, njobs - start);
        workers.emplace_back(fun, w, start, length);
        start += length;
    }

    for (auto& w : workers) {
        w.join();
    }
}

#endif
