#pragma once
// Chunked parallel loops over independent index ranges
// Uses std::thread, each thread owns one contiguous chunk

#include <algorithm>
#include <cstddef>
#include <thread>
#include <vector>

namespace Goldberg {
namespace Parallel {

// Get the number of threads to use (respects hardware concurrency)
inline unsigned int getThreadCount() {
    unsigned int n = std::thread::hardware_concurrency();
    return std::max(1u, n);
}

// Parallel for loop over [start, end). func(i) must only write state owned by i.
// Runs inline when there is a single thread or a single item.
template<typename Func>
void parallel_for(size_t start, size_t end, Func&& func, unsigned int maxThreads = 0) {
    if (start >= end) return;

    unsigned int numThreads = maxThreads == 0 ? getThreadCount() : maxThreads;
    size_t total = end - start;

    // Don't spawn more threads than items
    numThreads = static_cast<unsigned int>(std::min<size_t>(numThreads, total));

    if (numThreads <= 1) {
        for (size_t i = start; i < end; ++i) {
            func(i);
        }
        return;
    }

    std::vector<std::thread> threads;
    threads.reserve(numThreads);

    size_t chunkSize = (total + numThreads - 1) / numThreads;

    for (unsigned int t = 0; t < numThreads; ++t) {
        size_t chunkStart = start + t * chunkSize;
        size_t chunkEnd = std::min(chunkStart + chunkSize, end);

        if (chunkStart < end) {
            threads.emplace_back([=, &func] {
                for (size_t i = chunkStart; i < chunkEnd; ++i) {
                    func(i);
                }
            });
        }
    }

    for (auto& t : threads) {
        t.join();
    }
}

}  // namespace Parallel
}  // namespace Goldberg
