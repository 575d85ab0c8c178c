/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject
 * to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included
 * in all copies or substantial portions of the Software.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS
 * IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER
 * OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
 * PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF
 * LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

/**
 * @file WorkerPool.cpp
 * @brief Worker count detection and error propagation
 */

#include "Assembly/WorkerPool.h"
#include "Core/Exception.h"
#include "Core/Logger.h"
#include <algorithm>
#include <cstdlib>
#include <string>

namespace igak {
namespace assembly {

int resolveNumThreads(int requested) {
    IGAK_CHECK_ARG(requested >= 0, "resolveNumThreads: negative thread count");
    if (requested > 0) {
        return requested;
    }

    if (const char* env = std::getenv("IGAK_NUM_THREADS")) {
        char* end = nullptr;
        const long n = std::strtol(env, &end, 10);
        if (end != env && *end == '\0' && n > 0) {
            return static_cast<int>(n);
        }
        IGAK_LOG_WARNING("Ignoring invalid IGAK_NUM_THREADS='" + std::string(env) + "'");
    }

#if IGAK_HAS_OPENMP
    return std::max(1, omp_get_max_threads());
#else
    return 1;
#endif
}

WorkerPool::WorkerPool(AssemblyOptions options)
    : options_(options),
      num_workers_(resolveNumThreads(options.num_threads)) {
    IGAK_CHECK_ARG(options_.chunks_per_worker >= 1,
                   "WorkerPool: chunks_per_worker must be positive");
#if !IGAK_HAS_OPENMP
    if (num_workers_ > 1) {
        IGAK_LOG_DEBUG("WorkerPool: built without OpenMP, " + std::to_string(num_workers_) +
                       " workers run sequentially");
    }
#endif
}

std::vector<math::Interval> WorkerPool::chunkRanges(std::size_t n, std::size_t k) {
    std::vector<math::Interval> ranges;
    if (n == 0) {
        return ranges;
    }
    k = std::clamp<std::size_t>(k, 1, n);
    const std::size_t base = n / k;
    const std::size_t extra = n % k;
    std::size_t first = 0;
    for (std::size_t c = 0; c < k; ++c) {
        const std::size_t size = base + (c < extra ? 1 : 0);
        ranges.push_back(math::Interval{first, first + size});
        first += size;
    }
    return ranges;
}

void WorkerPool::rethrowFirst(const std::vector<std::exception_ptr>& errors) {
    std::size_t failed = 0;
    std::exception_ptr first;
    for (const auto& e : errors) {
        if (e) {
            if (!first) {
                first = e;
            }
            ++failed;
        }
    }
    if (!first) {
        return;
    }
    IGAK_LOG_ERROR("WorkerPool: " + std::to_string(failed) + " of " +
                   std::to_string(errors.size()) + " chunks failed, discarding batch results");
    std::rethrow_exception(first);
}

} // namespace assembly
} // namespace igak
