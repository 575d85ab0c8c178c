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

#ifndef IGAK_ASSEMBLY_WORKERPOOL_H
#define IGAK_ASSEMBLY_WORKERPOOL_H

/**
 * @file WorkerPool.h
 * @brief Fixed-size pool of OpenMP workers with chunked parallel map
 *
 * The pool is an explicit object owned by the caller and passed to the
 * assembly drivers. map() runs one task per chunk and returns the results in
 * chunk order once every worker has finished. An exception thrown by a task
 * is captured; after the join the first failing chunk's exception is
 * rethrown on the calling thread and no partial results are returned.
 *
 * Without OpenMP all chunks run sequentially on the calling thread.
 */

#include "Assembly/AssemblyOptions.h"
#include "Core/Config.h"
#include "Math/MultiIndex.h"
#include <cstddef>
#include <exception>
#include <utility>
#include <vector>

namespace igak {
namespace assembly {

class WorkerPool {
public:
    explicit WorkerPool(AssemblyOptions options = {});

    int numWorkers() const noexcept { return num_workers_; }
    const AssemblyOptions& options() const noexcept { return options_; }

    /**
     * @brief Evaluate @p fn(chunk) for chunk in [0, num_chunks)
     *
     * @tparam Result default-constructible result type
     */
    template<typename Result, typename Fn>
    std::vector<Result> map(std::size_t num_chunks, Fn&& fn) const {
        std::vector<Result> results(num_chunks);
        std::vector<std::exception_ptr> errors(num_chunks);

#if IGAK_HAS_OPENMP
        if (num_workers_ > 1 && num_chunks > 1) {
            const auto n = static_cast<long long>(num_chunks);
            #pragma omp parallel for schedule(dynamic, 1) num_threads(num_workers_)
            for (long long c = 0; c < n; ++c) {
                const auto chunk = static_cast<std::size_t>(c);
                try {
                    results[chunk] = fn(chunk);
                } catch (...) {
                    errors[chunk] = std::current_exception();
                }
            }
            rethrowFirst(errors);
            return results;
        }
#endif
        for (std::size_t chunk = 0; chunk < num_chunks; ++chunk) {
            try {
                results[chunk] = fn(chunk);
            } catch (...) {
                errors[chunk] = std::current_exception();
            }
        }
        rethrowFirst(errors);
        return results;
    }

    /// map() for tasks without a result
    template<typename Fn>
    void parallelFor(std::size_t num_chunks, Fn&& fn) const {
        map<char>(num_chunks, [&fn](std::size_t chunk) {
            fn(chunk);
            return char{0};
        });
    }

    /**
     * @brief Split [0, n) into at most @p k contiguous nonempty ranges whose
     *        sizes differ by at most one
     */
    static std::vector<math::Interval> chunkRanges(std::size_t n, std::size_t k);

private:
    /// Log and rethrow the exception of the lowest failing chunk, if any
    static void rethrowFirst(const std::vector<std::exception_ptr>& errors);

    AssemblyOptions options_;
    int num_workers_;
};

} // namespace assembly
} // namespace igak

#endif // IGAK_ASSEMBLY_WORKERPOOL_H
