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

#ifndef IGAK_ASSEMBLY_ASSEMBLYOPTIONS_H
#define IGAK_ASSEMBLY_ASSEMBLYOPTIONS_H

/**
 * @file AssemblyOptions.h
 * @brief Run-time settings of the assembly drivers
 */

#include "Core/Config.h"
#include <cstddef>

namespace igak {
namespace assembly {

struct AssemblyOptions {
    // Threading
    int num_threads{0};                  ///< Workers (0 = IGAK_NUM_THREADS, else OpenMP max threads)
    std::size_t serial_threshold{config::DEFAULT_SERIAL_THRESHOLD};  ///< multiEntries() runs serially below this
    int chunks_per_worker{config::DEFAULT_CHUNKS_PER_WORKER};        ///< Driver and load-vector chunks per worker

    // Assembly mode
    bool symmetric{true};                ///< Compute one half of symmetric forms and mirror

    // Debugging
    bool verbose{false};                 ///< Log assembly progress at INFO level
};

/**
 * @brief Worker count for @p requested (0 = auto-detect)
 *
 * Auto-detection reads IGAK_NUM_THREADS, then the OpenMP maximum thread
 * count, and falls back to one worker.
 */
int resolveNumThreads(int requested);

} // namespace assembly
} // namespace igak

#endif // IGAK_ASSEMBLY_ASSEMBLYOPTIONS_H
