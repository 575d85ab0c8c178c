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

#ifndef IGAK_CORE_CONFIG_H
#define IGAK_CORE_CONFIG_H

/**
 * @file Config.h
 * @brief Compile-time configuration for the assembly kernels
 *
 * Settings can be overridden via CMake or compiler flags.
 */

#include "Types.h"
#include <cstddef>

// ============================================================================
// Build Configuration Detection
// ============================================================================

#if !defined(NDEBUG) || defined(DEBUG) || defined(_DEBUG)
    #define IGAK_DEBUG_MODE 1
#else
    #define IGAK_DEBUG_MODE 0
#endif

// OpenMP support detection
#ifdef _OPENMP
    #define IGAK_HAS_OPENMP 1
    #include <omp.h>
#else
    #define IGAK_HAS_OPENMP 0
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define IGAK_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define IGAK_UNLIKELY(x) (x)
#endif

namespace igak {
namespace config {

// ============================================================================
// Dimension Configuration
// ============================================================================

/**
 * @brief Spatial dimensions for which kernels are instantiated
 *
 * Kernels are templates on the dimension; only 2D and 3D are compiled.
 */
constexpr int MIN_KERNEL_DIM = 2;
constexpr int MAX_KERNEL_DIM = 3;

template<int Dim>
constexpr bool is_supported_dim = (Dim >= MIN_KERNEL_DIM && Dim <= MAX_KERNEL_DIM);

/**
 * @brief Highest partial derivative order a form may request per axis
 */
#ifndef IGAK_MAX_DERIV_ORDER
    constexpr int MAX_DERIV_ORDER = 4;
#else
    constexpr int MAX_DERIV_ORDER = IGAK_MAX_DERIV_ORDER;
#endif

// ============================================================================
// Kernel Interpreter Configuration
// ============================================================================

/**
 * @brief Register count that fits on the stack of a combine kernel call
 *
 * Programs with more instructions fall back to a heap buffer owned by the
 * call.
 */
#ifndef IGAK_KERNEL_STACK_REGISTERS
    constexpr std::size_t KERNEL_STACK_REGISTERS = 256;
#else
    constexpr std::size_t KERNEL_STACK_REGISTERS = IGAK_KERNEL_STACK_REGISTERS;
#endif

/**
 * @brief Upper bound on basis loads/field views per kernel kept on the stack
 */
constexpr std::size_t KERNEL_STACK_LOADS = 64;

// ============================================================================
// Assembly Defaults
// ============================================================================

/// multiEntries() runs serially below this many pairs
constexpr std::size_t DEFAULT_SERIAL_THRESHOLD = 64;

/// Sparse drivers and assembleVector() split their outer range into this many chunks per worker
constexpr int DEFAULT_CHUNKS_PER_WORKER = 4;

} // namespace config
} // namespace igak

#endif // IGAK_CORE_CONFIG_H
