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

#ifndef IGAK_CORE_TYPES_H
#define IGAK_CORE_TYPES_H

/**
 * @file Types.h
 * @brief Fundamental type definitions for the isogeometric assembly kernels
 *
 * Core scalar and index aliases, status codes and the tensor-product
 * multi-index type shared by every module.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace igak {

// ============================================================================
// Scalar / Index Types
// ============================================================================

using Real = double;

/**
 * @brief Global (linearized) index of a tensor-product degree of freedom
 *
 * Unsigned: linear indices are built from per-axis counts and never carry
 * sentinel values.
 */
using GlobalIndex = std::size_t;

/**
 * @brief Index used for local quantities (quadrature nodes, components)
 */
using LocalIndex = std::uint32_t;

/**
 * @brief Per-axis tuple of 1D indices of a tensor-product basis function
 */
template<int Dim>
using MultiIndex = std::array<std::size_t, static_cast<std::size_t>(Dim)>;

/**
 * @brief Per-axis derivative orders of a partial derivative
 */
template<int Dim>
using DerivOrder = std::array<int, static_cast<std::size_t>(Dim)>;

constexpr GlobalIndex INVALID_GLOBAL_INDEX = std::numeric_limits<GlobalIndex>::max();

// ============================================================================
// Status Codes
// ============================================================================

/**
 * @brief Status codes carried by exceptions
 */
enum class Status : std::uint8_t {
    Success           = 0,
    InvalidArgument   = 1,
    ShapeMismatch     = 2,
    InvalidDimension  = 3,
    IndexOutOfRange   = 4,
    AssemblyError     = 5,
    NotImplemented    = 6,
    Unknown           = 255
};

inline const char* status_to_string(Status status) {
    switch (status) {
        case Status::Success:          return "Success";
        case Status::InvalidArgument:  return "Invalid argument";
        case Status::ShapeMismatch:    return "Shape mismatch";
        case Status::InvalidDimension: return "Invalid dimension";
        case Status::IndexOutOfRange:  return "Index out of range";
        case Status::AssemblyError:    return "Assembly error";
        case Status::NotImplemented:   return "Not implemented";
        default:                       return "Unknown error";
    }
}

// ============================================================================
// Form Arity
// ============================================================================

/**
 * @brief Number of basis functions a form consumes
 */
enum class Arity : std::uint8_t {
    Linear   = 1,   ///< load vector: single test function
    Bilinear = 2    ///< matrix: (trial, test) pair
};

} // namespace igak

#endif // IGAK_CORE_TYPES_H
