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

#ifndef IGAK_MATH_MULTIINDEX_H
#define IGAK_MATH_MULTIINDEX_H

/**
 * @file MultiIndex.h
 * @brief Tensor-product index arithmetic
 *
 * Linearization uses the last axis as the fastest-varying one, matching the
 * axis order of the per-axis support tables.
 */

#include "Core/Types.h"
#include <algorithm>
#include <array>
#include <cstddef>

namespace igak {
namespace math {

/**
 * @brief Half-open index interval [first, last)
 */
struct Interval {
    std::size_t first = 0;
    std::size_t last = 0;

    constexpr bool empty() const noexcept { return last <= first; }
    constexpr std::size_t size() const noexcept { return empty() ? 0 : last - first; }
    constexpr bool contains(std::size_t i) const noexcept { return i >= first && i < last; }
};

constexpr Interval intersect(const Interval& a, const Interval& b) noexcept {
    return Interval{std::max(a.first, b.first), std::min(a.last, b.last)};
}

constexpr bool operator==(const Interval& a, const Interval& b) noexcept {
    return a.first == b.first && a.last == b.last;
}

/**
 * @brief Product of all extents
 */
template<std::size_t N>
constexpr std::size_t product(const std::array<std::size_t, N>& extents) noexcept {
    std::size_t n = 1;
    for (std::size_t k = 0; k < N; ++k) {
        n *= extents[k];
    }
    return n;
}

/**
 * @brief Row-major (last axis fastest) linear index
 *
 * No range check; callers validate against @p extents.
 */
template<std::size_t N>
constexpr std::size_t linearIndex(const std::array<std::size_t, N>& index,
                                  const std::array<std::size_t, N>& extents) noexcept {
    std::size_t k = 0;
    for (std::size_t d = 0; d < N; ++d) {
        k = k * extents[d] + index[d];
    }
    return k;
}

/**
 * @brief Inverse of linearIndex()
 */
template<std::size_t N>
constexpr std::array<std::size_t, N> multiIndex(std::size_t linear,
                                                const std::array<std::size_t, N>& extents) noexcept {
    std::array<std::size_t, N> index{};
    for (std::size_t d = N; d-- > 0;) {
        index[d] = linear % extents[d];
        linear /= extents[d];
    }
    return index;
}

/**
 * @brief Advance @p index to its lexicographic successor inside the box
 *        [start, end)
 *
 * The last axis is incremented first; on overflow it is reset to its start
 * and the carry moves to the previous axis.
 *
 * @return false once the box is exhausted (index is then reset to start)
 */
template<std::size_t N>
constexpr bool nextLexicographic(std::array<std::size_t, N>& index,
                                 const std::array<std::size_t, N>& start,
                                 const std::array<std::size_t, N>& end) noexcept {
    for (std::size_t d = N; d-- > 0;) {
        if (++index[d] < end[d]) {
            return true;
        }
        index[d] = start[d];
    }
    return false;
}

} // namespace math
} // namespace igak

#endif // IGAK_MATH_MULTIINDEX_H
