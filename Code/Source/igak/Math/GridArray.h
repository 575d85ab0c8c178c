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

#ifndef IGAK_MATH_GRIDARRAY_H
#define IGAK_MATH_GRIDARRAY_H

/**
 * @file GridArray.h
 * @brief Dense per-node storage over a tensor quadrature grid
 *
 * Nodes are stored in last-axis-fastest order; the components of one node
 * are contiguous.
 */

#include "Core/Types.h"
#include <cstddef>
#include <functional>
#include <vector>

namespace igak {
namespace math {

class GridArray {
public:
    GridArray() = default;

    GridArray(std::vector<std::size_t> grid_shape, std::size_t components)
        : grid_shape_(std::move(grid_shape)),
          components_(components) {
        std::size_t n = grid_shape_.empty() ? 0 : 1;
        for (std::size_t s : grid_shape_) {
            n *= s;
        }
        num_nodes_ = n;
        data_.assign(num_nodes_ * components_, Real(0));
    }

    const std::vector<std::size_t>& gridShape() const noexcept { return grid_shape_; }
    int gridDim() const noexcept { return static_cast<int>(grid_shape_.size()); }
    std::size_t numNodes() const noexcept { return num_nodes_; }
    std::size_t components() const noexcept { return components_; }
    bool empty() const noexcept { return data_.empty(); }

    Real operator()(std::size_t node, std::size_t comp) const noexcept {
        return data_[node * components_ + comp];
    }
    Real& operator()(std::size_t node, std::size_t comp) noexcept {
        return data_[node * components_ + comp];
    }

    const Real* nodeData(std::size_t node) const noexcept { return data_.data() + node * components_; }
    Real* nodeData(std::size_t node) noexcept { return data_.data() + node * components_; }

    const Real* data() const noexcept { return data_.data(); }
    Real* data() noexcept { return data_.data(); }

    /**
     * @brief Stride (in Real entries) of grid axis @p axis
     */
    std::size_t stride(int axis) const noexcept {
        std::size_t s = components_;
        for (int k = gridDim() - 1; k > axis; --k) {
            s *= grid_shape_[static_cast<std::size_t>(k)];
        }
        return s;
    }

private:
    std::vector<std::size_t> grid_shape_;
    std::size_t components_ = 0;
    std::size_t num_nodes_ = 0;
    std::vector<Real> data_;
};

/**
 * @brief Call @p fn(node, index) for every grid node in storage order
 */
inline void forEachGridNode(const std::vector<std::size_t>& shape,
                            const std::function<void(std::size_t, const std::vector<std::size_t>&)>& fn) {
    std::size_t total = shape.empty() ? 0 : 1;
    for (std::size_t s : shape) {
        total *= s;
    }
    std::vector<std::size_t> index(shape.size(), 0);
    for (std::size_t node = 0; node < total; ++node) {
        fn(node, index);
        for (std::size_t d = shape.size(); d-- > 0;) {
            if (++index[d] < shape[d]) {
                break;
            }
            index[d] = 0;
        }
    }
}

} // namespace math
} // namespace igak

#endif // IGAK_MATH_GRIDARRAY_H
