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
 * @file KernelEmitter.cpp
 * @brief Kernel initialization and the support-restricted combine loop
 */

#include "Forms/KernelEmitter.h"
#include "Core/Exception.h"
#include "Core/Logger.h"
#include "Forms/Lowering.h"
#include <algorithm>
#include <cmath>
#include <span>

namespace igak {
namespace forms {

namespace {

/**
 * @brief Fixed-capacity stack storage with a heap fallback
 */
template<typename T, std::size_t N>
class ScratchBuffer {
public:
    explicit ScratchBuffer(std::size_t n) {
        if (n > N) {
            heap_.resize(n);
            ptr_ = heap_.data();
        } else {
            ptr_ = stack_.data();
        }
    }

    ScratchBuffer(const ScratchBuffer&) = delete;
    ScratchBuffer& operator=(const ScratchBuffer&) = delete;

    T* data() noexcept { return ptr_; }

private:
    std::array<T, N> stack_;
    std::vector<T> heap_;
    T* ptr_ = nullptr;
};

/**
 * @brief Loop state shared by every level of the quadrature nest
 */
template<int Dim>
struct CombineContext {
    const KernelProgram* program = nullptr;
    std::size_t num_loads = 0;
    const Real* const* rows = nullptr;          ///< [axis * num_loads + load]
    std::array<std::size_t, Dim> row_stride{};
    std::array<math::Interval, Dim> nodes{};
    std::array<std::size_t, Dim> grid_shape{};
    Real* partial = nullptr;                     ///< [axis * num_loads + load]
    std::size_t num_fields = 0;
    const Real* const* field_base = nullptr;
    const std::size_t* field_width = nullptr;
    const Real** field_ptrs = nullptr;
    Real* regs = nullptr;
    Real* out = nullptr;
};

template<int Dim, int Axis>
void sweep(CombineContext<Dim>& ctx, std::size_t node) {
    const std::size_t nl = ctx.num_loads;
    const Real* const* rows = ctx.rows + static_cast<std::size_t>(Axis) * nl;
    Real* cur = ctx.partial + static_cast<std::size_t>(Axis) * nl;
    const std::size_t stride = ctx.row_stride[Axis];
    const std::size_t extent = ctx.grid_shape[Axis];

    for (std::size_t q = ctx.nodes[Axis].first; q < ctx.nodes[Axis].last; ++q) {
        const std::size_t offset = q * stride;
        if constexpr (Axis == 0) {
            for (std::size_t l = 0; l < nl; ++l) {
                cur[l] = rows[l][offset];
            }
        } else {
            const Real* prev = cur - nl;
            for (std::size_t l = 0; l < nl; ++l) {
                cur[l] = prev[l] * rows[l][offset];
            }
        }

        const std::size_t n = node * extent + q;
        if constexpr (Axis + 1 < Dim) {
            sweep<Dim, Axis + 1>(ctx, n);
        } else {
            for (std::size_t s = 0; s < ctx.num_fields; ++s) {
                ctx.field_ptrs[s] = ctx.field_base[s] + n * ctx.field_width[s];
            }
            ctx.program->evaluate(ctx.regs, cur, ctx.field_ptrs, ctx.out);
        }
    }
}

/**
 * @brief Evaluate a grid program at every node, writing into @p target
 */
void evaluate_on_grid(const KernelProgram& program,
                      const std::vector<math::GridArray>& fields,
                      math::GridArray& target) {
    const std::size_t nf = program.fields().size();
    std::vector<const Real*> base(nf);
    std::vector<std::size_t> width(nf);
    for (std::size_t s = 0; s < nf; ++s) {
        const math::GridArray& f = fields[static_cast<std::size_t>(program.fields()[s])];
        IGAK_THROW_IF(f.empty(), AssemblyException,
                      "precomputed field depends on a field that has not been evaluated");
        base[s] = f.data();
        width[s] = f.components();
    }
    std::vector<const Real*> ptrs(nf);
    std::vector<Real> regs(std::max<std::size_t>(program.numRegisters(), 1));
    for (std::size_t n = 0; n < target.numNodes(); ++n) {
        for (std::size_t s = 0; s < nf; ++s) {
            ptrs[s] = base[s] + n * width[s];
        }
        program.evaluate(regs.data(), nullptr, ptrs.data(), target.nodeData(n));
    }
}

bool same_mesh(const std::vector<Real>& a, const std::vector<Real>& b) {
    if (a.size() != b.size()) {
        return false;
    }
    const Real tol = 1e-12 * std::max(Real(1), std::abs(a.back() - a.front()));
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::abs(a[i] - b[i]) > tol) {
            return false;
        }
    }
    return true;
}

template<int Dim>
void fill_space(const std::array<basis::KnotVector, Dim>& bases,
                const quadrature::TensorQuadrature& quadrature,
                int max_deriv,
                SpaceTables<Dim>& space) {
    for (std::size_t k = 0; k < static_cast<std::size_t>(Dim); ++k) {
        space.num_dofs[k] = bases[k].numDofs();
        space.support[k] = bases[k].meshSupport();
        space.tables[k] = bases[k].evaluateDerivatives(quadrature.axes[k].nodes, max_deriv);
    }
}

void sample_input(const math::GridArray& points, const InputFunction& fn,
                  int dim, math::GridArray& target) {
    for (std::size_t n = 0; n < points.numNodes(); ++n) {
        target(n, 0) = fn(std::span<const Real>(points.nodeData(n), static_cast<std::size_t>(dim)));
    }
}

} // anonymous namespace

// ============================================================================
// CompiledKernel
// ============================================================================

template<int Dim>
CompiledKernel<Dim>::CompiledKernel(VForm form, KernelProgram program)
    : form_(std::move(form)), program_(std::move(program)) {
    for (const auto& f : form_.fields) {
        if (f.definition.source == FieldSource::Precomputed) {
            field_programs_.emplace_back(f.id, lowerFieldDefinition(form_, f));
        }
    }
}

template<int Dim>
KernelData<Dim> CompiledKernel<Dim>::initialize(const std::array<basis::KnotVector, Dim>& bases,
                                                const geometry::GeometryMap& geometry) const {
    return initialize(bases, bases, geometry);
}

template<int Dim>
KernelData<Dim> CompiledKernel<Dim>::initialize(const std::array<basis::KnotVector, Dim>& trial_bases,
                                                const std::array<basis::KnotVector, Dim>& test_bases,
                                                const geometry::GeometryMap& geometry) const {
    IGAK_THROW_IF(geometry.dim() != Dim, InvalidDimensionException,
                  "Kernel '" + form_.name + "' is compiled for dimension " +
                  std::to_string(Dim) + " but the geometry map has dimension " +
                  std::to_string(geometry.dim()));

    const bool shared = &trial_bases == &test_bases;
    KernelData<Dim> data;
    std::vector<std::vector<Real>> meshes;
    int max_degree = 0;
    for (std::size_t k = 0; k < static_cast<std::size_t>(Dim); ++k) {
        IGAK_THROW_IF(!shared && !same_mesh(trial_bases[k].mesh(), test_bases[k].mesh()),
                      InvalidArgumentException,
                      "Kernel '" + form_.name + "': trial and test bases have different meshes on axis " +
                      std::to_string(k));
        meshes.push_back(trial_bases[k].mesh());
        max_degree = std::max({max_degree, trial_bases[k].degree(), test_bases[k].degree()});
    }

    data.points_per_element = max_degree + 1;
    data.quadrature = quadrature::makeTensorQuadrature(meshes, data.points_per_element);

    const int max_deriv = form_.requirements.max_deriv;
    fill_space<Dim>(trial_bases, data.quadrature, max_deriv, data.trial);
    if (shared) {
        data.test = data.trial;
    } else {
        fill_space<Dim>(test_bases, data.quadrature, max_deriv, data.test);
    }

    const std::vector<std::size_t> shape = data.quadrature.shape();
    data.fields.resize(form_.fields.size());

    math::GridArray jac;
    math::GridArray det;
    math::GridArray inv;
    if (form_.requirements.needs_jacobian) {
        jac = geometry::gridJacobian(geometry, data.quadrature);
        geometry::determinantsAndInverses(jac, Dim, &det, &inv);
    }

    const bool has_input = std::any_of(form_.fields.begin(), form_.fields.end(),
        [](const FieldVariable& f) { return f.definition.source == FieldSource::Input; });
    if (has_input) {
        data.points = geometry::gridEvaluate(geometry, data.quadrature);
    }

    for (const auto& f : form_.fields) {
        math::GridArray& target = data.fields[static_cast<std::size_t>(f.id)];
        switch (f.definition.source) {
            case FieldSource::Builtin: {
                IGAK_THROW_IF(jac.empty(), AssemblyException,
                              "Kernel '" + form_.name + "': geometry field '" + f.name +
                              "' requested without Jacobian data");
                target = math::GridArray(shape, static_cast<std::size_t>(f.storageSize()));
                switch (f.definition.builtin) {
                    case BuiltinField::Weight:
                        math::forEachGridNode(shape,
                            [&](std::size_t n, const std::vector<std::size_t>& index) {
                                Real w = std::abs(det(n, 0));
                                for (int k = 0; k < Dim; ++k) {
                                    const auto axis = static_cast<std::size_t>(k);
                                    w *= data.quadrature.axes[axis].weights[index[axis]];
                                }
                                target(n, 0) = w;
                            });
                        break;
                    case BuiltinField::JacobianInverseTranspose:
                        for (std::size_t n = 0; n < target.numNodes(); ++n) {
                            for (std::size_t r = 0; r < Dim; ++r) {
                                for (std::size_t c = 0; c < Dim; ++c) {
                                    target(n, r * Dim + c) = inv(n, c * Dim + r);
                                }
                            }
                        }
                        break;
                }
                break;
            }
            case FieldSource::Input:
                target = math::GridArray(shape, 1);
                sample_input(data.points, f.definition.function, Dim, target);
                break;
            case FieldSource::Precomputed:
            case FieldSource::Local:
                break;
        }
    }

    evaluatePrecomputed(data);

    IGAK_LOG_DEBUG("Initialized kernel '" + form_.name + "' (" + std::to_string(Dim) +
                   "D): " + std::to_string(data.quadrature.numNodes()) + " quadrature nodes, " +
                   std::to_string(data.points_per_element) + " per element and axis");
    return data;
}

template<int Dim>
void CompiledKernel<Dim>::evaluatePrecomputed(KernelData<Dim>& data) const {
    const std::vector<std::size_t> shape = data.quadrature.shape();
    for (const auto& [id, program] : field_programs_) {
        const FieldVariable& f = form_.fields[static_cast<std::size_t>(id)];
        math::GridArray values(shape, static_cast<std::size_t>(f.storageSize()));
        evaluate_on_grid(program, data.fields, values);
        data.fields[static_cast<std::size_t>(id)] = std::move(values);
    }
}

template<int Dim>
void CompiledKernel<Dim>::updateInput(KernelData<Dim>& data, const std::string& name,
                                      InputFunction fn) const {
    const int id = form_.findField(name);
    IGAK_THROW_IF(id < 0, InvalidArgumentException,
                  "Kernel '" + form_.name + "' has no field named '" + name + "'");
    const FieldVariable& f = form_.fields[static_cast<std::size_t>(id)];
    IGAK_THROW_IF(f.definition.source != FieldSource::Input, InvalidArgumentException,
                  "Field '" + name + "' of kernel '" + form_.name + "' is not an input function");
    IGAK_CHECK_ARG(static_cast<bool>(fn), "updateInput: empty function for '" + name + "'");
    IGAK_THROW_IF(data.points.empty(), AssemblyException,
                  "updateInput: kernel data of '" + form_.name + "' is not initialized");

    math::GridArray values(data.quadrature.shape(), 1);
    sample_input(data.points, fn, Dim, values);
    data.fields[static_cast<std::size_t>(id)] = std::move(values);

    // precomputed tensors may depend on the input
    evaluatePrecomputed(data);
}

template<int Dim>
void CompiledKernel<Dim>::entry(const KernelData<Dim>& data,
                                const MultiIndex<Dim>& test,
                                const MultiIndex<Dim>& trial,
                                Real* out) const {
    IGAK_THROW_IF(form_.arity != Arity::Bilinear, InvalidArgumentException,
                  "entry: kernel '" + form_.name + "' is a linear form");
    std::fill(out, out + program_.numSlots(), Real(0));

    const auto nqp = static_cast<std::size_t>(data.points_per_element);
    std::array<math::Interval, Dim> nodes{};
    for (std::size_t k = 0; k < static_cast<std::size_t>(Dim); ++k) {
        IGAK_CHECK_INDEX(test[k], data.test.num_dofs[k], "entry: test index");
        IGAK_CHECK_INDEX(trial[k], data.trial.num_dofs[k], "entry: trial index");
        const math::Interval overlap = math::intersect(data.test.support[k][test[k]],
                                                       data.trial.support[k][trial[k]]);
        if (overlap.empty()) {
            return;
        }
        nodes[k] = math::Interval{nqp * overlap.first, nqp * overlap.last};
    }
    combine(data, nodes, test, trial, out);
}

template<int Dim>
void CompiledKernel<Dim>::entry1(const KernelData<Dim>& data,
                                 const MultiIndex<Dim>& test,
                                 Real* out) const {
    IGAK_THROW_IF(form_.arity != Arity::Linear, InvalidArgumentException,
                  "entry1: kernel '" + form_.name + "' is a bilinear form");
    std::fill(out, out + program_.numSlots(), Real(0));

    const auto nqp = static_cast<std::size_t>(data.points_per_element);
    std::array<math::Interval, Dim> nodes{};
    for (std::size_t k = 0; k < static_cast<std::size_t>(Dim); ++k) {
        IGAK_CHECK_INDEX(test[k], data.test.num_dofs[k], "entry1: test index");
        const math::Interval& s = data.test.support[k][test[k]];
        nodes[k] = math::Interval{nqp * s.first, nqp * s.last};
    }
    combine(data, nodes, test, test, out);
}

template<int Dim>
void CompiledKernel<Dim>::combine(const KernelData<Dim>& data,
                                  const std::array<math::Interval, Dim>& nodes,
                                  const MultiIndex<Dim>& test,
                                  const MultiIndex<Dim>& trial,
                                  Real* out) const {
    const auto& loads = program_.basisLoads();
    const auto& field_ids = program_.fields();
    const std::size_t nl = loads.size();
    const std::size_t nf = field_ids.size();

    ScratchBuffer<const Real*, config::KERNEL_STACK_LOADS * Dim> rows(nl * Dim);
    ScratchBuffer<Real, config::KERNEL_STACK_LOADS * Dim> partial(nl * Dim);
    ScratchBuffer<const Real*, config::KERNEL_STACK_LOADS> field_base(nf);
    ScratchBuffer<std::size_t, config::KERNEL_STACK_LOADS> field_width(nf);
    ScratchBuffer<const Real*, config::KERNEL_STACK_LOADS> field_ptrs(nf);
    ScratchBuffer<Real, config::KERNEL_STACK_REGISTERS> regs(program_.numRegisters());

    CombineContext<Dim> ctx;
    ctx.program = &program_;
    ctx.num_loads = nl;
    ctx.nodes = nodes;

    for (std::size_t k = 0; k < static_cast<std::size_t>(Dim); ++k) {
        // both tables share the grid and the derivative order
        const basis::DerivativeTable& trial_table = data.trial.tables[k];
        const basis::DerivativeTable& test_table = data.test.tables[k];
        ctx.row_stride[k] = test_table.pointStride();
        ctx.grid_shape[k] = test_table.numPoints();
        for (std::size_t l = 0; l < nl; ++l) {
            const BasisLoad& load = loads[l];
            const Real* row = load.role == BasisRole::Trial ? trial_table.row(trial[k], 0)
                                                            : test_table.row(test[k], 0);
            rows.data()[k * nl + l] = row + load.orders[k];
        }
    }
    for (std::size_t s = 0; s < nf; ++s) {
        const math::GridArray& f = data.fields[static_cast<std::size_t>(field_ids[s])];
        field_base.data()[s] = f.data();
        field_width.data()[s] = f.components();
    }

    ctx.rows = rows.data();
    ctx.partial = partial.data();
    ctx.num_fields = nf;
    ctx.field_base = field_base.data();
    ctx.field_width = field_width.data();
    ctx.field_ptrs = field_ptrs.data();
    ctx.regs = regs.data();
    ctx.out = out;

    sweep<Dim, 0>(ctx, 0);
}

// ============================================================================
// KernelEmitter
// ============================================================================

template<int Dim>
std::shared_ptr<const CompiledKernel<Dim>> KernelEmitter<Dim>::emit(const FormSpec& spec) {
    return emit(spec.build(Dim));
}

template<int Dim>
std::shared_ptr<const CompiledKernel<Dim>> KernelEmitter<Dim>::emit(const VForm& form) {
    IGAK_THROW_IF(form.dim != Dim, InvalidDimensionException,
                  "KernelEmitter<" + std::to_string(Dim) + ">: form '" + form.name +
                  "' was built for dimension " + std::to_string(form.dim));
    IGAK_THROW_IF(form.requirements.max_deriv > config::MAX_DERIV_ORDER, InvalidArgumentException,
                  "KernelEmitter: form '" + form.name + "' needs derivative order " +
                  std::to_string(form.requirements.max_deriv) + ", supported up to " +
                  std::to_string(config::MAX_DERIV_ORDER));

    KernelProgram program = lowerForm(form);
    auto kernel = std::make_shared<const CompiledKernel<Dim>>(form, std::move(program));

    IGAK_LOG_DEBUG("Emitted kernel '" + form.name + "' (" + std::to_string(Dim) + "D): " +
                   std::to_string(kernel->program().numRegisters()) + " instructions, " +
                   std::to_string(kernel->program().basisLoads().size()) + " basis loads, " +
                   "max derivative order " + std::to_string(form.requirements.max_deriv));
    return kernel;
}

template class CompiledKernel<2>;
template class CompiledKernel<3>;
template class KernelEmitter<2>;
template class KernelEmitter<3>;

} // namespace forms
} // namespace igak
