/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

/**
 * @file test_BaseAssembler.cpp
 * @brief Unit tests for index mapping, batched queries and worker cloning
 */

#include <gtest/gtest.h>
#include "igak/Assembly/BaseAssembler.h"
#include "igak/Basis/KnotVector.h"
#include "igak/Core/Exception.h"

#include <atomic>
#include <memory>
#include <set>
#include <stdexcept>
#include <vector>

using namespace igak;
using namespace igak::assembly;

namespace {

/**
 * @brief Assembler with a closed-form entry, for testing the query plumbing
 *
 * Block value for (test, trial, r, c) is 1000 * lin(test) + lin(trial)
 * + 0.25 * (r * nc_trial + c) when the supports overlap on every axis,
 * else 0.
 */
class SyntheticAssembler : public BaseAssembler<2> {
public:
    SyntheticAssembler(const basis::KnotVector& a, const basis::KnotVector& b, int nc,
                       Arity arity = Arity::Bilinear)
        : BaseAssembler<2>({a.numDofs(), b.numDofs()}, arity, nc, false),
          test_support_{a.meshSupport(), b.meshSupport()},
          trial_support_(test_support_) {}

    /// Test functions from (a, b) with @p test_nc components, trial functions from (c, d)
    SyntheticAssembler(const basis::KnotVector& a, const basis::KnotVector& b, int test_nc,
                       const basis::KnotVector& c, const basis::KnotVector& d, int trial_nc,
                       bool symmetric = false)
        : BaseAssembler<2>({a.numDofs(), b.numDofs()}, {c.numDofs(), d.numDofs()},
                           Arity::Bilinear, test_nc, trial_nc, symmetric),
          test_support_{a.meshSupport(), b.meshSupport()},
          trial_support_{c.meshSupport(), d.meshSupport()} {}

    std::string name() const override { return "synthetic"; }

    const std::vector<math::Interval>& meshSupport(int axis, Space space) const override {
        const auto& support = space == Space::Trial ? trial_support_ : test_support_;
        return support.at(static_cast<std::size_t>(axis));
    }

    /// Throw from entryImpl when the test index on axis 0 equals this value
    std::size_t fail_at = static_cast<std::size_t>(-1);

protected:
    void entryImpl(const Index& test, const Index& trial, Real* out) const override {
        if (test[0] == fail_at) {
            throw AssemblyException("synthetic failure at row " + std::to_string(test[0]));
        }
        bool overlap = true;
        for (std::size_t k = 0; k < 2; ++k) {
            overlap = overlap &&
                      !math::intersect(test_support_[k][test[k]], trial_support_[k][trial[k]]).empty();
        }
        const auto base = static_cast<Real>(1000 * math::linearIndex(test, numDofsPerAxis(Space::Test)) +
                                            math::linearIndex(trial, numDofsPerAxis(Space::Trial)));
        for (int s = 0; s < numSlots(); ++s) {
            out[s] = overlap ? base + 0.25 * s : 0.0;
        }
    }

    void entry1Impl(const Index& test, Real* out) const override {
        for (int c = 0; c < numComponents(); ++c) {
            out[c] = static_cast<Real>(10 * math::linearIndex(test, numDofsPerAxis()) + c);
        }
    }

    std::array<std::vector<math::Interval>, 2> test_support_;
    std::array<std::vector<math::Interval>, 2> trial_support_;
};

/// Not shareable between workers; every worker receives its own clone
class CloningAssembler : public SyntheticAssembler {
public:
    CloningAssembler(const basis::KnotVector& a, const basis::KnotVector& b,
                     std::shared_ptr<std::atomic<int>> clones)
        : SyntheticAssembler(a, b, 1), clones_(std::move(clones)) {}

    bool isThreadSafe() const noexcept override { return false; }

    std::unique_ptr<BaseAssembler<2>> cloneForWorker() const override {
        clones_->fetch_add(1);
        auto copy = std::make_unique<CloningAssembler>(*this);
        copy->is_clone_ = true;
        return copy;
    }

    bool is_clone_ = false;

protected:
    void entryImpl(const Index& test, const Index& trial, Real* out) const override {
        if (!is_clone_) {
            throw AssemblyException("shared instance queried from a worker");
        }
        SyntheticAssembler::entryImpl(test, trial, out);
    }

private:
    std::shared_ptr<std::atomic<int>> clones_;
};

/// Default cloneForWorker(), which is not implemented
class UnclonableAssembler : public SyntheticAssembler {
public:
    using SyntheticAssembler::SyntheticAssembler;
    bool isThreadSafe() const noexcept override { return false; }
};

class BaseAssemblerTest : public ::testing::Test {
protected:
    basis::KnotVector a_ = basis::KnotVector::openUniform(2, 4);
    basis::KnotVector b_ = basis::KnotVector::openUniform(1, 3);

    basis::KnotVector c_ = basis::KnotVector::openUniform(3, 4);
    basis::KnotVector d_ = basis::KnotVector::openUniform(2, 3);

    static WorkerPool pool(int threads, std::size_t serial_threshold = 0, int chunks_per_worker = 4) {
        AssemblyOptions options;
        options.num_threads = threads;
        options.serial_threshold = serial_threshold;
        options.chunks_per_worker = chunks_per_worker;
        return WorkerPool(options);
    }

    std::vector<std::pair<GlobalIndex, GlobalIndex>> allPairs(const BaseAssembler<2>& a) const {
        std::vector<std::pair<GlobalIndex, GlobalIndex>> pairs;
        for (GlobalIndex i = 0; i < a.numRows(); ++i) {
            for (GlobalIndex j = 0; j < a.numCols(); j += 3) {
                pairs.emplace_back(i, j);
            }
        }
        return pairs;
    }
};

} // namespace

TEST_F(BaseAssemblerTest, Dimensions) {
    const SyntheticAssembler asmb(a_, b_, 2);
    EXPECT_EQ(asmb.numBasisFunctions(), 6u * 4u);
    EXPECT_EQ(asmb.numDofs(), 6u * 4u * 2u);
    EXPECT_EQ(asmb.numSlots(), 4);
    EXPECT_EQ(asmb.arity(), Arity::Bilinear);

    const SyntheticAssembler load(a_, b_, 3, Arity::Linear);
    EXPECT_EQ(load.numSlots(), 3);
}

TEST_F(BaseAssemblerTest, LinearIndexIsBijective) {
    const SyntheticAssembler asmb(a_, b_, 2);
    std::set<GlobalIndex> seen;
    for (std::size_t i0 = 0; i0 < 6; ++i0) {
        for (std::size_t i1 = 0; i1 < 4; ++i1) {
            for (int c = 0; c < 2; ++c) {
                const GlobalIndex k = asmb.toLinearIndex({i0, i1}, c);
                EXPECT_EQ(k, (i0 * 4 + i1) * 2 + static_cast<GlobalIndex>(c));
                int comp = -1;
                const auto back = asmb.fromLinearIndex(k, &comp);
                EXPECT_EQ(back, (MultiIndex<2>{i0, i1}));
                EXPECT_EQ(comp, c);
                seen.insert(k);
            }
        }
    }
    EXPECT_EQ(seen.size(), asmb.numDofs());
}

TEST_F(BaseAssemblerTest, IndexChecks) {
    const SyntheticAssembler asmb(a_, b_, 2);
    EXPECT_THROW(asmb.toLinearIndex({6, 0}), IndexOutOfRangeException);
    EXPECT_THROW(asmb.toLinearIndex({0, 0}, 2), IndexOutOfRangeException);
    EXPECT_THROW(asmb.fromLinearIndex(asmb.numDofs()), IndexOutOfRangeException);
    EXPECT_THROW(asmb.entry(asmb.numDofs(), 0), IndexOutOfRangeException);
    EXPECT_THROW(asmb.multiEntries({{0, 0}, {0, asmb.numDofs()}}), IndexOutOfRangeException);
}

TEST_F(BaseAssemblerTest, EntrySelectsComponentSlot) {
    const SyntheticAssembler asmb(a_, b_, 2);
    const MultiIndex<2> I{2, 1};
    const MultiIndex<2> J{3, 2};
    const Real base = 1000.0 * (2 * 4 + 1) + (3 * 4 + 2);
    for (int r = 0; r < 2; ++r) {
        for (int c = 0; c < 2; ++c) {
            EXPECT_DOUBLE_EQ(asmb.entry(asmb.toLinearIndex(I, r), asmb.toLinearIndex(J, c)),
                             base + 0.25 * (r * 2 + c));
        }
    }
}

TEST_F(BaseAssemblerTest, ArityMismatch) {
    const SyntheticAssembler matrix(a_, b_, 1);
    const SyntheticAssembler load(a_, b_, 1, Arity::Linear);
    Real v = 0.0;

    EXPECT_EQ(matrix.entry1(3), 0.0);
    EXPECT_EQ(load.entry(3, 4), 0.0);
    EXPECT_THROW(matrix.entry1Block({0, 0}, &v), InvalidArgumentException);
    EXPECT_THROW(load.entryBlock({0, 0}, {0, 0}, &v), InvalidArgumentException);
    EXPECT_THROW(matrix.assembleVector(), InvalidArgumentException);
}

TEST_F(BaseAssemblerTest, AssembleVectorComponentFastest) {
    const SyntheticAssembler load(a_, b_, 2, Arity::Linear);
    for (int threads : {1, 3}) {
        const WorkerPool p = pool(threads);
        const auto v = load.assembleVector(&p);
        ASSERT_EQ(v.size(), load.numDofs());
        for (GlobalIndex k = 0; k < v.size(); ++k) {
            EXPECT_DOUBLE_EQ(v[k], load.entry1(k));
            EXPECT_DOUBLE_EQ(v[k], static_cast<Real>(10 * (k / 2) + k % 2));
        }
    }
}

TEST_F(BaseAssemblerTest, MultiEntriesPreservesOrder) {
    const SyntheticAssembler asmb(a_, b_, 2);
    const auto pairs = allPairs(asmb);

    const auto serial = asmb.multiEntries(pairs);
    ASSERT_EQ(serial.size(), pairs.size());
    for (std::size_t p = 0; p < pairs.size(); ++p) {
        EXPECT_DOUBLE_EQ(serial[p], asmb.entry(pairs[p].first, pairs[p].second));
    }

    const WorkerPool parallel = pool(4);
    EXPECT_EQ(asmb.multiEntries(pairs, &parallel), serial);

    // below the threshold the batch runs on the caller
    const WorkerPool thresholded = pool(4, pairs.size() + 1);
    EXPECT_EQ(asmb.multiEntries(pairs, &thresholded), serial);

    EXPECT_TRUE(asmb.multiEntries({}, &parallel).empty());
}

TEST_F(BaseAssemblerTest, MultiEntriesPropagatesWorkerFailure) {
    SyntheticAssembler asmb(a_, b_, 1);
    asmb.fail_at = 4;
    const auto pairs = allPairs(asmb);
    for (int threads : {1, 4}) {
        const WorkerPool p = pool(threads);
        EXPECT_THROW(asmb.multiEntries(pairs, &p), AssemblyException);
    }
}

TEST_F(BaseAssemblerTest, WorkersUseClonesOfUnsafeAssemblers) {
    auto clones = std::make_shared<std::atomic<int>>(0);
    const CloningAssembler asmb(a_, b_, clones);
    const auto pairs = allPairs(asmb);

    const WorkerPool p = pool(4);
    const auto values = asmb.multiEntries(pairs, &p);
    EXPECT_GT(clones->load(), 0);
    ASSERT_EQ(values.size(), pairs.size());

    const SyntheticAssembler plain(a_, b_, 1);
    for (std::size_t k = 0; k < pairs.size(); ++k) {
        EXPECT_DOUBLE_EQ(values[k], plain.entry(pairs[k].first, pairs[k].second));
    }
}

TEST_F(BaseAssemblerTest, MultiEntriesRunsOneChunkPerWorker) {
    const CloningAssembler reference(a_, b_, std::make_shared<std::atomic<int>>(0));
    const auto pairs = allPairs(reference);
    ASSERT_GT(pairs.size(), 100u);

    for (int chunks_per_worker : {1, 8}) {
        auto clones = std::make_shared<std::atomic<int>>(0);
        const CloningAssembler asmb(a_, b_, clones);
        const WorkerPool p = pool(4, 0, chunks_per_worker);
        const auto values = asmb.multiEntries(pairs, &p);
        EXPECT_EQ(clones->load(), 4) << "chunks_per_worker " << chunks_per_worker;
        EXPECT_EQ(values.size(), pairs.size());
    }
}

TEST_F(BaseAssemblerTest, UnsafeAssemblerWithoutCloneFails) {
    const UnclonableAssembler asmb(a_, b_, 1);
    EXPECT_THROW(asmb.cloneForWorker(), NotImplementedException);

    const WorkerPool p = pool(2);
    EXPECT_THROW(asmb.multiEntries(allPairs(asmb), &p), NotImplementedException);
}

TEST_F(BaseAssemblerTest, NeighborRangeMatchesSupportOverlap) {
    const SyntheticAssembler asmb(a_, b_, 1);
    for (int axis = 0; axis < 2; ++axis) {
        const auto& support = asmb.meshSupport(axis, Space::Test);
        for (std::size_t i = 0; i < support.size(); ++i) {
            const math::Interval r = asmb.neighborRange(axis, i);
            for (std::size_t j = 0; j < support.size(); ++j) {
                const bool overlap = !math::intersect(support[i], support[j]).empty();
                EXPECT_EQ(r.contains(j), overlap) << "axis " << axis << " i " << i << " j " << j;
            }
        }
    }
    EXPECT_THROW(asmb.neighborRange(2, 0), IndexOutOfRangeException);
    EXPECT_THROW(asmb.neighborRange(0, 6), IndexOutOfRangeException);
}

TEST_F(BaseAssemblerTest, SeparateSpacesIndexRowsAndColumns) {
    const SyntheticAssembler asmb(a_, b_, 2, c_, d_, 3);
    EXPECT_EQ(asmb.numBasisFunctions(Space::Test), 6u * 4u);
    EXPECT_EQ(asmb.numBasisFunctions(Space::Trial), 7u * 5u);
    EXPECT_EQ(asmb.numRows(), 6u * 4u * 2u);
    EXPECT_EQ(asmb.numCols(), 7u * 5u * 3u);
    EXPECT_EQ(asmb.numComponents(Space::Test), 2);
    EXPECT_EQ(asmb.numComponents(Space::Trial), 3);
    EXPECT_EQ(asmb.numSlots(), 6);

    const MultiIndex<2> I{2, 1};
    const MultiIndex<2> J{3, 2};
    EXPECT_EQ(asmb.toLinearIndex(J, 2, Space::Trial), (3u * 5u + 2u) * 3u + 2u);
    int comp = -1;
    EXPECT_EQ(asmb.fromLinearIndex((3u * 5u + 2u) * 3u + 2u, &comp, Space::Trial), J);
    EXPECT_EQ(comp, 2);

    const Real base = 1000.0 * (2 * 4 + 1) + (3 * 5 + 2);
    for (int r = 0; r < 2; ++r) {
        for (int c = 0; c < 3; ++c) {
            EXPECT_DOUBLE_EQ(asmb.entry(asmb.toLinearIndex(I, r, Space::Test),
                                        asmb.toLinearIndex(J, c, Space::Trial)),
                             base + 0.25 * (r * 3 + c));
        }
    }

    // columns run past the row count
    const GlobalIndex last_col = asmb.numCols() - 1;
    EXPECT_NO_THROW(asmb.entry(0, last_col));
    EXPECT_THROW(asmb.entry(asmb.numRows(), 0), IndexOutOfRangeException);
    EXPECT_THROW(asmb.entry(0, asmb.numCols()), IndexOutOfRangeException);
    EXPECT_THROW(asmb.toLinearIndex({0, 0}, 2, Space::Test), IndexOutOfRangeException);

    const auto pairs = allPairs(asmb);
    const WorkerPool p = pool(3);
    const auto values = asmb.multiEntries(pairs, &p);
    ASSERT_EQ(values.size(), pairs.size());
    for (std::size_t k = 0; k < pairs.size(); ++k) {
        EXPECT_DOUBLE_EQ(values[k], asmb.entry(pairs[k].first, pairs[k].second));
    }
}

TEST_F(BaseAssemblerTest, SeparateSpacesNeighborRangeCoversTrialOverlap) {
    const SyntheticAssembler asmb(a_, b_, 1, c_, d_, 1);
    for (int axis = 0; axis < 2; ++axis) {
        const auto& test = asmb.meshSupport(axis, Space::Test);
        const auto& trial = asmb.meshSupport(axis, Space::Trial);
        for (std::size_t i = 0; i < test.size(); ++i) {
            const math::Interval r = asmb.neighborRange(axis, i);
            EXPECT_LE(r.last, trial.size());
            for (std::size_t j = 0; j < trial.size(); ++j) {
                const bool overlap = !math::intersect(test[i], trial[j]).empty();
                EXPECT_EQ(r.contains(j), overlap) << "axis " << axis << " i " << i << " j " << j;
            }
        }
    }
}

TEST_F(BaseAssemblerTest, SymmetricModeNeedsMatchingSpaces) {
    EXPECT_THROW(SyntheticAssembler(a_, b_, 1, c_, d_, 1, true), InvalidArgumentException);
    EXPECT_THROW(SyntheticAssembler(a_, b_, 1, a_, b_, 2, true), InvalidArgumentException);
    EXPECT_NO_THROW(SyntheticAssembler(a_, b_, 2, a_, b_, 2, true));
}
