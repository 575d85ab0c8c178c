/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

/**
 * @file test_Exception.cpp
 * @brief Unit tests for the exception hierarchy and throwing macros
 */

#include <gtest/gtest.h>
#include "igak/Core/Exception.h"

#include <string>

using namespace igak;

namespace {

void throwIfNegative(int value) {
    IGAK_THROW_IF(value < 0, InvalidArgumentException, "negative value");
}

void checkArg(bool ok) {
    IGAK_CHECK_ARG(ok, "argument rejected");
}

void checkIndex(std::size_t i, std::size_t n) {
    IGAK_CHECK_INDEX(i, n, "component");
}

} // namespace

TEST(Exception, CarriesStatusAndMessage) {
    const Exception e("something failed", Status::AssemblyError);
    EXPECT_EQ(e.status(), Status::AssemblyError);
    EXPECT_EQ(e.message(), "something failed");
    EXPECT_NE(std::string(e.what()).find("Assembly error"), std::string::npos);
    EXPECT_NE(std::string(e.what()).find("something failed"), std::string::npos);
}

TEST(Exception, DerivedTypesMapToStatus) {
    EXPECT_EQ(InvalidArgumentException("x").status(), Status::InvalidArgument);
    EXPECT_EQ(ShapeMismatchException("x").status(), Status::ShapeMismatch);
    EXPECT_EQ(InvalidDimensionException("x").status(), Status::InvalidDimension);
    EXPECT_EQ(AssemblyException("x").status(), Status::AssemblyError);
    EXPECT_EQ(NotImplementedException("x").status(), Status::NotImplemented);
}

TEST(Exception, ThrowIfRecordsLocation) {
    EXPECT_NO_THROW(throwIfNegative(1));
    try {
        throwIfNegative(-1);
        FAIL() << "expected InvalidArgumentException";
    } catch (const InvalidArgumentException& e) {
        EXPECT_EQ(e.message(), "negative value");
        EXPECT_GT(e.line(), 0);
        EXPECT_NE(e.file().find("test_Exception.cpp"), std::string::npos);
    }
}

TEST(Exception, CheckArgThrowsInvalidArgument) {
    EXPECT_NO_THROW(checkArg(true));
    EXPECT_THROW(checkArg(false), InvalidArgumentException);
}

TEST(Exception, CheckIndexReportsIndexAndBound) {
    EXPECT_NO_THROW(checkIndex(2, 3));
    try {
        checkIndex(5, 3);
        FAIL() << "expected IndexOutOfRangeException";
    } catch (const IndexOutOfRangeException& e) {
        EXPECT_EQ(e.index(), 5u);
        EXPECT_EQ(e.bound(), 3u);
        EXPECT_EQ(e.status(), Status::IndexOutOfRange);
        EXPECT_NE(e.message().find("not in [0, 3)"), std::string::npos);
    }
}

TEST(Exception, AddContextPrependsToMessage) {
    AssemblyException e("kernel failed");
    e.add_context("chunk 3");
    EXPECT_EQ(e.message().rfind("chunk 3", 0), 0u);
    EXPECT_NE(e.message().find("kernel failed"), std::string::npos);
    EXPECT_NE(std::string(e.what()).find("chunk 3"), std::string::npos);
}

TEST(Exception, CatchableAsBase) {
    EXPECT_THROW(throwIfNegative(-5), Exception);
    EXPECT_THROW(throwIfNegative(-5), std::exception);
}
