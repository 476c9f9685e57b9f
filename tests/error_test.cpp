// SPDX-License-Identifier: MIT

// tests/error_test.cpp
#include <cerrno>

#include <gtest/gtest.h>

#include "lib/stream/error.hpp"

using namespace streamkit;

TEST(ErrorTest, Construction) {
    Error err{ErrorCode::ClosedStream, "I/O operation on closed stream"};
    EXPECT_EQ(err.code, ErrorCode::ClosedStream);
    EXPECT_EQ(err.message, "I/O operation on closed stream");
    EXPECT_EQ(err.os_errno, 0);
}

TEST(ErrorTest, WithErrno) {
    Error err{ErrorCode::IoError, "open failed", ENOENT};
    EXPECT_EQ(err.code, ErrorCode::IoError);
    EXPECT_EQ(err.os_errno, ENOENT);
}

TEST(ErrorTest, CategoryString) {
    EXPECT_EQ(error_category(ErrorCode::ClosedStream), "state");
    EXPECT_EQ(error_category(ErrorCode::CapabilityViolation), "capability");

    EXPECT_EQ(error_category(ErrorCode::InvalidMode), "argument");
    EXPECT_EQ(error_category(ErrorCode::InvalidArgument), "argument");
    EXPECT_EQ(error_category(ErrorCode::OutOfRange), "argument");

    EXPECT_EQ(error_category(ErrorCode::InvalidCodec), "codec");
    EXPECT_EQ(error_category(ErrorCode::CompressionError), "codec");
    EXPECT_EQ(error_category(ErrorCode::DecompressionError), "codec");

    EXPECT_EQ(error_category(ErrorCode::TypeMismatch), "type");
    EXPECT_EQ(error_category(ErrorCode::BinaryExpected), "type");

    EXPECT_EQ(error_category(ErrorCode::AllocationFailure), "memory");
    EXPECT_EQ(error_category(ErrorCode::IoError), "io");
    EXPECT_EQ(error_category(ErrorCode::TransferFailure), "transfer");
}

TEST(ErrorTest, CategoryIsConstexpr) {
    static_assert(error_category(ErrorCode::InvalidCodec) == "codec");
}

TEST(ErrorTest, FormatWithoutErrno) {
    Error err{ErrorCode::InvalidCodec, "unknown codec 'foo'"};
    EXPECT_EQ(FormatError(err), "codec: unknown codec 'foo'");
}

TEST(ErrorTest, FormatWithErrno) {
    Error err{ErrorCode::IoError, "open /nonexistent", ENOENT};
    auto text = FormatError(err);
    EXPECT_EQ(text.rfind("io: open /nonexistent (errno ", 0), 0u);
    EXPECT_NE(text.find(std::to_string(ENOENT)), std::string::npos);
}

TEST(ErrorTest, MakeErrorInResult) {
    auto fail = []() -> Result<int> {
        return MakeError(ErrorCode::OutOfRange, "too far");
    };
    auto r = fail();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::OutOfRange);
    EXPECT_EQ(r.error().message, "too far");
}
