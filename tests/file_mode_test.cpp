// SPDX-License-Identifier: MIT

// tests/file_mode_test.cpp
#include <gtest/gtest.h>

#include "lib/stream/file_mode.hpp"

using namespace streamkit;

TEST(FileModeTest, RecognizedModes) {
    EXPECT_EQ(ParseFileMode("r"), FileMode::Read);
    EXPECT_EQ(ParseFileMode("rb"), FileMode::Read);
    EXPECT_EQ(ParseFileMode("w"), FileMode::Write);
    EXPECT_EQ(ParseFileMode("wb"), FileMode::Write);
    EXPECT_EQ(ParseFileMode("r+"), FileMode::ReadWrite);
    EXPECT_EQ(ParseFileMode("rb+"), FileMode::ReadWrite);
    EXPECT_EQ(ParseFileMode("r+b"), FileMode::ReadWrite);
}

TEST(FileModeTest, RejectsEverythingElse) {
    for (std::string_view mode : {"", "a", "ab", "w+", "x", "rt", "R", "rb ", "+r"}) {
        auto r = ParseFileMode(mode);
        ASSERT_FALSE(r.has_value()) << "mode '" << mode << "'";
        EXPECT_EQ(r.error().code, ErrorCode::InvalidMode);
    }
}

TEST(FileModeTest, ModeStringRoundTrips) {
    for (auto mode : {FileMode::Read, FileMode::Write, FileMode::ReadWrite}) {
        EXPECT_EQ(ParseFileMode(ModeString(mode)), mode);
    }
}

TEST(FileModeTest, Capabilities) {
    static_assert(ModeReads(FileMode::Read) && !ModeWrites(FileMode::Read));
    static_assert(!ModeReads(FileMode::Write) && ModeWrites(FileMode::Write));
    static_assert(ModeReads(FileMode::ReadWrite) && ModeWrites(FileMode::ReadWrite));
}
