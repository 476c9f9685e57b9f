// SPDX-License-Identifier: MIT

// tests/foreign_stream_test.cpp
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <cstring>
#include <memory>
#include <string>

#include "lib/stream/foreign_stream.hpp"

using namespace streamkit;
using ::testing::_;
using ::testing::Return;

namespace {

// Caller-side file object the adapter talks to.
struct FakeFile {
    std::string data;
    int64_t pos = 0;
    bool closed = false;
    int close_calls = 0;
    int flush_calls = 0;
    size_t max_chunk = 3;  // Short reads and writes
};

ForeignHandle MakeHandle(const std::shared_ptr<FakeFile>& f, bool seekable = true) {
    ForeignHandle h;
    h.read = [f](std::span<std::byte> out) -> Result<int64_t> {
        auto n = std::min({out.size(), f->max_chunk,
                           f->data.size() - static_cast<size_t>(f->pos)});
        std::memcpy(out.data(), f->data.data() + f->pos, n);
        f->pos += static_cast<int64_t>(n);
        return static_cast<int64_t>(n);
    };
    h.write = [f](std::span<const std::byte> in) -> Result<int64_t> {
        auto n = std::min(in.size(), f->max_chunk);
        auto end = static_cast<size_t>(f->pos) + n;
        if (f->data.size() < end) f->data.resize(end);
        std::memcpy(f->data.data() + f->pos, in.data(), n);
        f->pos += static_cast<int64_t>(n);
        return static_cast<int64_t>(n);
    };
    if (seekable) {
        h.seek = [f](int64_t offset, Whence whence) -> Result<int64_t> {
            int64_t base = whence == Whence::Start ? 0
                         : whence == Whence::Current ? f->pos
                         : static_cast<int64_t>(f->data.size());
            f->pos = base + offset;
            return f->pos;
        };
        h.tell = [f]() -> Result<int64_t> { return f->pos; };
    }
    h.flush = [f]() -> Result<void> {
        ++f->flush_calls;
        return {};
    };
    h.close = [f]() -> Result<void> {
        ++f->close_calls;
        f->closed = true;
        return {};
    };
    h.closed = [f] { return f->closed; };
    return h;
}

}  // namespace

TEST(ForeignFileTest, ReadLoopsOverShortReads) {
    auto f = std::make_shared<FakeFile>();
    f->data = "foreign handle contents";
    auto stream = WrapForeignHandle(MakeHandle(f), "rb");
    ASSERT_TRUE(stream.has_value());
    EXPECT_TRUE((*stream)->Readable());
    EXPECT_FALSE((*stream)->Writable());
    EXPECT_TRUE((*stream)->Seekable());

    auto all = (*stream)->Read();
    ASSERT_TRUE(all.has_value());
    EXPECT_EQ((*all)->ToString(), f->data);
}

TEST(ForeignFileTest, WriteLoopsOverShortWrites) {
    auto f = std::make_shared<FakeFile>();
    auto stream = *WrapForeignHandle(MakeHandle(f), "wb");
    EXPECT_EQ(stream->Write("written in pieces"), 17);
    ASSERT_TRUE(stream->Flush().has_value());
    EXPECT_EQ(f->data, "written in pieces");
    EXPECT_EQ(f->flush_calls, 1);
}

TEST(ForeignFileTest, SeekableOnlyWithSeekAndTell) {
    auto f = std::make_shared<FakeFile>();
    f->data = "abc";
    auto stream = *WrapForeignHandle(MakeHandle(f, false), "rb");
    EXPECT_FALSE(stream->Seekable());

    auto r = stream->Seek(1);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::CapabilityViolation);

    auto at = stream->ReadAt(0, 1);
    ASSERT_FALSE(at.has_value());
    EXPECT_EQ(at.error().code, ErrorCode::CapabilityViolation);

    // Unsized read on a sequential handle reads to EOF
    EXPECT_EQ((*stream->Read())->ToString(), "abc");
}

TEST(ForeignFileTest, ReadAtRestoresPosition) {
    auto f = std::make_shared<FakeFile>();
    f->data = "0123456789";
    auto stream = *WrapForeignHandle(MakeHandle(f), "rb");
    ASSERT_TRUE(stream->Seek(2).has_value());

    auto at = stream->ReadAt(6, 3);
    ASSERT_TRUE(at.has_value());
    EXPECT_EQ((*at)->ToString(), "678");
    EXPECT_EQ(stream->Tell(), 2);
    EXPECT_EQ(stream->Size(), 10);
    EXPECT_EQ(stream->Tell(), 2);
}

TEST(ForeignFileTest, ModeFromAttribute) {
    auto f = std::make_shared<FakeFile>();

    auto h = MakeHandle(f);
    h.mode = "ab";
    EXPECT_TRUE((*WrapForeignHandle(h))->Writable());

    h.mode = "r+b";
    auto rw = *WrapForeignHandle(h);
    EXPECT_TRUE(rw->Readable());
    EXPECT_TRUE(rw->Writable());

    h.mode = "rb";
    auto ro = *WrapForeignHandle(h);
    EXPECT_TRUE(ro->Readable());
    EXPECT_FALSE(ro->Writable());
}

TEST(ForeignFileTest, ModeFromPredicates) {
    auto f = std::make_shared<FakeFile>();
    auto h = MakeHandle(f);
    h.writable = [] { return true; };
    EXPECT_TRUE((*WrapForeignHandle(h))->Writable());

    h.writable = [] { return false; };
    EXPECT_TRUE((*WrapForeignHandle(h))->Readable());
}

TEST(ForeignFileTest, DeclaredModeContradictsPredicates) {
    auto f = std::make_shared<FakeFile>();
    auto h = MakeHandle(f);
    h.readable = [] { return false; };
    h.writable = [] { return true; };

    auto r = WrapForeignHandle(h, "rb");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::TypeMismatch);

    EXPECT_TRUE(WrapForeignHandle(h, "wb").has_value());
}

TEST(ForeignFileTest, MissingCallableIsTypeMismatch) {
    auto f = std::make_shared<FakeFile>();
    auto h = MakeHandle(f);
    h.write = nullptr;
    auto r = WrapForeignHandle(h, "wb");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::TypeMismatch);
}

TEST(ForeignFileTest, TextHandleRejected) {
    auto f = std::make_shared<FakeFile>();
    auto h = MakeHandle(f);
    h.is_text = true;
    auto r = WrapForeignHandle(h, "rb");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::BinaryExpected);
}

TEST(ForeignFileTest, InvalidExplicitMode) {
    auto f = std::make_shared<FakeFile>();
    auto r = WrapForeignHandle(MakeHandle(f), "rt");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidMode);
}

TEST(ForeignFileTest, OwnershipControlsDestructorClose) {
    auto f = std::make_shared<FakeFile>();
    { auto s = *WrapForeignHandle(MakeHandle(f), "rb"); }
    EXPECT_EQ(f->close_calls, 0);

    auto h = MakeHandle(f);
    h.own = true;
    { auto s = *WrapForeignHandle(h, "rb"); }
    EXPECT_EQ(f->close_calls, 1);
}

TEST(ForeignFileTest, ClosedHandleReportsClosed) {
    auto f = std::make_shared<FakeFile>();
    f->data = "abc";
    auto stream = *WrapForeignHandle(MakeHandle(f), "rb");
    f->closed = true;
    EXPECT_TRUE(stream->IsClosed());
    auto r = stream->Read(1);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::ClosedStream);
}

TEST(ForeignFileTest, WriteErrorPropagates) {
    ::testing::MockFunction<Result<int64_t>(std::span<const std::byte>)> write;
    EXPECT_CALL(write, Call(_))
        .WillOnce(Return(Result<int64_t>(MakeError(ErrorCode::IoError, "disk full", 28))));

    ForeignHandle h;
    h.write = write.AsStdFunction();
    auto stream = *WrapForeignHandle(std::move(h), "wb");
    auto r = stream->Write("data");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::IoError);
    EXPECT_EQ(r.error().os_errno, 28);
}

TEST(ForeignFileTest, ZeroByteWriteIsIoError) {
    ForeignHandle h;
    h.write = [](std::span<const std::byte>) -> Result<int64_t> { return 0; };
    auto stream = *WrapForeignHandle(std::move(h), "wb");
    auto r = stream->Write("data");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::IoError);
}
