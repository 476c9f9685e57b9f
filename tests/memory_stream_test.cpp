// SPDX-License-Identifier: MIT

// tests/memory_stream_test.cpp
#include <gtest/gtest.h>

#include <array>
#include <string>

#include "lib/stream/memory_stream.hpp"

using namespace streamkit;

TEST(BufferReaderTest, ReadsAreSlices) {
    auto source = Buffer::FromString("in-memory source");
    auto reader = WrapBufferAsReader(source);
    EXPECT_TRUE(reader->Readable());
    EXPECT_FALSE(reader->Writable());
    EXPECT_TRUE(reader->Seekable());

    auto head = reader->Read(9);
    ASSERT_TRUE(head.has_value());
    EXPECT_EQ((*head)->ToString(), "in-memory");
    EXPECT_EQ((*head)->Data(), source->Data());

    auto rest = reader->Read();
    ASSERT_TRUE(rest.has_value());
    EXPECT_EQ((*rest)->ToString(), " source");
    EXPECT_EQ((*reader->Read(4))->Size(), 0);
}

TEST(BufferReaderTest, SeekTellSize) {
    auto reader = WrapBufferAsReader(Buffer::FromString("0123456789"));
    EXPECT_EQ(reader->Seek(0, Whence::End), 10);
    EXPECT_EQ(reader->Tell(), 10);
    EXPECT_EQ(reader->Size(), 10);
    EXPECT_EQ(reader->Seek(-4, Whence::End), 6);
    EXPECT_EQ((*reader->Read(2))->ToString(), "67");
    EXPECT_EQ(reader->Seek(-2, Whence::Current), 6);
}

TEST(BufferReaderTest, ReadAtDoesNotMove) {
    auto reader = WrapBufferAsReader(Buffer::FromString("abcdef"));
    auto at = reader->ReadAt(2, 3);
    ASSERT_TRUE(at.has_value());
    EXPECT_EQ((*at)->ToString(), "cde");
    EXPECT_EQ(reader->Tell(), 0);
}

TEST(BufferReaderTest, ReadInto) {
    auto reader = WrapBufferAsReader(Buffer::FromString("abc"));
    std::array<std::byte, 2> out{};
    EXPECT_EQ(reader->ReadInto(out), 2);
    EXPECT_EQ(reader->ReadInto(out), 1);
    EXPECT_EQ(out[0], std::byte{'c'});
    EXPECT_EQ(reader->ReadInto(out), 0);
}

TEST(BufferReaderTest, NullBufferReadsEmpty) {
    auto reader = WrapBufferAsReader(nullptr);
    auto all = reader->Read();
    ASSERT_TRUE(all.has_value());
    EXPECT_EQ((*all)->Size(), 0);
}

TEST(BufferReaderTest, WriteIsCapabilityViolation) {
    auto reader = WrapBufferAsReader(Buffer::FromString("abc"));
    auto w = reader->Write("x");
    ASSERT_FALSE(w.has_value());
    EXPECT_EQ(w.error().code, ErrorCode::CapabilityViolation);
}

TEST(BufferReaderTest, ClosedRejectsIo) {
    auto reader = WrapBufferAsReader(Buffer::FromString("abc"));
    ASSERT_TRUE(reader->Close().has_value());
    ASSERT_TRUE(reader->Close().has_value());
    auto r = reader->Read(1);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::ClosedStream);
}

TEST(FixedSizeBufferWriterTest, WritesIntoBuffer) {
    auto target = *AllocateBuffer(8);
    auto writer = WrapBufferAsFixedWriter(target);
    ASSERT_TRUE(writer.has_value());
    auto& w = *writer;
    EXPECT_FALSE(w->Readable());
    EXPECT_TRUE(w->Writable());
    EXPECT_TRUE(w->Seekable());

    EXPECT_EQ(w->Write("abcd"), 4);
    EXPECT_EQ(w->Seek(6), 6);
    EXPECT_EQ(w->Write("gh"), 2);
    EXPECT_EQ(w->Tell(), 8);
    EXPECT_EQ(target->ToString().substr(0, 4), "abcd");
    EXPECT_EQ(target->ToString().substr(6), "gh");
}

TEST(FixedSizeBufferWriterTest, NeverGrows) {
    auto target = *AllocateBuffer(4);
    auto w = *WrapBufferAsFixedWriter(target);
    ASSERT_TRUE(w->Write("abc").has_value());
    auto r = w->Write("de");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::OutOfRange);
    EXPECT_EQ(w->Tell(), 3);
}

TEST(FixedSizeBufferWriterTest, ImmutableBufferRejected) {
    auto r = WrapBufferAsFixedWriter(Buffer::FromString("read only"));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::CapabilityViolation);
}

TEST(BufferOutputStreamTest, GrowsAndReturnsValue) {
    auto out = GrowableBufferWriter();
    ASSERT_TRUE(out.has_value());
    auto& w = *out;
    EXPECT_FALSE(w->Seekable());

    std::string big(10000, 'q');
    ASSERT_EQ(w->Write("head:"), 5);
    ASSERT_EQ(w->Write(big), 10000);
    EXPECT_EQ(w->Tell(), 10005);
    EXPECT_EQ(w->length(), 10005);

    auto value = w->GetValue();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ((*value)->Size(), 10005);
    EXPECT_EQ((*value)->ToString(), "head:" + big);

    EXPECT_TRUE(w->IsClosed());
    auto again = w->Write("x");
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::ClosedStream);
}

TEST(BufferOutputStreamTest, EmptyValue) {
    auto w = *BufferOutputStream::Create(0);
    auto value = w->GetValue();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ((*value)->Size(), 0);
}

TEST(BufferOutputStreamTest, ValueAfterCloseFails) {
    auto w = *GrowableBufferWriter();
    ASSERT_TRUE(w->Close().has_value());
    auto value = w->GetValue();
    ASSERT_FALSE(value.has_value());
    EXPECT_EQ(value.error().code, ErrorCode::ClosedStream);
}
