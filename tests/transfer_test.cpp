// SPDX-License-Identifier: MIT

// tests/transfer_test.cpp
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "lib/stream/memory_stream.hpp"
#include "lib/stream/transfer.hpp"
#include "tests/temp_path.hpp"

using namespace streamkit;
using namespace std::chrono_literals;
using streamkit::testing::Payload;
using streamkit::testing::ReadFile;
using streamkit::testing::TempDir;
using streamkit::testing::WriteFile;
using ::testing::_;
using ::testing::Return;

namespace {

// Reader over a string, handing out at most `limit` bytes per call.
ChunkReader StringReader(std::string data, size_t limit = SIZE_MAX) {
    auto state = std::make_shared<std::pair<std::string, size_t>>(std::move(data), 0);
    return [state, limit](std::span<std::byte> out) -> Result<int64_t> {
        auto& [src, pos] = *state;
        auto n = std::min({out.size(), limit, src.size() - pos});
        std::memcpy(out.data(), src.data() + pos, n);
        pos += n;
        return static_cast<int64_t>(n);
    };
}

// Writer that records chunks into `out`.
ChunkWriter StringWriter(std::shared_ptr<std::vector<std::string>> out) {
    return [out](std::span<const std::byte> chunk) -> Result<void> {
        out->emplace_back(reinterpret_cast<const char*>(chunk.data()), chunk.size());
        return {};
    };
}

std::string Joined(const std::vector<std::string>& chunks) {
    std::string all;
    for (const auto& c : chunks) all += c;
    return all;
}

}  // namespace

TEST(TransferTaskTest, EmptySourceMovesNothing) {
    auto chunks = std::make_shared<std::vector<std::string>>();
    TransferTask task(StringReader(""), StringWriter(chunks));
    auto stats = task.Run();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->chunks, 0);
    EXPECT_EQ(stats->bytes, 0);
    EXPECT_TRUE(chunks->empty());
}

TEST(TransferTaskTest, ChunksFollowChunkSize) {
    auto chunks = std::make_shared<std::vector<std::string>>();
    TransferTask task(StringReader("0123456789"), StringWriter(chunks),
                      {.chunk_size = 4, .queue_capacity = 8});
    auto stats = task.Run();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->chunks, 3);
    EXPECT_EQ(stats->bytes, 10);
    EXPECT_THAT(*chunks, ::testing::ElementsAre("0123", "4567", "89"));
}

TEST(TransferTaskTest, SlowWriterKeepsOrder) {
    auto data = Payload(64 * 1024);
    auto chunks = std::make_shared<std::vector<std::string>>();
    auto record = StringWriter(chunks);
    ChunkWriter slow = [record](std::span<const std::byte> chunk) {
        std::this_thread::sleep_for(1ms);
        return record(chunk);
    };

    TransferTask task(StringReader(data), slow, {.chunk_size = 1024, .queue_capacity = 2});
    auto stats = task.Run();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->chunks, 64);
    EXPECT_EQ(stats->bytes, static_cast<int64_t>(data.size()));
    EXPECT_EQ(Joined(*chunks), data);
}

TEST(TransferTaskTest, ChunksAreIndependentCopies) {
    // The reader reuses one scratch span; queued chunks must not alias it
    auto chunks = std::make_shared<std::vector<std::string>>();
    auto record = StringWriter(chunks);
    ChunkWriter slow = [record](std::span<const std::byte> chunk) {
        std::this_thread::sleep_for(5ms);
        return record(chunk);
    };
    TransferTask task(StringReader("aaaabbbbccccdddd"), slow,
                      {.chunk_size = 4, .queue_capacity = 4});
    ASSERT_TRUE(task.Run().has_value());
    EXPECT_THAT(*chunks, ::testing::ElementsAre("aaaa", "bbbb", "cccc", "dddd"));
}

TEST(TransferTaskTest, WriterErrorBecomesTransferFailure) {
    ::testing::MockFunction<Result<void>(std::span<const std::byte>)> write;
    EXPECT_CALL(write, Call(_))
        .WillOnce(Return(Result<void>()))
        .WillOnce(Return(Result<void>(MakeError(ErrorCode::IoError, "no space left", 28))));

    auto reads = std::make_shared<int>(0);
    ChunkReader endless = [reads](std::span<std::byte> out) -> Result<int64_t> {
        ++*reads;
        std::fill(out.begin(), out.end(), std::byte{'x'});
        return static_cast<int64_t>(out.size());
    };

    TransferTask task(endless, write.AsStdFunction(), {.chunk_size = 16, .queue_capacity = 2});
    auto r = task.Run();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::TransferFailure);
    EXPECT_EQ(r.error().os_errno, 28);
    EXPECT_THAT(r.error().message, ::testing::HasSubstr("no space left"));
    // The reader stopped instead of running forever
    EXPECT_GE(*reads, 2);
}

TEST(TransferTaskTest, ThrowingWriterBecomesTransferFailure) {
    ChunkWriter throwing = [](std::span<const std::byte>) -> Result<void> {
        throw std::runtime_error("sink exploded");
    };
    TransferTask task(StringReader("x"), throwing, {.chunk_size = 1, .queue_capacity = 1});
    auto r = task.Run();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::TransferFailure);
    EXPECT_THAT(r.error().message, ::testing::HasSubstr("sink exploded"));
}

TEST(TransferTaskTest, ThrowingWriterStopsEndlessReader) {
    auto calls = std::make_shared<int>(0);
    ChunkWriter throwing = [calls](std::span<const std::byte>) -> Result<void> {
        if (++*calls == 3) throw std::runtime_error("third chunk rejected");
        return {};
    };
    ChunkReader endless = [](std::span<std::byte> out) -> Result<int64_t> {
        std::fill(out.begin(), out.end(), std::byte{'e'});
        return static_cast<int64_t>(out.size());
    };
    TransferTask task(endless, throwing, {.chunk_size = 8, .queue_capacity = 2});
    auto r = task.Run();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::TransferFailure);
    EXPECT_EQ(*calls, 3);
}

TEST(TransferTaskTest, ReaderErrorReturnedUnchanged) {
    auto calls = std::make_shared<int>(0);
    ChunkReader failing = [calls](std::span<std::byte> out) -> Result<int64_t> {
        if (++*calls == 3) return MakeError(ErrorCode::IoError, "read failed", 5);
        std::fill(out.begin(), out.end(), std::byte{'r'});
        return static_cast<int64_t>(out.size());
    };
    auto chunks = std::make_shared<std::vector<std::string>>();
    TransferTask task(failing, StringWriter(chunks), {.chunk_size = 8, .queue_capacity = 4});
    auto r = task.Run();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::IoError);
    EXPECT_EQ(r.error().os_errno, 5);
    // Chunks read before the failure were still written
    EXPECT_EQ(chunks->size(), 2u);
}

TEST(TransferTaskTest, InvalidConfig) {
    auto chunks = std::make_shared<std::vector<std::string>>();
    TransferTask zero_chunk(StringReader("x"), StringWriter(chunks), {.chunk_size = 0});
    auto r1 = zero_chunk.Run();
    ASSERT_FALSE(r1.has_value());
    EXPECT_EQ(r1.error().code, ErrorCode::InvalidArgument);

    TransferTask zero_queue(StringReader("x"), StringWriter(chunks), {.queue_capacity = 0});
    auto r2 = zero_queue.Run();
    ASSERT_FALSE(r2.has_value());
    EXPECT_EQ(r2.error().code, ErrorCode::InvalidArgument);
    EXPECT_TRUE(chunks->empty());
}

class TransferPathTest : public ::testing::Test {
protected:
    TempDir dir_;
};

TEST_F(TransferPathTest, DownloadToPath) {
    auto data = Payload(200 * 1024);
    auto path = dir_.File("download.bin");
    auto stats = Download(WrapBufferAsReader(Buffer::FromString(data)), path);
    ASSERT_TRUE(stats.has_value()) << stats.error().message;
    EXPECT_EQ(stats->bytes, static_cast<int64_t>(data.size()));
    EXPECT_EQ(stats->chunks, 4);
    EXPECT_EQ(ReadFile(path), data);
}

TEST_F(TransferPathTest, UploadFromPath) {
    auto data = Payload(100 * 1024);
    auto path = dir_.File("upload.bin");
    WriteFile(path, data);

    auto target = *GrowableBufferWriter();
    auto stats = Upload(target, path);
    ASSERT_TRUE(stats.has_value()) << stats.error().message;
    EXPECT_EQ(stats->bytes, static_cast<int64_t>(data.size()));
    // The caller's stream stays open
    EXPECT_FALSE(target->IsClosed());
    EXPECT_EQ((*target->GetValue())->ToString(), data);
}

TEST_F(TransferPathTest, UploadFromMissingPath) {
    auto target = *GrowableBufferWriter();
    auto r = Upload(target, dir_.File("missing.bin"));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::IoError);
}

TEST(TransferStreamTest, DownloadIntoStreamLeavesItOpen) {
    auto target = *GrowableBufferWriter();
    auto stats = Download(WrapBufferAsReader(Buffer::FromString("stream to stream")),
                          std::shared_ptr<Stream>(target));
    ASSERT_TRUE(stats.has_value());
    EXPECT_FALSE(target->IsClosed());
    EXPECT_EQ((*target->GetValue())->ToString(), "stream to stream");
}

TEST(TransferStreamTest, DownloadIntoCallback) {
    auto chunks = std::make_shared<std::vector<std::string>>();
    auto stats = Download(WrapBufferAsReader(Buffer::FromString("callback sink")),
                          StringWriter(chunks), {.chunk_size = 5});
    ASSERT_TRUE(stats.has_value());
    EXPECT_THAT(*chunks, ::testing::ElementsAre("callb", "ack s", "ink"));
}

TEST(TransferStreamTest, UploadFromCallback) {
    auto target = *GrowableBufferWriter();
    auto stats = Upload(target, StringReader("from a callback", 4));
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->chunks, 4);
    EXPECT_EQ((*target->GetValue())->ToString(), "from a callback");
}

TEST(TransferStreamTest, CapabilityChecks) {
    auto reader = WrapBufferAsReader(Buffer::FromString("abc"));
    auto writer = *GrowableBufferWriter();

    auto wrong_source = Download(writer, std::shared_ptr<Stream>(writer));
    ASSERT_FALSE(wrong_source.has_value());
    EXPECT_EQ(wrong_source.error().code, ErrorCode::CapabilityViolation);

    auto wrong_sink = Download(reader, reader);
    ASSERT_FALSE(wrong_sink.has_value());
    EXPECT_EQ(wrong_sink.error().code, ErrorCode::CapabilityViolation);

    auto wrong_target = Upload(reader, reader);
    ASSERT_FALSE(wrong_target.has_value());
    EXPECT_EQ(wrong_target.error().code, ErrorCode::CapabilityViolation);

    auto null_stream = Download(nullptr, ChunkWriter([](std::span<const std::byte>) {
                                    return Result<void>();
                                }));
    ASSERT_FALSE(null_stream.has_value());
    EXPECT_EQ(null_stream.error().code, ErrorCode::InvalidArgument);

    auto empty_writer = Download(reader, ChunkWriter());
    ASSERT_FALSE(empty_writer.has_value());
    EXPECT_EQ(empty_writer.error().code, ErrorCode::InvalidArgument);
}
