// SPDX-License-Identifier: MIT

// tests/resolver_test.cpp
#include <gtest/gtest.h>

#include <memory>
#include <span>
#include <string>

#include "lib/stream/buffered_stream.hpp"
#include "lib/stream/compressed_stream.hpp"
#include "lib/stream/memory_stream.hpp"
#include "lib/stream/resolver.hpp"
#include "tests/temp_path.hpp"

using namespace streamkit;
using streamkit::testing::Payload;
using streamkit::testing::ReadFile;
using streamkit::testing::TempDir;
using streamkit::testing::WriteFile;

class ResolverTest : public ::testing::Test {
protected:
    TempDir dir_;
};

TEST(DetectCompressionTest, KnownSuffixes) {
    EXPECT_EQ(DetectCompression("a/b/data.bz2"), CompressionType::Bz2);
    EXPECT_EQ(DetectCompression("data.csv.gz"), CompressionType::Gzip);
    EXPECT_EQ(DetectCompression("data.lz4"), CompressionType::Lz4);
    EXPECT_EQ(DetectCompression("data.zst"), CompressionType::Zstd);
}

TEST(DetectCompressionTest, UnknownSuffixes) {
    EXPECT_FALSE(DetectCompression("data.csv").has_value());
    EXPECT_FALSE(DetectCompression("data").has_value());
    EXPECT_FALSE(DetectCompression("data.zstd").has_value());
    EXPECT_FALSE(DetectCompression("gz").has_value());
}

TEST_F(ResolverTest, DetectedRoundTripThroughPath) {
    auto path = dir_.File("payload.gz");
    auto data = Payload(100 * 1024);
    {
        auto out = OpenOutput(path);
        ASSERT_TRUE(out.has_value());
        EXPECT_EQ((*out)->Name(), "CompressedOutputStream");
        ASSERT_TRUE((*out)->Write(data).has_value());
        ASSERT_TRUE((*out)->Close().has_value());
    }
    // On disk the bytes are gzip, not the payload
    auto raw = ReadFile(path);
    ASSERT_GE(raw.size(), 2u);
    EXPECT_EQ(static_cast<unsigned char>(raw[0]), 0x1f);
    EXPECT_EQ(static_cast<unsigned char>(raw[1]), 0x8b);

    auto in = OpenInput(path);
    ASSERT_TRUE(in.has_value());
    auto all = (*in)->Read();
    ASSERT_TRUE(all.has_value()) << all.error().message;
    EXPECT_EQ((*all)->ToString(), data);
}

TEST_F(ResolverTest, PlainPathIsUncompressed) {
    auto path = dir_.File("plain.txt");
    WriteFile(path, "plain text");
    auto in = OpenInput(path);
    ASSERT_TRUE(in.has_value());
    EXPECT_EQ((*in)->Name(), "LocalFile");
    EXPECT_EQ((*(*in)->Read())->ToString(), "plain text");
}

TEST_F(ResolverTest, ExplicitCodecOverridesSuffix) {
    auto path = dir_.File("data.bin");
    {
        auto out = *OpenOutput(path, {.compression = "zstd"});
        ASSERT_TRUE(out->Write("explicit").has_value());
        ASSERT_TRUE(out->Close().has_value());
    }
    EXPECT_NE(ReadFile(path), "explicit");
    auto in = *OpenInput(path, {.compression = "zstd"});
    EXPECT_EQ((*in->Read())->ToString(), "explicit");
}

TEST_F(ResolverTest, UncompressedOptionIgnoresSuffix) {
    auto path = dir_.File("not_really.gz");
    WriteFile(path, "raw bytes");
    auto in = OpenInput(path, OpenOptions::Uncompressed());
    ASSERT_TRUE(in.has_value());
    EXPECT_EQ((*(*in)->Read())->ToString(), "raw bytes");
}

TEST_F(ResolverTest, UnknownCodecDoesNotTouchFileSystem) {
    auto path = dir_.File("never_created.bin");
    auto out = OpenOutput(path, {.compression = "zip"});
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(out.error().code, ErrorCode::InvalidCodec);
    EXPECT_FALSE(std::filesystem::exists(path));

    auto snappy = OpenOutput(path, {.compression = "snappy"});
    ASSERT_FALSE(snappy.has_value());
    EXPECT_EQ(snappy.error().code, ErrorCode::InvalidCodec);
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(ResolverTest, NegativeBufferSize) {
    auto path = dir_.File("never_created.bin");
    auto out = OpenOutput(path, {.buffer_size = -1});
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(out.error().code, ErrorCode::InvalidArgument);
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(ResolverTest, BufferingSitsBelowCompression) {
    auto path = dir_.File("layers.zst");
    auto out = OpenOutput(path, {.buffer_size = 4096});
    ASSERT_TRUE(out.has_value());
    auto compressed = std::dynamic_pointer_cast<CompressedOutputStream>(*out);
    ASSERT_NE(compressed, nullptr);
    EXPECT_NE(std::dynamic_pointer_cast<BufferedOutputStream>(compressed->raw()), nullptr);
    ASSERT_TRUE((*out)->Close().has_value());

    auto in = OpenInput(path, {.buffer_size = 4096});
    ASSERT_TRUE(in.has_value());
    auto decompressed = std::dynamic_pointer_cast<CompressedInputStream>(*in);
    ASSERT_NE(decompressed, nullptr);
    EXPECT_NE(std::dynamic_pointer_cast<BufferedInputStream>(decompressed->raw()), nullptr);
}

TEST_F(ResolverTest, BufferedPlainOutput) {
    auto path = dir_.File("buffered.txt");
    auto out = *OpenOutput(path, {.compression = std::nullopt, .buffer_size = 1024});
    EXPECT_EQ(out->Name(), "BufferedOutputStream");
    ASSERT_TRUE(out->Write("buffered").has_value());
    ASSERT_TRUE(out->Close().has_value());
    EXPECT_EQ(ReadFile(path), "buffered");
}

TEST_F(ResolverTest, MissingInputPath) {
    auto in = OpenInput(dir_.File("missing.txt"));
    ASSERT_FALSE(in.has_value());
    EXPECT_EQ(in.error().code, ErrorCode::IoError);
}

TEST(ResolverSourceTest, StreamSourcePassesThrough) {
    auto reader = WrapBufferAsReader(Buffer::FromString("abc"));
    auto in = OpenInput(reader);
    ASSERT_TRUE(in.has_value());
    EXPECT_EQ(*in, reader);
}

TEST(ResolverSourceTest, DetectDoesNothingForStreams) {
    // gzip-looking bytes stay raw: detection needs a path
    std::string gzip_magic = "\x1f\x8b";
    auto in = *OpenInput(WrapBufferAsReader(Buffer::FromString(gzip_magic)));
    EXPECT_EQ((*in->Read())->ToString(), gzip_magic);
}

TEST(ResolverSourceTest, StreamSourceCapability) {
    auto reader = WrapBufferAsReader(Buffer::FromString("abc"));
    auto out = OpenOutput(reader);
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(out.error().code, ErrorCode::CapabilityViolation);

    ASSERT_TRUE(reader->Close().has_value());
    auto in = OpenInput(reader);
    ASSERT_FALSE(in.has_value());
    EXPECT_EQ(in.error().code, ErrorCode::ClosedStream);

    auto null_stream = OpenInput(std::shared_ptr<Stream>());
    ASSERT_FALSE(null_stream.has_value());
    EXPECT_EQ(null_stream.error().code, ErrorCode::InvalidArgument);
}

TEST(ResolverSourceTest, BufferSourceWithCodec) {
    std::string text = "from a buffer";
    auto compressed = Compress(std::as_bytes(std::span{text.data(), text.size()}),
                               CompressionType::Gzip);
    ASSERT_TRUE(compressed.has_value());

    auto in = OpenInput(std::shared_ptr<Buffer>(*compressed), {.compression = "gzip"});
    ASSERT_TRUE(in.has_value());
    auto all = (*in)->Read();
    ASSERT_TRUE(all.has_value()) << all.error().message;
    EXPECT_EQ((*all)->ToString(), text);
}

TEST(ResolverSourceTest, BufferSourceForOutputIsFixedSize) {
    auto target = *AllocateBuffer(4);
    auto out = OpenOutput(std::shared_ptr<Buffer>(target), OpenOptions::Uncompressed());
    ASSERT_TRUE(out.has_value());
    ASSERT_TRUE((*out)->Write("abcd").has_value());
    EXPECT_EQ(target->ToString(), "abcd");
    auto overflow = (*out)->Write("e");
    ASSERT_FALSE(overflow.has_value());
    EXPECT_EQ(overflow.error().code, ErrorCode::OutOfRange);
}

TEST(ResolverSourceTest, ForeignHandleSource) {
    auto written = std::make_shared<std::string>();
    ForeignHandle handle;
    handle.write = [written](std::span<const std::byte> in) -> Result<int64_t> {
        written->append(reinterpret_cast<const char*>(in.data()), in.size());
        return static_cast<int64_t>(in.size());
    };
    auto out = OpenOutput(std::move(handle));
    ASSERT_TRUE(out.has_value());
    ASSERT_TRUE((*out)->Write("to the handle").has_value());
    EXPECT_EQ(*written, "to the handle");
}
