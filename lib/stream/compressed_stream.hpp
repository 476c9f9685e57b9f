// SPDX-License-Identifier: MIT

// lib/stream/compressed_stream.hpp
#pragma once

#include <memory>
#include <string_view>

#include "lib/stream/buffer.hpp"
#include "lib/stream/codec.hpp"
#include "lib/stream/stream.hpp"

namespace streamkit {

/// Resolve a codec the compressed decorators can drive. Fails with
/// InvalidCodec for unknown names, "uncompressed", codecs that were not built
/// in and codecs without a streaming form.
Result<std::shared_ptr<Codec>> MakeStreamingCodec(CompressionType type);
Result<std::shared_ptr<Codec>> MakeStreamingCodec(std::string_view name);

// CompressedInputStream - transparent decompression of a readable stream.
//
// Concatenated frames (or gzip members) decode as one stream. End of the raw
// stream inside a frame fails with DecompressionError. Tell() counts
// decompressed bytes.
class CompressedInputStream : public Stream {
public:
    static Result<std::shared_ptr<CompressedInputStream>> Create(
        std::shared_ptr<Stream> raw, std::shared_ptr<Codec> codec,
        std::shared_ptr<MemoryPool> pool = DefaultMemoryPool());
    static Result<std::shared_ptr<CompressedInputStream>> Create(
        std::shared_ptr<Stream> raw, CompressionType type,
        std::shared_ptr<MemoryPool> pool = DefaultMemoryPool());
    static Result<std::shared_ptr<CompressedInputStream>> Create(
        std::shared_ptr<Stream> raw, std::string_view codec_name,
        std::shared_ptr<MemoryPool> pool = DefaultMemoryPool());

    ~CompressedInputStream() override;

    bool Readable() const noexcept override { return true; }
    bool Writable() const noexcept override { return false; }
    bool Seekable() const noexcept override { return false; }

    std::string_view Name() const noexcept override { return "CompressedInputStream"; }

    const std::shared_ptr<Codec>& codec() const noexcept { return codec_; }
    const std::shared_ptr<Stream>& raw() const noexcept { return raw_; }

protected:
    CompressedInputStream(std::shared_ptr<Stream> raw, std::shared_ptr<Codec> codec,
                          std::shared_ptr<Decompressor> decompressor,
                          std::shared_ptr<ResizableBuffer> compressed,
                          std::shared_ptr<ResizableBuffer> decompressed);

    Result<int64_t> DoReadInto(std::span<std::byte> out) override;
    Result<int64_t> DoTell() override { return total_pos_; }
    Result<void> DoClose() override;

private:
    // Read the next compressed chunk once the current one is used up.
    Result<void> EnsureCompressedData();
    // Run the decompressor over pending compressed bytes, growing the output
    // until it makes progress.
    Result<void> DecompressData();
    // Returns false at the clean end of the stream.
    Result<bool> RefillDecompressed();
    int64_t ReadFromDecompressed(std::span<std::byte> out);

    std::shared_ptr<Stream> raw_;
    std::shared_ptr<Codec> codec_;
    std::shared_ptr<Decompressor> decompressor_;

    std::shared_ptr<ResizableBuffer> compressed_;
    int64_t compressed_pos_ = 0;
    std::shared_ptr<ResizableBuffer> decompressed_;
    int64_t decompressed_pos_ = 0;

    // True until the current decompressor has been fed any bytes
    bool fresh_decompressor_ = true;
    int64_t total_pos_ = 0;
};

// CompressedOutputStream - transparent compression onto a writable stream.
//
// Flush() makes everything written so far decodable and flushes the raw
// stream. Close() writes the codec trailer and closes the raw stream.
// Tell() counts uncompressed bytes.
class CompressedOutputStream : public Stream {
public:
    static Result<std::shared_ptr<CompressedOutputStream>> Create(
        std::shared_ptr<Stream> raw, std::shared_ptr<Codec> codec,
        std::shared_ptr<MemoryPool> pool = DefaultMemoryPool());
    static Result<std::shared_ptr<CompressedOutputStream>> Create(
        std::shared_ptr<Stream> raw, CompressionType type,
        std::shared_ptr<MemoryPool> pool = DefaultMemoryPool());
    static Result<std::shared_ptr<CompressedOutputStream>> Create(
        std::shared_ptr<Stream> raw, std::string_view codec_name,
        std::shared_ptr<MemoryPool> pool = DefaultMemoryPool());

    ~CompressedOutputStream() override;

    bool Readable() const noexcept override { return false; }
    bool Writable() const noexcept override { return true; }
    bool Seekable() const noexcept override { return false; }

    std::string_view Name() const noexcept override { return "CompressedOutputStream"; }

    const std::shared_ptr<Codec>& codec() const noexcept { return codec_; }
    const std::shared_ptr<Stream>& raw() const noexcept { return raw_; }

protected:
    CompressedOutputStream(std::shared_ptr<Stream> raw, std::shared_ptr<Codec> codec,
                           std::shared_ptr<Compressor> compressor,
                           std::shared_ptr<ResizableBuffer> compressed);

    Result<int64_t> DoWrite(std::span<const std::byte> data) override;
    Result<int64_t> DoTell() override { return total_pos_; }
    Result<void> DoFlush() override;
    Result<void> DoClose() override;

private:
    // Write the compressed bytes produced so far to the raw stream.
    Result<void> FlushCompressed();
    // Make room after a call reported no progress: drain if anything is
    // pending, else double the buffer.
    Result<void> MakeRoom();
    Result<void> FinalizeCompression();
    std::span<std::byte> Available();

    std::shared_ptr<Stream> raw_;
    std::shared_ptr<Codec> codec_;
    std::shared_ptr<Compressor> compressor_;

    std::shared_ptr<ResizableBuffer> compressed_;
    int64_t compressed_pos_ = 0;
    int64_t total_pos_ = 0;
};

}  // namespace streamkit
