// SPDX-License-Identifier: MIT

// lib/stream/codec.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <span>
#include <string_view>

#include "lib/stream/buffer.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/memory_pool.hpp"

namespace streamkit {

/// Compression algorithms known to the library.
enum class CompressionType {
    Uncompressed,
    Bz2,
    Brotli,
    Gzip,
    Lz4,
    Snappy,
    Zstd,
};

/// Pass to Codec::Create to get the library's default level.
inline constexpr int kUseDefaultCompressionLevel = std::numeric_limits<int>::min();

/// Case-insensitive lookup ("gzip", "ZSTD", "uncompressed", ...).
/// Unknown names fail with InvalidCodec.
Result<CompressionType> GetCompressionType(std::string_view name);

/// Canonical lowercase name.
std::string_view CompressionTypeName(CompressionType type) noexcept;

/// Streaming compressor. One instance produces one compressed stream.
class Compressor {
public:
    struct CompressResult {
        int64_t bytes_read;
        int64_t bytes_written;
    };
    struct FlushResult {
        int64_t bytes_written;
        bool should_retry;  ///< Output was too small; call again with more room
    };
    struct EndResult {
        int64_t bytes_written;
        bool should_retry;
    };

    virtual ~Compressor() = default;

    /// Consume input and produce compressed output. bytes_read == 0 means the
    /// output span was too small to make progress.
    virtual Result<CompressResult> Compress(std::span<const std::byte> input,
                                            std::span<std::byte> output) = 0;

    /// Emit everything buffered so far so a reader can decode it.
    virtual Result<FlushResult> Flush(std::span<std::byte> output) = 0;

    /// Finish the stream and write the trailer.
    virtual Result<EndResult> End(std::span<std::byte> output) = 0;
};

/// Streaming decompressor.
class Decompressor {
public:
    struct DecompressResult {
        int64_t bytes_read;
        int64_t bytes_written;
        bool need_more_output;  ///< No progress possible without a larger output span
    };

    virtual ~Decompressor() = default;

    virtual Result<DecompressResult> Decompress(std::span<const std::byte> input,
                                                std::span<std::byte> output) = 0;

    /// True once the current frame or member has been fully decoded.
    virtual bool IsFinished() const noexcept = 0;

    /// Prepare to decode a new, concatenated frame.
    virtual Result<void> Reset() = 0;
};

/// Compression algorithm behind a uniform contract.
///
/// Codecs are thin wrappers over the C libraries. Construction fails with
/// InvalidCodec for Uncompressed and for algorithms that were not found at
/// build time. Streaming contexts throw std::runtime_error if the library
/// cannot allocate them.
class Codec {
public:
    virtual ~Codec() = default;

    static Result<std::unique_ptr<Codec>> Create(
        CompressionType type, int compression_level = kUseDefaultCompressionLevel);

    /// Whether `type` was compiled in.
    static bool IsAvailable(CompressionType type) noexcept;

    /// Upper bound on the compressed size of `input_len` bytes.
    virtual int64_t MaxCompressedLen(int64_t input_len) const = 0;

    /// One-shot compression. `output` must hold MaxCompressedLen(input.size())
    /// bytes. Returns the compressed size.
    virtual Result<int64_t> Compress(std::span<const std::byte> input,
                                     std::span<std::byte> output) = 0;

    /// One-shot decompression into an output sized to the decompressed
    /// length. Returns the number of bytes produced.
    virtual Result<int64_t> Decompress(std::span<const std::byte> input,
                                       std::span<std::byte> output) = 0;

    /// Streaming contexts; fail with InvalidCodec if the algorithm has none.
    virtual Result<std::shared_ptr<Compressor>> MakeCompressor() = 0;
    virtual Result<std::shared_ptr<Decompressor>> MakeDecompressor() = 0;

    /// False for one-shot-only algorithms.
    virtual bool SupportsStreaming() const noexcept { return true; }

    virtual CompressionType compression_type() const noexcept = 0;

    std::string_view name() const noexcept { return CompressionTypeName(compression_type()); }
    int compression_level() const noexcept { return compression_level_; }

protected:
    explicit Codec(int compression_level) : compression_level_(compression_level) {}

private:
    int compression_level_;
};

/// Compress `data` into a new pool buffer shrunk to the compressed size.
/// Uncompressed copies the bytes unchanged.
Result<std::shared_ptr<Buffer>> Compress(
    std::span<const std::byte> data, CompressionType type,
    std::shared_ptr<MemoryPool> pool = DefaultMemoryPool());

/// Decompress `data` whose decompressed length is known to be
/// `decompressed_size`. A length mismatch fails with DecompressionError.
Result<std::shared_ptr<Buffer>> Decompress(
    std::span<const std::byte> data, int64_t decompressed_size, CompressionType type,
    std::shared_ptr<MemoryPool> pool = DefaultMemoryPool());

}  // namespace streamkit
