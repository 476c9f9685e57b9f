// SPDX-License-Identifier: MIT

// lib/stream/gzip_codec.cpp
#include <zlib.h>

#include <fmt/format.h>

#include <algorithm>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>

#include "lib/stream/codec_internal.hpp"

namespace streamkit::internal {

namespace {

// Window bits for gzip framing on output; +32 on input lets inflate
// auto-detect gzip or zlib headers.
constexpr int kGzipWindowBits = 15 + 16;
constexpr int kDetectWindowBits = 15 + 32;
constexpr int kMemLevel = 8;

// zlib counts in uInt; larger spans are fed in pieces.
constexpr size_t kMaxZlibChunk = std::numeric_limits<uInt>::max();

std::unexpected<Error> ZlibError(ErrorCode code, std::string_view what, const z_stream& s,
                                 int ret) {
    return MakeError(code, fmt::format("zlib {}: {} ({})", what,
                                       s.msg ? s.msg : "no message", ret));
}

Bytef* InPtr(std::span<const std::byte> s) {
    return reinterpret_cast<Bytef*>(const_cast<std::byte*>(s.data()));
}

// deflate and inflate reject a null next_out even when avail_out is 0
Bytef* OutPtr(std::span<std::byte> s) {
    static Bytef empty_output;
    return s.empty() ? &empty_output : reinterpret_cast<Bytef*>(s.data());
}

uInt Clamp(size_t n) {
    return static_cast<uInt>(std::min(n, kMaxZlibChunk));
}

class GzipDecompressor : public Decompressor {
public:
    GzipDecompressor() {
        std::memset(&stream_, 0, sizeof(stream_));
        int ret = inflateInit2(&stream_, kDetectWindowBits);
        if (ret != Z_OK) {
            throw std::runtime_error(
                std::string("Failed to initialize zlib inflate: ") +
                (stream_.msg ? stream_.msg : std::to_string(ret)));
        }
    }

    ~GzipDecompressor() override { inflateEnd(&stream_); }

    Result<DecompressResult> Decompress(std::span<const std::byte> input,
                                        std::span<std::byte> output) override {
        stream_.next_in = InPtr(input);
        stream_.avail_in = Clamp(input.size());
        stream_.next_out = OutPtr(output);
        stream_.avail_out = Clamp(output.size());
        uInt in_before = stream_.avail_in;
        uInt out_before = stream_.avail_out;

        int ret = inflate(&stream_, Z_SYNC_FLUSH);
        if (ret == Z_DATA_ERROR || ret == Z_STREAM_ERROR || ret == Z_MEM_ERROR) {
            return ZlibError(ErrorCode::DecompressionError, "inflate failed", stream_, ret);
        }
        if (ret == Z_NEED_DICT) {
            return ZlibError(ErrorCode::DecompressionError,
                             "inflate failed (need preset dictionary)", stream_, ret);
        }
        finished_ = (ret == Z_STREAM_END);
        if (ret == Z_BUF_ERROR) {
            // No progress was possible
            return DecompressResult{0, 0, true};
        }
        return DecompressResult{static_cast<int64_t>(in_before - stream_.avail_in),
                                static_cast<int64_t>(out_before - stream_.avail_out),
                                false};
    }

    bool IsFinished() const noexcept override { return finished_; }

    Result<void> Reset() override {
        finished_ = false;
        int ret = inflateReset(&stream_);
        if (ret != Z_OK) {
            return ZlibError(ErrorCode::DecompressionError, "inflate reset failed", stream_, ret);
        }
        return {};
    }

private:
    z_stream stream_;
    bool finished_ = false;
};

class GzipCompressor : public Compressor {
public:
    explicit GzipCompressor(int level) {
        std::memset(&stream_, 0, sizeof(stream_));
        int ret = deflateInit2(&stream_, level, Z_DEFLATED, kGzipWindowBits, kMemLevel,
                               Z_DEFAULT_STRATEGY);
        if (ret != Z_OK) {
            throw std::runtime_error(
                std::string("Failed to initialize zlib deflate: ") +
                (stream_.msg ? stream_.msg : std::to_string(ret)));
        }
    }

    ~GzipCompressor() override { deflateEnd(&stream_); }

    Result<CompressResult> Compress(std::span<const std::byte> input,
                                    std::span<std::byte> output) override {
        stream_.next_in = InPtr(input);
        stream_.avail_in = Clamp(input.size());
        stream_.next_out = OutPtr(output);
        stream_.avail_out = Clamp(output.size());
        uInt in_before = stream_.avail_in;
        uInt out_before = stream_.avail_out;

        int ret = deflate(&stream_, Z_NO_FLUSH);
        if (ret == Z_STREAM_ERROR) {
            return ZlibError(ErrorCode::CompressionError, "deflate failed", stream_, ret);
        }
        if (ret == Z_BUF_ERROR) {
            return CompressResult{0, 0};
        }
        return CompressResult{static_cast<int64_t>(in_before - stream_.avail_in),
                              static_cast<int64_t>(out_before - stream_.avail_out)};
    }

    Result<FlushResult> Flush(std::span<std::byte> output) override {
        stream_.avail_in = 0;
        stream_.next_out = OutPtr(output);
        stream_.avail_out = Clamp(output.size());
        uInt out_before = stream_.avail_out;

        int ret = deflate(&stream_, Z_SYNC_FLUSH);
        if (ret == Z_STREAM_ERROR) {
            return ZlibError(ErrorCode::CompressionError, "deflate flush failed", stream_, ret);
        }
        int64_t written = 0;
        if (ret == Z_OK) written = out_before - stream_.avail_out;
        // A full output span means there may be more to flush
        return FlushResult{written, stream_.avail_out == 0};
    }

    Result<EndResult> End(std::span<std::byte> output) override {
        stream_.avail_in = 0;
        stream_.next_out = OutPtr(output);
        stream_.avail_out = Clamp(output.size());
        uInt out_before = stream_.avail_out;

        int ret = deflate(&stream_, Z_FINISH);
        if (ret == Z_STREAM_ERROR) {
            return ZlibError(ErrorCode::CompressionError, "deflate end failed", stream_, ret);
        }
        int64_t written = out_before - stream_.avail_out;
        if (ret == Z_STREAM_END) return EndResult{written, false};
        return EndResult{written, true};
    }

private:
    z_stream stream_;
};

class GzipCodec : public Codec {
public:
    explicit GzipCodec(int level) : Codec(level) {}

    int64_t MaxCompressedLen(int64_t input_len) const override {
        // compressBound covers the 6-byte zlib wrapper; gzip's is 18
        return static_cast<int64_t>(compressBound(static_cast<uLong>(input_len))) + 12;
    }

    Result<int64_t> Compress(std::span<const std::byte> input,
                             std::span<std::byte> output) override {
        z_stream s;
        std::memset(&s, 0, sizeof(s));
        int ret = deflateInit2(&s, compression_level(), Z_DEFLATED, kGzipWindowBits,
                               kMemLevel, Z_DEFAULT_STRATEGY);
        if (ret != Z_OK) {
            return ZlibError(ErrorCode::CompressionError, "deflate init failed", s, ret);
        }
        s.next_in = InPtr(input);
        s.avail_in = Clamp(input.size());
        s.next_out = OutPtr(output);
        s.avail_out = Clamp(output.size());
        ret = deflate(&s, Z_FINISH);
        int64_t written = static_cast<int64_t>(s.total_out);
        if (ret != Z_STREAM_END) {
            auto err = ZlibError(ErrorCode::CompressionError,
                                 "deflate did not finish (output too small?)", s, ret);
            deflateEnd(&s);
            return err;
        }
        deflateEnd(&s);
        return written;
    }

    Result<int64_t> Decompress(std::span<const std::byte> input,
                               std::span<std::byte> output) override {
        z_stream s;
        std::memset(&s, 0, sizeof(s));
        int ret = inflateInit2(&s, kDetectWindowBits);
        if (ret != Z_OK) {
            return ZlibError(ErrorCode::DecompressionError, "inflate init failed", s, ret);
        }
        s.next_in = InPtr(input);
        s.avail_in = Clamp(input.size());
        s.next_out = OutPtr(output);
        s.avail_out = Clamp(output.size());
        ret = inflate(&s, Z_FINISH);
        int64_t written = static_cast<int64_t>(s.total_out);
        if (ret != Z_STREAM_END) {
            auto err = ZlibError(ErrorCode::DecompressionError,
                                 "inflate failed (corrupt or truncated input?)", s, ret);
            inflateEnd(&s);
            return err;
        }
        inflateEnd(&s);
        return written;
    }

    Result<std::shared_ptr<Compressor>> MakeCompressor() override {
        return MakeContext<GzipCompressor, Compressor>(compression_level());
    }

    Result<std::shared_ptr<Decompressor>> MakeDecompressor() override {
        return MakeContext<GzipDecompressor, Decompressor>();
    }

    CompressionType compression_type() const noexcept override {
        return CompressionType::Gzip;
    }
};

}  // namespace

Result<std::unique_ptr<Codec>> MakeGzipCodec(int compression_level) {
    if (compression_level == kUseDefaultCompressionLevel) {
        compression_level = Z_DEFAULT_COMPRESSION;
    }
    if (compression_level != Z_DEFAULT_COMPRESSION &&
        (compression_level < 0 || compression_level > 9)) {
        return MakeError(ErrorCode::InvalidArgument,
                         fmt::format("gzip compression level {} outside [0, 9]",
                                     compression_level));
    }
    return std::make_unique<GzipCodec>(compression_level);
}

}  // namespace streamkit::internal
