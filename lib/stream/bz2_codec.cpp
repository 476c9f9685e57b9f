// SPDX-License-Identifier: MIT

// lib/stream/bz2_codec.cpp
#include <bzlib.h>

#include <fmt/format.h>

#include <algorithm>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>

#include "lib/stream/codec_internal.hpp"

namespace streamkit::internal {

namespace {

constexpr int kBz2DefaultLevel = 9;
constexpr size_t kMaxBz2Chunk = std::numeric_limits<unsigned int>::max();

std::string_view Bz2ErrorName(int ret) {
    switch (ret) {
        case BZ_CONFIG_ERROR: return "BZ_CONFIG_ERROR";
        case BZ_PARAM_ERROR: return "BZ_PARAM_ERROR";
        case BZ_MEM_ERROR: return "BZ_MEM_ERROR";
        case BZ_DATA_ERROR: return "BZ_DATA_ERROR";
        case BZ_DATA_ERROR_MAGIC: return "BZ_DATA_ERROR_MAGIC";
        case BZ_IO_ERROR: return "BZ_IO_ERROR";
        case BZ_UNEXPECTED_EOF: return "BZ_UNEXPECTED_EOF";
        case BZ_OUTBUFF_FULL: return "BZ_OUTBUFF_FULL";
        case BZ_SEQUENCE_ERROR: return "BZ_SEQUENCE_ERROR";
        default: return "unknown error";
    }
}

std::unexpected<Error> Bz2Error(ErrorCode code, std::string_view what, int ret) {
    return MakeError(code, fmt::format("bz2 {}: {} ({})", what, Bz2ErrorName(ret), ret));
}

// The buffer-to-buffer helpers reject null pointers even for empty ranges
char empty_range;

char* InPtr(std::span<const std::byte> s) {
    if (s.empty()) return &empty_range;
    return reinterpret_cast<char*>(const_cast<std::byte*>(s.data()));
}

char* OutPtr(std::span<std::byte> s) {
    if (s.empty()) return &empty_range;
    return reinterpret_cast<char*>(s.data());
}

unsigned int Clamp(size_t n) {
    return static_cast<unsigned int>(std::min(n, kMaxBz2Chunk));
}

class Bz2Decompressor : public Decompressor {
public:
    Bz2Decompressor() { Init(); }

    ~Bz2Decompressor() override {
        if (initialized_) BZ2_bzDecompressEnd(&stream_);
    }

    Result<DecompressResult> Decompress(std::span<const std::byte> input,
                                        std::span<std::byte> output) override {
        stream_.next_in = InPtr(input);
        stream_.avail_in = Clamp(input.size());
        stream_.next_out = OutPtr(output);
        stream_.avail_out = Clamp(output.size());
        unsigned int in_before = stream_.avail_in;
        unsigned int out_before = stream_.avail_out;

        int ret = BZ2_bzDecompress(&stream_);
        if (ret != BZ_OK && ret != BZ_STREAM_END) {
            return Bz2Error(ErrorCode::DecompressionError, "decompression failed", ret);
        }
        finished_ = (ret == BZ_STREAM_END);
        int64_t bytes_read = in_before - stream_.avail_in;
        int64_t bytes_written = out_before - stream_.avail_out;
        return DecompressResult{bytes_read, bytes_written,
                                !finished_ && bytes_read == 0 && bytes_written == 0};
    }

    bool IsFinished() const noexcept override { return finished_; }

    Result<void> Reset() override {
        if (initialized_) BZ2_bzDecompressEnd(&stream_);
        initialized_ = false;
        finished_ = false;
        std::memset(&stream_, 0, sizeof(stream_));
        int ret = BZ2_bzDecompressInit(&stream_, 0, 0);
        if (ret != BZ_OK) {
            return Bz2Error(ErrorCode::DecompressionError, "reset failed", ret);
        }
        initialized_ = true;
        return {};
    }

private:
    void Init() {
        std::memset(&stream_, 0, sizeof(stream_));
        int ret = BZ2_bzDecompressInit(&stream_, 0, 0);
        if (ret != BZ_OK) {
            throw std::runtime_error(std::string("Failed to initialize bz2 decompressor: ") +
                                     std::string(Bz2ErrorName(ret)));
        }
        initialized_ = true;
    }

    bz_stream stream_;
    bool initialized_ = false;
    bool finished_ = false;
};

class Bz2Compressor : public Compressor {
public:
    explicit Bz2Compressor(int level) {
        std::memset(&stream_, 0, sizeof(stream_));
        int ret = BZ2_bzCompressInit(&stream_, level, 0, 0);
        if (ret != BZ_OK) {
            throw std::runtime_error(std::string("Failed to initialize bz2 compressor: ") +
                                     std::string(Bz2ErrorName(ret)));
        }
    }

    ~Bz2Compressor() override { BZ2_bzCompressEnd(&stream_); }

    Result<CompressResult> Compress(std::span<const std::byte> input,
                                    std::span<std::byte> output) override {
        stream_.next_in = InPtr(input);
        stream_.avail_in = Clamp(input.size());
        stream_.next_out = OutPtr(output);
        stream_.avail_out = Clamp(output.size());
        unsigned int in_before = stream_.avail_in;
        unsigned int out_before = stream_.avail_out;

        int ret = BZ2_bzCompress(&stream_, BZ_RUN);
        if (ret != BZ_RUN_OK) {
            return Bz2Error(ErrorCode::CompressionError, "compression failed", ret);
        }
        return CompressResult{static_cast<int64_t>(in_before - stream_.avail_in),
                              static_cast<int64_t>(out_before - stream_.avail_out)};
    }

    Result<FlushResult> Flush(std::span<std::byte> output) override {
        stream_.next_in = nullptr;
        stream_.avail_in = 0;
        stream_.next_out = OutPtr(output);
        stream_.avail_out = Clamp(output.size());
        unsigned int out_before = stream_.avail_out;

        int ret = BZ2_bzCompress(&stream_, BZ_FLUSH);
        if (ret != BZ_RUN_OK && ret != BZ_FLUSH_OK) {
            return Bz2Error(ErrorCode::CompressionError, "flush failed", ret);
        }
        return FlushResult{static_cast<int64_t>(out_before - stream_.avail_out),
                           ret == BZ_FLUSH_OK};
    }

    Result<EndResult> End(std::span<std::byte> output) override {
        stream_.next_in = nullptr;
        stream_.avail_in = 0;
        stream_.next_out = OutPtr(output);
        stream_.avail_out = Clamp(output.size());
        unsigned int out_before = stream_.avail_out;

        int ret = BZ2_bzCompress(&stream_, BZ_FINISH);
        if (ret != BZ_STREAM_END && ret != BZ_FINISH_OK) {
            return Bz2Error(ErrorCode::CompressionError, "end failed", ret);
        }
        return EndResult{static_cast<int64_t>(out_before - stream_.avail_out),
                         ret == BZ_FINISH_OK};
    }

private:
    bz_stream stream_;
};

class Bz2Codec : public Codec {
public:
    explicit Bz2Codec(int level) : Codec(level) {}

    int64_t MaxCompressedLen(int64_t input_len) const override {
        // bzip2 documents 1% + 600 bytes as the worst case
        return input_len + input_len / 100 + 600;
    }

    Result<int64_t> Compress(std::span<const std::byte> input,
                             std::span<std::byte> output) override {
        if (input.size() > kMaxBz2Chunk || output.size() > kMaxBz2Chunk) {
            return MakeError(ErrorCode::CompressionError,
                             "bz2 one-shot compression limited to 4 GiB");
        }
        unsigned int out_len = Clamp(output.size());
        int ret = BZ2_bzBuffToBuffCompress(OutPtr(output), &out_len, InPtr(input),
                                           Clamp(input.size()), compression_level(), 0, 0);
        if (ret != BZ_OK) {
            return Bz2Error(ErrorCode::CompressionError, "compression failed", ret);
        }
        return static_cast<int64_t>(out_len);
    }

    Result<int64_t> Decompress(std::span<const std::byte> input,
                               std::span<std::byte> output) override {
        if (input.size() > kMaxBz2Chunk || output.size() > kMaxBz2Chunk) {
            return MakeError(ErrorCode::DecompressionError,
                             "bz2 one-shot decompression limited to 4 GiB");
        }
        unsigned int out_len = Clamp(output.size());
        int ret = BZ2_bzBuffToBuffDecompress(OutPtr(output), &out_len, InPtr(input),
                                             Clamp(input.size()), 0, 0);
        if (ret != BZ_OK) {
            return Bz2Error(ErrorCode::DecompressionError, "decompression failed", ret);
        }
        return static_cast<int64_t>(out_len);
    }

    Result<std::shared_ptr<Compressor>> MakeCompressor() override {
        return MakeContext<Bz2Compressor, Compressor>(compression_level());
    }

    Result<std::shared_ptr<Decompressor>> MakeDecompressor() override {
        return MakeContext<Bz2Decompressor, Decompressor>();
    }

    CompressionType compression_type() const noexcept override {
        return CompressionType::Bz2;
    }
};

}  // namespace

Result<std::unique_ptr<Codec>> MakeBz2Codec(int compression_level) {
    if (compression_level == kUseDefaultCompressionLevel) {
        compression_level = kBz2DefaultLevel;
    }
    if (compression_level < 1 || compression_level > 9) {
        return MakeError(ErrorCode::InvalidArgument,
                         fmt::format("bz2 compression level {} outside [1, 9]",
                                     compression_level));
    }
    return std::make_unique<Bz2Codec>(compression_level);
}

}  // namespace streamkit::internal
