// SPDX-License-Identifier: MIT

// lib/stream/zstd_codec.cpp
#include <zstd.h>

#include <fmt/format.h>

#include <stdexcept>
#include <string>

#include "lib/stream/codec_internal.hpp"

namespace streamkit::internal {

namespace {

constexpr int kZstdDefaultLevel = 1;

std::unexpected<Error> ZstdError(ErrorCode code, std::string_view what, size_t ret) {
    return MakeError(code, fmt::format("zstd {}: {}", what, ZSTD_getErrorName(ret)));
}

// ZstdStreamDecompressor - incremental ZSTD_DStream decoding.
//
// The DStream continues into the next frame on its own, so concatenated
// frames decode without a Reset().
class ZstdStreamDecompressor : public Decompressor {
public:
    ZstdStreamDecompressor() {
        dstream_ = ZSTD_createDStream();
        if (!dstream_) {
            throw std::runtime_error("Failed to create ZSTD_DStream");
        }
        size_t init_result = ZSTD_initDStream(dstream_);
        if (ZSTD_isError(init_result)) {
            ZSTD_freeDStream(dstream_);
            dstream_ = nullptr;
            throw std::runtime_error(
                std::string("Failed to initialize ZSTD_DStream: ") +
                ZSTD_getErrorName(init_result));
        }
    }

    ~ZstdStreamDecompressor() override {
        if (dstream_) ZSTD_freeDStream(dstream_);
    }

    Result<DecompressResult> Decompress(std::span<const std::byte> input,
                                        std::span<std::byte> output) override {
        ZSTD_inBuffer in_buf{input.data(), input.size(), 0};
        ZSTD_outBuffer out_buf{output.data(), output.size(), 0};

        size_t ret = ZSTD_decompressStream(dstream_, &out_buf, &in_buf);
        if (ZSTD_isError(ret)) {
            return ZstdError(ErrorCode::DecompressionError, "decompression failed", ret);
        }
        // 0 means a frame was completely decoded and flushed
        finished_ = (ret == 0);
        return DecompressResult{static_cast<int64_t>(in_buf.pos),
                                static_cast<int64_t>(out_buf.pos),
                                in_buf.pos == 0 && out_buf.pos == 0};
    }

    bool IsFinished() const noexcept override { return finished_; }

    Result<void> Reset() override {
        finished_ = false;
        size_t ret = ZSTD_initDStream(dstream_);
        if (ZSTD_isError(ret)) {
            return ZstdError(ErrorCode::DecompressionError, "reset failed", ret);
        }
        return {};
    }

private:
    ZSTD_DStream* dstream_ = nullptr;
    bool finished_ = false;
};

class ZstdStreamCompressor : public Compressor {
public:
    explicit ZstdStreamCompressor(int level) {
        cstream_ = ZSTD_createCStream();
        if (!cstream_) {
            throw std::runtime_error("Failed to create ZSTD_CStream");
        }
        size_t init_result = ZSTD_initCStream(cstream_, level);
        if (ZSTD_isError(init_result)) {
            ZSTD_freeCStream(cstream_);
            cstream_ = nullptr;
            throw std::runtime_error(
                std::string("Failed to initialize ZSTD_CStream: ") +
                ZSTD_getErrorName(init_result));
        }
    }

    ~ZstdStreamCompressor() override {
        if (cstream_) ZSTD_freeCStream(cstream_);
    }

    Result<CompressResult> Compress(std::span<const std::byte> input,
                                    std::span<std::byte> output) override {
        ZSTD_inBuffer in_buf{input.data(), input.size(), 0};
        ZSTD_outBuffer out_buf{output.data(), output.size(), 0};

        size_t ret = ZSTD_compressStream(cstream_, &out_buf, &in_buf);
        if (ZSTD_isError(ret)) {
            return ZstdError(ErrorCode::CompressionError, "compression failed", ret);
        }
        return CompressResult{static_cast<int64_t>(in_buf.pos),
                              static_cast<int64_t>(out_buf.pos)};
    }

    Result<FlushResult> Flush(std::span<std::byte> output) override {
        ZSTD_outBuffer out_buf{output.data(), output.size(), 0};
        size_t ret = ZSTD_flushStream(cstream_, &out_buf);
        if (ZSTD_isError(ret)) {
            return ZstdError(ErrorCode::CompressionError, "flush failed", ret);
        }
        return FlushResult{static_cast<int64_t>(out_buf.pos), ret > 0};
    }

    Result<EndResult> End(std::span<std::byte> output) override {
        ZSTD_outBuffer out_buf{output.data(), output.size(), 0};
        size_t ret = ZSTD_endStream(cstream_, &out_buf);
        if (ZSTD_isError(ret)) {
            return ZstdError(ErrorCode::CompressionError, "end failed", ret);
        }
        return EndResult{static_cast<int64_t>(out_buf.pos), ret > 0};
    }

private:
    ZSTD_CStream* cstream_ = nullptr;
};

class ZstdCodec : public Codec {
public:
    explicit ZstdCodec(int level) : Codec(level) {}

    int64_t MaxCompressedLen(int64_t input_len) const override {
        return static_cast<int64_t>(ZSTD_compressBound(static_cast<size_t>(input_len)));
    }

    Result<int64_t> Compress(std::span<const std::byte> input,
                             std::span<std::byte> output) override {
        size_t ret = ZSTD_compress(output.data(), output.size(), input.data(), input.size(),
                                   compression_level());
        if (ZSTD_isError(ret)) {
            return ZstdError(ErrorCode::CompressionError, "compression failed", ret);
        }
        return static_cast<int64_t>(ret);
    }

    Result<int64_t> Decompress(std::span<const std::byte> input,
                               std::span<std::byte> output) override {
        // Some zstd versions reject a null destination even with zero capacity
        static std::byte empty_output;
        void* dst = output.empty() ? &empty_output : output.data();

        size_t ret = ZSTD_decompress(dst, output.size(), input.data(), input.size());
        if (ZSTD_isError(ret)) {
            return ZstdError(ErrorCode::DecompressionError, "decompression failed", ret);
        }
        return static_cast<int64_t>(ret);
    }

    Result<std::shared_ptr<Compressor>> MakeCompressor() override {
        return MakeContext<ZstdStreamCompressor, Compressor>(compression_level());
    }

    Result<std::shared_ptr<Decompressor>> MakeDecompressor() override {
        return MakeContext<ZstdStreamDecompressor, Decompressor>();
    }

    CompressionType compression_type() const noexcept override {
        return CompressionType::Zstd;
    }
};

}  // namespace

Result<std::unique_ptr<Codec>> MakeZstdCodec(int compression_level) {
    if (compression_level == kUseDefaultCompressionLevel) {
        compression_level = kZstdDefaultLevel;
    }
    if (compression_level < ZSTD_minCLevel() || compression_level > ZSTD_maxCLevel()) {
        return MakeError(ErrorCode::InvalidArgument,
                         fmt::format("zstd compression level {} outside [{}, {}]",
                                     compression_level, ZSTD_minCLevel(), ZSTD_maxCLevel()));
    }
    return std::make_unique<ZstdCodec>(compression_level);
}

}  // namespace streamkit::internal
