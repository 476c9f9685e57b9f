// SPDX-License-Identifier: MIT

// lib/stream/lz4_codec.cpp
#include <lz4frame.h>

#include <fmt/format.h>

#include <cstring>
#include <stdexcept>
#include <string>

#include "lib/stream/codec_internal.hpp"

namespace streamkit::internal {

namespace {

// Levels above 2 select the HC compressor inside LZ4F
constexpr int kLz4MaxLevel = 12;

std::unexpected<Error> Lz4Error(ErrorCode code, std::string_view what, LZ4F_errorCode_t ret) {
    return MakeError(code, fmt::format("lz4 {}: {}", what, LZ4F_getErrorName(ret)));
}

LZ4F_preferences_t DefaultPreferences(int level) {
    LZ4F_preferences_t prefs;
    std::memset(&prefs, 0, sizeof(prefs));
    prefs.compressionLevel = level;
    return prefs;
}

class Lz4FrameDecompressor : public Decompressor {
public:
    Lz4FrameDecompressor() {
        auto ret = LZ4F_createDecompressionContext(&ctx_, LZ4F_VERSION);
        if (LZ4F_isError(ret)) {
            throw std::runtime_error(std::string("Failed to create LZ4 decompression context: ") +
                                     LZ4F_getErrorName(ret));
        }
    }

    ~Lz4FrameDecompressor() override {
        if (ctx_) LZ4F_freeDecompressionContext(ctx_);
    }

    Result<DecompressResult> Decompress(std::span<const std::byte> input,
                                        std::span<std::byte> output) override {
        size_t src_size = input.size();
        size_t dst_size = output.size();
        auto ret = LZ4F_decompress(ctx_, output.data(), &dst_size, input.data(), &src_size,
                                   nullptr);
        if (LZ4F_isError(ret)) {
            return Lz4Error(ErrorCode::DecompressionError, "decompression failed", ret);
        }
        // 0 means the frame is fully decoded and flushed
        finished_ = (ret == 0);
        return DecompressResult{static_cast<int64_t>(src_size),
                                static_cast<int64_t>(dst_size),
                                src_size == 0 && dst_size == 0};
    }

    bool IsFinished() const noexcept override { return finished_; }

    Result<void> Reset() override {
        finished_ = false;
        if (ctx_) LZ4F_freeDecompressionContext(ctx_);
        ctx_ = nullptr;
        auto ret = LZ4F_createDecompressionContext(&ctx_, LZ4F_VERSION);
        if (LZ4F_isError(ret)) {
            return Lz4Error(ErrorCode::DecompressionError, "reset failed", ret);
        }
        return {};
    }

private:
    LZ4F_dctx* ctx_ = nullptr;
    bool finished_ = false;
};

// Lz4FrameCompressor - LZ4 frame output.
//
// The frame header is written lazily by the first call that has room for
// it. LZ4F refuses to compress into an output smaller than its bound, so
// a call with too little room reports zero progress and the caller grows
// its output.
class Lz4FrameCompressor : public Compressor {
public:
    explicit Lz4FrameCompressor(int level) : prefs_(DefaultPreferences(level)) {
        auto ret = LZ4F_createCompressionContext(&ctx_, LZ4F_VERSION);
        if (LZ4F_isError(ret)) {
            throw std::runtime_error(std::string("Failed to create LZ4 compression context: ") +
                                     LZ4F_getErrorName(ret));
        }
    }

    ~Lz4FrameCompressor() override {
        if (ctx_) LZ4F_freeCompressionContext(ctx_);
    }

    Result<CompressResult> Compress(std::span<const std::byte> input,
                                    std::span<std::byte> output) override {
        int64_t header = 0;
        if (!begun_) {
            if (output.size() < LZ4F_HEADER_SIZE_MAX) return CompressResult{0, 0};
            auto r = Begin(output);
            if (!r) return std::unexpected(r.error());
            header = *r;
            output = output.subspan(static_cast<size_t>(header));
        }
        if (output.size() < LZ4F_compressBound(input.size(), &prefs_)) {
            return CompressResult{0, header};
        }
        auto ret = LZ4F_compressUpdate(ctx_, output.data(), output.size(), input.data(),
                                       input.size(), nullptr);
        if (LZ4F_isError(ret)) {
            return Lz4Error(ErrorCode::CompressionError, "compression failed", ret);
        }
        return CompressResult{static_cast<int64_t>(input.size()),
                              header + static_cast<int64_t>(ret)};
    }

    Result<FlushResult> Flush(std::span<std::byte> output) override {
        int64_t header = 0;
        if (!begun_) {
            if (output.size() < LZ4F_HEADER_SIZE_MAX) return FlushResult{0, true};
            auto r = Begin(output);
            if (!r) return std::unexpected(r.error());
            header = *r;
            output = output.subspan(static_cast<size_t>(header));
        }
        if (output.size() < LZ4F_compressBound(0, &prefs_)) {
            return FlushResult{header, true};
        }
        auto ret = LZ4F_flush(ctx_, output.data(), output.size(), nullptr);
        if (LZ4F_isError(ret)) {
            return Lz4Error(ErrorCode::CompressionError, "flush failed", ret);
        }
        return FlushResult{header + static_cast<int64_t>(ret), false};
    }

    Result<EndResult> End(std::span<std::byte> output) override {
        int64_t header = 0;
        if (!begun_) {
            if (output.size() < LZ4F_HEADER_SIZE_MAX) return EndResult{0, true};
            auto r = Begin(output);
            if (!r) return std::unexpected(r.error());
            header = *r;
            output = output.subspan(static_cast<size_t>(header));
        }
        if (output.size() < LZ4F_compressBound(0, &prefs_)) {
            return EndResult{header, true};
        }
        auto ret = LZ4F_compressEnd(ctx_, output.data(), output.size(), nullptr);
        if (LZ4F_isError(ret)) {
            return Lz4Error(ErrorCode::CompressionError, "end failed", ret);
        }
        return EndResult{header + static_cast<int64_t>(ret), false};
    }

private:
    Result<int64_t> Begin(std::span<std::byte> output) {
        auto ret = LZ4F_compressBegin(ctx_, output.data(), output.size(), &prefs_);
        if (LZ4F_isError(ret)) {
            return Lz4Error(ErrorCode::CompressionError, "frame header failed", ret);
        }
        begun_ = true;
        return static_cast<int64_t>(ret);
    }

    LZ4F_preferences_t prefs_;
    LZ4F_cctx* ctx_ = nullptr;
    bool begun_ = false;
};

class Lz4FrameCodec : public Codec {
public:
    explicit Lz4FrameCodec(int level) : Codec(level), prefs_(DefaultPreferences(level)) {}

    int64_t MaxCompressedLen(int64_t input_len) const override {
        return static_cast<int64_t>(
            LZ4F_compressFrameBound(static_cast<size_t>(input_len), &prefs_));
    }

    Result<int64_t> Compress(std::span<const std::byte> input,
                             std::span<std::byte> output) override {
        auto ret = LZ4F_compressFrame(output.data(), output.size(), input.data(), input.size(),
                                      &prefs_);
        if (LZ4F_isError(ret)) {
            return Lz4Error(ErrorCode::CompressionError, "compression failed", ret);
        }
        return static_cast<int64_t>(ret);
    }

    Result<int64_t> Decompress(std::span<const std::byte> input,
                               std::span<std::byte> output) override {
        Lz4FrameDecompressor decompressor;
        int64_t total_read = 0;
        int64_t total_written = 0;
        while (true) {
            auto r = decompressor.Decompress(input.subspan(static_cast<size_t>(total_read)),
                                             output.subspan(static_cast<size_t>(total_written)));
            if (!r) return std::unexpected(r.error());
            total_read += r->bytes_read;
            total_written += r->bytes_written;
            if (decompressor.IsFinished()) break;
            if (r->need_more_output || total_read == static_cast<int64_t>(input.size())) {
                return MakeError(ErrorCode::DecompressionError,
                                 "lz4 frame truncated or larger than the output buffer");
            }
        }
        return total_written;
    }

    Result<std::shared_ptr<Compressor>> MakeCompressor() override {
        return MakeContext<Lz4FrameCompressor, Compressor>(compression_level());
    }

    Result<std::shared_ptr<Decompressor>> MakeDecompressor() override {
        return MakeContext<Lz4FrameDecompressor, Decompressor>();
    }

    CompressionType compression_type() const noexcept override {
        return CompressionType::Lz4;
    }

private:
    LZ4F_preferences_t prefs_;
};

}  // namespace

Result<std::unique_ptr<Codec>> MakeLz4Codec(int compression_level) {
    if (compression_level == kUseDefaultCompressionLevel) {
        compression_level = 0;  // LZ4F fast mode
    }
    if (compression_level < 0 || compression_level > kLz4MaxLevel) {
        return MakeError(ErrorCode::InvalidArgument,
                         fmt::format("lz4 compression level {} outside [0, {}]",
                                     compression_level, kLz4MaxLevel));
    }
    return std::make_unique<Lz4FrameCodec>(compression_level);
}

}  // namespace streamkit::internal
