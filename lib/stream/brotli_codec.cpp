// SPDX-License-Identifier: MIT

// lib/stream/brotli_codec.cpp
#include <brotli/decode.h>
#include <brotli/encode.h>

#include <fmt/format.h>

#include <stdexcept>
#include <string>

#include "lib/stream/codec_internal.hpp"

namespace streamkit::internal {

namespace {

constexpr int kBrotliDefaultLevel = 8;
constexpr int kBrotliWindowBits = BROTLI_DEFAULT_WINDOW;

const uint8_t* InPtr(std::span<const std::byte> s) {
    return reinterpret_cast<const uint8_t*>(s.data());
}

uint8_t* OutPtr(std::span<std::byte> s) {
    static uint8_t empty_output;
    return s.empty() ? &empty_output : reinterpret_cast<uint8_t*>(s.data());
}

class BrotliDecompressor : public Decompressor {
public:
    BrotliDecompressor() {
        state_ = BrotliDecoderCreateInstance(nullptr, nullptr, nullptr);
        if (!state_) {
            throw std::runtime_error("Failed to create brotli decoder instance");
        }
    }

    ~BrotliDecompressor() override {
        if (state_) BrotliDecoderDestroyInstance(state_);
    }

    Result<DecompressResult> Decompress(std::span<const std::byte> input,
                                        std::span<std::byte> output) override {
        size_t avail_in = input.size();
        const uint8_t* next_in = InPtr(input);
        size_t avail_out = output.size();
        uint8_t* next_out = OutPtr(output);

        auto ret = BrotliDecoderDecompressStream(state_, &avail_in, &next_in, &avail_out,
                                                 &next_out, nullptr);
        if (ret == BROTLI_DECODER_RESULT_ERROR) {
            return MakeError(ErrorCode::DecompressionError,
                             fmt::format("brotli decompression failed: {}",
                                         BrotliDecoderErrorString(
                                             BrotliDecoderGetErrorCode(state_))));
        }
        finished_ = (ret == BROTLI_DECODER_RESULT_SUCCESS);
        return DecompressResult{static_cast<int64_t>(input.size() - avail_in),
                                static_cast<int64_t>(output.size() - avail_out),
                                ret == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT};
    }

    bool IsFinished() const noexcept override { return finished_; }

    Result<void> Reset() override {
        if (state_) BrotliDecoderDestroyInstance(state_);
        finished_ = false;
        state_ = BrotliDecoderCreateInstance(nullptr, nullptr, nullptr);
        if (!state_) {
            return MakeError(ErrorCode::AllocationFailure,
                             "brotli decoder instance could not be recreated");
        }
        return {};
    }

private:
    BrotliDecoderState* state_ = nullptr;
    bool finished_ = false;
};

class BrotliCompressor : public Compressor {
public:
    explicit BrotliCompressor(int level) {
        state_ = BrotliEncoderCreateInstance(nullptr, nullptr, nullptr);
        if (!state_) {
            throw std::runtime_error("Failed to create brotli encoder instance");
        }
        if (!BrotliEncoderSetParameter(state_, BROTLI_PARAM_QUALITY,
                                       static_cast<uint32_t>(level)) ||
            !BrotliEncoderSetParameter(state_, BROTLI_PARAM_LGWIN,
                                       static_cast<uint32_t>(kBrotliWindowBits))) {
            BrotliEncoderDestroyInstance(state_);
            state_ = nullptr;
            throw std::runtime_error("Failed to configure brotli encoder");
        }
    }

    ~BrotliCompressor() override {
        if (state_) BrotliEncoderDestroyInstance(state_);
    }

    Result<CompressResult> Compress(std::span<const std::byte> input,
                                    std::span<std::byte> output) override {
        size_t avail_in = input.size();
        size_t avail_out = output.size();
        if (auto r = Run(BROTLI_OPERATION_PROCESS, input, avail_in, output, avail_out); !r) {
            return std::unexpected(r.error());
        }
        return CompressResult{static_cast<int64_t>(input.size() - avail_in),
                              static_cast<int64_t>(output.size() - avail_out)};
    }

    Result<FlushResult> Flush(std::span<std::byte> output) override {
        size_t avail_in = 0;
        size_t avail_out = output.size();
        if (auto r = Run(BROTLI_OPERATION_FLUSH, {}, avail_in, output, avail_out); !r) {
            return std::unexpected(r.error());
        }
        return FlushResult{static_cast<int64_t>(output.size() - avail_out),
                           BrotliEncoderHasMoreOutput(state_) == BROTLI_TRUE};
    }

    Result<EndResult> End(std::span<std::byte> output) override {
        size_t avail_in = 0;
        size_t avail_out = output.size();
        if (auto r = Run(BROTLI_OPERATION_FINISH, {}, avail_in, output, avail_out); !r) {
            return std::unexpected(r.error());
        }
        return EndResult{static_cast<int64_t>(output.size() - avail_out),
                         BrotliEncoderIsFinished(state_) != BROTLI_TRUE};
    }

private:
    Result<void> Run(BrotliEncoderOperation op, std::span<const std::byte> input,
                     size_t& avail_in, std::span<std::byte> output, size_t& avail_out) {
        const uint8_t* next_in = InPtr(input);
        uint8_t* next_out = OutPtr(output);
        if (!BrotliEncoderCompressStream(state_, op, &avail_in, &next_in, &avail_out,
                                         &next_out, nullptr)) {
            return MakeError(ErrorCode::CompressionError, "brotli compression failed");
        }
        return {};
    }

    BrotliEncoderState* state_ = nullptr;
};

class BrotliCodec : public Codec {
public:
    explicit BrotliCodec(int level) : Codec(level) {}

    int64_t MaxCompressedLen(int64_t input_len) const override {
        return static_cast<int64_t>(
            BrotliEncoderMaxCompressedSize(static_cast<size_t>(input_len)));
    }

    Result<int64_t> Compress(std::span<const std::byte> input,
                             std::span<std::byte> output) override {
        size_t out_size = output.size();
        if (!BrotliEncoderCompress(compression_level(), kBrotliWindowBits,
                                   BROTLI_DEFAULT_MODE, input.size(), InPtr(input),
                                   &out_size, OutPtr(output))) {
            return MakeError(ErrorCode::CompressionError, "brotli compression failed");
        }
        return static_cast<int64_t>(out_size);
    }

    Result<int64_t> Decompress(std::span<const std::byte> input,
                               std::span<std::byte> output) override {
        size_t out_size = output.size();
        if (BrotliDecoderDecompress(input.size(), InPtr(input), &out_size, OutPtr(output)) !=
            BROTLI_DECODER_RESULT_SUCCESS) {
            return MakeError(ErrorCode::DecompressionError,
                             "brotli decompression failed (corrupt or truncated input?)");
        }
        return static_cast<int64_t>(out_size);
    }

    Result<std::shared_ptr<Compressor>> MakeCompressor() override {
        return MakeContext<BrotliCompressor, Compressor>(compression_level());
    }

    Result<std::shared_ptr<Decompressor>> MakeDecompressor() override {
        return MakeContext<BrotliDecompressor, Decompressor>();
    }

    CompressionType compression_type() const noexcept override {
        return CompressionType::Brotli;
    }
};

}  // namespace

Result<std::unique_ptr<Codec>> MakeBrotliCodec(int compression_level) {
    if (compression_level == kUseDefaultCompressionLevel) {
        compression_level = kBrotliDefaultLevel;
    }
    if (compression_level < BROTLI_MIN_QUALITY || compression_level > BROTLI_MAX_QUALITY) {
        return MakeError(ErrorCode::InvalidArgument,
                         fmt::format("brotli compression level {} outside [{}, {}]",
                                     compression_level, BROTLI_MIN_QUALITY,
                                     BROTLI_MAX_QUALITY));
    }
    return std::make_unique<BrotliCodec>(compression_level);
}

}  // namespace streamkit::internal
