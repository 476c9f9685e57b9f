// SPDX-License-Identifier: MIT

// lib/stream/snappy_codec.cpp
#include <snappy.h>

#include <fmt/format.h>

#include "lib/stream/codec_internal.hpp"

namespace streamkit::internal {

namespace {

// Snappy has no levels and no streaming form; only the one-shot calls work.
class SnappyCodec : public Codec {
public:
    SnappyCodec() : Codec(kUseDefaultCompressionLevel) {}

    int64_t MaxCompressedLen(int64_t input_len) const override {
        return static_cast<int64_t>(
            snappy::MaxCompressedLength(static_cast<size_t>(input_len)));
    }

    Result<int64_t> Compress(std::span<const std::byte> input,
                             std::span<std::byte> output) override {
        auto bound = snappy::MaxCompressedLength(input.size());
        if (output.size() < bound) {
            return MakeError(ErrorCode::CompressionError,
                             fmt::format("snappy output buffer of {} bytes below bound {}",
                                         output.size(), bound));
        }
        size_t out_len = 0;
        snappy::RawCompress(reinterpret_cast<const char*>(input.data()), input.size(),
                            reinterpret_cast<char*>(output.data()), &out_len);
        return static_cast<int64_t>(out_len);
    }

    Result<int64_t> Decompress(std::span<const std::byte> input,
                               std::span<std::byte> output) override {
        const char* in = reinterpret_cast<const char*>(input.data());
        size_t decompressed_len = 0;
        if (!snappy::GetUncompressedLength(in, input.size(), &decompressed_len)) {
            return MakeError(ErrorCode::DecompressionError, "snappy: corrupt input header");
        }
        if (decompressed_len > output.size()) {
            return MakeError(ErrorCode::DecompressionError,
                             fmt::format("snappy: {} decompressed bytes exceed output of {}",
                                         decompressed_len, output.size()));
        }
        if (!snappy::RawUncompress(in, input.size(), reinterpret_cast<char*>(output.data()))) {
            return MakeError(ErrorCode::DecompressionError, "snappy: corrupt input");
        }
        return static_cast<int64_t>(decompressed_len);
    }

    Result<std::shared_ptr<Compressor>> MakeCompressor() override {
        return NoStreamingForm(CompressionType::Snappy);
    }

    Result<std::shared_ptr<Decompressor>> MakeDecompressor() override {
        return NoStreamingForm(CompressionType::Snappy);
    }

    bool SupportsStreaming() const noexcept override { return false; }

    CompressionType compression_type() const noexcept override {
        return CompressionType::Snappy;
    }
};

}  // namespace

Result<std::unique_ptr<Codec>> MakeSnappyCodec(int compression_level) {
    if (compression_level != kUseDefaultCompressionLevel) {
        return MakeError(ErrorCode::InvalidArgument,
                         "snappy does not support compression levels");
    }
    return std::make_unique<SnappyCodec>();
}

}  // namespace streamkit::internal
