// SPDX-License-Identifier: MIT

// lib/stream/compressed_stream.cpp
#include "lib/stream/compressed_stream.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstring>

namespace streamkit {

namespace {

// Chunk sizes for raw reads and for the first decompression attempt.
constexpr int64_t kChunkSize = kDefaultBufferSize;
constexpr int64_t kDecompressSize = kDefaultBufferSize;

Result<void> ValidateRaw(const std::shared_ptr<Stream>& raw,
                         const std::shared_ptr<Codec>& codec, std::string_view decorator) {
    if (!raw) {
        return MakeError(ErrorCode::InvalidArgument,
                         fmt::format("{}: null raw stream", decorator));
    }
    if (!codec) {
        return MakeError(ErrorCode::InvalidCodec, fmt::format("{}: null codec", decorator));
    }
    if (!codec->SupportsStreaming()) {
        return MakeError(ErrorCode::InvalidCodec,
                         fmt::format("{}: codec '{}' has no streaming form", decorator,
                                     codec->name()));
    }
    if (raw->IsClosed()) {
        return MakeError(ErrorCode::ClosedStream,
                         fmt::format("{}: raw stream {} is closed", decorator, raw->Name()));
    }
    return {};
}

}  // namespace

Result<std::shared_ptr<Codec>> MakeStreamingCodec(CompressionType type) {
    auto codec = Codec::Create(type);
    if (!codec) return std::unexpected(codec.error());
    if (!(*codec)->SupportsStreaming()) {
        return MakeError(ErrorCode::InvalidCodec,
                         fmt::format("codec '{}' has no streaming form",
                                     CompressionTypeName(type)));
    }
    return std::shared_ptr<Codec>(std::move(*codec));
}

Result<std::shared_ptr<Codec>> MakeStreamingCodec(std::string_view name) {
    auto type = GetCompressionType(name);
    if (!type) return std::unexpected(type.error());
    return MakeStreamingCodec(*type);
}

// CompressedInputStream

CompressedInputStream::CompressedInputStream(std::shared_ptr<Stream> raw,
                                             std::shared_ptr<Codec> codec,
                                             std::shared_ptr<Decompressor> decompressor,
                                             std::shared_ptr<ResizableBuffer> compressed,
                                             std::shared_ptr<ResizableBuffer> decompressed)
    : raw_(std::move(raw)),
      codec_(std::move(codec)),
      decompressor_(std::move(decompressor)),
      compressed_(std::move(compressed)),
      decompressed_(std::move(decompressed)) {
    pool_ = compressed_->pool();
}

CompressedInputStream::~CompressedInputStream() {
    CloseFromDestructor(*this);
}

Result<std::shared_ptr<CompressedInputStream>> CompressedInputStream::Create(
    std::shared_ptr<Stream> raw, std::shared_ptr<Codec> codec,
    std::shared_ptr<MemoryPool> pool) {
    if (auto r = ValidateRaw(raw, codec, "CompressedInputStream"); !r) {
        return std::unexpected(r.error());
    }
    if (!raw->Readable()) {
        return MakeError(ErrorCode::CapabilityViolation,
                         fmt::format("CompressedInputStream: raw stream {} is not readable",
                                     raw->Name()));
    }
    auto decompressor = codec->MakeDecompressor();
    if (!decompressor) return std::unexpected(decompressor.error());

    auto compressed = AllocateResizableBuffer(0, pool);
    if (!compressed) return std::unexpected(compressed.error());
    auto decompressed = AllocateResizableBuffer(0, pool);
    if (!decompressed) return std::unexpected(decompressed.error());

    struct MakeSharedEnabler : public CompressedInputStream {
        MakeSharedEnabler(std::shared_ptr<Stream> r, std::shared_ptr<Codec> c,
                          std::shared_ptr<Decompressor> d,
                          std::shared_ptr<ResizableBuffer> in,
                          std::shared_ptr<ResizableBuffer> out)
            : CompressedInputStream(std::move(r), std::move(c), std::move(d),
                                    std::move(in), std::move(out)) {}
    };
    return std::make_shared<MakeSharedEnabler>(std::move(raw), std::move(codec),
                                               std::move(*decompressor),
                                               std::move(*compressed),
                                               std::move(*decompressed));
}

Result<std::shared_ptr<CompressedInputStream>> CompressedInputStream::Create(
    std::shared_ptr<Stream> raw, CompressionType type, std::shared_ptr<MemoryPool> pool) {
    auto codec = MakeStreamingCodec(type);
    if (!codec) return std::unexpected(codec.error());
    return Create(std::move(raw), std::move(*codec), std::move(pool));
}

Result<std::shared_ptr<CompressedInputStream>> CompressedInputStream::Create(
    std::shared_ptr<Stream> raw, std::string_view codec_name,
    std::shared_ptr<MemoryPool> pool) {
    auto codec = MakeStreamingCodec(codec_name);
    if (!codec) return std::unexpected(codec.error());
    return Create(std::move(raw), std::move(*codec), std::move(pool));
}

Result<void> CompressedInputStream::EnsureCompressedData() {
    if (compressed_pos_ < compressed_->Size()) return {};

    if (auto r = compressed_->Resize(kChunkSize, false); !r) return r;
    auto n = raw_->ReadInto(*compressed_->MutableSpan());
    if (!n) return std::unexpected(n.error());
    compressed_pos_ = 0;
    return compressed_->Resize(*n, false);
}

Result<void> CompressedInputStream::DecompressData() {
    int64_t decompress_size = kDecompressSize;
    while (true) {
        if (auto r = decompressed_->Resize(decompress_size, false); !r) return r;
        auto input = compressed_->Span().subspan(static_cast<size_t>(compressed_pos_));

        auto result = decompressor_->Decompress(input, *decompressed_->MutableSpan());
        if (!result) return std::unexpected(result.error());

        compressed_pos_ += result->bytes_read;
        if (result->bytes_read > 0) fresh_decompressor_ = false;
        if (result->bytes_written > 0 || !result->need_more_output || input.empty()) {
            decompressed_pos_ = 0;
            return decompressed_->Resize(result->bytes_written, false);
        }
        // Nothing fit: retry with a larger output buffer
        decompress_size *= 2;
    }
}

Result<bool> CompressedInputStream::RefillDecompressed() {
    // Drain what the decompressor already holds before reading more input
    if (compressed_->Size() != 0) {
        if (decompressor_->IsFinished()) {
            // Went past the end of one frame; the next one starts fresh
            if (auto r = decompressor_->Reset(); !r) return std::unexpected(r.error());
            fresh_decompressor_ = true;
        }
        if (auto r = DecompressData(); !r) return std::unexpected(r.error());
    }
    if (decompressed_pos_ == decompressed_->Size()) {
        if (auto r = EnsureCompressedData(); !r) return std::unexpected(r.error());
        if (compressed_pos_ == compressed_->Size()) {
            if (!fresh_decompressor_ && !decompressor_->IsFinished()) {
                return MakeError(ErrorCode::DecompressionError,
                                 fmt::format("{}: truncated {} stream", Name(),
                                             codec_->name()));
            }
            return false;
        }
        if (auto r = DecompressData(); !r) return std::unexpected(r.error());
    }
    return true;
}

int64_t CompressedInputStream::ReadFromDecompressed(std::span<std::byte> out) {
    auto n = std::min(static_cast<int64_t>(out.size()),
                      decompressed_->Size() - decompressed_pos_);
    if (n <= 0) return 0;
    std::memcpy(out.data(), decompressed_->Data() + decompressed_pos_, static_cast<size_t>(n));
    decompressed_pos_ += n;
    return n;
}

Result<int64_t> CompressedInputStream::DoReadInto(std::span<std::byte> out) {
    int64_t total = 0;
    bool has_data = true;
    while (has_data) {
        total += ReadFromDecompressed(out.subspan(static_cast<size_t>(total)));
        if (total == static_cast<int64_t>(out.size())) break;
        auto refilled = RefillDecompressed();
        if (!refilled) return std::unexpected(refilled.error());
        has_data = *refilled;
    }
    total_pos_ += total;
    return total;
}

Result<void> CompressedInputStream::DoClose() {
    return raw_->Close();
}

// CompressedOutputStream

CompressedOutputStream::CompressedOutputStream(std::shared_ptr<Stream> raw,
                                               std::shared_ptr<Codec> codec,
                                               std::shared_ptr<Compressor> compressor,
                                               std::shared_ptr<ResizableBuffer> compressed)
    : raw_(std::move(raw)),
      codec_(std::move(codec)),
      compressor_(std::move(compressor)),
      compressed_(std::move(compressed)) {
    pool_ = compressed_->pool();
}

CompressedOutputStream::~CompressedOutputStream() {
    CloseFromDestructor(*this);
}

Result<std::shared_ptr<CompressedOutputStream>> CompressedOutputStream::Create(
    std::shared_ptr<Stream> raw, std::shared_ptr<Codec> codec,
    std::shared_ptr<MemoryPool> pool) {
    if (auto r = ValidateRaw(raw, codec, "CompressedOutputStream"); !r) {
        return std::unexpected(r.error());
    }
    if (!raw->Writable()) {
        return MakeError(ErrorCode::CapabilityViolation,
                         fmt::format("CompressedOutputStream: raw stream {} is not writable",
                                     raw->Name()));
    }
    auto compressor = codec->MakeCompressor();
    if (!compressor) return std::unexpected(compressor.error());

    auto compressed = AllocateResizableBuffer(kChunkSize, std::move(pool));
    if (!compressed) return std::unexpected(compressed.error());

    struct MakeSharedEnabler : public CompressedOutputStream {
        MakeSharedEnabler(std::shared_ptr<Stream> r, std::shared_ptr<Codec> c,
                          std::shared_ptr<Compressor> z,
                          std::shared_ptr<ResizableBuffer> out)
            : CompressedOutputStream(std::move(r), std::move(c), std::move(z),
                                     std::move(out)) {}
    };
    return std::make_shared<MakeSharedEnabler>(std::move(raw), std::move(codec),
                                               std::move(*compressor),
                                               std::move(*compressed));
}

Result<std::shared_ptr<CompressedOutputStream>> CompressedOutputStream::Create(
    std::shared_ptr<Stream> raw, CompressionType type, std::shared_ptr<MemoryPool> pool) {
    auto codec = MakeStreamingCodec(type);
    if (!codec) return std::unexpected(codec.error());
    return Create(std::move(raw), std::move(*codec), std::move(pool));
}

Result<std::shared_ptr<CompressedOutputStream>> CompressedOutputStream::Create(
    std::shared_ptr<Stream> raw, std::string_view codec_name,
    std::shared_ptr<MemoryPool> pool) {
    auto codec = MakeStreamingCodec(codec_name);
    if (!codec) return std::unexpected(codec.error());
    return Create(std::move(raw), std::move(*codec), std::move(pool));
}

std::span<std::byte> CompressedOutputStream::Available() {
    return compressed_->MutableSpan()->subspan(static_cast<size_t>(compressed_pos_));
}

Result<void> CompressedOutputStream::FlushCompressed() {
    if (compressed_pos_ == 0) return {};
    auto n = raw_->Write(std::span<const std::byte>(compressed_->Data(),
                                                    static_cast<size_t>(compressed_pos_)));
    if (!n) return std::unexpected(n.error());
    compressed_pos_ = 0;
    return {};
}

Result<void> CompressedOutputStream::MakeRoom() {
    if (compressed_pos_ > 0) return FlushCompressed();
    return compressed_->Resize(compressed_->Size() * 2, false);
}

Result<int64_t> CompressedOutputStream::DoWrite(std::span<const std::byte> data) {
    auto input = data;
    while (!input.empty()) {
        // Bounded slices keep the output bound of block codecs near the chunk size
        auto slice = input.first(std::min(input.size(), static_cast<size_t>(kChunkSize)));
        auto result = compressor_->Compress(slice, Available());
        if (!result) return std::unexpected(result.error());

        input = input.subspan(static_cast<size_t>(result->bytes_read));
        compressed_pos_ += result->bytes_written;
        if (compressed_pos_ == compressed_->Size()) {
            if (auto r = FlushCompressed(); !r) return std::unexpected(r.error());
        }
        if (result->bytes_read == 0) {
            if (auto r = MakeRoom(); !r) return std::unexpected(r.error());
        }
    }
    total_pos_ += static_cast<int64_t>(data.size());
    return static_cast<int64_t>(data.size());
}

Result<void> CompressedOutputStream::DoFlush() {
    while (true) {
        auto result = compressor_->Flush(Available());
        if (!result) return std::unexpected(result.error());
        compressed_pos_ += result->bytes_written;
        if (!result->should_retry) break;
        if (auto r = MakeRoom(); !r) return r;
    }
    if (auto r = FlushCompressed(); !r) return r;
    return raw_->Flush();
}

Result<void> CompressedOutputStream::FinalizeCompression() {
    while (true) {
        auto result = compressor_->End(Available());
        if (!result) return std::unexpected(result.error());
        compressed_pos_ += result->bytes_written;
        if (!result->should_retry) break;
        if (auto r = MakeRoom(); !r) return r;
    }
    return FlushCompressed();
}

Result<void> CompressedOutputStream::DoClose() {
    // The raw stream is closed even if the trailer cannot be written
    auto finished = FinalizeCompression();
    auto closed = raw_->Close();
    if (!finished) return finished;
    return closed;
}

}  // namespace streamkit
