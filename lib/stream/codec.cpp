// SPDX-License-Identifier: MIT

// lib/stream/codec.cpp
#include "lib/stream/codec.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <string>
#include <utility>

#include "lib/stream/codec_internal.hpp"

namespace streamkit {

namespace {

constexpr std::array<std::pair<std::string_view, CompressionType>, 7> kCompressionNames = {{
    {"uncompressed", CompressionType::Uncompressed},
    {"bz2", CompressionType::Bz2},
    {"brotli", CompressionType::Brotli},
    {"gzip", CompressionType::Gzip},
    {"lz4", CompressionType::Lz4},
    {"snappy", CompressionType::Snappy},
    {"zstd", CompressionType::Zstd},
}};

// Uncompressed data passes through the one-shot helpers as a plain copy.
Result<std::shared_ptr<Buffer>> CopyToBuffer(std::span<const std::byte> data,
                                             std::shared_ptr<MemoryPool> pool) {
    auto out = AllocateBuffer(static_cast<int64_t>(data.size()), std::move(pool));
    if (!out) return std::unexpected(out.error());
    if (!data.empty()) std::memcpy(*(*out)->MutableData(), data.data(), data.size());
    return std::move(*out);
}

}  // namespace

Result<CompressionType> GetCompressionType(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& [entry_name, type] : kCompressionNames) {
        if (lower == entry_name) return type;
    }
    return MakeError(ErrorCode::InvalidCodec,
                     fmt::format("unrecognized compression type '{}'", name));
}

std::string_view CompressionTypeName(CompressionType type) noexcept {
    for (const auto& [name, entry_type] : kCompressionNames) {
        if (entry_type == type) return name;
    }
    return "unknown";
}

bool Codec::IsAvailable(CompressionType type) noexcept {
    switch (type) {
        case CompressionType::Uncompressed:
            return false;
        case CompressionType::Zstd:
        case CompressionType::Gzip:
            return true;
        case CompressionType::Bz2:
#ifdef STREAMKIT_WITH_BZ2
            return true;
#else
            return false;
#endif
        case CompressionType::Brotli:
#ifdef STREAMKIT_WITH_BROTLI
            return true;
#else
            return false;
#endif
        case CompressionType::Lz4:
#ifdef STREAMKIT_WITH_LZ4
            return true;
#else
            return false;
#endif
        case CompressionType::Snappy:
#ifdef STREAMKIT_WITH_SNAPPY
            return true;
#else
            return false;
#endif
    }
    return false;
}

Result<std::unique_ptr<Codec>> Codec::Create(CompressionType type, int compression_level) {
    if (type == CompressionType::Uncompressed) {
        return MakeError(ErrorCode::InvalidCodec,
                         "'uncompressed' does not name a compression codec");
    }
    if (!IsAvailable(type)) {
        return MakeError(ErrorCode::InvalidCodec,
                         fmt::format("support for codec '{}' not built",
                                     CompressionTypeName(type)));
    }

    switch (type) {
        case CompressionType::Zstd:
            return internal::MakeZstdCodec(compression_level);
        case CompressionType::Gzip:
            return internal::MakeGzipCodec(compression_level);
#ifdef STREAMKIT_WITH_BZ2
        case CompressionType::Bz2:
            return internal::MakeBz2Codec(compression_level);
#endif
#ifdef STREAMKIT_WITH_BROTLI
        case CompressionType::Brotli:
            return internal::MakeBrotliCodec(compression_level);
#endif
#ifdef STREAMKIT_WITH_LZ4
        case CompressionType::Lz4:
            return internal::MakeLz4Codec(compression_level);
#endif
#ifdef STREAMKIT_WITH_SNAPPY
        case CompressionType::Snappy:
            return internal::MakeSnappyCodec(compression_level);
#endif
        default:
            break;
    }
    return MakeError(ErrorCode::InvalidCodec,
                     fmt::format("support for codec '{}' not built",
                                 CompressionTypeName(type)));
}

Result<std::shared_ptr<Buffer>> Compress(std::span<const std::byte> data,
                                         CompressionType type,
                                         std::shared_ptr<MemoryPool> pool) {
    if (type == CompressionType::Uncompressed) return CopyToBuffer(data, std::move(pool));

    auto codec = Codec::Create(type);
    if (!codec) return std::unexpected(codec.error());

    auto bound = (*codec)->MaxCompressedLen(static_cast<int64_t>(data.size()));
    auto out = AllocateResizableBuffer(bound, std::move(pool));
    if (!out) return std::unexpected(out.error());

    auto n = (*codec)->Compress(data, *(*out)->MutableSpan());
    if (!n) return std::unexpected(n.error());
    if (auto r = (*out)->Resize(*n); !r) return std::unexpected(r.error());
    return std::shared_ptr<Buffer>(std::move(*out));
}

Result<std::shared_ptr<Buffer>> Decompress(std::span<const std::byte> data,
                                           int64_t decompressed_size,
                                           CompressionType type,
                                           std::shared_ptr<MemoryPool> pool) {
    if (decompressed_size < 0) {
        return MakeError(ErrorCode::InvalidArgument,
                         fmt::format("negative decompressed size {}", decompressed_size));
    }
    if (type == CompressionType::Uncompressed) {
        if (static_cast<int64_t>(data.size()) != decompressed_size) {
            return MakeError(ErrorCode::DecompressionError,
                             fmt::format("uncompressed: got {} bytes, expected {}",
                                         data.size(), decompressed_size));
        }
        return CopyToBuffer(data, std::move(pool));
    }

    auto codec = Codec::Create(type);
    if (!codec) return std::unexpected(codec.error());

    auto out = AllocateBuffer(decompressed_size, std::move(pool));
    if (!out) return std::unexpected(out.error());

    auto n = (*codec)->Decompress(data, *(*out)->MutableSpan());
    if (!n) return std::unexpected(n.error());
    if (*n != decompressed_size) {
        return MakeError(ErrorCode::DecompressionError,
                         fmt::format("{}: decompressed {} bytes, expected {}",
                                     (*codec)->name(), *n, decompressed_size));
    }
    return std::move(*out);
}

}  // namespace streamkit
