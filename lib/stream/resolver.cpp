// SPDX-License-Identifier: MIT

// lib/stream/resolver.cpp
#include "lib/stream/resolver.hpp"

#include <fmt/format.h>

#include <array>
#include <utility>

#include "lib/stream/buffered_stream.hpp"
#include "lib/stream/compressed_stream.hpp"
#include "lib/stream/file_stream.hpp"
#include "lib/stream/memory_stream.hpp"

namespace streamkit {

namespace {

enum class Direction { Input, Output };

constexpr std::array<std::pair<std::string_view, CompressionType>, 4> kSuffixes = {{
    {".bz2", CompressionType::Bz2},
    {".gz", CompressionType::Gzip},
    {".lz4", CompressionType::Lz4},
    {".zst", CompressionType::Zstd},
}};

// Null when no compression layer is wanted.
Result<std::shared_ptr<Codec>> ResolveCodec(const Source& source, const OpenOptions& options) {
    if (!options.compression) return std::shared_ptr<Codec>();

    if (*options.compression == kDetectCompression) {
        const auto* path = std::get_if<std::filesystem::path>(&source);
        if (!path) return std::shared_ptr<Codec>();
        auto type = DetectCompression(*path);
        if (!type) return std::shared_ptr<Codec>();
        return MakeStreamingCodec(*type);
    }
    return MakeStreamingCodec(*options.compression);
}

Result<std::shared_ptr<Stream>> CheckStream(std::shared_ptr<Stream> stream,
                                            Direction direction) {
    if (!stream) {
        return MakeError(ErrorCode::InvalidArgument, "null stream source");
    }
    if (stream->IsClosed()) {
        return MakeError(ErrorCode::ClosedStream,
                         fmt::format("{} source is closed", stream->Name()));
    }
    if (direction == Direction::Input && !stream->Readable()) {
        return MakeError(ErrorCode::CapabilityViolation,
                         fmt::format("{} source is not readable", stream->Name()));
    }
    if (direction == Direction::Output && !stream->Writable()) {
        return MakeError(ErrorCode::CapabilityViolation,
                         fmt::format("{} source is not writable", stream->Name()));
    }
    return stream;
}

Result<std::shared_ptr<Stream>> OpenRaw(Source source, Direction direction) {
    if (auto* stream = std::get_if<std::shared_ptr<Stream>>(&source)) {
        return CheckStream(std::move(*stream), direction);
    }
    if (auto* path = std::get_if<std::filesystem::path>(&source)) {
        auto mode = direction == Direction::Input ? FileMode::Read : FileMode::Write;
        auto file = LocalFile::Open(*path, mode);
        if (!file) return std::unexpected(file.error());
        return std::shared_ptr<Stream>(std::move(*file));
    }
    if (auto* buffer = std::get_if<std::shared_ptr<Buffer>>(&source)) {
        if (!*buffer) {
            return MakeError(ErrorCode::InvalidArgument, "null buffer source");
        }
        if (direction == Direction::Input) return WrapBufferAsReader(std::move(*buffer));
        return WrapBufferAsFixedWriter(std::move(*buffer));
    }
    auto& handle = std::get<ForeignHandle>(source);
    return WrapForeignHandle(std::move(handle), direction == Direction::Input ? "rb" : "wb");
}

Result<std::shared_ptr<Stream>> Open(Source source, const OpenOptions& options,
                                     Direction direction) {
    if (options.buffer_size < 0) {
        return MakeError(ErrorCode::InvalidArgument,
                         fmt::format("negative buffer size {}", options.buffer_size));
    }
    auto codec = ResolveCodec(source, options);
    if (!codec) return std::unexpected(codec.error());

    auto stream = OpenRaw(std::move(source), direction);
    if (!stream) return stream;

    if (options.buffer_size > 0) {
        if (direction == Direction::Input) {
            auto buffered = BufferedInputStream::Create(std::move(*stream), options.buffer_size);
            if (!buffered) return std::unexpected(buffered.error());
            stream = std::shared_ptr<Stream>(std::move(*buffered));
        } else {
            auto buffered = BufferedOutputStream::Create(std::move(*stream), options.buffer_size);
            if (!buffered) return std::unexpected(buffered.error());
            stream = std::shared_ptr<Stream>(std::move(*buffered));
        }
    }

    if (*codec) {
        if (direction == Direction::Input) {
            auto compressed = CompressedInputStream::Create(std::move(*stream), *codec);
            if (!compressed) return std::unexpected(compressed.error());
            stream = std::shared_ptr<Stream>(std::move(*compressed));
        } else {
            auto compressed = CompressedOutputStream::Create(std::move(*stream), *codec);
            if (!compressed) return std::unexpected(compressed.error());
            stream = std::shared_ptr<Stream>(std::move(*compressed));
        }
    }
    return stream;
}

}  // namespace

std::optional<CompressionType> DetectCompression(const std::filesystem::path& path) {
    auto extension = path.extension().string();
    for (const auto& [suffix, type] : kSuffixes) {
        if (extension == suffix) return type;
    }
    return std::nullopt;
}

Result<std::shared_ptr<Stream>> OpenInput(Source source, const OpenOptions& options) {
    return Open(std::move(source), options, Direction::Input);
}

Result<std::shared_ptr<Stream>> OpenOutput(Source source, const OpenOptions& options) {
    return Open(std::move(source), options, Direction::Output);
}

}  // namespace streamkit
