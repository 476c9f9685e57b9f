// SPDX-License-Identifier: MIT

// lib/stream/resolver.hpp
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "lib/stream/buffer.hpp"
#include "lib/stream/codec.hpp"
#include "lib/stream/foreign_stream.hpp"
#include "lib/stream/stream.hpp"

namespace streamkit {

/// Anything OpenInput/OpenOutput can turn into a stream.
using Source = std::variant<std::shared_ptr<Stream>, std::filesystem::path,
                            std::shared_ptr<Buffer>, ForeignHandle>;

/// Compression value that selects the codec from a path's suffix.
inline constexpr std::string_view kDetectCompression = "detect";

/// Options for OpenInput/OpenOutput.
struct OpenOptions {
    /// Codec name, "detect" (path suffix, none for other sources) or
    /// std::nullopt for no compression.
    std::optional<std::string> compression = std::string(kDetectCompression);

    /// Add a buffering layer of this many bytes when positive.
    int64_t buffer_size = 0;

    static OpenOptions Defaults() { return {}; }
    static OpenOptions Uncompressed() { return {.compression = std::nullopt}; }
};

/// Map a path's extension to a codec: .bz2, .gz, .lz4, .zst.
std::optional<CompressionType> DetectCompression(const std::filesystem::path& path);

/// Open `source` for reading, layering buffering then decompression.
///
/// The codec is resolved before anything is opened, so an unknown or
/// unusable compression name fails with InvalidCodec without touching the
/// file system.
Result<std::shared_ptr<Stream>> OpenInput(Source source,
                                          const OpenOptions& options = OpenOptions::Defaults());

/// Open `source` for writing, layering buffering then compression. A path is
/// created or truncated.
Result<std::shared_ptr<Stream>> OpenOutput(Source source,
                                           const OpenOptions& options = OpenOptions::Defaults());

}  // namespace streamkit
