// SPDX-License-Identifier: MIT

// lib/stream/transfer.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <span>
#include <variant>

#include "lib/stream/error.hpp"
#include "lib/stream/memory_pool.hpp"
#include "lib/stream/stream.hpp"

namespace streamkit {

/// Tuning for Download/Upload.
struct TransferConfig {
    int64_t chunk_size = kDefaultBufferSize;  // Bytes per queued chunk
    size_t queue_capacity = 50;               // Chunks in flight before the reader blocks

    static TransferConfig Defaults() { return {}; }
};

/// What a completed transfer moved.
struct TransferStats {
    int64_t chunks = 0;
    int64_t bytes = 0;
};

/// Receives each chunk in order.
using ChunkWriter = std::function<Result<void>(std::span<const std::byte>)>;

/// Fills the span and returns the byte count; 0 means end of data.
using ChunkReader = std::function<Result<int64_t>(std::span<std::byte>)>;

/// Download destination. A path is opened and closed by the transfer; a
/// caller's stream or callback is never closed.
using DownloadSink = std::variant<std::filesystem::path, std::shared_ptr<Stream>, ChunkWriter>;

/// Upload origin, with the same ownership rules as DownloadSink.
using UploadSource = std::variant<std::filesystem::path, std::shared_ptr<Stream>, ChunkReader>;

// TransferTask - one bulk copy with read and write overlapped.
//
// The calling thread reads fixed-size chunks and queues private copies; a
// single worker thread writes them in order. A full queue blocks the reader.
// An exception thrown by the writer counts as a write error.
// The first write error stops the worker, which abandons the queue so the
// reader stops before its next enqueue. After the worker is joined a write
// error is returned as TransferFailure; a read error is returned unchanged.
class TransferTask {
public:
    TransferTask(ChunkReader produce, ChunkWriter consume,
                 TransferConfig config = TransferConfig::Defaults(),
                 std::shared_ptr<MemoryPool> pool = DefaultMemoryPool());

    TransferTask(const TransferTask&) = delete;
    TransferTask& operator=(const TransferTask&) = delete;

    /// Run to completion on the calling thread plus one worker.
    Result<TransferStats> Run();

private:
    ChunkReader produce_;
    ChunkWriter consume_;
    TransferConfig config_;
    std::shared_ptr<MemoryPool> pool_;
};

/// Copy everything readable from `stream` into `sink`.
Result<TransferStats> Download(const std::shared_ptr<Stream>& stream, DownloadSink sink,
                               const TransferConfig& config = TransferConfig::Defaults());

/// Copy everything from `source` into `stream`.
Result<TransferStats> Upload(const std::shared_ptr<Stream>& stream, UploadSource source,
                             const TransferConfig& config = TransferConfig::Defaults());

}  // namespace streamkit
