// SPDX-License-Identifier: MIT

// lib/stream/transfer.cpp
#include "lib/stream/transfer.hpp"

#include <fmt/format.h>

#include <cstring>
#include <exception>
#include <optional>
#include <thread>

#include "lib/stream/bounded_queue.hpp"
#include "lib/stream/buffer.hpp"
#include "lib/stream/file_stream.hpp"

namespace streamkit {

namespace {

using ChunkQueue = BoundedQueue<std::shared_ptr<Buffer>>;

// Joins the worker on every exit path, including exceptions thrown by
// caller-supplied callbacks on the reading side.
class WorkerGuard {
public:
    WorkerGuard(ChunkQueue& queue, std::thread& worker) : queue_(queue), worker_(worker) {}
    ~WorkerGuard() { Join(); }

    void Join() {
        if (!worker_.joinable()) return;
        queue_.Close();
        worker_.join();
    }

private:
    ChunkQueue& queue_;
    std::thread& worker_;
};

ChunkWriter WriterFor(const std::shared_ptr<Stream>& target) {
    return [target](std::span<const std::byte> chunk) -> Result<void> {
        auto n = target->Write(chunk);
        if (!n) return std::unexpected(n.error());
        return {};
    };
}

ChunkReader ReaderFor(const std::shared_ptr<Stream>& origin) {
    return [origin](std::span<std::byte> chunk) { return origin->ReadInto(chunk); };
}

// Close a stream the transfer opened itself. A transfer error wins over a
// close error.
Result<TransferStats> CloseOwned(const std::shared_ptr<Stream>& owned,
                                 Result<TransferStats> result) {
    if (!owned) return result;
    auto closed = owned->Close();
    if (!result) return result;
    if (!closed) return std::unexpected(closed.error());
    return result;
}

}  // namespace

TransferTask::TransferTask(ChunkReader produce, ChunkWriter consume, TransferConfig config,
                           std::shared_ptr<MemoryPool> pool)
    : produce_(std::move(produce)),
      consume_(std::move(consume)),
      config_(config),
      pool_(std::move(pool)) {}

Result<TransferStats> TransferTask::Run() {
    if (config_.chunk_size <= 0) {
        return MakeError(ErrorCode::InvalidArgument,
                         fmt::format("transfer chunk size must be positive, got {}",
                                     config_.chunk_size));
    }
    if (config_.queue_capacity == 0) {
        return MakeError(ErrorCode::InvalidArgument, "transfer queue capacity must be positive");
    }

    auto scratch = AllocateResizableBuffer(config_.chunk_size, pool_);
    if (!scratch) return std::unexpected(scratch.error());

    ChunkQueue queue(config_.queue_capacity);
    // Written only by the worker, read only after it is joined
    std::optional<Error> worker_error;

    std::thread worker([this, &queue, &worker_error] {
        while (auto chunk = queue.Pop()) {
            Result<void> r;
            try {
                r = consume_((*chunk)->Span());
            } catch (const std::exception& e) {
                r = MakeError(ErrorCode::TransferFailure, e.what());
            } catch (...) {
                r = MakeError(ErrorCode::TransferFailure,
                              "chunk writer threw a non-standard exception");
            }
            if (!r) {
                worker_error = std::move(r.error());
                queue.Abandon();
                return;
            }
        }
    });
    WorkerGuard guard(queue, worker);

    TransferStats stats;
    std::optional<Error> read_error;
    auto span = *(*scratch)->MutableSpan();
    while (!queue.Abandoned()) {
        auto n = produce_(span);
        if (!n) {
            read_error = std::move(n.error());
            break;
        }
        if (*n == 0) break;

        auto chunk = AllocateBuffer(*n, pool_);
        if (!chunk) {
            read_error = std::move(chunk.error());
            break;
        }
        std::memcpy(*(*chunk)->MutableData(), span.data(), static_cast<size_t>(*n));
        if (!queue.Push(std::move(*chunk))) break;

        ++stats.chunks;
        stats.bytes += *n;
    }
    guard.Join();

    if (worker_error) {
        return MakeError(ErrorCode::TransferFailure,
                         fmt::format("transfer worker failed: {}", worker_error->message),
                         worker_error->os_errno);
    }
    if (read_error) return std::unexpected(std::move(*read_error));
    return stats;
}

Result<TransferStats> Download(const std::shared_ptr<Stream>& stream, DownloadSink sink,
                               const TransferConfig& config) {
    if (!stream) return MakeError(ErrorCode::InvalidArgument, "download from null stream");
    if (!stream->Readable()) {
        return MakeError(ErrorCode::CapabilityViolation,
                         fmt::format("download from non-readable {}", stream->Name()));
    }

    std::shared_ptr<Stream> owned;
    ChunkWriter writer;
    if (auto* path = std::get_if<std::filesystem::path>(&sink)) {
        auto file = OpenLocalFile(*path, "wb");
        if (!file) return std::unexpected(file.error());
        owned = std::move(*file);
        writer = WriterFor(owned);
    } else if (auto* target = std::get_if<std::shared_ptr<Stream>>(&sink)) {
        if (!*target) return MakeError(ErrorCode::InvalidArgument, "download into null stream");
        if (!(*target)->Writable()) {
            return MakeError(ErrorCode::CapabilityViolation,
                             fmt::format("download into non-writable {}", (*target)->Name()));
        }
        writer = WriterFor(*target);
    } else {
        writer = std::move(std::get<ChunkWriter>(sink));
        if (!writer) return MakeError(ErrorCode::InvalidArgument, "empty chunk writer");
    }

    TransferTask task(ReaderFor(stream), std::move(writer), config);
    return CloseOwned(owned, task.Run());
}

Result<TransferStats> Upload(const std::shared_ptr<Stream>& stream, UploadSource source,
                             const TransferConfig& config) {
    if (!stream) return MakeError(ErrorCode::InvalidArgument, "upload into null stream");
    if (!stream->Writable()) {
        return MakeError(ErrorCode::CapabilityViolation,
                         fmt::format("upload into non-writable {}", stream->Name()));
    }

    std::shared_ptr<Stream> owned;
    ChunkReader reader;
    if (auto* path = std::get_if<std::filesystem::path>(&source)) {
        auto file = OpenLocalFile(*path, "rb");
        if (!file) return std::unexpected(file.error());
        owned = std::move(*file);
        reader = ReaderFor(owned);
    } else if (auto* origin = std::get_if<std::shared_ptr<Stream>>(&source)) {
        if (!*origin) return MakeError(ErrorCode::InvalidArgument, "upload from null stream");
        if (!(*origin)->Readable()) {
            return MakeError(ErrorCode::CapabilityViolation,
                             fmt::format("upload from non-readable {}", (*origin)->Name()));
        }
        reader = ReaderFor(*origin);
    } else {
        reader = std::move(std::get<ChunkReader>(source));
        if (!reader) return MakeError(ErrorCode::InvalidArgument, "empty chunk reader");
    }

    TransferTask task(std::move(reader), WriterFor(stream), config);
    return CloseOwned(owned, task.Run());
}

}  // namespace streamkit
