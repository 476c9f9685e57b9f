// SPDX-License-Identifier: MIT

// lib/stream/buffered_stream.hpp
#pragma once

#include <memory>
#include <span>
#include <string_view>

#include "lib/stream/buffer.hpp"
#include "lib/stream/stream.hpp"

namespace streamkit {

// BufferedInputStream - read-ahead decorator over a readable stream.
//
// Reads smaller than the buffer are served from an internal pool buffer that
// is refilled from the raw stream one buffer at a time; larger reads bypass
// it. The decorator is sequential whatever the raw stream is.
class BufferedInputStream : public Stream {
public:
    /// Fails with InvalidArgument if buffer_size <= 0 and with
    /// CapabilityViolation if `raw` is not readable.
    static Result<std::shared_ptr<BufferedInputStream>> Create(
        std::shared_ptr<Stream> raw, int64_t buffer_size = kDefaultBufferSize,
        std::shared_ptr<MemoryPool> pool = DefaultMemoryPool());

    ~BufferedInputStream() override;

    bool Readable() const noexcept override { return true; }
    bool Writable() const noexcept override { return false; }
    bool Seekable() const noexcept override { return false; }

    std::string_view Name() const noexcept override { return "BufferedInputStream"; }

    /// Look at up to `nbytes` upcoming bytes without consuming them. At most
    /// buffer_size() bytes are returned; fewer at end of stream. The span is
    /// valid until the next call on this stream.
    Result<std::span<const std::byte>> Peek(int64_t nbytes);

    /// Hand the raw stream back. Bytes still buffered are discarded. The
    /// decorator is closed afterwards.
    Result<std::shared_ptr<Stream>> Detach();

    int64_t BytesBuffered() const noexcept { return bytes_buffered_; }
    int64_t buffer_size() const noexcept { return buffer_size_; }

protected:
    BufferedInputStream(std::shared_ptr<Stream> raw, int64_t buffer_size,
                        std::shared_ptr<ResizableBuffer> buffer, int64_t position);

    Result<int64_t> DoReadInto(std::span<std::byte> out) override;
    Result<int64_t> DoTell() override { return position_; }
    Result<void> DoClose() override;

private:
    // Move unread bytes to the front and read from raw until at least
    // `wanted` bytes are buffered or raw reports end of stream.
    Result<void> Fill(int64_t wanted);
    void Consume(std::span<std::byte> out);

    std::shared_ptr<Stream> raw_;
    int64_t buffer_size_;
    std::shared_ptr<ResizableBuffer> buffer_;
    int64_t buffer_pos_ = 0;
    int64_t bytes_buffered_ = 0;
    int64_t position_;
};

// BufferedOutputStream - write-combining decorator over a writable stream.
//
// Writes accumulate in a pool buffer and go to the raw stream when the
// buffer would overflow, on Flush() and on Close(). Writes of at least a
// full buffer go straight through.
class BufferedOutputStream : public Stream {
public:
    /// Fails with InvalidArgument if buffer_size <= 0 and with
    /// CapabilityViolation if `raw` is not writable.
    static Result<std::shared_ptr<BufferedOutputStream>> Create(
        std::shared_ptr<Stream> raw, int64_t buffer_size = kDefaultBufferSize,
        std::shared_ptr<MemoryPool> pool = DefaultMemoryPool());

    ~BufferedOutputStream() override;

    bool Readable() const noexcept override { return false; }
    bool Writable() const noexcept override { return true; }
    bool Seekable() const noexcept override { return false; }

    std::string_view Name() const noexcept override { return "BufferedOutputStream"; }

    /// Write out buffered bytes and hand the raw stream back. The decorator
    /// is closed afterwards; the raw stream stays open.
    Result<std::shared_ptr<Stream>> Detach();

    int64_t BytesBuffered() const noexcept { return bytes_buffered_; }
    int64_t buffer_size() const noexcept { return buffer_size_; }

protected:
    BufferedOutputStream(std::shared_ptr<Stream> raw, int64_t buffer_size,
                         std::shared_ptr<ResizableBuffer> buffer, int64_t position);

    Result<int64_t> DoWrite(std::span<const std::byte> data) override;
    Result<int64_t> DoTell() override { return position_; }
    Result<void> DoFlush() override;
    Result<void> DoClose() override;

private:
    Result<void> FlushBuffer();

    std::shared_ptr<Stream> raw_;
    int64_t buffer_size_;
    std::shared_ptr<ResizableBuffer> buffer_;
    int64_t bytes_buffered_ = 0;
    int64_t position_;
};

}  // namespace streamkit
