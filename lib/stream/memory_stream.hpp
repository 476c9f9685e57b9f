// SPDX-License-Identifier: MIT

// lib/stream/memory_stream.hpp
#pragma once

#include <memory>
#include <string_view>

#include "lib/stream/buffer.hpp"
#include "lib/stream/stream.hpp"

namespace streamkit {

// BufferReader - random-access readable stream over a Buffer.
//
// Reads return zero-copy slices of the wrapped buffer. A null buffer reads
// as empty.
class BufferReader : public Stream {
public:
    explicit BufferReader(std::shared_ptr<Buffer> buffer);

    bool Readable() const noexcept override { return true; }
    bool Writable() const noexcept override { return false; }
    bool Seekable() const noexcept override { return true; }

    std::string_view Name() const noexcept override { return "BufferReader"; }

    const std::shared_ptr<Buffer>& buffer() const noexcept { return buffer_; }

protected:
    Result<std::shared_ptr<Buffer>> DoRead(int64_t nbytes) override;
    Result<int64_t> DoReadInto(std::span<std::byte> out) override;
    Result<std::shared_ptr<Buffer>> DoReadAt(int64_t position, int64_t nbytes) override;
    Result<int64_t> DoSeek(int64_t position) override;
    Result<int64_t> DoTell() override { return position_; }
    Result<int64_t> DoSize() override { return buffer_->Size(); }
    Result<void> DoClose() override;

private:
    std::shared_ptr<Buffer> buffer_;
    int64_t position_ = 0;
};

// FixedSizeBufferWriter - seekable writer into a pre-allocated mutable Buffer.
//
// Never grows: a write that would pass the end fails with OutOfRange and
// writes nothing.
class FixedSizeBufferWriter : public Stream {
public:
    /// Fails with CapabilityViolation if `buffer` is immutable.
    static Result<std::shared_ptr<FixedSizeBufferWriter>> Create(
        std::shared_ptr<Buffer> buffer);

    bool Readable() const noexcept override { return false; }
    bool Writable() const noexcept override { return true; }
    bool Seekable() const noexcept override { return true; }

    std::string_view Name() const noexcept override { return "FixedSizeBufferWriter"; }

protected:
    FixedSizeBufferWriter(std::shared_ptr<Buffer> buffer, std::span<std::byte> memory);

    Result<int64_t> DoWrite(std::span<const std::byte> data) override;
    Result<int64_t> DoSeek(int64_t position) override;
    Result<int64_t> DoTell() override { return position_; }
    Result<int64_t> DoSize() override { return static_cast<int64_t>(memory_.size()); }
    Result<void> DoClose() override;

private:
    std::shared_ptr<Buffer> buffer_;
    std::span<std::byte> memory_;
    int64_t position_ = 0;
};

// BufferOutputStream - growable in-memory writer.
//
// Appends into a pool-allocated ResizableBuffer with geometric growth.
// GetValue() finalizes the stream and hands the bytes over; the stream is
// closed afterwards.
class BufferOutputStream : public Stream {
public:
    static Result<std::shared_ptr<BufferOutputStream>> Create(
        int64_t initial_capacity = 4096,
        std::shared_ptr<MemoryPool> pool = DefaultMemoryPool());

    bool Readable() const noexcept override { return false; }
    bool Writable() const noexcept override { return true; }
    bool Seekable() const noexcept override { return false; }

    std::string_view Name() const noexcept override { return "BufferOutputStream"; }

    /// Close the stream and return everything written, shrunk to size.
    Result<std::shared_ptr<Buffer>> GetValue();

    /// Bytes written so far.
    int64_t length() const noexcept { return position_; }

protected:
    explicit BufferOutputStream(std::shared_ptr<ResizableBuffer> buffer);

    Result<int64_t> DoWrite(std::span<const std::byte> data) override;
    Result<int64_t> DoTell() override { return position_; }
    Result<void> DoClose() override;

private:
    Result<void> Grow(int64_t needed);

    std::shared_ptr<ResizableBuffer> buffer_;
    int64_t position_ = 0;
};

/// Random-access reader over `buffer`.
std::shared_ptr<Stream> WrapBufferAsReader(std::shared_ptr<Buffer> buffer);

/// Fixed-size writer over a mutable `buffer`.
Result<std::shared_ptr<Stream>> WrapBufferAsFixedWriter(std::shared_ptr<Buffer> buffer);

/// Growable in-memory writer.
Result<std::shared_ptr<BufferOutputStream>> GrowableBufferWriter(
    std::shared_ptr<MemoryPool> pool = DefaultMemoryPool());

}  // namespace streamkit
