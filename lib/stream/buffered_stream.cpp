// SPDX-License-Identifier: MIT

// lib/stream/buffered_stream.cpp
#include "lib/stream/buffered_stream.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstring>

namespace streamkit {

namespace {

Result<void> ValidateRaw(const std::shared_ptr<Stream>& raw, int64_t buffer_size,
                         std::string_view decorator) {
    if (!raw) {
        return MakeError(ErrorCode::InvalidArgument,
                         fmt::format("{}: null raw stream", decorator));
    }
    if (buffer_size <= 0) {
        return MakeError(ErrorCode::InvalidArgument,
                         fmt::format("{}: buffer size must be positive, got {}",
                                     decorator, buffer_size));
    }
    if (raw->IsClosed()) {
        return MakeError(ErrorCode::ClosedStream,
                         fmt::format("{}: raw stream {} is closed", decorator, raw->Name()));
    }
    return {};
}

// Decorators count positions from wherever the raw stream currently is.
// A raw stream that cannot report a position starts at zero.
Result<int64_t> StartingPosition(Stream& raw) {
    auto pos = raw.Tell();
    if (pos) return pos;
    if (pos.error().code == ErrorCode::CapabilityViolation) return 0;
    return pos;
}

}  // namespace

// BufferedInputStream

BufferedInputStream::BufferedInputStream(std::shared_ptr<Stream> raw, int64_t buffer_size,
                                         std::shared_ptr<ResizableBuffer> buffer,
                                         int64_t position)
    : raw_(std::move(raw)),
      buffer_size_(buffer_size),
      buffer_(std::move(buffer)),
      position_(position) {
    pool_ = buffer_->pool();
}

BufferedInputStream::~BufferedInputStream() {
    CloseFromDestructor(*this);
}

Result<std::shared_ptr<BufferedInputStream>> BufferedInputStream::Create(
    std::shared_ptr<Stream> raw, int64_t buffer_size, std::shared_ptr<MemoryPool> pool) {
    if (auto r = ValidateRaw(raw, buffer_size, "BufferedInputStream"); !r) {
        return std::unexpected(r.error());
    }
    if (!raw->Readable()) {
        return MakeError(ErrorCode::CapabilityViolation,
                         fmt::format("BufferedInputStream: raw stream {} is not readable",
                                     raw->Name()));
    }
    auto position = StartingPosition(*raw);
    if (!position) return std::unexpected(position.error());

    auto buffer = AllocateResizableBuffer(buffer_size, std::move(pool));
    if (!buffer) return std::unexpected(buffer.error());

    struct MakeSharedEnabler : public BufferedInputStream {
        MakeSharedEnabler(std::shared_ptr<Stream> r, int64_t size,
                          std::shared_ptr<ResizableBuffer> b, int64_t pos)
            : BufferedInputStream(std::move(r), size, std::move(b), pos) {}
    };
    return std::make_shared<MakeSharedEnabler>(std::move(raw), buffer_size,
                                               std::move(*buffer), *position);
}

Result<void> BufferedInputStream::Fill(int64_t wanted) {
    if (bytes_buffered_ >= wanted) return {};

    std::byte* base = *buffer_->MutableData();
    if (buffer_pos_ > 0 && bytes_buffered_ > 0) {
        std::memmove(base, base + buffer_pos_, static_cast<size_t>(bytes_buffered_));
    }
    buffer_pos_ = 0;

    while (bytes_buffered_ < wanted) {
        auto n = raw_->ReadInto({base + bytes_buffered_,
                                 static_cast<size_t>(buffer_size_ - bytes_buffered_)});
        if (!n) return std::unexpected(n.error());
        if (*n == 0) break;
        bytes_buffered_ += *n;
    }
    return {};
}

void BufferedInputStream::Consume(std::span<std::byte> out) {
    auto n = std::min(static_cast<int64_t>(out.size()), bytes_buffered_);
    if (n == 0) return;
    std::memcpy(out.data(), buffer_->Data() + buffer_pos_, static_cast<size_t>(n));
    buffer_pos_ += n;
    bytes_buffered_ -= n;
    position_ += n;
}

Result<int64_t> BufferedInputStream::DoReadInto(std::span<std::byte> out) {
    int64_t before = position_;
    Consume(out);
    auto rest = out.subspan(static_cast<size_t>(position_ - before));
    if (rest.empty()) return position_ - before;

    if (static_cast<int64_t>(rest.size()) >= buffer_size_) {
        // Large read: skip the copy through the buffer
        auto n = raw_->ReadInto(rest);
        if (!n) return std::unexpected(n.error());
        position_ += *n;
    } else {
        if (auto r = Fill(buffer_size_); !r) return std::unexpected(r.error());
        Consume(rest);
    }
    return position_ - before;
}

Result<std::span<const std::byte>> BufferedInputStream::Peek(int64_t nbytes) {
    if (auto r = CheckOpen(); !r) return std::unexpected(r.error());
    if (nbytes < 0) {
        return MakeError(ErrorCode::InvalidArgument,
                         fmt::format("{}: negative peek count {}", Name(), nbytes));
    }
    nbytes = std::min(nbytes, buffer_size_);
    if (auto r = Fill(nbytes); !r) return std::unexpected(r.error());

    auto n = std::min(nbytes, bytes_buffered_);
    return std::span<const std::byte>(buffer_->Data() + buffer_pos_, static_cast<size_t>(n));
}

Result<std::shared_ptr<Stream>> BufferedInputStream::Detach() {
    if (auto r = CheckOpen(); !r) return std::unexpected(r.error());
    MarkClosed();
    bytes_buffered_ = 0;
    buffer_pos_ = 0;
    return std::move(raw_);
}

Result<void> BufferedInputStream::DoClose() {
    bytes_buffered_ = 0;
    buffer_pos_ = 0;
    return raw_->Close();
}

// BufferedOutputStream

BufferedOutputStream::BufferedOutputStream(std::shared_ptr<Stream> raw, int64_t buffer_size,
                                           std::shared_ptr<ResizableBuffer> buffer,
                                           int64_t position)
    : raw_(std::move(raw)),
      buffer_size_(buffer_size),
      buffer_(std::move(buffer)),
      position_(position) {
    pool_ = buffer_->pool();
}

BufferedOutputStream::~BufferedOutputStream() {
    CloseFromDestructor(*this);
}

Result<std::shared_ptr<BufferedOutputStream>> BufferedOutputStream::Create(
    std::shared_ptr<Stream> raw, int64_t buffer_size, std::shared_ptr<MemoryPool> pool) {
    if (auto r = ValidateRaw(raw, buffer_size, "BufferedOutputStream"); !r) {
        return std::unexpected(r.error());
    }
    if (!raw->Writable()) {
        return MakeError(ErrorCode::CapabilityViolation,
                         fmt::format("BufferedOutputStream: raw stream {} is not writable",
                                     raw->Name()));
    }
    auto position = StartingPosition(*raw);
    if (!position) return std::unexpected(position.error());

    auto buffer = AllocateResizableBuffer(buffer_size, std::move(pool));
    if (!buffer) return std::unexpected(buffer.error());

    struct MakeSharedEnabler : public BufferedOutputStream {
        MakeSharedEnabler(std::shared_ptr<Stream> r, int64_t size,
                          std::shared_ptr<ResizableBuffer> b, int64_t pos)
            : BufferedOutputStream(std::move(r), size, std::move(b), pos) {}
    };
    return std::make_shared<MakeSharedEnabler>(std::move(raw), buffer_size,
                                               std::move(*buffer), *position);
}

Result<void> BufferedOutputStream::FlushBuffer() {
    if (bytes_buffered_ == 0) return {};
    auto n = raw_->Write(std::span<const std::byte>(buffer_->Data(),
                                                    static_cast<size_t>(bytes_buffered_)));
    if (!n) return std::unexpected(n.error());
    bytes_buffered_ = 0;
    return {};
}

Result<int64_t> BufferedOutputStream::DoWrite(std::span<const std::byte> data) {
    auto n = static_cast<int64_t>(data.size());
    if (bytes_buffered_ + n > buffer_size_) {
        if (auto r = FlushBuffer(); !r) return std::unexpected(r.error());
    }

    if (n >= buffer_size_) {
        auto written = raw_->Write(data);
        if (!written) return written;
    } else {
        std::memcpy(*buffer_->MutableData() + bytes_buffered_, data.data(), data.size());
        bytes_buffered_ += n;
    }
    position_ += n;
    return n;
}

Result<void> BufferedOutputStream::DoFlush() {
    if (auto r = FlushBuffer(); !r) return r;
    return raw_->Flush();
}

Result<std::shared_ptr<Stream>> BufferedOutputStream::Detach() {
    if (auto r = CheckOpen(); !r) return std::unexpected(r.error());
    if (auto r = FlushBuffer(); !r) return std::unexpected(r.error());
    MarkClosed();
    return std::move(raw_);
}

Result<void> BufferedOutputStream::DoClose() {
    // The raw stream is closed even if the final write fails
    auto flushed = FlushBuffer();
    auto closed = raw_->Close();
    if (!flushed) return flushed;
    return closed;
}

}  // namespace streamkit
