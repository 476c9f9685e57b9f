// SPDX-License-Identifier: MIT

// lib/stream/memory_stream.cpp
#include "lib/stream/memory_stream.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstring>

namespace streamkit {

// BufferReader

BufferReader::BufferReader(std::shared_ptr<Buffer> buffer)
    : buffer_(buffer ? std::move(buffer) : Buffer::FromString({})) {}

Result<std::shared_ptr<Buffer>> BufferReader::DoRead(int64_t nbytes) {
    auto slice = SliceBuffer(buffer_, position_, nbytes);
    if (!slice) return slice;
    position_ += (*slice)->Size();
    return slice;
}

Result<int64_t> BufferReader::DoReadInto(std::span<std::byte> out) {
    int64_t n = std::min(buffer_->Size() - position_, static_cast<int64_t>(out.size()));
    if (n > 0) {
        std::memcpy(out.data(), buffer_->Data() + position_, static_cast<size_t>(n));
        position_ += n;
    }
    return std::max<int64_t>(n, 0);
}

Result<std::shared_ptr<Buffer>> BufferReader::DoReadAt(int64_t position, int64_t nbytes) {
    return SliceBuffer(buffer_, position, nbytes);
}

Result<int64_t> BufferReader::DoSeek(int64_t position) {
    if (position > buffer_->Size()) {
        return MakeError(ErrorCode::OutOfRange,
                         fmt::format("{}: seek to {} beyond buffer size {}",
                                     Name(), position, buffer_->Size()));
    }
    position_ = position;
    return position_;
}

Result<void> BufferReader::DoClose() {
    return {};
}

// FixedSizeBufferWriter

FixedSizeBufferWriter::FixedSizeBufferWriter(std::shared_ptr<Buffer> buffer,
                                             std::span<std::byte> memory)
    : buffer_(std::move(buffer)), memory_(memory) {}

Result<std::shared_ptr<FixedSizeBufferWriter>> FixedSizeBufferWriter::Create(
    std::shared_ptr<Buffer> buffer) {
    if (!buffer) {
        return MakeError(ErrorCode::InvalidArgument, "FixedSizeBufferWriter: null buffer");
    }
    auto memory = buffer->MutableSpan();
    if (!memory) {
        return MakeError(ErrorCode::CapabilityViolation,
                         "FixedSizeBufferWriter: buffer is read-only");
    }

    struct MakeSharedEnabler : public FixedSizeBufferWriter {
        MakeSharedEnabler(std::shared_ptr<Buffer> b, std::span<std::byte> m)
            : FixedSizeBufferWriter(std::move(b), m) {}
    };
    return std::make_shared<MakeSharedEnabler>(std::move(buffer), *memory);
}

Result<int64_t> FixedSizeBufferWriter::DoWrite(std::span<const std::byte> data) {
    auto n = static_cast<int64_t>(data.size());
    auto capacity = static_cast<int64_t>(memory_.size());
    if (n > capacity - position_) {
        return MakeError(ErrorCode::OutOfRange,
                         fmt::format("{}: write of {} bytes at {} exceeds buffer size {}",
                                     Name(), n, position_, capacity));
    }
    std::memcpy(memory_.data() + position_, data.data(), data.size());
    position_ += n;
    return n;
}

Result<int64_t> FixedSizeBufferWriter::DoSeek(int64_t position) {
    if (position > static_cast<int64_t>(memory_.size())) {
        return MakeError(ErrorCode::OutOfRange,
                         fmt::format("{}: seek to {} beyond buffer size {}",
                                     Name(), position, memory_.size()));
    }
    position_ = position;
    return position_;
}

Result<void> FixedSizeBufferWriter::DoClose() {
    return {};
}

// BufferOutputStream

BufferOutputStream::BufferOutputStream(std::shared_ptr<ResizableBuffer> buffer)
    : buffer_(std::move(buffer)) {
    pool_ = buffer_->pool();
}

Result<std::shared_ptr<BufferOutputStream>> BufferOutputStream::Create(
    int64_t initial_capacity, std::shared_ptr<MemoryPool> pool) {
    if (initial_capacity < 0) {
        return MakeError(ErrorCode::InvalidArgument,
                         fmt::format("BufferOutputStream: negative capacity {}",
                                     initial_capacity));
    }
    auto buffer = AllocateResizableBuffer(initial_capacity, std::move(pool));
    if (!buffer) return std::unexpected(buffer.error());

    struct MakeSharedEnabler : public BufferOutputStream {
        explicit MakeSharedEnabler(std::shared_ptr<ResizableBuffer> b)
            : BufferOutputStream(std::move(b)) {}
    };
    return std::make_shared<MakeSharedEnabler>(std::move(*buffer));
}

Result<void> BufferOutputStream::Grow(int64_t needed) {
    if (needed <= buffer_->Size()) return {};
    int64_t target = std::max(needed, buffer_->Size() * 2);
    return buffer_->Resize(target, false);
}

Result<int64_t> BufferOutputStream::DoWrite(std::span<const std::byte> data) {
    auto n = static_cast<int64_t>(data.size());
    if (auto r = Grow(position_ + n); !r) return std::unexpected(r.error());

    std::memcpy(*buffer_->MutableData() + position_, data.data(), data.size());
    position_ += n;
    return n;
}

Result<void> BufferOutputStream::DoClose() {
    return buffer_->Resize(position_);
}

Result<std::shared_ptr<Buffer>> BufferOutputStream::GetValue() {
    if (auto r = CheckOpen(); !r) return std::unexpected(r.error());
    auto r = buffer_->Resize(position_);
    MarkClosed();
    if (!r) return std::unexpected(r.error());
    return std::shared_ptr<Buffer>(std::move(buffer_));
}

std::shared_ptr<Stream> WrapBufferAsReader(std::shared_ptr<Buffer> buffer) {
    return std::make_shared<BufferReader>(std::move(buffer));
}

Result<std::shared_ptr<Stream>> WrapBufferAsFixedWriter(std::shared_ptr<Buffer> buffer) {
    auto writer = FixedSizeBufferWriter::Create(std::move(buffer));
    if (!writer) return std::unexpected(writer.error());
    return std::shared_ptr<Stream>(std::move(*writer));
}

Result<std::shared_ptr<BufferOutputStream>> GrowableBufferWriter(
    std::shared_ptr<MemoryPool> pool) {
    return BufferOutputStream::Create(4096, std::move(pool));
}

}  // namespace streamkit
