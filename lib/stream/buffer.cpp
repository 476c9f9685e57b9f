// SPDX-License-Identifier: MIT

// lib/stream/buffer.cpp
#include "lib/stream/buffer.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstring>

namespace streamkit {

namespace {

// Buffer owning an std::string.
class StringBuffer : public Buffer {
public:
    explicit StringBuffer(std::string data) : storage_(std::move(data)) {
        SetMemory(reinterpret_cast<std::byte*>(storage_.data()),
                  static_cast<int64_t>(storage_.size()), false);
    }

private:
    std::string storage_;
};

// Buffer owning a byte vector.
class VectorBuffer : public Buffer {
public:
    explicit VectorBuffer(std::vector<std::byte> data) : storage_(std::move(data)) {
        SetMemory(storage_.data(), static_cast<int64_t>(storage_.size()), false);
    }

private:
    std::vector<std::byte> storage_;
};

// Buffer over foreign memory, pinning the owner for its whole lifetime.
class ForeignBuffer : public Buffer {
public:
    ForeignBuffer(std::byte* data, int64_t size, std::shared_ptr<void> owner,
                  bool is_mutable)
        : owner_(std::move(owner)) {
        SetMemory(data, size, is_mutable);
    }

private:
    std::shared_ptr<void> owner_;
};

int64_t RoundUpToAlignment(int64_t n) {
    constexpr auto kAlign = static_cast<int64_t>(kBufferAlignment);
    return (n + kAlign - 1) / kAlign * kAlign;
}

}  // namespace

std::shared_ptr<Buffer> Buffer::FromString(std::string data) {
    return std::make_shared<StringBuffer>(std::move(data));
}

std::shared_ptr<Buffer> Buffer::FromVector(std::vector<std::byte> data) {
    return std::make_shared<VectorBuffer>(std::move(data));
}

std::shared_ptr<Buffer> Buffer::Wrap(uintptr_t address, int64_t size,
                                     std::shared_ptr<void> owner, bool is_mutable) {
    return std::make_shared<ForeignBuffer>(reinterpret_cast<std::byte*>(address),
                                           size, std::move(owner), is_mutable);
}

Result<std::byte*> Buffer::MutableData() {
    if (!is_mutable_) {
        return MakeError(ErrorCode::CapabilityViolation, "buffer is not mutable");
    }
    return mutable_data_;
}

Result<std::span<std::byte>> Buffer::MutableSpan() {
    if (!is_mutable_) {
        return MakeError(ErrorCode::CapabilityViolation, "buffer is not mutable");
    }
    return std::span<std::byte>{mutable_data_, static_cast<size_t>(size_)};
}

bool Buffer::Equals(const Buffer& other) const noexcept {
    if (this == &other) return true;
    if (size_ != other.size_) return false;
    if (size_ == 0 || data_ == other.data_) return true;
    return std::memcmp(data_, other.data_, static_cast<size_t>(size_)) == 0;
}

std::vector<std::byte> Buffer::ToBytes() const {
    return std::vector<std::byte>(data_, data_ + size_);
}

std::string Buffer::ToString() const {
    return std::string(reinterpret_cast<const char*>(data_), static_cast<size_t>(size_));
}

std::string Buffer::ToHex() const {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<size_t>(size_) * 2);
    for (auto b : Span()) {
        auto v = std::to_integer<unsigned>(b);
        out.push_back(kDigits[v >> 4]);
        out.push_back(kDigits[v & 0x0F]);
    }
    return out;
}

Result<std::shared_ptr<Buffer>> SliceBuffer(const std::shared_ptr<Buffer>& buffer,
                                            int64_t offset,
                                            std::optional<int64_t> length) {
    if (!buffer) {
        return MakeError(ErrorCode::InvalidArgument, "cannot slice a null buffer");
    }
    if (offset < 0) {
        return MakeError(ErrorCode::InvalidArgument,
                         fmt::format("slice offset {} is negative", offset));
    }

    offset = std::min(offset, buffer->Size());
    int64_t remaining = buffer->Size() - offset;
    int64_t n = length.value_or(remaining);
    n = std::clamp<int64_t>(n, 0, remaining);

    struct MakeSharedEnabler : public Buffer {};
    std::shared_ptr<Buffer> slice = std::make_shared<MakeSharedEnabler>();
    slice->data_ = buffer->data_ + offset;
    slice->mutable_data_ = buffer->is_mutable_ ? buffer->mutable_data_ + offset : nullptr;
    slice->size_ = n;
    slice->is_mutable_ = buffer->is_mutable_;
    slice->parent_ = buffer;
    return slice;
}

// ResizableBuffer

ResizableBuffer::ResizableBuffer(std::shared_ptr<MemoryPool> pool)
    : pool_(std::move(pool)) {}

ResizableBuffer::~ResizableBuffer() {
    if (memory_) pool_->Free(memory_, capacity_);
}

Result<void> ResizableBuffer::Reallocate(int64_t new_capacity) {
    Result<std::byte*> fresh = memory_
        ? pool_->Reallocate(memory_, capacity_, new_capacity)
        : pool_->Allocate(new_capacity);
    if (!fresh) return std::unexpected(fresh.error());

    memory_ = *fresh;
    capacity_ = new_capacity;
    SetMemory(memory_, size_, true);
    return {};
}

Result<void> ResizableBuffer::Reserve(int64_t capacity) {
    if (capacity < 0) {
        return MakeError(ErrorCode::InvalidArgument,
                         fmt::format("negative buffer capacity {}", capacity));
    }
    if (memory_ && capacity <= capacity_) return {};
    return Reallocate(RoundUpToAlignment(capacity));
}

Result<void> ResizableBuffer::Resize(int64_t new_size, bool shrink_to_fit) {
    if (new_size < 0) {
        return MakeError(ErrorCode::InvalidArgument,
                         fmt::format("negative buffer size {}", new_size));
    }

    if (new_size > size_) {
        if (auto r = Reserve(new_size); !r) return r;
        std::memset(memory_ + size_, 0, static_cast<size_t>(new_size - size_));
    } else if (shrink_to_fit) {
        int64_t new_capacity = RoundUpToAlignment(new_size);
        if (new_capacity != capacity_) {
            if (auto r = Reallocate(new_capacity); !r) return r;
        }
    }

    size_ = new_size;
    SetMemory(memory_, size_, true);
    return {};
}

Result<std::shared_ptr<Buffer>> AllocateBuffer(int64_t size,
                                               std::shared_ptr<MemoryPool> pool) {
    auto buffer = AllocateResizableBuffer(size, std::move(pool));
    if (!buffer) return std::unexpected(buffer.error());
    return std::shared_ptr<Buffer>(std::move(*buffer));
}

Result<std::shared_ptr<ResizableBuffer>> AllocateResizableBuffer(
    int64_t size, std::shared_ptr<MemoryPool> pool) {
    auto buffer = std::make_shared<ResizableBuffer>(std::move(pool));
    if (auto r = buffer->Resize(size); !r) return std::unexpected(r.error());
    return buffer;
}

Result<std::shared_ptr<Buffer>> ConcatenateBuffers(
    const std::vector<std::shared_ptr<Buffer>>& buffers,
    std::shared_ptr<MemoryPool> pool) {
    int64_t total = 0;
    for (const auto& b : buffers) total += b->Size();

    auto out = AllocateBuffer(total, std::move(pool));
    if (!out) return out;

    std::byte* dest = *(*out)->MutableData();
    for (const auto& b : buffers) {
        if (b->Size() == 0) continue;
        std::memcpy(dest, b->Data(), static_cast<size_t>(b->Size()));
        dest += b->Size();
    }
    return out;
}

}  // namespace streamkit
